#include <escrow/core_test/testutil.hpp>
#include <escrow/node/signer.hpp>
#include <escrow/node/testing.hpp>
#include <escrow/secure/utility.hpp>

#include <gtest/gtest.h>

#include <functional>

using namespace std::chrono_literals;

namespace
{
escrow::record record_get (escrow::node & node_a, uint64_t id_a)
{
	escrow::record result;
	auto transaction (node_a.store.tx_begin_read ());
	EXPECT_FALSE (node_a.store.record_get (transaction, id_a, result));
	return result;
}

std::vector<escrow::record_event> events_get (escrow::node & node_a, uint64_t id_a)
{
	auto transaction (node_a.store.tx_begin_read ());
	return node_a.store.events (transaction, id_a);
}

/** Opens an escrow and funds it through the self custodial path */
escrow::record funded_escrow (escrow::system & system_a, escrow::node & node_a, uint64_t agreement_id_a)
{
	escrow::record result;
	EXPECT_FALSE (node_a.escrow_create (system_a.agreement (agreement_id_a, 1000), result));
	auto call (escrow::ledger_call::create_and_fund (system_a.buyer.pub, system_a.seller.pub, escrow::amount (1000), ""));
	escrow::block_hash hash;
	EXPECT_FALSE (system_a.submit (system_a.buyer, call, hash));
	system_a.chain.mine (3);
	EXPECT_FALSE (node_a.funding.fund_self_custodial (result.id, hash));
	return record_get (node_a, result.id);
}

/** Forwards to a ledger and runs a hook before every trade lookup */
class hooked_client final : public escrow::ledger_client
{
public:
	explicit hooked_client (escrow::ledger_client & ledger_a) :
	ledger (ledger_a)
	{
	}
	std::error_code head (uint64_t & head_a) override
	{
		return ledger.head (head_a);
	}
	std::error_code receipt (escrow::block_hash const & transaction_a, escrow::transaction_receipt & receipt_a) override
	{
		return ledger.receipt (transaction_a, receipt_a);
	}
	std::error_code logs (uint64_t from_a, uint64_t to_a, std::vector<escrow::ledger_log> & logs_a) override
	{
		return ledger.logs (from_a, to_a, logs_a);
	}
	std::error_code submit (escrow::ledger_call const & call_a, escrow::block_hash & transaction_a) override
	{
		return ledger.submit (call_a, transaction_a);
	}
	std::error_code trade_get (uint64_t trade_id_a, escrow::trade & trade_a) override
	{
		if (before_trade_get)
		{
			before_trade_get ();
		}
		return ledger.trade_get (trade_id_a, trade_a);
	}
	std::error_code nonce (escrow::account const & account_a, uint64_t & nonce_a) override
	{
		return ledger.nonce (account_a, nonce_a);
	}
	std::string name () const override
	{
		return ledger.name ();
	}
	std::function<void()> before_trade_get;

private:
	escrow::ledger_client & ledger;
};
}

TEST (reconciler, confirms_provisional_funding)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1));
	ASSERT_TRUE (record.provisional);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	auto confirmed (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, confirmed.state);
	ASSERT_FALSE (confirmed.provisional);
	auto events (events_get (*node, record.id));
	ASSERT_EQ (5, events.size ());
	ASSERT_EQ (escrow::record_event_type::escrow_created, events[3].type);
	ASSERT_EQ (escrow::event_cause::ledger, events[3].cause);
	ASSERT_EQ (0, events[3].log_index);
	ASSERT_EQ (escrow::record_event_type::funded, events[4].type);
	ASSERT_EQ (1, events[4].log_index);
	ASSERT_EQ (1, events[4].height);
	ASSERT_EQ (*record.funding_transaction, events[4].transaction);
	ASSERT_EQ (1, node->reconciler.cursor ());
}

TEST (reconciler, confirmation_depth)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto call (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, escrow::amount (1000), ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, call, hash));
	system.chain.mine (2);
	auto error1 (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error1);
	ASSERT_EQ (0, node->reconciler.cursor ());
	system.chain.mine ();
	auto error2 (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error2);
	ASSERT_EQ (1, node->reconciler.cursor ());
}

TEST (reconciler, links_pending_funding)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto call (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, escrow::amount (1000), ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, call, hash));
	ASSERT_EQ (escrow::error_verification::insufficient_confirmations, node->funding.fund_self_custodial (record.id, hash));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	auto funded (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, funded.state);
	ASSERT_FALSE (funded.provisional);
	ASSERT_TRUE (funded.trade_id);
	ASSERT_EQ (0, *funded.trade_id);
	ASSERT_NE (0, funded.timeout_at);
	ASSERT_EQ (0, node->funding.retry_pending ());
	ASSERT_EQ (0, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::unknown_trade));
}

TEST (reconciler, idempotent)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1));
	auto error1 (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error1);
	auto after_first (events_get (*node, record.id));
	std::vector<escrow::ledger_log> logs;
	ASSERT_NO_ERROR (system.chain.logs (1, 1, logs));
	ASSERT_EQ (2, logs.size ());
	for (auto & log : logs)
	{
		auto error (node->reconciler.apply (log));
		ASSERT_NO_ERROR (error);
	}
	ASSERT_EQ (2, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::event_duplicate));
	auto after_second (events_get (*node, record.id));
	ASSERT_EQ (after_first.size (), after_second.size ());
}

// Events applied but the cursor never written, as after a crash between the two
TEST (reconciler, crash_before_cursor)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1));
	std::vector<escrow::ledger_log> logs;
	ASSERT_NO_ERROR (system.chain.logs (1, 1, logs));
	for (auto & log : logs)
	{
		auto error (node->reconciler.apply (log));
		ASSERT_NO_ERROR (error);
	}
	ASSERT_EQ (0, node->reconciler.cursor ());
	auto before (events_get (*node, record.id));
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (1, node->reconciler.cursor ());
	ASSERT_EQ (before.size (), events_get (*node, record.id).size ());
	ASSERT_EQ (2, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::event_applied));
	ASSERT_EQ (2, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::event_duplicate));
}

TEST (reconciler, delivery_completes)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1));
	std::vector<escrow::record_state> transitions;
	node->observers.transition.add ([&transitions](escrow::record const & record_a, escrow::record_state) {
		transitions.push_back (record_a.state);
	});
	auto confirm (escrow::ledger_call::confirm_delivery (system.buyer.pub, *record.trade_id));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, confirm, hash));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	auto complete (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::complete, complete.state);
	ASSERT_FALSE (complete.provisional);
	ASSERT_NE (0, complete.completed_at);
	ASSERT_EQ (1, transitions.size ());
	ASSERT_EQ (escrow::record_state::complete, transitions[0]);
	auto events (events_get (*node, record.id));
	ASSERT_EQ (escrow::record_event_type::released, events.back ().type);
	ASSERT_EQ (escrow::record_event_type::delivery_confirmed, events[events.size () - 2].type);
}

TEST (reconciler, dispute_then_refund)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1));
	auto dispute (escrow::ledger_call::raise_dispute (system.seller.pub, *record.trade_id, "buyer unreachable"));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.seller, dispute, hash));
	system.chain.mine (3);
	auto error1 (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error1);
	auto disputed (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::disputed, disputed.state);
	ASSERT_EQ ("buyer unreachable", disputed.dispute_reason);
	ASSERT_NE (0, disputed.disputed_at);
	auto permissions (escrow::compute_permissions (disputed, disputed.buyer_id, escrow::seconds_since_epoch ()));
	ASSERT_FALSE (permissions.can_confirm_delivery);
	ASSERT_FALSE (permissions.can_raise_dispute);
}

TEST (reconciler, timeout_refund)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1));
	system.chain.advance_time (system.chain.timeout_duration ());
	auto refund (escrow::ledger_call::timeout_refund (system.seller.pub, *record.trade_id));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.seller, refund, hash));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (escrow::record_state::complete, record_get (*node, record.id).state);
	ASSERT_EQ (escrow::record_event_type::timeout_refund, events_get (*node, record.id).back ().type);
	ASSERT_EQ (system.initial_balance, system.chain.balance (system.buyer.pub));
}

TEST (reconciler, amount_mismatch_halts)
{
	escrow::system system;
	auto node (system.add_node ());
	std::vector<std::error_code> failures;
	node->observers.failure.add ([&failures](escrow::record const &, std::error_code const & error_a) {
		failures.push_back (error_a);
	});
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto create (escrow::ledger_call::create_trade_without_fund (system.buyer.pub, system.seller.pub, "{\"escrow_id\":\"" + std::to_string (record.id) + "\"}"));
	escrow::block_hash hash1;
	ASSERT_NO_ERROR (system.submit (system.buyer, create, hash1));
	auto fund (escrow::ledger_call::fund_trade (system.buyer.pub, 0, escrow::amount (999)));
	escrow::block_hash hash2;
	ASSERT_NO_ERROR (system.submit (system.buyer, fund, hash2));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	auto halted (record_get (*node, record.id));
	ASSERT_TRUE (halted.halted);
	ASSERT_EQ (escrow::record_state::awaiting_fund, halted.state);
	ASSERT_TRUE (halted.trade_id);
	ASSERT_EQ (0, *halted.trade_id);
	ASSERT_EQ (1, failures.size ());
	ASSERT_EQ (escrow::error_escrow::record_halted, failures[0]);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::consistency_failure));
	auto events (events_get (*node, record.id));
	ASSERT_EQ (escrow::record_event_type::consistency_failure, events.back ().type);
	auto permissions (escrow::compute_permissions (halted, halted.buyer_id, escrow::seconds_since_epoch ()));
	ASSERT_FALSE (permissions.can_be_funded);
	escrow::block_hash hash3 (0);
	ASSERT_EQ (escrow::error_escrow::record_halted, node->funding.fund_custodial (record.id, hash3));
}

TEST (reconciler, halted_record_frozen)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto create (escrow::ledger_call::create_trade_without_fund (system.buyer.pub, system.seller.pub, "{\"escrow_id\":\"" + std::to_string (record.id) + "\"}"));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, create, hash));
	auto fund (escrow::ledger_call::fund_trade (system.buyer.pub, 0, escrow::amount (999)));
	ASSERT_NO_ERROR (system.submit (system.buyer, fund, hash));
	auto confirm (escrow::ledger_call::confirm_delivery (system.buyer.pub, 0));
	ASSERT_NO_ERROR (system.submit (system.buyer, confirm, hash));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	auto halted (record_get (*node, record.id));
	ASSERT_TRUE (halted.halted);
	ASSERT_EQ (escrow::record_state::awaiting_fund, halted.state);
	ASSERT_EQ (escrow::record_event_type::released, events_get (*node, record.id).back ().type);
}

TEST (reconciler, unknown_trade)
{
	escrow::system system;
	auto node (system.add_node ());
	auto call (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, escrow::amount (1000), "not json"));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, call, hash));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (2, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::unknown_trade));
	auto transaction (node->store.tx_begin_read ());
	ASSERT_TRUE (node->store.ledger_event_exists (transaction, escrow::ledger_event_key (hash, 0)));
	ASSERT_TRUE (node->store.ledger_event_exists (transaction, escrow::ledger_event_key (hash, 1)));
	ASSERT_EQ (0, node->store.event_count (transaction));
}

TEST (reconciler, batch_size)
{
	escrow::system system;
	escrow::node_config config (system.logging);
	config.reconciler_batch_size = 2;
	auto node (system.add_node (config));
	system.chain.mine (10);
	auto error1 (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error1);
	ASSERT_EQ (2, node->reconciler.cursor ());
	auto error2 (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error2);
	ASSERT_EQ (4, node->reconciler.cursor ());
}

TEST (reconciler, ledger_offline)
{
	escrow::system system;
	auto node (system.add_node ());
	system.chain.mine (10);
	system.chain.online (false);
	ASSERT_EQ (escrow::error_ledger::unavailable, node->reconciler.process_once ());
	ASSERT_EQ (0, node->reconciler.cursor ());
	system.chain.online (true);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (7, node->reconciler.cursor ());
}

TEST (reconciler, background_thread)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto call (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, escrow::amount (1000), ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, call, hash));
	ASSERT_EQ (escrow::error_verification::insufficient_confirmations, node->funding.fund_self_custodial (record.id, hash));
	node->start ();
	system.chain.start (1ms);
	system.deadline_set (10s);
	while (record_get (*node, record.id).state != escrow::record_state::funded || record_get (*node, record.id).provisional)
	{
		ASSERT_NO_ERROR (system.poll ());
	}
	ASSERT_GT (node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::cycle), 0);
}

// Trades naming an escrow in their metadata are only linked when they are between its parties
TEST (reconciler, foreign_trade_not_linked)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	escrow::keypair stranger;
	escrow::keypair accomplice;
	system.chain.credit (stranger.pub, system.initial_balance);
	auto metadata ("{\"escrow_id\":\"" + std::to_string (record.id) + "\"}");
	auto redirected (escrow::ledger_call::create_and_fund (stranger.pub, accomplice.pub, escrow::amount (1000), metadata));
	escrow::block_hash hash1;
	ASSERT_NO_ERROR (system.submit (stranger, redirected, hash1));
	auto underpaid (escrow::ledger_call::create_and_fund (stranger.pub, system.seller.pub, escrow::amount (999), metadata));
	escrow::block_hash hash2;
	ASSERT_NO_ERROR (system.submit (stranger, underpaid, hash2));
	system.chain.mine (3);
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	auto untouched (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::awaiting_fund, untouched.state);
	ASSERT_FALSE (untouched.trade_id);
	ASSERT_FALSE (untouched.halted);
	ASSERT_EQ (4, node->stats.count (escrow::stat::type::reconciler, escrow::stat::detail::unknown_trade));
	ASSERT_EQ (1, events_get (*node, record.id).size ());
	auto permissions (escrow::compute_permissions (untouched, untouched.buyer_id, escrow::seconds_since_epoch ()));
	ASSERT_TRUE (permissions.can_be_funded);
}

// Every attempt to apply the funding finds the record moved on, the batch is kept for the next cycle
TEST (reconciler, cursor_held_while_record_changes)
{
	escrow::system system;
	hooked_client client (system.chain);
	escrow::node_config config (system.logging);
	escrow::node_init init;
	auto node (std::make_shared<escrow::node> (init, escrow::unique_path (), config, client, nullptr, std::make_shared<escrow::key_signer> (system.admin)));
	ASSERT_FALSE (init.error ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto create (escrow::ledger_call::create_trade_without_fund (system.buyer.pub, system.seller.pub, "{\"escrow_id\":\"" + std::to_string (record.id) + "\"}"));
	escrow::block_hash hash1;
	ASSERT_NO_ERROR (system.submit (system.buyer, create, hash1));
	auto fund (escrow::ledger_call::fund_trade (system.buyer.pub, 0, escrow::amount (999)));
	escrow::block_hash hash2;
	ASSERT_NO_ERROR (system.submit (system.buyer, fund, hash2));
	system.chain.mine (3);
	unsigned moves (0);
	client.before_trade_get = [&node, &record, &moves]() {
		auto transaction (node->store.tx_begin_write ());
		escrow::record current;
		EXPECT_FALSE (node->store.record_get (transaction, record.id, current));
		auto previous (current.state);
		current.state = static_cast<escrow::record_state> (static_cast<uint8_t> (previous) + 1);
		EXPECT_FALSE (node->store.state_update (transaction, previous, current));
		++moves;
	};
	ASSERT_EQ (escrow::error_escrow::state_mismatch, node->reconciler.process_once ());
	ASSERT_EQ (escrow::event_reconciler::apply_retry_max, moves);
	ASSERT_EQ (0, node->reconciler.cursor ());
	{
		auto transaction (node->store.tx_begin_read ());
		ASSERT_TRUE (node->store.ledger_event_exists (transaction, escrow::ledger_event_key (hash1, 0)));
		ASSERT_FALSE (node->store.ledger_event_exists (transaction, escrow::ledger_event_key (hash2, 0)));
	}
	ASSERT_EQ (escrow::record_event_type::escrow_created, events_get (*node, record.id).back ().type);
	client.before_trade_get = nullptr;
	auto error (node->reconciler.process_once ());
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (2, node->reconciler.cursor ());
	auto transaction (node->store.tx_begin_read ());
	ASSERT_TRUE (node->store.ledger_event_exists (transaction, escrow::ledger_event_key (hash2, 0)));
	ASSERT_EQ (escrow::record_event_type::funded, node->store.events (transaction, record.id).back ().type);
}
