#include <escrow/core_test/testutil.hpp>
#include <escrow/node/testing.hpp>

#include <gtest/gtest.h>

#include <boost/property_tree/json_parser.hpp>

using namespace std::chrono_literals;

namespace
{
escrow::block_hash buyer_funds (escrow::system & system_a, escrow::uint128_t const & amount_a)
{
	auto call (escrow::ledger_call::create_and_fund (system_a.buyer.pub, system_a.seller.pub, amount_a, ""));
	escrow::block_hash result;
	EXPECT_FALSE (system_a.submit (system_a.buyer, call, result));
	return result;
}

escrow::record record_get (escrow::node & node_a, uint64_t id_a)
{
	escrow::record result;
	auto transaction (node_a.store.tx_begin_read ());
	EXPECT_FALSE (node_a.store.record_get (transaction, id_a, result));
	return result;
}
}

TEST (funding, self_custodial)
{
	escrow::system system;
	auto node (system.add_node ());
	std::vector<escrow::record_state> transitions;
	node->observers.transition.add ([&transitions](escrow::record const & record_a, escrow::record_state) {
		transitions.push_back (record_a.state);
	});
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto hash (buyer_funds (system, 1000));
	system.chain.mine (3);
	auto error (node->funding.fund_self_custodial (record.id, hash));
	ASSERT_NO_ERROR (error);
	auto funded (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, funded.state);
	ASSERT_TRUE (funded.trade_id);
	ASSERT_EQ (0, *funded.trade_id);
	ASSERT_EQ (hash, *funded.funding_transaction);
	ASSERT_TRUE (funded.provisional);
	ASSERT_FALSE (funded.custodial);
	ASSERT_EQ (system.buyer.pub, funded.payer);
	ASSERT_NE (0, funded.timeout_at);
	ASSERT_EQ (2, transitions.size ());
	ASSERT_EQ (escrow::record_state::pending_verification, transitions[0]);
	ASSERT_EQ (escrow::record_state::funded, transitions[1]);
	auto transaction (node->store.tx_begin_read ());
	auto events (node->store.events (transaction, record.id));
	ASSERT_EQ (3, events.size ());
	ASSERT_EQ (escrow::record_event_type::created, events[0].type);
	ASSERT_EQ (escrow::record_event_type::funding_submitted, events[1].type);
	ASSERT_EQ (escrow::event_cause::funding, events[1].cause);
	ASSERT_FALSE (events[1].trust_reduced);
	ASSERT_EQ (escrow::record_event_type::funded, events[2].type);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::funding, escrow::stat::detail::self_custodial));
}

TEST (funding, self_custodial_retry)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto hash (buyer_funds (system, 1000));
	ASSERT_EQ (escrow::error_verification::insufficient_confirmations, node->funding.fund_self_custodial (record.id, hash));
	auto pending (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::pending_verification, pending.state);
	ASSERT_EQ (1, pending.verification_attempts);
	ASSERT_EQ (0, node->funding.retry_pending ());
	system.chain.mine (3);
	ASSERT_EQ (1, node->funding.retry_pending ());
	auto funded (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, funded.state);
	ASSERT_EQ (0, node->funding.retry_pending ());
	ASSERT_EQ (escrow::error_funding::wrong_state, node->funding.fund_self_custodial (record.id, hash));
}

TEST (funding, verification_exhausted)
{
	escrow::system system;
	auto node (system.add_node ());
	std::vector<std::error_code> failures;
	node->observers.failure.add ([&failures](escrow::record const &, std::error_code const & error_a) {
		failures.push_back (error_a);
	});
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto hash (buyer_funds (system, 999));
	system.chain.mine (3);
	ASSERT_EQ (escrow::error_verification::amount_mismatch, node->funding.fund_self_custodial (record.id, hash));
	for (auto i (1u); i < node->config.verification_attempts_max; ++i)
	{
		ASSERT_EQ (0, node->funding.retry_pending ());
	}
	auto exhausted (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::pending_verification, exhausted.state);
	ASSERT_EQ (node->config.verification_attempts_max, exhausted.verification_attempts);
	ASSERT_EQ (1, failures.size ());
	ASSERT_EQ (escrow::error_funding::verification_exhausted, failures[0]);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::funding, escrow::stat::detail::verification_exhausted));
	auto stuck (node->verification_failures ());
	ASSERT_EQ (1, stuck.size ());
	ASSERT_EQ (record.id, stuck[0].id);
	node->funding.retry_pending ();
	ASSERT_EQ (node->config.verification_attempts_max, record_get (*node, record.id).verification_attempts);
	auto transaction (node->store.tx_begin_read ());
	auto events (node->store.events (transaction, record.id));
	ASSERT_EQ (escrow::record_event_type::verification_failed, events.back ().type);
	boost::property_tree::ptree payload;
	std::stringstream stream (events.back ().payload);
	boost::property_tree::read_json (stream, payload);
	ASSERT_EQ ("verification", payload.get<std::string> ("step"));
	ASSERT_EQ (std::to_string (node->config.verification_attempts_max), payload.get<std::string> ("attempt"));
}

// One payment handed over for two escrows funds only the first
TEST (funding, transaction_reused)
{
	escrow::system system;
	auto node (system.add_node ());
	std::vector<std::error_code> failures;
	node->observers.failure.add ([&failures](escrow::record const &, std::error_code const & error_a) {
		failures.push_back (error_a);
	});
	escrow::record first;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), first));
	escrow::record second;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (2, 1000), second));
	auto hash (buyer_funds (system, 1000));
	system.chain.mine (3);
	auto error (node->funding.fund_self_custodial (first.id, hash));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (escrow::error_escrow::trade_conflict, node->funding.fund_self_custodial (second.id, hash));
	auto conflicted (record_get (*node, second.id));
	ASSERT_EQ (escrow::record_state::pending_verification, conflicted.state);
	ASSERT_FALSE (conflicted.trade_id);
	ASSERT_EQ (1, conflicted.verification_attempts);
	for (auto i (1u); i < node->config.verification_attempts_max; ++i)
	{
		ASSERT_EQ (0, node->funding.retry_pending ());
	}
	ASSERT_EQ (node->config.verification_attempts_max, record_get (*node, second.id).verification_attempts);
	auto stuck (node->verification_failures ());
	ASSERT_EQ (1, stuck.size ());
	ASSERT_EQ (second.id, stuck[0].id);
	ASSERT_EQ (1, failures.size ());
	ASSERT_EQ (escrow::error_funding::verification_exhausted, failures[0]);
	ASSERT_EQ (0, node->funding.retry_pending ());
	ASSERT_EQ (node->config.verification_attempts_max, record_get (*node, second.id).verification_attempts);
	auto transaction (node->store.tx_begin_read ());
	auto events (node->store.events (transaction, second.id));
	boost::property_tree::ptree payload;
	std::stringstream stream (events.back ().payload);
	boost::property_tree::read_json (stream, payload);
	ASSERT_EQ (escrow::record_event_type::verification_failed, events.back ().type);
	ASSERT_EQ ("escrow", payload.get<std::string> ("step"));
	ASSERT_EQ (escrow::record_state::funded, record_get (*node, first.id).state);
}

TEST (funding, self_custodial_replaced_transaction)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	auto wrong (buyer_funds (system, 999));
	system.chain.mine (3);
	ASSERT_EQ (escrow::error_verification::amount_mismatch, node->funding.fund_self_custodial (record.id, wrong));
	ASSERT_EQ (escrow::error_verification::amount_mismatch, node->funding.fund_self_custodial (record.id, wrong));
	ASSERT_EQ (2, record_get (*node, record.id).verification_attempts);
	auto right (buyer_funds (system, 1000));
	system.chain.mine (3);
	auto error (node->funding.fund_self_custodial (record.id, right));
	ASSERT_NO_ERROR (error);
	auto funded (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, funded.state);
	ASSERT_EQ (right, *funded.funding_transaction);
	ASSERT_EQ (1, *funded.trade_id);
}

TEST (funding, missing_transaction)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	escrow::funding_intent intent;
	intent.escrow_id = record.id;
	escrow::block_hash transaction (0);
	ASSERT_EQ (escrow::error_verification::not_found, node->funding.process (intent, transaction));
	ASSERT_EQ (escrow::record_state::awaiting_fund, record_get (*node, record.id).state);
	intent.escrow_id = 99;
	intent.transaction = escrow::block_hash (5);
	ASSERT_EQ (escrow::error_escrow::record_not_found, node->funding.process (intent, transaction));
}

TEST (funding, custodial)
{
	escrow::system system;
	auto node (system.add_node ());
	system.chain.start (1ms);
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	escrow::funding_intent intent;
	intent.escrow_id = record.id;
	intent.path = escrow::funding_path::custodial;
	escrow::block_hash hash (0);
	auto error (node->funding.process (intent, hash));
	ASSERT_NO_ERROR (error);
	ASSERT_FALSE (hash.is_zero ());
	auto funded (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, funded.state);
	ASSERT_TRUE (funded.custodial);
	ASSERT_EQ (system.custodian.pub, funded.payer);
	ASSERT_EQ (system.buyer.pub, funded.buyer_account);
	ASSERT_EQ (system.initial_balance - 1000, system.chain.balance (system.custodian.pub));
	escrow::trade trade;
	ASSERT_NO_ERROR (system.chain.trade_get (*funded.trade_id, trade));
	ASSERT_EQ (system.custodian.pub, trade.buyer);
	boost::property_tree::ptree metadata;
	std::stringstream stream (trade.metadata);
	boost::property_tree::read_json (stream, metadata);
	ASSERT_EQ (std::to_string (record.id), metadata.get<std::string> ("escrow_id"));
	auto transaction (node->store.tx_begin_read ());
	auto events (node->store.events (transaction, record.id));
	ASSERT_EQ (3, events.size ());
	ASSERT_TRUE (events[1].trust_reduced);
	ASSERT_TRUE (events[2].trust_reduced);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::funding, escrow::stat::detail::custodial));
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::ledger, escrow::stat::detail::submitted));
	escrow::block_hash hash2 (0);
	ASSERT_EQ (escrow::error_funding::wrong_state, node->funding.process (intent, hash2));
}

TEST (funding, custodial_ledger_offline)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	system.chain.online (false);
	escrow::block_hash hash (0);
	ASSERT_EQ (escrow::error_ledger::unavailable, node->funding.fund_custodial (record.id, hash));
	auto unchanged (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::awaiting_fund, unchanged.state);
	ASSERT_FALSE (unchanged.funding_transaction);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::ledger, escrow::stat::detail::submit_failed));
	system.chain.online (true);
	system.chain.start (1ms);
	auto error (node->funding.fund_custodial (record.id, hash));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (escrow::record_state::funded, record_get (*node, record.id).state);
}

TEST (funding, custodial_unavailable)
{
	escrow::system system;
	escrow::node_config config (system.logging);
	auto node (system.add_node (config, false));
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	escrow::block_hash hash (0);
	ASSERT_EQ (escrow::error_funding::custodial_unavailable, node->funding.fund_custodial (record.id, hash));
	ASSERT_EQ (0, system.chain.trade_count ());
}

TEST (funding, custodial_confirmation_timeout)
{
	escrow::system system;
	escrow::node_config config (system.logging);
	config.custodial_confirmation_timeout = std::chrono::milliseconds (50);
	auto node (system.add_node (config));
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	escrow::block_hash hash (0);
	ASSERT_EQ (escrow::error_funding::confirmation_timeout, node->funding.fund_custodial (record.id, hash));
	ASSERT_FALSE (hash.is_zero ());
	auto pending (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::pending_verification, pending.state);
	ASSERT_EQ (hash, *pending.funding_transaction);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::funding, escrow::stat::detail::confirmation_timeout));
	escrow::funding_intent intent;
	intent.escrow_id = record.id;
	intent.transaction = hash;
	escrow::block_hash hash2 (0);
	ASSERT_EQ (escrow::error_funding::wrong_state, node->funding.process (intent, hash2));
	system.chain.mine (3);
	ASSERT_EQ (1, node->funding.retry_pending ());
	auto funded (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::funded, funded.state);
	ASSERT_EQ (1, system.chain.trade_count ());
}
