#include <escrow/core_test/testutil.hpp>
#include <escrow/node/testing.hpp>

#include <gtest/gtest.h>

#include <future>
#include <limits>
#include <thread>

namespace
{
escrow::record record_get (escrow::node & node_a, uint64_t id_a)
{
	escrow::record result;
	auto transaction (node_a.store.tx_begin_read ());
	EXPECT_FALSE (node_a.store.record_get (transaction, id_a, result));
	return result;
}

/** Opens an escrow for the amount and funds it through the self custodial path */
escrow::record funded_escrow (escrow::system & system_a, escrow::node & node_a, escrow::uint128_t const & amount_a)
{
	escrow::record result;
	EXPECT_FALSE (node_a.escrow_create (system_a.agreement (1, amount_a), result));
	auto call (escrow::ledger_call::create_and_fund (system_a.buyer.pub, system_a.seller.pub, amount_a, ""));
	escrow::block_hash hash;
	EXPECT_FALSE (system_a.submit (system_a.buyer, call, hash));
	system_a.chain.mine (3);
	EXPECT_FALSE (node_a.funding.fund_self_custodial (result.id, hash));
	return record_get (node_a, result.id);
}

void reconcile (escrow::system & system_a, escrow::node & node_a)
{
	system_a.chain.mine (3);
	EXPECT_FALSE (node_a.reconciler.process_once ());
}

escrow::uint128_t released_total (escrow::node & node_a, uint64_t id_a)
{
	escrow::uint128_t result (0);
	escrow::record record (record_get (node_a, id_a));
	std::vector<escrow::ledger_log> logs;
	EXPECT_FALSE (node_a.client.logs (1, std::numeric_limits<uint64_t>::max (), logs));
	for (auto & log : logs)
	{
		if (escrow::event_trade_id (log.event) == *record.trade_id)
		{
			result += escrow::released_amount (log.event);
		}
	}
	return result;
}
}

TEST (node, escrow_create)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (7, escrow::ether_ratio), record));
	ASSERT_EQ (1, record.id);
	ASSERT_EQ (escrow::record_state::awaiting_fund, record.state);
	ASSERT_EQ (system.buyer.pub, record.payer);
	ASSERT_FALSE (record.trade_id);
	ASSERT_NE (0, record.created_at);
	escrow::record duplicate;
	ASSERT_EQ (escrow::error_escrow::agreement_exists, node->escrow_create (system.agreement (7, escrow::ether_ratio), duplicate));
	auto zero (system.agreement (8, 0));
	ASSERT_EQ (escrow::error_escrow::invalid_amount, node->escrow_create (zero, duplicate));
	auto same_account (system.agreement (9, 10));
	same_account.seller_account = same_account.buyer_account;
	ASSERT_EQ (escrow::error_escrow::invalid_parties, node->escrow_create (same_account, duplicate));
	auto same_id (system.agreement (10, 10));
	same_id.seller_id = same_id.buyer_id;
	ASSERT_EQ (escrow::error_escrow::invalid_parties, node->escrow_create (same_id, duplicate));
	auto null_account (system.agreement (11, 10));
	null_account.seller_account.clear ();
	ASSERT_EQ (escrow::error_escrow::invalid_parties, node->escrow_create (null_account, duplicate));
	auto transaction (node->store.tx_begin_read ());
	ASSERT_EQ (1, node->store.record_count (transaction));
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::escrow, escrow::stat::detail::created));
}

TEST (node, escrow_status)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (7, 1000), record));
	escrow::escrow_view view;
	auto error (node->escrow_status (record.id, record.buyer_id, escrow::seconds_since_epoch (), view));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (record, view.record);
	ASSERT_TRUE (view.permissions.can_be_funded);
	ASSERT_FALSE (view.permissions.can_confirm_delivery);
	ASSERT_EQ (1, view.events.size ());
	ASSERT_EQ (escrow::record_event_type::created, view.events[0].type);
	escrow::escrow_view seller_view;
	auto error2 (node->escrow_by_agreement (7, record.seller_id, escrow::seconds_since_epoch (), seller_view));
	ASSERT_NO_ERROR (error2);
	ASSERT_EQ (record.id, seller_view.record.id);
	ASSERT_FALSE (seller_view.permissions.can_be_funded);
	ASSERT_EQ (escrow::error_escrow::record_not_found, node->escrow_status (2, 0, 0, view));
	ASSERT_EQ (escrow::error_escrow::record_not_found, node->escrow_by_agreement (8, 0, 0, view));
}

TEST (node, permissions)
{
	escrow::record record;
	record.buyer_id = 1;
	record.seller_id = 2;
	record.state = escrow::record_state::funded;
	record.timeout_at = 1000;
	auto buyer (escrow::compute_permissions (record, 1, 999));
	ASSERT_FALSE (buyer.can_be_funded);
	ASSERT_TRUE (buyer.can_confirm_delivery);
	ASSERT_TRUE (buyer.can_raise_dispute);
	ASSERT_FALSE (buyer.can_timeout_refund);
	auto seller (escrow::compute_permissions (record, 2, 1000));
	ASSERT_TRUE (seller.can_confirm_delivery);
	ASSERT_TRUE (seller.can_timeout_refund);
	auto stranger (escrow::compute_permissions (record, 3, 1000));
	ASSERT_FALSE (stranger.can_confirm_delivery);
	ASSERT_FALSE (stranger.can_raise_dispute);
	ASSERT_TRUE (stranger.can_timeout_refund);
	record.state = escrow::record_state::complete;
	auto done (escrow::compute_permissions (record, 1, 1000));
	ASSERT_FALSE (done.can_confirm_delivery);
	ASSERT_FALSE (done.can_timeout_refund);
	record.state = escrow::record_state::funded;
	record.halted = true;
	auto halted (escrow::compute_permissions (record, 1, 1000));
	ASSERT_FALSE (halted.can_confirm_delivery);
	ASSERT_FALSE (halted.can_raise_dispute);
	ASSERT_FALSE (halted.can_timeout_refund);
}

TEST (node, timeout_candidates)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1000));
	ASSERT_TRUE (node->timeout_candidates (60).empty ());
	auto stale (record);
	stale.funded_at = escrow::seconds_since_epoch () - 120;
	{
		auto transaction (node->store.tx_begin_write ());
		ASSERT_NO_ERROR (node->store.state_update (transaction, escrow::record_state::funded, stale));
	}
	auto candidates (node->timeout_candidates (60));
	ASSERT_EQ (1, candidates.size ());
	ASSERT_EQ (record.id, candidates[0].id);
}

// Self custodial funding followed by delivery confirmed by the seller
TEST (node, scenario_happy_path)
{
	escrow::system system;
	auto node (system.add_node ());
	std::vector<escrow::record_state> completed;
	node->observers.transition.add ([&completed](escrow::record const & record_a, escrow::record_state) {
		completed.push_back (record_a.state);
	});
	auto record (funded_escrow (system, *node, escrow::ether_ratio));
	ASSERT_EQ (escrow::record_state::funded, record.state);
	escrow::escrow_view view;
	auto error1 (node->escrow_status (record.id, record.seller_id, escrow::seconds_since_epoch (), view));
	ASSERT_NO_ERROR (error1);
	ASSERT_TRUE (view.permissions.can_confirm_delivery);
	auto confirm (escrow::ledger_call::confirm_delivery (system.seller.pub, *record.trade_id));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.seller, confirm, hash));
	reconcile (system, *node);
	auto fee (escrow::ether_ratio * system.chain.fee_bps () / escrow::ledger::basis_points);
	ASSERT_EQ (escrow::ether_ratio / 100, fee);
	ASSERT_EQ (escrow::ether_ratio - fee, system.chain.balance (system.seller.pub));
	ASSERT_EQ (fee, system.chain.balance (system.fee_recipient.pub));
	ASSERT_EQ (0, system.chain.custody ());
	auto complete (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::complete, complete.state);
	ASSERT_FALSE (complete.provisional);
	ASSERT_EQ (escrow::record_state::complete, completed.back ());
	ASSERT_EQ (escrow::ether_ratio, released_total (*node, record.id));
}

// Buyer disputes, the administrator refunds 70% to the buyer and the rest goes to the seller
TEST (node, scenario_partial_split)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, escrow::ether_ratio));
	auto dispute (escrow::ledger_call::raise_dispute (system.buyer.pub, *record.trade_id, "quality issue"));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, dispute, hash));
	reconcile (system, *node);
	ASSERT_EQ (escrow::record_state::disputed, record_get (*node, record.id).state);
	ASSERT_EQ ("quality issue", record_get (*node, record.id).dispute_reason);
	auto buyer_before (system.chain.balance (system.buyer.pub));
	escrow::dispute_decision decision;
	decision.escrow_id = record.id;
	decision.outcome = escrow::resolution_outcome::partial_split;
	decision.recipient = system.buyer.pub;
	decision.amount = escrow::amount (escrow::ether_ratio * 7 / 10);
	decision.note = "quality issue confirmed";
	escrow::block_hash resolution;
	auto error (node->disputes.resolve (decision, resolution));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (escrow::record_state::disputed, record_get (*node, record.id).state);
	reconcile (system, *node);
	ASSERT_EQ (buyer_before + escrow::ether_ratio * 7 / 10, system.chain.balance (system.buyer.pub));
	ASSERT_EQ (escrow::ether_ratio * 3 / 10, system.chain.balance (system.seller.pub));
	auto complete (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::complete, complete.state);
	ASSERT_FALSE (complete.provisional);
	ASSERT_EQ (escrow::ether_ratio, released_total (*node, record.id));
	auto transaction (node->store.tx_begin_read ());
	auto events (node->store.events (transaction, record.id));
	ASSERT_EQ (escrow::record_event_type::resolved, events.back ().type);
	ASSERT_EQ (escrow::record_event_type::resolved, events[events.size () - 2].type);
}

// Nobody acts before the timeout, anyone may refund the buyer afterwards
TEST (node, scenario_timeout_refund)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, escrow::ether_ratio));
	auto refund1 (escrow::ledger_call::timeout_refund (system.custodian.pub, *record.trade_id));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.custodian, refund1, hash));
	escrow::transaction_receipt receipt;
	ASSERT_NO_ERROR (system.chain.receipt (hash, receipt));
	ASSERT_FALSE (receipt.success);
	reconcile (system, *node);
	ASSERT_NE (0, record_get (*node, record.id).timeout_at);
	system.chain.advance_time (system.chain.timeout_duration ());
	escrow::escrow_view view;
	auto error (node->escrow_status (record.id, 0, system.chain.now (), view));
	ASSERT_NO_ERROR (error);
	ASSERT_TRUE (view.permissions.can_timeout_refund);
	auto refund2 (escrow::ledger_call::timeout_refund (system.custodian.pub, *record.trade_id));
	ASSERT_NO_ERROR (system.submit (system.custodian, refund2, hash));
	reconcile (system, *node);
	ASSERT_EQ (system.initial_balance, system.chain.balance (system.buyer.pub));
	ASSERT_EQ (escrow::record_state::complete, record_get (*node, record.id).state);
	ASSERT_EQ (escrow::ether_ratio, released_total (*node, record.id));
}

// A funding transaction with the wrong amount never funds the escrow
TEST (node, scenario_verification_rejected)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, escrow::ether_ratio), record));
	auto call (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, escrow::ether_ratio / 2, ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, call, hash));
	system.chain.mine (3);
	ASSERT_EQ (escrow::error_verification::amount_mismatch, node->funding.fund_self_custodial (record.id, hash));
	for (auto i (0); i < 10; ++i)
	{
		node->funding.retry_pending ();
		reconcile (system, *node);
		ASSERT_EQ (escrow::record_state::pending_verification, record_get (*node, record.id).state);
	}
	auto pending (record_get (*node, record.id));
	ASSERT_FALSE (pending.trade_id);
	ASSERT_FALSE (pending.halted);
	ASSERT_EQ (node->config.verification_attempts_max, pending.verification_attempts);
}

// Two writers update the same record from the same prior state, the loser retries against the new state
TEST (node, scenario_concurrent_update)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1000));
	reconcile (system, *node);
	auto snapshot (record_get (*node, record.id));
	std::promise<void> ready;
	std::shared_future<void> go (ready.get_future ());
	auto write ([node, snapshot, go](escrow::record_state state_a) {
		go.wait ();
		auto updated (snapshot);
		updated.state = state_a;
		auto transaction (node->store.tx_begin_write ());
		return node->store.state_update (transaction, snapshot.state, updated);
	});
	auto ledger_write (std::async (std::launch::async, write, escrow::record_state::complete));
	auto admin_write (std::async (std::launch::async, write, escrow::record_state::disputed));
	ready.set_value ();
	auto ledger_result (ledger_write.get ());
	auto admin_result (admin_write.get ());
	ASSERT_NE (!ledger_result, !admin_result);
	auto loser (ledger_result ? ledger_result : admin_result);
	ASSERT_EQ (escrow::error_escrow::state_mismatch, loser);
	auto current (record_get (*node, record.id));
	ASSERT_NE (escrow::record_state::funded, current.state);
	if (current.state == escrow::record_state::disputed)
	{
		auto retried (current);
		retried.state = escrow::record_state::complete;
		auto transaction (node->store.tx_begin_write ());
		ASSERT_NO_ERROR (node->store.state_update (transaction, current.state, retried));
	}
	else
	{
		auto retried (current);
		retried.state = escrow::record_state::disputed;
		auto transaction (node->store.tx_begin_write ());
		ASSERT_EQ (escrow::error_escrow::invalid_transition, node->store.state_update (transaction, current.state, retried));
	}
	ASSERT_EQ (escrow::record_state::complete, record_get (*node, record.id).state);
}

// The reconciler retries a transition when a local write moved the record first
TEST (node, reconciler_after_local_write)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (funded_escrow (system, *node, 1000));
	auto dispute (escrow::ledger_call::raise_dispute (system.seller.pub, *record.trade_id, "late"));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.seller, dispute, hash));
	auto confirm (escrow::ledger_call::confirm_delivery (system.buyer.pub, *record.trade_id));
	ASSERT_NO_ERROR (system.submit (system.buyer, confirm, hash));
	{
		auto local (record_get (*node, record.id));
		local.state = escrow::record_state::disputed;
		local.dispute_reason = "reported locally";
		auto transaction (node->store.tx_begin_write ());
		ASSERT_NO_ERROR (node->store.state_update (transaction, escrow::record_state::funded, local));
	}
	reconcile (system, *node);
	auto disputed (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::disputed, disputed.state);
	ASSERT_EQ ("reported locally", disputed.dispute_reason);
}
