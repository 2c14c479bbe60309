#include <escrow/core_test/testutil.hpp>
#include <escrow/node/testing.hpp>
#include <escrow/secure/utility.hpp>

#include <gtest/gtest.h>

#include <boost/property_tree/json_parser.hpp>

namespace
{
escrow::record record_get (escrow::node & node_a, uint64_t id_a)
{
	escrow::record result;
	auto transaction (node_a.store.tx_begin_read ());
	EXPECT_FALSE (node_a.store.record_get (transaction, id_a, result));
	return result;
}

escrow::record split_record ()
{
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::record result;
	result.buyer_account = buyer.pub;
	result.payer = buyer.pub;
	result.seller_account = seller.pub;
	result.amount = escrow::amount (1000);
	result.state = escrow::record_state::disputed;
	result.trade_id = 0;
	return result;
}

/** Funds an escrow, disputes it on the ledger and reconciles until the record is disputed */
escrow::record disputed_escrow (escrow::system & system_a, escrow::node & node_a)
{
	escrow::record result;
	EXPECT_FALSE (node_a.escrow_create (system_a.agreement (1, 1000), result));
	auto call (escrow::ledger_call::create_and_fund (system_a.buyer.pub, system_a.seller.pub, escrow::amount (1000), ""));
	escrow::block_hash hash;
	EXPECT_FALSE (system_a.submit (system_a.buyer, call, hash));
	system_a.chain.mine (3);
	EXPECT_FALSE (node_a.funding.fund_self_custodial (result.id, hash));
	auto dispute (escrow::ledger_call::raise_dispute (system_a.buyer.pub, 0, "wrong size"));
	EXPECT_FALSE (system_a.submit (system_a.buyer, dispute, hash));
	system_a.chain.mine (3);
	EXPECT_FALSE (node_a.reconciler.process_once ());
	return record_get (node_a, result.id);
}
}

TEST (dispute, split_refund)
{
	auto record (split_record ());
	escrow::dispute_decision decision;
	decision.outcome = escrow::resolution_outcome::refund_to_buyer;
	escrow::dispute_split split;
	auto error (escrow::dispute_resolver::compute_split (record, decision, split));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (record.payer, split.recipient);
	ASSERT_EQ (1000, split.recipient_amount);
	ASSERT_EQ (0, split.remainder);
}

TEST (dispute, split_payout)
{
	auto record (split_record ());
	escrow::dispute_decision decision;
	decision.outcome = escrow::resolution_outcome::payout_to_seller;
	escrow::dispute_split split;
	auto error (escrow::dispute_resolver::compute_split (record, decision, split));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (record.seller_account, split.recipient);
	ASSERT_EQ (record.payer, split.other);
	ASSERT_EQ (1000, split.recipient_amount);
}

TEST (dispute, split_partial)
{
	auto record (split_record ());
	escrow::dispute_decision decision;
	decision.outcome = escrow::resolution_outcome::partial_split;
	decision.recipient = record.seller_account;
	decision.amount = escrow::amount (600);
	escrow::dispute_split split;
	auto error (escrow::dispute_resolver::compute_split (record, decision, split));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (record.seller_account, split.recipient);
	ASSERT_EQ (record.payer, split.other);
	ASSERT_EQ (600, split.recipient_amount);
	ASSERT_EQ (400, split.remainder);
	ASSERT_EQ (record.amount.number (), split.recipient_amount + split.remainder);
}

TEST (dispute, split_validation)
{
	auto record (split_record ());
	escrow::dispute_decision decision;
	decision.outcome = escrow::resolution_outcome::partial_split;
	escrow::dispute_split split;
	decision.amount = escrow::amount (100);
	ASSERT_EQ (escrow::error_dispute::missing_recipient, escrow::dispute_resolver::compute_split (record, decision, split));
	decision.recipient = record.payer;
	decision.amount = boost::none;
	ASSERT_EQ (escrow::error_dispute::missing_amount, escrow::dispute_resolver::compute_split (record, decision, split));
	decision.amount = escrow::amount (1001);
	ASSERT_EQ (escrow::error_dispute::amount_exceeds, escrow::dispute_resolver::compute_split (record, decision, split));
	escrow::keypair stranger;
	decision.recipient = stranger.pub;
	decision.amount = escrow::amount (10);
	ASSERT_EQ (escrow::error_dispute::invalid_recipient, escrow::dispute_resolver::compute_split (record, decision, split));
}

TEST (dispute, resolve_partial)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (disputed_escrow (system, *node));
	ASSERT_EQ (escrow::record_state::disputed, record.state);
	escrow::dispute_decision decision;
	decision.escrow_id = record.id;
	decision.outcome = escrow::resolution_outcome::partial_split;
	decision.recipient = system.seller.pub;
	decision.amount = escrow::amount (600);
	decision.note = "partial damage";
	escrow::block_hash transaction;
	auto error (node->disputes.resolve (decision, transaction));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (600, system.chain.balance (system.seller.pub));
	ASSERT_EQ (system.initial_balance - 600, system.chain.balance (system.buyer.pub));
	ASSERT_EQ (0, system.chain.custody ());
	auto resolved (record_get (*node, record.id));
	ASSERT_EQ (escrow::record_state::disputed, resolved.state);
	ASSERT_TRUE (resolved.provisional);
	ASSERT_TRUE (resolved.resolution);
	ASSERT_EQ (transaction, resolved.resolution->transaction);
	ASSERT_EQ (escrow::amount (600), resolved.resolution->amount);
	ASSERT_EQ ("partial damage", resolved.resolution->note);
	auto transaction_l (node->store.tx_begin_read ());
	auto events (node->store.events (transaction_l, record.id));
	ASSERT_EQ (escrow::record_event_type::resolution_submitted, events.back ().type);
	ASSERT_EQ (escrow::event_cause::administrative, events.back ().cause);
	boost::property_tree::ptree payload;
	std::stringstream stream (events.back ().payload);
	boost::property_tree::read_json (stream, payload);
	ASSERT_EQ ("400", payload.get<std::string> ("remainder"));
	escrow::block_hash transaction2;
	ASSERT_EQ (escrow::error_dispute::already_resolved, node->disputes.resolve (decision, transaction2));
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::dispute, escrow::stat::detail::resolution_submitted));
}

TEST (dispute, not_disputed)
{
	escrow::system system;
	auto node (system.add_node ());
	escrow::record record;
	ASSERT_NO_ERROR (node->escrow_create (system.agreement (1, 1000), record));
	escrow::dispute_decision decision;
	decision.escrow_id = record.id;
	decision.outcome = escrow::resolution_outcome::refund_to_buyer;
	escrow::block_hash transaction;
	ASSERT_EQ (escrow::error_dispute::not_disputed, node->disputes.resolve (decision, transaction));
	decision.escrow_id = 42;
	ASSERT_EQ (escrow::error_escrow::record_not_found, node->disputes.resolve (decision, transaction));
}

TEST (dispute, trade_not_linked)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (split_record ());
	record.trade_id = boost::none;
	record.agreement_id = 5;
	{
		auto transaction (node->store.tx_begin_write ());
		ASSERT_NO_ERROR (node->store.record_create (transaction, record));
	}
	escrow::dispute_decision decision;
	decision.escrow_id = record.id;
	decision.outcome = escrow::resolution_outcome::refund_to_buyer;
	escrow::block_hash transaction;
	ASSERT_EQ (escrow::error_dispute::trade_not_linked, node->disputes.resolve (decision, transaction));
}

TEST (dispute, admin_unavailable)
{
	escrow::system system;
	escrow::node_config config (system.logging);
	escrow::node_init init;
	escrow::node node (init, escrow::unique_path (), config, system.chain);
	ASSERT_FALSE (init.error ());
	escrow::dispute_decision decision;
	decision.escrow_id = 1;
	escrow::block_hash transaction;
	ASSERT_EQ (escrow::error_dispute::admin_unavailable, node.disputes.resolve (decision, transaction));
}

TEST (dispute, transfer_reverted)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (disputed_escrow (system, *node));
	system.chain.reject_transfers (system.seller.pub, true);
	escrow::dispute_decision decision;
	decision.escrow_id = record.id;
	decision.outcome = escrow::resolution_outcome::payout_to_seller;
	escrow::block_hash transaction;
	ASSERT_EQ (escrow::error_ledger::reverted, node->disputes.resolve (decision, transaction));
	auto unchanged (record_get (*node, record.id));
	ASSERT_FALSE (unchanged.resolution);
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::ledger, escrow::stat::detail::submit_failed));
	system.chain.reject_transfers (system.seller.pub, false);
	auto error (node->disputes.resolve (decision, transaction));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (1000, system.chain.balance (system.seller.pub));
}

TEST (dispute, halted)
{
	escrow::system system;
	auto node (system.add_node ());
	auto record (split_record ());
	record.halted = true;
	record.agreement_id = 5;
	{
		auto transaction (node->store.tx_begin_write ());
		ASSERT_NO_ERROR (node->store.record_create (transaction, record));
	}
	escrow::dispute_decision decision;
	decision.escrow_id = record.id;
	decision.outcome = escrow::resolution_outcome::refund_to_buyer;
	escrow::block_hash transaction;
	ASSERT_EQ (escrow::error_escrow::record_halted, node->disputes.resolve (decision, transaction));
}
