#include <gtest/gtest.h>

#include <escrow/lib/utility.hpp>
#include <escrow/secure/ledger.hpp>

namespace
{
class contract_parties
{
public:
	contract_parties () :
	ledger (admin.pub, fee_recipient.pub)
	{
		ledger.credit (buyer.pub, escrow::ether_ratio * 10);
	}
	escrow::keypair admin;
	escrow::keypair fee_recipient;
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::ledger ledger;
	uint64_t now{ 1000000 };
};

escrow::uint128_t released_total (escrow::process_return const & return_a)
{
	escrow::uint128_t result (0);
	for (auto & event : return_a.events)
	{
		result += escrow::released_amount (event);
	}
	return result;
}
}

TEST (ledger, create_and_fund)
{
	contract_parties parties;
	auto call (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::ether_ratio, "{\"listing\":\"1\"}"));
	auto return1 (parties.ledger.process (call, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	ASSERT_EQ (0, return1.trade_id);
	ASSERT_EQ (2, return1.events.size ());
	auto created (boost::get<escrow::escrow_created_event> (&return1.events[0]));
	ASSERT_NE (nullptr, created);
	ASSERT_EQ (parties.seller.pub, created->seller);
	ASSERT_EQ ("{\"listing\":\"1\"}", created->metadata);
	auto funded (boost::get<escrow::funded_event> (&return1.events[1]));
	ASSERT_NE (nullptr, funded);
	ASSERT_EQ (escrow::amount (escrow::ether_ratio), funded->amount);
	ASSERT_EQ (parties.buyer.pub, funded->payer);
	ASSERT_EQ (escrow::ether_ratio, parties.ledger.custody ());
	ASSERT_EQ (escrow::ether_ratio * 9, parties.ledger.balance (parties.buyer.pub));
	escrow::trade trade;
	ASSERT_FALSE (parties.ledger.trade_get (0, trade));
	ASSERT_EQ (escrow::trade_state::funded, trade.state);
	ASSERT_EQ (parties.now + escrow::ledger::default_timeout, trade.timeout_at);
	ASSERT_EQ (1, parties.ledger.trade_count ());
	auto return2 (parties.ledger.process (call, parties.now));
	ASSERT_EQ (1, return2.trade_id);
}

TEST (ledger, creation_validation)
{
	contract_parties parties;
	auto same (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.buyer.pub, escrow::ether_ratio, ""));
	ASSERT_EQ (escrow::process_result::same_party, parties.ledger.process (same, parties.now).code);
	auto null_seller (escrow::ledger_call::create_and_fund (parties.buyer.pub, escrow::account (0), escrow::ether_ratio, ""));
	ASSERT_EQ (escrow::process_result::invalid_seller, parties.ledger.process (null_seller, parties.now).code);
	auto zero (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::amount (0), ""));
	ASSERT_EQ (escrow::process_result::zero_amount, parties.ledger.process (zero, parties.now).code);
	auto unfunded (escrow::ledger_call::create_trade_without_fund (parties.buyer.pub, parties.seller.pub, ""));
	unfunded.value = escrow::amount (1);
	auto return1 (parties.ledger.process (unfunded, parties.now));
	ASSERT_EQ (escrow::process_result::unexpected_value, return1.code);
	ASSERT_TRUE (return1.events.empty ());
	ASSERT_EQ (0, parties.ledger.trade_count ());
	ASSERT_TRUE (parties.ledger.custody ().is_zero ());
}

TEST (ledger, create_then_fund)
{
	contract_parties parties;
	auto create (escrow::ledger_call::create_trade_without_fund (parties.buyer.pub, parties.seller.pub, ""));
	auto return1 (parties.ledger.process (create, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	ASSERT_EQ (1, return1.events.size ());
	escrow::trade trade;
	ASSERT_FALSE (parties.ledger.trade_get (return1.trade_id, trade));
	ASSERT_EQ (escrow::trade_state::awaiting_fund, trade.state);
	ASSERT_TRUE (trade.amount.is_zero ());
	auto stranger (escrow::ledger_call::fund_trade (parties.seller.pub, return1.trade_id, escrow::ether_ratio));
	ASSERT_EQ (escrow::process_result::not_buyer, parties.ledger.process (stranger, parties.now).code);
	auto fund (escrow::ledger_call::fund_trade (parties.buyer.pub, return1.trade_id, escrow::ether_ratio));
	auto return2 (parties.ledger.process (fund, parties.now + 5));
	ASSERT_EQ (escrow::process_result::progress, return2.code);
	ASSERT_EQ (1, return2.events.size ());
	ASSERT_NE (nullptr, boost::get<escrow::funded_event> (&return2.events[0]));
	ASSERT_FALSE (parties.ledger.trade_get (return1.trade_id, trade));
	ASSERT_EQ (escrow::trade_state::funded, trade.state);
	ASSERT_EQ (parties.now + 5 + escrow::ledger::default_timeout, trade.timeout_at);
	ASSERT_EQ (escrow::process_result::wrong_state, parties.ledger.process (fund, parties.now).code);
	auto missing (escrow::ledger_call::fund_trade (parties.buyer.pub, 42, escrow::ether_ratio));
	ASSERT_EQ (escrow::process_result::unknown_trade, parties.ledger.process (missing, parties.now).code);
}

TEST (ledger, confirm_delivery_fee)
{
	contract_parties parties;
	escrow::uint128_t amount (1000000);
	auto create (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, amount, ""));
	auto trade_id (parties.ledger.process (create, parties.now).trade_id);
	escrow::keypair stranger;
	auto outsider (escrow::ledger_call::confirm_delivery (stranger.pub, trade_id));
	ASSERT_EQ (escrow::process_result::not_party, parties.ledger.process (outsider, parties.now).code);
	auto confirm (escrow::ledger_call::confirm_delivery (parties.buyer.pub, trade_id));
	auto return1 (parties.ledger.process (confirm, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	ASSERT_EQ (2, return1.events.size ());
	ASSERT_NE (nullptr, boost::get<escrow::delivery_confirmed_event> (&return1.events[0]));
	auto released (boost::get<escrow::released_event> (&return1.events[1]));
	ASSERT_NE (nullptr, released);
	ASSERT_EQ (escrow::amount (990000), released->amount);
	ASSERT_EQ (escrow::amount (10000), released->fee);
	ASSERT_EQ (amount, released_total (return1));
	ASSERT_EQ (990000, parties.ledger.balance (parties.seller.pub));
	ASSERT_EQ (10000, parties.ledger.balance (parties.fee_recipient.pub));
	ASSERT_TRUE (parties.ledger.custody ().is_zero ());
	ASSERT_EQ (escrow::process_result::wrong_state, parties.ledger.process (confirm, parties.now).code);
}

TEST (ledger, confirm_delivery_without_fee)
{
	contract_parties parties;
	auto fee (escrow::ledger_call::update_platform_fee (parties.admin.pub, 0));
	ASSERT_EQ (escrow::process_result::progress, parties.ledger.process (fee, parties.now).code);
	auto create (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::amount (777), ""));
	auto trade_id (parties.ledger.process (create, parties.now).trade_id);
	auto confirm (escrow::ledger_call::confirm_delivery (parties.seller.pub, trade_id));
	auto return1 (parties.ledger.process (confirm, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	ASSERT_EQ (777, parties.ledger.balance (parties.seller.pub));
	ASSERT_TRUE (parties.ledger.balance (parties.fee_recipient.pub).is_zero ());
}

TEST (ledger, transfer_rejected)
{
	contract_parties parties;
	auto create (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::amount (500), ""));
	auto trade_id (parties.ledger.process (create, parties.now).trade_id);
	parties.ledger.reject_transfers (parties.fee_recipient.pub, true);
	auto confirm (escrow::ledger_call::confirm_delivery (parties.buyer.pub, trade_id));
	auto return1 (parties.ledger.process (confirm, parties.now));
	ASSERT_EQ (escrow::process_result::transfer_failed, return1.code);
	ASSERT_TRUE (return1.events.empty ());
	ASSERT_TRUE (parties.ledger.balance (parties.seller.pub).is_zero ());
	ASSERT_EQ (500, parties.ledger.custody ());
	escrow::trade trade;
	ASSERT_FALSE (parties.ledger.trade_get (trade_id, trade));
	ASSERT_EQ (escrow::trade_state::funded, trade.state);
	parties.ledger.reject_transfers (parties.fee_recipient.pub, false);
	ASSERT_EQ (escrow::process_result::progress, parties.ledger.process (confirm, parties.now).code);
}

TEST (ledger, dispute_partial_split)
{
	contract_parties parties;
	auto create (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::amount (100), ""));
	auto trade_id (parties.ledger.process (create, parties.now).trade_id);
	auto early (escrow::ledger_call::resolve_dispute (parties.admin.pub, trade_id, parties.seller.pub, escrow::amount (60), ""));
	ASSERT_EQ (escrow::process_result::wrong_state, parties.ledger.process (early, parties.now).code);
	auto dispute (escrow::ledger_call::raise_dispute (parties.seller.pub, trade_id, "item not as described"));
	auto return1 (parties.ledger.process (dispute, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	auto disputed (boost::get<escrow::disputed_event> (&return1.events[0]));
	ASSERT_NE (nullptr, disputed);
	ASSERT_EQ ("item not as described", disputed->reason);
	auto confirm (escrow::ledger_call::confirm_delivery (parties.buyer.pub, trade_id));
	ASSERT_EQ (escrow::process_result::wrong_state, parties.ledger.process (confirm, parties.now).code);
	auto not_admin (escrow::ledger_call::resolve_dispute (parties.buyer.pub, trade_id, parties.buyer.pub, escrow::amount (100), ""));
	ASSERT_EQ (escrow::process_result::not_admin, parties.ledger.process (not_admin, parties.now).code);
	escrow::keypair stranger;
	auto outsider (escrow::ledger_call::resolve_dispute (parties.admin.pub, trade_id, stranger.pub, escrow::amount (100), ""));
	ASSERT_EQ (escrow::process_result::invalid_recipient, parties.ledger.process (outsider, parties.now).code);
	auto excess (escrow::ledger_call::resolve_dispute (parties.admin.pub, trade_id, parties.seller.pub, escrow::amount (101), ""));
	ASSERT_EQ (escrow::process_result::amount_exceeds_trade, parties.ledger.process (excess, parties.now).code);
	auto resolve (escrow::ledger_call::resolve_dispute (parties.admin.pub, trade_id, parties.seller.pub, escrow::amount (60), "partial"));
	auto return2 (parties.ledger.process (resolve, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return2.code);
	ASSERT_EQ (2, return2.events.size ());
	ASSERT_EQ (100, released_total (return2));
	ASSERT_EQ (60, parties.ledger.balance (parties.seller.pub));
	ASSERT_EQ (escrow::ether_ratio * 10 - 60, parties.ledger.balance (parties.buyer.pub));
	ASSERT_TRUE (parties.ledger.custody ().is_zero ());
	escrow::trade trade;
	ASSERT_FALSE (parties.ledger.trade_get (trade_id, trade));
	ASSERT_EQ (escrow::trade_state::complete, trade.state);
}

TEST (ledger, dispute_full_refund)
{
	contract_parties parties;
	auto create (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::amount (100), ""));
	auto trade_id (parties.ledger.process (create, parties.now).trade_id);
	auto dispute (escrow::ledger_call::raise_dispute (parties.buyer.pub, trade_id, "never arrived"));
	ASSERT_EQ (escrow::process_result::progress, parties.ledger.process (dispute, parties.now).code);
	auto resolve (escrow::ledger_call::resolve_dispute (parties.admin.pub, trade_id, parties.buyer.pub, escrow::amount (100), ""));
	auto return1 (parties.ledger.process (resolve, parties.now));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	ASSERT_EQ (1, return1.events.size ());
	ASSERT_EQ (escrow::ether_ratio * 10, parties.ledger.balance (parties.buyer.pub));
	ASSERT_TRUE (parties.ledger.balance (parties.seller.pub).is_zero ());
}

TEST (ledger, timeout_refund)
{
	contract_parties parties;
	auto create (escrow::ledger_call::create_and_fund (parties.buyer.pub, parties.seller.pub, escrow::amount (100), ""));
	auto trade_id (parties.ledger.process (create, parties.now).trade_id);
	escrow::keypair anyone;
	auto refund (escrow::ledger_call::timeout_refund (anyone.pub, trade_id));
	ASSERT_EQ (escrow::process_result::not_timed_out, parties.ledger.process (refund, parties.now + escrow::ledger::default_timeout - 1).code);
	auto return1 (parties.ledger.process (refund, parties.now + escrow::ledger::default_timeout));
	ASSERT_EQ (escrow::process_result::progress, return1.code);
	auto refunded (boost::get<escrow::timeout_refund_event> (&return1.events[0]));
	ASSERT_NE (nullptr, refunded);
	ASSERT_EQ (parties.buyer.pub, refunded->buyer);
	ASSERT_EQ (escrow::ether_ratio * 10, parties.ledger.balance (parties.buyer.pub));
	ASSERT_EQ (escrow::process_result::wrong_state, parties.ledger.process (refund, parties.now + escrow::ledger::default_timeout).code);
}

TEST (ledger, administration)
{
	contract_parties parties;
	auto stranger_fee (escrow::ledger_call::update_platform_fee (parties.buyer.pub, 50));
	ASSERT_EQ (escrow::process_result::not_admin, parties.ledger.process (stranger_fee, parties.now).code);
	auto high_fee (escrow::ledger_call::update_platform_fee (parties.admin.pub, escrow::ledger::max_fee_bps + 1));
	ASSERT_EQ (escrow::process_result::fee_too_high, parties.ledger.process (high_fee, parties.now).code);
	auto max_fee (escrow::ledger_call::update_platform_fee (parties.admin.pub, escrow::ledger::max_fee_bps));
	ASSERT_EQ (escrow::process_result::progress, parties.ledger.process (max_fee, parties.now).code);
	ASSERT_EQ (escrow::ledger::max_fee_bps, parties.ledger.fee_bps);
	auto short_timeout (escrow::ledger_call::update_timeout_duration (parties.admin.pub, escrow::ledger::min_timeout - 1));
	ASSERT_EQ (escrow::process_result::invalid_duration, parties.ledger.process (short_timeout, parties.now).code);
	auto long_timeout (escrow::ledger_call::update_timeout_duration (parties.admin.pub, escrow::ledger::max_timeout + 1));
	ASSERT_EQ (escrow::process_result::invalid_duration, parties.ledger.process (long_timeout, parties.now).code);
	auto timeout (escrow::ledger_call::update_timeout_duration (parties.admin.pub, escrow::ledger::min_timeout));
	ASSERT_EQ (escrow::process_result::progress, parties.ledger.process (timeout, parties.now).code);
	ASSERT_EQ (escrow::ledger::min_timeout, parties.ledger.timeout_duration);
	auto null_recipient (escrow::ledger_call::update_fee_recipient (parties.admin.pub, escrow::account (0)));
	ASSERT_EQ (escrow::process_result::invalid_fee_recipient, parties.ledger.process (null_recipient, parties.now).code);
	auto recipient (escrow::ledger_call::update_fee_recipient (parties.admin.pub, parties.seller.pub));
	ASSERT_EQ (escrow::process_result::progress, parties.ledger.process (recipient, parties.now).code);
	ASSERT_EQ (parties.seller.pub, parties.ledger.fee_recipient);
}
