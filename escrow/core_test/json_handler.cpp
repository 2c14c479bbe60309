#include <escrow/core_test/testutil.hpp>
#include <escrow/node/json_handler.hpp>
#include <escrow/node/testing.hpp>

#include <gtest/gtest.h>

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace
{
/** Runs one request through a handler and parses the reply */
boost::property_tree::ptree call (escrow::node & node_a, boost::property_tree::ptree const & request_a)
{
	std::stringstream ostream;
	boost::property_tree::write_json (ostream, request_a);
	boost::property_tree::ptree result;
	auto handler (std::make_shared<escrow::json_handler> (node_a, ostream.str (), [&result](std::string const & response_a) {
		std::stringstream istream (response_a);
		boost::property_tree::read_json (istream, result);
	}));
	handler->process_request ();
	return result;
}

boost::property_tree::ptree create_request (escrow::system & system_a, uint64_t agreement_a, std::string const & amount_a)
{
	boost::property_tree::ptree request;
	request.put ("action", "escrow_create");
	request.put ("agreement_id", std::to_string (agreement_a));
	request.put ("buyer_id", "1");
	request.put ("seller_id", "2");
	request.put ("buyer_account", system_a.buyer.pub.to_account ());
	request.put ("seller_account", system_a.seller.pub.to_account ());
	request.put ("amount", amount_a);
	return request;
}
}

TEST (json_handler, escrow_create)
{
	escrow::system system;
	auto node (system.add_node ());
	auto request (create_request (system, 5, "1000"));
	request.put ("metadata", "order 5");
	auto response (call (*node, request));
	ASSERT_EQ ("1", response.get<std::string> ("id"));
	ASSERT_EQ ("5", response.get<std::string> ("agreement_id"));
	ASSERT_EQ ("awaiting_fund", response.get<std::string> ("state"));
	ASSERT_EQ ("1000", response.get<std::string> ("amount"));
	ASSERT_EQ (system.buyer.pub.to_account (), response.get<std::string> ("payer"));
	ASSERT_EQ ("order 5", response.get<std::string> ("metadata"));
	auto duplicate (call (*node, request));
	ASSERT_EQ ("Escrow already exists for this agreement", duplicate.get<std::string> ("error"));
	ASSERT_EQ ("escrow", duplicate.get<std::string> ("step"));
}

TEST (json_handler, escrow_create_invalid)
{
	escrow::system system;
	auto node (system.add_node ());
	auto bad_amount (create_request (system, 5, "ten"));
	auto response1 (call (*node, bad_amount));
	ASSERT_EQ (1, response1.count ("error"));
	auto bad_account (create_request (system, 6, "10"));
	bad_account.put ("seller_account", "esc_1111");
	auto response2 (call (*node, bad_account));
	ASSERT_EQ (1, response2.count ("error"));
	auto bad_id (create_request (system, 7, "10"));
	bad_id.put ("buyer_id", "-1");
	auto response3 (call (*node, bad_id));
	ASSERT_EQ ("Bad escrow id", response3.get<std::string> ("error"));
	ASSERT_EQ ("request", response3.get<std::string> ("step"));
	auto transaction (node->store.tx_begin_read ());
	ASSERT_EQ (0, node->store.record_count (transaction));
}

TEST (json_handler, escrow_status)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	boost::property_tree::ptree request;
	request.put ("action", "escrow_status");
	request.put ("id", "1");
	request.put ("actor", "1");
	auto response (call (*node, request));
	ASSERT_EQ ("awaiting_fund", response.get<std::string> ("state"));
	ASSERT_EQ ("true", response.get<std::string> ("permissions.can_be_funded"));
	ASSERT_EQ ("false", response.get<std::string> ("permissions.can_confirm_delivery"));
	ASSERT_EQ (1, response.get_child ("events").size ());
	request.put ("id", "2");
	auto missing (call (*node, request));
	ASSERT_EQ ("escrow", missing.get<std::string> ("step"));
	ASSERT_EQ (0, missing.count ("reference"));
}

TEST (json_handler, escrow_by_agreement)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	boost::property_tree::ptree request;
	request.put ("action", "escrow_by_agreement");
	request.put ("agreement_id", "5");
	request.put ("actor", "2");
	auto response (call (*node, request));
	ASSERT_EQ ("1", response.get<std::string> ("id"));
	ASSERT_EQ ("false", response.get<std::string> ("permissions.can_be_funded"));
}

TEST (json_handler, escrow_fund_self_custodial)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	auto fund (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, 1000, ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, fund, hash));
	system.chain.mine (3);
	boost::property_tree::ptree request;
	request.put ("action", "escrow_fund");
	request.put ("id", "1");
	request.put ("transaction", hash.to_string ());
	auto response (call (*node, request));
	ASSERT_EQ ("funded", response.get<std::string> ("state"));
	ASSERT_EQ (hash.to_string (), response.get<std::string> ("transaction"));
	ASSERT_EQ ("false", response.get<std::string> ("trust_reduced"));
}

TEST (json_handler, escrow_fund_rejected)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	auto fund (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, 999, ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (system.submit (system.buyer, fund, hash));
	system.chain.mine (3);
	boost::property_tree::ptree request;
	request.put ("action", "escrow_fund");
	request.put ("id", "1");
	request.put ("transaction", hash.to_string ());
	auto response (call (*node, request));
	ASSERT_EQ ("Funding amount does not match", response.get<std::string> ("error"));
	ASSERT_EQ ("verification", response.get<std::string> ("step"));
	ASSERT_EQ (hash.to_string (), response.get<std::string> ("reference"));
	request.put ("path", "wire");
	auto bad_path (call (*node, request));
	ASSERT_EQ ("request", bad_path.get<std::string> ("step"));
}

TEST (json_handler, escrow_events)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	boost::property_tree::ptree request;
	request.put ("action", "escrow_events");
	request.put ("id", "1");
	auto response (call (*node, request));
	auto & events (response.get_child ("events"));
	ASSERT_EQ (1, events.size ());
	ASSERT_EQ ("created", events.front ().second.get<std::string> ("type"));
	ASSERT_EQ ("1", events.front ().second.get<std::string> ("sequence"));
}

TEST (json_handler, dispute_resolve)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	boost::property_tree::ptree request;
	request.put ("action", "dispute_resolve");
	request.put ("id", "1");
	request.put ("outcome", "refund_to_buyer");
	auto response (call (*node, request));
	ASSERT_EQ ("dispute", response.get<std::string> ("step"));
	request.put ("outcome", "coin_flip");
	auto bad_outcome (call (*node, request));
	ASSERT_EQ ("request", bad_outcome.get<std::string> ("step"));
}

TEST (json_handler, escrow_list)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	call (*node, create_request (system, 6, "2000"));
	call (*node, create_request (system, 7, "3000"));
	auto strangers (create_request (system, 8, "4000"));
	strangers.put ("buyer_id", "3");
	strangers.put ("seller_id", "4");
	call (*node, strangers);
	{
		escrow::record record;
		auto transaction (node->store.tx_begin_write ());
		ASSERT_FALSE (node->store.record_get (transaction, 2, record));
		record.state = escrow::record_state::disputed;
		auto error (node->store.state_update (transaction, escrow::record_state::awaiting_fund, record));
		ASSERT_NO_ERROR (error);
	}
	boost::property_tree::ptree request;
	request.put ("action", "escrow_list");
	request.put ("actor", "1");
	request.put ("limit", "2");
	auto first (call (*node, request));
	ASSERT_EQ ("3", first.get<std::string> ("total"));
	ASSERT_EQ ("1", first.get<std::string> ("page"));
	ASSERT_EQ ("2", first.get<std::string> ("limit"));
	ASSERT_EQ ("true", first.get<std::string> ("has_next"));
	ASSERT_EQ ("false", first.get<std::string> ("has_prev"));
	auto & escrows1 (first.get_child ("escrows"));
	ASSERT_EQ (2, escrows1.size ());
	ASSERT_EQ ("1", escrows1.front ().second.get<std::string> ("id"));
	ASSERT_EQ ("2", escrows1.back ().second.get<std::string> ("id"));
	ASSERT_EQ ("true", escrows1.front ().second.get<std::string> ("permissions.can_be_funded"));
	ASSERT_EQ (1, escrows1.front ().second.get_child ("events").size ());
	request.put ("page", "2");
	auto second (call (*node, request));
	auto & escrows2 (second.get_child ("escrows"));
	ASSERT_EQ (1, escrows2.size ());
	ASSERT_EQ ("3", escrows2.front ().second.get<std::string> ("id"));
	ASSERT_EQ ("false", second.get<std::string> ("has_next"));
	ASSERT_EQ ("true", second.get<std::string> ("has_prev"));
	boost::property_tree::ptree seller;
	seller.put ("action", "escrow_list");
	seller.put ("actor", "2");
	seller.put ("state", "disputed");
	auto disputed (call (*node, seller));
	ASSERT_EQ ("1", disputed.get<std::string> ("total"));
	ASSERT_EQ ("2", disputed.get_child ("escrows").front ().second.get<std::string> ("id"));
	ASSERT_EQ ("10", disputed.get<std::string> ("limit"));
	boost::property_tree::ptree other;
	other.put ("action", "escrow_list");
	other.put ("actor", "4");
	auto others (call (*node, other));
	ASSERT_EQ ("1", others.get<std::string> ("total"));
	ASSERT_EQ ("4", others.get_child ("escrows").front ().second.get<std::string> ("id"));
	other.put ("actor", "9");
	auto none (call (*node, other));
	ASSERT_EQ ("0", none.get<std::string> ("total"));
	ASSERT_TRUE (none.get_child ("escrows").empty ());
	ASSERT_EQ ("false", none.get<std::string> ("has_next"));
}

TEST (json_handler, escrow_list_invalid)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	boost::property_tree::ptree request;
	request.put ("action", "escrow_list");
	auto missing_actor (call (*node, request));
	ASSERT_EQ ("Invalid request", missing_actor.get<std::string> ("error"));
	request.put ("actor", "1");
	request.put ("limit", "0");
	auto zero_limit (call (*node, request));
	ASSERT_EQ ("Bad limit, expected 1 to 100", zero_limit.get<std::string> ("error"));
	ASSERT_EQ ("request", zero_limit.get<std::string> ("step"));
	request.put ("limit", "101");
	auto large_limit (call (*node, request));
	ASSERT_EQ ("Bad limit, expected 1 to 100", large_limit.get<std::string> ("error"));
	request.put ("limit", "100");
	request.put ("page", "0");
	auto zero_page (call (*node, request));
	ASSERT_EQ ("Bad page, pages start at 1", zero_page.get<std::string> ("error"));
	request.put ("page", "1");
	request.put ("state", "lost");
	auto bad_state (call (*node, request));
	ASSERT_EQ ("request", bad_state.get<std::string> ("step"));
	ASSERT_EQ (0, bad_state.count ("escrows"));
	request.put ("state", "awaiting_fund");
	auto valid (call (*node, request));
	ASSERT_EQ ("1", valid.get<std::string> ("total"));
}

TEST (json_handler, dispute_list)
{
	escrow::system system;
	auto node (system.add_node ());
	for (uint64_t agreement (5); agreement < 9; ++agreement)
	{
		call (*node, create_request (system, agreement, "1000"));
	}
	for (uint64_t id : { 2, 4 })
	{
		escrow::record record;
		auto transaction (node->store.tx_begin_write ());
		ASSERT_FALSE (node->store.record_get (transaction, id, record));
		record.state = escrow::record_state::disputed;
		auto error (node->store.state_update (transaction, escrow::record_state::awaiting_fund, record));
		ASSERT_NO_ERROR (error);
	}
	boost::property_tree::ptree request;
	request.put ("action", "dispute_list");
	auto all (call (*node, request));
	ASSERT_EQ ("2", all.get<std::string> ("total"));
	ASSERT_EQ ("1", all.get<std::string> ("page"));
	ASSERT_EQ ("10", all.get<std::string> ("limit"));
	ASSERT_EQ (0, all.count ("has_next"));
	auto & disputes (all.get_child ("disputes"));
	ASSERT_EQ (2, disputes.size ());
	ASSERT_EQ ("2", disputes.front ().second.get<std::string> ("id"));
	ASSERT_EQ ("disputed", disputes.front ().second.get<std::string> ("state"));
	ASSERT_EQ ("4", disputes.back ().second.get<std::string> ("id"));
	request.put ("limit", "1");
	request.put ("page", "2");
	auto paged (call (*node, request));
	ASSERT_EQ (1, paged.get_child ("disputes").size ());
	ASSERT_EQ ("4", paged.get_child ("disputes").front ().second.get<std::string> ("id"));
	request.put ("page", "0");
	auto bad_page (call (*node, request));
	ASSERT_EQ ("Bad page, pages start at 1", bad_page.get<std::string> ("error"));
}

TEST (json_handler, invalid_requests)
{
	escrow::system system;
	auto node (system.add_node ());
	boost::property_tree::ptree unknown;
	unknown.put ("action", "escrow_destroy");
	auto response1 (call (*node, unknown));
	ASSERT_EQ ("Unknown command", response1.get<std::string> ("error"));
	boost::property_tree::ptree no_action;
	no_action.put ("id", "1");
	auto response2 (call (*node, no_action));
	ASSERT_EQ ("Invalid request", response2.get<std::string> ("error"));
	boost::property_tree::ptree no_id;
	no_id.put ("action", "escrow_status");
	auto response3 (call (*node, no_id));
	ASSERT_EQ ("Invalid request", response3.get<std::string> ("error"));
}

TEST (json_handler, stats)
{
	escrow::system system;
	auto node (system.add_node ());
	call (*node, create_request (system, 5, "1000"));
	boost::property_tree::ptree request;
	request.put ("action", "stats");
	auto response (call (*node, request));
	ASSERT_EQ ("counters", response.get<std::string> ("type"));
	ASSERT_EQ (1, node->stats.count (escrow::stat::type::escrow, escrow::stat::detail::created));
	auto created (false);
	for (auto const & entry : response.get_child ("entries"))
	{
		created |= entry.second.get<std::string> ("type") == "escrow" && entry.second.get<std::string> ("detail") == "created" && entry.second.get<uint64_t> ("value") == 1;
	}
	ASSERT_TRUE (created);
}
