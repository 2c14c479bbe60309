#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/lib/numbers.hpp>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace escrow
{
class escrow_page;
class node;

/**
 * Serves one JSON request against a node, the reply is handed to the response callback
 */
class json_handler : public std::enable_shared_from_this<escrow::json_handler>
{
public:
	json_handler (escrow::node &, std::string const &, std::function<void(std::string const &)> const &);
	void process_request ();
	void dispute_list ();
	void dispute_resolve ();
	void escrow_by_agreement ();
	void escrow_create ();
	void escrow_events ();
	void escrow_fund ();
	void escrow_list ();
	void escrow_status ();
	void stats ();
	std::string body;
	escrow::node & node;
	boost::property_tree::ptree request;
	std::function<void(std::string const &)> response;
	void response_errors ();
	std::error_code ec;
	// Transaction reported alongside an error
	boost::optional<escrow::block_hash> reference;
	std::string action;
	boost::property_tree::ptree response_l;
	escrow::account account_impl (std::string const &);
	escrow::amount amount_impl (std::string const &);
	escrow::block_hash hash_impl (std::string const & = "transaction");
	uint64_t id_impl (std::string const & = "id");
	uint64_t actor_impl ();
	uint64_t actor_optional_impl ();
	uint64_t bounded_optional_impl (std::string const &, uint64_t, uint64_t, uint64_t, escrow::error_rpc);
	void page_impl (escrow::escrow_page const &, std::string const &);
	uint64_t now_optional_impl ();
};
}
