#include <escrow/lib/errors.hpp>
#include <escrow/node/json_handler.hpp>
#include <escrow/node/node.hpp>

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace
{
// Keeps page * limit within 64 bits
uint64_t const page_max (1ULL << 32);

bool decode_unsigned (std::string const & text, uint64_t & number)
{
	auto result (text.empty () || text.find_first_not_of ("0123456789") != std::string::npos);
	if (!result)
	{
		try
		{
			number = std::stoull (text);
		}
		catch (std::out_of_range const &)
		{
			result = true;
		}
	}
	return result;
}
}

escrow::json_handler::json_handler (escrow::node & node_a, std::string const & body_a, std::function<void(std::string const &)> const & response_a) :
body (body_a),
node (node_a),
response (response_a)
{
}

void escrow::json_handler::process_request ()
{
	try
	{
		std::stringstream istream (body);
		boost::property_tree::read_json (istream, request);
		action = request.get<std::string> ("action");
		if (action == "escrow_create")
		{
			escrow_create ();
		}
		else if (action == "escrow_status")
		{
			escrow_status ();
		}
		else if (action == "escrow_by_agreement")
		{
			escrow_by_agreement ();
		}
		else if (action == "escrow_fund")
		{
			escrow_fund ();
		}
		else if (action == "escrow_events")
		{
			escrow_events ();
		}
		else if (action == "escrow_list")
		{
			escrow_list ();
		}
		else if (action == "dispute_list")
		{
			dispute_list ();
		}
		else if (action == "dispute_resolve")
		{
			dispute_resolve ();
		}
		else if (action == "stats")
		{
			stats ();
		}
		else
		{
			ec = escrow::error_rpc::unknown_command;
		}
	}
	catch (std::runtime_error const &)
	{
		ec = escrow::error_rpc::invalid_request;
	}
	response_errors ();
}

void escrow::json_handler::response_errors ()
{
	std::stringstream ostream;
	if (ec || response_l.empty ())
	{
		boost::property_tree::ptree response_error;
		std::error_code error (ec ? ec : std::error_code (escrow::error_rpc::empty_response));
		response_error.put ("error", error.message ());
		response_error.put ("step", escrow::error_step (error));
		if (reference)
		{
			response_error.put ("reference", reference->to_string ());
		}
		boost::property_tree::write_json (ostream, response_error);
	}
	else
	{
		boost::property_tree::write_json (ostream, response_l);
	}
	response (ostream.str ());
}

escrow::account escrow::json_handler::account_impl (std::string const & field_a)
{
	escrow::account result (0);
	if (!ec)
	{
		auto text (request.get<std::string> (field_a));
		if (result.decode_account (text))
		{
			ec = escrow::error_common::bad_account_number;
		}
	}
	return result;
}

escrow::amount escrow::json_handler::amount_impl (std::string const & field_a)
{
	escrow::amount result (0);
	if (!ec)
	{
		auto text (request.get<std::string> (field_a));
		if (result.decode_dec (text))
		{
			ec = escrow::error_common::invalid_amount;
		}
	}
	return result;
}

escrow::block_hash escrow::json_handler::hash_impl (std::string const & field_a)
{
	escrow::block_hash result (0);
	if (!ec)
	{
		auto text (request.get<std::string> (field_a));
		if (result.decode_hex (text))
		{
			ec = escrow::error_rpc::bad_hash;
		}
	}
	return result;
}

uint64_t escrow::json_handler::id_impl (std::string const & field_a)
{
	uint64_t result (0);
	if (!ec)
	{
		auto text (request.get<std::string> (field_a));
		if (decode_unsigned (text, result))
		{
			ec = escrow::error_rpc::bad_escrow_id;
		}
	}
	return result;
}

uint64_t escrow::json_handler::actor_impl ()
{
	uint64_t result (0);
	if (!ec)
	{
		auto text (request.get<std::string> ("actor"));
		if (decode_unsigned (text, result) || result == 0)
		{
			ec = escrow::error_common::invalid_index;
		}
	}
	return result;
}

uint64_t escrow::json_handler::actor_optional_impl ()
{
	uint64_t result (0);
	boost::optional<std::string> text (request.get_optional<std::string> ("actor"));
	if (!ec && text.is_initialized () && decode_unsigned (text.get (), result))
	{
		ec = escrow::error_common::invalid_index;
	}
	return result;
}

uint64_t escrow::json_handler::now_optional_impl ()
{
	uint64_t result (escrow::seconds_since_epoch ());
	boost::optional<std::string> text (request.get_optional<std::string> ("now"));
	if (!ec && text.is_initialized () && decode_unsigned (text.get (), result))
	{
		ec = escrow::error_common::numeric_conversion;
	}
	return result;
}

uint64_t escrow::json_handler::bounded_optional_impl (std::string const & field_a, uint64_t default_a, uint64_t min_a, uint64_t max_a, escrow::error_rpc error_a)
{
	uint64_t result (default_a);
	boost::optional<std::string> text (request.get_optional<std::string> (field_a));
	if (!ec && text.is_initialized () && (decode_unsigned (text.get (), result) || result < min_a || result > max_a))
	{
		ec = error_a;
	}
	return result;
}

void escrow::json_handler::page_impl (escrow::escrow_page const & page_a, std::string const & key_a)
{
	boost::property_tree::ptree views_l;
	for (auto & view : page_a.views)
	{
		boost::property_tree::ptree entry;
		view.serialize_json (entry);
		views_l.push_back (std::make_pair ("", entry));
	}
	response_l.add_child (key_a, views_l);
	response_l.put ("total", page_a.total);
	response_l.put ("page", page_a.page);
	response_l.put ("limit", page_a.limit);
}

void escrow::json_handler::escrow_create ()
{
	escrow::agreement agreement;
	agreement.agreement_id = id_impl ("agreement_id");
	agreement.buyer_id = id_impl ("buyer_id");
	agreement.seller_id = id_impl ("seller_id");
	agreement.buyer_account = account_impl ("buyer_account");
	agreement.seller_account = account_impl ("seller_account");
	agreement.amount = amount_impl ("amount");
	agreement.metadata = request.get<std::string> ("metadata", "");
	if (!ec)
	{
		escrow::record record;
		ec = node.escrow_create (agreement, record);
		if (!ec)
		{
			record.serialize_json (response_l);
		}
	}
}

void escrow::json_handler::escrow_status ()
{
	auto id (id_impl ());
	auto actor (actor_optional_impl ());
	auto now (now_optional_impl ());
	if (!ec)
	{
		escrow::escrow_view view;
		ec = node.escrow_status (id, actor, now, view);
		if (!ec)
		{
			view.serialize_json (response_l);
		}
	}
}

void escrow::json_handler::escrow_list ()
{
	auto actor (actor_impl ());
	auto now (now_optional_impl ());
	auto page (bounded_optional_impl ("page", 1, 1, page_max, escrow::error_rpc::bad_page));
	auto limit (bounded_optional_impl ("limit", 10, 1, 100, escrow::error_rpc::bad_limit));
	boost::optional<escrow::record_state> state;
	boost::optional<std::string> state_text (request.get_optional<std::string> ("state"));
	if (!ec && state_text.is_initialized ())
	{
		escrow::record_state decoded;
		if (escrow::decode_state (state_text.get (), decoded))
		{
			ec = escrow::error_rpc::bad_state;
		}
		else
		{
			state = decoded;
		}
	}
	if (!ec)
	{
		escrow::escrow_page page_l;
		node.escrow_list (actor, state, page, limit, now, page_l);
		page_impl (page_l, "escrows");
		response_l.put ("has_next", page_l.has_next () ? "true" : "false");
		response_l.put ("has_prev", page_l.has_prev () ? "true" : "false");
	}
}

void escrow::json_handler::dispute_list ()
{
	auto now (now_optional_impl ());
	auto page (bounded_optional_impl ("page", 1, 1, page_max, escrow::error_rpc::bad_page));
	auto limit (bounded_optional_impl ("limit", 10, 1, 100, escrow::error_rpc::bad_limit));
	if (!ec)
	{
		escrow::escrow_page page_l;
		node.dispute_list (page, limit, now, page_l);
		page_impl (page_l, "disputes");
	}
}

void escrow::json_handler::escrow_by_agreement ()
{
	auto agreement_id (id_impl ("agreement_id"));
	auto actor (actor_optional_impl ());
	auto now (now_optional_impl ());
	if (!ec)
	{
		escrow::escrow_view view;
		ec = node.escrow_by_agreement (agreement_id, actor, now, view);
		if (!ec)
		{
			view.serialize_json (response_l);
		}
	}
}

void escrow::json_handler::escrow_fund ()
{
	escrow::funding_intent intent;
	intent.escrow_id = id_impl ();
	if (!ec && escrow::decode_path (request.get<std::string> ("path", "self_custodial"), intent.path))
	{
		ec = escrow::error_rpc::bad_funding_path;
	}
	if (!ec && intent.path == escrow::funding_path::self_custodial)
	{
		intent.transaction = hash_impl ();
	}
	if (!ec)
	{
		escrow::block_hash transaction (0);
		ec = node.funding.process (intent, transaction);
		if (!transaction.is_zero ())
		{
			reference = transaction;
		}
		if (!ec)
		{
			escrow::escrow_view view;
			ec = node.escrow_status (intent.escrow_id, 0, escrow::seconds_since_epoch (), view);
			if (!ec)
			{
				response_l.put ("state", escrow::to_string (view.record.state));
				response_l.put ("transaction", transaction.to_string ());
				response_l.put ("trust_reduced", intent.path == escrow::funding_path::custodial ? "true" : "false");
			}
		}
	}
}

void escrow::json_handler::escrow_events ()
{
	auto id (id_impl ());
	if (!ec)
	{
		escrow::escrow_view view;
		ec = node.escrow_status (id, 0, escrow::seconds_since_epoch (), view);
		if (!ec)
		{
			boost::property_tree::ptree events;
			for (auto & event : view.events)
			{
				boost::property_tree::ptree entry;
				event.serialize_json (entry);
				events.push_back (std::make_pair ("", entry));
			}
			response_l.add_child ("events", events);
		}
	}
}

void escrow::json_handler::dispute_resolve ()
{
	escrow::dispute_decision decision;
	decision.escrow_id = id_impl ();
	if (!ec && escrow::decode_outcome (request.get<std::string> ("outcome"), decision.outcome))
	{
		ec = escrow::error_rpc::bad_outcome;
	}
	if (!ec && request.count ("recipient") != 0)
	{
		decision.recipient = account_impl ("recipient");
	}
	if (!ec && request.count ("amount") != 0)
	{
		decision.amount = amount_impl ("amount");
	}
	decision.note = request.get<std::string> ("note", "");
	if (!ec)
	{
		escrow::block_hash transaction (0);
		ec = node.disputes.resolve (decision, transaction);
		if (!transaction.is_zero ())
		{
			reference = transaction;
		}
		if (!ec)
		{
			response_l.put ("transaction", transaction.to_string ());
		}
	}
}

void escrow::json_handler::stats ()
{
	response_l = node.stats.serialize ();
}
