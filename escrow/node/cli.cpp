#include <escrow/lib/config.hpp>
#include <escrow/node/chain.hpp>
#include <escrow/node/cli.hpp>
#include <escrow/node/daemonconfig.hpp>
#include <escrow/node/json_handler.hpp>
#include <escrow/node/node.hpp>
#include <escrow/secure/utility.hpp>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <iostream>
#include <sstream>

std::string escrow::error_cli_messages::message (int ev) const
{
	switch (static_cast<escrow::error_cli> (ev))
	{
		case escrow::error_cli::generic:
			return "Unknown error";
		case escrow::error_cli::unknown_command:
			return "Unknown command";
		case escrow::error_cli::config_unreadable:
			return "Configuration could not be read";
		case escrow::error_cli::store_unavailable:
			return "Escrow record store could not be opened";
	}

	return "Invalid error code";
}

namespace
{
/** Answers a request against the record store of an existing data path, the ledger is not contacted */
std::error_code offline_request (boost::filesystem::path const & data_path, std::string const & action_a, uint64_t escrow_id_a)
{
	std::error_code ec;
	escrow::daemon_config config (data_path);
	auto error (escrow::read_and_update_daemon_config (data_path, config));
	if (!error)
	{
		escrow::keypair admin (config.ledger.admin_key);
		escrow::local_chain chain (admin.pub, config.ledger.fee_recipient, config.node.ledger_connection);
		chain.online (false);
		escrow::node_init init;
		escrow::node node (init, data_path, config.node, chain);
		if (!init.error ())
		{
			boost::property_tree::ptree request;
			request.put ("action", action_a);
			request.put ("id", std::to_string (escrow_id_a));
			std::stringstream body;
			boost::property_tree::write_json (body, request);
			auto handler (std::make_shared<escrow::json_handler> (node, body.str (), [](std::string const & response_a) {
				std::cout << response_a;
			}));
			handler->process_request ();
			ec = handler->ec;
		}
		else
		{
			ec = escrow::error_cli::store_unavailable;
			std::cerr << ec.message () << std::endl;
		}
		node.stop ();
	}
	else
	{
		ec = escrow::error_cli::config_unreadable;
		std::cerr << boost::str (boost::format ("%1%: %2%") % ec.message () % error.get_message ()) << std::endl;
	}
	return ec;
}
}

void escrow::add_node_options (boost::program_options::options_description & description_a)
{
	// clang-format off
	description_a.add_options ()
		("key_create", "Generates a random keypair")
		("escrow_status", boost::program_options::value<uint64_t> (), "Prints the escrow with the given id, its permissions and events")
		("escrow_events", boost::program_options::value<uint64_t> (), "Prints the event rows of the escrow with the given id");
	// clang-format on
}

std::error_code escrow::handle_node_options (boost::program_options::variables_map & vm)
{
	std::error_code ec;

	boost::filesystem::path data_path = vm.count ("data_path") ? boost::filesystem::path (vm["data_path"].as<std::string> ()) : escrow::working_path ();
	if (vm.count ("key_create"))
	{
		escrow::keypair pair;
		std::cout << "Private: " << pair.prv.data.to_string () << std::endl
		          << "Public: " << pair.pub.to_string () << std::endl
		          << "Account: " << pair.pub.to_account () << std::endl;
	}
	else if (vm.count ("escrow_status"))
	{
		ec = offline_request (data_path, "escrow_status", vm["escrow_status"].as<uint64_t> ());
	}
	else if (vm.count ("escrow_events"))
	{
		ec = offline_request (data_path, "escrow_events", vm["escrow_events"].as<uint64_t> ());
	}
	else
	{
		ec = escrow::error_cli::unknown_command;
	}

	return ec;
}
