#pragma once

#include <escrow/lib/errors.hpp>

#include <boost/program_options.hpp>

namespace escrow
{
/** Command line related error codes */
enum class error_cli
{
	generic = 1,
	unknown_command,
	config_unreadable,
	store_unavailable
};

/** Options answered without running the daemon */
void add_node_options (boost::program_options::options_description &);
/** Runs the first node option present, unknown_command if there is none */
std::error_code handle_node_options (boost::program_options::variables_map &);
}

REGISTER_ERROR_CODES (escrow, error_cli)
