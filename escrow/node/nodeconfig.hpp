#pragma once

#include <escrow/lib/config.hpp>
#include <escrow/lib/errors.hpp>
#include <escrow/lib/jsonconfig.hpp>
#include <escrow/node/logging.hpp>

#include <chrono>
#include <string>

namespace escrow
{
/**
 * Node configuration
 */
class node_config
{
public:
	node_config ();
	node_config (escrow::logging const &);
	escrow::error serialize_json (escrow::jsonconfig &) const;
	escrow::error deserialize_json (bool &, escrow::jsonconfig &);
	bool upgrade_json (unsigned, escrow::jsonconfig &);
	escrow::network_constants network;
	escrow::logging logging;
	unsigned confirmations;
	unsigned verification_attempts_max{ 5 };
	std::chrono::milliseconds custodial_confirmation_timeout;
	std::chrono::milliseconds confirmation_poll_interval;
	std::chrono::milliseconds reconciler_interval;
	unsigned reconciler_batch_size{ 100 };
	uint64_t reconciler_start_height{ 0 };
	int lmdb_max_dbs{ 128 };
	std::string ledger_connection{ "local" };
	static unsigned json_version ()
	{
		return 2;
	}
};
}
