#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/node/nodeconfig.hpp>
#include <escrow/secure/ledger.hpp>

namespace escrow
{
/** Settings of the in-process ledger the daemon hosts */
class ledger_config
{
public:
	ledger_config ();
	escrow::error serialize_json (escrow::jsonconfig &) const;
	escrow::error deserialize_json (escrow::jsonconfig &);
	std::chrono::milliseconds block_interval;
	// Defaults to the administrator's account
	escrow::account fee_recipient{ 0 };
	// Hex encoded private keys
	std::string admin_key;
	// Empty to disable custodial funding
	std::string custodial_key;
	uint64_t fee_bps{ escrow::ledger::default_fee_bps };
	uint64_t timeout_duration{ escrow::ledger::default_timeout };
};

class daemon_config
{
public:
	daemon_config (boost::filesystem::path const & data_path);
	escrow::error deserialize_json (bool &, escrow::jsonconfig &);
	escrow::error serialize_json (escrow::jsonconfig &);
	/**
	 * Returns true if an upgrade occurred
	 * @param version The version to upgrade to.
	 * @param config Configuration to upgrade.
	 */
	bool upgrade_json (unsigned version, escrow::jsonconfig & config);
	escrow::node_config node;
	escrow::ledger_config ledger;
	boost::filesystem::path data_path;
	int json_version () const
	{
		return 1;
	}
};

escrow::error read_and_update_daemon_config (boost::filesystem::path const &, escrow::daemon_config & config_a);
}
