#include <escrow/lib/config.hpp>
#include <escrow/node/daemonconfig.hpp>
#include <escrow/secure/common.hpp>

escrow::ledger_config::ledger_config () :
block_interval (escrow::network_constants ().block_interval)
{
	escrow::keypair admin;
	admin_key = admin.prv.data.to_string ();
	fee_recipient = admin.pub;
}

escrow::error escrow::ledger_config::serialize_json (escrow::jsonconfig & json) const
{
	json.put ("block_interval", block_interval.count ());
	json.put ("fee_recipient", fee_recipient.to_account ());
	json.put ("admin_key", admin_key);
	json.put ("custodial_key", custodial_key);
	json.put ("fee_bps", fee_bps);
	json.put ("timeout_duration", timeout_duration);
	return json.get_error ();
}

escrow::error escrow::ledger_config::deserialize_json (escrow::jsonconfig & json)
{
	auto block_interval_l (block_interval.count ());
	json.get ("block_interval", block_interval_l);
	block_interval = std::chrono::milliseconds (block_interval_l);
	json.get<escrow::account> ("fee_recipient", fee_recipient);
	json.get<std::string> ("admin_key", admin_key);
	json.get<std::string> ("custodial_key", custodial_key);
	json.get<uint64_t> ("fee_bps", fee_bps);
	json.get<uint64_t> ("timeout_duration", timeout_duration);

	escrow::raw_key key;
	if (key.data.decode_hex (admin_key))
	{
		json.get_error ().set ("admin_key must be a hex encoded private key");
	}
	if (!custodial_key.empty () && key.data.decode_hex (custodial_key))
	{
		json.get_error ().set ("custodial_key must be empty or a hex encoded private key");
	}
	if (fee_recipient.is_zero ())
	{
		json.get_error ().set ("fee_recipient must be set");
	}
	if (fee_bps > escrow::ledger::max_fee_bps)
	{
		json.get_error ().set ("fee_bps must not exceed 1000");
	}
	if (timeout_duration < escrow::ledger::min_timeout || timeout_duration > escrow::ledger::max_timeout)
	{
		json.get_error ().set ("timeout_duration must be between one day and one year");
	}
	return json.get_error ();
}

escrow::daemon_config::daemon_config (boost::filesystem::path const & data_path_a) :
data_path (data_path_a)
{
}

escrow::error escrow::daemon_config::serialize_json (escrow::jsonconfig & json)
{
	json.put ("version", json_version ());

	escrow::jsonconfig node_l;
	escrow::jsonconfig ledger_l;
	node.serialize_json (node_l);
	ledger.serialize_json (ledger_l);
	json.put_child ("node", node_l);
	json.put_child ("ledger", ledger_l);
	return json.get_error ();
}

escrow::error escrow::daemon_config::deserialize_json (bool & upgraded_a, escrow::jsonconfig & json)
{
	try
	{
		if (!json.empty ())
		{
			int version_l (json_version ());
			json.get_optional<int> ("version", version_l);

			upgraded_a |= upgrade_json (version_l, json);
			auto node_l (json.get_required_child ("node"));
			auto ledger_l (json.get_required_child ("ledger"));
			if (!json.get_error ())
			{
				node.deserialize_json (upgraded_a, node_l);
			}
			if (!json.get_error ())
			{
				ledger.deserialize_json (ledger_l);
			}
		}
		else
		{
			upgraded_a = true;
			serialize_json (json);
		}
	}
	catch (std::runtime_error const & ex)
	{
		json.get_error () = ex;
	}
	return json.get_error ();
}

bool escrow::daemon_config::upgrade_json (unsigned version_a, escrow::jsonconfig & json)
{
	json.put ("version", json_version ());
	switch (version_a)
	{
		case 1:
			break;
		default:
			throw std::runtime_error ("Unknown daemon_config version");
	}
	return version_a < json_version ();
}

escrow::error escrow::read_and_update_daemon_config (boost::filesystem::path const & data_path_a, escrow::daemon_config & config_a)
{
	escrow::jsonconfig json;
	auto config_path (escrow::get_config_path (data_path_a));
	auto result (json.read_and_update (config_a, config_path));
	if (!result)
	{
		// The file carries private keys
		boost::system::error_code ec;
		escrow::set_secure_perm_file (config_path, ec);
		if (ec)
		{
			result.set ("Could not restrict permissions of " + config_path.string () + ": " + ec.message ());
		}
	}
	return result;
}
