#include <escrow/lib/jsonconfig.hpp>
#include <escrow/node/nodeconfig.hpp>

namespace
{
const char * custodial_confirmation_timeout_key = "custodial_confirmation_timeout";
const char * confirmation_poll_interval_key = "confirmation_poll_interval";
const char * reconciler_interval_key = "reconciler_interval";
}

escrow::node_config::node_config () :
node_config (escrow::logging ())
{
}

escrow::node_config::node_config (escrow::logging const & logging_a) :
logging (logging_a),
confirmations (network.confirmations),
custodial_confirmation_timeout (network.custodial_confirmation_timeout),
confirmation_poll_interval (network.confirmation_poll_interval),
reconciler_interval (network.reconciler_interval)
{
}

escrow::error escrow::node_config::serialize_json (escrow::jsonconfig & json) const
{
	json.put ("version", json_version ());
	escrow::jsonconfig logging_l;
	logging.serialize_json (logging_l);
	json.put_child ("logging", logging_l);
	json.put ("confirmations", confirmations);
	json.put ("verification_attempts_max", verification_attempts_max);
	json.put (custodial_confirmation_timeout_key, custodial_confirmation_timeout.count ());
	json.put (confirmation_poll_interval_key, confirmation_poll_interval.count ());
	json.put (reconciler_interval_key, reconciler_interval.count ());
	json.put ("reconciler_batch_size", reconciler_batch_size);
	json.put ("reconciler_start_height", reconciler_start_height);
	json.put ("lmdb_max_dbs", lmdb_max_dbs);
	json.put ("ledger_connection", ledger_connection);
	return json.get_error ();
}

bool escrow::node_config::upgrade_json (unsigned version_a, escrow::jsonconfig & json)
{
	json.put ("version", json_version ());
	switch (version_a)
	{
		case 1:
			json.put ("reconciler_batch_size", reconciler_batch_size);
			json.put ("reconciler_start_height", reconciler_start_height);
			json.put ("ledger_connection", ledger_connection);
		case 2:
			break;
		default:
			throw std::runtime_error ("Unknown node_config version");
	}
	return version_a < json_version ();
}

escrow::error escrow::node_config::deserialize_json (bool & upgraded_a, escrow::jsonconfig & json)
{
	try
	{
		auto version_l (json.get_optional<unsigned> ("version"));
		if (!version_l)
		{
			version_l = 1;
			json.put ("version", version_l);
			upgraded_a = true;
		}

		upgraded_a |= upgrade_json (version_l.get (), json);

		auto logging_l (json.get_required_child ("logging"));
		logging.deserialize_json (upgraded_a, logging_l);

		json.get<unsigned> ("confirmations", confirmations);
		json.get<unsigned> ("verification_attempts_max", verification_attempts_max);

		auto custodial_confirmation_timeout_l (custodial_confirmation_timeout.count ());
		json.get (custodial_confirmation_timeout_key, custodial_confirmation_timeout_l);
		custodial_confirmation_timeout = std::chrono::milliseconds (custodial_confirmation_timeout_l);

		auto confirmation_poll_interval_l (confirmation_poll_interval.count ());
		json.get (confirmation_poll_interval_key, confirmation_poll_interval_l);
		confirmation_poll_interval = std::chrono::milliseconds (confirmation_poll_interval_l);

		auto reconciler_interval_l (reconciler_interval.count ());
		json.get (reconciler_interval_key, reconciler_interval_l);
		reconciler_interval = std::chrono::milliseconds (reconciler_interval_l);

		json.get<unsigned> ("reconciler_batch_size", reconciler_batch_size);
		json.get<uint64_t> ("reconciler_start_height", reconciler_start_height);
		json.get<int> ("lmdb_max_dbs", lmdb_max_dbs);
		json.get<std::string> ("ledger_connection", ledger_connection);

		// Validate ranges
		if (verification_attempts_max == 0)
		{
			json.get_error ().set ("verification_attempts_max must be non-zero");
		}
		if (reconciler_batch_size == 0)
		{
			json.get_error ().set ("reconciler_batch_size must be non-zero");
		}
		if (confirmation_poll_interval.count () <= 0)
		{
			json.get_error ().set ("confirmation_poll_interval must be positive");
		}
		if (ledger_connection.empty ())
		{
			json.get_error ().set ("ledger_connection must be named");
		}
	}
	catch (std::runtime_error const & ex)
	{
		json.get_error ().set (ex.what ());
	}
	return json.get_error ();
}
