#include <escrow/lib/config.hpp>
#include <escrow/node/logging.hpp>

#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <iostream>

boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> escrow::logging::file_sink;
std::atomic_flag escrow::logging::logging_already_added ATOMIC_FLAG_INIT;

void escrow::logging::init (boost::filesystem::path const & application_path_a)
{
	if (!logging_already_added.test_and_set ())
	{
		boost::log::add_common_attributes ();
		auto format_with_timestamp = boost::log::expressions::stream << "[" << boost::log::expressions::attr<boost::posix_time::ptime> ("TimeStamp") << "]: " << boost::log::expressions::smessage;

		if (log_to_cerr ())
		{
			boost::log::add_console_log (std::cerr, boost::log::keywords::format = format_with_timestamp);
		}

		escrow::network_constants network_constants;
		if (!network_constants.is_test_network ())
		{
			file_sink = boost::log::add_file_log (boost::log::keywords::target = application_path_a / "log", boost::log::keywords::file_name = application_path_a / "log" / "log_%Y-%m-%d_%H-%M-%S.%N.log", boost::log::keywords::rotation_size = rotation_size, boost::log::keywords::auto_flush = flush, boost::log::keywords::scan_method = boost::log::sinks::file::scan_method::scan_matching, boost::log::keywords::max_size = max_size, boost::log::keywords::format = format_with_timestamp);
		}
	}
}

void escrow::logging::release_file_sink ()
{
	if (logging_already_added.test_and_set () && escrow::logging::file_sink)
	{
		boost::log::core::get ()->remove_sink (escrow::logging::file_sink);
		escrow::logging::file_sink.reset ();
	}
	logging_already_added.clear ();
}

escrow::error escrow::logging::serialize_json (escrow::jsonconfig & json) const
{
	json.put ("version", json_version ());
	json.put ("ledger", ledger_logging_value);
	json.put ("verification", verification_logging_value);
	json.put ("funding", funding_logging_value);
	json.put ("reconciler", reconciler_logging_value);
	json.put ("dispute", dispute_logging_value);
	json.put ("log_to_cerr", log_to_cerr_value);
	json.put ("flush", flush);
	json.put ("max_size", max_size);
	json.put ("rotation_size", rotation_size);
	json.put ("min_time_between_output", min_time_between_log_output.count ());
	return json.get_error ();
}

bool escrow::logging::upgrade_json (unsigned version_a, escrow::jsonconfig & json)
{
	json.put ("version", json_version ());
	auto upgraded_l (false);
	switch (version_a)
	{
		case 1:
			break;
		default:
			throw std::runtime_error ("Unknown logging_config version");
			break;
	}
	return upgraded_l;
}

escrow::error escrow::logging::deserialize_json (bool & upgraded_a, escrow::jsonconfig & json)
{
	int version_l (1);
	if (!json.has_key ("version"))
	{
		json.put ("version", version_l);
		upgraded_a = true;
	}
	else
	{
		json.get_required<int> ("version", version_l);
	}

	upgraded_a |= upgrade_json (version_l, json);
	json.get<bool> ("ledger", ledger_logging_value);
	json.get<bool> ("verification", verification_logging_value);
	json.get<bool> ("funding", funding_logging_value);
	json.get<bool> ("reconciler", reconciler_logging_value);
	json.get<bool> ("dispute", dispute_logging_value);
	json.get<bool> ("log_to_cerr", log_to_cerr_value);
	json.get<bool> ("flush", flush);
	json.get<uintmax_t> ("max_size", max_size);
	json.get<uintmax_t> ("rotation_size", rotation_size);
	auto min_time_between_log_output_l = min_time_between_log_output.count ();
	json.get ("min_time_between_output", min_time_between_log_output_l);
	min_time_between_log_output = std::chrono::milliseconds (min_time_between_log_output_l);
	return json.get_error ();
}

bool escrow::logging::ledger_logging () const
{
	return ledger_logging_value;
}

bool escrow::logging::verification_logging () const
{
	return verification_logging_value;
}

bool escrow::logging::funding_logging () const
{
	return funding_logging_value;
}

bool escrow::logging::reconciler_logging () const
{
	return reconciler_logging_value;
}

bool escrow::logging::dispute_logging () const
{
	return dispute_logging_value;
}

bool escrow::logging::log_to_cerr () const
{
	return log_to_cerr_value;
}
