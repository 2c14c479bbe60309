#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/lib/jsonconfig.hpp>
#include <escrow/lib/logger_mt.hpp>

#include <boost/filesystem.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

#define FATAL_LOG_PREFIX "FATAL ERROR: "

namespace escrow
{
class logging final
{
public:
	escrow::error serialize_json (escrow::jsonconfig &) const;
	escrow::error deserialize_json (bool &, escrow::jsonconfig &);
	bool upgrade_json (unsigned, escrow::jsonconfig &);
	bool ledger_logging () const;
	bool verification_logging () const;
	bool funding_logging () const;
	bool reconciler_logging () const;
	bool dispute_logging () const;
	bool log_to_cerr () const;
	void init (boost::filesystem::path const &);

	bool ledger_logging_value{ true };
	bool verification_logging_value{ true };
	bool funding_logging_value{ true };
	bool reconciler_logging_value{ false };
	bool dispute_logging_value{ true };
	bool log_to_cerr_value{ false };
	bool flush{ true };
	uintmax_t max_size{ 128 * 1024 * 1024 };
	uintmax_t rotation_size{ 4 * 1024 * 1024 };
	std::chrono::milliseconds min_time_between_log_output{ 5 };
	static void release_file_sink ();
	static int json_version ()
	{
		return 1;
	}

private:
	static boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> file_sink;
	static std::atomic_flag logging_already_added;
};
}
