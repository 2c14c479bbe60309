#pragma once

#include <boost/property_tree/ptree.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace escrow
{
/** Value of one counter and when it last changed */
class stat_entry final
{
public:
	uint64_t value{ 0 };
	std::chrono::system_clock::time_point updated{ std::chrono::system_clock::now () };
};

/**
 * Collects counters of the escrow engine, keyed by type and detail
 */
class stat final
{
public:
	/** Primary statistics type */
	enum class type : uint8_t
	{
		escrow,
		funding,
		verification,
		reconciler,
		dispute,
		ledger,
		error
	};

	/** Optional detail type */
	enum class detail : uint8_t
	{
		all = 0,

		// escrow
		created,
		transition,
		state_mismatch,

		// funding
		self_custodial,
		custodial,
		confirmation_timeout,
		verification_exhausted,

		// verification
		verified,
		rejected,

		// reconciler
		cycle,
		event_applied,
		event_duplicate,
		unknown_trade,
		consistency_failure,

		// dispute
		resolution_submitted,

		// ledger
		submitted,
		submit_failed
	};

	/** Increments the given counter */
	void inc (stat::type type, stat::detail detail = stat::detail::all)
	{
		add (type, detail, 1);
	}

	/** Adds \p value to the given counter, the per type total under detail::all is kept as well */
	void add (stat::type, stat::detail, uint64_t value);

	/** Current value of a counter, zero if it never changed */
	uint64_t count (stat::type, stat::detail = stat::detail::all);

	/**
	 * Snapshot of every counter as {"type": "counters", "created", "entries": [{"time", "type", "detail", "value"}]}
	 */
	boost::property_tree::ptree serialize ();

	/** Returns string representation of type */
	static std::string type_to_string (uint32_t key);

	/** Returns string representation of detail */
	static std::string detail_to_string (uint32_t key);

private:
	/** Constructs a key given type and detail. */
	static uint32_t key_of (stat::type type, stat::detail detail)
	{
		return static_cast<uint8_t> (type) << 16 | static_cast<uint8_t> (detail) << 8;
	}

	/** Stat entries are sorted by key to simplify processing of log output */
	std::map<uint32_t, escrow::stat_entry> entries;

	std::mutex stat_mutex;
};
}
