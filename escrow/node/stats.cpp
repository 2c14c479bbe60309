#include <escrow/node/stats.hpp>

#include <boost/format.hpp>

#include <ctime>

namespace
{
std::string format_time (std::chrono::system_clock::time_point const & time_a, bool with_date_a)
{
	auto time_l (std::chrono::system_clock::to_time_t (time_a));
	tm tm_l;
	localtime_r (&time_l, &tm_l);
	auto clock_l (boost::str (boost::format ("%02d:%02d:%02d") % tm_l.tm_hour % tm_l.tm_min % tm_l.tm_sec));
	return with_date_a ? boost::str (boost::format ("%04d.%02d.%02d %s") % (1900 + tm_l.tm_year) % (tm_l.tm_mon + 1) % tm_l.tm_mday % clock_l) : clock_l;
}
}

void escrow::stat::add (stat::type type_a, stat::detail detail_a, uint64_t value_a)
{
	if (value_a > 0)
	{
		auto now (std::chrono::system_clock::now ());
		std::lock_guard<std::mutex> lock (stat_mutex);
		auto bump ([this, value_a, now](uint32_t key_a) {
			auto & entry (entries[key_a]);
			entry.value += value_a;
			entry.updated = now;
		});
		if (detail_a != stat::detail::all)
		{
			bump (key_of (type_a, stat::detail::all));
		}
		bump (key_of (type_a, detail_a));
	}
}

uint64_t escrow::stat::count (stat::type type_a, stat::detail detail_a)
{
	std::lock_guard<std::mutex> lock (stat_mutex);
	auto existing (entries.find (key_of (type_a, detail_a)));
	return existing != entries.end () ? existing->second.value : 0;
}

boost::property_tree::ptree escrow::stat::serialize ()
{
	boost::property_tree::ptree result;
	boost::property_tree::ptree entries_l;
	std::lock_guard<std::mutex> lock (stat_mutex);
	result.put ("type", "counters");
	result.put ("created", format_time (std::chrono::system_clock::now (), true));
	for (auto const & item : entries)
	{
		boost::property_tree::ptree entry_l;
		entry_l.put ("time", format_time (item.second.updated, false));
		entry_l.put ("type", type_to_string (item.first));
		entry_l.put ("detail", detail_to_string (item.first));
		entry_l.put ("value", item.second.value);
		entries_l.push_back (std::make_pair ("", entry_l));
	}
	result.add_child ("entries", entries_l);
	return result;
}

std::string escrow::stat::type_to_string (uint32_t key)
{
	auto type = static_cast<stat::type> (key >> 16 & 0x000000ff);
	std::string res;
	switch (type)
	{
		case escrow::stat::type::escrow:
			res = "escrow";
			break;
		case escrow::stat::type::funding:
			res = "funding";
			break;
		case escrow::stat::type::verification:
			res = "verification";
			break;
		case escrow::stat::type::reconciler:
			res = "reconciler";
			break;
		case escrow::stat::type::dispute:
			res = "dispute";
			break;
		case escrow::stat::type::ledger:
			res = "ledger";
			break;
		case escrow::stat::type::error:
			res = "error";
			break;
	}
	return res;
}

std::string escrow::stat::detail_to_string (uint32_t key)
{
	auto detail = static_cast<stat::detail> (key >> 8 & 0x000000ff);
	std::string res;
	switch (detail)
	{
		case escrow::stat::detail::all:
			res = "all";
			break;
		case escrow::stat::detail::created:
			res = "created";
			break;
		case escrow::stat::detail::transition:
			res = "transition";
			break;
		case escrow::stat::detail::state_mismatch:
			res = "state_mismatch";
			break;
		case escrow::stat::detail::self_custodial:
			res = "self_custodial";
			break;
		case escrow::stat::detail::custodial:
			res = "custodial";
			break;
		case escrow::stat::detail::confirmation_timeout:
			res = "confirmation_timeout";
			break;
		case escrow::stat::detail::verification_exhausted:
			res = "verification_exhausted";
			break;
		case escrow::stat::detail::verified:
			res = "verified";
			break;
		case escrow::stat::detail::rejected:
			res = "rejected";
			break;
		case escrow::stat::detail::cycle:
			res = "cycle";
			break;
		case escrow::stat::detail::event_applied:
			res = "event_applied";
			break;
		case escrow::stat::detail::event_duplicate:
			res = "event_duplicate";
			break;
		case escrow::stat::detail::unknown_trade:
			res = "unknown_trade";
			break;
		case escrow::stat::detail::consistency_failure:
			res = "consistency_failure";
			break;
		case escrow::stat::detail::resolution_submitted:
			res = "resolution_submitted";
			break;
		case escrow::stat::detail::submitted:
			res = "submitted";
			break;
		case escrow::stat::detail::submit_failed:
			res = "submit_failed";
			break;
	}
	return res;
}
