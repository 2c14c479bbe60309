#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/secure/common.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace escrow
{
class node;

/**
 * Follows the ledger's event log and applies each confirmed event to the record mirroring its trade.
 * Progress is tracked per ledger connection, events are applied at most once.
 */
class event_reconciler final
{
public:
	explicit event_reconciler (escrow::node &);
	~event_reconciler ();
	void start ();
	void stop ();
	/** Applies the next batch of confirmed events, the cursor only advances once every event in it is applied */
	std::error_code process_once ();
	/** Applies one event, state_mismatch is returned if the record changed under every attempt */
	std::error_code apply (escrow::ledger_log const &);
	/** Last height whose events were applied */
	uint64_t cursor ();
	static unsigned constexpr apply_retry_max = 4;

private:
	void run ();
	/** Returns true if the ledger event does not belong to any record */
	bool locate (escrow::ledger_log const &, escrow::record &);
	/** True if a trade created with the record's id in its metadata is between the record's parties */
	bool links_record (escrow::escrow_created_event const &, escrow::record const &) const;
	escrow::node & node;
	std::mutex mutex;
	std::condition_variable condition;
	bool stopped;
	std::thread thread;
};
}
