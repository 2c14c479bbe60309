#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/secure/common.hpp>

#include <boost/optional.hpp>

#include <condition_variable>
#include <mutex>
#include <string>

namespace escrow
{
class node;
class funding_proof;
class transaction;

enum class funding_path : uint8_t
{
	// The buyer pays the contract and hands over the transaction
	self_custodial = 0,
	// The service account pays on the buyer's behalf
	custodial = 1
};
std::string to_string (escrow::funding_path);
bool decode_path (std::string const &, escrow::funding_path &);

class funding_intent final
{
public:
	uint64_t escrow_id{ 0 };
	escrow::funding_path path{ escrow::funding_path::self_custodial };
	// Required for self custodial funding
	boost::optional<escrow::block_hash> transaction;
};

/**
 * Moves records from awaiting_fund to funded, either by verifying a transaction the buyer submitted
 * or by funding through the custodial signer and waiting for its confirmations.
 */
class funding_coordinator final
{
public:
	explicit funding_coordinator (escrow::node &);
	/** The funding transaction is returned through the second argument once one is known, even if a later step fails */
	std::error_code process (escrow::funding_intent const &, escrow::block_hash &);
	std::error_code fund_self_custodial (uint64_t, escrow::block_hash const &);
	std::error_code fund_custodial (uint64_t, escrow::block_hash &);
	/** Verifies pending records again until they run out of attempts, returns the number funded */
	size_t retry_pending ();
	/** Cancels confirmation waits */
	void stop ();

private:
	std::error_code submit_pending (uint64_t, escrow::block_hash const &, escrow::account const &, bool);
	std::error_code verify_pending (uint64_t, bool);
	std::error_code mark_funded (uint64_t, escrow::block_hash const &, escrow::funding_proof const &, bool);
	void record_failure (uint64_t, std::error_code const &, bool);
	std::error_code wait_confirmations (escrow::block_hash const &);
	std::error_code writable (escrow::record const &, bool) const;
	escrow::node & node;
	std::mutex mutex;
	std::condition_variable condition;
	bool stopped;
};
}
