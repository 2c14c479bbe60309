#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/secure/common.hpp>

#include <boost/optional.hpp>

#include <string>

namespace escrow
{
class node;

/** An administrator's decision on a disputed record */
class dispute_decision final
{
public:
	uint64_t escrow_id{ 0 };
	escrow::resolution_outcome outcome{ escrow::resolution_outcome::refund_to_buyer };
	// Both required for a partial split
	boost::optional<escrow::account> recipient;
	boost::optional<escrow::amount> amount;
	std::string note;
};

/** Payout of a decision, the remainder goes to the other party */
class dispute_split final
{
public:
	escrow::account recipient;
	escrow::uint128_t recipient_amount{ 0 };
	escrow::account other;
	escrow::uint128_t remainder{ 0 };
};

class dispute_resolver final
{
public:
	explicit dispute_resolver (escrow::node &);
	/** Submits the decision to the ledger, completion is left to the reconciler */
	std::error_code resolve (escrow::dispute_decision const &, escrow::block_hash &);
	static std::error_code compute_split (escrow::record const &, escrow::dispute_decision const &, escrow::dispute_split &);

private:
	std::error_code resolvable (escrow::record const &);
	escrow::node & node;
};
}
