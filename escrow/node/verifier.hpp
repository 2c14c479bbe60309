#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/lib/logger_mt.hpp>
#include <escrow/secure/common.hpp>

#include <boost/optional.hpp>

namespace escrow
{
class ledger_client;
class logging;
class stat;

/** What a funding transaction must prove */
class funding_expectation final
{
public:
	// Only checked when the record is already linked to a trade
	boost::optional<uint64_t> trade_id;
	escrow::account buyer;
	escrow::account seller;
	escrow::amount amount;
};

class funding_proof final
{
public:
	uint64_t trade_id{ 0 };
	uint64_t height{ 0 };
	uint64_t confirmations{ 0 };
	uint64_t timeout_at{ 0 };
};

/**
 * Confirms a transaction funded the expected trade with the expected amount between the expected parties,
 * and that it is buried under enough blocks.
 */
class transaction_verifier final
{
public:
	transaction_verifier (escrow::ledger_client &, unsigned, escrow::logger_mt &, escrow::logging const &, escrow::stat &);
	/** Failures are returned in the error_verification category */
	std::error_code verify (escrow::block_hash const &, escrow::funding_expectation const &, escrow::funding_proof &);
	escrow::ledger_client & client;
	unsigned confirmations;

private:
	std::error_code check (escrow::block_hash const &, escrow::funding_expectation const &, escrow::funding_proof &);
	escrow::logger_mt & logger;
	escrow::logging const & logging;
	escrow::stat & stats;
};
}
