#pragma once

#include <escrow/secure/common.hpp>

#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace escrow
{
/**
 * The escrow contract. Holds account balances and trade custody and executes
 * ledger calls atomically: a call either applies completely or reverts with no effect.
 * Callers serialize access.
 */
class ledger final
{
public:
	ledger (escrow::account const &, escrow::account const &);
	escrow::process_return process (escrow::ledger_call const &, uint64_t);
	// Returns true if the trade doesn't exist
	bool trade_get (uint64_t, escrow::trade &) const;
	// getTotalTrades
	uint64_t trade_count () const;
	// getBalance, value held for unreleased trades
	escrow::uint128_t custody () const;
	escrow::uint128_t balance (escrow::account const &) const;
	void credit (escrow::account const &, escrow::uint128_t const &);
	// Accounts flagged here refuse incoming transfers
	void reject_transfers (escrow::account const &, bool);
	escrow::account admin;
	escrow::account fee_recipient;
	uint64_t fee_bps;
	uint64_t timeout_duration;
	static uint64_t constexpr default_fee_bps = 100;
	static uint64_t constexpr max_fee_bps = 1000;
	static uint64_t constexpr basis_points = 10000;
	static uint64_t constexpr default_timeout = 30 * 24 * 60 * 60;
	static uint64_t constexpr min_timeout = 24 * 60 * 60;
	static uint64_t constexpr max_timeout = 365 * 24 * 60 * 60;

private:
	friend class ledger_processor;
	// Returns true if any recipient rejects, in which case nothing is transferred
	bool transfer (std::vector<std::pair<escrow::account, escrow::uint128_t>> const &);
	void debit (escrow::account const &, escrow::uint128_t const &);
	std::vector<escrow::trade> trades;
	std::unordered_map<escrow::account, escrow::uint128_t> balances;
	std::unordered_set<escrow::account> rejecting;
	escrow::uint128_t held;
};
}
