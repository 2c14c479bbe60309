#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/secure/common.hpp>
#include <escrow/secure/ledger.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace escrow
{
/**
 * Connection to a ledger hosting the escrow contract.
 * Failures are reported in the error_ledger category, nothing is thrown.
 */
class ledger_client
{
public:
	virtual ~ledger_client () = default;
	/** Height of the most recent block */
	virtual std::error_code head (uint64_t &) = 0;
	virtual std::error_code receipt (escrow::block_hash const &, escrow::transaction_receipt &) = 0;
	/** Logs emitted in the inclusive height range, ordered by height and log index */
	virtual std::error_code logs (uint64_t, uint64_t, std::vector<escrow::ledger_log> &) = 0;
	/** Submits a signed call, on acceptance the transaction hash is returned through the second argument */
	virtual std::error_code submit (escrow::ledger_call const &, escrow::block_hash &) = 0;
	virtual std::error_code trade_get (uint64_t, escrow::trade &) = 0;
	/** The nonce the next call from this account must carry */
	virtual std::error_code nonce (escrow::account const &, uint64_t &) = 0;
	/** Identifies the connection, reconciliation progress is tracked per name */
	virtual std::string name () const = 0;
};

/**
 * In-process ledger hosting the escrow contract.
 * Each accepted call is included in its own block, calls which revert are included with a failed receipt.
 * The clock only moves when advanced.
 */
class local_chain final : public ledger_client
{
public:
	local_chain (escrow::account const &, escrow::account const &, std::string const & = "local");
	~local_chain ();
	std::error_code head (uint64_t &) override;
	std::error_code receipt (escrow::block_hash const &, escrow::transaction_receipt &) override;
	std::error_code logs (uint64_t, uint64_t, std::vector<escrow::ledger_log> &) override;
	std::error_code submit (escrow::ledger_call const &, escrow::block_hash &) override;
	std::error_code trade_get (uint64_t, escrow::trade &) override;
	std::error_code nonce (escrow::account const &, uint64_t &) override;
	std::string name () const override;
	/** Produces an empty block every interval on a background thread, a zero interval produces none */
	void start (std::chrono::milliseconds const &);
	void stop ();
	/** Appends empty blocks */
	void mine (unsigned = 1);
	/** Moves the contract clock forward */
	void advance_time (uint64_t);
	uint64_t now ();
	/** Simulates loss of connectivity, every operation fails with unavailable while offline */
	void online (bool);
	void credit (escrow::account const &, escrow::uint128_t const &);
	escrow::uint128_t balance (escrow::account const &);
	escrow::uint128_t custody ();
	uint64_t trade_count ();
	void reject_transfers (escrow::account const &, bool);
	uint64_t fee_bps ();
	uint64_t timeout_duration ();
	/** Waits until the head reaches the height or the deadline passes, returns true on timeout */
	bool wait_height (uint64_t, std::chrono::milliseconds const &);

private:
	void produce_blocks (std::chrono::milliseconds);
	std::mutex mutex;
	std::condition_variable condition;
	escrow::ledger ledger;
	std::string connection_name;
	uint64_t height;
	uint64_t time;
	bool available;
	bool stopped;
	std::unordered_map<escrow::account, uint64_t> nonces;
	std::unordered_map<escrow::block_hash, escrow::transaction_receipt> receipts;
	std::vector<escrow::ledger_log> entries;
	std::thread thread;
};
}
