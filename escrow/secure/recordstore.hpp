#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/secure/common.hpp>

#include <memory>
#include <string>
#include <vector>

namespace escrow
{
/** Key of the events table, orders rows of one record by sequence */
class event_key final
{
public:
	event_key () = default;
	event_key (uint64_t, uint64_t);
	uint64_t escrow_id () const;
	uint64_t sequence () const;
	// Both fields are stored big endian
	std::array<uint8_t, 16> bytes;
};

/** Identifies one emitted ledger event, the transaction and the log index within it */
class ledger_event_key final
{
public:
	ledger_event_key () = default;
	ledger_event_key (escrow::block_hash const &, uint32_t);
	bool operator== (escrow::ledger_event_key const &) const;
	escrow::block_hash transaction;
	// Big endian
	std::array<uint8_t, 4> index;
};

/** Backend specific handle of an open store transaction */
class transaction_impl
{
public:
	virtual ~transaction_impl () = default;
	virtual void * get_handle () const = 0;
};

class transaction
{
public:
	virtual ~transaction () = default;
	virtual void * get_handle () const = 0;
};

/**
 * A snapshot read, the backend transaction ends when this is destroyed
 */
class read_transaction final : public transaction
{
public:
	explicit read_transaction (std::unique_ptr<escrow::transaction_impl>);
	void * get_handle () const override;

private:
	std::unique_ptr<escrow::transaction_impl> impl;
};

/**
 * An exclusive write, changes are committed when this is destroyed
 */
class write_transaction final : public transaction
{
public:
	explicit write_transaction (std::unique_ptr<escrow::transaction_impl>);
	void * get_handle () const override;

private:
	std::unique_ptr<escrow::transaction_impl> impl;
};

/**
 * Manages escrow records, their audit rows and reconciliation progress
 */
class record_store
{
public:
	virtual ~record_store () = default;
	/** Assigns the next id to the record and indexes its agreement */
	virtual std::error_code record_create (escrow::transaction const &, escrow::record &) = 0;
	// The getters return true if no record matches
	virtual bool record_get (escrow::transaction const &, uint64_t, escrow::record &) = 0;
	virtual bool record_get_agreement (escrow::transaction const &, uint64_t, escrow::record &) = 0;
	virtual bool record_get_trade (escrow::transaction const &, uint64_t, escrow::record &) = 0;
	/**
	 * Replaces the stored record if its state still equals the expected prior state.
	 * The new state must not be behind the stored one and a complete record never changes.
	 */
	virtual std::error_code state_update (escrow::transaction const &, escrow::record_state, escrow::record const &) = 0;
	/** Funded records whose funding time is older than the cutoff */
	virtual std::vector<escrow::record> awaiting_confirmation (escrow::transaction const &, uint64_t) = 0;
	virtual std::vector<escrow::record> records_in_state (escrow::transaction const &, escrow::record_state) = 0;
	/** Records naming the user as buyer or seller */
	virtual std::vector<escrow::record> records_for_party (escrow::transaction const &, uint64_t) = 0;
	virtual size_t record_count (escrow::transaction const &) = 0;

	/** Appends a row, assigning the next global sequence number which is also returned */
	virtual uint64_t event_append (escrow::transaction const &, escrow::record_event &) = 0;
	virtual std::vector<escrow::record_event> events (escrow::transaction const &, uint64_t) = 0;
	virtual size_t event_count (escrow::transaction const &) = 0;

	virtual bool ledger_event_exists (escrow::transaction const &, escrow::ledger_event_key const &) = 0;
	virtual void ledger_event_put (escrow::transaction const &, escrow::ledger_event_key const &, uint64_t) = 0;

	// Returns true if no cursor was stored for this ledger connection
	virtual bool cursor_get (escrow::transaction const &, std::string const &, uint64_t &) = 0;
	virtual void cursor_put (escrow::transaction const &, std::string const &, uint64_t) = 0;

	virtual void version_put (escrow::transaction const &, int) = 0;
	virtual int version_get (escrow::transaction const &) const = 0;

	virtual escrow::write_transaction tx_begin_write () = 0;
	virtual escrow::read_transaction tx_begin_read () = 0;
};
}
