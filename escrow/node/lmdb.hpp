#pragma once

#include <boost/filesystem.hpp>

#include <escrow/lib/logger_mt.hpp>
#include <escrow/lib/numbers.hpp>
#include <escrow/secure/common.hpp>
#include <escrow/secure/recordstore.hpp>

#include <lmdb.h>

#include <functional>
#include <memory>

namespace escrow
{
class mdb_env;

class read_mdb_txn final : public transaction_impl
{
public:
	read_mdb_txn (escrow::mdb_env const &);
	~read_mdb_txn ();
	void * get_handle () const override;
	MDB_txn * handle;
};

class write_mdb_txn final : public transaction_impl
{
public:
	write_mdb_txn (escrow::mdb_env const &);
	~write_mdb_txn ();
	void * get_handle () const override;
	MDB_txn * handle;
};

/**
 * RAII wrapper for MDB_env
 */
class mdb_env
{
public:
	mdb_env (bool &, boost::filesystem::path const &, int max_dbs = 128, size_t map_size = 16ULL * 1024 * 1024 * 1024);
	~mdb_env ();
	operator MDB_env * () const;
	escrow::read_transaction tx_begin_read () const;
	escrow::write_transaction tx_begin_write () const;
	MDB_txn * tx (escrow::transaction const & transaction_a) const;
	MDB_env * environment;
};

/**
 * Encapsulates MDB_val and provides conversion of the stored types.
 */
class mdb_val
{
public:
	mdb_val ();
	mdb_val (MDB_val const &);
	mdb_val (size_t, void *);
	mdb_val (escrow::uint256_union const &);
	mdb_val (escrow::event_key const &);
	mdb_val (escrow::ledger_event_key const &);
	mdb_val (escrow::record const &);
	mdb_val (escrow::record_event const &);
	mdb_val (std::string const &);
	mdb_val (uint64_t);
	void * data () const;
	size_t size () const;
	explicit operator escrow::uint256_union () const;
	explicit operator escrow::event_key () const;
	explicit operator escrow::record () const;
	explicit operator escrow::record_event () const;
	explicit operator uint64_t () const;
	operator MDB_val * () const;
	operator MDB_val const & () const;
	MDB_val value;
	std::shared_ptr<std::vector<uint8_t>> buffer;

private:
	/** Points value at an owned buffer filled by the writer */
	void serialized (std::function<void(escrow::stream &)> const &);
};

/**
 * mdb implementation of the record store
 */
class mdb_store : public record_store
{
public:
	mdb_store (bool &, escrow::logger_mt &, boost::filesystem::path const &, int lmdb_max_dbs = 128);
	escrow::write_transaction tx_begin_write () override;
	escrow::read_transaction tx_begin_read () override;

	std::error_code record_create (escrow::transaction const &, escrow::record &) override;
	bool record_get (escrow::transaction const &, uint64_t, escrow::record &) override;
	bool record_get_agreement (escrow::transaction const &, uint64_t, escrow::record &) override;
	bool record_get_trade (escrow::transaction const &, uint64_t, escrow::record &) override;
	std::error_code state_update (escrow::transaction const &, escrow::record_state, escrow::record const &) override;
	std::vector<escrow::record> awaiting_confirmation (escrow::transaction const &, uint64_t) override;
	std::vector<escrow::record> records_in_state (escrow::transaction const &, escrow::record_state) override;
	std::vector<escrow::record> records_for_party (escrow::transaction const &, uint64_t) override;
	size_t record_count (escrow::transaction const &) override;

	uint64_t event_append (escrow::transaction const &, escrow::record_event &) override;
	std::vector<escrow::record_event> events (escrow::transaction const &, uint64_t) override;
	size_t event_count (escrow::transaction const &) override;

	bool ledger_event_exists (escrow::transaction const &, escrow::ledger_event_key const &) override;
	void ledger_event_put (escrow::transaction const &, escrow::ledger_event_key const &, uint64_t) override;

	bool cursor_get (escrow::transaction const &, std::string const &, uint64_t &) override;
	void cursor_put (escrow::transaction const &, std::string const &, uint64_t) override;

	void version_put (escrow::transaction const &, int) override;
	int version_get (escrow::transaction const &) const override;

	escrow::logger_mt & logger;

	escrow::mdb_env env;

	/**
	 * Maps record id (uint64_t, big endian) to escrow::record
	 */
	MDB_dbi records{ 0 };

	/**
	 * Maps agreement id (uint64_t, big endian) to record id (uint64_t, big endian)
	 */
	MDB_dbi agreements{ 0 };

	/**
	 * Maps ledger trade id (uint64_t, big endian) to record id (uint64_t, big endian)
	 */
	MDB_dbi trades{ 0 };

	/**
	 * Maps (record id, sequence) to escrow::record_event
	 */
	MDB_dbi event_rows{ 0 };

	/**
	 * Maps (transaction, log index) to record id (uint64_t, big endian), processed ledger events
	 */
	MDB_dbi ledger_events{ 0 };

	/**
	 * Maps ledger connection name to the last reconciled height (uint64_t, big endian)
	 */
	MDB_dbi cursors{ 0 };

	/**
	 * Meta information about the store, such as its version and the event sequence counter
	 * escrow::uint256_union (arbitrary key) -> blob
	 */
	MDB_dbi meta{ 0 };

	static int constexpr version{ 1 };

private:
	void open_databases (bool &, escrow::transaction const &, unsigned);
	bool do_upgrades (escrow::write_transaction const &);
	void record_put (escrow::transaction const &, escrow::record const &);
	bool index_get (escrow::transaction const &, MDB_dbi, uint64_t, escrow::record &);
	uint64_t meta_counter (escrow::transaction const &, escrow::uint256_union const &);
	/** Visits entries from the first key at or after the start, stops when the action returns false */
	void for_each (escrow::transaction const &, MDB_dbi, escrow::mdb_val const &, std::function<bool(escrow::mdb_val const &, escrow::mdb_val const &)> const &);
};
}
