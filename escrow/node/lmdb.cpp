#include <escrow/lib/utility.hpp>
#include <escrow/node/lmdb.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/format.hpp>

#include <cstring>
#include <iostream>

namespace
{
// Keys of the meta table
escrow::uint256_union const version_key (1);
escrow::uint256_union const event_sequence_key (2);
escrow::uint256_union const record_id_key (3);
}

escrow::mdb_env::mdb_env (bool & error_a, boost::filesystem::path const & path_a, int max_dbs, size_t map_size_a) :
environment (nullptr)
{
	error_a = !path_a.has_parent_path ();
	if (!error_a)
	{
		boost::system::error_code ec;
		boost::filesystem::create_directories (path_a.parent_path (), ec);
		error_a = static_cast<bool> (ec);
		if (!error_a)
		{
			escrow::set_secure_perm_directory (path_a.parent_path (), ec);
			release_assert (mdb_env_create (&environment) == 0);
			release_assert (mdb_env_set_maxdbs (environment, max_dbs) == 0);
			release_assert (mdb_env_set_mapsize (environment, map_size_a) == 0);
			// Read transactions are opened from the reconciler, the funding callers and the RPC surface so slots must not be bound to threads
			auto status (mdb_env_open (environment, path_a.string ().c_str (), MDB_NOSUBDIR | MDB_NOTLS | MDB_NORDAHEAD, 00600));
			if (status != 0)
			{
				std::cerr << boost::str (boost::format ("Could not open escrow record store %1%: %2%") % path_a.string () % mdb_strerror (status)) << std::endl;
				mdb_env_close (environment);
				environment = nullptr;
				error_a = true;
			}
		}
	}
}

escrow::mdb_env::~mdb_env ()
{
	if (environment != nullptr)
	{
		mdb_env_close (environment);
	}
}

escrow::mdb_env::operator MDB_env * () const
{
	return environment;
}

escrow::read_transaction escrow::mdb_env::tx_begin_read () const
{
	return escrow::read_transaction{ std::make_unique<escrow::read_mdb_txn> (*this) };
}

escrow::write_transaction escrow::mdb_env::tx_begin_write () const
{
	return escrow::write_transaction{ std::make_unique<escrow::write_mdb_txn> (*this) };
}

MDB_txn * escrow::mdb_env::tx (escrow::transaction const & transaction_a) const
{
	return static_cast<MDB_txn *> (transaction_a.get_handle ());
}

escrow::read_mdb_txn::read_mdb_txn (escrow::mdb_env const & environment_a)
{
	auto status (mdb_txn_begin (environment_a, nullptr, MDB_RDONLY, &handle));
	release_assert (status == 0);
}

escrow::read_mdb_txn::~read_mdb_txn ()
{
	// Committed rather than aborted so database handles opened inside stay valid
	auto status (mdb_txn_commit (handle));
	release_assert (status == MDB_SUCCESS);
}

void * escrow::read_mdb_txn::get_handle () const
{
	return handle;
}

escrow::write_mdb_txn::write_mdb_txn (escrow::mdb_env const & environment_a)
{
	auto status (mdb_txn_begin (environment_a, nullptr, 0, &handle));
	release_assert (status == MDB_SUCCESS);
}

escrow::write_mdb_txn::~write_mdb_txn ()
{
	auto status (mdb_txn_commit (handle));
	release_assert (status == MDB_SUCCESS);
}

void * escrow::write_mdb_txn::get_handle () const
{
	return handle;
}

escrow::mdb_val::mdb_val () :
value ({ 0, nullptr })
{
}

escrow::mdb_val::mdb_val (MDB_val const & value_a) :
value (value_a)
{
}

escrow::mdb_val::mdb_val (size_t size_a, void * data_a) :
value ({ size_a, data_a })
{
}

escrow::mdb_val::mdb_val (escrow::uint256_union const & val_a) :
mdb_val (sizeof (val_a), const_cast<escrow::uint256_union *> (&val_a))
{
}

escrow::mdb_val::mdb_val (escrow::event_key const & val_a) :
mdb_val (sizeof (val_a.bytes), const_cast<uint8_t *> (val_a.bytes.data ()))
{
	static_assert (std::is_standard_layout<escrow::event_key>::value, "Standard layout is required");
}

escrow::mdb_val::mdb_val (escrow::ledger_event_key const & val_a)
{
	serialized ([&val_a](escrow::stream & stream_a) {
		escrow::write (stream_a, val_a.transaction.bytes);
		escrow::write (stream_a, val_a.index);
	});
}

escrow::mdb_val::mdb_val (escrow::record const & val_a)
{
	serialized ([&val_a](escrow::stream & stream_a) { val_a.serialize (stream_a); });
}

escrow::mdb_val::mdb_val (escrow::record_event const & val_a)
{
	serialized ([&val_a](escrow::stream & stream_a) { val_a.serialize (stream_a); });
}

escrow::mdb_val::mdb_val (std::string const & val_a) :
mdb_val (val_a.size (), const_cast<char *> (val_a.data ()))
{
}

escrow::mdb_val::mdb_val (uint64_t val_a)
{
	// Big endian so integer keys sort numerically
	serialized ([val_a](escrow::stream & stream_a) { escrow::write (stream_a, boost::endian::native_to_big (val_a)); });
}

void escrow::mdb_val::serialized (std::function<void(escrow::stream &)> const & write_a)
{
	buffer = std::make_shared<std::vector<uint8_t>> ();
	{
		escrow::vectorstream stream (*buffer);
		write_a (stream);
	}
	value = { buffer->size (), buffer->data () };
}

void * escrow::mdb_val::data () const
{
	return value.mv_data;
}

size_t escrow::mdb_val::size () const
{
	return value.mv_size;
}

escrow::mdb_val::operator escrow::uint256_union () const
{
	escrow::uint256_union result;
	assert (size () == sizeof (result));
	std::copy (reinterpret_cast<uint8_t const *> (data ()), reinterpret_cast<uint8_t const *> (data ()) + sizeof (result), result.bytes.data ());
	return result;
}

escrow::mdb_val::operator escrow::event_key () const
{
	escrow::event_key result;
	assert (size () == sizeof (result.bytes));
	std::memcpy (result.bytes.data (), data (), sizeof (result.bytes));
	return result;
}

escrow::mdb_val::operator escrow::record () const
{
	escrow::record result;
	escrow::bufferstream stream (reinterpret_cast<uint8_t const *> (value.mv_data), value.mv_size);
	auto error (result.deserialize (stream));
	release_assert (!error);
	return result;
}

escrow::mdb_val::operator escrow::record_event () const
{
	escrow::record_event result;
	escrow::bufferstream stream (reinterpret_cast<uint8_t const *> (value.mv_data), value.mv_size);
	auto error (result.deserialize (stream));
	release_assert (!error);
	return result;
}

escrow::mdb_val::operator uint64_t () const
{
	uint64_t result;
	escrow::bufferstream stream (reinterpret_cast<uint8_t const *> (value.mv_data), value.mv_size);
	auto error (escrow::try_read (stream, result));
	(void)error;
	assert (!error);
	boost::endian::big_to_native_inplace (result);
	return result;
}

escrow::mdb_val::operator MDB_val * () const
{
	// Allow passing a temporary to a non-c++ function which doesn't have constness
	return const_cast<MDB_val *> (&value);
}

escrow::mdb_val::operator MDB_val const & () const
{
	return value;
}

int constexpr escrow::mdb_store::version;

escrow::mdb_store::mdb_store (bool & error_a, escrow::logger_mt & logger_a, boost::filesystem::path const & path_a, int lmdb_max_dbs) :
logger (logger_a),
env (error_a, path_a, lmdb_max_dbs)
{
	if (!error_a)
	{
		auto is_fully_upgraded (false);
		{
			auto transaction (tx_begin_read ());
			auto err = mdb_dbi_open (env.tx (transaction), "meta", 0, &meta);
			if (err == MDB_SUCCESS)
			{
				is_fully_upgraded = (version_get (transaction) == version);
				mdb_dbi_close (env, meta);
			}
		}

		// Only open a write lock when upgrades are needed so offline queries don't block a running daemon
		if (!is_fully_upgraded)
		{
			auto transaction (tx_begin_write ());
			open_databases (error_a, transaction, MDB_CREATE);
			if (!error_a)
			{
				error_a |= do_upgrades (transaction);
			}
		}
		else
		{
			auto transaction (tx_begin_read ());
			open_databases (error_a, transaction, 0);
		}
	}
}

escrow::write_transaction escrow::mdb_store::tx_begin_write ()
{
	return env.tx_begin_write ();
}

escrow::read_transaction escrow::mdb_store::tx_begin_read ()
{
	return env.tx_begin_read ();
}

void escrow::mdb_store::open_databases (bool & error_a, escrow::transaction const & transaction_a, unsigned flags)
{
	error_a |= mdb_dbi_open (env.tx (transaction_a), "records", flags, &records) != 0;
	error_a |= mdb_dbi_open (env.tx (transaction_a), "agreements", flags, &agreements) != 0;
	error_a |= mdb_dbi_open (env.tx (transaction_a), "trades", flags, &trades) != 0;
	error_a |= mdb_dbi_open (env.tx (transaction_a), "events", flags, &event_rows) != 0;
	error_a |= mdb_dbi_open (env.tx (transaction_a), "ledger_events", flags, &ledger_events) != 0;
	error_a |= mdb_dbi_open (env.tx (transaction_a), "cursors", flags, &cursors) != 0;
	error_a |= mdb_dbi_open (env.tx (transaction_a), "meta", flags, &meta) != 0;
}

bool escrow::mdb_store::do_upgrades (escrow::write_transaction const & transaction_a)
{
	auto error (false);
	auto version_l (version_get (transaction_a));
	switch (version_l)
	{
		case 1:
			version_put (transaction_a, version);
			break;
		default:
			logger.always_log (boost::str (boost::format ("The version of the escrow store (%1%) is too high for this node") % version_l));
			error = true;
			break;
	}
	return error;
}

void escrow::mdb_store::version_put (escrow::transaction const & transaction_a, int version_a)
{
	escrow::uint256_union version_value (version_a);
	auto status (mdb_put (env.tx (transaction_a), meta, escrow::mdb_val (version_key), escrow::mdb_val (version_value), 0));
	release_assert (status == 0);
}

int escrow::mdb_store::version_get (escrow::transaction const & transaction_a) const
{
	escrow::mdb_val data;
	auto error (mdb_get (env.tx (transaction_a), meta, escrow::mdb_val (version_key), data));
	int result (1);
	if (error != MDB_NOTFOUND)
	{
		escrow::uint256_union version_value (data);
		assert (version_value.qwords[2] == 0 && version_value.qwords[1] == 0 && version_value.qwords[0] == 0);
		result = version_value.number ().convert_to<int> ();
	}
	return result;
}

uint64_t escrow::mdb_store::meta_counter (escrow::transaction const & transaction_a, escrow::uint256_union const & key)
{
	escrow::mdb_val data;
	auto status1 (mdb_get (env.tx (transaction_a), meta, escrow::mdb_val (key), data));
	release_assert (status1 == 0 || status1 == MDB_NOTFOUND);
	uint64_t result (status1 == 0 ? static_cast<uint64_t> (data) + 1 : 1);
	auto status2 (mdb_put (env.tx (transaction_a), meta, escrow::mdb_val (key), escrow::mdb_val (result), 0));
	release_assert (status2 == 0);
	return result;
}

void escrow::mdb_store::for_each (escrow::transaction const & transaction_a, MDB_dbi db_a, escrow::mdb_val const & start_a, std::function<bool(escrow::mdb_val const &, escrow::mdb_val const &)> const & action_a)
{
	MDB_cursor * cursor;
	auto status1 (mdb_cursor_open (env.tx (transaction_a), db_a, &cursor));
	release_assert (status1 == 0);
	escrow::mdb_val key (start_a.value);
	escrow::mdb_val data;
	auto status2 (mdb_cursor_get (cursor, key, data, start_a.size () == 0 ? MDB_FIRST : MDB_SET_RANGE));
	release_assert (status2 == 0 || status2 == MDB_NOTFOUND);
	auto more (status2 == 0);
	while (more)
	{
		more = action_a (key, data);
		if (more)
		{
			auto status3 (mdb_cursor_get (cursor, key, data, MDB_NEXT));
			release_assert (status3 == 0 || status3 == MDB_NOTFOUND);
			more = status3 == 0;
		}
	}
	mdb_cursor_close (cursor);
}

void escrow::mdb_store::record_put (escrow::transaction const & transaction_a, escrow::record const & record_a)
{
	auto status (mdb_put (env.tx (transaction_a), records, escrow::mdb_val (record_a.id), escrow::mdb_val (record_a), 0));
	release_assert (status == 0);
}

std::error_code escrow::mdb_store::record_create (escrow::transaction const & transaction_a, escrow::record & record_a)
{
	std::error_code result;
	escrow::mdb_val existing;
	auto status1 (mdb_get (env.tx (transaction_a), agreements, escrow::mdb_val (record_a.agreement_id), existing));
	release_assert (status1 == 0 || status1 == MDB_NOTFOUND);
	if (status1 == MDB_NOTFOUND)
	{
		record_a.id = meta_counter (transaction_a, record_id_key);
		record_put (transaction_a, record_a);
		auto status2 (mdb_put (env.tx (transaction_a), agreements, escrow::mdb_val (record_a.agreement_id), escrow::mdb_val (record_a.id), 0));
		release_assert (status2 == 0);
		if (record_a.trade_id)
		{
			auto status3 (mdb_put (env.tx (transaction_a), trades, escrow::mdb_val (*record_a.trade_id), escrow::mdb_val (record_a.id), 0));
			release_assert (status3 == 0);
		}
	}
	else
	{
		result = escrow::error_escrow::agreement_exists;
	}
	return result;
}

bool escrow::mdb_store::record_get (escrow::transaction const & transaction_a, uint64_t id_a, escrow::record & record_a)
{
	escrow::mdb_val value;
	auto status (mdb_get (env.tx (transaction_a), records, escrow::mdb_val (id_a), value));
	release_assert (status == 0 || status == MDB_NOTFOUND);
	auto result (status == MDB_NOTFOUND);
	if (!result)
	{
		record_a = static_cast<escrow::record> (value);
	}
	return result;
}

bool escrow::mdb_store::index_get (escrow::transaction const & transaction_a, MDB_dbi index_a, uint64_t key_a, escrow::record & record_a)
{
	escrow::mdb_val value;
	auto status (mdb_get (env.tx (transaction_a), index_a, escrow::mdb_val (key_a), value));
	release_assert (status == 0 || status == MDB_NOTFOUND);
	auto result (status == MDB_NOTFOUND);
	if (!result)
	{
		result = record_get (transaction_a, static_cast<uint64_t> (value), record_a);
		assert (!result);
	}
	return result;
}

bool escrow::mdb_store::record_get_agreement (escrow::transaction const & transaction_a, uint64_t agreement_id_a, escrow::record & record_a)
{
	return index_get (transaction_a, agreements, agreement_id_a, record_a);
}

bool escrow::mdb_store::record_get_trade (escrow::transaction const & transaction_a, uint64_t trade_id_a, escrow::record & record_a)
{
	return index_get (transaction_a, trades, trade_id_a, record_a);
}

std::error_code escrow::mdb_store::state_update (escrow::transaction const & transaction_a, escrow::record_state expected_a, escrow::record const & record_a)
{
	std::error_code result;
	escrow::record existing;
	if (!record_get (transaction_a, record_a.id, existing))
	{
		if (existing.state == expected_a)
		{
			if (escrow::is_forward (existing.state, record_a.state))
			{
				if (!existing.halted || existing.state == record_a.state)
				{
					if (existing.trade_id && existing.trade_id != record_a.trade_id)
					{
						// A linked trade id never changes
						result = escrow::error_escrow::trade_conflict;
					}
					else if (!existing.trade_id && record_a.trade_id)
					{
						escrow::mdb_val linked;
						auto status1 (mdb_get (env.tx (transaction_a), trades, escrow::mdb_val (*record_a.trade_id), linked));
						release_assert (status1 == 0 || status1 == MDB_NOTFOUND);
						if (status1 == 0)
						{
							result = escrow::error_escrow::trade_conflict;
						}
						else
						{
							auto status2 (mdb_put (env.tx (transaction_a), trades, escrow::mdb_val (*record_a.trade_id), escrow::mdb_val (record_a.id), 0));
							release_assert (status2 == 0);
						}
					}
					if (!result)
					{
						record_put (transaction_a, record_a);
					}
				}
				else
				{
					result = escrow::error_escrow::record_halted;
				}
			}
			else
			{
				result = escrow::error_escrow::invalid_transition;
			}
		}
		else
		{
			result = escrow::error_escrow::state_mismatch;
		}
	}
	else
	{
		result = escrow::error_escrow::record_not_found;
	}
	return result;
}

std::vector<escrow::record> escrow::mdb_store::awaiting_confirmation (escrow::transaction const & transaction_a, uint64_t cutoff_a)
{
	std::vector<escrow::record> result;
	for_each (transaction_a, records, escrow::mdb_val (), [&result, cutoff_a](escrow::mdb_val const &, escrow::mdb_val const & value_a) {
		auto record (static_cast<escrow::record> (value_a));
		if (record.state == escrow::record_state::funded && record.funded_at < cutoff_a)
		{
			result.push_back (record);
		}
		return true;
	});
	return result;
}

std::vector<escrow::record> escrow::mdb_store::records_in_state (escrow::transaction const & transaction_a, escrow::record_state state_a)
{
	std::vector<escrow::record> result;
	for_each (transaction_a, records, escrow::mdb_val (), [&result, state_a](escrow::mdb_val const &, escrow::mdb_val const & value_a) {
		auto record (static_cast<escrow::record> (value_a));
		if (record.state == state_a)
		{
			result.push_back (record);
		}
		return true;
	});
	return result;
}

std::vector<escrow::record> escrow::mdb_store::records_for_party (escrow::transaction const & transaction_a, uint64_t party_a)
{
	std::vector<escrow::record> result;
	for_each (transaction_a, records, escrow::mdb_val (), [&result, party_a](escrow::mdb_val const &, escrow::mdb_val const & value_a) {
		auto record (static_cast<escrow::record> (value_a));
		if (record.buyer_id == party_a || record.seller_id == party_a)
		{
			result.push_back (record);
		}
		return true;
	});
	return result;
}

size_t escrow::mdb_store::record_count (escrow::transaction const & transaction_a)
{
	MDB_stat records_stats;
	auto status (mdb_stat (env.tx (transaction_a), records, &records_stats));
	release_assert (status == 0);
	return records_stats.ms_entries;
}

uint64_t escrow::mdb_store::event_append (escrow::transaction const & transaction_a, escrow::record_event & event_a)
{
	event_a.sequence = meta_counter (transaction_a, event_sequence_key);
	auto status (mdb_put (env.tx (transaction_a), event_rows, escrow::mdb_val (escrow::event_key (event_a.escrow_id, event_a.sequence)), escrow::mdb_val (event_a), MDB_NOOVERWRITE));
	release_assert (status == 0);
	return event_a.sequence;
}

std::vector<escrow::record_event> escrow::mdb_store::events (escrow::transaction const & transaction_a, uint64_t escrow_id_a)
{
	std::vector<escrow::record_event> result;
	escrow::event_key start (escrow_id_a, 0);
	for_each (transaction_a, event_rows, escrow::mdb_val (start), [&result, escrow_id_a](escrow::mdb_val const & key_a, escrow::mdb_val const & value_a) {
		auto more (static_cast<escrow::event_key> (key_a).escrow_id () == escrow_id_a);
		if (more)
		{
			result.push_back (static_cast<escrow::record_event> (value_a));
		}
		return more;
	});
	return result;
}

size_t escrow::mdb_store::event_count (escrow::transaction const & transaction_a)
{
	MDB_stat event_stats;
	auto status (mdb_stat (env.tx (transaction_a), event_rows, &event_stats));
	release_assert (status == 0);
	return event_stats.ms_entries;
}

bool escrow::mdb_store::ledger_event_exists (escrow::transaction const & transaction_a, escrow::ledger_event_key const & key_a)
{
	escrow::mdb_val value;
	auto status (mdb_get (env.tx (transaction_a), ledger_events, escrow::mdb_val (key_a), value));
	release_assert (status == 0 || status == MDB_NOTFOUND);
	return status == 0;
}

void escrow::mdb_store::ledger_event_put (escrow::transaction const & transaction_a, escrow::ledger_event_key const & key_a, uint64_t escrow_id_a)
{
	auto status (mdb_put (env.tx (transaction_a), ledger_events, escrow::mdb_val (key_a), escrow::mdb_val (escrow_id_a), 0));
	release_assert (status == 0);
}

bool escrow::mdb_store::cursor_get (escrow::transaction const & transaction_a, std::string const & connection_a, uint64_t & height_a)
{
	escrow::mdb_val value;
	auto status (mdb_get (env.tx (transaction_a), cursors, escrow::mdb_val (connection_a), value));
	release_assert (status == 0 || status == MDB_NOTFOUND);
	auto result (status == MDB_NOTFOUND);
	if (!result)
	{
		height_a = static_cast<uint64_t> (value);
	}
	return result;
}

void escrow::mdb_store::cursor_put (escrow::transaction const & transaction_a, std::string const & connection_a, uint64_t height_a)
{
	auto status (mdb_put (env.tx (transaction_a), cursors, escrow::mdb_val (connection_a), escrow::mdb_val (height_a), 0));
	release_assert (status == 0);
}
