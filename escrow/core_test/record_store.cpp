#include <escrow/core_test/testutil.hpp>
#include <escrow/lib/logger_mt.hpp>
#include <escrow/node/lmdb.hpp>
#include <escrow/secure/utility.hpp>

#include <gtest/gtest.h>

namespace
{
escrow::record sample_record (uint64_t agreement_id_a)
{
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::record result;
	result.agreement_id = agreement_id_a;
	result.buyer_id = 10;
	result.seller_id = 20;
	result.buyer_account = buyer.pub;
	result.seller_account = seller.pub;
	result.payer = buyer.pub;
	result.amount = escrow::amount (1000);
	result.state = escrow::record_state::awaiting_fund;
	result.created_at = escrow::seconds_since_epoch ();
	result.metadata = "{\"listing\":\"42\"}";
	return result;
}
}

TEST (record_store, construction)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_read ());
	ASSERT_EQ (0, store.record_count (transaction));
	ASSERT_EQ (0, store.event_count (transaction));
	ASSERT_EQ (escrow::mdb_store::version, store.version_get (transaction));
}

TEST (record_store, create_and_get)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	ASSERT_EQ (1, record1.id);
	auto record2 (sample_record (101));
	ASSERT_NO_ERROR (store.record_create (transaction, record2));
	ASSERT_EQ (2, record2.id);
	escrow::record record3;
	ASSERT_FALSE (store.record_get (transaction, 1, record3));
	ASSERT_EQ (record1, record3);
	ASSERT_EQ ("{\"listing\":\"42\"}", record3.metadata);
	ASSERT_FALSE (record3.trade_id);
	escrow::record record4;
	ASSERT_FALSE (store.record_get_agreement (transaction, 101, record4));
	ASSERT_EQ (2, record4.id);
	ASSERT_TRUE (store.record_get (transaction, 3, record4));
	ASSERT_TRUE (store.record_get_agreement (transaction, 102, record4));
	ASSERT_TRUE (store.record_get_trade (transaction, 0, record4));
	ASSERT_EQ (2, store.record_count (transaction));
}

TEST (record_store, one_record_per_agreement)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	auto record2 (sample_record (100));
	ASSERT_EQ (escrow::error_escrow::agreement_exists, store.record_create (transaction, record2));
	ASSERT_EQ (1, store.record_count (transaction));
}

TEST (record_store, optional_fields)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	record1.trade_id = 0;
	record1.funding_transaction = escrow::block_hash (77);
	record1.state = escrow::record_state::disputed;
	record1.dispute_reason = "damaged";
	escrow::dispute_resolution resolution;
	resolution.outcome = escrow::resolution_outcome::partial_split;
	resolution.recipient = record1.seller_account;
	resolution.amount = escrow::amount (600);
	resolution.note = "shared fault";
	resolution.transaction = escrow::block_hash (78);
	record1.resolution = resolution;
	record1.provisional = true;
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	escrow::record record2;
	ASSERT_FALSE (store.record_get_trade (transaction, 0, record2));
	ASSERT_EQ (record1, record2);
	ASSERT_TRUE (record2.trade_id);
	ASSERT_EQ (0, *record2.trade_id);
	ASSERT_TRUE (record2.resolution);
	ASSERT_EQ (escrow::resolution_outcome::partial_split, record2.resolution->outcome);
	ASSERT_EQ ("shared fault", record2.resolution->note);
	ASSERT_TRUE (record2.provisional);
}

TEST (record_store, state_update_forward)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	auto record2 (record1);
	record2.state = escrow::record_state::funded;
	record2.trade_id = 5;
	ASSERT_NO_ERROR (store.state_update (transaction, escrow::record_state::awaiting_fund, record2));
	escrow::record record3;
	ASSERT_FALSE (store.record_get_trade (transaction, 5, record3));
	ASSERT_EQ (record1.id, record3.id);
	ASSERT_EQ (escrow::record_state::funded, record3.state);
	auto backward (record3);
	backward.state = escrow::record_state::pending_verification;
	ASSERT_EQ (escrow::error_escrow::invalid_transition, store.state_update (transaction, escrow::record_state::funded, backward));
	auto complete (record3);
	complete.state = escrow::record_state::complete;
	ASSERT_NO_ERROR (store.state_update (transaction, escrow::record_state::funded, complete));
	auto after (complete);
	after.dispute_reason = "late";
	ASSERT_EQ (escrow::error_escrow::invalid_transition, store.state_update (transaction, escrow::record_state::complete, after));
	escrow::record missing (record1);
	missing.id = 9;
	ASSERT_EQ (escrow::error_escrow::record_not_found, store.state_update (transaction, escrow::record_state::awaiting_fund, missing));
}

TEST (record_store, trade_link_immutable)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	auto record2 (sample_record (101));
	ASSERT_NO_ERROR (store.record_create (transaction, record2));
	record1.trade_id = 3;
	ASSERT_NO_ERROR (store.state_update (transaction, escrow::record_state::awaiting_fund, record1));
	record2.trade_id = 3;
	ASSERT_EQ (escrow::error_escrow::trade_conflict, store.state_update (transaction, escrow::record_state::awaiting_fund, record2));
	record1.trade_id = 4;
	ASSERT_EQ (escrow::error_escrow::trade_conflict, store.state_update (transaction, escrow::record_state::awaiting_fund, record1));
}

TEST (record_store, halted_keeps_state)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	record1.halted = true;
	ASSERT_NO_ERROR (store.state_update (transaction, escrow::record_state::awaiting_fund, record1));
	auto record2 (record1);
	record2.state = escrow::record_state::funded;
	ASSERT_EQ (escrow::error_escrow::record_halted, store.state_update (transaction, escrow::record_state::awaiting_fund, record2));
	record1.dispute_reason = "note";
	ASSERT_NO_ERROR (store.state_update (transaction, escrow::record_state::awaiting_fund, record1));
}

// Two writers read the same record and race to move it, only the first succeeds
TEST (record_store, concurrent_update)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	escrow::record record1;
	{
		auto transaction (store.tx_begin_write ());
		record1 = sample_record (100);
		record1.state = escrow::record_state::funded;
		record1.trade_id = 1;
		ASSERT_NO_ERROR (store.record_create (transaction, record1));
	}
	escrow::record snapshot;
	{
		auto transaction (store.tx_begin_read ());
		ASSERT_FALSE (store.record_get (transaction, record1.id, snapshot));
	}
	auto release (snapshot);
	release.state = escrow::record_state::complete;
	auto dispute (snapshot);
	dispute.state = escrow::record_state::disputed;
	{
		auto transaction (store.tx_begin_write ());
		ASSERT_NO_ERROR (store.state_update (transaction, snapshot.state, release));
	}
	{
		auto transaction (store.tx_begin_write ());
		ASSERT_EQ (escrow::error_escrow::state_mismatch, store.state_update (transaction, snapshot.state, dispute));
	}
	auto transaction (store.tx_begin_read ());
	escrow::record result;
	ASSERT_FALSE (store.record_get (transaction, record1.id, result));
	ASSERT_EQ (escrow::record_state::complete, result.state);
}

TEST (record_store, events_ordered)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto record1 (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, record1));
	auto record2 (sample_record (101));
	ASSERT_NO_ERROR (store.record_create (transaction, record2));
	std::vector<escrow::record_event_type> types{ escrow::record_event_type::created, escrow::record_event_type::funding_submitted, escrow::record_event_type::funded };
	for (auto type : types)
	{
		escrow::record_event event;
		event.escrow_id = record1.id;
		event.type = type;
		event.cause = escrow::event_cause::funding;
		store.event_append (transaction, event);
		escrow::record_event other;
		other.escrow_id = record2.id;
		other.type = escrow::record_event_type::created;
		other.cause = escrow::event_cause::administrative;
		store.event_append (transaction, other);
	}
	escrow::record_event ledger_row;
	ledger_row.escrow_id = record1.id;
	ledger_row.type = escrow::record_event_type::released;
	ledger_row.cause = escrow::event_cause::ledger;
	ledger_row.transaction = escrow::block_hash (9);
	ledger_row.log_index = 1;
	ledger_row.height = 12;
	ledger_row.payload = "{\"trade_id\":\"1\"}";
	ASSERT_EQ (7, store.event_append (transaction, ledger_row));
	auto events (store.events (transaction, record1.id));
	ASSERT_EQ (4, events.size ());
	ASSERT_EQ (escrow::record_event_type::created, events[0].type);
	ASSERT_EQ (escrow::record_event_type::funding_submitted, events[1].type);
	ASSERT_EQ (escrow::record_event_type::funded, events[2].type);
	ASSERT_EQ (escrow::record_event_type::released, events[3].type);
	for (size_t i (1); i < events.size (); ++i)
	{
		ASSERT_LT (events[i - 1].sequence, events[i].sequence);
	}
	ASSERT_EQ (escrow::block_hash (9), events[3].transaction);
	ASSERT_EQ (1, events[3].log_index);
	ASSERT_EQ (12, events[3].height);
	ASSERT_EQ ("{\"trade_id\":\"1\"}", events[3].payload);
	ASSERT_EQ (3, store.events (transaction, record2.id).size ());
	ASSERT_TRUE (store.events (transaction, 3).empty ());
	ASSERT_EQ (7, store.event_count (transaction));
}

TEST (record_store, ledger_events)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	escrow::ledger_event_key key1 (escrow::block_hash (1), 0);
	escrow::ledger_event_key key2 (escrow::block_hash (1), 1);
	ASSERT_FALSE (store.ledger_event_exists (transaction, key1));
	store.ledger_event_put (transaction, key1, 5);
	ASSERT_TRUE (store.ledger_event_exists (transaction, key1));
	ASSERT_FALSE (store.ledger_event_exists (transaction, key2));
}

TEST (record_store, cursors)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	uint64_t height (0);
	ASSERT_TRUE (store.cursor_get (transaction, "local", height));
	store.cursor_put (transaction, "local", 42);
	store.cursor_put (transaction, "mainnet", 7);
	ASSERT_FALSE (store.cursor_get (transaction, "local", height));
	ASSERT_EQ (42, height);
	ASSERT_FALSE (store.cursor_get (transaction, "mainnet", height));
	ASSERT_EQ (7, height);
}

TEST (record_store, state_queries)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto old_funded (sample_record (100));
	old_funded.state = escrow::record_state::funded;
	old_funded.funded_at = 1000;
	ASSERT_NO_ERROR (store.record_create (transaction, old_funded));
	auto new_funded (sample_record (101));
	new_funded.state = escrow::record_state::funded;
	new_funded.funded_at = 5000;
	ASSERT_NO_ERROR (store.record_create (transaction, new_funded));
	auto pending (sample_record (102));
	pending.state = escrow::record_state::pending_verification;
	ASSERT_NO_ERROR (store.record_create (transaction, pending));
	auto stale (store.awaiting_confirmation (transaction, 2000));
	ASSERT_EQ (1, stale.size ());
	ASSERT_EQ (old_funded.id, stale[0].id);
	ASSERT_EQ (2, store.records_in_state (transaction, escrow::record_state::funded).size ());
	ASSERT_EQ (1, store.records_in_state (transaction, escrow::record_state::pending_verification).size ());
	ASSERT_TRUE (store.records_in_state (transaction, escrow::record_state::complete).empty ());
}

TEST (record_store, party_query)
{
	escrow::logger_mt logger;
	bool init (false);
	escrow::mdb_store store (init, logger, escrow::unique_path ());
	ASSERT_TRUE (!init);
	auto transaction (store.tx_begin_write ());
	auto first (sample_record (100));
	ASSERT_NO_ERROR (store.record_create (transaction, first));
	auto other (sample_record (101));
	other.buyer_id = 30;
	other.seller_id = 40;
	ASSERT_NO_ERROR (store.record_create (transaction, other));
	auto reversed (sample_record (102));
	reversed.buyer_id = 20;
	reversed.seller_id = 30;
	ASSERT_NO_ERROR (store.record_create (transaction, reversed));
	ASSERT_EQ (1, store.records_for_party (transaction, 10).size ());
	ASSERT_EQ (2, store.records_for_party (transaction, 20).size ());
	ASSERT_EQ (2, store.records_for_party (transaction, 30).size ());
	auto seller_only (store.records_for_party (transaction, 40));
	ASSERT_EQ (1, seller_only.size ());
	ASSERT_EQ (other.id, seller_only[0].id);
	ASSERT_TRUE (store.records_for_party (transaction, 50).empty ());
}

TEST (record_store, reopen)
{
	escrow::logger_mt logger;
	auto path (escrow::unique_path ());
	{
		bool init (false);
		escrow::mdb_store store (init, logger, path);
		ASSERT_FALSE (init);
		auto transaction (store.tx_begin_write ());
		auto record1 (sample_record (100));
		ASSERT_NO_ERROR (store.record_create (transaction, record1));
		store.cursor_put (transaction, "local", 9);
	}
	bool init (false);
	escrow::mdb_store store (init, logger, path);
	ASSERT_FALSE (init);
	auto transaction (store.tx_begin_read ());
	ASSERT_EQ (1, store.record_count (transaction));
	uint64_t height (0);
	ASSERT_FALSE (store.cursor_get (transaction, "local", height));
	ASSERT_EQ (9, height);
}

TEST (record_store, version_too_high)
{
	escrow::logger_mt logger;
	auto path (escrow::unique_path ());
	{
		bool init (false);
		escrow::mdb_store store (init, logger, path);
		ASSERT_FALSE (init);
		auto transaction (store.tx_begin_write ());
		store.version_put (transaction, escrow::mdb_store::version + 1);
	}
	bool init (false);
	escrow::mdb_store store (init, logger, path);
	ASSERT_TRUE (init);
}
