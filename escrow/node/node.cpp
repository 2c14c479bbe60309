#include <escrow/node/chain.hpp>
#include <escrow/node/lmdb.hpp>
#include <escrow/node/node.hpp>
#include <escrow/node/signer.hpp>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <algorithm>
#include <sstream>

std::string escrow::json_payload (boost::property_tree::ptree const & tree_a)
{
	std::stringstream stream;
	boost::property_tree::write_json (stream, tree_a, false);
	auto result (stream.str ());
	// write_json terminates with a newline
	if (!result.empty () && result.back () == '\n')
	{
		result.pop_back ();
	}
	return result;
}

void escrow::escrow_view::serialize_json (boost::property_tree::ptree & tree_a) const
{
	record.serialize_json (tree_a);
	boost::property_tree::ptree permissions_l;
	permissions.serialize_json (permissions_l);
	tree_a.add_child ("permissions", permissions_l);
	boost::property_tree::ptree events_l;
	for (auto & event : events)
	{
		boost::property_tree::ptree entry;
		event.serialize_json (entry);
		events_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("events", events_l);
}

bool escrow::escrow_page::has_next () const
{
	return page * limit < total;
}

bool escrow::escrow_page::has_prev () const
{
	return page > 1;
}

bool escrow::node_init::error () const
{
	return store_init;
}

escrow::node::node (escrow::node_init & init_a, boost::filesystem::path const & application_path_a, escrow::node_config const & config_a, escrow::ledger_client & client_a, std::shared_ptr<escrow::signer> custodial_signer_a, std::shared_ptr<escrow::signer> admin_signer_a) :
config (config_a),
application_path (application_path_a),
logger (config_a.logging.min_time_between_log_output),
store_impl (std::make_unique<escrow::mdb_store> (init_a.store_init, logger, application_path_a / "data.ldb", config_a.lmdb_max_dbs)),
store (*store_impl),
client (client_a),
custodial_signer (custodial_signer_a),
admin_signer (admin_signer_a),
verifier (client_a, config_a.confirmations, logger, config.logging, stats),
funding (*this),
reconciler (*this),
disputes (*this),
stopped (false)
{
	if (!init_a.error ())
	{
		if (config.logging.ledger_logging ())
		{
			logger.always_log (boost::str (boost::format ("Node starting against ledger %1% with %2% confirmations") % client.name () % config.confirmations));
			if (custodial_signer != nullptr)
			{
				logger.always_log (boost::str (boost::format ("Custodial funding through %1%") % custodial_signer->account ().to_account ()));
			}
		}
	}
	else
	{
		logger.always_log ("Unable to open the record store");
	}
}

escrow::node::~node ()
{
	stop ();
}

void escrow::node::start ()
{
	reconciler.start ();
}

void escrow::node::stop ()
{
	if (!stopped)
	{
		stopped = true;
		logger.always_log ("Node stopping");
		funding.stop ();
		reconciler.stop ();
	}
}

void escrow::node::event_append (escrow::transaction const & transaction_a, escrow::record_event & event_a)
{
	if (event_a.timestamp == 0)
	{
		event_a.timestamp = escrow::seconds_since_epoch ();
	}
	store.event_append (transaction_a, event_a);
}

std::error_code escrow::node::escrow_create (escrow::agreement const & agreement_a, escrow::record & record_a)
{
	std::error_code result;
	if (agreement_a.amount.is_zero ())
	{
		result = escrow::error_escrow::invalid_amount;
	}
	else if (agreement_a.buyer_id == agreement_a.seller_id || agreement_a.buyer_account.is_zero () || agreement_a.seller_account.is_zero () || agreement_a.buyer_account == agreement_a.seller_account)
	{
		result = escrow::error_escrow::invalid_parties;
	}
	else
	{
		escrow::record record;
		record.agreement_id = agreement_a.agreement_id;
		record.buyer_id = agreement_a.buyer_id;
		record.seller_id = agreement_a.seller_id;
		record.buyer_account = agreement_a.buyer_account;
		record.seller_account = agreement_a.seller_account;
		record.payer = agreement_a.buyer_account;
		record.amount = agreement_a.amount;
		record.metadata = agreement_a.metadata;
		record.state = escrow::record_state::awaiting_fund;
		record.created_at = escrow::seconds_since_epoch ();
		auto transaction (store.tx_begin_write ());
		result = store.record_create (transaction, record);
		if (!result)
		{
			boost::property_tree::ptree payload;
			payload.put ("agreement_id", std::to_string (record.agreement_id));
			payload.put ("amount", record.amount.to_string_dec ());
			escrow::record_event event;
			event.escrow_id = record.id;
			event.type = escrow::record_event_type::created;
			event.cause = escrow::event_cause::administrative;
			event.timestamp = record.created_at;
			event.payload = escrow::json_payload (payload);
			event_append (transaction, event);
			record_a = record;
		}
	}
	if (!result)
	{
		stats.inc (escrow::stat::type::escrow, escrow::stat::detail::created);
		if (config.logging.funding_logging ())
		{
			logger.try_log (boost::str (boost::format ("Escrow %1% opened for agreement %2%, %3% from %4% to %5%") % record_a.id % record_a.agreement_id % record_a.amount.to_string_dec () % record_a.buyer_account.to_account () % record_a.seller_account.to_account ()));
		}
	}
	return result;
}

std::error_code escrow::node::view (escrow::transaction const & transaction_a, escrow::record const & record_a, uint64_t actor_a, uint64_t now_a, escrow::escrow_view & view_a)
{
	view_a.record = record_a;
	view_a.permissions = escrow::compute_permissions (record_a, actor_a, now_a);
	view_a.events = store.events (transaction_a, record_a.id);
	return std::error_code ();
}

std::error_code escrow::node::escrow_status (uint64_t escrow_id_a, uint64_t actor_a, uint64_t now_a, escrow::escrow_view & view_a)
{
	std::error_code result;
	escrow::record record;
	auto transaction (store.tx_begin_read ());
	if (store.record_get (transaction, escrow_id_a, record))
	{
		result = escrow::error_escrow::record_not_found;
	}
	else
	{
		result = view (transaction, record, actor_a, now_a, view_a);
	}
	return result;
}

std::error_code escrow::node::escrow_by_agreement (uint64_t agreement_id_a, uint64_t actor_a, uint64_t now_a, escrow::escrow_view & view_a)
{
	std::error_code result;
	escrow::record record;
	auto transaction (store.tx_begin_read ());
	if (store.record_get_agreement (transaction, agreement_id_a, record))
	{
		result = escrow::error_escrow::record_not_found;
	}
	else
	{
		result = view (transaction, record, actor_a, now_a, view_a);
	}
	return result;
}

void escrow::node::escrow_list (uint64_t actor_a, boost::optional<escrow::record_state> const & state_a, uint64_t page_a, uint64_t limit_a, uint64_t now_a, escrow::escrow_page & page_l)
{
	auto transaction (store.tx_begin_read ());
	auto records (store.records_for_party (transaction, actor_a));
	if (state_a)
	{
		records.erase (std::remove_if (records.begin (), records.end (), [&state_a](escrow::record const & record_a) { return record_a.state != *state_a; }), records.end ());
	}
	page_l.page = page_a;
	page_l.limit = limit_a;
	paginate (transaction, records, actor_a, now_a, page_l);
}

void escrow::node::dispute_list (uint64_t page_a, uint64_t limit_a, uint64_t now_a, escrow::escrow_page & page_l)
{
	auto transaction (store.tx_begin_read ());
	auto records (store.records_in_state (transaction, escrow::record_state::disputed));
	page_l.page = page_a;
	page_l.limit = limit_a;
	paginate (transaction, records, 0, now_a, page_l);
}

void escrow::node::paginate (escrow::transaction const & transaction_a, std::vector<escrow::record> const & records_a, uint64_t actor_a, uint64_t now_a, escrow::escrow_page & page_a)
{
	assert (page_a.page >= 1 && page_a.limit >= 1);
	page_a.total = records_a.size ();
	page_a.views.clear ();
	auto offset ((page_a.page - 1) * page_a.limit);
	for (auto i (offset); i < records_a.size () && i < offset + page_a.limit; ++i)
	{
		escrow::escrow_view view_l;
		auto error (view (transaction_a, records_a[i], actor_a, now_a, view_l));
		release_assert (!error);
		page_a.views.push_back (view_l);
	}
}

std::vector<escrow::record> escrow::node::timeout_candidates (uint64_t age_a)
{
	auto now (escrow::seconds_since_epoch ());
	auto transaction (store.tx_begin_read ());
	return store.awaiting_confirmation (transaction, now > age_a ? now - age_a : 0);
}

std::vector<escrow::record> escrow::node::verification_failures ()
{
	std::vector<escrow::record> result;
	auto transaction (store.tx_begin_read ());
	for (auto & record : store.records_in_state (transaction, escrow::record_state::pending_verification))
	{
		if (record.verification_attempts >= config.verification_attempts_max)
		{
			result.push_back (record);
		}
	}
	return result;
}
