#include <escrow/node/chain.hpp>
#include <escrow/node/node.hpp>
#include <escrow/node/reconciler.hpp>
#include <escrow/node/signer.hpp>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <algorithm>
#include <sstream>

constexpr unsigned escrow::event_reconciler::apply_retry_max;

namespace
{
bool advances (escrow::record_state from_a, escrow::record_state to_a)
{
	return static_cast<uint8_t> (to_a) > static_cast<uint8_t> (from_a);
}

/** Applies the effect of one ledger event to a copy of its record */
class transition_visitor : public boost::static_visitor<>
{
public:
	transition_visitor (escrow::record & record_a, uint64_t now_a, uint64_t timeout_at_a, escrow::block_hash const & transaction_a) :
	record (record_a),
	now (now_a),
	timeout_at (timeout_at_a),
	transaction (transaction_a)
	{
	}
	void operator() (escrow::escrow_created_event const & event_a)
	{
		type = escrow::record_event_type::escrow_created;
		if (!record.trade_id)
		{
			record.trade_id = event_a.trade_id;
		}
	}
	void operator() (escrow::funded_event const & event_a)
	{
		type = escrow::record_event_type::funded;
		if (event_a.amount != record.amount)
		{
			record.halted = true;
			consistency_failure = true;
		}
		else if (record.state == escrow::record_state::funded)
		{
			record.provisional = false;
			if (record.timeout_at == 0)
			{
				record.timeout_at = timeout_at;
			}
		}
		else if (advances (record.state, escrow::record_state::funded))
		{
			if (!record.trade_id)
			{
				record.trade_id = event_a.trade_id;
			}
			record.state = escrow::record_state::funded;
			record.provisional = false;
			record.funding_transaction = transaction;
			record.funded_at = now;
			record.timeout_at = timeout_at;
		}
	}
	void operator() (escrow::delivery_confirmed_event const &)
	{
		type = escrow::record_event_type::delivery_confirmed;
	}
	void operator() (escrow::released_event const &)
	{
		type = escrow::record_event_type::released;
		complete ();
	}
	void operator() (escrow::disputed_event const & event_a)
	{
		type = escrow::record_event_type::disputed;
		if (advances (record.state, escrow::record_state::disputed))
		{
			record.state = escrow::record_state::disputed;
			record.provisional = false;
			record.disputed_at = now;
			if (record.dispute_reason.empty ())
			{
				record.dispute_reason = event_a.reason;
			}
		}
	}
	void operator() (escrow::resolved_event const &)
	{
		type = escrow::record_event_type::resolved;
		complete ();
	}
	void operator() (escrow::timeout_refund_event const &)
	{
		type = escrow::record_event_type::timeout_refund;
		complete ();
	}
	void complete ()
	{
		if (advances (record.state, escrow::record_state::complete))
		{
			record.state = escrow::record_state::complete;
			record.provisional = false;
			record.completed_at = now;
		}
	}
	escrow::record & record;
	uint64_t now;
	uint64_t timeout_at;
	escrow::block_hash transaction;
	escrow::record_event_type type{ escrow::record_event_type::created };
	bool consistency_failure{ false };
};

/** True if the event funds the record with its expected amount between its expected parties */
bool funds_record (escrow::ledger_event const & event_a, escrow::record const & record_a)
{
	auto result (false);
	auto created (boost::get<escrow::escrow_created_event> (&event_a));
	auto funded (boost::get<escrow::funded_event> (&event_a));
	if (created != nullptr)
	{
		result = created->amount == record_a.amount && created->buyer == record_a.payer && created->seller == record_a.seller_account;
	}
	else if (funded != nullptr)
	{
		result = funded->amount == record_a.amount && funded->payer == record_a.payer;
	}
	return result;
}

/** Reads the escrow id the custodial path writes into trade metadata */
boost::optional<uint64_t> metadata_escrow_id (std::string const & metadata_a)
{
	boost::optional<uint64_t> result;
	if (!metadata_a.empty ())
	{
		boost::property_tree::ptree tree;
		std::stringstream stream (metadata_a);
		try
		{
			boost::property_tree::read_json (stream, tree);
			result = tree.get_optional<uint64_t> ("escrow_id");
		}
		catch (boost::property_tree::ptree_error const &)
		{
			// Free form metadata, the trade is linked by its id only
		}
	}
	return result;
}
}

escrow::event_reconciler::event_reconciler (escrow::node & node_a) :
node (node_a),
stopped (false)
{
}

escrow::event_reconciler::~event_reconciler ()
{
	stop ();
}

void escrow::event_reconciler::start ()
{
	if (!thread.joinable ())
	{
		thread = std::thread ([this]() {
			escrow::thread_role::set (escrow::thread_role::name::reconciler);
			run ();
		});
	}
}

void escrow::event_reconciler::stop ()
{
	{
		std::lock_guard<std::mutex> lock (mutex);
		stopped = true;
	}
	condition.notify_all ();
	if (thread.joinable ())
	{
		thread.join ();
	}
}

void escrow::event_reconciler::run ()
{
	std::unique_lock<std::mutex> lock (mutex);
	while (!stopped)
	{
		lock.unlock ();
		auto error (process_once ());
		if (error && node.config.logging.reconciler_logging ())
		{
			node.logger.try_log (boost::str (boost::format ("Reconciliation cycle failed: %1%") % error.message ()));
		}
		node.funding.retry_pending ();
		lock.lock ();
		if (!stopped)
		{
			condition.wait_for (lock, node.config.reconciler_interval);
		}
	}
}

uint64_t escrow::event_reconciler::cursor ()
{
	uint64_t result (node.config.reconciler_start_height);
	auto transaction (node.store.tx_begin_read ());
	if (node.store.cursor_get (transaction, node.client.name (), result))
	{
		result = node.config.reconciler_start_height;
	}
	return result;
}

std::error_code escrow::event_reconciler::process_once ()
{
	node.stats.inc (escrow::stat::type::reconciler, escrow::stat::detail::cycle);
	auto from (cursor ());
	uint64_t head (0);
	auto result (node.client.head (head));
	if (!result && head >= node.config.confirmations)
	{
		auto safe_head (head - node.config.confirmations);
		if (safe_head > from)
		{
			auto to (std::min<uint64_t> (safe_head, from + node.config.reconciler_batch_size));
			std::vector<escrow::ledger_log> logs;
			result = node.client.logs (from + 1, to, logs);
			for (auto i (logs.begin ()), n (logs.end ()); !result && i != n; ++i)
			{
				result = apply (*i);
			}
			// A batch with an event left unapplied is read again from the same cursor next cycle
			if (!result)
			{
				auto transaction (node.store.tx_begin_write ());
				node.store.cursor_put (transaction, node.client.name (), to);
				if (node.config.logging.reconciler_logging ())
				{
					node.logger.try_log (boost::str (boost::format ("Reconciled %1% events up to height %2%") % logs.size () % to));
				}
			}
		}
	}
	return result;
}

bool escrow::event_reconciler::links_record (escrow::escrow_created_event const & created_a, escrow::record const & record_a) const
{
	// Metadata names the record, the trade must still be between its parties for its amount
	auto buyer_known (created_a.buyer == record_a.payer || (node.custodial_signer != nullptr && created_a.buyer == node.custodial_signer->account ()));
	return buyer_known && !created_a.buyer.is_zero () && created_a.seller == record_a.seller_account && (created_a.amount.is_zero () || created_a.amount == record_a.amount);
}

bool escrow::event_reconciler::locate (escrow::ledger_log const & log_a, escrow::record & record_a)
{
	auto trade_id (escrow::event_trade_id (log_a.event));
	auto transaction (node.store.tx_begin_read ());
	auto result (node.store.record_get_trade (transaction, trade_id, record_a));
	if (result)
	{
		auto created (boost::get<escrow::escrow_created_event> (&log_a.event));
		if (created != nullptr)
		{
			auto escrow_id (metadata_escrow_id (created->metadata));
			result = !escrow_id || node.store.record_get (transaction, *escrow_id, record_a) || record_a.trade_id || !links_record (*created, record_a);
		}
	}
	if (result)
	{
		// Funding submitted but not yet verified, the record is found by its transaction
		for (auto & pending : node.store.records_in_state (transaction, escrow::record_state::pending_verification))
		{
			if (result && !pending.trade_id && pending.funding_transaction && *pending.funding_transaction == log_a.transaction && funds_record (log_a.event, pending))
			{
				record_a = pending;
				result = false;
			}
		}
	}
	return result;
}

std::error_code escrow::event_reconciler::apply (escrow::ledger_log const & log_a)
{
	escrow::ledger_event_key key (log_a.transaction, log_a.index);
	std::error_code result;
	auto retry (true);
	for (unsigned attempt (0); retry && attempt < apply_retry_max; ++attempt)
	{
		retry = false;
		escrow::record record;
		auto missing (locate (log_a, record));
		auto updated (record);
		uint64_t timeout_at (0);
		auto funded (boost::get<escrow::funded_event> (&log_a.event));
		if (!missing && funded != nullptr)
		{
			escrow::trade trade;
			if (!node.client.trade_get (funded->trade_id, trade))
			{
				timeout_at = trade.timeout_at;
			}
		}
		transition_visitor visitor (updated, escrow::seconds_since_epoch (), timeout_at, log_a.transaction);
		boost::apply_visitor (visitor, log_a.event);
		if (record.halted)
		{
			// Rows are still kept for halted records
			updated = record;
			visitor.consistency_failure = false;
		}
		auto changed (!missing && !(updated == record));
		auto applied (false);
		{
			auto transaction (node.store.tx_begin_write ());
			if (node.store.ledger_event_exists (transaction, key))
			{
				node.stats.inc (escrow::stat::type::reconciler, escrow::stat::detail::event_duplicate);
			}
			else if (missing)
			{
				node.store.ledger_event_put (transaction, key, 0);
				node.stats.inc (escrow::stat::type::reconciler, escrow::stat::detail::unknown_trade);
				if (node.config.logging.reconciler_logging ())
				{
					node.logger.try_log (boost::str (boost::format ("%1% for unknown trade %2% in %3%") % escrow::event_name (log_a.event) % escrow::event_trade_id (log_a.event) % log_a.transaction.to_string ()));
				}
			}
			else
			{
				std::error_code error;
				if (changed)
				{
					error = node.store.state_update (transaction, record.state, updated);
				}
				if (error == escrow::error_escrow::state_mismatch)
				{
					node.stats.inc (escrow::stat::type::escrow, escrow::stat::detail::state_mismatch);
					retry = true;
				}
				else
				{
					if (error)
					{
						changed = false;
						node.logger.always_log (boost::str (boost::format ("%1% not applied to escrow %2%: %3%") % escrow::event_name (log_a.event) % record.id % error.message ()));
					}
					boost::property_tree::ptree payload;
					escrow::serialize_json (log_a.event, payload);
					escrow::record_event event;
					event.escrow_id = record.id;
					event.type = visitor.type;
					event.cause = escrow::event_cause::ledger;
					event.payload = escrow::json_payload (payload);
					event.transaction = log_a.transaction;
					event.log_index = log_a.index;
					event.height = log_a.height;
					node.event_append (transaction, event);
					if (changed && visitor.consistency_failure)
					{
						boost::property_tree::ptree failure;
						failure.put ("expected", record.amount.to_string_dec ());
						failure.put ("observed", funded->amount.to_string_dec ());
						escrow::record_event halt;
						halt.escrow_id = record.id;
						halt.type = escrow::record_event_type::consistency_failure;
						halt.cause = escrow::event_cause::ledger;
						halt.payload = escrow::json_payload (failure);
						halt.transaction = log_a.transaction;
						halt.log_index = log_a.index;
						halt.height = log_a.height;
						node.event_append (transaction, halt);
					}
					node.store.ledger_event_put (transaction, key, record.id);
					node.stats.inc (escrow::stat::type::reconciler, escrow::stat::detail::event_applied);
					applied = true;
				}
			}
		}
		if (applied && changed)
		{
			if (visitor.consistency_failure)
			{
				node.stats.inc (escrow::stat::type::reconciler, escrow::stat::detail::consistency_failure);
				node.logger.always_log (boost::str (boost::format ("Escrow %1% halted, trade %2% was funded with an unexpected amount") % record.id % escrow::event_trade_id (log_a.event)));
				node.observers.failure.notify (updated, escrow::error_escrow::record_halted);
			}
			if (updated.state != record.state)
			{
				node.stats.inc (escrow::stat::type::escrow, escrow::stat::detail::transition);
				if (node.config.logging.reconciler_logging ())
				{
					node.logger.try_log (boost::str (boost::format ("Escrow %1% moved from %2% to %3% by %4%") % record.id % escrow::to_string (record.state) % escrow::to_string (updated.state) % escrow::event_name (log_a.event)));
				}
				node.observers.transition.notify (updated, record.state);
			}
		}
	}
	if (retry)
	{
		result = escrow::error_escrow::state_mismatch;
		node.logger.always_log (boost::str (boost::format ("%1% in %2% not applied after %3% attempts, the record kept changing") % escrow::event_name (log_a.event) % log_a.transaction.to_string () % apply_retry_max));
	}
	return result;
}
