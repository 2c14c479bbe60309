#include <escrow/node/chain.hpp>
#include <escrow/node/dispute.hpp>
#include <escrow/node/node.hpp>
#include <escrow/node/signer.hpp>

#include <boost/format.hpp>

escrow::dispute_resolver::dispute_resolver (escrow::node & node_a) :
node (node_a)
{
}

std::error_code escrow::dispute_resolver::compute_split (escrow::record const & record_a, escrow::dispute_decision const & decision_a, escrow::dispute_split & split_a)
{
	std::error_code result;
	switch (decision_a.outcome)
	{
		case escrow::resolution_outcome::refund_to_buyer:
			split_a.recipient = record_a.payer;
			split_a.other = record_a.seller_account;
			split_a.recipient_amount = record_a.amount.number ();
			break;
		case escrow::resolution_outcome::payout_to_seller:
			split_a.recipient = record_a.seller_account;
			split_a.other = record_a.payer;
			split_a.recipient_amount = record_a.amount.number ();
			break;
		case escrow::resolution_outcome::partial_split:
			if (!decision_a.recipient)
			{
				result = escrow::error_dispute::missing_recipient;
			}
			else if (!decision_a.amount)
			{
				result = escrow::error_dispute::missing_amount;
			}
			else if (decision_a.amount->number () > record_a.amount.number ())
			{
				result = escrow::error_dispute::amount_exceeds;
			}
			else if (*decision_a.recipient != record_a.payer && *decision_a.recipient != record_a.seller_account)
			{
				result = escrow::error_dispute::invalid_recipient;
			}
			else
			{
				split_a.recipient = *decision_a.recipient;
				split_a.other = split_a.recipient == record_a.payer ? record_a.seller_account : record_a.payer;
				split_a.recipient_amount = decision_a.amount->number ();
			}
			break;
	}
	if (!result)
	{
		split_a.remainder = record_a.amount.number () - split_a.recipient_amount;
	}
	return result;
}

std::error_code escrow::dispute_resolver::resolvable (escrow::record const & record_a)
{
	std::error_code result;
	if (record_a.halted)
	{
		result = escrow::error_escrow::record_halted;
	}
	else if (record_a.state != escrow::record_state::disputed)
	{
		result = escrow::error_dispute::not_disputed;
	}
	else if (!record_a.trade_id)
	{
		result = escrow::error_dispute::trade_not_linked;
	}
	else if (record_a.resolution && !record_a.resolution->transaction.is_zero ())
	{
		escrow::transaction_receipt receipt;
		auto error (node.client.receipt (record_a.resolution->transaction, receipt));
		if (!error && receipt.success)
		{
			result = escrow::error_dispute::already_resolved;
		}
		else if (error && error != escrow::error_ledger::unknown_transaction)
		{
			result = error;
		}
	}
	return result;
}

std::error_code escrow::dispute_resolver::resolve (escrow::dispute_decision const & decision_a, escrow::block_hash & transaction_a)
{
	auto signer (node.admin_signer);
	escrow::record record;
	escrow::dispute_split split;
	std::error_code result;
	if (signer == nullptr)
	{
		result = escrow::error_dispute::admin_unavailable;
	}
	else
	{
		auto transaction (node.store.tx_begin_read ());
		result = node.store.record_get (transaction, decision_a.escrow_id, record) ? escrow::error_escrow::record_not_found : std::error_code ();
	}
	if (!result)
	{
		result = resolvable (record);
	}
	if (!result)
	{
		result = compute_split (record, decision_a, split);
	}
	if (!result)
	{
		uint64_t nonce (0);
		result = node.client.nonce (signer->account (), nonce);
		if (!result)
		{
			auto call (escrow::ledger_call::resolve_dispute (signer->account (), *record.trade_id, split.recipient, split.recipient_amount, decision_a.note));
			call.nonce = nonce;
			signer->sign (call);
			result = node.client.submit (call, transaction_a);
		}
		if (!result)
		{
			escrow::transaction_receipt receipt;
			if (!node.client.receipt (transaction_a, receipt) && !receipt.success)
			{
				result = escrow::error_ledger::reverted;
			}
		}
		if (result)
		{
			node.stats.inc (escrow::stat::type::ledger, escrow::stat::detail::submit_failed);
			node.logger.always_log (boost::str (boost::format ("Resolution of escrow %1% failed: %2%") % decision_a.escrow_id % result.message ()));
		}
		else
		{
			node.stats.inc (escrow::stat::type::ledger, escrow::stat::detail::submitted);
		}
	}
	if (!result)
	{
		escrow::dispute_resolution resolution;
		resolution.outcome = decision_a.outcome;
		resolution.recipient = split.recipient;
		resolution.amount = split.recipient_amount;
		resolution.note = decision_a.note;
		resolution.transaction = transaction_a;
		auto recorded (false);
		{
			auto transaction (node.store.tx_begin_write ());
			if (!node.store.record_get (transaction, decision_a.escrow_id, record) && record.state == escrow::record_state::disputed)
			{
				record.resolution = resolution;
				record.provisional = true;
				auto error (node.store.state_update (transaction, escrow::record_state::disputed, record));
				if (!error)
				{
					boost::property_tree::ptree payload;
					resolution.serialize_json (payload);
					payload.put ("remainder", escrow::amount (split.remainder).to_string_dec ());
					escrow::record_event event;
					event.escrow_id = record.id;
					event.type = escrow::record_event_type::resolution_submitted;
					event.cause = escrow::event_cause::administrative;
					event.payload = escrow::json_payload (payload);
					event.transaction = transaction_a;
					node.event_append (transaction, event);
					recorded = true;
				}
			}
		}
		node.stats.inc (escrow::stat::type::dispute, escrow::stat::detail::resolution_submitted);
		if (!recorded)
		{
			// The ledger already completed the trade, its events carry the outcome
			node.logger.always_log (boost::str (boost::format ("Resolution %1% of escrow %2% submitted after the record left the disputed state") % transaction_a.to_string () % decision_a.escrow_id));
		}
		else if (node.config.logging.dispute_logging ())
		{
			node.logger.try_log (boost::str (boost::format ("Escrow %1% resolved as %2%, %3% to %4% in %5%") % decision_a.escrow_id % escrow::to_string (decision_a.outcome) % escrow::amount (split.recipient_amount).to_string_dec () % split.recipient.to_account () % transaction_a.to_string ()));
		}
	}
	return result;
}
