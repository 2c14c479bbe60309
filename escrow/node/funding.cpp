#include <escrow/node/chain.hpp>
#include <escrow/node/funding.hpp>
#include <escrow/node/node.hpp>
#include <escrow/node/signer.hpp>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <algorithm>

namespace
{
char const * trust_marker (bool trust_reduced_a)
{
	return trust_reduced_a ? " (trust reduced)" : "";
}
}

std::string escrow::to_string (escrow::funding_path path_a)
{
	std::string result;
	switch (path_a)
	{
		case escrow::funding_path::self_custodial:
			result = "self_custodial";
			break;
		case escrow::funding_path::custodial:
			result = "custodial";
			break;
	}
	return result;
}

bool escrow::decode_path (std::string const & text_a, escrow::funding_path & path_a)
{
	auto error (false);
	if (text_a == "self_custodial")
	{
		path_a = escrow::funding_path::self_custodial;
	}
	else if (text_a == "custodial")
	{
		path_a = escrow::funding_path::custodial;
	}
	else
	{
		error = true;
	}
	return error;
}

escrow::funding_coordinator::funding_coordinator (escrow::node & node_a) :
node (node_a),
stopped (false)
{
}

std::error_code escrow::funding_coordinator::process (escrow::funding_intent const & intent_a, escrow::block_hash & transaction_a)
{
	std::error_code result;
	switch (intent_a.path)
	{
		case escrow::funding_path::self_custodial:
			if (intent_a.transaction)
			{
				transaction_a = *intent_a.transaction;
				result = fund_self_custodial (intent_a.escrow_id, *intent_a.transaction);
			}
			else
			{
				result = escrow::error_verification::not_found;
			}
			break;
		case escrow::funding_path::custodial:
			result = fund_custodial (intent_a.escrow_id, transaction_a);
			break;
	}
	return result;
}

std::error_code escrow::funding_coordinator::fund_self_custodial (uint64_t escrow_id_a, escrow::block_hash const & transaction_a)
{
	node.stats.inc (escrow::stat::type::funding, escrow::stat::detail::self_custodial);
	escrow::record record;
	std::error_code result;
	{
		auto transaction (node.store.tx_begin_read ());
		result = node.store.record_get (transaction, escrow_id_a, record) ? escrow::error_escrow::record_not_found : std::error_code ();
	}
	if (!result)
	{
		result = submit_pending (escrow_id_a, transaction_a, record.buyer_account, false);
	}
	if (!result)
	{
		result = verify_pending (escrow_id_a, false);
	}
	return result;
}

std::error_code escrow::funding_coordinator::fund_custodial (uint64_t escrow_id_a, escrow::block_hash & transaction_a)
{
	node.stats.inc (escrow::stat::type::funding, escrow::stat::detail::custodial);
	auto signer (node.custodial_signer);
	std::error_code result;
	escrow::record record;
	if (signer == nullptr)
	{
		result = escrow::error_funding::custodial_unavailable;
	}
	else
	{
		auto transaction (node.store.tx_begin_read ());
		if (node.store.record_get (transaction, escrow_id_a, record))
		{
			result = escrow::error_escrow::record_not_found;
		}
		else if (record.halted)
		{
			result = escrow::error_escrow::record_halted;
		}
		else if (record.state != escrow::record_state::awaiting_fund)
		{
			result = escrow::error_funding::wrong_state;
		}
	}
	if (!result)
	{
		uint64_t nonce (0);
		result = node.client.nonce (signer->account (), nonce);
		if (!result)
		{
			boost::property_tree::ptree metadata;
			metadata.put ("escrow_id", std::to_string (record.id));
			metadata.put ("agreement_id", std::to_string (record.agreement_id));
			auto call (escrow::ledger_call::create_and_fund (signer->account (), record.seller_account, record.amount, escrow::json_payload (metadata)));
			call.nonce = nonce;
			signer->sign (call);
			result = node.client.submit (call, transaction_a);
		}
		if (result)
		{
			node.stats.inc (escrow::stat::type::ledger, escrow::stat::detail::submit_failed);
			node.logger.always_log (boost::str (boost::format ("Custodial funding of escrow %1% was not submitted: %2%%3%") % escrow_id_a % result.message () % trust_marker (true)));
		}
		else
		{
			node.stats.inc (escrow::stat::type::ledger, escrow::stat::detail::submitted);
			if (node.config.logging.funding_logging ())
			{
				node.logger.try_log (boost::str (boost::format ("Submitted custodial funding %1% for escrow %2%%3%") % transaction_a.to_string () % escrow_id_a % trust_marker (true)));
			}
			result = submit_pending (escrow_id_a, transaction_a, signer->account (), true);
			if (!result)
			{
				result = wait_confirmations (transaction_a);
				if (!result)
				{
					result = verify_pending (escrow_id_a, true);
				}
				else if (result == escrow::error_funding::confirmation_timeout)
				{
					node.stats.inc (escrow::stat::type::funding, escrow::stat::detail::confirmation_timeout);
					node.logger.always_log (boost::str (boost::format ("Custodial funding %1% of escrow %2% is not confirmed, the record stays pending%3%") % transaction_a.to_string () % escrow_id_a % trust_marker (true)));
				}
			}
		}
	}
	return result;
}

std::error_code escrow::funding_coordinator::writable (escrow::record const & record_a, bool custodial_a) const
{
	std::error_code result;
	if (record_a.halted)
	{
		result = escrow::error_escrow::record_halted;
	}
	else if (record_a.state == escrow::record_state::pending_verification)
	{
		// A buyer may hand over a different transaction, a custodial submission is never replaced
		result = custodial_a || record_a.custodial ? escrow::error_funding::wrong_state : std::error_code ();
	}
	else if (record_a.state != escrow::record_state::awaiting_fund)
	{
		result = escrow::error_funding::wrong_state;
	}
	return result;
}

std::error_code escrow::funding_coordinator::submit_pending (uint64_t escrow_id_a, escrow::block_hash const & transaction_a, escrow::account const & payer_a, bool custodial_a)
{
	escrow::record record;
	escrow::record_state previous (escrow::record_state::awaiting_fund);
	std::error_code result;
	{
		auto transaction (node.store.tx_begin_write ());
		if (node.store.record_get (transaction, escrow_id_a, record))
		{
			result = escrow::error_escrow::record_not_found;
		}
		else
		{
			result = writable (record, custodial_a);
		}
		if (!result)
		{
			previous = record.state;
			if (!record.funding_transaction || *record.funding_transaction != transaction_a)
			{
				record.verification_attempts = 0;
			}
			record.state = escrow::record_state::pending_verification;
			record.funding_transaction = transaction_a;
			record.payer = payer_a;
			record.custodial = custodial_a;
			result = node.store.state_update (transaction, previous, record);
			if (!result)
			{
				boost::property_tree::ptree payload;
				payload.put ("transaction", transaction_a.to_string ());
				payload.put ("payer", payer_a.to_account ());
				payload.put ("custodial", custodial_a);
				escrow::record_event event;
				event.escrow_id = escrow_id_a;
				event.type = escrow::record_event_type::funding_submitted;
				event.cause = escrow::event_cause::funding;
				event.trust_reduced = custodial_a;
				event.payload = escrow::json_payload (payload);
				node.event_append (transaction, event);
			}
		}
	}
	if (!result && previous != record.state)
	{
		node.stats.inc (escrow::stat::type::escrow, escrow::stat::detail::transition);
		node.observers.transition.notify (record, previous);
	}
	return result;
}

std::error_code escrow::funding_coordinator::verify_pending (uint64_t escrow_id_a, bool trust_reduced_a)
{
	escrow::record record;
	std::error_code result;
	{
		auto transaction (node.store.tx_begin_read ());
		if (node.store.record_get (transaction, escrow_id_a, record))
		{
			result = escrow::error_escrow::record_not_found;
		}
	}
	// Already advanced by the reconciler
	auto done (!result && static_cast<uint8_t> (record.state) >= static_cast<uint8_t> (escrow::record_state::funded));
	if (!result && !done)
	{
		if (record.halted)
		{
			result = escrow::error_escrow::record_halted;
		}
		else if (record.state != escrow::record_state::pending_verification || !record.funding_transaction)
		{
			result = escrow::error_funding::wrong_state;
		}
		else
		{
			escrow::funding_expectation expected;
			expected.trade_id = record.trade_id;
			expected.buyer = record.payer;
			expected.seller = record.seller_account;
			expected.amount = record.amount;
			escrow::funding_proof proof;
			result = node.verifier.verify (*record.funding_transaction, expected, proof);
			if (!result)
			{
				result = mark_funded (escrow_id_a, *record.funding_transaction, proof, trust_reduced_a);
			}
			if (result)
			{
				// Counted against the attempt limit whether the proof or the store rejected it
				record_failure (escrow_id_a, result, trust_reduced_a);
			}
		}
	}
	return result;
}

std::error_code escrow::funding_coordinator::mark_funded (uint64_t escrow_id_a, escrow::block_hash const & transaction_a, escrow::funding_proof const & proof_a, bool trust_reduced_a)
{
	escrow::record record;
	auto changed (false);
	std::error_code result;
	{
		auto transaction (node.store.tx_begin_write ());
		if (node.store.record_get (transaction, escrow_id_a, record))
		{
			result = escrow::error_escrow::record_not_found;
		}
		else if (static_cast<uint8_t> (record.state) < static_cast<uint8_t> (escrow::record_state::funded))
		{
			if (record.halted)
			{
				result = escrow::error_escrow::record_halted;
			}
			else if (record.state != escrow::record_state::pending_verification)
			{
				result = escrow::error_funding::wrong_state;
			}
			else
			{
				record.state = escrow::record_state::funded;
				record.trade_id = proof_a.trade_id;
				record.funding_transaction = transaction_a;
				record.provisional = true;
				record.funded_at = escrow::seconds_since_epoch ();
				record.timeout_at = proof_a.timeout_at;
				result = node.store.state_update (transaction, escrow::record_state::pending_verification, record);
				if (!result)
				{
					boost::property_tree::ptree payload;
					payload.put ("transaction", transaction_a.to_string ());
					payload.put ("trade_id", std::to_string (proof_a.trade_id));
					payload.put ("height", std::to_string (proof_a.height));
					payload.put ("confirmations", std::to_string (proof_a.confirmations));
					escrow::record_event event;
					event.escrow_id = escrow_id_a;
					event.type = escrow::record_event_type::funded;
					event.cause = escrow::event_cause::funding;
					event.trust_reduced = trust_reduced_a;
					event.payload = escrow::json_payload (payload);
					node.event_append (transaction, event);
					changed = true;
				}
			}
		}
	}
	if (changed)
	{
		node.stats.inc (escrow::stat::type::escrow, escrow::stat::detail::transition);
		if (node.config.logging.funding_logging ())
		{
			node.logger.try_log (boost::str (boost::format ("Escrow %1% funded through trade %2%%3%") % escrow_id_a % proof_a.trade_id % trust_marker (trust_reduced_a)));
		}
		node.observers.transition.notify (record, escrow::record_state::pending_verification);
	}
	return result;
}

void escrow::funding_coordinator::record_failure (uint64_t escrow_id_a, std::error_code const & error_a, bool trust_reduced_a)
{
	escrow::record record;
	auto counted (false);
	{
		auto transaction (node.store.tx_begin_write ());
		if (!node.store.record_get (transaction, escrow_id_a, record) && record.state == escrow::record_state::pending_verification)
		{
			++record.verification_attempts;
			auto error (node.store.state_update (transaction, escrow::record_state::pending_verification, record));
			if (!error)
			{
				boost::property_tree::ptree payload;
				payload.put ("error", error_a.message ());
				payload.put ("step", escrow::error_step (error_a));
				payload.put ("attempt", std::to_string (record.verification_attempts));
				escrow::record_event event;
				event.escrow_id = escrow_id_a;
				event.type = escrow::record_event_type::verification_failed;
				event.cause = escrow::event_cause::funding;
				event.trust_reduced = trust_reduced_a;
				event.payload = escrow::json_payload (payload);
				node.event_append (transaction, event);
				counted = true;
			}
		}
	}
	if (node.config.logging.funding_logging ())
	{
		node.logger.always_log (boost::str (boost::format ("Funding of escrow %1% not verified: %2%%3%") % escrow_id_a % error_a.message () % trust_marker (trust_reduced_a)));
	}
	if (counted && record.verification_attempts >= node.config.verification_attempts_max)
	{
		node.stats.inc (escrow::stat::type::funding, escrow::stat::detail::verification_exhausted);
		node.logger.always_log (boost::str (boost::format ("Escrow %1% exhausted %2% verification attempts%3%") % escrow_id_a % record.verification_attempts % trust_marker (trust_reduced_a)));
		node.observers.failure.notify (record, escrow::error_funding::verification_exhausted);
	}
}

std::error_code escrow::funding_coordinator::wait_confirmations (escrow::block_hash const & transaction_a)
{
	auto deadline (std::chrono::steady_clock::now () + node.config.custodial_confirmation_timeout);
	std::error_code result;
	auto done (false);
	std::unique_lock<std::mutex> lock (mutex);
	while (!done && !result)
	{
		if (stopped)
		{
			result = escrow::error_funding::cancelled;
		}
		else
		{
			lock.unlock ();
			escrow::transaction_receipt receipt;
			uint64_t head (0);
			auto included (!node.client.receipt (transaction_a, receipt));
			// A reverted call never gains confirmations, verification reports it
			auto settled (included && (!receipt.success || (!node.client.head (head) && head >= receipt.height && head - receipt.height >= node.config.confirmations)));
			lock.lock ();
			if (settled)
			{
				done = true;
			}
			else if (std::chrono::steady_clock::now () >= deadline)
			{
				result = escrow::error_funding::confirmation_timeout;
			}
			else if (!stopped)
			{
				condition.wait_until (lock, std::min (deadline, std::chrono::steady_clock::now () + node.config.confirmation_poll_interval));
			}
		}
	}
	return result;
}

size_t escrow::funding_coordinator::retry_pending ()
{
	std::vector<escrow::record> pending;
	{
		auto transaction (node.store.tx_begin_read ());
		pending = node.store.records_in_state (transaction, escrow::record_state::pending_verification);
	}
	size_t result (0);
	for (auto & record : pending)
	{
		if (!record.halted && record.funding_transaction && record.verification_attempts < node.config.verification_attempts_max)
		{
			if (!verify_pending (record.id, record.custodial))
			{
				++result;
			}
		}
	}
	return result;
}

void escrow::funding_coordinator::stop ()
{
	{
		std::lock_guard<std::mutex> lock (mutex);
		stopped = true;
	}
	condition.notify_all ();
}
