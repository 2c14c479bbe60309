#include <escrow/node/chain.hpp>
#include <escrow/node/logging.hpp>
#include <escrow/node/stats.hpp>
#include <escrow/node/verifier.hpp>

#include <boost/format.hpp>

namespace
{
/** Picks the funding related events out of a receipt */
class funding_scan : public boost::static_visitor<>
{
public:
	void operator() (escrow::escrow_created_event const & event_a)
	{
		created = event_a;
	}
	void operator() (escrow::funded_event const & event_a)
	{
		funded = event_a;
	}
	void operator() (escrow::delivery_confirmed_event const &)
	{
	}
	void operator() (escrow::released_event const &)
	{
	}
	void operator() (escrow::disputed_event const &)
	{
	}
	void operator() (escrow::resolved_event const &)
	{
	}
	void operator() (escrow::timeout_refund_event const &)
	{
	}
	boost::optional<escrow::escrow_created_event> created;
	boost::optional<escrow::funded_event> funded;
};

std::error_code ledger_to_verification (std::error_code const & ec)
{
	return ec == escrow::error_ledger::unknown_transaction ? escrow::error_verification::not_found : escrow::error_verification::ledger_unavailable;
}
}

escrow::transaction_verifier::transaction_verifier (escrow::ledger_client & client_a, unsigned confirmations_a, escrow::logger_mt & logger_a, escrow::logging const & logging_a, escrow::stat & stats_a) :
client (client_a),
confirmations (confirmations_a),
logger (logger_a),
logging (logging_a),
stats (stats_a)
{
}

std::error_code escrow::transaction_verifier::verify (escrow::block_hash const & hash_a, escrow::funding_expectation const & expected_a, escrow::funding_proof & proof_a)
{
	auto result (check (hash_a, expected_a, proof_a));
	if (!result)
	{
		stats.inc (escrow::stat::type::verification, escrow::stat::detail::verified);
		if (logging.verification_logging ())
		{
			logger.try_log (boost::str (boost::format ("Transaction %1% funds trade %2% with %3% confirmations") % hash_a.to_string () % proof_a.trade_id % proof_a.confirmations));
		}
	}
	else
	{
		stats.inc (escrow::stat::type::verification, escrow::stat::detail::rejected);
		if (logging.verification_logging ())
		{
			logger.always_log (boost::str (boost::format ("Verification of transaction %1% failed: %2%") % hash_a.to_string () % result.message ()));
		}
	}
	return result;
}

std::error_code escrow::transaction_verifier::check (escrow::block_hash const & hash_a, escrow::funding_expectation const & expected_a, escrow::funding_proof & proof_a)
{
	escrow::transaction_receipt receipt;
	auto result (client.receipt (hash_a, receipt));
	if (!result)
	{
		uint64_t head (0);
		if (!receipt.success)
		{
			result = escrow::error_verification::reverted;
		}
		else if (client.head (head))
		{
			result = escrow::error_verification::ledger_unavailable;
		}
		else if (head < receipt.height || head - receipt.height < confirmations)
		{
			result = escrow::error_verification::insufficient_confirmations;
		}
		else
		{
			funding_scan scan;
			for (auto & log : receipt.logs)
			{
				boost::apply_visitor (scan, log.event);
			}
			if (!scan.funded)
			{
				result = escrow::error_verification::missing_funding_event;
			}
			else if (expected_a.trade_id && *expected_a.trade_id != scan.funded->trade_id)
			{
				result = escrow::error_verification::trade_mismatch;
			}
			else if (scan.funded->payer != expected_a.buyer)
			{
				result = escrow::error_verification::party_mismatch;
			}
			else
			{
				escrow::trade trade;
				auto error (client.trade_get (scan.funded->trade_id, trade));
				if (error)
				{
					result = error == escrow::error_ledger::unknown_trade ? escrow::error_verification::trade_mismatch : escrow::error_verification::ledger_unavailable;
				}
				else
				{
					auto seller (scan.created && scan.created->trade_id == scan.funded->trade_id ? scan.created->seller : trade.seller);
					if (seller != expected_a.seller)
					{
						result = escrow::error_verification::party_mismatch;
					}
					else if (scan.funded->amount != expected_a.amount)
					{
						result = escrow::error_verification::amount_mismatch;
					}
					else
					{
						proof_a.trade_id = scan.funded->trade_id;
						proof_a.height = receipt.height;
						proof_a.confirmations = head - receipt.height;
						proof_a.timeout_at = trade.timeout_at;
					}
				}
			}
		}
	}
	else
	{
		result = ledger_to_verification (result);
	}
	return result;
}
