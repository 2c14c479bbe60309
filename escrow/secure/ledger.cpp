#include <escrow/secure/ledger.hpp>

uint64_t constexpr escrow::ledger::default_fee_bps;
uint64_t constexpr escrow::ledger::max_fee_bps;
uint64_t constexpr escrow::ledger::basis_points;
uint64_t constexpr escrow::ledger::default_timeout;
uint64_t constexpr escrow::ledger::min_timeout;
uint64_t constexpr escrow::ledger::max_timeout;

namespace escrow
{
/**
 * Roll forward a single call. Every check sets result.code and later steps only run on progress,
 * so a reverted call leaves the ledger untouched.
 */
class ledger_processor
{
public:
	ledger_processor (escrow::ledger &, uint64_t);
	void process (escrow::ledger_call const &);
	void create_and_fund (escrow::ledger_call const &);
	void create_trade_without_fund (escrow::ledger_call const &);
	void fund_trade (escrow::ledger_call const &);
	void confirm_delivery (escrow::ledger_call const &);
	void raise_dispute (escrow::ledger_call const &);
	void resolve_dispute (escrow::ledger_call const &);
	void timeout_refund (escrow::ledger_call const &);
	void update_platform_fee (escrow::ledger_call const &);
	void update_fee_recipient (escrow::ledger_call const &);
	void update_timeout_duration (escrow::ledger_call const &);
	escrow::ledger & ledger;
	uint64_t now;
	escrow::process_return result;

private:
	void validate_creation (escrow::ledger_call const &);
	escrow::trade * existing_trade (uint64_t);
};
}

escrow::ledger_processor::ledger_processor (escrow::ledger & ledger_a, uint64_t now_a) :
ledger (ledger_a),
now (now_a)
{
	result.code = escrow::process_result::progress;
	result.trade_id = 0;
}

void escrow::ledger_processor::process (escrow::ledger_call const & call_a)
{
	switch (call_a.function)
	{
		case escrow::ledger_function::create_and_fund:
			create_and_fund (call_a);
			break;
		case escrow::ledger_function::create_trade_without_fund:
			create_trade_without_fund (call_a);
			break;
		case escrow::ledger_function::fund_trade:
			fund_trade (call_a);
			break;
		case escrow::ledger_function::confirm_delivery:
			confirm_delivery (call_a);
			break;
		case escrow::ledger_function::raise_dispute:
			raise_dispute (call_a);
			break;
		case escrow::ledger_function::resolve_dispute:
			resolve_dispute (call_a);
			break;
		case escrow::ledger_function::timeout_refund:
			timeout_refund (call_a);
			break;
		case escrow::ledger_function::update_platform_fee:
			update_platform_fee (call_a);
			break;
		case escrow::ledger_function::update_fee_recipient:
			update_fee_recipient (call_a);
			break;
		case escrow::ledger_function::update_timeout_duration:
			update_timeout_duration (call_a);
			break;
		case escrow::ledger_function::invalid:
			result.code = escrow::process_result::invalid_function;
			break;
	}
	if (result.code != escrow::process_result::progress)
	{
		result.events.clear ();
	}
}

escrow::trade * escrow::ledger_processor::existing_trade (uint64_t trade_id_a)
{
	escrow::trade * trade (nullptr);
	if (trade_id_a < ledger.trades.size ())
	{
		trade = &ledger.trades[trade_id_a];
	}
	result.code = trade != nullptr ? escrow::process_result::progress : escrow::process_result::unknown_trade;
	return trade;
}

void escrow::ledger_processor::validate_creation (escrow::ledger_call const & call_a)
{
	result.code = call_a.party.is_zero () ? escrow::process_result::invalid_seller : escrow::process_result::progress; // Seller must be a real account
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.party == call_a.from ? escrow::process_result::same_party : escrow::process_result::progress; // A trade needs two parties
	}
}

void escrow::ledger_processor::create_and_fund (escrow::ledger_call const & call_a)
{
	validate_creation (call_a);
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.value.is_zero () ? escrow::process_result::zero_amount : escrow::process_result::progress;
		if (result.code == escrow::process_result::progress)
		{
			result.code = ledger.balance (call_a.from) < call_a.value.number () ? escrow::process_result::insufficient_balance : escrow::process_result::progress;
			if (result.code == escrow::process_result::progress)
			{
				ledger.debit (call_a.from, call_a.value.number ());
				escrow::trade trade;
				trade.buyer = call_a.from;
				trade.seller = call_a.party;
				trade.amount = call_a.value;
				trade.state = escrow::trade_state::funded;
				trade.created_at = now;
				trade.timeout_at = now + ledger.timeout_duration;
				trade.metadata = call_a.text;
				result.trade_id = ledger.trades.size ();
				ledger.trades.push_back (trade);
				result.events.push_back (escrow::escrow_created_event{ result.trade_id, trade.buyer, trade.seller, trade.amount, trade.metadata });
				result.events.push_back (escrow::funded_event{ result.trade_id, trade.buyer, trade.amount });
			}
		}
	}
}

void escrow::ledger_processor::create_trade_without_fund (escrow::ledger_call const & call_a)
{
	validate_creation (call_a);
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.value.is_zero () ? escrow::process_result::progress : escrow::process_result::unexpected_value;
		if (result.code == escrow::process_result::progress)
		{
			escrow::trade trade;
			trade.buyer = call_a.from;
			trade.seller = call_a.party;
			trade.state = escrow::trade_state::awaiting_fund;
			trade.created_at = now;
			trade.metadata = call_a.text;
			result.trade_id = ledger.trades.size ();
			ledger.trades.push_back (trade);
			result.events.push_back (escrow::escrow_created_event{ result.trade_id, trade.buyer, trade.seller, trade.amount, trade.metadata });
		}
	}
}

void escrow::ledger_processor::fund_trade (escrow::ledger_call const & call_a)
{
	auto trade (existing_trade (call_a.trade_id));
	if (result.code == escrow::process_result::progress)
	{
		result.code = trade->buyer == call_a.from ? escrow::process_result::progress : escrow::process_result::not_buyer;
		if (result.code == escrow::process_result::progress)
		{
			result.code = trade->state == escrow::trade_state::awaiting_fund ? escrow::process_result::progress : escrow::process_result::wrong_state;
			if (result.code == escrow::process_result::progress)
			{
				result.code = call_a.value.is_zero () ? escrow::process_result::zero_amount : escrow::process_result::progress;
				if (result.code == escrow::process_result::progress)
				{
					result.code = ledger.balance (call_a.from) < call_a.value.number () ? escrow::process_result::insufficient_balance : escrow::process_result::progress;
					if (result.code == escrow::process_result::progress)
					{
						ledger.debit (call_a.from, call_a.value.number ());
						trade->amount = call_a.value;
						trade->state = escrow::trade_state::funded;
						trade->timeout_at = now + ledger.timeout_duration;
						result.trade_id = call_a.trade_id;
						result.events.push_back (escrow::funded_event{ call_a.trade_id, call_a.from, call_a.value });
					}
				}
			}
		}
	}
}

void escrow::ledger_processor::confirm_delivery (escrow::ledger_call const & call_a)
{
	auto trade (existing_trade (call_a.trade_id));
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.value.is_zero () ? escrow::process_result::progress : escrow::process_result::unexpected_value;
		if (result.code == escrow::process_result::progress)
		{
			result.code = (call_a.from == trade->buyer || call_a.from == trade->seller) ? escrow::process_result::progress : escrow::process_result::not_party;
			if (result.code == escrow::process_result::progress)
			{
				result.code = trade->state == escrow::trade_state::funded ? escrow::process_result::progress : escrow::process_result::wrong_state;
				if (result.code == escrow::process_result::progress)
				{
					auto amount (trade->amount.number ());
					escrow::uint128_t fee (amount * ledger.fee_bps / escrow::ledger::basis_points);
					escrow::uint128_t payout (amount - fee);
					std::vector<std::pair<escrow::account, escrow::uint128_t>> transfers;
					transfers.emplace_back (trade->seller, payout);
					if (!fee.is_zero ())
					{
						transfers.emplace_back (ledger.fee_recipient, fee);
					}
					result.code = ledger.transfer (transfers) ? escrow::process_result::transfer_failed : escrow::process_result::progress; // Seller and fee recipient are paid together or not at all
					if (result.code == escrow::process_result::progress)
					{
						trade->state = escrow::trade_state::complete;
						result.trade_id = call_a.trade_id;
						result.events.push_back (escrow::delivery_confirmed_event{ call_a.trade_id, call_a.from });
						result.events.push_back (escrow::released_event{ call_a.trade_id, trade->seller, payout, fee });
					}
				}
			}
		}
	}
}

void escrow::ledger_processor::raise_dispute (escrow::ledger_call const & call_a)
{
	auto trade (existing_trade (call_a.trade_id));
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.value.is_zero () ? escrow::process_result::progress : escrow::process_result::unexpected_value;
		if (result.code == escrow::process_result::progress)
		{
			result.code = (call_a.from == trade->buyer || call_a.from == trade->seller) ? escrow::process_result::progress : escrow::process_result::not_party;
			if (result.code == escrow::process_result::progress)
			{
				result.code = trade->state == escrow::trade_state::funded ? escrow::process_result::progress : escrow::process_result::wrong_state;
				if (result.code == escrow::process_result::progress)
				{
					trade->state = escrow::trade_state::disputed;
					result.trade_id = call_a.trade_id;
					result.events.push_back (escrow::disputed_event{ call_a.trade_id, call_a.from, call_a.text });
				}
			}
		}
	}
}

void escrow::ledger_processor::resolve_dispute (escrow::ledger_call const & call_a)
{
	result.code = call_a.from == ledger.admin ? escrow::process_result::progress : escrow::process_result::not_admin;
	if (result.code == escrow::process_result::progress)
	{
		auto trade (existing_trade (call_a.trade_id));
		if (result.code == escrow::process_result::progress)
		{
			result.code = call_a.value.is_zero () ? escrow::process_result::progress : escrow::process_result::unexpected_value;
			if (result.code == escrow::process_result::progress)
			{
				result.code = trade->state == escrow::trade_state::disputed ? escrow::process_result::progress : escrow::process_result::wrong_state;
				if (result.code == escrow::process_result::progress)
				{
					result.code = (call_a.party == trade->buyer || call_a.party == trade->seller) ? escrow::process_result::progress : escrow::process_result::invalid_recipient;
					if (result.code == escrow::process_result::progress)
					{
						result.code = call_a.amount.number () <= trade->amount.number () ? escrow::process_result::progress : escrow::process_result::amount_exceeds_trade;
						if (result.code == escrow::process_result::progress)
						{
							auto other (call_a.party == trade->buyer ? trade->seller : trade->buyer);
							escrow::uint128_t remainder (trade->amount.number () - call_a.amount.number ());
							std::vector<std::pair<escrow::account, escrow::uint128_t>> transfers;
							if (!call_a.amount.is_zero ())
							{
								transfers.emplace_back (call_a.party, call_a.amount.number ());
							}
							if (!remainder.is_zero ())
							{
								transfers.emplace_back (other, remainder);
							}
							result.code = ledger.transfer (transfers) ? escrow::process_result::transfer_failed : escrow::process_result::progress;
							if (result.code == escrow::process_result::progress)
							{
								trade->state = escrow::trade_state::complete;
								result.trade_id = call_a.trade_id;
								result.events.push_back (escrow::resolved_event{ call_a.trade_id, call_a.party, call_a.amount, call_a.text });
								if (!remainder.is_zero ())
								{
									result.events.push_back (escrow::resolved_event{ call_a.trade_id, other, remainder, call_a.text });
								}
							}
						}
					}
				}
			}
		}
	}
}

void escrow::ledger_processor::timeout_refund (escrow::ledger_call const & call_a)
{
	auto trade (existing_trade (call_a.trade_id));
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.value.is_zero () ? escrow::process_result::progress : escrow::process_result::unexpected_value;
		if (result.code == escrow::process_result::progress)
		{
			result.code = trade->state == escrow::trade_state::funded ? escrow::process_result::progress : escrow::process_result::wrong_state;
			if (result.code == escrow::process_result::progress)
			{
				result.code = now >= trade->timeout_at ? escrow::process_result::progress : escrow::process_result::not_timed_out;
				if (result.code == escrow::process_result::progress)
				{
					std::vector<std::pair<escrow::account, escrow::uint128_t>> transfers;
					transfers.emplace_back (trade->buyer, trade->amount.number ());
					result.code = ledger.transfer (transfers) ? escrow::process_result::transfer_failed : escrow::process_result::progress;
					if (result.code == escrow::process_result::progress)
					{
						trade->state = escrow::trade_state::complete;
						result.trade_id = call_a.trade_id;
						result.events.push_back (escrow::timeout_refund_event{ call_a.trade_id, trade->buyer, trade->amount });
					}
				}
			}
		}
	}
}

void escrow::ledger_processor::update_platform_fee (escrow::ledger_call const & call_a)
{
	result.code = call_a.from == ledger.admin ? escrow::process_result::progress : escrow::process_result::not_admin;
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.parameter <= escrow::ledger::max_fee_bps ? escrow::process_result::progress : escrow::process_result::fee_too_high;
		if (result.code == escrow::process_result::progress)
		{
			ledger.fee_bps = call_a.parameter;
		}
	}
}

void escrow::ledger_processor::update_fee_recipient (escrow::ledger_call const & call_a)
{
	result.code = call_a.from == ledger.admin ? escrow::process_result::progress : escrow::process_result::not_admin;
	if (result.code == escrow::process_result::progress)
	{
		result.code = call_a.party.is_zero () ? escrow::process_result::invalid_fee_recipient : escrow::process_result::progress;
		if (result.code == escrow::process_result::progress)
		{
			ledger.fee_recipient = call_a.party;
		}
	}
}

void escrow::ledger_processor::update_timeout_duration (escrow::ledger_call const & call_a)
{
	result.code = call_a.from == ledger.admin ? escrow::process_result::progress : escrow::process_result::not_admin;
	if (result.code == escrow::process_result::progress)
	{
		auto valid (call_a.parameter >= escrow::ledger::min_timeout && call_a.parameter <= escrow::ledger::max_timeout);
		result.code = valid ? escrow::process_result::progress : escrow::process_result::invalid_duration;
		if (result.code == escrow::process_result::progress)
		{
			ledger.timeout_duration = call_a.parameter;
		}
	}
}

escrow::ledger::ledger (escrow::account const & admin_a, escrow::account const & fee_recipient_a) :
admin (admin_a),
fee_recipient (fee_recipient_a),
fee_bps (default_fee_bps),
timeout_duration (default_timeout),
held (0)
{
}

escrow::process_return escrow::ledger::process (escrow::ledger_call const & call_a, uint64_t now_a)
{
	escrow::ledger_processor processor (*this, now_a);
	processor.process (call_a);
	return processor.result;
}

bool escrow::ledger::trade_get (uint64_t trade_id_a, escrow::trade & trade_a) const
{
	auto error (trade_id_a >= trades.size ());
	if (!error)
	{
		trade_a = trades[trade_id_a];
	}
	return error;
}

uint64_t escrow::ledger::trade_count () const
{
	return trades.size ();
}

escrow::uint128_t escrow::ledger::custody () const
{
	return held;
}

escrow::uint128_t escrow::ledger::balance (escrow::account const & account_a) const
{
	escrow::uint128_t result (0);
	auto existing (balances.find (account_a));
	if (existing != balances.end ())
	{
		result = existing->second;
	}
	return result;
}

void escrow::ledger::credit (escrow::account const & account_a, escrow::uint128_t const & amount_a)
{
	balances[account_a] += amount_a;
}

void escrow::ledger::reject_transfers (escrow::account const & account_a, bool reject_a)
{
	if (reject_a)
	{
		rejecting.insert (account_a);
	}
	else
	{
		rejecting.erase (account_a);
	}
}

void escrow::ledger::debit (escrow::account const & account_a, escrow::uint128_t const & amount_a)
{
	auto & balance_l (balances[account_a]);
	assert (balance_l >= amount_a);
	balance_l -= amount_a;
	held += amount_a;
}

bool escrow::ledger::transfer (std::vector<std::pair<escrow::account, escrow::uint128_t>> const & transfers_a)
{
	escrow::uint128_t total (0);
	auto error (false);
	for (auto i (transfers_a.begin ()), n (transfers_a.end ()); i != n && !error; ++i)
	{
		error = rejecting.find (i->first) != rejecting.end ();
		total += i->second;
	}
	if (!error)
	{
		error = total > held;
		if (!error)
		{
			for (auto & transfer_l : transfers_a)
			{
				balances[transfer_l.first] += transfer_l.second;
			}
			held -= total;
		}
	}
	return error;
}
