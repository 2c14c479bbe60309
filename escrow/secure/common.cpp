#include <escrow/secure/common.hpp>

#include <escrow/crypto_lib/random_pool.hpp>
#include <escrow/lib/utility.hpp>

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

// Create a new random keypair
escrow::keypair::keypair ()
{
	random_pool::generate_block (prv.data.bytes.data (), prv.data.bytes.size ());
	pub = escrow::pub_key (prv.data);
}

// Create a keypair given a private key
escrow::keypair::keypair (escrow::raw_key && prv_a) :
prv (std::move (prv_a))
{
	pub = escrow::pub_key (prv.data);
}

// Create a keypair given a hex string of the private key
escrow::keypair::keypair (std::string const & prv_a)
{
	auto error (prv.data.decode_hex (prv_a));
	release_assert (!error);
	pub = escrow::pub_key (prv.data);
}

std::string escrow::to_string (escrow::trade_state state_a)
{
	std::string result;
	switch (state_a)
	{
		case escrow::trade_state::awaiting_fund:
			result = "AWAITING_FUND";
			break;
		case escrow::trade_state::funded:
			result = "FUNDED";
			break;
		case escrow::trade_state::awaiting_delivery:
			result = "AWAITING_DELIVERY";
			break;
		case escrow::trade_state::complete:
			result = "COMPLETE";
			break;
		case escrow::trade_state::disputed:
			result = "DISPUTED";
			break;
	}
	return result;
}

escrow::trade::trade () :
buyer (0),
seller (0),
amount (0),
state (escrow::trade_state::awaiting_fund),
created_at (0),
timeout_at (0)
{
}

std::string escrow::to_string (escrow::ledger_function function_a)
{
	std::string result ("invalid");
	switch (function_a)
	{
		case escrow::ledger_function::invalid:
			break;
		case escrow::ledger_function::create_and_fund:
			result = "createAndFund";
			break;
		case escrow::ledger_function::create_trade_without_fund:
			result = "createTradeWithoutFund";
			break;
		case escrow::ledger_function::fund_trade:
			result = "fundTrade";
			break;
		case escrow::ledger_function::confirm_delivery:
			result = "confirmDelivery";
			break;
		case escrow::ledger_function::raise_dispute:
			result = "raiseDispute";
			break;
		case escrow::ledger_function::resolve_dispute:
			result = "resolveDispute";
			break;
		case escrow::ledger_function::timeout_refund:
			result = "timeoutRefund";
			break;
		case escrow::ledger_function::update_platform_fee:
			result = "updatePlatformFee";
			break;
		case escrow::ledger_function::update_fee_recipient:
			result = "updateFeeRecipient";
			break;
		case escrow::ledger_function::update_timeout_duration:
			result = "updateTimeoutDuration";
			break;
	}
	return result;
}

escrow::ledger_call::ledger_call () :
from (0),
function (escrow::ledger_function::invalid),
trade_id (0),
party (0),
value (0),
amount (0),
parameter (0),
nonce (0)
{
	signature.clear ();
}

escrow::block_hash escrow::ledger_call::hash () const
{
	escrow::block_hash result;
	blake2b_state hash_l;
	auto status (blake2b_init (&hash_l, sizeof (result.bytes)));
	assert (status == 0);
	hash (hash_l);
	status = blake2b_final (&hash_l, result.bytes.data (), sizeof (result.bytes));
	assert (status == 0);
	(void)status;
	return result;
}

void escrow::ledger_call::hash (blake2b_state & hash_a) const
{
	blake2b_update (&hash_a, from.bytes.data (), sizeof (from.bytes));
	blake2b_update (&hash_a, reinterpret_cast<uint8_t const *> (&function), sizeof (function));
	blake2b_update (&hash_a, reinterpret_cast<uint8_t const *> (&trade_id), sizeof (trade_id));
	blake2b_update (&hash_a, party.bytes.data (), sizeof (party.bytes));
	blake2b_update (&hash_a, value.bytes.data (), sizeof (value.bytes));
	blake2b_update (&hash_a, amount.bytes.data (), sizeof (amount.bytes));
	blake2b_update (&hash_a, reinterpret_cast<uint8_t const *> (&parameter), sizeof (parameter));
	blake2b_update (&hash_a, reinterpret_cast<uint8_t const *> (text.data ()), text.size ());
	blake2b_update (&hash_a, reinterpret_cast<uint8_t const *> (&nonce), sizeof (nonce));
}

void escrow::ledger_call::serialize (escrow::stream & stream_a) const
{
	write (stream_a, from.bytes);
	write (stream_a, function);
	write (stream_a, trade_id);
	write (stream_a, party.bytes);
	write (stream_a, value.bytes);
	write (stream_a, amount.bytes);
	write (stream_a, parameter);
	write (stream_a, text);
	write (stream_a, nonce);
	write (stream_a, signature.bytes);
}

bool escrow::ledger_call::deserialize (escrow::stream & stream_a)
{
	auto error (false);
	try
	{
		read (stream_a, from.bytes);
		read (stream_a, function);
		read (stream_a, trade_id);
		read (stream_a, party.bytes);
		read (stream_a, value.bytes);
		read (stream_a, amount.bytes);
		read (stream_a, parameter);
		read (stream_a, text);
		read (stream_a, nonce);
		read (stream_a, signature.bytes);
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}

void escrow::ledger_call::sign (escrow::raw_key const & prv_a, escrow::public_key const & pub_a)
{
	signature = escrow::sign_message (prv_a, pub_a, hash ());
}

bool escrow::ledger_call::validate_signature () const
{
	return escrow::validate_message (from, hash (), signature);
}

escrow::ledger_call escrow::ledger_call::create_and_fund (escrow::account const & from_a, escrow::account const & seller_a, escrow::amount const & value_a, std::string const & metadata_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::create_and_fund;
	result.party = seller_a;
	result.value = value_a;
	result.text = metadata_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::create_trade_without_fund (escrow::account const & from_a, escrow::account const & seller_a, std::string const & metadata_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::create_trade_without_fund;
	result.party = seller_a;
	result.text = metadata_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::fund_trade (escrow::account const & from_a, uint64_t trade_id_a, escrow::amount const & value_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::fund_trade;
	result.trade_id = trade_id_a;
	result.value = value_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::confirm_delivery (escrow::account const & from_a, uint64_t trade_id_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::confirm_delivery;
	result.trade_id = trade_id_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::raise_dispute (escrow::account const & from_a, uint64_t trade_id_a, std::string const & reason_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::raise_dispute;
	result.trade_id = trade_id_a;
	result.text = reason_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::resolve_dispute (escrow::account const & from_a, uint64_t trade_id_a, escrow::account const & recipient_a, escrow::amount const & amount_a, std::string const & note_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::resolve_dispute;
	result.trade_id = trade_id_a;
	result.party = recipient_a;
	result.amount = amount_a;
	result.text = note_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::timeout_refund (escrow::account const & from_a, uint64_t trade_id_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::timeout_refund;
	result.trade_id = trade_id_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::update_platform_fee (escrow::account const & from_a, uint64_t fee_bps_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::update_platform_fee;
	result.parameter = fee_bps_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::update_fee_recipient (escrow::account const & from_a, escrow::account const & recipient_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::update_fee_recipient;
	result.party = recipient_a;
	return result;
}

escrow::ledger_call escrow::ledger_call::update_timeout_duration (escrow::account const & from_a, uint64_t duration_a)
{
	escrow::ledger_call result;
	result.from = from_a;
	result.function = escrow::ledger_function::update_timeout_duration;
	result.parameter = duration_a;
	return result;
}

namespace
{
class event_trade_id_visitor : public boost::static_visitor<uint64_t>
{
public:
	template <typename T>
	uint64_t operator() (T const & event_a) const
	{
		return event_a.trade_id;
	}
};

class event_name_visitor : public boost::static_visitor<std::string>
{
public:
	std::string operator() (escrow::escrow_created_event const &) const
	{
		return "EscrowCreated";
	}
	std::string operator() (escrow::funded_event const &) const
	{
		return "Funded";
	}
	std::string operator() (escrow::delivery_confirmed_event const &) const
	{
		return "DeliveryConfirmed";
	}
	std::string operator() (escrow::released_event const &) const
	{
		return "Released";
	}
	std::string operator() (escrow::disputed_event const &) const
	{
		return "Disputed";
	}
	std::string operator() (escrow::resolved_event const &) const
	{
		return "Resolved";
	}
	std::string operator() (escrow::timeout_refund_event const &) const
	{
		return "TimeoutRefund";
	}
};

class released_amount_visitor : public boost::static_visitor<escrow::uint128_t>
{
public:
	escrow::uint128_t operator() (escrow::escrow_created_event const &) const
	{
		return 0;
	}
	escrow::uint128_t operator() (escrow::funded_event const &) const
	{
		return 0;
	}
	escrow::uint128_t operator() (escrow::delivery_confirmed_event const &) const
	{
		return 0;
	}
	escrow::uint128_t operator() (escrow::released_event const & event_a) const
	{
		return event_a.amount.number () + event_a.fee.number ();
	}
	escrow::uint128_t operator() (escrow::disputed_event const &) const
	{
		return 0;
	}
	escrow::uint128_t operator() (escrow::resolved_event const & event_a) const
	{
		return event_a.amount.number ();
	}
	escrow::uint128_t operator() (escrow::timeout_refund_event const & event_a) const
	{
		return event_a.amount.number ();
	}
};

class json_visitor : public boost::static_visitor<>
{
public:
	json_visitor (boost::property_tree::ptree & tree_a) :
	tree (tree_a)
	{
	}
	void operator() (escrow::escrow_created_event const & event_a) const
	{
		tree.put ("buyer", event_a.buyer.to_account ());
		tree.put ("seller", event_a.seller.to_account ());
		tree.put ("amount", event_a.amount.to_string_dec ());
		tree.put ("metadata", event_a.metadata);
	}
	void operator() (escrow::funded_event const & event_a) const
	{
		tree.put ("payer", event_a.payer.to_account ());
		tree.put ("amount", event_a.amount.to_string_dec ());
	}
	void operator() (escrow::delivery_confirmed_event const & event_a) const
	{
		tree.put ("confirmer", event_a.confirmer.to_account ());
	}
	void operator() (escrow::released_event const & event_a) const
	{
		tree.put ("to", event_a.to.to_account ());
		tree.put ("amount", event_a.amount.to_string_dec ());
		tree.put ("fee", event_a.fee.to_string_dec ());
	}
	void operator() (escrow::disputed_event const & event_a) const
	{
		tree.put ("by", event_a.by.to_account ());
		tree.put ("reason", event_a.reason);
	}
	void operator() (escrow::resolved_event const & event_a) const
	{
		tree.put ("to", event_a.to.to_account ());
		tree.put ("amount", event_a.amount.to_string_dec ());
		tree.put ("resolution", event_a.resolution);
	}
	void operator() (escrow::timeout_refund_event const & event_a) const
	{
		tree.put ("buyer", event_a.buyer.to_account ());
		tree.put ("amount", event_a.amount.to_string_dec ());
	}
	boost::property_tree::ptree & tree;
};
}

uint64_t escrow::event_trade_id (escrow::ledger_event const & event_a)
{
	return boost::apply_visitor (event_trade_id_visitor (), event_a);
}

std::string escrow::event_name (escrow::ledger_event const & event_a)
{
	return boost::apply_visitor (event_name_visitor (), event_a);
}

escrow::uint128_t escrow::released_amount (escrow::ledger_event const & event_a)
{
	return boost::apply_visitor (released_amount_visitor (), event_a);
}

void escrow::serialize_json (escrow::ledger_event const & event_a, boost::property_tree::ptree & tree_a)
{
	tree_a.put ("event", escrow::event_name (event_a));
	tree_a.put ("trade_id", std::to_string (escrow::event_trade_id (event_a)));
	json_visitor visitor (tree_a);
	boost::apply_visitor (visitor, event_a);
}

std::string escrow::to_string (escrow::process_result result_a)
{
	std::string result;
	switch (result_a)
	{
		case escrow::process_result::progress:
			result = "Progress";
			break;
		case escrow::process_result::bad_signature:
			result = "Bad signature";
			break;
		case escrow::process_result::invalid_seller:
			result = "Invalid seller address";
			break;
		case escrow::process_result::same_party:
			result = "Buyer and seller cannot be same";
			break;
		case escrow::process_result::zero_amount:
			result = "Amount must be greater than 0";
			break;
		case escrow::process_result::unexpected_value:
			result = "Function does not accept value";
			break;
		case escrow::process_result::unknown_trade:
			result = "Trade does not exist";
			break;
		case escrow::process_result::wrong_state:
			result = "Invalid trade state";
			break;
		case escrow::process_result::not_buyer:
			result = "Only buyer allowed";
			break;
		case escrow::process_result::not_party:
			result = "Only trade parties allowed";
			break;
		case escrow::process_result::not_admin:
			result = "Only administrator allowed";
			break;
		case escrow::process_result::not_timed_out:
			result = "Trade not timed out";
			break;
		case escrow::process_result::invalid_recipient:
			result = "Recipient must be buyer or seller";
			break;
		case escrow::process_result::amount_exceeds_trade:
			result = "Amount exceeds trade amount";
			break;
		case escrow::process_result::transfer_failed:
			result = "Transfer failed";
			break;
		case escrow::process_result::insufficient_balance:
			result = "Insufficient balance";
			break;
		case escrow::process_result::fee_too_high:
			result = "Fee cannot exceed 10%";
			break;
		case escrow::process_result::invalid_duration:
			result = "Invalid timeout duration";
			break;
		case escrow::process_result::invalid_fee_recipient:
			result = "Invalid fee recipient";
			break;
		case escrow::process_result::invalid_function:
			result = "Unknown function";
			break;
	}
	return result;
}

escrow::transaction_receipt::transaction_receipt () :
transaction (0),
height (0),
success (false),
result (escrow::process_result::invalid_function),
from (0),
function (escrow::ledger_function::invalid),
value (0)
{
}

std::string escrow::to_string (escrow::record_state state_a)
{
	std::string result;
	switch (state_a)
	{
		case escrow::record_state::awaiting_fund:
			result = "awaiting_fund";
			break;
		case escrow::record_state::pending_verification:
			result = "pending_verification";
			break;
		case escrow::record_state::funded:
			result = "funded";
			break;
		case escrow::record_state::disputed:
			result = "disputed";
			break;
		case escrow::record_state::complete:
			result = "complete";
			break;
	}
	return result;
}

bool escrow::decode_state (std::string const & text_a, escrow::record_state & state_a)
{
	auto error (false);
	if (text_a == "awaiting_fund")
	{
		state_a = escrow::record_state::awaiting_fund;
	}
	else if (text_a == "pending_verification")
	{
		state_a = escrow::record_state::pending_verification;
	}
	else if (text_a == "funded")
	{
		state_a = escrow::record_state::funded;
	}
	else if (text_a == "disputed")
	{
		state_a = escrow::record_state::disputed;
	}
	else if (text_a == "complete")
	{
		state_a = escrow::record_state::complete;
	}
	else
	{
		error = true;
	}
	return error;
}

bool escrow::is_forward (escrow::record_state from_a, escrow::record_state to_a)
{
	auto result (from_a != escrow::record_state::complete && static_cast<uint8_t> (to_a) >= static_cast<uint8_t> (from_a));
	return result;
}

std::string escrow::to_string (escrow::resolution_outcome outcome_a)
{
	std::string result;
	switch (outcome_a)
	{
		case escrow::resolution_outcome::refund_to_buyer:
			result = "refund_to_buyer";
			break;
		case escrow::resolution_outcome::payout_to_seller:
			result = "payout_to_seller";
			break;
		case escrow::resolution_outcome::partial_split:
			result = "partial_split";
			break;
	}
	return result;
}

bool escrow::decode_outcome (std::string const & text_a, escrow::resolution_outcome & outcome_a)
{
	auto error (false);
	if (text_a == "refund_to_buyer")
	{
		outcome_a = escrow::resolution_outcome::refund_to_buyer;
	}
	else if (text_a == "payout_to_seller")
	{
		outcome_a = escrow::resolution_outcome::payout_to_seller;
	}
	else if (text_a == "partial_split")
	{
		outcome_a = escrow::resolution_outcome::partial_split;
	}
	else
	{
		error = true;
	}
	return error;
}

escrow::dispute_resolution::dispute_resolution () :
outcome (escrow::resolution_outcome::refund_to_buyer),
recipient (0),
amount (0),
transaction (0)
{
}

void escrow::dispute_resolution::serialize (escrow::stream & stream_a) const
{
	write (stream_a, outcome);
	write (stream_a, recipient.bytes);
	write (stream_a, amount.bytes);
	write (stream_a, note);
	write (stream_a, transaction.bytes);
}

bool escrow::dispute_resolution::deserialize (escrow::stream & stream_a)
{
	auto error (false);
	try
	{
		read (stream_a, outcome);
		read (stream_a, recipient.bytes);
		read (stream_a, amount.bytes);
		read (stream_a, note);
		read (stream_a, transaction.bytes);
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}

void escrow::dispute_resolution::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("outcome", escrow::to_string (outcome));
	tree_a.put ("recipient", recipient.to_account ());
	tree_a.put ("amount", amount.to_string_dec ());
	tree_a.put ("note", note);
	tree_a.put ("transaction", transaction.to_string ());
}

escrow::agreement::agreement () :
agreement_id (0),
buyer_id (0),
seller_id (0),
buyer_account (0),
seller_account (0),
amount (0)
{
}

escrow::record::record () :
id (0),
agreement_id (0),
buyer_id (0),
seller_id (0),
buyer_account (0),
seller_account (0),
payer (0),
amount (0),
custodial (false),
verification_attempts (0),
state (escrow::record_state::awaiting_fund),
provisional (false),
halted (false),
created_at (0),
funded_at (0),
disputed_at (0),
completed_at (0),
timeout_at (0)
{
}

void escrow::record::serialize (escrow::stream & stream_a) const
{
	write (stream_a, id);
	write (stream_a, agreement_id);
	write (stream_a, buyer_id);
	write (stream_a, seller_id);
	write (stream_a, buyer_account.bytes);
	write (stream_a, seller_account.bytes);
	write (stream_a, payer.bytes);
	write (stream_a, amount.bytes);
	write (stream_a, static_cast<uint8_t> (trade_id.is_initialized ()));
	if (trade_id)
	{
		write (stream_a, *trade_id);
	}
	write (stream_a, static_cast<uint8_t> (funding_transaction.is_initialized ()));
	if (funding_transaction)
	{
		write (stream_a, funding_transaction->bytes);
	}
	write (stream_a, static_cast<uint8_t> (custodial));
	write (stream_a, verification_attempts);
	write (stream_a, state);
	write (stream_a, static_cast<uint8_t> (provisional));
	write (stream_a, static_cast<uint8_t> (halted));
	write (stream_a, metadata);
	write (stream_a, dispute_reason);
	write (stream_a, static_cast<uint8_t> (resolution.is_initialized ()));
	if (resolution)
	{
		resolution->serialize (stream_a);
	}
	write (stream_a, created_at);
	write (stream_a, funded_at);
	write (stream_a, disputed_at);
	write (stream_a, completed_at);
	write (stream_a, timeout_at);
}

bool escrow::record::deserialize (escrow::stream & stream_a)
{
	auto error (false);
	try
	{
		read (stream_a, id);
		read (stream_a, agreement_id);
		read (stream_a, buyer_id);
		read (stream_a, seller_id);
		read (stream_a, buyer_account.bytes);
		read (stream_a, seller_account.bytes);
		read (stream_a, payer.bytes);
		read (stream_a, amount.bytes);
		uint8_t flag;
		read (stream_a, flag);
		trade_id = boost::none;
		if (flag != 0)
		{
			uint64_t trade_id_l;
			read (stream_a, trade_id_l);
			trade_id = trade_id_l;
		}
		read (stream_a, flag);
		funding_transaction = boost::none;
		if (flag != 0)
		{
			escrow::block_hash transaction_l;
			read (stream_a, transaction_l.bytes);
			funding_transaction = transaction_l;
		}
		read (stream_a, flag);
		custodial = flag != 0;
		read (stream_a, verification_attempts);
		read (stream_a, state);
		read (stream_a, flag);
		provisional = flag != 0;
		read (stream_a, flag);
		halted = flag != 0;
		read (stream_a, metadata);
		read (stream_a, dispute_reason);
		read (stream_a, flag);
		resolution = boost::none;
		if (flag != 0)
		{
			escrow::dispute_resolution resolution_l;
			error = resolution_l.deserialize (stream_a);
			resolution = resolution_l;
		}
		if (!error)
		{
			read (stream_a, created_at);
			read (stream_a, funded_at);
			read (stream_a, disputed_at);
			read (stream_a, completed_at);
			read (stream_a, timeout_at);
		}
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}

void escrow::record::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("id", std::to_string (id));
	tree_a.put ("agreement_id", std::to_string (agreement_id));
	tree_a.put ("buyer_id", std::to_string (buyer_id));
	tree_a.put ("seller_id", std::to_string (seller_id));
	tree_a.put ("buyer_account", buyer_account.to_account ());
	tree_a.put ("seller_account", seller_account.to_account ());
	tree_a.put ("payer", payer.to_account ());
	tree_a.put ("amount", amount.to_string_dec ());
	tree_a.put ("state", escrow::to_string (state));
	if (trade_id)
	{
		tree_a.put ("trade_id", std::to_string (*trade_id));
	}
	if (funding_transaction)
	{
		tree_a.put ("funding_transaction", funding_transaction->to_string ());
	}
	tree_a.put ("custodial", custodial ? "true" : "false");
	tree_a.put ("verification_attempts", std::to_string (verification_attempts));
	tree_a.put ("provisional", provisional ? "true" : "false");
	tree_a.put ("halted", halted ? "true" : "false");
	tree_a.put ("metadata", metadata);
	if (!dispute_reason.empty ())
	{
		tree_a.put ("dispute_reason", dispute_reason);
	}
	if (resolution)
	{
		boost::property_tree::ptree resolution_l;
		resolution->serialize_json (resolution_l);
		tree_a.add_child ("resolution", resolution_l);
	}
	tree_a.put ("created_at", std::to_string (created_at));
	tree_a.put ("funded_at", std::to_string (funded_at));
	tree_a.put ("disputed_at", std::to_string (disputed_at));
	tree_a.put ("completed_at", std::to_string (completed_at));
	tree_a.put ("timeout_at", std::to_string (timeout_at));
}

bool escrow::record::operator== (escrow::record const & other_a) const
{
	std::vector<uint8_t> bytes1;
	std::vector<uint8_t> bytes2;
	{
		escrow::vectorstream stream1 (bytes1);
		serialize (stream1);
		escrow::vectorstream stream2 (bytes2);
		other_a.serialize (stream2);
	}
	return bytes1 == bytes2;
}

std::string escrow::to_string (escrow::event_cause cause_a)
{
	std::string result;
	switch (cause_a)
	{
		case escrow::event_cause::ledger:
			result = "ledger";
			break;
		case escrow::event_cause::administrative:
			result = "administrative";
			break;
		case escrow::event_cause::funding:
			result = "funding";
			break;
	}
	return result;
}

std::string escrow::to_string (escrow::record_event_type type_a)
{
	std::string result;
	switch (type_a)
	{
		case escrow::record_event_type::created:
			result = "created";
			break;
		case escrow::record_event_type::funding_submitted:
			result = "funding_submitted";
			break;
		case escrow::record_event_type::verification_failed:
			result = "verification_failed";
			break;
		case escrow::record_event_type::funded:
			result = "funded";
			break;
		case escrow::record_event_type::escrow_created:
			result = "escrow_created";
			break;
		case escrow::record_event_type::delivery_confirmed:
			result = "delivery_confirmed";
			break;
		case escrow::record_event_type::released:
			result = "released";
			break;
		case escrow::record_event_type::disputed:
			result = "disputed";
			break;
		case escrow::record_event_type::resolution_submitted:
			result = "resolution_submitted";
			break;
		case escrow::record_event_type::resolved:
			result = "resolved";
			break;
		case escrow::record_event_type::timeout_refund:
			result = "timeout_refund";
			break;
		case escrow::record_event_type::consistency_failure:
			result = "consistency_failure";
			break;
	}
	return result;
}

escrow::record_event::record_event () :
escrow_id (0),
sequence (0),
type (escrow::record_event_type::created),
cause (escrow::event_cause::administrative),
trust_reduced (false),
timestamp (0),
transaction (0),
log_index (0),
height (0)
{
}

void escrow::record_event::serialize (escrow::stream & stream_a) const
{
	write (stream_a, escrow_id);
	write (stream_a, sequence);
	write (stream_a, type);
	write (stream_a, cause);
	write (stream_a, static_cast<uint8_t> (trust_reduced));
	write (stream_a, timestamp);
	write (stream_a, payload);
	write (stream_a, transaction.bytes);
	write (stream_a, log_index);
	write (stream_a, height);
}

bool escrow::record_event::deserialize (escrow::stream & stream_a)
{
	auto error (false);
	try
	{
		read (stream_a, escrow_id);
		read (stream_a, sequence);
		read (stream_a, type);
		read (stream_a, cause);
		uint8_t trust_reduced_l;
		read (stream_a, trust_reduced_l);
		trust_reduced = trust_reduced_l != 0;
		read (stream_a, timestamp);
		read (stream_a, payload);
		read (stream_a, transaction.bytes);
		read (stream_a, log_index);
		read (stream_a, height);
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}

void escrow::record_event::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("escrow_id", std::to_string (escrow_id));
	tree_a.put ("sequence", std::to_string (sequence));
	tree_a.put ("type", escrow::to_string (type));
	tree_a.put ("cause", escrow::to_string (cause));
	tree_a.put ("trust_reduced", trust_reduced ? "true" : "false");
	tree_a.put ("timestamp", std::to_string (timestamp));
	if (cause == escrow::event_cause::ledger)
	{
		tree_a.put ("transaction", transaction.to_string ());
		tree_a.put ("log_index", std::to_string (log_index));
		tree_a.put ("height", std::to_string (height));
	}
	boost::property_tree::ptree payload_l;
	if (!payload.empty ())
	{
		std::stringstream stream (payload);
		try
		{
			boost::property_tree::read_json (stream, payload_l);
		}
		catch (boost::property_tree::json_parser_error const &)
		{
			payload_l.put ("raw", payload);
		}
	}
	tree_a.add_child ("payload", payload_l);
}

void escrow::permissions::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("can_be_funded", can_be_funded ? "true" : "false");
	tree_a.put ("can_confirm_delivery", can_confirm_delivery ? "true" : "false");
	tree_a.put ("can_raise_dispute", can_raise_dispute ? "true" : "false");
	tree_a.put ("can_timeout_refund", can_timeout_refund ? "true" : "false");
}

escrow::permissions escrow::compute_permissions (escrow::record const & record_a, uint64_t actor_a, uint64_t now_a)
{
	escrow::permissions result;
	if (!record_a.halted)
	{
		auto is_buyer (actor_a == record_a.buyer_id);
		auto is_party (is_buyer || actor_a == record_a.seller_id);
		auto funded (record_a.state == escrow::record_state::funded);
		result.can_be_funded = is_buyer && record_a.state == escrow::record_state::awaiting_fund;
		result.can_confirm_delivery = is_party && funded;
		result.can_raise_dispute = is_party && funded;
		result.can_timeout_refund = funded && record_a.timeout_at != 0 && now_a >= record_a.timeout_at;
	}
	return result;
}
