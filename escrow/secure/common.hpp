#pragma once

#include <escrow/lib/numbers.hpp>
#include <escrow/lib/stream.hpp>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/variant.hpp>

#include <blake2.h>

#include <string>
#include <vector>

namespace escrow
{
/**
 * A key pair. The private key is generated from the random pool, or passed in
 * as a hex string. The public key is derived using ed25519.
 */
class keypair
{
public:
	keypair ();
	keypair (std::string const &);
	keypair (escrow::raw_key &&);
	escrow::public_key pub;
	escrow::raw_key prv;
};

/** Trade states as numbered by the ledger contract */
enum class trade_state : uint8_t
{
	awaiting_fund = 0,
	funded = 1,
	// Declared by the contract, no transitions lead into or out of it
	awaiting_delivery = 2,
	complete = 3,
	disputed = 4
};
std::string to_string (escrow::trade_state);

/**
 * One ledger tracked escrow instance, owned by the contract
 */
class trade final
{
public:
	trade ();
	escrow::account buyer;
	escrow::account seller;
	escrow::amount amount;
	escrow::trade_state state;
	uint64_t created_at;
	uint64_t timeout_at;
	std::string metadata;
};

/** Contract entry points, named on the wire by to_string */
enum class ledger_function : uint8_t
{
	invalid = 0,
	create_and_fund = 1,
	create_trade_without_fund = 2,
	fund_trade = 3,
	confirm_delivery = 4,
	raise_dispute = 5,
	resolve_dispute = 6,
	timeout_refund = 7,
	update_platform_fee = 8,
	update_fee_recipient = 9,
	update_timeout_duration = 10
};
std::string to_string (escrow::ledger_function);

/**
 * A signed invocation of a contract entry point
 */
class ledger_call final
{
public:
	ledger_call ();
	// Digest of every field except the signature
	escrow::block_hash hash () const;
	void hash (blake2b_state &) const;
	void serialize (escrow::stream &) const;
	bool deserialize (escrow::stream &);
	void sign (escrow::raw_key const &, escrow::public_key const &);
	// Returns true if the signature does not match `from'
	bool validate_signature () const;
	static escrow::ledger_call create_and_fund (escrow::account const &, escrow::account const &, escrow::amount const &, std::string const &);
	static escrow::ledger_call create_trade_without_fund (escrow::account const &, escrow::account const &, std::string const &);
	static escrow::ledger_call fund_trade (escrow::account const &, uint64_t, escrow::amount const &);
	static escrow::ledger_call confirm_delivery (escrow::account const &, uint64_t);
	static escrow::ledger_call raise_dispute (escrow::account const &, uint64_t, std::string const &);
	static escrow::ledger_call resolve_dispute (escrow::account const &, uint64_t, escrow::account const &, escrow::amount const &, std::string const &);
	static escrow::ledger_call timeout_refund (escrow::account const &, uint64_t);
	static escrow::ledger_call update_platform_fee (escrow::account const &, uint64_t);
	static escrow::ledger_call update_fee_recipient (escrow::account const &, escrow::account const &);
	static escrow::ledger_call update_timeout_duration (escrow::account const &, uint64_t);
	escrow::account from;
	escrow::ledger_function function;
	uint64_t trade_id;
	// Seller for creation calls, recipient for dispute resolution and fee recipient updates
	escrow::account party;
	// Value attached to payable calls
	escrow::amount value;
	// Amount paid to `party' by a dispute resolution
	escrow::amount amount;
	// Fee basis points or timeout duration in seconds
	uint64_t parameter;
	// Metadata, dispute reason or resolution note
	std::string text;
	uint64_t nonce;
	escrow::signature signature;
};

class escrow_created_event final
{
public:
	uint64_t trade_id;
	escrow::account buyer;
	escrow::account seller;
	escrow::amount amount;
	std::string metadata;
};
class funded_event final
{
public:
	uint64_t trade_id;
	escrow::account payer;
	escrow::amount amount;
};
class delivery_confirmed_event final
{
public:
	uint64_t trade_id;
	escrow::account confirmer;
};
class released_event final
{
public:
	uint64_t trade_id;
	escrow::account to;
	escrow::amount amount;
	escrow::amount fee;
};
class disputed_event final
{
public:
	uint64_t trade_id;
	escrow::account by;
	std::string reason;
};
class resolved_event final
{
public:
	uint64_t trade_id;
	escrow::account to;
	escrow::amount amount;
	std::string resolution;
};
class timeout_refund_event final
{
public:
	uint64_t trade_id;
	escrow::account buyer;
	escrow::amount amount;
};

/**
 * Closed set of events emitted by the contract. Handlers visit with a boost::static_visitor
 * so every alternative must be handled.
 */
using ledger_event = boost::variant<escrow::escrow_created_event, escrow::funded_event, escrow::delivery_confirmed_event, escrow::released_event, escrow::disputed_event, escrow::resolved_event, escrow::timeout_refund_event>;

uint64_t event_trade_id (escrow::ledger_event const &);
std::string event_name (escrow::ledger_event const &);
/** Value leaving contract custody because of this event */
escrow::uint128_t released_amount (escrow::ledger_event const &);
void serialize_json (escrow::ledger_event const &, boost::property_tree::ptree &);

/** An emitted event with its position in the ledger */
class ledger_log final
{
public:
	uint64_t height;
	escrow::block_hash transaction;
	uint32_t index;
	escrow::ledger_event event;
};

enum class process_result : uint8_t
{
	progress, // Call executed
	bad_signature, // Signature does not match the caller
	invalid_seller, // Seller is the null account
	same_party, // Buyer and seller are the same account
	zero_amount, // Payable call without value
	unexpected_value, // Value attached to a call which doesn't accept it
	unknown_trade, // Trade id was never assigned
	wrong_state, // Trade is not in the state required by the call
	not_buyer, // Caller must be the trade's buyer
	not_party, // Caller must be the trade's buyer or seller
	not_admin, // Caller must be the contract administrator
	not_timed_out, // Trade timeout has not elapsed
	invalid_recipient, // Resolution recipient is neither buyer nor seller
	amount_exceeds_trade, // Resolution amount is more than the trade holds
	transfer_failed, // A payout recipient rejected the transfer
	insufficient_balance, // Caller can't cover the attached value
	fee_too_high, // Fee above the hard ceiling
	invalid_duration, // Timeout duration out of bounds
	invalid_fee_recipient, // Fee recipient is the null account
	invalid_function // Unknown entry point
};
std::string to_string (escrow::process_result);

class process_return final
{
public:
	escrow::process_result code;
	uint64_t trade_id;
	std::vector<escrow::ledger_event> events;
};

/** Outcome of an included ledger call */
class transaction_receipt final
{
public:
	transaction_receipt ();
	escrow::block_hash transaction;
	uint64_t height;
	bool success;
	escrow::process_result result;
	escrow::account from;
	escrow::ledger_function function;
	escrow::amount value;
	std::vector<escrow::ledger_log> logs;
};

/**
 * Local mirror states. pending_verification is local only and sits between awaiting_fund and funded.
 * The numeric order is the forward order of the lifecycle.
 */
enum class record_state : uint8_t
{
	awaiting_fund = 0,
	pending_verification = 1,
	funded = 2,
	disputed = 3,
	complete = 4
};
std::string to_string (escrow::record_state);
bool decode_state (std::string const &, escrow::record_state &);
/** Returns true if a record may move from the first state to the second */
bool is_forward (escrow::record_state, escrow::record_state);

enum class resolution_outcome : uint8_t
{
	refund_to_buyer = 0,
	payout_to_seller = 1,
	partial_split = 2
};
std::string to_string (escrow::resolution_outcome);
bool decode_outcome (std::string const &, escrow::resolution_outcome &);

/** An administrator's dispute decision as submitted to the ledger */
class dispute_resolution final
{
public:
	dispute_resolution ();
	void serialize (escrow::stream &) const;
	bool deserialize (escrow::stream &);
	void serialize_json (boost::property_tree::ptree &) const;
	escrow::resolution_outcome outcome;
	escrow::account recipient;
	escrow::amount amount;
	std::string note;
	escrow::block_hash transaction;
};

/** Negotiated agreement handed over by the marketplace layer */
class agreement final
{
public:
	agreement ();
	uint64_t agreement_id;
	uint64_t buyer_id;
	uint64_t seller_id;
	escrow::account buyer_account;
	escrow::account seller_account;
	escrow::amount amount;
	std::string metadata;
};

/**
 * Local escrow record, mirroring one ledger trade
 */
class record final
{
public:
	record ();
	void serialize (escrow::stream &) const;
	bool deserialize (escrow::stream &);
	void serialize_json (boost::property_tree::ptree &) const;
	bool operator== (escrow::record const &) const;
	uint64_t id;
	uint64_t agreement_id;
	uint64_t buyer_id;
	uint64_t seller_id;
	escrow::account buyer_account;
	escrow::account seller_account;
	// Account expected to fund the trade, the buyer or the custodial service account
	escrow::account payer;
	escrow::amount amount;
	boost::optional<uint64_t> trade_id;
	boost::optional<escrow::block_hash> funding_transaction;
	bool custodial;
	uint32_t verification_attempts;
	escrow::record_state state;
	// Last transition was written locally and has not been echoed by a ledger event
	bool provisional;
	// Consistency failure, automated transitions are suspended
	bool halted;
	std::string metadata;
	std::string dispute_reason;
	boost::optional<escrow::dispute_resolution> resolution;
	uint64_t created_at;
	uint64_t funded_at;
	uint64_t disputed_at;
	uint64_t completed_at;
	uint64_t timeout_at;
};

enum class event_cause : uint8_t
{
	ledger = 0,
	administrative = 1,
	funding = 2
};
std::string to_string (escrow::event_cause);

enum class record_event_type : uint8_t
{
	created = 0,
	funding_submitted = 1,
	verification_failed = 2,
	funded = 3,
	escrow_created = 4,
	delivery_confirmed = 5,
	released = 6,
	disputed = 7,
	resolution_submitted = 8,
	resolved = 9,
	timeout_refund = 10,
	consistency_failure = 11
};
std::string to_string (escrow::record_event_type);

/**
 * Append-only audit row, one per transition or observed ledger event
 */
class record_event final
{
public:
	record_event ();
	void serialize (escrow::stream &) const;
	bool deserialize (escrow::stream &);
	void serialize_json (boost::property_tree::ptree &) const;
	uint64_t escrow_id;
	uint64_t sequence;
	escrow::record_event_type type;
	escrow::event_cause cause;
	bool trust_reduced;
	uint64_t timestamp;
	// JSON encoded event arguments or resolution parameters
	std::string payload;
	// Ledger position, set for ledger caused rows
	escrow::block_hash transaction;
	uint32_t log_index;
	uint64_t height;
};

/** Derived on every read, never stored */
class permissions final
{
public:
	void serialize_json (boost::property_tree::ptree &) const;
	bool can_be_funded{ false };
	bool can_confirm_delivery{ false };
	bool can_raise_dispute{ false };
	bool can_timeout_refund{ false };
};
escrow::permissions compute_permissions (escrow::record const &, uint64_t, uint64_t);
}
