#include "escrow/lib/errors.hpp"

std::string escrow::error_common_messages::message (int ev) const
{
	switch (static_cast<escrow::error_common> (ev))
	{
		case escrow::error_common::generic:
			return "Unknown error";
		case escrow::error_common::exception:
			return "Exception thrown";
		case escrow::error_common::account_not_found:
			return "Account not found";
		case escrow::error_common::bad_account_number:
			return "Bad account number";
		case escrow::error_common::bad_private_key:
			return "Bad private key";
		case escrow::error_common::bad_public_key:
			return "Bad public key";
		case escrow::error_common::bad_signature:
			return "Bad signature";
		case escrow::error_common::invalid_amount:
			return "Invalid amount number";
		case escrow::error_common::invalid_amount_big:
			return "Amount too big";
		case escrow::error_common::invalid_index:
			return "Invalid index";
		case escrow::error_common::invalid_type_conversion:
			return "Invalid type conversion";
		case escrow::error_common::numeric_conversion:
			return "Numeric conversion error";
	}

	return "Invalid error code";
}

std::string escrow::error_escrow_messages::message (int ev) const
{
	switch (static_cast<escrow::error_escrow> (ev))
	{
		case escrow::error_escrow::generic:
			return "Unknown error";
		case escrow::error_escrow::record_not_found:
			return "Escrow not found";
		case escrow::error_escrow::agreement_exists:
			return "Escrow already exists for this agreement";
		case escrow::error_escrow::invalid_parties:
			return "Buyer and seller must be distinct and valid";
		case escrow::error_escrow::invalid_amount:
			return "Escrow amount must be greater than zero";
		case escrow::error_escrow::state_mismatch:
			return "Escrow state changed concurrently";
		case escrow::error_escrow::invalid_transition:
			return "Invalid escrow state transition";
		case escrow::error_escrow::trade_conflict:
			return "Ledger trade already linked to another escrow";
		case escrow::error_escrow::record_halted:
			return "Escrow halted pending administrative review";
	}

	return "Invalid error code";
}

std::string escrow::error_funding_messages::message (int ev) const
{
	switch (static_cast<escrow::error_funding> (ev))
	{
		case escrow::error_funding::generic:
			return "Unknown error";
		case escrow::error_funding::wrong_state:
			return "Escrow is not awaiting funding";
		case escrow::error_funding::custodial_unavailable:
			return "Custodial funding is not enabled";
		case escrow::error_funding::confirmation_timeout:
			return "Timed out waiting for funding confirmations";
		case escrow::error_funding::verification_exhausted:
			return "Funding verification attempts exhausted";
		case escrow::error_funding::cancelled:
			return "Funding cancelled";
	}

	return "Invalid error code";
}

std::string escrow::error_verification_messages::message (int ev) const
{
	switch (static_cast<escrow::error_verification> (ev))
	{
		case escrow::error_verification::generic:
			return "Unknown error";
		case escrow::error_verification::not_found:
			return "Transaction not found";
		case escrow::error_verification::ledger_unavailable:
			return "Ledger unavailable";
		case escrow::error_verification::reverted:
			return "Transaction reverted";
		case escrow::error_verification::insufficient_confirmations:
			return "Insufficient confirmations";
		case escrow::error_verification::missing_funding_event:
			return "No funding event in transaction";
		case escrow::error_verification::trade_mismatch:
			return "Funding event is for a different trade";
		case escrow::error_verification::party_mismatch:
			return "Funding parties do not match";
		case escrow::error_verification::amount_mismatch:
			return "Funding amount does not match";
	}

	return "Invalid error code";
}

std::string escrow::error_ledger_messages::message (int ev) const
{
	switch (static_cast<escrow::error_ledger> (ev))
	{
		case escrow::error_ledger::generic:
			return "Unknown error";
		case escrow::error_ledger::unavailable:
			return "Ledger unavailable";
		case escrow::error_ledger::bad_signature:
			return "Bad signature";
		case escrow::error_ledger::bad_nonce:
			return "Bad nonce";
		case escrow::error_ledger::insufficient_balance:
			return "Insufficient balance";
		case escrow::error_ledger::unknown_transaction:
			return "Unknown transaction";
		case escrow::error_ledger::unknown_trade:
			return "Unknown trade";
		case escrow::error_ledger::reverted:
			return "Transaction reverted";
	}

	return "Invalid error code";
}

std::string escrow::error_dispute_messages::message (int ev) const
{
	switch (static_cast<escrow::error_dispute> (ev))
	{
		case escrow::error_dispute::generic:
			return "Unknown error";
		case escrow::error_dispute::not_disputed:
			return "Escrow is not disputed";
		case escrow::error_dispute::missing_recipient:
			return "Partial split requires a recipient";
		case escrow::error_dispute::missing_amount:
			return "Partial split requires an amount";
		case escrow::error_dispute::amount_exceeds:
			return "Amount exceeds escrow amount";
		case escrow::error_dispute::invalid_recipient:
			return "Recipient must be buyer or seller";
		case escrow::error_dispute::trade_not_linked:
			return "Escrow has no ledger trade";
		case escrow::error_dispute::already_resolved:
			return "Dispute already resolved";
		case escrow::error_dispute::admin_unavailable:
			return "Administrator key not configured";
	}

	return "Invalid error code";
}

std::string escrow::error_rpc_messages::message (int ev) const
{
	switch (static_cast<escrow::error_rpc> (ev))
	{
		case escrow::error_rpc::generic:
			return "Unknown error";
		case escrow::error_rpc::empty_response:
			return "Empty response";
		case escrow::error_rpc::invalid_request:
			return "Invalid request";
		case escrow::error_rpc::unknown_command:
			return "Unknown command";
		case escrow::error_rpc::bad_escrow_id:
			return "Bad escrow id";
		case escrow::error_rpc::bad_outcome:
			return "Bad outcome, expected refund_to_buyer, payout_to_seller or partial_split";
		case escrow::error_rpc::bad_funding_path:
			return "Bad funding path, expected self_custodial or custodial";
		case escrow::error_rpc::bad_hash:
			return "Bad transaction hash";
		case escrow::error_rpc::bad_state:
			return "Bad state, expected awaiting_fund, pending_verification, funded, disputed or complete";
		case escrow::error_rpc::bad_page:
			return "Bad page, pages start at 1";
		case escrow::error_rpc::bad_limit:
			return "Bad limit, expected 1 to 100";
	}

	return "Invalid error code";
}

std::string escrow::error_config_messages::message (int ev) const
{
	switch (static_cast<escrow::error_config> (ev))
	{
		case escrow::error_config::generic:
			return "Unknown error";
		case escrow::error_config::invalid_value:
			return "Invalid configuration value";
		case escrow::error_config::missing_value:
			return "Missing value in configuration";
	}

	return "Invalid error code";
}

std::string escrow::error_step (std::error_code const & code_a)
{
	std::string result ("escrow");
	auto & category (code_a.category ());
	if (category == escrow::error_funding_category ())
	{
		result = "funding";
	}
	else if (category == escrow::error_verification_category ())
	{
		result = "verification";
	}
	else if (category == escrow::error_ledger_category ())
	{
		result = "ledger submission";
	}
	else if (category == escrow::error_dispute_category ())
	{
		result = "dispute";
	}
	else if (category == escrow::error_rpc_category ())
	{
		result = "request";
	}
	else if (category == escrow::error_config_category ())
	{
		result = "config";
	}
	return result;
}
