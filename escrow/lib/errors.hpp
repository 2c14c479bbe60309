#pragma once

#include <boost/system/error_code.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>

namespace escrow
{
/** Common error codes */
enum class error_common
{
	generic = 1,
	exception,
	account_not_found,
	bad_account_number,
	bad_private_key,
	bad_public_key,
	bad_signature,
	invalid_amount,
	invalid_amount_big,
	invalid_index,
	invalid_type_conversion,
	numeric_conversion
};

/** Validation and local store errors */
enum class error_escrow
{
	generic = 1,
	record_not_found,
	agreement_exists,
	invalid_parties,
	invalid_amount,
	state_mismatch,
	invalid_transition,
	trade_conflict,
	record_halted
};

/** Funding coordinator errors */
enum class error_funding
{
	generic = 1,
	wrong_state,
	custodial_unavailable,
	confirmation_timeout,
	verification_exhausted,
	cancelled
};

/** Transaction verification failures */
enum class error_verification
{
	generic = 1,
	not_found,
	ledger_unavailable,
	reverted,
	insufficient_confirmations,
	missing_funding_event,
	trade_mismatch,
	party_mismatch,
	amount_mismatch
};

/** Ledger submission errors */
enum class error_ledger
{
	generic = 1,
	unavailable,
	bad_signature,
	bad_nonce,
	insufficient_balance,
	unknown_transaction,
	unknown_trade,
	reverted
};

/** Dispute resolution errors */
enum class error_dispute
{
	generic = 1,
	not_disputed,
	missing_recipient,
	missing_amount,
	amount_exceeds,
	invalid_recipient,
	trade_not_linked,
	already_resolved,
	admin_unavailable
};

/** Request handler errors */
enum class error_rpc
{
	generic = 1,
	empty_response,
	invalid_request,
	unknown_command,
	bad_escrow_id,
	bad_outcome,
	bad_funding_path,
	bad_hash,
	bad_state,
	bad_page,
	bad_limit
};

/** config.json related errors */
enum class error_config
{
	generic = 1,
	invalid_value,
	missing_value,
};
}

// Convenience macro to implement the standard boilerplate for using std::error_code with enums
// Use this at the end of any header defining one or more error code enums.
#define REGISTER_ERROR_CODES(namespace_name, enum_type)                                                                      \
	namespace namespace_name                                                                                                 \
	{                                                                                                                        \
		static_assert (static_cast<int> (enum_type::generic) > 0, "The first error enum must be generic = 1");               \
		class enum_type##_messages : public std::error_category                                                              \
		{                                                                                                                    \
		public:                                                                                                              \
			const char * name () const noexcept override                                                                     \
			{                                                                                                                \
				return #enum_type;                                                                                           \
			}                                                                                                                \
                                                                                                                             \
			std::string message (int ev) const override;                                                                     \
		};                                                                                                                   \
                                                                                                                             \
		inline const std::error_category & enum_type##_category ()                                                           \
		{                                                                                                                    \
			static enum_type##_messages instance;                                                                            \
			return instance;                                                                                                 \
		}                                                                                                                    \
                                                                                                                             \
		inline std::error_code make_error_code (::namespace_name::enum_type err)                                             \
		{                                                                                                                    \
			return std::error_code (static_cast<int> (err), enum_type##_category ());                                        \
		}                                                                                                                    \
	}                                                                                                                        \
	namespace std                                                                                                            \
	{                                                                                                                        \
		template <>                                                                                                          \
		struct is_error_code_enum<::namespace_name::enum_type> : public std::true_type                                       \
		{                                                                                                                    \
		};                                                                                                                   \
	}

REGISTER_ERROR_CODES (escrow, error_common);
REGISTER_ERROR_CODES (escrow, error_escrow);
REGISTER_ERROR_CODES (escrow, error_funding);
REGISTER_ERROR_CODES (escrow, error_verification);
REGISTER_ERROR_CODES (escrow, error_ledger);
REGISTER_ERROR_CODES (escrow, error_dispute);
REGISTER_ERROR_CODES (escrow, error_rpc);
REGISTER_ERROR_CODES (escrow, error_config);

namespace escrow
{
/** Names the processing step an error belongs to, for user-facing reports */
std::string error_step (std::error_code const &);

/** Adapter for std/boost::error_code, std::exception and bool flags to facilitate unified error handling */
class error
{
public:
	error () = default;
	error (escrow::error const & error_a) = default;
	error (escrow::error && error_a) = default;

	error (std::error_code code_a)
	{
		code = code_a;
	}

	error (boost::system::error_code code_a)
	{
		code = std::make_error_code (static_cast<std::errc> (code_a.value ()));
	}

	error (std::string message_a)
	{
		code = escrow::error_common::generic;
		message = std::move (message_a);
	}

	error (std::exception const & exception_a)
	{
		code = escrow::error_common::exception;
		message = exception_a.what ();
	}

	error & operator= (escrow::error const & err_a)
	{
		code = err_a.code;
		message = err_a.message;
		return *this;
	}

	error & operator= (escrow::error && err_a)
	{
		code = err_a.code;
		message = std::move (err_a.message);
		return *this;
	}

	/** Assign error code */
	error & operator= (const std::error_code code_a)
	{
		code = code_a;
		message.clear ();
		return *this;
	}

	/** Assign boost error code (as converted to std::error_code) */
	error & operator= (const boost::system::error_code & code_a)
	{
		code = std::make_error_code (static_cast<std::errc> (code_a.value ()));
		message.clear ();
		return *this;
	}

	/** Set the error to escrow::error_common::generic and the error message to \p message_a */
	error & operator= (const std::string message_a)
	{
		code = escrow::error_common::generic;
		message = std::move (message_a);
		return *this;
	}

	/** Sets the error to escrow::error_common::exception and adopts the exception error message. */
	error & operator= (std::exception const & exception_a)
	{
		code = escrow::error_common::exception;
		message = exception_a.what ();
		return *this;
	}

	/** Return true if this#error_code is equal to the parameter */
	bool operator== (const std::error_code code_a) const
	{
		return code == code_a;
	}

	/** Explicit std::error_code conversion */
	explicit operator std::error_code () const
	{
		return code;
	}

	/** True if there is an error */
	explicit operator bool () const
	{
		return code.value () != 0;
	}

	/**
	 * Get error message, or an empty string if there's no error. If a custom error message is set,
	 * that will be returned, otherwise the error_code#message() is returned.
	 */
	std::string get_message () const
	{
		std::string res = message;
		if (code && res.empty ())
		{
			res = code.message ();
		}
		return res;
	}

	/** Set an error message and an error code */
	error & set (std::string message_a, std::error_code code_a = escrow::error_common::generic)
	{
		message = message_a;
		code = code_a;
		return *this;
	}

	/** Set a custom error message. If the error code is not set, it will be set to escrow::error_common::generic. */
	error & set_message (std::string message_a)
	{
		if (code.value () == 0)
		{
			code = escrow::error_common::generic;
		}
		message = std::move (message_a);
		return *this;
	}

private:
	std::error_code code;
	std::string message;
};

/**
 * A type that manages a escrow::error.
 * The default return type is escrow::error&, though shared_ptr<escrow::error> is a good alternative return type.
 */
template <typename RET_TYPE = escrow::error &>
class error_aware
{
	static_assert (std::is_same<RET_TYPE, escrow::error &>::value || std::is_same<RET_TYPE, std::shared_ptr<escrow::error>>::value, "Must be escrow::error& or shared_ptr<escrow::error>");

public:
	/** Returns the error object managed by this object */
	virtual RET_TYPE get_error () = 0;
};
}
