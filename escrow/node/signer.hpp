#pragma once

#include <escrow/secure/common.hpp>

namespace escrow
{
/**
 * Key management capability. Holders can sign ledger calls for one account without seeing the key.
 */
class signer
{
public:
	virtual ~signer () = default;
	virtual escrow::account account () const = 0;
	virtual escrow::signature sign (escrow::block_hash const &) const = 0;
	/** Fills in the caller and the signature of the call */
	void sign (escrow::ledger_call &) const;
};

/** Signs with a key held in process memory */
class key_signer final : public signer
{
public:
	explicit key_signer (escrow::keypair const &);
	escrow::account account () const override;
	escrow::signature sign (escrow::block_hash const &) const override;
	using signer::sign;

private:
	escrow::keypair key;
};
}
