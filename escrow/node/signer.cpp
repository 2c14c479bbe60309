#include <escrow/node/signer.hpp>

void escrow::signer::sign (escrow::ledger_call & call_a) const
{
	call_a.from = account ();
	call_a.signature = sign (call_a.hash ());
}

escrow::key_signer::key_signer (escrow::keypair const & key_a) :
key (key_a)
{
}

escrow::account escrow::key_signer::account () const
{
	return key.pub;
}

escrow::signature escrow::key_signer::sign (escrow::block_hash const & hash_a) const
{
	return escrow::sign_message (key.prv, key.pub, hash_a);
}
