#include <escrow/secure/recordstore.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>

escrow::event_key::event_key (uint64_t escrow_id_a, uint64_t sequence_a)
{
	boost::endian::native_to_big_inplace (escrow_id_a);
	boost::endian::native_to_big_inplace (sequence_a);
	std::memcpy (bytes.data (), &escrow_id_a, sizeof (escrow_id_a));
	std::memcpy (bytes.data () + sizeof (escrow_id_a), &sequence_a, sizeof (sequence_a));
}

uint64_t escrow::event_key::escrow_id () const
{
	uint64_t result;
	std::memcpy (&result, bytes.data (), sizeof (result));
	boost::endian::big_to_native_inplace (result);
	return result;
}

uint64_t escrow::event_key::sequence () const
{
	uint64_t result;
	std::memcpy (&result, bytes.data () + sizeof (result), sizeof (result));
	boost::endian::big_to_native_inplace (result);
	return result;
}

escrow::ledger_event_key::ledger_event_key (escrow::block_hash const & transaction_a, uint32_t index_a) :
transaction (transaction_a)
{
	boost::endian::native_to_big_inplace (index_a);
	std::memcpy (index.data (), &index_a, sizeof (index_a));
}

bool escrow::ledger_event_key::operator== (escrow::ledger_event_key const & other_a) const
{
	return transaction == other_a.transaction && index == other_a.index;
}

escrow::read_transaction::read_transaction (std::unique_ptr<escrow::transaction_impl> impl_a) :
impl (std::move (impl_a))
{
}

void * escrow::read_transaction::get_handle () const
{
	return impl->get_handle ();
}

escrow::write_transaction::write_transaction (std::unique_ptr<escrow::transaction_impl> impl_a) :
impl (std::move (impl_a))
{
}

void * escrow::write_transaction::get_handle () const
{
	return impl->get_handle ();
}
