#include <escrow/lib/numbers.hpp>
#include <escrow/lib/utility.hpp>

#include <ed25519-donna/ed25519.h>

#include <blake2.h>

#include <algorithm>
#include <cassert>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace
{
char const * account_prefix ("esc_");
char const * account_lookup ("13456789abcdefghijkmnopqrstuwxyz");
char const * account_reverse ("~0~1234567~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~89:;<=>?@AB~CDEFGHIJK~LMNO~~~~~");
// Characters of the encoded key and checksum after the prefix
size_t const account_digits (60);

char account_encode (uint8_t value)
{
	assert (value < 32);
	return account_lookup[value];
}

uint8_t account_decode (char value)
{
	assert (value >= '0');
	assert (value <= '~');
	auto result (account_reverse[value - 0x30]);
	if (result != '~')
	{
		result -= 0x30;
	}
	return result;
}

uint64_t account_checksum (escrow::uint256_union const & account_a)
{
	uint64_t check (0);
	blake2b_state hash;
	blake2b_init (&hash, 5);
	blake2b_update (&hash, account_a.bytes.data (), account_a.bytes.size ());
	blake2b_final (&hash, reinterpret_cast<uint8_t *> (&check), 5);
	return check;
}

bool has_account_prefix (std::string const & source_a)
{
	return source_a.compare (0, 3, account_prefix, 3) == 0 && (source_a[3] == '_' || source_a[3] == '-');
}

/** Fixed width upper case hex of a number occupying \p digits_a characters */
template <typename Number>
std::string encode_hex_fixed (Number const & number_a, int digits_a)
{
	std::stringstream stream;
	stream << std::hex << std::uppercase << std::noshowbase << std::setw (digits_a) << std::setfill ('0');
	stream << number_a;
	return stream.str ();
}

/** Reads the whole text as one number in the stream's base, returns true on any leftover or malformed input */
template <typename Number>
bool decode_number (std::string const & text_a, std::ios_base & (*base_a) (std::ios_base &), Number & number_a)
{
	auto error (false);
	std::stringstream stream (text_a);
	stream << base_a << std::noshowbase;
	try
	{
		stream >> number_a;
		error = stream.fail () || !stream.eof ();
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}

template <typename Number, typename Bytes>
Number import_number (Bytes const & bytes_a)
{
	Number result;
	boost::multiprecision::import_bits (result, bytes_a.begin (), bytes_a.end ());
	return result;
}

template <typename Number, typename Bytes>
void export_number (Number const & number_a, Bytes & bytes_a)
{
	bytes_a.fill (0);
	boost::multiprecision::export_bits (number_a, bytes_a.rbegin (), 8, false);
}
}

escrow::uint128_union::uint128_union (std::string const & string_a)
{
	auto error (decode_hex (string_a));
	release_assert (!error);
}

escrow::uint128_union::uint128_union (uint64_t value_a)
{
	*this = escrow::uint128_t (value_a);
}

escrow::uint128_union::uint128_union (escrow::uint128_t const & number_a)
{
	export_number (number_a, bytes);
}

bool escrow::uint128_union::operator== (escrow::uint128_union const & other_a) const
{
	return qwords == other_a.qwords;
}

bool escrow::uint128_union::operator!= (escrow::uint128_union const & other_a) const
{
	return !(*this == other_a);
}

bool escrow::uint128_union::operator< (escrow::uint128_union const & other_a) const
{
	return std::memcmp (bytes.data (), other_a.bytes.data (), bytes.size ()) < 0;
}

escrow::uint128_t escrow::uint128_union::number () const
{
	return import_number<escrow::uint128_t> (bytes);
}

void escrow::uint128_union::encode_hex (std::string & text) const
{
	assert (text.empty ());
	text = encode_hex_fixed (number (), 32);
}

bool escrow::uint128_union::decode_hex (std::string const & text)
{
	escrow::uint128_t number_l;
	auto error (text.empty () || text.size () > 32 || decode_number (text, std::hex, number_l));
	if (!error)
	{
		*this = number_l;
	}
	return error;
}

void escrow::uint128_union::encode_dec (std::string & text) const
{
	assert (text.empty ());
	text = number ().convert_to<std::string> ();
}

bool escrow::uint128_union::decode_dec (std::string const & text, bool fraction_a)
{
	auto error (text.empty () || text.size () > 39 || (text.size () > 1 && text.front () == '0' && !fraction_a) || text.front () == '-' || text.front () == '+');
	if (!error)
	{
		boost::multiprecision::checked_uint128_t number_l;
		error = decode_number (text, std::dec, number_l);
		if (!error)
		{
			*this = escrow::uint128_t (number_l);
		}
	}
	return error;
}

bool escrow::uint128_union::decode_dec (std::string const & text, escrow::uint128_t scale)
{
	auto error (text.empty () || text.size () > 40);
	if (!error)
	{
		boost::multiprecision::cpp_int result;
		auto delimiter (text.find ('.'));
		escrow::uint128_union integer_part;
		error = integer_part.decode_dec (text.substr (0, delimiter));
		if (!error)
		{
			result = boost::multiprecision::cpp_int (integer_part.number ()) * boost::multiprecision::cpp_int (scale);
			if (delimiter != std::string::npos)
			{
				// Fractional digits must fit the scale, "1.5" ether is 15 followed by 17 zeros
				auto fraction_text (text.substr (delimiter + 1));
				auto scale_digits (scale.convert_to<std::string> ().size () - 1);
				escrow::uint128_union fraction_part;
				error = fraction_text.empty () || fraction_text.size () > scale_digits || fraction_part.decode_dec (fraction_text, true);
				if (!error)
				{
					auto shift (boost::multiprecision::pow (boost::multiprecision::cpp_int (10), static_cast<unsigned> (scale_digits - fraction_text.size ())));
					result += boost::multiprecision::cpp_int (fraction_part.number ()) * shift;
				}
			}
		}
		if (!error)
		{
			error = result > boost::multiprecision::cpp_int (std::numeric_limits<escrow::uint128_t>::max ());
			if (!error)
			{
				*this = escrow::uint128_t (result);
			}
		}
	}
	return error;
}

void escrow::uint128_union::clear ()
{
	qwords.fill (0);
}

bool escrow::uint128_union::is_zero () const
{
	return qwords[0] == 0 && qwords[1] == 0;
}

std::string escrow::uint128_union::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}

std::string escrow::uint128_union::to_string_dec () const
{
	std::string result;
	encode_dec (result);
	return result;
}

escrow::uint256_union::uint256_union (std::string const & hex_a)
{
	auto error (decode_hex (hex_a));
	release_assert (!error);
}

escrow::uint256_union::uint256_union (uint64_t value_a)
{
	*this = escrow::uint256_t (value_a);
}

escrow::uint256_union::uint256_union (escrow::uint256_t const & number_a)
{
	export_number (number_a, bytes);
}

bool escrow::uint256_union::operator== (escrow::uint256_union const & other_a) const
{
	return bytes == other_a.bytes;
}

bool escrow::uint256_union::operator!= (escrow::uint256_union const & other_a) const
{
	return !(*this == other_a);
}

bool escrow::uint256_union::operator< (escrow::uint256_union const & other_a) const
{
	return std::memcmp (bytes.data (), other_a.bytes.data (), bytes.size ()) < 0;
}

void escrow::uint256_union::encode_hex (std::string & text) const
{
	assert (text.empty ());
	text = encode_hex_fixed (number (), 64);
}

bool escrow::uint256_union::decode_hex (std::string const & text)
{
	escrow::uint256_t number_l;
	auto error (text.empty () || text.size () > 64 || decode_number (text, std::hex, number_l));
	if (!error)
	{
		*this = number_l;
	}
	return error;
}

void escrow::uint256_union::encode_account (std::string & destination_a) const
{
	assert (destination_a.empty ());
	destination_a.reserve (4 + account_digits);
	escrow::uint512_t number_l (number ());
	number_l <<= 40;
	number_l |= escrow::uint512_t (account_checksum (*this));
	std::string digits;
	for (size_t i (0); i < account_digits; ++i)
	{
		digits.push_back (account_encode (static_cast<uint8_t> (number_l & 0x1f)));
		number_l >>= 5;
	}
	destination_a.append (account_prefix);
	destination_a.append (digits.rbegin (), digits.rend ());
}

std::string escrow::uint256_union::to_account () const
{
	std::string result;
	encode_account (result);
	return result;
}

bool escrow::uint256_union::decode_account (std::string const & source_a)
{
	// The leading digit holds the top bits of the key and can only be 1 or 3
	auto error (source_a.size () != 4 + account_digits || !has_account_prefix (source_a) || (source_a[4] != '1' && source_a[4] != '3'));
	escrow::uint512_t number_l;
	for (auto i (source_a.begin () + std::min<size_t> (4, source_a.size ())), n (source_a.end ()); !error && i != n; ++i)
	{
		uint8_t character (*i);
		error = character < 0x30 || character >= 0x80;
		if (!error)
		{
			auto digit (account_decode (character));
			error = digit == '~';
			number_l <<= 5;
			number_l += digit;
		}
	}
	if (!error)
	{
		escrow::uint256_union decoded ((number_l >> 40).convert_to<escrow::uint256_t> ());
		uint64_t check (number_l & static_cast<uint64_t> (0xffffffffff));
		error = check != account_checksum (decoded);
		if (!error)
		{
			*this = decoded;
		}
	}
	return error;
}

void escrow::uint256_union::clear ()
{
	qwords.fill (0);
}

bool escrow::uint256_union::is_zero () const
{
	return qwords[0] == 0 && qwords[1] == 0 && qwords[2] == 0 && qwords[3] == 0;
}

std::string escrow::uint256_union::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}

escrow::uint256_t escrow::uint256_union::number () const
{
	return import_number<escrow::uint256_t> (bytes);
}

escrow::raw_key::~raw_key ()
{
	data.clear ();
}

bool escrow::raw_key::operator== (escrow::raw_key const & other_a) const
{
	return data == other_a.data;
}

bool escrow::raw_key::operator!= (escrow::raw_key const & other_a) const
{
	return !(*this == other_a);
}

escrow::uint512_union::uint512_union (escrow::uint512_t const & number_a)
{
	export_number (number_a, bytes);
}

bool escrow::uint512_union::operator== (escrow::uint512_union const & other_a) const
{
	return bytes == other_a.bytes;
}

bool escrow::uint512_union::operator!= (escrow::uint512_union const & other_a) const
{
	return !(*this == other_a);
}

void escrow::uint512_union::encode_hex (std::string & text) const
{
	assert (text.empty ());
	text = encode_hex_fixed (number (), 128);
}

bool escrow::uint512_union::decode_hex (std::string const & text)
{
	escrow::uint512_t number_l;
	auto error (text.empty () || text.size () > 128 || decode_number (text, std::hex, number_l));
	if (!error)
	{
		*this = number_l;
	}
	return error;
}

void escrow::uint512_union::clear ()
{
	bytes.fill (0);
}

bool escrow::uint512_union::is_zero () const
{
	return std::all_of (qwords.begin (), qwords.end (), [](uint64_t word_a) { return word_a == 0; });
}

escrow::uint512_t escrow::uint512_union::number () const
{
	return import_number<escrow::uint512_t> (bytes);
}

std::string escrow::uint512_union::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}

escrow::signature escrow::sign_message (escrow::raw_key const & private_key, escrow::public_key const & public_key, escrow::uint256_union const & message)
{
	escrow::signature result;
	ed25519_sign (message.bytes.data (), sizeof (message.bytes), private_key.data.bytes.data (), public_key.bytes.data (), result.bytes.data ());
	return result;
}

bool escrow::validate_message (escrow::public_key const & public_key, escrow::uint256_union const & message, escrow::signature const & signature)
{
	return 0 != ed25519_sign_open (message.bytes.data (), sizeof (message.bytes), public_key.bytes.data (), signature.bytes.data ());
}

escrow::public_key escrow::pub_key (escrow::private_key const & private_key_a)
{
	escrow::public_key result;
	ed25519_publickey (private_key_a.bytes.data (), result.bytes.data ());
	return result;
}
