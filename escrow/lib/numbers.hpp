#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <string>

namespace escrow
{
using uint128_t = boost::multiprecision::uint128_t;
using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::uint512_t;
// Amounts are kept in wei, one ether is 10^18 wei
escrow::uint128_t const ether_ratio = escrow::uint128_t ("1000000000000000000");

union uint128_union final
{
public:
	uint128_union () = default;
	/**
	 * Decode from hex string
	 * @warning Aborts at runtime if the input is invalid
	 */
	uint128_union (std::string const &);
	uint128_union (uint64_t);
	uint128_union (escrow::uint128_t const &);
	bool operator== (escrow::uint128_union const &) const;
	bool operator!= (escrow::uint128_union const &) const;
	bool operator< (escrow::uint128_union const &) const;
	void encode_hex (std::string &) const;
	bool decode_hex (std::string const &);
	void encode_dec (std::string &) const;
	/** Parses a plain integer, leading zeros are only accepted for fractional digits */
	bool decode_dec (std::string const &, bool = false);
	/** Parses an integer or decimal number of scale sized units, such as "1.5" ether */
	bool decode_dec (std::string const &, escrow::uint128_t);
	escrow::uint128_t number () const;
	void clear ();
	bool is_zero () const;
	std::string to_string () const;
	std::string to_string_dec () const;
	std::array<uint8_t, 16> bytes;
	std::array<uint64_t, 2> qwords;
};
// Ledger amounts are 128 bit, in wei
using amount = uint128_union;

union uint256_union final
{
	uint256_union () = default;
	/**
	 * Decode from hex string
	 * @warning Aborts at runtime if the input is invalid
	 */
	uint256_union (std::string const &);
	uint256_union (uint64_t);
	uint256_union (escrow::uint256_t const &);
	bool operator== (escrow::uint256_union const &) const;
	bool operator!= (escrow::uint256_union const &) const;
	bool operator< (escrow::uint256_union const &) const;
	void encode_hex (std::string &) const;
	bool decode_hex (std::string const &);
	void encode_account (std::string &) const;
	std::string to_account () const;
	/** Accepts esc_ or esc- followed by 60 base32 characters carrying a 40 bit checksum */
	bool decode_account (std::string const &);
	std::array<uint8_t, 32> bytes;
	std::array<uint64_t, 4> qwords;
	void clear ();
	bool is_zero () const;
	std::string to_string () const;
	escrow::uint256_t number () const;
};
// Keys, accounts and transaction hashes are 256 bit
using block_hash = uint256_union;
using account = uint256_union;
using public_key = uint256_union;
using private_key = uint256_union;

/** Private key material, cleared on destruction */
class raw_key final
{
public:
	~raw_key ();
	bool operator== (escrow::raw_key const &) const;
	bool operator!= (escrow::raw_key const &) const;
	escrow::uint256_union data;
};

union uint512_union final
{
	uint512_union () = default;
	uint512_union (escrow::uint512_t const &);
	bool operator== (escrow::uint512_union const &) const;
	bool operator!= (escrow::uint512_union const &) const;
	void encode_hex (std::string &) const;
	bool decode_hex (std::string const &);
	std::array<uint8_t, 64> bytes;
	std::array<uint64_t, 8> qwords;
	void clear ();
	bool is_zero () const;
	escrow::uint512_t number () const;
	std::string to_string () const;
};
using signature = uint512_union;

escrow::signature sign_message (escrow::raw_key const &, escrow::public_key const &, escrow::uint256_union const &);
/** Returns true if the signature does not verify */
bool validate_message (escrow::public_key const &, escrow::uint256_union const &, escrow::signature const &);
escrow::public_key pub_key (escrow::private_key const &);
}

namespace std
{
template <>
struct hash<::escrow::uint256_union>
{
	size_t operator() (::escrow::uint256_union const & data_a) const
	{
		return *reinterpret_cast<size_t const *> (data_a.bytes.data ());
	}
};
}
