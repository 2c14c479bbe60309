#include <gtest/gtest.h>

#include <escrow/lib/numbers.hpp>
#include <escrow/secure/common.hpp>

TEST (uint128_union, decode_dec)
{
	escrow::uint128_union value;
	std::string text ("16");
	ASSERT_FALSE (value.decode_dec (text));
	ASSERT_EQ (16, value.bytes[15]);
}

TEST (uint128_union, decode_dec_negative)
{
	escrow::uint128_union value;
	std::string text ("-1");
	auto error (value.decode_dec (text));
	ASSERT_TRUE (error);
}

TEST (uint128_union, decode_dec_zero)
{
	escrow::uint128_union value;
	std::string text ("0");
	ASSERT_FALSE (value.decode_dec (text));
	ASSERT_TRUE (value.is_zero ());
}

TEST (uint128_union, decode_dec_leading_zero)
{
	escrow::uint128_union value;
	std::string text ("010");
	auto error (value.decode_dec (text));
	ASSERT_TRUE (error);
}

TEST (uint128_union, decode_dec_overflow)
{
	escrow::uint128_union value;
	std::string text ("340282366920938463463374607431768211456");
	auto error (value.decode_dec (text));
	ASSERT_TRUE (error);
}

TEST (uint128_union, wei_amounts)
{
	escrow::amount one (escrow::ether_ratio);
	ASSERT_EQ ("1000000000000000000", one.to_string_dec ());
	escrow::amount parsed;
	ASSERT_FALSE (parsed.decode_dec ("1.5", escrow::ether_ratio));
	ASSERT_EQ (escrow::ether_ratio + escrow::ether_ratio / 2, parsed.number ());
}

TEST (uint256_union, account_transcode)
{
	escrow::keypair key;
	escrow::uint256_union value;
	auto text (key.pub.to_account ());
	ASSERT_EQ (64, text.size ());
	ASSERT_FALSE (value.decode_account (text));
	ASSERT_EQ (key.pub, value);
	ASSERT_EQ ('_', text[3]);
	text[3] = '-';
	escrow::uint256_union value2;
	ASSERT_FALSE (value2.decode_account (text));
	ASSERT_EQ (value, value2);
}

TEST (uint256_union, account_encode_lex)
{
	escrow::uint256_union min ("0000000000000000000000000000000000000000000000000000000000000000");
	escrow::uint256_union max ("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF");
	auto min_text (min.to_account ());
	auto max_text (max.to_account ());
	ASSERT_EQ (64, min_text.size ());
	ASSERT_EQ (64, max_text.size ());
	ASSERT_LT (min_text, max_text);
}

TEST (uint256_union, bounds)
{
	escrow::uint256_union key;
	std::string bad1 (64, '\x000');
	bad1[0] = 'e';
	bad1[1] = 's';
	bad1[2] = 'c';
	bad1[3] = '-';
	ASSERT_TRUE (key.decode_account (bad1));
	std::string bad2 (64, '\x0ff');
	bad2[0] = 'e';
	bad2[1] = 's';
	bad2[2] = 'c';
	bad2[3] = '-';
	ASSERT_TRUE (key.decode_account (bad2));
}

TEST (uint256_union, account_checksum)
{
	escrow::keypair key;
	auto text (key.pub.to_account ());
	text[10] = text[10] == '1' ? '3' : '1';
	escrow::uint256_union value;
	ASSERT_TRUE (value.decode_account (text));
}

TEST (keypair, from_private_hex)
{
	escrow::keypair key1;
	escrow::keypair key2 (key1.prv.data.to_string ());
	ASSERT_EQ (key1.pub, key2.pub);
	ASSERT_EQ (key1.prv, key2.prv);
}

TEST (signature, sign_and_validate)
{
	escrow::keypair key;
	escrow::uint256_union message (42);
	auto signature (escrow::sign_message (key.prv, key.pub, message));
	ASSERT_FALSE (escrow::validate_message (key.pub, message, signature));
	signature.bytes[32] ^= 0x1;
	ASSERT_TRUE (escrow::validate_message (key.pub, message, signature));
}

TEST (ledger_call, signature_covers_fields)
{
	escrow::keypair buyer;
	escrow::keypair seller;
	auto call (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (100), "{}"));
	call.sign (buyer.prv, buyer.pub);
	ASSERT_FALSE (call.validate_signature ());
	auto hash1 (call.hash ());
	call.value = escrow::amount (101);
	ASSERT_NE (hash1, call.hash ());
	ASSERT_TRUE (call.validate_signature ());
}

TEST (ledger_call, serialization)
{
	escrow::keypair admin;
	escrow::keypair seller;
	auto call1 (escrow::ledger_call::resolve_dispute (admin.pub, 7, seller.pub, escrow::amount (60), "split"));
	call1.nonce = 3;
	call1.sign (admin.prv, admin.pub);
	std::vector<uint8_t> bytes;
	{
		escrow::vectorstream stream (bytes);
		call1.serialize (stream);
	}
	escrow::bufferstream stream (bytes.data (), bytes.size ());
	escrow::ledger_call call2;
	ASSERT_FALSE (call2.deserialize (stream));
	ASSERT_EQ (call1.hash (), call2.hash ());
	ASSERT_EQ (call1.signature, call2.signature);
	ASSERT_EQ ("split", call2.text);
	ASSERT_FALSE (call2.validate_signature ());
}
