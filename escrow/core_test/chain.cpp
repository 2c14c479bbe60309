#include <escrow/core_test/testutil.hpp>
#include <escrow/node/chain.hpp>
#include <escrow/node/signer.hpp>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{
std::error_code submit (escrow::local_chain & chain_a, escrow::keypair const & key_a, escrow::ledger_call & call_a, escrow::block_hash & hash_a)
{
	auto result (chain_a.nonce (key_a.pub, call_a.nonce));
	if (!result)
	{
		escrow::key_signer signer (key_a);
		signer.sign (call_a);
		result = chain_a.submit (call_a, hash_a);
	}
	return result;
}
}

TEST (local_chain, block_per_call)
{
	escrow::keypair admin;
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::local_chain chain (admin.pub, admin.pub);
	chain.credit (buyer.pub, 1000);
	uint64_t head (0);
	ASSERT_NO_ERROR (chain.head (head));
	ASSERT_EQ (0, head);
	auto call (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (100), ""));
	escrow::block_hash hash;
	auto error (submit (chain, buyer, call, hash));
	ASSERT_NO_ERROR (error);
	ASSERT_NO_ERROR (chain.head (head));
	ASSERT_EQ (1, head);
	escrow::transaction_receipt receipt;
	ASSERT_NO_ERROR (chain.receipt (hash, receipt));
	ASSERT_TRUE (receipt.success);
	ASSERT_EQ (1, receipt.height);
	ASSERT_EQ (2, receipt.logs.size ());
	ASSERT_EQ (0, receipt.logs[0].index);
	ASSERT_EQ (1, receipt.logs[1].index);
	ASSERT_EQ (100, chain.custody ());
	ASSERT_EQ (1, chain.trade_count ());
	uint64_t nonce (0);
	ASSERT_NO_ERROR (chain.nonce (buyer.pub, nonce));
	ASSERT_EQ (1, nonce);
	chain.mine (3);
	ASSERT_NO_ERROR (chain.head (head));
	ASSERT_EQ (4, head);
}

TEST (local_chain, reverted_call_included)
{
	escrow::keypair admin;
	escrow::keypair buyer;
	escrow::local_chain chain (admin.pub, admin.pub);
	auto call (escrow::ledger_call::confirm_delivery (buyer.pub, 5));
	escrow::block_hash hash;
	auto error (submit (chain, buyer, call, hash));
	ASSERT_NO_ERROR (error);
	escrow::transaction_receipt receipt;
	ASSERT_NO_ERROR (chain.receipt (hash, receipt));
	ASSERT_FALSE (receipt.success);
	ASSERT_EQ (escrow::process_result::unknown_trade, receipt.result);
	ASSERT_TRUE (receipt.logs.empty ());
	std::vector<escrow::ledger_log> logs;
	ASSERT_NO_ERROR (chain.logs (1, 1, logs));
	ASSERT_TRUE (logs.empty ());
}

TEST (local_chain, rejects_before_inclusion)
{
	escrow::keypair admin;
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::local_chain chain (admin.pub, admin.pub);
	chain.credit (buyer.pub, 50);
	auto call (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (100), ""));
	escrow::block_hash hash;
	ASSERT_EQ (escrow::error_ledger::insufficient_balance, submit (chain, buyer, call, hash));
	auto unsigned_call (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (10), ""));
	ASSERT_EQ (escrow::error_ledger::bad_signature, chain.submit (unsigned_call, hash));
	auto stale (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (10), ""));
	stale.nonce = 7;
	escrow::key_signer signer (buyer);
	signer.sign (stale);
	ASSERT_EQ (escrow::error_ledger::bad_nonce, chain.submit (stale, hash));
	uint64_t head (0);
	ASSERT_NO_ERROR (chain.head (head));
	ASSERT_EQ (0, head);
}

TEST (local_chain, offline)
{
	escrow::keypair admin;
	escrow::local_chain chain (admin.pub, admin.pub);
	chain.online (false);
	uint64_t head (0);
	ASSERT_EQ (escrow::error_ledger::unavailable, chain.head (head));
	std::vector<escrow::ledger_log> logs;
	ASSERT_EQ (escrow::error_ledger::unavailable, chain.logs (0, 10, logs));
	escrow::trade trade;
	ASSERT_EQ (escrow::error_ledger::unavailable, chain.trade_get (0, trade));
	chain.online (true);
	ASSERT_NO_ERROR (chain.head (head));
	ASSERT_EQ (escrow::error_ledger::unknown_trade, chain.trade_get (0, trade));
}

TEST (local_chain, logs_by_height)
{
	escrow::keypair admin;
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::local_chain chain (admin.pub, admin.pub);
	chain.credit (buyer.pub, 1000);
	for (auto i (0); i < 3; ++i)
	{
		auto call (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (10), ""));
		escrow::block_hash hash;
		ASSERT_NO_ERROR (submit (chain, buyer, call, hash));
		chain.mine ();
	}
	std::vector<escrow::ledger_log> all;
	ASSERT_NO_ERROR (chain.logs (1, 6, all));
	ASSERT_EQ (6, all.size ());
	std::vector<escrow::ledger_log> middle;
	ASSERT_NO_ERROR (chain.logs (2, 4, middle));
	ASSERT_EQ (2, middle.size ());
	ASSERT_EQ (3, middle[0].height);
	ASSERT_EQ (1, escrow::event_trade_id (middle[0].event));
}

TEST (local_chain, clock)
{
	escrow::keypair admin;
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::local_chain chain (admin.pub, admin.pub);
	chain.credit (buyer.pub, 1000);
	auto call (escrow::ledger_call::create_and_fund (buyer.pub, seller.pub, escrow::amount (10), ""));
	escrow::block_hash hash;
	ASSERT_NO_ERROR (submit (chain, buyer, call, hash));
	auto refund (escrow::ledger_call::timeout_refund (seller.pub, 0));
	ASSERT_NO_ERROR (submit (chain, seller, refund, hash));
	escrow::transaction_receipt receipt;
	ASSERT_NO_ERROR (chain.receipt (hash, receipt));
	ASSERT_EQ (escrow::process_result::not_timed_out, receipt.result);
	chain.advance_time (chain.timeout_duration ());
	auto refund2 (escrow::ledger_call::timeout_refund (seller.pub, 0));
	ASSERT_NO_ERROR (submit (chain, seller, refund2, hash));
	ASSERT_NO_ERROR (chain.receipt (hash, receipt));
	ASSERT_TRUE (receipt.success);
	ASSERT_EQ (1000, chain.balance (buyer.pub));
}

TEST (local_chain, block_production)
{
	escrow::keypair admin;
	escrow::local_chain chain (admin.pub, admin.pub);
	chain.start (1ms);
	ASSERT_FALSE (chain.wait_height (5, 5s));
	chain.stop ();
	uint64_t head (0);
	ASSERT_NO_ERROR (chain.head (head));
	ASSERT_GE (head, 5);
}
