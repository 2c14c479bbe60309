#include <escrow/core_test/testutil.hpp>
#include <escrow/node/logging.hpp>
#include <escrow/node/stats.hpp>
#include <escrow/node/testing.hpp>
#include <escrow/node/verifier.hpp>

#include <gtest/gtest.h>

namespace
{
class verifier_context
{
public:
	verifier_context () :
	verifier (system.chain, 3, logger, system.logging, stats)
	{
	}
	escrow::funding_expectation expect (escrow::uint128_t const & amount_a)
	{
		escrow::funding_expectation result;
		result.buyer = system.buyer.pub;
		result.seller = system.seller.pub;
		result.amount = amount_a;
		return result;
	}
	escrow::block_hash fund (escrow::uint128_t const & amount_a)
	{
		auto call (escrow::ledger_call::create_and_fund (system.buyer.pub, system.seller.pub, amount_a, ""));
		escrow::block_hash result;
		EXPECT_FALSE (system.submit (system.buyer, call, result));
		return result;
	}
	escrow::system system;
	escrow::logger_mt logger;
	escrow::stat stats;
	escrow::transaction_verifier verifier;
};
}

TEST (verifier, confirmation_depth)
{
	verifier_context context;
	auto hash (context.fund (1000));
	escrow::funding_proof proof;
	ASSERT_EQ (escrow::error_verification::insufficient_confirmations, context.verifier.verify (hash, context.expect (1000), proof));
	context.system.chain.mine (2);
	ASSERT_EQ (escrow::error_verification::insufficient_confirmations, context.verifier.verify (hash, context.expect (1000), proof));
	context.system.chain.mine ();
	auto error (context.verifier.verify (hash, context.expect (1000), proof));
	ASSERT_NO_ERROR (error);
	ASSERT_EQ (0, proof.trade_id);
	ASSERT_EQ (1, proof.height);
	ASSERT_EQ (3, proof.confirmations);
	ASSERT_EQ (context.system.chain.now () + context.system.chain.timeout_duration (), proof.timeout_at);
	ASSERT_EQ (1, context.stats.count (escrow::stat::type::verification, escrow::stat::detail::verified));
	ASSERT_EQ (2, context.stats.count (escrow::stat::type::verification, escrow::stat::detail::rejected));
}

TEST (verifier, unknown_transaction)
{
	verifier_context context;
	escrow::funding_proof proof;
	ASSERT_EQ (escrow::error_verification::not_found, context.verifier.verify (escrow::block_hash (12345), context.expect (1000), proof));
}

TEST (verifier, ledger_unavailable)
{
	verifier_context context;
	auto hash (context.fund (1000));
	context.system.chain.mine (3);
	context.system.chain.online (false);
	escrow::funding_proof proof;
	ASSERT_EQ (escrow::error_verification::ledger_unavailable, context.verifier.verify (hash, context.expect (1000), proof));
	context.system.chain.online (true);
	auto error (context.verifier.verify (hash, context.expect (1000), proof));
	ASSERT_NO_ERROR (error);
}

TEST (verifier, reverted)
{
	verifier_context context;
	auto call (escrow::ledger_call::fund_trade (context.system.buyer.pub, 9, escrow::amount (1000)));
	escrow::block_hash hash;
	auto error (context.system.submit (context.system.buyer, call, hash));
	ASSERT_NO_ERROR (error);
	context.system.chain.mine (3);
	escrow::funding_proof proof;
	ASSERT_EQ (escrow::error_verification::reverted, context.verifier.verify (hash, context.expect (1000), proof));
}

TEST (verifier, mismatches)
{
	verifier_context context;
	auto hash (context.fund (1000));
	context.system.chain.mine (3);
	escrow::funding_proof proof;
	ASSERT_EQ (escrow::error_verification::amount_mismatch, context.verifier.verify (hash, context.expect (999), proof));
	auto wrong_buyer (context.expect (1000));
	wrong_buyer.buyer = context.system.custodian.pub;
	ASSERT_EQ (escrow::error_verification::party_mismatch, context.verifier.verify (hash, wrong_buyer, proof));
	auto wrong_seller (context.expect (1000));
	wrong_seller.seller = context.system.custodian.pub;
	ASSERT_EQ (escrow::error_verification::party_mismatch, context.verifier.verify (hash, wrong_seller, proof));
	auto wrong_trade (context.expect (1000));
	wrong_trade.trade_id = 4;
	ASSERT_EQ (escrow::error_verification::trade_mismatch, context.verifier.verify (hash, wrong_trade, proof));
	auto right_trade (context.expect (1000));
	right_trade.trade_id = 0;
	auto error (context.verifier.verify (hash, right_trade, proof));
	ASSERT_NO_ERROR (error);
}

TEST (verifier, missing_funding_event)
{
	verifier_context context;
	auto call (escrow::ledger_call::create_trade_without_fund (context.system.buyer.pub, context.system.seller.pub, ""));
	escrow::block_hash hash;
	auto error (context.system.submit (context.system.buyer, call, hash));
	ASSERT_NO_ERROR (error);
	context.system.chain.mine (3);
	escrow::funding_proof proof;
	ASSERT_EQ (escrow::error_verification::missing_funding_event, context.verifier.verify (hash, context.expect (1000), proof));
}

TEST (verifier, fund_existing_trade)
{
	verifier_context context;
	auto create (escrow::ledger_call::create_trade_without_fund (context.system.buyer.pub, context.system.seller.pub, ""));
	escrow::block_hash hash1;
	auto error1 (context.system.submit (context.system.buyer, create, hash1));
	ASSERT_NO_ERROR (error1);
	auto fund (escrow::ledger_call::fund_trade (context.system.buyer.pub, 0, escrow::amount (500)));
	escrow::block_hash hash2;
	auto error2 (context.system.submit (context.system.buyer, fund, hash2));
	ASSERT_NO_ERROR (error2);
	context.system.chain.mine (3);
	escrow::funding_proof proof;
	auto error3 (context.verifier.verify (hash2, context.expect (500), proof));
	ASSERT_NO_ERROR (error3);
	ASSERT_EQ (2, proof.height);
}
