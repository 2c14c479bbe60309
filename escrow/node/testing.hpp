#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/lib/utility.hpp>
#include <escrow/node/chain.hpp>
#include <escrow/node/node.hpp>

#include <chrono>

namespace escrow
{
/** Test-system related error codes */
enum class error_system
{
	generic = 1,
	deadline_expired
};

/**
 * A local chain with funded well known parties and any number of nodes following it
 */
class system final
{
public:
	system ();
	~system ();
	/** Adds a node with a fresh data path, signing with the custodian and admin keys */
	std::shared_ptr<escrow::node> add_node (escrow::node_config const &, bool = true);
	std::shared_ptr<escrow::node> add_node ();
	/** An agreement between the well known buyer and seller */
	escrow::agreement agreement (uint64_t, escrow::uint128_t const &);
	/** Fills in the nonce, signs with the key and submits */
	std::error_code submit (escrow::keypair const &, escrow::ledger_call &, escrow::block_hash &);
	/**
	 * Sleeps for the given time, then checks the deadline
	 * @returns 0 or escrow::deadline_expired
	 */
	std::error_code poll (const std::chrono::nanoseconds & sleep_time = std::chrono::milliseconds (50));
	void stop ();
	void deadline_set (const std::chrono::duration<double, std::nano> & delta);
	escrow::keypair admin;
	escrow::keypair fee_recipient;
	escrow::keypair buyer;
	escrow::keypair seller;
	escrow::keypair custodian;
	escrow::local_chain chain;
	std::vector<std::shared_ptr<escrow::node>> nodes;
	escrow::logging logging;
	std::chrono::time_point<std::chrono::steady_clock, std::chrono::duration<double>> deadline{ std::chrono::steady_clock::time_point::max () };
	double deadline_scaling_factor{ 1.0 };
	escrow::uint128_t initial_balance{ escrow::ether_ratio * 1000 };
};
/** Selects the test network constants, must run before any node or config is built */
void force_escrow_test_network ();
/** Removes the data directories handed out by unique_path unless TEST_KEEP_TMPDIRS is set */
void cleanup_test_directories_on_exit ();
}
REGISTER_ERROR_CODES (escrow, error_system);
