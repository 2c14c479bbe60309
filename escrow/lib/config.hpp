#pragma once

#include <boost/filesystem.hpp>

#include <chrono>
#include <string>

#define ESCROW_VERSION_MAJOR 1
#define ESCROW_VERSION_MINOR 0
#define ESCROW_VERSION_STRING "1.0"

namespace escrow
{
/**
 * Network variants with different defaults for intervals and confirmation depth
 */
enum class escrow_networks
{
	// Low wait times, used by unit tests
	escrow_test_network = 0,
	// Staging deployment against a shared development ledger
	escrow_beta_network = 1,
	// Production
	escrow_live_network = 2,
};

class network_constants
{
public:
	network_constants () :
	network_constants (network_constants::active_network)
	{
	}

	network_constants (escrow_networks network_a) :
	current_network (network_a)
	{
		confirmations = 3;
		reconciler_interval = is_test_network () ? std::chrono::milliseconds (50) : std::chrono::milliseconds (10000);
		confirmation_poll_interval = is_test_network () ? std::chrono::milliseconds (10) : std::chrono::milliseconds (2000);
		custodial_confirmation_timeout = is_test_network () ? std::chrono::milliseconds (5000) : std::chrono::milliseconds (120000);
		block_interval = is_test_network () ? std::chrono::milliseconds (0) : std::chrono::milliseconds (1000);
		data_directory = is_live_network () ? "Escrow" : is_beta_network () ? "EscrowBeta" : "EscrowTest";
	}

	escrow_networks current_network;
	unsigned confirmations;
	std::chrono::milliseconds reconciler_interval;
	std::chrono::milliseconds confirmation_poll_interval;
	std::chrono::milliseconds custodial_confirmation_timeout;
	std::chrono::milliseconds block_interval;
	std::string data_directory;

	/** Selects the network later default constructed constants describe */
	static void set_active_network (escrow_networks network_a)
	{
		active_network = network_a;
	}

	/**
	 * Selects the network by name, one of "live", "beta" and "test"
	 * @return true if the name was not recognized
	 */
	static bool set_active_network (std::string const & network_a);

	bool is_live_network () const
	{
		return current_network == escrow_networks::escrow_live_network;
	}
	bool is_beta_network () const
	{
		return current_network == escrow_networks::escrow_beta_network;
	}
	bool is_test_network () const
	{
		return current_network == escrow_networks::escrow_test_network;
	}

	std::string get_current_network_as_string () const
	{
		return is_live_network () ? "live" : is_beta_network () ? "beta" : "test";
	}

	/** Initial value is live */
	static escrow_networks active_network;
};

inline boost::filesystem::path get_config_path (boost::filesystem::path const & data_path)
{
	return data_path / "config.json";
}
}
