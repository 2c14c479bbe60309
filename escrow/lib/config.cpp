#include <escrow/lib/config.hpp>

escrow::escrow_networks escrow::network_constants::active_network = escrow::escrow_networks::escrow_live_network;

bool escrow::network_constants::set_active_network (std::string const & network_a)
{
	auto error (false);
	if (network_a == "live")
	{
		active_network = escrow::escrow_networks::escrow_live_network;
	}
	else if (network_a == "beta")
	{
		active_network = escrow::escrow_networks::escrow_beta_network;
	}
	else if (network_a == "test")
	{
		active_network = escrow::escrow_networks::escrow_test_network;
	}
	else
	{
		error = true;
	}
	return error;
}
