#include <escrow/node/signer.hpp>
#include <escrow/node/testing.hpp>
#include <escrow/secure/utility.hpp>

#include <cassert>
#include <cstdlib>
#include <thread>

std::string escrow::error_system_messages::message (int ev) const
{
	switch (static_cast<escrow::error_system> (ev))
	{
		case escrow::error_system::generic:
			return "Unknown error";
		case escrow::error_system::deadline_expired:
			return "Deadline expired";
	}

	return "Invalid error code";
}

escrow::system::system () :
chain (admin.pub, fee_recipient.pub)
{
	auto scale_str = std::getenv ("DEADLINE_SCALE_FACTOR");
	if (scale_str)
	{
		deadline_scaling_factor = std::stod (scale_str);
	}
	logging.init (escrow::unique_path ());
	chain.credit (buyer.pub, initial_balance);
	chain.credit (custodian.pub, initial_balance);
}

escrow::system::~system ()
{
	for (auto & i : nodes)
	{
		i->stop ();
	}
	chain.stop ();

	// Clean up tmp directories created by the tests. Since it's sometimes useful to
	// see log files after test failures, an environment variable is supported to
	// retain the files.
	if (std::getenv ("TEST_KEEP_TMPDIRS") == nullptr)
	{
		escrow::remove_temporary_directories ();
	}
}

std::shared_ptr<escrow::node> escrow::system::add_node (escrow::node_config const & config_a, bool custodial_a)
{
	escrow::node_init init;
	std::shared_ptr<escrow::signer> custodial_signer;
	if (custodial_a)
	{
		custodial_signer = std::make_shared<escrow::key_signer> (custodian);
	}
	auto node (std::make_shared<escrow::node> (init, escrow::unique_path (), config_a, chain, custodial_signer, std::make_shared<escrow::key_signer> (admin)));
	assert (!init.error ());
	nodes.push_back (node);
	return node;
}

std::shared_ptr<escrow::node> escrow::system::add_node ()
{
	escrow::node_config config (logging);
	return add_node (config);
}

escrow::agreement escrow::system::agreement (uint64_t agreement_id_a, escrow::uint128_t const & amount_a)
{
	escrow::agreement result;
	result.agreement_id = agreement_id_a;
	result.buyer_id = 1;
	result.seller_id = 2;
	result.buyer_account = buyer.pub;
	result.seller_account = seller.pub;
	result.amount = amount_a;
	result.metadata = "{\"listing\":\"test\"}";
	return result;
}

std::error_code escrow::system::submit (escrow::keypair const & key_a, escrow::ledger_call & call_a, escrow::block_hash & hash_a)
{
	auto result (chain.nonce (key_a.pub, call_a.nonce));
	if (!result)
	{
		escrow::key_signer signer (key_a);
		signer.sign (call_a);
		result = chain.submit (call_a, hash_a);
	}
	return result;
}

void escrow::system::deadline_set (std::chrono::duration<double, std::nano> const & delta_a)
{
	deadline = std::chrono::steady_clock::now () + delta_a * deadline_scaling_factor;
}

std::error_code escrow::system::poll (std::chrono::nanoseconds const & wait_time)
{
	std::error_code ec;
	std::this_thread::sleep_for (wait_time);

	if (std::chrono::steady_clock::now () > deadline)
	{
		ec = escrow::error_system::deadline_expired;
		stop ();
	}
	return ec;
}

void escrow::system::stop ()
{
	for (auto & i : nodes)
	{
		i->stop ();
	}
	chain.stop ();
}

void escrow::force_escrow_test_network ()
{
	escrow::network_constants::set_active_network (escrow::escrow_networks::escrow_test_network);
}

void escrow::cleanup_test_directories_on_exit ()
{
	// The file sink holds the log in the data directory open
	escrow::logging::release_file_sink ();
	if (std::getenv ("TEST_KEEP_TMPDIRS") == nullptr)
	{
		escrow::remove_temporary_directories ();
	}
}
