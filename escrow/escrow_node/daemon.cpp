#include <escrow/escrow_node/daemon.hpp>
#include <escrow/lib/utility.hpp>
#include <escrow/node/chain.hpp>
#include <escrow/node/daemonconfig.hpp>
#include <escrow/node/node.hpp>
#include <escrow/node/signer.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/format.hpp>

#include <csignal>
#include <iostream>

namespace
{
/** Applies configured contract parameters which differ from the contract defaults */
void configure_contract (escrow::local_chain & chain_a, escrow::key_signer const & admin_a, escrow::ledger_config const & config_a, escrow::logger_mt & logger_a)
{
	std::vector<escrow::ledger_call> calls;
	if (config_a.fee_bps != chain_a.fee_bps ())
	{
		calls.push_back (escrow::ledger_call::update_platform_fee (admin_a.account (), config_a.fee_bps));
	}
	if (config_a.timeout_duration != chain_a.timeout_duration ())
	{
		calls.push_back (escrow::ledger_call::update_timeout_duration (admin_a.account (), config_a.timeout_duration));
	}
	for (auto & call : calls)
	{
		escrow::block_hash hash;
		auto error (chain_a.nonce (admin_a.account (), call.nonce));
		if (!error)
		{
			admin_a.sign (call);
			error = chain_a.submit (call, hash);
		}
		if (error)
		{
			throw std::runtime_error (boost::str (boost::format ("Unable to configure the contract: %1%") % error.message ()));
		}
		logger_a.always_log (boost::str (boost::format ("Contract %1% set to %2%") % escrow::to_string (call.function) % call.parameter));
	}
}
}

void escrow_daemon::daemon::run (boost::filesystem::path const & data_path)
{
	boost::filesystem::create_directories (data_path);
	boost::system::error_code error_chmod;
	escrow::set_secure_perm_directory (data_path, error_chmod);
	escrow::daemon_config config (data_path);
	auto error = escrow::read_and_update_daemon_config (data_path, config);

	if (!error)
	{
		config.node.logging.init (data_path);
		escrow::logger_mt logger{ config.node.logging.min_time_between_log_output };
		boost::asio::io_context io_ctx;
		try
		{
			escrow::keypair admin (config.ledger.admin_key);
			auto admin_signer (std::make_shared<escrow::key_signer> (admin));
			std::shared_ptr<escrow::signer> custodial_signer;
			if (!config.ledger.custodial_key.empty ())
			{
				custodial_signer = std::make_shared<escrow::key_signer> (escrow::keypair (config.ledger.custodial_key));
			}
			escrow::local_chain chain (admin.pub, config.ledger.fee_recipient, config.node.ledger_connection);
			configure_contract (chain, *admin_signer, config.ledger, logger);
			escrow::node_init init;
			auto node (std::make_shared<escrow::node> (init, data_path, config.node, chain, custodial_signer, admin_signer));
			if (!init.error ())
			{
				chain.start (config.ledger.block_interval);
				node->start ();
				logger.always_log (boost::str (boost::format ("Escrow node %1% running on the %2% network") % ESCROW_VERSION_STRING % config.node.network.get_current_network_as_string ()));
				boost::asio::signal_set signals (io_ctx, SIGINT, SIGTERM);
				signals.async_wait ([&io_ctx](boost::system::error_code const &, int) {
					io_ctx.stop ();
				});
				escrow::thread_role::set (escrow::thread_role::name::io);
				io_ctx.run ();
				node->stop ();
				chain.stop ();
			}
			else
			{
				std::cerr << "Error initializing node\n";
			}
		}
		catch (const std::runtime_error & e)
		{
			std::cerr << "Error while running node (" << e.what () << ")\n";
		}
	}
	else
	{
		std::cerr << "Error deserializing config: " << error.get_message () << std::endl;
	}
}
