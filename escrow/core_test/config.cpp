#include <escrow/core_test/testutil.hpp>
#include <escrow/node/daemonconfig.hpp>
#include <escrow/node/nodeconfig.hpp>
#include <escrow/secure/common.hpp>
#include <escrow/secure/utility.hpp>

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

TEST (node_config, serialization)
{
	escrow::logging logging1;
	logging1.reconciler_logging_value = true;
	escrow::node_config config1 (logging1);
	config1.confirmations = 12;
	config1.verification_attempts_max = 9;
	config1.custodial_confirmation_timeout = std::chrono::milliseconds (90000);
	config1.reconciler_batch_size = 250;
	config1.reconciler_start_height = 4000;
	config1.ledger_connection = "mainnet";
	escrow::jsonconfig tree;
	config1.serialize_json (tree);
	escrow::logging logging2;
	escrow::node_config config2 (logging2);
	ASSERT_NE (config2.confirmations, config1.confirmations);
	bool upgraded (false);
	ASSERT_FALSE (config2.deserialize_json (upgraded, tree));
	ASSERT_FALSE (upgraded);
	ASSERT_EQ (12, config2.confirmations);
	ASSERT_EQ (9, config2.verification_attempts_max);
	ASSERT_EQ (std::chrono::milliseconds (90000), config2.custodial_confirmation_timeout);
	ASSERT_EQ (250, config2.reconciler_batch_size);
	ASSERT_EQ (4000, config2.reconciler_start_height);
	ASSERT_EQ ("mainnet", config2.ledger_connection);
	ASSERT_TRUE (config2.logging.reconciler_logging ());
}

TEST (node_config, v1_v2_upgrade)
{
	escrow::jsonconfig tree;
	tree.put ("version", 1);
	escrow::jsonconfig logging_l;
	escrow::logging ().serialize_json (logging_l);
	tree.put_child ("logging", logging_l);
	tree.put ("confirmations", 6);
	escrow::node_config config;
	bool upgraded (false);
	ASSERT_FALSE (config.deserialize_json (upgraded, tree));
	ASSERT_TRUE (upgraded);
	ASSERT_EQ (6, config.confirmations);
	ASSERT_EQ (escrow::node_config::json_version (), tree.get<unsigned> ("version"));
	ASSERT_EQ ("local", tree.get<std::string> ("ledger_connection"));
	ASSERT_EQ (100, tree.get<unsigned> ("reconciler_batch_size"));
}

TEST (node_config, unversioned)
{
	escrow::jsonconfig tree;
	escrow::jsonconfig logging_l;
	escrow::logging ().serialize_json (logging_l);
	tree.put_child ("logging", logging_l);
	escrow::node_config config;
	bool upgraded (false);
	ASSERT_FALSE (config.deserialize_json (upgraded, tree));
	ASSERT_TRUE (upgraded);
	ASSERT_TRUE (tree.has_key ("reconciler_start_height"));
}

TEST (node_config, validation)
{
	escrow::node_config config1;
	escrow::jsonconfig tree;
	config1.serialize_json (tree);
	tree.put ("verification_attempts_max", 0);
	escrow::node_config config2;
	bool upgraded (false);
	auto error (config2.deserialize_json (upgraded, tree));
	ASSERT_TRUE (error);
	ASSERT_EQ ("verification_attempts_max must be non-zero", error.get_message ());
	escrow::jsonconfig tree2;
	config1.serialize_json (tree2);
	tree2.put ("ledger_connection", "");
	escrow::node_config config3;
	ASSERT_TRUE (config3.deserialize_json (upgraded, tree2));
}

TEST (node_config, unknown_version)
{
	escrow::node_config config1;
	escrow::jsonconfig tree;
	config1.serialize_json (tree);
	tree.put ("version", 7);
	escrow::node_config config2;
	bool upgraded (false);
	ASSERT_TRUE (config2.deserialize_json (upgraded, tree));
}

TEST (daemon_config, defaults)
{
	auto path (escrow::unique_path ());
	escrow::daemon_config config (path);
	escrow::jsonconfig tree;
	bool upgraded (false);
	ASSERT_FALSE (config.deserialize_json (upgraded, tree));
	ASSERT_TRUE (upgraded);
	ASSERT_TRUE (tree.get_optional_child ("node"));
	ASSERT_TRUE (tree.get_optional_child ("ledger"));
	escrow::keypair admin (config.ledger.admin_key);
	ASSERT_EQ (admin.pub, config.ledger.fee_recipient);
	ASSERT_TRUE (config.ledger.custodial_key.empty ());
	ASSERT_EQ (escrow::ledger::default_fee_bps, config.ledger.fee_bps);
	ASSERT_EQ (escrow::ledger::default_timeout, config.ledger.timeout_duration);
}

TEST (daemon_config, read_and_update)
{
	auto path (escrow::unique_path ());
	boost::filesystem::create_directories (path);
	escrow::daemon_config config1 (path);
	ASSERT_FALSE (escrow::read_and_update_daemon_config (path, config1));
	ASSERT_TRUE (boost::filesystem::exists (escrow::get_config_path (path)));
	escrow::daemon_config config2 (path);
	ASSERT_FALSE (escrow::read_and_update_daemon_config (path, config2));
	ASSERT_EQ (config1.ledger.admin_key, config2.ledger.admin_key);
	ASSERT_EQ (config1.node.confirmations, config2.node.confirmations);
}

TEST (daemon_config, ledger_validation)
{
	escrow::daemon_config config1 (escrow::unique_path ());
	config1.ledger.fee_bps = escrow::ledger::max_fee_bps + 1;
	escrow::jsonconfig tree;
	config1.serialize_json (tree);
	escrow::daemon_config config2 (escrow::unique_path ());
	bool upgraded (false);
	auto error1 (config2.deserialize_json (upgraded, tree));
	ASSERT_EQ ("fee_bps must not exceed 1000", error1.get_message ());

	escrow::daemon_config config3 (escrow::unique_path ());
	config3.ledger.timeout_duration = escrow::ledger::min_timeout - 1;
	escrow::jsonconfig tree3;
	config3.serialize_json (tree3);
	escrow::daemon_config config4 (escrow::unique_path ());
	ASSERT_TRUE (config4.deserialize_json (upgraded, tree3));

	escrow::daemon_config config5 (escrow::unique_path ());
	config5.ledger.admin_key = "not a key";
	escrow::jsonconfig tree5;
	config5.serialize_json (tree5);
	escrow::daemon_config config6 (escrow::unique_path ());
	ASSERT_TRUE (config6.deserialize_json (upgraded, tree5));
}
