#pragma once

#include <escrow/lib/logger_mt.hpp>
#include <escrow/lib/utility.hpp>
#include <escrow/node/dispute.hpp>
#include <escrow/node/funding.hpp>
#include <escrow/node/nodeconfig.hpp>
#include <escrow/node/reconciler.hpp>
#include <escrow/node/stats.hpp>
#include <escrow/node/verifier.hpp>
#include <escrow/secure/common.hpp>
#include <escrow/secure/recordstore.hpp>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <memory>
#include <string>
#include <vector>

namespace escrow
{
class ledger_client;
class signer;

class node_observers final
{
public:
	/** Committed state changes, with the state the record left */
	escrow::observer_set<escrow::record const &, escrow::record_state> transition;
	/** Records surfaced for manual attention */
	escrow::observer_set<escrow::record const &, std::error_code const &> failure;
};

/** A record as presented to its parties */
class escrow_view final
{
public:
	void serialize_json (boost::property_tree::ptree &) const;
	escrow::record record;
	escrow::permissions permissions;
	std::vector<escrow::record_event> events;
};

/** One page of records ordered by id, total counts every match */
class escrow_page final
{
public:
	bool has_next () const;
	bool has_prev () const;
	std::vector<escrow::escrow_view> views;
	uint64_t total{ 0 };
	uint64_t page{ 1 };
	uint64_t limit{ 10 };
};

/** Compact JSON for event row payloads */
std::string json_payload (boost::property_tree::ptree const &);

class node_init final
{
public:
	bool error () const;
	bool store_init{ false };
};

class node final
{
public:
	node (escrow::node_init &, boost::filesystem::path const &, escrow::node_config const &, escrow::ledger_client &, std::shared_ptr<escrow::signer> = nullptr, std::shared_ptr<escrow::signer> = nullptr);
	~node ();
	void start ();
	void stop ();
	/** Opens a local record for a negotiated agreement, the new record is returned through the second argument */
	std::error_code escrow_create (escrow::agreement const &, escrow::record &);
	std::error_code escrow_status (uint64_t, uint64_t, uint64_t, escrow::escrow_view &);
	std::error_code escrow_by_agreement (uint64_t, uint64_t, uint64_t, escrow::escrow_view &);
	/** Records where the actor is a party, optionally only those in one state */
	void escrow_list (uint64_t, boost::optional<escrow::record_state> const &, uint64_t, uint64_t, uint64_t, escrow::escrow_page &);
	/** Every disputed record, viewed by an administrator */
	void dispute_list (uint64_t, uint64_t, uint64_t, escrow::escrow_page &);
	/** Funded records whose funding is older than the given number of seconds */
	std::vector<escrow::record> timeout_candidates (uint64_t);
	/** Records whose funding could not be verified within the attempt limit */
	std::vector<escrow::record> verification_failures ();
	/** Appends a row and fills in its sequence number */
	void event_append (escrow::transaction const &, escrow::record_event &);
	escrow::node_config config;
	boost::filesystem::path application_path;
	escrow::logger_mt logger;
	std::unique_ptr<escrow::record_store> store_impl;
	escrow::record_store & store;
	escrow::ledger_client & client;
	std::shared_ptr<escrow::signer> custodial_signer;
	std::shared_ptr<escrow::signer> admin_signer;
	escrow::stat stats;
	escrow::node_observers observers;
	escrow::transaction_verifier verifier;
	escrow::funding_coordinator funding;
	escrow::event_reconciler reconciler;
	escrow::dispute_resolver disputes;

private:
	void paginate (escrow::transaction const &, std::vector<escrow::record> const &, uint64_t, uint64_t, escrow::escrow_page &);
	std::error_code view (escrow::transaction const &, escrow::record const &, uint64_t, uint64_t, escrow::escrow_view &);
	bool stopped;
};
}
