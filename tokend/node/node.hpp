#pragma once

#include <tokend/ledger.hpp>
#include <tokend/node/common.hpp>
#include <tokend/node/handlers.hpp>
#include <tokend/proposals.hpp>
#include <tokend/transfers.hpp>

#include <functional>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>

namespace tokend
{
class logging
{
public:
	logging ();
	void serialize_json (boost::property_tree::ptree &) const;
	bool deserialize_json (bool &, boost::property_tree::ptree &);
	bool upgrade_json (unsigned, boost::property_tree::ptree &);
	bool ledger_logging () const;
	bool proposal_logging () const;
	bool notice_logging () const;
	bool log_to_cerr () const;
	void init (boost::filesystem::path const &);

	bool ledger_logging_value;
	bool proposal_logging_value;
	bool notice_logging_value;
	bool log_to_cerr_value;
	bool flush;
	uintmax_t max_size;
	uintmax_t rotation_size;
	boost::log::sources::logger_mt log;
};
class process_config
{
public:
	process_config ();
	void serialize_json (boost::property_tree::ptree &) const;
	bool deserialize_json (bool &, boost::property_tree::ptree &);
	bool upgrade_json (unsigned, boost::property_tree::ptree &);
	// Address of this process, receives nothing by itself but is a minter by default
	std::string process_id;
	tokend::token_metadata token;
	tokend::balance_map balances;
	tokend::members members;
	tokend::requirements requirements;
	std::vector<std::string> authorized_external_targets;
	// Reply to the caller with <Action>-Error when an action fails
	bool send_error_notices;
	bool deduplicate_approvals;
	tokend::logging logging;
	static unsigned constexpr json_version = 2;
};
class process_init
{
public:
	bool error () const;
	tokend::process_return ledger_init;
};
class process_observers
{
public:
	tokend::observer_set<tokend::notice const &> notice;
	tokend::observer_set<tokend::message const &, tokend::handler_result const &> processed;
};
/**
 * One token process: a ledger, its proposal registry and external gate behind a strand
 * Messages are handled one at a time in arrival order, notices go out after the action committed.
 */
class process
{
public:
	process (tokend::process_init &, boost::asio::io_service &, tokend::process_config const &);
	// Handle the message on the calling thread
	tokend::handler_result dispatch (tokend::message const &);
	// Queue the message on the strand and hand the result to the callback
	void post (tokend::message const &, std::function<void(tokend::handler_result const &)> const &);
	boost::asio::io_service & service;
	boost::asio::io_service::strand strand;
	tokend::process_config config;
	tokend::ledger ledger;
	tokend::proposals proposals;
	tokend::external_transfers transfers;
	tokend::handlers handlers;
	tokend::process_observers observers;
};
class thread_runner
{
public:
	thread_runner (boost::asio::io_service &, unsigned);
	~thread_runner ();
	void join ();
	std::vector<std::thread> threads;
};
}
