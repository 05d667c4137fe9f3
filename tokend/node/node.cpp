#include <tokend/node/node.hpp>

#include <boost/format.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <atomic>
#include <iostream>

unsigned constexpr tokend::process_config::json_version;

tokend::logging::logging () :
ledger_logging_value (true),
proposal_logging_value (true),
notice_logging_value (false),
log_to_cerr_value (false),
flush (true),
max_size (128 * 1024 * 1024),
rotation_size (4 * 1024 * 1024)
{
}

void tokend::logging::init (boost::filesystem::path const & application_path_a)
{
	static std::atomic_flag logging_already_added = ATOMIC_FLAG_INIT;
	if (!logging_already_added.test_and_set ())
	{
		boost::log::add_common_attributes ();
		if (log_to_cerr ())
		{
			boost::log::add_console_log (std::cerr, boost::log::keywords::format = "[%TimeStamp%]: %Message%");
		}
		boost::log::add_file_log (boost::log::keywords::target = application_path_a / "log", boost::log::keywords::file_name = application_path_a / "log" / "log_%Y-%m-%d_%H-%M-%S.%N.log", boost::log::keywords::rotation_size = rotation_size, boost::log::keywords::auto_flush = flush, boost::log::keywords::scan_method = boost::log::sinks::file::scan_method::scan_matching, boost::log::keywords::max_size = max_size, boost::log::keywords::format = "[%TimeStamp%]: %Message%");
	}
}

void tokend::logging::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("version", "1");
	tree_a.put ("ledger", ledger_logging_value);
	tree_a.put ("proposal", proposal_logging_value);
	tree_a.put ("notice", notice_logging_value);
	tree_a.put ("log_to_cerr", log_to_cerr_value);
	tree_a.put ("max_size", max_size);
	tree_a.put ("rotation_size", rotation_size);
	tree_a.put ("flush", flush);
}

bool tokend::logging::upgrade_json (unsigned version_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	switch (version_a)
	{
		case 1:
			break;
		default:
			throw std::runtime_error ("Unknown logging_config version");
			break;
	}
	return result;
}

bool tokend::logging::deserialize_json (bool & upgraded_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	try
	{
		auto version_l (tree_a.get_optional<std::string> ("version"));
		if (!version_l)
		{
			tree_a.put ("version", "1");
			version_l = "1";
			upgraded_a = true;
		}
		upgraded_a |= upgrade_json (std::stoull (version_l.get ()), tree_a);
		ledger_logging_value = tree_a.get<bool> ("ledger");
		proposal_logging_value = tree_a.get<bool> ("proposal");
		notice_logging_value = tree_a.get<bool> ("notice");
		log_to_cerr_value = tree_a.get<bool> ("log_to_cerr");
		max_size = tree_a.get<uintmax_t> ("max_size");
		rotation_size = tree_a.get<uintmax_t> ("rotation_size");
		flush = tree_a.get<bool> ("flush");
	}
	catch (std::runtime_error const &)
	{
		result = true;
	}
	catch (std::logic_error const &)
	{
		// std::stoull on a malformed version
		result = true;
	}
	return result;
}

bool tokend::logging::ledger_logging () const
{
	return ledger_logging_value;
}

bool tokend::logging::proposal_logging () const
{
	return proposal_logging_value;
}

bool tokend::logging::notice_logging () const
{
	return notice_logging_value;
}

bool tokend::logging::log_to_cerr () const
{
	return log_to_cerr_value;
}

tokend::process_config::process_config () :
process_id (tokend::default_process_id),
send_error_notices (true),
deduplicate_approvals (true)
{
	token.name = "Token";
	token.ticker = "TKD";
	token.denomination = 12;
	if (!process_id.empty ())
	{
		members.minters.insert (process_id);
	}
	switch (tokend::tokend_network)
	{
		case tokend::tokend_networks::tokend_test_network:
			logging.log_to_cerr_value = true;
			break;
		case tokend::tokend_networks::tokend_live_network:
			break;
	}
}

void tokend::process_config::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("version", std::to_string (json_version));
	tree_a.put ("process_id", process_id);
	boost::property_tree::ptree token_l;
	token_l.put ("name", token.name);
	token_l.put ("ticker", token.ticker);
	token_l.put ("denomination", token.denomination);
	token_l.put ("logo", token.logo);
	boost::property_tree::ptree balances_l;
	for (auto & i : balances)
	{
		balances_l.put (boost::property_tree::ptree::path_type (i.first, '\0'), tokend::encode_dec (i.second));
	}
	token_l.add_child ("balances", balances_l);
	tree_a.add_child ("token", token_l);
	boost::property_tree::ptree members_l;
	boost::property_tree::ptree burners_l;
	for (auto & i : members.burners)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i);
		burners_l.push_back (std::make_pair ("", entry));
	}
	members_l.add_child ("burners", burners_l);
	boost::property_tree::ptree minters_l;
	for (auto & i : members.minters)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i);
		minters_l.push_back (std::make_pair ("", entry));
	}
	members_l.add_child ("minters", minters_l);
	tree_a.add_child ("members", members_l);
	boost::property_tree::ptree requirements_l;
	requirements_l.put ("burn_approvals", requirements.burn_approvals);
	requirements_l.put ("mint_approvals", requirements.mint_approvals);
	tree_a.add_child ("requirements", requirements_l);
	boost::property_tree::ptree targets_l;
	for (auto & i : authorized_external_targets)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i);
		targets_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("authorized_external_targets", targets_l);
	tree_a.put ("send_error_notices", send_error_notices);
	tree_a.put ("deduplicate_approvals", deduplicate_approvals);
	boost::property_tree::ptree logging_l;
	logging.serialize_json (logging_l);
	tree_a.add_child ("logging", logging_l);
}

bool tokend::process_config::upgrade_json (unsigned version_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	switch (version_a)
	{
		case 1:
			tree_a.put ("deduplicate_approvals", deduplicate_approvals);
			tree_a.erase ("version");
			tree_a.put ("version", "2");
			result = true;
		case 2:
			break;
		default:
			throw std::runtime_error ("Unknown process_config version");
			break;
	}
	return result;
}

bool tokend::process_config::deserialize_json (bool & upgraded_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	try
	{
		if (!tree_a.empty ())
		{
			auto version_l (tree_a.get_optional<std::string> ("version"));
			if (!version_l)
			{
				tree_a.put ("version", "1");
				version_l = "1";
			}
			upgraded_a |= upgrade_json (std::stoull (version_l.get ()), tree_a);
			process_id = tree_a.get<std::string> ("process_id");
			std::string error;
			result = tokend::address_type ("Cannot load configuration.", "Field 'process_id'").assert_value (tokend::value (process_id), error);
			auto & token_l (tree_a.get_child ("token"));
			token.name = token_l.get<std::string> ("name");
			token.ticker = token_l.get<std::string> ("ticker");
			token.denomination = token_l.get<int64_t> ("denomination");
			token.logo = token_l.get<std::string> ("logo", "");
			result = result || token.denomination <= 0 || token.denomination > tokend::max_denomination;
			balances.clear ();
			auto balances_l (token_l.get_child_optional ("balances"));
			if (balances_l)
			{
				for (auto & i : *balances_l)
				{
					tokend::quantity balance;
					result = result || tokend::decode_dec (i.second.data (), balance) || balance < 0;
					balances[i.first] = balance;
				}
			}
			auto & members_l (tree_a.get_child ("members"));
			members.burners.clear ();
			for (auto & i : members_l.get_child ("burners"))
			{
				members.burners.insert (i.second.data ());
			}
			members.minters.clear ();
			for (auto & i : members_l.get_child ("minters"))
			{
				members.minters.insert (i.second.data ());
			}
			requirements.burn_approvals = tree_a.get<uint64_t> ("requirements.burn_approvals");
			requirements.mint_approvals = tree_a.get<uint64_t> ("requirements.mint_approvals");
			result = result || requirements.burn_approvals == 0 || requirements.mint_approvals == 0;
			authorized_external_targets.clear ();
			for (auto & i : tree_a.get_child ("authorized_external_targets"))
			{
				authorized_external_targets.push_back (i.second.data ());
			}
			send_error_notices = tree_a.get<bool> ("send_error_notices");
			deduplicate_approvals = tree_a.get<bool> ("deduplicate_approvals");
			auto & logging_l (tree_a.get_child ("logging"));
			result = logging.deserialize_json (upgraded_a, logging_l) || result;
		}
		else
		{
			upgraded_a = true;
			serialize_json (tree_a);
		}
	}
	catch (std::runtime_error const &)
	{
		result = true;
	}
	catch (std::logic_error const &)
	{
		result = true;
	}
	return result;
}

bool tokend::process_init::error () const
{
	return ledger_init.code != tokend::process_result::progress;
}

tokend::process::process (tokend::process_init & init_a, boost::asio::io_service & service_a, tokend::process_config const & config_a) :
service (service_a),
strand (service_a),
config (config_a),
proposals (config.members, config.requirements),
handlers (ledger, proposals, transfers, config.logging)
{
	init_a.ledger_init = ledger.init (config.token, config.balances);
	proposals.deduplicate_approvals = config.deduplicate_approvals;
	transfers.add_targets (config.authorized_external_targets);
	if (init_a.error ())
	{
		BOOST_LOG (config.logging.log) << boost::str (boost::format ("Unable to initialize token: %1%") % init_a.ledger_init.message);
	}
	else
	{
		BOOST_LOG (config.logging.log) << boost::str (boost::format ("Process %1% initialized %2% (%3%) with %4% balances, total supply %5%") % config.process_id % config.token.name % config.token.ticker % ledger.balances ().size () % tokend::encode_dec (ledger.total_supply ()));
	}
}

tokend::handler_result tokend::process::dispatch (tokend::message const & message_a)
{
	auto result (handlers.handle (message_a));
	if (result.code != tokend::process_result::progress)
	{
		BOOST_LOG (config.logging.log) << boost::str (boost::format ("Action '%1%' %2% from '%3%' failed with %4%: %5%") % message_a.action () % message_a.id % message_a.from % tokend::to_string (result.code) % result.message);
		if (config.send_error_notices)
		{
			result.notices.push_back (tokend::notice (message_a.from, message_a.action () + "-Error", { { "Message-Id", message_a.id }, { "Error", result.message }, { "Error-Code", tokend::to_string (result.code) } }));
		}
	}
	for (auto & i : result.notices)
	{
		if (config.logging.notice_logging ())
		{
			BOOST_LOG (config.logging.log) << boost::str (boost::format ("Sending notice %1%") % i.to_json ());
		}
		std::vector<std::function<void(tokend::notice const &)>> observers_l;
		{
			std::lock_guard<std::mutex> lock (observers.notice.mutex);
			observers_l = observers.notice.observers;
		}
		// Delivery failures never roll back a committed action and never stop delivery to the remaining observers
		for (auto & j : observers_l)
		{
			try
			{
				j (i);
			}
			catch (std::exception const & e)
			{
				BOOST_LOG (config.logging.log) << boost::str (boost::format ("Notice observer failed for '%1%' to %2%: %3%") % i.action % i.target % e.what ());
			}
		}
	}
	try
	{
		observers.processed (message_a, result);
	}
	catch (std::exception const & e)
	{
		BOOST_LOG (config.logging.log) << boost::str (boost::format ("Result observer failed for message %1%: %2%") % message_a.id % e.what ());
	}
	return result;
}

void tokend::process::post (tokend::message const & message_a, std::function<void(tokend::handler_result const &)> const & action_a)
{
	strand.post ([this, message_a, action_a]() {
		auto result (dispatch (message_a));
		action_a (result);
	});
}

tokend::thread_runner::thread_runner (boost::asio::io_service & service_a, unsigned service_threads_a)
{
	for (auto i (0u); i < service_threads_a; ++i)
	{
		threads.push_back (std::thread ([&service_a]() {
			try
			{
				service_a.run ();
			}
			catch (std::exception const & e)
			{
				std::cerr << "Unhandled service exception: " << e.what () << std::endl;
				throw;
			}
		}));
	}
}

tokend::thread_runner::~thread_runner ()
{
	join ();
}

void tokend::thread_runner::join ()
{
	for (auto & i : threads)
	{
		if (i.joinable ())
		{
			i.join ();
		}
	}
}
