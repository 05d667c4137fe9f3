#include <tokend/node/testing.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/test/unit_test.hpp>

#include <sstream>

namespace
{
tokend::process_config sample_config ()
{
	tokend::process_config result;
	result.process_id = tokend::test_address ('P');
	result.token = tokend::token_metadata{ "Points", "PNT", 6, "https://example.org/logo.png" };
	result.balances = { { tokend::test_address ('H'), tokend::quantity ("340282366920938463463374607431768211456") } };
	result.members.burners = { tokend::test_address ('1'), tokend::test_address ('2') };
	result.members.minters = { tokend::test_address ('M') };
	result.requirements.burn_approvals = 2;
	result.authorized_external_targets = { tokend::test_address ('B') };
	result.send_error_notices = false;
	result.deduplicate_approvals = false;
	result.logging.log_to_cerr_value = false;
	result.logging.notice_logging_value = true;
	return result;
}
}

BOOST_AUTO_TEST_SUITE (node)

BOOST_AUTO_TEST_CASE (config_defaults)
{
	tokend::process_config config;
	BOOST_CHECK_EQUAL (config.token.denomination, 12);
	BOOST_CHECK (config.send_error_notices);
	BOOST_CHECK (config.deduplicate_approvals);
	BOOST_CHECK_EQUAL (config.requirements.burn_approvals, 1);
	BOOST_CHECK_EQUAL (config.process_id, tokend::default_process_id);
	BOOST_CHECK_EQUAL (tokend::test_process_id.size (), tokend::address_length);
}

BOOST_AUTO_TEST_CASE (config_serialization)
{
	auto config1 (sample_config ());
	boost::property_tree::ptree tree;
	config1.serialize_json (tree);
	BOOST_CHECK_EQUAL (tree.get<std::string> ("version"), "2");
	tokend::process_config config2;
	auto upgraded (false);
	BOOST_REQUIRE (!config2.deserialize_json (upgraded, tree));
	BOOST_CHECK (!upgraded);
	BOOST_CHECK_EQUAL (config2.process_id, config1.process_id);
	BOOST_CHECK_EQUAL (config2.token.name, "Points");
	BOOST_CHECK_EQUAL (config2.token.denomination, 6);
	BOOST_CHECK_EQUAL (config2.token.logo, config1.token.logo);
	BOOST_CHECK (config2.balances == config1.balances);
	BOOST_CHECK (config2.members.burners == config1.members.burners);
	BOOST_CHECK (config2.members.minters == config1.members.minters);
	BOOST_CHECK_EQUAL (config2.requirements.burn_approvals, 2);
	BOOST_CHECK (config2.authorized_external_targets == config1.authorized_external_targets);
	BOOST_CHECK (!config2.send_error_notices);
	BOOST_CHECK (!config2.deduplicate_approvals);
	BOOST_CHECK (config2.logging.notice_logging ());
	BOOST_CHECK (!config2.logging.log_to_cerr ());
}

BOOST_AUTO_TEST_CASE (config_empty_tree)
{
	tokend::process_config config;
	boost::property_tree::ptree tree;
	auto upgraded (false);
	BOOST_CHECK (!config.deserialize_json (upgraded, tree));
	BOOST_CHECK (upgraded);
	BOOST_CHECK_EQUAL (tree.get<std::string> ("version"), "2");
	BOOST_CHECK_EQUAL (tree.get<std::string> ("token.ticker"), "TKD");
}

BOOST_AUTO_TEST_CASE (config_upgrade_v1)
{
	boost::property_tree::ptree tree;
	sample_config ().serialize_json (tree);
	tree.erase ("deduplicate_approvals");
	tree.put ("version", "1");
	tokend::process_config config;
	auto upgraded (false);
	BOOST_REQUIRE (!config.deserialize_json (upgraded, tree));
	BOOST_CHECK (upgraded);
	BOOST_CHECK (config.deduplicate_approvals);
	BOOST_CHECK_EQUAL (tree.get<std::string> ("version"), "2");
	BOOST_CHECK_EQUAL (tree.get<bool> ("deduplicate_approvals"), true);
}

BOOST_AUTO_TEST_CASE (config_invalid)
{
	boost::property_tree::ptree tree;
	sample_config ().serialize_json (tree);
	auto bad_id (tree);
	bad_id.put ("process_id", "short");
	tokend::process_config config;
	auto upgraded (false);
	BOOST_CHECK (config.deserialize_json (upgraded, bad_id));
	auto bad_version (tree);
	bad_version.put ("version", "9");
	BOOST_CHECK (config.deserialize_json (upgraded, bad_version));
	auto bad_balance (tree);
	bad_balance.get_child ("token.balances").begin ()->second.put_value (std::string ("-4"));
	BOOST_CHECK (config.deserialize_json (upgraded, bad_balance));
	auto bad_denomination (tree);
	bad_denomination.put ("token.denomination", 4294967306);
	BOOST_CHECK (config.deserialize_json (upgraded, bad_denomination));
	auto wide_denomination (tree);
	wide_denomination.put ("token.denomination", 256);
	BOOST_CHECK (config.deserialize_json (upgraded, wide_denomination));
	auto bad_requirement (tree);
	bad_requirement.put ("requirements.burn_approvals", 0);
	BOOST_CHECK (config.deserialize_json (upgraded, bad_requirement));
	auto missing (tree);
	missing.erase ("members");
	BOOST_CHECK (config.deserialize_json (upgraded, missing));
}

BOOST_AUTO_TEST_CASE (logging_serialization)
{
	tokend::logging logging1;
	logging1.ledger_logging_value = false;
	logging1.max_size = 1024;
	boost::property_tree::ptree tree;
	logging1.serialize_json (tree);
	tokend::logging logging2;
	auto upgraded (false);
	BOOST_REQUIRE (!logging2.deserialize_json (upgraded, tree));
	BOOST_CHECK (!upgraded);
	BOOST_CHECK (!logging2.ledger_logging ());
	BOOST_CHECK (logging2.proposal_logging ());
	BOOST_CHECK_EQUAL (logging2.max_size, 1024);
	tree.put ("version", "x");
	BOOST_CHECK (logging2.deserialize_json (upgraded, tree));
}

BOOST_AUTO_TEST_CASE (fetch_object_file)
{
	auto path (tokend::unique_path ());
	boost::filesystem::create_directories (path);
	auto file (path / "config.json");
	{
		tokend::process_config config;
		std::fstream stream;
		BOOST_CHECK (!tokend::fetch_object (config, file, stream));
	}
	boost::property_tree::ptree written;
	{
		std::ifstream stream (file.string ());
		boost::property_tree::read_json (stream, written);
	}
	BOOST_CHECK_EQUAL (written.get<std::string> ("version"), "2");
	{
		std::ofstream stream (file.string (), std::ios_base::trunc);
		stream << "{ not json";
	}
	{
		tokend::process_config config;
		std::fstream stream;
		BOOST_CHECK (tokend::fetch_object (config, file, stream));
	}
	boost::filesystem::remove_all (path);
}

BOOST_AUTO_TEST_CASE (process_init)
{
	tokend::system system (sample_config ());
	BOOST_CHECK (!system.init.error ());
	BOOST_CHECK (!system.process.proposals.deduplicate_approvals);
	BOOST_CHECK (system.process.transfers.authorized (tokend::test_address ('B')));
	BOOST_CHECK_EQUAL (system.process.ledger.total_supply (), tokend::quantity ("340282366920938463463374607431768211456"));
}

BOOST_AUTO_TEST_CASE (process_init_error)
{
	auto config (sample_config ());
	config.balances[tokend::test_address ('N')] = -1;
	tokend::system system (config);
	BOOST_CHECK (system.init.error ());
	BOOST_CHECK (system.init.ledger_init.code == tokend::process_result::invalid_metadata);
}

BOOST_AUTO_TEST_CASE (processed_observer)
{
	tokend::system system (sample_config ());
	std::vector<std::string> processed;
	system.process.observers.processed.add ([&processed](tokend::message const & message_a, tokend::handler_result const & result_a) {
		processed.push_back (message_a.id + ":" + tokend::to_string (result_a.code));
	});
	system.send (tokend::test_address ('X'), { { "Action", "Dance" } });
	BOOST_REQUIRE_EQUAL (processed.size (), 1);
	BOOST_CHECK_EQUAL (processed[0], "message_0:unknown_action");
	// Error notices are switched off in this configuration
	BOOST_CHECK (system.notices.empty ());
}

BOOST_AUTO_TEST_CASE (failing_observer)
{
	tokend::system system (sample_config ());
	system.process.observers.notice.add ([](tokend::notice const &) {
		throw std::runtime_error ("delivery failed");
	});
	std::vector<std::string> delivered;
	system.process.observers.notice.add ([&delivered](tokend::notice const & notice_a) {
		delivered.push_back (notice_a.action);
	});
	auto result (system.send (tokend::test_address ('H'), { { "Action", "Transfer" }, { "Recipient", tokend::test_address ('R') }, { "Quantity", "5" } }));
	BOOST_CHECK (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (system.process.ledger.balances ().at (tokend::test_address ('R')), 5);
	BOOST_CHECK_EQUAL (system.notices.size (), 2);
	// Observers added after the failing one still see every notice
	BOOST_CHECK_EQUAL (delivered.size (), 2);
}

BOOST_AUTO_TEST_CASE (post_on_strand)
{
	tokend::system system (sample_config ());
	std::vector<tokend::handler_result> results;
	for (auto i (0); i < 3; ++i)
	{
		tokend::message message (tokend::test_address ('H'), "post_" + std::to_string (i), { { "Action", "Transfer" }, { "Recipient", tokend::test_address ('R') }, { "Quantity", "1" } });
		system.process.post (message, [&results](tokend::handler_result const & result_a) {
			results.push_back (result_a);
		});
	}
	BOOST_CHECK (results.empty ());
	system.service.run ();
	BOOST_REQUIRE_EQUAL (results.size (), 3);
	BOOST_CHECK_EQUAL (results[2].output.get<std::string> ("recipient_balance_new"), "3");
}

BOOST_AUTO_TEST_CASE (message_json)
{
	std::stringstream stream ("{\"From\": \"abc\", \"Id\": \"7\", \"Tags\": {\"Action\": \"Balance\", \"Target\": \"xyz\"}}");
	boost::property_tree::ptree tree;
	boost::property_tree::read_json (stream, tree);
	tokend::message message;
	BOOST_REQUIRE (!message.deserialize_json (tree));
	BOOST_CHECK_EQUAL (message.from, "abc");
	BOOST_CHECK_EQUAL (message.action (), "Balance");
	BOOST_CHECK_EQUAL (*message.tag ("Target"), "xyz");
	BOOST_CHECK (!message.tag ("Quantity"));
	tree.get_child ("Tags").put_child ("Nested.Inner", boost::property_tree::ptree ("x"));
	tokend::message nested;
	BOOST_CHECK (nested.deserialize_json (tree));
	tree.erase ("From");
	BOOST_CHECK (nested.deserialize_json (tree));
}

BOOST_AUTO_TEST_CASE (notice_json)
{
	tokend::notice notice ("abc", "Credit-Notice", { { "Quantity", "5" } });
	BOOST_CHECK_EQUAL (notice.to_json (), "{\"Target\":\"abc\",\"Action\":\"Credit-Notice\",\"Tags\":{\"Quantity\":\"5\"}}");
	tokend::notice response ("abc", "", {}, "20");
	boost::property_tree::ptree tree;
	response.serialize_json (tree);
	BOOST_CHECK (!tree.get_optional<std::string> ("Action"));
	BOOST_CHECK_EQUAL (tree.get<std::string> ("Data"), "20");
}

BOOST_AUTO_TEST_CASE (payload_quantity)
{
	tokend::message message ("abc", "1", { { "Action", "Transfer" }, { "Quantity", "12" } });
	auto payload (tokend::to_payload (message));
	BOOST_REQUIRE (payload.code == tokend::process_result::progress);
	BOOST_CHECK (tokend::equal (payload.payload["Quantity"], tokend::value (tokend::quantity (12))));
	BOOST_CHECK (tokend::equal (payload.payload["Caller"], tokend::value (std::string ("abc"))));
	tokend::message bad ("abc", "1", { { "Quantity", "twelve" } });
	auto failed (tokend::to_payload (bad));
	BOOST_CHECK (failed.code == tokend::process_result::invalid_quantity);
	BOOST_CHECK_EQUAL (failed.message, "Could not convert field 'Quantity' to quantity");
}

BOOST_AUTO_TEST_CASE (result_names)
{
	BOOST_CHECK_EQUAL (tokend::to_string (tokend::process_result::insufficient_balance), "insufficient_balance");
	BOOST_CHECK_EQUAL (tokend::to_string (tokend::error_category::state), "StateError");
	BOOST_CHECK_EQUAL (tokend::to_string (tokend::category (tokend::process_result::invalid_address)), "ValidationError");
	BOOST_CHECK_EQUAL (tokend::to_string (tokend::category (tokend::process_result::duplicate_approval)), "ConflictError");
}

BOOST_AUTO_TEST_SUITE_END ()
