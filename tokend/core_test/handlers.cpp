#include <tokend/node/testing.hpp>

#include <boost/test/unit_test.hpp>

namespace
{
class handlers_fixture
{
public:
	handlers_fixture () :
	holder (tokend::test_address ('H')),
	other (tokend::test_address ('O')),
	minter (tokend::test_address ('M')),
	approver1 (tokend::test_address ('1')),
	approver2 (tokend::test_address ('2')),
	bridge (tokend::test_address ('B')),
	outsider (tokend::test_address ('X')),
	system (make_config ())
	{
		BOOST_REQUIRE (!system.init.error ());
	}
	tokend::process_config make_config () const
	{
		tokend::process_config result;
		result.process_id = tokend::test_address ('P');
		result.token = tokend::token_metadata{ "Points", "PNT", 3, "" };
		result.balances = { { holder, 190 }, { other, 1 } };
		result.members.minters = { minter };
		result.members.burners = { approver1, approver2 };
		result.requirements.burn_approvals = 2;
		result.authorized_external_targets = { bridge };
		result.logging.log_to_cerr_value = false;
		return result;
	}
	tokend::quantity balance (std::string const & address_a)
	{
		auto existing (system.process.ledger.balances ().find (address_a));
		return existing != system.process.ledger.balances ().end () ? existing->second : tokend::quantity (-1);
	}
	tokend::notice const * find (std::string const & target_a, std::string const & action_a) const
	{
		tokend::notice const * result (nullptr);
		for (auto & i : system.notices)
		{
			if (i.target == target_a && i.action == action_a)
			{
				result = &i;
			}
		}
		return result;
	}
	std::string holder;
	std::string other;
	std::string minter;
	std::string approver1;
	std::string approver2;
	std::string bridge;
	std::string outsider;
	tokend::system system;
};
}

BOOST_FIXTURE_TEST_SUITE (handlers, handlers_fixture)

BOOST_AUTO_TEST_CASE (mint_then_balance)
{
	auto target (tokend::test_address ('T'));
	auto minted (system.send (minter, { { "Action", "Mint" }, { "Target", target }, { "Quantity", "20" } }));
	BOOST_REQUIRE (minted.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (minted.output.get<std::string> ("balance_old"), "0");
	BOOST_CHECK_EQUAL (minted.output.get<std::string> ("balance_new"), "20");
	auto mint_notice (find (minter, ""));
	BOOST_REQUIRE (mint_notice != nullptr);
	BOOST_CHECK_EQUAL (mint_notice->data, "Successfully minted 20 PNT to '" + target + "'");
	auto balance (system.send (outsider, { { "Action", "Balance" }, { "Target", target } }));
	BOOST_REQUIRE (balance.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (balance.output.get<std::string> ("Balance"), "20");
	BOOST_CHECK_EQUAL (balance.output.get<std::string> ("Ticker"), "PNT");
	auto balance_notice (find (outsider, ""));
	BOOST_REQUIRE (balance_notice != nullptr);
	BOOST_CHECK_EQUAL (balance_notice->data, "20");
}

BOOST_AUTO_TEST_CASE (balance_defaults_to_caller)
{
	auto result (system.send (holder, { { "Action", "Balance" } }));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("Target"), holder);
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("Balance"), "190");
	auto unknown (system.send (outsider, { { "Action", "Balance" } }));
	BOOST_CHECK_EQUAL (unknown.output.get<std::string> ("Balance"), "0");
}

BOOST_AUTO_TEST_CASE (mint_unauthorized)
{
	auto result (system.send (outsider, { { "Action", "Mint" }, { "Target", outsider }, { "Quantity", "20" } }));
	BOOST_CHECK (result.code == tokend::process_result::unauthorized);
	BOOST_CHECK_EQUAL (result.message, "Address '" + outsider + "' unauthorized to mint tokens");
	BOOST_CHECK_EQUAL (balance (outsider), -1);
	auto error (find (outsider, "Mint-Error"));
	BOOST_REQUIRE (error != nullptr);
	BOOST_CHECK_EQUAL (error->tags.at ("Message-Id"), "message_0");
	BOOST_CHECK_EQUAL (error->tags.at ("Error-Code"), "unauthorized");
	BOOST_CHECK_EQUAL (error->tags.at ("Error"), result.message);
}

BOOST_AUTO_TEST_CASE (transfer_partial)
{
	auto result (system.send (holder, { { "Action", "Transfer" }, { "Recipient", other }, { "Quantity", "1" } }));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("sender_balance_old"), "190");
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("sender_balance_new"), "189");
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("recipient_balance_old"), "1");
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("recipient_balance_new"), "2");
	BOOST_CHECK_EQUAL (system.count (holder, "Debit-Notice"), 1);
	BOOST_CHECK_EQUAL (system.count (other, "Credit-Notice"), 1);
	auto credit (find (other, "Credit-Notice"));
	BOOST_REQUIRE (credit != nullptr);
	BOOST_CHECK_EQUAL (credit->tags.at ("Sender"), holder);
	BOOST_CHECK_EQUAL (credit->tags.at ("Quantity"), "1");
}

BOOST_AUTO_TEST_CASE (transfer_exceeds_balance)
{
	auto result (system.send (holder, { { "Action", "Transfer" }, { "Recipient", other }, { "Quantity", "191" } }));
	BOOST_CHECK (result.code == tokend::process_result::insufficient_balance);
	BOOST_CHECK_EQUAL (balance (holder), 190);
	BOOST_CHECK_EQUAL (balance (other), 1);
	BOOST_CHECK_EQUAL (system.count (holder, "Debit-Notice"), 0);
	BOOST_CHECK_EQUAL (system.count (holder, "Transfer-Error"), 1);
}

BOOST_AUTO_TEST_CASE (transfer_fields)
{
	auto missing (system.send (holder, { { "Action", "Transfer" }, { "Quantity", "1" } }));
	BOOST_CHECK (missing.code == tokend::process_result::invalid_address);
	BOOST_CHECK_EQUAL (missing.message, "Cannot transfer tokens. Field 'Recipient' must be a string.");
	auto fraction (system.send (holder, { { "Action", "Transfer" }, { "Recipient", other }, { "Quantity", "1.5" } }));
	BOOST_CHECK (fraction.code == tokend::process_result::invalid_quantity);
	BOOST_CHECK_EQUAL (fraction.message, "Could not convert field 'Quantity' to quantity");
	auto zero (system.send (holder, { { "Action", "Transfer" }, { "Recipient", other }, { "Quantity", "0" } }));
	BOOST_CHECK (zero.code == tokend::process_result::invalid_quantity);
	BOOST_CHECK_EQUAL (zero.message, "Cannot transfer tokens. Field 'Quantity' must be greater than 0.");
	auto self (system.send (holder, { { "Action", "Transfer" }, { "Recipient", holder }, { "Quantity", "1" } }));
	BOOST_CHECK (self.code == tokend::process_result::self_transfer);
	BOOST_CHECK_EQUAL (balance (holder), 190);
}

BOOST_AUTO_TEST_CASE (action_type)
{
	auto result (system.send (holder, { { "Action", "Transfer" }, { "Action-Type", "SIDEWAYS" }, { "Recipient", other }, { "Quantity", "1" } }));
	BOOST_CHECK (result.code == tokend::process_result::invalid_field);
	BOOST_CHECK_EQUAL (result.message, "Field 'Action-Type' is invalid. Value provided: SIDEWAYS. Value must be one of the following: INTERNAL, EXTERNAL.");
	BOOST_CHECK_EQUAL (balance (holder), 190);
	std::string error;
	BOOST_CHECK (!tokend::check_action_type ("Action-Type", tokend::value (std::string ("APPROVAL")), { "NEW_REQUEST", "APPROVAL" }, error));
	BOOST_CHECK (tokend::check_action_type ("Action-Type", tokend::value (), { "NEW_REQUEST", "APPROVAL" }, error));
	BOOST_CHECK_EQUAL (error, "Field 'Action-Type' is invalid. Value provided: nil. Value must be one of the following: NEW_REQUEST, APPROVAL.");
}

BOOST_AUTO_TEST_CASE (unknown_action)
{
	auto result (system.send (holder, { { "Action", "Dance" } }));
	BOOST_CHECK (result.code == tokend::process_result::unknown_action);
	BOOST_CHECK_EQUAL (result.message, "Action 'Dance' is not supported");
	BOOST_CHECK_EQUAL (system.count (holder, "Dance-Error"), 1);
}

BOOST_AUTO_TEST_CASE (two_of_two_burn)
{
	auto request (system.send (holder, { { "Action", "Burn" }, { "Quantity", "1" } }));
	BOOST_REQUIRE (request.code == tokend::process_result::progress);
	auto id (request.output.get<std::string> ("id"));
	BOOST_CHECK_EQUAL (id, "proposal_0");
	BOOST_CHECK_EQUAL (system.count (approver1, "Burn-Request-Notice"), 1);
	BOOST_CHECK_EQUAL (system.count (approver2, "Burn-Request-Notice"), 1);
	auto request_notice (find (approver1, "Burn-Request-Notice"));
	BOOST_REQUIRE (request_notice != nullptr);
	BOOST_CHECK_EQUAL (request_notice->tags.at ("Burn-Request-Id"), id);
	BOOST_CHECK_EQUAL (request_notice->tags.at ("Requestor"), holder);
	BOOST_CHECK_EQUAL (request_notice->tags.at ("Quantity"), "1");
	std::map<std::string, std::string> approval{ { "Action", "Burn" }, { "Action-Type", "APPROVAL" }, { "Requestor", holder }, { "Burn-Request-Id", id } };
	auto first (system.send (approver1, approval));
	BOOST_REQUIRE (first.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (first.output.get<std::string> ("approved"), "false");
	BOOST_CHECK_EQUAL (balance (holder), 190);
	BOOST_CHECK_EQUAL (system.count (holder, "Debit-Notice"), 0);
	auto second (system.send (approver2, approval));
	BOOST_REQUIRE (second.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (second.output.get<std::string> ("balance_old"), "190");
	BOOST_CHECK_EQUAL (second.output.get<std::string> ("balance_new"), "189");
	BOOST_CHECK_EQUAL (balance (holder), 189);
	BOOST_CHECK_EQUAL (system.count (holder, "Debit-Notice"), 1);
	auto debit (find (holder, "Debit-Notice"));
	BOOST_REQUIRE (debit != nullptr);
	BOOST_CHECK_EQUAL (debit->tags.at ("Quantity"), "1");
	auto repeat (system.send (approver1, approval));
	BOOST_CHECK (repeat.code == tokend::process_result::duplicate_approval);
	BOOST_CHECK_EQUAL (balance (holder), 189);
	BOOST_CHECK_EQUAL (system.count (holder, "Debit-Notice"), 1);
}

BOOST_AUTO_TEST_CASE (burn_quorum_without_balance)
{
	auto request (system.send (holder, { { "Action", "Burn" }, { "Quantity", "500" } }));
	BOOST_REQUIRE (request.code == tokend::process_result::progress);
	std::map<std::string, std::string> approval{ { "Action", "Burn" }, { "Action-Type", "APPROVAL" }, { "Requestor", holder }, { "Burn-Request-Id", "proposal_0" } };
	BOOST_CHECK (system.send (approver1, approval).code == tokend::process_result::progress);
	auto second (system.send (approver2, approval));
	BOOST_CHECK (second.code == tokend::process_result::insufficient_balance);
	auto stored (system.process.proposals.get_proposal (tokend::proposal_type::burn, holder, "proposal_0"));
	BOOST_CHECK_EQUAL (stored.proposal.approvals.size (), 1);
	BOOST_CHECK (!stored.proposal.approved);
	BOOST_CHECK_EQUAL (balance (holder), 190);
}

BOOST_AUTO_TEST_CASE (burn_approval_errors)
{
	std::map<std::string, std::string> approval{ { "Action", "Burn" }, { "Action-Type", "APPROVAL" }, { "Requestor", holder }, { "Burn-Request-Id", "proposal_7" } };
	auto missing (system.send (approver1, approval));
	BOOST_CHECK (missing.code == tokend::process_result::proposal_not_found);
	auto outsider_result (system.send (outsider, approval));
	BOOST_CHECK (outsider_result.code == tokend::process_result::unauthorized);
	approval.erase ("Burn-Request-Id");
	auto no_id (system.send (approver1, approval));
	BOOST_CHECK (no_id.code == tokend::process_result::invalid_field);
	BOOST_CHECK_EQUAL (no_id.message, "Cannot process burn approval. Field 'Burn-Request-Id' must be a string.");
}

BOOST_AUTO_TEST_CASE (transfer_external)
{
	auto result (system.send (holder, { { "Action", "Transfer" }, { "Action-Type", "EXTERNAL" }, { "Process", bridge }, { "Recipient", other }, { "Quantity", "10" } }));
	BOOST_REQUIRE (result.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("sender_balance_old"), "190");
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("sender_balance_new"), "180");
	BOOST_CHECK_EQUAL (result.output.get<std::string> ("process"), bridge);
	BOOST_CHECK_EQUAL (balance (other), 1);
	BOOST_CHECK_EQUAL (system.process.ledger.total_supply (), 181);
	auto debit (find (holder, "Debit-Notice"));
	BOOST_REQUIRE (debit != nullptr);
	BOOST_CHECK_EQUAL (debit->tags.at ("Process"), bridge);
	auto credit (find (bridge, "Credit-Notice"));
	BOOST_REQUIRE (credit != nullptr);
	BOOST_CHECK_EQUAL (credit->tags.at ("Recipient"), other);
	BOOST_CHECK_EQUAL (credit->tags.at ("Sender"), holder);
}

BOOST_AUTO_TEST_CASE (transfer_external_unauthorized)
{
	auto result (system.send (holder, { { "Action", "Transfer" }, { "Action-Type", "EXTERNAL" }, { "Process", other }, { "Recipient", other }, { "Quantity", "10" } }));
	BOOST_CHECK (result.code == tokend::process_result::unauthorized_target);
	BOOST_CHECK_EQUAL (balance (holder), 190);
	BOOST_CHECK_EQUAL (system.count (other, "Credit-Notice"), 0);
}

BOOST_AUTO_TEST_CASE (queries)
{
	auto info (system.send (outsider, { { "Action", "Info" } }));
	BOOST_REQUIRE (info.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (info.output.get<std::string> ("Name"), "Points");
	BOOST_CHECK_EQUAL (info.output.get<std::string> ("Denomination"), "3");
	auto info_notice (find (outsider, ""));
	BOOST_REQUIRE (info_notice != nullptr);
	BOOST_CHECK_EQUAL (info_notice->tags.at ("Ticker"), "PNT");
	auto supply (system.send (outsider, { { "Action", "Total-Supply" } }));
	BOOST_CHECK_EQUAL (supply.output.get<std::string> ("Total-Supply"), "191");
	auto balances (system.send (outsider, { { "Action", "Balances" } }));
	BOOST_CHECK_EQUAL (balances.output.get<std::string> (holder), "190");
	BOOST_CHECK_EQUAL (balances.output.get<std::string> (other), "1");
	auto balances_notice (find (outsider, ""));
	BOOST_REQUIRE (balances_notice != nullptr);
	BOOST_CHECK (balances_notice->data.find ("\"" + holder + "\":\"190\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE (conservation)
{
	auto before (system.process.ledger.total_supply ());
	system.send (minter, { { "Action", "Mint" }, { "Target", other }, { "Quantity", "40" } });
	system.send (holder, { { "Action", "Transfer" }, { "Recipient", other }, { "Quantity", "25" } });
	system.send (other, { { "Action", "Transfer" }, { "Recipient", outsider }, { "Quantity", "30" } });
	system.send (holder, { { "Action", "Burn" }, { "Quantity", "15" } });
	std::map<std::string, std::string> approval{ { "Action", "Burn" }, { "Action-Type", "APPROVAL" }, { "Requestor", holder }, { "Burn-Request-Id", "proposal_0" } };
	system.send (approver1, approval);
	system.send (approver2, approval);
	tokend::quantity expected (before + 40 - 15);
	BOOST_CHECK_EQUAL (system.process.ledger.total_supply (), expected);
	BOOST_CHECK_EQUAL (balance (holder), 150);
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_CASE (error_notices_disabled)
{
	tokend::process_config config;
	config.send_error_notices = false;
	config.logging.log_to_cerr_value = false;
	tokend::system system (config);
	auto result (system.send (tokend::test_address ('X'), { { "Action", "Dance" } }));
	BOOST_CHECK (result.code == tokend::process_result::unknown_action);
	BOOST_CHECK (system.notices.empty ());
}
