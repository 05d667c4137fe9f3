#include <tokend/node/testing.hpp>
#include <tokend/proposals.hpp>

#include <boost/test/unit_test.hpp>

#include <set>

namespace
{
class proposals_fixture
{
public:
	proposals_fixture () :
	requestor (tokend::test_address ('Q')),
	approver1 (tokend::test_address ('1')),
	approver2 (tokend::test_address ('2')),
	approver3 (tokend::test_address ('3')),
	outsider (tokend::test_address ('O')),
	engine (make_members (), make_requirements (), std::unique_ptr<tokend::id_generator> (new tokend::sequence_id_generator))
	{
	}
	tokend::members make_members () const
	{
		tokend::members result;
		result.burners = { approver1, approver2, approver3 };
		result.minters = { approver1 };
		return result;
	}
	tokend::requirements make_requirements () const
	{
		tokend::requirements result;
		result.burn_approvals = 2;
		return result;
	}
	std::string requestor;
	std::string approver1;
	std::string approver2;
	std::string approver3;
	std::string outsider;
	tokend::proposals engine;
};
}

BOOST_FIXTURE_TEST_SUITE (proposals, proposals_fixture)

BOOST_AUTO_TEST_CASE (default_requirements)
{
	tokend::requirements requirements;
	BOOST_CHECK_EQUAL (requirements.burn_approvals, 1);
	BOOST_CHECK_EQUAL (requirements.mint_approvals, 1);
}

BOOST_AUTO_TEST_CASE (membership)
{
	BOOST_CHECK (engine.can_burn (approver2).code == tokend::process_result::progress);
	BOOST_CHECK (engine.can_mint (approver1).code == tokend::process_result::progress);
	auto burn (engine.can_burn (outsider));
	BOOST_CHECK (burn.code == tokend::process_result::unauthorized);
	BOOST_CHECK_EQUAL (burn.message, "Address '" + outsider + "' unauthorized to burn tokens");
	auto mint (engine.can_mint (approver2));
	BOOST_CHECK (mint.code == tokend::process_result::unauthorized);
	BOOST_CHECK (tokend::category (mint.code) == tokend::error_category::authorization);
	BOOST_CHECK_EQUAL (mint.message, "Address '" + approver2 + "' unauthorized to mint tokens");
}

BOOST_AUTO_TEST_CASE (create)
{
	auto request (engine.create_burn_request (requestor, 5));
	BOOST_REQUIRE (request.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (request.proposal.id, "proposal_0");
	BOOST_CHECK_EQUAL (request.proposal.requestor, requestor);
	BOOST_CHECK_EQUAL (request.proposal.quantity, 5);
	BOOST_CHECK (request.proposal.approvals.empty ());
	BOOST_CHECK (!request.proposal.approved);
	auto stored (engine.get_proposal (tokend::proposal_type::burn, requestor, "proposal_0"));
	BOOST_CHECK (stored.code == tokend::process_result::progress);
	BOOST_CHECK_EQUAL (stored.proposal.quantity, 5);
	auto second (engine.create_burn_request (requestor, 6));
	BOOST_CHECK_EQUAL (second.proposal.id, "proposal_1");
	BOOST_CHECK_EQUAL (engine.burn_requests[requestor].size (), 2);
}

BOOST_AUTO_TEST_CASE (create_invalid)
{
	auto zero (engine.create_burn_request (requestor, 0));
	BOOST_CHECK (zero.code == tokend::process_result::invalid_quantity);
	BOOST_CHECK_EQUAL (zero.message, "Cannot add Burn request. Burn request 'Quantity' must be greater than 0.");
	auto address (engine.create_burn_request ("requestor", 5));
	BOOST_CHECK (address.code == tokend::process_result::invalid_address);
	BOOST_CHECK_EQUAL (address.message, "Cannot add Burn request. Burn request 'Requestor' address must be 43 characters.");
	BOOST_CHECK (engine.burn_requests.empty ());
}

BOOST_AUTO_TEST_CASE (not_found)
{
	auto missing (engine.get_proposal (tokend::proposal_type::burn, requestor, "proposal_9"));
	BOOST_CHECK (missing.code == tokend::process_result::proposal_not_found);
	BOOST_CHECK_EQUAL (missing.message, "Burn request with ID 'proposal_9' does not exist for address '" + requestor + "'");
	auto mint (engine.get_proposal (tokend::proposal_type::mint, requestor, "proposal_9"));
	BOOST_CHECK_EQUAL (mint.message, "Mint request with ID 'proposal_9' does not exist for address '" + requestor + "'");
	auto approval (engine.approve_burn_request (approver1, requestor, "proposal_9"));
	BOOST_CHECK (approval.code == tokend::process_result::proposal_not_found);
	BOOST_CHECK (tokend::category (approval.code) == tokend::error_category::not_found);
}

BOOST_AUTO_TEST_CASE (quorum)
{
	auto request (engine.create_burn_request (requestor, 5));
	auto first (engine.approve_burn_request (approver1, requestor, request.proposal.id));
	BOOST_REQUIRE (first.code == tokend::process_result::progress);
	BOOST_CHECK (!first.proposal.approved);
	BOOST_CHECK (!first.transitioned);
	auto second (engine.approve_burn_request (approver2, requestor, request.proposal.id));
	BOOST_REQUIRE (second.code == tokend::process_result::progress);
	BOOST_CHECK (second.proposal.approved);
	BOOST_CHECK (second.transitioned);
	BOOST_CHECK_EQUAL (second.proposal.approvals.size (), 2);
	auto third (engine.approve_burn_request (approver3, requestor, request.proposal.id));
	BOOST_REQUIRE (third.code == tokend::process_result::progress);
	BOOST_CHECK (third.proposal.approved);
	BOOST_CHECK (!third.transitioned);
	auto stored (engine.get_proposal (tokend::proposal_type::burn, requestor, request.proposal.id));
	std::vector<std::string> expected{ approver1, approver2, approver3 };
	BOOST_CHECK (stored.proposal.approvals == expected);
}

BOOST_AUTO_TEST_CASE (single_approval_default)
{
	tokend::members members;
	members.burners = { approver1 };
	tokend::proposals single (members, tokend::requirements (), std::unique_ptr<tokend::id_generator> (new tokend::sequence_id_generator));
	auto request (single.create_burn_request (requestor, 1));
	auto approval (single.approve_burn_request (approver1, requestor, request.proposal.id));
	BOOST_CHECK (approval.code == tokend::process_result::progress);
	BOOST_CHECK (approval.transitioned);
}

BOOST_AUTO_TEST_CASE (unauthorized_approval)
{
	auto request (engine.create_burn_request (requestor, 5));
	auto approval (engine.approve_burn_request (outsider, requestor, request.proposal.id));
	BOOST_CHECK (approval.code == tokend::process_result::unauthorized);
	BOOST_CHECK (engine.get_proposal (tokend::proposal_type::burn, requestor, request.proposal.id).proposal.approvals.empty ());
}

BOOST_AUTO_TEST_CASE (duplicate_rejected)
{
	auto request (engine.create_burn_request (requestor, 5));
	engine.approve_burn_request (approver1, requestor, request.proposal.id);
	auto again (engine.approve_burn_request (approver1, requestor, request.proposal.id));
	BOOST_CHECK (again.code == tokend::process_result::duplicate_approval);
	BOOST_CHECK_EQUAL (again.message, "Address '" + approver1 + "' already approved burn request with ID '" + request.proposal.id + "'");
	auto stored (engine.get_proposal (tokend::proposal_type::burn, requestor, request.proposal.id));
	BOOST_CHECK_EQUAL (stored.proposal.approvals.size (), 1);
	BOOST_CHECK (!stored.proposal.approved);
}

BOOST_AUTO_TEST_CASE (duplicate_counted_when_allowed)
{
	engine.deduplicate_approvals = false;
	auto request (engine.create_burn_request (requestor, 5));
	engine.approve_burn_request (approver1, requestor, request.proposal.id);
	auto again (engine.approve_burn_request (approver1, requestor, request.proposal.id));
	BOOST_CHECK (again.code == tokend::process_result::progress);
	BOOST_CHECK (again.transitioned);
}

BOOST_AUTO_TEST_CASE (check_approval_is_pure)
{
	auto request (engine.create_burn_request (requestor, 5));
	engine.approve_burn_request (approver1, requestor, request.proposal.id);
	auto check (engine.check_approval (approver2, requestor, request.proposal.id));
	BOOST_CHECK (check.code == tokend::process_result::progress);
	BOOST_CHECK (check.transitioned);
	auto stored (engine.get_proposal (tokend::proposal_type::burn, requestor, request.proposal.id));
	BOOST_CHECK_EQUAL (stored.proposal.approvals.size (), 1);
	BOOST_CHECK (!stored.proposal.approved);
}

BOOST_AUTO_TEST_CASE (blake2_ids)
{
	tokend::blake2_id_generator generator;
	std::set<std::string> ids;
	for (auto i (0); i < 16; ++i)
	{
		auto id (generator.generate (requestor));
		BOOST_CHECK_EQUAL (id.size (), 43);
		BOOST_CHECK (id.find_first_not_of ("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_") == std::string::npos);
		ids.insert (id);
	}
	BOOST_CHECK_EQUAL (ids.size (), 16);
	BOOST_CHECK_EQUAL (generator.sequence, 16);
}

BOOST_AUTO_TEST_CASE (base64url)
{
	uint8_t bytes[] = { 0xfb, 0xff };
	BOOST_CHECK_EQUAL (tokend::encode_base64url (bytes, sizeof (bytes)), "-_8");
}

BOOST_AUTO_TEST_SUITE_END ()
