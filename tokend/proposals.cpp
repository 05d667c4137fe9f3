#include <tokend/proposals.hpp>

#include <algorithm>

tokend::requirements::requirements () :
burn_approvals (1),
mint_approvals (1)
{
}

tokend::proposals::proposals (tokend::members const & members_a, tokend::requirements const & requirements_a, std::unique_ptr<tokend::id_generator> generator_a) :
members (members_a),
requirements (requirements_a),
deduplicate_approvals (true),
generator (std::move (generator_a))
{
}

tokend::process_return tokend::proposals::can_burn (std::string const & address_a) const
{
	tokend::process_return result{ tokend::process_result::progress, "" };
	if (members.burners.find (address_a) == members.burners.end ())
	{
		result.code = tokend::process_result::unauthorized;
		result.message = "Address '" + address_a + "' unauthorized to burn tokens";
	}
	return result;
}

tokend::process_return tokend::proposals::can_mint (std::string const & address_a) const
{
	tokend::process_return result{ tokend::process_result::progress, "" };
	if (members.minters.find (address_a) == members.minters.end ())
	{
		result.code = tokend::process_result::unauthorized;
		result.message = "Address '" + address_a + "' unauthorized to mint tokens";
	}
	return result;
}

tokend::proposal_return tokend::proposals::create_burn_request (std::string const & requestor_a, tokend::quantity const & quantity_a)
{
	tokend::proposal_return result{ tokend::process_result::progress, "", tokend::burn_proposal{ "", requestor_a, quantity_a, {}, false } };
	if (tokend::quantity_type ("Cannot add Burn request.", "Burn request 'Quantity'").assert_value (tokend::value (quantity_a), result.message))
	{
		result.code = tokend::process_result::invalid_quantity;
	}
	else if (tokend::address_type ("Cannot add Burn request.", "Burn request 'Requestor' address").assert_value (tokend::value (requestor_a), result.message))
	{
		result.code = tokend::process_result::invalid_address;
	}
	else
	{
		auto & requests (burn_requests[requestor_a]);
		auto id (generator->generate (requestor_a));
		while (requests.find (id) != requests.end ())
		{
			id = generator->generate (requestor_a);
		}
		result.proposal.id = id;
		requests[id] = result.proposal;
	}
	return result;
}

tokend::proposal_return tokend::proposals::get_proposal (tokend::proposal_type type_a, std::string const & requestor_a, std::string const & id_a) const
{
	tokend::proposal_return result{ tokend::process_result::progress, "", tokend::burn_proposal{ id_a, requestor_a, 0, {}, false } };
	auto & requests (type_a == tokend::proposal_type::burn ? burn_requests : mint_requests);
	auto found (false);
	auto existing (requests.find (requestor_a));
	if (existing != requests.end ())
	{
		auto proposal (existing->second.find (id_a));
		if (proposal != existing->second.end ())
		{
			found = true;
			result.proposal = proposal->second;
		}
	}
	if (!found)
	{
		result.code = tokend::process_result::proposal_not_found;
		result.message = std::string (type_a == tokend::proposal_type::burn ? "Burn" : "Mint") + " request with ID '" + id_a + "' does not exist for address '" + requestor_a + "'";
	}
	return result;
}

tokend::approval_return tokend::proposals::check_approval (std::string const & approver_a, std::string const & requestor_a, std::string const & id_a) const
{
	tokend::approval_return result{ tokend::process_result::progress, "", tokend::burn_proposal{ id_a, requestor_a, 0, {}, false }, false };
	auto authorized (can_burn (approver_a));
	if (authorized.code != tokend::process_result::progress)
	{
		result.code = authorized.code;
		result.message = authorized.message;
	}
	else
	{
		auto existing (get_proposal (tokend::proposal_type::burn, requestor_a, id_a));
		result.code = existing.code;
		result.message = existing.message;
		result.proposal = existing.proposal;
		if (result.code == tokend::process_result::progress)
		{
			auto & approvals (result.proposal.approvals);
			if (deduplicate_approvals && std::find (approvals.begin (), approvals.end (), approver_a) != approvals.end ())
			{
				result.code = tokend::process_result::duplicate_approval;
				result.message = "Address '" + approver_a + "' already approved burn request with ID '" + id_a + "'";
			}
			else
			{
				approvals.push_back (approver_a);
				if (!result.proposal.approved && approvals.size () >= requirements.burn_approvals)
				{
					result.proposal.approved = true;
					result.transitioned = true;
				}
			}
		}
	}
	return result;
}

tokend::approval_return tokend::proposals::approve_burn_request (std::string const & approver_a, std::string const & requestor_a, std::string const & id_a)
{
	auto result (check_approval (approver_a, requestor_a, id_a));
	if (result.code == tokend::process_result::progress)
	{
		burn_requests[requestor_a][id_a] = result.proposal;
	}
	return result;
}
