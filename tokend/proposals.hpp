#pragma once

#include <tokend/common.hpp>

#include <memory>
#include <set>

namespace tokend
{
class members
{
public:
	// Addresses allowed to approve burns
	std::set<std::string> burners;
	// Addresses allowed to mint
	std::set<std::string> minters;
};
class requirements
{
public:
	requirements ();
	uint64_t burn_approvals;
	uint64_t mint_approvals;
};
// requestor -> proposal id -> proposal
using proposal_map = std::map<std::string, std::map<std::string, tokend::burn_proposal>>;
/**
 * Multi party approval of burns
 * A proposal becomes approved once it holds the required number of approvals.
 * Executing the burn is left to the caller, which does so only when an approval reports the transition.
 */
class proposals
{
public:
	proposals (tokend::members const &, tokend::requirements const &, std::unique_ptr<tokend::id_generator> = std::unique_ptr<tokend::id_generator> (new tokend::blake2_id_generator));
	tokend::process_return can_burn (std::string const &) const;
	tokend::process_return can_mint (std::string const &) const;
	tokend::proposal_return create_burn_request (std::string const &, tokend::quantity const &);
	tokend::proposal_return get_proposal (tokend::proposal_type, std::string const &, std::string const &) const;
	// Outcome approve_burn_request would have, without recording the approval
	tokend::approval_return check_approval (std::string const &, std::string const &, std::string const &) const;
	tokend::approval_return approve_burn_request (std::string const &, std::string const &, std::string const &);
	tokend::members members;
	tokend::requirements requirements;
	tokend::proposal_map burn_requests;
	tokend::proposal_map mint_requests;
	// Reject a second approval from the same address
	bool deduplicate_approvals;
	std::unique_ptr<tokend::id_generator> generator;
};
}
