#pragma once

#include <tokend/ledger.hpp>
#include <tokend/node/common.hpp>
#include <tokend/proposals.hpp>
#include <tokend/transfers.hpp>

#include <boost/property_tree/ptree.hpp>

#include <vector>

namespace tokend
{
class logging;
class handler_result
{
public:
	tokend::process_result code;
	std::string message;
	// Structured output of the action, numbers rendered as decimal strings
	boost::property_tree::ptree output;
	// Sent once the action has committed
	std::vector<tokend::notice> notices;
};
// Returns true if the value is not one of the allowed strings
bool check_action_type (std::string const &, tokend::value const &, std::vector<std::string> const &, std::string &);
/**
 * Routes inbound actions to the ledger, proposal engine and external gate
 * Authorization and payload checks happen here, before any component is asked to mutate.
 */
class handlers
{
public:
	handlers (tokend::ledger &, tokend::proposals &, tokend::external_transfers &, tokend::logging &);
	tokend::handler_result handle (tokend::message const &);
	tokend::handler_result info (tokend::table const &);
	tokend::handler_result balance (tokend::table const &);
	tokend::handler_result balances (tokend::table const &);
	tokend::handler_result total_supply (tokend::table const &);
	tokend::handler_result mint (tokend::table const &);
	tokend::handler_result burn (tokend::table const &);
	tokend::handler_result create_burn_request (tokend::table const &);
	tokend::handler_result approve_burn_request (tokend::table const &);
	tokend::handler_result transfer (tokend::table const &);
	tokend::handler_result transfer_internally (tokend::table const &);
	tokend::handler_result transfer_externally (tokend::table const &);
	tokend::ledger & ledger;
	tokend::proposals & proposals;
	tokend::external_transfers & transfers;
	tokend::logging & logging;
};
}
