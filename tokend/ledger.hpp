#pragma once

#include <tokend/common.hpp>

namespace tokend
{
/**
 * Balance ledger and token metadata for a single process
 * Every operation validates before mutating; a failed call leaves the ledger untouched
 */
class ledger
{
public:
	ledger ();
	// One time setup, a second call returns already_initialized
	tokend::process_return init (tokend::token_metadata const &, tokend::balance_map const &);
	tokend::token_metadata const & info () const;
	tokend::balance_return balance (std::string const &) const;
	tokend::balance_map const & balances () const;
	tokend::quantity total_supply () const;
	tokend::change_return mint (std::string const &, tokend::quantity const &);
	tokend::change_return burn (std::string const &, tokend::quantity const &);
	// Same checks as burn without applying it
	tokend::process_return check_burn (std::string const &, tokend::quantity const &) const;
	tokend::transfer_return transfer (std::string const &, std::string const &, tokend::quantity const &);
	// Debit only, the matching credit happens in another process
	tokend::change_return debit_external (std::string const &, tokend::quantity const &);
	tokend::token_metadata metadata;
	tokend::balance_map entries;
	bool initialized;
};
}
