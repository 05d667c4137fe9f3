#pragma once

#include <tokend/ledger.hpp>

#include <set>
#include <vector>

namespace tokend
{
/**
 * Allow list of processes that may receive transfers leaving this ledger
 */
class external_transfers
{
public:
	void add_targets (std::vector<std::string> const &);
	void remove_targets (std::vector<std::string> const &);
	bool authorized (std::string const &) const;
	std::set<std::string> const & targets () const;
	// Debits the sender once the process is authorized and every input is valid
	tokend::change_return transfer_externally (tokend::ledger &, std::string const &, std::string const &, std::string const &, tokend::quantity const &) const;
	std::set<std::string> authorized_targets;
};
}
