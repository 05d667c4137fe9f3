#include <tokend/ledger.hpp>

namespace
{
bool check_address (std::string const & context_a, std::string const & field_a, std::string const & address_a, std::string & error_a)
{
	return tokend::address_type (context_a, field_a).assert_value (tokend::value (address_a), error_a);
}

bool check_quantity (std::string const & context_a, tokend::quantity const & quantity_a, std::string & error_a)
{
	return tokend::quantity_type (context_a, "Quantity").assert_value (tokend::value (quantity_a), error_a);
}

tokend::validator const & metadata_validator ()
{
	static tokend::validator result ({ { "Name", tokend::type ().string ("Cannot create token. Field `options.globals.Name` must be a string") },
	{ "Ticker", tokend::type ().string ("Cannot create token. Field `options.globals.Ticker` must be a string") },
	{ "Denomination", tokend::type ().number ("Cannot create token. Field `options.globals.Denomination` must be number").integer ("Cannot create token. Field `options.globals.Denomination` must be integer").greater_than (0, "Cannot create token. Field `options.globals.Denomination` must be greater than 0").less_than (tokend::max_denomination + 1, "Cannot create token. Field `options.globals.Denomination` must be at most " + std::to_string (tokend::max_denomination)) },
	{ "Logo", tokend::type ().optional (tokend::type ().string (), "Cannot create token. Field `options.globals.Logo` must be a string") } });
	return result;
}
}

tokend::ledger::ledger () :
initialized (false)
{
	metadata.denomination = 0;
}

tokend::process_return tokend::ledger::init (tokend::token_metadata const & metadata_a, tokend::balance_map const & balances_a)
{
	tokend::process_return result{ tokend::process_result::progress, "" };
	if (initialized)
	{
		result.code = tokend::process_result::already_initialized;
		result.message = "Cannot initialize token. Token metadata is already defined.";
	}
	else
	{
		tokend::table validated;
		auto error (metadata_validator ().validate_types (metadata_a.to_table (), { "Name", "Ticker", "Denomination", "Logo" }, validated, result.message));
		for (auto i (balances_a.begin ()), n (balances_a.end ()); !error && i != n; ++i)
		{
			error = check_address ("Cannot create token.", "Field `options.globals.Balances` address", i->first, result.message);
			if (!error && i->second < 0)
			{
				error = true;
				result.message = "Cannot create token. Balance for address '" + i->first + "' must not be negative.";
			}
		}
		if (!error)
		{
			metadata = metadata_a;
			entries = balances_a;
			initialized = true;
		}
		else
		{
			result.code = tokend::process_result::invalid_metadata;
		}
	}
	return result;
}

tokend::token_metadata const & tokend::ledger::info () const
{
	return metadata;
}

tokend::balance_return tokend::ledger::balance (std::string const & address_a) const
{
	tokend::balance_return result{ tokend::process_result::progress, "", boost::none };
	if (check_address ("Cannot get token balance.", "Target address", address_a, result.message))
	{
		result.code = tokend::process_result::invalid_address;
	}
	else
	{
		auto existing (entries.find (address_a));
		if (existing != entries.end ())
		{
			result.balance = existing->second;
		}
	}
	return result;
}

tokend::balance_map const & tokend::ledger::balances () const
{
	return entries;
}

tokend::quantity tokend::ledger::total_supply () const
{
	tokend::quantity result (0);
	for (auto & i : entries)
	{
		result += i.second;
	}
	return result;
}

tokend::change_return tokend::ledger::mint (std::string const & target_a, tokend::quantity const & quantity_a)
{
	tokend::change_return result{ tokend::process_result::progress, "", 0, 0 };
	if (check_address ("Cannot mint tokens.", "Target address", target_a, result.message))
	{
		result.code = tokend::process_result::invalid_address;
	}
	else if (check_quantity ("Cannot mint tokens.", quantity_a, result.message))
	{
		result.code = tokend::process_result::invalid_quantity;
	}
	else
	{
		auto & entry (entries[target_a]);
		result.balance_old = entry;
		entry += quantity_a;
		result.balance_new = entry;
	}
	return result;
}

tokend::process_return tokend::ledger::check_burn (std::string const & target_a, tokend::quantity const & quantity_a) const
{
	tokend::process_return result{ tokend::process_result::progress, "" };
	if (check_address ("Cannot burn tokens.", "Target address", target_a, result.message))
	{
		result.code = tokend::process_result::invalid_address;
	}
	else if (check_quantity ("Cannot burn tokens.", quantity_a, result.message))
	{
		result.code = tokend::process_result::invalid_quantity;
	}
	else
	{
		auto existing (entries.find (target_a));
		if (existing == entries.end ())
		{
			result.code = tokend::process_result::no_balance;
			result.message = "Cannot burn tokens. No balance for address '" + target_a + "' found.";
		}
		else if (existing->second < quantity_a)
		{
			result.code = tokend::process_result::insufficient_balance;
			result.message = "Cannot burn " + tokend::encode_dec (quantity_a) + " " + metadata.ticker + ". Target address '" + target_a + "' has insufficient balance: " + tokend::encode_dec (existing->second) + ".";
		}
	}
	return result;
}

tokend::change_return tokend::ledger::burn (std::string const & target_a, tokend::quantity const & quantity_a)
{
	auto check (check_burn (target_a, quantity_a));
	tokend::change_return result{ check.code, check.message, 0, 0 };
	if (result.code == tokend::process_result::progress)
	{
		auto & entry (entries[target_a]);
		result.balance_old = entry;
		entry -= quantity_a;
		result.balance_new = entry;
	}
	return result;
}

tokend::transfer_return tokend::ledger::transfer (std::string const & sender_a, std::string const & recipient_a, tokend::quantity const & quantity_a)
{
	tokend::transfer_return result{ tokend::process_result::progress, "", 0, 0, 0, 0 };
	if (check_address ("Cannot transfer tokens.", "Sender address", sender_a, result.message) || check_address ("Cannot transfer tokens.", "Recipient address", recipient_a, result.message))
	{
		result.code = tokend::process_result::invalid_address;
	}
	else if (sender_a == recipient_a)
	{
		result.code = tokend::process_result::self_transfer;
		result.message = "Cannot transfer tokens. From address cannot be the same as the Recipient address.";
	}
	else if (check_quantity ("Cannot transfer tokens.", quantity_a, result.message))
	{
		result.code = tokend::process_result::invalid_quantity;
	}
	else
	{
		auto sender (entries.find (sender_a));
		if (sender == entries.end ())
		{
			result.code = tokend::process_result::no_balance;
			result.message = "Cannot transfer tokens. No balance for From address '" + sender_a + "' found.";
		}
		else if (sender->second < quantity_a)
		{
			result.code = tokend::process_result::insufficient_balance;
			result.message = "Cannot transfer tokens. From address '" + sender_a + "' has insufficient balance.";
		}
		else
		{
			// Inserting the recipient leaves the sender iterator valid
			auto & recipient (entries[recipient_a]);
			result.sender_balance_old = sender->second;
			result.recipient_balance_old = recipient;
			recipient += quantity_a;
			sender->second -= quantity_a;
			result.sender_balance_new = sender->second;
			result.recipient_balance_new = recipient;
		}
	}
	return result;
}

tokend::change_return tokend::ledger::debit_external (std::string const & sender_a, tokend::quantity const & quantity_a)
{
	tokend::change_return result{ tokend::process_result::progress, "", 0, 0 };
	if (check_address ("Cannot process external transfer.", "Transfer 'Sender' address", sender_a, result.message))
	{
		result.code = tokend::process_result::invalid_address;
	}
	else if (check_quantity ("Cannot process external transfer.", quantity_a, result.message))
	{
		result.code = tokend::process_result::invalid_quantity;
	}
	else
	{
		auto existing (entries.find (sender_a));
		if (existing == entries.end ())
		{
			result.code = tokend::process_result::no_balance;
			result.message = "Cannot process external transfer. No balance for address '" + sender_a + "' found.";
		}
		else if (existing->second < quantity_a)
		{
			result.code = tokend::process_result::insufficient_balance;
			result.message = "Cannot process external transfer. Sender address '" + sender_a + "' has insufficient balance.";
		}
		else
		{
			result.balance_old = existing->second;
			existing->second -= quantity_a;
			result.balance_new = existing->second;
		}
	}
	return result;
}
