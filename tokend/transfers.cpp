#include <tokend/transfers.hpp>

void tokend::external_transfers::add_targets (std::vector<std::string> const & targets_a)
{
	authorized_targets.insert (targets_a.begin (), targets_a.end ());
}

void tokend::external_transfers::remove_targets (std::vector<std::string> const & targets_a)
{
	for (auto & i : targets_a)
	{
		authorized_targets.erase (i);
	}
}

bool tokend::external_transfers::authorized (std::string const & process_a) const
{
	return authorized_targets.find (process_a) != authorized_targets.end ();
}

std::set<std::string> const & tokend::external_transfers::targets () const
{
	return authorized_targets;
}

tokend::change_return tokend::external_transfers::transfer_externally (tokend::ledger & ledger_a, std::string const & sender_a, std::string const & receiver_a, std::string const & process_a, tokend::quantity const & quantity_a) const
{
	tokend::change_return result{ tokend::process_result::progress, "", 0, 0 };
	if (!authorized (process_a))
	{
		result.code = tokend::process_result::unauthorized_target;
		result.message = "Process '" + process_a + "' not authorized to receive transfers";
	}
	else
	{
		tokend::validator validator ({ { "Sender", tokend::address_type ("Cannot process external transfer.", "Transfer 'Sender' address") },
		{ "Receiver", tokend::address_type ("Cannot process external transfer.", "Transfer 'Receiver' address") },
		{ "Quantity", tokend::quantity_type ("Cannot process external transfer.", "Transfer 'Quantity'") },
		{ "Process", tokend::type ().string ("Cannot process external transfer. Transfer 'Process' must be a string.").length (0, tokend::length_match::greater, "Cannot process external transfer. Transfer 'Process' must not be empty.") } });
		std::string error;
		if (validator.validate_type ("Sender", tokend::value (sender_a), error) || validator.validate_type ("Receiver", tokend::value (receiver_a), error))
		{
			result.code = tokend::process_result::invalid_address;
		}
		else if (validator.validate_type ("Quantity", tokend::value (quantity_a), error))
		{
			result.code = tokend::process_result::invalid_quantity;
		}
		else if (validator.validate_type ("Process", tokend::value (process_a), error))
		{
			result.code = tokend::process_result::invalid_field;
		}
		if (result.code != tokend::process_result::progress)
		{
			result.message = error;
		}
		else
		{
			result = ledger_a.debit_external (sender_a, quantity_a);
		}
	}
	return result;
}
