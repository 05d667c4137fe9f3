#include <tokend/node/handlers.hpp>

#include <tokend/node/node.hpp>

#include <boost/algorithm/string/join.hpp>
#include <boost/format.hpp>

namespace
{
tokend::value field (tokend::table const & payload_a, std::string const & key_a)
{
	auto existing (payload_a.find (key_a));
	return existing != payload_a.end () ? existing->second : tokend::value ();
}

std::string caller (tokend::table const & payload_a)
{
	auto value (field (payload_a, "From"));
	auto text (boost::get<std::string> (&value));
	return text != nullptr ? *text : std::string ();
}

tokend::handler_result make_result ()
{
	return tokend::handler_result{ tokend::process_result::progress, "", boost::property_tree::ptree (), std::vector<tokend::notice> () };
}

void fail (tokend::handler_result & result_a, tokend::process_result code_a, std::string const & message_a)
{
	result_a.code = code_a;
	result_a.message = message_a;
}

bool address_field (tokend::table const & payload_a, std::string const & key_a, std::string const & context_a, std::string & address_a, tokend::handler_result & result_a)
{
	auto value (field (payload_a, key_a));
	auto error (tokend::address_type (context_a, "Field '" + key_a + "'").assert_value (value, result_a.message));
	if (error)
	{
		result_a.code = tokend::process_result::invalid_address;
	}
	else
	{
		address_a = boost::get<std::string> (value);
	}
	return error;
}

bool quantity_field (tokend::table const & payload_a, std::string const & context_a, std::string const & label_a, tokend::quantity & quantity_a, tokend::handler_result & result_a)
{
	auto value (field (payload_a, "Quantity"));
	auto error (tokend::quantity_type (context_a, label_a).assert_value (value, result_a.message));
	if (error)
	{
		result_a.code = tokend::process_result::invalid_quantity;
	}
	else
	{
		std::string message;
		error = tokend::converter (value).to_quantity (quantity_a, message);
		if (error)
		{
			fail (result_a, tokend::process_result::invalid_quantity, message);
		}
	}
	return error;
}

bool string_field (tokend::table const & payload_a, std::string const & key_a, std::string const & message_a, std::string & text_a, tokend::handler_result & result_a)
{
	auto value (field (payload_a, key_a));
	auto error (tokend::type ().string (message_a).length (0, tokend::length_match::greater, message_a).assert_value (value, result_a.message));
	if (error)
	{
		result_a.code = tokend::process_result::invalid_field;
	}
	else
	{
		text_a = boost::get<std::string> (value);
	}
	return error;
}

std::string action_type (tokend::table const & payload_a, std::string const & default_a, std::vector<std::string> const & allowed_a, tokend::handler_result & result_a)
{
	std::string result;
	auto value (field (payload_a, "Action-Type"));
	if (tokend::kind (value) == tokend::value_kind::nil)
	{
		value = default_a;
	}
	std::string error;
	if (tokend::check_action_type ("Action-Type", value, allowed_a, error))
	{
		fail (result_a, tokend::process_result::invalid_field, error);
	}
	else
	{
		result = boost::get<std::string> (value);
	}
	return result;
}
}

bool tokend::check_action_type (std::string const & field_a, tokend::value const & value_a, std::vector<std::string> const & allowed_a, std::string & error_a)
{
	std::vector<tokend::type> allowed;
	for (auto & i : allowed_a)
	{
		allowed.push_back (tokend::type ().is (tokend::value (i)));
	}
	auto error (!tokend::type ().either (allowed).check (value_a));
	if (error)
	{
		error_a = "Field '" + field_a + "' is invalid. Value provided: " + tokend::describe (value_a) + ". Value must be one of the following: " + boost::algorithm::join (allowed_a, ", ") + ".";
	}
	return error;
}

tokend::handlers::handlers (tokend::ledger & ledger_a, tokend::proposals & proposals_a, tokend::external_transfers & transfers_a, tokend::logging & logging_a) :
ledger (ledger_a),
proposals (proposals_a),
transfers (transfers_a),
logging (logging_a)
{
}

tokend::handler_result tokend::handlers::handle (tokend::message const & message_a)
{
	auto result (make_result ());
	auto payload (tokend::to_payload (message_a));
	if (payload.code != tokend::process_result::progress)
	{
		fail (result, payload.code, payload.message);
	}
	else
	{
		auto action (message_a.action ());
		if (action == "Info")
		{
			result = info (payload.payload);
		}
		else if (action == "Balance")
		{
			result = balance (payload.payload);
		}
		else if (action == "Balances")
		{
			result = balances (payload.payload);
		}
		else if (action == "Total-Supply")
		{
			result = total_supply (payload.payload);
		}
		else if (action == "Mint")
		{
			result = mint (payload.payload);
		}
		else if (action == "Burn")
		{
			result = burn (payload.payload);
		}
		else if (action == "Transfer")
		{
			result = transfer (payload.payload);
		}
		else
		{
			fail (result, tokend::process_result::unknown_action, "Action '" + action + "' is not supported");
		}
	}
	return result;
}

tokend::handler_result tokend::handlers::info (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto & metadata (ledger.info ());
	metadata.serialize_json (result.output);
	std::map<std::string, std::string> tags;
	for (auto & i : result.output)
	{
		tags[i.first] = i.second.data ();
	}
	result.notices.push_back (tokend::notice (caller (payload_a), "", tags));
	return result;
}

tokend::handler_result tokend::handlers::balance (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto payload (payload_a);
	if (tokend::kind (field (payload, "Target")) == tokend::value_kind::nil)
	{
		payload["Target"] = caller (payload);
	}
	std::string target;
	if (!address_field (payload, "Target", "Cannot get balance.", target, result))
	{
		auto balance (ledger.balance (target));
		if (balance.code != tokend::process_result::progress)
		{
			fail (result, balance.code, balance.message);
		}
		else
		{
			auto text (tokend::encode_dec (balance.balance ? *balance.balance : tokend::quantity (0)));
			result.output.put ("Target", target);
			result.output.put ("Balance", text);
			result.output.put ("Ticker", ledger.info ().ticker);
			result.notices.push_back (tokend::notice (caller (payload), "", { { "Balance", text }, { "Target", target }, { "Ticker", ledger.info ().ticker } }, text));
		}
	}
	return result;
}

tokend::handler_result tokend::handlers::balances (tokend::table const & payload_a)
{
	auto result (make_result ());
	for (auto & i : ledger.balances ())
	{
		result.output.put (boost::property_tree::ptree::path_type (i.first, '\0'), tokend::encode_dec (i.second));
	}
	auto data (result.output.empty () ? std::string ("{}") : tokend::to_json (result.output));
	result.notices.push_back (tokend::notice (caller (payload_a), "", {}, data));
	return result;
}

tokend::handler_result tokend::handlers::total_supply (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto text (tokend::encode_dec (ledger.total_supply ()));
	result.output.put ("Total-Supply", text);
	result.output.put ("Ticker", ledger.info ().ticker);
	result.notices.push_back (tokend::notice (caller (payload_a), "", { { "Total-Supply", text }, { "Ticker", ledger.info ().ticker } }, text));
	return result;
}

tokend::handler_result tokend::handlers::mint (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto from (caller (payload_a));
	auto authorized (proposals.can_mint (from));
	std::string target;
	tokend::quantity quantity;
	if (authorized.code != tokend::process_result::progress)
	{
		fail (result, authorized.code, authorized.message);
	}
	else if (!address_field (payload_a, "Target", "Cannot mint tokens.", target, result) && !quantity_field (payload_a, "Cannot mint tokens.", "Field 'Quantity'", quantity, result))
	{
		auto minted (ledger.mint (target, quantity));
		if (minted.code != tokend::process_result::progress)
		{
			fail (result, minted.code, minted.message);
		}
		else
		{
			auto & ticker (ledger.info ().ticker);
			result.output.put ("target", target);
			result.output.put ("balance_old", tokend::encode_dec (minted.balance_old));
			result.output.put ("balance_new", tokend::encode_dec (minted.balance_new));
			result.notices.push_back (tokend::notice (from, "", {}, "Successfully minted " + tokend::encode_dec (quantity) + " " + ticker + " to '" + target + "'"));
			if (logging.ledger_logging ())
			{
				BOOST_LOG (logging.log) << boost::str (boost::format ("Minted %1% %2% to '%3%'") % tokend::format_units (quantity, ledger.info ().denomination) % ticker % target);
			}
		}
	}
	return result;
}

tokend::handler_result tokend::handlers::burn (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto type (action_type (payload_a, "NEW_REQUEST", { "NEW_REQUEST", "APPROVAL" }, result));
	if (type == "NEW_REQUEST")
	{
		result = create_burn_request (payload_a);
	}
	else if (type == "APPROVAL")
	{
		result = approve_burn_request (payload_a);
	}
	return result;
}

tokend::handler_result tokend::handlers::create_burn_request (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto payload (payload_a);
	if (tokend::kind (field (payload, "Requestor")) == tokend::value_kind::nil)
	{
		payload["Requestor"] = caller (payload);
	}
	std::string requestor;
	tokend::quantity quantity;
	if (!address_field (payload, "Requestor", "Cannot create Burn request.", requestor, result) && !quantity_field (payload, "Cannot create Burn request.", "Burn request 'Quantity'", quantity, result))
	{
		auto request (proposals.create_burn_request (requestor, quantity));
		if (request.code != tokend::process_result::progress)
		{
			fail (result, request.code, request.message);
		}
		else
		{
			request.proposal.serialize_json (result.output);
			auto text (tokend::encode_dec (quantity));
			for (auto & i : proposals.members.burners)
			{
				result.notices.push_back (tokend::notice (i, "Burn-Request-Notice", { { "Burn-Request-Id", request.proposal.id }, { "Requestor", requestor }, { "Quantity", text } }));
			}
			if (logging.proposal_logging ())
			{
				BOOST_LOG (logging.log) << boost::str (boost::format ("Burn request %1% for %2% %3% from address '%4%' sent to %5% approvers") % request.proposal.id % text % ledger.info ().ticker % requestor % proposals.members.burners.size ());
			}
		}
	}
	return result;
}

tokend::handler_result tokend::handlers::approve_burn_request (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto approver (caller (payload_a));
	std::string requestor;
	std::string id;
	if (!address_field (payload_a, "Requestor", "Cannot process burn approval.", requestor, result) && !string_field (payload_a, "Burn-Request-Id", "Cannot process burn approval. Field 'Burn-Request-Id' must be a string.", id, result))
	{
		auto check (proposals.check_approval (approver, requestor, id));
		if (check.code != tokend::process_result::progress)
		{
			fail (result, check.code, check.message);
		}
		else
		{
			// Completing the quorum must not record an approval the burn would reject
			auto burnable (check.transitioned ? ledger.check_burn (requestor, check.proposal.quantity) : tokend::process_return{ tokend::process_result::progress, "" });
			if (burnable.code != tokend::process_result::progress)
			{
				fail (result, burnable.code, burnable.message);
			}
			else
			{
				auto approval (proposals.approve_burn_request (approver, requestor, id));
				if (approval.code != tokend::process_result::progress)
				{
					fail (result, approval.code, approval.message);
				}
				else if (approval.transitioned)
				{
					auto burned (ledger.burn (requestor, approval.proposal.quantity));
					if (burned.code != tokend::process_result::progress)
					{
						fail (result, burned.code, burned.message);
					}
					else
					{
						auto text (tokend::encode_dec (approval.proposal.quantity));
						result.output.put ("target", requestor);
						result.output.put ("balance_old", tokend::encode_dec (burned.balance_old));
						result.output.put ("balance_new", tokend::encode_dec (burned.balance_new));
						result.notices.push_back (tokend::notice (requestor, "Debit-Notice", { { "Target", requestor }, { "Quantity", text } }));
						if (logging.ledger_logging ())
						{
							BOOST_LOG (logging.log) << boost::str (boost::format ("Burned %1% %2% from address '%3%'") % tokend::format_units (approval.proposal.quantity, ledger.info ().denomination) % ledger.info ().ticker % requestor);
						}
					}
				}
				else
				{
					approval.proposal.serialize_json (result.output);
					if (logging.proposal_logging ())
					{
						BOOST_LOG (logging.log) << boost::str (boost::format ("Address '%1%' approved burn request %2% of '%3%', %4% of %5% approvals") % approver % id % requestor % approval.proposal.approvals.size () % proposals.requirements.burn_approvals);
					}
				}
			}
		}
	}
	return result;
}

tokend::handler_result tokend::handlers::transfer (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto type (action_type (payload_a, "INTERNAL", { "INTERNAL", "EXTERNAL" }, result));
	if (type == "INTERNAL")
	{
		result = transfer_internally (payload_a);
	}
	else if (type == "EXTERNAL")
	{
		result = transfer_externally (payload_a);
	}
	return result;
}

tokend::handler_result tokend::handlers::transfer_internally (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto sender (caller (payload_a));
	std::string recipient;
	tokend::quantity quantity;
	if (!address_field (payload_a, "Recipient", "Cannot transfer tokens.", recipient, result) && !quantity_field (payload_a, "Cannot transfer tokens.", "Field 'Quantity'", quantity, result))
	{
		auto transferred (ledger.transfer (sender, recipient, quantity));
		if (transferred.code != tokend::process_result::progress)
		{
			fail (result, transferred.code, transferred.message);
		}
		else
		{
			auto text (tokend::encode_dec (quantity));
			result.output.put ("sender_balance_old", tokend::encode_dec (transferred.sender_balance_old));
			result.output.put ("sender_balance_new", tokend::encode_dec (transferred.sender_balance_new));
			result.output.put ("recipient_balance_old", tokend::encode_dec (transferred.recipient_balance_old));
			result.output.put ("recipient_balance_new", tokend::encode_dec (transferred.recipient_balance_new));
			result.notices.push_back (tokend::notice (sender, "Debit-Notice", { { "Recipient", recipient }, { "Quantity", text } }));
			result.notices.push_back (tokend::notice (recipient, "Credit-Notice", { { "Sender", sender }, { "Quantity", text } }));
			if (logging.ledger_logging ())
			{
				BOOST_LOG (logging.log) << boost::str (boost::format ("Transferred %1% %2% from '%3%' to receiver '%4%'") % tokend::format_units (quantity, ledger.info ().denomination) % ledger.info ().ticker % sender % recipient);
			}
		}
	}
	return result;
}

tokend::handler_result tokend::handlers::transfer_externally (tokend::table const & payload_a)
{
	auto result (make_result ());
	auto sender (caller (payload_a));
	std::string process;
	std::string recipient;
	tokend::quantity quantity;
	if (!string_field (payload_a, "Process", "Cannot process external transfer. Field 'Process' must be a string.", process, result) && !address_field (payload_a, "Recipient", "Cannot process external transfer.", recipient, result) && !quantity_field (payload_a, "Cannot process external transfer.", "Field 'Quantity'", quantity, result))
	{
		auto debited (transfers.transfer_externally (ledger, sender, recipient, process, quantity));
		if (debited.code != tokend::process_result::progress)
		{
			fail (result, debited.code, debited.message);
		}
		else
		{
			auto text (tokend::encode_dec (quantity));
			result.output.put ("sender_balance_old", tokend::encode_dec (debited.balance_old));
			result.output.put ("sender_balance_new", tokend::encode_dec (debited.balance_new));
			result.output.put ("process", process);
			result.output.put ("recipient", recipient);
			result.notices.push_back (tokend::notice (sender, "Debit-Notice", { { "Recipient", recipient }, { "Process", process }, { "Quantity", text } }));
			result.notices.push_back (tokend::notice (process, "Credit-Notice", { { "Sender", sender }, { "Recipient", recipient }, { "Quantity", text } }));
			if (logging.ledger_logging ())
			{
				BOOST_LOG (logging.log) << boost::str (boost::format ("Transferred %1% %2% from '%3%' to process '%4%' and receiver '%5%'") % tokend::format_units (quantity, ledger.info ().denomination) % ledger.info ().ticker % sender % process % recipient);
			}
		}
	}
	return result;
}
