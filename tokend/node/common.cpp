#include <tokend/node/common.hpp>

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

tokend::message::message (std::string const & from_a, std::string const & id_a, std::map<std::string, std::string> const & tags_a) :
from (from_a),
id (id_a),
tags (tags_a)
{
}

bool tokend::message::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	auto error (false);
	auto from_l (tree_a.get_optional<std::string> ("From"));
	auto id_l (tree_a.get_optional<std::string> ("Id"));
	auto tags_l (tree_a.get_child_optional ("Tags"));
	if (from_l && id_l && tags_l)
	{
		std::map<std::string, std::string> entries;
		for (auto & i : *tags_l)
		{
			if (i.first.empty () || !i.second.empty ())
			{
				// Tag values are flat strings
				error = true;
			}
			else
			{
				entries[i.first] = i.second.data ();
			}
		}
		if (!error)
		{
			from = *from_l;
			id = *id_l;
			tags.swap (entries);
		}
	}
	else
	{
		error = true;
	}
	return error;
}

void tokend::message::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("From", from);
	tree_a.put ("Id", id);
	boost::property_tree::ptree tags_l;
	for (auto & i : tags)
	{
		tags_l.put (boost::property_tree::ptree::path_type (i.first, '\0'), i.second);
	}
	tree_a.add_child ("Tags", tags_l);
}

boost::optional<std::string> tokend::message::tag (std::string const & name_a) const
{
	boost::optional<std::string> result;
	auto existing (tags.find (name_a));
	if (existing != tags.end ())
	{
		result = existing->second;
	}
	return result;
}

std::string tokend::message::action () const
{
	auto result (tag ("Action"));
	return result ? *result : std::string ();
}

tokend::notice::notice (std::string const & target_a, std::string const & action_a, std::map<std::string, std::string> const & tags_a, std::string const & data_a) :
target (target_a),
action (action_a),
tags (tags_a),
data (data_a)
{
}

void tokend::notice::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("Target", target);
	if (!action.empty ())
	{
		tree_a.put ("Action", action);
	}
	boost::property_tree::ptree tags_l;
	for (auto & i : tags)
	{
		tags_l.put (boost::property_tree::ptree::path_type (i.first, '\0'), i.second);
	}
	tree_a.add_child ("Tags", tags_l);
	if (!data.empty ())
	{
		tree_a.put ("Data", data);
	}
}

std::string tokend::notice::to_json () const
{
	boost::property_tree::ptree tree;
	serialize_json (tree);
	return tokend::to_json (tree);
}

tokend::payload_return tokend::to_payload (tokend::message const & message_a)
{
	tokend::payload_return result{ tokend::process_result::progress, "", tokend::table () };
	for (auto & i : message_a.tags)
	{
		result.payload[i.first] = i.second;
	}
	result.payload["From"] = message_a.from;
	result.payload["Caller"] = message_a.from;
	auto quantity (result.payload.find ("Quantity"));
	if (quantity != result.payload.end ())
	{
		tokend::quantity converted;
		std::string error;
		if (tokend::converter (quantity->second).with_failure_message ("Could not convert field 'Quantity' to quantity").to_quantity (converted, error))
		{
			result.code = tokend::process_result::invalid_quantity;
			result.message = error;
		}
		else
		{
			quantity->second = converted;
		}
	}
	return result;
}

std::string tokend::to_json (boost::property_tree::ptree const & tree_a)
{
	std::stringstream ostream;
	boost::property_tree::write_json (ostream, tree_a, false);
	auto result (ostream.str ());
	// write_json terminates with a newline
	while (!result.empty () && result.back () == '\n')
	{
		result.pop_back ();
	}
	return result;
}
