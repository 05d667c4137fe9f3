#pragma once

#include <tokend/common.hpp>
#include <tokend/node/utility.hpp>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include <map>
#include <string>
#include <vector>

namespace tokend
{
/**
 * Inbound message as delivered by the host runtime
 */
class message
{
public:
	message () = default;
	message (std::string const &, std::string const &, std::map<std::string, std::string> const &);
	// Reads {"From", "Id", "Tags": {...}}, returns true on error
	bool deserialize_json (boost::property_tree::ptree const &);
	void serialize_json (boost::property_tree::ptree &) const;
	boost::optional<std::string> tag (std::string const &) const;
	std::string action () const;
	std::string from;
	std::string id;
	std::map<std::string, std::string> tags;
};
/**
 * Outbound message produced by a handler
 * An empty action marks a plain response carrying tags and data
 */
class notice
{
public:
	notice () = default;
	notice (std::string const &, std::string const &, std::map<std::string, std::string> const & = std::map<std::string, std::string> (), std::string const & = std::string ());
	void serialize_json (boost::property_tree::ptree &) const;
	std::string to_json () const;
	std::string target;
	std::string action;
	std::map<std::string, std::string> tags;
	std::string data;
};
class payload_return
{
public:
	tokend::process_result code;
	std::string message;
	tokend::table payload;
};
// Tags as strings plus From and Caller, Quantity converted to a quantity
tokend::payload_return to_payload (tokend::message const &);
// Compact single line JSON
std::string to_json (boost::property_tree::ptree const &);
}
