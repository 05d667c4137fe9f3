#pragma once

#include <tokend/lib/numbers.hpp>

#include <boost/variant.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tokend
{
/**
 * Loosely typed value as it arrives from a host message or a configuration
 * document. Integral numbers are held as quantities so they never lose precision.
 */
using value = boost::make_recursive_variant<boost::blank, bool, double, tokend::quantity, std::string, std::map<std::string, boost::recursive_variant_>>::type;
using table = std::map<std::string, tokend::value>;
enum class value_kind
{
	nil,
	boolean,
	number,
	string,
	table
};
tokend::value_kind kind (tokend::value const &);
std::string to_string (tokend::value_kind);
// Text form used inside error messages
std::string describe (tokend::value const &);
// Structural equality, numbers compare by magnitude regardless of representation
bool equal (tokend::value const &, tokend::value const &);
// Numeric view of a value, false if it isn't a number
bool numeric (tokend::value const &, double &);
enum class length_match
{
	exact,
	less,
	greater
};
class condition
{
public:
	std::string message;
	std::function<bool(tokend::value const &)> validate;
};
/**
 * Chain of conditions evaluated left to right, the first failing condition
 * determines the reported message. Builders return *this so rules read as a sentence:
 * tokend::type ().string ("must be a string").length (43, tokend::length_match::exact, "must be 43 characters")
 */
class type
{
public:
	tokend::type & custom (std::string const &, std::function<bool(tokend::value const &)> const &);
	tokend::type & of (tokend::value_kind, std::string const & = std::string ());
	tokend::type & nil (std::string const & = std::string ());
	tokend::type & boolean (std::string const & = std::string ());
	tokend::type & number (std::string const & = std::string ());
	tokend::type & string (std::string const & = std::string ());
	tokend::type & table (std::string const & = std::string ());
	// Table whose keys are all positional indexes
	tokend::type & array (std::string const & = std::string ());
	tokend::type & keys (tokend::type const &, std::string const & = std::string ());
	tokend::type & values (tokend::type const &, std::string const & = std::string ());
	tokend::type & is (tokend::value const &, std::string const & = std::string ());
	tokend::type & match (std::string const &, std::string const & = std::string ());
	tokend::type & length (size_t, tokend::length_match = tokend::length_match::exact, std::string const & = std::string ());
	tokend::type & integer (std::string const & = std::string ());
	tokend::type & even (std::string const & = std::string ());
	tokend::type & odd (std::string const & = std::string ());
	tokend::type & less_than (tokend::quantity const &, std::string const & = std::string ());
	tokend::type & greater_than (tokend::quantity const &, std::string const & = std::string ());
	// Nil passes, anything else must satisfy the given type
	tokend::type & optional (tokend::type const &, std::string const & = std::string ());
	// Every listed key must be present and valid, strict rejects unlisted keys
	tokend::type & object (std::map<std::string, tokend::type> const &, bool = false, std::string const & = std::string ());
	tokend::type & either (std::vector<tokend::type> const &, std::string const & = std::string ());
	tokend::type & is_not (tokend::type const &, std::string const & = std::string ());
	tokend::type & set_name (std::string const &);
	// Returns true if a condition failed and writes its message into the error string
	bool assert_value (tokend::value const &, std::string &) const;
	// Returns true if every condition holds
	bool check (tokend::value const &) const;
	std::string name;
	std::vector<tokend::condition> conditions;
};
class validator
{
public:
	validator (std::map<std::string, tokend::type> const &);
	bool validate_type (std::string const &, tokend::value const &, std::string &) const;
	// Validate the listed keys of the object, copying the validated entries into the result
	bool validate_types (tokend::table const &, std::vector<std::string> const &, tokend::table &, std::string &) const;
	bool validate_types (tokend::table const &, tokend::table &, std::string &) const;
	std::map<std::string, tokend::type> types;
};
/**
 * Converts a loosely typed value into a quantity
 * Decimal strings and integral numbers convert, everything else reports the failure message
 */
class converter
{
public:
	converter (tokend::value const &);
	tokend::converter & with_failure_message (std::string const &);
	// Returns true on error
	bool to_quantity (tokend::quantity &, std::string &) const;
	tokend::value source;
	std::string failure_message;
};
}
