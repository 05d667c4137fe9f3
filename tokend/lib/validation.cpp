#include <tokend/lib/validation.hpp>

#include <boost/format.hpp>

#include <algorithm>
#include <cmath>
#include <regex>

namespace
{
class equal_visitor : public boost::static_visitor<bool>
{
public:
	template <typename T, typename U>
	bool operator() (T const &, U const &) const
	{
		return false;
	}
	template <typename T>
	bool operator() (T const & first_a, T const & second_a) const
	{
		return first_a == second_a;
	}
	bool operator() (double first_a, tokend::quantity const & second_a) const
	{
		return first_a == second_a.convert_to<double> ();
	}
	bool operator() (tokend::quantity const & first_a, double second_a) const
	{
		return first_a.convert_to<double> () == second_a;
	}
	bool operator() (tokend::table const & first_a, tokend::table const & second_a) const
	{
		auto result (first_a.size () == second_a.size ());
		for (auto i (first_a.begin ()), j (second_a.begin ()), n (first_a.end ()); result && i != n; ++i, ++j)
		{
			result = i->first == j->first && tokend::equal (i->second, j->second);
		}
		return result;
	}
};

std::string message_or (std::string const & message_a, std::string const & default_a)
{
	return message_a.empty () ? default_a : message_a;
}

// Compare a numeric value against a quantity bound, -1 less, 0 equal, 1 greater
bool compare (tokend::value const & value_a, tokend::quantity const & bound_a, int & order_a)
{
	auto error (false);
	switch (tokend::kind (value_a))
	{
		case tokend::value_kind::number:
		{
			if (auto integral = boost::get<tokend::quantity> (&value_a))
			{
				order_a = integral->compare (bound_a);
			}
			else
			{
				auto real (boost::get<double> (value_a));
				auto bound (bound_a.convert_to<double> ());
				error = std::isnan (real);
				order_a = real < bound ? -1 : (real > bound ? 1 : 0);
			}
			break;
		}
		default:
			error = true;
			break;
	}
	return error;
}

bool is_integer (tokend::value const & value_a)
{
	auto result (false);
	if (boost::get<tokend::quantity> (&value_a) != nullptr)
	{
		result = true;
	}
	else if (auto real = boost::get<double> (&value_a))
	{
		result = std::isfinite (*real) && std::trunc (*real) == *real;
	}
	return result;
}

bool parity (tokend::value const & value_a, int remainder_a)
{
	auto result (false);
	if (auto integral = boost::get<tokend::quantity> (&value_a))
	{
		tokend::quantity remainder (*integral % 2);
		result = (remainder == 0) == (remainder_a == 0);
	}
	else if (auto real = boost::get<double> (&value_a))
	{
		result = std::isfinite (*real) && std::trunc (*real) == *real && (std::fmod (*real, 2.0) == 0.0) == (remainder_a == 0);
	}
	return result;
}
}

tokend::value_kind tokend::kind (tokend::value const & value_a)
{
	tokend::value_kind result;
	switch (value_a.which ())
	{
		case 0:
			result = tokend::value_kind::nil;
			break;
		case 1:
			result = tokend::value_kind::boolean;
			break;
		case 2:
		case 3:
			result = tokend::value_kind::number;
			break;
		case 4:
			result = tokend::value_kind::string;
			break;
		default:
			result = tokend::value_kind::table;
			break;
	}
	return result;
}

std::string tokend::to_string (tokend::value_kind kind_a)
{
	std::string result;
	switch (kind_a)
	{
		case tokend::value_kind::nil:
			result = "nil";
			break;
		case tokend::value_kind::boolean:
			result = "boolean";
			break;
		case tokend::value_kind::number:
			result = "number";
			break;
		case tokend::value_kind::string:
			result = "string";
			break;
		case tokend::value_kind::table:
			result = "table";
			break;
	}
	return result;
}

std::string tokend::describe (tokend::value const & value_a)
{
	std::string result;
	switch (value_a.which ())
	{
		case 0:
			result = "nil";
			break;
		case 1:
			result = boost::get<bool> (value_a) ? "true" : "false";
			break;
		case 2:
			result = boost::str (boost::format ("%1%") % boost::get<double> (value_a));
			break;
		case 3:
			result = tokend::encode_dec (boost::get<tokend::quantity> (value_a));
			break;
		case 4:
			result = boost::get<std::string> (value_a);
			break;
		default:
			result = "table";
			break;
	}
	return result;
}

bool tokend::equal (tokend::value const & first_a, tokend::value const & second_a)
{
	return boost::apply_visitor (equal_visitor (), first_a, second_a);
}

bool tokend::numeric (tokend::value const & value_a, double & number_a)
{
	auto result (true);
	if (auto integral = boost::get<tokend::quantity> (&value_a))
	{
		number_a = integral->convert_to<double> ();
	}
	else if (auto real = boost::get<double> (&value_a))
	{
		number_a = *real;
	}
	else
	{
		result = false;
	}
	return result;
}

tokend::type & tokend::type::custom (std::string const & message_a, std::function<bool(tokend::value const &)> const & validate_a)
{
	conditions.push_back (tokend::condition{ message_a, validate_a });
	return *this;
}

tokend::type & tokend::type::of (tokend::value_kind kind_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Not of type (" + tokend::to_string (kind_a) + ")"), [kind_a](tokend::value const & value_a) {
		return tokend::kind (value_a) == kind_a;
	});
}

tokend::type & tokend::type::nil (std::string const & message_a)
{
	return of (tokend::value_kind::nil, message_a);
}

tokend::type & tokend::type::boolean (std::string const & message_a)
{
	return of (tokend::value_kind::boolean, message_a);
}

tokend::type & tokend::type::number (std::string const & message_a)
{
	return of (tokend::value_kind::number, message_a);
}

tokend::type & tokend::type::string (std::string const & message_a)
{
	return of (tokend::value_kind::string, message_a);
}

tokend::type & tokend::type::table (std::string const & message_a)
{
	return of (tokend::value_kind::table, message_a);
}

tokend::type & tokend::type::array (std::string const & message_a)
{
	table (message_or (message_a, "Not of type (array)"));
	return keys (tokend::type ().string ().match ("[1-9][0-9]*"), message_or (message_a, "Not of type (array)"));
}

tokend::type & tokend::type::keys (tokend::type const & type_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Invalid table keys"), [type_a](tokend::value const & value_a) {
		auto result (false);
		if (auto entries = boost::get<tokend::table> (&value_a))
		{
			result = true;
			for (auto i (entries->begin ()), n (entries->end ()); result && i != n; ++i)
			{
				result = type_a.check (tokend::value (i->first));
			}
		}
		return result;
	});
}

tokend::type & tokend::type::values (tokend::type const & type_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Invalid table values"), [type_a](tokend::value const & value_a) {
		auto result (false);
		if (auto entries = boost::get<tokend::table> (&value_a))
		{
			result = true;
			for (auto i (entries->begin ()), n (entries->end ()); result && i != n; ++i)
			{
				result = type_a.check (i->second);
			}
		}
		return result;
	});
}

tokend::type & tokend::type::is (tokend::value const & expected_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Value did not match expected value (is)"), [expected_a](tokend::value const & value_a) {
		return tokend::equal (value_a, expected_a);
	});
}

tokend::type & tokend::type::match (std::string const & pattern_a, std::string const & message_a)
{
	std::regex pattern (pattern_a, std::regex::ECMAScript);
	return custom (message_or (message_a, "String did not match pattern \"" + pattern_a + "\""), [pattern](tokend::value const & value_a) {
		auto result (false);
		if (auto text = boost::get<std::string> (&value_a))
		{
			result = std::regex_match (*text, pattern);
		}
		return result;
	});
}

tokend::type & tokend::type::length (size_t length_a, tokend::length_match match_a, std::string const & message_a)
{
	std::string default_message;
	switch (match_a)
	{
		case tokend::length_match::exact:
			default_message = boost::str (boost::format ("String is not of length %1%") % length_a);
			break;
		case tokend::length_match::less:
			default_message = boost::str (boost::format ("String length is not less than %1%") % length_a);
			break;
		case tokend::length_match::greater:
			default_message = boost::str (boost::format ("String length is not greater than %1%") % length_a);
			break;
	}
	return custom (message_or (message_a, default_message), [length_a, match_a](tokend::value const & value_a) {
		auto result (false);
		if (auto text = boost::get<std::string> (&value_a))
		{
			switch (match_a)
			{
				case tokend::length_match::exact:
					result = text->size () == length_a;
					break;
				case tokend::length_match::less:
					result = text->size () < length_a;
					break;
				case tokend::length_match::greater:
					result = text->size () > length_a;
					break;
			}
		}
		return result;
	});
}

tokend::type & tokend::type::integer (std::string const & message_a)
{
	return custom (message_or (message_a, "Number is not an integer"), is_integer);
}

tokend::type & tokend::type::even (std::string const & message_a)
{
	return custom (message_or (message_a, "Number is not even"), [](tokend::value const & value_a) {
		return parity (value_a, 0);
	});
}

tokend::type & tokend::type::odd (std::string const & message_a)
{
	return custom (message_or (message_a, "Number is not odd"), [](tokend::value const & value_a) {
		return parity (value_a, 1);
	});
}

tokend::type & tokend::type::less_than (tokend::quantity const & bound_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Number is not less than " + tokend::encode_dec (bound_a)), [bound_a](tokend::value const & value_a) {
		int order (0);
		return !compare (value_a, bound_a, order) && order < 0;
	});
}

tokend::type & tokend::type::greater_than (tokend::quantity const & bound_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Number is not greater than " + tokend::encode_dec (bound_a)), [bound_a](tokend::value const & value_a) {
		int order (0);
		return !compare (value_a, bound_a, order) && order > 0;
	});
}

tokend::type & tokend::type::optional (tokend::type const & type_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Optional type did not match"), [type_a](tokend::value const & value_a) {
		return tokend::kind (value_a) == tokend::value_kind::nil || type_a.check (value_a);
	});
}

tokend::type & tokend::type::object (std::map<std::string, tokend::type> const & fields_a, bool strict_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Not of defined object"), [fields_a, strict_a](tokend::value const & value_a) {
		auto result (false);
		if (auto entries = boost::get<tokend::table> (&value_a))
		{
			result = true;
			for (auto i (fields_a.begin ()), n (fields_a.end ()); result && i != n; ++i)
			{
				auto existing (entries->find (i->first));
				result = i->second.check (existing != entries->end () ? existing->second : tokend::value ());
			}
			if (strict_a)
			{
				for (auto i (entries->begin ()), n (entries->end ()); result && i != n; ++i)
				{
					result = fields_a.find (i->first) != fields_a.end ();
				}
			}
		}
		return result;
	});
}

tokend::type & tokend::type::either (std::vector<tokend::type> const & types_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Neither types matched defined in (either)"), [types_a](tokend::value const & value_a) {
		return std::any_of (types_a.begin (), types_a.end (), [&value_a](tokend::type const & type_a) { return type_a.check (value_a); });
	});
}

tokend::type & tokend::type::is_not (tokend::type const & type_a, std::string const & message_a)
{
	return custom (message_or (message_a, "Value incorrectly matched with the assertion provided (is_not)"), [type_a](tokend::value const & value_a) {
		return !type_a.check (value_a);
	});
}

tokend::type & tokend::type::set_name (std::string const & name_a)
{
	name = name_a;
	return *this;
}

bool tokend::type::assert_value (tokend::value const & value_a, std::string & error_a) const
{
	auto error (false);
	for (auto i (conditions.begin ()), n (conditions.end ()); !error && i != n; ++i)
	{
		if (!i->validate (value_a))
		{
			error = true;
			error_a = name.empty () ? i->message : "[Type " + name + "] " + i->message;
		}
	}
	return error;
}

bool tokend::type::check (tokend::value const & value_a) const
{
	return std::all_of (conditions.begin (), conditions.end (), [&value_a](tokend::condition const & condition_a) { return condition_a.validate (value_a); });
}

tokend::validator::validator (std::map<std::string, tokend::type> const & types_a) :
types (types_a)
{
	for (auto & i : types)
	{
		if (i.second.name.empty ())
		{
			i.second.name = i.first;
		}
	}
}

bool tokend::validator::validate_type (std::string const & key_a, tokend::value const & value_a, std::string & error_a) const
{
	auto error (false);
	auto existing (types.find (key_a));
	if (existing != types.end ())
	{
		error = existing->second.assert_value (value_a, error_a);
	}
	else
	{
		error = true;
		error_a = "No type assertion found for '" + key_a + "' key";
	}
	return error;
}

bool tokend::validator::validate_types (tokend::table const & object_a, std::vector<std::string> const & keys_a, tokend::table & validated_a, std::string & error_a) const
{
	auto error (false);
	tokend::table validated;
	for (auto i (keys_a.begin ()), n (keys_a.end ()); !error && i != n; ++i)
	{
		auto existing (object_a.find (*i));
		auto value (existing != object_a.end () ? existing->second : tokend::value ());
		error = validate_type (*i, value, error_a);
		if (!error)
		{
			validated[*i] = value;
		}
	}
	if (!error)
	{
		validated_a.swap (validated);
	}
	return error;
}

bool tokend::validator::validate_types (tokend::table const & object_a, tokend::table & validated_a, std::string & error_a) const
{
	std::vector<std::string> keys;
	for (auto & i : types)
	{
		keys.push_back (i.first);
	}
	return validate_types (object_a, keys, validated_a, error_a);
}

tokend::converter::converter (tokend::value const & source_a) :
source (source_a),
failure_message ("Could not convert value to quantity")
{
}

tokend::converter & tokend::converter::with_failure_message (std::string const & message_a)
{
	failure_message = message_a;
	return *this;
}

bool tokend::converter::to_quantity (tokend::quantity & quantity_a, std::string & error_a) const
{
	auto error (false);
	switch (source.which ())
	{
		case 0:
			error = true;
			break;
		case 2:
		{
			auto real (boost::get<double> (source));
			error = !std::isfinite (real) || std::trunc (real) != real;
			if (!error)
			{
				quantity_a = tokend::quantity (real);
			}
			break;
		}
		case 3:
			quantity_a = boost::get<tokend::quantity> (source);
			break;
		case 4:
			error = tokend::decode_dec (boost::get<std::string> (source), quantity_a);
			break;
		default:
			error = true;
			break;
	}
	if (error)
	{
		error_a = source.which () == 0 ? "Cannot convert nil to quantity" : failure_message;
	}
	return error;
}
