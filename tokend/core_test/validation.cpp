#include <tokend/lib/validation.hpp>

#include <boost/test/unit_test.hpp>

namespace
{
tokend::value text (std::string const & text_a)
{
	return tokend::value (text_a);
}

tokend::value integral (int64_t number_a)
{
	return tokend::value (tokend::quantity (number_a));
}
}

BOOST_AUTO_TEST_SUITE (validation)

BOOST_AUTO_TEST_CASE (kinds)
{
	BOOST_CHECK (tokend::kind (tokend::value ()) == tokend::value_kind::nil);
	BOOST_CHECK (tokend::kind (tokend::value (true)) == tokend::value_kind::boolean);
	BOOST_CHECK (tokend::kind (tokend::value (1.5)) == tokend::value_kind::number);
	BOOST_CHECK (tokend::kind (integral (3)) == tokend::value_kind::number);
	BOOST_CHECK (tokend::kind (text ("a")) == tokend::value_kind::string);
	BOOST_CHECK (tokend::kind (tokend::value (tokend::table ())) == tokend::value_kind::table);
	BOOST_CHECK_EQUAL (tokend::describe (integral (12)), "12");
	BOOST_CHECK_EQUAL (tokend::describe (text ("NEW")), "NEW");
	BOOST_CHECK_EQUAL (tokend::describe (tokend::value ()), "nil");
}

BOOST_AUTO_TEST_CASE (equality)
{
	BOOST_CHECK (tokend::equal (integral (3), tokend::value (3.0)));
	BOOST_CHECK (tokend::equal (text ("a"), text ("a")));
	BOOST_CHECK (!tokend::equal (text ("3"), integral (3)));
	tokend::table first;
	first["a"] = integral (1);
	tokend::table second;
	second["a"] = tokend::value (1.0);
	BOOST_CHECK (tokend::equal (tokend::value (first), tokend::value (second)));
	second["b"] = text ("x");
	BOOST_CHECK (!tokend::equal (tokend::value (first), tokend::value (second)));
}

BOOST_AUTO_TEST_CASE (default_messages)
{
	std::string error;
	BOOST_CHECK (tokend::type ().string ().assert_value (tokend::value (1.0), error));
	BOOST_CHECK_EQUAL (error, "Not of type (string)");
	BOOST_CHECK (tokend::type ().length (3).assert_value (text ("ab"), error));
	BOOST_CHECK_EQUAL (error, "String is not of length 3");
	BOOST_CHECK (tokend::type ().length (3, tokend::length_match::less).assert_value (text ("abc"), error));
	BOOST_CHECK_EQUAL (error, "String length is not less than 3");
	BOOST_CHECK (tokend::type ().length (3, tokend::length_match::greater).assert_value (text ("abc"), error));
	BOOST_CHECK_EQUAL (error, "String length is not greater than 3");
	BOOST_CHECK (tokend::type ().match ("[a-z]+").assert_value (text ("A1"), error));
	BOOST_CHECK_EQUAL (error, "String did not match pattern \"[a-z]+\"");
	BOOST_CHECK (tokend::type ().integer ().assert_value (tokend::value (1.5), error));
	BOOST_CHECK_EQUAL (error, "Number is not an integer");
	BOOST_CHECK (tokend::type ().even ().assert_value (integral (3), error));
	BOOST_CHECK_EQUAL (error, "Number is not even");
	BOOST_CHECK (tokend::type ().odd ().assert_value (integral (4), error));
	BOOST_CHECK_EQUAL (error, "Number is not odd");
	BOOST_CHECK (tokend::type ().less_than (10).assert_value (integral (10), error));
	BOOST_CHECK_EQUAL (error, "Number is not less than 10");
	BOOST_CHECK (tokend::type ().greater_than (0).assert_value (integral (0), error));
	BOOST_CHECK_EQUAL (error, "Number is not greater than 0");
	BOOST_CHECK (tokend::type ().is (text ("x")).assert_value (text ("y"), error));
	BOOST_CHECK_EQUAL (error, "Value did not match expected value (is)");
}

BOOST_AUTO_TEST_CASE (passing_values)
{
	std::string error;
	BOOST_CHECK (!tokend::type ().string ().length (3).match ("[a-z]+").assert_value (text ("abc"), error));
	BOOST_CHECK (!tokend::type ().number ().integer ().assert_value (tokend::value (2.0), error));
	BOOST_CHECK (!tokend::type ().even ().assert_value (tokend::value (4.0), error));
	BOOST_CHECK (!tokend::type ().odd ().assert_value (integral (-3), error));
	BOOST_CHECK (!tokend::type ().greater_than (0).less_than (2).assert_value (integral (1), error));
	BOOST_CHECK (!tokend::type ().greater_than (0).assert_value (tokend::value (0.5), error));
	BOOST_CHECK (error.empty ());
}

BOOST_AUTO_TEST_CASE (first_failure_reported)
{
	tokend::type rule;
	rule.string ("first").length (3, tokend::length_match::exact, "second");
	std::string error;
	BOOST_CHECK (rule.assert_value (tokend::value (1.0), error));
	BOOST_CHECK_EQUAL (error, "first");
	BOOST_CHECK (rule.assert_value (text ("ab"), error));
	BOOST_CHECK_EQUAL (error, "second");
	BOOST_CHECK (!rule.check (text ("ab")));
	BOOST_CHECK (rule.check (text ("abc")));
}

BOOST_AUTO_TEST_CASE (named_type)
{
	std::string error;
	BOOST_CHECK (tokend::type ().string ().set_name ("Name").assert_value (tokend::value (), error));
	BOOST_CHECK_EQUAL (error, "[Type Name] Not of type (string)");
}

BOOST_AUTO_TEST_CASE (combinators)
{
	std::string error;
	BOOST_CHECK (!tokend::type ().optional (tokend::type ().string ()).assert_value (tokend::value (), error));
	BOOST_CHECK (tokend::type ().optional (tokend::type ().string ()).assert_value (tokend::value (1.0), error));
	BOOST_CHECK_EQUAL (error, "Optional type did not match");
	std::vector<tokend::type> options{ tokend::type ().is (text ("A")), tokend::type ().is (text ("B")) };
	BOOST_CHECK (!tokend::type ().either (options).assert_value (text ("B"), error));
	BOOST_CHECK (tokend::type ().either (options).assert_value (text ("C"), error));
	BOOST_CHECK_EQUAL (error, "Neither types matched defined in (either)");
	BOOST_CHECK (tokend::type ().is_not (tokend::type ().string ()).assert_value (text ("x"), error));
	BOOST_CHECK_EQUAL (error, "Value incorrectly matched with the assertion provided (is_not)");
	BOOST_CHECK (!tokend::type ().is_not (tokend::type ().string ()).assert_value (tokend::value (true), error));
}

BOOST_AUTO_TEST_CASE (tables)
{
	tokend::table object;
	object["a"] = text ("x");
	std::map<std::string, tokend::type> fields{ { "a", tokend::type ().string () } };
	std::string error;
	BOOST_CHECK (!tokend::type ().object (fields, true).assert_value (tokend::value (object), error));
	object["b"] = integral (1);
	BOOST_CHECK (!tokend::type ().object (fields).assert_value (tokend::value (object), error));
	BOOST_CHECK (tokend::type ().object (fields, true).assert_value (tokend::value (object), error));
	BOOST_CHECK_EQUAL (error, "Not of defined object");
	BOOST_CHECK (tokend::type ().object (fields).assert_value (tokend::value (tokend::table ()), error));
	BOOST_CHECK (tokend::type ().keys (tokend::type ().length (1)).check (tokend::value (object)));
	BOOST_CHECK (tokend::type ().values (tokend::type ().string ()).assert_value (tokend::value (object), error));
	BOOST_CHECK_EQUAL (error, "Invalid table values");
	BOOST_CHECK (tokend::type ().keys (tokend::type ().length (2)).assert_value (tokend::value (object), error));
	BOOST_CHECK_EQUAL (error, "Invalid table keys");
}

BOOST_AUTO_TEST_CASE (arrays)
{
	tokend::table list;
	list["1"] = text ("x");
	list["2"] = text ("y");
	BOOST_CHECK (tokend::type ().array ().check (tokend::value (list)));
	list["name"] = text ("z");
	BOOST_CHECK (!tokend::type ().array ().check (tokend::value (list)));
	BOOST_CHECK (!tokend::type ().array ().check (text ("1")));
}

BOOST_AUTO_TEST_CASE (validator_names_types)
{
	tokend::validator validator ({ { "Name", tokend::type ().string ("must be string") }, { "Count", tokend::type ().number () } });
	std::string error;
	BOOST_CHECK (validator.validate_type ("Name", integral (1), error));
	BOOST_CHECK_EQUAL (error, "[Type Name] must be string");
	BOOST_CHECK (validator.validate_type ("Other", integral (1), error));
	BOOST_CHECK_EQUAL (error, "No type assertion found for 'Other' key");
	BOOST_CHECK (!validator.validate_type ("Count", integral (1), error));
}

BOOST_AUTO_TEST_CASE (validator_tables)
{
	tokend::validator validator ({ { "Name", tokend::type ().string () }, { "Logo", tokend::type ().optional (tokend::type ().string ()) } });
	tokend::table object;
	object["Name"] = text ("Token");
	object["Extra"] = integral (1);
	tokend::table validated;
	std::string error;
	BOOST_CHECK (!validator.validate_types (object, validated, error));
	BOOST_CHECK_EQUAL (validated.size (), 2);
	BOOST_CHECK (tokend::equal (validated["Name"], text ("Token")));
	BOOST_CHECK (tokend::kind (validated["Logo"]) == tokend::value_kind::nil);
	BOOST_CHECK (validated.find ("Extra") == validated.end ());
	object["Name"] = integral (1);
	tokend::table untouched;
	BOOST_CHECK (validator.validate_types (object, { "Name" }, untouched, error));
	BOOST_CHECK_EQUAL (error, "[Type Name] Not of type (string)");
	BOOST_CHECK (untouched.empty ());
}

BOOST_AUTO_TEST_CASE (converter)
{
	tokend::quantity result;
	std::string error;
	BOOST_CHECK (!tokend::converter (text ("123")).to_quantity (result, error));
	BOOST_CHECK_EQUAL (result, 123);
	BOOST_CHECK (!tokend::converter (tokend::value (5.0)).to_quantity (result, error));
	BOOST_CHECK_EQUAL (result, 5);
	BOOST_CHECK (!tokend::converter (integral (9)).to_quantity (result, error));
	BOOST_CHECK_EQUAL (result, 9);
	BOOST_CHECK (tokend::converter (tokend::value ()).to_quantity (result, error));
	BOOST_CHECK_EQUAL (error, "Cannot convert nil to quantity");
	BOOST_CHECK (tokend::converter (tokend::value (5.5)).to_quantity (result, error));
	BOOST_CHECK_EQUAL (error, "Could not convert value to quantity");
	BOOST_CHECK (tokend::converter (tokend::value (true)).to_quantity (result, error));
	BOOST_CHECK_EQUAL (error, "Could not convert value to quantity");
	BOOST_CHECK (tokend::converter (text ("abc")).with_failure_message ("Quantity is not a number").to_quantity (result, error));
	BOOST_CHECK_EQUAL (error, "Quantity is not a number");
	BOOST_CHECK_EQUAL (result, 9);
}

BOOST_AUTO_TEST_SUITE_END ()
