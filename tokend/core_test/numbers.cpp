#include <tokend/lib/numbers.hpp>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE (numbers)

BOOST_AUTO_TEST_CASE (decode_dec_digits)
{
	tokend::quantity number;
	BOOST_CHECK (!tokend::decode_dec ("190", number));
	BOOST_CHECK_EQUAL (number, 190);
	BOOST_CHECK (!tokend::decode_dec ("-5", number));
	BOOST_CHECK_EQUAL (number, -5);
	BOOST_CHECK (!tokend::decode_dec ("0", number));
	BOOST_CHECK_EQUAL (number, 0);
}

BOOST_AUTO_TEST_CASE (decode_dec_rejects)
{
	tokend::quantity number (7);
	BOOST_CHECK (tokend::decode_dec ("", number));
	BOOST_CHECK (tokend::decode_dec ("-", number));
	BOOST_CHECK (tokend::decode_dec ("1.5", number));
	BOOST_CHECK (tokend::decode_dec ("1e3", number));
	BOOST_CHECK (tokend::decode_dec (" 1", number));
	BOOST_CHECK (tokend::decode_dec ("abc", number));
	BOOST_CHECK (tokend::decode_dec ("+1", number));
	BOOST_CHECK_EQUAL (number, 7);
}

BOOST_AUTO_TEST_CASE (large_values)
{
	std::string text ("340282366920938463463374607431768211456000000000000");
	tokend::quantity number;
	BOOST_REQUIRE (!tokend::decode_dec (text, number));
	BOOST_CHECK_EQUAL (tokend::encode_dec (number), text);
	BOOST_CHECK_EQUAL (tokend::encode_dec (number + 1), "340282366920938463463374607431768211456000000000001");
}

BOOST_AUTO_TEST_CASE (denomination)
{
	BOOST_CHECK_EQUAL (tokend::scale (0), 1);
	BOOST_CHECK_EQUAL (tokend::scale (3), 1000);
	BOOST_CHECK_EQUAL (tokend::to_sub_units (5, 3), 5000);
	BOOST_CHECK_EQUAL (tokend::encode_dec (tokend::to_sub_units (1, 18)), "1000000000000000000");
	BOOST_CHECK_EQUAL (tokend::encode_dec (tokend::to_sub_units (1, tokend::max_denomination)).size (), 256);
	auto widest (tokend::format_units (20, tokend::max_denomination));
	BOOST_CHECK_EQUAL (widest.size (), 257);
	BOOST_CHECK_EQUAL (widest.substr (widest.size () - 2), "20");
}

BOOST_AUTO_TEST_CASE (format_units)
{
	BOOST_CHECK_EQUAL (tokend::format_units (1500, 3), "1.500");
	BOOST_CHECK_EQUAL (tokend::format_units (5, 3), "0.005");
	BOOST_CHECK_EQUAL (tokend::format_units (0, 2), "0.00");
	BOOST_CHECK_EQUAL (tokend::format_units (7, 0), "7");
	BOOST_CHECK_EQUAL (tokend::format_units (-1500, 3), "-1.500");
}

BOOST_AUTO_TEST_SUITE_END ()
