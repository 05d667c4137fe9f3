#include <tokend/lib/numbers.hpp>

#include <algorithm>
#include <cassert>

bool tokend::decode_dec (std::string const & text_a, tokend::quantity & number_a)
{
	auto error (text_a.empty ());
	if (!error)
	{
		auto digits (text_a.begin ());
		if (*digits == '-')
		{
			++digits;
		}
		error = digits == text_a.end () || !std::all_of (digits, text_a.end (), [](char c) { return c >= '0' && c <= '9'; });
		if (!error)
		{
			try
			{
				number_a = tokend::quantity (text_a.c_str ());
			}
			catch (std::runtime_error const &)
			{
				error = true;
			}
		}
	}
	return error;
}

std::string tokend::encode_dec (tokend::quantity const & number_a)
{
	return number_a.str ();
}

tokend::quantity tokend::scale (int64_t denomination_a)
{
	assert (denomination_a >= 0 && denomination_a <= tokend::max_denomination);
	return boost::multiprecision::pow (tokend::quantity (10), static_cast<unsigned> (denomination_a));
}

tokend::quantity tokend::to_sub_units (tokend::quantity const & whole_a, int64_t denomination_a)
{
	return whole_a * scale (denomination_a);
}

std::string tokend::format_units (tokend::quantity const & raw_a, int64_t denomination_a)
{
	auto negative (raw_a < 0);
	tokend::quantity magnitude (negative ? tokend::quantity (-raw_a) : raw_a);
	auto divisor (scale (denomination_a));
	std::string result (encode_dec (magnitude / divisor));
	if (denomination_a > 0)
	{
		auto fraction (encode_dec (magnitude % divisor));
		result += '.';
		result += std::string (static_cast<size_t> (denomination_a) - fraction.size (), '0');
		result += fraction;
	}
	if (negative)
	{
		result.insert (result.begin (), '-');
	}
	return result;
}
