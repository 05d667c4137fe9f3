#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace tokend
{
// Token units are unbounded integers; the ledger keeps every stored balance >= 0
using quantity = boost::multiprecision::cpp_int;

// Parse an optional '-' followed by decimal digits. Returns true on error.
bool decode_dec (std::string const &, tokend::quantity &);
std::string encode_dec (tokend::quantity const &);
// Largest accepted number of fractional digits, denominations are validated against it before use
int64_t constexpr max_denomination = 255;
// 10^denomination, denomination in [0, max_denomination]
tokend::quantity scale (int64_t);
// Whole token amount into raw sub-units
tokend::quantity to_sub_units (tokend::quantity const &, int64_t);
// Raw sub-units rendered with exactly `denomination' fractional digits e.g. 1500 @ 3 -> "1.500"
std::string format_units (tokend::quantity const &, int64_t);
}
