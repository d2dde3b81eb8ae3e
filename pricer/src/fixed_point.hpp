#pragma once

#include <string>

namespace fixed_point {

// Exact base-16 -> base-10 conversion of an unsigned integer of any width.
// Accepts an optional 0x prefix; "" and "0x" are zero.
// Throws std::invalid_argument on a non-hex digit.
std::string hex_to_decimal(const std::string& hex);

// Interprets `digits` as an integer amount of the smallest unit and returns
// it scaled by 10^-decimals. The decimal string "whole.frac" is assembled from
// the digits and parsed once, so large on-chain integers keep their leading
// precision. Throws std::invalid_argument on a non-decimal digit string.
double units_to_double(const std::string& digits, int decimals);

// Decimal string form used by units_to_double, exposed for logging/tests.
std::string format_units(const std::string& digits, int decimals);

} // namespace fixed_point
