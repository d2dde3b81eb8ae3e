#include "fixed_point.hpp"
#include <stdexcept>
#include <vector>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace fixed_point {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw std::invalid_argument(std::string("invalid hex digit '") + c + "'");
}

std::string strip_leading_zeros(const std::string& digits) {
    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) return "0";
    return digits.substr(first);
}

} // namespace

std::string hex_to_decimal(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }

    // Little-endian base-10 digits; each nibble does digits = digits*16 + nibble.
    std::vector<int> digits{0};
    for (size_t i = start; i < hex.size(); i++) {
        int carry = hex_value(hex[i]);
        for (auto& d : digits) {
            int v = d * 16 + carry;
            d = v % 10;
            carry = v / 10;
        }
        while (carry > 0) {
            digits.push_back(carry % 10);
            carry /= 10;
        }
    }

    std::string out;
    out.reserve(digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(static_cast<char>('0' + *it));
    }
    return strip_leading_zeros(out);
}

std::string format_units(const std::string& digits, int decimals) {
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("not a decimal integer: '" + digits + "'");
    }
    if (decimals < 0) {
        throw std::invalid_argument("negative decimals");
    }

    std::string s = strip_leading_zeros(digits);
    if (decimals == 0) return s;

    const size_t d = static_cast<size_t>(decimals);
    std::string whole;
    std::string frac;
    if (s.size() > d) {
        whole = s.substr(0, s.size() - d);
        frac = s.substr(s.size() - d);
    } else {
        whole = "0";
        frac = std::string(d - s.size(), '0') + s;
    }
    return whole + "." + frac;
}

double units_to_double(const std::string& digits, int decimals) {
    std::string formatted = format_units(digits, decimals);
    if (formatted == "0") return 0.0;
    return std::strtod(formatted.c_str(), nullptr);
}

} // namespace fixed_point
