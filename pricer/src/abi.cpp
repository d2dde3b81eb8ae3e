#include "abi.hpp"
#include "address.hpp"
#include "fixed_point.hpp"
#include "util.hpp"
#include <stdexcept>

namespace abi {

namespace {

std::string strip_0x(const std::string& s) {
    if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
    return s;
}

std::string pad32(const std::string& no0x) {
    if (no0x.size() >= 64) return no0x.substr(no0x.size() - 64);
    return std::string(64 - no0x.size(), '0') + no0x;
}

} // namespace

std::string encode_address(const std::string& address) {
    auto canonical = AddressNormalizer::canonicalize(address);
    if (!canonical.has_value()) {
        throw std::invalid_argument("cannot encode address '" + address + "'");
    }
    return pad32(canonical->substr(2));
}

std::string encode_bool(bool value) {
    return pad32(value ? "1" : "0");
}

std::string encode_call(const std::string& selector, const std::vector<std::string>& words) {
    std::string data = selector;
    for (const auto& w : words) {
        data += w;
    }
    return data;
}

size_t word_count(const std::string& result) {
    return strip_0x(result).size() / 64;
}

std::string word(const std::string& result, size_t index) {
    std::string hex = strip_0x(result);
    if (hex.size() < (index + 1) * 64) {
        throw std::runtime_error("ABI result too short: need word " + std::to_string(index) +
                                 ", have " + std::to_string(hex.size() / 64));
    }
    return hex.substr(index * 64, 64);
}

std::string decode_address(const std::string& result, size_t index) {
    return "0x" + util::to_lower(word(result, index).substr(24, 40));
}

std::string decode_uint(const std::string& result, size_t index) {
    return fixed_point::hex_to_decimal(word(result, index));
}

} // namespace abi
