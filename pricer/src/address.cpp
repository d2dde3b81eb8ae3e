#include "address.hpp"
#include "util.hpp"
#include <cctype>

std::optional<std::string> AddressNormalizer::canonicalize(const std::string& raw) {
    std::string addr = util::trim(raw);

    if (addr.size() != 42) return std::nullopt;
    if (addr[0] != '0' || (addr[1] != 'x' && addr[1] != 'X')) return std::nullopt;

    for (size_t i = 2; i < addr.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(addr[i]))) {
            return std::nullopt;
        }
    }

    return "0x" + util::to_lower(addr.substr(2));
}

AddressSet AddressNormalizer::normalize(const std::string& csv) {
    return normalize(util::split(csv, ','));
}

AddressSet AddressNormalizer::normalize(const std::vector<std::string>& raw) {
    AddressSet out;
    for (const auto& entry : raw) {
        auto addr = canonicalize(entry);
        if (addr.has_value()) {
            out.insert(*addr);
        }
    }
    return out;
}

bool AddressNormalizer::is_zero(const std::string& address) {
    auto addr = canonicalize(address);
    return !addr.has_value() || *addr == kZeroAddress;
}
