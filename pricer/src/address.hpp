#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>

// Canonical addresses: "0x" + 40 lower-case hex digits. Sorted, so the set
// doubles as a stable cache key.
using AddressSet = std::set<std::string>;

class AddressNormalizer {
public:
    static std::optional<std::string> canonicalize(const std::string& raw);

    // Invalid entries are dropped; duplicates collapse case-insensitively.
    static AddressSet normalize(const std::string& csv);
    static AddressSet normalize(const std::vector<std::string>& raw);

    static bool is_zero(const std::string& address);
};

inline constexpr const char* kZeroAddress = "0x0000000000000000000000000000000000000000";
