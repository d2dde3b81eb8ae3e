#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace util {
    std::string current_iso8601();
    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(const std::string& str);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);

    // Masks the last path segment of an RPC URL (provider keys live there).
    std::string redact_url(const std::string& url);
}
