#pragma once

#include "eth_rpc.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <memory>

struct TokenDecimals {
    std::string token;
    int decimals;
    bool pinned;  // configured, never expires
    std::chrono::steady_clock::time_point cached_at;
};

class DecimalsCache {
public:
    static constexpr int kDefaultDecimals = 18;

    explicit DecimalsCache(std::shared_ptr<EthRpc> rpc, int ttl_seconds = 86400);

    // ERC-20 decimals(); kDefaultDecimals when the token does not answer.
    int get_or_fetch(const std::string& token);
    void update(const std::string& token, int decimals);
    size_t size() const;

private:
    std::shared_ptr<EthRpc> rpc_;
    int ttl_seconds_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TokenDecimals> cache_;

    bool is_expired(const TokenDecimals& entry) const;
    std::optional<int> fetch_from_chain(const std::string& token);
};
