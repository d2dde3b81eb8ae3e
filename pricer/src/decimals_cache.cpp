#include "decimals_cache.hpp"
#include "abi.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

DecimalsCache::DecimalsCache(std::shared_ptr<EthRpc> rpc, int ttl_seconds)
    : rpc_(std::move(rpc))
    , ttl_seconds_(ttl_seconds)
{}

bool DecimalsCache::is_expired(const TokenDecimals& entry) const {
    if (entry.pinned) return false;
    auto now = std::chrono::steady_clock::now();
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - entry.cached_at).count();
    return age > ttl_seconds_;
}

int DecimalsCache::get_or_fetch(const std::string& token) {
    std::string key = util::to_lower(token);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() && !is_expired(it->second)) {
            return it->second.decimals;
        }
    }

    // Fetched outside the lock; concurrent misses for one token both hit the node.
    auto fetched = fetch_from_chain(key);
    if (!fetched.has_value()) {
        spdlog::debug("decimals() unavailable for {}, assuming {}", key, kDefaultDecimals);
        return kDefaultDecimals;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = TokenDecimals{key, *fetched, false, std::chrono::steady_clock::now()};
    return *fetched;
}

void DecimalsCache::update(const std::string& token, int decimals) {
    std::string key = util::to_lower(token);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = TokenDecimals{key, decimals, true, std::chrono::steady_clock::now()};
}

size_t DecimalsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::optional<int> DecimalsCache::fetch_from_chain(const std::string& token) {
    auto result = rpc_->eth_call(token, abi::kDecimals);
    if (!result.has_value()) return std::nullopt;

    try {
        // uint8 return value: only the low byte may be set
        std::string word = abi::word(*result, 0);
        if (word.find_first_not_of('0') < 62) return std::nullopt;
        int decimals = std::stoi(word.substr(62), nullptr, 16);
        if (decimals > 77) return std::nullopt;
        return decimals;
    } catch (const std::exception& e) {
        spdlog::debug("Malformed decimals() result for {}: {}", token, e.what());
        return std::nullopt;
    }
}
