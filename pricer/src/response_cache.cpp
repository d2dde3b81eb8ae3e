#include "response_cache.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <vector>

ResponseCache::ResponseCache(int ttl_seconds, std::shared_ptr<RedisStore> redis, Clock clock)
    : ttl_seconds_(ttl_seconds)
    , redis_(std::move(redis))
    , clock_(std::move(clock))
{}

std::string ResponseCache::make_key(int64_t chain_id, const AddressSet& addresses) {
    std::vector<std::string> parts(addresses.begin(), addresses.end());
    return std::to_string(chain_id) + ":" + util::join(parts, ",");
}

bool ResponseCache::is_fresh(const Entry& entry) const {
    return clock_() - entry.stored_at < std::chrono::seconds(ttl_seconds_);
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (is_fresh(it->second)) {
                return it->second.response;
            }
            entries_.erase(it);
        }
    }

    if (!redis_) return std::nullopt;

    auto stored = redis_->get(key);
    if (!stored.has_value()) return std::nullopt;

    // Not copied locally: Redis holds the remaining lifetime of the entry.
    try {
        return nlohmann::json::parse(*stored);
    } catch (const std::exception& e) {
        spdlog::warn("Discarding unparsable cached response for {}: {}", key, e.what());
        return std::nullopt;
    }
}

void ResponseCache::put(const std::string& key, const nlohmann::json& response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{response, clock_()};
    }

    if (redis_) {
        redis_->setex(key, ttl_seconds_, response.dump());
    }
}

size_t ResponseCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!is_fresh(it->second)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
