#pragma once

#include "address.hpp"
#include "redis_store.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class ResponseCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ResponseCache(int ttl_seconds,
                           std::shared_ptr<RedisStore> redis = nullptr,
                           Clock clock = std::chrono::steady_clock::now);

    // "<chain>:<addr>,<addr>,..." over the sorted normalized set
    static std::string make_key(int64_t chain_id, const AddressSet& addresses);

    std::optional<nlohmann::json> get(const std::string& key);
    void put(const std::string& key, const nlohmann::json& response);

    size_t purge_expired();
    size_t size() const;
    int ttl_seconds() const { return ttl_seconds_; }

private:
    struct Entry {
        nlohmann::json response;
        std::chrono::steady_clock::time_point stored_at;
    };

    int ttl_seconds_;
    std::shared_ptr<RedisStore> redis_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    bool is_fresh(const Entry& entry) const;
};
