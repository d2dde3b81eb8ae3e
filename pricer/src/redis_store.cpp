#include "redis_store.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

RedisStore::RedisStore(const std::string& redis_url, const std::string& key_prefix)
    : key_prefix_(key_prefix)
{
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    try {
        auto value = redis_->get(key_prefix_ + key);
        if (value) {
            return *value;
        }
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis GET {} failed: {}", key, e.what());
    }
    return std::nullopt;
}

void RedisStore::setex(const std::string& key, int ttl_seconds, const std::string& value) {
    try {
        redis_->setex(key_prefix_ + key, std::chrono::seconds(ttl_seconds), value);
        spdlog::debug("Stored {} in Redis for {}s", key, ttl_seconds);
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis SETEX {} failed: {}", key, e.what());
    }
}

bool RedisStore::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
