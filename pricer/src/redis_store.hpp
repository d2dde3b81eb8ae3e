#pragma once

#include <string>
#include <memory>
#include <optional>
#include <sw/redis++/redis++.h>

// Shared response cache backend, so several service replicas reuse each
// other's results inside the validity window.
class RedisStore {
public:
    explicit RedisStore(const std::string& redis_url, const std::string& key_prefix = "tokenprice:");

    std::optional<std::string> get(const std::string& key);
    void setex(const std::string& key, int ttl_seconds, const std::string& value);

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string key_prefix_;
};
