#pragma once

#include "eth_rpc.hpp"
#include "redis_store.hpp"
#include "response_cache.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class HealthCheck {
public:
    // `redis` may be null when no shared cache is configured.
    HealthCheck(std::shared_ptr<EthRpc> rpc,
                std::shared_ptr<RedisStore> redis,
                std::shared_ptr<ResponseCache> cache,
                const std::string& service_name);

    nlohmann::json get_status() const;

private:
    std::shared_ptr<EthRpc> rpc_;
    std::shared_ptr<RedisStore> redis_;
    std::shared_ptr<ResponseCache> cache_;
    std::string service_name_;
};
