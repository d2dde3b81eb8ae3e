#include "health.hpp"

HealthCheck::HealthCheck(std::shared_ptr<EthRpc> rpc,
                         std::shared_ptr<RedisStore> redis,
                         std::shared_ptr<ResponseCache> cache,
                         const std::string& service_name)
    : rpc_(rpc), redis_(redis), cache_(cache), service_name_(service_name) {}

nlohmann::json HealthCheck::get_status() const {
    bool rpc_ok = rpc_->is_healthy();

    nlohmann::json status = {
        {"ok", rpc_ok},
        {"rpc", rpc_ok ? "up" : "degraded"},
        {"cache_entries", cache_->size()},
        {"service", service_name_}
    };

    if (redis_) {
        bool redis_ok = redis_->ping();
        status["redis"] = redis_ok;
        status["ok"] = rpc_ok && redis_ok;
    } else {
        status["redis"] = "disabled";
    }

    return status;
}
