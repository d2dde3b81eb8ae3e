#include "config.hpp"
#include "http_client.hpp"
#include "eth_rpc.hpp"
#include "aggregator_client.hpp"
#include "decimals_cache.hpp"
#include "pool_registry.hpp"
#include "reserve_oracle.hpp"
#include "price_resolver.hpp"
#include "redis_store.hpp"
#include "response_cache.hpp"
#include "price_service.hpp"
#include "health.hpp"
#include "api_server.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("tokenprice", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;

    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Token Price Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Upstreams
        auto http = std::make_shared<CurlHttpClient>(config->request_timeout_ms);
        auto rpc = std::make_shared<EthRpc>(config->rpc_urls, http);
        auto aggregator = std::make_shared<AggregatorClient>(config->aggregator_base, http);

        auto decimals = std::make_shared<DecimalsCache>(rpc, config->decimals_ttl_seconds);
        decimals->update(config->stable_token, config->stable_decimals);

        // Pipeline
        auto registry = std::make_shared<PoolRegistry>(rpc, config->factory_address);
        auto oracle = std::make_shared<ReserveOracle>(rpc, decimals);
        auto resolver = std::make_shared<PriceResolver>(config->pricing(), aggregator, registry, oracle);

        std::shared_ptr<RedisStore> redis;
        if (!config->redis_url.empty()) {
            redis = std::make_shared<RedisStore>(config->redis_url);
        }
        auto cache = std::make_shared<ResponseCache>(config->cache_ttl_seconds, redis);

        auto prices = std::make_shared<PriceService>(resolver, oracle, cache, config->peg_pools());
        auto health = std::make_shared<HealthCheck>(rpc, redis, cache, config->service_name);

        ApiServer server(*config, prices, health);
        server.start();

        spdlog::info("{} started on {}:{}", config->service_name, config->listen_addr, server.port());

        auto last_purge = std::chrono::steady_clock::now();
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            if (!server.is_running()) {
                spdlog::error("HTTP server exited unexpectedly");
                exit_code = 1;
                break;
            }

            if (std::chrono::steady_clock::now() - last_purge >= std::chrono::seconds(60)) {
                size_t removed = cache->purge_expired();
                if (removed > 0) {
                    spdlog::debug("Purged {} expired cache entries", removed);
                }
                last_purge = std::chrono::steady_clock::now();
            }
        }

        spdlog::info("Stopping services...");
        server.stop();
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
