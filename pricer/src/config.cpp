#include "config.hpp"
#include "address.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cstdlib>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

std::string Config::get_env_address(const char* name, const std::string& default_val) {
    return util::to_lower(util::trim(get_env(name, default_val)));
}

Config Config::from_env() {
    Config cfg;

    cfg.chain_id = get_env_int("CHAIN_ID", 8453);
    cfg.aggregator_chain_prefix = get_env("AGGREGATOR_CHAIN_PREFIX", "base");

    cfg.rpc_urls = util::split(get_env("RPC_URLS"), ',');
    if (cfg.rpc_urls.empty()) {
        std::string key = get_env("ALCHEMY_KEY");
        if (!key.empty()) {
            cfg.rpc_urls.push_back("https://base-mainnet.g.alchemy.com/v2/" + key);
        }
        cfg.rpc_urls.push_back("https://mainnet.base.org");
    }

    cfg.aggregator_base = get_env("AGGREGATOR_BASE", "https://coins.llama.fi");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);

    // Base mainnet token book
    cfg.stable_token = get_env_address("STABLE_TOKEN", "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
    cfg.stable_decimals = get_env_int("STABLE_DECIMALS", 6);
    cfg.reference_token = get_env_address("REFERENCE_TOKEN", "0x4200000000000000000000000000000000000006");
    cfg.tracked_token = get_env_address("TRACKED_TOKEN", "0x940181a94a35a4569e4529a3cdfb74e38fd98631");
    cfg.factory_address = get_env_address("FACTORY_ADDRESS", "0x420DD381b31aEf6683db6B902084cB0FFECe40Da");
    cfg.iaero_token = get_env_address("IAERO_TOKEN", "0x81034Fb34009115F215f5d5F564AAc9FfA46a1Dc");
    cfg.liq_token = get_env_address("LIQ_TOKEN", "0x7ee8964160126081cebC443a42482E95e393e6A8");
    cfg.iaero_aero_pool = get_env_address("IAERO_AERO_POOL", "0x08d49DA370ecfFBC4c6Fdd2aE82B2D6aE238Affd");
    cfg.liq_usdc_pool = get_env_address("LIQ_USDC_POOL", "0x8966379fCD16F7cB6c6EA61077B6c4fAfECa28f4");
    cfg.aero_usdc_pool = get_env_address("AERO_USDC_POOL", "0x6cDcb1C4A4D1C3C6d054b27AC5B77e89eAFb971d");

    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 300);
    cfg.decimals_ttl_seconds = get_env_int("DECIMALS_TTL_SECONDS", 86400);
    cfg.redis_url = get_env("REDIS_URL");

    cfg.max_concurrency = get_env_int("MAX_CONCURRENCY", 4);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "tokenprice");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (rpc_urls.empty()) {
        throw std::runtime_error("At least one RPC URL is required");
    }

    const std::pair<const char*, const std::string*> required[] = {
        {"STABLE_TOKEN", &stable_token},
        {"REFERENCE_TOKEN", &reference_token},
        {"TRACKED_TOKEN", &tracked_token},
        {"FACTORY_ADDRESS", &factory_address},
    };
    for (const auto& [name, value] : required) {
        auto canonical = AddressNormalizer::canonicalize(*value);
        if (!canonical.has_value() || *canonical != *value) {
            throw std::runtime_error(std::string(name) + " is not a valid address: " + *value);
        }
    }

    if (cache_ttl_seconds <= 0 || decimals_ttl_seconds <= 0) {
        throw std::runtime_error("Cache TTLs must be positive");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }
    if (max_concurrency <= 0) {
        throw std::runtime_error("MAX_CONCURRENCY must be positive");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Chain: {} (aggregator prefix '{}')", chain_id, aggregator_chain_prefix);
    for (const auto& url : rpc_urls) {
        spdlog::info("  RPC: {}", util::redact_url(url));
    }
    spdlog::info("  Cache TTL: {}s, timeout: {}ms, concurrency: {}",
                 cache_ttl_seconds, request_timeout_ms, max_concurrency);
    spdlog::info("  Redis: {}", redis_url.empty() ? "disabled" : "enabled");
}

PricingConfig Config::pricing() const {
    PricingConfig p;
    p.chain_id = chain_id;
    p.aggregator_chain_prefix = aggregator_chain_prefix;
    p.stable_token = stable_token;
    p.reference_token = reference_token;
    p.tracked_token = tracked_token;
    p.factory = factory_address;
    p.max_concurrency = max_concurrency;
    return p;
}

PegPools Config::peg_pools() const {
    PegPools p;
    p.iaero_token = iaero_token;
    p.liq_token = liq_token;
    p.iaero_aero_pool = iaero_aero_pool;
    p.liq_usdc_pool = liq_usdc_pool;
    p.aero_usdc_pool = aero_usdc_pool;
    return p;
}
