#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Addresses and limits the resolution pipeline works against for its one
// supported chain. All addresses are canonical (lower-case, 0x-prefixed).
struct PricingConfig {
    int64_t chain_id = 8453;
    std::string aggregator_chain_prefix = "base";

    std::string stable_token;     // USD proxy, price 1.0
    std::string reference_token;  // volatile hop (wrapped native asset)
    std::string tracked_token;    // second reference priced once per run
    std::string factory;

    int max_concurrency = 4;
};

// Fixed protocol pools read by the peg endpoint.
struct PegPools {
    std::string iaero_token;
    std::string liq_token;
    std::string iaero_aero_pool;
    std::string liq_usdc_pool;
    std::string aero_usdc_pool;
};

struct Config {
    // Chain
    int64_t chain_id;
    std::string aggregator_chain_prefix;
    std::vector<std::string> rpc_urls;

    // Upstreams
    std::string aggregator_base;
    int request_timeout_ms;

    // Token book
    std::string stable_token;
    int stable_decimals;
    std::string reference_token;
    std::string tracked_token;
    std::string factory_address;
    std::string iaero_token;
    std::string liq_token;
    std::string iaero_aero_pool;
    std::string liq_usdc_pool;
    std::string aero_usdc_pool;

    // Caching
    int cache_ttl_seconds;
    int decimals_ttl_seconds;
    std::string redis_url;

    // Resolution
    int max_concurrency;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    PricingConfig pricing() const;
    PegPools peg_pools() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static std::string get_env_address(const char* name, const std::string& default_val);
};
