#pragma once

#include "config.hpp"
#include "price_resolver.hpp"
#include "reserve_oracle.hpp"
#include "response_cache.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

struct ApiResponse {
    int status;
    nlohmann::json body;
};

// Request-level behaviour behind the HTTP routes: parsing, caching and the
// failure policy (500 + empty map, details only in the log).
class PriceService {
public:
    PriceService(std::shared_ptr<PriceResolver> resolver,
                 std::shared_ptr<ReserveOracle> oracle,
                 std::shared_ptr<ResponseCache> cache,
                 const PegPools& peg_pools);

    // GET /api/prices/token?chainId=..&addresses=a,b,c
    ApiResponse token_prices(const std::string& chain_param, const std::string& addresses_param);

    // GET /api/prices/peg
    ApiResponse peg_prices();

    static std::optional<int64_t> parse_chain_id(const std::string& param);

private:
    std::shared_ptr<PriceResolver> resolver_;
    std::shared_ptr<ReserveOracle> oracle_;
    std::shared_ptr<ResponseCache> cache_;
    PegPools peg_pools_;

    static nlohmann::json prices_body(const PriceMap& prices);
    double pool_spot(const std::string& pool, const std::string& base, const std::string& quote);
};
