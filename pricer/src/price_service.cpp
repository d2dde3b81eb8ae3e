#include "price_service.hpp"
#include "address.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PriceService::PriceService(std::shared_ptr<PriceResolver> resolver,
                           std::shared_ptr<ReserveOracle> oracle,
                           std::shared_ptr<ResponseCache> cache,
                           const PegPools& peg_pools)
    : resolver_(std::move(resolver))
    , oracle_(std::move(oracle))
    , cache_(std::move(cache))
    , peg_pools_(peg_pools)
{}

std::optional<int64_t> PriceService::parse_chain_id(const std::string& param) {
    std::string s = util::trim(param);
    if (s.empty()) return std::nullopt;

    try {
        size_t pos = 0;
        int64_t id = std::stoll(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return id;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

nlohmann::json PriceService::prices_body(const PriceMap& prices) {
    nlohmann::json map = nlohmann::json::object();
    for (const auto& [addr, price] : prices) {
        map[addr] = price;
    }
    return nlohmann::json{{"prices", map}};
}

ApiResponse PriceService::token_prices(const std::string& chain_param,
                                       const std::string& addresses_param) {
    try {
        AddressSet addresses = AddressNormalizer::normalize(addresses_param);
        if (addresses.empty()) {
            return {200, prices_body({})};
        }

        int64_t chain_id = resolver_->config().chain_id;
        if (!util::trim(chain_param).empty()) {
            auto parsed = parse_chain_id(chain_param);
            if (!parsed.has_value()) {
                spdlog::debug("Unparsable chainId '{}'", chain_param);
                PriceMap zeros;
                for (const auto& addr : addresses) zeros[addr] = 0.0;
                return {200, prices_body(zeros)};
            }
            chain_id = *parsed;
        }

        if (!resolver_->is_supported_chain(chain_id)) {
            return {200, prices_body(resolver_->resolve(chain_id, addresses))};
        }

        std::string key = ResponseCache::make_key(chain_id, addresses);
        if (auto cached = cache_->get(key)) {
            spdlog::debug("Serving {} prices from cache", addresses.size());
            return {200, *cached};
        }

        auto body = prices_body(resolver_->resolve(chain_id, addresses));
        cache_->put(key, body);
        return {200, body};

    } catch (const std::exception& e) {
        spdlog::error("prices/token error: {}", e.what());
        return {500, prices_body({})};
    }
}

double PriceService::pool_spot(const std::string& pool, const std::string& base,
                               const std::string& quote) {
    if (!AddressNormalizer::canonicalize(pool).has_value()) {
        return 0.0;
    }
    return oracle_->spot_price(pool, base, quote);
}

ApiResponse PriceService::peg_prices() {
    try {
        const std::string key = "peg";
        if (auto cached = cache_->get(key)) {
            return {200, *cached};
        }

        const auto& cfg = resolver_->config();
        double aero_usd = pool_spot(peg_pools_.aero_usdc_pool, cfg.tracked_token, cfg.stable_token);
        double iaero_in_aero = pool_spot(peg_pools_.iaero_aero_pool, peg_pools_.iaero_token, cfg.tracked_token);
        double liq_usd = pool_spot(peg_pools_.liq_usdc_pool, peg_pools_.liq_token, cfg.stable_token);

        nlohmann::json body = {
            {"aero_usd", aero_usd},
            {"iaero_in_aero", iaero_in_aero},
            {"iaero_usd", aero_usd * iaero_in_aero},
            {"liq_usd", liq_usd},
            {"ts", util::current_iso8601()}
        };

        cache_->put(key, body);
        return {200, body};

    } catch (const std::exception& e) {
        spdlog::error("prices/peg error: {}", e.what());
        return {500, nlohmann::json{{"error", "Failed to fetch peg prices"}}};
    }
}
