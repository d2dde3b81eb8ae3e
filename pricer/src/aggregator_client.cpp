#include "aggregator_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

AggregatorClient::AggregatorClient(const std::string& base_url, std::shared_ptr<HttpClient> http)
    : base_url_(base_url)
    , http_(std::move(http))
{}

std::string AggregatorClient::build_url(const std::string& chain_prefix,
                                        const AddressSet& addresses) const {
    std::vector<std::string> ids;
    ids.reserve(addresses.size());
    for (const auto& addr : addresses) {
        ids.push_back(chain_prefix + ":" + addr);
    }
    return base_url_ + "/prices/current/" + util::join(ids, ",");
}

PriceMap AggregatorClient::get_prices(const std::string& chain_prefix,
                                      const AddressSet& addresses) {
    PriceMap out;
    if (addresses.empty()) return out;

    try {
        auto response = http_->get_json(build_url(chain_prefix, addresses));
        if (!response.has_value()) {
            spdlog::warn("Aggregator unavailable, continuing with on-chain fallback");
            return out;
        }

        if (!response->is_object() || !response->contains("coins") || !(*response)["coins"].is_object()) {
            spdlog::warn("Aggregator response missing 'coins'");
            return out;
        }

        const auto& coins = (*response)["coins"];
        for (const auto& addr : addresses) {
            auto it = coins.find(chain_prefix + ":" + addr);
            if (it == coins.end() || !it->is_object()) continue;

            auto price_it = it->find("price");
            if (price_it == it->end() || !price_it->is_number()) continue;

            double price = price_it->get<double>();
            if (std::isfinite(price) && price > 0.0) {
                out[addr] = price;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Aggregator lookup failed: {}", e.what());
        out.clear();
    }

    spdlog::debug("Aggregator priced {}/{} addresses", out.size(), addresses.size());
    return out;
}
