#pragma once

#include "address.hpp"
#include "http_client.hpp"
#include "price_types.hpp"
#include <memory>
#include <string>

// Batched lookups against a DeFiLlama-compatible price cache:
//   GET {base}/prices/current/{prefix}:{addr},{prefix}:{addr},...
class AggregatorClient {
public:
    AggregatorClient(const std::string& base_url, std::shared_ptr<HttpClient> http);

    // Partial map of strictly positive prices. Never throws; any upstream
    // failure yields an empty map.
    PriceMap get_prices(const std::string& chain_prefix, const AddressSet& addresses);

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;

    std::string build_url(const std::string& chain_prefix, const AddressSet& addresses) const;
};
