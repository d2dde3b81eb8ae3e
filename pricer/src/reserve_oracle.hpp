#pragma once

#include "eth_rpc.hpp"
#include "decimals_cache.hpp"
#include <string>
#include <memory>
#include <optional>

struct PoolState {
    std::string token0;
    std::string token1;
    std::string reserve0;  // base-10 digits, exact
    std::string reserve1;
};

class ReserveOracle {
public:
    ReserveOracle(std::shared_ptr<EthRpc> rpc, std::shared_ptr<DecimalsCache> decimals);

    // Price of one base token in quote tokens, from the pool's reserves.
    // 0 when the pool does not hold exactly {base, quote}, when the base side
    // is empty, or when any read fails. Never throws.
    double spot_price(const std::string& pool,
                      const std::string& base_token,
                      const std::string& quote_token);

    std::optional<PoolState> read_pool(const std::string& pool);

private:
    std::shared_ptr<EthRpc> rpc_;
    std::shared_ptr<DecimalsCache> decimals_;
};
