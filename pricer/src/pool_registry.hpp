#pragma once

#include "eth_rpc.hpp"
#include "price_types.hpp"
#include <string>
#include <optional>
#include <memory>

// Solidly-style factory: getPool(tokenA, tokenB, stable) -> pool | address(0)
class PoolRegistry {
public:
    PoolRegistry(std::shared_ptr<EthRpc> rpc, const std::string& factory);

    // Arguments are forwarded to the factory in the order given.
    std::optional<std::string> resolve_pool(const std::string& token_x,
                                            const std::string& token_y,
                                            PoolVariant variant);

private:
    std::shared_ptr<EthRpc> rpc_;
    std::string factory_;
};
