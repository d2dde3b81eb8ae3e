#include "reserve_oracle.hpp"
#include "abi.hpp"
#include "fixed_point.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ReserveOracle::ReserveOracle(std::shared_ptr<EthRpc> rpc, std::shared_ptr<DecimalsCache> decimals)
    : rpc_(std::move(rpc))
    , decimals_(std::move(decimals))
{}

std::optional<PoolState> ReserveOracle::read_pool(const std::string& pool) {
    auto t0 = rpc_->eth_call(pool, abi::kToken0);
    auto t1 = rpc_->eth_call(pool, abi::kToken1);
    auto reserves = rpc_->eth_call(pool, abi::kGetReserves);

    if (!t0.has_value() || !t1.has_value() || !reserves.has_value()) {
        return std::nullopt;
    }

    // (reserve0, reserve1, blockTimestampLast); uint112 and uint256 layouts
    // both occupy full words.
    PoolState state;
    state.token0 = abi::decode_address(*t0);
    state.token1 = abi::decode_address(*t1);
    state.reserve0 = abi::decode_uint(*reserves, 0);
    state.reserve1 = abi::decode_uint(*reserves, 1);
    return state;
}

double ReserveOracle::spot_price(const std::string& pool,
                                 const std::string& base_token,
                                 const std::string& quote_token) {
    try {
        std::string base = util::to_lower(base_token);
        std::string quote = util::to_lower(quote_token);
        if (base == quote) return 0.0;

        auto state = read_pool(pool);
        if (!state.has_value()) {
            spdlog::debug("Could not read pool {}", pool);
            return 0.0;
        }

        // basic sanity
        if (base != state->token0 && base != state->token1) return 0.0;
        if (quote != state->token0 && quote != state->token1) return 0.0;

        const std::string& base_raw = (base == state->token0) ? state->reserve0 : state->reserve1;
        const std::string& quote_raw = (quote == state->token0) ? state->reserve0 : state->reserve1;

        double base_amount = fixed_point::units_to_double(base_raw, decimals_->get_or_fetch(base));
        double quote_amount = fixed_point::units_to_double(quote_raw, decimals_->get_or_fetch(quote));

        if (base_amount <= 0.0) return 0.0;

        double price = quote_amount / base_amount;
        spdlog::debug("Pool {}: {} base / {} quote -> {}", pool, base_amount, quote_amount, price);
        return price;

    } catch (const std::invalid_argument& e) {
        spdlog::warn("Malformed reserves in pool {}: {}", pool, e.what());
        return 0.0;
    } catch (const std::runtime_error& e) {
        spdlog::warn("Spot price from pool {} failed: {}", pool, e.what());
        return 0.0;
    }
}
