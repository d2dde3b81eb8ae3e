#include "pool_registry.hpp"
#include "abi.hpp"
#include "address.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

PoolRegistry::PoolRegistry(std::shared_ptr<EthRpc> rpc, const std::string& factory)
    : rpc_(std::move(rpc))
    , factory_(factory)
{}

std::optional<std::string> PoolRegistry::resolve_pool(const std::string& token_x,
                                                      const std::string& token_y,
                                                      PoolVariant variant) {
    try {
        std::string data = abi::encode_call(abi::kGetPool, {
            abi::encode_address(token_x),
            abi::encode_address(token_y),
            abi::encode_bool(variant == PoolVariant::Stable)
        });

        auto result = rpc_->eth_call(factory_, data);
        if (!result.has_value() || abi::word_count(*result) < 1) {
            return std::nullopt;
        }

        std::string pool = abi::decode_address(*result);
        if (AddressNormalizer::is_zero(pool)) {
            spdlog::debug("No {} pool for {}/{}", variant_name(variant), token_x, token_y);
            return std::nullopt;
        }

        spdlog::debug("Found {} pool {} for {}/{}", variant_name(variant), pool, token_x, token_y);
        return pool;

    } catch (const std::invalid_argument& e) {
        spdlog::warn("getPool({}, {}, {}) rejected: {}", token_x, token_y, variant_name(variant), e.what());
        return std::nullopt;
    } catch (const std::runtime_error& e) {
        spdlog::warn("getPool({}, {}, {}) failed: {}", token_x, token_y, variant_name(variant), e.what());
        return std::nullopt;
    }
}
