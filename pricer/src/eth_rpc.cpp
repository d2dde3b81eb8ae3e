#include "eth_rpc.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

EthRpc::EthRpc(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http)
    : rpc_urls_(rpc_urls)
    , http_(std::move(http))
{
    if (rpc_urls_.empty()) {
        throw std::invalid_argument("EthRpc requires at least one endpoint");
    }
}

void EthRpc::rotate_rpc(size_t failed_index) {
    if (rpc_urls_.size() < 2) return;

    size_t next = (failed_index + 1) % rpc_urls_.size();
    // Concurrent failures on the same endpoint rotate only once.
    if (current_rpc_index_.compare_exchange_strong(failed_index, next)) {
        spdlog::warn("Rotated to RPC endpoint: {}", util::redact_url(rpc_urls_[next]));
    }
}

std::optional<nlohmann::json> EthRpc::make_request(const std::string& method,
                                                  const nlohmann::json& params) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };

    size_t index = current_rpc_index_.load();
    auto response = http_->post_json(rpc_urls_[index], payload);

    if (!response.has_value()) {
        spdlog::warn("RPC {} failed on {}", method, util::redact_url(rpc_urls_[index]));
        rotate_rpc(index);
        return std::nullopt;
    }

    if (response->contains("error")) {
        spdlog::debug("RPC {} error: {}", method, (*response)["error"].dump());
        return std::nullopt;
    }

    if (!response->contains("result")) {
        spdlog::warn("RPC {} returned no result", method);
        return std::nullopt;
    }

    return (*response)["result"];
}

std::optional<std::string> EthRpc::eth_call(const std::string& to, const std::string& data) {
    nlohmann::json call = {{"to", to}, {"data", data}};
    auto result = make_request("eth_call", nlohmann::json::array({call, "latest"}));
    if (!result.has_value() || !result->is_string()) {
        return std::nullopt;
    }

    auto hex = result->get<std::string>();
    if (hex.rfind("0x", 0) != 0) {
        spdlog::warn("eth_call to {} returned non-hex data", to);
        return std::nullopt;
    }
    return hex;
}

std::optional<uint64_t> EthRpc::block_number() {
    auto result = make_request("eth_blockNumber", nlohmann::json::array());
    if (!result.has_value() || !result->is_string()) {
        return std::nullopt;
    }

    try {
        return std::stoull(result->get<std::string>(), nullptr, 16);
    } catch (const std::exception& e) {
        spdlog::warn("Unparsable block number: {}", e.what());
        return std::nullopt;
    }
}

bool EthRpc::is_healthy() {
    return block_number().has_value();
}
