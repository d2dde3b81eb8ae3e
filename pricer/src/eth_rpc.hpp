#pragma once

#include "http_client.hpp"
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <optional>
#include <cstdint>

class EthRpc {
public:
    EthRpc(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http);

    // Read-only call against the latest block. Returns the 0x-prefixed return
    // data, or nullopt on transport failure, JSON-RPC error or revert.
    std::optional<std::string> eth_call(const std::string& to, const std::string& data);

    std::optional<uint64_t> block_number();
    bool is_healthy();

private:
    std::vector<std::string> rpc_urls_;
    std::shared_ptr<HttpClient> http_;
    std::atomic<size_t> current_rpc_index_{0};
    std::atomic<int64_t> next_id_{1};

    std::optional<nlohmann::json> make_request(const std::string& method, const nlohmann::json& params);
    void rotate_rpc(size_t failed_index);
};
