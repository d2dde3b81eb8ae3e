#include "fake_chain.hpp"
#include "../src/abi.hpp"
#include "../src/util.hpp"
#include <algorithm>
#include <new>

namespace fixture {

std::string uint_word(const std::string& decimal) {
    std::string digits = decimal;
    std::string hex;

    while (digits != "0" && !digits.empty()) {
        int rem = 0;
        std::string quotient;
        for (char c : digits) {
            int cur = rem * 10 + (c - '0');
            int q = cur / 16;
            rem = cur % 16;
            if (!quotient.empty() || q != 0) {
                quotient.push_back(static_cast<char>('0' + q));
            }
        }
        hex.push_back("0123456789abcdef"[rem]);
        digits = quotient.empty() ? "0" : quotient;
    }

    std::reverse(hex.begin(), hex.end());
    return std::string(64 - hex.size(), '0') + hex;
}

std::string scaled(const std::string& mantissa, int zeros) {
    return mantissa + std::string(static_cast<size_t>(zeros), '0');
}

} // namespace fixture

namespace {

std::string address_word(const std::string& address) {
    return std::string(24, '0') + address.substr(2);
}

nlohmann::json rpc_reply(const nlohmann::json& id, const std::optional<std::string>& result) {
    if (!result.has_value()) {
        return {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", 3}, {"message", "execution reverted"}}}
        };
    }
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", *result}};
}

} // namespace

FakeChain::FakeChain(const std::string& factory) : factory_(factory) {}

void FakeChain::add_pool(const std::string& pool,
                         const std::string& token0, const std::string& token1,
                         const std::string& reserve0, const std::string& reserve1,
                         bool stable) {
    pools_[pool] = PoolEntry{token0, token1, reserve0, reserve1};
    factory_pools_[{token0, token1, stable}] = pool;
    factory_pools_[{token1, token0, stable}] = pool;
}

void FakeChain::set_decimals(const std::string& token, int decimals) {
    decimals_[token] = decimals;
}

void FakeChain::set_aggregator_price(const std::string& address, const nlohmann::json& price) {
    coins_["base:" + address] = {
        {"decimals", 18},
        {"symbol", "TKN"},
        {"price", price},
        {"confidence", 0.99}
    };
}

void FakeChain::set_aggregator_status(long status) {
    std::lock_guard<std::mutex> lock(mutex_);
    aggregator_status_ = status;
}

void FakeChain::set_aggregator_down(bool down) {
    std::lock_guard<std::mutex> lock(mutex_);
    aggregator_down_ = down;
}

void FakeChain::set_node_down(bool down) {
    std::lock_guard<std::mutex> lock(mutex_);
    node_down_ = down;
}

void FakeChain::set_endpoint_down(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    down_endpoints_.insert(url);
}

void FakeChain::set_out_of_memory(bool oom) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_of_memory_ = oom;
}

void FakeChain::hold_failures_until(int callers) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_quorum_ = callers;
}

int FakeChain::aggregator_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregator_calls_;
}

int FakeChain::rpc_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rpc_calls_;
}

int FakeChain::rpc_calls_to(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_by_address_.find(address);
    return it == calls_by_address_.end() ? 0 : it->second;
}

std::string FakeChain::last_aggregator_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_aggregator_url_;
}

std::string FakeChain::last_rpc_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_rpc_url_;
}

std::optional<HttpResponse> FakeChain::get(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    aggregator_calls_++;
    last_aggregator_url_ = url;

    if (out_of_memory_) throw std::bad_alloc();

    if (aggregator_down_) return std::nullopt;
    if (aggregator_status_ != 200) {
        return HttpResponse{aggregator_status_, "{\"message\":\"unavailable\"}"};
    }

    const std::string marker = "/prices/current/";
    auto pos = url.find(marker);
    if (pos == std::string::npos) {
        return HttpResponse{404, "{}"};
    }

    nlohmann::json coins = nlohmann::json::object();
    for (const auto& id : util::split(url.substr(pos + marker.size()), ',')) {
        if (coins_.contains(id)) {
            coins[id] = coins_[id];
        }
    }
    return HttpResponse{200, nlohmann::json{{"coins", coins}}.dump()};
}

std::optional<HttpResponse> FakeChain::post(const std::string& url,
                                            const std::string& body,
                                            const std::string& content_type) {
    (void)content_type;

    std::unique_lock<std::mutex> lock(mutex_);
    rpc_calls_++;
    last_rpc_url_ = url;

    if (out_of_memory_) throw std::bad_alloc();

    if (node_down_ || down_endpoints_.count(url)) {
        failing_in_flight_++;
        failure_cv_.notify_all();
        failure_cv_.wait(lock, [this]() { return failing_in_flight_ >= failure_quorum_; });
        return std::nullopt;
    }

    auto request = nlohmann::json::parse(body);
    std::string method = request.value("method", "");

    if (method == "eth_blockNumber") {
        return HttpResponse{200, rpc_reply(request["id"], std::string("0x1234")).dump()};
    }

    if (method != "eth_call") {
        return HttpResponse{200, rpc_reply(request["id"], std::nullopt).dump()};
    }

    const auto& call = request["params"][0];
    std::string to = util::to_lower(call.value("to", ""));
    std::string data = call.value("data", "");
    calls_by_address_[to]++;

    return HttpResponse{200, rpc_reply(request["id"], answer_call(to, data)).dump()};
}

std::optional<std::string> FakeChain::answer_call(const std::string& to, const std::string& data) {
    if (to == factory_ && data.rfind(abi::kGetPool, 0) == 0) {
        std::string args = data.substr(10);
        if (args.size() < 192) return std::nullopt;

        std::string x = "0x" + args.substr(24, 40);
        std::string y = "0x" + args.substr(64 + 24, 40);
        bool stable = args[191] == '1';

        auto it = factory_pools_.find({x, y, stable});
        std::string pool = it == factory_pools_.end() ? std::string(kZeroAddress) : it->second;
        return "0x" + address_word(pool);
    }

    if (broken_pools_.count(to)) return std::nullopt;

    auto pool = pools_.find(to);
    if (pool != pools_.end()) {
        if (data == abi::kToken0) return "0x" + address_word(pool->second.token0);
        if (data == abi::kToken1) return "0x" + address_word(pool->second.token1);
        if (data == abi::kGetReserves) {
            return "0x" + fixture::uint_word(pool->second.reserve0) +
                   fixture::uint_word(pool->second.reserve1) +
                   fixture::uint_word("1700000000");
        }
        return std::nullopt;
    }

    auto dec = decimals_.find(to);
    if (dec != decimals_.end() && data == abi::kDecimals) {
        return "0x" + fixture::uint_word(std::to_string(dec->second));
    }

    return std::nullopt;
}

PricingHarness::PricingHarness(int max_concurrency)
    : chain(std::make_shared<FakeChain>())
{
    config.chain_id = 8453;
    config.aggregator_chain_prefix = "base";
    config.stable_token = fixture::kUsdc;
    config.reference_token = fixture::kWeth;
    config.tracked_token = fixture::kAero;
    config.factory = fixture::kFactory;
    config.max_concurrency = max_concurrency;

    chain->set_decimals(fixture::kUsdc, 6);
    chain->set_decimals(fixture::kWeth, 18);
    chain->set_decimals(fixture::kAero, 18);

    rpc = std::make_shared<EthRpc>(std::vector<std::string>{fixture::kNodeUrl}, chain);
    aggregator = std::make_shared<AggregatorClient>(fixture::kAggregatorBase, chain);
    decimals = std::make_shared<DecimalsCache>(rpc, 3600);
    registry = std::make_shared<PoolRegistry>(rpc, config.factory);
    oracle = std::make_shared<ReserveOracle>(rpc, decimals);
    resolver = std::make_shared<PriceResolver>(config, aggregator, registry, oracle);
}
