#include "price_resolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace {

const PoolVariant kVariantOrder[] = {PoolVariant::Volatile, PoolVariant::Stable};

} // namespace

double first_positive(const std::vector<PriceAttempt>& attempts, const std::string& token) {
    for (const auto& attempt : attempts) {
        double price = attempt.run();
        if (price > 0.0) {
            spdlog::debug("Priced {} via {}: {}", token, attempt.label, price);
            return price;
        }
    }
    return 0.0;
}

std::thread spawn_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

void parallel_for(size_t count, int max_workers,
                  const std::function<void(size_t)>& task,
                  const ThreadFactory& spawn) {
    if (count == 0) return;

    size_t worker_count = std::min(count, static_cast<size_t>(std::max(max_workers, 1)));
    if (worker_count == 1) {
        for (size_t i = 0; i < count; i++) {
            task(i);
        }
        return;
    }

    // Each worker claims the next index; a task only touches its own slot.
    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        for (size_t i = next++; i < count; i = next++) {
            try {
                task(i);
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count - 1);
    try {
        for (size_t w = 1; w < worker_count; w++) {
            workers.push_back(spawn(worker));
        }
    } catch (const std::exception& e) {
        spdlog::warn("Started {} of {} workers: {}", workers.size() + 1, worker_count, e.what());
    }

    worker();
    for (auto& t : workers) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

PriceResolver::PriceResolver(const PricingConfig& config,
                             std::shared_ptr<AggregatorClient> aggregator,
                             std::shared_ptr<PoolRegistry> registry,
                             std::shared_ptr<ReserveOracle> oracle)
    : config_(config)
    , aggregator_(std::move(aggregator))
    , registry_(std::move(registry))
    , oracle_(std::move(oracle))
{}

std::vector<PriceAttempt> PriceResolver::pool_attempts(const std::string& base,
                                                       const std::string& quote) {
    std::vector<PriceAttempt> attempts;
    for (PoolVariant variant : kVariantOrder) {
        attempts.push_back({
            std::string(variant_name(variant)) + " pool " + quote,
            [this, base, quote, variant]() {
                auto pool = registry_->resolve_pool(base, quote, variant);
                if (!pool.has_value()) return 0.0;
                return oracle_->spot_price(*pool, base, quote);
            }
        });
    }
    return attempts;
}

double PriceResolver::pool_price(const std::string& base, const std::string& quote) {
    return first_positive(pool_attempts(base, quote), base);
}

ReferencePrices PriceResolver::reference_prices() {
    ReferencePrices refs;
    refs.volatile_in_stable = pool_price(config_.reference_token, config_.stable_token);
    refs.tracked_in_stable = pool_price(config_.tracked_token, config_.stable_token);

    spdlog::debug("Reference prices: reference={} tracked={}",
                  refs.volatile_in_stable, refs.tracked_in_stable);
    return refs;
}

double PriceResolver::resolve_on_chain(const std::string& token, const ReferencePrices& refs) {
    // Direct to the stable unit
    auto attempts = pool_attempts(token, config_.stable_token);

    // Two hops through the volatile reference token
    for (PoolVariant variant : kVariantOrder) {
        attempts.push_back({
            std::string(variant_name(variant)) + " pool via reference",
            [this, token, variant, &refs]() {
                auto pool = registry_->resolve_pool(token, config_.reference_token, variant);
                if (!pool.has_value()) return 0.0;

                double in_reference = oracle_->spot_price(*pool, token, config_.reference_token);
                if (in_reference > 0.0 && refs.volatile_in_stable > 0.0) {
                    return in_reference * refs.volatile_in_stable;
                }
                return 0.0;
            }
        });
    }

    return first_positive(attempts, token);
}

std::vector<double> PriceResolver::resolve_residual(const std::vector<std::string>& tokens,
                                                    const ReferencePrices& refs) {
    std::vector<double> prices(tokens.size(), 0.0);
    parallel_for(tokens.size(), config_.max_concurrency, [&](size_t i) {
        prices[i] = resolve_on_chain(tokens[i], refs);
    });
    return prices;
}

PriceMap PriceResolver::resolve(int64_t chain_id, const AddressSet& addresses) {
    PriceMap out;
    if (addresses.empty()) return out;

    if (!is_supported_chain(chain_id)) {
        spdlog::info("Chain {} not supported, returning zero prices for {} addresses",
                     chain_id, addresses.size());
        for (const auto& addr : addresses) {
            out[addr] = 0.0;
        }
        return out;
    }

    // 1) Aggregator batch
    PriceMap working = aggregator_->get_prices(config_.aggregator_chain_prefix, addresses);
    size_t aggregator_hits = working.size();

    // 2) Reference prices, computed once per run
    ReferencePrices refs = reference_prices();
    if (working.find(config_.reference_token) == working.end() && refs.volatile_in_stable > 0.0) {
        working[config_.reference_token] = refs.volatile_in_stable;
    }
    if (working.find(config_.tracked_token) == working.end() && refs.tracked_in_stable > 0.0) {
        working[config_.tracked_token] = refs.tracked_in_stable;
    }
    if (working.find(config_.stable_token) == working.end()) {
        working[config_.stable_token] = 1.0;
    }

    // 3) On-chain fallback for whatever is still missing
    std::vector<std::string> residual;
    for (const auto& addr : addresses) {
        if (working.find(addr) == working.end()) {
            residual.push_back(addr);
        }
    }

    auto residual_prices = resolve_residual(residual, refs);
    size_t dex_hits = 0;
    for (size_t i = 0; i < residual.size(); i++) {
        working[residual[i]] = residual_prices[i];
        if (residual_prices[i] > 0.0) dex_hits++;
    }

    // Only requested addresses leave the pipeline
    for (const auto& addr : addresses) {
        out[addr] = working[addr];
    }

    spdlog::info("Resolved {} addresses: {} aggregator, {} on-chain, {} unresolved",
                 addresses.size(), aggregator_hits, dex_hits,
                 residual.size() - dex_hits);
    return out;
}
