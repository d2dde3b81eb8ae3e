#pragma once

#include "address.hpp"
#include "aggregator_client.hpp"
#include "config.hpp"
#include "pool_registry.hpp"
#include "price_types.hpp"
#include "reserve_oracle.hpp"
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// One step of a price waterfall. Attempts run in order until one returns a
// strictly positive price.
struct PriceAttempt {
    std::string label;
    std::function<double()> run;
};

double first_positive(const std::vector<PriceAttempt>& attempts, const std::string& token);

using ThreadFactory = std::function<std::thread(std::function<void()>)>;

std::thread spawn_thread(std::function<void()> fn);

// Runs task(i) for every i in [0, count) on at most `max_workers` threads,
// the calling thread being one of them. Workers that cannot be started leave
// their share to the others. The first exception thrown by a task is rethrown
// once every worker has finished.
void parallel_for(size_t count, int max_workers,
                  const std::function<void(size_t)>& task,
                  const ThreadFactory& spawn = spawn_thread);

class PriceResolver {
public:
    PriceResolver(const PricingConfig& config,
                  std::shared_ptr<AggregatorClient> aggregator,
                  std::shared_ptr<PoolRegistry> registry,
                  std::shared_ptr<ReserveOracle> oracle);

    // Every address in `addresses` is present in the result; 0 = unresolved.
    PriceMap resolve(int64_t chain_id, const AddressSet& addresses);

    bool is_supported_chain(int64_t chain_id) const { return chain_id == config_.chain_id; }

    ReferencePrices reference_prices();

    // base priced in quote via the factory's pools, volatile then stable
    double pool_price(const std::string& base, const std::string& quote);

    const PricingConfig& config() const { return config_; }

private:
    PricingConfig config_;
    std::shared_ptr<AggregatorClient> aggregator_;
    std::shared_ptr<PoolRegistry> registry_;
    std::shared_ptr<ReserveOracle> oracle_;

    std::vector<PriceAttempt> pool_attempts(const std::string& base, const std::string& quote);
    double resolve_on_chain(const std::string& token, const ReferencePrices& refs);
    std::vector<double> resolve_residual(const std::vector<std::string>& tokens,
                                         const ReferencePrices& refs);
};
