#pragma once

#include <string>
#include <map>

// Canonical address -> USD price. 0 means "unresolved".
using PriceMap = std::map<std::string, double>;

enum class PoolVariant {
    Volatile,   // x*y=k curve, tried first
    Stable      // correlated-asset curve
};

inline const char* variant_name(PoolVariant v) {
    return v == PoolVariant::Stable ? "stable" : "volatile";
}

struct ReferencePrices {
    double volatile_in_stable = 0.0;  // e.g. WETH in USDC
    double tracked_in_stable = 0.0;   // e.g. AERO in USDC
};
