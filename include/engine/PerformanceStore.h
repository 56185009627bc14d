#pragma once

#include "analytics/FailurePatternMiner.h"
#include "analytics/MarketStateClassifier.h"
#include "risk/RiskConfig.h"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace edgeguard {
namespace engine {

enum class VolatilityBucket { LOW = 0, MEDIUM = 1, HIGH = 2 };

const char* toString(VolatilityBucket bucket);

struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    void add(double pnl);

    double winRate() const;
    double expectancy() const;
    // 999 when there are winners and no losers
    double profitFactor() const;

    nlohmann::json toJson() const;
};

// Realized outcomes per strategy, and per (strategy, regime, volatility bucket).
// Thread-safe; readers get copies.
class PerformanceStore {
public:
    PerformanceStore() = default;
    // Volatility cut points shared with the blacklist, so both bucket a signal the same way
    explicit PerformanceStore(const risk::BlacklistConfig& bands);

    void rebuild(const std::vector<analytics::TradeOutcome>& history);
    void add(const analytics::TradeOutcome& trade);

    std::optional<StrategyPerformanceStats> forStrategy(const std::string& strategy_id) const;
    std::optional<StrategyPerformanceStats> forBucket(const std::string& strategy_id,
                                                      analytics::MarketRegime regime,
                                                      VolatilityBucket bucket) const;

    std::map<std::string, StrategyPerformanceStats> byStrategy() const;
    nlohmann::json toJson() const;

    // Below low_volatility LOW, below high_volatility MEDIUM, otherwise HIGH.
    // Unknown volatility is MEDIUM.
    VolatilityBucket volatilityBucket(const std::optional<double>& volatility) const;

private:
    using BucketKey = std::tuple<std::string, analytics::MarketRegime, VolatilityBucket>;

    void addLocked(const analytics::TradeOutcome& trade);

    double low_volatility_ = 0.01;
    double high_volatility_ = 0.03;

    mutable std::mutex mutex_;
    std::map<std::string, StrategyPerformanceStats> by_strategy_;
    std::map<BucketKey, StrategyPerformanceStats> by_bucket_;
};

} // namespace engine
} // namespace edgeguard
