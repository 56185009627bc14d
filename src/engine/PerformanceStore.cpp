#include "engine/PerformanceStore.h"

#include <algorithm>
#include <cmath>

namespace edgeguard {
namespace engine {

const char* toString(VolatilityBucket bucket) {
    switch (bucket) {
        case VolatilityBucket::LOW: return "LOW";
        case VolatilityBucket::MEDIUM: return "MEDIUM";
        case VolatilityBucket::HIGH: return "HIGH";
    }
    return "MEDIUM";
}

void StrategyPerformanceStats::add(double pnl) {
    ++trades;
    net_profit += pnl;
    if (pnl > 0.0) {
        ++wins;
        gross_profit += pnl;
    } else if (pnl < 0.0) {
        gross_loss_abs -= pnl;
    }
}

double StrategyPerformanceStats::winRate() const {
    return trades > 0 ? static_cast<double>(wins) / trades : 0.0;
}

double StrategyPerformanceStats::expectancy() const {
    return trades > 0 ? net_profit / trades : 0.0;
}

double StrategyPerformanceStats::profitFactor() const {
    if (gross_loss_abs <= 1e-12) {
        return gross_profit > 0.0 ? 999.0 : 0.0;
    }
    return std::min(gross_profit / gross_loss_abs, 999.0);
}

nlohmann::json StrategyPerformanceStats::toJson() const {
    return {
        {"trades", trades},
        {"wins", wins},
        {"win_rate", winRate()},
        {"net_profit", net_profit},
        {"expectancy", expectancy()},
        {"profit_factor", profitFactor()}
    };
}

PerformanceStore::PerformanceStore(const risk::BlacklistConfig& bands)
    : low_volatility_(bands.low_volatility), high_volatility_(bands.high_volatility) {}

VolatilityBucket PerformanceStore::volatilityBucket(const std::optional<double>& volatility) const {
    if (!volatility) return VolatilityBucket::MEDIUM;
    if (*volatility < low_volatility_) return VolatilityBucket::LOW;
    if (*volatility < high_volatility_) return VolatilityBucket::MEDIUM;
    return VolatilityBucket::HIGH;
}

void PerformanceStore::addLocked(const analytics::TradeOutcome& trade) {
    const std::string id = trade.strategy_id.empty() ? "unknown" : trade.strategy_id;
    const auto regime = analytics::marketRegimeFromString(trade.regime)
                            .value_or(analytics::MarketRegime::UNKNOWN);

    by_strategy_[id].add(trade.pnl);
    by_bucket_[BucketKey{id, regime, volatilityBucket(trade.volatility)}].add(trade.pnl);
}

void PerformanceStore::rebuild(const std::vector<analytics::TradeOutcome>& history) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_strategy_.clear();
    by_bucket_.clear();
    for (const auto& trade : history) {
        addLocked(trade);
    }
}

void PerformanceStore::add(const analytics::TradeOutcome& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    addLocked(trade);
}

std::optional<StrategyPerformanceStats> PerformanceStore::forStrategy(const std::string& strategy_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_strategy_.find(strategy_id);
    if (it == by_strategy_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<StrategyPerformanceStats> PerformanceStore::forBucket(const std::string& strategy_id,
                                                                    analytics::MarketRegime regime,
                                                                    VolatilityBucket bucket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_bucket_.find(BucketKey{strategy_id, regime, bucket});
    if (it == by_bucket_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, StrategyPerformanceStats> PerformanceStore::byStrategy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_strategy_;
}

nlohmann::json PerformanceStore::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json strategies = nlohmann::json::object();
    for (const auto& entry : by_strategy_) {
        strategies[entry.first] = entry.second.toJson();
    }
    nlohmann::json buckets = nlohmann::json::array();
    for (const auto& entry : by_bucket_) {
        auto row = entry.second.toJson();
        row["strategy_id"] = std::get<0>(entry.first);
        row["regime"] = analytics::toString(std::get<1>(entry.first));
        row["volatility"] = toString(std::get<2>(entry.first));
        buckets.push_back(std::move(row));
    }
    return {{"strategies", strategies}, {"buckets", buckets}};
}

} // namespace engine
} // namespace edgeguard
