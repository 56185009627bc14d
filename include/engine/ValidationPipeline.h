#pragma once

#include "analytics/FailurePatternMiner.h"
#include "backtest/AdmissionGate.h"
#include "backtest/BacktestEngine.h"
#include "backtest/StrategyRegistry.h"
#include "backtest/WalkForwardValidator.h"
#include "engine/PerformanceStore.h"
#include "risk/FailureModeBlacklist.h"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace engine {

struct ValidationReport {
    std::string strategy_id;
    std::string version;

    backtest::BacktestResult backtest;
    backtest::WalkForwardResult walk_forward;
    std::optional<backtest::StrategyMetrics> metrics;
    backtest::AdmissionDecision admission;

    std::vector<analytics::FailurePattern> patterns;
    std::size_t blacklisted_added = 0;

    nlohmann::json toJson() const;
    std::string summary() const;
};

// Offline flow for one strategy version: full-history backtest, walk-forward,
// registry update, admission request. Trade outcomes also feed the pattern
// miner, the blacklist and the performance store when those are supplied.
class ValidationPipeline {
public:
    ValidationPipeline(backtest::BacktestConfig backtest_config,
                       backtest::WalkForwardConfig walk_forward_config,
                       backtest::StrategyRegistry& registry,
                       backtest::AdmissionGate& admission,
                       analytics::FailurePatternMiner* miner = nullptr,
                       risk::FailureModeBlacklist* blacklist = nullptr,
                       PerformanceStore* performance = nullptr);

    ValidationReport run(const std::string& strategy_id,
                         const std::string& version,
                         const std::vector<Candle>& candles,
                         const backtest::StrategyFunction& strategy);

private:
    void learnFromTrades(const std::vector<backtest::TradeRecord>& trades, ValidationReport& report);

    backtest::BacktestConfig backtest_config_;
    backtest::WalkForwardConfig walk_forward_config_;
    backtest::StrategyRegistry& registry_;
    backtest::AdmissionGate& admission_;
    analytics::FailurePatternMiner* miner_;
    risk::FailureModeBlacklist* blacklist_;
    PerformanceStore* performance_;
};

} // namespace engine
} // namespace edgeguard
