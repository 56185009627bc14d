#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestEngine.h"

namespace edgeguard {
namespace backtest {

struct WalkForwardWindow {
    std::size_t index = 0;
    // Bar index ranges into the full series, half-open
    std::size_t train_begin = 0;
    std::size_t train_end = 0;
    std::size_t test_begin = 0;
    std::size_t test_end = 0;

    BacktestMetrics train_metrics;
    BacktestMetrics test_metrics;
    double train_pnl_per_bar = 0.0;
    double test_pnl_per_bar = 0.0;
    double degradation = 0.0;

    bool passed = false;
    std::string reason;

    nlohmann::json toJson() const;
};

struct WalkForwardResult {
    bool passed = false;
    std::string reason;
    std::vector<std::string> failure_reasons;

    std::vector<WalkForwardWindow> windows;
    int windows_passed = 0;
    double consistency_score = 0.0;     // fraction of windows passed
    double avg_degradation = 0.0;
    double test_win_rate = 0.0;         // pooled over all test trades
    double test_pnl = 0.0;
    int test_trades = 0;

    // Concatenated out-of-sample trades, in window order
    std::vector<TradeRecord> oos_trades;
};

// Rolling train/test validation. Each window slice runs in its own BacktestEngine;
// the strategy sees indices into the full series.
class WalkForwardValidator {
public:
    WalkForwardValidator(WalkForwardConfig config,
                         BacktestConfig backtest_config,
                         std::string strategy_id = "strategy",
                         std::string version = "1");

    WalkForwardResult validate(const std::vector<Candle>& candles, const StrategyFunction& strategy) const;

    // Number of complete train+test windows that fit in bar_count bars
    static std::size_t windowCount(std::size_t bar_count, const WalkForwardConfig& config);

    static std::string generateReport(const WalkForwardResult& result);
    static nlohmann::json toJson(const WalkForwardResult& result);

private:
    WalkForwardWindow runWindow(const std::vector<Candle>& candles,
                                const StrategyFunction& strategy,
                                std::size_t index,
                                std::vector<TradeRecord>& test_trades) const;

    WalkForwardConfig config_;
    BacktestConfig backtest_config_;
    std::string strategy_id_;
    std::string version_;
};

} // namespace backtest
} // namespace edgeguard
