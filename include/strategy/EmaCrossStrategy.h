#pragma once

#include "backtest/BacktestEngine.h"
#include "common/Types.h"
#include <optional>
#include <vector>

namespace edgeguard {
namespace strategy {

struct EmaCrossConfig {
    int fast_period = 9;
    int slow_period = 21;
    double stop_loss_pct = 0.02;
    double take_profit_pct = 0.04;
    std::optional<double> trailing_stop_pct;
    bool allow_short = false;   // when false a bearish cross only closes
};

// Reference strategy for the validation CLI. Indicators are computed once over
// the whole series, so calls are read-only and safe from parallel windows.
class EmaCrossStrategy {
public:
    EmaCrossStrategy(const std::vector<Candle>& candles, EmaCrossConfig config = EmaCrossConfig{});

    backtest::StrategySignal operator()(const Candle& candle, std::size_t index) const;

    backtest::StrategyFunction function() const;

private:
    std::optional<double> fastAt(std::size_t index) const;
    std::optional<double> slowAt(std::size_t index) const;

    EmaCrossConfig config_;
    std::vector<double> fast_;
    std::vector<double> slow_;
};

} // namespace strategy
} // namespace edgeguard
