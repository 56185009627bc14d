#pragma once

#include <cstddef>
#include <optional>

namespace edgeguard {
namespace backtest {

struct BacktestConfig {
    double initial_capital = 10000.0;
    double default_position_pct = 0.02;   // notional per entry when the strategy gives no size

    double fee_rate = 0.0;                // per side
    double slippage_pct = 0.0;            // applied against the trade on entry and exit

    // Bars handed to the regime classifier when tagging an entry
    std::size_t regime_lookback_bars = 96;

    // Pass criteria
    int min_trades = 10;
    double min_win_rate = 0.45;
    double min_total_pnl = 0.0;           // strictly greater than
    double min_profit_factor = 1.1;
    double max_drawdown_pct = 0.30;       // of starting capital, strictly less than
};

struct WalkForwardConfig {
    std::size_t train_window = 1000;      // bars
    std::size_t test_window = 200;
    std::size_t step = 200;
    std::size_t max_parallel_windows = 4;

    double min_pass_rate = 0.70;
    double max_degradation = 0.50;        // strictly less than
    double min_test_win_rate = 0.40;
    double min_test_pnl = 0.0;            // strictly greater than
};

struct LiveRequirements {
    int min_trades = 30;
    double min_win_rate = 0.52;
    double min_profit_factor = 1.2;
    double min_sharpe = 0.5;
    double min_total_pnl = 0.0;
    std::optional<double> max_drawdown;   // absolute, unchecked when unset
};

} // namespace backtest
} // namespace edgeguard
