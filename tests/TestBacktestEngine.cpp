#include "backtest/BacktestEngine.h"

#include <array>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace edgeguard;

namespace {

constexpr long long BAR_MS = 15 * 60 * 1000;

std::vector<Candle> bars(const std::vector<std::array<double, 4>>& ohlc) {
    std::vector<Candle> out;
    long long ts = 1700000000000LL;
    for (const auto& b : ohlc) {
        out.emplace_back(b[0], b[1], b[2], b[3], 100.0, ts);
        ts += BAR_MS;
    }
    return out;
}

backtest::BacktestConfig plainConfig() {
    backtest::BacktestConfig cfg;
    cfg.initial_capital = 10000.0;
    cfg.default_position_pct = 0.10;   // 1000 notional
    cfg.fee_rate = 0.0;
    cfg.slippage_pct = 0.0;
    return cfg;
}

backtest::StrategyFunction enterOnFirstBar(backtest::StrategySignal entry) {
    return [entry](const Candle&, std::size_t i) {
        return i == 0 ? entry : backtest::StrategySignal::hold();
    };
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

} // namespace

int main() {
    // No entries at all
    {
        backtest::BacktestEngine engine(plainConfig());
        auto candles = bars({{100, 101, 99, 100}, {100, 101, 99, 100}});
        auto result = engine.run(candles, [](const Candle&, std::size_t) {
            return backtest::StrategySignal::hold();
        });
        assert(!result.passed);
        assert(!result.error);
        assert(result.reason == "insufficient trades (0 < 10)");
        assert(result.metrics.total_trades == 0);
        assert(result.bars_processed == 2);
    }

    // Stop wins when a bar touches both levels
    {
        backtest::StrategySignal entry;
        entry.action = backtest::StrategyAction::LONG;
        entry.stop_loss = 95.0;
        entry.take_profit = 105.0;

        backtest::BacktestEngine engine(plainConfig(), "s1", "2");
        auto candles = bars({{100, 100, 100, 100}, {100, 106, 94, 100}, {100, 101, 99, 100}});
        auto result = engine.run(candles, enterOnFirstBar(entry));
        if (result.trades.size() != 1 || result.trades[0].exit_reason != "stop_loss") {
            std::cerr << "[TEST] expected a single stop_loss exit\n";
            return 1;
        }
        const auto& t = result.trades[0];
        assert(near(t.exit_price, 95.0));
        assert(near(t.pnl, -50.0));
        assert(!t.win);
        assert(t.hold_bars == 1);
        assert(t.hold_ms == BAR_MS);
        assert(t.strategy_id == "s1" && t.version == "2");
        assert(near(result.metrics.max_drawdown, 50.0));
        assert(near(result.metrics.max_drawdown_pct, 0.005));
        assert(near(result.metrics.final_equity, 9950.0));
        assert(result.exit_reason_counts.at("stop_loss") == 1);
        assert(engine.lastMarketState().has_value());
    }

    // Gaps fill at the open
    {
        backtest::StrategySignal entry;
        entry.action = backtest::StrategyAction::LONG;
        entry.stop_loss = 95.0;
        entry.take_profit = 105.0;

        backtest::BacktestEngine engine(plainConfig());
        auto down = engine.run(bars({{100, 100, 100, 100}, {90, 92, 89, 91}}), enterOnFirstBar(entry));
        assert(down.trades.size() == 1);
        assert(near(down.trades[0].exit_price, 90.0));
        assert(near(down.trades[0].pnl, -100.0));

        auto up = engine.run(bars({{100, 100, 100, 100}, {110, 112, 109, 111}}), enterOnFirstBar(entry));
        assert(up.trades.size() == 1);
        assert(up.trades[0].exit_reason == "take_profit");
        assert(near(up.trades[0].exit_price, 110.0));
        assert(near(up.trades[0].pnl, 100.0));
    }

    // Short side mirrors the levels
    {
        backtest::StrategySignal entry;
        entry.action = backtest::StrategyAction::SHORT;
        entry.stop_loss = 105.0;
        entry.take_profit = 95.0;

        backtest::BacktestEngine engine(plainConfig());
        auto result = engine.run(bars({{100, 100, 100, 100}, {99, 100, 94, 96}}), enterOnFirstBar(entry));
        assert(result.trades.size() == 1);
        assert(result.trades[0].side == TradeSide::SHORT);
        assert(result.trades[0].exit_reason == "take_profit");
        assert(near(result.trades[0].pnl, 50.0));
    }

    // Trailing stop follows the best high and fires on the close
    {
        backtest::StrategySignal entry;
        entry.action = backtest::StrategyAction::LONG;
        entry.trailing_stop_pct = 0.05;

        backtest::BacktestEngine engine(plainConfig());
        auto candles = bars({{100, 100, 100, 100}, {100, 110, 99, 109}, {109, 109, 103, 104}, {104, 105, 103, 104}});
        auto result = engine.run(candles, enterOnFirstBar(entry));
        assert(result.trades.size() == 1);
        assert(result.trades[0].exit_reason == "trailing_stop");
        assert(near(result.trades[0].exit_price, 104.0));
        assert(near(result.trades[0].pnl, 40.0));
        assert(result.trades[0].hold_bars == 2);
    }

    // A throwing strategy holds; open position is closed at the end
    {
        backtest::BacktestEngine engine(plainConfig());
        auto candles = bars({{100, 100, 100, 100}, {101, 101, 101, 101}, {102, 102, 102, 102}});
        auto result = engine.run(candles, [](const Candle&, std::size_t i) -> backtest::StrategySignal {
            if (i == 0) {
                backtest::StrategySignal s;
                s.action = backtest::StrategyAction::LONG;
                return s;
            }
            throw std::runtime_error("indicator not ready");
        });
        assert(!result.error);
        assert(result.trades.size() == 1);
        assert(result.trades[0].exit_reason == "backtest_end");
        assert(near(result.trades[0].pnl, 20.0));
        assert(result.bars_processed == 3);
    }

    // Opposite signal closes without reversing
    {
        backtest::BacktestEngine engine(plainConfig());
        auto candles = bars({{100, 100, 100, 100}, {101, 101, 101, 101}, {102, 102, 102, 102},
                             {103, 103, 103, 103}, {102, 102, 102, 102}});
        auto result = engine.run(candles, [](const Candle&, std::size_t i) {
            backtest::StrategySignal s;
            if (i == 0) s.action = backtest::StrategyAction::LONG;
            if (i == 2 || i == 3) s.action = backtest::StrategyAction::SHORT;
            return s;
        });
        assert(result.trades.size() == 2);
        assert(result.trades[0].exit_reason == "signal_reverse");
        assert(near(result.trades[0].pnl, 20.0));
        assert(result.trades[1].side == TradeSide::SHORT);
        assert(result.trades[1].exit_reason == "backtest_end");
        assert(result.exit_reason_counts.at("signal_reverse") == 1);
    }

    // Fees on both sides, slippage against the trade
    {
        auto cfg = plainConfig();
        cfg.fee_rate = 0.001;
        backtest::StrategySignal entry;
        entry.action = backtest::StrategyAction::LONG;
        entry.size_notional = 1000.0;
        backtest::StrategySignal close;
        close.action = backtest::StrategyAction::CLOSE;

        auto strategy = [entry, close](const Candle&, std::size_t i) {
            return i == 0 ? entry : close;
        };
        auto candles = bars({{100, 100, 100, 100}, {110, 110, 110, 110}});

        backtest::BacktestEngine fees(cfg);
        auto result = fees.run(candles, strategy);
        assert(result.trades.size() == 1);
        assert(result.trades[0].exit_reason == "signal_close");
        assert(near(result.trades[0].pnl, 97.9));

        cfg.fee_rate = 0.0;
        cfg.slippage_pct = 0.01;
        backtest::BacktestEngine slip(cfg);
        result = slip.run(candles, strategy);
        assert(near(result.trades[0].entry_price, 101.0));
        assert(near(result.trades[0].exit_price, 108.9));
        assert(near(result.trades[0].pnl, (108.9 - 101.0) * 1000.0 / 101.0));
    }

    // Malformed input is reported, not thrown
    {
        backtest::BacktestEngine engine(plainConfig());
        auto empty = engine.run({}, enterOnFirstBar(backtest::StrategySignal{}));
        assert(!empty.passed);
        assert(empty.error && empty.error->kind == risk::RiskErrorKind::SIMULATION);
        assert(empty.reason == "simulation error: empty data");

        auto candles = bars({{100, 101, 99, 100}, {100, 99, 101, 100}});
        auto bad = engine.run(candles, enterOnFirstBar(backtest::StrategySignal{}));
        assert(bad.error);
        assert(bad.reason == "simulation error: high below low at bar 1");

        auto none = engine.run(bars({{100, 101, 99, 100}}), backtest::StrategyFunction{});
        assert(none.reason == "simulation error: no strategy function");
    }

    // Steady winner passes every criterion
    {
        std::vector<std::array<double, 4>> ohlc;
        for (int i = 0; i < 24; ++i) {
            const double c = 100.0 + i;
            ohlc.push_back({c, c, c, c});
        }
        backtest::BacktestEngine engine(plainConfig(), "steady", "1");
        auto result = engine.run(bars(ohlc), [](const Candle&, std::size_t i) {
            backtest::StrategySignal s;
            s.action = i % 2 == 0 ? backtest::StrategyAction::LONG : backtest::StrategyAction::CLOSE;
            return s;
        });
        if (!result.passed) {
            std::cerr << "[TEST] steady winner should pass: " << result.reason << "\n";
            return 1;
        }
        assert(result.reason == "all criteria met");
        assert(result.metrics.total_trades == 12);
        assert(result.metrics.win_rate == 1.0);
        assert(result.metrics.profit_factor == 999.0);
        assert(result.metrics.max_drawdown == 0.0);
        assert(result.metrics.sharpe_ratio > 0.0);

        const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_backtest";
        std::filesystem::remove_all(dir);
        assert(backtest::BacktestEngine::saveResult(result, dir));
        assert(!std::filesystem::is_empty(dir));
        assert(backtest::BacktestEngine::toJson(result)["trades"].size() == 12);
        std::filesystem::remove_all(dir);
    }

    // Criteria order
    {
        backtest::BacktestMetrics m;
        m.total_trades = 20;
        m.win_rate = 0.30;
        m.total_pnl = -10.0;
        m.profit_factor = 0.5;
        m.max_drawdown_pct = 0.40;
        const auto failures = backtest::BacktestEngine::evaluateCriteria(m, backtest::BacktestConfig{});
        assert(failures.size() == 4);
        assert(failures[0] == "win rate 30.0% below 45.0%");
        assert(failures[1] == "total pnl -10.00 not above 0.00");
        assert(failures[2] == "profit factor 0.50 below 1.10");
        assert(failures[3] == "max drawdown 40.0% not below 30.0%");
    }

    // Invalid configuration
    {
        bool threw = false;
        auto cfg = plainConfig();
        cfg.initial_capital = 0.0;
        try {
            backtest::BacktestEngine engine(cfg);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
