#include "backtest/StrategyRegistry.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>

using namespace edgeguard;

namespace {

std::vector<backtest::TradeRecord> tradesFrom(const std::vector<double>& pnls) {
    std::vector<backtest::TradeRecord> out;
    long long ts = 1700000000000LL;
    for (double pnl : pnls) {
        backtest::TradeRecord t;
        t.strategy_id = "alpha";
        t.version = "1";
        t.entry_time = ts;
        t.exit_time = ts + 60000;
        t.hold_ms = 60000;
        t.pnl = pnl;
        t.win = pnl > 0.0;
        out.push_back(t);
        ts += 120000;
    }
    return out;
}

} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_registry";
    std::filesystem::remove_all(dir);

    {
        backtest::StrategyRegistry registry(dir);
        assert(registry.list().empty());
        assert(registry.path() == dir / "registry.json");

        const auto first = registry.registerStrategy("alpha", "1");
        assert(first.created_at_ms > 0);
        const auto again = registry.registerStrategy("alpha", "1");
        assert(again.created_at_ms == first.created_at_ms);
        assert(std::filesystem::exists(registry.path()));

        // Cumulative 10, 5, 25, -5, 10: drawdown 30 from the 25 peak
        const auto m = registry.updateFromTrades("alpha", "1", tradesFrom({10, -5, 20, -30, 15}));
        assert(m);
        assert(m->total_trades == 5);
        assert(m->winning_trades == 3);
        assert(std::abs(m->win_rate - 0.6) < 1e-12);
        assert(std::abs(m->total_pnl - 10.0) < 1e-12);
        assert(std::abs(m->max_drawdown - 30.0) < 1e-12);
        assert(std::abs(m->profit_factor - 45.0 / 35.0) < 1e-12);
        assert(std::abs(m->largest_loss - (-30.0)) < 1e-12);
        assert(std::abs(m->avg_trade_duration_ms - 60000.0) < 1e-9);
        assert(m->created_at_ms == first.created_at_ms);

        // Requirement failures are all reported
        const auto strict = registry.evaluateLiveRequirements("alpha", "1", backtest::LiveRequirements{});
        assert(!strict.met);
        if (strict.failures.empty() || strict.failures[0] != "trades 5 < 30") {
            std::cerr << "[TEST] expected trade count failure first\n";
            return 1;
        }

        backtest::LiveRequirements loose;
        loose.min_trades = 5;
        loose.min_win_rate = 0.5;
        loose.min_profit_factor = 1.0;
        loose.min_sharpe = 0.0;
        assert(registry.evaluateLiveRequirements("alpha", "1", loose).met);
        loose.max_drawdown = 20.0;
        const auto dd = registry.evaluateLiveRequirements("alpha", "1", loose);
        assert(dd.failures.size() == 1);
        assert(dd.failures[0] == "max drawdown 30.00 > 20.00");

        assert(registry.evaluateLiveRequirements("ghost", "1", loose).failures[0] == "strategy not registered");

        // Enabling needs approval
        std::string error;
        assert(!registry.enableLive("alpha", "1", &error));
        assert(error == "strategy not approved for live trading");
        assert(!registry.enableLive("ghost", "1", &error));
        assert(error == "strategy not registered");

        assert(registry.setValidationStatus("alpha", "1", true, true));
        assert(registry.setApprovedLive("alpha", "1", true));
        assert(registry.enableLive("alpha", "1", &error));
        assert(registry.get("alpha", "1")->approved_at_ms > 0);

        // New trades keep the flags
        const auto updated = registry.updateFromTrades("alpha", "1", tradesFrom({10, 10}));
        assert(updated->approved_live && updated->live_enabled);
        assert(updated->backtest_passed && updated->walkforward_passed);
        assert(updated->total_trades == 2);

        registry.registerStrategy("beta", "2");
        assert(registry.list().size() == 2);
        assert(registry.list(true).size() == 1);
        assert(registry.list(true)[0].strategy_id == "alpha");
        assert(registry.report().find("STRATEGY REGISTRY REPORT") != std::string::npos);

        assert(!registry.setValidationStatus("ghost", "1", true, true));
        assert(!registry.disableLive("ghost", "1"));
    }

    // Reopening restores every field
    {
        backtest::StrategyRegistry registry(dir);
        const auto m = registry.get("alpha", "1");
        if (!m) {
            std::cerr << "[TEST] alpha v1 missing after reload\n";
            return 1;
        }
        assert(m->approved_live);
        assert(m->live_enabled);
        assert(m->total_trades == 2);
        assert(registry.get("beta", "2"));

        const auto copy = backtest::StrategyMetrics::fromJson(m->toJson());
        assert(copy.toJson() == m->toJson());

        // Revoking approval disables live trading too
        assert(registry.setApprovedLive("alpha", "1", false));
        assert(!registry.get("alpha", "1")->live_enabled);
        assert(registry.list(true).empty());

        assert(registry.reload());
        assert(!registry.get("alpha", "1")->approved_live);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] StrategyRegistry PASSED\n";
    return 0;
}
