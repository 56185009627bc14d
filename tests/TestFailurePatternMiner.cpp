#include "analytics/FailurePatternMiner.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>

using namespace edgeguard;

namespace {

analytics::TradeOutcome makeTrade(const std::string& regime, double pnl, long long ts) {
    analytics::TradeOutcome t;
    t.strategy_id = "s1";
    t.regime = regime;
    t.volatility = 0.005;
    t.pnl = pnl;
    t.timestamp_ms = ts;
    return t;
}

} // namespace

int main() {
    // 2023-11-14 22:13:20 UTC
    const long long ts = 1700000000000LL;

    assert(analytics::timePeriod(ts) == "EVENING_18_24");
    assert(analytics::timePeriod(0) == "NIGHT_0_6");
    assert(analytics::volatilityBucket(0.02) == "MEDIUM");

    // Group statistics
    {
        std::vector<analytics::TradeOutcome> trades{makeTrade("RANGING", 30.0, ts),
                                                    makeTrade("RANGING", -10.0, ts),
                                                    makeTrade("RANGING", -20.0, ts),
                                                    makeTrade("RANGING", 0.0, ts)};
        std::vector<const analytics::TradeOutcome*> ptrs;
        for (const auto& t : trades) {
            ptrs.push_back(&t);
        }
        const auto s = analytics::computeGroupStats(ptrs);
        assert(s.total_trades == 4);
        assert(s.wins == 1);
        assert(s.losses == 3);
        assert(std::abs(s.win_rate - 0.25) < 1e-12);
        assert(std::abs(s.avg_loss - 15.0) < 1e-12);
        assert(std::abs(s.profit_factor - 1.0) < 1e-12);
    }

    // Flat and all-winning groups: no losses means 0 without profit, the cap with it
    {
        std::vector<analytics::TradeOutcome> flat{makeTrade("QUIET", 0.0, ts), makeTrade("QUIET", 0.0, ts)};
        std::vector<analytics::TradeOutcome> winners{makeTrade("QUIET", 5.0, ts), makeTrade("QUIET", 0.0, ts)};
        std::vector<const analytics::TradeOutcome*> flat_ptrs{&flat[0], &flat[1]};
        std::vector<const analytics::TradeOutcome*> win_ptrs{&winners[0], &winners[1]};
        const auto f = analytics::computeGroupStats(flat_ptrs);
        if (f.profit_factor != 0.0) {
            std::cerr << "[TEST] flat group profit factor should be 0, got " << f.profit_factor << "\n";
            return 1;
        }
        assert(analytics::computeGroupStats(win_ptrs).profit_factor == 999.0);
    }

    const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_miner";
    std::filesystem::remove_all(dir);

    analytics::FailurePatternMiner miner(risk::PatternMinerConfig{}, risk::BlacklistConfig{},
                                         dir / "failure_patterns.json");
    assert(miner.hasStorage());

    // Too few trades overall
    {
        std::vector<analytics::TradeOutcome> few(5, makeTrade("RANGING", -100.0, ts));
        assert(miner.minePatterns(few).empty());
    }

    // Ranging is a disaster for s1, trending is fine
    std::vector<analytics::TradeOutcome> trades;
    for (int i = 0; i < 3; ++i) {
        trades.push_back(makeTrade("RANGING", 10.0, ts + i));
    }
    for (int i = 0; i < 27; ++i) {
        trades.push_back(makeTrade("RANGING", -100.0, ts + 3 + i));
    }
    for (int i = 0; i < 30; ++i) {
        trades.push_back(makeTrade("TRENDING_UP", 50.0, ts + 30 + i));
    }

    const auto patterns = miner.minePatterns(trades);
    if (patterns.empty()) {
        std::cerr << "[TEST] expected failure patterns for s1 in RANGING\n";
        return 1;
    }

    for (size_t i = 1; i < patterns.size(); ++i) {
        assert(patterns[i - 1].severity >= patterns[i].severity);
    }
    for (const auto& p : patterns) {
        assert(p.severity >= 0.6);
        assert(p.stats.total_trades >= 10);
        auto it = p.conditions.find("market_regime");
        assert(it == p.conditions.end() || it->second != "TRENDING_UP");
    }

    auto regime = std::find_if(patterns.begin(), patterns.end(), [](const analytics::FailurePattern& p) {
        return p.type == "strategy_market_regime";
    });
    assert(regime != patterns.end());
    assert(regime->strategy_id == "s1");
    assert(regime->conditions.at("market_regime") == "RANGING");
    assert(regime->pattern_id == "strategy_market_regime_s1_RANGING");
    assert(regime->stats.total_trades == 30);
    assert(std::abs(regime->stats.win_rate - 0.1) < 1e-12);
    assert(std::abs(regime->stats.expected_value - (-89.0)) < 1e-9);
    assert(regime->severity > 0.8 && regime->severity <= 1.0);
    assert(miner.isFailure(regime->stats));

    // The mixed volatility group is a failure but not severe enough
    auto vol = std::find_if(patterns.begin(), patterns.end(), [](const analytics::FailurePattern& p) {
        return p.type == "strategy_volatility";
    });
    assert(vol == patterns.end());

    assert(miner.patterns().size() == patterns.size());
    assert(miner.save());
    assert(std::filesystem::exists(dir / "failure_patterns.json"));
    assert(miner.generateReport(3).find("strategy_market_regime_s1_RANGING") != std::string::npos);

    // Severity is discounted for small samples
    {
        analytics::GroupStats s;
        s.win_rate = 0.0;
        s.expected_value = -200.0;
        s.profit_factor = 0.0;
        s.total_trades = 30;
        assert(std::abs(miner.severity(s) - 1.0) < 1e-12);
        s.total_trades = 15;
        assert(std::abs(miner.severity(s) - 0.5) < 1e-12);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] FailurePatternMiner PASSED\n";
    return 0;
}
