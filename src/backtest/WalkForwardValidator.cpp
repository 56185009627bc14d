#include "backtest/WalkForwardValidator.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <sstream>

namespace edgeguard {
namespace backtest {

namespace {
std::vector<Candle> slice(const std::vector<Candle>& candles, std::size_t begin, std::size_t end) {
    return std::vector<Candle>(candles.begin() + static_cast<std::ptrdiff_t>(begin),
                               candles.begin() + static_cast<std::ptrdiff_t>(end));
}

StrategyFunction offsetStrategy(const StrategyFunction& strategy, std::size_t offset) {
    return [strategy, offset](const Candle& candle, std::size_t i) {
        return strategy(candle, offset + i);
    };
}

struct WindowOutcome {
    WalkForwardWindow window;
    std::vector<TradeRecord> test_trades;
};
}

nlohmann::json WalkForwardWindow::toJson() const {
    return {
        {"index", index},
        {"train_begin", train_begin},
        {"train_end", train_end},
        {"test_begin", test_begin},
        {"test_end", test_end},
        {"train_metrics", train_metrics.toJson()},
        {"test_metrics", test_metrics.toJson()},
        {"train_pnl_per_bar", train_pnl_per_bar},
        {"test_pnl_per_bar", test_pnl_per_bar},
        {"degradation", degradation},
        {"passed", passed},
        {"reason", reason}
    };
}

WalkForwardValidator::WalkForwardValidator(WalkForwardConfig config,
                                           BacktestConfig backtest_config,
                                           std::string strategy_id,
                                           std::string version)
    : config_(config),
      backtest_config_(backtest_config),
      strategy_id_(std::move(strategy_id)),
      version_(std::move(version)) {}

std::size_t WalkForwardValidator::windowCount(std::size_t bar_count, const WalkForwardConfig& config) {
    if (config.train_window == 0 || config.test_window == 0 || config.step == 0) {
        return 0;
    }
    const std::size_t span = config.train_window + config.test_window;
    if (bar_count < span) {
        return 0;
    }
    return (bar_count - span) / config.step + 1;
}

WalkForwardWindow WalkForwardValidator::runWindow(const std::vector<Candle>& candles,
                                                  const StrategyFunction& strategy,
                                                  std::size_t index,
                                                  std::vector<TradeRecord>& test_trades) const {
    WalkForwardWindow w;
    w.index = index;
    w.train_begin = index * config_.step;
    w.train_end = w.train_begin + config_.train_window;
    w.test_begin = w.train_end;
    w.test_end = w.test_begin + config_.test_window;

    BacktestEngine train_engine(backtest_config_, strategy_id_, version_);
    auto train = train_engine.run(slice(candles, w.train_begin, w.train_end),
                                  offsetStrategy(strategy, w.train_begin));

    BacktestEngine test_engine(backtest_config_, strategy_id_, version_);
    auto test = test_engine.run(slice(candles, w.test_begin, w.test_end),
                                offsetStrategy(strategy, w.test_begin));

    w.train_metrics = train.metrics;
    w.test_metrics = test.metrics;
    w.train_pnl_per_bar = train.metrics.total_pnl / static_cast<double>(config_.train_window);
    w.test_pnl_per_bar = test.metrics.total_pnl / static_cast<double>(config_.test_window);
    if (w.train_pnl_per_bar != 0.0) {
        w.degradation = (w.train_pnl_per_bar - w.test_pnl_per_bar) / std::abs(w.train_pnl_per_bar);
    }

    if (test.error) {
        w.reason = "test " + test.reason;
    } else if (train.error) {
        w.reason = "train " + train.reason;
    } else if (!(test.metrics.total_pnl > config_.min_test_pnl)) {
        w.reason = "test pnl not positive";
    } else if (!(w.degradation < config_.max_degradation)) {
        w.reason = "degradation too high";
    } else if (test.metrics.win_rate < config_.min_test_win_rate) {
        w.reason = "test win rate too low";
    } else {
        w.passed = true;
        w.reason = "ok";
    }

    test_trades = std::move(test.trades);
    return w;
}

WalkForwardResult WalkForwardValidator::validate(const std::vector<Candle>& candles,
                                                 const StrategyFunction& strategy) const {
    WalkForwardResult result;

    if (config_.train_window == 0 || config_.test_window == 0 || config_.step == 0) {
        result.reason = "invalid window configuration";
        result.failure_reasons.push_back(result.reason);
        LOG_WARN("Walk-forward {} v{}: {}", strategy_id_, version_, result.reason);
        return result;
    }

    const std::size_t count = windowCount(candles.size(), config_);
    if (count == 0) {
        result.reason = "insufficient data (" + std::to_string(candles.size()) + " bars < " +
                        std::to_string(config_.train_window + config_.test_window) + ")";
        result.failure_reasons.push_back(result.reason);
        LOG_WARN("Walk-forward {} v{}: {}", strategy_id_, version_, result.reason);
        return result;
    }

    // Windows share nothing mutable; run them in bounded batches
    std::vector<WindowOutcome> outcomes(count);
    const std::size_t batch = std::max<std::size_t>(config_.max_parallel_windows, 1);
    for (std::size_t start = 0; start < count; start += batch) {
        const std::size_t end = std::min(count, start + batch);
        std::vector<std::future<WindowOutcome>> futures;
        futures.reserve(end - start);
        for (std::size_t k = start; k < end; ++k) {
            futures.push_back(std::async(std::launch::async, [this, &candles, &strategy, k]() {
                WindowOutcome out;
                out.window = runWindow(candles, strategy, k, out.test_trades);
                return out;
            }));
        }
        for (std::size_t k = start; k < end; ++k) {
            try {
                outcomes[k] = futures[k - start].get();
            } catch (const std::exception& e) {
                LOG_ERROR("Walk-forward window {} failed: {}", k, e.what());
                outcomes[k].window.index = k;
                outcomes[k].window.passed = false;
                outcomes[k].window.reason = std::string("window error: ") + e.what();
            }
        }
    }

    double degradation_sum = 0.0;
    int test_wins = 0;
    for (auto& out : outcomes) {
        if (out.window.passed) {
            result.windows_passed++;
        }
        degradation_sum += out.window.degradation;
        for (auto& t : out.test_trades) {
            result.test_pnl += t.pnl;
            if (t.win) test_wins++;
            result.oos_trades.push_back(std::move(t));
        }
        result.windows.push_back(std::move(out.window));
    }

    const double n = static_cast<double>(count);
    result.consistency_score = static_cast<double>(result.windows_passed) / n;
    result.avg_degradation = degradation_sum / n;
    result.test_trades = static_cast<int>(result.oos_trades.size());
    result.test_win_rate = result.test_trades > 0
        ? static_cast<double>(test_wins) / static_cast<double>(result.test_trades)
        : 0.0;

    if (result.consistency_score < config_.min_pass_rate) {
        result.failure_reasons.push_back("window pass rate too low");
    }
    if (!(result.avg_degradation < config_.max_degradation)) {
        result.failure_reasons.push_back("average degradation too high");
    }
    if (result.test_win_rate < config_.min_test_win_rate) {
        result.failure_reasons.push_back("out-of-sample win rate too low");
    }
    if (!(result.test_pnl > config_.min_test_pnl)) {
        result.failure_reasons.push_back("out-of-sample pnl not positive");
    }
    result.passed = result.failure_reasons.empty();
    result.reason = result.passed ? "all criteria met" : result.failure_reasons.front();

    LOG_INFO("Walk-forward {} v{}: {}/{} windows passed, avg degradation {:.2f}, OOS WR {:.1f}%, OOS PnL {:.2f} -> {}",
             strategy_id_, version_, result.windows_passed, count, result.avg_degradation,
             result.test_win_rate * 100.0, result.test_pnl, result.passed ? "PASS" : result.reason);
    return result;
}

std::string WalkForwardValidator::generateReport(const WalkForwardResult& result) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << std::string(60, '=') << "\n";
    ss << "WALK-FORWARD VALIDATION REPORT\n";
    ss << std::string(60, '=') << "\n";
    ss << "Result: " << (result.passed ? "PASSED" : "FAILED") << " (" << result.reason << ")\n";
    ss << "Windows: " << result.windows_passed << "/" << result.windows.size()
       << " passed (consistency " << result.consistency_score * 100.0 << "%)\n";
    ss << "Avg degradation: " << result.avg_degradation * 100.0 << "%\n";
    ss << "Out-of-sample: " << result.test_trades << " trades, win rate "
       << result.test_win_rate * 100.0 << "%, pnl " << result.test_pnl << "\n";
    for (const auto& w : result.windows) {
        ss << "  #" << w.index << " train[" << w.train_begin << "," << w.train_end << ") test["
           << w.test_begin << "," << w.test_end << ")  train pnl " << w.train_metrics.total_pnl
           << "  test pnl " << w.test_metrics.total_pnl
           << "  degr " << w.degradation * 100.0 << "%  "
           << (w.passed ? "PASS" : "FAIL: " + w.reason) << "\n";
    }
    for (const auto& reason : result.failure_reasons) {
        ss << "  - " << reason << "\n";
    }
    return ss.str();
}

nlohmann::json WalkForwardValidator::toJson(const WalkForwardResult& result) {
    nlohmann::json j;
    j["passed"] = result.passed;
    j["reason"] = result.reason;
    j["failure_reasons"] = result.failure_reasons;
    j["windows_passed"] = result.windows_passed;
    j["window_count"] = result.windows.size();
    j["consistency_score"] = result.consistency_score;
    j["avg_degradation"] = result.avg_degradation;
    j["test_win_rate"] = result.test_win_rate;
    j["test_pnl"] = result.test_pnl;
    j["test_trades"] = result.test_trades;
    j["windows"] = nlohmann::json::array();
    for (const auto& w : result.windows) {
        j["windows"].push_back(w.toJson());
    }
    return j;
}

} // namespace backtest
} // namespace edgeguard
