#include "backtest/StrategyRegistry.h"
#include "common/Logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace edgeguard {
namespace backtest {

nlohmann::json StrategyMetrics::toJson() const {
    return {
        {"strategy_id", strategy_id},
        {"version", version},
        {"total_trades", total_trades},
        {"winning_trades", winning_trades},
        {"losing_trades", losing_trades},
        {"total_pnl", total_pnl},
        {"avg_trade_pnl", avg_trade_pnl},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"largest_win", largest_win},
        {"largest_loss", largest_loss},
        {"win_rate", win_rate},
        {"profit_factor", profit_factor},
        {"sharpe_ratio", sharpe_ratio},
        {"max_drawdown", max_drawdown},
        {"avg_trade_duration_ms", avg_trade_duration_ms},
        {"backtest_passed", backtest_passed},
        {"walkforward_passed", walkforward_passed},
        {"approved_live", approved_live},
        {"live_enabled", live_enabled},
        {"created_at_ms", created_at_ms},
        {"updated_at_ms", updated_at_ms},
        {"approved_at_ms", approved_at_ms}
    };
}

StrategyMetrics StrategyMetrics::fromJson(const nlohmann::json& j) {
    StrategyMetrics m;
    m.strategy_id = j.value("strategy_id", std::string());
    m.version = j.value("version", std::string());
    m.total_trades = j.value("total_trades", 0);
    m.winning_trades = j.value("winning_trades", 0);
    m.losing_trades = j.value("losing_trades", 0);
    m.total_pnl = j.value("total_pnl", 0.0);
    m.avg_trade_pnl = j.value("avg_trade_pnl", 0.0);
    m.avg_win = j.value("avg_win", 0.0);
    m.avg_loss = j.value("avg_loss", 0.0);
    m.largest_win = j.value("largest_win", 0.0);
    m.largest_loss = j.value("largest_loss", 0.0);
    m.win_rate = j.value("win_rate", 0.0);
    m.profit_factor = j.value("profit_factor", 0.0);
    m.sharpe_ratio = j.value("sharpe_ratio", 0.0);
    m.max_drawdown = j.value("max_drawdown", 0.0);
    m.avg_trade_duration_ms = j.value("avg_trade_duration_ms", 0.0);
    m.backtest_passed = j.value("backtest_passed", false);
    m.walkforward_passed = j.value("walkforward_passed", false);
    m.approved_live = j.value("approved_live", false);
    m.live_enabled = j.value("live_enabled", false);
    m.created_at_ms = j.value("created_at_ms", 0LL);
    m.updated_at_ms = j.value("updated_at_ms", 0LL);
    m.approved_at_ms = j.value("approved_at_ms", 0LL);
    return m;
}

StrategyRegistry::StrategyRegistry(const std::filesystem::path& registry_dir)
    : file_(registry_dir / "registry.json") {
    reload();
}

bool StrategyRegistry::reload() {
    auto doc = file_.load();
    if (!doc) {
        return false;
    }

    std::map<Key, StrategyMetrics> loaded;
    try {
        if (doc->contains("strategies") && (*doc)["strategies"].is_array()) {
            for (const auto& item : (*doc)["strategies"]) {
                auto m = StrategyMetrics::fromJson(item);
                if (m.strategy_id.empty()) {
                    continue;
                }
                Key key{m.strategy_id, m.version};
                loaded[key] = std::move(m);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Registry parse failed ({}): {}", file_.path().string(), e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    strategies_ = std::move(loaded);
    LOG_INFO("Registry loaded {} strategies from {}", strategies_.size(), file_.path().string());
    return true;
}

bool StrategyRegistry::saveLocked() const {
    nlohmann::json doc;
    doc["updated_at_ms"] = currentTimeMs();
    doc["strategies"] = nlohmann::json::array();
    for (const auto& [key, m] : strategies_) {
        doc["strategies"].push_back(m.toJson());
    }
    return file_.save(doc);
}

StrategyMetrics StrategyRegistry::registerStrategy(const std::string& strategy_id, const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key{strategy_id, version};
    auto it = strategies_.find(key);
    if (it != strategies_.end()) {
        return it->second;
    }

    StrategyMetrics m;
    m.strategy_id = strategy_id;
    m.version = version;
    m.created_at_ms = currentTimeMs();
    m.updated_at_ms = m.created_at_ms;
    strategies_[key] = m;
    if (!saveLocked()) {
        LOG_WARN("Registry save failed after registering {} v{}", strategy_id, version);
    }
    LOG_INFO("Registered strategy {} v{}", strategy_id, version);
    return m;
}

StrategyMetrics StrategyRegistry::metricsFromTrades(const std::string& strategy_id,
                                                    const std::string& version,
                                                    const std::vector<TradeRecord>& trades) {
    double cumulative = 0.0;
    double peak = 0.0;
    double max_dd = 0.0;
    for (const auto& t : trades) {
        cumulative += t.pnl;
        peak = std::max(peak, cumulative);
        max_dd = std::max(max_dd, peak - cumulative);
    }

    // Sharpe is scale-free, so unit capital gives the same ratio as any other
    const auto bm = BacktestEngine::computeMetrics(trades, 1.0, max_dd);

    StrategyMetrics m;
    m.strategy_id = strategy_id;
    m.version = version;
    m.total_trades = bm.total_trades;
    m.winning_trades = bm.winning_trades;
    m.losing_trades = bm.losing_trades;
    m.total_pnl = bm.total_pnl;
    m.avg_trade_pnl = bm.avg_pnl;
    m.avg_win = bm.avg_win;
    m.avg_loss = bm.avg_loss;
    m.largest_win = bm.largest_win;
    m.largest_loss = bm.largest_loss;
    m.win_rate = bm.win_rate;
    m.profit_factor = bm.profit_factor;
    m.sharpe_ratio = bm.sharpe_ratio;
    m.max_drawdown = max_dd;
    m.avg_trade_duration_ms = bm.avg_hold_ms;
    return m;
}

std::optional<StrategyMetrics> StrategyRegistry::updateFromTrades(const std::string& strategy_id,
                                                                  const std::string& version,
                                                                  const std::vector<TradeRecord>& trades) {
    StrategyMetrics fresh = metricsFromTrades(strategy_id, version, trades);

    std::lock_guard<std::mutex> lock(mutex_);
    Key key{strategy_id, version};
    auto it = strategies_.find(key);
    const long long now = currentTimeMs();
    if (it != strategies_.end()) {
        const auto& old = it->second;
        fresh.backtest_passed = old.backtest_passed;
        fresh.walkforward_passed = old.walkforward_passed;
        fresh.approved_live = old.approved_live;
        fresh.live_enabled = old.live_enabled;
        fresh.created_at_ms = old.created_at_ms;
        fresh.approved_at_ms = old.approved_at_ms;
    } else {
        fresh.created_at_ms = now;
    }
    fresh.updated_at_ms = now;

    strategies_[key] = fresh;
    if (!saveLocked()) {
        LOG_WARN("Registry save failed after updating {} v{}", strategy_id, version);
    }
    LOG_INFO("Updated metrics for {} v{}: {} trades, win_rate={:.2f}%, pnl={:.2f}",
             strategy_id, version, fresh.total_trades, fresh.win_rate * 100.0, fresh.total_pnl);
    return fresh;
}

bool StrategyRegistry::upsert(const StrategyMetrics& metrics) {
    if (metrics.strategy_id.empty()) {
        LOG_WARN("Registry upsert rejected: empty strategy id");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    strategies_[Key{metrics.strategy_id, metrics.version}] = metrics;
    return saveLocked();
}

RequirementCheck StrategyRegistry::evaluateLiveRequirements(const StrategyMetrics& m,
                                                            const LiveRequirements& r) {
    RequirementCheck check;
    if (m.total_trades < r.min_trades) {
        check.failures.push_back("trades " + std::to_string(m.total_trades) +
                                 " < " + std::to_string(r.min_trades));
    }
    if (m.win_rate < r.min_win_rate) {
        check.failures.push_back(fmt::format("win rate {:.3f} < {:.3f}", m.win_rate, r.min_win_rate));
    }
    if (m.profit_factor < r.min_profit_factor) {
        check.failures.push_back(fmt::format("profit factor {:.2f} < {:.2f}", m.profit_factor, r.min_profit_factor));
    }
    if (m.sharpe_ratio < r.min_sharpe) {
        check.failures.push_back(fmt::format("sharpe {:.2f} < {:.2f}", m.sharpe_ratio, r.min_sharpe));
    }
    if (m.total_pnl < r.min_total_pnl) {
        check.failures.push_back(fmt::format("total pnl {:.2f} < {:.2f}", m.total_pnl, r.min_total_pnl));
    }
    if (r.max_drawdown && m.max_drawdown > *r.max_drawdown) {
        check.failures.push_back(fmt::format("max drawdown {:.2f} > {:.2f}", m.max_drawdown, *r.max_drawdown));
    }
    check.met = check.failures.empty();
    return check;
}

RequirementCheck StrategyRegistry::evaluateLiveRequirements(const std::string& strategy_id,
                                                            const std::string& version,
                                                            const LiveRequirements& requirements) const {
    auto m = get(strategy_id, version);
    if (!m) {
        RequirementCheck check;
        check.failures.push_back("strategy not registered");
        return check;
    }
    return evaluateLiveRequirements(*m, requirements);
}

bool StrategyRegistry::setValidationStatus(const std::string& strategy_id, const std::string& version,
                                           bool backtest_passed, bool walkforward_passed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(Key{strategy_id, version});
    if (it == strategies_.end()) {
        return false;
    }
    it->second.backtest_passed = backtest_passed;
    it->second.walkforward_passed = walkforward_passed;
    it->second.updated_at_ms = currentTimeMs();
    return saveLocked();
}

bool StrategyRegistry::setApprovedLive(const std::string& strategy_id, const std::string& version, bool approved) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(Key{strategy_id, version});
    if (it == strategies_.end()) {
        return false;
    }
    auto& m = it->second;
    m.approved_live = approved;
    if (approved) {
        m.approved_at_ms = currentTimeMs();
    } else {
        m.live_enabled = false;
    }
    m.updated_at_ms = currentTimeMs();
    return saveLocked();
}

bool StrategyRegistry::enableLive(const std::string& strategy_id, const std::string& version, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(Key{strategy_id, version});
    if (it == strategies_.end()) {
        if (error) *error = "strategy not registered";
        return false;
    }
    if (!it->second.approved_live) {
        if (error) *error = "strategy not approved for live trading";
        return false;
    }
    it->second.live_enabled = true;
    it->second.updated_at_ms = currentTimeMs();
    if (!saveLocked()) {
        if (error) *error = "registry save failed";
        return false;
    }
    LOG_INFO("Enabled live trading for {} v{}", strategy_id, version);
    return true;
}

bool StrategyRegistry::disableLive(const std::string& strategy_id, const std::string& version,
                                   const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(Key{strategy_id, version});
    if (it == strategies_.end()) {
        return false;
    }
    it->second.live_enabled = false;
    it->second.updated_at_ms = currentTimeMs();
    LOG_INFO("Disabled live trading for {} v{}: {}", strategy_id, version, reason);
    return saveLocked();
}

std::optional<StrategyMetrics> StrategyRegistry::get(const std::string& strategy_id, const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(Key{strategy_id, version});
    if (it == strategies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<StrategyMetrics> StrategyRegistry::list(bool live_only) const {
    std::vector<StrategyMetrics> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, m] : strategies_) {
            if (!live_only || m.live_enabled) {
                out.push_back(m);
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const StrategyMetrics& a, const StrategyMetrics& b) {
        return a.updated_at_ms > b.updated_at_ms;
    });
    return out;
}

std::string StrategyRegistry::report() const {
    const auto all = list();
    int approved = 0;
    int live = 0;
    for (const auto& m : all) {
        if (m.approved_live) approved++;
        if (m.live_enabled) live++;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << std::string(60, '=') << "\n";
    ss << "STRATEGY REGISTRY REPORT\n";
    ss << std::string(60, '=') << "\n";
    ss << "Strategies: " << all.size() << "  approved: " << approved << "  live: " << live << "\n";
    for (const auto& m : all) {
        ss << "\n  " << m.strategy_id << " v" << m.version
           << (m.live_enabled ? "  [LIVE]" : (m.approved_live ? "  [APPROVED]" : "")) << "\n";
        ss << "    trades " << m.total_trades << ", win rate " << m.win_rate * 100.0
           << "%, pnl " << m.total_pnl << ", PF " << m.profit_factor
           << ", sharpe " << m.sharpe_ratio << ", max DD " << m.max_drawdown << "\n";
        ss << "    backtest " << (m.backtest_passed ? "passed" : "not passed")
           << ", walk-forward " << (m.walkforward_passed ? "passed" : "not passed") << "\n";
    }
    return ss.str();
}

} // namespace backtest
} // namespace edgeguard
