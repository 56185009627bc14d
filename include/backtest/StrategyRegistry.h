#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestEngine.h"
#include "core/state/JsonStateFile.h"

namespace edgeguard {
namespace backtest {

struct StrategyMetrics {
    std::string strategy_id;
    std::string version;

    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;

    double total_pnl = 0.0;
    double avg_trade_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;

    double win_rate = 0.0;
    double profit_factor = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;            // absolute, from cumulative trade pnl
    double avg_trade_duration_ms = 0.0;

    bool backtest_passed = false;
    bool walkforward_passed = false;
    bool approved_live = false;
    bool live_enabled = false;

    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    long long approved_at_ms = 0;         // 0 when never approved

    nlohmann::json toJson() const;
    static StrategyMetrics fromJson(const nlohmann::json& j);
};

struct RequirementCheck {
    bool met = false;
    std::vector<std::string> failures;
};

// Durable per-(strategy, version) metrics and live-approval flags.
// Every mutation is persisted to registry.json before returning.
class StrategyRegistry {
public:
    explicit StrategyRegistry(const std::filesystem::path& registry_dir);

    // Returns the existing record when already registered
    StrategyMetrics registerStrategy(const std::string& strategy_id, const std::string& version);

    // Recomputes the performance fields from the full trade list; flags are preserved
    std::optional<StrategyMetrics> updateFromTrades(const std::string& strategy_id,
                                                    const std::string& version,
                                                    const std::vector<TradeRecord>& trades);

    bool upsert(const StrategyMetrics& metrics);

    RequirementCheck evaluateLiveRequirements(const std::string& strategy_id,
                                              const std::string& version,
                                              const LiveRequirements& requirements) const;
    static RequirementCheck evaluateLiveRequirements(const StrategyMetrics& metrics,
                                                     const LiveRequirements& requirements);

    bool setValidationStatus(const std::string& strategy_id, const std::string& version,
                             bool backtest_passed, bool walkforward_passed);
    // Revoking approval also disables live trading
    bool setApprovedLive(const std::string& strategy_id, const std::string& version, bool approved);
    // Fails for unknown or unapproved strategies; error receives the cause
    bool enableLive(const std::string& strategy_id, const std::string& version,
                    std::string* error = nullptr);
    bool disableLive(const std::string& strategy_id, const std::string& version,
                     const std::string& reason = "");

    std::optional<StrategyMetrics> get(const std::string& strategy_id, const std::string& version) const;
    // Most recently updated first
    std::vector<StrategyMetrics> list(bool live_only = false) const;

    std::string report() const;

    // Replaces in-memory state with the file contents
    bool reload();

    const std::filesystem::path& path() const { return file_.path(); }

    static StrategyMetrics metricsFromTrades(const std::string& strategy_id,
                                             const std::string& version,
                                             const std::vector<TradeRecord>& trades);

private:
    using Key = std::pair<std::string, std::string>;

    bool saveLocked() const;

    core::JsonStateFile file_;
    mutable std::mutex mutex_;
    std::map<Key, StrategyMetrics> strategies_;
};

} // namespace backtest
} // namespace edgeguard
