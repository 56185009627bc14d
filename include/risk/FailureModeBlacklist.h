#pragma once

#include "analytics/FailurePatternMiner.h"
#include "risk/RiskConfig.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace risk {

struct CombinationStats {
    std::string strategy_id;
    std::string regime;
    std::string volatility_level;   // empty for the strategy|regime key
    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    double total_pnl = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;        // positive magnitude
    double win_rate = 0.0;
    double expected_value = 0.0;    // mean pnl per trade
    double profit_factor = 0.0;     // capped at 999
    long long updated_at_ms = 0;
};

struct BlacklistEntry {
    std::string key;
    std::string strategy_id;
    std::string regime;
    std::string volatility_level;
    int total_trades = 0;
    double win_rate = 0.0;
    double expected_value = 0.0;
    double profit_factor = 0.0;
    std::string reason;
    std::string source;             // "outcomes" or "pattern"
    long long blacklisted_at_ms = 0;
};

struct BlacklistCheck {
    bool allowed = true;
    std::string reason;
};

// Rolling per-(strategy, regime[, volatility bucket]) outcome counts.
// A combination is blocked once it has enough trades and any of win rate,
// expected value or profit factor falls below its threshold.
class FailureModeBlacklist {
public:
    explicit FailureModeBlacklist(BlacklistConfig config = BlacklistConfig{},
                                  std::optional<std::filesystem::path> storage_path = std::nullopt);

    // Most specific key (with volatility bucket) is checked first
    BlacklistCheck check(const std::string& strategy_id,
                         const std::string& regime,
                         std::optional<double> volatility = std::nullopt) const;

    // Updates both the specific and the strategy|regime key
    void recordTradeResult(const std::string& strategy_id,
                           const std::string& regime,
                           std::optional<double> volatility,
                           double pnl);

    // Manual override; the key is not re-blacklisted by later outcomes
    bool remove(const std::string& key);

    // Blocks strategy|regime combinations found by the miner. Returns how many were added.
    std::size_t importPatterns(const std::vector<analytics::FailurePattern>& patterns);

    bool isBlacklisted(const std::string& key) const;
    std::optional<CombinationStats> stats(const std::string& key) const;
    std::vector<BlacklistEntry> entries() const;

    std::string volatilityLevel(double volatility) const;
    static std::string makeKey(const std::string& strategy_id,
                               const std::string& regime,
                               const std::string& volatility_level = "");

    bool save() const;
    bool load();
    std::string generateReport() const;

private:
    void updateLocked(const std::string& key, const std::string& strategy_id,
                      const std::string& regime, const std::string& vol_level, double pnl);
    bool shouldBlacklist(const CombinationStats& s) const;
    nlohmann::json toJsonLocked() const;
    bool saveLocked() const;

    BlacklistConfig config_;
    std::optional<std::filesystem::path> storage_path_;

    mutable std::mutex mutex_;
    std::map<std::string, CombinationStats> combinations_;
    std::map<std::string, BlacklistEntry> blacklisted_;
    std::set<std::string> overrides_;
};

} // namespace risk
} // namespace edgeguard
