#pragma once

#include "risk/RiskConfig.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace analytics {

// Closed trade as seen by the miner and the blacklist
struct TradeOutcome {
    std::string strategy_id;
    std::string regime = "UNKNOWN";
    std::optional<double> volatility;
    std::optional<double> volume_ratio;
    double pnl = 0.0;
    long long timestamp_ms = 0;   // exit time
};

struct GroupStats {
    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double avg_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;        // positive magnitude
    double profit_factor = 0.0;   // capped at 999
    double expected_value = 0.0;

    nlohmann::json toJson() const;
};

struct FailurePattern {
    std::string pattern_id;
    std::string type;                                  // e.g. strategy_market_regime
    std::string strategy_id;
    std::map<std::string, std::string> conditions;     // dimension name -> bucket
    GroupStats stats;
    double severity = 0.0;                             // [0,1]
    long long discovered_at_ms = 0;

    nlohmann::json toJson() const;
};

// LOW / MEDIUM / HIGH
std::string volatilityBucket(double volatility, double low = 0.01, double high = 0.03);
// NIGHT_0_6 / MORNING_6_12 / AFTERNOON_12_18 / EVENING_18_24, UTC hour of timestamp_ms
std::string timePeriod(long long timestamp_ms);

GroupStats computeGroupStats(const std::vector<const TradeOutcome*>& trades);

class FailurePatternMiner {
public:
    explicit FailurePatternMiner(risk::PatternMinerConfig config = risk::PatternMinerConfig{},
                                 risk::BlacklistConfig buckets = risk::BlacklistConfig{},
                                 std::optional<std::filesystem::path> storage_path = std::nullopt);

    // Replaces the previous result. Returns patterns with severity >= min_severity,
    // highest severity first.
    std::vector<FailurePattern> minePatterns(const std::vector<TradeOutcome>& trades);

    const std::vector<FailurePattern>& patterns() const { return patterns_; }

    bool isFailure(const GroupStats& stats) const;
    double severity(const GroupStats& stats) const;

    bool hasStorage() const { return storage_path_.has_value(); }
    bool save() const;
    std::string generateReport(std::size_t top_n = 10) const;

private:
    struct Tagged {
        const TradeOutcome* trade;
        std::string vol_bucket;
        std::string time_period;
        std::string volume_bucket;   // empty when no trade carries a volume ratio
    };

    void analyzeGroups(const std::vector<Tagged>& tagged,
                       const std::string& type,
                       const std::vector<std::string>& dimensions);

    risk::PatternMinerConfig config_;
    risk::BlacklistConfig buckets_;
    std::optional<std::filesystem::path> storage_path_;
    std::vector<FailurePattern> patterns_;
};

} // namespace analytics
} // namespace edgeguard
