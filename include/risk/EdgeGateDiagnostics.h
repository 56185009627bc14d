#pragma once

#include "risk/EdgeGate.h"
#include "risk/RiskConfig.h"

#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace risk {

struct DecisionRecord {
    long long timestamp_ms = 0;
    std::string symbol;
    GateState state = GateState::BLOCK;
    std::string reason;
    double net_edge = 0.0;
    double confidence = 0.0;
    double percentile = 0.0;
    double position_multiplier = 0.0;
    bool insufficient_samples = false;

    nlohmann::json toJson() const;
};

struct DecisionSummary {
    std::size_t total_decisions = 0;
    std::map<std::string, std::size_t> decision_counts;   // by state name
    std::map<std::string, std::size_t> block_reasons;
    double block_rate = 0.0;
    double probe_rate = 0.0;   // PROBE_SMALL + PROBE_MEDIUM
    double full_rate = 0.0;
};

// Percentile distribution of recent decisions, bucketed on the gate's band edges
struct PercentileHistogram {
    std::size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double p10 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    std::size_t below_probe_small = 0;
    std::size_t probe_small_band = 0;
    std::size_t probe_medium_band = 0;
    std::size_t full_band = 0;
};

// Append-only record of gate decisions. Each record goes to
// <log_dir>/decisions_YYYY-MM-DD.jsonl (UTC date of the decision); counters
// and a bounded window of recent decisions are kept in memory.
class EdgeGateDiagnostics {
public:
    static constexpr std::size_t MAX_RECENT = 1000;

    explicit EdgeGateDiagnostics(std::optional<std::filesystem::path> log_dir = std::nullopt,
                                 EdgeGateConfig bands = EdgeGateConfig{});

    // Returns false only when the JSONL line could not be written; in-memory
    // counters are updated regardless.
    bool record(const DecisionRecord& record);

    DecisionSummary getSummary() const;
    PercentileHistogram analyzePercentiles() const;
    std::vector<DecisionRecord> recentBlocks(std::size_t limit = 10) const;
    std::vector<DecisionRecord> recentDecisions(std::size_t limit = MAX_RECENT) const;

    std::string generateReport() const;

    // Writes daily_stats_<date>.json for the current day
    bool flushDailyStats();

private:
    static std::string utcDate(long long timestamp_ms);
    bool saveDailyStatsLocked() const;

    std::optional<std::filesystem::path> log_dir_;
    EdgeGateConfig bands_;

    mutable std::mutex mutex_;
    std::map<std::string, std::size_t> decision_counts_;
    std::map<std::string, std::size_t> block_reasons_;
    std::deque<DecisionRecord> recent_;

    std::string current_date_;
    std::map<std::string, std::size_t> daily_stats_;
};

} // namespace risk
} // namespace edgeguard
