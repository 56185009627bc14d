#pragma once

#include "analytics/MarketStateClassifier.h"
#include "engine/PerformanceStore.h"
#include "risk/EdgeGate.h"
#include "risk/EdgeGateDiagnostics.h"
#include "risk/EdgeStatsTracker.h"
#include "risk/FailureModeBlacklist.h"
#include "risk/RiskErrors.h"
#include "risk/TradeQualityScorer.h"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace engine {

struct SignalInput {
    std::string symbol;
    std::string direction;   // LONG / SHORT
    std::string timeframe;   // e.g. 15m
    double net_edge = 0.0;
    double confidence = 0.0;

    std::string signal_type;
    nlohmann::json metadata = nlohmann::json::object();
    long long timestamp_ms = 0;

    // Secondary filters run only for signals attributed to a strategy
    std::optional<std::string> strategy_id;
    std::optional<risk::StrategyType> strategy_type;
    std::optional<analytics::MarketRegime> regime;
    std::optional<double> volatility;
    std::optional<double> historical_win_rate;
    std::optional<double> reward_risk_ratio;

    // Throws nlohmann::json::exception on mistyped fields
    static SignalInput fromJson(const nlohmann::json& j);
};

struct SignalOutcome {
    risk::GateDecision gate;       // EdgeGate output before secondary filters
    risk::GateDecision decision;   // final
    double percentile = 0.0;       // value handed to the gate
    bool insufficient_samples = false;
    bool edge_recorded = false;

    std::optional<risk::BlacklistCheck> blacklist;
    std::optional<risk::QualityScore> quality;

    std::optional<risk::RiskError> error;     // request rejected
    std::vector<risk::RiskError> warnings;    // decision stands

    nlohmann::json toJson() const;
};

// Online flow: key validation, percentile lookup, gate, secondary filters,
// then edge recording and the diagnostic record. Collaborators are not owned.
class SignalEvaluator {
public:
    static constexpr int MIN_TRADES_FOR_HISTORY = 10;

    SignalEvaluator(risk::EdgeStatsTracker& tracker,
                    const risk::EdgeGate& gate,
                    risk::EdgeGateDiagnostics* diagnostics = nullptr,
                    risk::FailureModeBlacklist* blacklist = nullptr,
                    risk::TradeQualityScorer* scorer = nullptr,
                    const PerformanceStore* performance = nullptr);

    SignalOutcome evaluate(const SignalInput& input);

private:
    std::optional<double> historicalWinRate(const SignalInput& input) const;
    static risk::GateDecision blocked(const std::string& reason);

    risk::EdgeStatsTracker& tracker_;
    const risk::EdgeGate& gate_;
    risk::EdgeGateDiagnostics* diagnostics_;
    risk::FailureModeBlacklist* blacklist_;
    risk::TradeQualityScorer* scorer_;
    const PerformanceStore* performance_;
};

} // namespace engine
} // namespace edgeguard
