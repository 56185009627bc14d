#pragma once

#include "analytics/MarketStateClassifier.h"
#include "risk/RiskConfig.h"

#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace edgeguard {
namespace risk {

enum class StrategyType {
    TREND_FOLLOWING,
    MEAN_REVERSION,
    BREAKOUT,
    VOLATILITY,
    GENERIC
};

std::string toString(StrategyType type);
// Unrecognized names map to GENERIC
StrategyType strategyTypeFromString(const std::string& value);

struct QualityInput {
    double signal_confidence = 0.0;   // [0,1]
    analytics::MarketRegime regime = analytics::MarketRegime::UNKNOWN;
    StrategyType strategy_type = StrategyType::GENERIC;
    std::optional<double> historical_win_rate;
    std::optional<double> reward_risk_ratio;
};

struct QualityScore {
    double total = 0.0;   // 0-100
    bool allowed = false;
    double signal_strength = 0.0;
    double regime_match = 0.0;
    double historical = 0.0;
    double risk_reward = 0.0;
};

struct QualityScorerStats {
    std::size_t total_scored = 0;
    std::size_t passed = 0;
    std::size_t blocked = 0;
    double avg_score = 0.0;   // over the last 100 scores
    double pass_rate = 0.0;
};

class TradeQualityScorer {
public:
    explicit TradeQualityScorer(QualityScorerConfig config = QualityScorerConfig{});

    QualityScore score(const QualityInput& input);

    static double regimeMatchScore(StrategyType type, analytics::MarketRegime regime);
    double historicalScore(const std::optional<double>& win_rate) const;
    double riskRewardScore(const std::optional<double>& ratio) const;

    QualityScorerStats getStats() const;
    std::string generateReport() const;

    const QualityScorerConfig& config() const { return config_; }

private:
    static constexpr std::size_t SCORE_WINDOW = 100;

    QualityScorerConfig config_;

    mutable std::mutex mutex_;
    QualityScorerStats stats_;
    std::deque<double> recent_scores_;
};

} // namespace risk
} // namespace edgeguard
