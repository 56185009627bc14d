#include "risk/TradeQualityScorer.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace edgeguard {
namespace risk {

namespace {
using analytics::MarketRegime;

constexpr std::size_t STRATEGY_TYPE_COUNT = 5;
constexpr std::size_t REGIME_COUNT = 6;

// Columns: UNKNOWN, TRENDING_UP, TRENDING_DOWN, RANGING, VOLATILE, QUIET
// (MarketRegime declaration order)
constexpr std::array<std::array<double, REGIME_COUNT>, STRATEGY_TYPE_COUNT> COMPATIBILITY = {{
    /* TREND_FOLLOWING */ {{50.0, 90.0, 90.0, 30.0, 50.0, 40.0}},
    /* MEAN_REVERSION  */ {{50.0, 40.0, 40.0, 90.0, 30.0, 70.0}},
    /* BREAKOUT        */ {{50.0, 70.0, 70.0, 50.0, 40.0, 80.0}},
    /* VOLATILITY      */ {{50.0, 50.0, 50.0, 40.0, 95.0, 20.0}},
    /* GENERIC         */ {{50.0, 70.0, 70.0, 70.0, 60.0, 60.0}},
}};
}

std::string toString(StrategyType type) {
    switch (type) {
        case StrategyType::TREND_FOLLOWING: return "trend_following";
        case StrategyType::MEAN_REVERSION: return "mean_reversion";
        case StrategyType::BREAKOUT: return "breakout";
        case StrategyType::VOLATILITY: return "volatility";
        case StrategyType::GENERIC: return "generic";
    }
    return "generic";
}

StrategyType strategyTypeFromString(const std::string& value) {
    if (value == "trend_following") return StrategyType::TREND_FOLLOWING;
    if (value == "mean_reversion") return StrategyType::MEAN_REVERSION;
    if (value == "breakout") return StrategyType::BREAKOUT;
    if (value == "volatility") return StrategyType::VOLATILITY;
    return StrategyType::GENERIC;
}

TradeQualityScorer::TradeQualityScorer(QualityScorerConfig config) : config_(config) {}

double TradeQualityScorer::regimeMatchScore(StrategyType type, analytics::MarketRegime regime) {
    const auto row = static_cast<std::size_t>(type);
    const auto col = static_cast<std::size_t>(regime);
    if (row >= STRATEGY_TYPE_COUNT || col >= REGIME_COUNT) {
        return 50.0;
    }
    return COMPATIBILITY[row][col];
}

double TradeQualityScorer::historicalScore(const std::optional<double>& win_rate) const {
    if (!win_rate) {
        return config_.neutral_historical_score;
    }
    const double wr = *win_rate;
    if (wr < 0.40) return 20.0;
    if (wr < 0.50) return 40.0 + (wr - 0.40) * 200.0;
    if (wr < 0.60) return 60.0 + (wr - 0.50) * 250.0;
    return std::min(100.0, 85.0 + (wr - 0.60) * 150.0);
}

double TradeQualityScorer::riskRewardScore(const std::optional<double>& ratio) const {
    if (!ratio) {
        return config_.neutral_risk_reward_score;
    }
    const double rr = *ratio;
    if (rr < 0.8) return 20.0;
    if (rr < 1.2) return 50.0;
    if (rr < 1.8) return 70.0;
    if (rr < 2.5) return 85.0;
    return 95.0;
}

QualityScore TradeQualityScorer::score(const QualityInput& input) {
    QualityScore result;
    if (!config_.enabled) {
        result.total = 100.0;
        result.allowed = true;
        return result;
    }

    result.signal_strength = std::clamp(input.signal_confidence, 0.0, 1.0) * 100.0;
    result.regime_match = regimeMatchScore(input.strategy_type, input.regime);
    result.historical = historicalScore(input.historical_win_rate);
    result.risk_reward = riskRewardScore(input.reward_risk_ratio);

    result.total = result.signal_strength * config_.weight_signal_strength
                 + result.regime_match * config_.weight_regime_match
                 + result.historical * config_.weight_historical
                 + result.risk_reward * config_.weight_risk_reward;
    result.allowed = result.total >= config_.min_quality_score;

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_scored++;
    if (result.allowed) {
        stats_.passed++;
    } else {
        stats_.blocked++;
    }
    recent_scores_.push_back(result.total);
    if (recent_scores_.size() > SCORE_WINDOW) {
        recent_scores_.pop_front();
    }
    stats_.avg_score = std::accumulate(recent_scores_.begin(), recent_scores_.end(), 0.0)
                     / static_cast<double>(recent_scores_.size());
    stats_.pass_rate = static_cast<double>(stats_.passed) / static_cast<double>(stats_.total_scored);
    return result;
}

QualityScorerStats TradeQualityScorer::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string TradeQualityScorer::generateReport() const {
    const auto stats = getStats();
    const std::string rule(60, '=');

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << rule << "\n";
    out << "TRADE QUALITY SCORER REPORT\n";
    out << rule << "\n";
    out << "Status: " << (config_.enabled ? "ENABLED" : "DISABLED") << "\n";
    out << "Min Quality Score: " << config_.min_quality_score << "/100\n\n";
    out << "Total Scored: " << stats.total_scored << "\n";
    out << "Passed: " << stats.passed << " (" << stats.pass_rate * 100.0 << "%)\n";
    out << "Blocked: " << stats.blocked << "\n";
    out << "Avg Score: " << stats.avg_score << "/100\n\n";
    out << "Weights: signal " << config_.weight_signal_strength
        << ", regime " << config_.weight_regime_match
        << ", historical " << config_.weight_historical
        << ", risk/reward " << config_.weight_risk_reward << "\n";
    return out.str();
}

} // namespace risk
} // namespace edgeguard
