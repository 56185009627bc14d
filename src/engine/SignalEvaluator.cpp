#include "engine/SignalEvaluator.h"
#include "common/Logger.h"
#include "common/Types.h"

#include <iomanip>
#include <sstream>

namespace edgeguard {
namespace engine {

SignalInput SignalInput::fromJson(const nlohmann::json& j) {
    SignalInput in;
    in.symbol = j.value("symbol", std::string());
    in.direction = j.value("direction", std::string());
    in.timeframe = j.value("timeframe", std::string());
    in.net_edge = j.value("net_edge", 0.0);
    in.confidence = j.value("confidence", 0.0);
    in.signal_type = j.value("signal_type", std::string());
    if (j.contains("metadata") && j["metadata"].is_object()) {
        in.metadata = j["metadata"];
    }
    in.timestamp_ms = j.value("timestamp_ms", 0LL);

    if (j.contains("strategy_id") && j["strategy_id"].is_string()) {
        in.strategy_id = j["strategy_id"].get<std::string>();
    }
    if (j.contains("strategy_type") && j["strategy_type"].is_string()) {
        in.strategy_type = risk::strategyTypeFromString(j["strategy_type"].get<std::string>());
    }
    if (j.contains("regime") && j["regime"].is_string()) {
        in.regime = analytics::marketRegimeFromString(j["regime"].get<std::string>());
    }
    if (j.contains("volatility") && j["volatility"].is_number()) {
        in.volatility = j["volatility"].get<double>();
    }
    if (j.contains("historical_win_rate") && j["historical_win_rate"].is_number()) {
        in.historical_win_rate = j["historical_win_rate"].get<double>();
    }
    if (j.contains("reward_risk_ratio") && j["reward_risk_ratio"].is_number()) {
        in.reward_risk_ratio = j["reward_risk_ratio"].get<double>();
    }
    return in;
}

nlohmann::json SignalOutcome::toJson() const {
    nlohmann::json j;
    j["decision"] = decision.toJson();
    j["gate"] = gate.toJson();
    j["percentile"] = percentile;
    j["insufficient_samples"] = insufficient_samples;
    j["edge_recorded"] = edge_recorded;
    if (blacklist) {
        j["blacklist"] = {{"allowed", blacklist->allowed}, {"reason", blacklist->reason}};
    }
    if (quality) {
        j["quality"] = {
            {"total", quality->total},
            {"allowed", quality->allowed},
            {"signal_strength", quality->signal_strength},
            {"regime_match", quality->regime_match},
            {"historical", quality->historical},
            {"risk_reward", quality->risk_reward}
        };
    }
    if (error) {
        j["error"] = {{"kind", risk::toString(error->kind)}, {"message", error->message}};
    }
    j["warnings"] = nlohmann::json::array();
    for (const auto& w : warnings) {
        j["warnings"].push_back({{"kind", risk::toString(w.kind)}, {"message", w.message}});
    }
    return j;
}

SignalEvaluator::SignalEvaluator(risk::EdgeStatsTracker& tracker,
                                 const risk::EdgeGate& gate,
                                 risk::EdgeGateDiagnostics* diagnostics,
                                 risk::FailureModeBlacklist* blacklist,
                                 risk::TradeQualityScorer* scorer,
                                 const PerformanceStore* performance)
    : tracker_(tracker)
    , gate_(gate)
    , diagnostics_(diagnostics)
    , blacklist_(blacklist)
    , scorer_(scorer)
    , performance_(performance) {}

risk::GateDecision SignalEvaluator::blocked(const std::string& reason) {
    risk::GateDecision d;
    d.state = risk::GateState::BLOCK;
    d.position_multiplier = 0.0;
    d.reason = reason;
    return d;
}

std::optional<double> SignalEvaluator::historicalWinRate(const SignalInput& input) const {
    if (input.historical_win_rate) {
        return input.historical_win_rate;
    }
    if (!performance_ || !input.strategy_id) {
        return std::nullopt;
    }
    // Prefer the matching regime and volatility bucket when it has enough history
    if (input.regime) {
        const auto bucket = performance_->forBucket(*input.strategy_id, *input.regime,
                                                    performance_->volatilityBucket(input.volatility));
        if (bucket && bucket->trades >= MIN_TRADES_FOR_HISTORY) {
            return bucket->winRate();
        }
    }
    const auto stats = performance_->forStrategy(*input.strategy_id);
    if (!stats || stats->trades < MIN_TRADES_FOR_HISTORY) {
        return std::nullopt;
    }
    return stats->winRate();
}

SignalOutcome SignalEvaluator::evaluate(const SignalInput& input) {
    SignalOutcome outcome;

    std::string key_error;
    const auto key = risk::EdgeStatsKey::make(input.symbol, input.direction, input.timeframe, &key_error);
    if (!key) {
        LOG_WARN("Signal rejected ({}:{}:{}): {}", input.symbol, input.direction, input.timeframe, key_error);
        outcome.error = risk::RiskError(risk::RiskErrorKind::INVALID_KEY, key_error);
        outcome.gate = blocked("invalid key");
        outcome.decision = outcome.gate;
        return outcome;
    }

    // Percentile is taken before this signal's edge joins the window
    const auto raw_percentile = tracker_.getPercentile(input.net_edge, *key);
    outcome.insufficient_samples = !raw_percentile.has_value();
    outcome.percentile = gate_.resolvePercentile(raw_percentile);
    if (outcome.insufficient_samples) {
        outcome.warnings.emplace_back(risk::RiskErrorKind::INSUFFICIENT_DATA,
                                      "fewer than " + std::to_string(tracker_.config().min_sample) +
                                      " samples for " + key->toString());
    }

    outcome.gate = gate_.evaluate(input.net_edge, input.confidence, outcome.percentile);
    outcome.decision = outcome.gate;

    if (!outcome.gate.isBlocked() && input.strategy_id) {
        const std::string regime = analytics::toString(input.regime.value_or(analytics::MarketRegime::UNKNOWN));

        if (blacklist_) {
            outcome.blacklist = blacklist_->check(*input.strategy_id, regime, input.volatility);
            if (!outcome.blacklist->allowed) {
                outcome.decision = blocked(outcome.blacklist->reason);
            }
        }

        if (scorer_ && !outcome.decision.isBlocked()) {
            risk::QualityInput q;
            q.signal_confidence = input.confidence;
            q.regime = input.regime.value_or(analytics::MarketRegime::UNKNOWN);
            q.strategy_type = input.strategy_type.value_or(risk::StrategyType::GENERIC);
            q.historical_win_rate = historicalWinRate(input);
            q.reward_risk_ratio = input.reward_risk_ratio;
            outcome.quality = scorer_->score(q);
            if (!outcome.quality->allowed) {
                std::ostringstream reason;
                reason << std::fixed << std::setprecision(1) << "quality score " << outcome.quality->total
                       << " below " << scorer_->config().min_quality_score;
                outcome.decision = blocked(reason.str());
            }
        }
    }

    const long long ts = input.timestamp_ms > 0 ? input.timestamp_ms : currentTimeMs();
    outcome.edge_recorded = tracker_.recordEdge(input.net_edge, *key, input.signal_type, input.metadata, ts);

    if (diagnostics_) {
        risk::DecisionRecord rec;
        rec.timestamp_ms = ts;
        rec.symbol = input.symbol;
        rec.state = outcome.decision.state;
        rec.reason = outcome.decision.reason;
        rec.net_edge = input.net_edge;
        rec.confidence = input.confidence;
        rec.percentile = outcome.percentile;
        rec.position_multiplier = outcome.decision.position_multiplier;
        rec.insufficient_samples = outcome.insufficient_samples;
        if (!diagnostics_->record(rec)) {
            outcome.warnings.emplace_back(risk::RiskErrorKind::PERSISTENCE, "diagnostic record not written");
        }
    }

    return outcome;
}

} // namespace engine
} // namespace edgeguard
