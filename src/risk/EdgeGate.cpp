#include "risk/EdgeGate.h"

#include <cmath>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace edgeguard {
namespace risk {

namespace {
bool inUnitRange(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

std::string fmt3(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << v;
    return ss.str();
}
}

std::string toString(GateState state) {
    switch (state) {
        case GateState::BLOCK: return "BLOCK";
        case GateState::PROBE_SMALL: return "PROBE_SMALL";
        case GateState::PROBE_MEDIUM: return "PROBE_MEDIUM";
        case GateState::FULL: return "FULL";
    }
    return "BLOCK";
}

std::optional<GateState> gateStateFromString(const std::string& value) {
    if (value == "BLOCK") return GateState::BLOCK;
    if (value == "PROBE_SMALL") return GateState::PROBE_SMALL;
    if (value == "PROBE_MEDIUM") return GateState::PROBE_MEDIUM;
    if (value == "FULL") return GateState::FULL;
    return std::nullopt;
}

nlohmann::json GateDecision::toJson() const {
    return {
        {"state", toString(state)},
        {"position_multiplier", position_multiplier},
        {"reason", reason},
        {"stop_distance_multiplier", stop_distance_multiplier},
        {"allow_pyramiding", allow_pyramiding}
    };
}

void EdgeGate::validate(const EdgeGateConfig& c) {
    if (!inUnitRange(c.min_confidence)) {
        throw std::invalid_argument("edge_gate.min_confidence must be in [0,1]");
    }
    if (!inUnitRange(c.percentile_probe_small) ||
        !inUnitRange(c.percentile_probe_medium) ||
        !inUnitRange(c.percentile_full)) {
        throw std::invalid_argument("edge_gate percentile thresholds must be in [0,1]");
    }
    if (!(c.percentile_probe_small <= c.percentile_probe_medium &&
          c.percentile_probe_medium <= c.percentile_full)) {
        throw std::invalid_argument("edge_gate percentile thresholds must be ascending");
    }
    if (!inUnitRange(c.probe_small_multiplier) ||
        !inUnitRange(c.probe_medium_multiplier) ||
        !inUnitRange(c.full_multiplier)) {
        throw std::invalid_argument("edge_gate multipliers must be in [0,1]");
    }
    if (!inUnitRange(c.insufficient_sample_percentile)) {
        throw std::invalid_argument("edge_gate.insufficient_sample_percentile must be in [0,1]");
    }
    if (!std::isfinite(c.probe_stop_distance_multiplier) || c.probe_stop_distance_multiplier <= 0.0) {
        throw std::invalid_argument("edge_gate.probe_stop_distance_multiplier must be positive");
    }
}

EdgeGate::EdgeGate(EdgeGateConfig config) : config_(config) {
    validate(config_);
}

double EdgeGate::resolvePercentile(const std::optional<double>& percentile) const {
    return percentile ? *percentile : config_.insufficient_sample_percentile;
}

GateDecision EdgeGate::block(const std::string& reason) const {
    GateDecision d;
    d.state = GateState::BLOCK;
    d.position_multiplier = 0.0;
    d.reason = reason;
    d.stop_distance_multiplier = 1.0;
    d.allow_pyramiding = false;
    return d;
}

GateDecision EdgeGate::probe(GateState state, double multiplier, const std::string& reason) const {
    GateDecision d;
    d.state = state;
    d.position_multiplier = multiplier;
    d.reason = reason;
    if (state == GateState::FULL) {
        d.stop_distance_multiplier = 1.0;
        d.allow_pyramiding = true;
    } else {
        d.stop_distance_multiplier = config_.probe_stop_distance_multiplier;
        d.allow_pyramiding = config_.probe_allow_pyramiding;
    }
    return d;
}

GateDecision EdgeGate::evaluate(double net_edge, double confidence, double percentile) const {
    // NaN compares false everywhere, so test for the passing side explicitly
    if (!(net_edge > 0.0)) {
        return block("non-positive edge");
    }
    if (!(confidence >= config_.min_confidence)) {
        return block("confidence below threshold");
    }
    if (!(percentile >= config_.percentile_probe_small)) {
        return block("edge below historical floor");
    }

    if (percentile < config_.percentile_probe_medium) {
        return probe(GateState::PROBE_SMALL, config_.probe_small_multiplier,
                     "probe small (percentile " + fmt3(percentile) + ")");
    }
    if (percentile < config_.percentile_full) {
        return probe(GateState::PROBE_MEDIUM, config_.probe_medium_multiplier,
                     "probe medium (percentile " + fmt3(percentile) + ")");
    }
    return probe(GateState::FULL, config_.full_multiplier,
                 "full position (percentile " + fmt3(percentile) + ")");
}

} // namespace risk
} // namespace edgeguard
