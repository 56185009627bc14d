#pragma once

#include "risk/RiskConfig.h"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace risk {

enum class GateState {
    BLOCK,
    PROBE_SMALL,
    PROBE_MEDIUM,
    FULL
};

std::string toString(GateState state);
std::optional<GateState> gateStateFromString(const std::string& value);

struct GateDecision {
    GateState state = GateState::BLOCK;
    double position_multiplier = 0.0;
    std::string reason;

    // Hints for the caller; the gate does not enforce them
    double stop_distance_multiplier = 1.0;
    bool allow_pyramiding = false;

    bool isBlocked() const { return state == GateState::BLOCK; }
    bool isProbe() const { return state == GateState::PROBE_SMALL || state == GateState::PROBE_MEDIUM; }

    nlohmann::json toJson() const;
};

// Stateless: each evaluate() call is independent of every other.
class EdgeGate {
public:
    // Throws std::invalid_argument when thresholds are not ascending in [0,1]
    // or a multiplier falls outside [0,1].
    explicit EdgeGate(EdgeGateConfig config = EdgeGateConfig{});

    GateDecision evaluate(double net_edge, double confidence, double percentile) const;

    // Maps the tracker's insufficient-sample sentinel to the conservative default
    double resolvePercentile(const std::optional<double>& percentile) const;

    const EdgeGateConfig& config() const { return config_; }

    static void validate(const EdgeGateConfig& config);

private:
    GateDecision block(const std::string& reason) const;
    GateDecision probe(GateState state, double multiplier, const std::string& reason) const;

    EdgeGateConfig config_;
};

} // namespace risk
} // namespace edgeguard
