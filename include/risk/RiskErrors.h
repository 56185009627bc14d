#pragma once

#include <string>

namespace edgeguard {
namespace risk {

enum class RiskErrorKind {
    INSUFFICIENT_DATA,   // recoverable; callers substitute a conservative default
    INVALID_KEY,         // rejects the single request
    PERSISTENCE,         // logged, never changes a decision
    SIMULATION           // backtest input unusable; result marked failed
};

struct RiskError {
    RiskErrorKind kind = RiskErrorKind::INSUFFICIENT_DATA;
    std::string message;

    RiskError() = default;
    RiskError(RiskErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline std::string toString(RiskErrorKind kind) {
    switch (kind) {
        case RiskErrorKind::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case RiskErrorKind::INVALID_KEY: return "INVALID_KEY";
        case RiskErrorKind::PERSISTENCE: return "PERSISTENCE";
        case RiskErrorKind::SIMULATION: return "SIMULATION";
    }
    return "INSUFFICIENT_DATA";
}

} // namespace risk
} // namespace edgeguard
