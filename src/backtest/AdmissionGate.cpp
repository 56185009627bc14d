#include "backtest/AdmissionGate.h"
#include "common/Logger.h"

namespace edgeguard {
namespace backtest {

namespace {
constexpr double MAX_VOLATILE_CONFIDENCE = 0.8;
}

AdmissionGate::AdmissionGate(StrategyRegistry& registry,
                             const std::filesystem::path& audit_path,
                             LiveRequirements default_requirements)
    : registry_(registry),
      audit_(audit_path),
      default_requirements_(default_requirements) {}

void AdmissionGate::audit(const std::string& type,
                          const std::string& strategy_id,
                          const std::string& version,
                          const std::string& decision,
                          const std::string& reason,
                          const std::vector<std::string>& failures) {
    const long long now = currentTimeMs();
    nlohmann::json payload;
    payload["timestamp"] = now;
    payload["strategy_id"] = strategy_id;
    payload["version"] = version;
    payload["decision"] = decision;
    payload["reason"] = reason;
    payload["failures"] = failures;
    auto metrics = registry_.get(strategy_id, version);
    payload["metrics"] = metrics ? metrics->toJson() : nlohmann::json();

    if (audit_.append(type, payload, now) == 0) {
        LOG_ERROR("Admission audit append failed for {} v{} ({})", strategy_id, version, decision);
    }
}

AdmissionDecision AdmissionGate::requestApproval(const std::string& strategy_id,
                                                 const std::string& version,
                                                 bool backtest_passed,
                                                 bool walkforward_passed,
                                                 const std::optional<LiveRequirements>& requirements) {
    AdmissionDecision decision;

    if (!registry_.get(strategy_id, version)) {
        decision.reason = "strategy not registered";
        decision.failures.push_back(decision.reason);
        LOG_WARN("Admission rejected {} v{}: {}", strategy_id, version, decision.reason);
        audit("approval", strategy_id, version, "REJECTED", decision.reason, decision.failures);
        return decision;
    }

    if (!registry_.setValidationStatus(strategy_id, version, backtest_passed, walkforward_passed)) {
        LOG_ERROR("Registry save failed while recording validation status for {} v{}", strategy_id, version);
    }

    if (!backtest_passed) {
        decision.failures.push_back("backtest validation failed");
    }
    if (!walkforward_passed) {
        decision.failures.push_back("walk-forward validation failed");
    }
    const auto check = registry_.evaluateLiveRequirements(strategy_id, version,
                                                          requirements.value_or(default_requirements_));
    for (const auto& f : check.failures) {
        decision.failures.push_back(f);
    }

    decision.approved = decision.failures.empty();
    decision.reason = decision.approved ? "approved for live trading" : decision.failures.front();

    if (!registry_.setApprovedLive(strategy_id, version, decision.approved)) {
        LOG_ERROR("Registry save failed while recording approval for {} v{}", strategy_id, version);
    }

    if (decision.approved) {
        LOG_INFO("Admission approved {} v{}", strategy_id, version);
    } else {
        LOG_WARN("Admission rejected {} v{}: {} ({} failures)",
                 strategy_id, version, decision.reason, decision.failures.size());
    }
    audit("approval", strategy_id, version, decision.approved ? "APPROVED" : "REJECTED",
          decision.reason, decision.failures);
    return decision;
}

AdmissionDecision AdmissionGate::checkAdmission(const std::string& strategy_id,
                                                const std::string& version,
                                                const std::optional<analytics::MarketState>& market_state,
                                                bool force) const {
    AdmissionDecision decision;
    if (force) {
        decision.approved = true;
        decision.reason = "forced admission";
        return decision;
    }

    auto metrics = registry_.get(strategy_id, version);
    if (!metrics) {
        decision.reason = "strategy " + strategy_id + " v" + version + " not found in registry";
    } else if (!metrics->approved_live) {
        decision.reason = "strategy not approved for live trading";
    } else if (!metrics->live_enabled) {
        decision.reason = "strategy approved but not enabled";
    } else if (market_state && market_state->regime == analytics::MarketRegime::VOLATILE &&
               market_state->regime_confidence > MAX_VOLATILE_CONFIDENCE) {
        decision.reason = "market too volatile";
    } else if (market_state && market_state->regime == analytics::MarketRegime::UNKNOWN) {
        decision.reason = "market regime unknown";
    } else {
        decision.approved = true;
        decision.reason = "approved and enabled";
    }
    if (!decision.approved) {
        decision.failures.push_back(decision.reason);
    }
    return decision;
}

bool AdmissionGate::enableStrategy(const std::string& strategy_id, const std::string& version) {
    std::string error;
    const bool ok = registry_.enableLive(strategy_id, version, &error);
    if (!ok) {
        LOG_WARN("Cannot enable {} v{}: {}", strategy_id, version, error);
    }
    audit("enable", strategy_id, version, ok ? "ENABLED" : "ENABLE_REJECTED",
          ok ? "enabled for live trading" : error,
          ok ? std::vector<std::string>{} : std::vector<std::string>{error});
    return ok;
}

bool AdmissionGate::disableStrategy(const std::string& strategy_id, const std::string& version,
                                    const std::string& reason) {
    const bool ok = registry_.disableLive(strategy_id, version, reason);
    audit("disable", strategy_id, version, ok ? "DISABLED" : "DISABLE_FAILED",
          reason.empty() ? "manual disable" : reason, {});
    return ok;
}

std::string AdmissionGate::statusReport() const {
    std::string out = registry_.report();
    out += "\nAudit entries: " + std::to_string(audit_.lastSeq()) + " (" + audit_.path().string() + ")\n";
    return out;
}

} // namespace backtest
} // namespace edgeguard
