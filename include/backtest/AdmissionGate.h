#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "analytics/MarketStateClassifier.h"
#include "backtest/BacktestConfig.h"
#include "backtest/StrategyRegistry.h"
#include "core/state/JsonlJournal.h"

namespace edgeguard {
namespace backtest {

struct AdmissionDecision {
    bool approved = false;
    std::string reason;
    std::vector<std::string> failures;
};

// Promotion of a strategy version to live status. Every approval, rejection,
// enable and disable is appended to the audit journal.
class AdmissionGate {
public:
    AdmissionGate(StrategyRegistry& registry,
                  const std::filesystem::path& audit_path,
                  LiveRequirements default_requirements = LiveRequirements{});

    // Approves only when both validation stages passed and the registry metrics
    // meet the requirements. A rejection revokes any earlier approval.
    AdmissionDecision requestApproval(const std::string& strategy_id,
                                      const std::string& version,
                                      bool backtest_passed,
                                      bool walkforward_passed,
                                      const std::optional<LiveRequirements>& requirements = std::nullopt);

    // Runtime check before a live trade
    AdmissionDecision checkAdmission(const std::string& strategy_id,
                                     const std::string& version,
                                     const std::optional<analytics::MarketState>& market_state = std::nullopt,
                                     bool force = false) const;

    bool enableStrategy(const std::string& strategy_id, const std::string& version);
    bool disableStrategy(const std::string& strategy_id, const std::string& version,
                         const std::string& reason = "");

    std::string statusReport() const;

    const core::JsonlJournal& auditLog() const { return audit_; }

private:
    void audit(const std::string& type,
               const std::string& strategy_id,
               const std::string& version,
               const std::string& decision,
               const std::string& reason,
               const std::vector<std::string>& failures);

    StrategyRegistry& registry_;
    core::JsonlJournal audit_;
    LiveRequirements default_requirements_;
};

} // namespace backtest
} // namespace edgeguard
