#include "engine/ValidationPipeline.h"
#include "common/Logger.h"
#include <iomanip>
#include <sstream>

namespace edgeguard {
namespace engine {

nlohmann::json ValidationReport::toJson() const {
    nlohmann::json j;
    j["strategy_id"] = strategy_id;
    j["version"] = version;
    j["backtest"] = backtest::BacktestEngine::toJson(backtest);
    j["walk_forward"] = backtest::WalkForwardValidator::toJson(walk_forward);
    j["metrics"] = metrics ? metrics->toJson() : nlohmann::json();
    j["admission"] = {
        {"approved", admission.approved},
        {"reason", admission.reason},
        {"failures", admission.failures}
    };
    j["patterns"] = nlohmann::json::array();
    for (const auto& p : patterns) {
        j["patterns"].push_back(p.toJson());
    }
    j["blacklisted_added"] = blacklisted_added;
    return j;
}

std::string ValidationReport::summary() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << std::string(60, '=') << "\n";
    ss << "VALIDATION " << strategy_id << " v" << version << "\n";
    ss << std::string(60, '=') << "\n";
    const auto& m = backtest.metrics;
    ss << "Backtest:     " << (backtest.passed ? "PASSED" : "FAILED") << " (" << backtest.reason << ")\n";
    ss << "  trades " << m.total_trades << ", win rate " << m.win_rate * 100.0 << "%, pnl " << m.total_pnl
       << ", PF " << m.profit_factor << ", sharpe " << m.sharpe_ratio
       << ", max DD " << m.max_drawdown_pct * 100.0 << "%\n";
    for (const auto& [reason, count] : backtest.exit_reason_counts) {
        ss << "  exit " << reason << ": " << count << "\n";
    }
    ss << "Walk-forward: " << (walk_forward.passed ? "PASSED" : "FAILED") << " (" << walk_forward.reason << ")\n";
    ss << "  windows " << walk_forward.windows_passed << "/" << walk_forward.windows.size()
       << ", avg degradation " << walk_forward.avg_degradation * 100.0 << "%\n";
    ss << "Admission:    " << (admission.approved ? "APPROVED" : "REJECTED") << " (" << admission.reason << ")\n";
    for (const auto& f : admission.failures) {
        ss << "  - " << f << "\n";
    }
    ss << "Failure patterns: " << patterns.size() << " (" << blacklisted_added << " blacklisted)\n";
    return ss.str();
}

ValidationPipeline::ValidationPipeline(backtest::BacktestConfig backtest_config,
                                       backtest::WalkForwardConfig walk_forward_config,
                                       backtest::StrategyRegistry& registry,
                                       backtest::AdmissionGate& admission,
                                       analytics::FailurePatternMiner* miner,
                                       risk::FailureModeBlacklist* blacklist,
                                       PerformanceStore* performance)
    : backtest_config_(backtest_config),
      walk_forward_config_(walk_forward_config),
      registry_(registry),
      admission_(admission),
      miner_(miner),
      blacklist_(blacklist),
      performance_(performance) {}

void ValidationPipeline::learnFromTrades(const std::vector<backtest::TradeRecord>& trades,
                                         ValidationReport& report) {
    std::vector<analytics::TradeOutcome> outcomes;
    outcomes.reserve(trades.size());
    for (const auto& t : trades) {
        outcomes.push_back(t.toOutcome());
    }

    if (performance_) {
        performance_->rebuild(outcomes);
    }
    if (miner_) {
        report.patterns = miner_->minePatterns(outcomes);
        if (miner_->hasStorage() && !miner_->save()) {
            LOG_WARN("Failure patterns for {} could not be saved", report.strategy_id);
        }
        if (blacklist_) {
            report.blacklisted_added = blacklist_->importPatterns(report.patterns);
        }
    }
}

ValidationReport ValidationPipeline::run(const std::string& strategy_id,
                                         const std::string& version,
                                         const std::vector<Candle>& candles,
                                         const backtest::StrategyFunction& strategy) {
    ValidationReport report;
    report.strategy_id = strategy_id;
    report.version = version;

    LOG_INFO("Validating {} v{} on {} bars", strategy_id, version, candles.size());

    try {
        backtest::BacktestEngine engine(backtest_config_, strategy_id, version);
        report.backtest = engine.run(candles, strategy);

        backtest::WalkForwardValidator validator(walk_forward_config_, backtest_config_, strategy_id, version);
        report.walk_forward = validator.validate(candles, strategy);
    } catch (const std::exception& e) {
        // Construction rejects invalid configuration; nothing was simulated
        LOG_ERROR("Validation of {} v{} aborted: {}", strategy_id, version, e.what());
        report.backtest.reason = std::string("configuration error: ") + e.what();
        report.backtest.failure_reasons.push_back(report.backtest.reason);
        report.backtest.error = risk::RiskError(risk::RiskErrorKind::SIMULATION, e.what());
        report.walk_forward.reason = "not run";
    }

    report.metrics = registry_.updateFromTrades(strategy_id, version, report.backtest.trades);

    report.admission = admission_.requestApproval(strategy_id, version,
                                                  report.backtest.passed,
                                                  report.walk_forward.passed);
    report.metrics = registry_.get(strategy_id, version);

    learnFromTrades(report.backtest.trades, report);

    LOG_INFO("Validation of {} v{} finished: backtest {}, walk-forward {}, admission {}",
             strategy_id, version,
             report.backtest.passed ? "passed" : "failed",
             report.walk_forward.passed ? "passed" : "failed",
             report.admission.approved ? "approved" : "rejected");
    return report;
}

} // namespace engine
} // namespace edgeguard
