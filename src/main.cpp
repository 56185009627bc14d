#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/DataHistory.h"
#include "backtest/AdmissionGate.h"
#include "backtest/StrategyRegistry.h"
#include "engine/PerformanceStore.h"
#include "engine/SignalEvaluator.h"
#include "engine/ValidationPipeline.h"
#include "analytics/FailurePatternMiner.h"
#include "risk/EdgeGate.h"
#include "risk/EdgeGateDiagnostics.h"
#include "risk/EdgeStatsTracker.h"
#include "risk/FailureModeBlacklist.h"
#include "risk/TradeQualityScorer.h"
#include "strategy/EmaCrossStrategy.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace edgeguard;

namespace {

void printUsage() {
    std::cout << "Usage:\n"
              << "  EdgeGuard [--config <path>] --validate <candles.csv|json> [--strategy-id <id>]\n"
              << "            [--version <v>] [--initial-capital <x>] [--json]\n"
              << "  EdgeGuard [--config <path>] --signals <signals.jsonl> [--json]\n"
              << "  EdgeGuard [--config <path>] --report\n";
}

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string mode;
    std::string input_path;
    std::string strategy_id = "ema_cross";
    std::string version = "1";
    double initial_capital = -1.0;
    bool json_mode = false;
};

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if ((arg == "--validate" || arg == "--signals") && i + 1 < argc) {
            opts.mode = arg.substr(2);
            opts.input_path = argv[++i];
        } else if (arg == "--report") {
            opts.mode = "report";
        } else if (arg == "--strategy-id" && i + 1 < argc) {
            opts.strategy_id = argv[++i];
        } else if (arg == "--version" && i + 1 < argc) {
            opts.version = argv[++i];
        } else if (arg == "--initial-capital" && i + 1 < argc) {
            try {
                opts.initial_capital = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value. Ignored.\n";
            }
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !opts.mode.empty();
}

int runValidate(const CliOptions& opts, Config& config) {
    if (!std::filesystem::exists(opts.input_path)) {
        std::cerr << "Data file not found: " << opts.input_path << "\n";
        return 1;
    }
    LOG_INFO("Starting validation with file: {}", opts.input_path);

    const auto candles = backtest::DataHistory::load(opts.input_path);
    const auto state_dir = utils::PathUtils::resolve(config.getStateDir());

    backtest::StrategyRegistry registry(state_dir);
    backtest::AdmissionGate admission(registry, state_dir / "admission_audit.jsonl",
                                      config.getLiveRequirements());
    analytics::FailurePatternMiner miner(config.getPatternMinerConfig(), config.getBlacklistConfig(),
                                         state_dir / "failure_patterns.json");
    risk::FailureModeBlacklist blacklist(config.getBlacklistConfig(), state_dir / "blacklist.json");
    engine::PerformanceStore performance(config.getBlacklistConfig());

    engine::ValidationPipeline pipeline(config.getBacktestConfig(), config.getWalkForwardConfig(),
                                        registry, admission, &miner, &blacklist, &performance);

    strategy::EmaCrossStrategy reference(candles);
    const auto report = pipeline.run(opts.strategy_id, opts.version, candles, reference.function());

    if (!backtest::BacktestEngine::saveResult(report.backtest, state_dir / "backtests")) {
        LOG_WARN("Backtest result could not be saved under {}", (state_dir / "backtests").string());
    }

    if (opts.json_mode) {
        auto out = report.toJson();
        out["performance"] = performance.toJson();
        std::cout << out.dump() << "\n";
    } else {
        std::cout << report.summary();
        std::cout << backtest::WalkForwardValidator::generateReport(report.walk_forward);
        std::cout << miner.generateReport(5) << "\n";
    }
    return report.admission.approved ? 0 : 2;
}

int runSignals(const CliOptions& opts, Config& config) {
    std::ifstream in(opts.input_path);
    if (!in.is_open()) {
        std::cerr << "Signal file could not be opened: " << opts.input_path << "\n";
        return 1;
    }

    const auto state_dir = utils::PathUtils::resolve(config.getStateDir());
    const auto log_dir = utils::PathUtils::resolve(config.getLogDir());

    risk::EdgeStatsTracker tracker(config.getEdgeStatsConfig(), state_dir / "edge_stats.json");
    risk::EdgeGate gate(config.getEdgeGateConfig());
    risk::EdgeGateDiagnostics diagnostics(log_dir / "edge_gate", config.getEdgeGateConfig());
    risk::FailureModeBlacklist blacklist(config.getBlacklistConfig(), state_dir / "blacklist.json");
    risk::TradeQualityScorer scorer(config.getQualityScorerConfig());

    engine::SignalEvaluator evaluator(tracker, gate, &diagnostics, &blacklist, &scorer);

    std::string line;
    std::size_t line_no = 0;
    std::size_t evaluated = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        engine::SignalInput input;
        try {
            input = engine::SignalInput::fromJson(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping signal line {}: {}", line_no, e.what());
            continue;
        }

        const auto outcome = evaluator.evaluate(input);
        ++evaluated;
        if (opts.json_mode) {
            auto j = outcome.toJson();
            j["symbol"] = input.symbol;
            std::cout << j.dump() << "\n";
        } else {
            std::cout << input.symbol << " " << input.direction << " " << input.timeframe
                      << " -> " << risk::toString(outcome.decision.state)
                      << " x" << outcome.decision.position_multiplier
                      << " (" << outcome.decision.reason << ")\n";
        }
    }

    if (evaluated > 0 && !diagnostics.flushDailyStats()) {
        LOG_WARN("Diagnostics daily stats could not be written");
    }
    if (!tracker.config().persist_on_record && !tracker.save()) {
        LOG_WARN("Edge history could not be saved");
    }
    if (!opts.json_mode) {
        std::cout << "\n" << diagnostics.generateReport() << "\n";
    }
    LOG_INFO("Evaluated {} signals from {}", evaluated, opts.input_path);
    return 0;
}

int runReport(Config& config) {
    const auto state_dir = utils::PathUtils::resolve(config.getStateDir());
    backtest::StrategyRegistry registry(state_dir);
    backtest::AdmissionGate admission(registry, state_dir / "admission_audit.jsonl",
                                      config.getLiveRequirements());
    risk::FailureModeBlacklist blacklist(config.getBlacklistConfig(), state_dir / "blacklist.json");

    std::cout << admission.statusReport() << "\n";
    std::cout << blacklist.generateReport() << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        const bool from_file = config.load(opts.config_path);

        Logger::getInstance().initialize(utils::PathUtils::resolve(config.getLogDir()).string());
        Logger::getInstance().setLevel(config.getLogLevel());
        if (!from_file) {
            LOG_WARN("Running with default configuration ({} not loaded)", opts.config_path);
        }

        if (opts.initial_capital > 0.0) {
            config.setInitialCapital(opts.initial_capital);
        }

        if (opts.mode == "validate") {
            return runValidate(opts, config);
        }
        if (opts.mode == "signals") {
            return runSignals(opts, config);
        }
        return runReport(config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
