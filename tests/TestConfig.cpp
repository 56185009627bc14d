#include "common/Config.h"
#include "common/Logger.h"
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    using namespace edgeguard;

    spdlog::set_level(spdlog::level::debug);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // Defaults when the file is missing
    const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_config";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    assert(!config.load((dir / "missing.json").string()));
    assert(std::abs(config.getEdgeGateConfig().percentile_full - 0.90) < 1e-12);
    assert(config.getEdgeStatsConfig().min_sample == 50);
    assert(config.getBacktestConfig().initial_capital == 10000.0);

    // Partial file: listed keys change, everything else keeps its default
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({
            "log_level": "debug",
            "paths": {"log_dir": "/tmp/eg_logs", "state_dir": "/tmp/eg_state"},
            "edge_gate": {"min_confidence": 0.6, "percentile_full": 0.95},
            "edge_stats": {"max_window": 500, "persist_on_record": true},
            "quality": {"min_quality_score": 65.0},
            "blacklist": {"min_trades_for_analysis": 20},
            "pattern_miner": {"min_severity": 0.5},
            "backtest": {"initial_capital": 5000.0, "fee_rate": 0.0005},
            "walk_forward": {"train_window": 300, "max_parallel_windows": 2},
            "admission": {"min_trades": 50, "max_drawdown": 750.0}
        })";
    }

    if (!config.load(path.string())) {
        std::cerr << "[TEST] config load failed: " << path << std::endl;
        return 1;
    }
    assert(config.getLogLevel() == "debug");
    assert(config.getLogDir() == "/tmp/eg_logs");
    assert(config.getStateDir() == "/tmp/eg_state");

    const auto gate = config.getEdgeGateConfig();
    assert(std::abs(gate.min_confidence - 0.6) < 1e-12);
    assert(std::abs(gate.percentile_full - 0.95) < 1e-12);
    assert(std::abs(gate.percentile_probe_small - 0.60) < 1e-12);

    assert(config.getEdgeStatsConfig().max_window == 500);
    assert(config.getEdgeStatsConfig().persist_on_record);
    assert(config.getQualityScorerConfig().min_quality_score == 65.0);
    assert(config.getBlacklistConfig().min_trades_for_analysis == 20);
    assert(std::abs(config.getPatternMinerConfig().min_severity - 0.5) < 1e-12);

    const auto bt = config.getBacktestConfig();
    assert(bt.initial_capital == 5000.0);
    assert(std::abs(bt.fee_rate - 0.0005) < 1e-12);
    assert(bt.min_trades == 10);

    assert(config.getWalkForwardConfig().train_window == 300);
    assert(config.getWalkForwardConfig().test_window == 200);
    assert(config.getLiveRequirements().min_trades == 50);
    assert(config.getLiveRequirements().max_drawdown && *config.getLiveRequirements().max_drawdown == 750.0);

    config.setInitialCapital(2500.0);
    assert(config.getBacktestConfig().initial_capital == 2500.0);

    // Environment wins over the file
    setenv("EDGE_GATE_MIN_CONFIDENCE", " 0.7 ", 1);
    setenv("EDGE_GATE_PERCENTILE_FULL", "not-a-number", 1);
    config.reset();
    assert(config.load(path.string()));
    assert(std::abs(config.getEdgeGateConfig().min_confidence - 0.7) < 1e-12);
    assert(std::abs(config.getEdgeGateConfig().percentile_full - 0.95) < 1e-12);
    unsetenv("EDGE_GATE_MIN_CONFIDENCE");
    unsetenv("EDGE_GATE_PERCENTILE_FULL");

    // Malformed JSON falls back without throwing
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    config.reset();
    assert(!config.load(path.string()));
    assert(std::abs(config.getEdgeGateConfig().min_confidence - 0.55) < 1e-12);

    config.reset();
    std::filesystem::remove_all(dir);
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
