#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "risk/RiskConfig.h"
#include "backtest/BacktestConfig.h"

namespace edgeguard {

class Config {
public:
    static Config& getInstance();
    bool load(const std::string& config_path);

    // Restore compiled-in defaults (tests reuse the singleton)
    void reset();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getStateDir() const { return state_dir_; }

    risk::EdgeGateConfig getEdgeGateConfig() const { return edge_gate_config_; }
    risk::EdgeStatsConfig getEdgeStatsConfig() const { return edge_stats_config_; }
    risk::QualityScorerConfig getQualityScorerConfig() const { return quality_config_; }
    risk::BlacklistConfig getBlacklistConfig() const { return blacklist_config_; }
    risk::PatternMinerConfig getPatternMinerConfig() const { return miner_config_; }

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    backtest::WalkForwardConfig getWalkForwardConfig() const { return walk_forward_config_; }
    backtest::LiveRequirements getLiveRequirements() const { return live_requirements_; }

    void setInitialCapital(double v) { backtest_config_.initial_capital = v; }

private:
    Config() = default;
    void applyEnvironmentOverrides();

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string state_dir_ = "state";

    risk::EdgeGateConfig edge_gate_config_;
    risk::EdgeStatsConfig edge_stats_config_;
    risk::QualityScorerConfig quality_config_;
    risk::BlacklistConfig blacklist_config_;
    risk::PatternMinerConfig miner_config_;

    backtest::BacktestConfig backtest_config_;
    backtest::WalkForwardConfig walk_forward_config_;
    backtest::LiveRequirements live_requirements_;
};

} // namespace edgeguard
