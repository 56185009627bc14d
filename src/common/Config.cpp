#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace edgeguard {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void overrideFromEnv(const char* name, double& target) {
    const std::string raw = readEnvVar(name);
    if (raw.empty()) {
        return;
    }
    try {
        target = std::stod(raw);
    } catch (const std::exception&) {
        std::cerr << "Ignoring invalid " << name << "=" << raw << std::endl;
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    state_dir_ = "state";
    edge_gate_config_ = risk::EdgeGateConfig{};
    edge_stats_config_ = risk::EdgeStatsConfig{};
    quality_config_ = risk::QualityScorerConfig{};
    blacklist_config_ = risk::BlacklistConfig{};
    miner_config_ = risk::PatternMinerConfig{};
    backtest_config_ = backtest::BacktestConfig{};
    walk_forward_config_ = backtest::WalkForwardConfig{};
    live_requirements_ = backtest::LiveRequirements{};
}

bool Config::load(const std::string& path) {
    try {
        const auto config_path = utils::PathUtils::locateConfig(path);

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Config file not found: " << config_path << ", using defaults" << std::endl;
            applyEnvironmentOverrides();
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Config file could not be opened: " << config_path << std::endl;
            applyEnvironmentOverrides();
            return false;
        }

        nlohmann::json j;
        file >> j;

        if (j.contains("paths")) {
            auto& p = j["paths"];
            log_dir_ = p.value("log_dir", log_dir_);
            state_dir_ = p.value("state_dir", state_dir_);
        }
        log_level_ = j.value("log_level", log_level_);

        if (j.contains("edge_gate")) {
            auto& g = j["edge_gate"];
            auto& c = edge_gate_config_;
            c.min_confidence = g.value("min_confidence", c.min_confidence);
            c.percentile_probe_small = g.value("percentile_probe_small", c.percentile_probe_small);
            c.percentile_probe_medium = g.value("percentile_probe_medium", c.percentile_probe_medium);
            c.percentile_full = g.value("percentile_full", c.percentile_full);
            c.probe_small_multiplier = g.value("probe_small_multiplier", c.probe_small_multiplier);
            c.probe_medium_multiplier = g.value("probe_medium_multiplier", c.probe_medium_multiplier);
            c.full_multiplier = g.value("full_multiplier", c.full_multiplier);
            c.insufficient_sample_percentile =
                g.value("insufficient_sample_percentile", c.insufficient_sample_percentile);
            c.probe_stop_distance_multiplier =
                g.value("probe_stop_distance_multiplier", c.probe_stop_distance_multiplier);
            c.probe_allow_pyramiding = g.value("probe_allow_pyramiding", c.probe_allow_pyramiding);
        }

        if (j.contains("edge_stats")) {
            auto& s = j["edge_stats"];
            auto& c = edge_stats_config_;
            c.max_window = s.value("max_window", c.max_window);
            c.min_sample = s.value("min_sample", c.min_sample);
            c.persist_on_record = s.value("persist_on_record", c.persist_on_record);
        }

        if (j.contains("quality")) {
            auto& q = j["quality"];
            auto& c = quality_config_;
            c.enabled = q.value("enabled", c.enabled);
            c.min_quality_score = q.value("min_quality_score", c.min_quality_score);
            c.weight_signal_strength = q.value("weight_signal_strength", c.weight_signal_strength);
            c.weight_regime_match = q.value("weight_regime_match", c.weight_regime_match);
            c.weight_historical = q.value("weight_historical", c.weight_historical);
            c.weight_risk_reward = q.value("weight_risk_reward", c.weight_risk_reward);
            c.neutral_historical_score = q.value("neutral_historical_score", c.neutral_historical_score);
            c.neutral_risk_reward_score = q.value("neutral_risk_reward_score", c.neutral_risk_reward_score);
        }

        if (j.contains("blacklist")) {
            auto& b = j["blacklist"];
            auto& c = blacklist_config_;
            c.enabled = b.value("enabled", c.enabled);
            c.min_trades_for_analysis = b.value("min_trades_for_analysis", c.min_trades_for_analysis);
            c.win_rate_threshold = b.value("win_rate_threshold", c.win_rate_threshold);
            c.expected_value_threshold = b.value("expected_value_threshold", c.expected_value_threshold);
            c.profit_factor_threshold = b.value("profit_factor_threshold", c.profit_factor_threshold);
            c.low_volatility = b.value("low_volatility", c.low_volatility);
            c.high_volatility = b.value("high_volatility", c.high_volatility);
        }

        if (j.contains("pattern_miner")) {
            auto& m = j["pattern_miner"];
            auto& c = miner_config_;
            c.min_sample_size = m.value("min_sample_size", c.min_sample_size);
            c.min_severity = m.value("min_severity", c.min_severity);
            c.max_win_rate = m.value("max_win_rate", c.max_win_rate);
            c.max_expected_value = m.value("max_expected_value", c.max_expected_value);
            c.max_profit_factor = m.value("max_profit_factor", c.max_profit_factor);
            c.combined_win_rate = m.value("combined_win_rate", c.combined_win_rate);
            c.combined_expected_value = m.value("combined_expected_value", c.combined_expected_value);
            c.weight_win_rate = m.value("weight_win_rate", c.weight_win_rate);
            c.weight_expected_value = m.value("weight_expected_value", c.weight_expected_value);
            c.weight_profit_factor = m.value("weight_profit_factor", c.weight_profit_factor);
        }

        if (j.contains("backtest")) {
            auto& t = j["backtest"];
            auto& c = backtest_config_;
            c.initial_capital = t.value("initial_capital", c.initial_capital);
            c.default_position_pct = t.value("default_position_pct", c.default_position_pct);
            c.fee_rate = t.value("fee_rate", c.fee_rate);
            c.slippage_pct = t.value("slippage_pct", c.slippage_pct);
            c.regime_lookback_bars = t.value("regime_lookback_bars", c.regime_lookback_bars);
            c.min_trades = t.value("min_trades", c.min_trades);
            c.min_win_rate = t.value("min_win_rate", c.min_win_rate);
            c.min_total_pnl = t.value("min_total_pnl", c.min_total_pnl);
            c.min_profit_factor = t.value("min_profit_factor", c.min_profit_factor);
            c.max_drawdown_pct = t.value("max_drawdown_pct", c.max_drawdown_pct);
        }

        if (j.contains("walk_forward")) {
            auto& w = j["walk_forward"];
            auto& c = walk_forward_config_;
            c.train_window = w.value("train_window", c.train_window);
            c.test_window = w.value("test_window", c.test_window);
            c.step = w.value("step", c.step);
            c.max_parallel_windows = w.value("max_parallel_windows", c.max_parallel_windows);
            c.min_pass_rate = w.value("min_pass_rate", c.min_pass_rate);
            c.max_degradation = w.value("max_degradation", c.max_degradation);
            c.min_test_win_rate = w.value("min_test_win_rate", c.min_test_win_rate);
            c.min_test_pnl = w.value("min_test_pnl", c.min_test_pnl);
        }

        if (j.contains("admission")) {
            auto& a = j["admission"];
            auto& c = live_requirements_;
            c.min_trades = a.value("min_trades", c.min_trades);
            c.min_win_rate = a.value("min_win_rate", c.min_win_rate);
            c.min_profit_factor = a.value("min_profit_factor", c.min_profit_factor);
            c.min_sharpe = a.value("min_sharpe", c.min_sharpe);
            c.min_total_pnl = a.value("min_total_pnl", c.min_total_pnl);
            if (a.contains("max_drawdown") && a["max_drawdown"].is_number()) {
                c.max_drawdown = a["max_drawdown"].get<double>();
            }
        }

        applyEnvironmentOverrides();
        LOG_INFO("Config loaded: {}", config_path.string());
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        applyEnvironmentOverrides();
        return false;
    }
}

void Config::applyEnvironmentOverrides() {
    overrideFromEnv("EDGE_GATE_MIN_CONFIDENCE", edge_gate_config_.min_confidence);
    overrideFromEnv("EDGE_GATE_PERCENTILE_PROBE_SMALL", edge_gate_config_.percentile_probe_small);
    overrideFromEnv("EDGE_GATE_PERCENTILE_PROBE_MEDIUM", edge_gate_config_.percentile_probe_medium);
    overrideFromEnv("EDGE_GATE_PERCENTILE_FULL", edge_gate_config_.percentile_full);
}

} // namespace edgeguard
