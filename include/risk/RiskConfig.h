#pragma once

#include <cstddef>

namespace edgeguard {
namespace risk {

struct EdgeGateConfig {
    double min_confidence = 0.55;

    // Percentile band lower edges; each band is [edge, next_edge)
    double percentile_probe_small = 0.60;
    double percentile_probe_medium = 0.75;
    double percentile_full = 0.90;

    double probe_small_multiplier = 0.10;
    double probe_medium_multiplier = 0.25;
    double full_multiplier = 1.00;

    // Substituted when the tracker has too few samples for the key
    double insufficient_sample_percentile = 0.60;

    // Caller-facing hints for PROBE entries
    double probe_stop_distance_multiplier = 0.7;
    bool probe_allow_pyramiding = false;
};

struct EdgeStatsConfig {
    std::size_t max_window = 1000;
    std::size_t min_sample = 50;
    bool persist_on_record = false;
};

struct QualityScorerConfig {
    bool enabled = true;
    double min_quality_score = 60.0;

    double weight_signal_strength = 0.30;
    double weight_regime_match = 0.25;
    double weight_historical = 0.25;
    double weight_risk_reward = 0.20;

    // Neutral component scores when an input is unknown
    double neutral_historical_score = 50.0;
    double neutral_risk_reward_score = 60.0;
};

struct BlacklistConfig {
    bool enabled = true;
    int min_trades_for_analysis = 10;
    double win_rate_threshold = 0.40;
    double expected_value_threshold = -50.0;
    double profit_factor_threshold = 0.8;

    // Volatility buckets: LOW < low_volatility <= MEDIUM < high_volatility <= HIGH
    double low_volatility = 0.01;
    double high_volatility = 0.03;
};

struct PatternMinerConfig {
    int min_sample_size = 10;
    double min_severity = 0.6;

    // Group is a failure when any of these hold
    double max_win_rate = 0.42;
    double max_expected_value = -30.0;
    double max_profit_factor = 0.8;
    double combined_win_rate = 0.48;
    double combined_expected_value = -10.0;

    // Severity weights
    double weight_win_rate = 0.4;
    double weight_expected_value = 0.4;
    double weight_profit_factor = 0.2;
};

} // namespace risk
} // namespace edgeguard
