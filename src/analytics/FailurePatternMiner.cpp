#include "analytics/FailurePatternMiner.h"
#include "common/Logger.h"
#include "common/Types.h"
#include "core/state/JsonStateFile.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace edgeguard {
namespace analytics {

namespace {
constexpr double PROFIT_FACTOR_CAP = 999.0;

const std::string DIM_REGIME = "market_regime";
const std::string DIM_VOLATILITY = "volatility_level";
const std::string DIM_TIME = "time_period";
const std::string DIM_VOLUME = "volume_level";

// Tercile cut points, exclusive method: positions i*(n+1)/3 with linear interpolation
std::pair<double, double> volumeTerciles(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    const long ld = static_cast<long>(values.size());
    const long m = ld + 1;
    const long n = 3;
    double cuts[2] = {0.0, 0.0};
    for (long i = 1; i < n; ++i) {
        long j = i * m / n;
        j = std::clamp(j, 1L, ld - 1);
        const long delta = i * m - j * n;
        cuts[i - 1] = (values[j - 1] * static_cast<double>(n - delta) +
                       values[j] * static_cast<double>(delta)) / static_cast<double>(n);
    }
    return {cuts[0], cuts[1]};
}

std::string dimensionValue(const std::string& dim, const std::string& regime,
                           const std::string& vol, const std::string& period,
                           const std::string& volume) {
    if (dim == DIM_REGIME) return regime;
    if (dim == DIM_VOLATILITY) return vol;
    if (dim == DIM_TIME) return period;
    return volume;
}
}

nlohmann::json GroupStats::toJson() const {
    return {
        {"total_trades", total_trades},
        {"wins", wins},
        {"losses", losses},
        {"win_rate", win_rate},
        {"total_pnl", total_pnl},
        {"avg_pnl", avg_pnl},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"profit_factor", profit_factor},
        {"expected_value", expected_value}
    };
}

nlohmann::json FailurePattern::toJson() const {
    nlohmann::json cond = nlohmann::json::object();
    for (const auto& [name, value] : conditions) {
        cond[name] = value;
    }
    return {
        {"pattern_id", pattern_id},
        {"type", type},
        {"strategy_id", strategy_id},
        {"conditions", cond},
        {"stats", stats.toJson()},
        {"severity", severity},
        {"discovered_at_ms", discovered_at_ms}
    };
}

std::string volatilityBucket(double volatility, double low, double high) {
    if (volatility < low) return "LOW";
    if (volatility < high) return "MEDIUM";
    return "HIGH";
}

std::string timePeriod(long long timestamp_ms) {
    const std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    const int hour = tm_utc.tm_hour;
    if (hour < 6) return "NIGHT_0_6";
    if (hour < 12) return "MORNING_6_12";
    if (hour < 18) return "AFTERNOON_12_18";
    return "EVENING_18_24";
}

GroupStats computeGroupStats(const std::vector<const TradeOutcome*>& trades) {
    GroupStats s;
    s.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) {
        return s;
    }

    double gross_win = 0.0;
    double gross_loss = 0.0;
    int losing_count = 0;
    for (const auto* t : trades) {
        s.total_pnl += t->pnl;
        if (t->pnl > 0.0) {
            s.wins++;
            gross_win += t->pnl;
        } else if (t->pnl < 0.0) {
            losing_count++;
            gross_loss += -t->pnl;
        }
    }
    s.losses = s.total_trades - s.wins;
    s.win_rate = static_cast<double>(s.wins) / s.total_trades;
    s.avg_pnl = s.total_pnl / s.total_trades;
    s.avg_win = s.wins > 0 ? gross_win / s.wins : 0.0;
    s.avg_loss = losing_count > 0 ? gross_loss / losing_count : 0.0;
    if (gross_loss > 0.0) {
        s.profit_factor = std::min(gross_win / gross_loss, PROFIT_FACTOR_CAP);
    } else {
        s.profit_factor = gross_win > 0.0 ? PROFIT_FACTOR_CAP : 0.0;
    }
    s.expected_value = s.win_rate * s.avg_win - (1.0 - s.win_rate) * s.avg_loss;
    return s;
}

FailurePatternMiner::FailurePatternMiner(risk::PatternMinerConfig config,
                                         risk::BlacklistConfig buckets,
                                         std::optional<std::filesystem::path> storage_path)
    : config_(config), buckets_(buckets), storage_path_(std::move(storage_path)) {}

bool FailurePatternMiner::isFailure(const GroupStats& s) const {
    return s.win_rate < config_.max_win_rate
        || s.expected_value < config_.max_expected_value
        || s.profit_factor < config_.max_profit_factor
        || (s.win_rate < config_.combined_win_rate && s.expected_value < config_.combined_expected_value);
}

double FailurePatternMiner::severity(const GroupStats& s) const {
    const double wr_score = std::max(0.0, (0.5 - s.win_rate) / 0.5);
    const double ev_score = std::clamp(-s.expected_value / 100.0, 0.0, 1.0);
    const double pf_score = s.profit_factor < 1.0 ? std::max(0.0, 1.0 - s.profit_factor) : 0.0;

    const double denom = static_cast<double>(std::max(config_.min_sample_size, 1) * 3);
    const double confidence = std::min(1.0, s.total_trades / denom);

    const double raw = wr_score * config_.weight_win_rate
                     + ev_score * config_.weight_expected_value
                     + pf_score * config_.weight_profit_factor;
    return raw * confidence;
}

void FailurePatternMiner::analyzeGroups(const std::vector<Tagged>& tagged,
                                        const std::string& type,
                                        const std::vector<std::string>& dimensions) {
    std::map<std::vector<std::string>, std::vector<const TradeOutcome*>> groups;

    for (const auto& t : tagged) {
        std::vector<std::string> key{t.trade->strategy_id.empty() ? "unknown" : t.trade->strategy_id};
        bool complete = true;
        for (const auto& dim : dimensions) {
            auto value = dimensionValue(dim, t.trade->regime, t.vol_bucket, t.time_period, t.volume_bucket);
            if (value.empty()) {
                complete = false;
                break;
            }
            key.push_back(std::move(value));
        }
        if (complete) {
            groups[key].push_back(t.trade);
        }
    }

    const long long now = currentTimeMs();
    for (const auto& [key, trades] : groups) {
        if (static_cast<int>(trades.size()) < config_.min_sample_size) {
            continue;
        }
        const auto stats = computeGroupStats(trades);
        if (!isFailure(stats)) {
            continue;
        }

        FailurePattern p;
        p.type = type;
        p.strategy_id = key.front();
        p.pattern_id = type + "_" + key.front();
        for (size_t i = 0; i < dimensions.size(); ++i) {
            p.conditions[dimensions[i]] = key[i + 1];
            p.pattern_id += "_" + key[i + 1];
        }
        p.stats = stats;
        p.severity = severity(stats);
        p.discovered_at_ms = now;
        patterns_.push_back(std::move(p));
    }
}

std::vector<FailurePattern> FailurePatternMiner::minePatterns(const std::vector<TradeOutcome>& trades) {
    patterns_.clear();

    if (static_cast<int>(trades.size()) < config_.min_sample_size) {
        LOG_INFO("PatternMiner: {} trades, need at least {}", trades.size(), config_.min_sample_size);
        return patterns_;
    }

    std::vector<double> volumes;
    for (const auto& t : trades) {
        if (t.volume_ratio) {
            volumes.push_back(*t.volume_ratio);
        }
    }
    const bool has_volume = volumes.size() >= 2;
    std::pair<double, double> cuts{0.0, 0.0};
    if (has_volume) {
        cuts = volumeTerciles(volumes);
    }

    std::vector<Tagged> tagged;
    tagged.reserve(trades.size());
    for (const auto& t : trades) {
        Tagged row;
        row.trade = &t;
        row.vol_bucket = volatilityBucket(t.volatility.value_or(0.02),
                                          buckets_.low_volatility, buckets_.high_volatility);
        row.time_period = timePeriod(t.timestamp_ms);
        if (has_volume) {
            const double ratio = t.volume_ratio.value_or(1.0);
            row.volume_bucket = ratio < cuts.first ? "LOW" : (ratio < cuts.second ? "MEDIUM" : "HIGH");
        }
        tagged.push_back(std::move(row));
    }

    analyzeGroups(tagged, "strategy_market_regime", {DIM_REGIME});
    analyzeGroups(tagged, "strategy_volatility", {DIM_VOLATILITY});
    analyzeGroups(tagged, "strategy_time_period", {DIM_TIME});
    analyzeGroups(tagged, "strategy_volume", {DIM_VOLUME});
    analyzeGroups(tagged, "market_regime_time", {DIM_REGIME, DIM_TIME});
    analyzeGroups(tagged, "volatility_volume", {DIM_VOLATILITY, DIM_VOLUME});

    patterns_.erase(std::remove_if(patterns_.begin(), patterns_.end(), [this](const FailurePattern& p) {
        return p.severity < config_.min_severity;
    }), patterns_.end());
    std::stable_sort(patterns_.begin(), patterns_.end(), [](const FailurePattern& a, const FailurePattern& b) {
        return a.severity > b.severity;
    });

    LOG_INFO("PatternMiner: {} failure patterns from {} trades", patterns_.size(), trades.size());
    return patterns_;
}

bool FailurePatternMiner::save() const {
    if (!storage_path_) {
        return false;
    }
    nlohmann::json doc;
    doc["patterns"] = nlohmann::json::array();
    for (const auto& p : patterns_) {
        doc["patterns"].push_back(p.toJson());
    }
    doc["config"] = {
        {"min_sample_size", config_.min_sample_size},
        {"min_severity", config_.min_severity}
    };
    doc["updated_at_ms"] = currentTimeMs();

    core::JsonStateFile file(*storage_path_);
    if (!file.save(doc)) {
        LOG_ERROR("PatternMiner: could not persist patterns to {}", storage_path_->string());
        return false;
    }
    return true;
}

std::string FailurePatternMiner::generateReport(std::size_t top_n) const {
    const std::string rule(80, '=');
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << rule << "\n";
    out << "FAILURE PATTERN MINING REPORT\n";
    out << rule << "\n";
    out << "Patterns Discovered: " << patterns_.size() << "\n";
    out << "Min Sample Size: " << config_.min_sample_size << "\n";
    out << "Min Severity: " << config_.min_severity << "\n\n";

    if (patterns_.empty()) {
        out << "No significant failure patterns found.\n";
        return out.str();
    }

    out << "TOP FAILURE PATTERNS (by severity):\n\n";
    for (size_t i = 0; i < patterns_.size() && i < top_n; ++i) {
        const auto& p = patterns_[i];
        out << (i + 1) << ". " << p.pattern_id << "\n";
        out << "   Severity: " << p.severity << "\n";
        out << "   Conditions:";
        for (const auto& [name, value] : p.conditions) {
            out << " " << name << "=" << value;
        }
        out << "\n";
        out << "   Trades: " << p.stats.total_trades
            << ", Win Rate: " << p.stats.win_rate * 100.0 << "%"
            << ", EV: " << p.stats.expected_value
            << ", PF: " << p.stats.profit_factor << "\n\n";
    }
    return out.str();
}

} // namespace analytics
} // namespace edgeguard
