#include "risk/EdgeGateDiagnostics.h"
#include "common/Logger.h"
#include "common/Types.h"
#include "core/state/JsonStateFile.h"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace edgeguard {
namespace risk {

namespace {
double valueAt(const std::vector<double>& sorted, double p) {
    const std::size_t n = sorted.size();
    const std::size_t idx = (std::min)(static_cast<std::size_t>(static_cast<double>(n) * p), n - 1);
    return sorted[idx];
}

std::string pct(double ratio) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return ss.str();
}
}

nlohmann::json DecisionRecord::toJson() const {
    return {
        {"timestamp", timestamp_ms},
        {"symbol", symbol},
        {"state", toString(state)},
        {"reason", reason},
        {"net_edge", net_edge},
        {"confidence", confidence},
        {"percentile", percentile},
        {"position_multiplier", position_multiplier},
        {"insufficient_samples", insufficient_samples}
    };
}

EdgeGateDiagnostics::EdgeGateDiagnostics(std::optional<std::filesystem::path> log_dir,
                                         EdgeGateConfig bands)
    : log_dir_(std::move(log_dir)), bands_(bands) {
    if (log_dir_) {
        std::error_code ec;
        std::filesystem::create_directories(*log_dir_, ec);
        if (ec) {
            LOG_WARN("Diagnostics dir create failed ({}): {}", log_dir_->string(), ec.message());
        }
    }
}

std::string EdgeGateDiagnostics::utcDate(long long timestamp_ms) {
    const std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d");
    return ss.str();
}

bool EdgeGateDiagnostics::record(const DecisionRecord& input) {
    DecisionRecord rec = input;
    if (rec.timestamp_ms <= 0) {
        rec.timestamp_ms = currentTimeMs();
    }
    const std::string state_name = toString(rec.state);
    const std::string date = utcDate(rec.timestamp_ms);

    std::lock_guard<std::mutex> lock(mutex_);

    if (current_date_ != date) {
        if (!current_date_.empty() && log_dir_ && !saveDailyStatsLocked()) {
            LOG_WARN("Daily stats for {} could not be written", current_date_);
        }
        current_date_ = date;
        daily_stats_.clear();
    }

    decision_counts_[state_name]++;
    daily_stats_[state_name + "_count"]++;
    if (rec.state == GateState::BLOCK) {
        block_reasons_[rec.reason]++;
        daily_stats_["block_" + rec.reason]++;
    }
    if (rec.insufficient_samples) {
        daily_stats_["insufficient_samples_count"]++;
    }

    recent_.push_back(rec);
    while (recent_.size() > MAX_RECENT) {
        recent_.pop_front();
    }

    Logger::getInstance().logDecision(rec.symbol, state_name, rec.position_multiplier,
                                      rec.percentile, rec.reason);

    if (!log_dir_) {
        return true;
    }

    const auto file = *log_dir_ / ("decisions_" + date + ".jsonl");
    std::ofstream out(file, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Diagnostics log could not be opened: {}", file.string());
        return false;
    }
    out << rec.toJson().dump() << "\n";
    if (!out.good()) {
        LOG_ERROR("Diagnostics log write failed: {}", file.string());
        return false;
    }
    return true;
}

DecisionSummary EdgeGateDiagnostics::getSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DecisionSummary summary;
    summary.decision_counts = decision_counts_;
    summary.block_reasons = block_reasons_;
    for (const auto& [state, count] : decision_counts_) {
        summary.total_decisions += count;
    }
    if (summary.total_decisions == 0) {
        return summary;
    }

    auto countOf = [this](GateState s) {
        auto it = decision_counts_.find(toString(s));
        return it == decision_counts_.end() ? std::size_t{0} : it->second;
    };
    const double total = static_cast<double>(summary.total_decisions);
    summary.block_rate = countOf(GateState::BLOCK) / total;
    summary.probe_rate = (countOf(GateState::PROBE_SMALL) + countOf(GateState::PROBE_MEDIUM)) / total;
    summary.full_rate = countOf(GateState::FULL) / total;
    return summary;
}

PercentileHistogram EdgeGateDiagnostics::analyzePercentiles() const {
    std::vector<double> values;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values.reserve(recent_.size());
        for (const auto& rec : recent_) {
            values.push_back(rec.percentile);
        }
    }

    PercentileHistogram hist;
    if (values.empty()) {
        return hist;
    }
    std::sort(values.begin(), values.end());

    hist.count = values.size();
    hist.min = values.front();
    hist.max = values.back();
    hist.p10 = valueAt(values, 0.10);
    hist.p25 = valueAt(values, 0.25);
    hist.p50 = valueAt(values, 0.50);
    hist.p75 = valueAt(values, 0.75);
    hist.p90 = valueAt(values, 0.90);

    for (double p : values) {
        if (p < bands_.percentile_probe_small) {
            hist.below_probe_small++;
        } else if (p < bands_.percentile_probe_medium) {
            hist.probe_small_band++;
        } else if (p < bands_.percentile_full) {
            hist.probe_medium_band++;
        } else {
            hist.full_band++;
        }
    }
    return hist;
}

std::vector<DecisionRecord> EdgeGateDiagnostics::recentBlocks(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DecisionRecord> blocks;
    for (auto it = recent_.rbegin(); it != recent_.rend() && blocks.size() < limit; ++it) {
        if (it->state == GateState::BLOCK) {
            blocks.push_back(*it);
        }
    }
    std::reverse(blocks.begin(), blocks.end());
    return blocks;
}

std::vector<DecisionRecord> EdgeGateDiagnostics::recentDecisions(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t start = recent_.size() > limit ? recent_.size() - limit : 0;
    return std::vector<DecisionRecord>(recent_.begin() + static_cast<std::ptrdiff_t>(start), recent_.end());
}

std::string EdgeGateDiagnostics::generateReport() const {
    const auto summary = getSummary();
    const auto hist = analyzePercentiles();
    const auto blocks = recentBlocks(5);
    const std::string rule(80, '=');

    std::ostringstream out;
    out << std::fixed;
    out << rule << "\n";
    out << "EDGE GATE DIAGNOSTIC REPORT\n";
    out << rule << "\n\n";

    out << "DECISION SUMMARY:\n";
    out << "  Total decisions: " << summary.total_decisions << "\n";
    out << "  BLOCK rate: " << pct(summary.block_rate) << "\n";
    out << "  PROBE rate: " << pct(summary.probe_rate) << "\n";
    out << "  FULL rate: " << pct(summary.full_rate) << "\n\n";

    out << "BLOCK REASONS:\n";
    std::vector<std::pair<std::string, std::size_t>> reasons(summary.block_reasons.begin(),
                                                             summary.block_reasons.end());
    std::sort(reasons.begin(), reasons.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    for (const auto& [reason, count] : reasons) {
        const double share = summary.total_decisions > 0
            ? static_cast<double>(count) / summary.total_decisions : 0.0;
        out << "  " << reason << ": " << count << " (" << pct(share) << ")\n";
    }
    out << "\n";

    out << std::setprecision(3);
    out << "PERCENTILE DISTRIBUTION:\n";
    out << "  Below " << bands_.percentile_probe_small << " (BLOCK): " << hist.below_probe_small << "\n";
    out << "  " << bands_.percentile_probe_small << "-" << bands_.percentile_probe_medium
        << " (PROBE_SMALL): " << hist.probe_small_band << "\n";
    out << "  " << bands_.percentile_probe_medium << "-" << bands_.percentile_full
        << " (PROBE_MEDIUM): " << hist.probe_medium_band << "\n";
    out << "  Above " << bands_.percentile_full << " (FULL): " << hist.full_band << "\n";
    out << "  P50: " << hist.p50 << "\n";
    out << "  P90: " << hist.p90 << "\n\n";

    out << "RECENT BLOCKS (last 5):\n";
    if (blocks.empty()) {
        out << "  No blocks recorded\n";
    }
    for (const auto& b : blocks) {
        out << "  " << b.timestamp_ms << " " << b.symbol << " - " << b.reason << "\n";
        out << "    net_edge=" << std::setprecision(6) << b.net_edge
            << " conf=" << std::setprecision(3) << b.confidence
            << " pct=" << b.percentile << "\n";
    }
    out << "\n";

    if (summary.block_rate > 0.90) {
        out << "WARNING: block rate above 90%, check percentile thresholds and edge history depth\n";
    }
    if (hist.count > 0 && hist.below_probe_small > hist.count * 0.8) {
        out << "WARNING: most signals rank below the probe floor, verify the net edge calculation\n";
    }
    if (!reasons.empty()) {
        out << "Top block reason: " << reasons.front().first << "\n";
    }
    return out.str();
}

bool EdgeGateDiagnostics::flushDailyStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveDailyStatsLocked();
}

bool EdgeGateDiagnostics::saveDailyStatsLocked() const {
    if (!log_dir_ || current_date_.empty()) {
        return false;
    }
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [name, count] : daily_stats_) {
        doc[name] = count;
    }
    core::JsonStateFile file(*log_dir_ / ("daily_stats_" + current_date_ + ".json"));
    return file.save(doc);
}

} // namespace risk
} // namespace edgeguard
