#include "risk/FailureModeBlacklist.h"
#include "common/Logger.h"
#include "common/Types.h"
#include "core/state/JsonStateFile.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace edgeguard {
namespace risk {

namespace {
constexpr double PROFIT_FACTOR_CAP = 999.0;

nlohmann::json statsToJson(const CombinationStats& s) {
    return {
        {"strategy_id", s.strategy_id},
        {"market_regime", s.regime},
        {"volatility_level", s.volatility_level},
        {"total_trades", s.total_trades},
        {"wins", s.wins},
        {"losses", s.losses},
        {"total_pnl", s.total_pnl},
        {"gross_profit", s.gross_profit},
        {"gross_loss", s.gross_loss},
        {"win_rate", s.win_rate},
        {"expected_value", s.expected_value},
        {"profit_factor", s.profit_factor},
        {"updated_at_ms", s.updated_at_ms}
    };
}

CombinationStats statsFromJson(const nlohmann::json& j) {
    CombinationStats s;
    s.strategy_id = j.value("strategy_id", std::string());
    s.regime = j.value("market_regime", std::string());
    s.volatility_level = j.value("volatility_level", std::string());
    s.total_trades = j.value("total_trades", 0);
    s.wins = j.value("wins", 0);
    s.losses = j.value("losses", 0);
    s.total_pnl = j.value("total_pnl", 0.0);
    s.gross_profit = j.value("gross_profit", 0.0);
    s.gross_loss = j.value("gross_loss", 0.0);
    s.win_rate = j.value("win_rate", 0.0);
    s.expected_value = j.value("expected_value", 0.0);
    s.profit_factor = j.value("profit_factor", 0.0);
    s.updated_at_ms = j.value("updated_at_ms", 0LL);
    return s;
}

nlohmann::json entryToJson(const BlacklistEntry& e) {
    return {
        {"key", e.key},
        {"strategy_id", e.strategy_id},
        {"market_regime", e.regime},
        {"volatility_level", e.volatility_level},
        {"total_trades", e.total_trades},
        {"win_rate", e.win_rate},
        {"expected_value", e.expected_value},
        {"profit_factor", e.profit_factor},
        {"reason", e.reason},
        {"source", e.source},
        {"blacklisted_at_ms", e.blacklisted_at_ms}
    };
}

BlacklistEntry entryFromJson(const nlohmann::json& j) {
    BlacklistEntry e;
    e.key = j.value("key", std::string());
    e.strategy_id = j.value("strategy_id", std::string());
    e.regime = j.value("market_regime", std::string());
    e.volatility_level = j.value("volatility_level", std::string());
    e.total_trades = j.value("total_trades", 0);
    e.win_rate = j.value("win_rate", 0.0);
    e.expected_value = j.value("expected_value", 0.0);
    e.profit_factor = j.value("profit_factor", 0.0);
    e.reason = j.value("reason", std::string());
    e.source = j.value("source", std::string("outcomes"));
    e.blacklisted_at_ms = j.value("blacklisted_at_ms", 0LL);
    return e;
}

std::string describe(const std::string& strategy_id, const std::string& regime,
                     const std::string& vol_level, double win_rate, double ev, double pf) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    ss << strategy_id << " in " << regime << " (" << (vol_level.empty() ? "ANY" : vol_level)
       << " vol): win rate " << win_rate * 100.0 << "%";
    ss << std::setprecision(2) << ", EV " << ev << ", PF " << pf;
    return ss.str();
}
}

FailureModeBlacklist::FailureModeBlacklist(BlacklistConfig config,
                                           std::optional<std::filesystem::path> storage_path)
    : config_(config), storage_path_(std::move(storage_path)) {
    if (storage_path_) {
        load();
    }
}

std::string FailureModeBlacklist::makeKey(const std::string& strategy_id,
                                          const std::string& regime,
                                          const std::string& volatility_level) {
    std::string key = strategy_id + "|" + regime;
    if (!volatility_level.empty()) {
        key += "|" + volatility_level;
    }
    return key;
}

std::string FailureModeBlacklist::volatilityLevel(double volatility) const {
    return analytics::volatilityBucket(volatility, config_.low_volatility, config_.high_volatility);
}

BlacklistCheck FailureModeBlacklist::check(const std::string& strategy_id,
                                           const std::string& regime,
                                           std::optional<double> volatility) const {
    BlacklistCheck result;
    if (!config_.enabled) {
        result.reason = "blacklist disabled";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (volatility) {
        const auto specific = makeKey(strategy_id, regime, volatilityLevel(*volatility));
        auto it = blacklisted_.find(specific);
        if (it != blacklisted_.end()) {
            result.allowed = false;
            result.reason = "blacklisted: " + it->second.reason;
            return result;
        }
    }

    auto it = blacklisted_.find(makeKey(strategy_id, regime));
    if (it != blacklisted_.end()) {
        result.allowed = false;
        result.reason = "blacklisted: " + it->second.reason;
        return result;
    }

    result.reason = "not blacklisted";
    return result;
}

bool FailureModeBlacklist::shouldBlacklist(const CombinationStats& s) const {
    if (s.total_trades < config_.min_trades_for_analysis) {
        return false;
    }
    return s.win_rate < config_.win_rate_threshold
        || s.expected_value < config_.expected_value_threshold
        || s.profit_factor < config_.profit_factor_threshold;
}

void FailureModeBlacklist::updateLocked(const std::string& key, const std::string& strategy_id,
                                        const std::string& regime, const std::string& vol_level,
                                        double pnl) {
    auto& s = combinations_[key];
    if (s.total_trades == 0) {
        s.strategy_id = strategy_id;
        s.regime = regime;
        s.volatility_level = vol_level;
    }

    s.total_trades++;
    s.total_pnl += pnl;
    if (pnl > 0.0) {
        s.wins++;
        s.gross_profit += pnl;
    } else {
        s.losses++;
        s.gross_loss += -pnl;
    }
    s.win_rate = static_cast<double>(s.wins) / s.total_trades;
    s.expected_value = s.total_pnl / s.total_trades;
    s.profit_factor = s.gross_loss > 0.0 ? std::min(s.gross_profit / s.gross_loss, PROFIT_FACTOR_CAP)
                                         : (s.gross_profit > 0.0 ? PROFIT_FACTOR_CAP : 0.0);
    s.updated_at_ms = currentTimeMs();

    if (!shouldBlacklist(s) || blacklisted_.count(key) > 0 || overrides_.count(key) > 0) {
        return;
    }

    BlacklistEntry e;
    e.key = key;
    e.strategy_id = s.strategy_id;
    e.regime = s.regime;
    e.volatility_level = s.volatility_level;
    e.total_trades = s.total_trades;
    e.win_rate = s.win_rate;
    e.expected_value = s.expected_value;
    e.profit_factor = s.profit_factor;
    e.reason = describe(s.strategy_id, s.regime, s.volatility_level, s.win_rate, s.expected_value, s.profit_factor);
    e.source = "outcomes";
    e.blacklisted_at_ms = s.updated_at_ms;
    LOG_WARN("Blacklisted {}: {}", key, e.reason);
    blacklisted_[key] = std::move(e);
}

void FailureModeBlacklist::recordTradeResult(const std::string& strategy_id,
                                             const std::string& regime,
                                             std::optional<double> volatility,
                                             double pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (volatility) {
        const auto level = volatilityLevel(*volatility);
        updateLocked(makeKey(strategy_id, regime, level), strategy_id, regime, level, pnl);
    }
    updateLocked(makeKey(strategy_id, regime), strategy_id, regime, "", pnl);

    if (storage_path_) {
        saveLocked();
    }
}

bool FailureModeBlacklist::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.insert(key);
    const bool removed = blacklisted_.erase(key) > 0;
    if (removed) {
        LOG_INFO("Removed from blacklist (manual override): {}", key);
    }
    if (storage_path_) {
        saveLocked();
    }
    return removed;
}

std::size_t FailureModeBlacklist::importPatterns(const std::vector<analytics::FailurePattern>& patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t added = 0;
    for (const auto& p : patterns) {
        if (p.type != "strategy_market_regime") {
            continue;
        }
        auto it = p.conditions.find("market_regime");
        if (it == p.conditions.end()) {
            continue;
        }
        const auto key = makeKey(p.strategy_id, it->second);
        if (blacklisted_.count(key) > 0 || overrides_.count(key) > 0) {
            continue;
        }

        BlacklistEntry e;
        e.key = key;
        e.strategy_id = p.strategy_id;
        e.regime = it->second;
        e.total_trades = p.stats.total_trades;
        e.win_rate = p.stats.win_rate;
        e.expected_value = p.stats.expected_value;
        e.profit_factor = p.stats.profit_factor;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << " (pattern severity " << p.severity << ")";
        e.reason = describe(p.strategy_id, it->second, "", p.stats.win_rate,
                            p.stats.expected_value, p.stats.profit_factor) + ss.str();
        e.source = "pattern";
        e.blacklisted_at_ms = currentTimeMs();
        blacklisted_[key] = std::move(e);
        ++added;
    }
    if (added > 0 && storage_path_) {
        saveLocked();
    }
    return added;
}

bool FailureModeBlacklist::isBlacklisted(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blacklisted_.count(key) > 0;
}

std::optional<CombinationStats> FailureModeBlacklist::stats(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = combinations_.find(key);
    if (it == combinations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BlacklistEntry> FailureModeBlacklist::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BlacklistEntry> out;
    for (const auto& [key, entry] : blacklisted_) {
        out.push_back(entry);
    }
    return out;
}

nlohmann::json FailureModeBlacklist::toJsonLocked() const {
    nlohmann::json doc;
    doc["blacklisted"] = nlohmann::json::object();
    for (const auto& [key, entry] : blacklisted_) {
        doc["blacklisted"][key] = entryToJson(entry);
    }
    doc["combination_stats"] = nlohmann::json::object();
    for (const auto& [key, s] : combinations_) {
        doc["combination_stats"][key] = statsToJson(s);
    }
    doc["overrides"] = overrides_;
    doc["updated_at_ms"] = currentTimeMs();
    return doc;
}

bool FailureModeBlacklist::saveLocked() const {
    if (!storage_path_) {
        return false;
    }
    core::JsonStateFile file(*storage_path_);
    if (!file.save(toJsonLocked())) {
        LOG_ERROR("Blacklist: could not persist to {}", storage_path_->string());
        return false;
    }
    return true;
}

bool FailureModeBlacklist::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool FailureModeBlacklist::load() {
    if (!storage_path_) {
        return false;
    }
    core::JsonStateFile file(*storage_path_);
    auto doc = file.load();
    if (!doc) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::map<std::string, BlacklistEntry> blacklisted;
        std::map<std::string, CombinationStats> combinations;
        std::set<std::string> overrides;

        const auto bl = doc->value("blacklisted", nlohmann::json::object());
        for (auto it = bl.begin(); it != bl.end(); ++it) {
            blacklisted[it.key()] = entryFromJson(it.value());
        }
        const auto cs = doc->value("combination_stats", nlohmann::json::object());
        for (auto it = cs.begin(); it != cs.end(); ++it) {
            combinations[it.key()] = statsFromJson(it.value());
        }
        for (const auto& key : doc->value("overrides", nlohmann::json::array())) {
            overrides.insert(key.get<std::string>());
        }

        blacklisted_ = std::move(blacklisted);
        combinations_ = std::move(combinations);
        overrides_ = std::move(overrides);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Blacklist: malformed state in {}: {}", storage_path_->string(), e.what());
        return false;
    }
    LOG_INFO("Blacklist: loaded {} blacklisted combinations", blacklisted_.size());
    return true;
}

std::string FailureModeBlacklist::generateReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string rule(60, '=');

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << rule << "\n";
    out << "FAILURE MODE BLACKLIST REPORT\n";
    out << rule << "\n";
    out << "Status: " << (config_.enabled ? "ENABLED" : "DISABLED") << "\n";
    out << "Blacklisted Combinations: " << blacklisted_.size() << "\n";
    out << "Tracked Combinations: " << combinations_.size() << "\n\n";

    if (!blacklisted_.empty()) {
        out << "BLACKLISTED:\n";
        for (const auto& [key, e] : blacklisted_) {
            out << "  " << key << "\n";
            out << "    Win Rate: " << e.win_rate * 100.0 << "% (threshold "
                << config_.win_rate_threshold * 100.0 << "%)\n";
            out << std::setprecision(2);
            out << "    EV: " << e.expected_value << " (threshold " << config_.expected_value_threshold << ")\n";
            out << "    PF: " << e.profit_factor << " (threshold " << config_.profit_factor_threshold << ")\n";
            out << std::setprecision(1);
            out << "    Trades: " << e.total_trades << "\n";
            out << "    Reason: " << e.reason << "\n";
        }
        out << "\n";
    }

    std::vector<const std::pair<const std::string, CombinationStats>*> sorted;
    for (const auto& item : combinations_) {
        sorted.push_back(&item);
    }
    std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) {
        return a->second.expected_value > b->second.expected_value;
    });

    out << "ALL COMBINATIONS:\n";
    for (const auto* item : sorted) {
        const auto& s = item->second;
        out << "  [" << (blacklisted_.count(item->first) ? "BLOCKED" : "ok") << "] " << item->first
            << "  trades " << s.total_trades
            << ", win rate " << s.win_rate * 100.0 << "%"
            << std::setprecision(2) << ", EV " << s.expected_value << "\n"
            << std::setprecision(1);
    }
    return out.str();
}

} // namespace risk
} // namespace edgeguard
