#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "engine/PerformanceStore.h"
#include "core/state/JsonStateFile.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace edgeguard {
namespace backtest {

namespace {
constexpr double TRADING_DAYS_PER_YEAR = 252.0;

bool validLevel(const std::optional<double>& v) {
    return v && std::isfinite(*v) && *v > 0.0;
}
}

std::string toString(StrategyAction action) {
    switch (action) {
        case StrategyAction::HOLD: return "HOLD";
        case StrategyAction::LONG: return "LONG";
        case StrategyAction::SHORT: return "SHORT";
        case StrategyAction::CLOSE: return "CLOSE";
    }
    return "HOLD";
}

nlohmann::json TradeRecord::toJson() const {
    return {
        {"strategy_id", strategy_id},
        {"version", version},
        {"side", edgeguard::toString(side)},
        {"entry_price", entry_price},
        {"exit_price", exit_price},
        {"entry_time", entry_time},
        {"exit_time", exit_time},
        {"quantity", quantity},
        {"pnl", pnl},
        {"pnl_pct", pnl_pct},
        {"win", win},
        {"exit_reason", exit_reason},
        {"hold_ms", hold_ms},
        {"hold_bars", hold_bars},
        {"regime", regime},
        {"volatility", volatility},
        {"volume_ratio", volume_ratio}
    };
}

analytics::TradeOutcome TradeRecord::toOutcome() const {
    analytics::TradeOutcome outcome;
    outcome.strategy_id = strategy_id;
    outcome.regime = regime;
    outcome.volatility = volatility;
    outcome.volume_ratio = volume_ratio;
    outcome.pnl = pnl;
    outcome.timestamp_ms = exit_time;
    return outcome;
}

nlohmann::json BacktestMetrics::toJson() const {
    return {
        {"total_trades", total_trades},
        {"winning_trades", winning_trades},
        {"losing_trades", losing_trades},
        {"win_rate", win_rate},
        {"total_pnl", total_pnl},
        {"avg_pnl", avg_pnl},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"largest_win", largest_win},
        {"largest_loss", largest_loss},
        {"profit_factor", profit_factor},
        {"sharpe_ratio", sharpe_ratio},
        {"max_drawdown", max_drawdown},
        {"max_drawdown_pct", max_drawdown_pct},
        {"avg_hold_ms", avg_hold_ms},
        {"initial_capital", initial_capital},
        {"final_equity", final_equity}
    };
}

BacktestEngine::BacktestEngine(BacktestConfig config, std::string strategy_id, std::string version)
    : config_(config),
      strategy_id_(std::move(strategy_id)),
      version_(std::move(version)) {
    if (!(config_.initial_capital > 0.0)) {
        throw std::invalid_argument("initial_capital must be positive");
    }
    if (config_.fee_rate < 0.0 || config_.slippage_pct < 0.0) {
        throw std::invalid_argument("fee_rate and slippage_pct must be non-negative");
    }
}

double BacktestEngine::entryFillPrice(TradeSide side, double price) const {
    return side == TradeSide::LONG ? price * (1.0 + config_.slippage_pct)
                                   : price * (1.0 - config_.slippage_pct);
}

double BacktestEngine::exitFillPrice(TradeSide side, double price) const {
    return side == TradeSide::LONG ? price * (1.0 - config_.slippage_pct)
                                   : price * (1.0 + config_.slippage_pct);
}

BacktestResult BacktestEngine::run(const std::vector<Candle>& candles, const StrategyFunction& strategy) {
    BacktestResult result;
    position_.reset();
    last_market_state_.reset();
    result.metrics.initial_capital = config_.initial_capital;
    result.metrics.final_equity = config_.initial_capital;

    if (!strategy) {
        result.error = risk::RiskError(risk::RiskErrorKind::SIMULATION, "no strategy function");
    } else if (auto defect = DataHistory::validate(candles)) {
        result.error = risk::RiskError(risk::RiskErrorKind::SIMULATION, *defect);
    }
    if (result.error) {
        result.reason = "simulation error: " + result.error->message;
        result.failure_reasons.push_back(result.reason);
        LOG_WARN("Backtest {} v{} rejected: {}", strategy_id_, version_, result.reason);
        return result;
    }

    double capital = config_.initial_capital;
    double peak_equity = capital;
    double max_drawdown = 0.0;

    for (std::size_t i = 0; i < candles.size(); ++i) {
        const Candle& candle = candles[i];

        // 1. Protective exits against this bar's range
        if (position_) {
            if (auto exit = checkExitTriggers(*position_, candle)) {
                auto trade = closePosition(exit->first, candle, i, exit->second);
                capital += trade.pnl;
                result.trades.push_back(std::move(trade));
            }
        }

        // 2. Strategy decision at the bar close
        StrategySignal signal;
        try {
            signal = strategy(candle, i);
        } catch (const std::exception& e) {
            LOG_WARN("Strategy {} threw on bar {}: {} (treated as HOLD)", strategy_id_, i, e.what());
            signal = StrategySignal::hold();
        }

        if (position_) {
            const bool reverse =
                (signal.action == StrategyAction::LONG && position_->side == TradeSide::SHORT) ||
                (signal.action == StrategyAction::SHORT && position_->side == TradeSide::LONG);
            if (signal.action == StrategyAction::CLOSE || reverse) {
                auto trade = closePosition(candle.close, candle, i,
                                           reverse ? "signal_reverse" : "signal_close");
                capital += trade.pnl;
                result.trades.push_back(std::move(trade));
            }
        } else if (signal.action == StrategyAction::LONG || signal.action == StrategyAction::SHORT) {
            const TradeSide side = signal.action == StrategyAction::LONG ? TradeSide::LONG : TradeSide::SHORT;
            openPosition(side, signal, candles, i, capital);
        }

        // 3. Mark to market
        double equity = capital;
        if (position_) {
            const double exit_px = exitFillPrice(position_->side, candle.close);
            const double move = position_->side == TradeSide::LONG
                ? exit_px - position_->entry_price
                : position_->entry_price - exit_px;
            equity += move * position_->quantity - position_->entry_fee;
        }
        peak_equity = std::max(peak_equity, equity);
        max_drawdown = std::max(max_drawdown, peak_equity - equity);
        result.bars_processed = i + 1;
    }

    if (position_) {
        auto trade = closePosition(candles.back().close, candles.back(), candles.size() - 1, "backtest_end");
        capital += trade.pnl;
        result.trades.push_back(std::move(trade));
        peak_equity = std::max(peak_equity, capital);
        max_drawdown = std::max(max_drawdown, peak_equity - capital);
    }

    for (const auto& trade : result.trades) {
        result.exit_reason_counts[trade.exit_reason]++;
    }

    result.metrics = computeMetrics(result.trades, config_.initial_capital, max_drawdown);
    result.failure_reasons = evaluateCriteria(result.metrics, config_);
    result.passed = result.failure_reasons.empty();
    result.reason = result.passed ? "all criteria met" : result.failure_reasons.front();

    LOG_INFO("Backtest {} v{}: {} trades, WR {:.1f}%, PnL {:.2f}, PF {:.2f}, MDD {:.2f}% -> {}",
             strategy_id_, version_, result.metrics.total_trades,
             result.metrics.win_rate * 100.0, result.metrics.total_pnl,
             result.metrics.profit_factor, result.metrics.max_drawdown_pct * 100.0,
             result.passed ? "PASS" : result.reason);
    return result;
}

std::optional<std::pair<double, std::string>> BacktestEngine::checkExitTriggers(Position& position,
                                                                               const Candle& candle) const {
    position.high_watermark = std::max(position.high_watermark, candle.high);
    position.low_watermark = std::min(position.low_watermark, candle.low);

    // Stop is checked first: a bar touching both levels resolves to the stop
    if (position.side == TradeSide::LONG) {
        if (position.stop_loss && candle.low <= *position.stop_loss) {
            const double fill = candle.open <= *position.stop_loss ? candle.open : *position.stop_loss;
            return std::make_pair(fill, std::string("stop_loss"));
        }
        if (position.take_profit && candle.high >= *position.take_profit) {
            const double fill = candle.open >= *position.take_profit ? candle.open : *position.take_profit;
            return std::make_pair(fill, std::string("take_profit"));
        }
        if (position.trailing_stop_pct) {
            const double trail = position.high_watermark * (1.0 - *position.trailing_stop_pct);
            if (candle.close <= trail) {
                return std::make_pair(candle.close, std::string("trailing_stop"));
            }
        }
    } else {
        if (position.stop_loss && candle.high >= *position.stop_loss) {
            const double fill = candle.open >= *position.stop_loss ? candle.open : *position.stop_loss;
            return std::make_pair(fill, std::string("stop_loss"));
        }
        if (position.take_profit && candle.low <= *position.take_profit) {
            const double fill = candle.open <= *position.take_profit ? candle.open : *position.take_profit;
            return std::make_pair(fill, std::string("take_profit"));
        }
        if (position.trailing_stop_pct) {
            const double trail = position.low_watermark * (1.0 + *position.trailing_stop_pct);
            if (candle.close >= trail) {
                return std::make_pair(candle.close, std::string("trailing_stop"));
            }
        }
    }
    return std::nullopt;
}

bool BacktestEngine::openPosition(TradeSide side, const StrategySignal& signal,
                                  const std::vector<Candle>& candles, std::size_t index, double capital) {
    const Candle& candle = candles[index];
    double notional = capital * config_.default_position_pct;
    if (signal.size_notional) {
        if (!std::isfinite(*signal.size_notional) || *signal.size_notional <= 0.0) {
            LOG_WARN("Ignoring entry on bar {}: invalid size {}", index, *signal.size_notional);
            return false;
        }
        notional = *signal.size_notional;
    }
    if (notional <= 0.0) {
        LOG_WARN("Ignoring entry on bar {}: no capital left", index);
        return false;
    }

    Position pos;
    pos.side = side;
    pos.entry_price = entryFillPrice(side, candle.close);
    pos.quantity = notional / pos.entry_price;
    pos.entry_time = candle.timestamp;
    pos.entry_index = index;
    pos.entry_fee = notional * config_.fee_rate;
    pos.high_watermark = candle.close;
    pos.low_watermark = candle.close;
    if (validLevel(signal.stop_loss)) pos.stop_loss = signal.stop_loss;
    if (validLevel(signal.take_profit)) pos.take_profit = signal.take_profit;
    if (signal.trailing_stop_pct && std::isfinite(*signal.trailing_stop_pct) &&
        *signal.trailing_stop_pct > 0.0 && *signal.trailing_stop_pct < 1.0) {
        pos.trailing_stop_pct = signal.trailing_stop_pct;
    }

    const std::size_t lookback = std::max<std::size_t>(config_.regime_lookback_bars, 2);
    const std::size_t first = index + 1 > lookback ? index + 1 - lookback : 0;
    std::vector<Candle> window(candles.begin() + static_cast<std::ptrdiff_t>(first),
                               candles.begin() + static_cast<std::ptrdiff_t>(index + 1));
    pos.entry_state = classifier_.analyze(window);
    last_market_state_ = pos.entry_state;

    position_ = std::move(pos);
    return true;
}

TradeRecord BacktestEngine::closePosition(double raw_price, const Candle& candle, std::size_t index,
                                          const std::string& reason) {
    const Position pos = *position_;
    position_.reset();

    TradeRecord trade;
    trade.strategy_id = strategy_id_;
    trade.version = version_;
    trade.side = pos.side;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exitFillPrice(pos.side, raw_price);
    trade.entry_time = pos.entry_time;
    trade.exit_time = candle.timestamp;
    trade.quantity = pos.quantity;

    const double entry_notional = pos.entry_price * pos.quantity;
    const double exit_fee = trade.exit_price * pos.quantity * config_.fee_rate;
    const double gross = pos.side == TradeSide::LONG
        ? (trade.exit_price - pos.entry_price) * pos.quantity
        : (pos.entry_price - trade.exit_price) * pos.quantity;
    trade.pnl = gross - pos.entry_fee - exit_fee;
    trade.pnl_pct = entry_notional > 0.0 ? trade.pnl / entry_notional : 0.0;
    trade.win = trade.pnl > 0.0;
    trade.exit_reason = reason;
    trade.hold_ms = trade.exit_time - trade.entry_time;
    trade.hold_bars = index - pos.entry_index;

    trade.regime = analytics::toString(pos.entry_state.regime);
    trade.volatility = pos.entry_state.volatility_24h;
    trade.volume_ratio = pos.entry_state.volume_ratio;

    Logger::getInstance().logTrade(strategy_id_, version_, edgeguard::toString(trade.side),
                                   trade.entry_price, trade.exit_price, trade.pnl, trade.exit_reason);
    return trade;
}

BacktestMetrics BacktestEngine::computeMetrics(const std::vector<TradeRecord>& trades,
                                               double initial_capital,
                                               double max_drawdown) {
    BacktestMetrics m;
    m.initial_capital = initial_capital;
    m.final_equity = initial_capital;
    m.max_drawdown = max_drawdown;
    m.max_drawdown_pct = initial_capital > 0.0 ? max_drawdown / initial_capital : 0.0;

    if (trades.empty()) {
        return m;
    }

    engine::StrategyPerformanceStats stats;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    double hold_sum = 0.0;
    for (const auto& t : trades) {
        stats.add(t.pnl);
        hold_sum += static_cast<double>(t.hold_ms);
        if (t.win) {
            m.winning_trades++;
            win_sum += t.pnl;
            m.largest_win = std::max(m.largest_win, t.pnl);
        } else {
            m.losing_trades++;
            loss_sum += t.pnl;
            m.largest_loss = std::min(m.largest_loss, t.pnl);
        }
    }

    const double n = static_cast<double>(trades.size());
    m.total_trades = static_cast<int>(trades.size());
    m.win_rate = static_cast<double>(m.winning_trades) / n;
    m.total_pnl = stats.net_profit;
    m.avg_pnl = stats.expectancy();
    m.avg_win = m.winning_trades > 0 ? win_sum / m.winning_trades : 0.0;
    m.avg_loss = m.losing_trades > 0 ? loss_sum / m.losing_trades : 0.0;
    m.profit_factor = stats.profitFactor();
    m.avg_hold_ms = hold_sum / n;
    m.final_equity = initial_capital + m.total_pnl;

    // Per-trade return on starting capital, annualized
    if (trades.size() >= 2 && initial_capital > 0.0) {
        double mean = 0.0;
        for (const auto& t : trades) mean += t.pnl / initial_capital;
        mean /= n;
        double var = 0.0;
        for (const auto& t : trades) {
            const double d = t.pnl / initial_capital - mean;
            var += d * d;
        }
        const double sd = std::sqrt(var / n);
        m.sharpe_ratio = sd > 0.0 ? mean / sd * std::sqrt(TRADING_DAYS_PER_YEAR) : 0.0;
    }
    return m;
}

std::vector<std::string> BacktestEngine::evaluateCriteria(const BacktestMetrics& metrics,
                                                          const BacktestConfig& config) {
    std::vector<std::string> failures;
    if (metrics.total_trades < config.min_trades) {
        failures.push_back(fmt::format("insufficient trades ({} < {})",
                                       metrics.total_trades, config.min_trades));
    }
    if (metrics.win_rate < config.min_win_rate) {
        failures.push_back(fmt::format("win rate {:.1f}% below {:.1f}%",
                                       metrics.win_rate * 100.0, config.min_win_rate * 100.0));
    }
    if (!(metrics.total_pnl > config.min_total_pnl)) {
        failures.push_back(fmt::format("total pnl {:.2f} not above {:.2f}",
                                       metrics.total_pnl, config.min_total_pnl));
    }
    if (metrics.profit_factor < config.min_profit_factor) {
        failures.push_back(fmt::format("profit factor {:.2f} below {:.2f}",
                                       metrics.profit_factor, config.min_profit_factor));
    }
    if (!(metrics.max_drawdown_pct < config.max_drawdown_pct)) {
        failures.push_back(fmt::format("max drawdown {:.1f}% not below {:.1f}%",
                                       metrics.max_drawdown_pct * 100.0, config.max_drawdown_pct * 100.0));
    }
    return failures;
}

nlohmann::json BacktestEngine::toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["passed"] = result.passed;
    j["reason"] = result.reason;
    j["failure_reasons"] = result.failure_reasons;
    if (result.error) {
        j["error"] = {{"kind", risk::toString(result.error->kind)}, {"message", result.error->message}};
    }
    j["metrics"] = result.metrics.toJson();
    j["exit_reason_counts"] = result.exit_reason_counts;
    j["bars_processed"] = result.bars_processed;
    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back(t.toJson());
    }
    return j;
}

bool BacktestEngine::saveResult(const BacktestResult& result, const std::filesystem::path& dir) {
    std::string name = "backtest";
    if (!result.trades.empty()) {
        name += "_" + result.trades.front().strategy_id + "_v" + result.trades.front().version;
    }
    name += "_" + std::to_string(currentTimeMs()) + ".json";
    core::JsonStateFile file(dir / name);
    return file.save(toJson(result));
}

} // namespace backtest
} // namespace edgeguard
