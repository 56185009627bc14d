#include "strategy/EmaCrossStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include <stdexcept>

namespace edgeguard {
namespace strategy {

EmaCrossStrategy::EmaCrossStrategy(const std::vector<Candle>& candles, EmaCrossConfig config)
    : config_(config) {
    if (config_.fast_period <= 0 || config_.slow_period <= config_.fast_period) {
        throw std::invalid_argument("ema cross periods must satisfy 0 < fast < slow");
    }
    const auto closes = analytics::TechnicalIndicators::extractClosePrices(candles);
    fast_ = analytics::TechnicalIndicators::calculateEMAVector(closes, config_.fast_period);
    slow_ = analytics::TechnicalIndicators::calculateEMAVector(closes, config_.slow_period);
}

// EMA vectors start at index period - 1 of the series
std::optional<double> EmaCrossStrategy::fastAt(std::size_t index) const {
    const std::size_t first = static_cast<std::size_t>(config_.fast_period - 1);
    if (index < first || index - first >= fast_.size()) return std::nullopt;
    return fast_[index - first];
}

std::optional<double> EmaCrossStrategy::slowAt(std::size_t index) const {
    const std::size_t first = static_cast<std::size_t>(config_.slow_period - 1);
    if (index < first || index - first >= slow_.size()) return std::nullopt;
    return slow_[index - first];
}

backtest::StrategySignal EmaCrossStrategy::operator()(const Candle& candle, std::size_t index) const {
    if (index == 0) {
        return backtest::StrategySignal::hold();
    }
    const auto fast_prev = fastAt(index - 1);
    const auto slow_prev = slowAt(index - 1);
    const auto fast_now = fastAt(index);
    const auto slow_now = slowAt(index);
    if (!fast_prev || !slow_prev || !fast_now || !slow_now) {
        return backtest::StrategySignal::hold();
    }

    backtest::StrategySignal signal;
    if (*fast_prev <= *slow_prev && *fast_now > *slow_now) {
        signal.action = backtest::StrategyAction::LONG;
        signal.stop_loss = candle.close * (1.0 - config_.stop_loss_pct);
        signal.take_profit = candle.close * (1.0 + config_.take_profit_pct);
        signal.trailing_stop_pct = config_.trailing_stop_pct;
    } else if (*fast_prev >= *slow_prev && *fast_now < *slow_now) {
        if (config_.allow_short) {
            signal.action = backtest::StrategyAction::SHORT;
            signal.stop_loss = candle.close * (1.0 + config_.stop_loss_pct);
            signal.take_profit = candle.close * (1.0 - config_.take_profit_pct);
            signal.trailing_stop_pct = config_.trailing_stop_pct;
        } else {
            signal.action = backtest::StrategyAction::CLOSE;
        }
    }
    return signal;
}

backtest::StrategyFunction EmaCrossStrategy::function() const {
    // Copies the precomputed series so the function outlives this object
    EmaCrossStrategy copy = *this;
    return [copy](const Candle& candle, std::size_t index) { return copy(candle, index); };
}

} // namespace strategy
} // namespace edgeguard
