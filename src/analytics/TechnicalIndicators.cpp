#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace edgeguard {
namespace analytics {

namespace {

double trueRange(const Candle& bar, double prev_close) {
    return std::max({bar.high - bar.low,
                     std::abs(bar.high - prev_close),
                     std::abs(bar.low - prev_close)});
}

double populationStdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double acc = 0.0;
    for (double v : values) {
        acc += (v - mean) * (v - mean);
    }
    return std::sqrt(acc / values.size());
}

} // namespace

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() <= static_cast<size_t>(period)) {
        return 0.0;
    }

    // Seed with the plain average of the first `period` true ranges
    double atr = 0.0;
    for (int i = 1; i <= period; ++i) {
        atr += trueRange(candles[i], candles[i - 1].close);
    }
    atr /= period;

    for (size_t i = static_cast<size_t>(period) + 1; i < candles.size(); ++i) {
        atr += (trueRange(candles[i], candles[i - 1].close) - atr) / period;
    }
    return atr;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) {
        return 0.0;
    }
    const auto series = calculateEMAVector(prices, period);
    return series.empty() ? prices.back() : series.back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(const std::vector<double>& prices, int period) {
    std::vector<double> out;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }
    out.reserve(prices.size() - period + 1);

    const double alpha = 2.0 / (period + 1.0);
    double ema = std::accumulate(prices.begin(), prices.begin() + period, 0.0) / period;
    out.push_back(ema);
    for (auto it = prices.begin() + period; it != prices.end(); ++it) {
        ema += alpha * (*it - ema);
        out.push_back(ema);
    }
    return out;
}

double TechnicalIndicators::calculatePriceChange(const std::vector<Candle>& candles, std::size_t periods) {
    if (periods == 0 || candles.size() <= periods) {
        return 0.0;
    }
    const double base = candles[candles.size() - 1 - periods].close;
    if (base == 0.0) {
        return 0.0;
    }
    return candles.back().close / base - 1.0;
}

double TechnicalIndicators::calculateReturnVolatility(const std::vector<Candle>& candles, std::size_t bars) {
    if (bars < 2 || candles.size() < bars) {
        return 0.0;
    }

    std::vector<double> returns;
    returns.reserve(bars - 1);
    const size_t first = candles.size() - bars;
    for (size_t i = first + 1; i < candles.size(); ++i) {
        const double prev = candles[i - 1].close;
        if (prev > 0.0) {
            returns.push_back(candles[i].close / prev - 1.0);
        }
    }
    return populationStdDev(returns);
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> closes(candles.size());
    std::transform(candles.begin(), candles.end(), closes.begin(),
                   [](const Candle& c) { return c.close; });
    return closes;
}

} // namespace analytics
} // namespace edgeguard
