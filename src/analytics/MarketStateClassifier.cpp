#include "analytics/MarketStateClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace edgeguard {
namespace analytics {

namespace {
constexpr double VOLATILE_THRESHOLD = 0.05;
constexpr double QUIET_THRESHOLD = 0.01;
constexpr double TREND_THRESHOLD = 0.02;
constexpr double TREND_FULL_CONFIDENCE = 0.05;
}

std::string toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::TRENDING_UP: return "TRENDING_UP";
        case MarketRegime::TRENDING_DOWN: return "TRENDING_DOWN";
        case MarketRegime::RANGING: return "RANGING";
        case MarketRegime::VOLATILE: return "VOLATILE";
        case MarketRegime::QUIET: return "QUIET";
        case MarketRegime::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::optional<MarketRegime> marketRegimeFromString(const std::string& value) {
    if (value == "TRENDING_UP") return MarketRegime::TRENDING_UP;
    if (value == "TRENDING_DOWN") return MarketRegime::TRENDING_DOWN;
    if (value == "RANGING") return MarketRegime::RANGING;
    if (value == "VOLATILE") return MarketRegime::VOLATILE;
    if (value == "QUIET") return MarketRegime::QUIET;
    if (value == "UNKNOWN") return MarketRegime::UNKNOWN;
    return std::nullopt;
}

nlohmann::json MarketState::toJson() const {
    nlohmann::json j;
    j["timestamp"] = timestamp;
    j["symbol"] = symbol;
    j["price"] = price;
    j["price_change_1h"] = price_change_1h;
    j["price_change_4h"] = price_change_4h;
    j["price_change_24h"] = price_change_24h;
    j["volatility_1h"] = volatility_1h;
    j["volatility_24h"] = volatility_24h;
    j["atr_14"] = atr_14;
    j["volume_24h"] = volume_24h;
    j["volume_ratio"] = volume_ratio;
    j["ema_9"] = ema_9 ? nlohmann::json(*ema_9) : nlohmann::json();
    j["ema_21"] = ema_21 ? nlohmann::json(*ema_21) : nlohmann::json();
    j["ema_50"] = ema_50 ? nlohmann::json(*ema_50) : nlohmann::json();
    j["regime"] = toString(regime);
    j["regime_confidence"] = regime_confidence;
    return j;
}

MarketState MarketStateClassifier::analyze(const std::vector<Candle>& candles, const std::string& symbol) const {
    MarketState state;
    state.symbol = symbol;

    if (candles.size() < 2) {
        state.regime = MarketRegime::UNKNOWN;
        if (!candles.empty()) {
            state.price = candles.back().close;
            state.timestamp = candles.back().timestamp;
        }
        return state;
    }

    const auto& latest = candles.back();
    state.price = latest.close;
    state.timestamp = latest.timestamp;

    state.price_change_1h = TechnicalIndicators::calculatePriceChange(candles, BARS_1H);
    state.price_change_4h = TechnicalIndicators::calculatePriceChange(candles, BARS_4H);
    state.price_change_24h = TechnicalIndicators::calculatePriceChange(candles, BARS_24H);

    state.volatility_1h = TechnicalIndicators::calculateReturnVolatility(candles, BARS_1H);
    state.volatility_24h = TechnicalIndicators::calculateReturnVolatility(candles, BARS_24H);
    state.atr_14 = TechnicalIndicators::calculateATR(candles, 14);

    if (candles.size() >= BARS_24H) {
        double volume_24h = 0.0;
        for (size_t i = candles.size() - BARS_24H; i < candles.size(); ++i) {
            volume_24h += candles[i].volume;
        }
        state.volume_24h = volume_24h;
    }
    const double avg_volume = state.volume_24h > 0.0 ? state.volume_24h / BARS_24H : 1.0;
    state.volume_ratio = avg_volume > 0.0 ? latest.volume / avg_volume : 1.0;

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    if (closes.size() >= 9) state.ema_9 = TechnicalIndicators::calculateEMA(closes, 9);
    if (closes.size() >= 21) state.ema_21 = TechnicalIndicators::calculateEMA(closes, 21);
    if (closes.size() >= 50) state.ema_50 = TechnicalIndicators::calculateEMA(closes, 50);

    classify(state);
    return state;
}

void MarketStateClassifier::classify(MarketState& state) {
    const double change = state.price_change_24h;
    const double vol = state.volatility_24h;

    if (change == 0.0 && vol == 0.0) {
        state.regime = MarketRegime::UNKNOWN;
        state.regime_confidence = 0.0;
        return;
    }

    if (vol > VOLATILE_THRESHOLD) {
        state.regime = MarketRegime::VOLATILE;
        state.regime_confidence = std::min(vol / (VOLATILE_THRESHOLD * 2.0), 1.0);
        return;
    }

    if (vol < QUIET_THRESHOLD) {
        state.regime = MarketRegime::QUIET;
        state.regime_confidence = 1.0 - vol / QUIET_THRESHOLD;
        return;
    }

    if (change > TREND_THRESHOLD) {
        state.regime = MarketRegime::TRENDING_UP;
        state.regime_confidence = std::min(change / TREND_FULL_CONFIDENCE, 1.0);
        return;
    }

    if (change < -TREND_THRESHOLD) {
        state.regime = MarketRegime::TRENDING_DOWN;
        state.regime_confidence = std::min(std::abs(change) / TREND_FULL_CONFIDENCE, 1.0);
        return;
    }

    state.regime = MarketRegime::RANGING;
    state.regime_confidence = 1.0 - std::abs(change) / TREND_THRESHOLD;
}

} // namespace analytics
} // namespace edgeguard
