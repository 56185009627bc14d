#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace analytics {

enum class MarketRegime {
    UNKNOWN,
    TRENDING_UP,
    TRENDING_DOWN,
    RANGING,
    VOLATILE,
    QUIET
};

std::string toString(MarketRegime regime);
std::optional<MarketRegime> marketRegimeFromString(const std::string& value);

struct MarketState {
    long long timestamp = 0;   // ms, taken from the last bar
    std::string symbol;
    double price = 0.0;

    // Bar-count horizons on 15m bars: 4 = 1h, 16 = 4h, 96 = 24h
    double price_change_1h = 0.0;
    double price_change_4h = 0.0;
    double price_change_24h = 0.0;

    double volatility_1h = 0.0;
    double volatility_24h = 0.0;
    double atr_14 = 0.0;

    double volume_24h = 0.0;
    double volume_ratio = 1.0;

    std::optional<double> ema_9;
    std::optional<double> ema_21;
    std::optional<double> ema_50;

    MarketRegime regime = MarketRegime::UNKNOWN;
    double regime_confidence = 0.0;

    nlohmann::json toJson() const;
};

// Pure function of a bar window; holds no history.
class MarketStateClassifier {
public:
    static constexpr std::size_t BARS_1H = 4;
    static constexpr std::size_t BARS_4H = 16;
    static constexpr std::size_t BARS_24H = 96;

    MarketState analyze(const std::vector<Candle>& candles, const std::string& symbol = "") const;

    // Applies the regime rules to an already populated state
    static void classify(MarketState& state);
};

} // namespace analytics
} // namespace edgeguard
