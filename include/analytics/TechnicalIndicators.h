#pragma once

#include <vector>
#include "common/Types.h"

namespace edgeguard {
namespace analytics {

// Indicators used by the regime classifier and the reference strategy.
class TechnicalIndicators {
public:
    // Average true range with Wilder smoothing. 0 until period + 1 bars exist.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // EMA seeded with the SMA of the first `period` values.
    // With fewer values than the period the last value is returned.
    static double calculateEMA(const std::vector<double>& prices, int period);

    // One value per bar from index period - 1 onward
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // Fractional close-to-close change over the last `periods` bars.
    // 0 when fewer than periods + 1 bars exist or the base price is 0.
    static double calculatePriceChange(const std::vector<Candle>& candles, std::size_t periods);

    // Population standard deviation of simple returns over the last `bars` candles
    static double calculateReturnVolatility(const std::vector<Candle>& candles, std::size_t bars);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace edgeguard
