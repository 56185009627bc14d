#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace edgeguard {

enum class TradeSide { LONG, SHORT };

// One OHLCV bar. Timestamps are milliseconds since the epoch, bar open time.
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline long long currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline std::string toString(TradeSide side) {
    return side == TradeSide::LONG ? "LONG" : "SHORT";
}

inline std::optional<TradeSide> tradeSideFromString(const std::string& value) {
    if (value == "LONG") return TradeSide::LONG;
    if (value == "SHORT") return TradeSide::SHORT;
    return std::nullopt;
}

} // namespace edgeguard
