#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace edgeguard {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume (header rows are skipped)
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array of {timestamp|t, open|o, high|h, low|l, close|c, volume|v}
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Dispatches on the file extension
    static std::vector<Candle> load(const std::string& file_path);

    // Candles with start_ms <= timestamp < end_ms
    static std::vector<Candle> filterByTime(const std::vector<Candle>& candles,
                                            long long start_ms,
                                            long long end_ms);

    // Dates are YYYY-MM-DD in UTC; end_date is inclusive. An empty bound is open.
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    // Returns a description of the first defect, or nullopt for a usable series:
    // non-empty, finite positive prices, high >= low, strictly increasing timestamps.
    static std::optional<std::string> validate(const std::vector<Candle>& candles);

    // Second-resolution timestamps are promoted to milliseconds
    static long long toMsTimestamp(long long ts);

    static std::optional<long long> parseDateMs(const std::string& date);
};

} // namespace backtest
} // namespace edgeguard
