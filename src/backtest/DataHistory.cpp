#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>

namespace edgeguard {
namespace backtest {

namespace {
constexpr long long MS_PER_DAY = 86400000LL;
constexpr std::size_t CSV_COLUMNS = 6;
const std::string UTF8_BOM = "\xEF\xBB\xBF";

std::string cleanCell(const std::string& raw) {
    std::string s = raw;
    if (s.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
        s.erase(0, UTF8_BOM.size());
    }
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(cleanCell(cell));
    }
    return cells;
}

// Header rows and rows with a non-numeric first cell are not data
bool looksLikeData(const std::vector<std::string>& cells) {
    if (cells.size() < CSV_COLUMNS || cells[0].empty()) {
        return false;
    }
    const unsigned char lead = static_cast<unsigned char>(cells[0][0]);
    return std::isdigit(lead) || lead == '-';
}

Candle candleFromCells(const std::vector<std::string>& cells) {
    return Candle(std::stod(cells[1]), std::stod(cells[2]), std::stod(cells[3]),
                  std::stod(cells[4]), std::stod(cells[5]),
                  DataHistory::toMsTimestamp(std::stoll(cells[0])));
}

// Accepts the long or the one-letter key, as a number or a numeric string
double jsonNumber(const nlohmann::json& item, const char* key, const char* short_key) {
    auto it = item.find(key);
    if (it == item.end()) {
        it = item.find(short_key);
    }
    if (it == item.end()) {
        return 0.0;
    }
    return it->is_string() ? std::stod(it->get<std::string>()) : it->get<double>();
}

void sortByTime(std::vector<Candle>& candles) {
    std::sort(candles.begin(), candles.end(),
              [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });
}
} // namespace

long long DataHistory::toMsTimestamp(long long ts) {
    // Below 1e12 the value is in seconds
    return ts < 1000000000000LL ? ts * 1000LL : ts;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        const auto cells = splitRow(line);
        if (!looksLikeData(cells)) {
            continue;
        }
        try {
            candles.push_back(candleFromCells(cells));
        } catch (const std::exception& e) {
            LOG_WARN("{}:{} skipped ({})", file_path, line_no, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return {};
    }

    std::vector<Candle> candles;
    try {
        const auto doc = nlohmann::json::parse(file);
        if (!doc.is_array()) {
            LOG_ERROR("{} is not a JSON array of candles", file_path);
            return {};
        }
        candles.reserve(doc.size());
        for (const auto& item : doc) {
            candles.emplace_back(jsonNumber(item, "open", "o"), jsonNumber(item, "high", "h"),
                                 jsonNumber(item, "low", "l"), jsonNumber(item, "close", "c"),
                                 jsonNumber(item, "volume", "v"),
                                 toMsTimestamp(static_cast<long long>(jsonNumber(item, "timestamp", "t"))));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return {};
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    if (std::filesystem::path(file_path).extension() == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::filterByTime(const std::vector<Candle>& candles,
                                              long long start_ms,
                                              long long end_ms) {
    std::vector<Candle> out;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(out),
                 [&](const Candle& c) { return c.timestamp >= start_ms && c.timestamp < end_ms; });
    return out;
}

std::optional<long long> DataHistory::parseDateMs(const std::string& date) {
    std::tm tm{};
    std::istringstream ss(date);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        return std::nullopt;
    }
    return static_cast<long long>(timegm(&tm)) * 1000LL;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    auto bound = [](const std::string& date, const char* which, long long open_value,
                    long long offset) {
        if (date.empty()) {
            return open_value;
        }
        const auto parsed = parseDateMs(date);
        if (!parsed) {
            LOG_WARN("Ignoring unparsable {} date: {}", which, date);
            return open_value;
        }
        return *parsed + offset;
    };

    const long long start_ms = bound(start_date, "start", std::numeric_limits<long long>::min(), 0);
    const long long end_ms = bound(end_date, "end", std::numeric_limits<long long>::max(), MS_PER_DAY);
    return filterByTime(candles, start_ms, end_ms);
}

std::optional<std::string> DataHistory::validate(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        return std::string("empty data");
    }
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        const std::string at = " at bar " + std::to_string(i);
        for (double v : {c.open, c.high, c.low, c.close, c.volume}) {
            if (!std::isfinite(v)) {
                return "non-finite value" + at;
            }
        }
        if (std::min({c.open, c.high, c.low, c.close}) <= 0.0) {
            return "non-positive price" + at;
        }
        if (c.high < c.low) {
            return "high below low" + at;
        }
        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            return "non-increasing timestamp" + at;
        }
    }
    return std::nullopt;
}

} // namespace backtest
} // namespace edgeguard
