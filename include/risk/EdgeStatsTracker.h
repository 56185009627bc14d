#pragma once

#include "common/Types.h"
#include "core/state/JsonStateFile.h"
#include "risk/RiskConfig.h"

#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace edgeguard {
namespace risk {

// Identity of a rolling edge window. Samples of different keys are never compared.
struct EdgeStatsKey {
    std::string symbol;
    TradeSide direction = TradeSide::LONG;
    std::string timeframe;

    // SYMBOL:DIRECTION:TIMEFRAME
    std::string toString() const;

    // Builds a key from raw signal fields. Returns nullopt and fills `error`
    // when the symbol, direction or timeframe is malformed.
    static std::optional<EdgeStatsKey> make(const std::string& symbol,
                                            const std::string& direction,
                                            const std::string& timeframe,
                                            std::string* error = nullptr);
    static std::optional<EdgeStatsKey> fromString(const std::string& key_str);

    bool operator==(const EdgeStatsKey& other) const {
        return symbol == other.symbol && direction == other.direction && timeframe == other.timeframe;
    }
    bool operator<(const EdgeStatsKey& other) const { return toString() < other.toString(); }
};

struct EdgeSample {
    double net_edge = 0.0;
    long long timestamp_ms = 0;
    std::string signal_type;
    nlohmann::json metadata = nlohmann::json::object();
};

struct EdgeStatistics {
    std::string key;          // empty for the all-keys aggregate
    std::size_t count = 0;
    std::size_t key_count = 0;
    bool sufficient_samples = false;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
};

class EdgeStatsTracker {
public:
    explicit EdgeStatsTracker(EdgeStatsConfig config = EdgeStatsConfig{},
                              std::optional<std::filesystem::path> persistence_path = std::nullopt);

    // Must be called once the gate decision is made and before the outcome is known.
    // Non-finite edges are rejected.
    bool recordEdge(double net_edge,
                    const EdgeStatsKey& key,
                    const std::string& signal_type = "",
                    const nlohmann::json& metadata = nlohmann::json::object(),
                    long long timestamp_ms = 0);

    // Fraction of stored samples strictly below net_edge.
    // nullopt while the key holds fewer than min_sample samples.
    std::optional<double> getPercentile(double net_edge, const EdgeStatsKey& key) const;

    EdgeStatistics getStatistics(const EdgeStatsKey& key) const;
    EdgeStatistics getStatistics() const;

    // Oldest first, at most `limit` of the newest samples
    std::vector<EdgeSample> recentRecords(const EdgeStatsKey& key, std::size_t limit = 10) const;

    std::size_t sampleCount(const EdgeStatsKey& key) const;
    std::vector<std::string> keys() const;

    void clear(const EdgeStatsKey& key);
    void clearAll();

    // Safe to call from any thread; concurrent saves are serialized
    bool save() const;
    bool load();

    const EdgeStatsConfig& config() const { return config_; }

private:
    struct Bucket {
        mutable std::mutex mutex;
        std::deque<EdgeSample> samples;   // insertion order
        std::vector<double> sorted;       // same values, ascending
    };

    std::shared_ptr<Bucket> findBucket(const std::string& key_str) const;
    std::shared_ptr<Bucket> getOrCreateBucket(const std::string& key_str);
    void appendLocked(Bucket& bucket, EdgeSample sample) const;

    EdgeStatsConfig config_;
    std::optional<core::JsonStateFile> state_file_;

    // Held across snapshot and write so saves land in order, one at a time.
    // Lock order: save_mutex_, registry_mutex_, Bucket::mutex.
    mutable std::mutex save_mutex_;
    mutable std::mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<Bucket>> buckets_;
};

} // namespace risk
} // namespace edgeguard
