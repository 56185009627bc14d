#include "risk/EdgeStatsTracker.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <system_error>

namespace edgeguard {
namespace risk {

namespace {
constexpr std::size_t MAX_SYMBOL_LENGTH = 32;

bool isValidSymbol(const std::string& symbol) {
    if (symbol.empty() || symbol.size() > MAX_SYMBOL_LENGTH) {
        return false;
    }
    return std::all_of(symbol.begin(), symbol.end(), [](unsigned char c) {
        return std::isupper(c) || std::isdigit(c) || c == '_' || c == '-' || c == '.' || c == '/';
    });
}

bool isValidTimeframe(const std::string& timeframe) {
    if (timeframe.size() < 2) {
        return false;
    }
    const char unit = timeframe.back();
    if (unit != 'm' && unit != 'h' && unit != 'd' && unit != 'w') {
        return false;
    }
    const std::string digits = timeframe.substr(0, timeframe.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    return std::any_of(digits.begin(), digits.end(), [](char c) { return c != '0'; });
}

double valueAt(const std::vector<double>& sorted, double p) {
    const std::size_t n = sorted.size();
    const std::size_t idx = (std::min)(static_cast<std::size_t>(static_cast<double>(n) * p), n - 1);
    return sorted[idx];
}

void fillDistribution(EdgeStatistics& stats, const std::vector<double>& sorted) {
    stats.count = sorted.size();
    if (sorted.empty()) {
        return;
    }
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());
    stats.p25 = valueAt(sorted, 0.25);
    stats.p50 = valueAt(sorted, 0.50);
    stats.p75 = valueAt(sorted, 0.75);
    stats.p90 = valueAt(sorted, 0.90);
}
}

std::string EdgeStatsKey::toString() const {
    return symbol + ":" + edgeguard::toString(direction) + ":" + timeframe;
}

std::optional<EdgeStatsKey> EdgeStatsKey::make(const std::string& symbol,
                                               const std::string& direction,
                                               const std::string& timeframe,
                                               std::string* error) {
    auto fail = [error](const std::string& message) -> std::optional<EdgeStatsKey> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    if (!isValidSymbol(symbol)) {
        return fail("invalid symbol '" + symbol + "'");
    }
    const auto side = tradeSideFromString(direction);
    if (!side) {
        return fail("invalid direction '" + direction + "'");
    }
    if (!isValidTimeframe(timeframe)) {
        return fail("invalid timeframe '" + timeframe + "'");
    }

    EdgeStatsKey key;
    key.symbol = symbol;
    key.direction = *side;
    key.timeframe = timeframe;
    return key;
}

std::optional<EdgeStatsKey> EdgeStatsKey::fromString(const std::string& key_str) {
    const auto first = key_str.find(':');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto second = key_str.find(':', first + 1);
    if (second == std::string::npos || key_str.find(':', second + 1) != std::string::npos) {
        return std::nullopt;
    }
    return make(key_str.substr(0, first),
                key_str.substr(first + 1, second - first - 1),
                key_str.substr(second + 1));
}

EdgeStatsTracker::EdgeStatsTracker(EdgeStatsConfig config,
                                   std::optional<std::filesystem::path> persistence_path)
    : config_(config) {
    if (config_.max_window == 0) {
        throw std::invalid_argument("edge_stats.max_window must be positive");
    }
    if (persistence_path) {
        state_file_.emplace(*persistence_path);
        load();
    }
}

std::shared_ptr<EdgeStatsTracker::Bucket> EdgeStatsTracker::findBucket(const std::string& key_str) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = buckets_.find(key_str);
    return it == buckets_.end() ? nullptr : it->second;
}

std::shared_ptr<EdgeStatsTracker::Bucket> EdgeStatsTracker::getOrCreateBucket(const std::string& key_str) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = buckets_[key_str];
    if (!slot) {
        slot = std::make_shared<Bucket>();
    }
    return slot;
}

// The deque append and evict are O(1) amortized. Keeping `sorted` in step is a
// linear insert/erase, bounded by max_window.
void EdgeStatsTracker::appendLocked(Bucket& bucket, EdgeSample sample) const {
    const double value = sample.net_edge;
    bucket.samples.push_back(std::move(sample));
    bucket.sorted.insert(std::upper_bound(bucket.sorted.begin(), bucket.sorted.end(), value), value);

    while (bucket.samples.size() > config_.max_window) {
        const double evicted = bucket.samples.front().net_edge;
        bucket.samples.pop_front();
        auto it = std::lower_bound(bucket.sorted.begin(), bucket.sorted.end(), evicted);
        if (it != bucket.sorted.end() && *it == evicted) {
            bucket.sorted.erase(it);
        }
    }
}

bool EdgeStatsTracker::recordEdge(double net_edge,
                                  const EdgeStatsKey& key,
                                  const std::string& signal_type,
                                  const nlohmann::json& metadata,
                                  long long timestamp_ms) {
    if (!std::isfinite(net_edge)) {
        LOG_WARN("EdgeStats: rejected non-finite edge for {}", key.toString());
        return false;
    }

    EdgeSample sample;
    sample.net_edge = net_edge;
    sample.timestamp_ms = timestamp_ms > 0 ? timestamp_ms : currentTimeMs();
    sample.signal_type = signal_type;
    sample.metadata = metadata.is_object() ? metadata : nlohmann::json::object();

    auto bucket = getOrCreateBucket(key.toString());
    {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        appendLocked(*bucket, std::move(sample));
    }

    if (config_.persist_on_record && state_file_) {
        save();
    }
    return true;
}

std::optional<double> EdgeStatsTracker::getPercentile(double net_edge, const EdgeStatsKey& key) const {
    auto bucket = findBucket(key.toString());
    if (!bucket) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(bucket->mutex);
    const auto& sorted = bucket->sorted;
    if (sorted.empty() || sorted.size() < config_.min_sample) {
        return std::nullopt;
    }
    if (std::isnan(net_edge)) {
        return 0.0;
    }

    const auto idx = std::lower_bound(sorted.begin(), sorted.end(), net_edge) - sorted.begin();
    return static_cast<double>(idx) / static_cast<double>(sorted.size());
}

EdgeStatistics EdgeStatsTracker::getStatistics(const EdgeStatsKey& key) const {
    EdgeStatistics stats;
    stats.key = key.toString();

    auto bucket = findBucket(stats.key);
    if (!bucket) {
        return stats;
    }

    std::lock_guard<std::mutex> lock(bucket->mutex);
    stats.key_count = 1;
    fillDistribution(stats, bucket->sorted);
    stats.sufficient_samples = stats.count >= config_.min_sample;
    return stats;
}

EdgeStatistics EdgeStatsTracker::getStatistics() const {
    std::vector<std::shared_ptr<Bucket>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& [key_str, bucket] : buckets_) {
            snapshot.push_back(bucket);
        }
    }

    std::vector<double> all_edges;
    for (const auto& bucket : snapshot) {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        all_edges.insert(all_edges.end(), bucket->sorted.begin(), bucket->sorted.end());
    }
    std::sort(all_edges.begin(), all_edges.end());

    EdgeStatistics stats;
    stats.key_count = snapshot.size();
    fillDistribution(stats, all_edges);
    stats.sufficient_samples = stats.count >= config_.min_sample;
    return stats;
}

std::vector<EdgeSample> EdgeStatsTracker::recentRecords(const EdgeStatsKey& key, std::size_t limit) const {
    std::vector<EdgeSample> out;
    auto bucket = findBucket(key.toString());
    if (!bucket || limit == 0) {
        return out;
    }

    std::lock_guard<std::mutex> lock(bucket->mutex);
    const std::size_t n = bucket->samples.size();
    const std::size_t start = n > limit ? n - limit : 0;
    out.assign(bucket->samples.begin() + static_cast<std::ptrdiff_t>(start), bucket->samples.end());
    return out;
}

std::size_t EdgeStatsTracker::sampleCount(const EdgeStatsKey& key) const {
    auto bucket = findBucket(key.toString());
    if (!bucket) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    return bucket->samples.size();
}

std::vector<std::string> EdgeStatsTracker::keys() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> out;
    out.reserve(buckets_.size());
    for (const auto& [key_str, bucket] : buckets_) {
        out.push_back(key_str);
    }
    return out;
}

void EdgeStatsTracker::clear(const EdgeStatsKey& key) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    buckets_.erase(key.toString());
}

void EdgeStatsTracker::clearAll() {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        buckets_.clear();
    }
    if (state_file_) {
        std::error_code ec;
        std::filesystem::remove(state_file_->path(), ec);
        if (ec) {
            LOG_ERROR("EdgeStats: could not remove {}: {}", state_file_->path().string(), ec.message());
        }
    }
}

bool EdgeStatsTracker::save() const {
    if (!state_file_) {
        return false;
    }
    std::lock_guard<std::mutex> save_lock(save_mutex_);

    std::map<std::string, std::shared_ptr<Bucket>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        snapshot = buckets_;
    }

    nlohmann::json doc;
    doc["max_window"] = config_.max_window;
    doc["min_sample"] = config_.min_sample;
    doc["saved_at_ms"] = currentTimeMs();
    doc["history"] = nlohmann::json::object();

    for (const auto& [key_str, bucket] : snapshot) {
        nlohmann::json rows = nlohmann::json::array();
        std::lock_guard<std::mutex> lock(bucket->mutex);
        for (const auto& sample : bucket->samples) {
            rows.push_back({
                {"net_edge", sample.net_edge},
                {"timestamp_ms", sample.timestamp_ms},
                {"signal_type", sample.signal_type},
                {"metadata", sample.metadata}
            });
        }
        doc["history"][key_str] = std::move(rows);
    }

    if (!state_file_->save(doc)) {
        LOG_ERROR("EdgeStats: persistence failed for {}", state_file_->path().string());
        return false;
    }
    return true;
}

bool EdgeStatsTracker::load() {
    if (!state_file_) {
        return false;
    }
    std::lock_guard<std::mutex> save_lock(save_mutex_);
    auto doc = state_file_->load();
    if (!doc) {
        return false;
    }

    std::map<std::string, std::shared_ptr<Bucket>> loaded;
    std::size_t total = 0;
    try {
        const auto history = doc->value("history", nlohmann::json::object());
        for (auto it = history.begin(); it != history.end(); ++it) {
            const auto key = EdgeStatsKey::fromString(it.key());
            if (!key || !it.value().is_array()) {
                LOG_WARN("EdgeStats: skipping invalid key '{}' in {}", it.key(), state_file_->path().string());
                continue;
            }

            auto bucket = std::make_shared<Bucket>();
            for (const auto& row : it.value()) {
                EdgeSample sample;
                sample.net_edge = row.value("net_edge", 0.0);
                sample.timestamp_ms = row.value("timestamp_ms", 0LL);
                sample.signal_type = row.value("signal_type", std::string());
                sample.metadata = row.value("metadata", nlohmann::json::object());
                if (!std::isfinite(sample.net_edge)) {
                    continue;
                }
                appendLocked(*bucket, std::move(sample));
            }
            total += bucket->samples.size();
            loaded[key->toString()] = std::move(bucket);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("EdgeStats: malformed history in {}: {}", state_file_->path().string(), e.what());
        return false;
    }

    const std::size_t key_count = loaded.size();
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        buckets_ = std::move(loaded);
    }
    LOG_INFO("EdgeStats: loaded {} samples across {} keys", total, key_count);
    return true;
}

} // namespace risk
} // namespace edgeguard
