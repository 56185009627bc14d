#include "risk/EdgeStatsTracker.h"

#include <atomic>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

using namespace edgeguard;

namespace {
risk::EdgeStatsKey key(const std::string& symbol = "BTCUSDT", const std::string& dir = "LONG",
                       const std::string& tf = "15m") {
    auto k = risk::EdgeStatsKey::make(symbol, dir, tf);
    assert(k.has_value());
    return *k;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    // Key validation
    {
        std::string error;
        assert(!risk::EdgeStatsKey::make("", "LONG", "15m", &error));
        assert(!error.empty());
        assert(!risk::EdgeStatsKey::make("btcusdt", "LONG", "15m"));
        assert(!risk::EdgeStatsKey::make("BTCUSDT", "BUY", "15m"));
        assert(!risk::EdgeStatsKey::make("BTCUSDT", "LONG", "15"));
        assert(!risk::EdgeStatsKey::make("BTCUSDT", "LONG", "0m"));
        assert(!risk::EdgeStatsKey::make(std::string(33, 'A'), "LONG", "1h"));
        assert(risk::EdgeStatsKey::make("ETH-USD", "SHORT", "4h"));

        const auto k = key();
        if (k.toString() != "BTCUSDT:LONG:15m") {
            std::cerr << "[TEST] unexpected key string: " << k.toString() << "\n";
            return 1;
        }
        const auto parsed = risk::EdgeStatsKey::fromString(k.toString());
        assert(parsed && *parsed == k);
        assert(!risk::EdgeStatsKey::fromString("BTCUSDT:LONG"));
    }

    // Below min_sample the percentile is the sentinel, not a number
    {
        risk::EdgeStatsTracker tracker;
        const auto k = key();
        for (int i = 0; i < 49; ++i) {
            assert(tracker.recordEdge(static_cast<double>(i), k));
        }
        if (tracker.getPercentile(25.0, k).has_value()) {
            std::cerr << "[TEST] percentile should be unavailable with 49 samples\n";
            return 1;
        }
        assert(tracker.recordEdge(49.0, k));
        const auto p = tracker.getPercentile(25.0, k);
        assert(p.has_value());
        // 25 of 50 samples (0..24) are strictly below 25
        assert(near(*p, 0.5));
        assert(tracker.getStatistics(k).sufficient_samples);
    }

    // Non-finite edges are rejected
    {
        risk::EdgeStatsTracker tracker;
        assert(!tracker.recordEdge(std::nan(""), key()));
        assert(!tracker.recordEdge(INFINITY, key()));
        assert(tracker.sampleCount(key()) == 0);
    }

    // FIFO eviction: only the newest 1000 samples count
    {
        risk::EdgeStatsTracker tracker;
        const auto k = key();
        // 1001 samples: the first one is a large outlier that must be evicted
        assert(tracker.recordEdge(5000.0, k));
        for (int i = 0; i < 1000; ++i) {
            assert(tracker.recordEdge(static_cast<double>(i), k));
        }
        assert(tracker.sampleCount(k) == 1000);
        const auto stats = tracker.getStatistics(k);
        assert(near(stats.max, 999.0));
        assert(near(stats.min, 0.0));
        // Values 0..499 are below 500
        const auto p = tracker.getPercentile(500.0, k);
        assert(p && near(*p, 0.5));
        const auto p_top = tracker.getPercentile(1e9, k);
        assert(p_top && near(*p_top, 1.0));
        const auto p_bottom = tracker.getPercentile(-1.0, k);
        assert(p_bottom && near(*p_bottom, 0.0));
    }

    // Keys never share samples
    {
        risk::EdgeStatsTracker tracker;
        const auto long_key = key("BTCUSDT", "LONG", "15m");
        const auto short_key = key("BTCUSDT", "SHORT", "15m");
        const auto other_tf = key("BTCUSDT", "LONG", "1h");
        for (int i = 0; i < 60; ++i) {
            tracker.recordEdge(1.0, long_key);
        }
        assert(tracker.sampleCount(short_key) == 0);
        assert(tracker.sampleCount(other_tf) == 0);
        assert(!tracker.getPercentile(2.0, short_key).has_value());
        assert(tracker.keys().size() == 1);

        tracker.clear(long_key);
        assert(tracker.sampleCount(long_key) == 0);
    }

    // Persistence round trip
    {
        const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_edge_stats";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        const auto path = dir / "edge_stats.json";
        const auto k = key("SOLUSDT", "SHORT", "5m");
        {
            risk::EdgeStatsTracker tracker(risk::EdgeStatsConfig{}, path);
            for (int i = 0; i < 80; ++i) {
                tracker.recordEdge(static_cast<double>(i), k, "breakout", {{"i", i}}, 1000 + i);
            }
            if (!tracker.save()) {
                std::cerr << "[TEST] save failed\n";
                return 1;
            }
        }
        risk::EdgeStatsTracker reloaded(risk::EdgeStatsConfig{}, path);
        assert(reloaded.sampleCount(k) == 80);
        const auto recent = reloaded.recentRecords(k, 3);
        assert(recent.size() == 3);
        assert(recent.back().timestamp_ms == 1079);
        assert(recent.back().signal_type == "breakout");
        const auto p = reloaded.getPercentile(40.0, k);
        assert(p && near(*p, 0.5));
        std::filesystem::remove_all(dir, ec);
    }

    // One writer past capacity while readers query the same key
    {
        risk::EdgeStatsTracker tracker;
        const auto k = key("ETHUSDT", "LONG", "1m");
        const std::size_t max_window = tracker.config().max_window;
        const std::size_t min_sample = tracker.config().min_sample;

        std::atomic<bool> done{false};
        std::atomic<int> violations{0};
        std::atomic<long> reads{0};

        std::thread writer([&] {
            for (int i = 0; i < 1200; ++i) {
                if (!tracker.recordEdge(static_cast<double>(i), k)) {
                    ++violations;
                }
            }
            done = true;
        });

        std::vector<std::thread> readers;
        for (int r = 0; r < 3; ++r) {
            readers.emplace_back([&] {
                while (!done) {
                    // Counts only grow until capacity, so bracketing the read
                    // pins down which side of min_sample it saw
                    const std::size_t before = tracker.sampleCount(k);
                    const auto p = tracker.getPercentile(600.0, k);
                    const std::size_t after = tracker.sampleCount(k);
                    if (before > max_window || after > max_window) {
                        ++violations;
                    }
                    if (p && (*p < 0.0 || *p > 1.0 || after < min_sample)) {
                        ++violations;
                    }
                    if (!p && before >= min_sample) {
                        ++violations;
                    }
                    ++reads;
                }
            });
        }

        writer.join();
        for (auto& t : readers) {
            t.join();
        }
        if (violations != 0) {
            std::cerr << "[TEST] concurrent read/write saw " << violations << " bad observations in "
                      << reads << " reads\n";
            return 1;
        }
        assert(tracker.sampleCount(k) == max_window);
        // Window holds 200..1199; 500 of them are below 700
        const auto p = tracker.getPercentile(700.0, k);
        assert(p && near(*p, 0.5));
    }

    // Concurrent saves and persisting records on different keys all succeed
    {
        const auto dir = std::filesystem::temp_directory_path() / "edgeguard_test_edge_stats_concurrent";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        const auto path = dir / "edge_stats.json";

        {
            risk::EdgeStatsTracker tracker(risk::EdgeStatsConfig{}, path);
            const auto k = key("BTCUSDT", "SHORT", "1h");
            for (int i = 0; i < 1000; ++i) {
                tracker.recordEdge(static_cast<double>(i), k);
            }

            std::atomic<int> failures{0};
            std::vector<std::thread> savers;
            for (int t = 0; t < 4; ++t) {
                savers.emplace_back([&] {
                    for (int i = 0; i < 50; ++i) {
                        if (!tracker.save()) {
                            ++failures;
                        }
                    }
                });
            }
            for (auto& t : savers) {
                t.join();
            }
            if (failures != 0) {
                std::cerr << "[TEST] " << failures << " of 200 concurrent saves failed\n";
                return 1;
            }
        }

        risk::EdgeStatsConfig persisting;
        persisting.persist_on_record = true;
        const std::vector<std::string> symbols = {"AAAUSDT", "BBBUSDT", "CCCUSDT", "DDDUSDT"};
        {
            risk::EdgeStatsTracker tracker(persisting, path);
            std::vector<std::thread> writers;
            for (const auto& symbol : symbols) {
                writers.emplace_back([&tracker, symbol] {
                    const auto k = key(symbol, "LONG", "5m");
                    for (int i = 0; i < 25; ++i) {
                        tracker.recordEdge(static_cast<double>(i), k);
                    }
                });
            }
            for (auto& t : writers) {
                t.join();
            }
        }

        // The last save saw every record
        risk::EdgeStatsTracker reloaded(risk::EdgeStatsConfig{}, path);
        assert(reloaded.sampleCount(key("BTCUSDT", "SHORT", "1h")) == 1000);
        for (const auto& symbol : symbols) {
            if (reloaded.sampleCount(key(symbol, "LONG", "5m")) != 25) {
                std::cerr << "[TEST] " << symbol << " lost records across concurrent saves\n";
                return 1;
            }
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            assert(entry.path().filename() == "edge_stats.json");
        }
        std::filesystem::remove_all(dir, ec);
    }

    // A zero-size window is a configuration error
    {
        risk::EdgeStatsConfig bad;
        bad.max_window = 0;
        bool threw = false;
        try {
            risk::EdgeStatsTracker tracker(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] EdgeStatsTracker PASSED\n";
    return 0;
}
