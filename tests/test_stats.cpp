/**
 * VOXRELAY - Realtime Voice Gateway
 * Unit tests for service counters
 */

#include "util/stats.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using voxrelay::util::ConnectionGuard;
using voxrelay::util::Stats;

TEST(StatsTest, StartsAtZero) {
    Stats stats;
    auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.connections_active, 0u);
    EXPECT_EQ(snapshot.synthesis_requests, 0u);
    EXPECT_DOUBLE_EQ(snapshot.cache_hit_rate, 0.0);
    EXPECT_EQ(snapshot.breaker_state, "closed");
}

TEST(StatsTest, ConnectionGuardTracksLifetime) {
    Stats stats;
    {
        ConnectionGuard first(stats);
        ConnectionGuard second(stats);
        EXPECT_EQ(stats.snapshot().connections_active, 2u);
    }
    auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.connections_active, 0u);
    EXPECT_EQ(snapshot.connections_total, 2u);
}

TEST(StatsTest, HitRateFromCounters) {
    Stats stats;
    stats.cache_hit();
    stats.cache_miss();
    stats.cache_miss();
    stats.cache_miss();
    EXPECT_DOUBLE_EQ(stats.snapshot().cache_hit_rate, 0.25);
}

TEST(StatsTest, CountersAreThreadSafe) {
    Stats stats;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&stats] {
            for (int i = 0; i < 1000; ++i) {
                stats.synthesis_request();
                stats.request_failed();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.synthesis_requests, 4000u);
    EXPECT_EQ(snapshot.failed_requests, 4000u);
}

TEST(StatsTest, JsonLayout) {
    Stats stats;
    stats.transcription_request();
    stats.cache_write();

    auto snapshot = stats.snapshot();
    snapshot.breaker_state = "open";
    snapshot.breaker_failures = 5;
    auto j = snapshot.to_json();

    EXPECT_EQ(j["requests"]["transcription"], 1);
    EXPECT_EQ(j["cache"]["writes"], 1);
    EXPECT_EQ(j["circuit_breaker"]["state"], "open");
    EXPECT_EQ(j["circuit_breaker"]["failures"], 5);
    EXPECT_TRUE(j.contains("active_connections"));
    EXPECT_TRUE(j.contains("uptime_seconds"));
}
