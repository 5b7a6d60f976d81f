/**
 * VOXRELAY - Realtime Voice Gateway
 * Stats - Thread-safe counters for the health/stats surface
 *
 * Provides:
 * - Connection counters (active, total)
 * - Cache hit/miss/write counters
 * - Request counters per pipeline path
 * - Uptime
 *
 * All mutation is lock-free (relaxed atomics). One instance is created at
 * startup and shared by every session through the pipeline context.
 */

#ifndef VOXRELAY_UTIL_STATS_HPP
#define VOXRELAY_UTIL_STATS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace voxrelay::util {

/**
 * Point-in-time copy of all counters
 */
struct StatsSnapshot {
    std::uint64_t connections_active{0};
    std::uint64_t connections_total{0};

    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    std::uint64_t cache_writes{0};
    double cache_hit_rate{0.0};

    std::uint64_t synthesis_requests{0};
    std::uint64_t transcription_requests{0};
    std::uint64_t failed_requests{0};

    // Filled in from the circuit breaker by the dispatcher
    std::string breaker_state{"closed"};
    std::uint32_t breaker_failures{0};

    std::uint64_t uptime_seconds{0};

    nlohmann::json to_json() const;
};

class Stats {
public:
    Stats();

    // Non-copyable
    Stats(const Stats&) = delete;
    Stats& operator=(const Stats&) = delete;

    // Connection tracking
    void connection_opened();
    void connection_closed();

    // Cache tracking
    void cache_hit();
    void cache_miss();
    void cache_write();

    // Request tracking
    void synthesis_request();
    void transcription_request();
    void request_failed();

    StatsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    std::atomic<std::uint64_t> connections_active_{0};
    std::atomic<std::uint64_t> connections_total_{0};

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> cache_writes_{0};

    std::atomic<std::uint64_t> synthesis_requests_{0};
    std::atomic<std::uint64_t> transcription_requests_{0};
    std::atomic<std::uint64_t> failed_requests_{0};

    std::chrono::steady_clock::time_point start_time_;
};

/**
 * RAII registration of one client connection
 *
 * Decrements the active count however the session ends.
 */
class ConnectionGuard {
public:
    explicit ConnectionGuard(Stats& stats) : stats_(&stats) {
        stats_->connection_opened();
    }

    ~ConnectionGuard() {
        if (stats_) {
            stats_->connection_closed();
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    Stats* stats_;
};

} // namespace voxrelay::util

#endif // VOXRELAY_UTIL_STATS_HPP
