/**
 * VOXRELAY - Realtime Voice Gateway
 * Stats Implementation
 */

#include "util/stats.hpp"

namespace voxrelay::util {

Stats::Stats()
    : start_time_(std::chrono::steady_clock::now())
{
}

void Stats::connection_opened() {
    connections_active_.fetch_add(1, std::memory_order_relaxed);
    connections_total_.fetch_add(1, std::memory_order_relaxed);
}

void Stats::connection_closed() {
    connections_active_.fetch_sub(1, std::memory_order_relaxed);
}

void Stats::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Stats::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Stats::cache_write() {
    cache_writes_.fetch_add(1, std::memory_order_relaxed);
}

void Stats::synthesis_request() {
    synthesis_requests_.fetch_add(1, std::memory_order_relaxed);
}

void Stats::transcription_request() {
    transcription_requests_.fetch_add(1, std::memory_order_relaxed);
}

void Stats::request_failed() {
    failed_requests_.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t Stats::uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

StatsSnapshot Stats::snapshot() const {
    StatsSnapshot snap;

    snap.connections_active = connections_active_.load(std::memory_order_relaxed);
    snap.connections_total = connections_total_.load(std::memory_order_relaxed);

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    snap.cache_writes = cache_writes_.load(std::memory_order_relaxed);
    auto cache_total = snap.cache_hits + snap.cache_misses;
    snap.cache_hit_rate = cache_total > 0
        ? static_cast<double>(snap.cache_hits) / cache_total
        : 0.0;

    snap.synthesis_requests = synthesis_requests_.load(std::memory_order_relaxed);
    snap.transcription_requests = transcription_requests_.load(std::memory_order_relaxed);
    snap.failed_requests = failed_requests_.load(std::memory_order_relaxed);

    snap.uptime_seconds = uptime_seconds();

    return snap;
}

nlohmann::json StatsSnapshot::to_json() const {
    return nlohmann::json{
        {"active_connections", connections_active},
        {"total_connections", connections_total},
        {"cache", {
            {"hits", cache_hits},
            {"misses", cache_misses},
            {"writes", cache_writes},
            {"hit_rate", cache_hit_rate}
        }},
        {"requests", {
            {"synthesis", synthesis_requests},
            {"transcription", transcription_requests},
            {"failed", failed_requests}
        }},
        {"circuit_breaker", {
            {"state", breaker_state},
            {"failures", breaker_failures}
        }},
        {"uptime_seconds", uptime_seconds}
    };
}

} // namespace voxrelay::util
