/**
 * VOXRELAY - Realtime Voice Gateway
 * Audio Cache - Cache-aside layer for synthesized audio
 *
 * Maps a CacheKey to a finished (already post-processed) audio artifact.
 * Entries are immutable once written; concurrent writers for the same key
 * race benignly and the last write wins.
 *
 * Store failures never reach the caller: a failed read is a miss and a
 * failed write is dropped. Both are logged and counted as store errors.
 */

#ifndef VOXRELAY_CACHE_AUDIO_CACHE_HPP
#define VOXRELAY_CACHE_AUDIO_CACHE_HPP

#include "cache/cache_key.hpp"
#include "cache/cache_store.hpp"
#include "util/stats.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace voxrelay::cache {

/**
 * Cached synthesis result
 */
struct CacheEntry {
    CacheKey key;
    std::string audio;                                  // Post-processed audio bytes
    double duration{0.0};                               // Seconds, >= 0
    std::chrono::system_clock::time_point created_at;   // When the entry was written
    std::chrono::seconds ttl{0};                        // Lifetime applied at write time
};

/**
 * Cache statistics for the stats surface
 */
struct AudioCacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t writes{0};
    std::uint64_t store_errors{0};
    StoreStats store;

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }

    // Share of synthesis lookups that did not reach the backend
    double reduction_percentage() const {
        return hit_rate() * 100.0;
    }
};

struct AudioCacheConfig {
    bool enabled{true};
    std::chrono::seconds ttl{3600};  // 1 hour TTL default
};

class AudioCache {
public:
    AudioCache(std::shared_ptr<CacheStore> store, util::Stats& stats,
               const AudioCacheConfig& config = {});

    // Non-copyable
    AudioCache(const AudioCache&) = delete;
    AudioCache& operator=(const AudioCache&) = delete;

    /**
     * Look up a cached entry
     *
     * Never throws on a miss or a store failure.
     */
    std::optional<CacheEntry> get(const CacheKey& key);

    /**
     * Store an entry with an explicit TTL
     */
    void put(const CacheKey& key, const CacheEntry& entry, std::chrono::seconds ttl);

    /**
     * Store an entry with the deployment TTL
     */
    void put(const CacheKey& key, const CacheEntry& entry);

    bool remove(const CacheKey& key);

    void clear();

    /**
     * Ping the backing store
     */
    bool reachable() const;

    AudioCacheStats stats() const;

    bool is_enabled() const noexcept { return config_.enabled; }

    std::chrono::seconds ttl() const noexcept { return config_.ttl; }

private:
    static std::string encode(const CacheEntry& entry);
    static CacheEntry decode(const CacheKey& key, const std::string& bytes);

    std::shared_ptr<CacheStore> store_;
    util::Stats& stats_;
    AudioCacheConfig config_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> writes_{0};
    std::atomic<std::uint64_t> store_errors_{0};
};

} // namespace voxrelay::cache

#endif // VOXRELAY_CACHE_AUDIO_CACHE_HPP
