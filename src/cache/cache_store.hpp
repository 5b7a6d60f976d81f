/**
 * VOXRELAY - Realtime Voice Gateway
 * Cache Store - Byte-keyed backing store interface
 *
 * The store owns expiry and eviction. Callers apply a TTL at write time and
 * never re-check timestamps themselves.
 */

#ifndef VOXRELAY_CACHE_CACHE_STORE_HPP
#define VOXRELAY_CACHE_CACHE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace voxrelay::cache {

/**
 * Store-side statistics
 */
struct StoreStats {
    std::uint64_t evictions{0};     // Entries removed under memory pressure
    std::uint64_t expired{0};       // Entries removed after TTL
    std::size_t entries{0};         // Current number of entries
    std::size_t size_bytes{0};      // Current payload size in bytes
    std::size_t max_size_bytes{0};  // Capacity in bytes
};

/**
 * Backing store for the audio cache
 *
 * Implementations throw pipeline::CacheStoreError when the store cannot be
 * reached; an absent or expired key is reported as std::nullopt.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void put(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;

    virtual bool remove(const std::string& key) = 0;

    virtual void clear() = 0;

    /**
     * Check that the store is reachable
     */
    virtual bool ping() = 0;

    virtual StoreStats stats() const = 0;
};

} // namespace voxrelay::cache

#endif // VOXRELAY_CACHE_CACHE_STORE_HPP
