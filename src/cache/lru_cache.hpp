/**
 * VOXRELAY - Realtime Voice Gateway
 * Thread-Safe LRU Store - In-process backing store for synthesized audio
 *
 * Features:
 * - Thread-safe with std::shared_mutex
 * - LRU eviction when the store exceeds its configured size
 * - Per-entry TTL fixed at write time, enforced on access
 * - Store statistics for monitoring
 */

#ifndef VOXRELAY_CACHE_LRU_CACHE_HPP
#define VOXRELAY_CACHE_LRU_CACHE_HPP

#include "cache/cache_store.hpp"
#include "util/clock.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace voxrelay::cache {

/**
 * LRU store configuration
 */
struct LruCacheConfig {
    std::size_t max_size_bytes{512 * 1024 * 1024};  // 512 MB default
};

/**
 * Thread-safe LRU store keyed by byte strings
 *
 * Implementation:
 * - Hash map for O(1) lookup by key
 * - Doubly-linked list for LRU ordering
 * - Size-based eviction when max_size_bytes exceeded
 * - TTL-based expiration checked on access
 */
class LruCache final : public CacheStore {
public:
    explicit LruCache(const LruCacheConfig& config, const util::Clock& clock = util::steady_clock());
    ~LruCache() override = default;

    // Non-copyable, non-movable
    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;
    LruCache(LruCache&&) = delete;
    LruCache& operator=(LruCache&&) = delete;

    /**
     * Get a stored value by key
     *
     * @return Value if found and not expired, nullopt otherwise
     */
    std::optional<std::string> get(const std::string& key) override;

    /**
     * Store a value, replacing any previous value for the key
     *
     * @param ttl Lifetime of the entry, measured from now
     */
    void put(const std::string& key, std::string value, std::chrono::seconds ttl) override;

    bool remove(const std::string& key) override;

    void clear() override;

    /**
     * In-process store is always reachable
     */
    bool ping() override { return true; }

    StoreStats stats() const override;

private:
    struct Node {
        std::string key;
        std::string value;
        util::Clock::time_point expires_at;
    };

    using LruList = std::list<Node>;
    using StoreMap = std::unordered_map<std::string, typename LruList::iterator>;

    /**
     * Move node to front of LRU list (most recently used)
     * Must be called with exclusive lock held
     */
    void touch_node(typename LruList::iterator it);

    /**
     * Evict entries until store size is below max
     * Must be called with exclusive lock held
     */
    void evict_if_needed();

    /**
     * Remove a node; must be called with exclusive lock held
     */
    void erase_node(typename StoreMap::iterator it);

    bool is_expired(const Node& node) const;

    mutable std::shared_mutex mutex_;
    LruCacheConfig config_;
    const util::Clock& clock_;

    LruList lru_list_;  // Front = most recently used, back = least recently used
    StoreMap store_map_;

    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expired_{0};
    std::atomic<std::size_t> current_size_bytes_{0};
};

} // namespace voxrelay::cache

#endif // VOXRELAY_CACHE_LRU_CACHE_HPP
