/**
 * VOXRELAY - Realtime Voice Gateway
 * LRU Store Implementation
 */

#include "cache/lru_cache.hpp"

#include <spdlog/spdlog.h>

namespace voxrelay::cache {

LruCache::LruCache(const LruCacheConfig& config, const util::Clock& clock)
    : config_(config)
    , clock_(clock) {
    spdlog::debug("LRU store initialized: max_size={}MB",
                  config_.max_size_bytes / (1024 * 1024));
}

std::optional<std::string> LruCache::get(const std::string& key) {
    // Exclusive lock: a hit reorders the LRU list, an expired hit removes the node
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = store_map_.find(key);
    if (it == store_map_.end()) {
        return std::nullopt;
    }

    if (is_expired(*it->second)) {
        spdlog::debug("Store entry expired: key={}", key);
        erase_node(it);
        ++expired_;
        return std::nullopt;
    }

    touch_node(it->second);
    return it->second->value;
}

void LruCache::put(const std::string& key, std::string value, std::chrono::seconds ttl) {
    std::size_t entry_size = value.size();

    // Don't store entries larger than the whole store
    if (entry_size > config_.max_size_bytes) {
        spdlog::debug("Store entry too large: {} bytes > {} max",
                      entry_size, config_.max_size_bytes);
        return;
    }

    auto expires_at = clock_.now() + ttl;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = store_map_.find(key);
    if (it != store_map_.end()) {
        // Last writer wins
        std::size_t old_size = it->second->value.size();
        it->second->value = std::move(value);
        it->second->expires_at = expires_at;

        current_size_bytes_ = current_size_bytes_ - old_size + entry_size;
        touch_node(it->second);

        spdlog::debug("Store entry replaced: key={}, size={}", key, entry_size);
    } else {
        lru_list_.push_front(Node{key, std::move(value), expires_at});
        store_map_[key] = lru_list_.begin();

        current_size_bytes_ += entry_size;

        spdlog::debug("Store entry added: key={}, size={}, total_size={}",
                      key, entry_size, current_size_bytes_.load());
    }

    evict_if_needed();
}

bool LruCache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = store_map_.find(key);
    if (it == store_map_.end()) {
        return false;
    }

    erase_node(it);
    spdlog::debug("Store entry removed: key={}", key);
    return true;
}

void LruCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = store_map_.size();
    store_map_.clear();
    lru_list_.clear();
    current_size_bytes_ = 0;

    spdlog::info("Store cleared: {} entries removed", count);
}

StoreStats LruCache::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    StoreStats stats;
    stats.evictions = evictions_.load();
    stats.expired = expired_.load();
    stats.entries = store_map_.size();
    stats.size_bytes = current_size_bytes_.load();
    stats.max_size_bytes = config_.max_size_bytes;

    return stats;
}

void LruCache::touch_node(typename LruList::iterator it) {
    if (it != lru_list_.begin()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it);
    }
}

void LruCache::evict_if_needed() {
    // Evict from back (least recently used) until under size limit
    while (current_size_bytes_ > config_.max_size_bytes && !lru_list_.empty()) {
        auto& lru_node = lru_list_.back();

        spdlog::debug("Evicting store entry: key={}, size={}",
                      lru_node.key, lru_node.value.size());

        current_size_bytes_ -= lru_node.value.size();
        store_map_.erase(lru_node.key);
        lru_list_.pop_back();

        ++evictions_;
    }
}

void LruCache::erase_node(typename StoreMap::iterator it) {
    current_size_bytes_ -= it->second->value.size();
    lru_list_.erase(it->second);
    store_map_.erase(it);
}

bool LruCache::is_expired(const Node& node) const {
    return clock_.now() >= node.expires_at;
}

} // namespace voxrelay::cache
