/**
 * VOXRELAY - Realtime Voice Gateway
 * Audio Cache Implementation
 */

#include "cache/audio_cache.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <vector>

namespace voxrelay::cache {

using util::log_component::Cache;

AudioCache::AudioCache(std::shared_ptr<CacheStore> store, util::Stats& stats,
                       const AudioCacheConfig& config)
    : store_(std::move(store))
    , stats_(stats)
    , config_(config)
{
    VOXRELAY_LOG_DEBUG(Cache, "Audio cache initialized: enabled={}, ttl={}s",
                       config_.enabled, config_.ttl.count());
}

std::optional<CacheEntry> AudioCache::get(const CacheKey& key) {
    if (!config_.enabled) {
        return std::nullopt;
    }

    std::optional<std::string> bytes;
    try {
        bytes = store_->get(key.storage_key());
    } catch (const std::exception& e) {
        // Fail open: an unreachable store is reported as a miss
        ++store_errors_;
        ++misses_;
        stats_.cache_miss();
        VOXRELAY_LOG_WARN(Cache, "Store read failed, treating as miss: key={}, error={}",
                          key.to_string(), e.what());
        return std::nullopt;
    }

    if (!bytes) {
        ++misses_;
        stats_.cache_miss();
        VOXRELAY_LOG_DEBUG(Cache, "MISS: key={}", key.to_string());
        return std::nullopt;
    }

    try {
        auto entry = decode(key, *bytes);
        ++hits_;
        stats_.cache_hit();
        VOXRELAY_LOG_DEBUG(Cache, "HIT: key={}, size={}", key.to_string(), entry.audio.size());
        return entry;
    } catch (const nlohmann::json::exception& e) {
        ++store_errors_;
        ++misses_;
        stats_.cache_miss();
        VOXRELAY_LOG_WARN(Cache, "Discarding undecodable entry: key={}, error={}",
                          key.to_string(), e.what());
        try {
            store_->remove(key.storage_key());
        } catch (const std::exception& remove_error) {
            VOXRELAY_LOG_WARN(Cache, "Failed to remove undecodable entry: {}", remove_error.what());
        }
        return std::nullopt;
    }
}

void AudioCache::put(const CacheKey& key, const CacheEntry& entry, std::chrono::seconds ttl) {
    if (!config_.enabled) {
        return;
    }

    ++writes_;
    stats_.cache_write();

    CacheEntry stored = entry;
    stored.key = key;
    stored.ttl = ttl;

    try {
        store_->put(key.storage_key(), encode(stored), ttl);
        VOXRELAY_LOG_DEBUG(Cache, "SET: key={}, size={}, ttl={}s",
                           key.to_string(), stored.audio.size(), ttl.count());
    } catch (const std::exception& e) {
        ++store_errors_;
        VOXRELAY_LOG_WARN(Cache, "Store write failed, entry dropped: key={}, error={}",
                          key.to_string(), e.what());
    }
}

void AudioCache::put(const CacheKey& key, const CacheEntry& entry) {
    put(key, entry, config_.ttl);
}

bool AudioCache::remove(const CacheKey& key) {
    try {
        return store_->remove(key.storage_key());
    } catch (const std::exception& e) {
        ++store_errors_;
        VOXRELAY_LOG_WARN(Cache, "Store remove failed: key={}, error={}", key.to_string(), e.what());
        return false;
    }
}

void AudioCache::clear() {
    try {
        store_->clear();
        VOXRELAY_LOG_INFO(Cache, "Audio cache cleared");
    } catch (const std::exception& e) {
        ++store_errors_;
        VOXRELAY_LOG_WARN(Cache, "Store clear failed: {}", e.what());
    }
}

bool AudioCache::reachable() const {
    try {
        return store_->ping();
    } catch (const std::exception& e) {
        VOXRELAY_LOG_WARN(Cache, "Store ping failed: {}", e.what());
        return false;
    }
}

AudioCacheStats AudioCache::stats() const {
    AudioCacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.writes = writes_.load();
    stats.store_errors = store_errors_.load();
    try {
        stats.store = store_->stats();
    } catch (const std::exception& e) {
        VOXRELAY_LOG_WARN(Cache, "Store stats unavailable: {}", e.what());
    }
    return stats;
}

std::string AudioCache::encode(const CacheEntry& entry) {
    auto created_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.created_at.time_since_epoch()).count();

    nlohmann::json j = {
        {"audio", nlohmann::json::binary(std::vector<std::uint8_t>(entry.audio.begin(), entry.audio.end()))},
        {"duration", entry.duration},
        {"created_at_ms", created_ms},
        {"ttl", entry.ttl.count()}
    };

    auto packed = nlohmann::json::to_msgpack(j);
    return std::string(packed.begin(), packed.end());
}

CacheEntry AudioCache::decode(const CacheKey& key, const std::string& bytes) {
    auto j = nlohmann::json::from_msgpack(bytes);

    const auto& audio = j.at("audio").get_binary();

    CacheEntry entry;
    entry.key = key;
    entry.audio.assign(audio.begin(), audio.end());
    entry.duration = j.at("duration").get<double>();
    entry.created_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.at("created_at_ms").get<std::int64_t>()));
    entry.ttl = std::chrono::seconds(j.at("ttl").get<std::int64_t>());
    return entry;
}

} // namespace voxrelay::cache
