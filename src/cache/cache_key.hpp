/**
 * VOXRELAY - Realtime Voice Gateway
 * Cache Key - SHA-256 fingerprint of normalized synthesis text
 *
 * Text is normalized before hashing so that requests differing only in
 * case or whitespace share a cache entry:
 * - ASCII case-fold
 * - Leading/trailing whitespace trimmed
 * - Internal whitespace runs collapsed to a single space
 */

#ifndef VOXRELAY_CACHE_CACHE_KEY_HPP
#define VOXRELAY_CACHE_CACHE_KEY_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace voxrelay::cache {

/**
 * Cache key - 256-bit digest of normalized request text
 */
struct CacheKey {
    static constexpr std::size_t digest_size = 32;

    std::array<std::uint8_t, digest_size> digest{};

    bool operator==(const CacheKey& other) const = default;

    bool operator<(const CacheKey& other) const {
        return digest < other.digest;
    }

    /**
     * Convert to hex string for logging/debugging
     */
    std::string to_string() const;

    /**
     * Key under which the entry is stored in the backing store
     */
    std::string storage_key() const;
};

/**
 * Hash functor for use with std::unordered_map
 */
struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept;
};

/**
 * Normalize synthesis text (case-fold, trim, collapse whitespace)
 */
std::string normalize_text(std::string_view text);

/**
 * Generate a cache key from raw request text
 *
 * The text is normalized first, so "Hello  World" and " hello world"
 * produce the same key.
 *
 * @param text Synthesis request text
 * @return Cache key
 * @throws std::runtime_error if the digest cannot be computed
 */
CacheKey generate_cache_key(std::string_view text);

} // namespace voxrelay::cache

#endif // VOXRELAY_CACHE_CACHE_KEY_HPP
