/**
 * VOXRELAY - Realtime Voice Gateway
 * Cache Key Implementation - SHA-256 fingerprinting
 */

#include "cache/cache_key.hpp"

#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/generator.hpp>
#include <openssl/evp.h>
#include <xxhash.h>

#include <cctype>
#include <iomanip>
#include <locale>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace voxrelay::cache {

namespace {

constexpr std::string_view storage_prefix = "tts:audio:";

// ICU-backed, so folding does not depend on the process locale
const std::locale& folding_locale() {
    static const std::locale locale = boost::locale::generator{}("en_US.UTF-8");
    return locale;
}

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string CacheKey::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : digest) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::string CacheKey::storage_key() const {
    std::string key(storage_prefix);
    key += to_string();
    return key;
}

std::size_t CacheKeyHash::operator()(const CacheKey& key) const noexcept {
    return static_cast<std::size_t>(XXH64(key.digest.data(), key.digest.size(), 0));
}

std::string normalize_text(std::string_view text) {
    std::string normalized;
    normalized.reserve(text.size());

    bool pending_space = false;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            // Only emit a separator once we know more text follows
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized.push_back(' ');
            pending_space = false;
        }
        normalized.push_back(static_cast<char>(std::tolower(uc)));
    }

    try {
        return boost::locale::fold_case(normalized, folding_locale());
    } catch (const boost::locale::conv::conversion_error&) {
        // Not valid UTF-8; the ASCII fold above is all we can do
        return normalized;
    }
}

CacheKey generate_cache_key(std::string_view text) {
    auto normalized = normalize_text(text);

    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    CacheKey key;
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), normalized.data(), normalized.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), key.digest.data(), &length) != 1 ||
        length != CacheKey::digest_size) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return key;
}

} // namespace voxrelay::cache
