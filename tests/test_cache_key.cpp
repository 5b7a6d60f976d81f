/**
 * VOXRELAY - Realtime Voice Gateway
 * Unit tests for cache key generation and text normalization
 */

#include "cache/cache_key.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace voxrelay::cache;

// ============================================================
// normalize_text
// ============================================================

TEST(NormalizeTextTest, LowercasesAndTrims) {
    EXPECT_EQ(normalize_text("  Hello World  "), "hello world");
}

TEST(NormalizeTextTest, CollapsesInternalWhitespace) {
    EXPECT_EQ(normalize_text("Hello \t\n  World"), "hello world");
}

TEST(NormalizeTextTest, WhitespaceOnlyBecomesEmpty) {
    EXPECT_EQ(normalize_text(" \t\n "), "");
}

TEST(NormalizeTextTest, PunctuationIsPreserved) {
    EXPECT_EQ(normalize_text("Hello, World!"), "hello, world!");
}

TEST(NormalizeTextTest, FoldsNonAsciiCase) {
    EXPECT_EQ(normalize_text("\xC3\x89T\xC3\x89"), "\xC3\xA9t\xC3\xA9");   // ÉTÉ -> été
    EXPECT_EQ(normalize_text("\xD0\x9F\xD0\xA0\xD0\x98\xD0\x92\xD0\x95\xD0\xA2"),
              "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82");  // ПРИВЕТ -> привет
}

// ============================================================
// generate_cache_key
// ============================================================

TEST(CacheKeyTest, SameTextSameKey) {
    EXPECT_EQ(generate_cache_key("Hello world"), generate_cache_key("Hello world"));
}

TEST(CacheKeyTest, NormalizationEquivalentTextSameKey) {
    EXPECT_EQ(generate_cache_key("Hello  World"), generate_cache_key(" hello world "));
}

TEST(CacheKeyTest, NonAsciiCaseVariantsShareKey) {
    EXPECT_EQ(generate_cache_key("\xC3\x89t\xC3\xA9 ARRIV\xC3\x89"),
              generate_cache_key("  \xC3\xA9t\xC3\xA9 arriv\xC3\xA9 "));
}

TEST(CacheKeyTest, DifferentTextDifferentKey) {
    EXPECT_NE(generate_cache_key("Hello world"), generate_cache_key("Goodbye world"));
}

TEST(CacheKeyTest, KnownDigestOfNormalizedText) {
    // SHA-256("hello world")
    auto key = generate_cache_key("  HELLO   World ");
    EXPECT_EQ(key.to_string(),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(CacheKeyTest, HexStringIs64Characters) {
    auto key = generate_cache_key("anything");
    EXPECT_EQ(key.to_string().size(), 64u);
}

TEST(CacheKeyTest, StorageKeyCarriesNamespacePrefix) {
    auto key = generate_cache_key("hello world");
    EXPECT_EQ(key.storage_key(), "tts:audio:" + key.to_string());
}

TEST(CacheKeyTest, HashUsableInUnorderedContainers) {
    std::unordered_set<CacheKey, CacheKeyHash> keys;
    keys.insert(generate_cache_key("one"));
    keys.insert(generate_cache_key("ONE"));
    keys.insert(generate_cache_key("two"));

    EXPECT_EQ(keys.size(), 2u);
    EXPECT_EQ(CacheKeyHash{}(generate_cache_key("one")), CacheKeyHash{}(generate_cache_key(" one")));
}
