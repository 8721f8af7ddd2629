/// @file response_cache_test.cpp
/// @brief Unit tests for ResponseCache and cacheKey.

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "lra/foundation/agent_logger.hpp"
#include "lra/resilience/cache_key.hpp"
#include "lra/resilience/response_cache.hpp"

#include "mocks/mock_logger.hpp"

using namespace lra::resilience;
using lra::foundation::AgentLogger;
using lra::foundation::LogCategory;
using lra::foundation::LogLevel;
using namespace std::chrono_literals;

// ===========================================================================
// cacheKey
// ===========================================================================

TEST(CacheKeyTest, IsLowercaseHexSha256) {
    // SHA-256("abc")
    EXPECT_EQ(cacheKey("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CacheKeyTest, DeterministicAndFixedLength) {
    std::string longPrompt(100000, 'x');
    auto a = cacheKey(longPrompt);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a, cacheKey(longPrompt));
    EXPECT_NE(a, cacheKey("different prompt"));
    EXPECT_EQ(cacheKey("").size(), 64u);
}

// ===========================================================================
// ResponseCache
// ===========================================================================

class ResponseCacheTest : public lra::test::MockLoggerTest {
protected:
    void SetUp() override {
        MockLoggerTest::SetUp();
        AgentLogger::instance().setCategoryLevel(LogCategory::Cache, LogLevel::Debug);
    }

    void TearDown() override {
        AgentLogger::instance().setCategoryLevel(LogCategory::Cache, LogLevel::Info);
        MockLoggerTest::TearDown();
    }
};

TEST_F(ResponseCacheTest, SetThenGet) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 0ms});
    cache.set("prompt", "reply");

    auto hit = cache.get("prompt");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "reply");
    EXPECT_FALSE(cache.get("other").has_value());
}

TEST_F(ResponseCacheTest, EvictsLeastRecentlyUsed) {
    ResponseCache<std::string> cache({.maxEntries = 2, .ttl = 0ms});
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("c", "3");

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_TRUE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
    EXPECT_EQ(cache.stats().evictions, 1u);
    EXPECT_TRUE(mockLogger_->contains("cache_eviction"));
}

TEST_F(ResponseCacheTest, GetPromotesEntry) {
    ResponseCache<std::string> cache({.maxEntries = 2, .ttl = 0ms});
    cache.set("a", "1");
    cache.set("b", "2");
    ASSERT_TRUE(cache.get("a").has_value());

    cache.set("c", "3");

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
}

TEST_F(ResponseCacheTest, OverwriteDoesNotEvictAndResetsHits) {
    ResponseCache<std::string> cache({.maxEntries = 2, .ttl = 0ms});
    cache.set("a", "1");
    cache.set("b", "2");
    ASSERT_TRUE(cache.get("a").has_value());
    ASSERT_TRUE(cache.get("a").has_value());
    EXPECT_EQ(cache.entryHits("a"), 2u);

    cache.set("a", "updated");

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.stats().evictions, 0u);
    EXPECT_EQ(cache.entryHits("a"), 0u);
    EXPECT_EQ(cache.get("a").value(), "updated");
}

TEST_F(ResponseCacheTest, EntryExpiresAfterTtl) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 100ms});
    cache.set("prompt", "reply");

    std::this_thread::sleep_for(30ms);
    EXPECT_TRUE(cache.get("prompt").has_value());

    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(cache.get("prompt").has_value());
    EXPECT_EQ(cache.size(), 0u);

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST_F(ResponseCacheTest, ZeroTtlNeverExpires) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 0ms});
    cache.set("prompt", "reply");
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(cache.get("prompt").has_value());
    EXPECT_EQ(cache.cleanupExpired(), 0u);
}

TEST_F(ResponseCacheTest, CleanupExpiredRemovesOnlyStaleEntries) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 80ms});
    cache.set("old-1", "x");
    cache.set("old-2", "y");
    std::this_thread::sleep_for(120ms);
    cache.set("fresh", "z");

    EXPECT_EQ(cache.cleanupExpired(), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("fresh"));
}

TEST_F(ResponseCacheTest, ContainsDoesNotTouchStats) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 0ms});
    cache.set("a", "1");
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_FALSE(cache.entryHits("b").has_value());
}

TEST_F(ResponseCacheTest, DisabledCacheIsInert) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 0ms, .enabled = false});
    cache.set("a", "1");
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().misses, 0u);

    cache.setEnabled(true);
    cache.set("a", "1");
    EXPECT_TRUE(cache.get("a").has_value());
}

TEST_F(ResponseCacheTest, InvalidateAndClear) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 0ms});
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("c", "3");

    EXPECT_TRUE(cache.invalidate("a"));
    EXPECT_FALSE(cache.invalidate("a"));
    EXPECT_EQ(cache.size(), 2u);

    EXPECT_EQ(cache.clear(), 2u);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_TRUE(mockLogger_->contains("entries_cleared=2"));
}

TEST_F(ResponseCacheTest, ConfigIsClamped) {
    ResponseCache<int> cache({.maxEntries = 0, .ttl = -5ms});
    EXPECT_EQ(cache.config().maxEntries, 1u);
    EXPECT_EQ(cache.config().ttl, 0ms);

    cache.set("a", 1);
    cache.set("b", 2);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("b"), 2);
}

TEST_F(ResponseCacheTest, StatsHitRate) {
    ResponseCache<std::string> cache({.maxEntries = 4, .ttl = 0ms});
    cache.set("a", "1");
    (void)cache.get("a");
    (void)cache.get("a");
    (void)cache.get("a");
    (void)cache.get("missing");

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 3u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.maxEntries, 4u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 75.0);
    EXPECT_NE(toString(stats).find("hit_rate=75.0%"), std::string::npos);

    cache.resetStats();
    EXPECT_EQ(cache.stats().hits, 0u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResponseCacheTest, ConcurrentLongPromptsStayConsistent) {
    constexpr int kThreads = 4;
    constexpr int kPromptsPerThread = 25;
    ResponseCache<std::string> cache({.maxEntries = kThreads * kPromptsPerThread, .ttl = 0ms});

    auto promptFor = [](int t, int i) {
        return std::string(64 * 1024, static_cast<char>('a' + t)) + std::to_string(i);
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPromptsPerThread; ++i) {
                auto prompt = promptFor(t, i);
                cache.set(prompt, std::to_string(t) + ":" + std::to_string(i));
                EXPECT_TRUE(cache.get(prompt).has_value());
            }
        });
    }
    for (auto& t : threads) { t.join(); }

    EXPECT_EQ(cache.size(), static_cast<std::size_t>(kThreads * kPromptsPerThread));
    EXPECT_EQ(cache.stats().hits, static_cast<uint64_t>(kThreads * kPromptsPerThread));
    EXPECT_EQ(cache.get(promptFor(2, 7)), "2:7");
    EXPECT_TRUE(cache.invalidate(promptFor(3, 0)));
    EXPECT_FALSE(cache.contains(promptFor(3, 0)));
}
