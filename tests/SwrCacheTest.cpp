#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "Core/SwrCache.h"
#include "support/TestSupport.h"

using namespace std::chrono_literals;
using nlohmann::json;
using testing_support::ManualClock;
using testing_support::TempDir;

namespace {
    SwrCacheSettings manualSettings() {
        SwrCacheSettings settings;
        settings.refresh_mode = SwrCacheSettings::RefreshMode::Manual;
        return settings;
    }

    CacheKey key(const std::string& id, CacheCategory category = CacheCategory::Default) {
        return CacheKey{.category = category, .id = id};
    }

    class SwrCacheTest : public ::testing::Test {
      protected:
        SwrCache::Fetcher counting(json value) {
            return [this, value] {
                ++fetches;
                return value;
            };
        }

        ManualClock clock;
        int fetches = 0;
    };
}

TEST_F(SwrCacheTest, MissFetchesOnceThenServesFromMemory) {
    SwrCache cache(manualSettings(), clock.wallNow());
    EXPECT_EQ(cache.getJson(key("a"), counting("first")), "first");
    EXPECT_EQ(cache.getJson(key("a"), counting("second")), "first");
    EXPECT_EQ(fetches, 1);

    auto stats = cache.stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.entries, 1u);
}

TEST_F(SwrCacheTest, TypedAccessRoundTripsThroughJson) {
    SwrCache cache(manualSettings(), clock.wallNow());
    int value = cache.get<int>(key("n"), std::function<int()>([] { return 42; }));
    EXPECT_EQ(value, 42);
    EXPECT_EQ(cache.peek<int>(key("n")), 42);
    EXPECT_FALSE(cache.peek<int>(key("missing")).has_value());
}

TEST_F(SwrCacheTest, HitPastEightyPercentOfLifetimeSchedulesOneRefresh) {
    SwrCache cache(manualSettings(), clock.wallNow());
    cache.getJson(key("feed"), counting("v1"), 5min);

    clock.advance(4min);
    EXPECT_EQ(cache.getJson(key("feed"), counting("v2"), 5min), "v1");
    EXPECT_EQ(cache.pendingRefreshCount(), 0u);

    clock.advance(48s);
    EXPECT_EQ(cache.getJson(key("feed"), counting("v2"), 5min), "v1");
    EXPECT_EQ(cache.getJson(key("feed"), counting("v2"), 5min), "v1");
    EXPECT_EQ(cache.pendingRefreshCount(), 1u);
    EXPECT_EQ(fetches, 1);

    EXPECT_EQ(cache.runPending(), 1u);
    EXPECT_EQ(fetches, 2);
    EXPECT_EQ(cache.peekJson(key("feed")), json("v2"));
    EXPECT_EQ(cache.stats().background_refreshes, 1u);
}

TEST_F(SwrCacheTest, ExpiredEntryIsServedStaleWhileRevalidating) {
    SwrCache cache(manualSettings(), clock.wallNow());
    cache.getJson(key("feed"), counting("old"), 1min);
    clock.advance(2min);

    EXPECT_FALSE(cache.peekJson(key("feed")).has_value());
    EXPECT_EQ(cache.peekJson(key("feed"), true), json("old"));
    EXPECT_EQ(cache.getJson(key("feed"), counting("new"), 1min), "old");
    EXPECT_EQ(cache.stats().stale_served, 1u);

    cache.runPending();
    EXPECT_EQ(cache.getJson(key("feed"), counting("newer"), 1min), "new");
}

TEST_F(SwrCacheTest, CategoryWithoutStaleServingFetchesSynchronously) {
    auto settings = manualSettings();
    settings.categories[CacheCategory::Profile].stale_while_revalidate = false;
    SwrCache cache(settings, clock.wallNow());

    cache.getJson(key("me", CacheCategory::Profile), counting("v1"));
    clock.advance(25h);
    EXPECT_EQ(cache.getJson(key("me", CacheCategory::Profile), counting("v2")), "v2");
    EXPECT_EQ(cache.pendingRefreshCount(), 0u);
}

TEST_F(SwrCacheTest, EmptyResultsAreNeverCached) {
    SwrCache cache(manualSettings(), clock.wallNow());

    json empty_page = {{"items", json::array()}};
    EXPECT_EQ(cache.getJson(key("p0", CacheCategory::MediaList), counting(empty_page)), empty_page);
    EXPECT_FALSE(cache.peekJson(key("p0", CacheCategory::MediaList)).has_value());

    cache.getJson(key("list"), counting(json::array()));
    EXPECT_FALSE(cache.peekJson(key("list")).has_value());
    EXPECT_EQ(cache.stats().entries, 0u);

    EXPECT_TRUE(cache.isEmptyPayload(CacheCategory::AdList, {{"ads", json::array()}}));
    EXPECT_FALSE(cache.isEmptyPayload(CacheCategory::Default, {{"items", json::array()}}));
}

TEST_F(SwrCacheTest, EmptyRefreshKeepsExistingEntry) {
    SwrCache cache(manualSettings(), clock.wallNow());
    json page = {{"items", json::array({1, 2})}};
    cache.getJson(key("p0", CacheCategory::MediaList), counting(page), 10min);

    clock.advance(9min);
    cache.getJson(key("p0", CacheCategory::MediaList), counting({{"items", json::array()}}), 10min);
    cache.runPending();
    EXPECT_EQ(cache.peekJson(key("p0", CacheCategory::MediaList)), page);
}

TEST_F(SwrCacheTest, FailedFetchFallsBackToCachedCopy) {
    SwrCache cache(manualSettings(), clock.wallNow());
    cache.getJson(key("a"), counting("cached"));

    auto failing = []() -> json { throw std::runtime_error("service down"); };
    EXPECT_EQ(cache.getJson(key("a"), failing, std::nullopt, true), "cached");
    EXPECT_THROW(cache.getJson(key("b"), failing), std::runtime_error);
}

TEST_F(SwrCacheTest, FailedBackgroundRefreshIsCounted) {
    SwrCache cache(manualSettings(), clock.wallNow());
    cache.getJson(key("a"), counting("v1"), 1min);
    clock.advance(55s);

    cache.getJson(key("a"), []() -> json { throw std::runtime_error("boom"); }, 1min);
    cache.runPending();
    EXPECT_EQ(cache.stats().refresh_failures, 1u);
    EXPECT_EQ(cache.peekJson(key("a")), json("v1"));
}

TEST_F(SwrCacheTest, FullCategoryEvictsColdestThirtyPercent) {
    auto settings = manualSettings();
    settings.categories[CacheCategory::Default].capacity = 10;
    SwrCache cache(settings, clock.wallNow());

    for (int i = 0; i < 10; ++i) {
        cache.getJson(key(std::to_string(i)), counting(i));
    }
    for (int i = 3; i < 10; ++i) {
        cache.getJson(key(std::to_string(i)), counting(-1));
    }

    cache.getJson(key("10"), counting(10));
    auto stats = cache.stats();
    EXPECT_EQ(stats.evictions, 3u);
    EXPECT_EQ(stats.entries, 8u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(cache.peekJson(key(std::to_string(i))).has_value()) << i;
    }
    for (int i = 3; i <= 10; ++i) {
        EXPECT_TRUE(cache.peekJson(key(std::to_string(i))).has_value()) << i;
    }
}

TEST_F(SwrCacheTest, EvictionOnlyTouchesTheFullCategory) {
    auto settings = manualSettings();
    settings.categories[CacheCategory::Default].capacity = 2;
    SwrCache cache(settings, clock.wallNow());

    cache.getJson(key("m", CacheCategory::MediaMetadata), counting("meta"));
    cache.getJson(key("a"), counting(1));
    cache.getJson(key("b"), counting(2));
    cache.getJson(key("c"), counting(3));

    EXPECT_TRUE(cache.peekJson(key("m", CacheCategory::MediaMetadata)).has_value());
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(SwrCacheTest, DurableTierSurvivesRestart) {
    TempDir dir;
    auto settings = manualSettings();
    settings.durable_dir = dir.path();
    {
        SwrCache cache(settings, clock.wallNow());
        cache.getJson(key("feed:page:0", CacheCategory::MediaList), counting({{"items", json::array({"x"})}}));
    }

    SwrCache restarted(settings, clock.wallNow());
    auto failing = []() -> json { throw std::runtime_error("offline"); };
    auto restored = restarted.getJson(key("feed:page:0", CacheCategory::MediaList), failing);
    EXPECT_EQ(restored, (json{{"items", json::array({"x"})}}));
    EXPECT_EQ(fetches, 1);
    EXPECT_EQ(restarted.stats().hits, 1u);
}

TEST_F(SwrCacheTest, InvalidateByPrefixRemovesMemoryAndDurableRecords) {
    TempDir dir;
    auto settings = manualSettings();
    settings.durable_dir = dir.path();
    SwrCache cache(settings, clock.wallNow());

    cache.getJson(key("feed:page:0", CacheCategory::MediaList), counting({{"items", json::array({1})}}));
    cache.getJson(key("feed:page:1", CacheCategory::MediaList), counting({{"items", json::array({2})}}));
    cache.getJson(key("other", CacheCategory::MediaList), counting({{"items", json::array({3})}}));

    EXPECT_EQ(cache.invalidate(CacheCategory::MediaList, "feed:"), 2u);
    EXPECT_TRUE(cache.peekJson(key("other", CacheCategory::MediaList)).has_value());

    // Nothing durable is left to restore either.
    cache.getJson(key("feed:page:0", CacheCategory::MediaList), counting({{"items", json::array({9})}}));
    EXPECT_EQ(fetches, 4);
}

TEST_F(SwrCacheTest, SweepDropsExpiredEntries) {
    SwrCache cache(manualSettings(), clock.wallNow());
    cache.getJson(key("short"), counting(1), 1min);
    cache.getJson(key("long"), counting(2), 1h);
    clock.advance(2min);

    EXPECT_EQ(cache.sweepExpired(), 1u);
    EXPECT_EQ(cache.stats().entries, 1u);
}

TEST_F(SwrCacheTest, DurableCleanupKeepsRecordLimit) {
    TempDir dir;
    auto settings = manualSettings();
    settings.durable_dir = dir.path();
    settings.durable_max_records = 2;
    SwrCache cache(settings, clock.wallNow());

    for (int i = 0; i < 4; ++i) {
        cache.getJson(key("k" + std::to_string(i)), counting(i));
    }
    EXPECT_EQ(cache.cleanupDurable(), 2u);
    EXPECT_EQ(cache.cleanupDurable(), 0u);
}

TEST_F(SwrCacheTest, ClearEmptiesEverything) {
    SwrCache cache(manualSettings(), clock.wallNow());
    cache.getJson(key("a"), counting(1), 1min);
    clock.advance(55s);
    cache.getJson(key("a"), counting(2), 1min);
    ASSERT_EQ(cache.pendingRefreshCount(), 1u);

    cache.clear();
    EXPECT_EQ(cache.stats().entries, 0u);
    EXPECT_EQ(cache.pendingRefreshCount(), 0u);
}
