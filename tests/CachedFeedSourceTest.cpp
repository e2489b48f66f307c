#include <gtest/gtest.h>

#include <stdexcept>

#include "Core/CachedFeedSource.h"
#include "Core/SwrCache.h"
#include "support/TestSupport.h"

using testing_support::makeFeed;
using testing_support::ManualClock;

namespace {
    // Counts how often the data service is asked for an item.
    class CountingFeed : public IFeedSource {
      public:
        explicit CountingFeed(std::size_t count) : m_feed(makeFeed(count)) {}

        std::size_t itemCount() const override { return m_feed.itemCount(); }
        std::optional<MediaItem> itemAt(int index) override {
            ++calls;
            if (offline) {
                throw std::runtime_error("feed service unreachable");
            }
            return m_feed.itemAt(index);
        }

        int calls = 0;
        bool offline = false;

      private:
        StaticFeedSource m_feed;
    };

    SwrCacheSettings manualSettings() {
        SwrCacheSettings settings;
        settings.refresh_mode = SwrCacheSettings::RefreshMode::Manual;
        return settings;
    }
}

TEST(CachedFeedSourceTest, FetchesWholePageOnceAndServesNeighboursFromCache) {
    ManualClock clock;
    CountingFeed upstream(25);
    SwrCache cache(manualSettings(), clock.wallNow());
    CachedFeedSource feed(upstream, cache, 10);

    auto first = feed.itemAt(0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, "clip0");
    EXPECT_EQ(upstream.calls, 10);

    EXPECT_EQ(feed.itemAt(7)->id, "clip7");
    EXPECT_EQ(upstream.calls, 10);

    EXPECT_EQ(feed.itemAt(12)->id, "clip12");
    EXPECT_EQ(upstream.calls, 20);
}

TEST(CachedFeedSourceTest, ShortLastPageAndOutOfRangeIndices) {
    ManualClock clock;
    CountingFeed upstream(25);
    SwrCache cache(manualSettings(), clock.wallNow());
    CachedFeedSource feed(upstream, cache, 10);

    EXPECT_EQ(feed.itemAt(24)->id, "clip24");
    // Page 2 stops at the first missing item.
    EXPECT_EQ(upstream.calls, 6);

    const int before = upstream.calls;
    EXPECT_FALSE(feed.itemAt(-1).has_value());
    EXPECT_FALSE(feed.itemAt(25).has_value());
    EXPECT_EQ(upstream.calls, before);
    EXPECT_EQ(feed.itemCount(), 25u);
}

TEST(CachedFeedSourceTest, CachedPagesSurviveAnOutage) {
    ManualClock clock;
    CountingFeed upstream(10);
    SwrCache cache(manualSettings(), clock.wallNow());
    CachedFeedSource feed(upstream, cache, 5);

    ASSERT_TRUE(feed.itemAt(1).has_value());
    upstream.offline = true;
    EXPECT_EQ(feed.itemAt(3)->id, "clip3");
    EXPECT_THROW(feed.itemAt(6), std::runtime_error);
}

TEST(CachedFeedSourceTest, InvalidateForcesRefetch) {
    ManualClock clock;
    CountingFeed upstream(10);
    SwrCache cache(manualSettings(), clock.wallNow());
    CachedFeedSource feed(upstream, cache, 5);

    feed.itemAt(0);
    feed.itemAt(5);
    EXPECT_EQ(upstream.calls, 10);

    feed.invalidate();
    EXPECT_FALSE(cache.peekJson(CacheKey{.category = CacheCategory::MediaList, .id = "feed:page:0"}).has_value());
    feed.itemAt(0);
    EXPECT_EQ(upstream.calls, 15);
}
