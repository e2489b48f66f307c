#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <future>
#include <stdexcept>
#include <thread>

#include "Core/ProgressiveFetchCache.h"
#include "Core/ResourcePool.h"
#include "Errors.h"
#include "support/TestSupport.h"

using namespace std::chrono_literals;
using testing_support::FakeHttpClient;
using testing_support::FakePlayerFactory;
using testing_support::FakeResponse;
using testing_support::makeFeed;
using testing_support::makeItem;
using testing_support::TempDir;

namespace {
    PoolSettings directSettings(std::size_t capacity) {
        return PoolSettings{.capacity = capacity, .init_timeout = 2s, .route_through_fetch_cache = false};
    }

    bool waitUntil(const std::function<bool()>& condition) {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!condition()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    class ResourcePoolTest : public ::testing::Test {
      protected:
        ResourcePoolTest() : feed(makeFeed(10)) {}

        FakePlayerFactory factory;
        std::vector<MediaItem> feed;
    };
}

TEST_F(ResourcePoolTest, RejectsZeroCapacity) {
    EXPECT_THROW(ResourcePool(factory, nullptr, directSettings(0)), std::invalid_argument);
}

TEST_F(ResourcePoolTest, EvictsLeastRecentlyUsedBeyondCapacity) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    auto first = pool.acquire(0, feed[0]);
    pool.acquire(1, feed[1]);
    pool.acquire(2, feed[2]);
    pool.acquire(3, feed[3]);

    EXPECT_EQ(pool.size(), 3u);
    EXPECT_FALSE(pool.contains(0));
    EXPECT_TRUE(first.expired());
    EXPECT_EQ(pool.stats().evictions, 1u);
    EXPECT_EQ(factory.destroyed.load(), 1);
}

TEST_F(ResourcePoolTest, HitRefreshesRecency) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    pool.acquire(0, feed[0]);
    pool.acquire(1, feed[1]);
    pool.acquire(2, feed[2]);
    pool.acquire(0, feed[0]);
    pool.acquire(3, feed[3]);

    EXPECT_TRUE(pool.contains(0));
    EXPECT_FALSE(pool.contains(1));
    auto stats = pool.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 4u);
    EXPECT_EQ(factory.created.load(), 4);
}

TEST_F(ResourcePoolTest, PeekDoesNotCountAsUse) {
    ResourcePool pool(factory, nullptr, directSettings(2));
    pool.acquire(0, feed[0]);
    pool.acquire(1, feed[1]);
    EXPECT_FALSE(pool.handle(0).expired());
    pool.acquire(2, feed[2]);

    EXPECT_FALSE(pool.contains(0));
    EXPECT_TRUE(pool.handle(0).expired());
    EXPECT_EQ(pool.stats().hits, 0u);
}

TEST_F(ResourcePoolTest, PinnedEntriesAreNeverEvicted) {
    ResourcePool pool(factory, nullptr, directSettings(2));
    pool.pin({0, 1});
    pool.acquire(0, feed[0]);
    pool.acquire(1, feed[1]);
    auto extra = pool.acquire(2, feed[2]);

    EXPECT_EQ(pool.size(), 3u);
    EXPECT_FALSE(extra.expired());
    EXPECT_EQ(pool.stats().capacity_overflows, 1u);

    pool.unpin({0});
    pool.acquire(3, feed[3]);
    EXPECT_FALSE(pool.contains(0));
    EXPECT_TRUE(pool.contains(1));
}

TEST_F(ResourcePoolTest, SlotsReportPinsAndStates) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    pool.pin({1});
    pool.acquire(0, feed[0]).play();
    pool.acquire(1, feed[1]);

    auto slots = pool.slots();
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].index, 0);
    EXPECT_EQ(slots[0].state, PlaybackState::Playing);
    EXPECT_FALSE(slots[0].pinned);
    EXPECT_EQ(slots[1].media_id, "clip1");
    EXPECT_TRUE(slots[1].pinned);
}

TEST_F(ResourcePoolTest, DifferentMediaAtSameIndexReplacesEntry) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    auto old_handle = pool.acquire(0, feed[0]);
    auto new_handle = pool.acquire(0, feed[5]);

    EXPECT_TRUE(old_handle.expired());
    EXPECT_FALSE(new_handle.expired());
    EXPECT_EQ(pool.slots().front().media_id, "clip5");
    EXPECT_EQ(pool.size(), 1u);
}

TEST_F(ResourcePoolTest, FallsBackToNextCandidateUrl) {
    auto item = makeItem("a", "https://cdn.example.com/a-broken.mp4", {"https://cdn.example.com/a.mp4"});
    factory.failUrl("https://cdn.example.com/a-broken.mp4", MediaErrorKind::Network);
    ResourcePool pool(factory, nullptr, directSettings(3));

    auto handle = pool.acquire(0, item);
    EXPECT_EQ(handle.url(), "https://cdn.example.com/a.mp4");
    EXPECT_EQ(handle.state(), PlaybackState::Ready);
    EXPECT_EQ(factory.created.load(), 2);
    EXPECT_EQ(factory.destroyed.load(), 1);
}

TEST_F(ResourcePoolTest, ExhaustedCandidatesRethrowLastFailure) {
    auto item = makeItem("a", "https://cdn.example.com/a.mp4", {"https://cdn.example.com/a.webm"});
    factory.failUrl("https://cdn.example.com/a.mp4", MediaErrorKind::Timeout);
    factory.failUrl("https://cdn.example.com/a.webm", MediaErrorKind::Unsupported);
    ResourcePool pool(factory, nullptr, directSettings(3));

    EXPECT_THROW(pool.acquire(0, item), UnsupportedFormatError);
    EXPECT_FALSE(pool.contains(0));
    EXPECT_EQ(pool.stats().init_failures, 1u);
    EXPECT_EQ(factory.destroyed.load(), 2);

    EXPECT_THROW(pool.acquire(1, makeItem("empty", "")), UnsupportedFormatError);
}

TEST_F(ResourcePoolTest, ErroredEntryIsReplacedOnNextAcquire) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    auto handle = pool.acquire(0, feed[0]);

    factory.setHealthy(false);
    EXPECT_EQ(pool.poll(), 1u);
    EXPECT_EQ(handle.state(), PlaybackState::Error);

    factory.setHealthy(true);
    auto fresh = pool.acquire(0, feed[0]);
    EXPECT_TRUE(handle.expired());
    EXPECT_EQ(fresh.state(), PlaybackState::Ready);
    EXPECT_EQ(factory.created.load(), 2);
}

TEST_F(ResourcePoolTest, ConcurrentAcquireOfSameIndexSharesOneInitialization) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    factory.closeGate();

    auto first = std::async(std::launch::async, [&] { return pool.acquire(0, feed[0]); });
    ASSERT_TRUE(factory.waitForLoadsStarted(1, 2s));
    auto second = std::async(std::launch::async, [&] { return pool.acquire(0, feed[0]); });
    ASSERT_TRUE(waitUntil([&] { return pool.stats().coalesced == 1; }));
    factory.openGate();

    auto a = first.get();
    auto b = second.get();
    EXPECT_FALSE(a.expired());
    EXPECT_FALSE(b.expired());
    EXPECT_EQ(factory.created.load(), 1);
    EXPECT_EQ(pool.stats().misses, 1u);
}

TEST_F(ResourcePoolTest, PreloadNoLongerWantedIsDiscarded) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    auto handle = pool.preload(4, feed[4], [] { return false; });

    EXPECT_TRUE(handle.expired());
    EXPECT_FALSE(pool.contains(4));
    EXPECT_EQ(factory.destroyed.load(), 1);

    auto wanted = pool.preload(4, feed[4], [] { return true; });
    EXPECT_FALSE(wanted.expired());
    EXPECT_TRUE(pool.contains(4));
}

TEST_F(ResourcePoolTest, ReleaseDuringInitializationAbandonsAttempt) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    factory.closeGate();

    auto pending = std::async(std::launch::async, [&] { return pool.acquire(2, feed[2]); });
    ASSERT_TRUE(factory.waitForLoadsStarted(1, 2s));
    pool.release(2);
    factory.openGate();

    EXPECT_TRUE(pending.get().expired());
    EXPECT_FALSE(pool.contains(2));

    // A later acquire starts a fresh attempt.
    EXPECT_FALSE(pool.acquire(2, feed[2]).expired());
    EXPECT_EQ(factory.created.load(), 2);
}

TEST_F(ResourcePoolTest, AcquireJoiningAPreloadKeepsTheResult) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    std::atomic<bool> wanted{true};
    factory.closeGate();

    auto preloading = std::async(std::launch::async, [&] {
        return pool.preload(1, feed[1], [&] { return wanted.load(); });
    });
    ASSERT_TRUE(factory.waitForLoadsStarted(1, 2s));
    auto acquiring = std::async(std::launch::async, [&] { return pool.acquire(1, feed[1]); });
    ASSERT_TRUE(waitUntil([&] { return pool.stats().coalesced == 1; }));

    // The viewport moved on, but the user is now waiting for this item.
    wanted = false;
    factory.openGate();

    auto handle = acquiring.get();
    ASSERT_FALSE(handle.expired());
    EXPECT_EQ(handle.state(), PlaybackState::Ready);
    EXPECT_TRUE(pool.contains(1));
    EXPECT_FALSE(preloading.get().expired());
    EXPECT_EQ(factory.created.load(), 1);
    EXPECT_EQ(factory.destroyed.load(), 0);
}

TEST_F(ResourcePoolTest, AcquireJoiningAReleasedAttemptStartsOver) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    factory.closeGate();

    auto preloading = std::async(std::launch::async, [&] {
        return pool.preload(2, feed[2], [] { return true; });
    });
    ASSERT_TRUE(factory.waitForLoadsStarted(1, 2s));
    auto acquiring = std::async(std::launch::async, [&] { return pool.acquire(2, feed[2]); });
    ASSERT_TRUE(waitUntil([&] { return pool.stats().coalesced == 1; }));

    pool.release(2);
    factory.openGate();

    EXPECT_TRUE(preloading.get().expired());
    auto handle = acquiring.get();
    ASSERT_FALSE(handle.expired());
    EXPECT_EQ(handle.state(), PlaybackState::Ready);
    EXPECT_TRUE(pool.contains(2));
    EXPECT_EQ(factory.created.load(), 2);
}

TEST_F(ResourcePoolTest, ReleaseOutsideKeepsRangeAndPins) {
    ResourcePool pool(factory, nullptr, directSettings(7));
    for (int i = 2; i <= 8; ++i) {
        pool.acquire(i, feed[i]);
    }
    pool.pin({8});

    EXPECT_EQ(pool.releaseOutside(5, 1), 3u);
    EXPECT_EQ(pool.indices(), (std::vector<int>{4, 5, 6, 8}));
}

TEST_F(ResourcePoolTest, PauseAllOnlyTouchesPlayingEntries) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    auto playing = pool.acquire(0, feed[0]);
    auto ready = pool.acquire(1, feed[1]);
    playing.play();

    pool.pauseAll();
    EXPECT_EQ(playing.state(), PlaybackState::Paused);
    EXPECT_EQ(ready.state(), PlaybackState::Ready);
}

TEST_F(ResourcePoolTest, ClearDisposesEverything) {
    ResourcePool pool(factory, nullptr, directSettings(3));
    auto handle = pool.acquire(0, feed[0]);
    pool.acquire(1, feed[1]);

    pool.clear();
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_TRUE(handle.expired());
    EXPECT_EQ(factory.destroyed.load(), 2);
}

TEST_F(ResourcePoolTest, DirectFilesStreamThroughFetchCache) {
    TempDir dir;
    FakeHttpClient http;
    http.respond("https://cdn.example.com/clip0.mp4",
                 FakeResponse{.status = 200, .body = std::string(300 * 1024, 'v')});
    FetchCacheSettings settings;
    settings.dir = dir.path();
    ProgressiveFetchCache fetch_cache(http, [] { return QualityTier::VeryLow; }, settings);

    ResourcePool pool(factory, &fetch_cache,
                      PoolSettings{.capacity = 3, .init_timeout = 5s, .route_through_fetch_cache = true});
    auto handle = pool.acquire(0, feed[0]);
    EXPECT_EQ(handle.state(), PlaybackState::Ready);
    EXPECT_TRUE(fetch_cache.hasStream("clip0"));

    // Adaptive playlists go to the player directly.
    auto hls = makeItem("live", "https://cdn.example.com/hls/live.m3u8");
    pool.acquire(1, hls);
    EXPECT_FALSE(fetch_cache.hasStream("live"));
    EXPECT_EQ(http.requestCount(), 1u);
}

TEST_F(ResourcePoolTest, FailedStreamStopsDownloadAndTriesNextCandidate) {
    TempDir dir;
    FakeHttpClient http;
    http.respond("https://cdn.example.com/good.mp4", FakeResponse{.status = 200, .body = std::string(300 * 1024, 'v')});
    FetchCacheSettings settings;
    settings.dir = dir.path();
    ProgressiveFetchCache fetch_cache(http, [] { return QualityTier::VeryLow; }, settings);
    ResourcePool pool(factory, &fetch_cache,
                      PoolSettings{.capacity = 3, .init_timeout = 5s, .route_through_fetch_cache = true});

    auto item = makeItem("clip", "https://cdn.example.com/gone.mp4", {"https://cdn.example.com/good.mp4"});
    auto handle = pool.acquire(0, item);
    EXPECT_EQ(handle.url(), "https://cdn.example.com/good.mp4");
    EXPECT_EQ(http.requestCount("https://cdn.example.com/gone.mp4"), 1u);
}
