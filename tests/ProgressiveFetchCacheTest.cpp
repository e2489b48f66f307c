#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "Core/ProgressiveFetchCache.h"
#include "Errors.h"
#include "support/TestSupport.h"

using namespace std::chrono_literals;
using testing_support::FakeHttpClient;
using testing_support::FakeResponse;
using testing_support::ManualClock;
using testing_support::TempDir;

namespace {
    const std::string CLIP_URL = "https://cdn.example.com/clip.mp4";

    std::string makeBody(std::size_t size) {
        std::string body(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            body[i] = static_cast<char>('a' + i % 23);
        }
        return body;
    }

    std::string readAll(MediaStreamReader& reader) {
        std::string data;
        while (auto chunk = reader.nextChunk()) {
            data += *chunk;
        }
        return data;
    }

    class ProgressiveFetchCacheTest : public ::testing::Test {
      protected:
        ProgressiveFetchCacheTest() : http(nullptr, 4096) {}

        std::unique_ptr<ProgressiveFetchCache> makeCache(std::uint64_t max_disk_bytes = 64ULL * 1024 * 1024,
                                                         std::chrono::milliseconds request_timeout = 20s) {
            FetchCacheSettings settings;
            settings.dir = dir.path() / "media";
            settings.max_disk_bytes = max_disk_bytes;
            settings.request_timeout = request_timeout;
            settings.retention = 8s;
            return std::make_unique<ProgressiveFetchCache>(
                http, [this] { return tier.load(); }, settings, clock.steadyNow());
        }

        TempDir dir;
        ManualClock clock;
        FakeHttpClient http;
        std::atomic<QualityTier> tier{QualityTier::VeryLow};
    };
}

TEST_F(ProgressiveFetchCacheTest, StreamsWholeBodyInTierSizedChunks) {
    const std::string body = makeBody(600 * 1024);
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = body});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    ASSERT_TRUE(reader->waitReady(5s));

    auto first = reader->nextChunk();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), NetworkQualityEstimator::chunkSizeFor(QualityTier::VeryLow));

    std::string data = *first + readAll(*reader);
    EXPECT_EQ(data, body);
    EXPECT_EQ(reader->totalSize(), body.size());
    EXPECT_EQ(cache->bytesReceived("clip"), body.size());
}

TEST_F(ProgressiveFetchCacheTest, HighTierUsesLargerChunks) {
    tier = QualityTier::High;
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = makeBody(300 * 1024)});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    auto first = reader->nextChunk();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), 128u * 1024u);
}

TEST_F(ProgressiveFetchCacheTest, ChunkSizeFollowsTierChangesMidStream) {
    const std::string body = makeBody(400 * 1024);
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = body, .hold_after = 64 * 1024});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    EXPECT_TRUE(http.waitUntilHeld(5s));
    tier = QualityTier::High;
    http.resumeDelivery();

    std::vector<std::size_t> sizes;
    std::string data;
    while (auto chunk = reader->nextChunk()) {
        sizes.push_back(chunk->size());
        data += *chunk;
    }
    EXPECT_EQ(data, body);
    const std::size_t kib = 1024;
    EXPECT_EQ(sizes, (std::vector<std::size_t>{16 * kib, 16 * kib, 16 * kib, 16 * kib, 128 * kib, 128 * kib,
                                               80 * kib}));
}

TEST_F(ProgressiveFetchCacheTest, ReadyOnceInitialBufferArrivesBeforeCompletion) {
    const std::string body = makeBody(600 * 1024);
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = body, .hold_after = 300 * 1024});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    EXPECT_TRUE(http.waitUntilHeld(5s));
    // 300 KiB is past the 256 KiB initial buffer of the VeryLow tier.
    EXPECT_TRUE(reader->waitReady(2s));
    EXPECT_FALSE(reader->totalSize().has_value());
    EXPECT_EQ(cache->bytesReceived("clip"), 300u * 1024u);

    http.resumeDelivery();
    EXPECT_EQ(readAll(*reader), body);
    EXPECT_EQ(reader->totalSize(), body.size());
}

TEST_F(ProgressiveFetchCacheTest, SlowSteadyDownloadOutlastsRequestTimeout) {
    const std::string body = makeBody(256 * 1024);
    // 64 fragments at 500 ms each take 32 s, far past the 2 s timeout.
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = body, .per_fragment = 500ms});
    auto cache = makeCache(64ULL * 1024 * 1024, 2s);

    auto reader = cache->stream("clip", CLIP_URL);
    EXPECT_EQ(readAll(*reader), body);
    EXPECT_EQ(cache->bytesReceived("clip"), body.size());
}

TEST_F(ProgressiveFetchCacheTest, StalledDownloadTimesOut) {
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = makeBody(64 * 1024), .per_fragment = 3s});
    auto cache = makeCache(64ULL * 1024 * 1024, 2s);

    auto reader = cache->stream("clip", CLIP_URL);
    EXPECT_THROW(readAll(*reader), TimeoutError);
}

TEST_F(ProgressiveFetchCacheTest, ByteReadsAndSeeksFollowTheChunks) {
    const std::string body = makeBody(100 * 1024);
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = body});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    ASSERT_TRUE(reader->seek(20000));
    std::string buffer(5000, '\0');
    ASSERT_EQ(reader->read(buffer.data(), buffer.size()), 5000u);
    EXPECT_EQ(buffer, body.substr(20000, 5000));
    EXPECT_EQ(reader->position(), 25000u);
    EXPECT_FALSE(reader->seek(body.size() + 1));
}

TEST_F(ProgressiveFetchCacheTest, CompletedDownloadIsServedFromDisk) {
    const std::string body = makeBody(200 * 1024);
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = body});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    ASSERT_EQ(readAll(*reader), body);
    cache->stopStreaming("clip");
    EXPECT_FALSE(cache->hasStream("clip"));
    EXPECT_EQ(cache->diskStore().fileCount(), 1u);

    auto again = cache->stream("clip", CLIP_URL);
    EXPECT_EQ(readAll(*again), body);
    EXPECT_EQ(http.requestCount(), 1u);
}

TEST_F(ProgressiveFetchCacheTest, WarmReuseRearmsRetentionWindow) {
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = makeBody(64 * 1024)});
    auto cache = makeCache();

    auto reader = cache->stream("clip", CLIP_URL);
    readAll(*reader);
    EXPECT_TRUE(cache->isRetained("clip"));

    clock.advance(5s);
    auto reused = cache->stream("clip", CLIP_URL);
    EXPECT_EQ(readAll(*reused).size(), 64u * 1024u);
    EXPECT_EQ(http.requestCount(), 1u);

    clock.advance(5s);
    EXPECT_EQ(cache->sweepRetention(), 0u);
    EXPECT_TRUE(cache->hasStream("clip"));

    clock.advance(4s);
    EXPECT_EQ(cache->sweepRetention(), 1u);
    EXPECT_FALSE(cache->hasStream("clip"));
    EXPECT_EQ(cache->activeStreamCount(), 0u);
}

TEST_F(ProgressiveFetchCacheTest, BadRequestFallsBackToDegradedVariant) {
    const std::string base = "https://res.cloudinary.com/demo/video/upload/";
    const std::string body = makeBody(32 * 1024);
    http.respond(base + "sp_hd/clip.mp4", FakeResponse{.status = 400});
    http.respond(base + "sp_sd/clip.mp4", FakeResponse{.status = 200, .body = body});
    auto cache = makeCache();

    auto reader = cache->stream("clip", base + "sp_hd/clip.mp4");
    EXPECT_EQ(readAll(*reader), body);

    auto urls = http.requestedUrls();
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[1], base + "sp_sd/clip.mp4");
}

TEST_F(ProgressiveFetchCacheTest, FailedDownloadSurfacesToReaderAndIsSwept) {
    auto cache = makeCache();
    auto reader = cache->stream("missing", "https://cdn.example.com/missing.mp4");

    EXPECT_THROW(reader->waitReady(5s), NetworkError);
    EXPECT_EQ(cache->diskStore().fileCount(), 0u);
    EXPECT_EQ(cache->sweepRetention(), 1u);
    EXPECT_FALSE(cache->hasStream("missing"));
}

TEST_F(ProgressiveFetchCacheTest, TransportErrorSurfacesAsMediaError) {
    http.respond(CLIP_URL, FakeResponse{.failure = MediaErrorKind::Timeout});
    auto cache = makeCache();
    auto reader = cache->stream("clip", CLIP_URL);
    EXPECT_THROW(readAll(*reader), TimeoutError);
}

TEST_F(ProgressiveFetchCacheTest, DiskBudgetDropsLeastRecentFiles) {
    http.respond("https://cdn.example.com/a.mp4", FakeResponse{.status = 200, .body = makeBody(80 * 1024)});
    http.respond("https://cdn.example.com/b.mp4", FakeResponse{.status = 200, .body = makeBody(80 * 1024)});
    auto cache = makeCache(100 * 1024);

    readAll(*cache->stream("a", "https://cdn.example.com/a.mp4"));
    readAll(*cache->stream("b", "https://cdn.example.com/b.mp4"));
    ASSERT_EQ(cache->diskStore().fileCount(), 2u);

    EXPECT_EQ(cache->enforceDiskBudget(), 1u);
    EXPECT_EQ(cache->diskStore().fileCount(), 1u);
    EXPECT_LE(cache->diskStore().totalBytes(), 100u * 1024u);
}

TEST_F(ProgressiveFetchCacheTest, ClearAllDropsStreamsAndFiles) {
    http.respond(CLIP_URL, FakeResponse{.status = 200, .body = makeBody(16 * 1024)});
    auto cache = makeCache();
    readAll(*cache->stream("clip", CLIP_URL));

    cache->clearAll();
    EXPECT_EQ(cache->activeStreamCount(), 0u);
    EXPECT_EQ(cache->diskStore().fileCount(), 0u);
}
