#ifndef PROGRESSIVEFETCHCACHE_H
#define PROGRESSIVEFETCHCACHE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Core/Clock.h"
#include "Core/MediaDiskStore.h"
#include "Core/MediaStream.h"
#include "Core/NetworkQualityEstimator.h"

class IHttpClient;

struct FetchCacheSettings {
    std::filesystem::path dir = "reelcast_cache/media";
    std::uint64_t max_disk_bytes = 500ULL * 1024 * 1024;
    std::chrono::seconds retention{8};
    // Longest silence tolerated on a download. Slow but steady transfers run to completion.
    std::chrono::milliseconds request_timeout{std::chrono::seconds(20)};
};

/*!
@class ProgressiveFetchCache
@brief Streams remote media in tier-sized chunks while persisting it.

One download per media id. The chunk size and readiness threshold are
re-read from the current quality tier on every buffering decision. A
finished stream stays warm for the retention window so a quick return to
the same item reuses it. Files already on disk are served from there.
*/
class ProgressiveFetchCache {
  public:
    using TierSource = std::function<QualityTier()>;

    ProgressiveFetchCache(IHttpClient& http,
                          TierSource tier_source,
                          FetchCacheSettings settings,
                          SteadyNow now = realSteadyClock());
    ~ProgressiveFetchCache();

    ProgressiveFetchCache(const ProgressiveFetchCache&) = delete;
    ProgressiveFetchCache& operator=(const ProgressiveFetchCache&) = delete;

    std::shared_ptr<MediaStreamReader> stream(const std::string& media_id, const std::string& url);
    void stopStreaming(const std::string& media_id);

    // Tears down streams whose retention window ran out, and failed ones.
    std::size_t sweepRetention();
    std::size_t enforceDiskBudget();
    void clearAll();

    std::size_t activeStreamCount() const;
    bool hasStream(const std::string& media_id) const;
    bool isRetained(const std::string& media_id) const;
    std::uint64_t bytesReceived(const std::string& media_id) const;
    MediaDiskStore& diskStore();

  private:
    struct StreamEntry {
        std::shared_ptr<StreamState> state;
        std::future<void> producer;
        std::optional<std::chrono::steady_clock::time_point> retention_deadline;
    };

    void runProducer(const std::shared_ptr<StreamState>& state, const std::function<void()>& body);
    void produceFromNetwork(const std::shared_ptr<StreamState>& state, const std::string& url);
    void produceFromDisk(const std::shared_ptr<StreamState>& state, const std::filesystem::path& path);
    int fetchOnce(const std::shared_ptr<StreamState>& state, const std::string& url);
    void onProducerFinished(const std::shared_ptr<StreamState>& state, bool succeeded);

    IHttpClient& m_http;
    TierSource m_tier_source;
    FetchCacheSettings m_settings;
    SteadyNow m_now;
    MediaDiskStore m_disk;

    mutable std::mutex m_mutex;
    std::map<std::string, StreamEntry> m_streams;
};

#endif // PROGRESSIVEFETCHCACHE_H
