#ifndef SWRCACHE_H
#define SWRCACHE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "Core/CacheCategory.h"
#include "Core/Clock.h"
#include "nlohmann/json.hpp"

struct CacheEntry {
    nlohmann::json payload;
    std::chrono::system_clock::time_point created_at;
    std::chrono::seconds max_age{0};
    std::uint64_t access_count = 0;
    std::chrono::system_clock::time_point last_accessed;
    std::optional<std::string> etag;

    bool isExpired(std::chrono::system_clock::time_point now) const { return now - created_at > max_age; }
    // Past 80% of the lifetime a hit also schedules a refresh.
    bool shouldRefresh(std::chrono::system_clock::time_point now) const {
        return (now - created_at) * 5 > max_age * 4;
    }
};

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t stale_served = 0;
    std::uint64_t background_refreshes = 0;
    std::uint64_t refresh_failures = 0;
    std::uint64_t evictions = 0;
    std::size_t entries = 0;
};

struct SwrCacheSettings {
    enum class RefreshMode {
        Background, // a worker thread drains the refresh queue
        Manual      // the owner drains it with runPending()
    };

    std::map<CacheCategory, CategoryConfig> categories = default_category_configs();
    std::chrono::milliseconds refresh_delay{200};
    RefreshMode refresh_mode = RefreshMode::Background;
    // Enables the durable tier when set.
    std::optional<std::filesystem::path> durable_dir;
    std::size_t durable_max_records = 1000;
};

/*!
@class SwrCache
@brief Keyed stale-while-revalidate store for fetched documents.

Payloads are held as JSON so any type with to_json/from_json can be cached.
Fetchers always run outside the cache lock. Background refreshes are
sequential, one pending task per key, with a fixed pause between them.
*/
class SwrCache {
  public:
    using Fetcher = std::function<nlohmann::json()>;

    explicit SwrCache(SwrCacheSettings settings = {}, WallNow now = realWallClock());
    ~SwrCache();

    SwrCache(const SwrCache&) = delete;
    SwrCache& operator=(const SwrCache&) = delete;

    template <typename T>
    T get(const CacheKey& key,
          std::function<T()> fetch,
          std::optional<std::chrono::seconds> max_age = std::nullopt,
          bool force_refresh = false) {
        Fetcher json_fetch = [fetch = std::move(fetch)]() { return nlohmann::json(fetch()); };
        return getJson(key, json_fetch, max_age, force_refresh).template get<T>();
    }

    template <typename T>
    std::optional<T> peek(const CacheKey& key, bool allow_stale = false) const {
        auto payload = peekJson(key, allow_stale);
        if (!payload) {
            return std::nullopt;
        }
        return payload->template get<T>();
    }

    nlohmann::json getJson(const CacheKey& key,
                           const Fetcher& fetch,
                           std::optional<std::chrono::seconds> max_age = std::nullopt,
                           bool force_refresh = false);
    std::optional<nlohmann::json> peekJson(const CacheKey& key, bool allow_stale = false) const;

    void invalidate(const CacheKey& key);
    // Removes every key of the category whose id starts with id_prefix.
    std::size_t invalidate(CacheCategory category, const std::string& id_prefix);
    void clear();

    std::size_t sweepExpired();
    std::size_t cleanupDurable();

    // Manual mode only: runs every queued refresh now, without delays.
    std::size_t runPending();
    std::size_t pendingRefreshCount() const;

    CacheStats stats() const;
    const CategoryConfig& configFor(CacheCategory category) const;
    bool isEmptyPayload(CacheCategory category, const nlohmann::json& payload) const;

  private:
    struct RefreshTask {
        CacheKey key;
        Fetcher fetch;
        std::optional<std::chrono::seconds> max_age;
    };

    // All private helpers with a lock parameter expect m_mutex to be held.
    void enqueueRefresh(const std::unique_lock<std::mutex>& lock,
                        const CacheKey& key,
                        const Fetcher& fetch,
                        std::optional<std::chrono::seconds> max_age);
    void store(const std::unique_lock<std::mutex>& lock,
               const CacheKey& key,
               nlohmann::json payload,
               std::optional<std::chrono::seconds> max_age);
    void eraseKey(const std::unique_lock<std::mutex>& lock, const CacheKey& key);
    void evictColdest(const std::unique_lock<std::mutex>& lock, CacheCategory category);
    CacheEntry* findOrLoad(const std::unique_lock<std::mutex>& lock, const CacheKey& key);
    void runRefresh(RefreshTask task);
    void refreshLoop();

    std::filesystem::path durablePath(const CacheKey& key) const;
    void writeDurable(const CacheKey& key, const CacheEntry& entry) const;
    std::optional<CacheEntry> readDurable(const CacheKey& key) const;
    void removeDurable(const CacheKey& key) const;

    SwrCacheSettings m_settings;
    WallNow m_now;

    mutable std::mutex m_mutex;
    std::map<CacheKey, CacheEntry> m_entries;
    mutable CacheStats m_stats;

    std::deque<RefreshTask> m_refresh_queue;
    std::condition_variable m_refresh_cond;
    bool m_stopping = false;
    std::thread m_refresh_thread;
};

#endif // SWRCACHE_H
