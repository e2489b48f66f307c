#ifndef RESOURCEPOOL_H
#define RESOURCEPOOL_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "Core/PlaybackResource.h"
#include "MediaItem.h"

class ProgressiveFetchCache;

struct PoolSettings {
    std::size_t capacity = 7;
    std::chrono::milliseconds init_timeout{10000};
    bool route_through_fetch_cache = true;
};

struct PoolStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t capacity_overflows = 0;
    std::uint64_t init_failures = 0;
    // Requests that waited on an initialization already in flight.
    std::uint64_t coalesced = 0;
};

struct PoolSlot {
    int index;
    std::string media_id;
    PlaybackState state;
    bool pinned;
};

/*!
@class ResourcePool
@brief Bounded set of playback resources, one per feed index.

The pool is the only owner of PlaybackResource objects; callers get weak
PlaybackHandles. Initialization blocks the calling thread and never holds
the pool lock, so acquisitions for different indices proceed in parallel
while a second request for the same index waits on the first attempt.

When an insertion pushes the pool over capacity the least recently used
unpinned entry is evicted. If every other entry is pinned the pool stays
over capacity and counts a capacity overflow.
*/
class ResourcePool {
  public:
    using StillWanted = std::function<bool()>;

    ResourcePool(IPlayerFactory& factory, ProgressiveFetchCache* fetch_cache, PoolSettings settings);
    ~ResourcePool();

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    // Throws TimeoutError, NetworkError or UnsupportedFormatError once every
    // candidate URL failed.
    PlaybackHandle acquire(int index, const MediaItem& item);
    // Like acquire, but the fresh resource is discarded when still_wanted()
    // is false after initialization and no acquire is waiting for it. Returns
    // an expired handle in that case.
    PlaybackHandle preload(int index, const MediaItem& item, const StillWanted& still_wanted);

    void release(int index);
    void pin(const std::set<int>& indices);
    void unpin(const std::set<int>& indices);
    // Releases unpinned entries farther than keep_range from center.
    std::size_t releaseOutside(int center, int keep_range);
    void pauseAll();
    void clear();

    // Drains player events and moves failed players to the error state.
    std::size_t poll();

    // Looks up without counting a hit or touching the LRU order.
    PlaybackHandle handle(int index) const;
    bool contains(int index) const;
    std::vector<int> indices() const;
    std::size_t size() const;
    PoolStats stats() const;
    std::vector<PoolSlot> slots() const;
    const PoolSettings& settings() const { return m_settings; }

  private:
    using ResourcePtr = std::shared_ptr<PlaybackResource>;

    struct Entry {
        ResourcePtr resource;
        std::uint64_t last_access = 0;
    };

    struct InFlight {
        std::shared_future<ResourcePtr> result;
        std::uint64_t attempt = 0;
        bool abandoned = false;
        // Set once a direct acquire waits on the attempt; the result is then kept
        // even if the preload that started it is no longer wanted.
        bool wanted_by_acquire = false;
    };

    ResourcePtr obtain(int index, const MediaItem& item, const StillWanted& still_wanted);
    ResourcePtr createResource(int index, const MediaItem& item);
    bool routesThroughFetchCache(const std::string& url) const;
    PlaybackSource sourceFor(const std::string& media_id, const std::string& url, std::chrono::milliseconds& budget);
    // Expects m_mutex to be held.
    std::vector<ResourcePtr> evictOverCapacity(int inserted_index);

    IPlayerFactory& m_factory;
    ProgressiveFetchCache* m_fetch_cache;
    const PoolSettings m_settings;

    mutable std::mutex m_mutex;
    std::map<int, Entry> m_entries;
    std::map<int, InFlight> m_in_flight;
    std::set<int> m_pinned;
    std::uint64_t m_access_seq = 0;
    std::uint64_t m_attempt_seq = 0;
    PoolStats m_stats;
};

#endif // RESOURCEPOOL_H
