#include "Core/ResourcePool.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "Core/MediaStream.h"
#include "Core/ProgressiveFetchCache.h"
#include "Core/UrlFallbackChain.h"
#include "Errors.h"

namespace {
    constexpr auto MIN_LOAD_BUDGET = std::chrono::milliseconds(1);
}

ResourcePool::ResourcePool(IPlayerFactory& factory, ProgressiveFetchCache* fetch_cache, PoolSettings settings)
    : m_factory(factory), m_fetch_cache(fetch_cache), m_settings(settings) {
    if (m_settings.capacity == 0) {
        throw std::invalid_argument("ResourcePool: capacity must be at least 1");
    }
}

ResourcePool::~ResourcePool() { clear(); }

PlaybackHandle ResourcePool::acquire(int index, const MediaItem& item) {
    return PlaybackHandle(obtain(index, item, nullptr));
}

PlaybackHandle ResourcePool::preload(int index, const MediaItem& item, const StillWanted& still_wanted) {
    return PlaybackHandle(obtain(index, item, still_wanted));
}

ResourcePool::ResourcePtr ResourcePool::obtain(int index, const MediaItem& item, const StillWanted& still_wanted) {
    ResourcePtr doomed;
    std::shared_future<ResourcePtr> pending;
    std::promise<ResourcePtr> promise;
    bool owner = false;
    std::uint64_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(index);
        if (it != m_entries.end()) {
            const PlaybackState state = it->second.resource->state();
            if (is_usable(state) && it->second.resource->mediaId() == item.id) {
                it->second.last_access = ++m_access_seq;
                ++m_stats.hits;
                return it->second.resource;
            }
            spdlog::debug("ResourcePool: replacing index {} ({}, {})", index, it->second.resource->mediaId(),
                          to_string(state));
            doomed = std::move(it->second.resource);
            m_entries.erase(it);
        }

        auto flight = m_in_flight.find(index);
        if (flight != m_in_flight.end() && !flight->second.abandoned) {
            pending = flight->second.result;
            if (!still_wanted) {
                flight->second.wanted_by_acquire = true;
            }
            ++m_stats.coalesced;
        } else {
            owner = true;
            attempt = ++m_attempt_seq;
            pending = promise.get_future().share();
            m_in_flight[index] = InFlight{.result = pending, .attempt = attempt, .abandoned = false};
            ++m_stats.misses;
        }
    }

    if (doomed) {
        doomed->dispose();
    }
    if (!owner) {
        auto joined = pending.get();
        if (!joined && !still_wanted) {
            // The attempt was discarded or released before this acquire joined it.
            spdlog::debug("ResourcePool: attempt for index {} was dropped, starting over", index);
            return obtain(index, item, nullptr);
        }
        return joined;
    }

    // Expects m_mutex to be held. A record replaced by a newer attempt counts as abandoned.
    auto finish_flight = [&]() {
        auto flight = m_in_flight.find(index);
        if (flight == m_in_flight.end() || flight->second.attempt != attempt) {
            return true;
        }
        const bool abandoned = flight->second.abandoned;
        m_in_flight.erase(flight);
        return abandoned;
    };

    ResourcePtr created;
    try {
        created = createResource(index, item);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            finish_flight();
            ++m_stats.init_failures;
        }
        spdlog::warn("ResourcePool: index {} ({}) failed: {}", index, item.id, e.what());
        promise.set_exception(std::current_exception());
        throw;
    }

    bool acquire_waiting = false;
    if (still_wanted) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto flight = m_in_flight.find(index);
        acquire_waiting =
            flight != m_in_flight.end() && flight->second.attempt == attempt && flight->second.wanted_by_acquire;
    }
    if (still_wanted && !acquire_waiting && !still_wanted()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            finish_flight();
        }
        spdlog::debug("ResourcePool: discarding preload of index {}, no longer wanted", index);
        created->dispose();
        promise.set_value(nullptr);
        return nullptr;
    }

    std::vector<ResourcePtr> evicted;
    bool abandoned;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        abandoned = finish_flight();
        if (!abandoned) {
            auto existing = m_entries.find(index);
            if (existing != m_entries.end()) {
                evicted.push_back(std::move(existing->second.resource));
                m_entries.erase(existing);
            }
            created->setPinned(m_pinned.count(index) > 0);
            m_entries[index] = Entry{.resource = created, .last_access = ++m_access_seq};
            auto victims = evictOverCapacity(index);
            std::move(victims.begin(), victims.end(), std::back_inserter(evicted));
        }
    }

    if (abandoned) {
        spdlog::debug("ResourcePool: index {} was released while initializing", index);
        created->dispose();
        promise.set_value(nullptr);
        return nullptr;
    }

    promise.set_value(created);
    for (auto& victim : evicted) {
        victim->dispose();
    }
    return created;
}

ResourcePool::ResourcePtr ResourcePool::createResource(int index, const MediaItem& item) {
    const auto candidates = UrlFallbackChain::candidateUrls(item);
    if (candidates.empty()) {
        throw UnsupportedFormatError("ResourcePool: no playable URL for " + item.id);
    }

    std::exception_ptr last_error;
    for (const auto& url : candidates) {
        auto resource = std::make_shared<PlaybackResource>(index, item.id, url, m_factory.create());
        const bool routed = routesThroughFetchCache(url);
        try {
            std::chrono::milliseconds budget = m_settings.init_timeout;
            PlaybackSource source = sourceFor(item.id, url, budget);
            resource->initialize(source, budget);
            spdlog::info("ResourcePool: index {} ready ({})", index, url);
            return resource;
        } catch (const MediaError& e) {
            spdlog::warn("ResourcePool: index {} could not use {} ({}): {}", index, url, to_string(e.kind()),
                         e.what());
            last_error = std::current_exception();
        }
        resource->dispose();
        if (routed) {
            m_fetch_cache->stopStreaming(item.id);
        }
    }
    std::rethrow_exception(last_error);
}

bool ResourcePool::routesThroughFetchCache(const std::string& url) const {
    // Adaptive playlists reference further segments, the player fetches those itself.
    return m_settings.route_through_fetch_cache && m_fetch_cache && !UrlFallbackChain::isAdaptive(url);
}

PlaybackSource ResourcePool::sourceFor(const std::string& media_id,
                                       const std::string& url,
                                       std::chrono::milliseconds& budget) {
    if (!routesThroughFetchCache(url)) {
        return PlaybackSource{.url = url, .stream = nullptr};
    }

    const auto started = std::chrono::steady_clock::now();
    auto reader = m_fetch_cache->stream(media_id, url);
    if (!reader->waitReady(budget)) {
        throw TimeoutError("ResourcePool: " + media_id + " buffered too slowly within " +
                           std::to_string(budget.count()) + "ms");
    }
    const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    budget = std::max(MIN_LOAD_BUDGET, budget - spent);
    return PlaybackSource{.url = url, .stream = std::move(reader)};
}

std::vector<ResourcePool::ResourcePtr> ResourcePool::evictOverCapacity(int inserted_index) {
    std::vector<ResourcePtr> victims;
    while (m_entries.size() > m_settings.capacity) {
        auto victim = m_entries.end();
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (it->first == inserted_index || m_pinned.count(it->first)) {
                continue;
            }
            if (victim == m_entries.end() || it->second.last_access < victim->second.last_access) {
                victim = it;
            }
        }
        if (victim == m_entries.end()) {
            ++m_stats.capacity_overflows;
            spdlog::warn("ResourcePool: {} entries over capacity {}, all candidates pinned", m_entries.size(),
                         m_settings.capacity);
            break;
        }
        spdlog::debug("ResourcePool: evicting index {} ({})", victim->first, victim->second.resource->mediaId());
        victims.push_back(std::move(victim->second.resource));
        m_entries.erase(victim);
        ++m_stats.evictions;
    }
    return victims;
}

void ResourcePool::release(int index) {
    ResourcePtr doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(index);
        if (it != m_entries.end()) {
            doomed = std::move(it->second.resource);
            m_entries.erase(it);
        }
        auto flight = m_in_flight.find(index);
        if (flight != m_in_flight.end()) {
            flight->second.abandoned = true;
        }
    }
    if (doomed) {
        doomed->dispose();
    }
}

void ResourcePool::pin(const std::set<int>& indices) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (int index : indices) {
        m_pinned.insert(index);
        if (auto it = m_entries.find(index); it != m_entries.end()) {
            it->second.resource->setPinned(true);
        }
    }
}

void ResourcePool::unpin(const std::set<int>& indices) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (int index : indices) {
        m_pinned.erase(index);
        if (auto it = m_entries.find(index); it != m_entries.end()) {
            it->second.resource->setPinned(false);
        }
    }
}

std::size_t ResourcePool::releaseOutside(int center, int keep_range) {
    std::vector<ResourcePtr> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (std::abs(it->first - center) > keep_range && !m_pinned.count(it->first)) {
                doomed.push_back(std::move(it->second.resource));
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& resource : doomed) {
        spdlog::debug("ResourcePool: released index {} outside {}+-{}", resource->index(), center, keep_range);
        resource->dispose();
    }
    return doomed.size();
}

void ResourcePool::pauseAll() {
    std::vector<ResourcePtr> playing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [index, entry] : m_entries) {
            if (entry.resource->state() == PlaybackState::Playing) {
                playing.push_back(entry.resource);
            }
        }
    }
    for (auto& resource : playing) {
        try {
            resource->pause();
        } catch (const std::exception& e) {
            spdlog::warn("ResourcePool: could not pause index {}: {}", resource->index(), e.what());
        }
    }
}

void ResourcePool::clear() {
    std::map<int, Entry> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        doomed.swap(m_entries);
        for (auto& [index, flight] : m_in_flight) {
            flight.abandoned = true;
        }
    }
    for (auto& [index, entry] : doomed) {
        entry.resource->dispose();
    }
}

std::size_t ResourcePool::poll() {
    std::vector<ResourcePtr> resources;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [index, entry] : m_entries) {
            resources.push_back(entry.resource);
        }
    }
    std::size_t failed = 0;
    for (auto& resource : resources) {
        if (!resource->pollHealthy()) {
            spdlog::warn("ResourcePool: index {} ({}) is in error", resource->index(), resource->mediaId());
            ++failed;
        }
    }
    return failed;
}

PlaybackHandle ResourcePool::handle(int index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(index);
    if (it == m_entries.end()) {
        return PlaybackHandle();
    }
    return PlaybackHandle(it->second.resource);
}

bool ResourcePool::contains(int index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(index) > 0;
}

std::vector<int> ResourcePool::indices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<int> result;
    result.reserve(m_entries.size());
    for (const auto& [index, entry] : m_entries) {
        result.push_back(index);
    }
    return result;
}

std::size_t ResourcePool::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

PoolStats ResourcePool::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

std::vector<PoolSlot> ResourcePool::slots() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PoolSlot> result;
    result.reserve(m_entries.size());
    for (const auto& [index, entry] : m_entries) {
        result.push_back(PoolSlot{.index = index,
                                  .media_id = entry.resource->mediaId(),
                                  .state = entry.resource->state(),
                                  .pinned = m_pinned.count(index) > 0});
    }
    return result;
}
