#include "Core/SwrCache.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>
#include <vector>

#include "Utils.h"

using nlohmann::json;
namespace fs = std::filesystem;

namespace {
    // Share of a category's entries dropped when it is full.
    constexpr std::size_t EVICT_PERCENT = 30;
    constexpr const char* DURABLE_EXTENSION = ".json";
}

SwrCache::SwrCache(SwrCacheSettings settings, WallNow now) : m_settings(std::move(settings)), m_now(std::move(now)) {
    for (const auto& [category, config] : default_category_configs()) {
        m_settings.categories.emplace(category, config);
    }

    if (m_settings.durable_dir) {
        std::error_code ec;
        fs::create_directories(*m_settings.durable_dir, ec);
        if (ec) {
            spdlog::warn("SwrCache: cannot create {} ({}), durable tier disabled", m_settings.durable_dir->string(),
                         ec.message());
            m_settings.durable_dir.reset();
        }
    }

    if (m_settings.refresh_mode == SwrCacheSettings::RefreshMode::Background) {
        m_refresh_thread = std::thread(&SwrCache::refreshLoop, this);
    }
}

SwrCache::~SwrCache() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_refresh_cond.notify_all();
    if (m_refresh_thread.joinable()) {
        m_refresh_thread.join();
    }
}

const CategoryConfig& SwrCache::configFor(CacheCategory category) const {
    auto it = m_settings.categories.find(category);
    if (it == m_settings.categories.end()) {
        return m_settings.categories.at(CacheCategory::Default);
    }
    return it->second;
}

bool SwrCache::isEmptyPayload(CacheCategory category, const json& payload) const {
    if (payload.is_null()) {
        return true;
    }
    if (payload.is_array()) {
        return payload.empty();
    }
    const auto& field = configFor(category).empty_list_field;
    if (field.empty() || !payload.is_object()) {
        return false;
    }
    auto it = payload.find(field);
    return it != payload.end() && it->is_array() && it->empty();
}

json SwrCache::getJson(const CacheKey& key,
                       const Fetcher& fetch,
                       std::optional<std::chrono::seconds> max_age,
                       bool force_refresh) {
    const auto& config = configFor(key.category);
    const auto now = m_now();

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!force_refresh) {
            if (CacheEntry* entry = findOrLoad(lock, key)) {
                entry->access_count++;
                entry->last_accessed = std::max(now, entry->created_at);

                if (!entry->isExpired(now)) {
                    m_stats.hits++;
                    if (entry->shouldRefresh(now)) {
                        enqueueRefresh(lock, key, fetch, max_age);
                    }
                    spdlog::debug("SwrCache: hit for {}", key.str());
                    return entry->payload;
                }
                if (config.stale_while_revalidate) {
                    m_stats.stale_served++;
                    enqueueRefresh(lock, key, fetch, max_age);
                    spdlog::debug("SwrCache: serving stale {} while revalidating", key.str());
                    return entry->payload;
                }
            }
        }
        m_stats.misses++;
    }

    json fresh;
    try {
        fresh = fetch();
    } catch (const std::exception& e) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (CacheEntry* entry = findOrLoad(lock, key)) {
            m_stats.stale_served++;
            spdlog::warn("SwrCache: fetch for {} failed ({}), serving cached copy", key.str(), e.what());
            return entry->payload;
        }
        spdlog::warn("SwrCache: fetch for {} failed with nothing cached: {}", key.str(), e.what());
        throw;
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (isEmptyPayload(key.category, fresh)) {
        spdlog::debug("SwrCache: empty result for {} is not cached", key.str());
        eraseKey(lock, key);
        return fresh;
    }
    store(lock, key, fresh, max_age);
    return fresh;
}

std::optional<json> SwrCache::peekJson(const CacheKey& key, bool allow_stale) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    if (!allow_stale && it->second.isExpired(m_now())) {
        return std::nullopt;
    }
    return it->second.payload;
}

CacheEntry* SwrCache::findOrLoad(const std::unique_lock<std::mutex>& lock, const CacheKey& key) {
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        return &it->second;
    }
    if (!m_settings.durable_dir) {
        return nullptr;
    }
    auto loaded = readDurable(key);
    if (!loaded) {
        return nullptr;
    }

    const auto& config = configFor(key.category);
    auto in_category = std::count_if(m_entries.begin(), m_entries.end(),
                                     [&](const auto& item) { return item.first.category == key.category; });
    if ((std::size_t) in_category >= config.capacity) {
        evictColdest(lock, key.category);
    }
    spdlog::debug("SwrCache: restored {} from durable tier", key.str());
    return &m_entries.insert_or_assign(key, std::move(*loaded)).first->second;
}

void SwrCache::store(const std::unique_lock<std::mutex>& lock,
                     const CacheKey& key,
                     json payload,
                     std::optional<std::chrono::seconds> max_age) {
    const auto& config = configFor(key.category);
    const auto now = m_now();

    CacheEntry entry{.payload = std::move(payload),
                     .created_at = now,
                     .max_age = max_age.value_or(config.max_age),
                     .access_count = 0,
                     .last_accessed = now,
                     .etag = std::nullopt};

    auto existing = m_entries.find(key);
    if (existing != m_entries.end()) {
        entry.access_count = existing->second.access_count;
        entry.etag = existing->second.etag;
        existing->second = std::move(entry);
    } else {
        auto in_category = std::count_if(m_entries.begin(), m_entries.end(),
                                         [&](const auto& item) { return item.first.category == key.category; });
        if ((std::size_t) in_category >= config.capacity) {
            evictColdest(lock, key.category);
        }
        existing = m_entries.emplace(key, std::move(entry)).first;
    }

    if (m_settings.durable_dir) {
        writeDurable(key, existing->second);
    }
}

void SwrCache::evictColdest(const std::unique_lock<std::mutex>&, CacheCategory category) {
    std::vector<std::map<CacheKey, CacheEntry>::iterator> candidates;
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->first.category == category) {
            candidates.push_back(it);
        }
    }
    if (candidates.empty()) {
        return;
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a->second.access_count != b->second.access_count) {
            return a->second.access_count < b->second.access_count;
        }
        return a->second.last_accessed < b->second.last_accessed;
    });

    const std::size_t to_remove = (candidates.size() * EVICT_PERCENT + 99) / 100;
    for (std::size_t i = 0; i < to_remove; ++i) {
        m_entries.erase(candidates[i]);
    }
    m_stats.evictions += to_remove;
    spdlog::debug("SwrCache: evicted {} least used {} entries", to_remove, to_string(category));
}

void SwrCache::eraseKey(const std::unique_lock<std::mutex>&, const CacheKey& key) {
    m_entries.erase(key);
    if (m_settings.durable_dir) {
        removeDurable(key);
    }
}

void SwrCache::enqueueRefresh(const std::unique_lock<std::mutex>&,
                              const CacheKey& key,
                              const Fetcher& fetch,
                              std::optional<std::chrono::seconds> max_age) {
    bool already_queued = std::any_of(m_refresh_queue.begin(), m_refresh_queue.end(),
                                      [&](const RefreshTask& task) { return task.key == key; });
    if (already_queued) {
        return;
    }
    m_refresh_queue.push_back({.key = key, .fetch = fetch, .max_age = max_age});
    spdlog::debug("SwrCache: queued background refresh for {}", key.str());
    m_refresh_cond.notify_one();
}

void SwrCache::runRefresh(RefreshTask task) {
    try {
        json fresh = task.fetch();
        std::unique_lock<std::mutex> lock(m_mutex);
        if (isEmptyPayload(task.key.category, fresh)) {
            spdlog::debug("SwrCache: background refresh of {} returned nothing, keeping entry", task.key.str());
            return;
        }
        store(lock, task.key, std::move(fresh), task.max_age);
        m_stats.background_refreshes++;
        spdlog::debug("SwrCache: refreshed {} in background", task.key.str());
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.refresh_failures++;
        spdlog::warn("SwrCache: background refresh of {} failed: {}", task.key.str(), e.what());
    }
}

void SwrCache::refreshLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_refresh_cond.wait(lock, [this] { return m_stopping || !m_refresh_queue.empty(); });
        if (m_stopping) {
            break;
        }
        RefreshTask task = std::move(m_refresh_queue.front());
        m_refresh_queue.pop_front();

        lock.unlock();
        runRefresh(std::move(task));
        lock.lock();

        m_refresh_cond.wait_for(lock, m_settings.refresh_delay, [this] { return m_stopping; });
    }
}

std::size_t SwrCache::runPending() {
    std::size_t ran = 0;
    while (true) {
        RefreshTask task;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_refresh_queue.empty()) {
                break;
            }
            task = std::move(m_refresh_queue.front());
            m_refresh_queue.pop_front();
        }
        runRefresh(std::move(task));
        ++ran;
    }
    return ran;
}

std::size_t SwrCache::pendingRefreshCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_refresh_queue.size();
}

void SwrCache::invalidate(const CacheKey& key) {
    std::unique_lock<std::mutex> lock(m_mutex);
    eraseKey(lock, key);
    spdlog::debug("SwrCache: invalidated {}", key.str());
}

std::size_t SwrCache::invalidate(CacheCategory category, const std::string& id_prefix) {
    std::unique_lock<std::mutex> lock(m_mutex);
    std::size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->first.category == category && starts_with(it->first.id, id_prefix)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (m_settings.durable_dir) {
        const auto dir = *m_settings.durable_dir / to_string(category);
        const auto file_prefix = id_prefix.empty() ? std::string() : sanitize_file_name(id_prefix);
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            for (const auto& file : fs::directory_iterator(dir, ec)) {
                if (starts_with(file.path().filename().string(), file_prefix)) {
                    fs::remove(file.path(), ec);
                }
            }
        }
    }
    spdlog::info("SwrCache: invalidated {} {} entries matching '{}'", removed, to_string(category), id_prefix);
    return removed;
}

void SwrCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_refresh_queue.clear();
    if (m_settings.durable_dir) {
        std::error_code ec;
        for (const auto& child : fs::directory_iterator(*m_settings.durable_dir, ec)) {
            fs::remove_all(child.path(), ec);
        }
    }
    spdlog::info("SwrCache: cleared");
}

std::size_t SwrCache::sweepExpired() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_now();
    std::size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.isExpired(now)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("SwrCache: swept {} expired entries", removed);
    }
    return removed;
}

std::size_t SwrCache::cleanupDurable() {
    if (!m_settings.durable_dir) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::pair<fs::file_time_type, fs::path>> records;
    std::error_code ec;
    for (const auto& file : fs::recursive_directory_iterator(*m_settings.durable_dir, ec)) {
        if (file.is_regular_file(ec) && file.path().extension() == DURABLE_EXTENSION) {
            records.emplace_back(file.last_write_time(ec), file.path());
        }
    }
    if (records.size() <= m_settings.durable_max_records) {
        return 0;
    }

    std::sort(records.begin(), records.end());
    const std::size_t to_remove = records.size() - m_settings.durable_max_records;
    for (std::size_t i = 0; i < to_remove; ++i) {
        fs::remove(records[i].second, ec);
    }
    spdlog::info("SwrCache: removed {} old durable records", to_remove);
    return to_remove;
}

CacheStats SwrCache::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats result = m_stats;
    result.entries = m_entries.size();
    return result;
}

fs::path SwrCache::durablePath(const CacheKey& key) const {
    return *m_settings.durable_dir / to_string(key.category) / (sanitize_file_name(key.id) + DURABLE_EXTENSION);
}

void SwrCache::writeDurable(const CacheKey& key, const CacheEntry& entry) const {
    const auto path = durablePath(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    json record = {{"key", key.str()},
                   {"created_at_ms", to_epoch_ms(entry.created_at)},
                   {"max_age_s", entry.max_age.count()},
                   {"access_count", entry.access_count},
                   {"last_accessed_ms", to_epoch_ms(entry.last_accessed)},
                   {"payload", entry.payload}};
    if (entry.etag) {
        record["etag"] = *entry.etag;
    }

    std::ofstream o(path, std::ios::trunc);
    if (!o.is_open()) {
        spdlog::warn("SwrCache: cannot write durable record {}", path.string());
        return;
    }
    o << record.dump() << std::endl;
}

std::optional<CacheEntry> SwrCache::readDurable(const CacheKey& key) const {
    const auto path = durablePath(key);
    std::ifstream i(path);
    if (!i.is_open()) {
        return std::nullopt;
    }
    try {
        json record = json::parse(i);
        CacheEntry entry;
        entry.payload = record.at("payload");
        entry.created_at = from_epoch_ms(record.at("created_at_ms").get<std::int64_t>());
        entry.max_age = std::chrono::seconds(record.at("max_age_s").get<std::int64_t>());
        entry.access_count = record.value("access_count", std::uint64_t{0});
        entry.last_accessed =
            std::max(entry.created_at, from_epoch_ms(record.value("last_accessed_ms", std::int64_t{0})));
        if (record.contains("etag")) {
            entry.etag = record.at("etag").get<std::string>();
        }
        return entry;
    } catch (const json::exception& e) {
        spdlog::warn("SwrCache: discarding unreadable record {}: {}", path.string(), e.what());
        i.close();
        removeDurable(key);
        return std::nullopt;
    }
}

void SwrCache::removeDurable(const CacheKey& key) const {
    std::error_code ec;
    fs::remove(durablePath(key), ec);
}
