#include "Core/CachedFeedSource.h"

#include <spdlog/spdlog.h>

#include <string>

#include "Core/SwrCache.h"

using nlohmann::json;

namespace {
    constexpr const char* PAGE_KEY_PREFIX = "feed:page:";
}

void to_json(json& j, const FeedPage& page) { j = json{{"items", page.items}}; }

void from_json(const json& j, FeedPage& page) { page.items = j.value("items", std::vector<MediaItem>{}); }

CachedFeedSource::CachedFeedSource(IFeedSource& upstream, SwrCache& cache, std::size_t page_size)
    : m_upstream(upstream), m_cache(cache), m_page_size(page_size == 0 ? 1 : page_size) {}

std::size_t CachedFeedSource::itemCount() const { return m_upstream.itemCount(); }

FeedPage CachedFeedSource::fetchPage(std::size_t page) const {
    FeedPage result;
    const std::size_t first = page * m_page_size;
    for (std::size_t i = first; i < first + m_page_size; ++i) {
        auto item = m_upstream.itemAt(static_cast<int>(i));
        if (!item) {
            break;
        }
        result.items.push_back(std::move(*item));
    }
    spdlog::debug("CachedFeedSource: fetched page {} ({} items)", page, result.items.size());
    return result;
}

std::optional<MediaItem> CachedFeedSource::itemAt(int index) {
    if (index < 0 || (std::size_t) index >= itemCount()) {
        return std::nullopt;
    }
    const std::size_t page = static_cast<std::size_t>(index) / m_page_size;
    const CacheKey key{.category = CacheCategory::MediaList, .id = PAGE_KEY_PREFIX + std::to_string(page)};

    FeedPage cached = m_cache.get<FeedPage>(key, [this, page] { return fetchPage(page); });
    const std::size_t offset = static_cast<std::size_t>(index) % m_page_size;
    if (offset >= cached.items.size()) {
        return std::nullopt;
    }
    return cached.items[offset];
}

void CachedFeedSource::invalidate() { m_cache.invalidate(CacheCategory::MediaList, PAGE_KEY_PREFIX); }
