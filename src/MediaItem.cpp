#include "MediaItem.h"

#include <utility>

using nlohmann::json;

void to_json(json& j, const MediaItem& item) {
    j = json{{"id", item.id},
             {"url", item.url},
             {"fallback_urls", item.fallback_urls},
             {"duration", item.duration_s},
             {"aspect_ratio", item.aspect_ratio}};
}

void from_json(const json& j, MediaItem& item) {
    item.id = j.at("id").get<std::string>();
    item.url = j.at("url").get<std::string>();
    item.fallback_urls = j.value("fallback_urls", std::vector<std::string>{});
    item.duration_s = j.value("duration", 0.0);
    item.aspect_ratio = j.value("aspect_ratio", 9.0 / 16.0);
}

StaticFeedSource::StaticFeedSource(std::vector<MediaItem> items) : m_items(std::move(items)) {}

std::size_t StaticFeedSource::itemCount() const { return m_items.size(); }

std::optional<MediaItem> StaticFeedSource::itemAt(int index) {
    if (index < 0 || index >= (int) m_items.size()) {
        return std::nullopt;
    }
    return m_items[index];
}
