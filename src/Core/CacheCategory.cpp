#include "Core/CacheCategory.h"

#include <array>
#include <utility>

using namespace std::chrono_literals;

namespace {
    constexpr std::array<std::pair<CacheCategory, const char*>, 5> CATEGORY_NAMES = {{
        {CacheCategory::Default, "default"},
        {CacheCategory::MediaList, "media_list"},
        {CacheCategory::MediaMetadata, "media_metadata"},
        {CacheCategory::Profile, "profile"},
        {CacheCategory::AdList, "ad_list"},
    }};
}

const char* to_string(CacheCategory category) {
    for (const auto& [value, name] : CATEGORY_NAMES) {
        if (value == category)
            return name;
    }
    return "default";
}

std::optional<CacheCategory> cache_category_from_string(const std::string& name) {
    for (const auto& [value, text] : CATEGORY_NAMES) {
        if (name == text)
            return value;
    }
    return std::nullopt;
}

std::string CacheKey::str() const { return std::string(to_string(category)) + ":" + id; }

std::map<CacheCategory, CategoryConfig> default_category_configs() {
    return {
        {CacheCategory::Default, {.max_age = 10min, .capacity = 50, .stale_while_revalidate = true, .empty_list_field = ""}},
        {CacheCategory::MediaList,
         {.max_age = 60min, .capacity = 150, .stale_while_revalidate = true, .empty_list_field = "items"}},
        {CacheCategory::MediaMetadata,
         {.max_age = 2h, .capacity = 200, .stale_while_revalidate = true, .empty_list_field = ""}},
        {CacheCategory::Profile, {.max_age = 24h, .capacity = 40, .stale_while_revalidate = true, .empty_list_field = ""}},
        {CacheCategory::AdList, {.max_age = 30min, .capacity = 60, .stale_while_revalidate = true, .empty_list_field = "ads"}},
    };
}
