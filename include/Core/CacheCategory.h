#ifndef CACHECATEGORY_H
#define CACHECATEGORY_H

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class CacheCategory {
    Default,
    MediaList,
    MediaMetadata,
    Profile,
    AdList
};

const char* to_string(CacheCategory category);
std::optional<CacheCategory> cache_category_from_string(const std::string& name);

struct CacheKey {
    CacheCategory category = CacheCategory::Default;
    std::string id;

    std::string str() const;
    bool operator==(const CacheKey& other) const { return category == other.category && id == other.id; }
    bool operator<(const CacheKey& other) const {
        return category != other.category ? category < other.category : id < other.id;
    }
};

struct CategoryConfig {
    std::chrono::seconds max_age;
    std::size_t capacity;
    bool stale_while_revalidate;
    // A payload whose field of this name is an empty array counts as empty.
    std::string empty_list_field;
};

std::map<CacheCategory, CategoryConfig> default_category_configs();

#endif // CACHECATEGORY_H
