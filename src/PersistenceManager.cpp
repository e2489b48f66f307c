#include "PersistenceManager.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <stdexcept> // For std::runtime_error

#include "Core/PreloadStrategy.h"

using nlohmann::json;

namespace {
    constexpr std::uint64_t BYTES_PER_MB = 1024ULL * 1024ULL;

    // Copies obj[key] into out when present. Type mismatches name the file and key.
    template <typename T>
    bool read_value(const json& obj, const char* key, T& out, const std::string& origin) {
        if (!obj.is_object() || !obj.contains(key)) {
            return false;
        }
        try {
            out = obj.at(key).get<T>();
        } catch (const json::exception& e) {
            throw std::runtime_error(origin + ": invalid value for '" + key + "': " + e.what());
        }
        return true;
    }

    const json& section(const json& root, const char* key, const std::string& origin) {
        static const json EMPTY = json::object();
        if (!root.contains(key)) {
            return EMPTY;
        }
        const json& value = root.at(key);
        if (!value.is_object()) {
            throw std::runtime_error(origin + ": '" + key + "' must be an object");
        }
        return value;
    }

    void apply_category_overrides(const json& categories, SwrCacheSettings& settings, const std::string& origin) {
        for (const auto& [name, value] : categories.items()) {
            auto category = cache_category_from_string(name);
            if (!category) {
                spdlog::warn("Config: {} names unknown cache category '{}', ignoring it", origin, name);
                continue;
            }
            CategoryConfig& config = settings.categories[*category];
            long long max_age_s;
            if (read_value(value, "max_age_s", max_age_s, origin)) {
                config.max_age = std::chrono::seconds(max_age_s);
            }
            read_value(value, "capacity", config.capacity, origin);
            read_value(value, "stale_while_revalidate", config.stale_while_revalidate, origin);
            read_value(value, "empty_list_field", config.empty_list_field, origin);
        }
    }
}

const char* to_string(DeviceClass device_class) {
    return device_class == DeviceClass::LowEnd ? "low_end" : "high_end";
}

PoolSettings pool_defaults_for(DeviceClass device_class) {
    if (device_class == DeviceClass::LowEnd) {
        return PoolSettings{.capacity = 3, .init_timeout = std::chrono::seconds(15), .route_through_fetch_cache = true};
    }
    return PoolSettings{.capacity = 7, .init_timeout = std::chrono::seconds(10), .route_through_fetch_cache = true};
}

std::optional<MediaItem> PersistenceManager::parse_single_item(const json& item_entry) const {
    if (!item_entry.is_object() || !item_entry.contains("id") || !item_entry.contains("url")) {
        return std::nullopt; // Not a valid item object
    }

    MediaItem item;
    try {
        item = item_entry.get<MediaItem>();
    } catch (const json::exception& e) {
        spdlog::debug("PersistenceManager: skipping feed entry: {}", e.what());
        return std::nullopt;
    }

    if (item.id.empty() || (item.url.empty() && item.fallback_urls.empty())) {
        return std::nullopt; // Needs an id and at least one URL
    }
    return item;
}

std::vector<MediaItem> PersistenceManager::loadFeed(const std::string& filename) const {
    std::ifstream i(filename);
    if (!i.is_open()) {
        throw std::runtime_error("Could not open feed file: " + filename);
    }

    std::vector<MediaItem> items;
    try {
        json root_json = json::parse(i, nullptr, true, true); // Allow comments
        const json* entries = &root_json;
        if (root_json.is_object() && root_json.contains("items")) {
            entries = &root_json.at("items");
        }
        if (!entries->is_array()) {
            throw std::runtime_error(filename + " must contain a JSON array of items.");
        }
        for (const auto& item_entry_json : *entries) {
            if (auto parsed_item = parse_single_item(item_entry_json)) {
                items.push_back(*parsed_item);
            } else {
                spdlog::warn("PersistenceManager: skipping invalid entry in {}", filename);
            }
        }
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + filename + ": " + std::string(e.what()));
    }

    if (items.empty()) {
        throw std::runtime_error(filename + " is empty or contains no valid feed items.");
    }
    return items;
}

EngineConfig PersistenceManager::loadConfig(const std::string& filename) const {
    std::ifstream i(filename);
    if (!i.is_open()) {
        spdlog::info("PersistenceManager: {} not found, using defaults", filename);
        return parseConfig(json::object(), filename);
    }

    json root;
    try {
        root = json::parse(i, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + filename + ": " + std::string(e.what()));
    }
    if (!root.is_object()) {
        throw std::runtime_error(filename + " must contain a JSON object.");
    }
    return parseConfig(root, filename);
}

EngineConfig PersistenceManager::parseConfig(const json& root, const std::string& origin) const {
    EngineConfig config;

    std::string device_class;
    if (read_value(root, "device_class", device_class, origin)) {
        if (device_class == "low_end") {
            config.device_class = DeviceClass::LowEnd;
        } else if (device_class == "high_end") {
            config.device_class = DeviceClass::HighEnd;
        } else {
            throw std::runtime_error(origin + ": unknown device_class '" + device_class + "'");
        }
    }
    read_value(root, "preload_profile", config.preload_profile, origin);
    std::string cache_dir;
    if (read_value(root, "cache_dir", cache_dir, origin)) {
        config.cache_dir = cache_dir;
    }
    std::string session_file;
    if (read_value(root, "session_file", session_file, origin)) {
        config.session_file = session_file;
    }
    read_value(root, "log_level", config.log_level, origin);
    read_value(root, "log_file", config.log_file, origin);

    // --- pool ---
    config.pool = pool_defaults_for(config.device_class);
    const json& pool = section(root, "pool", origin);
    read_value(pool, "capacity", config.pool.capacity, origin);
    long long init_timeout_ms;
    if (read_value(pool, "init_timeout_ms", init_timeout_ms, origin)) {
        config.pool.init_timeout = std::chrono::milliseconds(init_timeout_ms);
    }
    read_value(pool, "route_through_fetch_cache", config.pool.route_through_fetch_cache, origin);
    if (config.pool.capacity == 0) {
        throw std::runtime_error(origin + ": pool.capacity must be at least 1");
    }

    // --- network ---
    const json& network = section(root, "network", origin);
    read_value(network, "probe_url", config.network.probe_url, origin);
    read_value(network, "probe_bytes", config.network.probe_bytes, origin);
    long long millis;
    if (read_value(network, "probe_timeout_ms", millis, origin)) {
        config.network.probe_timeout = std::chrono::milliseconds(millis);
    }
    long long seconds;
    if (read_value(network, "probe_interval_s", seconds, origin)) {
        config.network.probe_interval = std::chrono::seconds(seconds);
    }
    const json& thresholds = section(network, "thresholds", origin);
    read_value(thresholds, "low", config.network.low_kbps, origin);
    read_value(thresholds, "medium", config.network.medium_kbps, origin);
    read_value(thresholds, "high", config.network.high_kbps, origin);
    if (!(config.network.low_kbps <= config.network.medium_kbps &&
          config.network.medium_kbps <= config.network.high_kbps)) {
        throw std::runtime_error(origin + ": network.thresholds must ascend from low to high");
    }

    // --- fetch cache ---
    config.fetch_cache.dir = config.cache_dir / "media";
    const json& fetch = section(root, "fetch_cache", origin);
    if (read_value(fetch, "retention_s", seconds, origin)) {
        config.fetch_cache.retention = std::chrono::seconds(seconds);
    }
    std::uint64_t max_disk_mb;
    if (read_value(fetch, "max_disk_mb", max_disk_mb, origin)) {
        config.fetch_cache.max_disk_bytes = max_disk_mb * BYTES_PER_MB;
    }
    if (read_value(fetch, "request_timeout_ms", millis, origin)) {
        config.fetch_cache.request_timeout = std::chrono::milliseconds(millis);
    }

    // --- metadata cache ---
    const json& metadata = section(root, "metadata_cache", origin);
    read_value(metadata, "durable", config.durable_metadata, origin);
    read_value(metadata, "max_records", config.metadata_cache.durable_max_records, origin);
    if (read_value(metadata, "refresh_delay_ms", millis, origin)) {
        config.metadata_cache.refresh_delay = std::chrono::milliseconds(millis);
    }
    apply_category_overrides(section(metadata, "categories", origin), config.metadata_cache, origin);
    if (config.durable_metadata) {
        config.metadata_cache.durable_dir = config.cache_dir / "metadata";
    }

    // --- player ---
    const json& player = section(root, "player", origin);
    read_value(player, "vo", config.player.vo, origin);
    read_value(player, "hwdec", config.player.hwdec, origin);

    return config;
}

std::optional<std::string> PersistenceManager::loadLastMediaId() const {
    std::ifstream i(m_session_file);
    if (!i.is_open())
        return std::nullopt;

    try {
        json session_data;
        i >> session_data;
        if (session_data.is_object() && session_data.contains("last_media_id") &&
            session_data["last_media_id"].is_string()) {
            return session_data["last_media_id"].get<std::string>();
        }
    } catch (const json::parse_error& e) {
        spdlog::warn("PersistenceManager: ignoring unreadable {}: {}", m_session_file.string(), e.what());
    }
    return std::nullopt;
}

void PersistenceManager::saveSession(const std::string& last_media_id) const {
    if (last_media_id.empty())
        return;
    json session_data;
    session_data["last_media_id"] = last_media_id;
    std::ofstream o(m_session_file);
    if (o.is_open()) {
        o << std::setw(4) << session_data << std::endl;
    } else {
        spdlog::warn("PersistenceManager: could not write {}", m_session_file.string());
    }
}
