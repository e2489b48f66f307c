#ifndef PERSISTENCEMANAGER_H
#define PERSISTENCEMANAGER_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "EngineConfig.h"
#include "MediaItem.h"
#include "nlohmann/json.hpp"

class PersistenceManager {
  public:
    PersistenceManager() = default;
    explicit PersistenceManager(std::filesystem::path session_file) : m_session_file(std::move(session_file)) {}

    // Throws std::runtime_error when the file is unreadable or holds no valid item.
    std::vector<MediaItem> loadFeed(const std::string& filename) const;

    // A missing file yields the defaults. Malformed files throw std::runtime_error.
    EngineConfig loadConfig(const std::string& filename) const;
    EngineConfig parseConfig(const nlohmann::json& root, const std::string& origin) const;

    // Session Persistence
    std::optional<std::string> loadLastMediaId() const;
    void saveSession(const std::string& last_media_id) const;

  private:
    // Helper to parse a single feed entry from the JSON array
    std::optional<MediaItem> parse_single_item(const nlohmann::json& item_entry) const;

    std::filesystem::path m_session_file = "reelcast_session.json";
};

#endif // PERSISTENCEMANAGER_H
