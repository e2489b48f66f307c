#ifndef MEDIADISKSTORE_H
#define MEDIADISKSTORE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "Core/Clock.h"

// Completed media files keyed by media id, with an index for capacity cleanup.
//
// Layout: <dir>/<id>.media for finished files, <dir>/<id>.part while a
// download is in progress, and <dir>/index.json for sizes and access times.
class MediaDiskStore {
  public:
    MediaDiskStore(std::filesystem::path dir, std::uint64_t max_bytes, WallNow now = realWallClock());

    // Path of the completed file for media_id, refreshing its access time.
    std::optional<std::filesystem::path> lookup(const std::string& media_id);
    std::filesystem::path partialPath(const std::string& media_id) const;

    // Promotes the partial file of media_id to a completed file.
    bool commit(const std::string& media_id);
    void discardPartial(const std::string& media_id);
    void remove(const std::string& media_id);

    // Deletes least recently accessed files until the budget is met.
    std::size_t enforceCapacity();
    std::uint64_t totalBytes() const;
    std::size_t fileCount() const;
    void clear();

  private:
    struct Record {
        std::uint64_t size = 0;
        std::chrono::system_clock::time_point last_access;
    };

    std::filesystem::path completePath(const std::string& media_id) const;
    void loadIndex();
    void saveIndex() const;

    std::filesystem::path m_dir;
    std::uint64_t m_max_bytes;
    WallNow m_now;

    mutable std::mutex m_mutex;
    std::map<std::string, Record> m_records;
};

#endif // MEDIADISKSTORE_H
