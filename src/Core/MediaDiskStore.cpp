#include "Core/MediaDiskStore.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <utility>
#include <vector>

#include "Utils.h"
#include "nlohmann/json.hpp"

using nlohmann::json;
namespace fs = std::filesystem;

namespace {
    constexpr const char* INDEX_FILENAME = "index.json";
    constexpr const char* COMPLETE_EXTENSION = ".media";
    constexpr const char* PARTIAL_EXTENSION = ".part";
}

MediaDiskStore::MediaDiskStore(fs::path dir, std::uint64_t max_bytes, WallNow now)
    : m_dir(std::move(dir)), m_max_bytes(max_bytes), m_now(std::move(now)) {
    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) {
        spdlog::warn("MediaDiskStore: cannot create {}: {}", m_dir.string(), ec.message());
    }
    loadIndex();
}

fs::path MediaDiskStore::completePath(const std::string& media_id) const {
    return m_dir / (sanitize_file_name(media_id) + COMPLETE_EXTENSION);
}

fs::path MediaDiskStore::partialPath(const std::string& media_id) const {
    return m_dir / (sanitize_file_name(media_id) + PARTIAL_EXTENSION);
}

std::optional<fs::path> MediaDiskStore::lookup(const std::string& media_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(media_id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    auto path = completePath(media_id);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        // The file vanished behind our back.
        m_records.erase(it);
        saveIndex();
        return std::nullopt;
    }
    it->second.last_access = m_now();
    saveIndex();
    return path;
}

bool MediaDiskStore::commit(const std::string& media_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    const auto partial = partialPath(media_id);
    const auto complete = completePath(media_id);
    fs::rename(partial, complete, ec);
    if (ec) {
        spdlog::warn("MediaDiskStore: cannot finalize {}: {}", partial.string(), ec.message());
        fs::remove(partial, ec);
        return false;
    }
    const auto size = fs::file_size(complete, ec);
    m_records[media_id] = Record{.size = ec ? 0 : static_cast<std::uint64_t>(size), .last_access = m_now()};
    saveIndex();
    spdlog::debug("MediaDiskStore: stored {} ({} bytes)", media_id, m_records[media_id].size);
    return true;
}

void MediaDiskStore::discardPartial(const std::string& media_id) {
    std::error_code ec;
    fs::remove(partialPath(media_id), ec);
}

void MediaDiskStore::remove(const std::string& media_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    fs::remove(completePath(media_id), ec);
    fs::remove(partialPath(media_id), ec);
    if (m_records.erase(media_id) > 0) {
        saveIndex();
    }
}

std::size_t MediaDiskStore::enforceCapacity() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::uint64_t total = 0;
    for (const auto& [id, record] : m_records) {
        total += record.size;
    }
    if (total <= m_max_bytes) {
        return 0;
    }

    std::vector<std::pair<std::chrono::system_clock::time_point, std::string>> by_age;
    for (const auto& [id, record] : m_records) {
        by_age.emplace_back(record.last_access, id);
    }
    std::sort(by_age.begin(), by_age.end());

    std::size_t removed = 0;
    std::error_code ec;
    for (const auto& [access, id] : by_age) {
        if (total <= m_max_bytes) {
            break;
        }
        total -= m_records[id].size;
        fs::remove(completePath(id), ec);
        m_records.erase(id);
        ++removed;
    }
    saveIndex();
    spdlog::info("MediaDiskStore: removed {} files to stay under {} bytes", removed, m_max_bytes);
    return removed;
}

std::uint64_t MediaDiskStore::totalBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::uint64_t total = 0;
    for (const auto& [id, record] : m_records) {
        total += record.size;
    }
    return total;
}

std::size_t MediaDiskStore::fileCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

void MediaDiskStore::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    for (const auto& child : fs::directory_iterator(m_dir, ec)) {
        fs::remove_all(child.path(), ec);
    }
    m_records.clear();
    saveIndex();
}

void MediaDiskStore::loadIndex() {
    std::ifstream i(m_dir / INDEX_FILENAME);
    if (!i.is_open()) {
        return;
    }
    try {
        json data = json::parse(i);
        if (!data.is_object()) {
            return;
        }
        std::error_code ec;
        for (auto& [id, value] : data.items()) {
            if (!fs::is_regular_file(completePath(id), ec)) {
                continue;
            }
            m_records[id] = Record{.size = value.value("size", std::uint64_t{0}),
                                   .last_access = from_epoch_ms(value.value("last_access_ms", std::int64_t{0}))};
        }
    } catch (const json::exception& e) {
        spdlog::warn("MediaDiskStore: ignoring unreadable index: {}", e.what());
    }
}

void MediaDiskStore::saveIndex() const {
    json data = json::object();
    for (const auto& [id, record] : m_records) {
        data[id] = {{"size", record.size}, {"last_access_ms", to_epoch_ms(record.last_access)}};
    }
    std::ofstream o(m_dir / INDEX_FILENAME, std::ios::trunc);
    if (o.is_open()) {
        o << std::setw(4) << data << std::endl;
    }
}
