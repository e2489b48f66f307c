#include "Core/ProgressiveFetchCache.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

#include "Core/UrlFallbackChain.h"
#include "Errors.h"
#include "Net/HttpClient.h"

namespace {
    bool is_success(int status) { return status >= 200 && status < 300; }
    bool wants_fallback(int status) { return status == 400 || status == 401; }
}

ProgressiveFetchCache::ProgressiveFetchCache(IHttpClient& http,
                                             TierSource tier_source,
                                             FetchCacheSettings settings,
                                             SteadyNow now)
    : m_http(http),
      m_tier_source(std::move(tier_source)),
      m_settings(std::move(settings)),
      m_now(std::move(now)),
      m_disk(m_settings.dir, m_settings.max_disk_bytes) {}

ProgressiveFetchCache::~ProgressiveFetchCache() {
    std::map<std::string, StreamEntry> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        doomed.swap(m_streams);
    }
    for (auto& [id, entry] : doomed) {
        entry.state->cancel();
    }
    // Futures join their producers as the map goes out of scope.
}

std::shared_ptr<MediaStreamReader> ProgressiveFetchCache::stream(const std::string& media_id, const std::string& url) {
    std::vector<StreamEntry> doomed; // destroyed after the lock is released
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_streams.find(media_id);
    if (it != m_streams.end()) {
        bool usable;
        {
            std::lock_guard<std::mutex> state_lock(it->second.state->mutex);
            usable = !it->second.state->error && !it->second.state->cancelled;
        }
        if (usable) {
            if (it->second.retention_deadline) {
                spdlog::info("ProgressiveFetchCache: warm reuse of {}", media_id);
                it->second.retention_deadline = m_now() + m_settings.retention;
            }
            return std::make_shared<MediaStreamReader>(it->second.state);
        }
        doomed.push_back(std::move(it->second));
        m_streams.erase(it);
    }

    auto state = std::make_shared<StreamState>(media_id);
    StreamEntry entry;
    entry.state = state;

    if (auto cached = m_disk.lookup(media_id)) {
        state->from_disk = true;
        state->url = cached->string();
        spdlog::debug("ProgressiveFetchCache: serving {} from {}", media_id, cached->string());
        entry.producer = std::async(std::launch::async, [this, state, path = *cached] {
            runProducer(state, [&] { produceFromDisk(state, path); });
        });
    } else {
        state->url = url;
        spdlog::debug("ProgressiveFetchCache: starting download of {} from {}", media_id, url);
        entry.producer = std::async(std::launch::async, [this, state, url] {
            runProducer(state, [&] { produceFromNetwork(state, url); });
        });
    }

    m_streams.emplace(media_id, std::move(entry));
    return std::make_shared<MediaStreamReader>(state);
}

void ProgressiveFetchCache::runProducer(const std::shared_ptr<StreamState>& state, const std::function<void()>& body) {
    try {
        body();
        onProducerFinished(state, true);
        state->finish();
    } catch (const std::exception& e) {
        if (!state->cancelled) {
            spdlog::warn("ProgressiveFetchCache: stream {} failed: {}", state->media_id, e.what());
        }
        onProducerFinished(state, false);
        state->fail(std::current_exception());
    }
}

void ProgressiveFetchCache::onProducerFinished(const std::shared_ptr<StreamState>& state, bool succeeded) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_streams.find(state->media_id);
    if (it == m_streams.end() || it->second.state != state) {
        return; // replaced or stopped meanwhile
    }
    if (succeeded) {
        it->second.retention_deadline = m_now() + m_settings.retention;
        spdlog::debug("ProgressiveFetchCache: {} complete, retained for {}s", state->media_id,
                      m_settings.retention.count());
    }
}

void ProgressiveFetchCache::produceFromNetwork(const std::shared_ptr<StreamState>& state, const std::string& url) {
    int status = fetchOnce(state, url);
    if (wants_fallback(status)) {
        for (const auto& variant : UrlFallbackChain::degradedVariants(url)) {
            spdlog::warn("ProgressiveFetchCache: HTTP {} for {}, trying {}", status, state->media_id, variant);
            status = fetchOnce(state, variant);
            if (!wants_fallback(status)) {
                break;
            }
        }
    }
    if (!is_success(status)) {
        throw NetworkError(status, "HTTP " + std::to_string(status) + " while streaming " + state->media_id);
    }
}

int ProgressiveFetchCache::fetchOnce(const std::shared_ptr<StreamState>& state, const std::string& url) {
    const auto part_path = m_disk.partialPath(state->media_id);
    std::ofstream part(part_path, std::ios::binary | std::ios::trunc);
    if (!part.is_open()) {
        spdlog::warn("ProgressiveFetchCache: cannot write {}, streaming without persistence", part_path.string());
    }

    std::string buffer;
    auto emit = [&](std::string piece) {
        if (part.is_open()) {
            part.write(piece.data(), static_cast<std::streamsize>(piece.size()));
        }
        state->emitChunk(std::move(piece));
    };

    HttpRequest request{.url = url, .range_start = 0, .timeout = m_settings.request_timeout};
    int status = 0;
    try {
        status = m_http.get(request, [&](const char* data, std::size_t size) {
            if (state->cancelled) {
                return false;
            }
            buffer.append(data, size);
            std::uint64_t received;
            bool was_ready;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->bytes_received += size;
                received = state->bytes_received;
                was_ready = state->ready;
            }

            const QualityTier tier = m_tier_source();
            std::size_t chunk_size = NetworkQualityEstimator::chunkSizeFor(tier);
            while (buffer.size() >= chunk_size) {
                emit(buffer.substr(0, chunk_size));
                buffer.erase(0, chunk_size);
                chunk_size = NetworkQualityEstimator::chunkSizeFor(m_tier_source());
            }

            if (!was_ready && received >= NetworkQualityEstimator::initialBufferFor(tier)) {
                spdlog::debug("ProgressiveFetchCache: {} ready after {} bytes ({})", state->media_id, received,
                              to_string(tier));
                state->markReady();
            }
            return true;
        });
    } catch (const std::exception&) {
        part.close();
        m_disk.discardPartial(state->media_id);
        throw;
    }

    if (state->cancelled) {
        part.close();
        m_disk.discardPartial(state->media_id);
        throw NetworkError(0, "stream for " + state->media_id + " was stopped");
    }
    if (!is_success(status)) {
        part.close();
        m_disk.discardPartial(state->media_id);
        return status;
    }

    if (!buffer.empty()) {
        emit(std::move(buffer));
    }
    part.close();
    if (!part.fail()) {
        m_disk.commit(state->media_id);
    }
    spdlog::info("ProgressiveFetchCache: {} streamed ({} bytes)", state->media_id, state->bytes_emitted);
    return status;
}

void ProgressiveFetchCache::produceFromDisk(const std::shared_ptr<StreamState>& state,
                                            const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw NetworkError(0, "cannot open cached file " + path.string());
    }
    state->markReady();

    while (!state->cancelled) {
        const std::size_t chunk_size = NetworkQualityEstimator::chunkSizeFor(m_tier_source());
        std::string piece(chunk_size, '\0');
        in.read(piece.data(), static_cast<std::streamsize>(chunk_size));
        piece.resize(static_cast<std::size_t>(in.gcount()));
        if (piece.empty()) {
            break;
        }
        state->emitChunk(std::move(piece));
    }
    if (state->cancelled) {
        throw NetworkError(0, "stream for " + state->media_id + " was stopped");
    }
}

void ProgressiveFetchCache::stopStreaming(const std::string& media_id) {
    std::optional<StreamEntry> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_streams.find(media_id);
        if (it == m_streams.end()) {
            return;
        }
        doomed = std::move(it->second);
        m_streams.erase(it);
    }
    doomed->state->cancel();
    spdlog::debug("ProgressiveFetchCache: stopped {}", media_id);
}

std::size_t ProgressiveFetchCache::sweepRetention() {
    std::vector<StreamEntry> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_now();
        for (auto it = m_streams.begin(); it != m_streams.end();) {
            bool failed;
            {
                std::lock_guard<std::mutex> state_lock(it->second.state->mutex);
                failed = it->second.state->error != nullptr;
            }
            const bool expired = it->second.retention_deadline && now >= *it->second.retention_deadline;
            if (expired || failed) {
                spdlog::debug("ProgressiveFetchCache: releasing {}", it->first);
                doomed.push_back(std::move(it->second));
                it = m_streams.erase(it);
            } else {
                ++it;
            }
        }
    }
    return doomed.size();
}

std::size_t ProgressiveFetchCache::enforceDiskBudget() { return m_disk.enforceCapacity(); }

void ProgressiveFetchCache::clearAll() {
    std::map<std::string, StreamEntry> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        doomed.swap(m_streams);
    }
    for (auto& [id, entry] : doomed) {
        entry.state->cancel();
    }
    for (auto& [id, entry] : doomed) {
        if (entry.producer.valid()) {
            entry.producer.wait();
        }
    }
    m_disk.clear();
    spdlog::info("ProgressiveFetchCache: cleared all streams and files");
}

std::size_t ProgressiveFetchCache::activeStreamCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_streams.size();
}

bool ProgressiveFetchCache::hasStream(const std::string& media_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_streams.count(media_id) > 0;
}

bool ProgressiveFetchCache::isRetained(const std::string& media_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_streams.find(media_id);
    return it != m_streams.end() && it->second.retention_deadline.has_value();
}

std::uint64_t ProgressiveFetchCache::bytesReceived(const std::string& media_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_streams.find(media_id);
    if (it == m_streams.end()) {
        return 0;
    }
    std::lock_guard<std::mutex> state_lock(it->second.state->mutex);
    return it->second.state->bytes_received;
}

MediaDiskStore& ProgressiveFetchCache::diskStore() { return m_disk; }
