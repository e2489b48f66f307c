#include "Core/MediaStream.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include "Errors.h"

void StreamState::emitChunk(std::string chunk) {
    if (chunk.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        chunk_offsets.push_back(bytes_emitted);
        bytes_emitted += chunk.size();
        chunks.push_back(std::move(chunk));
    }
    cond.notify_all();
}

void StreamState::markReady() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        ready = true;
    }
    cond.notify_all();
}

void StreamState::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        ready = true;
        done = true;
    }
    cond.notify_all();
}

void StreamState::fail(std::exception_ptr failure) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        error = std::move(failure);
        done = true;
    }
    cond.notify_all();
}

void StreamState::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
    }
    cond.notify_all();
}

MediaStreamReader::MediaStreamReader(std::shared_ptr<StreamState> state) : m_state(std::move(state)) {}

const std::string& MediaStreamReader::mediaId() const { return m_state->media_id; }

bool MediaStreamReader::waitReady(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    bool signalled = m_state->cond.wait_for(lock, timeout, [this] {
        return m_state->ready || m_state->done || m_state->cancelled;
    });
    if (m_state->error) {
        std::rethrow_exception(m_state->error);
    }
    return signalled && (m_state->ready || m_state->done);
}

std::optional<std::string> MediaStreamReader::nextChunk() {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    m_state->cond.wait(lock, [this] {
        return m_next_chunk < m_state->chunks.size() || m_state->done || m_state->cancelled;
    });
    if (m_next_chunk < m_state->chunks.size()) {
        m_position = m_state->chunk_offsets[m_next_chunk] + m_state->chunks[m_next_chunk].size();
        return m_state->chunks[m_next_chunk++];
    }
    if (m_state->error) {
        std::rethrow_exception(m_state->error);
    }
    if (m_state->cancelled && !m_state->done) {
        throw NetworkError(0, "stream for " + m_state->media_id + " was stopped");
    }
    return std::nullopt;
}

std::size_t MediaStreamReader::read(char* buffer, std::size_t size) {
    if (size == 0) {
        return 0;
    }
    std::unique_lock<std::mutex> lock(m_state->mutex);
    m_state->cond.wait(lock, [this] {
        return m_position < m_state->bytes_emitted || m_state->done || m_state->cancelled;
    });
    if (m_position >= m_state->bytes_emitted) {
        if (m_state->error) {
            std::rethrow_exception(m_state->error);
        }
        if (m_state->cancelled && !m_state->done) {
            throw NetworkError(0, "stream for " + m_state->media_id + " was stopped");
        }
        return 0;
    }

    const auto& offsets = m_state->chunk_offsets;
    auto it = std::upper_bound(offsets.begin(), offsets.end(), m_position);
    std::size_t index = static_cast<std::size_t>(std::distance(offsets.begin(), it)) - 1;

    std::size_t copied = 0;
    while (copied < size && index < m_state->chunks.size()) {
        const auto& chunk = m_state->chunks[index];
        const std::size_t within = static_cast<std::size_t>(m_position - offsets[index]);
        const std::size_t n = std::min(size - copied, chunk.size() - within);
        std::memcpy(buffer + copied, chunk.data() + within, n);
        copied += n;
        m_position += n;
        ++index;
    }
    m_next_chunk = index;
    return copied;
}

bool MediaStreamReader::seek(std::uint64_t offset) {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    m_state->cond.wait(lock, [&] {
        return offset <= m_state->bytes_emitted || m_state->done || m_state->cancelled;
    });
    if (offset > m_state->bytes_emitted) {
        return false;
    }
    m_position = offset;
    // Chunk reads resume at the first chunk starting at or after the offset.
    auto it = std::lower_bound(m_state->chunk_offsets.begin(), m_state->chunk_offsets.end(), offset);
    m_next_chunk = static_cast<std::size_t>(std::distance(m_state->chunk_offsets.begin(), it));
    return true;
}

std::uint64_t MediaStreamReader::position() const { return m_position; }

std::optional<std::uint64_t> MediaStreamReader::totalSize() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->done && !m_state->error) {
        return m_state->bytes_emitted;
    }
    return std::nullopt;
}
