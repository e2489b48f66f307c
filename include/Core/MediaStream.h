#ifndef MEDIASTREAM_H
#define MEDIASTREAM_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Buffered state of one progressive download, shared by its producer and readers.
// Chunks are appended in order and never modified.
struct StreamState {
    explicit StreamState(std::string id) : media_id(std::move(id)) {}

    const std::string media_id;

    mutable std::mutex mutex;
    std::condition_variable cond;
    std::vector<std::string> chunks;
    std::vector<std::uint64_t> chunk_offsets; // absolute offset of each chunk
    std::uint64_t bytes_received = 0;
    std::uint64_t bytes_emitted = 0;
    std::string url;
    bool from_disk = false;
    bool ready = false;
    bool done = false;
    std::exception_ptr error;
    std::atomic<bool> cancelled{false};

    // Producer side, all take the lock themselves.
    void emitChunk(std::string chunk);
    void markReady();
    void finish();
    void fail(std::exception_ptr failure);
    void cancel();
};

/*!
@class MediaStreamReader
@brief Lazy byte sequence over a StreamState.

Reads block until the producer delivered the requested bytes, finished, or
failed. A failure is rethrown to the reader. Each reader keeps its own
position, so a warm stream can be consumed again from the start.
*/
class MediaStreamReader {
  public:
    explicit MediaStreamReader(std::shared_ptr<StreamState> state);

    const std::string& mediaId() const;

    // Waits for the readiness signal. Returns false on timeout.
    bool waitReady(std::chrono::milliseconds timeout) const;

    // Next whole chunk, nullopt at end of stream.
    std::optional<std::string> nextChunk();

    // Byte interface for decoders. Returns 0 at end of stream.
    std::size_t read(char* buffer, std::size_t size);
    // Blocks until offset is reachable. Returns false past the end.
    bool seek(std::uint64_t offset);
    std::uint64_t position() const;
    // Known once the producer finished.
    std::optional<std::uint64_t> totalSize() const;

  private:
    std::shared_ptr<StreamState> m_state;
    std::size_t m_next_chunk = 0;
    std::uint64_t m_position = 0;
};

#endif // MEDIASTREAM_H
