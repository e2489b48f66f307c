#include "Core/MpvPlayer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include "Core/MediaStream.h"
#include "Errors.h"
#include "Utils.h"

namespace {
    constexpr const char* STREAM_PROTOCOL = "reelcast";
    constexpr double MAX_EVENT_WAIT_SECONDS = 0.25;
}

MpvPlayer::MpvPlayer(PlayerOptions options) : m_options(std::move(options)) {}

MpvPlayer::~MpvPlayer() {
    // mpv closes any open reelcast:// streams while terminating.
    m_instance.shutdown();
}

void MpvPlayer::load(const PlaybackSource& source, std::chrono::milliseconds timeout) {
    m_instance.initialize(m_options, source.url);
    mpv_handle* handle = m_instance.get();

    std::string target = source.url;
    if (source.stream) {
        m_stream = source.stream;
        check_mpv_error(mpv_stream_cb_add_ro(handle, STREAM_PROTOCOL, this, &MpvPlayer::openStream),
                        "mpv_stream_cb_add_ro");
        target = std::string(STREAM_PROTOCOL) + "://" + source.stream->mediaId();
    }

    const char* cmd[] = {"loadfile", target.c_str(), nullptr};
    check_mpv_error(mpv_command(handle, cmd), "loadfile " + target);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto remaining = std::chrono::duration<double>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0.0) {
            throw TimeoutError("MpvPlayer: " + source.url + " did not load within " +
                               std::to_string(timeout.count()) + "ms");
        }

        mpv_event* event = mpv_wait_event(handle, std::min(remaining, MAX_EVENT_WAIT_SECONDS));
        switch (event->event_id) {
        case MPV_EVENT_FILE_LOADED:
            spdlog::debug("MpvPlayer: loaded {}", target);
            return;
        case MPV_EVENT_END_FILE: {
            auto* end = static_cast<mpv_event_end_file*>(event->data);
            if (end->reason == MPV_END_FILE_REASON_ERROR && end->error == MPV_ERROR_UNKNOWN_FORMAT) {
                throw UnsupportedFormatError("MpvPlayer: unrecognized format at " + source.url);
            }
            const std::string reason =
                end->reason == MPV_END_FILE_REASON_ERROR ? mpv_error_string(end->error) : "ended before loading";
            throw NetworkError(0, "MpvPlayer: " + source.url + ": " + reason);
        }
        case MPV_EVENT_SHUTDOWN:
            throw NetworkError(0, "MpvPlayer: instance shut down while loading " + source.url);
        default:
            break;
        }
    }
}

void MpvPlayer::play() {
    check_mpv_error(mpv_set_property_string(m_instance.get(), "pause", "no"), "resume playback");
}

void MpvPlayer::pause() {
    if (!m_instance.get()) {
        return;
    }
    check_mpv_error(mpv_set_property_string(m_instance.get(), "pause", "yes"), "pause playback");
}

void MpvPlayer::setVolume(double volume) {
    if (!m_instance.get()) {
        return;
    }
    check_mpv_error(mpv_set_property(m_instance.get(), "volume", MPV_FORMAT_DOUBLE, &volume), "set volume");
}

bool MpvPlayer::pollHealthy() {
    mpv_handle* handle = m_instance.get();
    if (!handle) {
        return !m_failed;
    }
    while (true) {
        mpv_event* event = mpv_wait_event(handle, 0);
        if (event->event_id == MPV_EVENT_NONE) {
            break;
        }
        if (event->event_id == MPV_EVENT_END_FILE) {
            auto* end = static_cast<mpv_event_end_file*>(event->data);
            if (end->reason == MPV_END_FILE_REASON_ERROR) {
                spdlog::warn("MpvPlayer: playback error: {}", mpv_error_string(end->error));
                m_failed = true;
            }
        } else if (event->event_id == MPV_EVENT_SHUTDOWN) {
            m_failed = true;
        }
    }
    return !m_failed;
}

int MpvPlayer::openStream(void* user_data, char* uri, mpv_stream_cb_info* info) {
    auto* self = static_cast<MpvPlayer*>(user_data);
    if (!self->m_stream) {
        spdlog::warn("MpvPlayer: no stream attached for {}", uri);
        return MPV_ERROR_LOADING_FAILED;
    }
    // Every open gets an independent cursor over the shared buffer.
    auto reader = std::make_unique<MediaStreamReader>(*self->m_stream);
    if (!reader->seek(0)) {
        return MPV_ERROR_LOADING_FAILED;
    }
    // mpv owns the cookie until close_fn.
    info->cookie = reader.release();
    info->read_fn = &MpvPlayer::readStream;
    info->seek_fn = &MpvPlayer::seekStream;
    info->size_fn = &MpvPlayer::sizeStream;
    info->close_fn = &MpvPlayer::closeStream;
    return 0;
}

std::int64_t MpvPlayer::readStream(void* cookie, char* buf, std::uint64_t nbytes) {
    auto* reader = static_cast<MediaStreamReader*>(cookie);
    try {
        return static_cast<std::int64_t>(reader->read(buf, static_cast<std::size_t>(nbytes)));
    } catch (const std::exception& e) {
        // Exceptions cannot cross into mpv; it sees a read error instead.
        spdlog::warn("MpvPlayer: read from {} failed: {}", reader->mediaId(), e.what());
        return -1;
    }
}

std::int64_t MpvPlayer::seekStream(void* cookie, std::int64_t offset) {
    auto* reader = static_cast<MediaStreamReader*>(cookie);
    if (offset < 0 || !reader->seek(static_cast<std::uint64_t>(offset))) {
        return MPV_ERROR_GENERIC;
    }
    return offset;
}

std::int64_t MpvPlayer::sizeStream(void* cookie) {
    auto* reader = static_cast<MediaStreamReader*>(cookie);
    if (auto size = reader->totalSize()) {
        return static_cast<std::int64_t>(*size);
    }
    return MPV_ERROR_UNSUPPORTED;
}

void MpvPlayer::closeStream(void* cookie) {
    std::unique_ptr<MediaStreamReader> reader(static_cast<MediaStreamReader*>(cookie));
}
