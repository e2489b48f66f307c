#include "Core/PlaybackResource.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

const char* to_string(PlaybackState state) {
    switch (state) {
    case PlaybackState::Uninitialized:
        return "uninitialized";
    case PlaybackState::Initializing:
        return "initializing";
    case PlaybackState::Ready:
        return "ready";
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Paused:
        return "paused";
    case PlaybackState::Error:
        return "error";
    case PlaybackState::Disposed:
        return "disposed";
    }
    return "unknown";
}

bool is_usable(PlaybackState state) {
    return state == PlaybackState::Ready || state == PlaybackState::Playing || state == PlaybackState::Paused;
}

namespace {
    bool is_allowed(PlaybackState from, PlaybackState to) {
        if (to == PlaybackState::Disposed) {
            return true;
        }
        switch (from) {
        case PlaybackState::Uninitialized:
            return to == PlaybackState::Initializing;
        case PlaybackState::Initializing:
            return to == PlaybackState::Ready || to == PlaybackState::Error;
        case PlaybackState::Ready:
            return to == PlaybackState::Playing || to == PlaybackState::Paused || to == PlaybackState::Error;
        case PlaybackState::Playing:
            return to == PlaybackState::Paused || to == PlaybackState::Error;
        case PlaybackState::Paused:
            return to == PlaybackState::Playing || to == PlaybackState::Error;
        case PlaybackState::Error:
        case PlaybackState::Disposed:
            return false;
        }
        return false;
    }
}

PlaybackResource::PlaybackResource(int index, std::string media_id, std::string url, std::unique_ptr<IPlayer> player)
    : m_index(index), m_media_id(std::move(media_id)), m_url(std::move(url)), m_player(std::move(player)) {}

PlaybackResource::~PlaybackResource() { dispose(); }

void PlaybackResource::transition(PlaybackState to) {
    // m_mutex is held by the caller.
    if (!is_allowed(m_state, to)) {
        throw std::logic_error(std::string("PlaybackResource: illegal transition ") + to_string(m_state) + " -> " +
                               to_string(to) + " for index " + std::to_string(m_index));
    }
    m_state = to;
}

void PlaybackResource::initialize(const PlaybackSource& source, std::chrono::milliseconds timeout) {
    IPlayer* player;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transition(PlaybackState::Initializing);
        player = m_player.get();
    }

    // Loading blocks, so it runs without the lock. The pool does not dispose
    // a resource that is still initializing.
    try {
        player->load(source, timeout);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == PlaybackState::Initializing) {
            transition(PlaybackState::Error);
        }
        spdlog::debug("PlaybackResource: index {} failed to load {}: {}", m_index, m_url, e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == PlaybackState::Initializing) {
        transition(PlaybackState::Ready);
    }
}

void PlaybackResource::play() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == PlaybackState::Playing) {
        return;
    }
    PlaybackState previous = m_state;
    transition(PlaybackState::Playing);
    try {
        m_player->play();
    } catch (const std::exception&) {
        m_state = previous;
        throw;
    }
}

void PlaybackResource::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == PlaybackState::Paused) {
        return;
    }
    PlaybackState previous = m_state;
    transition(PlaybackState::Paused);
    try {
        m_player->pause();
    } catch (const std::exception&) {
        m_state = previous;
        throw;
    }
}

void PlaybackResource::markError() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == PlaybackState::Error || m_state == PlaybackState::Disposed) {
        return;
    }
    transition(PlaybackState::Error);
}

bool PlaybackResource::pollHealthy() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!is_usable(m_state)) {
        return m_state != PlaybackState::Error;
    }
    if (!m_player->pollHealthy()) {
        transition(PlaybackState::Error);
        return false;
    }
    return true;
}

void PlaybackResource::dispose() noexcept {
    std::unique_ptr<IPlayer> player;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == PlaybackState::Disposed) {
            return;
        }
        m_state = PlaybackState::Disposed;
        player = std::move(m_player);
    }
    if (!player) {
        return;
    }
    try {
        player->pause();
        player->setVolume(0.0);
    } catch (const std::exception& e) {
        spdlog::warn("PlaybackResource: error silencing index {} before disposal: {}", m_index, e.what());
    }
    player.reset();
    spdlog::debug("PlaybackResource: disposed index {} ({})", m_index, m_media_id);
}

PlaybackState PlaybackResource::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool PlaybackResource::isPinned() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pinned;
}

void PlaybackResource::setPinned(bool pinned) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pinned = pinned;
}

PlaybackState PlaybackHandle::state() const {
    if (auto resource = m_resource.lock()) {
        return resource->state();
    }
    return PlaybackState::Disposed;
}

bool PlaybackHandle::play() {
    auto resource = m_resource.lock();
    if (!resource || !is_usable(resource->state())) {
        return false;
    }
    try {
        resource->play();
    } catch (const std::logic_error& e) {
        // The pool disposed the resource between the check and the call.
        spdlog::debug("PlaybackHandle: play ignored: {}", e.what());
        return false;
    }
    return true;
}

bool PlaybackHandle::pause() {
    auto resource = m_resource.lock();
    if (!resource || !is_usable(resource->state())) {
        return false;
    }
    try {
        resource->pause();
    } catch (const std::logic_error& e) {
        // The pool disposed the resource between the check and the call.
        spdlog::debug("PlaybackHandle: pause ignored: {}", e.what());
        return false;
    }
    return true;
}

int PlaybackHandle::index() const {
    auto resource = m_resource.lock();
    return resource ? resource->index() : -1;
}

std::string PlaybackHandle::url() const {
    auto resource = m_resource.lock();
    return resource ? resource->url() : std::string();
}
