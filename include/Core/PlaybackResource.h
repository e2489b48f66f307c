#ifndef PLAYBACKRESOURCE_H
#define PLAYBACKRESOURCE_H

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "Core/Player.h"

enum class PlaybackState {
    Uninitialized,
    Initializing,
    Ready,
    Playing,
    Paused,
    Error,
    Disposed
};

const char* to_string(PlaybackState state);
bool is_usable(PlaybackState state);

/*!
@class PlaybackResource
@brief One player bound to one feed index.

Owned by the ResourcePool. Transitions follow
uninitialized -> initializing -> {ready | error}, ready <-> playing <-> paused,
and any state -> disposed. Illegal transitions throw std::logic_error.
Disposal happens exactly once; later calls are no-ops.
*/
class PlaybackResource {
  public:
    PlaybackResource(int index, std::string media_id, std::string url, std::unique_ptr<IPlayer> player);
    ~PlaybackResource();

    PlaybackResource(const PlaybackResource&) = delete;
    PlaybackResource& operator=(const PlaybackResource&) = delete;

    // Rethrows the player's error after moving to Error.
    void initialize(const PlaybackSource& source, std::chrono::milliseconds timeout);
    void play();
    void pause();
    void markError();
    bool pollHealthy();
    // Pauses and silences before releasing the player. Never throws.
    void dispose() noexcept;

    PlaybackState state() const;
    int index() const { return m_index; }
    const std::string& mediaId() const { return m_media_id; }
    const std::string& url() const { return m_url; }

    bool isPinned() const;
    void setPinned(bool pinned);

  private:
    void transition(PlaybackState to);

    const int m_index;
    const std::string m_media_id;
    const std::string m_url;

    mutable std::mutex m_mutex;
    std::unique_ptr<IPlayer> m_player;
    PlaybackState m_state = PlaybackState::Uninitialized;
    bool m_pinned = false;
};

// Non-owning view handed to callers. Turns into a no-op once the pool let go.
class PlaybackHandle {
  public:
    PlaybackHandle() = default;
    explicit PlaybackHandle(std::weak_ptr<PlaybackResource> resource) : m_resource(std::move(resource)) {}

    PlaybackState state() const;
    bool play();
    bool pause();
    int index() const;
    std::string url() const;
    bool expired() const { return m_resource.expired(); }

  private:
    std::weak_ptr<PlaybackResource> m_resource;
};

#endif // PLAYBACKRESOURCE_H
