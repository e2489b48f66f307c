#ifndef PLAYER_H
#define PLAYER_H

#include <chrono>
#include <memory>
#include <string>

class MediaStreamReader;

// What a player is asked to open: a URL, or bytes from the fetch cache.
struct PlaybackSource {
    std::string url;
    std::shared_ptr<MediaStreamReader> stream;
};

// One decode/playback instance. load() throws MediaError subclasses.
class IPlayer {
  public:
    virtual ~IPlayer() = default;

    virtual void load(const PlaybackSource& source, std::chrono::milliseconds timeout) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void setVolume(double volume) = 0;
    // Drains pending events. Returns false once the player hit a fatal error.
    virtual bool pollHealthy() = 0;
};

class IPlayerFactory {
  public:
    virtual ~IPlayerFactory() = default;
    virtual std::unique_ptr<IPlayer> create() = 0;
};

#endif // PLAYER_H
