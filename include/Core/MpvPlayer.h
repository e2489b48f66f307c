#ifndef MPVPLAYER_H
#define MPVPLAYER_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "Core/Player.h"
#include "MpvInstance.h"

#include <mpv/stream_cb.h>

class MediaStreamReader;

// IPlayer on top of libmpv. Streams from the fetch cache are exposed to mpv
// through a private "reelcast://" protocol.
class MpvPlayer : public IPlayer {
  public:
    explicit MpvPlayer(PlayerOptions options);
    ~MpvPlayer() override;

    void load(const PlaybackSource& source, std::chrono::milliseconds timeout) override;
    void play() override;
    void pause() override;
    void setVolume(double volume) override;
    bool pollHealthy() override;

  private:
    static int openStream(void* user_data, char* uri, mpv_stream_cb_info* info);
    static std::int64_t readStream(void* cookie, char* buf, std::uint64_t nbytes);
    static std::int64_t seekStream(void* cookie, std::int64_t offset);
    static std::int64_t sizeStream(void* cookie);
    static void closeStream(void* cookie);

    PlayerOptions m_options;
    MpvInstance m_instance;
    std::shared_ptr<MediaStreamReader> m_stream;
    bool m_failed = false;
};

class MpvPlayerFactory : public IPlayerFactory {
  public:
    explicit MpvPlayerFactory(PlayerOptions options) : m_options(std::move(options)) {}
    std::unique_ptr<IPlayer> create() override { return std::make_unique<MpvPlayer>(m_options); }

  private:
    PlayerOptions m_options;
};

#endif // MPVPLAYER_H
