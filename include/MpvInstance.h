#ifndef MPVINSTANCE_H
#define MPVINSTANCE_H

#include <string>
#include <mpv/client.h>

struct PlayerOptions {
    std::string vo = "null";
    std::string hwdec = "auto-safe";
    std::string network_timeout_s = "10";
    std::string demuxer_max_bytes = "8MiB";
};

class MpvInstance {
public:
    MpvInstance();
    ~MpvInstance();

    MpvInstance(const MpvInstance&) = delete;
    MpvInstance& operator=(const MpvInstance&) = delete;
    MpvInstance(MpvInstance&& other) noexcept;
    MpvInstance& operator=(MpvInstance&& other) noexcept;

    // Creates a paused, looping instance. Throws std::runtime_error on failure.
    void initialize(const PlayerOptions& options, const std::string& context);
    void shutdown();
    mpv_handle* get() const;

private:
    mpv_handle* m_mpv;
};

#endif // MPVINSTANCE_H
