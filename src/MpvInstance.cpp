#include "MpvInstance.h"
#include "Utils.h"
#include <stdexcept>
#include <utility>

MpvInstance::MpvInstance() : m_mpv(nullptr) {}

MpvInstance::~MpvInstance() {
    shutdown();
}

void MpvInstance::shutdown() {
    if (m_mpv) {
        // The only place the handle is destroyed.
        mpv_terminate_destroy(m_mpv);
        m_mpv = nullptr;
    }
}

MpvInstance::MpvInstance(MpvInstance&& other) noexcept 
    : m_mpv(other.m_mpv)
{
    other.m_mpv = nullptr; 
}

MpvInstance& MpvInstance::operator=(MpvInstance&& other) noexcept {
    if (this != &other) {
        shutdown();
        m_mpv = other.m_mpv;
        other.m_mpv = nullptr;
    }
    return *this;
}

void MpvInstance::initialize(const PlayerOptions& options, const std::string& context) {
    if (m_mpv) {
        return;
    }

    m_mpv = mpv_create();
    if (!m_mpv) {
        throw std::runtime_error("Failed to create MPV instance for " + context);
    }

    const std::pair<const char*, std::string> settings[] = {
        {"config", "no"},
        {"load-scripts", "no"},
        {"ytdl", "no"},
        {"input-default-bindings", "no"},
        {"input-media-keys", "no"},
        {"terminal", "no"},
        {"msg-level", "all=error"},
        {"vo", options.vo},
        {"hwdec", options.hwdec},
        // Players start paused and loop their clip until the feed moves on.
        {"pause", "yes"},
        {"loop-file", "inf"},
        {"cache", "yes"},
        {"demuxer-max-bytes", options.demuxer_max_bytes},
        {"timeout", options.network_timeout_s},
    };
    for (const auto& [name, value] : settings) {
        check_mpv_error(mpv_set_option_string(m_mpv, name, value.c_str()),
                        std::string("option '") + name + "' for " + context);
    }

    check_mpv_error(mpv_initialize(m_mpv), "mpv_initialize for " + context);
}

mpv_handle* MpvInstance::get() const {
    return m_mpv;
}
