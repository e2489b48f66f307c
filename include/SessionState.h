#ifndef SESSIONSTATE_H
#define SESSIONSTATE_H

#include <chrono>
#include <string>

#include "Core/NetworkQualityEstimator.h"

/**
 * @struct SessionState
 * @brief Engine state owned by the actor thread.
 */
struct SessionState {
    // Viewport
    int viewport_index = -1;
    std::string current_media_id;
    bool autoplay = true;

    // Connectivity
    ConnectivityState connectivity;
    bool slow_network_profile_active = false;

    // Maintenance timers
    std::chrono::steady_clock::time_point last_cache_sweep;
    std::chrono::steady_clock::time_point last_disk_cleanup;

    // Session Statistics & Lifecycle
    std::chrono::steady_clock::time_point session_start_time;
    int viewport_changes = 0;
    int playback_starts = 0;

    SessionState()
        : last_cache_sweep(std::chrono::steady_clock::now()),
          last_disk_cleanup(std::chrono::steady_clock::now()),
          session_start_time(std::chrono::steady_clock::now()) {}
};

#endif // SESSIONSTATE_H
