#ifndef UPDATEMANAGER_H
#define UPDATEMANAGER_H

#include <chrono>

// Forward declaration to avoid circular dependencies
class MediaEngine;

// Periodic maintenance, run on every idle tick of the engine actor.
class UpdateManager {
public:
    UpdateManager() = default;

    // The main entry point for processing all time-based updates
    void process_updates(MediaEngine& engine);

private:
    void handle_quality_probe(MediaEngine& engine);
    void handle_network_profile(MediaEngine& engine);
    void handle_finished_tasks(MediaEngine& engine);
    void handle_player_health(MediaEngine& engine);
    void handle_stream_retention(MediaEngine& engine);
    void handle_cache_sweep(MediaEngine& engine, std::chrono::steady_clock::time_point now);
    void handle_disk_cleanup(MediaEngine& engine, std::chrono::steady_clock::time_point now);
};

#endif // UPDATEMANAGER_H
