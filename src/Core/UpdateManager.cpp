#include "Core/UpdateManager.h"

#include <spdlog/spdlog.h>

#include <mutex>

#include "MediaEngine.h"

namespace {
    constexpr auto CACHE_SWEEP_INTERVAL = std::chrono::seconds(60);
    constexpr auto DISK_CLEANUP_INTERVAL = std::chrono::minutes(5);
}

void UpdateManager::process_updates(MediaEngine& engine) {
    const auto now = std::chrono::steady_clock::now();
    handle_quality_probe(engine);
    handle_network_profile(engine);
    handle_finished_tasks(engine);
    handle_player_health(engine);
    handle_stream_retention(engine);
    handle_cache_sweep(engine, now);
    handle_disk_cleanup(engine, now);
    engine.applyPlayback();
}

void UpdateManager::handle_quality_probe(MediaEngine& engine) { engine.m_estimator.update(); }

void UpdateManager::handle_network_profile(MediaEngine& engine) {
    const bool slow = engine.m_estimator.isSlowNetwork();
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        if (slow == engine.m_session_state.slow_network_profile_active) {
            return;
        }
        engine.m_session_state.slow_network_profile_active = slow;
    }
    if (slow) {
        spdlog::info("UpdateManager: slow network, preloading less");
        engine.m_scheduler.setProfile(Strategy::liteProfile());
    } else {
        spdlog::info("UpdateManager: network recovered, restoring the configured profile");
        engine.m_scheduler.setProfile(engine.resolveProfile());
    }
    engine.m_needs_redraw = true;
}

void UpdateManager::handle_finished_tasks(MediaEngine& engine) {
    if (engine.m_executor.reap() > 0) {
        engine.m_needs_redraw = true;
    }
}

void UpdateManager::handle_player_health(MediaEngine& engine) {
    if (engine.m_pool.poll() > 0) {
        engine.m_needs_redraw = true;
    }
}

void UpdateManager::handle_stream_retention(MediaEngine& engine) {
    if (engine.m_fetch_cache.sweepRetention() > 0) {
        engine.m_needs_redraw = true;
    }
}

void UpdateManager::handle_cache_sweep(MediaEngine& engine, std::chrono::steady_clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        if (now - engine.m_session_state.last_cache_sweep < CACHE_SWEEP_INTERVAL) {
            return;
        }
        engine.m_session_state.last_cache_sweep = now;
    }
    const auto removed = engine.m_metadata_cache.sweepExpired();
    if (removed > 0) {
        spdlog::debug("UpdateManager: swept {} expired metadata entries", removed);
    }
}

void UpdateManager::handle_disk_cleanup(MediaEngine& engine, std::chrono::steady_clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        if (now - engine.m_session_state.last_disk_cleanup < DISK_CLEANUP_INTERVAL) {
            return;
        }
        engine.m_session_state.last_disk_cleanup = now;
    }
    const auto media_files = engine.m_fetch_cache.enforceDiskBudget();
    const auto records = engine.m_metadata_cache.cleanupDurable();
    if (media_files > 0 || records > 0) {
        spdlog::info("UpdateManager: disk cleanup removed {} media files and {} metadata records", media_files,
                     records);
    }
}
