#ifndef ENGINESNAPSHOT_H
#define ENGINESNAPSHOT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Core/NetworkQualityEstimator.h"
#include "Core/ResourcePool.h"
#include "Core/SwrCache.h"

// A guaranteed-consistent copy of everything a front end may display.
struct EngineSnapshot {
    int viewport_index = -1;
    std::string current_media_id;
    PlaybackState current_state = PlaybackState::Disposed;
    bool autoplay = true;
    std::uint64_t epoch = 0;
    QualityTier tier = QualityTier::Medium;
    double speed_kbps = 0.0;
    bool connected = true;
    std::string preload_profile;
    std::vector<PoolSlot> slots;
    PoolStats pool_stats;
    CacheStats cache_stats;
    std::size_t active_streams = 0;
    std::size_t item_count = 0;
};

#endif // ENGINESNAPSHOT_H
