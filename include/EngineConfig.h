#ifndef ENGINECONFIG_H
#define ENGINECONFIG_H

#include <filesystem>
#include <string>

#include "AppState.h"
#include "Core/NetworkQualityEstimator.h"
#include "Core/ProgressiveFetchCache.h"
#include "Core/ResourcePool.h"
#include "Core/SwrCache.h"
#include "MpvInstance.h"

// Everything the engine reads from reelcast.jsonc, with the defaults used when a key is absent.
struct EngineConfig {
    DeviceClass device_class = DeviceClass::HighEnd;
    // "auto" or a preset name.
    std::string preload_profile = "auto";
    std::filesystem::path cache_dir = "reelcast_cache";
    // Where the last shown media id is kept. Empty disables session persistence.
    std::filesystem::path session_file = "reelcast_session.json";
    bool durable_metadata = true;

    PoolSettings pool;
    EstimatorSettings network;
    FetchCacheSettings fetch_cache;
    SwrCacheSettings metadata_cache;
    PlayerOptions player;

    std::string log_level = "info";
    std::string log_file;
};

const char* to_string(DeviceClass device_class);
// Pool capacity and init timeout for a device class.
PoolSettings pool_defaults_for(DeviceClass device_class);

#endif // ENGINECONFIG_H
