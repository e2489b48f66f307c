#ifndef APPSTATE_H
#define APPSTATE_H

#include <chrono>

// Shared, simple type definitions used by the scheduler and the engine.

enum class NavDirection {
    UP,  // towards lower feed indices
    DOWN // towards higher feed indices
};

struct NavEvent {
    NavDirection direction;
    std::chrono::steady_clock::time_point timestamp;
};

enum class DeviceClass {
    HighEnd,
    LowEnd
};

#endif // APPSTATE_H
