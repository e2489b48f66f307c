#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <functional>

// Injectable time sources. Production code passes the real clocks.
using SteadyNow = std::function<std::chrono::steady_clock::time_point()>;
using WallNow = std::function<std::chrono::system_clock::time_point()>;

inline SteadyNow realSteadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

inline WallNow realWallClock() {
    return [] { return std::chrono::system_clock::now(); };
}

#endif // CLOCK_H
