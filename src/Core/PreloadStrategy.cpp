#include "Core/PreloadStrategy.h"

#include <algorithm> // For std::max

namespace {
    // The window of time to check for rapid navigation.
    constexpr auto ACCEL_TIME_WINDOW = std::chrono::milliseconds(500);
    // The number of consecutive navigation events to trigger acceleration.
    constexpr int ACCEL_EVENT_THRESHOLD = 3;
    // How many extra items to preload in the direction of travel.
    constexpr int PRELOAD_EXTRA = 3;
    // What remains of the opposite direction while accelerating.
    constexpr int PRELOAD_REDUCED = 1;

    const PreloadProfile AGGRESSIVE = {.name = "aggressive",
                                       .ahead = 3,
                                       .behind = 1,
                                       .concurrency = 3,
                                       .keep_range = 3,
                                       .follow_scroll_velocity = true};

    const PreloadProfile BALANCED = {.name = "balanced",
                                     .ahead = 2,
                                     .behind = 1,
                                     .concurrency = 2,
                                     .keep_range = 3,
                                     .follow_scroll_velocity = true};

    const PreloadProfile LITE = {.name = "lite",
                                 .ahead = 1,
                                 .behind = 1,
                                 .concurrency = 2,
                                 .keep_range = 2,
                                 .follow_scroll_velocity = false};
}

namespace Strategy {

    const PreloadProfile& aggressiveProfile() { return AGGRESSIVE; }
    const PreloadProfile& balancedProfile() { return BALANCED; }
    const PreloadProfile& liteProfile() { return LITE; }

    PreloadProfile profileByName(const std::string& name) {
        if (name == AGGRESSIVE.name) {
            return AGGRESSIVE;
        }
        if (name == BALANCED.name) {
            return BALANCED;
        }
        return LITE;
    }

    Preloader::Preloader(PreloadProfile profile) : m_profile(std::move(profile)) {}

    std::pair<int, int> Preloader::getPreloadCounts(const std::deque<NavEvent>& nav_history,
                                                    std::chrono::steady_clock::time_point now) const {
        int behind = m_profile.behind;
        int ahead = m_profile.ahead;

        if (!m_profile.follow_scroll_velocity || nav_history.empty()) {
            return {behind, ahead};
        }

        const NavDirection current_dir = nav_history.back().direction;
        int consecutive_count = 0;
        for (auto it = nav_history.rbegin(); it != nav_history.rend(); ++it) {
            if (now - it->timestamp > ACCEL_TIME_WINDOW)
                break;
            if (it->direction != current_dir)
                break;
            consecutive_count++;
        }

        if (consecutive_count >= ACCEL_EVENT_THRESHOLD) {
            if (current_dir == NavDirection::DOWN) {
                ahead += PRELOAD_EXTRA;
                behind = std::min(behind, PRELOAD_REDUCED);
            } else {
                behind += PRELOAD_EXTRA;
                ahead = std::min(ahead, PRELOAD_REDUCED);
            }
        }

        return {behind, ahead};
    }

    std::vector<PreloadCandidate> Preloader::candidates(int active_idx,
                                                        std::size_t item_count,
                                                        const std::deque<NavEvent>& nav_history,
                                                        std::chrono::steady_clock::time_point now) const {
        std::vector<PreloadCandidate> result;
        const int count = static_cast<int>(item_count);
        if (active_idx < 0 || active_idx >= count) {
            return result;
        }

        auto [behind, ahead] = getPreloadCounts(nav_history, now);
        int priority = 0;
        result.push_back({active_idx, priority});
        for (int i = 1; i <= ahead; ++i) {
            ++priority;
            if (active_idx + i < count) {
                result.push_back({active_idx + i, priority});
            }
        }
        for (int i = 1; i <= behind; ++i) {
            ++priority;
            if (active_idx - i >= 0) {
                result.push_back({active_idx - i, priority});
            }
        }
        return result;
    }

} // namespace Strategy
