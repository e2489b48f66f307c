#ifndef PRELOADSTRATEGY_H
#define PRELOADSTRATEGY_H

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <utility> // For std::pair
#include <vector>

#include "AppState.h" // For NavEvent

// How far around the visible item the scheduler works.
struct PreloadProfile {
    std::string name;
    int ahead = 1;
    int behind = 1;
    int concurrency = 1;
    int keep_range = 2;
    bool follow_scroll_velocity = false;
};

struct PreloadCandidate {
    int index;
    int priority; // 0 is the visible item
};

namespace Strategy {

const PreloadProfile& aggressiveProfile();
const PreloadProfile& balancedProfile();
const PreloadProfile& liteProfile();
// Unknown names fall back to the lite profile.
PreloadProfile profileByName(const std::string& name);

// Decides which feed indices to prepare around the visible one, taking the
// user's scroll velocity into account.
class Preloader {
  public:
    explicit Preloader(PreloadProfile profile = liteProfile());

    // Indices sorted by priority. Out-of-range indices are dropped.
    std::vector<PreloadCandidate> candidates(int active_idx,
                                             std::size_t item_count,
                                             const std::deque<NavEvent>& nav_history,
                                             std::chrono::steady_clock::time_point now) const;

    // {behind, ahead} after the scroll velocity boost.
    std::pair<int, int> getPreloadCounts(const std::deque<NavEvent>& nav_history,
                                         std::chrono::steady_clock::time_point now) const;

    const PreloadProfile& profile() const { return m_profile; }

  private:
    PreloadProfile m_profile;
};

} // namespace Strategy

#endif // PRELOADSTRATEGY_H
