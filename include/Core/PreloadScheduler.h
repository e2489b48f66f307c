#ifndef PRELOADSCHEDULER_H
#define PRELOADSCHEDULER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <vector>

#include "AppState.h"
#include "Core/Clock.h"
#include "Core/PreloadStrategy.h"

class IFeedSource;
class ResourcePool;
class TaskExecutor;

struct PreloadTask {
    int index;
    int priority;
    std::uint64_t epoch;
};

/*!
@class PreloadScheduler
@brief Turns viewport changes into bounded preload work against the pool.

Every viewport change starts a new epoch. Tasks carry the epoch they were
created in and check it before touching the feed or the pool; a stale task
returns without side effects, and a preload that finishes after its epoch
ended is discarded by the pool. At most profile().concurrency tasks run at
once, the rest wait in the pending list of the current epoch.
*/
class PreloadScheduler {
  public:
    PreloadScheduler(ResourcePool& pool,
                     IFeedSource& feed,
                     TaskExecutor& executor,
                     PreloadProfile profile,
                     SteadyNow now = realSteadyClock());

    PreloadScheduler(const PreloadScheduler&) = delete;
    PreloadScheduler& operator=(const PreloadScheduler&) = delete;

    void onViewportChanged(int index);
    void setProfile(PreloadProfile profile);

    std::uint64_t epoch() const { return m_epoch.load(); }
    bool isCurrent(std::uint64_t epoch) const { return m_epoch.load() == epoch; }
    int currentIndex() const;
    PreloadProfile profile() const;
    std::set<int> inFlight() const;
    std::vector<int> pending() const;

  private:
    // Both expect m_mutex to be held.
    std::vector<PreloadTask> takeDispatchable();
    void recordNavigation(int index);

    void submit(const std::vector<PreloadTask>& tasks);
    void runTask(const PreloadTask& task);
    void onTaskDone(const PreloadTask& task);

    ResourcePool& m_pool;
    IFeedSource& m_feed;
    TaskExecutor& m_executor;
    SteadyNow m_now;

    std::atomic<std::uint64_t> m_epoch{0};

    mutable std::mutex m_mutex;
    Strategy::Preloader m_preloader;
    int m_current_index = -1;
    std::deque<NavEvent> m_nav_history;
    std::set<int> m_in_flight;
    std::deque<PreloadTask> m_pending;

    static constexpr std::size_t MAX_NAV_HISTORY = 10;
};

#endif // PRELOADSCHEDULER_H
