#include "Core/PreloadScheduler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <utility>

#include "Core/AsyncExecutor.h"
#include "Core/ResourcePool.h"
#include "MediaItem.h"

PreloadScheduler::PreloadScheduler(ResourcePool& pool,
                                   IFeedSource& feed,
                                   TaskExecutor& executor,
                                   PreloadProfile profile,
                                   SteadyNow now)
    : m_pool(pool), m_feed(feed), m_executor(executor), m_now(std::move(now)), m_preloader(std::move(profile)) {}

void PreloadScheduler::onViewportChanged(int index) {
    std::vector<PreloadTask> dispatch;
    int previous;
    int keep_range;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::uint64_t epoch = ++m_epoch;
        previous = m_current_index;
        recordNavigation(index);
        m_current_index = index;

        // Work queued for the previous viewport is dropped; running tasks notice the new epoch.
        m_pending.clear();
        for (const auto& candidate : m_preloader.candidates(index, m_feed.itemCount(), m_nav_history, m_now())) {
            m_pending.push_back({.index = candidate.index, .priority = candidate.priority, .epoch = epoch});
        }
        dispatch = takeDispatchable();
        keep_range = m_preloader.profile().keep_range;
        spdlog::debug("PreloadScheduler: epoch {} at index {}, {} dispatched, {} pending", epoch, index,
                      dispatch.size(), m_pending.size());
    }

    if (previous != index) {
        if (previous >= 0) {
            m_pool.unpin({previous});
        }
        m_pool.pin({index});
    }
    submit(dispatch);
    m_pool.releaseOutside(index, keep_range);
}

void PreloadScheduler::setProfile(PreloadProfile profile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    spdlog::info("PreloadScheduler: using profile '{}'", profile.name);
    m_preloader = Strategy::Preloader(std::move(profile));
}

int PreloadScheduler::currentIndex() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_index;
}

PreloadProfile PreloadScheduler::profile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_preloader.profile();
}

std::set<int> PreloadScheduler::inFlight() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight;
}

std::vector<int> PreloadScheduler::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<int> result;
    for (const auto& task : m_pending) {
        result.push_back(task.index);
    }
    return result;
}

void PreloadScheduler::recordNavigation(int index) {
    if (m_current_index < 0 || index == m_current_index) {
        return;
    }
    const NavDirection direction = index > m_current_index ? NavDirection::DOWN : NavDirection::UP;
    m_nav_history.push_back({direction, m_now()});
    if (m_nav_history.size() > MAX_NAV_HISTORY) {
        m_nav_history.pop_front();
    }
}

std::vector<PreloadTask> PreloadScheduler::takeDispatchable() {
    std::vector<PreloadTask> ready;
    const std::size_t limit = static_cast<std::size_t>(std::max(1, m_preloader.profile().concurrency));
    for (auto it = m_pending.begin(); it != m_pending.end() && m_in_flight.size() < limit;) {
        // An index still being prepared under an older epoch waits for that task to leave.
        if (m_in_flight.count(it->index)) {
            ++it;
            continue;
        }
        m_in_flight.insert(it->index);
        ready.push_back(*it);
        it = m_pending.erase(it);
    }
    return ready;
}

void PreloadScheduler::submit(const std::vector<PreloadTask>& tasks) {
    for (const auto& task : tasks) {
        m_executor.submit([this, task]() { runTask(task); });
    }
}

void PreloadScheduler::runTask(const PreloadTask& task) {
    try {
        if (!isCurrent(task.epoch)) {
            spdlog::debug("PreloadScheduler: index {} skipped, epoch {} is stale", task.index, task.epoch);
        } else if (auto item = m_feed.itemAt(task.index); !item) {
            spdlog::debug("PreloadScheduler: no item at index {}", task.index);
        } else if (isCurrent(task.epoch)) {
            auto handle = m_pool.preload(task.index, *item, [this, epoch = task.epoch]() { return isCurrent(epoch); });
            if (handle.expired()) {
                spdlog::debug("PreloadScheduler: index {} discarded, epoch {} ended", task.index, task.epoch);
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("PreloadScheduler: preload of index {} failed: {}", task.index, e.what());
    }
    onTaskDone(task);
}

void PreloadScheduler::onTaskDone(const PreloadTask& task) {
    std::vector<PreloadTask> dispatch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_in_flight.erase(task.index);
        dispatch = takeDispatchable();
    }
    submit(dispatch);
}
