#include "Core/AsyncExecutor.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

AsyncExecutor::~AsyncExecutor() { waitAll(); }

void AsyncExecutor::submit(std::function<void()> task) {
    auto future = std::async(std::launch::async, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("AsyncExecutor: task threw: {}", e.what());
        }
    });
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(future));
}

std::size_t AsyncExecutor::reap() {
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto done = std::stable_partition(m_tasks.begin(), m_tasks.end(), [](const std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        std::move(done, m_tasks.end(), std::back_inserter(finished));
        m_tasks.erase(done, m_tasks.end());
    }
    return finished.size();
}

void AsyncExecutor::waitAll() {
    // Tasks may submit follow-up tasks while we wait.
    while (true) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pending.swap(m_tasks);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& future : pending) {
            future.wait();
        }
    }
}

std::size_t AsyncExecutor::runningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}
