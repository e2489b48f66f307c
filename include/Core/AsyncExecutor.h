#ifndef ASYNCEXECUTOR_H
#define ASYNCEXECUTOR_H

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <vector>

// Where the scheduler sends its preload tasks.
class TaskExecutor {
  public:
    virtual ~TaskExecutor() = default;
    virtual void submit(std::function<void()> task) = 0;
};

// Runs every task on its own std::async thread and keeps the futures until
// they are reaped, so no task outlives the executor.
class AsyncExecutor : public TaskExecutor {
  public:
    AsyncExecutor() = default;
    ~AsyncExecutor() override;

    AsyncExecutor(const AsyncExecutor&) = delete;
    AsyncExecutor& operator=(const AsyncExecutor&) = delete;

    void submit(std::function<void()> task) override;

    // Drops finished futures. Returns how many were collected.
    std::size_t reap();
    void waitAll();
    std::size_t runningCount() const;

  private:
    mutable std::mutex m_mutex;
    std::vector<std::future<void>> m_tasks;
};

#endif // ASYNCEXECUTOR_H
