#pragma once

// Shaderlay - Task Queue
// Delivers callbacks from watcher/network threads and deferred work
// onto the main loop, in posting order

#include <functional>
#include <mutex>
#include <vector>

namespace shaderlay {

using Task = std::function<void()>;

class TaskQueue {
public:
    TaskQueue() = default;

    // Non-copyable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Thread-safe. Runs on the next drain().
    void post(Task task);

    // Thread-safe. Runs on the first drain() at or after the time of
    // the last drain plus `delaySeconds`.
    void postDelayed(double delaySeconds, Task task);

    // Run every due task (call in main loop). Tasks posted while
    // draining run on the next drain, never in the current one.
    // Returns the number of tasks run.
    int drain(double now);

    // Tasks not yet run, immediate and delayed
    size_t pending() const;

private:
    struct DelayedTask {
        double dueTime;
        Task task;
    };

    mutable std::mutex m_mutex;
    std::vector<Task> m_tasks;
    std::vector<DelayedTask> m_delayed;
    double m_lastDrain = 0.0;
};

} // namespace shaderlay
