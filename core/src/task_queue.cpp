// Shaderlay - Task Queue Implementation

#include <shaderlay/task_queue.h>

namespace shaderlay {

void TaskQueue::post(Task task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(task));
}

void TaskQueue::postDelayed(double delaySeconds, Task task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_delayed.push_back({m_lastDrain + delaySeconds, std::move(task)});
}

int TaskQueue::drain(double now) {
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastDrain = now;
        due.swap(m_tasks);

        auto it = m_delayed.begin();
        while (it != m_delayed.end()) {
            if (it->dueTime <= now) {
                due.push_back(std::move(it->task));
                it = m_delayed.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Run outside the lock so tasks can post more work
    for (auto& task : due) {
        task();
    }
    return static_cast<int>(due.size());
}

size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size() + m_delayed.size();
}

} // namespace shaderlay
