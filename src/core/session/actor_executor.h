#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lp {

// Fixed pool of worker threads running actor drain tasks in FIFO order.
class ActorExecutor {
public:
    using Task = std::function<void()>;

    explicit ActorExecutor(int threadCount = 4);
    ~ActorExecutor();

    ActorExecutor(const ActorExecutor&) = delete;
    ActorExecutor& operator=(const ActorExecutor&) = delete;

    void start();
    // Runs every queued task, then joins the workers.
    void stop();

    // False once stop() has begun.
    bool post(Task task);

    // Blocks until no task is queued or running.
    bool waitForIdle(int timeoutMs);

    size_t queuedTasks() const;
    int threadCount() const { return m_threadCount; }

private:
    void workerLoop();

    int m_threadCount = 4;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<Task> m_tasks;
    std::vector<std::thread> m_workers;
    int m_running = 0;
    bool m_stopping = false;
};

} // namespace lp
