#include "core/session/actor_executor.h"
#include "core/shared/logging.h"

#include <chrono>
#include <exception>

namespace lp {

ActorExecutor::ActorExecutor(int threadCount)
    : m_threadCount(threadCount > 0 ? threadCount : 1)
{
}

ActorExecutor::~ActorExecutor()
{
    stop();
}

void ActorExecutor::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_workers.empty()) {
        return;
    }
    m_stopping = false;
    m_workers.reserve(static_cast<size_t>(m_threadCount));
    for (int i = 0; i < m_threadCount; ++i) {
        m_workers.emplace_back([this] { workerLoop(); });
    }
    LOG_INFO(lpSession, "Actor executor started with %d workers", m_threadCount);
}

void ActorExecutor::stop()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
        workers.swap(m_workers);
    }
    m_cv.notify_all();
    for (std::thread& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ActorExecutor::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return false;
        }
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

bool ActorExecutor::waitForIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_tasks.empty() && m_running == 0;
    });
}

size_t ActorExecutor::queuedTasks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void ActorExecutor::workerLoop()
{
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                break;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
            ++m_running;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(lpSession, "Actor task threw: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_running;
        }
        m_idleCv.notify_all();
    }
    m_idleCv.notify_all();
}

} // namespace lp
