#include "core/store/async_write_queue.h"
#include "core/shared/logging.h"

#include <chrono>

namespace lp {

AsyncWriteQueue::AsyncWriteQueue(const WriteQueueConfig& config)
    : m_config(config)
{
    if (m_config.maxPendingWrites <= 0) {
        m_config.maxPendingWrites = 10000;
    }
    if (m_config.maxRetries < 0) {
        m_config.maxRetries = 0;
    }
}

AsyncWriteQueue::~AsyncWriteQueue()
{
    stop();
}

void AsyncWriteQueue::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_writerThread.joinable()) {
        return;
    }
    m_stopping = false;
    m_writerThread = std::thread([this] { writerLoop(); });
}

void AsyncWriteQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_writerThread.joinable()) {
        m_writerThread.join();
    }
}

bool AsyncWriteQueue::enqueue(const QString& label, WriteFn write)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.size() >= static_cast<size_t>(m_config.maxPendingWrites)) {
            m_dropped.fetch_add(1);
            LOG_WARN(lpStore, "Async write queue full, dropping %s", qUtf8Printable(label));
            return false;
        }
        m_queue.push_back(PendingWrite{label, std::move(write)});
    }
    m_cv.notify_one();
    return true;
}

void AsyncWriteQueue::setEscalationHandler(EscalationFn handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_escalation = std::move(handler);
}

bool AsyncWriteQueue::waitForIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_queue.empty() && !m_writing;
    });
}

AsyncWriteStats AsyncWriteQueue::stats() const
{
    AsyncWriteStats out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.pending = m_queue.size() + (m_writing ? 1 : 0);
    }
    out.completed = m_completed.load();
    out.retried = m_retried.load();
    out.failed = m_failed.load();
    out.dropped = m_dropped.load();
    return out;
}

void AsyncWriteQueue::writerLoop()
{
    while (true) {
        PendingWrite pending;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                // Stopping and fully drained.
                break;
            }
            pending = std::move(m_queue.front());
            m_queue.pop_front();
            m_writing = true;
        }

        runWrite(pending);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_writing = false;
        }
        m_idleCv.notify_all();
    }
    m_idleCv.notify_all();
}

void AsyncWriteQueue::runWrite(PendingWrite& pending)
{
    const int attempts = m_config.maxRetries + 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            m_retried.fetch_add(1);
            std::this_thread::sleep_for(
                std::chrono::milliseconds(m_config.retryBackoffMs * attempt));  // 50, 100, 150 ms
        }
        if (pending.write()) {
            m_completed.fetch_add(1);
            return;
        }
    }

    m_failed.fetch_add(1);
    LOG_ERROR(lpStore, "Async write %s failed after %d attempts",
              qUtf8Printable(pending.label), attempts);

    EscalationFn escalation;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        escalation = m_escalation;
    }
    if (escalation) {
        escalation(pending.label, attempts);
    }
}

} // namespace lp
