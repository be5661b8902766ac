#pragma once

#include "core/shared/settings.h"

#include <QString>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace lp {

struct AsyncWriteStats {
    size_t pending = 0;
    size_t completed = 0;
    size_t retried = 0;
    size_t failed = 0;
    size_t dropped = 0;
};

// AsyncWriteQueue -- single writer thread for fire-and-forget audit writes.
//
// A write returns true on success. Failed writes are retried with linear
// backoff; once the attempts are exhausted the escalation handler runs.
// A full queue drops new writes and counts them.
class AsyncWriteQueue {
public:
    using WriteFn = std::function<bool()>;
    using EscalationFn = std::function<void(const QString& label, int attempts)>;

    explicit AsyncWriteQueue(const WriteQueueConfig& config = {});
    ~AsyncWriteQueue();

    AsyncWriteQueue(const AsyncWriteQueue&) = delete;
    AsyncWriteQueue& operator=(const AsyncWriteQueue&) = delete;

    void start();
    // Drains everything still queued, then joins the writer.
    void stop();

    bool enqueue(const QString& label, WriteFn write);
    void setEscalationHandler(EscalationFn handler);

    // Blocks until the queue is empty and no write is in flight.
    bool waitForIdle(int timeoutMs);

    AsyncWriteStats stats() const;

private:
    struct PendingWrite {
        QString label;
        WriteFn write;
    };

    void writerLoop();
    void runWrite(PendingWrite& pending);

    WriteQueueConfig m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<PendingWrite> m_queue;
    bool m_writing = false;
    bool m_stopping = false;
    std::thread m_writerThread;
    EscalationFn m_escalation;

    std::atomic<size_t> m_completed{0};
    std::atomic<size_t> m_retried{0};
    std::atomic<size_t> m_failed{0};
    std::atomic<size_t> m_dropped{0};
};

} // namespace lp
