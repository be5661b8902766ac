#pragma once

#include <QHash>
#include <QSet>
#include <QString>

#include <cstdint>
#include <deque>
#include <list>
#include <mutex>

namespace lp {

// NonceCache -- per-session replay and rate window.
//
// Each tracked session keeps at most noncesPerSession recent nonces, none
// older than maxAgeMs, plus the accept times of the last minute. At most
// maxSessions sessions are tracked; the least recently used is evicted.
class NonceCache {
public:
    enum class Admission {
        Accepted,
        Replayed,
        RateLimited,
    };

    NonceCache(int noncesPerSession, int maxSessions, int64_t maxAgeMs);

    bool seen(const QString& sessionId, const QString& nonce, int64_t nowMs);
    int acceptedInLastMinute(const QString& sessionId, int64_t nowMs);

    // Replay check, rate check and reservation under one lock. On Accepted
    // the nonce is remembered and a rate slot is taken.
    Admission tryAccept(const QString& sessionId, const QString& nonce, int64_t nowMs,
                        int maxPerMinute);

    // Returns a reservation from tryAccept for a signal rejected later.
    void release(const QString& sessionId, const QString& nonce);

    void forgetSession(const QString& sessionId);

    size_t trackedSessions() const;

private:
    struct SessionEntry {
        std::deque<std::pair<QString, int64_t>> nonces;
        QSet<QString> nonceSet;
        std::deque<int64_t> acceptTimes;
        std::list<QString>::iterator lruPosition;
    };

    SessionEntry* findLocked(const QString& sessionId, int64_t nowMs);
    SessionEntry& touchLocked(const QString& sessionId);
    void pruneLocked(SessionEntry& entry, int64_t nowMs);

    int m_noncesPerSession = 256;
    int m_maxSessions = 20000;
    int64_t m_maxAgeMs = 300000;

    mutable std::mutex m_mutex;
    QHash<QString, SessionEntry> m_sessions;
    std::list<QString> m_lru;   // front = most recently used
};

} // namespace lp
