#include "core/ingest/nonce_cache.h"

#include <algorithm>
#include <iterator>

namespace lp {

namespace {

constexpr int64_t kRateWindowMs = 60000;

} // namespace

NonceCache::NonceCache(int noncesPerSession, int maxSessions, int64_t maxAgeMs)
    : m_noncesPerSession(std::max(1, noncesPerSession))
    , m_maxSessions(std::max(1, maxSessions))
    , m_maxAgeMs(std::max<int64_t>(1, maxAgeMs))
{
}

void NonceCache::pruneLocked(SessionEntry& entry, int64_t nowMs)
{
    while (!entry.nonces.empty()
           && (nowMs - entry.nonces.front().second > m_maxAgeMs
               || static_cast<int>(entry.nonces.size()) > m_noncesPerSession)) {
        entry.nonceSet.remove(entry.nonces.front().first);
        entry.nonces.pop_front();
    }
    while (!entry.acceptTimes.empty() && nowMs - entry.acceptTimes.front() >= kRateWindowMs) {
        entry.acceptTimes.pop_front();
    }
}

NonceCache::SessionEntry* NonceCache::findLocked(const QString& sessionId, int64_t nowMs)
{
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return nullptr;
    }
    pruneLocked(*it, nowMs);
    return &(*it);
}

NonceCache::SessionEntry& NonceCache::touchLocked(const QString& sessionId)
{
    auto it = m_sessions.find(sessionId);
    if (it != m_sessions.end()) {
        m_lru.splice(m_lru.begin(), m_lru, it->lruPosition);
        return *it;
    }

    while (m_sessions.size() >= m_maxSessions && !m_lru.empty()) {
        m_sessions.remove(m_lru.back());
        m_lru.pop_back();
    }

    m_lru.push_front(sessionId);
    SessionEntry entry;
    entry.lruPosition = m_lru.begin();
    return *m_sessions.insert(sessionId, std::move(entry));
}

bool NonceCache::seen(const QString& sessionId, const QString& nonce, int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    SessionEntry* entry = findLocked(sessionId, nowMs);
    return entry && entry->nonceSet.contains(nonce);
}

int NonceCache::acceptedInLastMinute(const QString& sessionId, int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    SessionEntry* entry = findLocked(sessionId, nowMs);
    return entry ? static_cast<int>(entry->acceptTimes.size()) : 0;
}

NonceCache::Admission NonceCache::tryAccept(const QString& sessionId, const QString& nonce,
                                            int64_t nowMs, int maxPerMinute)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (SessionEntry* existing = findLocked(sessionId, nowMs)) {
        if (existing->nonceSet.contains(nonce)) {
            return Admission::Replayed;
        }
        if (static_cast<int>(existing->acceptTimes.size()) >= maxPerMinute) {
            return Admission::RateLimited;
        }
    } else if (maxPerMinute <= 0) {
        return Admission::RateLimited;
    }

    SessionEntry& entry = touchLocked(sessionId);
    entry.nonces.emplace_back(nonce, nowMs);
    entry.nonceSet.insert(nonce);
    entry.acceptTimes.push_back(nowMs);
    pruneLocked(entry, nowMs);
    return Admission::Accepted;
}

void NonceCache::release(const QString& sessionId, const QString& nonce)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end() || !it->nonceSet.contains(nonce)) {
        return;
    }
    for (auto pos = it->nonces.rbegin(); pos != it->nonces.rend(); ++pos) {
        if (pos->first != nonce) {
            continue;
        }
        const int64_t reservedAtMs = pos->second;
        it->nonces.erase(std::next(pos).base());
        auto slot = std::find(it->acceptTimes.rbegin(), it->acceptTimes.rend(), reservedAtMs);
        if (slot != it->acceptTimes.rend()) {
            it->acceptTimes.erase(std::next(slot).base());
        }
        break;
    }
    it->nonceSet.remove(nonce);
}

void NonceCache::forgetSession(const QString& sessionId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return;
    }
    m_lru.erase(it->lruPosition);
    m_sessions.erase(it);
}

size_t NonceCache::trackedSessions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(m_sessions.size());
}

} // namespace lp
