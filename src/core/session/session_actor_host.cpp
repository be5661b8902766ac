#include "core/session/session_actor_host.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <algorithm>
#include <vector>

namespace lp {

QString postOutcomeToString(PostOutcome outcome)
{
    switch (outcome) {
    case PostOutcome::Posted:           return QStringLiteral("posted");
    case PostOutcome::CapacityExceeded: return QStringLiteral("capacity_exceeded");
    case PostOutcome::SessionClosing:   return QStringLiteral("session_closing");
    case PostOutcome::IdentityMismatch: return QStringLiteral("identity_mismatch");
    case PostOutcome::HostStopped:      return QStringLiteral("host_stopped");
    }
    return QStringLiteral("host_stopped");
}

SessionActorHost::SessionActorHost(const SessionConfig& config,
                                   const StruggleScorer& scorer,
                                   int effectivenessSampleSignals,
                                   SessionActorDelegate& delegate)
    : m_config(config)
    , m_scorer(scorer)
    , m_effectivenessSampleSignals(effectivenessSampleSignals)
    , m_delegate(delegate)
    , m_executor(config.workerThreads)
{
}

SessionActorHost::~SessionActorHost()
{
    stop();
}

void SessionActorHost::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return;
    }
    m_executor.start();
    m_running = true;
}

void SessionActorHost::stop()
{
    std::vector<ActorPtr> actors;
    // Never earlier than the newest activity, so snapshots are not born expired.
    int64_t closeAtMs = QDateTime::currentMSecsSinceEpoch();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        actors.reserve(static_cast<size_t>(m_actors.size()));
        for (auto it = m_actors.cbegin(); it != m_actors.cend(); ++it) {
            actors.push_back(it.value());
            closeAtMs = std::max(closeAtMs, it.value()->lastActivityMs());
        }
    }

    for (const ActorPtr& actor : actors) {
        postClose(actor, QStringLiteral("shutdown"), closeAtMs);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_executor.stop();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_actors.clear();
}

void SessionActorHost::schedule(const ActorPtr& actor)
{
    const bool posted = m_executor.post([this, actor]() {
        actor->drain();
        if (actor->finished()) {
            retire(actor);
        }
    });
    if (!posted) {
        LOG_WARN(lpSession, "Executor stopped; session %s not scheduled",
                 qUtf8Printable(actor->sessionId()));
    }
}

void SessionActorHost::retire(const ActorPtr& actor)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_actors.find(actor->sessionId());
    if (it != m_actors.end() && it.value() == actor) {
        m_actors.erase(it);
        ++m_sessionsClosed;
    }
}

PostOutcome SessionActorHost::postSignal(const BehavioralSignal& signal)
{
    ActorPtr actor;
    SessionActor::EnqueueResult result = SessionActor::EnqueueResult::AlreadyScheduled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return PostOutcome::HostStopped;
        }

        auto it = m_actors.find(signal.sessionId);
        if (it != m_actors.end() && it.value()->finished()) {
            // Closed but not retired yet; a new actor takes over the key.
            m_actors.erase(it);
            ++m_sessionsClosed;
            it = m_actors.end();
        }

        if (it == m_actors.end()) {
            if (m_actors.size() >= m_config.maxActiveSessions) {
                ++m_capacityRejections;
                return PostOutcome::CapacityExceeded;
            }
            actor = std::make_shared<SessionActor>(signal, m_config, m_scorer,
                                                   m_effectivenessSampleSignals, m_delegate);
            m_actors.insert(signal.sessionId, actor);
            ++m_sessionsOpened;
        } else {
            actor = it.value();
            if (actor->tenantId() != signal.tenantId || actor->userId() != signal.userId) {
                ++m_identityRejections;
                return PostOutcome::IdentityMismatch;
            }
        }

        SessionMessage message;
        message.kind = SessionMessage::Kind::Signal;
        message.signal = signal;
        message.atMs = signal.receivedAtMs;
        result = actor->enqueue(std::move(message));
        if (result == SessionActor::EnqueueResult::Closing) {
            ++m_closingRejections;
            return PostOutcome::SessionClosing;
        }
    }

    if (result == SessionActor::EnqueueResult::NeedsSchedule) {
        schedule(actor);
    }
    return PostOutcome::Posted;
}

bool SessionActorHost::postInterventionOutcome(const QString& sessionId,
                                               const QString& interventionId,
                                               UserResponse response, int64_t atMs)
{
    ActorPtr actor;
    SessionActor::EnqueueResult result = SessionActor::EnqueueResult::AlreadyScheduled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return false;
        }
        auto it = m_actors.find(sessionId);
        if (it == m_actors.end()) {
            return false;
        }
        actor = it.value();

        SessionMessage message;
        message.kind = SessionMessage::Kind::InterventionOutcome;
        message.interventionId = interventionId;
        message.response = response;
        message.atMs = atMs;
        result = actor->enqueue(std::move(message));
    }

    if (result == SessionActor::EnqueueResult::Closing) {
        return false;
    }
    if (result == SessionActor::EnqueueResult::NeedsSchedule) {
        schedule(actor);
    }
    return true;
}

bool SessionActorHost::postClose(const ActorPtr& actor, const QString& reason, int64_t nowMs)
{
    SessionMessage message;
    message.kind = SessionMessage::Kind::Close;
    message.closeReason = reason;
    message.atMs = nowMs;
    const SessionActor::EnqueueResult result = actor->enqueue(std::move(message));
    if (result == SessionActor::EnqueueResult::Closing) {
        return false;
    }
    if (result == SessionActor::EnqueueResult::NeedsSchedule) {
        schedule(actor);
    }
    return true;
}

bool SessionActorHost::closeSession(const QString& sessionId, const QString& reason, int64_t nowMs)
{
    ActorPtr actor;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return false;
        }
        auto it = m_actors.find(sessionId);
        if (it == m_actors.end()) {
            return false;
        }
        actor = it.value();
    }
    return postClose(actor, reason, nowMs);
}

int SessionActorHost::closeSessionsForUser(const QString& tenantId, const QString& userId,
                                           const QString& reason, int64_t nowMs)
{
    std::vector<ActorPtr> matches;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return 0;
        }
        for (auto it = m_actors.cbegin(); it != m_actors.cend(); ++it) {
            if (it.value()->tenantId() == tenantId && it.value()->userId() == userId) {
                matches.push_back(it.value());
            }
        }
    }

    int closed = 0;
    for (const ActorPtr& actor : matches) {
        if (postClose(actor, reason, nowMs)) {
            ++closed;
        }
    }
    return closed;
}

int SessionActorHost::expireIdle(int64_t nowMs)
{
    const int64_t idleMs = static_cast<int64_t>(m_config.idleTimeoutMinutes) * 60000;
    std::vector<ActorPtr> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return 0;
        }
        for (auto it = m_actors.cbegin(); it != m_actors.cend(); ++it) {
            if (nowMs - it.value()->lastActivityMs() >= idleMs) {
                expired.push_back(it.value());
            }
        }
    }

    int closed = 0;
    for (const ActorPtr& actor : expired) {
        if (postClose(actor, QStringLiteral("idle_timeout"), nowMs)) {
            ++closed;
        }
    }
    if (closed > 0) {
        LOG_INFO(lpSession, "Expired %d idle sessions", closed);
    }
    return closed;
}

bool SessionActorHost::hasSession(const QString& sessionId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_actors.contains(sessionId);
}

size_t SessionActorHost::activeSessions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(m_actors.size());
}

bool SessionActorHost::waitForIdle(int timeoutMs)
{
    return m_executor.waitForIdle(timeoutMs);
}

SessionHostStats SessionActorHost::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    SessionHostStats out;
    out.activeSessions = static_cast<size_t>(m_actors.size());
    out.sessionsOpened = m_sessionsOpened;
    out.sessionsClosed = m_sessionsClosed;
    out.capacityRejections = m_capacityRejections;
    out.closingRejections = m_closingRejections;
    out.identityRejections = m_identityRejections;
    return out;
}

} // namespace lp
