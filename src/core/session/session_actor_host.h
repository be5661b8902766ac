#pragma once

#include "core/scoring/struggle_scorer.h"
#include "core/session/actor_executor.h"
#include "core/session/session_actor.h"
#include "core/shared/settings.h"

#include <QHash>
#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>

namespace lp {

enum class PostOutcome {
    Posted,
    CapacityExceeded,
    SessionClosing,
    IdentityMismatch,
    HostStopped,
};

QString postOutcomeToString(PostOutcome outcome);

struct SessionHostStats {
    size_t activeSessions = 0;
    size_t sessionsOpened = 0;
    size_t sessionsClosed = 0;
    size_t capacityRejections = 0;
    size_t closingRejections = 0;
    size_t identityRejections = 0;
};

// SessionActorHost -- virtual actor registry keyed by sessionId.
//
// Actors are created on the first signal and retired after their Close
// message is handled. Ordering is per session only; different sessions
// drain in parallel on the executor.
class SessionActorHost {
public:
    SessionActorHost(const SessionConfig& config,
                     const StruggleScorer& scorer,
                     int effectivenessSampleSignals,
                     SessionActorDelegate& delegate);
    ~SessionActorHost();

    SessionActorHost(const SessionActorHost&) = delete;
    SessionActorHost& operator=(const SessionActorHost&) = delete;

    void start();
    // Closes every live session, flushes them, then stops the workers.
    void stop();

    PostOutcome postSignal(const BehavioralSignal& signal);
    bool postInterventionOutcome(const QString& sessionId, const QString& interventionId,
                                 UserResponse response, int64_t atMs);

    bool closeSession(const QString& sessionId, const QString& reason, int64_t nowMs);
    int closeSessionsForUser(const QString& tenantId, const QString& userId,
                             const QString& reason, int64_t nowMs);
    // Closes sessions without a signal for idleTimeoutMinutes.
    int expireIdle(int64_t nowMs);

    bool hasSession(const QString& sessionId) const;
    size_t activeSessions() const;
    bool waitForIdle(int timeoutMs);

    SessionHostStats stats() const;

private:
    using ActorPtr = std::shared_ptr<SessionActor>;

    void schedule(const ActorPtr& actor);
    void retire(const ActorPtr& actor);
    bool postClose(const ActorPtr& actor, const QString& reason, int64_t nowMs);

    SessionConfig m_config;
    const StruggleScorer& m_scorer;
    int m_effectivenessSampleSignals = 3;
    SessionActorDelegate& m_delegate;
    ActorExecutor m_executor;

    mutable std::mutex m_mutex;
    QHash<QString, ActorPtr> m_actors;
    bool m_running = false;

    size_t m_sessionsOpened = 0;
    size_t m_sessionsClosed = 0;
    size_t m_capacityRejections = 0;
    size_t m_closingRejections = 0;
    size_t m_identityRejections = 0;
};

} // namespace lp
