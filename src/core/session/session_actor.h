#pragma once

#include "core/intervention/effectiveness_tracker.h"
#include "core/session/session_state.h"

#include <QElapsedTimer>
#include <QString>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace lp {

struct SessionMessage {
    enum class Kind {
        Signal,
        Close,
        InterventionOutcome,
    };

    Kind kind = Kind::Signal;
    BehavioralSignal signal;
    QString closeReason;
    QString interventionId;
    UserResponse response = UserResponse::None;
    int64_t atMs = 0;
    QElapsedTimer queuedTimer;      // started by enqueue()
};

// Callbacks made from the actor's drain, one at a time per session.
class SessionActorDelegate {
public:
    virtual ~SessionActorDelegate() = default;

    // featuresUpdated is false after a ModelError. queueDelayMs is the
    // time the signal waited in the mailbox.
    virtual void onSignalApplied(const SessionState& state, const BehavioralSignal& signal,
                                 bool featuresUpdated, int64_t queueDelayMs) = 0;
    virtual void onEffectivenessMeasured(const SessionState& state,
                                         const EffectivenessMeasurement& measurement) = 0;
    virtual void onSessionClosed(const SessionState& state, const QString& reason,
                                 int64_t closedAtMs) = 0;
};

// SessionActor -- mailbox plus exclusively owned SessionState.
//
// enqueue() may be called from any thread. drain() is run by the host on
// an executor worker and never concurrently with itself, which is what
// serializes every mutation of the session.
class SessionActor {
public:
    enum class EnqueueResult {
        NeedsSchedule,
        AlreadyScheduled,
        Closing,
    };

    SessionActor(const BehavioralSignal& firstSignal,
                 const SessionConfig& config,
                 const StruggleScorer& scorer,
                 int effectivenessSampleSignals,
                 SessionActorDelegate& delegate);

    SessionActor(const SessionActor&) = delete;
    SessionActor& operator=(const SessionActor&) = delete;

    EnqueueResult enqueue(SessionMessage message);

    // Handles queued messages in FIFO order until the mailbox is empty.
    void drain();

    const QString& sessionId() const { return m_sessionId; }
    const QString& tenantId() const { return m_tenantId; }
    const QString& userId() const { return m_userId; }

    int64_t lastActivityMs() const { return m_lastActivityMs.load(); }
    bool closeRequested() const;
    bool finished() const { return m_finished.load(); }
    size_t mailboxDepth() const;

private:
    void handle(const SessionMessage& message);

    const QString m_sessionId;
    const QString m_tenantId;
    const QString m_userId;
    SessionActorDelegate& m_delegate;

    // Touched only inside drain().
    SessionState m_state;
    EffectivenessTracker m_tracker;

    mutable std::mutex m_mutex;
    std::deque<SessionMessage> m_mailbox;
    bool m_scheduled = false;
    bool m_closeRequested = false;

    std::atomic<int64_t> m_lastActivityMs{0};
    std::atomic<bool> m_finished{false};
};

} // namespace lp
