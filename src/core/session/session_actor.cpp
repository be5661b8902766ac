#include "core/session/session_actor.h"
#include "core/shared/logging.h"

#include <exception>

namespace lp {

SessionActor::SessionActor(const BehavioralSignal& firstSignal,
                           const SessionConfig& config,
                           const StruggleScorer& scorer,
                           int effectivenessSampleSignals,
                           SessionActorDelegate& delegate)
    : m_sessionId(firstSignal.sessionId)
    , m_tenantId(firstSignal.tenantId)
    , m_userId(firstSignal.userId)
    , m_delegate(delegate)
    , m_state(firstSignal.sessionId, firstSignal.tenantId, firstSignal.userId,
              firstSignal.courseId, config, scorer)
    , m_tracker(effectivenessSampleSignals)
{
    m_lastActivityMs.store(firstSignal.receivedAtMs);
}

SessionActor::EnqueueResult SessionActor::enqueue(SessionMessage message)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closeRequested) {
        return EnqueueResult::Closing;
    }
    message.queuedTimer.start();
    if (message.kind == SessionMessage::Kind::Close) {
        m_closeRequested = true;
    } else if (message.kind == SessionMessage::Kind::Signal) {
        m_lastActivityMs.store(message.signal.receivedAtMs);
    }
    m_mailbox.push_back(std::move(message));

    if (m_scheduled) {
        return EnqueueResult::AlreadyScheduled;
    }
    m_scheduled = true;
    return EnqueueResult::NeedsSchedule;
}

bool SessionActor::closeRequested() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closeRequested;
}

size_t SessionActor::mailboxDepth() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mailbox.size();
}

void SessionActor::drain()
{
    while (true) {
        SessionMessage message;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_mailbox.empty()) {
                m_scheduled = false;
                return;
            }
            message = std::move(m_mailbox.front());
            m_mailbox.pop_front();
        }

        try {
            handle(message);
        } catch (const std::exception& e) {
            // One bad message must not wedge the session.
            LOG_ERROR(lpSession, "Session %s failed handling message: %s",
                      qUtf8Printable(m_sessionId), e.what());
        }
    }
}

void SessionActor::handle(const SessionMessage& message)
{
    if (m_finished.load()) {
        return;
    }

    switch (message.kind) {
    case SessionMessage::Kind::Signal: {
        const bool updated = m_state.apply(message.signal);
        const std::vector<EffectivenessMeasurement> measured =
            m_tracker.onSignal(m_state.features().attentionEstimate);
        for (const EffectivenessMeasurement& m : measured) {
            m_delegate.onEffectivenessMeasured(m_state, m);
        }
        m_delegate.onSignalApplied(m_state, message.signal, updated,
                                   message.queuedTimer.elapsed());
        break;
    }
    case SessionMessage::Kind::InterventionOutcome:
        m_tracker.track(message.interventionId, message.response,
                        m_state.features().attentionEstimate);
        break;
    case SessionMessage::Kind::Close:
        LOG_DEBUG(lpSession, "Closing session %s (%s) after %d signals",
                  qUtf8Printable(m_sessionId), qUtf8Printable(message.closeReason),
                  m_state.totalSignals());
        m_finished.store(true);
        m_delegate.onSessionClosed(m_state, message.closeReason, message.atMs);
        break;
    }
}

} // namespace lp
