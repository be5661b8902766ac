#pragma once

#include "core/shared/settings.h"
#include "core/shared/struggle_types.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace lp {

class ConsentGate;

struct InterventionDecision {
    bool triggered = false;
    std::optional<SuppressionReason> suppression;
    InterventionRecord record;          // valid when triggered
    InterventionCommand command;        // valid when triggered
};

struct InterventionPolicyStats {
    size_t triggered = 0;
    size_t suppressed = 0;
    size_t persistFailures = 0;
    size_t trackedUsers = 0;
};

// InterventionPolicy -- per-user cap/cooldown state machine.
//
// A per-user lock is held across gate evaluation, the synchronous insert
// and the state update, so two sessions of one learner cannot both pass
// the cap. A failed insert leaves the state as it was.
class InterventionPolicy {
public:
    using PersistFn = std::function<bool(const InterventionRecord& record)>;
    using HistoryFn = std::function<std::vector<InterventionRecord>(
        const QString& tenantId, const QString& userId, int64_t sinceMs)>;

    InterventionPolicy(const InterventionPolicyConfig& config,
                       ConsentGate& consentGate,
                       PersistFn persist);

    // Seeds a user's cap/cooldown state from stored records the first
    // time the user is seen, so limits survive a restart.
    void setHistoryLoader(HistoryFn loader);

    InterventionDecision decide(const StruggleAssessment& assessment, int64_t nowMs);

    void forgetUser(const QString& tenantId, const QString& userId);

    // Factor-mapped types in contribution order, proactive_chat last.
    static std::vector<InterventionType> candidateTypes(const QStringList& contributingFactors);
    static Urgency urgencyFor(double riskLevel, const InterventionPolicyConfig& config);

    InterventionPolicyStats stats() const;

private:
    struct UserState {
        std::mutex mutex;
        bool hydrated = false;
        std::deque<int64_t> triggeredAt;                // rolling 24h
        QHash<int, int64_t> lastTriggeredByType;
    };

    std::shared_ptr<UserState> userState(const QString& tenantId, const QString& userId);
    void hydrate(UserState& state, const QString& tenantId, const QString& userId, int64_t nowMs);
    void pruneDay(UserState& state, int64_t nowMs) const;
    bool inCooldown(const UserState& state, InterventionType type, int64_t nowMs) const;
    InterventionDecision suppress(SuppressionReason reason, const StruggleAssessment& assessment);

    InterventionPolicyConfig m_config;
    ConsentGate& m_consentGate;
    PersistFn m_persist;
    HistoryFn m_history;

    mutable std::mutex m_mutex;
    QHash<QString, std::shared_ptr<UserState>> m_users;
    size_t m_triggered = 0;
    size_t m_suppressed = 0;
    size_t m_persistFailures = 0;
};

} // namespace lp
