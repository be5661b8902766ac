#pragma once

#include "core/retention/retention_backend.h"
#include "core/shared/settings.h"
#include "core/shared/struggle_types.h"

#include <QHash>
#include <QSet>
#include <QString>

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace lp {

struct PurgeTask {
    QString tenantId;
    QString userId;
    int attempts = 0;
    int64_t requestedAtMs = 0;
    int64_t nextAttemptAtMs = 0;
    QString lastError;
};

struct PurgeRunResult {
    int attempted = 0;
    int purged = 0;
    int retryScheduled = 0;
    int escalated = 0;
};

struct RetentionSweepResult {
    bool ok = true;
    int tenantsSwept = 0;
    int tenantsFailed = 0;
    RetentionSweepCounts totals;
    int purgesDiscovered = 0;
    int slaBreaches = 0;
    int interventionsTimedOut = 0;
    int alertsExpired = 0;
};

struct RetentionStats {
    size_t pendingPurges = 0;
    size_t purgesCompleted = 0;
    size_t purgeFailures = 0;
    size_t purgesEscalated = 0;
    size_t sweepsRun = 0;
};

// RetentionScheduler -- purge queue plus the periodic retention sweep.
//
// Purge tasks are retried with exponential backoff and escalated to an
// operational alert once maxPurgeAttempts is reached. Each tenant and each
// user is processed on its own, so one failure never blocks the rest.
class RetentionScheduler {
public:
    using EscalationFn = std::function<void(const OperationalAlert& alert)>;
    using PurgedFn = std::function<void(const QString& tenantId, const QString& userId)>;

    RetentionScheduler(RetentionBackend& backend,
                       const RetentionConfig& config,
                       int64_t responseTimeoutMs,
                       int alertExpiryDays);

    void setEscalationHandler(EscalationFn handler);
    void setPurgeCompletedHandler(PurgedFn handler);

    // False when the user already has a queued task.
    bool requestPurge(const QString& tenantId, const QString& userId, int64_t nowMs);

    // Runs every task whose backoff has elapsed.
    PurgeRunResult processPurgeQueue(int64_t nowMs);

    RetentionSweepResult runSweep(int64_t nowMs);

    std::vector<PurgeTask> pendingTasks() const;
    RetentionStats stats() const;

    // Delay before the next try after `attempts` failures.
    static int64_t backoffDelayMs(int attempts, const RetentionConfig& config);

private:
    void escalate(const QString& code, const QString& message, int64_t nowMs);

    RetentionBackend& m_backend;
    RetentionConfig m_config;
    int64_t m_responseTimeoutMs = 0;
    int m_alertExpiryDays = 7;

    mutable std::mutex m_mutex;
    QHash<QString, PurgeTask> m_tasks;
    QSet<QString> m_slaEscalated;
    EscalationFn m_escalation;
    PurgedFn m_purged;

    size_t m_purgesCompleted = 0;
    size_t m_purgeFailures = 0;
    size_t m_purgesEscalated = 0;
    size_t m_sweepsRun = 0;
};

} // namespace lp
