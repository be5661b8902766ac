#include "core/retention/retention_scheduler.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace lp {

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

QString purgeKey(const QString& tenantId, const QString& userId)
{
    return tenantId + QLatin1Char('\x1f') + userId;
}

} // namespace

RetentionScheduler::RetentionScheduler(RetentionBackend& backend,
                                       const RetentionConfig& config,
                                       int64_t responseTimeoutMs,
                                       int alertExpiryDays)
    : m_backend(backend)
    , m_config(config)
    , m_responseTimeoutMs(responseTimeoutMs)
    , m_alertExpiryDays(alertExpiryDays)
{
    if (m_config.maxPurgeAttempts <= 0) {
        m_config.maxPurgeAttempts = 1;
    }
}

void RetentionScheduler::setEscalationHandler(EscalationFn handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_escalation = std::move(handler);
}

void RetentionScheduler::setPurgeCompletedHandler(PurgedFn handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_purged = std::move(handler);
}

int64_t RetentionScheduler::backoffDelayMs(int attempts, const RetentionConfig& config)
{
    if (attempts <= 0) {
        return 0;
    }
    int64_t delay = config.purgeBackoffBaseMs;
    for (int i = 1; i < attempts && delay < config.purgeBackoffMaxMs; ++i) {
        delay *= 2;
    }
    return std::min(delay, config.purgeBackoffMaxMs);
}

bool RetentionScheduler::requestPurge(const QString& tenantId, const QString& userId, int64_t nowMs)
{
    const QString key = purgeKey(tenantId, userId);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tasks.contains(key)) {
        return false;
    }
    PurgeTask task;
    task.tenantId = tenantId;
    task.userId = userId;
    task.requestedAtMs = nowMs;
    task.nextAttemptAtMs = nowMs;
    m_tasks.insert(key, task);
    LOG_INFO(lpRetention, "Purge queued for tenant=%s", qUtf8Printable(tenantId));
    return true;
}

void RetentionScheduler::escalate(const QString& code, const QString& message, int64_t nowMs)
{
    EscalationFn escalation;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        escalation = m_escalation;
    }
    LOG_ERROR(lpRetention, "%s: %s", qUtf8Printable(code), qUtf8Printable(message));
    if (escalation) {
        OperationalAlert alert;
        alert.component = QStringLiteral("retention_scheduler");
        alert.code = code;
        alert.message = message;
        alert.raisedAtMs = nowMs;
        escalation(alert);
    }
}

PurgeRunResult RetentionScheduler::processPurgeQueue(int64_t nowMs)
{
    PurgeRunResult result;

    std::vector<PurgeTask> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_tasks.cbegin(); it != m_tasks.cend(); ++it) {
            if (it.value().nextAttemptAtMs <= nowMs) {
                due.push_back(it.value());
            }
        }
    }
    std::sort(due.begin(), due.end(), [](const PurgeTask& a, const PurgeTask& b) {
        return a.requestedAtMs < b.requestedAtMs;
    });

    for (PurgeTask& task : due) {
        ++result.attempted;
        QString error;
        const bool ok = m_backend.purgeUser(task.tenantId, task.userId, nowMs, &error);
        const QString key = purgeKey(task.tenantId, task.userId);

        if (ok) {
            PurgedFn purged;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_tasks.remove(key);
                m_slaEscalated.remove(key);
                ++m_purgesCompleted;
                purged = m_purged;
            }
            ++result.purged;
            LOG_INFO(lpRetention, "Purged withdrawn user in tenant=%s after %d attempt(s)",
                     qUtf8Printable(task.tenantId), task.attempts + 1);
            if (purged) {
                purged(task.tenantId, task.userId);
            }
            continue;
        }

        ++task.attempts;
        task.lastError = error;
        bool exhausted = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_purgeFailures;
            if (task.attempts >= m_config.maxPurgeAttempts) {
                m_tasks.remove(key);
                ++m_purgesEscalated;
                exhausted = true;
            } else {
                task.nextAttemptAtMs = nowMs + backoffDelayMs(task.attempts, m_config);
                m_tasks.insert(key, task);
            }
        }

        if (exhausted) {
            ++result.escalated;
            escalate(QStringLiteral("purge_retries_exhausted"),
                     QStringLiteral("Purge for tenant %1 failed %2 times: %3")
                         .arg(task.tenantId)
                         .arg(task.attempts)
                         .arg(error),
                     nowMs);
        } else {
            ++result.retryScheduled;
            LOG_WARN(lpRetention, "Purge attempt %d for tenant=%s failed: %s (retry in %lld ms)",
                     task.attempts, qUtf8Printable(task.tenantId), qUtf8Printable(error),
                     static_cast<long long>(task.nextAttemptAtMs - nowMs));
        }
    }
    return result;
}

RetentionSweepResult RetentionScheduler::runSweep(int64_t nowMs)
{
    RetentionSweepResult result;

    for (const QString& tenantId : m_backend.tenantsWithData()) {
        TenantRetentionPolicy policy;
        policy.tenantId = tenantId;
        policy.signalRetentionDays = m_config.signalRetentionDays;
        policy.recordRetentionDays = m_config.recordRetentionDays;
        if (const std::optional<TenantRetentionPolicy> custom = m_backend.tenantRetentionPolicy(tenantId)) {
            policy = *custom;
        }

        const int64_t signalCutoff = nowMs - policy.signalRetentionDays * kDayMs;
        const int64_t recordCutoff = nowMs - policy.recordRetentionDays * kDayMs;

        RetentionSweepCounts counts;
        QString error;
        if (!m_backend.applyTenantRetention(tenantId, signalCutoff, recordCutoff, nowMs,
                                            &counts, &error)) {
            ++result.tenantsFailed;
            result.ok = false;
            LOG_ERROR(lpRetention, "Retention sweep failed for tenant=%s: %s",
                      qUtf8Printable(tenantId), qUtf8Printable(error));
            continue;
        }
        ++result.tenantsSwept;
        result.totals.signalsDeleted += counts.signalsDeleted;
        result.totals.snapshotsDeleted += counts.snapshotsDeleted;
        result.totals.recordsAnonymized += counts.recordsAnonymized;
    }

    const int64_t slaMs = static_cast<int64_t>(m_config.purgeSlaHours) * 3600 * 1000;
    QSet<QString> stillPending;
    for (const PendingPurge& pending : m_backend.withdrawnUnpurgedUsers()) {
        if (requestPurge(pending.tenantId, pending.userId, nowMs)) {
            ++result.purgesDiscovered;
        }
        const QString key = purgeKey(pending.tenantId, pending.userId);
        stillPending.insert(key);
        if (nowMs - pending.withdrawnAtMs <= slaMs) {
            continue;
        }
        bool firstBreach = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_slaEscalated.contains(key)) {
                m_slaEscalated.insert(key);
                firstBreach = true;
            }
        }
        if (firstBreach) {
            ++result.slaBreaches;
            escalate(QStringLiteral("purge_sla_breached"),
                     QStringLiteral("Withdrawn user in tenant %1 still unpurged after %2 h")
                         .arg(pending.tenantId)
                         .arg(m_config.purgeSlaHours),
                     nowMs);
        }
    }
    {
        // Breaches resolved outside the queue (regrant, manual purge) may fire again later.
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slaEscalated.intersect(stillPending);
    }

    const int timedOut = m_backend.timeoutStaleInterventions(nowMs - m_responseTimeoutMs, nowMs);
    if (timedOut < 0) {
        result.ok = false;
    } else {
        result.interventionsTimedOut = timedOut;
    }

    const int expired = m_backend.expireStaleAlerts(nowMs - m_alertExpiryDays * kDayMs, nowMs);
    if (expired < 0) {
        result.ok = false;
    } else {
        result.alertsExpired = expired;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_sweepsRun;
    }
    LOG_INFO(lpRetention,
             "Retention sweep: %d tenants (%d failed), %d signals, %d snapshots deleted, "
             "%d records anonymized, %d purges queued, %d timeouts, %d alerts expired",
             result.tenantsSwept, result.tenantsFailed, result.totals.signalsDeleted,
             result.totals.snapshotsDeleted, result.totals.recordsAnonymized,
             result.purgesDiscovered, result.interventionsTimedOut, result.alertsExpired);
    return result;
}

std::vector<PurgeTask> RetentionScheduler::pendingTasks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PurgeTask> tasks;
    for (auto it = m_tasks.cbegin(); it != m_tasks.cend(); ++it) {
        tasks.push_back(it.value());
    }
    std::sort(tasks.begin(), tasks.end(), [](const PurgeTask& a, const PurgeTask& b) {
        return a.requestedAtMs < b.requestedAtMs;
    });
    return tasks;
}

RetentionStats RetentionScheduler::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    RetentionStats out;
    out.pendingPurges = static_cast<size_t>(m_tasks.size());
    out.purgesCompleted = m_purgesCompleted;
    out.purgeFailures = m_purgeFailures;
    out.purgesEscalated = m_purgesEscalated;
    out.sweepsRun = m_sweepsRun;
    return out;
}

} // namespace lp
