#include <QtTest/QtTest>

#include "core/retention/retention_scheduler.h"

#include <QHash>
#include <QSet>

#include <vector>

namespace {

constexpr int64_t kNow = 1700000000000;
constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

class FakeRetentionBackend : public lp::RetentionBackend {
public:
    std::vector<QString> tenantsWithData() override { return tenants; }

    std::optional<lp::TenantRetentionPolicy> tenantRetentionPolicy(const QString& tenantId) override
    {
        auto it = policies.constFind(tenantId);
        if (it == policies.constEnd()) {
            return std::nullopt;
        }
        return *it;
    }

    bool applyTenantRetention(const QString& tenantId, int64_t signalCutoffMs,
                              int64_t recordCutoffMs, int64_t,
                              lp::RetentionSweepCounts* counts, QString* errorOut) override
    {
        sweptTenants.append(tenantId);
        signalCutoffs.insert(tenantId, signalCutoffMs);
        recordCutoffs.insert(tenantId, recordCutoffMs);
        if (failingTenants.contains(tenantId)) {
            if (errorOut) *errorOut = QStringLiteral("disk I/O error");
            return false;
        }
        counts->signalsDeleted = 10;
        counts->snapshotsDeleted = 2;
        counts->recordsAnonymized = 3;
        return true;
    }

    std::vector<lp::PendingPurge> withdrawnUnpurgedUsers() override { return pending; }

    bool purgeUser(const QString& tenantId, const QString& userId, int64_t,
                   QString* errorOut) override
    {
        purgeAttempts.append(tenantId + QLatin1Char('/') + userId);
        if (failingTenants.contains(tenantId)) {
            if (errorOut) *errorOut = QStringLiteral("database is locked");
            return false;
        }
        purged.append(tenantId + QLatin1Char('/') + userId);
        return true;
    }

    int timeoutStaleInterventions(int64_t deliveredBeforeMs, int64_t) override
    {
        timeoutCutoff = deliveredBeforeMs;
        return 4;
    }

    int expireStaleAlerts(int64_t updatedBeforeMs, int64_t) override
    {
        alertCutoff = updatedBeforeMs;
        return 1;
    }

    std::vector<QString> tenants;
    QHash<QString, lp::TenantRetentionPolicy> policies;
    QSet<QString> failingTenants;
    std::vector<lp::PendingPurge> pending;

    QStringList sweptTenants;
    QHash<QString, int64_t> signalCutoffs;
    QHash<QString, int64_t> recordCutoffs;
    QStringList purgeAttempts;
    QStringList purged;
    int64_t timeoutCutoff = 0;
    int64_t alertCutoff = 0;
};

} // namespace

class TestRetentionScheduler : public QObject {
    Q_OBJECT

private slots:
    void testBackoffDoublesAndCaps();
    void testRequestPurgeDeduplicates();
    void testSuccessfulPurgeNotifiesAndClears();
    void testFailedPurgeRetriesAfterBackoff();
    void testExhaustedRetriesEscalate();
    void testFailingTenantDoesNotBlockOthers();
    void testSweepAppliesTenantPolicyAndDefaults();
    void testSweepRediscoversWithdrawnUsersAndFlagsSla();
    void testSlaBreachEscalatesOncePerUser();
    void testSweepTimesOutInterventionsAndExpiresAlerts();
};

void TestRetentionScheduler::testBackoffDoublesAndCaps()
{
    lp::RetentionConfig config;
    QCOMPARE(lp::RetentionScheduler::backoffDelayMs(0, config), int64_t(0));
    QCOMPARE(lp::RetentionScheduler::backoffDelayMs(1, config), int64_t(1000));
    QCOMPARE(lp::RetentionScheduler::backoffDelayMs(2, config), int64_t(2000));
    QCOMPARE(lp::RetentionScheduler::backoffDelayMs(4, config), int64_t(8000));
    QCOMPARE(lp::RetentionScheduler::backoffDelayMs(20, config), int64_t(300000));
}

void TestRetentionScheduler::testRequestPurgeDeduplicates()
{
    FakeRetentionBackend backend;
    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);

    QVERIFY(scheduler.requestPurge(QStringLiteral("t1"), QStringLiteral("u1"), kNow));
    QVERIFY(!scheduler.requestPurge(QStringLiteral("t1"), QStringLiteral("u1"), kNow + 5));
    QVERIFY(scheduler.requestPurge(QStringLiteral("t2"), QStringLiteral("u1"), kNow));
    QCOMPARE(scheduler.pendingTasks().size(), static_cast<size_t>(2));
}

void TestRetentionScheduler::testSuccessfulPurgeNotifiesAndClears()
{
    FakeRetentionBackend backend;
    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);

    QStringList notified;
    scheduler.setPurgeCompletedHandler([&notified](const QString& tenantId, const QString& userId) {
        notified.append(tenantId + QLatin1Char('/') + userId);
    });

    scheduler.requestPurge(QStringLiteral("t1"), QStringLiteral("u1"), kNow);
    const lp::PurgeRunResult run = scheduler.processPurgeQueue(kNow);
    QCOMPARE(run.attempted, 1);
    QCOMPARE(run.purged, 1);
    QCOMPARE(notified, QStringList{QStringLiteral("t1/u1")});
    QVERIFY(scheduler.pendingTasks().empty());
    QCOMPARE(scheduler.stats().purgesCompleted, static_cast<size_t>(1));
}

void TestRetentionScheduler::testFailedPurgeRetriesAfterBackoff()
{
    FakeRetentionBackend backend;
    backend.failingTenants.insert(QStringLiteral("t1"));
    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);

    scheduler.requestPurge(QStringLiteral("t1"), QStringLiteral("u1"), kNow);
    lp::PurgeRunResult run = scheduler.processPurgeQueue(kNow);
    QCOMPARE(run.retryScheduled, 1);

    const std::vector<lp::PurgeTask> tasks = scheduler.pendingTasks();
    QCOMPARE(tasks.size(), static_cast<size_t>(1));
    QCOMPARE(tasks[0].attempts, 1);
    QCOMPARE(tasks[0].nextAttemptAtMs, kNow + 1000);
    QCOMPARE(tasks[0].lastError, QStringLiteral("database is locked"));

    // Not due yet.
    run = scheduler.processPurgeQueue(kNow + 999);
    QCOMPARE(run.attempted, 0);

    backend.failingTenants.clear();
    run = scheduler.processPurgeQueue(kNow + 1000);
    QCOMPARE(run.purged, 1);
    QCOMPARE(backend.purgeAttempts.size(), 2);
}

void TestRetentionScheduler::testExhaustedRetriesEscalate()
{
    FakeRetentionBackend backend;
    backend.failingTenants.insert(QStringLiteral("t1"));
    lp::RetentionConfig config;
    config.maxPurgeAttempts = 3;
    lp::RetentionScheduler scheduler(backend, config, 600000, 7);

    std::vector<lp::OperationalAlert> alerts;
    scheduler.setEscalationHandler([&alerts](const lp::OperationalAlert& alert) {
        alerts.push_back(alert);
    });

    scheduler.requestPurge(QStringLiteral("t1"), QStringLiteral("u1"), kNow);
    int64_t now = kNow;
    for (int i = 0; i < 3; ++i) {
        scheduler.processPurgeQueue(now);
        now += 600000;
    }

    QCOMPARE(backend.purgeAttempts.size(), 3);
    QCOMPARE(alerts.size(), static_cast<size_t>(1));
    QCOMPARE(alerts[0].component, QStringLiteral("retention_scheduler"));
    QCOMPARE(alerts[0].code, QStringLiteral("purge_retries_exhausted"));
    QVERIFY(scheduler.pendingTasks().empty());
    QCOMPARE(scheduler.stats().purgesEscalated, static_cast<size_t>(1));
}

void TestRetentionScheduler::testFailingTenantDoesNotBlockOthers()
{
    FakeRetentionBackend backend;
    backend.failingTenants.insert(QStringLiteral("bad"));
    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);

    scheduler.requestPurge(QStringLiteral("bad"), QStringLiteral("u1"), kNow);
    scheduler.requestPurge(QStringLiteral("good"), QStringLiteral("u2"), kNow + 1);

    const lp::PurgeRunResult run = scheduler.processPurgeQueue(kNow + 10);
    QCOMPARE(run.attempted, 2);
    QCOMPARE(run.purged, 1);
    QCOMPARE(run.retryScheduled, 1);
    QCOMPARE(backend.purged, QStringList{QStringLiteral("good/u2")});
}

void TestRetentionScheduler::testSweepAppliesTenantPolicyAndDefaults()
{
    FakeRetentionBackend backend;
    backend.tenants = {QStringLiteral("t1"), QStringLiteral("t2"), QStringLiteral("t3")};
    lp::TenantRetentionPolicy strict;
    strict.tenantId = QStringLiteral("t2");
    strict.signalRetentionDays = 7;
    strict.recordRetentionDays = 90;
    backend.policies.insert(QStringLiteral("t2"), strict);
    backend.failingTenants.insert(QStringLiteral("t1"));

    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);
    const lp::RetentionSweepResult result = scheduler.runSweep(kNow);

    QVERIFY(!result.ok);
    QCOMPARE(result.tenantsFailed, 1);
    QCOMPARE(result.tenantsSwept, 2);
    QCOMPARE(backend.sweptTenants.size(), 3);
    QCOMPARE(result.totals.signalsDeleted, 20);
    QCOMPARE(result.totals.recordsAnonymized, 6);

    QCOMPARE(backend.signalCutoffs.value(QStringLiteral("t2")), kNow - 7 * kDayMs);
    QCOMPARE(backend.recordCutoffs.value(QStringLiteral("t2")), kNow - 90 * kDayMs);
    QCOMPARE(backend.signalCutoffs.value(QStringLiteral("t3")), kNow - 30 * kDayMs);
    QCOMPARE(backend.recordCutoffs.value(QStringLiteral("t3")), kNow - 365 * kDayMs);
}

void TestRetentionScheduler::testSweepRediscoversWithdrawnUsersAndFlagsSla()
{
    FakeRetentionBackend backend;
    backend.pending.push_back({QStringLiteral("t1"), QStringLiteral("recent"), kNow - 3600 * 1000});
    backend.pending.push_back({QStringLiteral("t1"), QStringLiteral("overdue"), kNow - 25 * 3600 * 1000LL});

    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);
    std::vector<lp::OperationalAlert> alerts;
    scheduler.setEscalationHandler([&alerts](const lp::OperationalAlert& alert) {
        alerts.push_back(alert);
    });

    const lp::RetentionSweepResult result = scheduler.runSweep(kNow);
    QCOMPARE(result.purgesDiscovered, 2);
    QCOMPARE(scheduler.pendingTasks().size(), static_cast<size_t>(2));
    QCOMPARE(alerts.size(), static_cast<size_t>(1));
    QCOMPARE(alerts[0].code, QStringLiteral("purge_sla_breached"));

    // Already queued: the next sweep does not count them again.
    QCOMPARE(scheduler.runSweep(kNow + 1).purgesDiscovered, 0);
}

void TestRetentionScheduler::testSlaBreachEscalatesOncePerUser()
{
    FakeRetentionBackend backend;
    const lp::PendingPurge overdue{QStringLiteral("t1"), QStringLiteral("overdue"),
                                   kNow - 25 * 3600 * 1000LL};
    backend.pending.push_back(overdue);

    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);
    int slaAlerts = 0;
    scheduler.setEscalationHandler([&slaAlerts](const lp::OperationalAlert& alert) {
        if (alert.code == QLatin1String("purge_sla_breached")) {
            ++slaAlerts;
        }
    });

    QCOMPARE(scheduler.runSweep(kNow).slaBreaches, 1);
    QCOMPARE(scheduler.runSweep(kNow + 3600 * 1000).slaBreaches, 0);
    QCOMPARE(scheduler.runSweep(kNow + 2 * 3600 * 1000).slaBreaches, 0);
    QCOMPARE(slaAlerts, 1);

    QCOMPARE(scheduler.processPurgeQueue(kNow + 2 * 3600 * 1000).purged, 1);
    backend.pending.clear();
    scheduler.runSweep(kNow + 3 * 3600 * 1000);
    QCOMPARE(slaAlerts, 1);

    // A later withdrawal that also overruns is a new breach.
    backend.pending.push_back(overdue);
    QCOMPARE(scheduler.runSweep(kNow + 4 * 3600 * 1000).slaBreaches, 1);
    QCOMPARE(slaAlerts, 2);
}

void TestRetentionScheduler::testSweepTimesOutInterventionsAndExpiresAlerts()
{
    FakeRetentionBackend backend;
    lp::RetentionScheduler scheduler(backend, {}, 600000, 7);

    const lp::RetentionSweepResult result = scheduler.runSweep(kNow);
    QVERIFY(result.ok);
    QCOMPARE(result.interventionsTimedOut, 4);
    QCOMPARE(result.alertsExpired, 1);
    QCOMPARE(backend.timeoutCutoff, kNow - 600000);
    QCOMPARE(backend.alertCutoff, kNow - 7 * kDayMs);
    QCOMPARE(scheduler.stats().sweepsRun, static_cast<size_t>(1));
}

QTEST_MAIN(TestRetentionScheduler)
#include "test_retention_scheduler.moc"
