#include <QtTest/QtTest>

#include "core/store/engine_store.h"

#include <memory>

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;
constexpr int64_t kNow = 1800000000000LL;

int64_t countWhere(lp::EngineStore& store, const char* sqlText)
{
    lp::EngineStore::Connection connection = store.acquire();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(connection.db(), sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    int64_t value = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

lp::BehavioralSignal makeSignal(const QString& tenantId, const QString& userId,
                                const QString& nonce, int64_t timestampMs)
{
    lp::BehavioralSignal signal;
    signal.tenantId = tenantId;
    signal.userId = userId;
    signal.sessionId = QStringLiteral("sess-") + userId;
    signal.courseId = QStringLiteral("c1");
    signal.type = lp::SignalType::Click;
    signal.durationMs = 1200;
    signal.nonce = nonce;
    signal.origin = QStringLiteral("https://school.instructure.com");
    signal.timestampMs = timestampMs;
    signal.receivedAtMs = timestampMs;
    return signal;
}

lp::InterventionRecord makeIntervention(const QString& id, const QString& userId,
                                        int64_t triggeredAtMs)
{
    lp::InterventionRecord record;
    record.id = id;
    record.sessionId = QStringLiteral("sess-") + userId;
    record.userId = userId;
    record.tenantId = QStringLiteral("t1");
    record.courseId = QStringLiteral("c1");
    record.type = lp::InterventionType::HelpOffer;
    record.urgency = lp::Urgency::High;
    record.riskLevel = 0.8;
    record.messageIntent = QStringLiteral("offer_help");
    record.triggeredAtMs = triggeredAtMs;
    return record;
}

lp::StruggleAssessment makeAssessment(const QString& id, const QString& userId,
                                      int64_t computedAtMs)
{
    lp::StruggleAssessment assessment;
    assessment.id = id;
    assessment.sessionId = QStringLiteral("sess-") + userId;
    assessment.userId = userId;
    assessment.tenantId = QStringLiteral("t1");
    assessment.courseId = QStringLiteral("c1");
    assessment.riskLevel = 0.72;
    assessment.confidence = 0.8;
    assessment.contributingFactors = {QStringLiteral("error_rate")};
    assessment.modelVersion = QStringLiteral("heuristic-1.0");
    assessment.computedAtMs = computedAtMs;
    assessment.validUntilMs = computedAtMs + 300000;
    return assessment;
}

} // namespace

class TestEngineStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testOpenCreatesSchema();
    void testConsentLookupNotFound();
    void testScopeWithdrawalKeepsOtherScopes();
    void testFullWithdrawalStampsOnce();
    void testRegrantStartsNewPeriod();
    void testDuplicateNonceIgnored();
    void testResponseRecordedOnce();
    void testDeliveryOnMissingRecordFails();
    void testInterventionsForUserSince();
    void testPurgeUserAnonymizesRecords();
    void testTenantRetentionScopedToTenant();
    void testTenantRetentionPolicyRoundTrip();
    void testTimeoutStaleInterventions();
    void testSettingsRoundTrip();

private:
    std::unique_ptr<lp::EngineStore> m_store;
};

void TestEngineStore::init()
{
    m_store = lp::EngineStore::open(QStringLiteral(":memory:"));
    QVERIFY(m_store);
}

void TestEngineStore::cleanup()
{
    m_store.reset();
}

void TestEngineStore::testOpenCreatesSchema()
{
    QVERIFY(m_store->integrityCheck());
    const std::optional<lp::StoreCounts> counts = m_store->counts();
    QVERIFY(counts.has_value());
    QCOMPARE(counts->signals, int64_t(0));
    QCOMPARE(counts->openAlerts, int64_t(0));
    QCOMPARE(counts->pendingPurges, int64_t(0));
}

void TestEngineStore::testConsentLookupNotFound()
{
    const lp::ConsentLookup lookup = m_store->lookupConsent(QStringLiteral("t1"),
                                                            QStringLiteral("nobody"));
    QCOMPARE(lookup.status, lp::ConsentLookupStatus::NotFound);
}

void TestEngineStore::testScopeWithdrawalKeepsOtherScopes()
{
    QVERIFY(m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                        std::nullopt, true, kNow).has_value());
    const auto record = m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                                    lp::ConsentScope::ChatInteractions,
                                                    false, kNow + 10);
    QVERIFY(record.has_value());
    QVERIFY(!record->scopes.chatInteractions);
    QVERIFY(record->scopes.behavioralTiming);
    QVERIFY(!record->withdrawnAtMs.has_value());

    const lp::ConsentLookup lookup = m_store->lookupConsent(QStringLiteral("t1"),
                                                            QStringLiteral("u1"));
    QCOMPARE(lookup.status, lp::ConsentLookupStatus::Found);
    QVERIFY(lookup.record.scopes.assessmentPatterns);
    QVERIFY(!lookup.record.scopes.chatInteractions);
    QCOMPARE(lookup.record.updatedAtMs, kNow + 10);
}

void TestEngineStore::testFullWithdrawalStampsOnce()
{
    m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                std::nullopt, true, kNow);
    const auto first = m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                                   lp::ConsentScope::BehavioralTiming,
                                                   false, kNow + 100);
    QVERIFY(first.has_value());
    QCOMPARE(first->withdrawnAtMs.value(), kNow + 100);

    const auto second = m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                                    std::nullopt, false, kNow + 200);
    QVERIFY(second.has_value());
    QCOMPARE(second->withdrawnAtMs.value(), kNow + 100);
    QVERIFY(!second->scopes.anonymizedAnalytics);

    const std::vector<lp::PendingPurge> pending = m_store->withdrawnUnpurgedUsers();
    QCOMPARE(static_cast<int>(pending.size()), 1);
    QCOMPARE(pending[0].userId, QStringLiteral("u1"));
    QCOMPARE(pending[0].withdrawnAtMs, kNow + 100);
    QCOMPARE(m_store->counts()->pendingPurges, int64_t(1));
}

void TestEngineStore::testRegrantStartsNewPeriod()
{
    m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                std::nullopt, false, kNow);
    QVERIFY(m_store->purgeUser(QStringLiteral("t1"), QStringLiteral("u1"), kNow + 1, nullptr));

    lp::ConsentLookup lookup = m_store->lookupConsent(QStringLiteral("t1"), QStringLiteral("u1"));
    QVERIFY(lookup.record.purgedAtMs.has_value());

    const auto record = m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                                    lp::ConsentScope::BehavioralTiming,
                                                    true, kNow + 2);
    QVERIFY(record.has_value());
    QVERIFY(!record->withdrawnAtMs.has_value());
    QVERIFY(!record->purgedAtMs.has_value());
    QVERIFY(record->scopes.behavioralTiming);
    QVERIFY(!record->scopes.chatInteractions);
}

void TestEngineStore::testDuplicateNonceIgnored()
{
    QVERIFY(m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u1"),
                                             QStringLiteral("n-1"), kNow)));
    QVERIFY(m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u1"),
                                             QStringLiteral("n-1"), kNow + 5)));
    QVERIFY(m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u1"),
                                             QStringLiteral("n-2"), kNow + 5)));
    QCOMPARE(m_store->counts()->signals, int64_t(2));
}

void TestEngineStore::testResponseRecordedOnce()
{
    QVERIFY(m_store->insertIntervention(makeIntervention(QStringLiteral("iv-1"),
                                                         QStringLiteral("u1"), kNow)));
    QVERIFY(m_store->recordDelivery(QStringLiteral("iv-1"), kNow + 10));
    QVERIFY(m_store->recordResponse(QStringLiteral("iv-1"), lp::UserResponse::Accepted, kNow + 20));
    QVERIFY(m_store->recordResponse(QStringLiteral("iv-1"), lp::UserResponse::Accepted, kNow + 30));
    QVERIFY(!m_store->recordResponse(QStringLiteral("iv-1"), lp::UserResponse::Dismissed,
                                     kNow + 40));

    const std::optional<lp::InterventionRecord> record =
        m_store->getIntervention(QStringLiteral("iv-1"));
    QVERIFY(record.has_value());
    QCOMPARE(record->userResponse, lp::UserResponse::Accepted);
    QCOMPARE(record->respondedAtMs.value(), kNow + 20);
    QCOMPARE(record->deliveredAtMs.value(), kNow + 10);
    QCOMPARE(record->messageIntent, QStringLiteral("offer_help"));
}

void TestEngineStore::testDeliveryOnMissingRecordFails()
{
    QVERIFY(!m_store->recordDelivery(QStringLiteral("missing"), kNow));
    QVERIFY(!m_store->recordResponse(QStringLiteral("missing"), lp::UserResponse::Accepted, kNow));
    QVERIFY(!m_store->getIntervention(QStringLiteral("missing")).has_value());
}

void TestEngineStore::testInterventionsForUserSince()
{
    m_store->insertIntervention(makeIntervention(QStringLiteral("old"), QStringLiteral("u1"),
                                                 kNow - 2 * kDayMs));
    m_store->insertIntervention(makeIntervention(QStringLiteral("b"), QStringLiteral("u1"),
                                                 kNow - 1000));
    m_store->insertIntervention(makeIntervention(QStringLiteral("a"), QStringLiteral("u1"),
                                                 kNow - 5000));
    m_store->insertIntervention(makeIntervention(QStringLiteral("other"), QStringLiteral("u2"),
                                                 kNow));

    const std::vector<lp::InterventionRecord> records = m_store->interventionsForUserSince(
        QStringLiteral("t1"), QStringLiteral("u1"), kNow - kDayMs);
    QCOMPARE(static_cast<int>(records.size()), 2);
    QCOMPARE(records[0].id, QStringLiteral("a"));
    QCOMPARE(records[1].id, QStringLiteral("b"));
}

void TestEngineStore::testPurgeUserAnonymizesRecords()
{
    m_store->applyConsentChange(QStringLiteral("t1"), QStringLiteral("u1"),
                                std::nullopt, false, kNow);
    m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u1"),
                                     QStringLiteral("n-1"), kNow));
    m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u2"),
                                     QStringLiteral("n-1"), kNow));
    m_store->insertAssessment(makeAssessment(QStringLiteral("se-1"), QStringLiteral("u1"), kNow));
    m_store->insertIntervention(makeIntervention(QStringLiteral("iv-1"), QStringLiteral("u1"), kNow));

    lp::SessionSnapshotRow snapshot;
    snapshot.sessionId = QStringLiteral("sess-u1");
    snapshot.tenantId = QStringLiteral("t1");
    snapshot.userId = QStringLiteral("u1");
    snapshot.featuresJson = QByteArrayLiteral("{}");
    snapshot.openedAtMs = kNow - 1000;
    snapshot.closedAtMs = kNow;
    snapshot.closeReason = QStringLiteral("idle_timeout");
    QVERIFY(m_store->upsertSessionSnapshot(snapshot));

    QString error;
    QVERIFY(m_store->purgeUser(QStringLiteral("t1"), QStringLiteral("u1"), kNow + 100, &error));

    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM behavioral_signals WHERE user_id = 'u1'"), int64_t(0));
    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM behavioral_signals WHERE user_id = 'u2'"), int64_t(1));
    QCOMPARE(countWhere(*m_store, "SELECT COUNT(*) FROM session_snapshots"), int64_t(0));
    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM struggle_events WHERE user_id LIKE 'anon-%'"), int64_t(1));
    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM proactive_interventions WHERE user_id = 'u1'"), int64_t(0));

    const std::optional<lp::InterventionRecord> record =
        m_store->getIntervention(QStringLiteral("iv-1"));
    QVERIFY(record.has_value());
    QVERIFY(record->userId.startsWith(QStringLiteral("anon-")));

    QVERIFY(m_store->withdrawnUnpurgedUsers().empty());
    const lp::ConsentLookup lookup = m_store->lookupConsent(QStringLiteral("t1"),
                                                            QStringLiteral("u1"));
    QCOMPARE(lookup.record.purgedAtMs.value(), kNow + 100);
}

void TestEngineStore::testTenantRetentionScopedToTenant()
{
    m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u1"),
                                     QStringLiteral("old"), kNow - 40 * kDayMs));
    m_store->insertSignal(makeSignal(QStringLiteral("t1"), QStringLiteral("u1"),
                                     QStringLiteral("new"), kNow - kDayMs));
    m_store->insertSignal(makeSignal(QStringLiteral("t2"), QStringLiteral("u9"),
                                     QStringLiteral("old"), kNow - 40 * kDayMs));
    m_store->insertAssessment(makeAssessment(QStringLiteral("se-old"), QStringLiteral("u1"),
                                             kNow - 400 * kDayMs));
    m_store->insertAssessment(makeAssessment(QStringLiteral("se-new"), QStringLiteral("u1"),
                                             kNow - kDayMs));

    const std::vector<QString> tenants = m_store->tenantsWithData();
    QCOMPARE(static_cast<int>(tenants.size()), 2);
    QCOMPARE(tenants[0], QStringLiteral("t1"));

    lp::RetentionSweepCounts counts;
    QString error;
    QVERIFY(m_store->applyTenantRetention(QStringLiteral("t1"), kNow - 30 * kDayMs,
                                          kNow - 365 * kDayMs, kNow, &counts, &error));
    QCOMPARE(counts.signalsDeleted, 1);
    QCOMPARE(counts.recordsAnonymized, 1);

    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM behavioral_signals WHERE tenant_id = 't2'"), int64_t(1));
    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM struggle_events WHERE user_id = 'u1'"), int64_t(1));
    QCOMPARE(countWhere(*m_store,
        "SELECT COUNT(*) FROM struggle_events WHERE id = 'se-old' AND anonymized_at IS NOT NULL"),
        int64_t(1));
}

void TestEngineStore::testTenantRetentionPolicyRoundTrip()
{
    QVERIFY(!m_store->tenantRetentionPolicy(QStringLiteral("t1")).has_value());

    lp::TenantRetentionPolicy policy;
    policy.tenantId = QStringLiteral("t1");
    policy.signalRetentionDays = 7;
    policy.recordRetentionDays = 90;
    QVERIFY(m_store->setTenantRetention(policy, kNow));

    policy.signalRetentionDays = 14;
    QVERIFY(m_store->setTenantRetention(policy, kNow + 1));

    const auto stored = m_store->tenantRetentionPolicy(QStringLiteral("t1"));
    QVERIFY(stored.has_value());
    QCOMPARE(stored->signalRetentionDays, 14);
    QCOMPARE(stored->recordRetentionDays, 90);
}

void TestEngineStore::testTimeoutStaleInterventions()
{
    m_store->insertIntervention(makeIntervention(QStringLiteral("stale"), QStringLiteral("u1"),
                                                 kNow - 3600000));
    m_store->recordDelivery(QStringLiteral("stale"), kNow - 3600000);
    m_store->insertIntervention(makeIntervention(QStringLiteral("fresh"), QStringLiteral("u1"),
                                                 kNow - 1000));
    m_store->recordDelivery(QStringLiteral("fresh"), kNow - 1000);
    m_store->insertIntervention(makeIntervention(QStringLiteral("undelivered"),
                                                 QStringLiteral("u1"), kNow - 3600000));

    QCOMPARE(m_store->timeoutStaleInterventions(kNow - 600000, kNow), 1);
    QCOMPARE(m_store->getIntervention(QStringLiteral("stale"))->userResponse,
             lp::UserResponse::Timeout);
    QCOMPARE(m_store->getIntervention(QStringLiteral("fresh"))->userResponse,
             lp::UserResponse::None);
    QCOMPARE(m_store->getIntervention(QStringLiteral("undelivered"))->userResponse,
             lp::UserResponse::None);
}

void TestEngineStore::testSettingsRoundTrip()
{
    QVERIFY(!m_store->getSetting(QStringLiteral("schema_note")).has_value());
    QVERIFY(m_store->setSetting(QStringLiteral("schema_note"), QStringLiteral("a")));
    QVERIFY(m_store->setSetting(QStringLiteral("schema_note"), QStringLiteral("b")));
    QCOMPARE(m_store->getSetting(QStringLiteral("schema_note")).value(), QStringLiteral("b"));
}

QTEST_MAIN(TestEngineStore)
#include "test_engine_store.moc"
