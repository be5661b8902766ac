#include <QtTest/QtTest>

#include "core/consent/consent_gate.h"
#include "core/intervention/intervention_policy.h"

#include <vector>

namespace {

constexpr int64_t kNow = 1700000000000;
constexpr int64_t kMinuteMs = 60000;

class StaticConsentSource : public lp::ConsentSource {
public:
    lp::ConsentLookup lookupConsent(const QString& tenantId, const QString& userId) override
    {
        lp::ConsentLookup lookup;
        lookup.status = lp::ConsentLookupStatus::Found;
        lookup.record.tenantId = tenantId;
        lookup.record.userId = userId;
        lookup.record.scopes.behavioralTiming = true;
        lookup.record.scopes.chatInteractions = chatAllowed;
        lookup.record.collectionLevel = lp::CollectionLevel::Standard;
        return lookup;
    }

    bool chatAllowed = true;
};

lp::StruggleAssessment makeAssessment(double risk, double confidence,
                                      const QStringList& factors,
                                      const QString& sessionId = QStringLiteral("s1"))
{
    lp::StruggleAssessment assessment;
    assessment.id = QStringLiteral("assessment-1");
    assessment.sessionId = sessionId;
    assessment.userId = QStringLiteral("u1");
    assessment.tenantId = QStringLiteral("t1");
    assessment.courseId = QStringLiteral("c1");
    assessment.riskLevel = risk;
    assessment.confidence = confidence;
    assessment.contributingFactors = factors;
    return assessment;
}

} // namespace

class TestInterventionPolicy : public QObject {
    Q_OBJECT

private slots:
    void testBelowThresholdIsSuppressed();
    void testLowConfidenceIsSuppressed();
    void testNoChatConsentIsSuppressed();
    void testTriggerPersistsAndBuildsCommand();
    void testUrgencyBands();
    void testCandidateTypesFollowFactors();
    void testCooldownFallsThroughToNextType();
    void testCooldownSuppressesWhenAllTypesCooling();
    void testDailyCapAcrossSessions();
    void testCapWindowRolls();
    void testPersistFailureLeavesStateUntouched();
    void testHistorySeedsCapAfterRestart();
};

void TestInterventionPolicy::testBelowThresholdIsSuppressed()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    int persisted = 0;
    lp::InterventionPolicy policy({}, gate, [&persisted](const lp::InterventionRecord&) {
        ++persisted;
        return true;
    });

    const lp::InterventionDecision decision =
        policy.decide(makeAssessment(0.49, 0.9, {QStringLiteral("error_rate")}), kNow);
    QVERIFY(!decision.triggered);
    QCOMPARE(decision.suppression.value(), lp::SuppressionReason::BelowThreshold);
    QCOMPARE(persisted, 0);
}

void TestInterventionPolicy::testLowConfidenceIsSuppressed()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    lp::InterventionPolicy policy({}, gate, [](const lp::InterventionRecord&) { return true; });

    const lp::InterventionDecision decision =
        policy.decide(makeAssessment(0.9, 0.59, {QStringLiteral("error_rate")}), kNow);
    QVERIFY(!decision.triggered);
    QCOMPARE(decision.suppression.value(), lp::SuppressionReason::LowConfidence);
}

void TestInterventionPolicy::testNoChatConsentIsSuppressed()
{
    StaticConsentSource source;
    source.chatAllowed = false;
    lp::ConsentGate gate(source);
    int persisted = 0;
    lp::InterventionPolicy policy({}, gate, [&persisted](const lp::InterventionRecord&) {
        ++persisted;
        return true;
    });

    const lp::InterventionDecision decision =
        policy.decide(makeAssessment(0.9, 0.9, {QStringLiteral("error_rate")}), kNow);
    QVERIFY(!decision.triggered);
    QCOMPARE(decision.suppression.value(), lp::SuppressionReason::NoConsent);
    QCOMPARE(persisted, 0);
}

void TestInterventionPolicy::testTriggerPersistsAndBuildsCommand()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    std::vector<lp::InterventionRecord> stored;
    lp::InterventionPolicy policy({}, gate, [&stored](const lp::InterventionRecord& record) {
        stored.push_back(record);
        return true;
    });

    const lp::InterventionDecision decision = policy.decide(
        makeAssessment(0.75, 0.8, {QStringLiteral("help_request_rate"), QStringLiteral("error_rate")}),
        kNow);
    QVERIFY(decision.triggered);
    QVERIFY(!decision.suppression.has_value());
    QCOMPARE(stored.size(), static_cast<size_t>(1));

    const lp::InterventionRecord& record = stored.front();
    QCOMPARE(record.type, lp::InterventionType::HelpOffer);
    QCOMPARE(record.urgency, lp::Urgency::High);
    QCOMPARE(record.messageIntent, QStringLiteral("offer_help"));
    QCOMPARE(record.struggleAssessmentId.value(), QStringLiteral("assessment-1"));
    QCOMPARE(record.triggeredAtMs, kNow);
    QCOMPARE(record.userResponse, lp::UserResponse::None);

    QCOMPARE(decision.command.interventionId, record.id);
    QCOMPARE(decision.command.sessionId, QStringLiteral("s1"));
    QCOMPARE(decision.command.userId, QStringLiteral("u1"));
    QCOMPARE(decision.command.suggestedMessageIntent, QStringLiteral("offer_help"));
    QCOMPARE(policy.stats().triggered, static_cast<size_t>(1));
}

void TestInterventionPolicy::testUrgencyBands()
{
    lp::InterventionPolicyConfig config;
    QCOMPARE(lp::InterventionPolicy::urgencyFor(0.95, config), lp::Urgency::High);
    QCOMPARE(lp::InterventionPolicy::urgencyFor(0.7, config), lp::Urgency::High);
    QCOMPARE(lp::InterventionPolicy::urgencyFor(0.69, config), lp::Urgency::Medium);
    QCOMPARE(lp::InterventionPolicy::urgencyFor(0.5, config), lp::Urgency::Medium);
    QCOMPARE(lp::InterventionPolicy::urgencyFor(0.3, config), lp::Urgency::Low);
}

void TestInterventionPolicy::testCandidateTypesFollowFactors()
{
    const std::vector<lp::InterventionType> candidates = lp::InterventionPolicy::candidateTypes(
        {QStringLiteral("idle_frequency"), QStringLiteral("hover_duration"),
         QStringLiteral("response_time_variability"), QStringLiteral("error_rate")});
    const std::vector<lp::InterventionType> expected = {
        lp::InterventionType::BreakReminder,
        lp::InterventionType::ContentSuggestion,
        lp::InterventionType::ProactiveChat,
    };
    QVERIFY(candidates == expected);

    const std::vector<lp::InterventionType> fallback = lp::InterventionPolicy::candidateTypes({});
    QCOMPARE(fallback.size(), static_cast<size_t>(1));
    QCOMPARE(fallback.front(), lp::InterventionType::ProactiveChat);
}

void TestInterventionPolicy::testCooldownFallsThroughToNextType()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    lp::InterventionPolicy policy({}, gate, [](const lp::InterventionRecord&) { return true; });

    const QStringList factors = {QStringLiteral("idle_frequency"), QStringLiteral("error_rate")};
    lp::InterventionDecision first = policy.decide(makeAssessment(0.8, 0.9, factors), kNow);
    QVERIFY(first.triggered);
    QCOMPARE(first.record.type, lp::InterventionType::BreakReminder);

    lp::InterventionDecision second =
        policy.decide(makeAssessment(0.8, 0.9, factors), kNow + 5 * kMinuteMs);
    QVERIFY(second.triggered);
    QCOMPARE(second.record.type, lp::InterventionType::ProactiveChat);

    // Cooldown over for the break reminder.
    lp::InterventionDecision third =
        policy.decide(makeAssessment(0.8, 0.9, factors), kNow + 31 * kMinuteMs);
    QVERIFY(third.triggered);
    QCOMPARE(third.record.type, lp::InterventionType::BreakReminder);
}

void TestInterventionPolicy::testCooldownSuppressesWhenAllTypesCooling()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    lp::InterventionPolicy policy({}, gate, [](const lp::InterventionRecord&) { return true; });

    const QStringList factors = {QStringLiteral("error_rate")};
    QVERIFY(policy.decide(makeAssessment(0.8, 0.9, factors), kNow).triggered);

    const lp::InterventionDecision decision =
        policy.decide(makeAssessment(0.8, 0.9, factors), kNow + 29 * kMinuteMs);
    QVERIFY(!decision.triggered);
    QCOMPARE(decision.suppression.value(), lp::SuppressionReason::Cooldown);
}

void TestInterventionPolicy::testDailyCapAcrossSessions()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    lp::InterventionPolicyConfig config;
    config.dailyCap = 2;
    config.cooldownMinutes = 0;
    lp::InterventionPolicy policy(config, gate, [](const lp::InterventionRecord&) { return true; });

    const QStringList factors = {QStringLiteral("error_rate")};
    QVERIFY(policy.decide(makeAssessment(0.8, 0.9, factors, QStringLiteral("s1")), kNow).triggered);
    QVERIFY(policy.decide(makeAssessment(0.8, 0.9, factors, QStringLiteral("s2")), kNow + 1).triggered);

    const lp::InterventionDecision capped =
        policy.decide(makeAssessment(0.8, 0.9, factors, QStringLiteral("s3")), kNow + 2);
    QVERIFY(!capped.triggered);
    QCOMPARE(capped.suppression.value(), lp::SuppressionReason::DailyCap);
}

void TestInterventionPolicy::testCapWindowRolls()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    lp::InterventionPolicyConfig config;
    config.dailyCap = 1;
    lp::InterventionPolicy policy(config, gate, [](const lp::InterventionRecord&) { return true; });

    const QStringList factors = {QStringLiteral("error_rate")};
    QVERIFY(policy.decide(makeAssessment(0.8, 0.9, factors), kNow).triggered);
    QVERIFY(!policy.decide(makeAssessment(0.8, 0.9, factors), kNow + 23 * 60 * kMinuteMs).triggered);
    QVERIFY(policy.decide(makeAssessment(0.8, 0.9, factors), kNow + 24 * 60 * kMinuteMs).triggered);
}

void TestInterventionPolicy::testPersistFailureLeavesStateUntouched()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    bool storeUp = false;
    lp::InterventionPolicyConfig config;
    config.dailyCap = 1;
    lp::InterventionPolicy policy(config, gate, [&storeUp](const lp::InterventionRecord&) {
        return storeUp;
    });

    const QStringList factors = {QStringLiteral("error_rate")};
    const lp::InterventionDecision failed = policy.decide(makeAssessment(0.8, 0.9, factors), kNow);
    QVERIFY(!failed.triggered);
    QCOMPARE(failed.suppression.value(), lp::SuppressionReason::PersistFailed);
    QCOMPARE(policy.stats().persistFailures, static_cast<size_t>(1));

    // Neither the cap nor the cooldown counted the failed attempt.
    storeUp = true;
    QVERIFY(policy.decide(makeAssessment(0.8, 0.9, factors), kNow + 1).triggered);
}

void TestInterventionPolicy::testHistorySeedsCapAfterRestart()
{
    StaticConsentSource source;
    lp::ConsentGate gate(source);
    lp::InterventionPolicyConfig config;
    config.dailyCap = 2;
    lp::InterventionPolicy policy(config, gate, [](const lp::InterventionRecord&) { return true; });

    int64_t requestedSince = 0;
    policy.setHistoryLoader([&requestedSince](const QString& tenantId, const QString& userId,
                                              int64_t sinceMs) {
        requestedSince = sinceMs;
        std::vector<lp::InterventionRecord> history;
        for (int i = 0; i < 2; ++i) {
            lp::InterventionRecord record;
            record.tenantId = tenantId;
            record.userId = userId;
            record.type = lp::InterventionType::HelpOffer;
            record.triggeredAtMs = kNow - (i + 1) * 60 * kMinuteMs;
            history.push_back(record);
        }
        return history;
    });

    const lp::InterventionDecision decision =
        policy.decide(makeAssessment(0.8, 0.9, {QStringLiteral("error_rate")}), kNow);
    QVERIFY(!decision.triggered);
    QCOMPARE(decision.suppression.value(), lp::SuppressionReason::DailyCap);
    QCOMPARE(requestedSince, kNow - 24 * 60 * kMinuteMs);

    // Forgetting the user drops the cached state; history is read again.
    policy.forgetUser(QStringLiteral("t1"), QStringLiteral("u1"));
    QCOMPARE(policy.stats().trackedUsers, static_cast<size_t>(0));
}

QTEST_MAIN(TestInterventionPolicy)
#include "test_intervention_policy.moc"
