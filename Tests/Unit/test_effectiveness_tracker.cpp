#include <QtTest/QtTest>

#include "core/intervention/effectiveness_tracker.h"

class TestEffectivenessTracker : public QObject {
    Q_OBJECT

private slots:
    void testScoreFormula();
    void testMeasurementCompletesAfterSampleSignals();
    void testRetrackRestartsMeasurement();
    void testIndependentInterventions();
};

void TestEffectivenessTracker::testScoreFormula()
{
    QCOMPARE(lp::EffectivenessTracker::effectivenessScore(0.4, 0.4), 0.5);
    QCOMPARE(lp::EffectivenessTracker::effectivenessScore(0.2, 0.5), 0.8);
    QCOMPARE(lp::EffectivenessTracker::effectivenessScore(0.9, 0.1), 0.0);
    QCOMPARE(lp::EffectivenessTracker::effectivenessScore(0.0, 1.0), 1.0);
}

void TestEffectivenessTracker::testMeasurementCompletesAfterSampleSignals()
{
    lp::EffectivenessTracker tracker(3);
    tracker.track(QStringLiteral("i1"), lp::UserResponse::Accepted, 0.25);
    QCOMPARE(tracker.pending(), static_cast<size_t>(1));

    QVERIFY(tracker.onSignal(0.3).empty());
    QVERIFY(tracker.onSignal(0.4).empty());
    const std::vector<lp::EffectivenessMeasurement> done = tracker.onSignal(0.5);

    QCOMPARE(done.size(), static_cast<size_t>(1));
    QCOMPARE(done[0].interventionId, QStringLiteral("i1"));
    QCOMPARE(done[0].response, lp::UserResponse::Accepted);
    QCOMPARE(done[0].attentionAfter, 0.5);
    QCOMPARE(done[0].score, 0.75);
    QCOMPARE(tracker.pending(), static_cast<size_t>(0));
}

void TestEffectivenessTracker::testRetrackRestartsMeasurement()
{
    lp::EffectivenessTracker tracker(2);
    tracker.track(QStringLiteral("i1"), lp::UserResponse::Dismissed, 0.5);
    QVERIFY(tracker.onSignal(0.5).empty());

    tracker.track(QStringLiteral("i1"), lp::UserResponse::Accepted, 0.5);
    QCOMPARE(tracker.pending(), static_cast<size_t>(1));
    QVERIFY(tracker.onSignal(0.5).empty());

    const std::vector<lp::EffectivenessMeasurement> done = tracker.onSignal(0.5);
    QCOMPARE(done.size(), static_cast<size_t>(1));
    QCOMPARE(done[0].response, lp::UserResponse::Accepted);
}

void TestEffectivenessTracker::testIndependentInterventions()
{
    lp::EffectivenessTracker tracker(2);
    tracker.track(QStringLiteral("a"), lp::UserResponse::Accepted, 0.5);
    QVERIFY(tracker.onSignal(0.5).empty());
    tracker.track(QStringLiteral("b"), lp::UserResponse::Ignored, 0.5);

    std::vector<lp::EffectivenessMeasurement> done = tracker.onSignal(0.5);
    QCOMPARE(done.size(), static_cast<size_t>(1));
    QCOMPARE(done[0].interventionId, QStringLiteral("a"));

    done = tracker.onSignal(0.5);
    QCOMPARE(done.size(), static_cast<size_t>(1));
    QCOMPARE(done[0].interventionId, QStringLiteral("b"));
}

QTEST_MAIN(TestEffectivenessTracker)
#include "test_effectiveness_tracker.moc"
