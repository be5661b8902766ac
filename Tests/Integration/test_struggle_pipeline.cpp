#include <QtTest/QtTest>

#include "Support/signal_test_utils.h"
#include "core/engine/struggle_engine.h"
#include "core/store/engine_store.h"

#include <sqlite3.h>

#include <mutex>
#include <vector>

namespace {

constexpr int64_t kNow = 1800000000000LL;

const QString kTenant = QStringLiteral("tenant-1");
const QString kUser = QStringLiteral("learner-1");
const QString kSession = QStringLiteral("session-1");

class RecordingSink : public lp::InterventionSink, public lp::OperationalAlertSink {
public:
    void deliverIntervention(const lp::InterventionCommand& command) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        commands.push_back(command);
    }

    void raiseOperationalAlert(const lp::OperationalAlert& alert) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        alerts.push_back(alert);
    }

    std::vector<lp::InterventionCommand> takeCommands()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return commands;
    }

    std::mutex mutex;
    std::vector<lp::InterventionCommand> commands;
    std::vector<lp::OperationalAlert> alerts;
};

lp::EngineSettings pipelineSettings()
{
    lp::EngineSettings settings;
    settings.ingest = lp::test::testIngestConfig();
    settings.session.minSamplesForScoring = 10;
    settings.session.minElapsedForScoringMs = 600000;
    settings.intervention.signalBudgetMs = 5000;
    settings.writeQueue.retryBackoffMs = 1;
    return settings;
}

lp::test::SignalSpec signalSpec(const QString& type, int64_t durationMs, int64_t timestampMs,
                          const QString& outcome = QString())
{
    lp::test::SignalSpec s;
    s.sessionId = kSession;
    s.userId = kUser;
    s.tenantId = kTenant;
    s.type = type;
    s.durationMs = durationMs;
    s.timestampMs = timestampMs;
    s.outcome = outcome;
    return s;
}

// Two wrong answers out of five, then five long idle periods.
std::vector<lp::test::SignalSpec> strugglingSequence()
{
    std::vector<lp::test::SignalSpec> specs;
    const QString outcomes[] = {
        QStringLiteral("incorrect"), QStringLiteral("incorrect"),
        QStringLiteral("correct"), QStringLiteral("correct"), QStringLiteral("correct"),
    };
    int64_t ts = kNow - 20000;
    for (const QString& outcome : outcomes) {
        specs.push_back(signalSpec(QStringLiteral("quiz_interaction"), 4000, ts, outcome));
        ts += 1000;
    }
    for (int i = 0; i < 5; ++i) {
        specs.push_back(signalSpec(QStringLiteral("idle"), 60000, ts));
        ts += 1000;
    }
    return specs;
}

} // namespace

class TestStrugglePipeline : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testStrugglingLearnerGetsOneIntervention();
    void testResponseLifecycle();
    void testSignalsWithoutConsentAreRejected();
    void testWithdrawalPurgesLearnerData();
    void testClosedSessionWritesSnapshot();
    void testReplayedSignalRejected();
    void testLateDecisionIsSuppressed();

private:
    void grantConsent();
    void submitAll(const std::vector<lp::test::SignalSpec>& specs);

    std::unique_ptr<lp::StruggleEngine> m_engine;
    std::unique_ptr<RecordingSink> m_sink;
};

void TestStrugglePipeline::init()
{
    m_sink = std::make_unique<RecordingSink>();
    m_engine = std::make_unique<lp::StruggleEngine>(pipelineSettings());
    QString error;
    QVERIFY2(m_engine->open(&error), qPrintable(error));
    m_engine->setInterventionSink(m_sink.get());
    m_engine->setOperationalAlertSink(m_sink.get());
}

void TestStrugglePipeline::cleanup()
{
    m_engine->shutdown();
    m_engine->setInterventionSink(nullptr);
    m_engine->setOperationalAlertSink(nullptr);
    m_engine.reset();
    m_sink.reset();
}

void TestStrugglePipeline::grantConsent()
{
    QVERIFY(m_engine->applyConsentChange(kTenant, kUser, std::nullopt, true,
                                         kNow - 60000).has_value());
}

void TestStrugglePipeline::submitAll(const std::vector<lp::test::SignalSpec>& specs)
{
    for (const lp::test::SignalSpec& s : specs) {
        const lp::IngestResult result =
            m_engine->submitSignal(lp::test::makeSignalPayload(s), kNow);
        QVERIFY2(result.accepted, qPrintable(result.reason));
    }
}

void TestStrugglePipeline::testStrugglingLearnerGetsOneIntervention()
{
    grantConsent();
    submitAll(strugglingSequence());
    QVERIFY(m_engine->waitForIdle(5000));

    const std::vector<lp::InterventionCommand> commands = m_sink->takeCommands();
    QCOMPARE(static_cast<int>(commands.size()), 1);
    QCOMPARE(commands[0].sessionId, kSession);
    QCOMPARE(commands[0].userId, kUser);
    QCOMPARE(commands[0].type, lp::InterventionType::BreakReminder);
    QCOMPARE(commands[0].urgency, lp::Urgency::High);
    QCOMPARE(commands[0].suggestedMessageIntent, QStringLiteral("suggest_short_break"));

    const std::optional<lp::InterventionRecord> record =
        m_engine->store()->getIntervention(commands[0].interventionId);
    QVERIFY(record.has_value());
    QVERIFY(qAbs(record->riskLevel - 0.731) < 0.001);
    QVERIFY(record->struggleAssessmentId.has_value());

    const std::optional<lp::StoreCounts> counts = m_engine->store()->counts();
    QVERIFY(counts.has_value());
    QCOMPARE(counts->signals, int64_t(10));
    QCOMPARE(counts->struggleEvents, int64_t(1));
    QCOMPARE(counts->interventions, int64_t(1));

    const QJsonObject health = m_engine->health();
    QCOMPARE(health.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    QCOMPARE(health.value(QStringLiteral("interventions")).toObject()
                 .value(QStringLiteral("triggered")).toInteger(), qint64(1));
}

void TestStrugglePipeline::testResponseLifecycle()
{
    grantConsent();
    submitAll(strugglingSequence());
    QVERIFY(m_engine->waitForIdle(5000));

    const std::vector<lp::InterventionCommand> commands = m_sink->takeCommands();
    QCOMPARE(static_cast<int>(commands.size()), 1);
    const QString id = commands[0].interventionId;

    QCOMPARE(m_engine->recordDelivery(id, kNow + 100), lp::InterventionUpdateStatus::Ok);
    QCOMPARE(m_engine->recordResponse(id, lp::UserResponse::Accepted, kNow + 200),
             lp::InterventionUpdateStatus::Ok);
    QCOMPARE(m_engine->recordResponse(id, lp::UserResponse::Accepted, kNow + 300),
             lp::InterventionUpdateStatus::Ok);
    QCOMPARE(m_engine->recordResponse(id, lp::UserResponse::Dismissed, kNow + 400),
             lp::InterventionUpdateStatus::Conflict);
    QCOMPARE(m_engine->recordResponse(QStringLiteral("missing"), lp::UserResponse::Accepted,
                                      kNow + 400),
             lp::InterventionUpdateStatus::NotFound);
    QCOMPARE(m_engine->recordDelivery(QStringLiteral("missing"), kNow + 400),
             lp::InterventionUpdateStatus::NotFound);

    const std::optional<lp::InterventionRecord> record = m_engine->store()->getIntervention(id);
    QVERIFY(record.has_value());
    QCOMPARE(record->userResponse, lp::UserResponse::Accepted);
    QCOMPARE(record->deliveredAtMs.value(), kNow + 100);
}

void TestStrugglePipeline::testSignalsWithoutConsentAreRejected()
{
    for (const lp::test::SignalSpec& s : strugglingSequence()) {
        const lp::IngestResult result =
            m_engine->submitSignal(lp::test::makeSignalPayload(s), kNow);
        QVERIFY(!result.accepted);
        QCOMPARE(result.rejection, lp::IngestRejection::ConsentDenied);
    }
    QVERIFY(m_engine->waitForIdle(5000));

    QCOMPARE(m_engine->store()->counts()->signals, int64_t(0));
    QVERIFY(m_sink->takeCommands().empty());
    QCOMPARE(m_engine->health().value(QStringLiteral("sessions")).toObject()
                 .value(QStringLiteral("active")).toInteger(), qint64(0));
}

void TestStrugglePipeline::testWithdrawalPurgesLearnerData()
{
    grantConsent();
    submitAll(strugglingSequence());
    QVERIFY(m_engine->waitForIdle(5000));
    QCOMPARE(static_cast<int>(m_sink->takeCommands().size()), 1);

    const std::optional<lp::ConsentRecord> withdrawn =
        m_engine->applyConsentChange(kTenant, kUser, std::nullopt, false, kNow + 1000);
    QVERIFY(withdrawn.has_value());
    QVERIFY(withdrawn->withdrawnAtMs.has_value());
    QVERIFY(m_engine->waitForIdle(5000));

    const lp::PurgeRunResult purge = m_engine->processPurgeQueue(kNow + 2000);
    QCOMPARE(purge.purged, 1);
    QCOMPARE(purge.escalated, 0);

    const std::optional<lp::StoreCounts> counts = m_engine->store()->counts();
    QVERIFY(counts.has_value());
    QCOMPARE(counts->signals, int64_t(0));
    QCOMPARE(counts->snapshots, int64_t(0));
    QCOMPARE(counts->pendingPurges, int64_t(0));
    QCOMPARE(counts->interventions, int64_t(1));

    const std::vector<lp::InterventionRecord> remaining =
        m_engine->store()->interventionsForUserSince(kTenant, kUser, 0);
    QVERIFY(remaining.empty());

    lp::test::SignalSpec late = signalSpec(QStringLiteral("click"), 800, kNow + 2500);
    const lp::IngestResult result =
        m_engine->submitSignal(lp::test::makeSignalPayload(late), kNow + 3000);
    QVERIFY(!result.accepted);
    QCOMPARE(result.rejection, lp::IngestRejection::ConsentDenied);
}

void TestStrugglePipeline::testClosedSessionWritesSnapshot()
{
    grantConsent();
    submitAll({signalSpec(QStringLiteral("click"), 900, kNow - 3000),
               signalSpec(QStringLiteral("hover"), 2000, kNow - 2000),
               signalSpec(QStringLiteral("scroll"), 300, kNow - 1000)});
    QVERIFY(m_engine->waitForIdle(5000));

    QVERIFY(m_engine->closeSession(kSession, kNow + 10));
    QVERIFY(m_engine->waitForIdle(5000));

    QCOMPARE(m_engine->store()->counts()->snapshots, int64_t(1));
    QCOMPARE(m_engine->store()->counts()->signals, int64_t(3));
    QVERIFY(m_sink->takeCommands().empty());
    QVERIFY(!m_engine->closeSession(kSession, kNow + 20));
}

void TestStrugglePipeline::testReplayedSignalRejected()
{
    grantConsent();
    lp::test::SignalSpec s = signalSpec(QStringLiteral("click"), 900, kNow - 1000);
    s.nonce = QStringLiteral("fixed-nonce");
    const QJsonObject payload = lp::test::makeSignalPayload(s);

    QVERIFY(m_engine->submitSignal(payload, kNow).accepted);
    const lp::IngestResult replay = m_engine->submitSignal(payload, kNow + 10);
    QVERIFY(!replay.accepted);
    QCOMPARE(replay.rejection, lp::IngestRejection::ReplayedNonce);
    QVERIFY(m_engine->waitForIdle(5000));
    QCOMPARE(m_engine->store()->counts()->signals, int64_t(1));
}

void TestStrugglePipeline::testLateDecisionIsSuppressed()
{
    m_engine->shutdown();
    lp::EngineSettings settings = pipelineSettings();
    // Every decision misses a negative budget.
    settings.intervention.signalBudgetMs = -1;
    m_engine = std::make_unique<lp::StruggleEngine>(settings);
    QString error;
    QVERIFY2(m_engine->open(&error), qPrintable(error));
    m_engine->setInterventionSink(m_sink.get());
    m_engine->setOperationalAlertSink(m_sink.get());

    grantConsent();
    submitAll(strugglingSequence());
    QVERIFY(m_engine->waitForIdle(5000));

    QVERIFY(m_sink->takeCommands().empty());

    const std::optional<lp::StoreCounts> counts = m_engine->store()->counts();
    QVERIFY(counts.has_value());
    QCOMPARE(counts->signals, int64_t(10));
    QCOMPARE(counts->interventions, int64_t(0));
    QCOMPARE(counts->struggleEvents, int64_t(0));
    QCOMPARE(counts->suppressions, int64_t(1));

    {
        lp::EngineStore::Connection conn = m_engine->store()->acquire();
        sqlite3_stmt* stmt = nullptr;
        QCOMPARE(sqlite3_prepare_v2(conn.db(),
                                    "SELECT reason FROM intervention_suppressions",
                                    -1, &stmt, nullptr), SQLITE_OK);
        QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
        const QString reason = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        sqlite3_finalize(stmt);
        QCOMPARE(reason, QStringLiteral("budget_exceeded"));
    }

    const QJsonObject health = m_engine->health();
    QCOMPARE(health.value(QStringLiteral("sessions")).toObject()
                 .value(QStringLiteral("budgetExceeded")).toInteger(), qint64(1));
}

QTEST_MAIN(TestStrugglePipeline)
#include "test_struggle_pipeline.moc"
