#include "core/engine/struggle_engine.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QUuid>

#include <utility>

namespace lp {

namespace {

QJsonObject featuresToJson(const SessionFeatures& f)
{
    QJsonObject json;
    json[QStringLiteral("sampleCount")] = f.sampleCount;
    json[QStringLiteral("windowSpanMs")] = static_cast<qint64>(f.windowSpanMs);
    json[QStringLiteral("avgResponseTimeMs")] = f.avgResponseTimeMs;
    json[QStringLiteral("responseTimeVariance")] = f.responseTimeVariance;
    json[QStringLiteral("responseTimeVariability")] = f.responseTimeVariability;
    json[QStringLiteral("helpRequestRate")] = f.helpRequestRate;
    json[QStringLiteral("errorRate")] = f.errorRate;
    json[QStringLiteral("gradedInteractions")] = f.gradedInteractions;
    json[QStringLiteral("idlePeriodCount")] = f.idlePeriodCount;
    json[QStringLiteral("avgHoverMs")] = f.avgHoverMs;
    json[QStringLiteral("taskSwitchFrequency")] = f.taskSwitchFrequency;
    json[QStringLiteral("attentionEstimate")] = f.attentionEstimate;
    json[QStringLiteral("fatigueEstimate")] = f.fatigueEstimate;
    json[QStringLiteral("cognitiveLoadEstimate")] = f.cognitiveLoadEstimate;
    json[QStringLiteral("featureStability")] = f.featureStability;
    return json;
}

} // anonymous namespace

StruggleEngine::StruggleEngine(const EngineSettings& settings)
    : m_settings(settings)
{
}

StruggleEngine::~StruggleEngine()
{
    shutdown();
}

bool StruggleEngine::open(QString* errorOut)
{
    if (m_open) {
        return true;
    }

    const QString dbPath = m_settings.dbPath.isEmpty() ? QStringLiteral(":memory:")
                                                       : m_settings.dbPath;
    m_store = EngineStore::open(dbPath);
    if (!m_store) {
        const QString message = QStringLiteral("Failed to open engine store at %1").arg(dbPath);
        LOG_ERROR(lpCore, "%s", qUtf8Printable(message));
        raiseOperationalAlert({QStringLiteral("engine_store"), QStringLiteral("store_open_failed"),
                               message, QDateTime::currentMSecsSinceEpoch()});
        if (errorOut) {
            *errorOut = message;
        }
        return false;
    }

    m_consentGate = std::make_unique<ConsentGate>(*m_store, m_settings.consent);
    m_scorer = std::make_unique<StruggleScorer>(m_settings.model);
    m_ingestor = std::make_unique<SignalIngestor>(m_settings.ingest, *m_consentGate);
    m_writeQueue = std::make_unique<AsyncWriteQueue>(m_settings.writeQueue);

    EngineStore* store = m_store.get();
    m_policy = std::make_unique<InterventionPolicy>(
        m_settings.intervention, *m_consentGate,
        [store](const InterventionRecord& record) {
            return store->insertIntervention(record);
        });
    m_policy->setHistoryLoader(
        [store](const QString& tenantId, const QString& userId, int64_t sinceMs) {
            return store->interventionsForUserSince(tenantId, userId, sinceMs);
        });

    m_host = std::make_unique<SessionActorHost>(
        m_settings.session, *m_scorer,
        m_settings.intervention.effectivenessSampleSignals, *this);
    m_alerts = std::make_unique<AlertAggregator>(*m_store, *m_consentGate, m_settings.alerts);
    m_retention = std::make_unique<RetentionScheduler>(
        *m_store, m_settings.retention,
        m_settings.intervention.responseTimeoutMs,
        m_settings.alerts.alertExpiryDays);

    m_consentGate->setEscalationHandler([this](const OperationalAlert& alert) {
        raiseOperationalAlert(alert);
    });
    m_consentGate->setPurgeRequestHandler([this](const QString& tenantId, const QString& userId) {
        onPurgeRequested(tenantId, userId, m_lastNowMs.load());
    });
    m_writeQueue->setEscalationHandler([this](const QString& label, int attempts) {
        raiseOperationalAlert({QStringLiteral("async_write_queue"),
                               QStringLiteral("write_retries_exhausted"),
                               QStringLiteral("Write '%1' failed after %2 attempts")
                                   .arg(label).arg(attempts),
                               QDateTime::currentMSecsSinceEpoch()});
    });
    m_retention->setEscalationHandler([this](const OperationalAlert& alert) {
        raiseOperationalAlert(alert);
    });
    m_retention->setPurgeCompletedHandler([this](const QString& tenantId, const QString& userId) {
        m_policy->forgetUser(tenantId, userId);
        m_consentGate->onConsentChanged(tenantId, userId);
    });

    m_writeQueue->start();
    m_host->start();
    m_open = true;

    LOG_INFO(lpCore, "Engine opened (db=%s, model=%s)",
             qUtf8Printable(dbPath), qUtf8Printable(m_settings.model.modelVersion));
    return true;
}

void StruggleEngine::shutdown()
{
    if (!m_open) {
        return;
    }
    m_open = false;

    // Sessions flush their snapshots through the writer, so stop them first.
    m_host->stop();
    m_writeQueue->stop();
    m_consentGate->shutdown();

    LOG_INFO(lpCore, "Engine shut down");
}

void StruggleEngine::setInterventionSink(InterventionSink* sink)
{
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_interventionSink = sink;
}

void StruggleEngine::setOperationalAlertSink(OperationalAlertSink* sink)
{
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_opsSink = sink;
}

void StruggleEngine::setPageContextProvider(PageContextFn provider)
{
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_pageContext = std::move(provider);
}

void StruggleEngine::touchClock(int64_t nowMs)
{
    int64_t previous = m_lastNowMs.load();
    while (nowMs > previous && !m_lastNowMs.compare_exchange_weak(previous, nowMs)) {
    }
}

// ── Inbound ─────────────────────────────────────────────────

IngestResult StruggleEngine::submitSignal(const QJsonObject& payload, int64_t nowMs)
{
    if (!m_open) {
        IngestResult result;
        result.rejection = IngestRejection::CapacityExceeded;
        result.reason = QStringLiteral("engine not running");
        return result;
    }
    touchClock(nowMs);

    IngestResult result = m_ingestor->ingest(payload, nowMs);
    if (!result.accepted) {
        return result;
    }

    const PostOutcome outcome = m_host->postSignal(result.signal);
    switch (outcome) {
    case PostOutcome::Posted:
        return result;
    case PostOutcome::IdentityMismatch:
        result.rejection = IngestRejection::SchemaViolation;
        result.reason = QStringLiteral("session belongs to another learner");
        LOG_WARN(lpIngest, "Rejected signal session=%s: %s",
                 qUtf8Printable(result.signal.sessionId), qUtf8Printable(result.reason));
        break;
    case PostOutcome::CapacityExceeded:
    case PostOutcome::SessionClosing:
    case PostOutcome::HostStopped:
        result.rejection = IngestRejection::CapacityExceeded;
        result.reason = postOutcomeToString(outcome);
        LOG_WARN(lpIngest, "Signal not admitted session=%s: %s",
                 qUtf8Printable(result.signal.sessionId), qUtf8Printable(result.reason));
        break;
    }
    result.accepted = false;
    return result;
}

bool StruggleEngine::closeSession(const QString& sessionId, int64_t nowMs)
{
    if (!m_open) {
        return false;
    }
    touchClock(nowMs);
    return m_host->closeSession(sessionId, QStringLiteral("closed"), nowMs);
}

std::optional<ConsentRecord> StruggleEngine::applyConsentChange(const QString& tenantId,
                                                                const QString& userId,
                                                                std::optional<ConsentScope> scope,
                                                                bool granted,
                                                                int64_t nowMs)
{
    if (!m_open) {
        return std::nullopt;
    }
    touchClock(nowMs);

    std::optional<ConsentRecord> record =
        m_store->applyConsentChange(tenantId, userId, scope, granted, nowMs);
    // Invalidate even on failure so the next check goes to the store.
    m_consentGate->onConsentChanged(tenantId, userId);
    if (!record) {
        LOG_ERROR(lpConsent, "Failed to apply consent change tenant=%s user=%s",
                  qUtf8Printable(tenantId), qUtf8Printable(userId));
        return std::nullopt;
    }

    LOG_INFO(lpConsent, "Consent %s tenant=%s user=%s scope=%s",
             granted ? "granted" : "withdrawn",
             qUtf8Printable(tenantId), qUtf8Printable(userId),
             scope ? qUtf8Printable(consentScopeToString(*scope)) : "all");

    if (!granted && record->withdrawnAtMs.has_value()) {
        onPurgeRequested(tenantId, userId, nowMs);
    } else if (!granted && scope == ConsentScope::ChatInteractions) {
        m_policy->forgetUser(tenantId, userId);
    }
    return record;
}

InterventionUpdateStatus StruggleEngine::recordDelivery(const QString& interventionId,
                                                        int64_t deliveredAtMs)
{
    if (!m_open) {
        return InterventionUpdateStatus::StoreError;
    }
    if (!m_store->getIntervention(interventionId)) {
        return InterventionUpdateStatus::NotFound;
    }
    if (!m_store->recordDelivery(interventionId, deliveredAtMs)) {
        return InterventionUpdateStatus::StoreError;
    }
    m_interventionsDelivered.fetch_add(1);
    return InterventionUpdateStatus::Ok;
}

InterventionUpdateStatus StruggleEngine::recordResponse(const QString& interventionId,
                                                        UserResponse response,
                                                        int64_t respondedAtMs)
{
    if (!m_open) {
        return InterventionUpdateStatus::StoreError;
    }
    if (response == UserResponse::None) {
        return InterventionUpdateStatus::Conflict;
    }

    const std::optional<InterventionRecord> existing = m_store->getIntervention(interventionId);
    if (!existing) {
        return InterventionUpdateStatus::NotFound;
    }
    if (!m_store->recordResponse(interventionId, response, respondedAtMs)) {
        return InterventionUpdateStatus::Conflict;
    }

    // Repeated identical responses are accepted but measured once.
    if (existing->userResponse == UserResponse::None) {
        m_host->postInterventionOutcome(existing->sessionId, interventionId,
                                        response, respondedAtMs);
    }
    return InterventionUpdateStatus::Ok;
}

// ── Scheduled work ──────────────────────────────────────────

int StruggleEngine::expireIdleSessions(int64_t nowMs)
{
    if (!m_open) {
        return 0;
    }
    touchClock(nowMs);
    return m_host->expireIdle(nowMs);
}

PurgeRunResult StruggleEngine::processPurgeQueue(int64_t nowMs)
{
    if (!m_open) {
        return {};
    }
    touchClock(nowMs);
    return m_retention->processPurgeQueue(nowMs);
}

AlertScanResult StruggleEngine::runAlertScan(int64_t nowMs)
{
    if (!m_open) {
        AlertScanResult result;
        result.ok = false;
        result.error = QStringLiteral("engine not running");
        return result;
    }
    touchClock(nowMs);
    return m_alerts->runAggregation(nowMs);
}

RetentionSweepResult StruggleEngine::runRetentionSweep(int64_t nowMs)
{
    if (!m_open) {
        RetentionSweepResult result;
        result.ok = false;
        return result;
    }
    touchClock(nowMs);
    return m_retention->runSweep(nowMs);
}

bool StruggleEngine::waitForIdle(int timeoutMs)
{
    if (!m_open) {
        return true;
    }
    QElapsedTimer timer;
    timer.start();
    // A drained writer can be refilled by a late session callback, so
    // loop until both sides are quiet together.
    while (timer.elapsed() < timeoutMs) {
        const int remaining = static_cast<int>(timeoutMs - timer.elapsed());
        if (!m_host->waitForIdle(remaining)) {
            return false;
        }
        if (!m_writeQueue->waitForIdle(static_cast<int>(timeoutMs - timer.elapsed()))) {
            return false;
        }
        if (m_host->waitForIdle(0) && m_writeQueue->stats().pending == 0) {
            return true;
        }
    }
    return false;
}

QJsonObject StruggleEngine::health() const
{
    QJsonObject json;
    json[QStringLiteral("open")] = m_open;
    json[QStringLiteral("modelVersion")] = m_settings.model.modelVersion;
    if (!m_open) {
        json[QStringLiteral("status")] = QStringLiteral("stopped");
        return json;
    }

    const IngestStats ingest = m_ingestor->stats();
    QJsonObject ingestJson;
    ingestJson[QStringLiteral("accepted")] = static_cast<qint64>(ingest.accepted);
    ingestJson[QStringLiteral("rejected")] = static_cast<qint64>(ingest.rejected);
    ingestJson[QStringLiteral("rateLimited")] = static_cast<qint64>(ingest.rateLimited);
    json[QStringLiteral("ingest")] = ingestJson;

    const ConsentGateStats consent = m_consentGate->stats();
    QJsonObject consentJson;
    consentJson[QStringLiteral("cacheEntries")] = static_cast<qint64>(consent.cacheEntries);
    consentJson[QStringLiteral("cacheHits")] = static_cast<qint64>(consent.cacheHits);
    consentJson[QStringLiteral("cacheMisses")] = static_cast<qint64>(consent.cacheMisses);
    consentJson[QStringLiteral("denials")] = static_cast<qint64>(consent.denials);
    consentJson[QStringLiteral("storeFailures")] = static_cast<qint64>(consent.storeFailures);
    consentJson[QStringLiteral("purgeRequests")] = static_cast<qint64>(consent.purgeRequests);
    json[QStringLiteral("consent")] = consentJson;

    const SessionHostStats sessions = m_host->stats();
    QJsonObject sessionsJson;
    sessionsJson[QStringLiteral("active")] = static_cast<qint64>(sessions.activeSessions);
    sessionsJson[QStringLiteral("opened")] = static_cast<qint64>(sessions.sessionsOpened);
    sessionsJson[QStringLiteral("closed")] = static_cast<qint64>(sessions.sessionsClosed);
    sessionsJson[QStringLiteral("capacityRejections")] =
        static_cast<qint64>(sessions.capacityRejections);
    sessionsJson[QStringLiteral("assessments")] = static_cast<qint64>(m_assessments.load());
    sessionsJson[QStringLiteral("modelErrors")] = static_cast<qint64>(m_modelErrors.load());
    sessionsJson[QStringLiteral("budgetExceeded")] = static_cast<qint64>(m_budgetExceeded.load());
    json[QStringLiteral("sessions")] = sessionsJson;

    const InterventionPolicyStats policy = m_policy->stats();
    QJsonObject policyJson;
    policyJson[QStringLiteral("triggered")] = static_cast<qint64>(policy.triggered);
    policyJson[QStringLiteral("suppressed")] = static_cast<qint64>(policy.suppressed);
    policyJson[QStringLiteral("persistFailures")] = static_cast<qint64>(policy.persistFailures);
    policyJson[QStringLiteral("delivered")] = static_cast<qint64>(m_interventionsDelivered.load());
    json[QStringLiteral("interventions")] = policyJson;

    const AsyncWriteStats writes = m_writeQueue->stats();
    QJsonObject writesJson;
    writesJson[QStringLiteral("pending")] = static_cast<qint64>(writes.pending);
    writesJson[QStringLiteral("completed")] = static_cast<qint64>(writes.completed);
    writesJson[QStringLiteral("retried")] = static_cast<qint64>(writes.retried);
    writesJson[QStringLiteral("failed")] = static_cast<qint64>(writes.failed);
    writesJson[QStringLiteral("dropped")] = static_cast<qint64>(writes.dropped);
    json[QStringLiteral("writeQueue")] = writesJson;

    const RetentionStats retention = m_retention->stats();
    QJsonObject retentionJson;
    retentionJson[QStringLiteral("pendingPurges")] = static_cast<qint64>(retention.pendingPurges);
    retentionJson[QStringLiteral("purgesCompleted")] =
        static_cast<qint64>(retention.purgesCompleted);
    retentionJson[QStringLiteral("purgesEscalated")] =
        static_cast<qint64>(retention.purgesEscalated);
    retentionJson[QStringLiteral("sweepsRun")] = static_cast<qint64>(retention.sweepsRun);
    json[QStringLiteral("retention")] = retentionJson;

    bool degraded = consent.consecutiveStoreFailures >= m_settings.consent.consentFailureEscalationCount
        || writes.failed > 0 || retention.purgesEscalated > 0;

    const std::optional<StoreCounts> counts = m_store->counts();
    if (counts) {
        QJsonObject storeJson;
        storeJson[QStringLiteral("signals")] = static_cast<qint64>(counts->signals);
        storeJson[QStringLiteral("snapshots")] = static_cast<qint64>(counts->snapshots);
        storeJson[QStringLiteral("struggleEvents")] = static_cast<qint64>(counts->struggleEvents);
        storeJson[QStringLiteral("interventions")] = static_cast<qint64>(counts->interventions);
        storeJson[QStringLiteral("suppressions")] = static_cast<qint64>(counts->suppressions);
        storeJson[QStringLiteral("openAlerts")] = static_cast<qint64>(counts->openAlerts);
        storeJson[QStringLiteral("pendingPurges")] = static_cast<qint64>(counts->pendingPurges);
        json[QStringLiteral("store")] = storeJson;
    } else {
        degraded = true;
    }

    json[QStringLiteral("operationalAlerts")] = static_cast<qint64>(m_operationalAlerts.load());
    json[QStringLiteral("status")] = degraded ? QStringLiteral("degraded") : QStringLiteral("ok");
    return json;
}

// ── SessionActorDelegate ────────────────────────────────────

void StruggleEngine::onSignalApplied(const SessionState& state, const BehavioralSignal& signal,
                                     bool featuresUpdated, int64_t queueDelayMs)
{
    enqueueLearnerWrite(QStringLiteral("signal"), signal.tenantId, signal.userId,
                        signal.receivedAtMs,
                        [signal](EngineStore& store) { return store.insertSignal(signal); });

    if (!featuresUpdated) {
        m_modelErrors.fetch_add(1);
        return;
    }
    if (!state.readyForScoring()) {
        return;
    }

    QElapsedTimer timer;
    timer.start();

    std::optional<PageContext> pageContext;
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        if (m_pageContext && !state.lastPageContentHash().isEmpty()) {
            pageContext = m_pageContext(state.lastPageContentHash());
        }
    }

    std::optional<StruggleAssessment> scored =
        m_scorer->score(state.features(), pageContext, signal.receivedAtMs);
    if (!scored) {
        m_modelErrors.fetch_add(1);
        LOG_WARN(lpScoring, "Scorer rejected features for session %s",
                 qUtf8Printable(state.sessionId()));
        return;
    }

    StruggleAssessment assessment = std::move(*scored);
    assessment.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    assessment.sessionId = state.sessionId();
    assessment.tenantId = state.tenantId();
    assessment.userId = state.userId();
    assessment.courseId = state.courseId();
    m_assessments.fetch_add(1);

    if (queueDelayMs + timer.elapsed() > m_settings.intervention.signalBudgetMs) {
        // Missed opportunity, never a late or forced decision.
        m_budgetExceeded.fetch_add(1);
        LOG_WARN(lpIntervention, "Signal budget exceeded for session %s (queued %lld ms)",
                 qUtf8Printable(state.sessionId()), static_cast<long long>(queueDelayMs));
        persistSuppression(assessment, SuppressionReason::BudgetExceeded, signal.receivedAtMs);
        return;
    }

    if (assessment.riskLevel >= m_settings.intervention.deliveryRiskThreshold) {
        enqueueLearnerWrite(QStringLiteral("assessment"), assessment.tenantId, assessment.userId,
                            signal.receivedAtMs,
                            [assessment](EngineStore& store) {
                                return store.insertAssessment(assessment);
                            });
    }

    const InterventionDecision decision = m_policy->decide(assessment, signal.receivedAtMs);
    if (decision.triggered) {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        if (m_interventionSink) {
            m_interventionSink->deliverIntervention(decision.command);
        }
        return;
    }

    if (decision.suppression && *decision.suppression != SuppressionReason::BelowThreshold) {
        persistSuppression(assessment, *decision.suppression, signal.receivedAtMs);
    }
}

void StruggleEngine::onEffectivenessMeasured(const SessionState& state,
                                             const EffectivenessMeasurement& measurement)
{
    LOG_DEBUG(lpIntervention, "Intervention %s effectiveness %.3f (session %s)",
              qUtf8Printable(measurement.interventionId), measurement.score,
              qUtf8Printable(state.sessionId()));

    const QString id = measurement.interventionId;
    const double score = measurement.score;
    EngineStore* store = m_store.get();
    m_writeQueue->enqueue(QStringLiteral("effectiveness"), [store, id, score]() {
        return store->updateEffectiveness(id, score);
    });
}

void StruggleEngine::onSessionClosed(const SessionState& state, const QString& reason,
                                     int64_t closedAtMs)
{
    // Nonces older than the idle timeout can no longer pass the freshness
    // check, so their replay state is safe to release.
    if (reason == QLatin1String("idle_timeout")) {
        m_ingestor->forgetSession(state.sessionId());
    }

    SessionSnapshotRow row;
    row.sessionId = state.sessionId();
    row.tenantId = state.tenantId();
    row.userId = state.userId();
    row.courseId = state.courseId();
    row.sampleCount = state.totalSignals();
    row.featuresJson = QJsonDocument(featuresToJson(state.features())).toJson(QJsonDocument::Compact);
    row.openedAtMs = state.openedAtMs();
    row.closedAtMs = closedAtMs;
    row.closeReason = reason;

    enqueueLearnerWrite(QStringLiteral("snapshot"), row.tenantId, row.userId, closedAtMs,
                        [row](EngineStore& store) { return store.upsertSessionSnapshot(row); });
}

// ── Private ─────────────────────────────────────────────────

void StruggleEngine::onPurgeRequested(const QString& tenantId, const QString& userId,
                                      int64_t nowMs)
{
    if (nowMs <= 0) {
        nowMs = QDateTime::currentMSecsSinceEpoch();
    }
    m_retention->requestPurge(tenantId, userId, nowMs);
    const int closed = m_host->closeSessionsForUser(tenantId, userId,
                                                    QStringLiteral("consent_withdrawn"), nowMs);
    m_policy->forgetUser(tenantId, userId);
    LOG_INFO(lpRetention, "Purge requested tenant=%s user=%s (%d live sessions closed)",
             qUtf8Printable(tenantId), qUtf8Printable(userId), closed);
}

void StruggleEngine::raiseOperationalAlert(const OperationalAlert& alert)
{
    m_operationalAlerts.fetch_add(1);
    LOG_ERROR(lpCore, "Operational alert [%s/%s]: %s",
              qUtf8Printable(alert.component), qUtf8Printable(alert.code),
              qUtf8Printable(alert.message));
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    if (m_opsSink) {
        m_opsSink->raiseOperationalAlert(alert);
    }
}

void StruggleEngine::persistSuppression(const StruggleAssessment& assessment,
                                        SuppressionReason reason, int64_t decidedAtMs)
{
    SuppressionRecord record;
    record.tenantId = assessment.tenantId;
    record.sessionId = assessment.sessionId;
    record.userId = assessment.userId;
    record.courseId = assessment.courseId;
    record.reason = reason;
    record.riskLevel = assessment.riskLevel;
    record.confidence = assessment.confidence;
    record.decidedAtMs = decidedAtMs;

    enqueueLearnerWrite(QStringLiteral("suppression"), record.tenantId, record.userId,
                        decidedAtMs,
                        [record](EngineStore& store) { return store.insertSuppression(record); });
}

void StruggleEngine::enqueueLearnerWrite(const QString& label, const QString& tenantId,
                                         const QString& userId, int64_t nowMs,
                                         std::function<bool(EngineStore&)> write)
{
    EngineStore* store = m_store.get();
    ConsentGate* gate = m_consentGate.get();
    const bool queued = m_writeQueue->enqueue(
        label, [store, gate, label, tenantId, userId, nowMs, write]() {
            const ConsentDecision decision =
                gate->check(tenantId, userId, ConsentScope::BehavioralTiming, nowMs);
            if (!decision.allowed) {
                LOG_DEBUG(lpStore, "Skipping %s write for user without consent (%s)",
                          qUtf8Printable(label),
                          qUtf8Printable(consentDenialReasonToString(decision.reason)));
                return true;
            }
            return write(*store);
        });
    if (!queued) {
        LOG_WARN(lpStore, "Write queue full, dropped %s write", qUtf8Printable(label));
    }
}

} // namespace lp
