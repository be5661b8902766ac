#pragma once

#include "core/alerts/alert_aggregator.h"
#include "core/consent/consent_gate.h"
#include "core/engine/delivery_sink.h"
#include "core/ingest/signal_ingestor.h"
#include "core/intervention/intervention_policy.h"
#include "core/retention/retention_scheduler.h"
#include "core/scoring/struggle_scorer.h"
#include "core/session/session_actor_host.h"
#include "core/shared/settings.h"
#include "core/store/async_write_queue.h"
#include "core/store/engine_store.h"

#include <QJsonObject>
#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace lp {

enum class InterventionUpdateStatus {
    Ok,
    NotFound,
    Conflict,
    StoreError,
};

// StruggleEngine -- wires ingest, session actors, scoring, the decision
// policy, alerts and retention around one EngineStore.
//
// Every public entry point takes the caller's clock (epoch ms) so tests
// can drive time explicitly.
class StruggleEngine : public SessionActorDelegate {
public:
    using PageContextFn = std::function<std::optional<PageContext>(const QString& pageContentHash)>;

    explicit StruggleEngine(const EngineSettings& settings);
    ~StruggleEngine() override;

    StruggleEngine(const StruggleEngine&) = delete;
    StruggleEngine& operator=(const StruggleEngine&) = delete;

    // Opens the store and starts the workers.
    bool open(QString* errorOut = nullptr);
    // Flushes live sessions and pending writes, then stops.
    void shutdown();
    bool isOpen() const { return m_open; }

    // Sinks must outlive the engine or be cleared before they are destroyed.
    void setInterventionSink(InterventionSink* sink);
    void setOperationalAlertSink(OperationalAlertSink* sink);
    void setPageContextProvider(PageContextFn provider);

    // ── Inbound ─────────────────────────────────────────────

    IngestResult submitSignal(const QJsonObject& payload, int64_t nowMs);
    bool closeSession(const QString& sessionId, int64_t nowMs);

    // Consent webhook. scope == nullopt means every scope.
    std::optional<ConsentRecord> applyConsentChange(const QString& tenantId,
                                                    const QString& userId,
                                                    std::optional<ConsentScope> scope,
                                                    bool granted,
                                                    int64_t nowMs);

    InterventionUpdateStatus recordDelivery(const QString& interventionId, int64_t deliveredAtMs);
    InterventionUpdateStatus recordResponse(const QString& interventionId, UserResponse response,
                                            int64_t respondedAtMs);

    // ── Scheduled work ──────────────────────────────────────

    int expireIdleSessions(int64_t nowMs);
    PurgeRunResult processPurgeQueue(int64_t nowMs);
    AlertScanResult runAlertScan(int64_t nowMs);
    RetentionSweepResult runRetentionSweep(int64_t nowMs);

    // ── Accessors ───────────────────────────────────────────

    AlertAggregator* alerts() { return m_alerts.get(); }
    EngineStore* store() { return m_store.get(); }
    const EngineSettings& settings() const { return m_settings; }

    // Waits for session mailboxes and the async writer to drain.
    bool waitForIdle(int timeoutMs);

    QJsonObject health() const;

    // ── SessionActorDelegate ────────────────────────────────

    void onSignalApplied(const SessionState& state, const BehavioralSignal& signal,
                         bool featuresUpdated, int64_t queueDelayMs) override;
    void onEffectivenessMeasured(const SessionState& state,
                                 const EffectivenessMeasurement& measurement) override;
    void onSessionClosed(const SessionState& state, const QString& reason,
                         int64_t closedAtMs) override;

private:
    void touchClock(int64_t nowMs);
    void onPurgeRequested(const QString& tenantId, const QString& userId, int64_t nowMs);
    void raiseOperationalAlert(const OperationalAlert& alert);
    void persistSuppression(const StruggleAssessment& assessment, SuppressionReason reason,
                            int64_t decidedAtMs);
    // Queues a learner-data write that re-checks behavioral_timing consent
    // when it runs, so nothing lands for a user withdrawn in between.
    void enqueueLearnerWrite(const QString& label, const QString& tenantId,
                             const QString& userId, int64_t nowMs,
                             std::function<bool(EngineStore&)> write);

    EngineSettings m_settings;
    bool m_open = false;

    std::unique_ptr<EngineStore> m_store;
    std::unique_ptr<ConsentGate> m_consentGate;
    std::unique_ptr<SignalIngestor> m_ingestor;
    std::unique_ptr<StruggleScorer> m_scorer;
    std::unique_ptr<InterventionPolicy> m_policy;
    std::unique_ptr<AsyncWriteQueue> m_writeQueue;
    std::unique_ptr<SessionActorHost> m_host;
    std::unique_ptr<AlertAggregator> m_alerts;
    std::unique_ptr<RetentionScheduler> m_retention;

    mutable std::mutex m_sinkMutex;
    InterventionSink* m_interventionSink = nullptr;
    OperationalAlertSink* m_opsSink = nullptr;
    PageContextFn m_pageContext;

    // Latest caller clock, for callbacks that arrive without one.
    std::atomic<int64_t> m_lastNowMs{0};
    std::atomic<size_t> m_assessments{0};
    std::atomic<size_t> m_modelErrors{0};
    std::atomic<size_t> m_budgetExceeded{0};
    std::atomic<size_t> m_interventionsDelivered{0};
    std::atomic<size_t> m_operationalAlerts{0};
};

} // namespace lp
