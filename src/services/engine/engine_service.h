#pragma once

#include "core/engine/delivery_sink.h"
#include "core/engine/struggle_engine.h"
#include "core/ipc/service_base.h"

#include <QTimer>

namespace lp {

// EngineService -- IPC front of the struggle engine.
//
// Requests run on the service thread. Engine callbacks arrive on session
// and writer threads and are re-posted to this thread before they touch
// the socket server.
class EngineService : public ServiceBase, public InterventionSink, public OperationalAlertSink {
    Q_OBJECT
public:
    explicit EngineService(const EngineSettings& settings, QObject* parent = nullptr);
    ~EngineService() override;

    // Opens the engine and arms the maintenance timers.
    bool start(QString* errorOut = nullptr);
    void stop();

    StruggleEngine& engine() { return m_engine; }

    void deliverIntervention(const InterventionCommand& command) override;
    void raiseOperationalAlert(const OperationalAlert& alert) override;

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;
    void onShutdownRequested() override;

private:
    QJsonObject handleSubmitSignal(uint64_t id, const QJsonObject& params);
    QJsonObject handleCloseSession(uint64_t id, const QJsonObject& params);
    QJsonObject handleConsentChanged(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordDelivery(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordResponse(uint64_t id, const QJsonObject& params);
    QJsonObject handleListAlerts(uint64_t id, const QJsonObject& params);
    QJsonObject handleAlertAction(uint64_t id, const QJsonObject& params);
    QJsonObject handleRunAlertScan(uint64_t id);
    QJsonObject handleRunRetentionSweep(uint64_t id);
    QJsonObject handleGetEngineHealth(uint64_t id);

    AlertScanResult runAlertScan(int64_t nowMs);
    void publishCreatedAlerts(const AlertScanResult& result);

    StruggleEngine m_engine;
    QTimer m_idleTimer;
    QTimer m_purgeTimer;
    QTimer m_alertScanTimer;
    QTimer m_retentionTimer;
};

} // namespace lp
