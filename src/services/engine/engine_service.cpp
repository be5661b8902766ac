#include "engine_service.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonArray>

namespace lp {

namespace {

int64_t nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

IpcErrorCode errorCodeForRejection(IngestRejection rejection)
{
    switch (rejection) {
    case IngestRejection::SchemaViolation:
    case IngestRejection::StaleTimestamp:
        return IpcErrorCode::InvalidParams;
    case IngestRejection::InvalidOrigin:
    case IngestRejection::InvalidSignature:
    case IngestRejection::ConsentDenied:
        return IpcErrorCode::PermissionDenied;
    case IngestRejection::ReplayedNonce:
        return IpcErrorCode::Conflict;
    case IngestRejection::CapacityExceeded:
        return IpcErrorCode::ServiceUnavailable;
    case IngestRejection::RateLimited:
    case IngestRejection::None:
        break;
    }
    return IpcErrorCode::InternalError;
}

QJsonObject alertScanToJson(const AlertScanResult& result)
{
    QJsonObject json;
    json[QStringLiteral("ok")] = result.ok;
    json[QStringLiteral("timedOut")] = result.timedOut;
    json[QStringLiteral("coursesScanned")] = result.coursesScanned;
    json[QStringLiteral("studentsEvaluated")] = result.studentsEvaluated;
    json[QStringLiteral("alertsCreated")] = result.alertsCreated;
    json[QStringLiteral("alertsUpdated")] = result.alertsUpdated;
    if (!result.error.isEmpty()) {
        json[QStringLiteral("error")] = result.error;
    }
    return json;
}

} // anonymous namespace

EngineService::EngineService(const EngineSettings& settings, QObject* parent)
    : ServiceBase(QStringLiteral("engine"), parent)
    , m_engine(settings)
{
    m_engine.setInterventionSink(this);
    m_engine.setOperationalAlertSink(this);

    connect(&m_idleTimer, &QTimer::timeout, this, [this]() {
        m_engine.expireIdleSessions(nowMs());
    });
    connect(&m_purgeTimer, &QTimer::timeout, this, [this]() {
        m_engine.processPurgeQueue(nowMs());
    });
    connect(&m_alertScanTimer, &QTimer::timeout, this, [this]() {
        runAlertScan(nowMs());
    });
    connect(&m_retentionTimer, &QTimer::timeout, this, [this]() {
        m_engine.runRetentionSweep(nowMs());
    });

    LOG_INFO(lpIpc, "EngineService created");
}

EngineService::~EngineService()
{
    stop();
    m_engine.setInterventionSink(nullptr);
    m_engine.setOperationalAlertSink(nullptr);
}

bool EngineService::start(QString* errorOut)
{
    if (!m_engine.open(errorOut)) {
        return false;
    }

    const ServiceTimerConfig& timers = m_engine.settings().timers;
    m_idleTimer.start(timers.idleSweepIntervalMs);
    m_purgeTimer.start(timers.purgeQueueIntervalMs);
    m_alertScanTimer.start(timers.alertScanIntervalMs);
    m_retentionTimer.start(timers.retentionSweepIntervalMs);
    return true;
}

void EngineService::stop()
{
    m_idleTimer.stop();
    m_purgeTimer.stop();
    m_alertScanTimer.stop();
    m_retentionTimer.stop();
    m_engine.shutdown();
}

void EngineService::onShutdownRequested()
{
    m_idleTimer.stop();
    m_purgeTimer.stop();
    m_alertScanTimer.stop();
    m_retentionTimer.stop();
}

void EngineService::deliverIntervention(const InterventionCommand& command)
{
    const QJsonObject params = interventionCommandToJson(command);
    QMetaObject::invokeMethod(this, [this, params]() {
        sendNotification(QStringLiteral("intervention_triggered"), params);
    }, Qt::QueuedConnection);
}

void EngineService::raiseOperationalAlert(const OperationalAlert& alert)
{
    const QJsonObject params = operationalAlertToJson(alert);
    QMetaObject::invokeMethod(this, [this, params]() {
        sendNotification(QStringLiteral("operational_alert"), params);
    }, Qt::QueuedConnection);
}

QJsonObject EngineService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = requestId(request);
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    if (method == QLatin1String("submit_signal"))       return handleSubmitSignal(id, params);
    if (method == QLatin1String("close_session"))       return handleCloseSession(id, params);
    if (method == QLatin1String("consent_changed"))     return handleConsentChanged(id, params);
    if (method == QLatin1String("record_delivery"))     return handleRecordDelivery(id, params);
    if (method == QLatin1String("record_response"))     return handleRecordResponse(id, params);
    if (method == QLatin1String("list_alerts"))         return handleListAlerts(id, params);
    if (method == QLatin1String("alert_action"))        return handleAlertAction(id, params);
    if (method == QLatin1String("run_alert_scan"))      return handleRunAlertScan(id);
    if (method == QLatin1String("run_retention_sweep")) return handleRunRetentionSweep(id);
    if (method == QLatin1String("get_engine_health"))   return handleGetEngineHealth(id);

    // ping, shutdown, unknown
    return ServiceBase::handleRequest(request);
}

QJsonObject EngineService::handleSubmitSignal(uint64_t id, const QJsonObject& params)
{
    const IngestResult result = m_engine.submitSignal(params, nowMs());

    QJsonObject json;
    json[QStringLiteral("accepted")] = result.accepted;
    json[QStringLiteral("status")] = ingestStatusCode(result.rejection);

    if (result.accepted) {
        return IpcMessage::makeResponse(id, json);
    }
    if (result.rejection == IngestRejection::RateLimited) {
        // Silent drop: the caller learns nothing beyond "not accepted".
        json[QStringLiteral("dropped")] = true;
        return IpcMessage::makeResponse(id, json);
    }

    return IpcMessage::makeError(id, errorCodeForRejection(result.rejection),
                                 QStringLiteral("%1 (%2): %3")
                                     .arg(ingestRejectionToString(result.rejection),
                                          ingestErrorClass(result.rejection),
                                          result.reason));
}

QJsonObject EngineService::handleCloseSession(uint64_t id, const QJsonObject& params)
{
    const QString sessionId = params.value(QStringLiteral("sessionId")).toString();
    if (sessionId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'sessionId' parameter"));
    }
    if (!m_engine.closeSession(sessionId, nowMs())) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("No live session: %1").arg(sessionId));
    }

    QJsonObject result;
    result[QStringLiteral("closed")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject EngineService::handleConsentChanged(uint64_t id, const QJsonObject& params)
{
    const QString tenantId = params.value(QStringLiteral("tenantId")).toString();
    const QString userId = params.value(QStringLiteral("userId")).toString();
    if (tenantId.isEmpty() || userId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'tenantId' or 'userId' parameter"));
    }
    if (!params.value(QStringLiteral("granted")).isBool()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'granted' parameter"));
    }

    std::optional<ConsentScope> scope;
    const QString scopeStr = params.value(QStringLiteral("scope")).toString(QStringLiteral("all"));
    if (scopeStr != QLatin1String("all")) {
        scope = consentScopeFromString(scopeStr);
        if (!scope) {
            return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                         QStringLiteral("Unknown consent scope: %1").arg(scopeStr));
        }
    }

    const bool granted = params.value(QStringLiteral("granted")).toBool();
    const std::optional<ConsentRecord> record =
        m_engine.applyConsentChange(tenantId, userId, scope, granted, nowMs());
    if (!record) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to store consent change"));
    }
    return IpcMessage::makeResponse(id, consentRecordToJson(*record));
}

QJsonObject EngineService::handleRecordDelivery(uint64_t id, const QJsonObject& params)
{
    const QString interventionId = params.value(QStringLiteral("interventionId")).toString();
    if (interventionId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'interventionId' parameter"));
    }
    const int64_t deliveredAt =
        params.value(QStringLiteral("deliveredAt")).toInteger(nowMs());

    switch (m_engine.recordDelivery(interventionId, deliveredAt)) {
    case InterventionUpdateStatus::Ok:
        break;
    case InterventionUpdateStatus::NotFound:
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown intervention: %1").arg(interventionId));
    case InterventionUpdateStatus::Conflict:
    case InterventionUpdateStatus::StoreError:
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to record delivery"));
    }

    QJsonObject result;
    result[QStringLiteral("recorded")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject EngineService::handleRecordResponse(uint64_t id, const QJsonObject& params)
{
    const QString interventionId = params.value(QStringLiteral("interventionId")).toString();
    const std::optional<UserResponse> response =
        userResponseFromString(params.value(QStringLiteral("response")).toString());
    if (interventionId.isEmpty() || !response || *response == UserResponse::None) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'interventionId' or valid 'response'"));
    }
    const int64_t respondedAt =
        params.value(QStringLiteral("respondedAt")).toInteger(nowMs());

    switch (m_engine.recordResponse(interventionId, *response, respondedAt)) {
    case InterventionUpdateStatus::Ok:
        break;
    case InterventionUpdateStatus::NotFound:
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown intervention: %1").arg(interventionId));
    case InterventionUpdateStatus::Conflict:
        return IpcMessage::makeError(id, IpcErrorCode::Conflict,
                                     QStringLiteral("Intervention already has a different response"));
    case InterventionUpdateStatus::StoreError:
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to record response"));
    }

    QJsonObject result;
    result[QStringLiteral("recorded")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject EngineService::handleListAlerts(uint64_t id, const QJsonObject& params)
{
    AlertFilter filter;
    filter.tenantId = params.value(QStringLiteral("tenantId")).toString();
    filter.courseId = params.value(QStringLiteral("courseId")).toString();
    if (filter.tenantId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'tenantId' parameter"));
    }

    if (params.contains(QStringLiteral("severity"))) {
        filter.severity = alertSeverityFromString(params.value(QStringLiteral("severity")).toString());
        if (!filter.severity) {
            return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                         QStringLiteral("Unknown severity"));
        }
    }
    if (params.contains(QStringLiteral("status"))) {
        filter.status = alertStatusFromString(params.value(QStringLiteral("status")).toString());
        if (!filter.status) {
            return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                         QStringLiteral("Unknown status"));
        }
    }

    const int offset = params.value(QStringLiteral("offset")).toInt(0);
    const int limit = params.value(QStringLiteral("limit")).toInt(0);

    AlertAggregator* alerts = m_engine.alerts();
    if (!alerts) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Engine not running"));
    }
    const std::optional<AlertPage> page = alerts->listAlerts(filter, offset, limit);
    if (!page) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to list alerts"));
    }

    QJsonArray items;
    for (const InstructorAlert& alert : page->alerts) {
        items.append(instructorAlertToJson(alert));
    }

    QJsonObject result;
    result[QStringLiteral("alerts")] = items;
    result[QStringLiteral("total")] = page->total;
    result[QStringLiteral("offset")] = page->offset;
    result[QStringLiteral("limit")] = page->limit;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject EngineService::handleAlertAction(uint64_t id, const QJsonObject& params)
{
    const QString tenantId = params.value(QStringLiteral("tenantId")).toString();
    const int64_t alertId = params.value(QStringLiteral("alertId")).toInteger(0);
    const std::optional<AlertAction> action =
        alertActionFromString(params.value(QStringLiteral("action")).toString());
    const QString actorId = params.value(QStringLiteral("actorId")).toString();
    const QString note = params.value(QStringLiteral("note")).toString();

    if (tenantId.isEmpty() || alertId <= 0 || !action || actorId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Requires 'tenantId', 'alertId', 'action' and 'actorId'"));
    }

    AlertAggregator* alerts = m_engine.alerts();
    if (!alerts) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Engine not running"));
    }

    const AlertActionResult result =
        alerts->applyAction(tenantId, alertId, *action, actorId, note, nowMs());
    switch (result.error) {
    case AlertActionError::None:
        return IpcMessage::makeResponse(id, instructorAlertToJson(result.alert));
    case AlertActionError::NotFound:
        return IpcMessage::makeError(id, IpcErrorCode::NotFound, result.message);
    case AlertActionError::InvalidTransition:
        return IpcMessage::makeError(id, IpcErrorCode::Conflict, result.message);
    case AlertActionError::StoreError:
        break;
    }
    return IpcMessage::makeError(id, IpcErrorCode::InternalError, result.message);
}

QJsonObject EngineService::handleRunAlertScan(uint64_t id)
{
    const AlertScanResult result = runAlertScan(nowMs());
    if (!result.ok) {
        return IpcMessage::makeError(id, result.timedOut ? IpcErrorCode::Timeout
                                                         : IpcErrorCode::InternalError,
                                     result.error);
    }
    return IpcMessage::makeResponse(id, alertScanToJson(result));
}

QJsonObject EngineService::handleRunRetentionSweep(uint64_t id)
{
    const RetentionSweepResult sweep = m_engine.runRetentionSweep(nowMs());
    const PurgeRunResult purges = m_engine.processPurgeQueue(nowMs());

    QJsonObject result;
    result[QStringLiteral("ok")] = sweep.ok;
    result[QStringLiteral("tenantsSwept")] = sweep.tenantsSwept;
    result[QStringLiteral("tenantsFailed")] = sweep.tenantsFailed;
    result[QStringLiteral("signalsDeleted")] = sweep.totals.signalsDeleted;
    result[QStringLiteral("snapshotsDeleted")] = sweep.totals.snapshotsDeleted;
    result[QStringLiteral("recordsAnonymized")] = sweep.totals.recordsAnonymized;
    result[QStringLiteral("purgesDiscovered")] = sweep.purgesDiscovered;
    result[QStringLiteral("slaBreaches")] = sweep.slaBreaches;
    result[QStringLiteral("purged")] = purges.purged;
    result[QStringLiteral("purgeRetries")] = purges.retryScheduled;
    result[QStringLiteral("interventionsTimedOut")] = sweep.interventionsTimedOut;
    result[QStringLiteral("alertsExpired")] = sweep.alertsExpired;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject EngineService::handleGetEngineHealth(uint64_t id)
{
    QJsonObject health = m_engine.health();
    health[QStringLiteral("connectedClients")] = m_server->clientCount();
    return IpcMessage::makeResponse(id, health);
}

AlertScanResult EngineService::runAlertScan(int64_t now)
{
    const AlertScanResult result = m_engine.runAlertScan(now);
    if (result.ok) {
        publishCreatedAlerts(result);
    } else {
        LOG_WARN(lpAlerts, "Alert scan failed: %s", qPrintable(result.error));
    }
    return result;
}

void EngineService::publishCreatedAlerts(const AlertScanResult& result)
{
    for (const InstructorAlert& alert : result.created) {
        sendNotification(QStringLiteral("instructor_alert"), instructorAlertToJson(alert));
    }
}

} // namespace lp
