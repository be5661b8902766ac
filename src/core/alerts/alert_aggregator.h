#pragma once

#include "core/shared/settings.h"
#include "core/shared/struggle_types.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace lp {

class ConsentGate;
class EngineStore;

enum class AlertAction {
    Acknowledge,
    Start,
    Resolve,
    Dismiss,
};

QString alertActionToString(AlertAction action);
std::optional<AlertAction> alertActionFromString(const QString& str);

// nullopt when the action is not allowed from the given status.
std::optional<AlertStatus> alertTransition(AlertStatus from, AlertAction action);

enum class AlertActionError {
    None,
    NotFound,
    InvalidTransition,
    StoreError,
};

struct AlertActionResult {
    bool ok = false;
    AlertActionError error = AlertActionError::None;
    QString message;
    InstructorAlert alert;
};

struct AlertFilter {
    QString tenantId;                       // required
    QString courseId;
    std::optional<AlertSeverity> severity;
    std::optional<AlertStatus> status;
};

struct AlertPage {
    std::vector<InstructorAlert> alerts;
    int total = 0;
    int offset = 0;
    int limit = 0;
};

struct AlertScanResult {
    bool ok = false;
    bool timedOut = false;
    QString error;
    int coursesScanned = 0;
    int studentsEvaluated = 0;
    int alertsCreated = 0;
    int alertsUpdated = 0;
    // Newly created alerts, for the dashboard notification.
    std::vector<InstructorAlert> created;
};

// AlertAggregator -- scheduled roll-up of struggle events into instructor alerts.
//
// Reads the trailing window under a query deadline, checks each student's
// anonymized_analytics consent outside the store lock, then upserts alerts
// in one transaction. Students without consent only ever contribute to a
// course-level class_struggle alert, and only when the course has at least
// kAnonymityFloor active students.
class AlertAggregator {
public:
    AlertAggregator(EngineStore& store, ConsentGate& consentGate, const AlertConfig& config = {});

    AlertScanResult runAggregation(int64_t nowMs);

    std::optional<AlertPage> listAlerts(const AlertFilter& filter, int offset, int limit);
    std::optional<InstructorAlert> getAlert(const QString& tenantId, int64_t alertId);

    AlertActionResult applyAction(const QString& tenantId, int64_t alertId, AlertAction action,
                                  const QString& actorId, const QString& note, int64_t nowMs);

    static AlertSeverity severityForRisk(double riskScore, const AlertConfig& config);

private:
    EngineStore& m_store;
    ConsentGate& m_consentGate;
    AlertConfig m_config;
};

} // namespace lp
