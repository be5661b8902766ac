#include "core/alerts/alert_aggregator.h"
#include "core/consent/consent_gate.h"
#include "core/shared/logging.h"
#include "core/store/engine_store.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

#include <algorithm>
#include <functional>
#include <map>
#include <set>

#include <sqlite3.h>

namespace lp {

namespace {

constexpr const char* kAlertColumns =
    "id, tenant_id, course_id, instructor_id, student_id, student_key, alert_type, severity, "
    "risk_score, evidence_json, concerns_json, actions_json, status, window_start, window_end, "
    "created_at, updated_at";

constexpr const char* kCourseLevelStudentKey = "*";

struct StudentWindow {
    QString tenantId;
    QString courseId;
    QString userId;
    int struggleEvents = 0;
    int highRiskEvents = 0;
    double maxRisk = 0.0;
    double riskSum = 0.0;
    int deliveredInterventions = 0;
    int suppressedDecisions = 0;
    int negativeResponses = 0;
    QHash<QString, int> factorCounts;
};

struct CourseWindow {
    QString tenantId;
    QString courseId;
    QString instructorId;
};

QString join3(const QString& a, const QString& b, const QString& c)
{
    return a + QLatin1Char('\x1f') + b + QLatin1Char('\x1f') + c;
}

QString join2(const QString& a, const QString& b)
{
    return a + QLatin1Char('\x1f') + b;
}

QByteArray compactJson(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

QByteArray compactJson(const QJsonArray& array)
{
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

QJsonObject evidenceToJson(const AlertEvidence& evidence)
{
    QJsonObject json;
    json[QStringLiteral("struggleEvents")] = evidence.struggleEvents;
    json[QStringLiteral("highRiskEvents")] = evidence.highRiskEvents;
    json[QStringLiteral("deliveredInterventions")] = evidence.deliveredInterventions;
    json[QStringLiteral("suppressedDecisions")] = evidence.suppressedDecisions;
    json[QStringLiteral("negativeResponses")] = evidence.negativeResponses;
    json[QStringLiteral("distinctStudents")] = evidence.distinctStudents;
    return json;
}

AlertEvidence evidenceFromJson(const QByteArray& bytes)
{
    const QJsonObject json = QJsonDocument::fromJson(bytes).object();
    AlertEvidence evidence;
    evidence.struggleEvents = json.value(QStringLiteral("struggleEvents")).toInt();
    evidence.highRiskEvents = json.value(QStringLiteral("highRiskEvents")).toInt();
    evidence.deliveredInterventions = json.value(QStringLiteral("deliveredInterventions")).toInt();
    evidence.suppressedDecisions = json.value(QStringLiteral("suppressedDecisions")).toInt();
    evidence.negativeResponses = json.value(QStringLiteral("negativeResponses")).toInt();
    evidence.distinctStudents = json.value(QStringLiteral("distinctStudents")).toInt();
    return evidence;
}

QJsonArray concernsToJson(const std::vector<AlertConcern>& concerns)
{
    QJsonArray array;
    for (const AlertConcern& concern : concerns) {
        QJsonObject entry;
        entry[QStringLiteral("code")] = concern.code;
        entry[QStringLiteral("count")] = concern.count;
        array.append(entry);
    }
    return array;
}

std::vector<AlertConcern> concernsFromJson(const QByteArray& bytes)
{
    std::vector<AlertConcern> concerns;
    const QJsonArray array = QJsonDocument::fromJson(bytes).array();
    for (const QJsonValue& value : array) {
        const QJsonObject entry = value.toObject();
        concerns.push_back({entry.value(QStringLiteral("code")).toString(),
                            entry.value(QStringLiteral("count")).toInt()});
    }
    return concerns;
}

QStringList actionsFromJson(const QByteArray& bytes)
{
    QStringList actions;
    const QJsonArray array = QJsonDocument::fromJson(bytes).array();
    for (const QJsonValue& value : array) {
        actions.append(value.toString());
    }
    return actions;
}

InstructorAlert readAlert(sqlite3_stmt* stmt)
{
    InstructorAlert alert;
    alert.id = sqlite3_column_int64(stmt, 0);
    alert.tenantId = sql::columnText(stmt, 1);
    alert.courseId = sql::columnText(stmt, 2);
    alert.instructorId = sql::columnText(stmt, 3);
    alert.studentId = sql::columnText(stmt, 4);
    alert.studentKey = sql::columnText(stmt, 5);
    alert.alertType = alertTypeFromString(sql::columnText(stmt, 6)).value_or(AlertType::StruggleRisk);
    alert.severity = alertSeverityFromString(sql::columnText(stmt, 7)).value_or(AlertSeverity::Low);
    alert.riskScore = sqlite3_column_double(stmt, 8);
    alert.evidence = evidenceFromJson(sql::columnText(stmt, 9).toUtf8());
    alert.specificConcerns = concernsFromJson(sql::columnText(stmt, 10).toUtf8());
    alert.recommendedActions = actionsFromJson(sql::columnText(stmt, 11).toUtf8());
    alert.status = alertStatusFromString(sql::columnText(stmt, 12)).value_or(AlertStatus::New);
    alert.windowStartMs = sqlite3_column_int64(stmt, 13);
    alert.windowEndMs = sqlite3_column_int64(stmt, 14);
    alert.createdAtMs = sqlite3_column_int64(stmt, 15);
    alert.updatedAtMs = sqlite3_column_int64(stmt, 16);
    return alert;
}

std::optional<InstructorAlert> readAlertById(sqlite3* db, const QString& tenantId, int64_t alertId)
{
    const QByteArray sqlText = QStringLiteral(
        "SELECT %1 FROM instructor_alerts WHERE id = ?1 AND tenant_id = ?2")
        .arg(QString::fromLatin1(kAlertColumns)).toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlText.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(lpAlerts, "readAlertById prepare failed: %s", sqlite3_errmsg(db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, alertId);
    sql::bindText(stmt, 2, tenantId);

    std::optional<InstructorAlert> alert;
    if (sql::stepWithRetry(stmt) == SQLITE_ROW) {
        alert = readAlert(stmt);
    }
    sqlite3_finalize(stmt);
    return alert;
}

std::vector<AlertConcern> sortedConcerns(const QHash<QString, int>& counts)
{
    std::vector<AlertConcern> concerns;
    for (auto it = counts.cbegin(); it != counts.cend(); ++it) {
        if (it.value() > 0) {
            concerns.push_back({it.key(), it.value()});
        }
    }
    std::sort(concerns.begin(), concerns.end(), [](const AlertConcern& a, const AlertConcern& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.code < b.code;
    });
    return concerns;
}

QStringList recommendedActionsFor(AlertType type, const QHash<QString, int>& factorCounts)
{
    switch (type) {
    case AlertType::StruggleRisk: {
        QStringList actions = {QStringLiteral("schedule_check_in"),
                               QStringLiteral("offer_office_hours")};
        if (factorCounts.value(QStringLiteral("error_rate")) > 0) {
            actions.append(QStringLiteral("review_prerequisites"));
        }
        return actions;
    }
    case AlertType::Disengagement:
        return {QStringLiteral("schedule_check_in"), QStringLiteral("adjust_pacing")};
    case AlertType::CognitiveOverload:
        return {QStringLiteral("review_prerequisites"), QStringLiteral("adjust_pacing")};
    case AlertType::AttentionIssues:
        return {QStringLiteral("suggest_break_strategies"), QStringLiteral("schedule_check_in")};
    case AlertType::ClassStruggle:
        return {QStringLiteral("adjust_pacing"), QStringLiteral("review_prerequisites"),
                QStringLiteral("offer_office_hours")};
    }
    return {};
}

// Alert types the student's window qualifies for.
std::vector<AlertType> triggeredTypes(const StudentWindow& s, const AlertConfig& config)
{
    std::vector<AlertType> types;
    if (s.highRiskEvents >= config.minHighRiskEvents) {
        types.push_back(AlertType::StruggleRisk);
    }
    if (s.negativeResponses >= config.minNegativeResponses) {
        types.push_back(AlertType::Disengagement);
    }
    if (s.struggleEvents >= config.minPatternEvents) {
        const int overload = std::max(s.factorCounts.value(QStringLiteral("error_rate")),
                                      s.factorCounts.value(QStringLiteral("hover_duration")));
        if (overload * 2 >= s.struggleEvents) {
            types.push_back(AlertType::CognitiveOverload);
        }
        if (s.factorCounts.value(QStringLiteral("idle_frequency")) * 2 >= s.struggleEvents) {
            types.push_back(AlertType::AttentionIssues);
        }
    }
    return types;
}

bool stepAll(sqlite3_stmt* stmt, const std::function<void(sqlite3_stmt*)>& onRow)
{
    int rc = sql::stepWithRetry(stmt);
    while (rc == SQLITE_ROW) {
        onRow(stmt);
        rc = sql::stepWithRetry(stmt);
    }
    return rc == SQLITE_DONE;
}

} // namespace

QString alertActionToString(AlertAction action)
{
    switch (action) {
    case AlertAction::Acknowledge: return QStringLiteral("acknowledge");
    case AlertAction::Start:       return QStringLiteral("start");
    case AlertAction::Resolve:     return QStringLiteral("resolve");
    case AlertAction::Dismiss:     return QStringLiteral("dismiss");
    }
    return QStringLiteral("acknowledge");
}

std::optional<AlertAction> alertActionFromString(const QString& str)
{
    if (str == QLatin1String("acknowledge")) return AlertAction::Acknowledge;
    if (str == QLatin1String("start")) return AlertAction::Start;
    if (str == QLatin1String("resolve")) return AlertAction::Resolve;
    if (str == QLatin1String("dismiss")) return AlertAction::Dismiss;
    return std::nullopt;
}

std::optional<AlertStatus> alertTransition(AlertStatus from, AlertAction action)
{
    if (!isOpenAlertStatus(from)) {
        return std::nullopt;
    }
    switch (action) {
    case AlertAction::Acknowledge:
        if (from == AlertStatus::New) {
            return AlertStatus::Acknowledged;
        }
        return std::nullopt;
    case AlertAction::Start:
        if (from == AlertStatus::InProgress) {
            return std::nullopt;
        }
        return AlertStatus::InProgress;
    case AlertAction::Resolve:
        return AlertStatus::Resolved;
    case AlertAction::Dismiss:
        return AlertStatus::Dismissed;
    }
    return std::nullopt;
}

AlertSeverity AlertAggregator::severityForRisk(double riskScore, const AlertConfig& config)
{
    if (riskScore >= config.criticalSeverityRisk) {
        return AlertSeverity::Critical;
    }
    if (riskScore >= config.highSeverityRisk) {
        return AlertSeverity::High;
    }
    if (riskScore >= config.mediumSeverityRisk) {
        return AlertSeverity::Medium;
    }
    return AlertSeverity::Low;
}

AlertAggregator::AlertAggregator(EngineStore& store, ConsentGate& consentGate,
                                 const AlertConfig& config)
    : m_store(store)
    , m_consentGate(consentGate)
    , m_config(config)
{
}

AlertScanResult AlertAggregator::runAggregation(int64_t nowMs)
{
    AlertScanResult result;
    const int64_t windowStartMs = nowMs - static_cast<int64_t>(m_config.windowHours) * 3600 * 1000;

    std::map<QString, StudentWindow> students;
    std::map<QString, CourseWindow> courses;

    auto studentFor = [&students, &courses](const QString& tenantId, const QString& courseId,
                                            const QString& userId) -> StudentWindow& {
        StudentWindow& s = students[join3(tenantId, courseId, userId)];
        if (s.userId.isEmpty()) {
            s.tenantId = tenantId;
            s.courseId = courseId;
            s.userId = userId;
        }
        CourseWindow& c = courses[join2(tenantId, courseId)];
        c.tenantId = tenantId;
        c.courseId = courseId;
        return s;
    };

    // ── Phase 1: read the window ────────────────────────────
    {
        EngineStore::Connection conn = m_store.acquire();
        sqlite3* db = conn.db();
        ScopedQueryDeadline deadline(db, m_config.queryTimeoutMs);

        const char* eventsSql = R"(
            SELECT tenant_id, course_id, user_id, risk_level, contributing_factors
            FROM struggle_events
            WHERE computed_at >= ?1 AND computed_at <= ?2 AND anonymized_at IS NULL
              AND course_id IS NOT NULL AND course_id <> ''
        )";
        const char* interventionsSql = R"(
            SELECT tenant_id, course_id, user_id, delivered_at, user_response
            FROM proactive_interventions
            WHERE triggered_at >= ?1 AND triggered_at <= ?2 AND anonymized_at IS NULL
              AND course_id IS NOT NULL AND course_id <> ''
        )";
        const char* suppressionsSql = R"(
            SELECT tenant_id, course_id, user_id, COUNT(*)
            FROM intervention_suppressions
            WHERE decided_at >= ?1 AND decided_at <= ?2 AND anonymized_at IS NULL
              AND course_id IS NOT NULL AND course_id <> ''
            GROUP BY tenant_id, course_id, user_id
        )";

        const double highRisk = m_config.highRiskThreshold;
        auto onEvent = [&studentFor, highRisk](sqlite3_stmt* stmt) {
            StudentWindow& s = studentFor(sql::columnText(stmt, 0), sql::columnText(stmt, 1),
                                          sql::columnText(stmt, 2));
            const double risk = sqlite3_column_double(stmt, 3);
            ++s.struggleEvents;
            s.riskSum += risk;
            s.maxRisk = std::max(s.maxRisk, risk);
            if (risk >= highRisk) {
                ++s.highRiskEvents;
            }
            const QStringList factors =
                sql::columnText(stmt, 4).split(QLatin1Char(','), Qt::SkipEmptyParts);
            for (const QString& factor : factors) {
                s.factorCounts[factor] += 1;
            }
        };
        auto onIntervention = [&studentFor](sqlite3_stmt* stmt) {
            StudentWindow& s = studentFor(sql::columnText(stmt, 0), sql::columnText(stmt, 1),
                                          sql::columnText(stmt, 2));
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
                ++s.deliveredInterventions;
            }
            const UserResponse response = userResponseFromString(sql::columnText(stmt, 4))
                                              .value_or(UserResponse::None);
            if (response == UserResponse::Dismissed || response == UserResponse::Ignored
                || response == UserResponse::Timeout) {
                ++s.negativeResponses;
            }
        };
        auto onSuppression = [&studentFor](sqlite3_stmt* stmt) {
            StudentWindow& s = studentFor(sql::columnText(stmt, 0), sql::columnText(stmt, 1),
                                          sql::columnText(stmt, 2));
            s.suppressedDecisions += sqlite3_column_int(stmt, 3);
        };

        struct Query {
            const char* sqlText;
            std::function<void(sqlite3_stmt*)> onRow;
        };
        const Query queries[] = {
            {eventsSql, onEvent},
            {interventionsSql, onIntervention},
            {suppressionsSql, onSuppression},
        };

        for (const Query& query : queries) {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(db, query.sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
                result.error = QString::fromUtf8(sqlite3_errmsg(db));
                LOG_ERROR(lpAlerts, "Alert scan prepare failed: %s", qUtf8Printable(result.error));
                return result;
            }
            sqlite3_bind_int64(stmt, 1, windowStartMs);
            sqlite3_bind_int64(stmt, 2, nowMs);
            const bool ok = stepAll(stmt, query.onRow);
            sqlite3_finalize(stmt);
            if (!ok) {
                result.timedOut = deadline.expired();
                result.error = result.timedOut ? QStringLiteral("query timeout")
                                               : QString::fromUtf8(sqlite3_errmsg(db));
                LOG_ERROR(lpAlerts, "Alert scan aborted: %s", qUtf8Printable(result.error));
                return result;
            }
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT tenant_id, course_id, instructor_id FROM course_instructors",
                               -1, &stmt, nullptr) == SQLITE_OK) {
            const bool ok = stepAll(stmt, [&courses](sqlite3_stmt* row) {
                auto it = courses.find(join2(sql::columnText(row, 0), sql::columnText(row, 1)));
                if (it != courses.end()) {
                    it->second.instructorId = sql::columnText(row, 2);
                }
            });
            sqlite3_finalize(stmt);
            if (!ok) {
                LOG_WARN(lpAlerts, "Instructor lookup incomplete: %s", sqlite3_errmsg(db));
            }
        } else {
            LOG_WARN(lpAlerts, "Instructor lookup prepare failed: %s", sqlite3_errmsg(db));
        }
    }

    // ── Phase 2: consent and alert rules ────────────────────
    std::vector<InstructorAlert> candidates;
    std::set<QString> coursesWithWithheld;
    QSet<QString> namedStudents;

    for (const auto& entry : students) {
        const StudentWindow& s = entry.second;
        const CourseWindow& course = courses[join2(s.tenantId, s.courseId)];
        ++result.studentsEvaluated;

        const std::vector<AlertType> types = triggeredTypes(s, m_config);
        if (types.empty()) {
            continue;
        }

        const ConsentDecision consent = m_consentGate.check(
            s.tenantId, s.userId, ConsentScope::AnonymizedAnalytics, nowMs);
        if (!consent.allowed) {
            coursesWithWithheld.insert(join2(s.tenantId, s.courseId));
            continue;
        }
        namedStudents.insert(entry.first);

        for (AlertType type : types) {
            InstructorAlert alert;
            alert.tenantId = s.tenantId;
            alert.courseId = s.courseId;
            alert.instructorId = course.instructorId;
            alert.studentId = s.userId;
            alert.studentKey = s.userId;
            alert.alertType = type;
            alert.riskScore = s.maxRisk;
            alert.severity = severityForRisk(s.maxRisk, m_config);
            alert.evidence.struggleEvents = s.struggleEvents;
            alert.evidence.highRiskEvents = s.highRiskEvents;
            alert.evidence.deliveredInterventions = s.deliveredInterventions;
            alert.evidence.suppressedDecisions = s.suppressedDecisions;
            alert.evidence.negativeResponses = s.negativeResponses;
            alert.evidence.distinctStudents = 1;

            QHash<QString, int> concerns = s.factorCounts;
            if (type == AlertType::Disengagement) {
                concerns.insert(QStringLiteral("negative_responses"), s.negativeResponses);
            }
            alert.specificConcerns = sortedConcerns(concerns);
            alert.recommendedActions = recommendedActionsFor(type, s.factorCounts);
            alert.windowStartMs = windowStartMs;
            alert.windowEndMs = nowMs;
            candidates.push_back(alert);
        }
    }

    for (const QString& courseKey : coursesWithWithheld) {
        const CourseWindow& course = courses[courseKey];

        // The rollup covers every student in the course without an
        // individual alert, so it cannot be differenced against those alerts.
        std::vector<const StudentWindow*> unnamed;
        for (const auto& studentEntry : students) {
            const StudentWindow& s = studentEntry.second;
            if (s.tenantId == course.tenantId && s.courseId == course.courseId
                && !namedStudents.contains(studentEntry.first)) {
                unnamed.push_back(&s);
            }
        }
        const int groupSize = static_cast<int>(unnamed.size());
        if (groupSize < m_config.kAnonymityFloor) {
            LOG_DEBUG(lpAlerts, "Course %s below k-anonymity floor (%d < %d), withholding",
                      qUtf8Printable(course.courseId), groupSize, m_config.kAnonymityFloor);
            continue;
        }

        InstructorAlert alert;
        alert.tenantId = course.tenantId;
        alert.courseId = course.courseId;
        alert.instructorId = course.instructorId;
        alert.studentKey = QString::fromLatin1(kCourseLevelStudentKey);
        alert.alertType = AlertType::ClassStruggle;

        QHash<QString, int> factorCounts;
        double riskSum = 0.0;
        for (const StudentWindow* student : unnamed) {
            const StudentWindow& s = *student;
            alert.evidence.struggleEvents += s.struggleEvents;
            alert.evidence.highRiskEvents += s.highRiskEvents;
            alert.evidence.deliveredInterventions += s.deliveredInterventions;
            alert.evidence.suppressedDecisions += s.suppressedDecisions;
            alert.evidence.negativeResponses += s.negativeResponses;
            riskSum += s.riskSum;
            for (auto it = s.factorCounts.cbegin(); it != s.factorCounts.cend(); ++it) {
                factorCounts[it.key()] += it.value();
            }
        }
        alert.evidence.distinctStudents = groupSize;
        alert.riskScore = alert.evidence.struggleEvents > 0
            ? riskSum / alert.evidence.struggleEvents : 0.0;
        alert.severity = severityForRisk(alert.riskScore, m_config);
        alert.specificConcerns = sortedConcerns(factorCounts);
        alert.recommendedActions = recommendedActionsFor(AlertType::ClassStruggle, factorCounts);
        alert.windowStartMs = windowStartMs;
        alert.windowEndMs = nowMs;
        candidates.push_back(alert);
    }

    result.coursesScanned = static_cast<int>(courses.size());

    // ── Phase 3: upsert ─────────────────────────────────────
    EngineStore::Connection conn = m_store.acquire();
    sqlite3* db = conn.db();
    ScopedQueryDeadline deadline(db, m_config.queryTimeoutMs);

    if (!sql::exec(db, "BEGIN IMMEDIATE")) {
        result.error = QString::fromUtf8(sqlite3_errmsg(db));
        return result;
    }

    const char* findSql = R"(
        SELECT id, created_at FROM instructor_alerts
        WHERE tenant_id = ?1 AND course_id = ?2 AND student_key = ?3 AND alert_type = ?4
          AND status IN ('new', 'acknowledged', 'in_progress')
    )";
    const char* updateSql = R"(
        UPDATE instructor_alerts
        SET instructor_id = ?1, severity = ?2, risk_score = ?3, evidence_json = ?4,
            concerns_json = ?5, actions_json = ?6, window_start = ?7, window_end = ?8,
            updated_at = ?9
        WHERE id = ?10
    )";
    const char* insertSql = R"(
        INSERT INTO instructor_alerts (tenant_id, course_id, instructor_id, student_id, student_key,
                                       alert_type, severity, risk_score, evidence_json,
                                       concerns_json, actions_json, status, window_start,
                                       window_end, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, 'new', ?12, ?13, ?14, ?14)
    )";
    const char* settingSql = R"(
        INSERT INTO settings (key, value) VALUES ('lastAlertScanAtMs', ?1)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";

    sqlite3_stmt* findStmt = nullptr;
    sqlite3_stmt* updateStmt = nullptr;
    sqlite3_stmt* insertStmt = nullptr;
    sqlite3_stmt* settingStmt = nullptr;
    bool ok = sqlite3_prepare_v2(db, findSql, -1, &findStmt, nullptr) == SQLITE_OK
        && sqlite3_prepare_v2(db, updateSql, -1, &updateStmt, nullptr) == SQLITE_OK
        && sqlite3_prepare_v2(db, insertSql, -1, &insertStmt, nullptr) == SQLITE_OK
        && sqlite3_prepare_v2(db, settingSql, -1, &settingStmt, nullptr) == SQLITE_OK;
    if (!ok) {
        result.error = QString::fromUtf8(sqlite3_errmsg(db));
        LOG_ERROR(lpAlerts, "Alert upsert prepare failed: %s", qUtf8Printable(result.error));
    }

    std::vector<InstructorAlert> created;
    for (InstructorAlert& alert : candidates) {
        if (!ok) {
            break;
        }
        const QByteArray evidence = compactJson(evidenceToJson(alert.evidence));
        const QByteArray concerns = compactJson(concernsToJson(alert.specificConcerns));
        const QByteArray actions = compactJson(QJsonArray::fromStringList(alert.recommendedActions));
        const QString severity = alertSeverityToString(alert.severity);

        sqlite3_reset(findStmt);
        sqlite3_clear_bindings(findStmt);
        sql::bindText(findStmt, 1, alert.tenantId);
        sql::bindText(findStmt, 2, alert.courseId);
        sql::bindText(findStmt, 3, alert.studentKey);
        sql::bindText(findStmt, 4, alertTypeToString(alert.alertType));
        const int findRc = sql::stepWithRetry(findStmt);

        if (findRc == SQLITE_ROW) {
            alert.id = sqlite3_column_int64(findStmt, 0);
            alert.createdAtMs = sqlite3_column_int64(findStmt, 1);
            alert.updatedAtMs = nowMs;

            sqlite3_reset(updateStmt);
            sqlite3_clear_bindings(updateStmt);
            sql::bindText(updateStmt, 1, alert.instructorId);
            sql::bindText(updateStmt, 2, severity);
            sqlite3_bind_double(updateStmt, 3, alert.riskScore);
            sqlite3_bind_text(updateStmt, 4, evidence.constData(), static_cast<int>(evidence.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(updateStmt, 5, concerns.constData(), static_cast<int>(concerns.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(updateStmt, 6, actions.constData(), static_cast<int>(actions.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(updateStmt, 7, alert.windowStartMs);
            sqlite3_bind_int64(updateStmt, 8, alert.windowEndMs);
            sqlite3_bind_int64(updateStmt, 9, nowMs);
            sqlite3_bind_int64(updateStmt, 10, alert.id);
            ok = sql::stepWithRetry(updateStmt) == SQLITE_DONE;
            if (ok) {
                ++result.alertsUpdated;
            }
        } else if (findRc == SQLITE_DONE) {
            alert.createdAtMs = nowMs;
            alert.updatedAtMs = nowMs;

            sqlite3_reset(insertStmt);
            sqlite3_clear_bindings(insertStmt);
            sql::bindText(insertStmt, 1, alert.tenantId);
            sql::bindText(insertStmt, 2, alert.courseId);
            sql::bindText(insertStmt, 3, alert.instructorId);
            sql::bindTextOrNull(insertStmt, 4, alert.studentId);
            sql::bindText(insertStmt, 5, alert.studentKey);
            sql::bindText(insertStmt, 6, alertTypeToString(alert.alertType));
            sql::bindText(insertStmt, 7, severity);
            sqlite3_bind_double(insertStmt, 8, alert.riskScore);
            sqlite3_bind_text(insertStmt, 9, evidence.constData(), static_cast<int>(evidence.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(insertStmt, 10, concerns.constData(), static_cast<int>(concerns.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(insertStmt, 11, actions.constData(), static_cast<int>(actions.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(insertStmt, 12, alert.windowStartMs);
            sqlite3_bind_int64(insertStmt, 13, alert.windowEndMs);
            sqlite3_bind_int64(insertStmt, 14, nowMs);
            ok = sql::stepWithRetry(insertStmt) == SQLITE_DONE;
            if (ok) {
                alert.id = sqlite3_last_insert_rowid(db);
                alert.status = AlertStatus::New;
                ++result.alertsCreated;
                created.push_back(alert);
            }
        } else {
            ok = false;
        }
    }

    if (ok) {
        sql::bindText(settingStmt, 1, QString::number(nowMs));
        ok = sql::stepWithRetry(settingStmt) == SQLITE_DONE;
    }

    sqlite3_finalize(findStmt);
    sqlite3_finalize(updateStmt);
    sqlite3_finalize(insertStmt);
    sqlite3_finalize(settingStmt);

    if (!ok || !sql::exec(db, "COMMIT")) {
        result.timedOut = deadline.expired();
        if (result.error.isEmpty()) {
            result.error = result.timedOut ? QStringLiteral("query timeout")
                                           : QString::fromUtf8(sqlite3_errmsg(db));
        }
        sql::exec(db, "ROLLBACK");
        LOG_ERROR(lpAlerts, "Alert upsert rolled back: %s", qUtf8Printable(result.error));
        result.alertsCreated = 0;
        result.alertsUpdated = 0;
        return result;
    }

    result.ok = true;
    result.created = std::move(created);
    LOG_INFO(lpAlerts, "Alert scan: %d courses, %d students, %d created, %d updated",
             result.coursesScanned, result.studentsEvaluated,
             result.alertsCreated, result.alertsUpdated);
    return result;
}

std::optional<AlertPage> AlertAggregator::listAlerts(const AlertFilter& filter, int offset, int limit)
{
    if (filter.tenantId.isEmpty()) {
        return std::nullopt;
    }

    AlertPage page;
    page.offset = std::max(0, offset);
    page.limit = limit <= 0 ? m_config.defaultPageSize : std::min(limit, m_config.maxPageSize);

    QString where = QStringLiteral("WHERE tenant_id = ?");
    QStringList params = {filter.tenantId};
    if (!filter.courseId.isEmpty()) {
        where += QStringLiteral(" AND course_id = ?");
        params.append(filter.courseId);
    }
    if (filter.severity.has_value()) {
        where += QStringLiteral(" AND severity = ?");
        params.append(alertSeverityToString(*filter.severity));
    }
    if (filter.status.has_value()) {
        where += QStringLiteral(" AND status = ?");
        params.append(alertStatusToString(*filter.status));
    }

    const QByteArray countSql = QStringLiteral("SELECT COUNT(*) FROM instructor_alerts %1")
                                    .arg(where).toUtf8();
    const QByteArray listSql = QStringLiteral(
        "SELECT %1 FROM instructor_alerts %2 ORDER BY updated_at DESC, id DESC LIMIT ? OFFSET ?")
        .arg(QString::fromLatin1(kAlertColumns), where).toUtf8();

    EngineStore::Connection conn = m_store.acquire();
    sqlite3* db = conn.db();
    ScopedQueryDeadline deadline(db, m_config.queryTimeoutMs);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, countSql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(lpAlerts, "listAlerts count prepare failed: %s", sqlite3_errmsg(db));
        return std::nullopt;
    }
    for (int i = 0; i < params.size(); ++i) {
        sql::bindText(stmt, i + 1, params.at(i));
    }
    if (sql::stepWithRetry(stmt) == SQLITE_ROW) {
        page.total = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    stmt = nullptr;
    if (sqlite3_prepare_v2(db, listSql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(lpAlerts, "listAlerts prepare failed: %s", sqlite3_errmsg(db));
        return std::nullopt;
    }
    int index = 1;
    for (const QString& param : params) {
        sql::bindText(stmt, index++, param);
    }
    sqlite3_bind_int(stmt, index++, page.limit);
    sqlite3_bind_int(stmt, index, page.offset);

    const bool ok = stepAll(stmt, [&page](sqlite3_stmt* row) {
        page.alerts.push_back(readAlert(row));
    });
    sqlite3_finalize(stmt);
    if (!ok) {
        LOG_WARN(lpAlerts, "listAlerts failed%s", deadline.expired() ? " (timeout)" : "");
        return std::nullopt;
    }
    return page;
}

std::optional<InstructorAlert> AlertAggregator::getAlert(const QString& tenantId, int64_t alertId)
{
    EngineStore::Connection conn = m_store.acquire();
    return readAlertById(conn.db(), tenantId, alertId);
}

AlertActionResult AlertAggregator::applyAction(const QString& tenantId, int64_t alertId,
                                               AlertAction action, const QString& actorId,
                                               const QString& note, int64_t nowMs)
{
    AlertActionResult result;
    EngineStore::Connection conn = m_store.acquire();
    sqlite3* db = conn.db();

    if (!sql::exec(db, "BEGIN IMMEDIATE")) {
        result.error = AlertActionError::StoreError;
        result.message = QString::fromUtf8(sqlite3_errmsg(db));
        return result;
    }

    std::optional<InstructorAlert> alert = readAlertById(db, tenantId, alertId);
    if (!alert.has_value()) {
        sql::exec(db, "ROLLBACK");
        result.error = AlertActionError::NotFound;
        result.message = QStringLiteral("alert %1 not found").arg(alertId);
        return result;
    }

    const std::optional<AlertStatus> next = alertTransition(alert->status, action);
    if (!next.has_value()) {
        sql::exec(db, "ROLLBACK");
        result.error = AlertActionError::InvalidTransition;
        result.message = QStringLiteral("cannot %1 an alert that is %2")
                             .arg(alertActionToString(action), alertStatusToString(alert->status));
        result.alert = *alert;
        return result;
    }

    const bool closes = !isOpenAlertStatus(*next);
    const char* updateSql = R"(
        UPDATE instructor_alerts
        SET status = ?1, updated_at = ?2, resolved_at = CASE WHEN ?3 THEN ?2 ELSE resolved_at END
        WHERE id = ?4
    )";
    const char* auditSql = R"(
        INSERT INTO alert_actions (alert_id, actor_id, action_taken, from_status, to_status, note, acted_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";

    bool ok = true;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, updateSql, -1, &stmt, nullptr) == SQLITE_OK) {
        sql::bindText(stmt, 1, alertStatusToString(*next));
        sqlite3_bind_int64(stmt, 2, nowMs);
        sqlite3_bind_int(stmt, 3, closes ? 1 : 0);
        sqlite3_bind_int64(stmt, 4, alertId);
        ok = sql::stepWithRetry(stmt) == SQLITE_DONE;
    } else {
        ok = false;
    }
    sqlite3_finalize(stmt);

    if (ok) {
        stmt = nullptr;
        if (sqlite3_prepare_v2(db, auditSql, -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, alertId);
            sql::bindText(stmt, 2, actorId);
            sql::bindText(stmt, 3, alertActionToString(action));
            sql::bindText(stmt, 4, alertStatusToString(alert->status));
            sql::bindText(stmt, 5, alertStatusToString(*next));
            sql::bindTextOrNull(stmt, 6, note);
            sqlite3_bind_int64(stmt, 7, nowMs);
            ok = sql::stepWithRetry(stmt) == SQLITE_DONE;
        } else {
            ok = false;
        }
        sqlite3_finalize(stmt);
    }

    if (!ok || !sql::exec(db, "COMMIT")) {
        result.error = AlertActionError::StoreError;
        result.message = QString::fromUtf8(sqlite3_errmsg(db));
        sql::exec(db, "ROLLBACK");
        LOG_ERROR(lpAlerts, "Alert action %s on %lld failed: %s",
                  qUtf8Printable(alertActionToString(action)),
                  static_cast<long long>(alertId), qUtf8Printable(result.message));
        return result;
    }

    LOG_INFO(lpAlerts, "Alert %lld %s -> %s by %s",
             static_cast<long long>(alertId),
             qUtf8Printable(alertStatusToString(alert->status)),
             qUtf8Printable(alertStatusToString(*next)),
             qUtf8Printable(actorId));

    alert->status = *next;
    alert->updatedAtMs = nowMs;
    result.ok = true;
    result.alert = *alert;
    return result;
}

} // namespace lp
