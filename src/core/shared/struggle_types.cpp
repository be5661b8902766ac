#include "core/shared/struggle_types.h"

#include <QJsonArray>

namespace lp {

bool ConsentScopes::grants(ConsentScope scope) const
{
    switch (scope) {
    case ConsentScope::BehavioralTiming:       return behavioralTiming;
    case ConsentScope::AssessmentPatterns:     return assessmentPatterns;
    case ConsentScope::ChatInteractions:       return chatInteractions;
    case ConsentScope::CrossCourseCorrelation: return crossCourseCorrelation;
    case ConsentScope::AnonymizedAnalytics:    return anonymizedAnalytics;
    }
    return false;
}

void ConsentScopes::set(ConsentScope scope, bool granted)
{
    switch (scope) {
    case ConsentScope::BehavioralTiming:       behavioralTiming = granted; break;
    case ConsentScope::AssessmentPatterns:     assessmentPatterns = granted; break;
    case ConsentScope::ChatInteractions:       chatInteractions = granted; break;
    case ConsentScope::CrossCourseCorrelation: crossCourseCorrelation = granted; break;
    case ConsentScope::AnonymizedAnalytics:    anonymizedAnalytics = granted; break;
    }
}

QJsonObject assessmentToJson(const StruggleAssessment& assessment)
{
    QJsonObject json;
    json[QStringLiteral("id")] = assessment.id;
    json[QStringLiteral("sessionId")] = assessment.sessionId;
    json[QStringLiteral("userId")] = assessment.userId;
    json[QStringLiteral("riskLevel")] = assessment.riskLevel;
    json[QStringLiteral("confidence")] = assessment.confidence;
    if (assessment.estimatedTimeToStruggleMinutes.has_value()) {
        json[QStringLiteral("estimatedTimeToStruggleMinutes")] =
            *assessment.estimatedTimeToStruggleMinutes;
    } else {
        json[QStringLiteral("estimatedTimeToStruggleMinutes")] = QJsonValue::Null;
    }
    json[QStringLiteral("contributingFactors")] =
        QJsonArray::fromStringList(assessment.contributingFactors);
    json[QStringLiteral("modelVersion")] = assessment.modelVersion;
    json[QStringLiteral("computedAt")] = static_cast<qint64>(assessment.computedAtMs);
    json[QStringLiteral("validUntil")] = static_cast<qint64>(assessment.validUntilMs);
    return json;
}

QJsonObject interventionToJson(const InterventionRecord& record)
{
    QJsonObject json;
    json[QStringLiteral("id")] = record.id;
    json[QStringLiteral("sessionId")] = record.sessionId;
    json[QStringLiteral("userId")] = record.userId;
    if (record.struggleAssessmentId.has_value()) {
        json[QStringLiteral("struggleAssessmentId")] = *record.struggleAssessmentId;
    }
    json[QStringLiteral("type")] = interventionTypeToString(record.type);
    json[QStringLiteral("urgency")] = urgencyToString(record.urgency);
    json[QStringLiteral("triggeredAt")] = static_cast<qint64>(record.triggeredAtMs);
    if (record.deliveredAtMs.has_value()) {
        json[QStringLiteral("deliveredAt")] = static_cast<qint64>(*record.deliveredAtMs);
    }
    json[QStringLiteral("userResponse")] = userResponseToString(record.userResponse);
    if (record.effectivenessScore.has_value()) {
        json[QStringLiteral("effectivenessScore")] = *record.effectivenessScore;
    }
    return json;
}

QJsonObject interventionCommandToJson(const InterventionCommand& command)
{
    QJsonObject json;
    json[QStringLiteral("interventionId")] = command.interventionId;
    json[QStringLiteral("sessionId")] = command.sessionId;
    json[QStringLiteral("userId")] = command.userId;
    json[QStringLiteral("type")] = interventionTypeToString(command.type);
    json[QStringLiteral("urgency")] = urgencyToString(command.urgency);
    json[QStringLiteral("suggestedMessageIntent")] = command.suggestedMessageIntent;
    return json;
}

QJsonObject instructorAlertToJson(const InstructorAlert& alert)
{
    QJsonObject evidence;
    evidence[QStringLiteral("struggleEvents")] = alert.evidence.struggleEvents;
    evidence[QStringLiteral("highRiskEvents")] = alert.evidence.highRiskEvents;
    evidence[QStringLiteral("deliveredInterventions")] = alert.evidence.deliveredInterventions;
    evidence[QStringLiteral("suppressedDecisions")] = alert.evidence.suppressedDecisions;
    evidence[QStringLiteral("negativeResponses")] = alert.evidence.negativeResponses;
    evidence[QStringLiteral("distinctStudents")] = alert.evidence.distinctStudents;

    QJsonArray concerns;
    for (const AlertConcern& concern : alert.specificConcerns) {
        QJsonObject entry;
        entry[QStringLiteral("code")] = concern.code;
        entry[QStringLiteral("count")] = concern.count;
        concerns.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(alert.id);
    json[QStringLiteral("courseId")] = alert.courseId;
    json[QStringLiteral("instructorId")] = alert.instructorId;
    if (alert.studentId.isEmpty()) {
        json[QStringLiteral("studentId")] = QJsonValue::Null;
    } else {
        json[QStringLiteral("studentId")] = alert.studentId;
    }
    json[QStringLiteral("alertType")] = alertTypeToString(alert.alertType);
    json[QStringLiteral("severity")] = alertSeverityToString(alert.severity);
    json[QStringLiteral("riskScore")] = alert.riskScore;
    json[QStringLiteral("evidenceCounts")] = evidence;
    json[QStringLiteral("specificConcerns")] = concerns;
    json[QStringLiteral("recommendedActions")] =
        QJsonArray::fromStringList(alert.recommendedActions);
    json[QStringLiteral("status")] = alertStatusToString(alert.status);
    json[QStringLiteral("windowStart")] = static_cast<qint64>(alert.windowStartMs);
    json[QStringLiteral("windowEnd")] = static_cast<qint64>(alert.windowEndMs);
    json[QStringLiteral("createdAt")] = static_cast<qint64>(alert.createdAtMs);
    json[QStringLiteral("updatedAt")] = static_cast<qint64>(alert.updatedAtMs);
    return json;
}

QJsonObject consentRecordToJson(const ConsentRecord& record)
{
    QJsonObject scopes;
    scopes[QStringLiteral("behavioralTiming")] = record.scopes.behavioralTiming;
    scopes[QStringLiteral("assessmentPatterns")] = record.scopes.assessmentPatterns;
    scopes[QStringLiteral("chatInteractions")] = record.scopes.chatInteractions;
    scopes[QStringLiteral("crossCourseCorrelation")] = record.scopes.crossCourseCorrelation;
    scopes[QStringLiteral("anonymizedAnalytics")] = record.scopes.anonymizedAnalytics;

    QJsonObject json;
    json[QStringLiteral("tenantId")] = record.tenantId;
    json[QStringLiteral("userId")] = record.userId;
    json[QStringLiteral("scopes")] = scopes;
    json[QStringLiteral("collectionLevel")] = collectionLevelToString(record.collectionLevel);
    json[QStringLiteral("withdrawnAt")] = record.withdrawnAtMs
        ? QJsonValue(static_cast<qint64>(*record.withdrawnAtMs)) : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("purgedAt")] = record.purgedAtMs
        ? QJsonValue(static_cast<qint64>(*record.purgedAtMs)) : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("updatedAt")] = static_cast<qint64>(record.updatedAtMs);
    return json;
}

QJsonObject operationalAlertToJson(const OperationalAlert& alert)
{
    QJsonObject json;
    json[QStringLiteral("component")] = alert.component;
    json[QStringLiteral("code")] = alert.code;
    json[QStringLiteral("message")] = alert.message;
    json[QStringLiteral("raisedAt")] = static_cast<qint64>(alert.raisedAtMs);
    return json;
}

} // namespace lp
