#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace lp {

// Canonical signal produced by the ingestor. Immutable once built.
struct BehavioralSignal {
    QString sessionId;
    QString userId;
    QString tenantId;
    QString courseId;
    SignalType type = SignalType::Hover;
    int64_t durationMs = 0;
    QString elementContext;
    QString pageContentHash;
    int64_t timestampMs = 0;
    QString nonce;
    QString origin;
    SignalOutcome outcome = SignalOutcome::None;
    int64_t receivedAtMs = 0;
};

// Aggregated behavioral features derived from a session's rolling window.
struct SessionFeatures {
    int sampleCount = 0;
    int64_t windowSpanMs = 0;
    double avgResponseTimeMs = 0.0;
    double responseTimeVariance = 0.0;
    double responseTimeVariability = 0.0;   // coefficient of variation, 0..1
    double helpRequestRate = 0.0;
    double errorRate = 0.0;
    int gradedInteractions = 0;
    int idlePeriodCount = 0;
    double avgHoverMs = 0.0;
    double taskSwitchFrequency = 0.0;       // per minute
    double attentionEstimate = 1.0;
    double fatigueEstimate = 0.0;
    double cognitiveLoadEstimate = 0.0;
    double featureStability = 1.0;
};

// Optional page-level context supplied by the content analysis collaborator.
struct PageContext {
    QString pageContentHash;
    double difficulty = 0.0;
};

struct StruggleAssessment {
    QString id;
    QString sessionId;
    QString userId;
    QString tenantId;
    QString courseId;
    double riskLevel = 0.0;
    double confidence = 0.0;
    std::optional<double> estimatedTimeToStruggleMinutes;
    QStringList contributingFactors;
    QString modelVersion;
    int64_t computedAtMs = 0;
    int64_t validUntilMs = 0;
};

struct InterventionRecord {
    QString id;
    QString sessionId;
    QString userId;
    QString tenantId;
    QString courseId;
    std::optional<QString> struggleAssessmentId;
    InterventionType type = InterventionType::ProactiveChat;
    Urgency urgency = Urgency::Low;
    double riskLevel = 0.0;
    QString messageIntent;
    int64_t triggeredAtMs = 0;
    std::optional<int64_t> deliveredAtMs;
    UserResponse userResponse = UserResponse::None;
    std::optional<int64_t> respondedAtMs;
    std::optional<double> effectivenessScore;
};

// Command handed to the chat delivery collaborator. Carries no prose.
struct InterventionCommand {
    QString interventionId;
    QString sessionId;
    QString userId;
    InterventionType type = InterventionType::ProactiveChat;
    Urgency urgency = Urgency::Low;
    QString suggestedMessageIntent;
};

// A declined decision, kept for the alert aggregator's evidence counts.
struct SuppressionRecord {
    QString tenantId;
    QString sessionId;
    QString userId;
    QString courseId;
    SuppressionReason reason = SuppressionReason::BelowThreshold;
    double riskLevel = 0.0;
    double confidence = 0.0;
    int64_t decidedAtMs = 0;
};

struct AlertEvidence {
    int struggleEvents = 0;
    int highRiskEvents = 0;
    int deliveredInterventions = 0;
    int suppressedDecisions = 0;
    int negativeResponses = 0;
    int distinctStudents = 0;
};

struct AlertConcern {
    QString code;
    int count = 0;
};

struct InstructorAlert {
    int64_t id = 0;
    QString tenantId;
    QString courseId;
    QString instructorId;
    QString studentId;      // empty for course-level aggregates
    QString studentKey;     // studentId, or "*" for course-level aggregates
    AlertType alertType = AlertType::StruggleRisk;
    AlertSeverity severity = AlertSeverity::Low;
    double riskScore = 0.0;
    AlertEvidence evidence;
    std::vector<AlertConcern> specificConcerns;
    QStringList recommendedActions;
    AlertStatus status = AlertStatus::New;
    int64_t windowStartMs = 0;
    int64_t windowEndMs = 0;
    int64_t createdAtMs = 0;
    int64_t updatedAtMs = 0;
};

struct ConsentScopes {
    bool behavioralTiming = false;
    bool assessmentPatterns = false;
    bool chatInteractions = false;
    bool crossCourseCorrelation = false;
    bool anonymizedAnalytics = false;

    bool grants(ConsentScope scope) const;
    void set(ConsentScope scope, bool granted);
};

struct ConsentRecord {
    QString tenantId;
    QString userId;
    ConsentScopes scopes;
    CollectionLevel collectionLevel = CollectionLevel::Minimal;
    std::optional<int64_t> withdrawnAtMs;
    std::optional<int64_t> purgedAtMs;
    int64_t updatedAtMs = 0;
};

// Systemic failure surfaced to operators instead of degrading silently.
struct OperationalAlert {
    QString component;
    QString code;
    QString message;
    int64_t raisedAtMs = 0;
};

QJsonObject assessmentToJson(const StruggleAssessment& assessment);
QJsonObject interventionToJson(const InterventionRecord& record);
QJsonObject interventionCommandToJson(const InterventionCommand& command);
QJsonObject instructorAlertToJson(const InstructorAlert& alert);
QJsonObject consentRecordToJson(const ConsentRecord& record);
QJsonObject operationalAlertToJson(const OperationalAlert& alert);

} // namespace lp
