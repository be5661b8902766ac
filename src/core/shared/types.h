#pragma once

#include <QString>
#include <optional>

namespace lp {

// Behavioral signal kinds emitted by the LMS page instrumentation.
enum class SignalType {
    Hover,
    Scroll,
    Idle,
    Click,
    HelpRequest,
    QuizInteraction,
    PageLeave,
    FocusChange,
};

QString signalTypeToString(SignalType type);
std::optional<SignalType> signalTypeFromString(const QString& str);

// Graded outcome carried by quiz_interaction signals.
enum class SignalOutcome {
    None,
    Correct,
    Incorrect,
};

QString signalOutcomeToString(SignalOutcome outcome);
std::optional<SignalOutcome> signalOutcomeFromString(const QString& str);

enum class InterventionType {
    ProactiveChat,
    ContentSuggestion,
    BreakReminder,
    HelpOffer,
};

QString interventionTypeToString(InterventionType type);
std::optional<InterventionType> interventionTypeFromString(const QString& str);

// Intent handed to the authoring collaborator; never rendered prose.
QString messageIntentFor(InterventionType type);

enum class Urgency {
    Low,
    Medium,
    High,
};

QString urgencyToString(Urgency urgency);
std::optional<Urgency> urgencyFromString(const QString& str);

enum class UserResponse {
    None,
    Accepted,
    Dismissed,
    Ignored,
    Timeout,
};

QString userResponseToString(UserResponse response);
std::optional<UserResponse> userResponseFromString(const QString& str);

enum class AlertType {
    StruggleRisk,
    Disengagement,
    CognitiveOverload,
    AttentionIssues,
    ClassStruggle,
};

QString alertTypeToString(AlertType type);
std::optional<AlertType> alertTypeFromString(const QString& str);

enum class AlertSeverity {
    Low,
    Medium,
    High,
    Critical,
};

QString alertSeverityToString(AlertSeverity severity);
std::optional<AlertSeverity> alertSeverityFromString(const QString& str);
int alertSeverityRank(AlertSeverity severity);

enum class AlertStatus {
    New,
    Acknowledged,
    InProgress,
    Resolved,
    Dismissed,
};

QString alertStatusToString(AlertStatus status);
std::optional<AlertStatus> alertStatusFromString(const QString& str);
bool isOpenAlertStatus(AlertStatus status);

enum class ConsentScope {
    BehavioralTiming,
    AssessmentPatterns,
    ChatInteractions,
    CrossCourseCorrelation,
    AnonymizedAnalytics,
};

QString consentScopeToString(ConsentScope scope);
std::optional<ConsentScope> consentScopeFromString(const QString& str);

enum class CollectionLevel {
    Minimal,
    Standard,
    Comprehensive,
};

QString collectionLevelToString(CollectionLevel level);
std::optional<CollectionLevel> collectionLevelFromString(const QString& str);

// Why the decision engine declined to emit an intervention.
enum class SuppressionReason {
    BelowThreshold,
    LowConfidence,
    DailyCap,
    Cooldown,
    NoConsent,
    PersistFailed,
    BudgetExceeded,
};

QString suppressionReasonToString(SuppressionReason reason);
std::optional<SuppressionReason> suppressionReasonFromString(const QString& str);

} // namespace lp
