#include "core/shared/types.h"

namespace lp {

QString signalTypeToString(SignalType type)
{
    switch (type) {
    case SignalType::Hover:           return QStringLiteral("hover");
    case SignalType::Scroll:          return QStringLiteral("scroll");
    case SignalType::Idle:            return QStringLiteral("idle");
    case SignalType::Click:           return QStringLiteral("click");
    case SignalType::HelpRequest:     return QStringLiteral("help_request");
    case SignalType::QuizInteraction: return QStringLiteral("quiz_interaction");
    case SignalType::PageLeave:       return QStringLiteral("page_leave");
    case SignalType::FocusChange:     return QStringLiteral("focus_change");
    }
    return QStringLiteral("hover");
}

std::optional<SignalType> signalTypeFromString(const QString& str)
{
    if (str == QLatin1String("hover"))            return SignalType::Hover;
    if (str == QLatin1String("scroll"))           return SignalType::Scroll;
    if (str == QLatin1String("idle"))             return SignalType::Idle;
    if (str == QLatin1String("click"))            return SignalType::Click;
    if (str == QLatin1String("help_request"))     return SignalType::HelpRequest;
    if (str == QLatin1String("quiz_interaction")) return SignalType::QuizInteraction;
    if (str == QLatin1String("page_leave"))       return SignalType::PageLeave;
    if (str == QLatin1String("focus_change"))     return SignalType::FocusChange;
    return std::nullopt;
}

QString signalOutcomeToString(SignalOutcome outcome)
{
    switch (outcome) {
    case SignalOutcome::None:      return QStringLiteral("none");
    case SignalOutcome::Correct:   return QStringLiteral("correct");
    case SignalOutcome::Incorrect: return QStringLiteral("incorrect");
    }
    return QStringLiteral("none");
}

std::optional<SignalOutcome> signalOutcomeFromString(const QString& str)
{
    if (str.isEmpty() || str == QLatin1String("none")) return SignalOutcome::None;
    if (str == QLatin1String("correct"))               return SignalOutcome::Correct;
    if (str == QLatin1String("incorrect"))             return SignalOutcome::Incorrect;
    return std::nullopt;
}

QString interventionTypeToString(InterventionType type)
{
    switch (type) {
    case InterventionType::ProactiveChat:     return QStringLiteral("proactive_chat");
    case InterventionType::ContentSuggestion: return QStringLiteral("content_suggestion");
    case InterventionType::BreakReminder:     return QStringLiteral("break_reminder");
    case InterventionType::HelpOffer:         return QStringLiteral("help_offer");
    }
    return QStringLiteral("proactive_chat");
}

std::optional<InterventionType> interventionTypeFromString(const QString& str)
{
    if (str == QLatin1String("proactive_chat"))     return InterventionType::ProactiveChat;
    if (str == QLatin1String("content_suggestion")) return InterventionType::ContentSuggestion;
    if (str == QLatin1String("break_reminder"))     return InterventionType::BreakReminder;
    if (str == QLatin1String("help_offer"))         return InterventionType::HelpOffer;
    return std::nullopt;
}

QString messageIntentFor(InterventionType type)
{
    switch (type) {
    case InterventionType::ProactiveChat:     return QStringLiteral("check_in_on_progress");
    case InterventionType::ContentSuggestion: return QStringLiteral("suggest_related_content");
    case InterventionType::BreakReminder:     return QStringLiteral("suggest_short_break");
    case InterventionType::HelpOffer:         return QStringLiteral("offer_help");
    }
    return QStringLiteral("check_in_on_progress");
}

QString urgencyToString(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low:    return QStringLiteral("low");
    case Urgency::Medium: return QStringLiteral("medium");
    case Urgency::High:   return QStringLiteral("high");
    }
    return QStringLiteral("low");
}

std::optional<Urgency> urgencyFromString(const QString& str)
{
    if (str == QLatin1String("low"))    return Urgency::Low;
    if (str == QLatin1String("medium")) return Urgency::Medium;
    if (str == QLatin1String("high"))   return Urgency::High;
    return std::nullopt;
}

QString userResponseToString(UserResponse response)
{
    switch (response) {
    case UserResponse::None:      return QStringLiteral("none");
    case UserResponse::Accepted:  return QStringLiteral("accepted");
    case UserResponse::Dismissed: return QStringLiteral("dismissed");
    case UserResponse::Ignored:   return QStringLiteral("ignored");
    case UserResponse::Timeout:   return QStringLiteral("timeout");
    }
    return QStringLiteral("none");
}

std::optional<UserResponse> userResponseFromString(const QString& str)
{
    if (str.isEmpty() || str == QLatin1String("none")) return UserResponse::None;
    if (str == QLatin1String("accepted"))              return UserResponse::Accepted;
    if (str == QLatin1String("dismissed"))             return UserResponse::Dismissed;
    if (str == QLatin1String("ignored"))               return UserResponse::Ignored;
    if (str == QLatin1String("timeout"))               return UserResponse::Timeout;
    return std::nullopt;
}

QString alertTypeToString(AlertType type)
{
    switch (type) {
    case AlertType::StruggleRisk:      return QStringLiteral("struggle_risk");
    case AlertType::Disengagement:     return QStringLiteral("disengagement");
    case AlertType::CognitiveOverload: return QStringLiteral("cognitive_overload");
    case AlertType::AttentionIssues:   return QStringLiteral("attention_issues");
    case AlertType::ClassStruggle:     return QStringLiteral("class_struggle");
    }
    return QStringLiteral("struggle_risk");
}

std::optional<AlertType> alertTypeFromString(const QString& str)
{
    if (str == QLatin1String("struggle_risk"))      return AlertType::StruggleRisk;
    if (str == QLatin1String("disengagement"))      return AlertType::Disengagement;
    if (str == QLatin1String("cognitive_overload")) return AlertType::CognitiveOverload;
    if (str == QLatin1String("attention_issues"))   return AlertType::AttentionIssues;
    if (str == QLatin1String("class_struggle"))     return AlertType::ClassStruggle;
    return std::nullopt;
}

QString alertSeverityToString(AlertSeverity severity)
{
    switch (severity) {
    case AlertSeverity::Low:      return QStringLiteral("low");
    case AlertSeverity::Medium:   return QStringLiteral("medium");
    case AlertSeverity::High:     return QStringLiteral("high");
    case AlertSeverity::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("low");
}

std::optional<AlertSeverity> alertSeverityFromString(const QString& str)
{
    if (str == QLatin1String("low"))      return AlertSeverity::Low;
    if (str == QLatin1String("medium"))   return AlertSeverity::Medium;
    if (str == QLatin1String("high"))     return AlertSeverity::High;
    if (str == QLatin1String("critical")) return AlertSeverity::Critical;
    return std::nullopt;
}

int alertSeverityRank(AlertSeverity severity)
{
    switch (severity) {
    case AlertSeverity::Low:      return 0;
    case AlertSeverity::Medium:   return 1;
    case AlertSeverity::High:     return 2;
    case AlertSeverity::Critical: return 3;
    }
    return 0;
}

QString alertStatusToString(AlertStatus status)
{
    switch (status) {
    case AlertStatus::New:          return QStringLiteral("new");
    case AlertStatus::Acknowledged: return QStringLiteral("acknowledged");
    case AlertStatus::InProgress:   return QStringLiteral("in_progress");
    case AlertStatus::Resolved:     return QStringLiteral("resolved");
    case AlertStatus::Dismissed:    return QStringLiteral("dismissed");
    }
    return QStringLiteral("new");
}

std::optional<AlertStatus> alertStatusFromString(const QString& str)
{
    if (str == QLatin1String("new"))          return AlertStatus::New;
    if (str == QLatin1String("acknowledged")) return AlertStatus::Acknowledged;
    if (str == QLatin1String("in_progress"))  return AlertStatus::InProgress;
    if (str == QLatin1String("resolved"))     return AlertStatus::Resolved;
    if (str == QLatin1String("dismissed"))    return AlertStatus::Dismissed;
    return std::nullopt;
}

bool isOpenAlertStatus(AlertStatus status)
{
    return status == AlertStatus::New
        || status == AlertStatus::Acknowledged
        || status == AlertStatus::InProgress;
}

QString consentScopeToString(ConsentScope scope)
{
    switch (scope) {
    case ConsentScope::BehavioralTiming:       return QStringLiteral("behavioral_timing");
    case ConsentScope::AssessmentPatterns:     return QStringLiteral("assessment_patterns");
    case ConsentScope::ChatInteractions:       return QStringLiteral("chat_interactions");
    case ConsentScope::CrossCourseCorrelation: return QStringLiteral("cross_course_correlation");
    case ConsentScope::AnonymizedAnalytics:    return QStringLiteral("anonymized_analytics");
    }
    return QStringLiteral("behavioral_timing");
}

std::optional<ConsentScope> consentScopeFromString(const QString& str)
{
    if (str == QLatin1String("behavioral_timing"))        return ConsentScope::BehavioralTiming;
    if (str == QLatin1String("assessment_patterns"))      return ConsentScope::AssessmentPatterns;
    if (str == QLatin1String("chat_interactions"))        return ConsentScope::ChatInteractions;
    if (str == QLatin1String("cross_course_correlation")) return ConsentScope::CrossCourseCorrelation;
    if (str == QLatin1String("anonymized_analytics"))     return ConsentScope::AnonymizedAnalytics;
    return std::nullopt;
}

QString collectionLevelToString(CollectionLevel level)
{
    switch (level) {
    case CollectionLevel::Minimal:       return QStringLiteral("minimal");
    case CollectionLevel::Standard:      return QStringLiteral("standard");
    case CollectionLevel::Comprehensive: return QStringLiteral("comprehensive");
    }
    return QStringLiteral("minimal");
}

std::optional<CollectionLevel> collectionLevelFromString(const QString& str)
{
    if (str == QLatin1String("minimal"))       return CollectionLevel::Minimal;
    if (str == QLatin1String("standard"))      return CollectionLevel::Standard;
    if (str == QLatin1String("comprehensive")) return CollectionLevel::Comprehensive;
    return std::nullopt;
}

QString suppressionReasonToString(SuppressionReason reason)
{
    switch (reason) {
    case SuppressionReason::BelowThreshold: return QStringLiteral("below_threshold");
    case SuppressionReason::LowConfidence:  return QStringLiteral("low_confidence");
    case SuppressionReason::DailyCap:       return QStringLiteral("daily_cap");
    case SuppressionReason::Cooldown:       return QStringLiteral("cooldown");
    case SuppressionReason::NoConsent:      return QStringLiteral("no_consent");
    case SuppressionReason::PersistFailed:  return QStringLiteral("persist_failed");
    case SuppressionReason::BudgetExceeded: return QStringLiteral("budget_exceeded");
    }
    return QStringLiteral("below_threshold");
}

std::optional<SuppressionReason> suppressionReasonFromString(const QString& str)
{
    if (str == QLatin1String("below_threshold")) return SuppressionReason::BelowThreshold;
    if (str == QLatin1String("low_confidence"))  return SuppressionReason::LowConfidence;
    if (str == QLatin1String("daily_cap"))       return SuppressionReason::DailyCap;
    if (str == QLatin1String("cooldown"))        return SuppressionReason::Cooldown;
    if (str == QLatin1String("no_consent"))      return SuppressionReason::NoConsent;
    if (str == QLatin1String("persist_failed"))  return SuppressionReason::PersistFailed;
    if (str == QLatin1String("budget_exceeded")) return SuppressionReason::BudgetExceeded;
    return std::nullopt;
}

} // namespace lp
