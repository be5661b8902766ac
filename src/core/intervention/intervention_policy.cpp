#include "core/intervention/intervention_policy.h"
#include "core/consent/consent_gate.h"
#include "core/shared/logging.h"

#include <QUuid>

#include <algorithm>

namespace lp {

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

std::optional<InterventionType> typeForFactor(const QString& factor)
{
    if (factor == QLatin1String("idle_frequency")) {
        return InterventionType::BreakReminder;
    }
    if (factor == QLatin1String("response_time_variability")
        || factor == QLatin1String("hover_duration")) {
        return InterventionType::ContentSuggestion;
    }
    if (factor == QLatin1String("help_request_rate")) {
        return InterventionType::HelpOffer;
    }
    if (factor == QLatin1String("error_rate")) {
        return InterventionType::ProactiveChat;
    }
    return std::nullopt;
}

} // namespace

InterventionPolicy::InterventionPolicy(const InterventionPolicyConfig& config,
                                       ConsentGate& consentGate,
                                       PersistFn persist)
    : m_config(config)
    , m_consentGate(consentGate)
    , m_persist(std::move(persist))
{
}

void InterventionPolicy::setHistoryLoader(HistoryFn loader)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history = std::move(loader);
}

std::vector<InterventionType> InterventionPolicy::candidateTypes(const QStringList& contributingFactors)
{
    std::vector<InterventionType> candidates;
    auto add = [&candidates](InterventionType type) {
        if (std::find(candidates.begin(), candidates.end(), type) == candidates.end()) {
            candidates.push_back(type);
        }
    };
    for (const QString& factor : contributingFactors) {
        if (const std::optional<InterventionType> type = typeForFactor(factor)) {
            add(*type);
        }
    }
    add(InterventionType::ProactiveChat);
    return candidates;
}

Urgency InterventionPolicy::urgencyFor(double riskLevel, const InterventionPolicyConfig& config)
{
    if (riskLevel >= config.highUrgencyRisk) {
        return Urgency::High;
    }
    if (riskLevel >= config.mediumUrgencyRisk) {
        return Urgency::Medium;
    }
    return Urgency::Low;
}

std::shared_ptr<InterventionPolicy::UserState> InterventionPolicy::userState(
    const QString& tenantId, const QString& userId)
{
    const QString key = tenantId + QLatin1Char('\x1f') + userId;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_users.find(key);
    if (it == m_users.end()) {
        it = m_users.insert(key, std::make_shared<UserState>());
    }
    return it.value();
}

void InterventionPolicy::hydrate(UserState& state, const QString& tenantId,
                                 const QString& userId, int64_t nowMs)
{
    state.hydrated = true;
    HistoryFn loader;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        loader = m_history;
    }
    if (!loader) {
        return;
    }

    const std::vector<InterventionRecord> history = loader(tenantId, userId, nowMs - kDayMs);
    for (const InterventionRecord& record : history) {
        state.triggeredAt.push_back(record.triggeredAtMs);
        const int typeKey = static_cast<int>(record.type);
        const int64_t previous = state.lastTriggeredByType.value(typeKey, 0);
        state.lastTriggeredByType.insert(typeKey, std::max(previous, record.triggeredAtMs));
    }
    std::sort(state.triggeredAt.begin(), state.triggeredAt.end());
}

void InterventionPolicy::pruneDay(UserState& state, int64_t nowMs) const
{
    while (!state.triggeredAt.empty() && nowMs - state.triggeredAt.front() >= kDayMs) {
        state.triggeredAt.pop_front();
    }
}

bool InterventionPolicy::inCooldown(const UserState& state, InterventionType type, int64_t nowMs) const
{
    auto it = state.lastTriggeredByType.constFind(static_cast<int>(type));
    if (it == state.lastTriggeredByType.constEnd()) {
        return false;
    }
    const int64_t cooldownMs = static_cast<int64_t>(m_config.cooldownMinutes) * 60000;
    return nowMs - it.value() < cooldownMs;
}

InterventionDecision InterventionPolicy::suppress(SuppressionReason reason,
                                                  const StruggleAssessment& assessment)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_suppressed;
        if (reason == SuppressionReason::PersistFailed) {
            ++m_persistFailures;
        }
    }
    LOG_INFO(lpIntervention, "Suppressed session=%s reason=%s risk=%.3f confidence=%.3f",
             qUtf8Printable(assessment.sessionId),
             qUtf8Printable(suppressionReasonToString(reason)),
             assessment.riskLevel, assessment.confidence);

    InterventionDecision decision;
    decision.suppression = reason;
    return decision;
}

InterventionDecision InterventionPolicy::decide(const StruggleAssessment& assessment, int64_t nowMs)
{
    if (assessment.riskLevel < m_config.deliveryRiskThreshold) {
        return suppress(SuppressionReason::BelowThreshold, assessment);
    }
    if (assessment.confidence < m_config.deliveryConfidenceThreshold) {
        return suppress(SuppressionReason::LowConfidence, assessment);
    }

    const ConsentDecision consent = m_consentGate.check(
        assessment.tenantId, assessment.userId, ConsentScope::ChatInteractions, nowMs);
    if (!consent.allowed) {
        return suppress(SuppressionReason::NoConsent, assessment);
    }

    std::shared_ptr<UserState> state = userState(assessment.tenantId, assessment.userId);
    std::lock_guard<std::mutex> userLock(state->mutex);

    if (!state->hydrated) {
        hydrate(*state, assessment.tenantId, assessment.userId, nowMs);
    }
    pruneDay(*state, nowMs);

    if (static_cast<int>(state->triggeredAt.size()) >= m_config.dailyCap) {
        return suppress(SuppressionReason::DailyCap, assessment);
    }

    std::optional<InterventionType> chosen;
    for (InterventionType type : candidateTypes(assessment.contributingFactors)) {
        if (!inCooldown(*state, type, nowMs)) {
            chosen = type;
            break;
        }
    }
    if (!chosen.has_value()) {
        return suppress(SuppressionReason::Cooldown, assessment);
    }

    InterventionRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.sessionId = assessment.sessionId;
    record.userId = assessment.userId;
    record.tenantId = assessment.tenantId;
    record.courseId = assessment.courseId;
    if (!assessment.id.isEmpty()) {
        record.struggleAssessmentId = assessment.id;
    }
    record.type = *chosen;
    record.urgency = urgencyFor(assessment.riskLevel, m_config);
    record.riskLevel = assessment.riskLevel;
    record.messageIntent = messageIntentFor(*chosen);
    record.triggeredAtMs = nowMs;

    if (!m_persist || !m_persist(record)) {
        LOG_ERROR(lpIntervention, "Intervention insert failed for session %s; not delivering",
                  qUtf8Printable(assessment.sessionId));
        return suppress(SuppressionReason::PersistFailed, assessment);
    }

    state->triggeredAt.push_back(nowMs);
    state->lastTriggeredByType.insert(static_cast<int>(*chosen), nowMs);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_triggered;
    }
    LOG_INFO(lpIntervention, "Triggered %s (%s) for session=%s risk=%.3f",
             qUtf8Printable(interventionTypeToString(record.type)),
             qUtf8Printable(urgencyToString(record.urgency)),
             qUtf8Printable(record.sessionId), record.riskLevel);

    InterventionDecision decision;
    decision.triggered = true;
    decision.record = record;
    decision.command.interventionId = record.id;
    decision.command.sessionId = record.sessionId;
    decision.command.userId = record.userId;
    decision.command.type = record.type;
    decision.command.urgency = record.urgency;
    decision.command.suggestedMessageIntent = record.messageIntent;
    return decision;
}

void InterventionPolicy::forgetUser(const QString& tenantId, const QString& userId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_users.remove(tenantId + QLatin1Char('\x1f') + userId);
}

InterventionPolicyStats InterventionPolicy::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    InterventionPolicyStats out;
    out.triggered = m_triggered;
    out.suppressed = m_suppressed;
    out.persistFailures = m_persistFailures;
    out.trackedUsers = static_cast<size_t>(m_users.size());
    return out;
}

} // namespace lp
