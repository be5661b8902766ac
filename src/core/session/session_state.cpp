#include "core/session/session_state.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace lp {

namespace {

constexpr double kMsPerMinute = 60000.0;
// Task switches per minute treated as fully scattered attention.
constexpr double kTaskSwitchSaturation = 3.0;

double clamp01(double value)
{
    return std::clamp(value, 0.0, 1.0);
}

bool allFinite(const SessionFeatures& f)
{
    return std::isfinite(f.avgResponseTimeMs) && std::isfinite(f.responseTimeVariance)
        && std::isfinite(f.responseTimeVariability) && std::isfinite(f.helpRequestRate)
        && std::isfinite(f.errorRate) && std::isfinite(f.avgHoverMs)
        && std::isfinite(f.taskSwitchFrequency) && std::isfinite(f.attentionEstimate)
        && std::isfinite(f.fatigueEstimate) && std::isfinite(f.cognitiveLoadEstimate)
        && std::isfinite(f.featureStability);
}

} // namespace

SessionState::SessionState(const QString& sessionId, const QString& tenantId,
                           const QString& userId, const QString& courseId,
                           const SessionConfig& config, const StruggleScorer& scorer)
    : m_sessionId(sessionId)
    , m_tenantId(tenantId)
    , m_userId(userId)
    , m_courseId(courseId)
    , m_config(config)
    , m_scorer(scorer)
{
}

void SessionState::trimWindow()
{
    while (static_cast<int>(m_window.size()) > m_config.windowMaxSignals) {
        m_window.pop_front();
    }

    int64_t newest = 0;
    for (const BehavioralSignal& s : m_window) {
        newest = std::max(newest, s.timestampMs);
    }
    const int64_t cutoff = newest - static_cast<int64_t>(m_config.windowMinutes) * 60000;
    m_window.erase(std::remove_if(m_window.begin(), m_window.end(),
                                  [cutoff](const BehavioralSignal& s) {
                                      return s.timestampMs < cutoff;
                                  }),
                   m_window.end());
}

bool SessionState::apply(const BehavioralSignal& signal)
{
    if (m_totalSignals == 0) {
        m_openedAtMs = signal.receivedAtMs > 0 ? signal.receivedAtMs : signal.timestampMs;
    }
    ++m_totalSignals;
    m_lastSignalAtMs = signal.receivedAtMs > 0 ? signal.receivedAtMs : signal.timestampMs;
    if (!signal.pageContentHash.isEmpty()) {
        m_lastPageContentHash = signal.pageContentHash;
    }
    if (m_courseId.isEmpty() && !signal.courseId.isEmpty()) {
        m_courseId = signal.courseId;
    }

    m_window.push_back(signal);
    trimWindow();

    std::optional<SessionFeatures> computed;
    try {
        computed = m_featureFn ? m_featureFn(m_window, m_lastInputs)
                               : computeFeatures(m_window, m_config, m_scorer, m_lastInputs);
    } catch (const std::exception& e) {
        ++m_modelErrors;
        LOG_ERROR(lpSession, "Feature recomputation threw for session %s: %s",
                  qUtf8Printable(m_sessionId), e.what());
        return false;
    }

    if (!computed.has_value() || !allFinite(*computed)) {
        ++m_modelErrors;
        LOG_WARN(lpSession, "Non-finite features for session %s, keeping previous snapshot",
                 qUtf8Printable(m_sessionId));
        return false;
    }

    m_features = *computed;
    m_lastInputs = m_scorer.normalizedInputs(m_features);
    return true;
}

void SessionState::setFeatureFunction(FeatureFn fn)
{
    m_featureFn = std::move(fn);
}

bool SessionState::readyForScoring() const
{
    return m_features.sampleCount >= m_config.minSamplesForScoring
        || (m_features.sampleCount > 0
            && m_features.windowSpanMs >= m_config.minElapsedForScoringMs);
}

std::optional<SessionFeatures> SessionState::computeFeatures(
    const std::deque<BehavioralSignal>& window,
    const SessionConfig& config,
    const StruggleScorer& scorer,
    const std::optional<FactorInputs>& previousInputs)
{
    SessionFeatures f;
    f.sampleCount = static_cast<int>(window.size());
    if (window.empty()) {
        return f;
    }

    int64_t oldest = window.front().timestampMs;
    int64_t newest = window.front().timestampMs;
    double responseSum = 0.0;
    int responseCount = 0;
    int helpRequests = 0;
    int incorrect = 0;
    double hoverSum = 0.0;
    int hoverCount = 0;
    int taskSwitches = 0;

    for (const BehavioralSignal& s : window) {
        oldest = std::min(oldest, s.timestampMs);
        newest = std::max(newest, s.timestampMs);

        switch (s.type) {
        case SignalType::Click:
            responseSum += static_cast<double>(s.durationMs);
            ++responseCount;
            break;
        case SignalType::QuizInteraction:
            responseSum += static_cast<double>(s.durationMs);
            ++responseCount;
            if (s.outcome != SignalOutcome::None) {
                ++f.gradedInteractions;
                if (s.outcome == SignalOutcome::Incorrect) {
                    ++incorrect;
                }
            }
            break;
        case SignalType::HelpRequest:
            ++helpRequests;
            break;
        case SignalType::Idle:
            if (s.durationMs >= config.idlePeriodThresholdMs) {
                ++f.idlePeriodCount;
            }
            break;
        case SignalType::Hover:
            hoverSum += static_cast<double>(s.durationMs);
            ++hoverCount;
            break;
        case SignalType::FocusChange:
        case SignalType::PageLeave:
            ++taskSwitches;
            break;
        case SignalType::Scroll:
            break;
        }
    }

    f.windowSpanMs = newest - oldest;

    if (responseCount > 0) {
        f.avgResponseTimeMs = responseSum / responseCount;
        double squares = 0.0;
        for (const BehavioralSignal& s : window) {
            if (s.type == SignalType::Click || s.type == SignalType::QuizInteraction) {
                const double delta = static_cast<double>(s.durationMs) - f.avgResponseTimeMs;
                squares += delta * delta;
            }
        }
        f.responseTimeVariance = squares / responseCount;
        if (responseCount > 1 && f.avgResponseTimeMs > 0.0) {
            f.responseTimeVariability =
                clamp01(std::sqrt(f.responseTimeVariance) / f.avgResponseTimeMs);
        }
    }

    f.helpRequestRate = static_cast<double>(helpRequests) / f.sampleCount;
    f.errorRate = f.gradedInteractions > 0
        ? static_cast<double>(incorrect) / f.gradedInteractions : 0.0;
    f.avgHoverMs = hoverCount > 0 ? hoverSum / hoverCount : 0.0;

    const double spanMinutes = std::max(1.0, f.windowSpanMs / kMsPerMinute);
    f.taskSwitchFrequency = taskSwitches / spanMinutes;

    const FactorInputs inputs = scorer.normalizedInputs(f);
    const double idleInput = inputs[static_cast<size_t>(StruggleFactor::IdleFrequency)];
    const double helpInput = inputs[static_cast<size_t>(StruggleFactor::HelpRequestRate)];
    const double variabilityInput =
        inputs[static_cast<size_t>(StruggleFactor::ResponseTimeVariability)];
    const double switchInput = clamp01(f.taskSwitchFrequency / kTaskSwitchSaturation);
    const double windowMs = std::max(1.0, config.windowMinutes * kMsPerMinute);

    f.attentionEstimate = clamp01(1.0 - 0.6 * idleInput - 0.4 * switchInput);
    f.fatigueEstimate = clamp01(0.5 * idleInput + 0.5 * clamp01(f.windowSpanMs / windowMs));
    f.cognitiveLoadEstimate = clamp01(0.4 * f.errorRate + 0.3 * helpInput + 0.3 * variabilityInput);

    if (previousInputs.has_value()) {
        double drift = 0.0;
        for (size_t i = 0; i < kStruggleFactorCount; ++i) {
            drift += std::abs(inputs[i] - (*previousInputs)[i]);
        }
        f.featureStability = clamp01(1.0 - drift / kStruggleFactorCount);
    }

    if (!allFinite(f)) {
        return std::nullopt;
    }
    return f;
}

} // namespace lp
