#include "core/scoring/struggle_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace lp {

namespace {

constexpr std::array<StruggleFactor, kStruggleFactorCount> kAllFactors = {
    StruggleFactor::ResponseTimeVariability,
    StruggleFactor::IdleFrequency,
    StruggleFactor::HelpRequestRate,
    StruggleFactor::ErrorRate,
    StruggleFactor::HoverDuration,
};

double clamp01(double value)
{
    return std::clamp(value, 0.0, 1.0);
}

bool featuresFinite(const SessionFeatures& f)
{
    const double values[] = {
        f.avgResponseTimeMs, f.responseTimeVariance, f.responseTimeVariability,
        f.helpRequestRate, f.errorRate, f.avgHoverMs, f.taskSwitchFrequency,
        f.attentionEstimate, f.fatigueEstimate, f.cognitiveLoadEstimate, f.featureStability,
    };
    for (double v : values) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    return true;
}

} // namespace

QString struggleFactorToString(StruggleFactor factor)
{
    switch (factor) {
    case StruggleFactor::ResponseTimeVariability: return QStringLiteral("response_time_variability");
    case StruggleFactor::IdleFrequency:           return QStringLiteral("idle_frequency");
    case StruggleFactor::HelpRequestRate:         return QStringLiteral("help_request_rate");
    case StruggleFactor::ErrorRate:               return QStringLiteral("error_rate");
    case StruggleFactor::HoverDuration:           return QStringLiteral("hover_duration");
    }
    return QStringLiteral("error_rate");
}

std::optional<StruggleFactor> struggleFactorFromString(const QString& str)
{
    for (StruggleFactor factor : kAllFactors) {
        if (str == struggleFactorToString(factor)) {
            return factor;
        }
    }
    return std::nullopt;
}

StruggleScorer::StruggleScorer(const StruggleModelConfig& config)
    : m_config(config)
{
}

double StruggleScorer::weightFor(StruggleFactor factor) const
{
    switch (factor) {
    case StruggleFactor::ResponseTimeVariability: return m_config.responseTimeVariabilityWeight;
    case StruggleFactor::IdleFrequency:           return m_config.idleFrequencyWeight;
    case StruggleFactor::HelpRequestRate:         return m_config.helpRequestRateWeight;
    case StruggleFactor::ErrorRate:               return m_config.errorRateWeight;
    case StruggleFactor::HoverDuration:           return m_config.hoverDurationWeight;
    }
    return 0.0;
}

double StruggleScorer::thresholdFor(StruggleFactor factor) const
{
    switch (factor) {
    case StruggleFactor::ResponseTimeVariability: return m_config.responseTimeVariabilityThreshold;
    case StruggleFactor::IdleFrequency:           return m_config.idleFrequencyThreshold;
    case StruggleFactor::HelpRequestRate:         return m_config.helpRequestRateThreshold;
    case StruggleFactor::ErrorRate:               return m_config.errorRateThreshold;
    case StruggleFactor::HoverDuration:           return m_config.hoverDurationThreshold;
    }
    return 1.0;
}

FactorInputs StruggleScorer::normalizedInputs(const SessionFeatures& features) const
{
    FactorInputs inputs{};
    inputs[static_cast<size_t>(StruggleFactor::ResponseTimeVariability)] =
        clamp01(features.responseTimeVariability);
    inputs[static_cast<size_t>(StruggleFactor::IdleFrequency)] =
        m_config.idleSaturationCount > 0.0
            ? clamp01(features.idlePeriodCount / m_config.idleSaturationCount) : 0.0;
    inputs[static_cast<size_t>(StruggleFactor::HelpRequestRate)] =
        m_config.helpRateSaturation > 0.0
            ? clamp01(features.helpRequestRate / m_config.helpRateSaturation) : 0.0;
    inputs[static_cast<size_t>(StruggleFactor::ErrorRate)] = clamp01(features.errorRate);
    inputs[static_cast<size_t>(StruggleFactor::HoverDuration)] =
        m_config.hoverCriticalMs > 0.0
            ? clamp01(features.avgHoverMs / m_config.hoverCriticalMs) : 0.0;

    // Jitter below the floor is not evidence of anything.
    for (double& value : inputs) {
        if (value < m_config.noiseFloor) {
            value = 0.0;
        }
    }
    return inputs;
}

double StruggleScorer::calibrate(double raw) const
{
    const double z = m_config.calibrationSteepness * (raw - m_config.calibrationMidpoint);
    return clamp01(1.0 / (1.0 + std::exp(-z)));
}

std::optional<StruggleAssessment> StruggleScorer::score(
    const SessionFeatures& features,
    const std::optional<PageContext>& pageContext,
    int64_t computedAtMs) const
{
    if (!featuresFinite(features)) {
        LOG_WARN(lpScoring, "Refusing to score non-finite features (samples=%d)",
                 features.sampleCount);
        return std::nullopt;
    }

    const FactorInputs inputs = normalizedInputs(features);

    struct Contribution {
        QString name;
        double weighted = 0.0;
    };
    std::vector<Contribution> contributing;

    double raw = 0.0;
    for (StruggleFactor factor : kAllFactors) {
        const double value = inputs[static_cast<size_t>(factor)];
        const double weighted = value * weightFor(factor);
        raw += weighted;
        if (value > 0.0 && value >= thresholdFor(factor)) {
            contributing.push_back({struggleFactorToString(factor), weighted});
        }
    }
    if (pageContext.has_value() && std::isfinite(pageContext->difficulty)) {
        raw += clamp01(pageContext->difficulty) * m_config.contentDifficultyWeight;
    }

    std::sort(contributing.begin(), contributing.end(),
              [](const Contribution& a, const Contribution& b) {
                  if (a.weighted != b.weighted) {
                      return a.weighted > b.weighted;
                  }
                  return a.name < b.name;
              });

    StruggleAssessment assessment;
    assessment.riskLevel = calibrate(raw);

    const double sampleFactor = m_config.confidenceSaturationSamples > 0
        ? std::min(1.0, static_cast<double>(features.sampleCount)
                            / m_config.confidenceSaturationSamples)
        : 1.0;
    assessment.confidence = clamp01(0.6 * sampleFactor + 0.4 * clamp01(features.featureStability));

    if (assessment.confidence >= m_config.timeEstimateConfidenceFloor) {
        assessment.estimatedTimeToStruggleMinutes =
            m_config.earlyWarningHorizonMinutes * (1.0 - assessment.riskLevel);
    }

    for (const Contribution& c : contributing) {
        assessment.contributingFactors.append(c.name);
    }
    assessment.modelVersion = m_config.modelVersion;
    assessment.computedAtMs = computedAtMs;
    assessment.validUntilMs = computedAtMs + m_config.assessmentValidityMs;

    LOG_DEBUG(lpScoring, "raw=%.4f risk=%.4f confidence=%.4f factors=%s",
              raw, assessment.riskLevel, assessment.confidence,
              qUtf8Printable(assessment.contributingFactors.join(QLatin1Char(','))));
    return assessment;
}

} // namespace lp
