#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/struggle_types.h"

#include <QString>

#include <array>
#include <cstdint>
#include <optional>

namespace lp {

enum class StruggleFactor {
    ResponseTimeVariability,
    IdleFrequency,
    HelpRequestRate,
    ErrorRate,
    HoverDuration,
};

constexpr size_t kStruggleFactorCount = 5;

QString struggleFactorToString(StruggleFactor factor);
std::optional<StruggleFactor> struggleFactorFromString(const QString& str);

// Scorer inputs after normalization to [0,1], indexed by StruggleFactor.
using FactorInputs = std::array<double, kStruggleFactorCount>;

// StruggleScorer -- explainable weighted model over session features.
//
// Deterministic for a given config: the only time input is computedAtMs.
// The returned assessment carries no identity; the session fills it in.
class StruggleScorer {
public:
    explicit StruggleScorer(const StruggleModelConfig& config = {});

    // nullopt when a feature is not finite.
    std::optional<StruggleAssessment> score(const SessionFeatures& features,
                                            const std::optional<PageContext>& pageContext,
                                            int64_t computedAtMs) const;

    FactorInputs normalizedInputs(const SessionFeatures& features) const;

    double weightFor(StruggleFactor factor) const;
    double thresholdFor(StruggleFactor factor) const;

    // logistic(steepness * (raw - midpoint)), clamped to [0,1]
    double calibrate(double raw) const;

    const StruggleModelConfig& config() const { return m_config; }

private:
    StruggleModelConfig m_config;
};

} // namespace lp
