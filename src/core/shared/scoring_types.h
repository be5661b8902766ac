#pragma once

#include <QString>

#include <cstdint>

namespace lp {

// Tunable parameters of the heuristic struggle model.
struct StruggleModelConfig {
    QString modelVersion = QStringLiteral("heuristic-1.0");

    // Input weights
    double responseTimeVariabilityWeight = 0.15;
    double idleFrequencyWeight = 0.30;
    double helpRequestRateWeight = 0.15;
    double errorRateWeight = 0.25;
    double hoverDurationWeight = 0.15;
    double contentDifficultyWeight = 0.10;   // only applied with a PageContext

    // Normalization
    double idleSaturationCount = 4.0;
    double helpRateSaturation = 0.3;
    double hoverCriticalMs = 30000.0;
    double noiseFloor = 0.05;

    // Logistic calibration of the raw weighted sum
    double calibrationSteepness = 10.0;
    double calibrationMidpoint = 0.3;

    // Per-input thresholds for contributing factors
    double responseTimeVariabilityThreshold = 0.5;
    double idleFrequencyThreshold = 0.5;
    double helpRequestRateThreshold = 0.5;
    double errorRateThreshold = 0.3;
    double hoverDurationThreshold = 0.5;

    // Confidence and timing
    int confidenceSaturationSamples = 10;
    double timeEstimateConfidenceFloor = 0.5;
    double earlyWarningHorizonMinutes = 20.0;
    int64_t assessmentValidityMs = 300000;
};

} // namespace lp
