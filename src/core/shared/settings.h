#pragma once

#include "core/shared/scoring_types.h"

#include <QString>
#include <QStringList>
#include <cstdint>

namespace lp {

struct IngestConfig {
    QStringList allowedOrigins;
    QStringList allowedOriginPatterns = {
        QStringLiteral("^https://[\\w.-]+\\.instructure\\.com$"),
        QStringLiteral("^https://[\\w.-]+\\.canvaslms\\.com$"),
    };
    QStringList hmacSecrets;
    int64_t maxSignalDurationMs = 300000;
    int64_t maxSignalAgeMs = 300000;
    int64_t maxClockSkewMs = 60000;
    int noncesPerSession = 256;
    int maxTrackedSessions = 20000;
    int maxSignalsPerMinute = 60;
    int maxIdLength = 128;
    int maxElementContextLength = 512;
};

struct ConsentConfig {
    int64_t cacheTtlMs = 60000;
    int consentFailureEscalationCount = 3;
};

struct SessionConfig {
    int maxActiveSessions = 5000;
    int idleTimeoutMinutes = 30;
    int windowMaxSignals = 50;
    int windowMinutes = 30;
    int minSamplesForScoring = 3;
    int64_t minElapsedForScoringMs = 60000;
    int64_t idlePeriodThresholdMs = 30000;
    int workerThreads = 4;
};

struct InterventionPolicyConfig {
    double deliveryRiskThreshold = 0.5;
    double deliveryConfidenceThreshold = 0.6;
    int dailyCap = 8;
    int cooldownMinutes = 30;
    double highUrgencyRisk = 0.7;
    double mediumUrgencyRisk = 0.5;
    int effectivenessSampleSignals = 3;
    int64_t responseTimeoutMs = 600000;
    int64_t signalBudgetMs = 100;
};

struct AlertConfig {
    int windowHours = 24;
    double highRiskThreshold = 0.6;
    int minHighRiskEvents = 3;
    int minNegativeResponses = 3;
    int minPatternEvents = 3;
    int kAnonymityFloor = 5;
    double criticalSeverityRisk = 0.85;
    double highSeverityRisk = 0.75;
    double mediumSeverityRisk = 0.6;
    int64_t queryTimeoutMs = 5000;
    int alertExpiryDays = 7;
    int defaultPageSize = 50;
    int maxPageSize = 200;
};

struct RetentionConfig {
    int signalRetentionDays = 30;
    int recordRetentionDays = 365;
    int purgeSlaHours = 24;
    int maxPurgeAttempts = 5;
    int64_t purgeBackoffBaseMs = 1000;
    int64_t purgeBackoffMaxMs = 300000;
};

struct WriteQueueConfig {
    int maxPendingWrites = 10000;
    int maxRetries = 3;
    int retryBackoffMs = 50;
};

struct ServiceTimerConfig {
    int idleSweepIntervalMs = 60000;
    int purgeQueueIntervalMs = 30000;
    int alertScanIntervalMs = 15 * 60 * 1000;
    int retentionSweepIntervalMs = 60 * 60 * 1000;
};

struct EngineSettings {
    // Database
    QString dbPath;

    IngestConfig ingest;
    ConsentConfig consent;
    SessionConfig session;
    StruggleModelConfig model;
    InterventionPolicyConfig intervention;
    AlertConfig alerts;
    RetentionConfig retention;
    WriteQueueConfig writeQueue;
    ServiceTimerConfig timers;
};

} // namespace lp
