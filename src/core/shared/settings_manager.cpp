#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace lp {

namespace {

QStringList readStringList(const QJsonObject& json, const QString& key, const QStringList& fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    QStringList out;
    const QJsonArray array = json.value(key).toArray();
    out.reserve(array.size());
    for (const QJsonValue& value : array) {
        out.append(value.toString());
    }
    return out;
}

void readInt(const QJsonObject& json, const char* key, int& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = json.value(name).toInt(target);
    }
}

void readInt64(const QJsonObject& json, const char* key, int64_t& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = static_cast<int64_t>(json.value(name).toVariant().toLongLong());
    }
}

void readDouble(const QJsonObject& json, const char* key, double& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = json.value(name).toDouble(target);
    }
}

QJsonObject ingestToJson(const IngestConfig& c)
{
    QJsonObject json;
    json.insert(QStringLiteral("allowedOrigins"), QJsonArray::fromStringList(c.allowedOrigins));
    json.insert(QStringLiteral("allowedOriginPatterns"),
                QJsonArray::fromStringList(c.allowedOriginPatterns));
    json.insert(QStringLiteral("hmacSecrets"), QJsonArray::fromStringList(c.hmacSecrets));
    json.insert(QStringLiteral("maxSignalDurationMs"), static_cast<qint64>(c.maxSignalDurationMs));
    json.insert(QStringLiteral("maxSignalAgeMs"), static_cast<qint64>(c.maxSignalAgeMs));
    json.insert(QStringLiteral("maxClockSkewMs"), static_cast<qint64>(c.maxClockSkewMs));
    json.insert(QStringLiteral("noncesPerSession"), c.noncesPerSession);
    json.insert(QStringLiteral("maxTrackedSessions"), c.maxTrackedSessions);
    json.insert(QStringLiteral("maxSignalsPerMinute"), c.maxSignalsPerMinute);
    json.insert(QStringLiteral("maxIdLength"), c.maxIdLength);
    json.insert(QStringLiteral("maxElementContextLength"), c.maxElementContextLength);
    return json;
}

void ingestFromJson(const QJsonObject& json, IngestConfig& c)
{
    c.allowedOrigins = readStringList(json, QStringLiteral("allowedOrigins"), c.allowedOrigins);
    c.allowedOriginPatterns = readStringList(json, QStringLiteral("allowedOriginPatterns"),
                                             c.allowedOriginPatterns);
    c.hmacSecrets = readStringList(json, QStringLiteral("hmacSecrets"), c.hmacSecrets);
    readInt64(json, "maxSignalDurationMs", c.maxSignalDurationMs);
    readInt64(json, "maxSignalAgeMs", c.maxSignalAgeMs);
    readInt64(json, "maxClockSkewMs", c.maxClockSkewMs);
    readInt(json, "noncesPerSession", c.noncesPerSession);
    readInt(json, "maxTrackedSessions", c.maxTrackedSessions);
    readInt(json, "maxSignalsPerMinute", c.maxSignalsPerMinute);
    readInt(json, "maxIdLength", c.maxIdLength);
    readInt(json, "maxElementContextLength", c.maxElementContextLength);
}

QJsonObject sessionToJson(const SessionConfig& c)
{
    QJsonObject json;
    json.insert(QStringLiteral("maxActiveSessions"), c.maxActiveSessions);
    json.insert(QStringLiteral("idleTimeoutMinutes"), c.idleTimeoutMinutes);
    json.insert(QStringLiteral("windowMaxSignals"), c.windowMaxSignals);
    json.insert(QStringLiteral("windowMinutes"), c.windowMinutes);
    json.insert(QStringLiteral("minSamplesForScoring"), c.minSamplesForScoring);
    json.insert(QStringLiteral("minElapsedForScoringMs"), static_cast<qint64>(c.minElapsedForScoringMs));
    json.insert(QStringLiteral("idlePeriodThresholdMs"), static_cast<qint64>(c.idlePeriodThresholdMs));
    json.insert(QStringLiteral("workerThreads"), c.workerThreads);
    return json;
}

void sessionFromJson(const QJsonObject& json, SessionConfig& c)
{
    readInt(json, "maxActiveSessions", c.maxActiveSessions);
    readInt(json, "idleTimeoutMinutes", c.idleTimeoutMinutes);
    readInt(json, "windowMaxSignals", c.windowMaxSignals);
    readInt(json, "windowMinutes", c.windowMinutes);
    readInt(json, "minSamplesForScoring", c.minSamplesForScoring);
    readInt64(json, "minElapsedForScoringMs", c.minElapsedForScoringMs);
    readInt64(json, "idlePeriodThresholdMs", c.idlePeriodThresholdMs);
    readInt(json, "workerThreads", c.workerThreads);
}

QJsonObject modelToJson(const StruggleModelConfig& c)
{
    QJsonObject weights;
    weights.insert(QStringLiteral("response_time_variability"), c.responseTimeVariabilityWeight);
    weights.insert(QStringLiteral("idle_frequency"), c.idleFrequencyWeight);
    weights.insert(QStringLiteral("help_request_rate"), c.helpRequestRateWeight);
    weights.insert(QStringLiteral("error_rate"), c.errorRateWeight);
    weights.insert(QStringLiteral("hover_duration"), c.hoverDurationWeight);
    weights.insert(QStringLiteral("content_difficulty"), c.contentDifficultyWeight);

    QJsonObject thresholds;
    thresholds.insert(QStringLiteral("response_time_variability"), c.responseTimeVariabilityThreshold);
    thresholds.insert(QStringLiteral("idle_frequency"), c.idleFrequencyThreshold);
    thresholds.insert(QStringLiteral("help_request_rate"), c.helpRequestRateThreshold);
    thresholds.insert(QStringLiteral("error_rate"), c.errorRateThreshold);
    thresholds.insert(QStringLiteral("hover_duration"), c.hoverDurationThreshold);

    QJsonObject json;
    json.insert(QStringLiteral("modelVersion"), c.modelVersion);
    json.insert(QStringLiteral("weights"), weights);
    json.insert(QStringLiteral("thresholds"), thresholds);
    json.insert(QStringLiteral("idleSaturationCount"), c.idleSaturationCount);
    json.insert(QStringLiteral("helpRateSaturation"), c.helpRateSaturation);
    json.insert(QStringLiteral("hoverCriticalMs"), c.hoverCriticalMs);
    json.insert(QStringLiteral("noiseFloor"), c.noiseFloor);
    json.insert(QStringLiteral("calibrationSteepness"), c.calibrationSteepness);
    json.insert(QStringLiteral("calibrationMidpoint"), c.calibrationMidpoint);
    json.insert(QStringLiteral("confidenceSaturationSamples"), c.confidenceSaturationSamples);
    json.insert(QStringLiteral("timeEstimateConfidenceFloor"), c.timeEstimateConfidenceFloor);
    json.insert(QStringLiteral("earlyWarningHorizonMinutes"), c.earlyWarningHorizonMinutes);
    json.insert(QStringLiteral("assessmentValidityMs"), static_cast<qint64>(c.assessmentValidityMs));
    return json;
}

void modelFromJson(const QJsonObject& json, StruggleModelConfig& c)
{
    c.modelVersion = json.value(QStringLiteral("modelVersion")).toString(c.modelVersion);

    const QJsonObject weights = json.value(QStringLiteral("weights")).toObject();
    readDouble(weights, "response_time_variability", c.responseTimeVariabilityWeight);
    readDouble(weights, "idle_frequency", c.idleFrequencyWeight);
    readDouble(weights, "help_request_rate", c.helpRequestRateWeight);
    readDouble(weights, "error_rate", c.errorRateWeight);
    readDouble(weights, "hover_duration", c.hoverDurationWeight);
    readDouble(weights, "content_difficulty", c.contentDifficultyWeight);

    const QJsonObject thresholds = json.value(QStringLiteral("thresholds")).toObject();
    readDouble(thresholds, "response_time_variability", c.responseTimeVariabilityThreshold);
    readDouble(thresholds, "idle_frequency", c.idleFrequencyThreshold);
    readDouble(thresholds, "help_request_rate", c.helpRequestRateThreshold);
    readDouble(thresholds, "error_rate", c.errorRateThreshold);
    readDouble(thresholds, "hover_duration", c.hoverDurationThreshold);

    readDouble(json, "idleSaturationCount", c.idleSaturationCount);
    readDouble(json, "helpRateSaturation", c.helpRateSaturation);
    readDouble(json, "hoverCriticalMs", c.hoverCriticalMs);
    readDouble(json, "noiseFloor", c.noiseFloor);
    readDouble(json, "calibrationSteepness", c.calibrationSteepness);
    readDouble(json, "calibrationMidpoint", c.calibrationMidpoint);
    readInt(json, "confidenceSaturationSamples", c.confidenceSaturationSamples);
    readDouble(json, "timeEstimateConfidenceFloor", c.timeEstimateConfidenceFloor);
    readDouble(json, "earlyWarningHorizonMinutes", c.earlyWarningHorizonMinutes);
    readInt64(json, "assessmentValidityMs", c.assessmentValidityMs);
}

QJsonObject interventionToJson(const InterventionPolicyConfig& c)
{
    QJsonObject json;
    json.insert(QStringLiteral("deliveryRiskThreshold"), c.deliveryRiskThreshold);
    json.insert(QStringLiteral("deliveryConfidenceThreshold"), c.deliveryConfidenceThreshold);
    json.insert(QStringLiteral("dailyCap"), c.dailyCap);
    json.insert(QStringLiteral("cooldownMinutes"), c.cooldownMinutes);
    json.insert(QStringLiteral("highUrgencyRisk"), c.highUrgencyRisk);
    json.insert(QStringLiteral("mediumUrgencyRisk"), c.mediumUrgencyRisk);
    json.insert(QStringLiteral("effectivenessSampleSignals"), c.effectivenessSampleSignals);
    json.insert(QStringLiteral("responseTimeoutMs"), static_cast<qint64>(c.responseTimeoutMs));
    json.insert(QStringLiteral("signalBudgetMs"), static_cast<qint64>(c.signalBudgetMs));
    return json;
}

void interventionFromJson(const QJsonObject& json, InterventionPolicyConfig& c)
{
    readDouble(json, "deliveryRiskThreshold", c.deliveryRiskThreshold);
    readDouble(json, "deliveryConfidenceThreshold", c.deliveryConfidenceThreshold);
    readInt(json, "dailyCap", c.dailyCap);
    readInt(json, "cooldownMinutes", c.cooldownMinutes);
    readDouble(json, "highUrgencyRisk", c.highUrgencyRisk);
    readDouble(json, "mediumUrgencyRisk", c.mediumUrgencyRisk);
    readInt(json, "effectivenessSampleSignals", c.effectivenessSampleSignals);
    readInt64(json, "responseTimeoutMs", c.responseTimeoutMs);
    readInt64(json, "signalBudgetMs", c.signalBudgetMs);
}

QJsonObject alertsToJson(const AlertConfig& c)
{
    QJsonObject json;
    json.insert(QStringLiteral("windowHours"), c.windowHours);
    json.insert(QStringLiteral("highRiskThreshold"), c.highRiskThreshold);
    json.insert(QStringLiteral("minHighRiskEvents"), c.minHighRiskEvents);
    json.insert(QStringLiteral("minNegativeResponses"), c.minNegativeResponses);
    json.insert(QStringLiteral("minPatternEvents"), c.minPatternEvents);
    json.insert(QStringLiteral("kAnonymityFloor"), c.kAnonymityFloor);
    json.insert(QStringLiteral("criticalSeverityRisk"), c.criticalSeverityRisk);
    json.insert(QStringLiteral("highSeverityRisk"), c.highSeverityRisk);
    json.insert(QStringLiteral("mediumSeverityRisk"), c.mediumSeverityRisk);
    json.insert(QStringLiteral("queryTimeoutMs"), static_cast<qint64>(c.queryTimeoutMs));
    json.insert(QStringLiteral("alertExpiryDays"), c.alertExpiryDays);
    json.insert(QStringLiteral("defaultPageSize"), c.defaultPageSize);
    json.insert(QStringLiteral("maxPageSize"), c.maxPageSize);
    return json;
}

void alertsFromJson(const QJsonObject& json, AlertConfig& c)
{
    readInt(json, "windowHours", c.windowHours);
    readDouble(json, "highRiskThreshold", c.highRiskThreshold);
    readInt(json, "minHighRiskEvents", c.minHighRiskEvents);
    readInt(json, "minNegativeResponses", c.minNegativeResponses);
    readInt(json, "minPatternEvents", c.minPatternEvents);
    readInt(json, "kAnonymityFloor", c.kAnonymityFloor);
    readDouble(json, "criticalSeverityRisk", c.criticalSeverityRisk);
    readDouble(json, "highSeverityRisk", c.highSeverityRisk);
    readDouble(json, "mediumSeverityRisk", c.mediumSeverityRisk);
    readInt64(json, "queryTimeoutMs", c.queryTimeoutMs);
    readInt(json, "alertExpiryDays", c.alertExpiryDays);
    readInt(json, "defaultPageSize", c.defaultPageSize);
    readInt(json, "maxPageSize", c.maxPageSize);
}

QJsonObject retentionToJson(const RetentionConfig& c)
{
    QJsonObject json;
    json.insert(QStringLiteral("signalRetentionDays"), c.signalRetentionDays);
    json.insert(QStringLiteral("recordRetentionDays"), c.recordRetentionDays);
    json.insert(QStringLiteral("purgeSlaHours"), c.purgeSlaHours);
    json.insert(QStringLiteral("maxPurgeAttempts"), c.maxPurgeAttempts);
    json.insert(QStringLiteral("purgeBackoffBaseMs"), static_cast<qint64>(c.purgeBackoffBaseMs));
    json.insert(QStringLiteral("purgeBackoffMaxMs"), static_cast<qint64>(c.purgeBackoffMaxMs));
    return json;
}

void retentionFromJson(const QJsonObject& json, RetentionConfig& c)
{
    readInt(json, "signalRetentionDays", c.signalRetentionDays);
    readInt(json, "recordRetentionDays", c.recordRetentionDays);
    readInt(json, "purgeSlaHours", c.purgeSlaHours);
    readInt(json, "maxPurgeAttempts", c.maxPurgeAttempts);
    readInt64(json, "purgeBackoffBaseMs", c.purgeBackoffBaseMs);
    readInt64(json, "purgeBackoffMaxMs", c.purgeBackoffMaxMs);
}

} // namespace

std::optional<EngineSettings> SettingsManager::load()
{
    const QString filePath = settingsFilePath();
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(lpCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(lpCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const EngineSettings& settings)
{
    const QString filePath = settingsFilePath();
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(lpCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(lpCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(lpCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("LEARNPULSE_SETTINGS_PATH");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/learnpulse/settings.json");
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject consent;
    consent.insert(QStringLiteral("cacheTtlMs"), static_cast<qint64>(settings.consent.cacheTtlMs));
    consent.insert(QStringLiteral("consentFailureEscalationCount"),
                   settings.consent.consentFailureEscalationCount);

    QJsonObject writeQueue;
    writeQueue.insert(QStringLiteral("maxPendingWrites"), settings.writeQueue.maxPendingWrites);
    writeQueue.insert(QStringLiteral("maxRetries"), settings.writeQueue.maxRetries);
    writeQueue.insert(QStringLiteral("retryBackoffMs"), settings.writeQueue.retryBackoffMs);

    QJsonObject timers;
    timers.insert(QStringLiteral("idleSweepIntervalMs"), settings.timers.idleSweepIntervalMs);
    timers.insert(QStringLiteral("purgeQueueIntervalMs"), settings.timers.purgeQueueIntervalMs);
    timers.insert(QStringLiteral("alertScanIntervalMs"), settings.timers.alertScanIntervalMs);
    timers.insert(QStringLiteral("retentionSweepIntervalMs"), settings.timers.retentionSweepIntervalMs);

    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("ingest"), ingestToJson(settings.ingest));
    json.insert(QStringLiteral("consent"), consent);
    json.insert(QStringLiteral("session"), sessionToJson(settings.session));
    json.insert(QStringLiteral("model"), modelToJson(settings.model));
    json.insert(QStringLiteral("intervention"), interventionToJson(settings.intervention));
    json.insert(QStringLiteral("alerts"), alertsToJson(settings.alerts));
    json.insert(QStringLiteral("retention"), retentionToJson(settings.retention));
    json.insert(QStringLiteral("writeQueue"), writeQueue);
    json.insert(QStringLiteral("timers"), timers);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    ingestFromJson(json.value(QStringLiteral("ingest")).toObject(), settings.ingest);
    sessionFromJson(json.value(QStringLiteral("session")).toObject(), settings.session);
    modelFromJson(json.value(QStringLiteral("model")).toObject(), settings.model);
    interventionFromJson(json.value(QStringLiteral("intervention")).toObject(), settings.intervention);
    alertsFromJson(json.value(QStringLiteral("alerts")).toObject(), settings.alerts);
    retentionFromJson(json.value(QStringLiteral("retention")).toObject(), settings.retention);

    const QJsonObject consent = json.value(QStringLiteral("consent")).toObject();
    readInt64(consent, "cacheTtlMs", settings.consent.cacheTtlMs);
    readInt(consent, "consentFailureEscalationCount", settings.consent.consentFailureEscalationCount);

    const QJsonObject writeQueue = json.value(QStringLiteral("writeQueue")).toObject();
    readInt(writeQueue, "maxPendingWrites", settings.writeQueue.maxPendingWrites);
    readInt(writeQueue, "maxRetries", settings.writeQueue.maxRetries);
    readInt(writeQueue, "retryBackoffMs", settings.writeQueue.retryBackoffMs);

    const QJsonObject timers = json.value(QStringLiteral("timers")).toObject();
    readInt(timers, "idleSweepIntervalMs", settings.timers.idleSweepIntervalMs);
    readInt(timers, "purgeQueueIntervalMs", settings.timers.purgeQueueIntervalMs);
    readInt(timers, "alertScanIntervalMs", settings.timers.alertScanIntervalMs);
    readInt(timers, "retentionSweepIntervalMs", settings.timers.retentionSweepIntervalMs);

    return settings;
}

} // namespace lp
