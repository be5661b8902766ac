#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lpCore)
Q_DECLARE_LOGGING_CATEGORY(lpIngest)
Q_DECLARE_LOGGING_CATEGORY(lpConsent)
Q_DECLARE_LOGGING_CATEGORY(lpSession)
Q_DECLARE_LOGGING_CATEGORY(lpScoring)
Q_DECLARE_LOGGING_CATEGORY(lpIntervention)
Q_DECLARE_LOGGING_CATEGORY(lpAlerts)
Q_DECLARE_LOGGING_CATEGORY(lpRetention)
Q_DECLARE_LOGGING_CATEGORY(lpStore)
Q_DECLARE_LOGGING_CATEGORY(lpIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
