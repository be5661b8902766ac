#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(lpCore, "learnpulse.core")
Q_LOGGING_CATEGORY(lpIngest, "learnpulse.ingest")
Q_LOGGING_CATEGORY(lpConsent, "learnpulse.consent")
Q_LOGGING_CATEGORY(lpSession, "learnpulse.session")
Q_LOGGING_CATEGORY(lpScoring, "learnpulse.scoring")
Q_LOGGING_CATEGORY(lpIntervention, "learnpulse.intervention")
Q_LOGGING_CATEGORY(lpAlerts, "learnpulse.alerts")
Q_LOGGING_CATEGORY(lpRetention, "learnpulse.retention")
Q_LOGGING_CATEGORY(lpStore, "learnpulse.store")
Q_LOGGING_CATEGORY(lpIpc, "learnpulse.ipc")
