#include "core/store/engine_store.h"
#include "core/store/schema.h"
#include "core/store/migration.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QThread>
#include <QUuid>

#include <algorithm>
#include <cstring>

namespace lp {

// ── SQL helpers ─────────────────────────────────────────────

namespace sql {

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void bindTextOrNull(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

void bindInt64OrNull(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value)
{
    if (value.has_value()) {
        sqlite3_bind_int64(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bindDoubleOrNull(sqlite3_stmt* stmt, int index, const std::optional<double>& value)
{
    if (value.has_value()) {
        sqlite3_bind_double(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

std::optional<int64_t> columnInt64OrNull(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
}

std::optional<double> columnDoubleOrNull(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, column);
}

int stepWithRetry(sqlite3_stmt* stmt)
{
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
        }
        rc = sqlite3_step(stmt);
    }
    return rc;
}

bool exec(sqlite3* db, const char* statement)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, statement, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(lpStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace sql

namespace {

constexpr const char* kConsentColumns =
    "tenant_id, user_id, behavioral_timing, assessment_patterns, chat_interactions, "
    "cross_course_correlation, anonymized_analytics, collection_level, withdrawn_at, "
    "purged_at, updated_at";

constexpr const char* kInterventionColumns =
    "id, session_id, user_id, tenant_id, course_id, struggle_event_id, intervention_type, "
    "urgency, risk_level, message_intent, triggered_at, delivered_at, user_response, "
    "responded_at, effectiveness_score";

// Returns Found/NotFound, or Unavailable with error set.
ConsentLookup readConsentLocked(sqlite3* db, const QString& tenantId, const QString& userId)
{
    ConsentLookup lookup;
    const QByteArray sqlText = QStringLiteral(
        "SELECT %1 FROM privacy_consent WHERE tenant_id = ?1 AND user_id = ?2")
        .arg(QString::fromLatin1(kConsentColumns)).toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlText.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        lookup.status = ConsentLookupStatus::Unavailable;
        lookup.error = QString::fromUtf8(sqlite3_errmsg(db));
        return lookup;
    }
    sql::bindText(stmt, 1, tenantId);
    sql::bindText(stmt, 2, userId);

    const int rc = sql::stepWithRetry(stmt);
    if (rc == SQLITE_ROW) {
        ConsentRecord& record = lookup.record;
        record.tenantId = sql::columnText(stmt, 0);
        record.userId = sql::columnText(stmt, 1);
        record.scopes.behavioralTiming = sqlite3_column_int(stmt, 2) != 0;
        record.scopes.assessmentPatterns = sqlite3_column_int(stmt, 3) != 0;
        record.scopes.chatInteractions = sqlite3_column_int(stmt, 4) != 0;
        record.scopes.crossCourseCorrelation = sqlite3_column_int(stmt, 5) != 0;
        record.scopes.anonymizedAnalytics = sqlite3_column_int(stmt, 6) != 0;
        record.collectionLevel = collectionLevelFromString(sql::columnText(stmt, 7))
                                     .value_or(CollectionLevel::Minimal);
        record.withdrawnAtMs = sql::columnInt64OrNull(stmt, 8);
        record.purgedAtMs = sql::columnInt64OrNull(stmt, 9);
        record.updatedAtMs = sqlite3_column_int64(stmt, 10);
        lookup.status = ConsentLookupStatus::Found;
    } else if (rc == SQLITE_DONE) {
        lookup.status = ConsentLookupStatus::NotFound;
    } else {
        lookup.status = ConsentLookupStatus::Unavailable;
        lookup.error = QString::fromUtf8(sqlite3_errmsg(db));
    }
    sqlite3_finalize(stmt);
    return lookup;
}

bool writeConsentLocked(sqlite3* db, const ConsentRecord& record)
{
    const char* sqlText = R"(
        INSERT INTO privacy_consent (tenant_id, user_id, behavioral_timing, assessment_patterns,
                                     chat_interactions, cross_course_correlation,
                                     anonymized_analytics, collection_level, withdrawn_at,
                                     purged_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
        ON CONFLICT(tenant_id, user_id) DO UPDATE SET
            behavioral_timing = excluded.behavioral_timing,
            assessment_patterns = excluded.assessment_patterns,
            chat_interactions = excluded.chat_interactions,
            cross_course_correlation = excluded.cross_course_correlation,
            anonymized_analytics = excluded.anonymized_analytics,
            collection_level = excluded.collection_level,
            withdrawn_at = excluded.withdrawn_at,
            purged_at = excluded.purged_at,
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "writeConsent prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }
    sql::bindText(stmt, 1, record.tenantId);
    sql::bindText(stmt, 2, record.userId);
    sqlite3_bind_int(stmt, 3, record.scopes.behavioralTiming ? 1 : 0);
    sqlite3_bind_int(stmt, 4, record.scopes.assessmentPatterns ? 1 : 0);
    sqlite3_bind_int(stmt, 5, record.scopes.chatInteractions ? 1 : 0);
    sqlite3_bind_int(stmt, 6, record.scopes.crossCourseCorrelation ? 1 : 0);
    sqlite3_bind_int(stmt, 7, record.scopes.anonymizedAnalytics ? 1 : 0);
    sql::bindText(stmt, 8, collectionLevelToString(record.collectionLevel));
    sql::bindInt64OrNull(stmt, 9, record.withdrawnAtMs);
    sql::bindInt64OrNull(stmt, 10, record.purgedAtMs);
    sqlite3_bind_int64(stmt, 11, record.updatedAtMs);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "writeConsent step failed: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

InterventionRecord readIntervention(sqlite3_stmt* stmt)
{
    InterventionRecord record;
    record.id = sql::columnText(stmt, 0);
    record.sessionId = sql::columnText(stmt, 1);
    record.userId = sql::columnText(stmt, 2);
    record.tenantId = sql::columnText(stmt, 3);
    record.courseId = sql::columnText(stmt, 4);
    const QString assessmentId = sql::columnText(stmt, 5);
    if (!assessmentId.isEmpty()) {
        record.struggleAssessmentId = assessmentId;
    }
    record.type = interventionTypeFromString(sql::columnText(stmt, 6))
                      .value_or(InterventionType::ProactiveChat);
    record.urgency = urgencyFromString(sql::columnText(stmt, 7)).value_or(Urgency::Low);
    record.riskLevel = sqlite3_column_double(stmt, 8);
    record.messageIntent = sql::columnText(stmt, 9);
    record.triggeredAtMs = sqlite3_column_int64(stmt, 10);
    record.deliveredAtMs = sql::columnInt64OrNull(stmt, 11);
    record.userResponse = userResponseFromString(sql::columnText(stmt, 12))
                              .value_or(UserResponse::None);
    record.respondedAtMs = sql::columnInt64OrNull(stmt, 13);
    record.effectivenessScore = sql::columnDoubleOrNull(stmt, 14);
    return record;
}

// Runs a statement binding (tenant, cutoff, now) and returns changed rows, or -1.
int runScopedUpdate(sqlite3* db, const char* sqlText, const QString& tenantId,
                    int64_t cutoffMs, int64_t nowMs)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "retention prepare failed: %s", sqlite3_errmsg(db));
        return -1;
    }
    sql::bindText(stmt, 1, tenantId);
    sqlite3_bind_int64(stmt, 2, cutoffMs);
    if (sqlite3_bind_parameter_count(stmt) >= 3) {
        sqlite3_bind_int64(stmt, 3, nowMs);
    }
    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "retention step failed: %s", sqlite3_errmsg(db));
        return -1;
    }
    return sqlite3_changes(db);
}

// Runs a statement binding (tenant, user, token, now) and returns success.
bool runUserUpdate(sqlite3* db, const char* sqlText, const QString& tenantId,
                   const QString& userId, const QString& token, int64_t nowMs)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "purge prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }
    sql::bindText(stmt, 1, tenantId);
    sql::bindText(stmt, 2, userId);
    const int params = sqlite3_bind_parameter_count(stmt);
    if (params >= 3) {
        sql::bindText(stmt, 3, token);
    }
    if (params >= 4) {
        sqlite3_bind_int64(stmt, 4, nowMs);
    }
    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "purge step failed: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

} // namespace

// ── Lifecycle ───────────────────────────────────────────────

EngineStore::~EngineStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<EngineStore> EngineStore::open(const QString& dbPath)
{
    std::unique_ptr<EngineStore> store(new EngineStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool EngineStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(lpStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execLocked(kConnectionPragmas)) {
        LOG_ERROR(lpStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='privacy_consent'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execLocked(kDatabasePragmas)) {
            LOG_ERROR(lpStore, "Failed to set database pragmas");
            return false;
        }
        if (!execLocked(kSchemaV1)) {
            LOG_ERROR(lpStore, "Failed to create schema");
            return false;
        }
        if (!execLocked(kDefaultSettings)) {
            LOG_ERROR(lpStore, "Failed to insert default settings");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(lpStore, "Migration failed");
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
        QFile walFile(dbPath + QStringLiteral("-wal"));
        if (walFile.exists()) {
            walFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
        }
    }

    LOG_INFO(lpStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool EngineStore::execLocked(const char* statement)
{
    return sql::exec(m_db, statement);
}

EngineStore::Connection EngineStore::acquire()
{
    return Connection(m_mutex, m_db);
}

// ── Consent ─────────────────────────────────────────────────

ConsentLookup EngineStore::lookupConsent(const QString& tenantId, const QString& userId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return readConsentLocked(m_db, tenantId, userId);
}

bool EngineStore::upsertConsent(const ConsentRecord& record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return writeConsentLocked(m_db, record);
}

std::optional<ConsentRecord> EngineStore::applyConsentChange(const QString& tenantId,
                                                             const QString& userId,
                                                             std::optional<ConsentScope> scope,
                                                             bool granted,
                                                             int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    ConsentLookup existing = readConsentLocked(m_db, tenantId, userId);
    if (existing.status == ConsentLookupStatus::Unavailable) {
        LOG_ERROR(lpStore, "applyConsentChange: lookup failed: %s", qUtf8Printable(existing.error));
        return std::nullopt;
    }

    ConsentRecord record = existing.record;
    if (existing.status == ConsentLookupStatus::NotFound) {
        record = ConsentRecord{};
        record.tenantId = tenantId;
        record.userId = userId;
        record.collectionLevel = CollectionLevel::Standard;
    }

    if (scope.has_value()) {
        record.scopes.set(*scope, granted);
    } else {
        record.scopes.behavioralTiming = granted;
        record.scopes.assessmentPatterns = granted;
        record.scopes.chatInteractions = granted;
        record.scopes.crossCourseCorrelation = granted;
        record.scopes.anonymizedAnalytics = granted;
    }

    const bool fullWithdrawal = !granted
        && (!scope.has_value() || *scope == ConsentScope::BehavioralTiming);
    if (fullWithdrawal) {
        if (!record.withdrawnAtMs.has_value()) {
            record.withdrawnAtMs = nowMs;
        }
        record.purgedAtMs.reset();
    } else if (granted && record.withdrawnAtMs.has_value()) {
        // Fresh grant after a withdrawal starts a new consent period.
        record.withdrawnAtMs.reset();
        record.purgedAtMs.reset();
    }
    record.updatedAtMs = nowMs;

    if (!writeConsentLocked(m_db, record)) {
        return std::nullopt;
    }
    return record;
}

// ── Learner data ────────────────────────────────────────────

bool EngineStore::insertSignal(const BehavioralSignal& signal)
{
    const char* sqlText = R"(
        INSERT OR IGNORE INTO behavioral_signals (tenant_id, session_id, user_id, course_id,
            signal_type, duration_ms, element_context, page_content_hash, outcome,
            signal_ts, received_at, nonce, origin)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "insertSignal prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, signal.tenantId);
    sql::bindText(stmt, 2, signal.sessionId);
    sql::bindText(stmt, 3, signal.userId);
    sql::bindTextOrNull(stmt, 4, signal.courseId);
    sql::bindText(stmt, 5, signalTypeToString(signal.type));
    sqlite3_bind_int64(stmt, 6, signal.durationMs);
    sql::bindTextOrNull(stmt, 7, signal.elementContext);
    sql::bindTextOrNull(stmt, 8, signal.pageContentHash);
    sql::bindText(stmt, 9, signalOutcomeToString(signal.outcome));
    sqlite3_bind_int64(stmt, 10, signal.timestampMs);
    sqlite3_bind_int64(stmt, 11, signal.receivedAtMs);
    sql::bindText(stmt, 12, signal.nonce);
    sql::bindText(stmt, 13, signal.origin);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "insertSignal step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool EngineStore::upsertSessionSnapshot(const SessionSnapshotRow& row)
{
    const char* sqlText = R"(
        INSERT INTO session_snapshots (session_id, tenant_id, user_id, course_id, sample_count,
                                       features_json, opened_at, closed_at, close_reason)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
        ON CONFLICT(session_id) DO UPDATE SET
            sample_count = excluded.sample_count,
            features_json = excluded.features_json,
            closed_at = excluded.closed_at,
            close_reason = excluded.close_reason
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "upsertSessionSnapshot prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, row.sessionId);
    sql::bindText(stmt, 2, row.tenantId);
    sql::bindText(stmt, 3, row.userId);
    sql::bindTextOrNull(stmt, 4, row.courseId);
    sqlite3_bind_int(stmt, 5, row.sampleCount);
    sqlite3_bind_text(stmt, 6, row.featuresJson.constData(), row.featuresJson.size(),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 7, row.openedAtMs);
    sqlite3_bind_int64(stmt, 8, row.closedAtMs);
    sql::bindText(stmt, 9, row.closeReason);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "upsertSessionSnapshot step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool EngineStore::insertAssessment(const StruggleAssessment& assessment)
{
    const char* sqlText = R"(
        INSERT OR IGNORE INTO struggle_events (id, tenant_id, session_id, user_id, course_id,
            risk_level, confidence, time_to_struggle_minutes, contributing_factors,
            model_version, computed_at, valid_until)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "insertAssessment prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, assessment.id);
    sql::bindText(stmt, 2, assessment.tenantId);
    sql::bindText(stmt, 3, assessment.sessionId);
    sql::bindText(stmt, 4, assessment.userId);
    sql::bindTextOrNull(stmt, 5, assessment.courseId);
    sqlite3_bind_double(stmt, 6, assessment.riskLevel);
    sqlite3_bind_double(stmt, 7, assessment.confidence);
    sql::bindDoubleOrNull(stmt, 8, assessment.estimatedTimeToStruggleMinutes);
    sql::bindText(stmt, 9, assessment.contributingFactors.join(QLatin1Char(',')));
    sql::bindText(stmt, 10, assessment.modelVersion);
    sqlite3_bind_int64(stmt, 11, assessment.computedAtMs);
    sqlite3_bind_int64(stmt, 12, assessment.validUntilMs);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "insertAssessment step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool EngineStore::insertSuppression(const SuppressionRecord& record)
{
    const char* sqlText = R"(
        INSERT INTO intervention_suppressions (tenant_id, session_id, user_id, course_id,
                                               reason, risk_level, confidence, decided_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "insertSuppression prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, record.tenantId);
    sql::bindText(stmt, 2, record.sessionId);
    sql::bindText(stmt, 3, record.userId);
    sql::bindTextOrNull(stmt, 4, record.courseId);
    sql::bindText(stmt, 5, suppressionReasonToString(record.reason));
    sqlite3_bind_double(stmt, 6, record.riskLevel);
    sqlite3_bind_double(stmt, 7, record.confidence);
    sqlite3_bind_int64(stmt, 8, record.decidedAtMs);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "insertSuppression step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

// ── Interventions ───────────────────────────────────────────

bool EngineStore::insertIntervention(const InterventionRecord& record)
{
    const char* sqlText = R"(
        INSERT INTO proactive_interventions (id, session_id, user_id, tenant_id, course_id,
            struggle_event_id, intervention_type, urgency, risk_level, message_intent,
            triggered_at, delivered_at, user_response, responded_at, effectiveness_score)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "insertIntervention prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, record.id);
    sql::bindText(stmt, 2, record.sessionId);
    sql::bindText(stmt, 3, record.userId);
    sql::bindText(stmt, 4, record.tenantId);
    sql::bindTextOrNull(stmt, 5, record.courseId);
    sql::bindTextOrNull(stmt, 6, record.struggleAssessmentId.value_or(QString()));
    sql::bindText(stmt, 7, interventionTypeToString(record.type));
    sql::bindText(stmt, 8, urgencyToString(record.urgency));
    sqlite3_bind_double(stmt, 9, record.riskLevel);
    sql::bindText(stmt, 10, record.messageIntent);
    sqlite3_bind_int64(stmt, 11, record.triggeredAtMs);
    sql::bindInt64OrNull(stmt, 12, record.deliveredAtMs);
    sql::bindText(stmt, 13, userResponseToString(record.userResponse));
    sql::bindInt64OrNull(stmt, 14, record.respondedAtMs);
    sql::bindDoubleOrNull(stmt, 15, record.effectivenessScore);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "insertIntervention step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<InterventionRecord> EngineStore::getIntervention(const QString& interventionId)
{
    const QByteArray sqlText = QStringLiteral(
        "SELECT %1 FROM proactive_interventions WHERE id = ?1")
        .arg(QString::fromLatin1(kInterventionColumns)).toUtf8();

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sql::bindText(stmt, 1, interventionId);

    std::optional<InterventionRecord> result;
    if (sql::stepWithRetry(stmt) == SQLITE_ROW) {
        result = readIntervention(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool EngineStore::recordDelivery(const QString& interventionId, int64_t deliveredAtMs)
{
    const char* sqlText =
        "UPDATE proactive_interventions SET delivered_at = COALESCE(delivered_at, ?2) WHERE id = ?1";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "recordDelivery prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, interventionId);
    sqlite3_bind_int64(stmt, 2, deliveredAtMs);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "recordDelivery step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

bool EngineStore::recordResponse(const QString& interventionId, UserResponse response,
                                 int64_t respondedAtMs)
{
    // A record reaches exactly one terminal response. Repeating the same
    // response is accepted as a no-op.
    const char* updateSql = R"(
        UPDATE proactive_interventions
        SET user_response = ?2,
            responded_at = ?3,
            delivered_at = COALESCE(delivered_at, ?3)
        WHERE id = ?1 AND user_response = 'none'
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, updateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "recordResponse prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, interventionId);
    sql::bindText(stmt, 2, userResponseToString(response));
    sqlite3_bind_int64(stmt, 3, respondedAtMs);

    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "recordResponse step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    if (sqlite3_changes(m_db) > 0) {
        return true;
    }

    stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "SELECT user_response FROM proactive_interventions WHERE id = ?1",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sql::bindText(stmt, 1, interventionId);
    bool sameResponse = false;
    if (sql::stepWithRetry(stmt) == SQLITE_ROW) {
        sameResponse = sql::columnText(stmt, 0) == userResponseToString(response);
    }
    sqlite3_finalize(stmt);
    return sameResponse;
}

bool EngineStore::updateEffectiveness(const QString& interventionId, double score)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "UPDATE proactive_interventions SET effectiveness_score = ?2 WHERE id = ?1",
            -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "updateEffectiveness prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, interventionId);
    sqlite3_bind_double(stmt, 2, score);
    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::vector<InterventionRecord> EngineStore::interventionsForUserSince(const QString& tenantId,
                                                                      const QString& userId,
                                                                      int64_t sinceMs)
{
    const QByteArray sqlText = QStringLiteral(
        "SELECT %1 FROM proactive_interventions "
        "WHERE tenant_id = ?1 AND user_id = ?2 AND triggered_at >= ?3 "
        "ORDER BY triggered_at ASC")
        .arg(QString::fromLatin1(kInterventionColumns)).toUtf8();

    std::vector<InterventionRecord> records;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(lpStore, "interventionsForUserSince prepare failed: %s", sqlite3_errmsg(m_db));
        return records;
    }
    sql::bindText(stmt, 1, tenantId);
    sql::bindText(stmt, 2, userId);
    sqlite3_bind_int64(stmt, 3, sinceMs);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(readIntervention(stmt));
    }
    sqlite3_finalize(stmt);
    return records;
}

// ── Courses and tenants ─────────────────────────────────────

bool EngineStore::setCourseInstructor(const QString& tenantId, const QString& courseId,
                                      const QString& instructorId)
{
    const char* sqlText = R"(
        INSERT INTO course_instructors (tenant_id, course_id, instructor_id) VALUES (?1, ?2, ?3)
        ON CONFLICT(tenant_id, course_id) DO UPDATE SET instructor_id = excluded.instructor_id
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sql::bindText(stmt, 1, tenantId);
    sql::bindText(stmt, 2, courseId);
    sql::bindText(stmt, 3, instructorId);
    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool EngineStore::setTenantRetention(const TenantRetentionPolicy& policy, int64_t nowMs)
{
    const char* sqlText = R"(
        INSERT INTO tenant_retention (tenant_id, signal_retention_days, record_retention_days, updated_at)
        VALUES (?1, ?2, ?3, ?4)
        ON CONFLICT(tenant_id) DO UPDATE SET
            signal_retention_days = excluded.signal_retention_days,
            record_retention_days = excluded.record_retention_days,
            updated_at = excluded.updated_at
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sql::bindText(stmt, 1, policy.tenantId);
    sqlite3_bind_int(stmt, 2, policy.signalRetentionDays);
    sqlite3_bind_int(stmt, 3, policy.recordRetentionDays);
    sqlite3_bind_int64(stmt, 4, nowMs);
    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── RetentionBackend ────────────────────────────────────────

std::vector<QString> EngineStore::tenantsWithData()
{
    const char* sqlText = R"(
        SELECT tenant_id FROM behavioral_signals
        UNION SELECT tenant_id FROM session_snapshots
        UNION SELECT tenant_id FROM struggle_events WHERE anonymized_at IS NULL
        UNION SELECT tenant_id FROM proactive_interventions WHERE anonymized_at IS NULL
        UNION SELECT tenant_id FROM intervention_suppressions WHERE anonymized_at IS NULL
        ORDER BY 1
    )";

    std::vector<QString> tenants;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "tenantsWithData prepare failed: %s", sqlite3_errmsg(m_db));
        return tenants;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        tenants.push_back(sql::columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return tenants;
}

std::optional<TenantRetentionPolicy> EngineStore::tenantRetentionPolicy(const QString& tenantId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "SELECT signal_retention_days, record_retention_days FROM tenant_retention "
            "WHERE tenant_id = ?1",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sql::bindText(stmt, 1, tenantId);

    std::optional<TenantRetentionPolicy> policy;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        TenantRetentionPolicy row;
        row.tenantId = tenantId;
        row.signalRetentionDays = sqlite3_column_int(stmt, 0);
        row.recordRetentionDays = sqlite3_column_int(stmt, 1);
        policy = row;
    }
    sqlite3_finalize(stmt);
    return policy;
}

bool EngineStore::applyTenantRetention(const QString& tenantId,
                                       int64_t signalCutoffMs,
                                       int64_t recordCutoffMs,
                                       int64_t nowMs,
                                       RetentionSweepCounts* counts,
                                       QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!execLocked("BEGIN TRANSACTION")) {
        if (errorOut) *errorOut = QStringLiteral("begin failed");
        return false;
    }

    RetentionSweepCounts local;
    bool ok = true;

    const int signals = runScopedUpdate(m_db,
        "DELETE FROM behavioral_signals WHERE tenant_id = ?1 AND signal_ts < ?2",
        tenantId, signalCutoffMs, nowMs);
    ok = ok && signals >= 0;
    local.signalsDeleted = std::max(signals, 0);

    if (ok) {
        const int snapshots = runScopedUpdate(m_db,
            "DELETE FROM session_snapshots WHERE tenant_id = ?1 AND closed_at < ?2",
            tenantId, signalCutoffMs, nowMs);
        ok = snapshots >= 0;
        local.snapshotsDeleted = std::max(snapshots, 0);
    }

    // Past the record horizon each row gets its own random token, which keeps
    // aggregate statistics while unlinking rows from each other and the user.
    const char* anonymizeStatements[] = {
        "UPDATE struggle_events SET user_id = 'anon-' || lower(hex(randomblob(16))), "
        "anonymized_at = ?3 WHERE tenant_id = ?1 AND computed_at < ?2 AND anonymized_at IS NULL",
        "UPDATE proactive_interventions SET user_id = 'anon-' || lower(hex(randomblob(16))), "
        "anonymized_at = ?3 WHERE tenant_id = ?1 AND triggered_at < ?2 AND anonymized_at IS NULL",
        "UPDATE intervention_suppressions SET user_id = 'anon-' || lower(hex(randomblob(16))), "
        "anonymized_at = ?3 WHERE tenant_id = ?1 AND decided_at < ?2 AND anonymized_at IS NULL",
    };
    for (const char* statement : anonymizeStatements) {
        if (!ok) {
            break;
        }
        const int changed = runScopedUpdate(m_db, statement, tenantId, recordCutoffMs, nowMs);
        ok = changed >= 0;
        local.recordsAnonymized += std::max(changed, 0);
    }

    if (!ok) {
        execLocked("ROLLBACK");
        if (errorOut) *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
        return false;
    }
    if (!execLocked("COMMIT")) {
        execLocked("ROLLBACK");
        if (errorOut) *errorOut = QStringLiteral("commit failed");
        return false;
    }

    if (counts) {
        *counts = local;
    }
    return true;
}

std::vector<PendingPurge> EngineStore::withdrawnUnpurgedUsers()
{
    std::vector<PendingPurge> pending;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "SELECT tenant_id, user_id, withdrawn_at FROM privacy_consent "
            "WHERE withdrawn_at IS NOT NULL AND purged_at IS NULL ORDER BY withdrawn_at",
            -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "withdrawnUnpurgedUsers prepare failed: %s", sqlite3_errmsg(m_db));
        return pending;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        PendingPurge entry;
        entry.tenantId = sql::columnText(stmt, 0);
        entry.userId = sql::columnText(stmt, 1);
        entry.withdrawnAtMs = sqlite3_column_int64(stmt, 2);
        pending.push_back(entry);
    }
    sqlite3_finalize(stmt);
    return pending;
}

bool EngineStore::purgeUser(const QString& tenantId, const QString& userId,
                            int64_t nowMs, QString* errorOut)
{
    const QString token = QStringLiteral("anon-")
        + QUuid::createUuid().toString(QUuid::WithoutBraces);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!execLocked("BEGIN TRANSACTION")) {
        if (errorOut) *errorOut = QStringLiteral("begin failed");
        return false;
    }

    const char* statements[] = {
        "DELETE FROM behavioral_signals WHERE tenant_id = ?1 AND user_id = ?2",
        "DELETE FROM session_snapshots WHERE tenant_id = ?1 AND user_id = ?2",
        "UPDATE struggle_events SET user_id = ?3, anonymized_at = ?4 "
        "WHERE tenant_id = ?1 AND user_id = ?2",
        "UPDATE proactive_interventions SET user_id = ?3, anonymized_at = ?4 "
        "WHERE tenant_id = ?1 AND user_id = ?2",
        "UPDATE intervention_suppressions SET user_id = ?3, anonymized_at = ?4 "
        "WHERE tenant_id = ?1 AND user_id = ?2",
        "UPDATE instructor_alerts SET student_id = ?3, student_key = ?3, anonymized_at = ?4 "
        "WHERE tenant_id = ?1 AND student_id = ?2",
        "UPDATE privacy_consent SET purged_at = ?4 WHERE tenant_id = ?1 AND user_id = ?2",
    };

    bool ok = true;
    for (const char* statement : statements) {
        if (!runUserUpdate(m_db, statement, tenantId, userId, token, nowMs)) {
            ok = false;
            break;
        }
    }

    if (!ok) {
        if (errorOut) *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
        execLocked("ROLLBACK");
        return false;
    }
    if (!execLocked("COMMIT")) {
        execLocked("ROLLBACK");
        if (errorOut) *errorOut = QStringLiteral("commit failed");
        return false;
    }
    return true;
}

int EngineStore::timeoutStaleInterventions(int64_t deliveredBeforeMs, int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "UPDATE proactive_interventions SET user_response = 'timeout', responded_at = ?2 "
            "WHERE user_response = 'none' AND delivered_at IS NOT NULL AND delivered_at < ?1",
            -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lpStore, "timeoutStaleInterventions prepare failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    sqlite3_bind_int64(stmt, 1, deliveredBeforeMs);
    sqlite3_bind_int64(stmt, 2, nowMs);
    const int rc = sql::stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lpStore, "timeoutStaleInterventions step failed: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_changes(m_db);
}

int EngineStore::expireStaleAlerts(int64_t updatedBeforeMs, int64_t nowMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!execLocked("BEGIN TRANSACTION")) {
        return -1;
    }

    const char* auditSql = R"(
        INSERT INTO alert_actions (alert_id, actor_id, action_taken, from_status, to_status, acted_at)
        SELECT id, 'system', 'expired', status, 'dismissed', ?2 FROM instructor_alerts
        WHERE status IN ('new', 'acknowledged', 'in_progress') AND updated_at < ?1
    )";
    const char* updateSql = R"(
        UPDATE instructor_alerts SET status = 'dismissed', updated_at = ?2, resolved_at = ?2
        WHERE status IN ('new', 'acknowledged', 'in_progress') AND updated_at < ?1
    )";

    int changed = -1;
    bool ok = true;
    for (const char* statement : {auditSql, updateSql}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, statement, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(lpStore, "expireStaleAlerts prepare failed: %s", sqlite3_errmsg(m_db));
            ok = false;
            break;
        }
        sqlite3_bind_int64(stmt, 1, updatedBeforeMs);
        sqlite3_bind_int64(stmt, 2, nowMs);
        const int rc = sql::stepWithRetry(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(lpStore, "expireStaleAlerts step failed: %s", sqlite3_errmsg(m_db));
            ok = false;
            break;
        }
        changed = sqlite3_changes(m_db);
    }

    if (!ok || !execLocked("COMMIT")) {
        execLocked("ROLLBACK");
        return -1;
    }
    return changed;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> EngineStore::getSetting(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return getSettingLocked(key);
}

std::optional<QString> EngineStore::getSettingLocked(const QString& key)
{
    const char* sqlText = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sql::bindText(stmt, 1, key);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = sql::columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool EngineStore::setSetting(const QString& key, const QString& value)
{
    const char* sqlText = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sql::bindText(stmt, 1, key);
    sql::bindText(stmt, 2, value);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Health ──────────────────────────────────────────────────

int64_t EngineStore::countLocked(const char* sqlText)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    int64_t value = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

std::optional<StoreCounts> EngineStore::counts()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    StoreCounts counts;
    counts.signals = countLocked("SELECT COUNT(*) FROM behavioral_signals");
    counts.snapshots = countLocked("SELECT COUNT(*) FROM session_snapshots");
    counts.struggleEvents = countLocked("SELECT COUNT(*) FROM struggle_events");
    counts.interventions = countLocked("SELECT COUNT(*) FROM proactive_interventions");
    counts.suppressions = countLocked("SELECT COUNT(*) FROM intervention_suppressions");
    counts.openAlerts = countLocked(
        "SELECT COUNT(*) FROM instructor_alerts WHERE status IN ('new', 'acknowledged', 'in_progress')");
    counts.pendingPurges = countLocked(
        "SELECT COUNT(*) FROM privacy_consent WHERE withdrawn_at IS NOT NULL AND purged_at IS NULL");

    if (counts.signals < 0 || counts.snapshots < 0 || counts.struggleEvents < 0
        || counts.interventions < 0 || counts.suppressions < 0 || counts.openAlerts < 0
        || counts.pendingPurges < 0) {
        return std::nullopt;
    }
    return counts;
}

bool EngineStore::integrityCheck()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && std::strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

// ── ScopedQueryDeadline ─────────────────────────────────────

ScopedQueryDeadline::ScopedQueryDeadline(sqlite3* db, int64_t timeoutMs)
    : m_db(db)
    , m_timeoutMs(timeoutMs)
{
    m_timer.start();
    if (m_db && m_timeoutMs > 0) {
        sqlite3_progress_handler(m_db, 1000, &ScopedQueryDeadline::progressCallback, this);
    }
}

ScopedQueryDeadline::~ScopedQueryDeadline()
{
    if (m_db) {
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }
}

bool ScopedQueryDeadline::expired() const
{
    return m_expired;
}

int ScopedQueryDeadline::progressCallback(void* context)
{
    auto* self = static_cast<ScopedQueryDeadline*>(context);
    if (self->m_timer.elapsed() > self->m_timeoutMs) {
        self->m_expired = true;
        return 1;
    }
    return 0;
}

} // namespace lp
