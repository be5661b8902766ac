#pragma once

#include "core/consent/consent_source.h"
#include "core/retention/retention_backend.h"
#include "core/shared/struggle_types.h"

#include <QByteArray>
#include <QElapsedTimer>
#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace lp {

struct SessionSnapshotRow {
    QString sessionId;
    QString tenantId;
    QString userId;
    QString courseId;
    int sampleCount = 0;
    QByteArray featuresJson;
    int64_t openedAtMs = 0;
    int64_t closedAtMs = 0;
    QString closeReason;
};

struct StoreCounts {
    int64_t signals = 0;
    int64_t snapshots = 0;
    int64_t struggleEvents = 0;
    int64_t interventions = 0;
    int64_t suppressions = 0;
    int64_t openAlerts = 0;
    int64_t pendingPurges = 0;
};

// EngineStore -- owner of the engine's SQLite database.
//
// One connection shared by the session workers, the async writer and the
// scheduled scans; every public call takes the store mutex. Callers that
// need several statements in one transaction use acquire().
class EngineStore : public ConsentSource, public RetentionBackend {
public:
    ~EngineStore() override;

    EngineStore(const EngineStore&) = delete;
    EngineStore& operator=(const EngineStore&) = delete;

    // Open or create the database at the given path (":memory:" allowed).
    // Creates schema and sets pragmas on first open.
    static std::unique_ptr<EngineStore> open(const QString& dbPath);

    // Exclusive access to the raw connection for the lifetime of the object.
    class Connection {
    public:
        sqlite3* db() const { return m_db; }

    private:
        friend class EngineStore;
        Connection(std::mutex& mutex, sqlite3* db)
            : m_lock(mutex)
            , m_db(db)
        {
        }

        std::unique_lock<std::mutex> m_lock;
        sqlite3* m_db = nullptr;
    };

    Connection acquire();

    // ── Consent ─────────────────────────────────────────────

    ConsentLookup lookupConsent(const QString& tenantId, const QString& userId) override;
    bool upsertConsent(const ConsentRecord& record);

    // Applies one webhook event. scope == nullopt means every scope.
    // Withdrawing behavioral_timing or every scope stamps withdrawn_at.
    // Returns the resulting record, or nullopt on failure.
    std::optional<ConsentRecord> applyConsentChange(const QString& tenantId,
                                                    const QString& userId,
                                                    std::optional<ConsentScope> scope,
                                                    bool granted,
                                                    int64_t nowMs);

    // ── Learner data ────────────────────────────────────────

    // Duplicate (session, nonce) pairs are ignored.
    bool insertSignal(const BehavioralSignal& signal);
    bool upsertSessionSnapshot(const SessionSnapshotRow& row);
    bool insertAssessment(const StruggleAssessment& assessment);
    bool insertSuppression(const SuppressionRecord& record);

    // ── Interventions ───────────────────────────────────────

    bool insertIntervention(const InterventionRecord& record);
    std::optional<InterventionRecord> getIntervention(const QString& interventionId);

    // Both return false when the record does not exist or the write fails.
    bool recordDelivery(const QString& interventionId, int64_t deliveredAtMs);
    bool recordResponse(const QString& interventionId, UserResponse response, int64_t respondedAtMs);

    bool updateEffectiveness(const QString& interventionId, double score);

    std::vector<InterventionRecord> interventionsForUserSince(const QString& tenantId,
                                                              const QString& userId,
                                                              int64_t sinceMs);

    // ── Courses and tenants ─────────────────────────────────

    bool setCourseInstructor(const QString& tenantId, const QString& courseId,
                             const QString& instructorId);
    bool setTenantRetention(const TenantRetentionPolicy& policy, int64_t nowMs);

    // ── RetentionBackend ────────────────────────────────────

    std::vector<QString> tenantsWithData() override;
    std::optional<TenantRetentionPolicy> tenantRetentionPolicy(const QString& tenantId) override;
    bool applyTenantRetention(const QString& tenantId,
                              int64_t signalCutoffMs,
                              int64_t recordCutoffMs,
                              int64_t nowMs,
                              RetentionSweepCounts* counts,
                              QString* errorOut) override;
    std::vector<PendingPurge> withdrawnUnpurgedUsers() override;
    bool purgeUser(const QString& tenantId, const QString& userId,
                   int64_t nowMs, QString* errorOut) override;
    int timeoutStaleInterventions(int64_t deliveredBeforeMs, int64_t nowMs) override;
    int expireStaleAlerts(int64_t updatedBeforeMs, int64_t nowMs) override;

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Health ──────────────────────────────────────────────

    std::optional<StoreCounts> counts();

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck();

private:
    EngineStore() = default;
    bool init(const QString& dbPath);
    bool execLocked(const char* sql);
    std::optional<QString> getSettingLocked(const QString& key);
    int64_t countLocked(const char* sql);

    mutable std::mutex m_mutex;
    sqlite3* m_db = nullptr;
};

// Aborts long-running statements on the connection once the deadline
// passes (sqlite3_step then fails with SQLITE_INTERRUPT). Removed on scope exit.
class ScopedQueryDeadline {
public:
    ScopedQueryDeadline(sqlite3* db, int64_t timeoutMs);
    ~ScopedQueryDeadline();

    ScopedQueryDeadline(const ScopedQueryDeadline&) = delete;
    ScopedQueryDeadline& operator=(const ScopedQueryDeadline&) = delete;

    bool expired() const;

private:
    static int progressCallback(void* context);

    sqlite3* m_db = nullptr;
    QElapsedTimer m_timer;
    int64_t m_timeoutMs = 0;
    bool m_expired = false;
};

// Binding helpers shared by the store and the aggregator.
namespace sql {

void bindText(sqlite3_stmt* stmt, int index, const QString& value);
void bindTextOrNull(sqlite3_stmt* stmt, int index, const QString& value);
void bindInt64OrNull(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value);
void bindDoubleOrNull(sqlite3_stmt* stmt, int index, const std::optional<double>& value);
QString columnText(sqlite3_stmt* stmt, int column);
std::optional<int64_t> columnInt64OrNull(sqlite3_stmt* stmt, int column);
std::optional<double> columnDoubleOrNull(sqlite3_stmt* stmt, int column);

// sqlite3_busy_timeout's handler is not invoked when SQLite detects a
// potential WAL deadlock; in that case step returns SQLITE_BUSY immediately,
// so retry at the application level.
int stepWithRetry(sqlite3_stmt* stmt);

bool exec(sqlite3* db, const char* statement);

} // namespace sql

} // namespace lp
