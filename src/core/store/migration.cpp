#include "core/store/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <cstdlib>

namespace lp {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                version = std::atoi(val);
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(lpStore, "Schema version %d is newer than engine version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(lpStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(lpStore, "Applying schema migration 1 -> 2");

        // Per-tenant retention horizons. Tenants without a row use the
        // engine-wide defaults.
        if (!exec(R"(
            CREATE TABLE IF NOT EXISTS tenant_retention (
                tenant_id TEXT PRIMARY KEY,
                signal_retention_days INTEGER NOT NULL,
                record_retention_days INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
        )")) {
            return false;
        }

        if (!exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');")) {
            return false;
        }

        current = 2;
    }

    return current == targetVersion;
}

} // namespace lp
