#pragma once

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace lp {

struct TenantRetentionPolicy {
    QString tenantId;
    int signalRetentionDays = 30;
    int recordRetentionDays = 365;
};

struct RetentionSweepCounts {
    int signalsDeleted = 0;
    int snapshotsDeleted = 0;
    int recordsAnonymized = 0;
};

struct PendingPurge {
    QString tenantId;
    QString userId;
    int64_t withdrawnAtMs = 0;
};

// Storage operations the retention scheduler drives. Every call is scoped
// to one tenant or one user so a failure stays contained.
class RetentionBackend {
public:
    virtual ~RetentionBackend() = default;

    virtual std::vector<QString> tenantsWithData() = 0;
    virtual std::optional<TenantRetentionPolicy> tenantRetentionPolicy(const QString& tenantId) = 0;
    virtual bool applyTenantRetention(const QString& tenantId,
                                      int64_t signalCutoffMs,
                                      int64_t recordCutoffMs,
                                      int64_t nowMs,
                                      RetentionSweepCounts* counts,
                                      QString* errorOut) = 0;

    virtual std::vector<PendingPurge> withdrawnUnpurgedUsers() = 0;
    virtual bool purgeUser(const QString& tenantId, const QString& userId,
                           int64_t nowMs, QString* errorOut) = 0;

    // Both return the number of rows changed, or -1 on failure.
    virtual int timeoutStaleInterventions(int64_t deliveredBeforeMs, int64_t nowMs) = 0;
    virtual int expireStaleAlerts(int64_t updatedBeforeMs, int64_t nowMs) = 0;
};

} // namespace lp
