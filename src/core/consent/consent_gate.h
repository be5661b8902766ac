#pragma once

#include "core/consent/consent_source.h"
#include "core/shared/settings.h"
#include "core/shared/struggle_types.h"

#include <QHash>
#include <QSet>
#include <QString>

#include <cstdint>
#include <functional>
#include <mutex>

namespace lp {

enum class ConsentDenialReason {
    None,
    ScopeNotGranted,
    ConsentWithdrawn,
    NoConsentRecord,
    ConsentStoreUnavailable,
    GateShutDown,
};

QString consentDenialReasonToString(ConsentDenialReason reason);

struct ConsentDecision {
    bool allowed = false;
    ConsentDenialReason reason = ConsentDenialReason::NoConsentRecord;
    CollectionLevel collectionLevel = CollectionLevel::Minimal;
};

struct ConsentGateStats {
    size_t cacheEntries = 0;
    size_t cacheHits = 0;
    size_t cacheMisses = 0;
    size_t denials = 0;
    size_t storeFailures = 0;
    int consecutiveStoreFailures = 0;
    size_t purgeRequests = 0;
    size_t staleLookups = 0;
};

// ConsentGate -- cache-first consent check used by every write path.
//
// Found and not-found lookups are cached for cacheTtlMs; the consent
// webhook invalidates entries explicitly. An unreachable store denies
// (fail closed) and is never cached. The cache lives from construction
// until shutdown().
class ConsentGate {
public:
    using PurgeRequestFn = std::function<void(const QString& tenantId, const QString& userId)>;
    using EscalationFn = std::function<void(const OperationalAlert& alert)>;

    explicit ConsentGate(ConsentSource& source, const ConsentConfig& config = {});

    ConsentDecision check(const QString& tenantId, const QString& userId,
                          ConsentScope scope, int64_t nowMs);

    // Drops the cached entry so the next check reads the store. A later
    // withdrawal may request a purge again. Lookups already in flight when
    // this runs are not cached.
    void onConsentChanged(const QString& tenantId, const QString& userId);

    // Called once per withdrawn user until onConsentChanged.
    void setPurgeRequestHandler(PurgeRequestFn handler);
    void setEscalationHandler(EscalationFn handler);

    // Clears the cache; every later check is denied.
    void shutdown();

    ConsentGateStats stats() const;

private:
    struct CacheEntry {
        ConsentLookupStatus status = ConsentLookupStatus::NotFound;
        ConsentRecord record;
        int64_t fetchedAtMs = 0;
    };

    static QString cacheKey(const QString& tenantId, const QString& userId);
    ConsentDecision decide(const CacheEntry& entry, ConsentScope scope) const;

    ConsentSource& m_source;
    ConsentConfig m_config;

    mutable std::mutex m_mutex;
    QHash<QString, CacheEntry> m_cache;
    QSet<QString> m_purgeRequested;
    PurgeRequestFn m_purgeRequest;
    EscalationFn m_escalation;
    bool m_shutdown = false;
    uint64_t m_consentEpoch = 0;

    size_t m_cacheHits = 0;
    size_t m_cacheMisses = 0;
    size_t m_denials = 0;
    size_t m_storeFailures = 0;
    int m_consecutiveFailures = 0;
    size_t m_purgeRequests = 0;
    size_t m_staleLookups = 0;
};

} // namespace lp
