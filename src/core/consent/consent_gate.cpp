#include "core/consent/consent_gate.h"
#include "core/shared/logging.h"

namespace lp {

QString consentDenialReasonToString(ConsentDenialReason reason)
{
    switch (reason) {
    case ConsentDenialReason::None:                    return QStringLiteral("granted");
    case ConsentDenialReason::ScopeNotGranted:         return QStringLiteral("scope_not_granted");
    case ConsentDenialReason::ConsentWithdrawn:        return QStringLiteral("consent_withdrawn");
    case ConsentDenialReason::NoConsentRecord:         return QStringLiteral("no_consent_record");
    case ConsentDenialReason::ConsentStoreUnavailable: return QStringLiteral("consent_store_unavailable");
    case ConsentDenialReason::GateShutDown:            return QStringLiteral("gate_shut_down");
    }
    return QStringLiteral("no_consent_record");
}

ConsentGate::ConsentGate(ConsentSource& source, const ConsentConfig& config)
    : m_source(source)
    , m_config(config)
{
    if (m_config.consentFailureEscalationCount <= 0) {
        m_config.consentFailureEscalationCount = 3;
    }
}

QString ConsentGate::cacheKey(const QString& tenantId, const QString& userId)
{
    return tenantId + QLatin1Char('\x1f') + userId;
}

ConsentDecision ConsentGate::decide(const CacheEntry& entry, ConsentScope scope) const
{
    ConsentDecision decision;
    if (entry.status == ConsentLookupStatus::NotFound) {
        decision.reason = ConsentDenialReason::NoConsentRecord;
        return decision;
    }

    decision.collectionLevel = entry.record.collectionLevel;
    if (entry.record.withdrawnAtMs.has_value()) {
        decision.reason = ConsentDenialReason::ConsentWithdrawn;
        return decision;
    }
    if (!entry.record.scopes.grants(scope)) {
        decision.reason = ConsentDenialReason::ScopeNotGranted;
        return decision;
    }

    decision.allowed = true;
    decision.reason = ConsentDenialReason::None;
    return decision;
}

ConsentDecision ConsentGate::check(const QString& tenantId, const QString& userId,
                                   ConsentScope scope, int64_t nowMs)
{
    const QString key = cacheKey(tenantId, userId);
    uint64_t epochAtLookup = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            ++m_denials;
            ConsentDecision denied;
            denied.reason = ConsentDenialReason::GateShutDown;
            return denied;
        }
        auto it = m_cache.constFind(key);
        if (it != m_cache.constEnd() && nowMs - it->fetchedAtMs < m_config.cacheTtlMs) {
            ++m_cacheHits;
            const ConsentDecision decision = decide(*it, scope);
            if (!decision.allowed) {
                ++m_denials;
            }
            return decision;
        }
        ++m_cacheMisses;
        epochAtLookup = m_consentEpoch;
    }

    // Store lookup happens outside the lock.
    const ConsentLookup lookup = m_source.lookupConsent(tenantId, userId);

    if (lookup.status == ConsentLookupStatus::Unavailable) {
        EscalationFn escalation;
        OperationalAlert alert;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_storeFailures;
            ++m_denials;
            ++m_consecutiveFailures;
            if (m_consecutiveFailures == m_config.consentFailureEscalationCount) {
                escalation = m_escalation;
                alert.component = QStringLiteral("consent_gate");
                alert.code = QStringLiteral("consent_store_unavailable");
                alert.message = QStringLiteral("Consent store failed %1 consecutive lookups: %2")
                                    .arg(m_consecutiveFailures)
                                    .arg(lookup.error);
                alert.raisedAtMs = nowMs;
            }
        }
        LOG_WARN(lpConsent, "Consent lookup failed, denying: %s", qUtf8Printable(lookup.error));
        if (escalation) {
            escalation(alert);
        }
        ConsentDecision denied;
        denied.reason = ConsentDenialReason::ConsentStoreUnavailable;
        return denied;
    }

    CacheEntry entry;
    entry.status = lookup.status;
    entry.record = lookup.record;
    entry.fetchedAtMs = nowMs;
    const ConsentDecision decision = decide(entry, scope);

    PurgeRequestFn purgeRequest;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_consecutiveFailures = 0;
        // A consent change that landed during the lookup makes this row stale.
        if (!m_shutdown && m_consentEpoch == epochAtLookup) {
            m_cache.insert(key, entry);
        } else if (m_consentEpoch != epochAtLookup) {
            ++m_staleLookups;
        }
        if (!decision.allowed) {
            ++m_denials;
        }
        const bool needsPurge = decision.reason == ConsentDenialReason::ConsentWithdrawn
            && !entry.record.purgedAtMs.has_value()
            && !m_purgeRequested.contains(key);
        if (needsPurge) {
            m_purgeRequested.insert(key);
            ++m_purgeRequests;
            purgeRequest = m_purgeRequest;
        }
    }

    if (purgeRequest) {
        LOG_INFO(lpConsent, "Consent withdrawn, requesting purge tenant=%s",
                 qUtf8Printable(tenantId));
        purgeRequest(tenantId, userId);
    }
    return decision;
}

void ConsentGate::onConsentChanged(const QString& tenantId, const QString& userId)
{
    const QString key = cacheKey(tenantId, userId);
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_consentEpoch;
    m_cache.remove(key);
    m_purgeRequested.remove(key);
}

void ConsentGate::setPurgeRequestHandler(PurgeRequestFn handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_purgeRequest = std::move(handler);
}

void ConsentGate::setEscalationHandler(EscalationFn handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_escalation = std::move(handler);
}

void ConsentGate::shutdown()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdown = true;
    m_cache.clear();
    m_purgeRequested.clear();
}

ConsentGateStats ConsentGate::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ConsentGateStats out;
    out.cacheEntries = static_cast<size_t>(m_cache.size());
    out.cacheHits = m_cacheHits;
    out.cacheMisses = m_cacheMisses;
    out.denials = m_denials;
    out.storeFailures = m_storeFailures;
    out.consecutiveStoreFailures = m_consecutiveFailures;
    out.purgeRequests = m_purgeRequests;
    out.staleLookups = m_staleLookups;
    return out;
}

} // namespace lp
