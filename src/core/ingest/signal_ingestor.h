#pragma once

#include "core/ingest/nonce_cache.h"
#include "core/shared/settings.h"
#include "core/shared/struggle_types.h"

#include <QJsonObject>
#include <QRegularExpression>
#include <QString>

#include <atomic>
#include <cstdint>
#include <vector>

namespace lp {

class ConsentGate;

enum class IngestRejection {
    None,
    SchemaViolation,
    InvalidOrigin,
    InvalidSignature,
    ReplayedNonce,
    StaleTimestamp,
    ConsentDenied,
    RateLimited,
    CapacityExceeded,
};

QString ingestRejectionToString(IngestRejection rejection);

// ValidationError / ConsentError / RateLimitExceeded
QString ingestErrorClass(IngestRejection rejection);

// 202 for accepted, 4xx/503 otherwise.
int ingestStatusCode(IngestRejection rejection);

struct IngestResult {
    bool accepted = false;
    IngestRejection rejection = IngestRejection::None;
    QString reason;
    BehavioralSignal signal;
};

struct IngestStats {
    size_t accepted = 0;
    size_t rejected = 0;
    size_t rateLimited = 0;
};

// SignalIngestor -- validates, authenticates and normalizes raw signals.
//
// Checks run cheapest first: schema, freshness, origin, HMAC, replay, rate,
// consent. Rejections are audited on the ingest category and never retried.
class SignalIngestor {
public:
    SignalIngestor(const IngestConfig& config, ConsentGate& consentGate);

    IngestResult ingest(const QJsonObject& payload, int64_t nowMs);

    void forgetSession(const QString& sessionId);

    IngestStats stats() const;

    // Hex HMAC-SHA256 over "sessionId|timestamp|nonce".
    static QString computeSignature(const QString& sessionId, int64_t timestampMs,
                                    const QString& nonce, const QString& secret);

private:
    IngestResult reject(IngestRejection rejection, const QString& reason,
                        const BehavioralSignal& partial);
    bool parsePayload(const QJsonObject& payload, BehavioralSignal& out,
                      QString& signature, QString* error) const;
    bool originAllowed(const QString& origin) const;
    bool signatureValid(const BehavioralSignal& signal, const QString& signature) const;

    IngestConfig m_config;
    ConsentGate& m_consentGate;
    std::vector<QRegularExpression> m_originPatterns;
    NonceCache m_nonces;

    std::atomic<size_t> m_accepted{0};
    std::atomic<size_t> m_rejected{0};
    std::atomic<size_t> m_rateLimited{0};
};

} // namespace lp
