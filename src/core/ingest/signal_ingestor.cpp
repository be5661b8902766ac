#include "core/ingest/signal_ingestor.h"
#include "core/consent/consent_gate.h"
#include "core/shared/logging.h"

#include <QMessageAuthenticationCode>

namespace lp {

namespace {

bool constantTimeEquals(const QByteArray& a, const QByteArray& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (int i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a.at(i) ^ b.at(i));
    }
    return diff == 0;
}

bool readBoundedString(const QJsonObject& payload, const QString& key, int maxLength,
                       bool required, QString& out, QString* error)
{
    const QJsonValue value = payload.value(key);
    if (value.isUndefined() || value.isNull()) {
        if (required) {
            if (error) *error = QStringLiteral("missing field: %1").arg(key);
            return false;
        }
        out.clear();
        return true;
    }
    if (!value.isString()) {
        if (error) *error = QStringLiteral("field must be a string: %1").arg(key);
        return false;
    }
    out = value.toString();
    if (required && out.isEmpty()) {
        if (error) *error = QStringLiteral("empty field: %1").arg(key);
        return false;
    }
    if (out.size() > maxLength) {
        if (error) *error = QStringLiteral("field too long: %1").arg(key);
        return false;
    }
    return true;
}

} // namespace

QString ingestRejectionToString(IngestRejection rejection)
{
    switch (rejection) {
    case IngestRejection::None:             return QStringLiteral("None");
    case IngestRejection::SchemaViolation:  return QStringLiteral("SchemaViolation");
    case IngestRejection::InvalidOrigin:    return QStringLiteral("InvalidOrigin");
    case IngestRejection::InvalidSignature: return QStringLiteral("InvalidSignature");
    case IngestRejection::ReplayedNonce:    return QStringLiteral("ReplayedNonce");
    case IngestRejection::StaleTimestamp:   return QStringLiteral("StaleTimestamp");
    case IngestRejection::ConsentDenied:    return QStringLiteral("ConsentDenied");
    case IngestRejection::RateLimited:      return QStringLiteral("RateLimited");
    case IngestRejection::CapacityExceeded: return QStringLiteral("CapacityExceeded");
    }
    return QStringLiteral("None");
}

QString ingestErrorClass(IngestRejection rejection)
{
    switch (rejection) {
    case IngestRejection::None:
        return QString();
    case IngestRejection::ConsentDenied:
        return QStringLiteral("ConsentError");
    case IngestRejection::RateLimited:
    case IngestRejection::CapacityExceeded:
        return QStringLiteral("RateLimitExceeded");
    case IngestRejection::SchemaViolation:
    case IngestRejection::InvalidOrigin:
    case IngestRejection::InvalidSignature:
    case IngestRejection::ReplayedNonce:
    case IngestRejection::StaleTimestamp:
        return QStringLiteral("ValidationError");
    }
    return QStringLiteral("ValidationError");
}

int ingestStatusCode(IngestRejection rejection)
{
    switch (rejection) {
    case IngestRejection::None:             return 202;
    case IngestRejection::SchemaViolation:  return 400;
    case IngestRejection::StaleTimestamp:   return 400;
    case IngestRejection::InvalidOrigin:    return 403;
    case IngestRejection::ConsentDenied:    return 403;
    case IngestRejection::InvalidSignature: return 401;
    case IngestRejection::ReplayedNonce:    return 409;
    case IngestRejection::RateLimited:      return 429;
    case IngestRejection::CapacityExceeded: return 503;
    }
    return 400;
}

SignalIngestor::SignalIngestor(const IngestConfig& config, ConsentGate& consentGate)
    : m_config(config)
    , m_consentGate(consentGate)
    , m_nonces(config.noncesPerSession, config.maxTrackedSessions, config.maxSignalAgeMs)
{
    for (const QString& pattern : m_config.allowedOriginPatterns) {
        QRegularExpression regex(pattern, QRegularExpression::CaseInsensitiveOption);
        if (!regex.isValid()) {
            LOG_WARN(lpIngest, "Ignoring invalid origin pattern %s: %s",
                     qUtf8Printable(pattern), qUtf8Printable(regex.errorString()));
            continue;
        }
        m_originPatterns.push_back(regex);
    }
    if (m_config.hmacSecrets.isEmpty()) {
        LOG_WARN(lpIngest, "No HMAC secrets configured; every signal will fail authentication");
    }
}

QString SignalIngestor::computeSignature(const QString& sessionId, int64_t timestampMs,
                                         const QString& nonce, const QString& secret)
{
    const QByteArray message = sessionId.toUtf8() + '|'
        + QByteArray::number(static_cast<qlonglong>(timestampMs)) + '|' + nonce.toUtf8();
    return QString::fromLatin1(QMessageAuthenticationCode::hash(
        message, secret.toUtf8(), QCryptographicHash::Sha256).toHex());
}

IngestResult SignalIngestor::reject(IngestRejection rejection, const QString& reason,
                                    const BehavioralSignal& partial)
{
    if (rejection == IngestRejection::RateLimited) {
        // Silent drop: not an attack, not audited as one.
        m_rateLimited.fetch_add(1);
        LOG_DEBUG(lpIngest, "Rate limited session=%s", qUtf8Printable(partial.sessionId));
    } else {
        m_rejected.fetch_add(1);
        LOG_WARN(lpIngest, "Signal rejected reason=%s detail=%s session=%s tenant=%s origin=%s",
                 qUtf8Printable(ingestRejectionToString(rejection)),
                 qUtf8Printable(reason),
                 qUtf8Printable(partial.sessionId),
                 qUtf8Printable(partial.tenantId),
                 qUtf8Printable(partial.origin));
    }

    IngestResult result;
    result.accepted = false;
    result.rejection = rejection;
    result.reason = reason;
    return result;
}

bool SignalIngestor::parsePayload(const QJsonObject& payload, BehavioralSignal& out,
                                  QString& signature, QString* error) const
{
    const int idMax = m_config.maxIdLength;
    if (!readBoundedString(payload, QStringLiteral("sessionId"), idMax, true, out.sessionId, error)
        || !readBoundedString(payload, QStringLiteral("userId"), idMax, true, out.userId, error)
        || !readBoundedString(payload, QStringLiteral("tenantId"), idMax, true, out.tenantId, error)
        || !readBoundedString(payload, QStringLiteral("nonce"), idMax, true, out.nonce, error)
        || !readBoundedString(payload, QStringLiteral("origin"), 512, true, out.origin, error)
        || !readBoundedString(payload, QStringLiteral("signature"), 128, true, signature, error)
        || !readBoundedString(payload, QStringLiteral("courseId"), idMax, false, out.courseId, error)
        || !readBoundedString(payload, QStringLiteral("elementContext"),
                              m_config.maxElementContextLength, false, out.elementContext, error)
        || !readBoundedString(payload, QStringLiteral("pageContentHash"), idMax, false,
                              out.pageContentHash, error)) {
        return false;
    }

    QString typeName;
    if (!readBoundedString(payload, QStringLiteral("type"), 64, true, typeName, error)) {
        return false;
    }
    const std::optional<SignalType> type = signalTypeFromString(typeName);
    if (!type.has_value()) {
        if (error) *error = QStringLiteral("unknown signal type: %1").arg(typeName);
        return false;
    }
    out.type = *type;

    QString outcomeName;
    if (!readBoundedString(payload, QStringLiteral("outcome"), 32, false, outcomeName, error)) {
        return false;
    }
    const std::optional<SignalOutcome> outcome = signalOutcomeFromString(outcomeName);
    if (!outcome.has_value()) {
        if (error) *error = QStringLiteral("unknown outcome: %1").arg(outcomeName);
        return false;
    }
    out.outcome = *outcome;

    const QJsonValue duration = payload.value(QStringLiteral("durationMs"));
    const QJsonValue timestamp = payload.value(QStringLiteral("timestamp"));
    if (!duration.isDouble() || !timestamp.isDouble()) {
        if (error) *error = QStringLiteral("durationMs and timestamp must be numbers");
        return false;
    }
    constexpr qint64 kNotInteger = -1;
    out.durationMs = duration.toInteger(kNotInteger);
    out.timestampMs = timestamp.toInteger(kNotInteger);
    if (out.timestampMs <= 0) {
        if (error) *error = QStringLiteral("timestamp must be a positive integer");
        return false;
    }
    if (out.durationMs < 0 || out.durationMs > m_config.maxSignalDurationMs) {
        if (error) *error = QStringLiteral("durationMs out of range: %1").arg(out.durationMs);
        return false;
    }
    return true;
}

bool SignalIngestor::originAllowed(const QString& origin) const
{
    if (!origin.startsWith(QLatin1String("https://"), Qt::CaseInsensitive)) {
        return false;
    }
    for (const QString& allowed : m_config.allowedOrigins) {
        if (origin.compare(allowed, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    for (const QRegularExpression& pattern : m_originPatterns) {
        if (pattern.match(origin).hasMatch()) {
            return true;
        }
    }
    return false;
}

bool SignalIngestor::signatureValid(const BehavioralSignal& signal, const QString& signature) const
{
    const QByteArray provided = signature.toLower().toLatin1();
    bool matched = false;
    // Every secret is checked so timing does not reveal which one matched.
    for (const QString& secret : m_config.hmacSecrets) {
        const QByteArray expected = computeSignature(
            signal.sessionId, signal.timestampMs, signal.nonce, secret).toLatin1();
        if (constantTimeEquals(expected, provided)) {
            matched = true;
        }
    }
    return matched;
}

IngestResult SignalIngestor::ingest(const QJsonObject& payload, int64_t nowMs)
{
    BehavioralSignal signal;
    QString signature;
    QString error;

    if (!parsePayload(payload, signal, signature, &error)) {
        return reject(IngestRejection::SchemaViolation, error, signal);
    }

    if (nowMs - signal.timestampMs > m_config.maxSignalAgeMs) {
        return reject(IngestRejection::StaleTimestamp, QStringLiteral("timestamp too old"), signal);
    }
    if (signal.timestampMs - nowMs > m_config.maxClockSkewMs) {
        return reject(IngestRejection::StaleTimestamp,
                      QStringLiteral("timestamp in the future"), signal);
    }

    if (!originAllowed(signal.origin)) {
        return reject(IngestRejection::InvalidOrigin, QStringLiteral("origin not allowed"), signal);
    }

    if (!signatureValid(signal, signature)) {
        return reject(IngestRejection::InvalidSignature, QStringLiteral("hmac mismatch"), signal);
    }

    switch (m_nonces.tryAccept(signal.sessionId, signal.nonce, nowMs,
                               m_config.maxSignalsPerMinute)) {
    case NonceCache::Admission::Replayed:
        return reject(IngestRejection::ReplayedNonce, QStringLiteral("nonce already used"), signal);
    case NonceCache::Admission::RateLimited:
        return reject(IngestRejection::RateLimited, QStringLiteral("per-session rate limit"), signal);
    case NonceCache::Admission::Accepted:
        break;
    }

    const ConsentDecision consent = m_consentGate.check(
        signal.tenantId, signal.userId, ConsentScope::BehavioralTiming, nowMs);
    if (!consent.allowed) {
        m_nonces.release(signal.sessionId, signal.nonce);
        return reject(IngestRejection::ConsentDenied,
                      consentDenialReasonToString(consent.reason), signal);
    }

    if (consent.collectionLevel == CollectionLevel::Minimal) {
        signal.elementContext.clear();
    }
    signal.receivedAtMs = nowMs;

    m_accepted.fetch_add(1);
    IngestResult result;
    result.accepted = true;
    result.signal = signal;
    return result;
}

void SignalIngestor::forgetSession(const QString& sessionId)
{
    m_nonces.forgetSession(sessionId);
}

IngestStats SignalIngestor::stats() const
{
    IngestStats out;
    out.accepted = m_accepted.load();
    out.rejected = m_rejected.load();
    out.rateLimited = m_rateLimited.load();
    return out;
}

} // namespace lp
