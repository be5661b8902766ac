#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace lp {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    QJsonDocument doc(json);
    QByteArray payload = doc.toJson(QJsonDocument::Compact);

    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(lpIpc, "Message exceeds max size: %d > %d",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray msg;
    msg.reserve(4 + payload.size());

    quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    msg.append(reinterpret_cast<const char*>(&len), 4);
    msg.append(payload);

    return msg;
}

IpcMessage::DecodeResult IpcMessage::decode(const QByteArray& buffer)
{
    DecodeResult result;
    if (buffer.size() < 4) {
        return result;
    }

    quint32 rawLen;
    std::memcpy(&rawLen, buffer.constData(), 4);
    const quint32 payloadLen = qFromBigEndian(rawLen);

    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        // The stream cannot be resynchronized after a bogus length.
        LOG_WARN(lpIpc, "Received message length exceeds max: %u > %d",
                 payloadLen, kMaxMessageSize);
        result.status = DecodeStatus::Invalid;
        result.bytesConsumed = 0;
        return result;
    }

    const int totalLen = 4 + static_cast<int>(payloadLen);
    if (buffer.size() < totalLen) {
        return result;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(buffer.mid(4, static_cast<int>(payloadLen)),
                                                &parseError);
    result.bytesConsumed = totalLen;

    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(lpIpc, "JSON parse error: %s", qPrintable(parseError.errorString()));
        result.status = DecodeStatus::Invalid;
        return result;
    }
    if (!doc.isObject()) {
        LOG_WARN(lpIpc, "Expected JSON object frame");
        result.status = DecodeStatus::Invalid;
        return result;
    }

    result.status = DecodeStatus::Ok;
    result.json = doc.object();
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject errorObj;
    errorObj[QStringLiteral("code")] = static_cast<int>(code);
    errorObj[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    errorObj[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = errorObj;
    return json;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("notification");
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

} // namespace lp
