#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <cstdint>

namespace lp {

class IpcMessage {
public:
    // Encode a JSON object to a length-prefixed frame (4-byte BE uint32 + UTF-8 JSON).
    // Returns an empty array if the payload is over kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    enum class DecodeStatus {
        Incomplete,     // wait for more bytes
        Ok,
        Invalid,        // frame is unusable; skip bytesConsumed (0 = drop the buffer)
    };

    struct DecodeResult {
        DecodeStatus status = DecodeStatus::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static DecodeResult decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    // Notifications carry no id
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    // Max message size: 1MB
    static constexpr int kMaxMessageSize = 1024 * 1024;
};

} // namespace lp
