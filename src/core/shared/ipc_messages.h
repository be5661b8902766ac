#pragma once

#include <QString>
#include <cstdint>

namespace lp {

// Error codes carried in IPC error envelopes
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    PermissionDenied   = 3,
    NotFound           = 4,
    AlreadyRunning     = 5,
    InternalError      = 6,
    Unsupported        = 7,
    ServiceUnavailable = 8,
    Conflict           = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::PermissionDenied:   return QStringLiteral("PERMISSION_DENIED");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::AlreadyRunning:     return QStringLiteral("ALREADY_RUNNING");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    case IpcErrorCode::Conflict:           return QStringLiteral("CONFLICT");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace lp
