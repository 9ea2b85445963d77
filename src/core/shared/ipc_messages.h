#pragma once

#include <QJsonObject>
#include <QString>
#include <cstdint>

namespace pl {

// Error codes carried in the "error" object of an IPC reply.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    NotFound           = 4,
    InternalError      = 6,
    Unsupported        = 7,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

// Methods understood by the evidence service.
namespace ipc_method {
inline const QString kPing         = QStringLiteral("ping");
inline const QString kShutdown     = QStringLiteral("shutdown");
inline const QString kPackEvidence = QStringLiteral("packEvidence");
inline const QString kSearchPages  = QStringLiteral("searchPages");
} // namespace ipc_method

inline uint64_t ipcRequestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

} // namespace pl
