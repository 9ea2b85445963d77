#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>

namespace pl {

// Wire framing for the evidence socket: a 4-byte big-endian payload length
// followed by compact UTF-8 JSON.
class IpcMessage {
public:
    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;

    // Empty when the encoded payload would exceed kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        enum class Status {
            Incomplete,   // wait for more bytes
            Complete,
            Malformed,    // frame consumed, payload was not a JSON object
            Oversized,    // declared length exceeds kMaxMessageSize
        };

        Status status = Status::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static DecodeResult decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method,
                                   const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    // One piece of a reply too large for a single frame. Partials for an id
    // arrive in order before its response.
    static QJsonObject makePartial(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
};

} // namespace pl
