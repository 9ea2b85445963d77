#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace pl {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(plIpc, "Refusing to encode %lld byte message (max %d)",
                 static_cast<long long>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame(kHeaderSize, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    return frame;
}

IpcMessage::DecodeResult IpcMessage::decode(const QByteArray& buffer)
{
    DecodeResult result;
    if (buffer.size() < kHeaderSize) {
        return result;
    }

    const quint32 payloadLen = qFromBigEndian<quint32>(buffer.constData());
    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(plIpc, "Frame declares %u bytes (max %d)", payloadLen, kMaxMessageSize);
        result.status = DecodeResult::Status::Oversized;
        return result;
    }

    const int frameLen = kHeaderSize + static_cast<int>(payloadLen);
    if (buffer.size() < frameLen) {
        return result;
    }

    result.bytesConsumed = frameLen;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(kHeaderSize, static_cast<int>(payloadLen)), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(plIpc, "Discarding malformed frame: %s",
                 parseError.error != QJsonParseError::NoError
                     ? qUtf8Printable(parseError.errorString())
                     : "payload is not a JSON object");
        result.status = DecodeResult::Status::Malformed;
        return result;
    }

    result.status = DecodeResult::Status::Complete;
    result.json = doc.object();
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json{
        {QStringLiteral("type"), QStringLiteral("request")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("method"), method},
    };
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    return QJsonObject{
        {QStringLiteral("type"), QStringLiteral("response")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("result"), result},
    };
}

QJsonObject IpcMessage::makePartial(uint64_t id, const QJsonObject& result)
{
    return QJsonObject{
        {QStringLiteral("type"), QStringLiteral("partial")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("result"), result},
    };
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    const QJsonObject error{
        {QStringLiteral("code"), static_cast<int>(code)},
        {QStringLiteral("codeString"), ipcErrorCodeToString(code)},
        {QStringLiteral("message"), message},
    };
    return QJsonObject{
        {QStringLiteral("type"), QStringLiteral("error")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("error"), error},
    };
}

} // namespace pl
