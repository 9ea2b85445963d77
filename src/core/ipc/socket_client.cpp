#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"
#include <QElapsedTimer>

#include <algorithm>

namespace pl {

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(std::make_unique<QLocalSocket>())
{
}

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    if (socketPath.trimmed().isEmpty() || timeoutMs <= 0) {
        const QString err = QStringLiteral("Invalid connect request: path='%1' timeout=%2ms")
                                .arg(socketPath)
                                .arg(timeoutMs);
        LOG_ERROR(plIpc, "%s", qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    if (isConnected() && m_socket->serverName() == socketPath) {
        return true;
    }

    m_socket->abort();
    m_readBuffer.clear();

    m_socket->connectToServer(socketPath);
    if (!m_socket->waitForConnected(timeoutMs)) {
        LOG_DEBUG(plIpc, "Connect to %s failed: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(m_socket->errorString()));
        return false;
    }

    LOG_DEBUG(plIpc, "Connected to %s", qUtf8Printable(socketPath));
    return true;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    m_readBuffer.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::takeFrame()
{
    for (;;) {
        const IpcMessage::DecodeResult decoded = IpcMessage::decode(m_readBuffer);
        switch (decoded.status) {
        case IpcMessage::DecodeResult::Status::Incomplete:
            return std::nullopt;
        case IpcMessage::DecodeResult::Status::Oversized:
            LOG_ERROR(plIpc, "Server sent an oversized frame; dropping connection");
            m_socket->abort();
            m_readBuffer.clear();
            return std::nullopt;
        case IpcMessage::DecodeResult::Status::Malformed:
            m_readBuffer.remove(0, decoded.bytesConsumed);
            continue;
        case IpcMessage::DecodeResult::Status::Complete:
            m_readBuffer.remove(0, decoded.bytesConsumed);
            return decoded.json;
        }
    }
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs,
                                                     std::vector<QJsonObject>* partials)
{
    if (!isConnected()) {
        LOG_WARN(plIpc, "Cannot send %s: not connected", qUtf8Printable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray frame = IpcMessage::encode(IpcMessage::makeRequest(id, method, params));
    if (frame.isEmpty()) {
        return std::nullopt;
    }

    m_socket->write(frame);
    m_socket->flush();

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        while (std::optional<QJsonObject> reply = takeFrame()) {
            if (ipcRequestId(*reply) == id) {
                if (reply->value(QStringLiteral("type")).toString() != QLatin1String("partial")) {
                    return reply;
                }
                if (partials) {
                    partials->push_back(reply->value(QStringLiteral("result")).toObject());
                }
                continue;
            }
            LOG_DEBUG(plIpc, "Dropping reply for stale request %llu",
                      static_cast<unsigned long long>(ipcRequestId(*reply)));
        }
        if (!isConnected()) {
            break;
        }

        const int remainingMs = std::max(1, timeoutMs - static_cast<int>(timer.elapsed()));
        if (m_socket->bytesAvailable() > 0 || m_socket->waitForReadyRead(std::min(remainingMs, 50))) {
            m_readBuffer.append(m_socket->readAll());
        }
    }

    LOG_WARN(plIpc, "No reply to %s (id %llu) within %d ms",
             qUtf8Printable(method), static_cast<unsigned long long>(id), timeoutMs);
    return std::nullopt;
}

} // namespace pl
