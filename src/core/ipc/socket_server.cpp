#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace pl {

namespace {

bool socketHasLivePeer(const QString& socketPath)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    if (!peer.waitForConnected(150)) {
        return false;
    }
    peer.disconnectFromServer();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>())
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(plIpc, "Listening on %s", qUtf8Printable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(plIpc, "Failed to listen on %s: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasLivePeer(socketPath)) {
        const QString err = QStringLiteral("Socket already served by a running instance: %1")
                                .arg(socketPath);
        LOG_ERROR(plIpc, "%s", qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(plIpc, "Removing stale socket %s", qUtf8Printable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(plIpc, "Failed to listen on %s after stale cleanup: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(plIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    const QList<QLocalSocket*> clients = m_readBuffers.keys();
    m_readBuffers.clear();
    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(plIpc, "Closed %s", qUtf8Printable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

bool SocketServer::sendToCurrentClient(const QJsonObject& message)
{
    if (!m_currentClient) {
        return false;
    }
    const QByteArray frame = IpcMessage::encode(message);
    if (frame.isEmpty()) {
        return false;
    }
    m_currentClient->write(frame);
    m_currentClient->flush();
    return true;
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_readBuffers.insert(client, QByteArray());
        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);
        LOG_DEBUG(plIpc, "Client connected (%d open)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());
    if (buffer.size() > kMaxReadBufferSize) {
        dropClient(client, "read buffer overflow");
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && detachClient(client)) {
        client->deleteLater();
        LOG_DEBUG(plIpc, "Client disconnected (%d open)", clientCount());
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    return m_readBuffers.remove(client) > 0;
}

void SocketServer::dropClient(QLocalSocket* client, const char* reason)
{
    LOG_ERROR(plIpc, "Disconnecting client: %s", reason);
    const bool tracked = detachClient(client);
    client->disconnect(this);
    client->disconnectFromServer();
    if (tracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

void SocketServer::reply(QLocalSocket* client, const QJsonObject& message)
{
    const QByteArray frame = IpcMessage::encode(message);
    if (frame.isEmpty()) {
        const QByteArray fallback = IpcMessage::encode(IpcMessage::makeError(
            ipcRequestId(message), IpcErrorCode::InternalError,
            QStringLiteral("Reply exceeds the maximum message size")));
        client->write(fallback);
    } else {
        client->write(frame);
    }
    client->flush();
}

QJsonObject SocketServer::dispatch(const QJsonObject& request)
{
    if (!m_handler) {
        return IpcMessage::makeError(ipcRequestId(request), IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("No request handler registered"));
    }
    return m_handler(request);
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const IpcMessage::DecodeResult decoded = IpcMessage::decode(buffer);

        switch (decoded.status) {
        case IpcMessage::DecodeResult::Status::Incomplete:
            return;
        case IpcMessage::DecodeResult::Status::Oversized:
            dropClient(client, "oversized frame");
            return;
        case IpcMessage::DecodeResult::Status::Malformed:
            buffer.remove(0, decoded.bytesConsumed);
            reply(client, IpcMessage::makeError(0, IpcErrorCode::InvalidParams,
                                                QStringLiteral("Malformed JSON frame")));
            continue;
        case IpcMessage::DecodeResult::Status::Complete:
            break;
        }

        buffer.remove(0, decoded.bytesConsumed);

        const QJsonObject& incoming = decoded.json;
        const QString type = incoming.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("request")) {
            LOG_WARN(plIpc, "Ignoring message of type '%s'", qUtf8Printable(type));
            continue;
        }

        LOG_DEBUG(plIpc, "Request %llu: %s",
                  static_cast<unsigned long long>(ipcRequestId(incoming)),
                  qUtf8Printable(incoming.value(QStringLiteral("method")).toString()));
        m_currentClient = client;
        const QJsonObject outgoing = dispatch(incoming);
        m_currentClient = nullptr;
        reply(client, outgoing);
    }
}

} // namespace pl
