#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace pl {

// SocketServer -- QLocalServer that decodes framed requests, hands each to a
// handler on the event-loop thread and writes the reply back to the sender.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // Replaces a stale socket file, refuses a socket with a live peer.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const { return static_cast<int>(m_readBuffers.size()); }

    void setRequestHandler(RequestHandler handler);

    // Writes a frame to the client whose request is being handled, ahead of
    // the handler's reply. False outside a handler or if the frame is too big.
    bool sendToCurrentClient(const QJsonObject& message);

    // A client whose unparsed input grows past this is disconnected.
    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + IpcMessage::kHeaderSize;

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    void processBuffer(QLocalSocket* client);
    QJsonObject dispatch(const QJsonObject& request);
    void reply(QLocalSocket* client, const QJsonObject& message);
    void dropClient(QLocalSocket* client, const char* reason);
    bool detachClient(QLocalSocket* client);

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    QLocalSocket* m_currentClient = nullptr;
    bool m_closing = false;
};

} // namespace pl
