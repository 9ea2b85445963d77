#pragma once

#include "core/ipc/message.h"
#include <QLocalSocket>
#include <QObject>
#include <memory>
#include <optional>
#include <vector>

namespace pl {

// SocketClient -- blocking request/reply client for a ServiceBase socket.
// Used by callers of the evidence service that run their own event loop or
// none at all.
class SocketClient : public QObject {
    Q_OBJECT
public:
    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // Waits up to timeoutMs for the reply with the matching id without
    // pumping the caller's event loop. nullopt on timeout or disconnect.
    // "partial" frames for the request are appended to *partials (their
    // "result" objects, in arrival order) or dropped when partials is null.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 30000,
                                           std::vector<QJsonObject>* partials = nullptr);

signals:
    void errorOccurred(const QString& error);

private:
    // Pops the next complete frame off m_readBuffer, if any.
    std::optional<QJsonObject> takeFrame();

    std::unique_ptr<QLocalSocket> m_socket;
    QByteArray m_readBuffer;
    uint64_t m_nextRequestId = 1;
};

} // namespace pl
