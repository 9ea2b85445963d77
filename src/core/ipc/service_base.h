#pragma once

#include "core/ipc/socket_server.h"
#include <QHash>
#include <QObject>
#include <QString>
#include <functional>
#include <memory>

namespace pl {

// ServiceBase -- a named local-socket service with a method table.
//
// ping and shutdown are registered by default; subclasses add their own
// methods with registerMethod(). Handlers receive the request's "params"
// object and return a complete reply (IpcMessage::makeResponse/makeError).
// A handler whose reply would not fit in one frame sends the leading pieces
// with sendPartial() first.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens on socketPath(serviceName) and enters the event loop.
    int run();

    const QString& serviceName() const { return m_serviceName; }

    // /tmp/policylens-<uid>, or POLICYLENS_RUNTIME_DIR
    static QString runtimeDirectory();
    // runtimeDirectory(), or POLICYLENS_SOCKET_DIR
    static QString socketDirectory();
    static QString socketPath(const QString& serviceName);

protected:
    using MethodHandler = std::function<QJsonObject(uint64_t id, const QJsonObject& params)>;

    void registerMethod(const QString& method, MethodHandler handler);
    QJsonObject handleRequest(const QJsonObject& request);

    // Streams part of a reply to the requesting client ahead of the final
    // response. Only valid while a handler is running.
    virtual bool sendPartial(uint64_t id, const QJsonObject& result);

private:
    QJsonObject handlePing(uint64_t id);
    QJsonObject handleShutdown(uint64_t id);

    QString m_serviceName;
    QHash<QString, MethodHandler> m_methods;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace pl
