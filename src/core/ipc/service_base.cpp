#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace pl {

namespace {

QString envDirectory(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>())
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });

    registerMethod(ipc_method::kPing, [this](uint64_t id, const QJsonObject&) {
        return handlePing(id);
    });
    registerMethod(ipc_method::kShutdown, [this](uint64_t id, const QJsonObject&) {
        return handleShutdown(id);
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);

    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !QDir().mkpath(dir.path())) {
        LOG_ERROR(plIpc, "Failed to create socket directory %s", qUtf8Printable(dir.path()));
        return 1;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(plIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return 1;
    }

    LOG_INFO(plIpc, "Service '%s' ready on %s",
             qUtf8Printable(m_serviceName), qUtf8Printable(path));

    // Readiness line for whoever launched us
    fprintf(stdout, "ready\n");
    fflush(stdout);

    const int code = QCoreApplication::exec();
    m_server->close();
    return code;
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = envDirectory("POLICYLENS_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return QStringLiteral("/tmp/policylens-%1").arg(getuid());
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = envDirectory("POLICYLENS_SOCKET_DIR");
    return socketDir.isEmpty() ? runtimeDirectory() : socketDir;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

void ServiceBase::registerMethod(const QString& method, MethodHandler handler)
{
    m_methods.insert(method, std::move(handler));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const uint64_t id = ipcRequestId(request);
    const QString method = request.value(QStringLiteral("method")).toString();

    const auto it = m_methods.constFind(method);
    if (it == m_methods.constEnd()) {
        LOG_WARN(plIpc, "Unknown method '%s' for service '%s'",
                 qUtf8Printable(method), qUtf8Printable(m_serviceName));
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown method: %1").arg(method));
    }

    return it.value()(id, request.value(QStringLiteral("params")).toObject());
}

bool ServiceBase::sendPartial(uint64_t id, const QJsonObject& result)
{
    return m_server->sendToCurrentClient(IpcMessage::makePartial(id, result));
}

QJsonObject ServiceBase::handlePing(uint64_t id)
{
    return IpcMessage::makeResponse(id, QJsonObject{
        {QStringLiteral("pong"), true},
        {QStringLiteral("service"), m_serviceName},
        {QStringLiteral("timestamp"), QDateTime::currentMSecsSinceEpoch()},
    });
}

QJsonObject ServiceBase::handleShutdown(uint64_t id)
{
    LOG_INFO(plIpc, "Shutdown requested for service '%s'", qUtf8Printable(m_serviceName));

    // Quit after this reply has been written.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);

    return IpcMessage::makeResponse(id, QJsonObject{{QStringLiteral("shuttingDown"), true}});
}

} // namespace pl
