#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/ipc/socket_server.h"

#include <QElapsedTimer>
#include <QFile>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QtEndian>

#include <memory>
#include <optional>

namespace {

// Reads frames off a raw client socket as they arrive.
class FrameReader {
public:
    explicit FrameReader(QLocalSocket& socket) : m_socket(socket) {}

    std::optional<QJsonObject> next()
    {
        m_buffer.append(m_socket.readAll());
        const auto decoded = pl::IpcMessage::decode(m_buffer);
        if (decoded.status != pl::IpcMessage::DecodeResult::Status::Complete) {
            return std::nullopt;
        }
        m_buffer.remove(0, decoded.bytesConsumed);
        return decoded.json;
    }

private:
    QLocalSocket& m_socket;
    QByteArray m_buffer;
};

std::optional<QJsonObject> waitForFrame(FrameReader& reader, int timeoutMs = 5000)
{
    std::optional<QJsonObject> frame;
    QElapsedTimer timer;
    timer.start();
    while (!(frame = reader.next()) && timer.elapsed() < timeoutMs) {
        QTest::qWait(10);
    }
    return frame;
}

} // namespace

class TestSocketServer : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRequestRoundTrip();
    void testPipelinedRequestsAnsweredInOrder();
    void testMalformedFrameGetsErrorReply();
    void testNonRequestMessagesIgnored();
    void testOversizedFrameDisconnects();
    void testNoHandlerReportsUnavailable();
    void testPartialFramesPrecedeResponse();
    void testSendToCurrentClientOutsideHandler();
    void testSecondServerRefusedWhileFirstIsLive();
    void testStaleSocketIsReplaced();

private:
    QString socketPath() const { return m_dir->filePath(QStringLiteral("unit.sock")); }
    void connectClient(QLocalSocket& socket);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<pl::SocketServer> m_server;
};

void TestSocketServer::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_server = std::make_unique<pl::SocketServer>();
    m_server->setRequestHandler([](const QJsonObject& request) {
        const QJsonObject params = request.value(QStringLiteral("params")).toObject();
        return pl::IpcMessage::makeResponse(
            pl::ipcRequestId(request),
            QJsonObject{{QStringLiteral("echo"), params.value(QStringLiteral("text"))}});
    });
    QVERIFY(m_server->listen(socketPath()));
}

void TestSocketServer::cleanup()
{
    m_server.reset();
    m_dir.reset();
}

void TestSocketServer::connectClient(QLocalSocket& socket)
{
    socket.connectToServer(socketPath());
    QVERIFY(socket.waitForConnected(2000));
    QTRY_COMPARE(m_server->clientCount(), 1);
}

void TestSocketServer::testRequestRoundTrip()
{
    QLocalSocket socket;
    connectClient(socket);
    FrameReader reader(socket);

    socket.write(pl::IpcMessage::encode(pl::IpcMessage::makeRequest(
        7, QStringLiteral("echo"), QJsonObject{{QStringLiteral("text"), QStringLiteral("hello")}})));
    socket.flush();

    const auto reply = waitForFrame(reader);
    QVERIFY(reply.has_value());
    QCOMPARE(reply->value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(pl::ipcRequestId(*reply), uint64_t(7));
    QCOMPARE(reply->value(QStringLiteral("result")).toObject()
                 .value(QStringLiteral("echo")).toString(),
             QStringLiteral("hello"));
}

void TestSocketServer::testPipelinedRequestsAnsweredInOrder()
{
    QLocalSocket socket;
    connectClient(socket);
    FrameReader reader(socket);

    QByteArray batch;
    for (int i = 1; i <= 3; ++i) {
        batch.append(pl::IpcMessage::encode(pl::IpcMessage::makeRequest(
            i, QStringLiteral("echo"), QJsonObject{{QStringLiteral("text"), QString::number(i)}})));
    }
    // Split mid-frame to exercise partial reads.
    socket.write(batch.left(10));
    socket.flush();
    QTest::qWait(20);
    socket.write(batch.mid(10));
    socket.flush();

    for (int i = 1; i <= 3; ++i) {
        const auto reply = waitForFrame(reader);
        QVERIFY(reply.has_value());
        QCOMPARE(pl::ipcRequestId(*reply), uint64_t(i));
    }
}

void TestSocketServer::testMalformedFrameGetsErrorReply()
{
    QLocalSocket socket;
    connectClient(socket);
    FrameReader reader(socket);

    const QByteArray payload("{oops");
    QByteArray frame(pl::IpcMessage::kHeaderSize, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    frame.append(pl::IpcMessage::encode(pl::IpcMessage::makeRequest(3, QStringLiteral("echo"))));
    socket.write(frame);
    socket.flush();

    const auto error = waitForFrame(reader);
    QVERIFY(error.has_value());
    QCOMPARE(error->value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    QCOMPARE(error->value(QStringLiteral("error")).toObject()
                 .value(QStringLiteral("codeString")).toString(),
             QStringLiteral("INVALID_PARAMS"));

    // The connection stays usable after a bad frame.
    const auto reply = waitForFrame(reader);
    QVERIFY(reply.has_value());
    QCOMPARE(pl::ipcRequestId(*reply), uint64_t(3));
    QCOMPARE(m_server->clientCount(), 1);
}

void TestSocketServer::testNonRequestMessagesIgnored()
{
    QLocalSocket socket;
    connectClient(socket);
    FrameReader reader(socket);

    socket.write(pl::IpcMessage::encode(
        pl::IpcMessage::makeResponse(1, QJsonObject{{QStringLiteral("stray"), true}})));
    socket.write(pl::IpcMessage::encode(pl::IpcMessage::makeRequest(2, QStringLiteral("echo"))));
    socket.flush();

    const auto reply = waitForFrame(reader);
    QVERIFY(reply.has_value());
    QCOMPARE(pl::ipcRequestId(*reply), uint64_t(2));
}

void TestSocketServer::testOversizedFrameDisconnects()
{
    QLocalSocket socket;
    connectClient(socket);
    QSignalSpy disconnectedSpy(m_server.get(), &pl::SocketServer::clientDisconnected);

    QByteArray header(pl::IpcMessage::kHeaderSize, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(pl::IpcMessage::kMaxMessageSize) + 1, header.data());
    socket.write(header);
    socket.flush();

    QTRY_COMPARE(disconnectedSpy.count(), 1);
    QTRY_COMPARE(m_server->clientCount(), 0);
    QTRY_COMPARE(socket.state(), QLocalSocket::UnconnectedState);
}

void TestSocketServer::testNoHandlerReportsUnavailable()
{
    m_server->setRequestHandler(nullptr);

    QLocalSocket socket;
    connectClient(socket);
    FrameReader reader(socket);

    socket.write(pl::IpcMessage::encode(pl::IpcMessage::makeRequest(5, QStringLiteral("echo"))));
    socket.flush();

    const auto reply = waitForFrame(reader);
    QVERIFY(reply.has_value());
    QCOMPARE(reply->value(QStringLiteral("error")).toObject()
                 .value(QStringLiteral("code")).toInt(),
             static_cast<int>(pl::IpcErrorCode::ServiceUnavailable));
}

void TestSocketServer::testSecondServerRefusedWhileFirstIsLive()
{
    pl::SocketServer second;
    QSignalSpy errorSpy(&second, &pl::SocketServer::errorOccurred);
    QVERIFY(!second.listen(socketPath()));
    QCOMPARE(errorSpy.count(), 1);
    QVERIFY(m_server->isListening());
}

void TestSocketServer::testStaleSocketIsReplaced()
{
    m_server.reset();

    // A socket file with nobody behind it.
    QFile stale(socketPath());
    QVERIFY(stale.open(QIODevice::WriteOnly));
    stale.close();

    pl::SocketServer replacement;
    QVERIFY(replacement.listen(socketPath()));
    QVERIFY(replacement.isListening());
}

void TestSocketServer::testPartialFramesPrecedeResponse()
{
    pl::SocketServer* server = m_server.get();
    m_server->setRequestHandler([server](const QJsonObject& request) {
        const uint64_t id = pl::ipcRequestId(request);
        for (int part = 0; part < 2; ++part) {
            server->sendToCurrentClient(pl::IpcMessage::makePartial(
                id, QJsonObject{{QStringLiteral("part"), part}}));
        }
        return pl::IpcMessage::makeResponse(id, QJsonObject{{QStringLiteral("part"), 2}});
    });

    QLocalSocket socket;
    connectClient(socket);
    FrameReader reader(socket);

    socket.write(pl::IpcMessage::encode(pl::IpcMessage::makeRequest(21, QStringLiteral("split"))));
    socket.flush();

    for (int part = 0; part < 3; ++part) {
        const auto frame = waitForFrame(reader);
        QVERIFY(frame.has_value());
        QCOMPARE(pl::ipcRequestId(*frame), uint64_t(21));
        QCOMPARE(frame->value(QStringLiteral("type")).toString(),
                 part < 2 ? QStringLiteral("partial") : QStringLiteral("response"));
        QCOMPARE(frame->value(QStringLiteral("result")).toObject()
                     .value(QStringLiteral("part")).toInt(),
                 part);
    }
}

void TestSocketServer::testSendToCurrentClientOutsideHandler()
{
    QVERIFY(!m_server->sendToCurrentClient(
        pl::IpcMessage::makePartial(1, QJsonObject{{QStringLiteral("part"), 0}})));
}

QTEST_MAIN(TestSocketServer)
#include "test_socket_server.moc"
