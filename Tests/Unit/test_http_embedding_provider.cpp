#include <QtTest/QtTest>

#include "core/embedding/http_embedding_provider.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

class TestHttpEmbeddingProvider : public QObject {
    Q_OBJECT

private slots:
    void testParseSuccess();
    void testParseHttpError();
    void testParseMalformedBodies_data();
    void testParseMalformedBodies();
    void testRequestBodyShape();
    void testRequestUrl();
    void testMissingKeyIsNotConfigured();
    void testApiKeyFromEnvironment();
};

void TestHttpEmbeddingProvider::testParseSuccess()
{
    const auto result = pl::HttpEmbeddingProvider::parseResponse(
        200, QByteArrayLiteral(R"({"embedding":{"values":[0.5,-1,2.25]}})"));
    QVERIFY(result.ok());
    QCOMPARE(result.httpStatus, 200);
    QCOMPARE(result.vector.size(), size_t(3));
    QCOMPARE(result.vector[0], 0.5f);
    QCOMPARE(result.vector[1], -1.0f);
    QCOMPARE(result.vector[2], 2.25f);
    QVERIFY(!result.errorMessage.has_value());
}

void TestHttpEmbeddingProvider::testParseHttpError()
{
    const QByteArray body = QByteArrayLiteral(R"({"error":{"message":"API key not valid"}})");
    const auto result = pl::HttpEmbeddingProvider::parseResponse(400, body);
    QCOMPARE(result.status, pl::EmbeddingResult::Status::HttpError);
    QCOMPARE(result.httpStatus, 400);
    QVERIFY(result.errorMessage.has_value());
    QVERIFY(result.errorMessage->contains(QStringLiteral("400")));
    QVERIFY(result.errorMessage->contains(QStringLiteral("API key not valid")));
    QVERIFY(result.vector.empty());

    // A 5xx with a valid-looking payload is still an error.
    const auto serverError = pl::HttpEmbeddingProvider::parseResponse(
        503, QByteArrayLiteral(R"({"embedding":{"values":[1]}})"));
    QCOMPARE(serverError.status, pl::EmbeddingResult::Status::HttpError);
}

void TestHttpEmbeddingProvider::testParseMalformedBodies_data()
{
    QTest::addColumn<QByteArray>("body");

    QTest::newRow("not json") << QByteArrayLiteral("<html>oops</html>");
    QTest::newRow("array") << QByteArrayLiteral("[1,2,3]");
    QTest::newRow("no embedding") << QByteArrayLiteral(R"({"values":[1,2]})");
    QTest::newRow("values not array") << QByteArrayLiteral(R"({"embedding":{"values":"1,2"}})");
    QTest::newRow("empty values") << QByteArrayLiteral(R"({"embedding":{"values":[]}})");
    QTest::newRow("non-numeric") << QByteArrayLiteral(R"({"embedding":{"values":[1,"x"]}})");
}

void TestHttpEmbeddingProvider::testParseMalformedBodies()
{
    QFETCH(QByteArray, body);
    const auto result = pl::HttpEmbeddingProvider::parseResponse(200, body);
    QCOMPARE(result.status, pl::EmbeddingResult::Status::MalformedPayload);
    QVERIFY(result.vector.empty());
    QVERIFY(result.errorMessage.has_value());
}

void TestHttpEmbeddingProvider::testRequestBodyShape()
{
    const QByteArray body = pl::HttpEmbeddingProvider::buildRequestBody(
        QStringLiteral("notice \"window\""), QStringLiteral("RETRIEVAL_QUERY"));
    const QJsonObject json = QJsonDocument::fromJson(body).object();

    QCOMPARE(json.value(QStringLiteral("taskType")).toString(), QStringLiteral("RETRIEVAL_QUERY"));
    const QJsonArray parts = json.value(QStringLiteral("content")).toObject()
                                 .value(QStringLiteral("parts")).toArray();
    QCOMPARE(parts.size(), 1);
    QCOMPARE(parts.at(0).toObject().value(QStringLiteral("text")).toString(),
             QStringLiteral("notice \"window\""));
}

void TestHttpEmbeddingProvider::testRequestUrl()
{
    pl::EmbeddingProviderSettings settings;
    settings.endpoint = QStringLiteral("https://embed.example.test/v1/models//");
    settings.model = QStringLiteral("text-embedding-004");

    const pl::HttpEmbeddingProvider provider(settings, QStringLiteral("a b+c"));
    QCOMPARE(provider.requestUrl(),
             QStringLiteral("https://embed.example.test/v1/models/text-embedding-004"
                            ":embedContent?key=a%20b%2Bc"));
    QCOMPARE(provider.modelId(), QStringLiteral("text-embedding-004"));
}

void TestHttpEmbeddingProvider::testMissingKeyIsNotConfigured()
{
    pl::EmbeddingProviderSettings settings;
    settings.endpoint = QStringLiteral("http://127.0.0.1:9");
    settings.apiKeyEnv = QStringLiteral("POLICYLENS_TEST_UNSET_KEY");

    pl::HttpEmbeddingProvider provider(settings, QString());
    const auto result = provider.embed(QStringLiteral("anything"), QStringLiteral("RETRIEVAL_QUERY"));
    QCOMPARE(result.status, pl::EmbeddingResult::Status::NotConfigured);
    QVERIFY(result.errorMessage.has_value());
    QVERIFY(result.errorMessage->contains(QStringLiteral("POLICYLENS_TEST_UNSET_KEY")));
    QCOMPARE(pl::embeddingStatusToString(result.status), QStringLiteral("not_configured"));
}

void TestHttpEmbeddingProvider::testApiKeyFromEnvironment()
{
    pl::EmbeddingProviderSettings settings;
    settings.apiKeyEnv = QStringLiteral("POLICYLENS_TEST_API_KEY");

    qputenv("POLICYLENS_TEST_API_KEY", "  secret-key \n");
    QCOMPARE(pl::HttpEmbeddingProvider::apiKeyFromEnvironment(settings),
             QStringLiteral("secret-key"));

    qunsetenv("POLICYLENS_TEST_API_KEY");
    QVERIFY(pl::HttpEmbeddingProvider::apiKeyFromEnvironment(settings).isEmpty());
}

QTEST_MAIN(TestHttpEmbeddingProvider)
#include "test_http_embedding_provider.moc"
