#include <QtTest/QtTest>

#include "core/embedding/embedding_index.h"
#include "core/ipc/message.h"
#include "core/store/json_page_store.h"
#include "core/store/sqlite_page_store.h"
#include "corpus_fixtures.h"
#include "fake_embedding_provider.h"
#include "ipc_test_utils.h"
#include "services/evidence/evidence_service.h"

#include <QJsonArray>
#include <QTemporaryDir>

namespace {

const QString kNoticeSentence = QStringLiteral(
    "Members receive written notice within fourteen (14) calendar days of a denial.");

std::vector<pl::PageRow> corpusPages()
{
    return {
        {QStringLiteral("GG.1100.pdf"), QStringLiteral("policies/GG.1100.pdf"), 1,
         QStringLiteral("Overview of utilization management. ") + kNoticeSentence},
        {QStringLiteral("GG.1100.pdf"), QStringLiteral("policies/GG.1100.pdf"), 2,
         QStringLiteral("Claims are paid within thirty days of receipt.")},
        {QStringLiteral("HH.2000.pdf"), QStringLiteral("policies/HH.2000.pdf"), 1,
         QStringLiteral("Hospice room and board is covered.")},
    };
}

std::shared_ptr<const pl::EmbeddingIndex> corpusIndex()
{
    return std::make_shared<const pl::EmbeddingIndex>(
        QStringLiteral("fake-embedding"), 2, std::vector<pl::EmbeddingRecord>{
            pl::test::makeRecord(1, QStringLiteral("GG.1100.pdf"), 1, {1.0f, 0.0f}),
            pl::test::makeRecord(2, QStringLiteral("GG.1100.pdf"), 2, {0.7f, 0.7f}),
            pl::test::makeRecord(3, QStringLiteral("HH.2000.pdf"), 1, {0.0f, 1.0f}),
        });
}

// Dispatches straight into the method table, no socket involved.
class InProcessEvidenceService : public pl::EvidenceService {
public:
    using pl::EvidenceService::EvidenceService;

    QJsonObject call(uint64_t id, const QString& method, const QJsonObject& params = {})
    {
        partials.clear();
        return handleRequest(pl::IpcMessage::makeRequest(id, method, params));
    }

    // Frames that would have gone to the client ahead of the response.
    std::vector<QJsonObject> partials;

protected:
    bool sendPartial(uint64_t id, const QJsonObject& result) override
    {
        partials.push_back(pl::IpcMessage::makePartial(id, result));
        return true;
    }
};

std::unique_ptr<InProcessEvidenceService> makeService(std::unique_ptr<pl::PageStore> store,
                                                      pl::Settings settings = {})
{
    auto provider = std::make_unique<pl::test::FakeEmbeddingProvider>(
        std::vector<float>{1.0f, 0.0f});
    provider->addFailure(QStringLiteral("broken"), pl::EmbeddingResult::Status::HttpError,
                         QStringLiteral("embed HTTP 500"));
    return std::make_unique<InProcessEvidenceService>(corpusIndex(), std::move(store),
                                                      std::move(provider), settings);
}

} // namespace

class TestEvidenceServiceIpc : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testPingIdentifiesService();
    void testPackEvidenceReturnsResultsInOrder();
    void testPackEvidenceAcceptsNumericIds();
    void testPackEvidenceSplitsLargeBatches();
    void testReplyLimitClamped();
    void testPackEvidenceRejectsBadParams_data();
    void testPackEvidenceRejectsBadParams();
    void testSearchPagesWithSqlite();
    void testSearchPagesLimitClamped();
    void testSearchPagesRequiresQuery();
    void testSearchPagesUnsupportedWithJsonStore();
    void testUnknownMethod();

private:
    QTemporaryDir m_dir;
    QString m_dbPath;
};

void TestEvidenceServiceIpc::initTestCase()
{
    QVERIFY(m_dir.isValid());
    m_dbPath = m_dir.filePath(QStringLiteral("pages.db"));
    QVERIFY(pl::test::writePagesDatabase(m_dbPath, corpusPages()));
}

void TestEvidenceServiceIpc::testPingIdentifiesService()
{
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));
    const QJsonObject reply = service->call(1, pl::ipc_method::kPing);
    QVERIFY(pl::test::isResponse(reply));
    QCOMPARE(pl::test::resultPayload(reply).value(QStringLiteral("service")).toString(),
             QStringLiteral("evidence"));
}

void TestEvidenceServiceIpc::testPackEvidenceReturnsResultsInOrder()
{
    auto service = makeService(pl::SqlitePageStore::open(m_dbPath));

    const QJsonArray questions{
        QJsonObject{{QStringLiteral("id"), QStringLiteral("Q-1")},
                    {QStringLiteral("text"), QStringLiteral("Must members get notice within 14 days?")}},
        QJsonObject{{QStringLiteral("id"), QStringLiteral("Q-2")},
                    {QStringLiteral("text"), QStringLiteral("This one is broken")}},
        QJsonObject{{QStringLiteral("id"), QStringLiteral("Q-3")},
                    {QStringLiteral("text"), QStringLiteral("Is hospice room and board covered?")}},
    };
    const QJsonObject reply = service->call(
        5, pl::ipc_method::kPackEvidence, QJsonObject{{QStringLiteral("questions"), questions}});
    QVERIFY(pl::test::isResponse(reply));
    QCOMPARE(pl::ipcRequestId(reply), uint64_t(5));

    const QJsonObject result = pl::test::resultPayload(reply);
    QVERIFY(result.contains(QStringLiteral("durationMs")));
    QVERIFY(service->partials.empty());
    QCOMPARE(result.value(QStringLiteral("offset")).toInt(), 0);
    QCOMPARE(result.value(QStringLiteral("total")).toInt(), 3);
    const QJsonArray results = result.value(QStringLiteral("results")).toArray();
    QCOMPARE(results.size(), 3);

    const QJsonObject first = results.at(0).toObject();
    QCOMPARE(first.value(QStringLiteral("questionId")).toString(), QStringLiteral("Q-1"));
    QVERIFY(first.value(QStringLiteral("hasEvidence")).toBool());
    QVERIFY(first.value(QStringLiteral("packedContext")).toString().contains(kNoticeSentence));
    QVERIFY(first.value(QStringLiteral("chunkCount")).toInt() >= 1);
    QCOMPARE(first.value(QStringLiteral("candidatePageCount")).toInt(), 3);
    QVERIFY(first.value(QStringLiteral("tier")).toString() != QLatin1String("none"));

    const QJsonObject second = results.at(1).toObject();
    QCOMPARE(second.value(QStringLiteral("questionId")).toString(), QStringLiteral("Q-2"));
    QVERIFY(!second.value(QStringLiteral("hasEvidence")).toBool());
    QVERIFY(second.value(QStringLiteral("packedContext")).toString().isEmpty());
    QCOMPARE(second.value(QStringLiteral("tier")).toString(), QStringLiteral("none"));

    QCOMPARE(results.at(2).toObject().value(QStringLiteral("questionId")).toString(),
             QStringLiteral("Q-3"));
    QVERIFY(results.at(2).toObject().value(QStringLiteral("hasEvidence")).toBool());
}

void TestEvidenceServiceIpc::testPackEvidenceAcceptsNumericIds()
{
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));
    const QJsonArray questions{
        QJsonObject{{QStringLiteral("id"), 42},
                    {QStringLiteral("text"), QStringLiteral("Are claims paid within thirty days?")}},
    };
    const QJsonObject reply = service->call(
        6, pl::ipc_method::kPackEvidence, QJsonObject{{QStringLiteral("questions"), questions}});
    QVERIFY(pl::test::isResponse(reply));
    const QJsonArray results = pl::test::resultPayload(reply).value(QStringLiteral("results")).toArray();
    QCOMPARE(results.size(), 1);
    QCOMPARE(results.at(0).toObject().value(QStringLiteral("questionId")).toString(),
             QStringLiteral("42"));
}

void TestEvidenceServiceIpc::testPackEvidenceSplitsLargeBatches()
{
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));
    service->setMaxReplyBytes(pl::EvidenceService::kMinReplyBytes);

    const int questionCount = 40;
    QJsonArray questions;
    for (int i = 0; i < questionCount; ++i) {
        questions.append(QJsonObject{
            {QStringLiteral("id"), QStringLiteral("Q-%1").arg(i)},
            {QStringLiteral("text"), i % 7 == 3
                 ? QStringLiteral("This one is broken")
                 : QStringLiteral("Must members get notice within 14 days?")},
        });
    }

    const QJsonObject reply = service->call(
        30, pl::ipc_method::kPackEvidence, QJsonObject{{QStringLiteral("questions"), questions}});
    QVERIFY(pl::test::isResponse(reply));
    QVERIFY(!service->partials.empty());

    std::vector<QJsonObject> frames = service->partials;
    frames.push_back(reply);

    QJsonArray collected;
    for (const QJsonObject& frame : frames) {
        QCOMPARE(pl::ipcRequestId(frame), uint64_t(30));
        const QByteArray encoded = pl::IpcMessage::encode(frame);
        QVERIFY(!encoded.isEmpty());
        QVERIFY(encoded.size() - pl::IpcMessage::kHeaderSize <= service->maxReplyBytes());

        const QJsonObject result = frame.value(QStringLiteral("result")).toObject();
        QCOMPARE(result.value(QStringLiteral("offset")).toInt(), collected.size());
        const QJsonArray slice = result.value(QStringLiteral("results")).toArray();
        QVERIFY(!slice.isEmpty());
        for (const QJsonValue& entry : slice) {
            collected.append(entry);
        }
    }
    for (size_t i = 0; i + 1 < frames.size(); ++i) {
        QCOMPARE(frames[i].value(QStringLiteral("type")).toString(), QStringLiteral("partial"));
    }

    QCOMPARE(pl::test::resultPayload(reply).value(QStringLiteral("total")).toInt(), questionCount);
    QCOMPARE(collected.size(), questionCount);
    for (int i = 0; i < questionCount; ++i) {
        const QJsonObject entry = collected.at(i).toObject();
        QCOMPARE(entry.value(QStringLiteral("questionId")).toString(), QStringLiteral("Q-%1").arg(i));
        QCOMPARE(entry.value(QStringLiteral("hasEvidence")).toBool(), i % 7 != 3);
        if (i % 7 != 3) {
            QVERIFY(entry.value(QStringLiteral("packedContext")).toString().contains(kNoticeSentence));
        }
    }
}

void TestEvidenceServiceIpc::testReplyLimitClamped()
{
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));
    QCOMPARE(service->maxReplyBytes(), pl::IpcMessage::kMaxMessageSize);

    service->setMaxReplyBytes(10);
    QCOMPARE(service->maxReplyBytes(), pl::EvidenceService::kMinReplyBytes);
    service->setMaxReplyBytes(pl::IpcMessage::kMaxMessageSize * 2);
    QCOMPARE(service->maxReplyBytes(), pl::IpcMessage::kMaxMessageSize);
}

void TestEvidenceServiceIpc::testPackEvidenceRejectsBadParams_data()
{
    QTest::addColumn<QJsonObject>("params");

    QTest::newRow("missing") << QJsonObject{};
    QTest::newRow("empty list") << QJsonObject{{QStringLiteral("questions"), QJsonArray{}}};
    QTest::newRow("not a list")
        << QJsonObject{{QStringLiteral("questions"), QStringLiteral("what is covered?")}};
    QTest::newRow("non-object entry")
        << QJsonObject{{QStringLiteral("questions"), QJsonArray{QStringLiteral("what?")}}};
}

void TestEvidenceServiceIpc::testPackEvidenceRejectsBadParams()
{
    QFETCH(QJsonObject, params);
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));

    const QJsonObject reply = service->call(8, pl::ipc_method::kPackEvidence, params);
    QVERIFY(pl::test::isError(reply));
    const QJsonObject error = pl::test::errorPayload(reply);
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(), QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(error.value(QStringLiteral("message")).toString(),
             QStringLiteral("Provide { questions: Question[] }"));
}

void TestEvidenceServiceIpc::testSearchPagesWithSqlite()
{
    auto service = makeService(pl::SqlitePageStore::open(m_dbPath));

    const QJsonObject reply = service->call(
        9, pl::ipc_method::kSearchPages,
        QJsonObject{{QStringLiteral("q"), QStringLiteral("  Calendar days ")}});
    QVERIFY(pl::test::isResponse(reply));

    const QJsonObject result = pl::test::resultPayload(reply);
    QCOMPARE(result.value(QStringLiteral("query")).toString(), QStringLiteral("Calendar days"));
    QCOMPARE(result.value(QStringLiteral("ftsQuery")).toString(),
             QStringLiteral("\"calendar\" AND \"days\""));

    const QJsonArray hits = result.value(QStringLiteral("results")).toArray();
    QCOMPARE(hits.size(), 1);
    const QJsonObject hit = hits.at(0).toObject();
    QCOMPARE(hit.value(QStringLiteral("fileName")).toString(), QStringLiteral("GG.1100.pdf"));
    QCOMPARE(hit.value(QStringLiteral("relativePath")).toString(),
             QStringLiteral("policies/GG.1100.pdf"));
    QCOMPARE(hit.value(QStringLiteral("page")).toInt(), 1);
    QVERIFY(hit.value(QStringLiteral("preview")).toString().contains(QStringLiteral("calendar days")));
}

void TestEvidenceServiceIpc::testSearchPagesLimitClamped()
{
    auto service = makeService(pl::SqlitePageStore::open(m_dbPath));

    const QJsonObject zero = service->call(
        10, pl::ipc_method::kSearchPages,
        QJsonObject{{QStringLiteral("q"), QStringLiteral("within")}, {QStringLiteral("limit"), 0}});
    QCOMPARE(pl::test::resultPayload(zero).value(QStringLiteral("results")).toArray().size(), 1);

    const QJsonObject defaulted = service->call(
        11, pl::ipc_method::kSearchPages, QJsonObject{{QStringLiteral("q"), QStringLiteral("within")}});
    QCOMPARE(pl::test::resultPayload(defaulted).value(QStringLiteral("results")).toArray().size(), 2);
}

void TestEvidenceServiceIpc::testSearchPagesRequiresQuery()
{
    auto service = makeService(pl::SqlitePageStore::open(m_dbPath));
    const QJsonObject reply = service->call(
        12, pl::ipc_method::kSearchPages, QJsonObject{{QStringLiteral("q"), QStringLiteral("   ")}});
    QVERIFY(pl::test::isError(reply));
    QCOMPARE(pl::test::errorPayload(reply).value(QStringLiteral("message")).toString(),
             QStringLiteral("Provide { q: string }"));
}

void TestEvidenceServiceIpc::testSearchPagesUnsupportedWithJsonStore()
{
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));
    const QJsonObject reply = service->call(
        13, pl::ipc_method::kSearchPages, QJsonObject{{QStringLiteral("q"), QStringLiteral("hospice")}});
    QVERIFY(pl::test::isError(reply));
    QCOMPARE(pl::test::errorPayload(reply).value(QStringLiteral("code")).toInt(),
             static_cast<int>(pl::IpcErrorCode::Unsupported));
}

void TestEvidenceServiceIpc::testUnknownMethod()
{
    auto service = makeService(pl::JsonPageStore::fromJson(pl::test::pagesToJson(corpusPages())));
    const QJsonObject reply = service->call(14, QStringLiteral("packEvidences"));
    QVERIFY(pl::test::isError(reply));
    QCOMPARE(pl::test::errorPayload(reply).value(QStringLiteral("codeString")).toString(),
             QStringLiteral("NOT_FOUND"));
}

QTEST_MAIN(TestEvidenceServiceIpc)
#include "test_evidence_service_ipc.moc"
