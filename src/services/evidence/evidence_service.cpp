#include "evidence_service.h"
#include "core/embedding/embedding_index.h"
#include "core/embedding/http_embedding_provider.h"
#include "core/shared/logging.h"
#include "core/store/json_page_store.h"
#include "core/store/sqlite_page_store.h"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>

namespace pl {

namespace {

constexpr int kDefaultSearchLimit = 3;
constexpr int kMaxSearchLimit = 50;

// Room for the frame envelope around a slice of results (type, id, offset,
// total, durationMs).
constexpr int kReplyEnvelopeBytes = 512;

int encodedSize(const QJsonObject& json)
{
    return static_cast<int>(QJsonDocument(json).toJson(QJsonDocument::Compact).size());
}

QJsonObject evidenceToJson(const QuestionEvidence& evidence)
{
    return QJsonObject{
        {QStringLiteral("questionId"), evidence.questionId},
        {QStringLiteral("packedContext"), evidence.packedContext},
        {QStringLiteral("hasEvidence"), evidence.hasEvidence},
        {QStringLiteral("tier"), packingTierToString(evidence.tier)},
        {QStringLiteral("chunkCount"), evidence.chunkCount},
        {QStringLiteral("candidatePageCount"), evidence.candidatePageCount},
    };
}

// Question ids arrive as strings or numbers.
QString questionIdFromJson(const QJsonValue& value)
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return {};
}

} // namespace

EvidenceService::EvidenceService(std::shared_ptr<const EmbeddingIndex> index,
                                 std::unique_ptr<PageStore> pageStore,
                                 std::unique_ptr<EmbeddingProvider> provider,
                                 const Settings& settings,
                                 QObject* parent)
    : ServiceBase(QString::fromLatin1(kServiceName), parent)
    , m_index(std::move(index))
    , m_pageStore(std::move(pageStore))
    , m_provider(std::move(provider))
    , m_settings(settings)
{
    m_sqliteStore = dynamic_cast<const SqlitePageStore*>(m_pageStore.get());

    m_engine = std::make_unique<EvidenceEngine>(*m_index, *m_pageStore, *m_provider,
                                                m_settings.retrieval,
                                                m_settings.embedding.taskType);
    m_coordinator = std::make_unique<QuestionCoordinator>(*m_engine,
                                                          m_settings.retrieval.concurrency);

    if (m_provider->modelId() != m_index->modelId()) {
        LOG_WARN(plCore, "Query model '%s' differs from index model '%s'",
                 qUtf8Printable(m_provider->modelId()), qUtf8Printable(m_index->modelId()));
    }

    registerMethod(ipc_method::kPackEvidence, [this](uint64_t id, const QJsonObject& params) {
        return handlePackEvidence(id, params);
    });
    registerMethod(ipc_method::kSearchPages, [this](uint64_t id, const QJsonObject& params) {
        return handleSearchPages(id, params);
    });
}

EvidenceService::~EvidenceService() = default;

std::unique_ptr<EvidenceService> EvidenceService::create(const Settings& settings,
                                                         QString* error)
{
    auto fail = [error](const QString& message) -> std::unique_ptr<EvidenceService> {
        LOG_ERROR(plCore, "%s", qUtf8Printable(message));
        if (error) {
            *error = message;
        }
        return nullptr;
    };

    std::unique_ptr<PageStore> pageStore;
    if (!settings.pagesDbPath.isEmpty()) {
        pageStore = SqlitePageStore::open(settings.pagesDbPath);
        if (!pageStore) {
            return fail(QStringLiteral("Cannot open page database %1").arg(settings.pagesDbPath));
        }
    } else if (!settings.pagesJsonPath.isEmpty()) {
        pageStore = JsonPageStore::loadFromFile(settings.pagesJsonPath);
        if (!pageStore) {
            return fail(QStringLiteral("Cannot load page map %1").arg(settings.pagesJsonPath));
        }
    } else {
        return fail(QStringLiteral("No page store configured (pagesDbPath or pagesJsonPath)"));
    }

    if (settings.embeddingsPath.isEmpty()) {
        return fail(QStringLiteral("No embedding index configured (embeddingsPath)"));
    }
    EmbeddingIndexCache indexCache(settings.embeddingsPath);
    std::shared_ptr<const EmbeddingIndex> index = indexCache.get();
    if (!index) {
        return fail(QStringLiteral("Embedding index unavailable: %1").arg(indexCache.lastError()));
    }

    auto provider = std::make_unique<HttpEmbeddingProvider>(
        settings.embedding, HttpEmbeddingProvider::apiKeyFromEnvironment(settings.embedding));

    LOG_INFO(plCore, "Evidence service: %d pages, %d index records (dim %d)",
             pageStore->pageCount(), static_cast<int>(index->size()), index->dimensions());

    return std::make_unique<EvidenceService>(std::move(index), std::move(pageStore),
                                             std::move(provider), settings);
}

void EvidenceService::setMaxReplyBytes(int bytes)
{
    m_maxReplyBytes = std::clamp(bytes, kMinReplyBytes, IpcMessage::kMaxMessageSize);
}

QJsonObject EvidenceService::handlePackEvidence(uint64_t id, const QJsonObject& params)
{
    const QJsonArray questionsJson = params.value(QStringLiteral("questions")).toArray();
    if (questionsJson.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Provide { questions: Question[] }"));
    }

    std::vector<Question> questions;
    questions.reserve(static_cast<size_t>(questionsJson.size()));
    for (const QJsonValue& value : questionsJson) {
        if (!value.isObject()) {
            return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                         QStringLiteral("Provide { questions: Question[] }"));
        }
        const QJsonObject obj = value.toObject();
        questions.push_back(Question{questionIdFromJson(obj.value(QStringLiteral("id"))),
                                     obj.value(QStringLiteral("text")).toString()});
    }

    QElapsedTimer timer;
    timer.start();
    const std::vector<QuestionEvidence> results = m_coordinator->run(questions);

    const int sliceBudget = m_maxReplyBytes - kReplyEnvelopeBytes;
    QJsonArray slice;
    int sliceBytes = 2;
    int sliceOffset = 0;
    int withEvidence = 0;
    int partialFrames = 0;
    bool streaming = true;

    for (size_t i = 0; i < results.size(); ++i) {
        const QuestionEvidence& evidence = results[i];
        QJsonObject entry = evidenceToJson(evidence);
        int entryBytes = encodedSize(entry) + 1;

        // A single context that cannot fit in any frame goes back empty so
        // its siblings still arrive.
        if (entryBytes > sliceBudget) {
            LOG_ERROR(plCore, "Packed context for question '%s' is %d bytes, over the %d byte reply limit",
                      qUtf8Printable(evidence.questionId), entryBytes, m_maxReplyBytes);
            QuestionEvidence dropped;
            dropped.questionId = evidence.questionId;
            dropped.candidatePageCount = evidence.candidatePageCount;
            entry = evidenceToJson(dropped);
            entry.insert(QStringLiteral("error"),
                         QStringLiteral("Packed context exceeds the maximum message size"));
            entryBytes = encodedSize(entry) + 1;
        } else if (evidence.hasEvidence) {
            ++withEvidence;
        }

        if (streaming && !slice.isEmpty() && sliceBytes + entryBytes > sliceBudget) {
            const bool sent = sendPartial(id, QJsonObject{
                {QStringLiteral("results"), slice},
                {QStringLiteral("offset"), sliceOffset},
            });
            if (sent) {
                ++partialFrames;
                sliceOffset = static_cast<int>(i);
                slice = QJsonArray();
                sliceBytes = 2;
            } else {
                LOG_WARN(plIpc, "Cannot stream packEvidence results for request %llu; replying in one frame",
                         static_cast<unsigned long long>(id));
                streaming = false;
            }
        }
        slice.append(entry);
        sliceBytes += entryBytes;
    }

    LOG_INFO(plCore, "packEvidence: %d/%d questions with evidence in %lld ms (%d frames)",
             withEvidence, static_cast<int>(results.size()),
             static_cast<long long>(timer.elapsed()), partialFrames + 1);

    return IpcMessage::makeResponse(id, QJsonObject{
        {QStringLiteral("results"), slice},
        {QStringLiteral("offset"), sliceOffset},
        {QStringLiteral("total"), static_cast<int>(results.size())},
        {QStringLiteral("durationMs"), static_cast<qint64>(timer.elapsed())},
    });
}

QJsonObject EvidenceService::handleSearchPages(uint64_t id, const QJsonObject& params)
{
    const QString query = params.value(QStringLiteral("q")).toString().trimmed();
    if (query.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Provide { q: string }"));
    }
    if (!m_sqliteStore || !m_sqliteStore->hasFullTextIndex()) {
        return IpcMessage::makeError(id, IpcErrorCode::Unsupported,
                                     QStringLiteral("Keyword search needs the SQLite page database"));
    }

    const int limit = std::clamp(
        params.value(QStringLiteral("limit")).toInt(kDefaultSearchLimit), 1, kMaxSearchLimit);

    QJsonArray hits;
    for (const SqlitePageStore::SearchHit& hit : m_sqliteStore->keywordSearch(query, limit)) {
        hits.append(QJsonObject{
            {QStringLiteral("fileName"), hit.documentId},
            {QStringLiteral("relativePath"), hit.relativePath},
            {QStringLiteral("page"), hit.page},
            {QStringLiteral("preview"), hit.preview},
        });
    }

    return IpcMessage::makeResponse(id, QJsonObject{
        {QStringLiteral("query"), query},
        {QStringLiteral("ftsQuery"), SqlitePageStore::buildFtsQuery(query)},
        {QStringLiteral("results"), hits},
    });
}

} // namespace pl
