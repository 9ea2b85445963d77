#include "core/embedding/embedding_index.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace pl {

namespace {

void setError(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

EmbeddingIndex::EmbeddingIndex(QString modelId, int dimensions,
                               std::vector<EmbeddingRecord> records)
    : m_modelId(std::move(modelId))
    , m_dimensions(dimensions)
    , m_records(std::move(records))
{
}

std::optional<EmbeddingIndex> EmbeddingIndex::loadFromFile(const QString& filePath,
                                                           QString* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("cannot open %1").arg(filePath));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("JSON parse error in %1: %2")
                            .arg(filePath, parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("%1 is not a JSON object").arg(filePath));
        return std::nullopt;
    }

    return fromJson(doc.object(), error);
}

std::optional<EmbeddingIndex> EmbeddingIndex::fromJson(const QJsonObject& json, QString* error)
{
    const int dimensions = json.value(QStringLiteral("dim")).toInt(0);
    if (dimensions <= 0) {
        setError(error, QStringLiteral("invalid index dimension %1").arg(dimensions));
        return std::nullopt;
    }

    const QJsonValue itemsValue = json.value(QStringLiteral("items"));
    if (!itemsValue.isArray()) {
        setError(error, QStringLiteral("index has no items array"));
        return std::nullopt;
    }

    const QJsonArray items = itemsValue.toArray();
    std::vector<EmbeddingRecord> records;
    records.reserve(static_cast<size_t>(items.size()));

    for (qsizetype i = 0; i < items.size(); ++i) {
        const QJsonObject item = items.at(i).toObject();
        const QJsonArray vector = item.value(QStringLiteral("vector")).toArray();

        EmbeddingRecord record;
        record.recordId = item.value(QStringLiteral("id")).toInteger(static_cast<qint64>(i));
        record.documentId = item.value(QStringLiteral("fileName")).toString();
        record.relativePath = item.value(QStringLiteral("relativePath")).toString();
        record.page = item.value(QStringLiteral("page")).toInt(0);

        if (record.documentId.isEmpty()) {
            setError(error, QStringLiteral("item %1 has no fileName").arg(i));
            return std::nullopt;
        }
        if (record.page < 1) {
            setError(error, QStringLiteral("item %1 (%2) has invalid page %3")
                                .arg(i).arg(record.documentId).arg(record.page));
            return std::nullopt;
        }
        if (vector.size() != dimensions) {
            setError(error, QStringLiteral("item %1 (%2 p.%3) has %4 components, expected %5")
                                .arg(i)
                                .arg(record.documentId)
                                .arg(record.page)
                                .arg(vector.size())
                                .arg(dimensions));
            return std::nullopt;
        }

        record.vector.reserve(static_cast<size_t>(dimensions));
        for (const QJsonValue& component : vector) {
            if (!component.isDouble()) {
                setError(error, QStringLiteral("item %1 has a non-numeric vector component").arg(i));
                return std::nullopt;
            }
            record.vector.push_back(static_cast<float>(component.toDouble()));
        }
        records.push_back(std::move(record));
    }

    const QString modelId = json.value(QStringLiteral("model")).toString(QStringLiteral("unknown"));
    return EmbeddingIndex(modelId, dimensions, std::move(records));
}

// ── EmbeddingIndexCache ─────────────────────────────────────

EmbeddingIndexCache::EmbeddingIndexCache(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::shared_ptr<const EmbeddingIndex> EmbeddingIndexCache::get()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_attempted) {
        return m_index;
    }
    m_attempted = true;

    QElapsedTimer timer;
    timer.start();

    QString error;
    std::optional<EmbeddingIndex> loaded = EmbeddingIndex::loadFromFile(m_filePath, &error);
    ++m_loadCount;
    if (!loaded) {
        m_error = error;
        LOG_ERROR(plEmbedding, "Embedding index load failed: %s", qUtf8Printable(error));
        return nullptr;
    }

    m_index = std::make_shared<const EmbeddingIndex>(std::move(*loaded));
    LOG_INFO(plEmbedding, "Loaded embedding index %s: model=%s dim=%d records=%d (%lld ms)",
             qUtf8Printable(m_filePath),
             qUtf8Printable(m_index->modelId()),
             m_index->dimensions(),
             static_cast<int>(m_index->size()),
             static_cast<long long>(timer.elapsed()));
    return m_index;
}

QString EmbeddingIndexCache::lastError() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

int EmbeddingIndexCache::loadCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loadCount;
}

} // namespace pl
