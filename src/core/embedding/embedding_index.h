#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pl {

// EmbeddingIndex -- immutable set of embedded pages exported by the offline
// index builder:
//
//   { "model": "...", "dim": 768,
//     "items": [ { "id", "fileName", "relativePath", "page", "vector" } ] }
//
// Every record's vector has exactly dimensions() components.
class EmbeddingIndex {
public:
    EmbeddingIndex(QString modelId, int dimensions, std::vector<EmbeddingRecord> records);

    // Returns nullopt and fills *error when the file is missing or corrupt.
    static std::optional<EmbeddingIndex> loadFromFile(const QString& filePath,
                                                      QString* error = nullptr);
    static std::optional<EmbeddingIndex> fromJson(const QJsonObject& json,
                                                  QString* error = nullptr);

    const QString& modelId() const { return m_modelId; }
    int dimensions() const { return m_dimensions; }
    const std::vector<EmbeddingRecord>& records() const { return m_records; }
    size_t size() const { return m_records.size(); }
    bool isEmpty() const { return m_records.empty(); }

private:
    QString m_modelId;
    int m_dimensions = 0;
    std::vector<EmbeddingRecord> m_records;
};

// EmbeddingIndexCache -- "load once, return cached handle" gate over an index
// file. Concurrent first callers block until the single load finishes; a
// failed load is cached too, so a corrupt file is reported once.
class EmbeddingIndexCache {
public:
    explicit EmbeddingIndexCache(QString filePath);

    EmbeddingIndexCache(const EmbeddingIndexCache&) = delete;
    EmbeddingIndexCache& operator=(const EmbeddingIndexCache&) = delete;

    // nullptr if the index could not be loaded; see lastError().
    std::shared_ptr<const EmbeddingIndex> get();

    QString lastError() const;
    int loadCount() const;

private:
    const QString m_filePath;
    mutable std::mutex m_mutex;
    bool m_attempted = false;
    int m_loadCount = 0;
    QString m_error;
    std::shared_ptr<const EmbeddingIndex> m_index;
};

} // namespace pl
