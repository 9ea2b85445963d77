#pragma once

#include "core/store/page_store.h"

#include <QString>

#include <memory>
#include <mutex>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace pl {

// SqlitePageStore -- read-only view over the page database produced by the
// offline ingestion step:
//
//   pages(id, fileName, relativePath, page, text)
//   pages_fts USING fts5(text, fileName, relativePath, page)
//
// The connection is opened read-only. The lookup statement is shared, so
// get() serializes on an internal mutex.
class SqlitePageStore : public PageStore {
public:
    struct SearchHit {
        QString documentId;
        QString relativePath;
        int page = 0;
        QString preview;
    };

    static constexpr int kPreviewChars = 500;

    ~SqlitePageStore() override;

    SqlitePageStore(const SqlitePageStore&) = delete;
    SqlitePageStore& operator=(const SqlitePageStore&) = delete;

    // Returns nullptr if the database can't be opened or has no pages table.
    static std::unique_ptr<SqlitePageStore> open(const QString& dbPath);

    std::optional<PageRow> get(const QString& documentId, int page) const override;
    int pageCount() const override;

    bool hasFullTextIndex() const { return m_hasFts; }

    // Keyword lookup over pages_fts, best FTS5 rank first. Returns an empty
    // list when the query has no usable tokens or the FTS table is missing.
    std::vector<SearchHit> keywordSearch(const QString& query, int limit = 3) const;

    // Lower-case, keep [a-z0-9 -()"], collapse whitespace and AND the
    // remaining tokens. Each token is quoted so user text can't inject FTS5
    // operators.
    static QString buildFtsQuery(const QString& query);

private:
    SqlitePageStore() = default;

    bool init(const QString& dbPath);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_getStmt = nullptr;
    bool m_hasFts = false;
    int m_pageCount = 0;
    mutable std::mutex m_mutex;
};

} // namespace pl
