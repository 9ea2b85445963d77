#include "core/store/sqlite_page_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QRegularExpression>
#include <QStringList>

namespace pl {

namespace {

constexpr const char* kGetPageSql = R"(
    SELECT fileName, relativePath, page, text
    FROM pages
    WHERE fileName = ?1 AND page = ?2
    LIMIT 1
)";

constexpr const char* kCountPagesSql = "SELECT COUNT(*) FROM pages";

constexpr const char* kKeywordSearchSql = R"(
    SELECT fileName, relativePath, page, text
    FROM pages_fts
    WHERE pages_fts MATCH ?1
    ORDER BY rank
    LIMIT ?2
)";

bool tableExists(sqlite3* db, const char* name)
{
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db,
        "SELECT count(*) FROM sqlite_master WHERE name = ?1",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_text(stmt, 1, name, -1, SQLITE_STATIC);
    bool exists = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        exists = sqlite3_column_int(stmt, 0) > 0;
    }
    sqlite3_finalize(stmt);
    return exists;
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return raw ? QString::fromUtf8(raw) : QString();
}

} // namespace

SqlitePageStore::~SqlitePageStore()
{
    sqlite3_finalize(m_getStmt);
    if (m_db) {
        sqlite3_close(m_db);
    }
}

std::unique_ptr<SqlitePageStore> SqlitePageStore::open(const QString& dbPath)
{
    std::unique_ptr<SqlitePageStore> store(new SqlitePageStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool SqlitePageStore::init(const QString& dbPath)
{
    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(plStore, "Failed to open page database %s: %s",
                  qUtf8Printable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!tableExists(m_db, "pages")) {
        LOG_ERROR(plStore, "Page database %s has no pages table", qUtf8Printable(dbPath));
        return false;
    }
    m_hasFts = tableExists(m_db, "pages_fts");
    if (!m_hasFts) {
        LOG_WARN(plStore, "Page database %s has no pages_fts table; keyword search disabled",
                 qUtf8Printable(dbPath));
    }

    if (sqlite3_prepare_v2(m_db, kGetPageSql, -1, &m_getStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(plStore, "Page lookup prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_stmt* countStmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kCountPagesSql, -1, &countStmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(countStmt) == SQLITE_ROW) {
            m_pageCount = sqlite3_column_int(countStmt, 0);
        }
    }
    sqlite3_finalize(countStmt);

    LOG_INFO(plStore, "Opened page database %s (%d pages)", qUtf8Printable(dbPath), m_pageCount);
    return true;
}

std::optional<PageRow> SqlitePageStore::get(const QString& documentId, int page) const
{
    const QByteArray documentUtf8 = documentId.toUtf8();

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_bind_text(m_getStmt, 1, documentUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(m_getStmt, 2, page);

    std::optional<PageRow> row;
    const int rc = sqlite3_step(m_getStmt);
    if (rc == SQLITE_ROW) {
        PageRow found;
        found.documentId = columnText(m_getStmt, 0);
        found.relativePath = columnText(m_getStmt, 1);
        found.page = sqlite3_column_int(m_getStmt, 2);
        found.text = columnText(m_getStmt, 3);
        if (!found.text.isEmpty()) {
            row = std::move(found);
        }
    } else if (rc != SQLITE_DONE) {
        LOG_WARN(plStore, "Page lookup failed for %s p.%d: %s",
                 qUtf8Printable(documentId), page, sqlite3_errmsg(m_db));
    }

    sqlite3_reset(m_getStmt);
    sqlite3_clear_bindings(m_getStmt);
    return row;
}

int SqlitePageStore::pageCount() const
{
    return m_pageCount;
}

QString SqlitePageStore::buildFtsQuery(const QString& query)
{
    static const QRegularExpression disallowed(QStringLiteral("[^a-z0-9\\s\\-()\"]"));
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    QString raw = query.toLower();
    raw.replace(disallowed, QStringLiteral(" "));
    raw.replace(whitespace, QStringLiteral(" "));
    raw = raw.trimmed();

    QStringList terms;
    const QStringList tokens = raw.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (QString token : tokens) {
        token.remove(QLatin1Char('"'));
        if (token.isEmpty()) {
            continue;
        }
        terms.append(QLatin1Char('"') + token + QLatin1Char('"'));
    }
    return terms.join(QStringLiteral(" AND "));
}

std::vector<SqlitePageStore::SearchHit> SqlitePageStore::keywordSearch(const QString& query,
                                                                       int limit) const
{
    if (!m_hasFts) {
        return {};
    }

    const QString ftsQuery = buildFtsQuery(query);
    if (ftsQuery.isEmpty()) {
        LOG_DEBUG(plStore, "Keyword search skipped: no usable tokens in '%s'",
                  qUtf8Printable(query));
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kKeywordSearchSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(plStore, "Keyword search prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    const QByteArray queryUtf8 = ftsQuery.toUtf8();
    sqlite3_bind_text(stmt, 1, queryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : 3);

    std::vector<SearchHit> hits;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SearchHit hit;
        hit.documentId = columnText(stmt, 0);
        hit.relativePath = columnText(stmt, 1);
        hit.page = sqlite3_column_int(stmt, 2);
        hit.preview = columnText(stmt, 3).left(kPreviewChars);
        hits.push_back(std::move(hit));
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(plStore, "Keyword search '%s' failed: %s",
                 qUtf8Printable(ftsQuery), sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return hits;
}

} // namespace pl
