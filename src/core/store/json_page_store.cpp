#include "core/store/json_page_store.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace pl {

JsonPageStore::JsonPageStore(QHash<QString, QString> pages)
    : m_pages(std::move(pages))
{
}

std::unique_ptr<JsonPageStore> JsonPageStore::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(plStore, "JsonPageStore: cannot open %s", qUtf8Printable(filePath));
        return nullptr;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_ERROR(plStore, "JsonPageStore: JSON parse error in %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        return nullptr;
    }

    auto store = fromJson(doc.object());
    LOG_INFO(plStore, "Loaded %d pages from %s", store->pageCount(), qUtf8Printable(filePath));
    return store;
}

std::unique_ptr<JsonPageStore> JsonPageStore::fromJson(const QJsonObject& json)
{
    QHash<QString, QString> pages;
    pages.reserve(json.size());
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (!it.value().isString()) {
            LOG_DEBUG(plStore, "JsonPageStore: skipping non-string entry %s",
                      qUtf8Printable(it.key()));
            continue;
        }
        pages.insert(it.key(), it.value().toString());
    }
    return std::make_unique<JsonPageStore>(std::move(pages));
}

std::optional<PageRow> JsonPageStore::get(const QString& documentId, int page) const
{
    const auto it = m_pages.constFind(pageKey(documentId, page));
    if (it == m_pages.constEnd() || it.value().isEmpty()) {
        return std::nullopt;
    }

    PageRow row;
    row.documentId = documentId;
    row.page = page;
    row.text = it.value();
    return row;
}

int JsonPageStore::pageCount() const
{
    return static_cast<int>(m_pages.size());
}

} // namespace pl
