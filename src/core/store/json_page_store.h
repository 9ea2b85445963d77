#pragma once

#include "core/store/page_store.h"

#include <QHash>
#include <QJsonObject>
#include <QString>

#include <memory>

namespace pl {

// JsonPageStore -- in-memory page map loaded from the compact JSON dump
// ({"fileName#page": "text", ...}).
class JsonPageStore : public PageStore {
public:
    explicit JsonPageStore(QHash<QString, QString> pages);

    // Returns nullptr if the file is missing or is not a JSON object.
    static std::unique_ptr<JsonPageStore> loadFromFile(const QString& filePath);
    static std::unique_ptr<JsonPageStore> fromJson(const QJsonObject& json);

    std::optional<PageRow> get(const QString& documentId, int page) const override;
    int pageCount() const override;

private:
    const QHash<QString, QString> m_pages;
};

} // namespace pl
