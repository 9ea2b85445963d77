#pragma once

#include "core/shared/retrieval_settings.h"

#include <QString>

namespace pl {

struct EmbeddingProviderSettings {
    QString endpoint = QStringLiteral("https://generativelanguage.googleapis.com/v1/models");
    QString model = QStringLiteral("text-embedding-004");
    QString apiKeyEnv = QStringLiteral("GOOGLE_API_KEY");
    QString taskType = QStringLiteral("RETRIEVAL_QUERY");
    // 0 = no transport timeout; batch latency is bounded by the caller.
    int requestTimeoutMs = 0;
};

struct Settings {
    // Page store: the SQLite database wins when both are set
    QString pagesDbPath;
    QString pagesJsonPath;

    // Precomputed embedding index
    QString embeddingsPath;

    EmbeddingProviderSettings embedding;
    RetrievalSettings retrieval;
};

} // namespace pl
