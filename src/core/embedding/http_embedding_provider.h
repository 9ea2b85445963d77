#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/shared/settings.h"

#include <QByteArray>
#include <QString>

namespace pl {

// HttpEmbeddingProvider -- Generative Language "embedContent" client.
//
//   POST {endpoint}/{model}:embedContent?key={apiKey}
//   {"content":{"parts":[{"text":...}]},"taskType":"RETRIEVAL_QUERY"}
//   -> {"embedding":{"values":[...]}}
//
// Each call uses its own curl easy handle, so concurrent calls share nothing.
class HttpEmbeddingProvider : public EmbeddingProvider {
public:
    HttpEmbeddingProvider(EmbeddingProviderSettings settings, QString apiKey);
    ~HttpEmbeddingProvider() override;

    HttpEmbeddingProvider(const HttpEmbeddingProvider&) = delete;
    HttpEmbeddingProvider& operator=(const HttpEmbeddingProvider&) = delete;

    // Reads the API key from the environment variable named in settings.
    static QString apiKeyFromEnvironment(const EmbeddingProviderSettings& settings);

    EmbeddingResult embed(const QString& text, const QString& taskType) override;
    QString modelId() const override;

    QString requestUrl() const;

    static QByteArray buildRequestBody(const QString& text, const QString& taskType);

    // Interpret an HTTP status and body. Anything but a 2xx carrying a
    // non-empty numeric embedding.values array is an error.
    static EmbeddingResult parseResponse(long httpStatus, const QByteArray& body);

private:
    EmbeddingProviderSettings m_settings;
    QString m_apiKey;
};

} // namespace pl
