#include "core/embedding/http_embedding_provider.h"
#include "core/shared/logging.h"

#include <curl/curl.h>

#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUrl>

#include <mutex>
#include <string>

namespace pl {

namespace {

constexpr int kErrorBodyPreviewChars = 300;

void ensureCurlGlobalInit()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t curlWriteCb(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* out = static_cast<std::string*>(userdata);
    const size_t total = size * nmemb;
    out->append(ptr, total);
    return total;
}

EmbeddingResult makeError(EmbeddingResult::Status status, const QString& message,
                          long httpStatus = 0)
{
    EmbeddingResult result;
    result.status = status;
    result.errorMessage = message;
    result.httpStatus = static_cast<int>(httpStatus);
    return result;
}

} // namespace

QString embeddingStatusToString(EmbeddingResult::Status status)
{
    switch (status) {
    case EmbeddingResult::Status::Success:           return QStringLiteral("success");
    case EmbeddingResult::Status::NotConfigured:     return QStringLiteral("not_configured");
    case EmbeddingResult::Status::TransportError:    return QStringLiteral("transport_error");
    case EmbeddingResult::Status::HttpError:         return QStringLiteral("http_error");
    case EmbeddingResult::Status::MalformedPayload:  return QStringLiteral("malformed_payload");
    case EmbeddingResult::Status::DimensionMismatch: return QStringLiteral("dimension_mismatch");
    }
    return QStringLiteral("unknown");
}

HttpEmbeddingProvider::HttpEmbeddingProvider(EmbeddingProviderSettings settings, QString apiKey)
    : m_settings(std::move(settings))
    , m_apiKey(std::move(apiKey))
{
    ensureCurlGlobalInit();
    if (m_apiKey.isEmpty()) {
        LOG_WARN(plEmbedding, "%s is not set; query embedding will fail",
                 qUtf8Printable(m_settings.apiKeyEnv));
    }
}

HttpEmbeddingProvider::~HttpEmbeddingProvider() = default;

QString HttpEmbeddingProvider::apiKeyFromEnvironment(const EmbeddingProviderSettings& settings)
{
    return qEnvironmentVariable(settings.apiKeyEnv.toUtf8().constData()).trimmed();
}

QString HttpEmbeddingProvider::modelId() const
{
    return m_settings.model;
}

QString HttpEmbeddingProvider::requestUrl() const
{
    QString endpoint = m_settings.endpoint;
    while (endpoint.endsWith(QLatin1Char('/'))) {
        endpoint.chop(1);
    }
    return endpoint + QLatin1Char('/') + m_settings.model
           + QStringLiteral(":embedContent?key=")
           + QString::fromUtf8(QUrl::toPercentEncoding(m_apiKey));
}

QByteArray HttpEmbeddingProvider::buildRequestBody(const QString& text, const QString& taskType)
{
    QJsonObject part;
    part[QStringLiteral("text")] = text;

    QJsonObject content;
    content[QStringLiteral("parts")] = QJsonArray{part};

    QJsonObject body;
    body[QStringLiteral("content")] = content;
    body[QStringLiteral("taskType")] = taskType;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

EmbeddingResult HttpEmbeddingProvider::parseResponse(long httpStatus, const QByteArray& body)
{
    if (httpStatus < 200 || httpStatus >= 300) {
        return makeError(EmbeddingResult::Status::HttpError,
                         QStringLiteral("embed HTTP %1: %2")
                             .arg(httpStatus)
                             .arg(QString::fromUtf8(body.left(kErrorBodyPreviewChars))),
                         httpStatus);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return makeError(EmbeddingResult::Status::MalformedPayload,
                         QStringLiteral("embed response is not a JSON object: %1")
                             .arg(parseError.errorString()),
                         httpStatus);
    }

    const QJsonValue values = doc.object()
                                  .value(QStringLiteral("embedding"))
                                  .toObject()
                                  .value(QStringLiteral("values"));
    if (!values.isArray()) {
        return makeError(EmbeddingResult::Status::MalformedPayload,
                         QStringLiteral("No embedding.values"), httpStatus);
    }

    const QJsonArray array = values.toArray();
    if (array.isEmpty()) {
        return makeError(EmbeddingResult::Status::MalformedPayload,
                         QStringLiteral("embedding.values is empty"), httpStatus);
    }

    EmbeddingResult result;
    result.vector.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (!value.isDouble()) {
            return makeError(EmbeddingResult::Status::MalformedPayload,
                             QStringLiteral("embedding.values has a non-numeric entry"),
                             httpStatus);
        }
        result.vector.push_back(static_cast<float>(value.toDouble()));
    }
    result.status = EmbeddingResult::Status::Success;
    result.httpStatus = static_cast<int>(httpStatus);
    return result;
}

EmbeddingResult HttpEmbeddingProvider::embed(const QString& text, const QString& taskType)
{
    if (m_apiKey.isEmpty()) {
        return makeError(EmbeddingResult::Status::NotConfigured,
                         QStringLiteral("%1 is not set").arg(m_settings.apiKeyEnv));
    }

    QElapsedTimer timer;
    timer.start();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return makeError(EmbeddingResult::Status::TransportError,
                         QStringLiteral("curl_easy_init failed"));
    }

    const QByteArray url = requestUrl().toUtf8();
    const QByteArray body = buildRequestBody(text, taskType);
    std::string response;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.constData());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.constData());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (m_settings.requestTimeoutMs > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_settings.requestTimeoutMs));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    const CURLcode rc = curl_easy_perform(curl);
    long httpStatus = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    EmbeddingResult result;
    if (rc != CURLE_OK) {
        result = makeError(EmbeddingResult::Status::TransportError,
                           QStringLiteral("embed request failed: %1")
                               .arg(QString::fromUtf8(curl_easy_strerror(rc))));
    } else {
        result = parseResponse(httpStatus,
                               QByteArray(response.data(), static_cast<qsizetype>(response.size())));
    }
    result.durationMs = static_cast<int>(timer.elapsed());

    if (!result.ok()) {
        LOG_WARN(plEmbedding, "Query embedding failed (%s, %d ms): %s",
                 qUtf8Printable(embeddingStatusToString(result.status)),
                 result.durationMs,
                 qUtf8Printable(result.errorMessage.value_or(QString())));
    } else {
        LOG_DEBUG(plEmbedding, "Query embedded: dim=%d in %d ms",
                  static_cast<int>(result.vector.size()), result.durationMs);
    }
    return result;
}

} // namespace pl
