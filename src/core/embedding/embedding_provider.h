#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace pl {

// Result of one query-embedding request.
// The vector is present only on Success; every other status is an embedding
// error and the question it belongs to resolves to "no evidence".
struct EmbeddingResult {
    enum class Status {
        Success,
        NotConfigured,
        TransportError,
        HttpError,
        MalformedPayload,
        DimensionMismatch,
    };

    Status status = Status::NotConfigured;
    std::vector<float> vector;
    std::optional<QString> errorMessage;
    int httpStatus = 0;
    int durationMs = 0;

    bool ok() const { return status == Status::Success; }
};

QString embeddingStatusToString(EmbeddingResult::Status status);

// EmbeddingProvider -- abstract interface for the external embedding service.
//
// Implementations issue exactly one request per call and never retry; retry
// policy belongs to the caller. embed() is called concurrently from worker
// threads.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual EmbeddingResult embed(const QString& text, const QString& taskType) = 0;

    virtual QString modelId() const = 0;
};

} // namespace pl
