#include "core/embedding/query_vectorizer.h"
#include "core/embedding/query_preprocessor.h"
#include "core/shared/logging.h"

namespace pl {

QueryVectorizer::QueryVectorizer(EmbeddingProvider& provider, int expectedDimensions,
                                 QString taskType)
    : m_provider(provider)
    , m_expectedDimensions(expectedDimensions)
    , m_taskType(std::move(taskType))
{
}

EmbeddingResult QueryVectorizer::vectorize(const QString& question) const
{
    const QString processed = QueryPreprocessor::preprocess(question);
    EmbeddingResult result = m_provider.embed(processed, m_taskType);
    if (!result.ok()) {
        return result;
    }

    if (static_cast<int>(result.vector.size()) != m_expectedDimensions) {
        LOG_WARN(plEmbedding, "Query vector has %d dimensions, index expects %d",
                 static_cast<int>(result.vector.size()), m_expectedDimensions);
        result.status = EmbeddingResult::Status::DimensionMismatch;
        result.errorMessage = QStringLiteral("query dimension %1 != index dimension %2")
                                  .arg(result.vector.size())
                                  .arg(m_expectedDimensions);
        result.vector.clear();
    }
    return result;
}

} // namespace pl
