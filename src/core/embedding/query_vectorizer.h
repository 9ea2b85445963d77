#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

namespace pl {

// QueryVectorizer -- turns question text into a query vector: lexical
// preprocessing, then exactly one provider call.
class QueryVectorizer {
public:
    QueryVectorizer(EmbeddingProvider& provider, int expectedDimensions,
                    QString taskType = QStringLiteral("RETRIEVAL_QUERY"));

    // A vector whose length differs from expectedDimensions is reported as
    // DimensionMismatch.
    EmbeddingResult vectorize(const QString& question) const;

    int expectedDimensions() const { return m_expectedDimensions; }

private:
    EmbeddingProvider& m_provider;
    int m_expectedDimensions = 0;
    QString m_taskType;
};

} // namespace pl
