#pragma once

#include "core/embedding/query_vectorizer.h"
#include "core/evidence/evidence_assembler.h"
#include "core/evidence/sentence_scorer.h"
#include "core/shared/retrieval_settings.h"
#include "core/shared/types.h"
#include "core/vector/nearest_neighbor_ranker.h"
#include "core/vector/neighborhood_expander.h"

#include <QString>

#include <vector>

namespace pl {

class EmbeddingIndex;
class EmbeddingProvider;
class PageStore;

// EvidenceEngine -- one question end to end:
//
//   vectorize -> top-K -> neighborhood expansion -> page lookup -> assemble
//
// The index, page store and provider are owned by the caller and must
// outlive the engine. answer() is safe to call from several threads at once.
class EvidenceEngine {
public:
    EvidenceEngine(const EmbeddingIndex& index,
                   const PageStore& pageStore,
                   EmbeddingProvider& provider,
                   const RetrievalSettings& settings = {},
                   const QString& taskType = QStringLiteral("RETRIEVAL_QUERY"));

    QuestionEvidence answer(const Question& question) const;

    // Candidate pages with text, in expansion order. Exposed for the service's
    // diagnostics and for tests.
    std::vector<CandidatePage> fetchCandidates(const std::vector<ScoredPage>& pages) const;

    const RetrievalSettings& settings() const { return m_settings; }

private:
    const EmbeddingIndex& m_index;
    const PageStore& m_pageStore;
    RetrievalSettings m_settings;

    QueryVectorizer m_vectorizer;
    NearestNeighborRanker m_ranker;
    NeighborhoodExpander m_expander;
    SentenceScorer m_scorer;
    EvidenceAssembler m_assembler;
};

} // namespace pl
