#include "core/engine/evidence_engine.h"
#include "core/embedding/embedding_index.h"
#include "core/shared/logging.h"
#include "core/store/page_store.h"

#include <QElapsedTimer>

namespace pl {

EvidenceEngine::EvidenceEngine(const EmbeddingIndex& index,
                               const PageStore& pageStore,
                               EmbeddingProvider& provider,
                               const RetrievalSettings& settings,
                               const QString& taskType)
    : m_index(index)
    , m_pageStore(pageStore)
    , m_settings(settings)
    , m_vectorizer(provider, index.dimensions(), taskType)
    , m_ranker(settings.topK)
    , m_expander(settings.neighborRadius, settings.baseScoreFactor)
    , m_scorer(SentenceScoringWeights{})
    , m_assembler(m_scorer, m_settings)
{
}

std::vector<CandidatePage> EvidenceEngine::fetchCandidates(
    const std::vector<ScoredPage>& pages) const
{
    std::vector<CandidatePage> candidates;
    candidates.reserve(pages.size());
    for (const ScoredPage& scored : pages) {
        std::optional<PageRow> row = m_pageStore.get(scored.documentId, scored.page);
        if (!row || row->text.isEmpty()) {
            continue;
        }
        candidates.push_back(CandidatePage{scored.documentId, scored.page,
                                           scored.baseScore, row->text});
    }
    return candidates;
}

QuestionEvidence EvidenceEngine::answer(const Question& question) const
{
    QElapsedTimer timer;
    timer.start();

    QuestionEvidence evidence;
    evidence.questionId = question.questionId;

    const EmbeddingResult embedded = m_vectorizer.vectorize(question.questionText);
    if (!embedded.ok()) {
        LOG_WARN(plRetrieval, "Question %s: embedding failed (%s): %s",
                 qUtf8Printable(question.questionId),
                 qUtf8Printable(embeddingStatusToString(embedded.status)),
                 qUtf8Printable(embedded.errorMessage.value_or(QString())));
        return evidence;
    }

    const std::vector<NeighborHit> hits = m_ranker.rank(embedded.vector, m_index);
    const std::vector<ScoredPage> expanded = m_expander.expand(hits, m_index);
    const std::vector<CandidatePage> candidates = fetchCandidates(expanded);
    evidence.candidatePageCount = static_cast<int>(candidates.size());

    if (candidates.empty()) {
        LOG_INFO(plRetrieval, "Question %s: no candidate pages (%d hits, %d expanded)",
                 qUtf8Printable(question.questionId),
                 static_cast<int>(hits.size()), static_cast<int>(expanded.size()));
        return evidence;
    }

    const AssembledContext assembled = m_assembler.assemble(question.questionText, candidates);
    evidence.packedContext = assembled.context();
    evidence.chunkCount = static_cast<int>(assembled.chunks.size());
    evidence.tier = assembled.tier;
    evidence.hasEvidence = !evidence.packedContext.isEmpty();

    LOG_INFO(plRetrieval, "Question %s: %d pages -> %d chunks (%s, %lld chars) in %lld ms",
             qUtf8Printable(question.questionId), evidence.candidatePageCount,
             evidence.chunkCount, qUtf8Printable(packingTierToString(evidence.tier)),
             static_cast<long long>(evidence.packedContext.size()),
             static_cast<long long>(timer.elapsed()));
    return evidence;
}

} // namespace pl
