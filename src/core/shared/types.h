#pragma once

#include <QString>
#include <cstdint>
#include <vector>

namespace pl {

// One page of one source document, as stored by the offline ingestion step.
struct PageRow {
    QString documentId;
    QString relativePath;
    int page = 0;
    QString text;
};

// One embedded page in the precomputed index.
struct EmbeddingRecord {
    int64_t recordId = 0;
    QString documentId;
    QString relativePath;
    int page = 0;
    std::vector<float> vector;
};

// A page reached by neighborhood expansion. baseScore is inherited from the
// nearest-neighbor hit that first reached it.
struct ScoredPage {
    QString documentId;
    int page = 0;
    double baseScore = 0.0;
};

// A ScoredPage whose text was found in the page store.
struct CandidatePage {
    QString documentId;
    int page = 0;
    double baseScore = 0.0;
    QString text;
};

// Windowed sentence excerpt with a combined (heuristic + base) score.
struct EvidenceBlock {
    QString documentId;
    int page = 0;
    QString text;
    double score = 0.0;
};

struct Question {
    QString questionId;
    QString questionText;
};

// Which packing strategy produced a question's context.
enum class PackingTier {
    None,
    StrictSentences,
    LenientSentences,
    WholePages,
};

QString packingTierToString(PackingTier tier);

struct QuestionEvidence {
    QString questionId;
    QString packedContext;
    bool hasEvidence = false;
    PackingTier tier = PackingTier::None;
    int chunkCount = 0;
    int candidatePageCount = 0;
    bool cancelled = false;
};

// "documentId#page" -- the key format shared by the JSON page map and the
// expansion dedup set.
QString pageKey(const QString& documentId, int page);

} // namespace pl
