#pragma once

#include "core/evidence/sentence_scorer.h"
#include "core/shared/retrieval_settings.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace pl {

// How harvesting treats low-scoring sentences.
struct HarvestPolicy {
    // Sentences scoring below scoreThreshold are dropped; a sentence scoring
    // exactly scoreThreshold is dropped too when dropAtThreshold is set.
    double scoreThreshold = 0.0;
    bool dropAtThreshold = true;

    // Combined scores are floored here when set (lenient packs everything
    // that survives).
    bool floorCombinedScore = false;
    double combinedScoreFloor = 0.0;

    // score <= 0 is dropped.
    static HarvestPolicy strict();
    // score < -1 is dropped; combined score floored at floor.
    static HarvestPolicy lenient(double floor);
};

// EvidenceHarvester -- scores every sentence of every candidate page, builds
// a +-sentWindow window around each survivor and returns deduplicated blocks,
// highest combined score first.
class EvidenceHarvester {
public:
    EvidenceHarvester(const SentenceScorer& scorer, const RetrievalSettings& settings);

    std::vector<EvidenceBlock> harvest(const QString& question,
                                       const std::vector<CandidatePage>& pages,
                                       const HarvestPolicy& policy) const;

    // "documentId#page#<first dedupKeyChars of text, lower-cased>"
    QString dedupKey(const EvidenceBlock& block) const;

    // Stable sort by descending score, then keep the first block per key.
    std::vector<EvidenceBlock> rankAndDeduplicate(std::vector<EvidenceBlock> blocks) const;

private:
    bool keepSentence(double score, const HarvestPolicy& policy) const;

    const SentenceScorer& m_scorer;
    int m_sentWindow = 2;
    int m_maxSentChars = 600;
    int m_dedupKeyChars = 160;
};

} // namespace pl
