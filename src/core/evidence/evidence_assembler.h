#pragma once

#include "core/evidence/context_packer.h"
#include "core/evidence/evidence_harvester.h"
#include "core/evidence/sentence_scorer.h"
#include "core/shared/retrieval_settings.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace pl {

struct AssembledContext {
    std::vector<QString> chunks;
    PackingTier tier = PackingTier::None;

    QString context() const { return ContextPacker::joinChunks(chunks); }
    bool isEmpty() const { return chunks.empty(); }
};

// EvidenceAssembler -- runs the packing tiers in order until one produces
// enough context:
//
//   StrictSentences   done when >= minPackedChunks chunks
//   LenientSentences  replaces strict only if it packs at least as many
//   WholePages        only when nothing has been packed yet
class EvidenceAssembler {
public:
    EvidenceAssembler(const SentenceScorer& scorer, const RetrievalSettings& settings);

    AssembledContext assemble(const QString& question,
                              const std::vector<CandidatePage>& pages) const;

private:
    EvidenceHarvester m_harvester;
    ContextPacker m_packer;
    int m_minPackedChunks = 5;
    double m_lenientScoreFloor = 0.1;
};

} // namespace pl
