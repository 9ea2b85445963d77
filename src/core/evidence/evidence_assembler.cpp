#include "core/evidence/evidence_assembler.h"
#include "core/shared/logging.h"

#include <array>

namespace pl {

EvidenceAssembler::EvidenceAssembler(const SentenceScorer& scorer,
                                     const RetrievalSettings& settings)
    : m_harvester(scorer, settings)
    , m_packer(settings)
    , m_minPackedChunks(settings.minPackedChunks)
    , m_lenientScoreFloor(settings.lenientScoreFloor)
{
}

AssembledContext EvidenceAssembler::assemble(const QString& question,
                                             const std::vector<CandidatePage>& pages) const
{
    AssembledContext result;
    if (pages.empty()) {
        return result;
    }

    static constexpr std::array<PackingTier, 3> kTiers = {
        PackingTier::StrictSentences,
        PackingTier::LenientSentences,
        PackingTier::WholePages,
    };

    for (PackingTier tier : kTiers) {
        switch (tier) {
        case PackingTier::StrictSentences: {
            result.chunks = m_packer.pack(
                m_harvester.harvest(question, pages, HarvestPolicy::strict()));
            result.tier = result.chunks.empty() ? PackingTier::None : tier;
            if (static_cast<int>(result.chunks.size()) >= m_minPackedChunks) {
                return result;
            }
            break;
        }
        case PackingTier::LenientSentences: {
            std::vector<QString> lenient = m_packer.pack(m_harvester.harvest(
                question, pages, HarvestPolicy::lenient(m_lenientScoreFloor)));
            if (!lenient.empty() && lenient.size() >= result.chunks.size()) {
                result.chunks = std::move(lenient);
                result.tier = tier;
            }
            if (!result.chunks.empty()) {
                return result;
            }
            break;
        }
        case PackingTier::WholePages: {
            result.chunks = m_packer.packWholePages(pages);
            result.tier = result.chunks.empty() ? PackingTier::None : tier;
            break;
        }
        case PackingTier::None:
            break;
        }
    }

    if (result.tier == PackingTier::WholePages) {
        LOG_INFO(plEvidence, "No sentence evidence; fell back to %d whole pages",
                 static_cast<int>(result.chunks.size()));
    }
    return result;
}

} // namespace pl
