#include "core/evidence/evidence_harvester.h"
#include "core/evidence/sentence_splitter.h"
#include "core/shared/logging.h"

#include <QSet>
#include <QStringList>

#include <algorithm>

namespace pl {

HarvestPolicy HarvestPolicy::strict()
{
    HarvestPolicy policy;
    policy.scoreThreshold = 0.0;
    policy.dropAtThreshold = true;
    return policy;
}

HarvestPolicy HarvestPolicy::lenient(double floor)
{
    HarvestPolicy policy;
    policy.scoreThreshold = -1.0;
    policy.dropAtThreshold = false;
    policy.floorCombinedScore = true;
    policy.combinedScoreFloor = floor;
    return policy;
}

EvidenceHarvester::EvidenceHarvester(const SentenceScorer& scorer,
                                     const RetrievalSettings& settings)
    : m_scorer(scorer)
    , m_sentWindow(std::max(settings.sentWindow, 0))
    , m_maxSentChars(std::max(settings.maxSentChars, 1))
    , m_dedupKeyChars(std::max(settings.dedupKeyChars, 1))
{
}

bool EvidenceHarvester::keepSentence(double score, const HarvestPolicy& policy) const
{
    if (policy.dropAtThreshold) {
        return score > policy.scoreThreshold;
    }
    return score >= policy.scoreThreshold;
}

std::vector<EvidenceBlock> EvidenceHarvester::harvest(const QString& question,
                                                      const std::vector<CandidatePage>& pages,
                                                      const HarvestPolicy& policy) const
{
    const QString questionNumber = SentenceScorer::questionNumber(question);

    std::vector<EvidenceBlock> blocks;
    for (const CandidatePage& page : pages) {
        const QStringList sentences = SentenceSplitter::split(page.text);
        const int count = static_cast<int>(sentences.size());

        for (int i = 0; i < count; ++i) {
            const QString core = sentences.at(i).left(m_maxSentChars);
            const double sentenceScore = m_scorer.score(core, questionNumber);
            if (!keepSentence(sentenceScore, policy)) {
                continue;
            }

            const int first = std::max(0, i - m_sentWindow);
            const int last = std::min(count - 1, i + m_sentWindow);
            QStringList window;
            for (int w = first; w <= last; ++w) {
                window.append(w == i ? core : sentences.at(w).left(m_maxSentChars));
            }

            EvidenceBlock block;
            block.documentId = page.documentId;
            block.page = page.page;
            block.text = SentenceSplitter::normalize(window.join(QLatin1Char(' ')));
            block.score = sentenceScore + page.baseScore;
            if (policy.floorCombinedScore) {
                block.score = std::max(block.score, policy.combinedScoreFloor);
            }
            blocks.push_back(std::move(block));
        }
    }

    const size_t harvested = blocks.size();
    std::vector<EvidenceBlock> ranked = rankAndDeduplicate(std::move(blocks));
    LOG_DEBUG(plEvidence, "Harvested %d windows (%d after dedup) from %d pages",
              static_cast<int>(harvested), static_cast<int>(ranked.size()),
              static_cast<int>(pages.size()));
    return ranked;
}

QString EvidenceHarvester::dedupKey(const EvidenceBlock& block) const
{
    return pageKey(block.documentId, block.page) + QLatin1Char('#')
           + block.text.left(m_dedupKeyChars).toLower();
}

std::vector<EvidenceBlock> EvidenceHarvester::rankAndDeduplicate(
    std::vector<EvidenceBlock> blocks) const
{
    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const EvidenceBlock& a, const EvidenceBlock& b) {
                         return a.score > b.score;
                     });

    std::vector<EvidenceBlock> unique;
    unique.reserve(blocks.size());
    QSet<QString> seen;
    for (EvidenceBlock& block : blocks) {
        const QString key = dedupKey(block);
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        unique.push_back(std::move(block));
    }
    return unique;
}

} // namespace pl
