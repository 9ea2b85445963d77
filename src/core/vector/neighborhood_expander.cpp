#include "core/vector/neighborhood_expander.h"
#include "core/embedding/embedding_index.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>

namespace pl {

NeighborhoodExpander::NeighborhoodExpander(int radius, double baseScoreFactor)
    : m_radius(std::max(radius, 0))
    , m_baseScoreFactor(baseScoreFactor)
{
}

std::vector<ScoredPage> NeighborhoodExpander::expand(const std::vector<NeighborHit>& hits,
                                                     const EmbeddingIndex& index) const
{
    const std::vector<EmbeddingRecord>& records = index.records();

    std::vector<ScoredPage> pages;
    QSet<QString> seen;

    for (const NeighborHit& hit : hits) {
        if (hit.recordIndex >= records.size()) {
            continue;
        }
        const EmbeddingRecord& record = records[hit.recordIndex];
        const double baseScore = m_baseScoreFactor * hit.similarity;

        for (int offset = -m_radius; offset <= m_radius; ++offset) {
            const int page = record.page + offset;
            if (page < 1) {
                continue;
            }
            const QString key = pageKey(record.documentId, page);
            if (seen.contains(key)) {
                continue;
            }
            seen.insert(key);

            ScoredPage scored;
            scored.documentId = record.documentId;
            scored.page = page;
            scored.baseScore = baseScore;
            pages.push_back(std::move(scored));
        }
    }

    LOG_DEBUG(plRetrieval, "Expanded %d hits into %d candidate pages (radius %d)",
              static_cast<int>(hits.size()), static_cast<int>(pages.size()), m_radius);
    return pages;
}

} // namespace pl
