#pragma once

#include "core/shared/types.h"
#include "core/vector/nearest_neighbor_ranker.h"

#include <vector>

namespace pl {

class EmbeddingIndex;

// NeighborhoodExpander -- turns ranked hits into candidate pages.
//
// Each hit contributes pages [page - radius, page + radius] (pages < 1 are
// dropped) with baseScore = baseScoreFactor * similarity. A page reached by
// several hits keeps the score of the first hit that reached it, in rank
// order; output preserves that first-reached order.
class NeighborhoodExpander {
public:
    explicit NeighborhoodExpander(int radius = 3, double baseScoreFactor = 0.25);

    std::vector<ScoredPage> expand(const std::vector<NeighborHit>& hits,
                                   const EmbeddingIndex& index) const;

private:
    int m_radius = 3;
    double m_baseScoreFactor = 0.25;
};

} // namespace pl
