#include "core/vector/nearest_neighbor_ranker.h"
#include "core/embedding/embedding_index.h"
#include "core/shared/logging.h"
#include "core/vector/similarity.h"

#include <algorithm>

namespace pl {

NearestNeighborRanker::NearestNeighborRanker(int topK)
    : m_topK(std::max(topK, 1))
{
}

std::vector<NeighborHit> NearestNeighborRanker::rank(const std::vector<float>& query,
                                                     const EmbeddingIndex& index) const
{
    const std::vector<EmbeddingRecord>& records = index.records();
    const size_t length = std::min(query.size(), static_cast<size_t>(index.dimensions()));

    std::vector<NeighborHit> hits;
    hits.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        NeighborHit hit;
        hit.recordIndex = i;
        hit.similarity = cosineSimilarity(query.data(), records[i].vector.data(), length);
        hits.push_back(hit);
    }

    const size_t keep = std::min(hits.size(), static_cast<size_t>(m_topK));
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(keep), hits.end(),
                      [](const NeighborHit& a, const NeighborHit& b) {
                          if (a.similarity != b.similarity) {
                              return a.similarity > b.similarity;
                          }
                          return a.recordIndex < b.recordIndex;
                      });
    hits.resize(keep);

    if (!hits.empty()) {
        LOG_DEBUG(plRetrieval, "Ranked %d records, top similarity %.4f",
                  static_cast<int>(records.size()), hits.front().similarity);
    }
    return hits;
}

} // namespace pl
