#pragma once

#include <cstddef>
#include <vector>

namespace pl {

class EmbeddingIndex;

struct NeighborHit {
    size_t recordIndex = 0;   // position in EmbeddingIndex::records()
    double similarity = 0.0;
};

// NearestNeighborRanker -- exact top-K by cosine similarity.
//
// Full linear scan over every record. Ties are broken by record order, so
// repeated calls with the same query return the same ranking.
class NearestNeighborRanker {
public:
    explicit NearestNeighborRanker(int topK = 80);

    // The query must have index.dimensions() components; callers check this
    // before ranking (QueryVectorizer does).
    std::vector<NeighborHit> rank(const std::vector<float>& query,
                                  const EmbeddingIndex& index) const;

    int topK() const { return m_topK; }

private:
    int m_topK = 80;
};

} // namespace pl
