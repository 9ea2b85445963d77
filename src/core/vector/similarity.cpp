#include "core/vector/similarity.h"

#include <algorithm>
#include <cmath>

namespace pl {

double cosineSimilarity(const float* a, const float* b, size_t length)
{
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < length; ++i) {
        const double x = static_cast<double>(a[i]);
        const double y = static_cast<double>(b[i]);
        dot += x * y;
        normA += x * x;
        normB += y * y;
    }

    double denom = std::sqrt(normA) * std::sqrt(normB);
    if (denom == 0.0) {
        denom = 1.0;
    }
    return dot / denom;
}

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    return cosineSimilarity(a.data(), b.data(), std::min(a.size(), b.size()));
}

} // namespace pl
