#pragma once

#include <cstddef>
#include <vector>

namespace pl {

// dot(a, b) / (|a| * |b|), with the denominator replaced by 1 when it is 0 so
// a zero vector scores 0 instead of NaN. Only the first min(len) components
// are compared.
double cosineSimilarity(const float* a, const float* b, size_t length);
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace pl
