// ============= include/recognition/embedding.hpp =============
#pragma once
#include "analysis/face_types.hpp"
#include <vector>

namespace burstface {
namespace embedding {

void l2_normalize(std::vector<float>& descriptor);

// Cosine similarity of two descriptors, clamped to [-1, 1]
float compare(const std::vector<float>& a, const std::vector<float>& b);

// Euclidean distance between the L2-normalized descriptors, in [0, 2].
// Size mismatch or empty descriptors report the maximum distance.
float l2_distance(const FaceEmbedding& a, const FaceEmbedding& b);

// max(0, 1 - distance / 2)
float similarity_from_distance(float distance);

} // namespace embedding
} // namespace burstface
