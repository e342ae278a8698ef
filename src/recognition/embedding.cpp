// ============= src/recognition/embedding.cpp =============
#include "recognition/embedding.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace burstface {
namespace embedding {

void l2_normalize(std::vector<float>& descriptor) {
    float norm = 0.0f;
    for (float val : descriptor) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : descriptor) {
            val /= norm;
        }
    }
}

float compare(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        spdlog::error("Embedding size mismatch: {} vs {}", a.size(), b.size());
        return 0.0f;
    }

    std::vector<float> na = a, nb = b;
    l2_normalize(na);
    l2_normalize(nb);

    float dot_product = 0.0f;
    for (size_t i = 0; i < na.size(); i++) {
        dot_product += na[i] * nb[i];
    }

    // numerical stability
    return std::max(-1.0f, std::min(1.0f, dot_product));
}

float l2_distance(const FaceEmbedding& a, const FaceEmbedding& b) {
    if (a.descriptor.empty() || b.descriptor.empty()) {
        return 2.0f;
    }
    if (a.descriptor.size() != b.descriptor.size()) {
        spdlog::error("Embedding size mismatch: {} vs {}", a.descriptor.size(), b.descriptor.size());
        return 2.0f;
    }

    // |a - b|^2 = 2 - 2cos for unit vectors
    float cos = compare(a.descriptor, b.descriptor);
    return std::sqrt(std::max(0.0f, 2.0f - 2.0f * cos));
}

float similarity_from_distance(float distance) {
    return std::max(0.0f, 1.0f - distance / 2.0f);
}

} // namespace embedding
} // namespace burstface
