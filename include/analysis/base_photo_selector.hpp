// ============= include/analysis/base_photo_selector.hpp =============
#pragma once
#include "analysis/face_types.hpp"
#include <optional>
#include <vector>

namespace burstface {

// Picks the photo the composite is built on:
//   score = 0.6 aesthetic + 0.4 technical
// aesthetic = precomputed photo score, or a resolution/aspect heuristic
// technical = resolution relative to 4 MP
class BasePhotoSelector {
public:
    float aesthetic_score(const Photo& photo, const cv::Size& size) const;
    float technical_score(const cv::Size& size) const;
    float suitability(const Photo& photo, const cv::Size& size) const;

    // photos in canonical order; the first one wins ties
    std::optional<PhotoCandidate> select(const std::vector<ProcessedPhoto>& photos) const;
};

} // namespace burstface
