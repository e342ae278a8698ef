// ============= src/analysis/base_photo_selector.cpp =============
#include "analysis/base_photo_selector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace burstface {

namespace {
constexpr double TWO_MP = 2000000.0;
constexpr double ONE_MP = 1000000.0;
constexpr double FOUR_MP = 4000000.0;

inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }
}

float BasePhotoSelector::aesthetic_score(const Photo& photo, const cv::Size& size) const {
    if (photo.overall_score) {
        return clamp01(*photo.overall_score);
    }

    double pixels = static_cast<double>(size.width) * size.height;
    float score = 0.5f;

    if (pixels > TWO_MP) {
        score += 0.3f;
    } else if (pixels > ONE_MP) {
        score += 0.2f;
    }

    if (size.height > 0) {
        double aspect = static_cast<double>(size.width) / size.height;
        if (aspect >= 0.75 && aspect <= 1.5) score += 0.2f;
    }

    return std::min(1.0f, score);
}

float BasePhotoSelector::technical_score(const cv::Size& size) const {
    double pixels = static_cast<double>(size.width) * size.height;
    return static_cast<float>(std::min(1.0, pixels / FOUR_MP));
}

float BasePhotoSelector::suitability(const Photo& photo, const cv::Size& size) const {
    return aesthetic_score(photo, size) * 0.6f + technical_score(size) * 0.4f;
}

std::optional<PhotoCandidate> BasePhotoSelector::select(const std::vector<ProcessedPhoto>& photos) const {
    if (photos.empty()) return std::nullopt;

    const ProcessedPhoto* best = &photos.front();
    float best_score = suitability(best->photo, best->image_size);

    for (size_t i = 1; i < photos.size(); i++) {
        float s = suitability(photos[i].photo, photos[i].image_size);
        if (s > best_score) {
            best_score = s;
            best = &photos[i];
        }
    }

    PhotoCandidate candidate;
    candidate.photo = best->photo;
    candidate.image_size = best->image_size;
    candidate.suitability = clamp01(best_score);
    candidate.aesthetic = clamp01(best_score * 0.6f);
    candidate.technical = clamp01(best_score * 0.4f);

    spdlog::debug("Base photo: {} ({}x{}) score={:.3f}", best->photo.asset_id,
                  best->image_size.width, best->image_size.height, best_score);
    return candidate;
}

} // namespace burstface
