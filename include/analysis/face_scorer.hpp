// ============= include/analysis/face_scorer.hpp =============
/*
 * FaceScorer: one FaceQualityRecord per detected face
 *
 * composite = 0.30 capture + 0.25 eyes + 0.20 expression
 *           + 0.15 sharpness + 0.10 pose           (clamped to [0,1])
 *
 * Sharpness is a proxy, not blur detection: a base score plus a bonus by
 * face area, plus an edge bonus scaled by the Laplacian std dev of the face
 * crop (full bonus at score.edge_stddev_scale, none for a flat or failed crop).
 */

#pragma once
#include "analysis/face_types.hpp"
#include "analysis/geometric_signals.hpp"
#include "config.hpp"
#include <opencv2/core.hpp>
#include <optional>

namespace burstface {

class FaceScorer {
public:
    explicit FaceScorer(const AnalysisConfig& config = AnalysisConfig());

    FaceQualityRecord score(const DetectedFace& face,
                            const Photo& photo,
                            int face_index,
                            const cv::Mat& image) const;

    float sharpness(const cv::Rect2f& box, const cv::Mat& image) const;

    float composite(float capture_quality,
                    const EyeState& eyes,
                    const ExpressionQuality& expression,
                    float sharpness,
                    const FaceAngle& pose) const;

    // Normalized box -> pixel rect clipped to the image
    static cv::Rect to_pixels(const cv::Rect2f& box, const cv::Size& size);

private:
    ScoreConfig cfg;
    GeometricSignals geometric;

    std::optional<float> edge_response(const cv::Mat& image, const cv::Rect& roi) const;
};

} // namespace burstface
