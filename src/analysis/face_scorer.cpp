// ============= src/analysis/face_scorer.cpp =============
#include "analysis/face_scorer.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace burstface {

FaceScorer::FaceScorer(const AnalysisConfig& config)
    : cfg(config.score), geometric(config.eyes, config.expression) {}

cv::Rect FaceScorer::to_pixels(const cv::Rect2f& box, const cv::Size& size) {
    cv::Rect r(static_cast<int>(std::round(box.x * size.width)),
               static_cast<int>(std::round(box.y * size.height)),
               static_cast<int>(std::round(box.width * size.width)),
               static_cast<int>(std::round(box.height * size.height)));
    return r & cv::Rect(0, 0, size.width, size.height);
}

std::optional<float> FaceScorer::edge_response(const cv::Mat& image, const cv::Rect& roi) const {
    if (image.empty() || roi.area() <= 0) return std::nullopt;

    try {
        cv::Mat crop = image(roi);
        cv::Mat gray;
        if (crop.channels() == 3) {
            cv::cvtColor(crop, gray, cv::COLOR_BGR2GRAY);
        } else if (crop.channels() == 4) {
            cv::cvtColor(crop, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = crop;
        }

        // Laplacian std dev: 0 on a flat crop, grows with edge content
        cv::Mat lap;
        cv::Laplacian(gray, lap, CV_64F);
        cv::Scalar mean, stddev;
        cv::meanStdDev(lap, mean, stddev);
        return static_cast<float>(stddev[0]);
    } catch (const cv::Exception& e) {
        spdlog::debug("Edge filter failed on {}x{} crop: {}", roi.width, roi.height, e.what());
        return std::nullopt;
    }
}

float FaceScorer::sharpness(const cv::Rect2f& box, const cv::Mat& image) const {
    float area = box.width * box.height;
    float s = cfg.sharpness_base;

    if (area > cfg.large_face_area) {
        s += cfg.large_face_bonus;
    } else if (area > cfg.medium_face_area) {
        s += cfg.medium_face_bonus;
    } else if (area > cfg.small_face_area) {
        s += cfg.small_face_bonus;
    }

    if (auto edges = edge_response(image, to_pixels(box, image.size()))) {
        s += cfg.filter_bonus * std::min(1.0f, *edges / cfg.edge_stddev_scale);
    }

    return std::min(1.0f, s);
}

float FaceScorer::composite(float capture_quality,
                            const EyeState& eyes,
                            const ExpressionQuality& expression,
                            float sharpness,
                            const FaceAngle& pose) const {
    float eye_score = eyes.both_open() ? 1.0f : 0.0f;
    float pose_score = pose.is_optimal() ? 1.0f : cfg.non_optimal_pose_score;

    float total = capture_quality * cfg.capture_weight +
                  eye_score * cfg.eyes_weight +
                  expression.overall() * cfg.expression_weight +
                  sharpness * cfg.sharpness_weight +
                  pose_score * cfg.pose_weight;

    return std::max(0.0f, std::min(1.0f, total));
}

FaceQualityRecord FaceScorer::score(const DetectedFace& face,
                                    const Photo& photo,
                                    int face_index,
                                    const cv::Mat& image) const {
    FaceQualityRecord rec;
    rec.photo = photo;
    rec.face_index = face_index;
    rec.box = face.box;
    rec.capture_quality = std::max(0.0f, std::min(1.0f,
        face.capture_quality.value_or(cfg.default_capture_quality)));
    rec.pose = face.pose;

    rec.eyes = geometric.eye_state(face.landmarks);
    rec.expression = geometric.expression_quality(face.landmarks);
    rec.sharpness = sharpness(face.box, image);
    rec.composite = composite(rec.capture_quality, rec.eyes, rec.expression,
                              rec.sharpness, rec.pose);

    spdlog::debug("Face {}#{}: capture={:.2f} eyes={} expr={:.2f} sharp={:.2f} pose={} -> {:.3f}",
                  photo.asset_id, face_index, rec.capture_quality,
                  rec.eyes.both_open() ? "open" : "closed",
                  rec.expression.overall(), rec.sharpness,
                  rec.pose.is_optimal() ? "optimal" : "off", rec.composite);

    return rec;
}

} // namespace burstface
