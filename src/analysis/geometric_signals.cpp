// ============= src/analysis/geometric_signals.cpp =============
#include "analysis/geometric_signals.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace burstface {

namespace {

// Scale factors mapping normalized landmark offsets to [0,1]
constexpr float LIP_CURVATURE_SCALE = 40.0f;
constexpr float LIP_SIDE_CURVATURE_SCALE = 30.0f;
constexpr float LIP_WIDTH_SCALE = 15.0f;
constexpr float LIP_OPENNESS_SCALE = 30.0f;
constexpr float CHEEK_ELEVATION_SCALE = 5.0f;
constexpr float EYE_CREASE_SCALE = 20.0f;

// point farther from the centroid than this many mean spreads
constexpr float OUTLIER_SPREAD_FACTOR = 2.5f;

constexpr size_t LIP_MIN_POINTS = 12;
constexpr size_t LIP_DETAILED_POINTS = 16;
constexpr size_t CONTOUR_MIN_POINTS = 10;
constexpr size_t CONTOUR_DEFINITION_POINTS = 15;
constexpr size_t EYE_MIN_POINTS = 6;

inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }

inline float dist(const cv::Point2f& a, const cv::Point2f& b) {
    return static_cast<float>(cv::norm(a - b));
}

// 1 - |a - b| / max(a, b); degenerate spans count as neutral
float balance(float a, float b) {
    float m = std::max(a, b);
    if (m <= 0.0f) return 0.5f;
    return 1.0f - std::abs(a - b) / m;
}

// Turning angle at p2, normalized to [0,1]
float turning(const cv::Point2f& p1, const cv::Point2f& p2, const cv::Point2f& p3) {
    cv::Point2f v1 = p2 - p1;
    cv::Point2f v2 = p3 - p2;
    float dot = v1.x * v2.x + v1.y * v2.y;
    float det = v1.x * v2.y - v1.y * v2.x;
    return std::abs(std::atan2(det, dot)) / static_cast<float>(CV_PI);
}

} // namespace

GeometricSignals::GeometricSignals(const EyeConfig& eye_cfg, const ExpressionConfig& expr_cfg)
    : eye_cfg(eye_cfg), expr_cfg(expr_cfg) {}

// ==================== EYES ====================

float GeometricSignals::eye_aspect_ratio(const Points& eye) const {
    if (static_cast<int>(eye.size()) < eye_cfg.min_points) {
        spdlog::debug("EAR: insufficient eye landmarks ({} points)", eye.size());
        return eye_cfg.default_ear;
    }

    // 1. Corners: extreme x
    auto by_x = [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; };
    size_t outer_idx = std::min_element(eye.begin(), eye.end(), by_x) - eye.begin();
    size_t inner_idx = std::max_element(eye.begin(), eye.end(), by_x) - eye.begin();
    const cv::Point2f& outer = eye[outer_idx];
    const cv::Point2f& inner = eye[inner_idx];

    float horizontal = dist(outer, inner);
    if (horizontal < eye_cfg.horizontal_epsilon) {
        spdlog::debug("EAR: horizontal distance too small ({:.5f})", horizontal);
        return eye_cfg.default_ear;
    }

    // 2. Eye frame: t along the outer->inner axis, s perpendicular to it
    //    (s == y for a level eye)
    cv::Point2f axis = (inner - outer) * (1.0f / horizontal);
    cv::Point2f normal(-axis.y, axis.x);

    struct LidPoint { float t; float s; };
    std::vector<LidPoint> lid;
    lid.reserve(eye.size());
    for (size_t i = 0; i < eye.size(); i++) {
        if (i == outer_idx || i == inner_idx) continue;
        cv::Point2f d = eye[i] - outer;
        lid.push_back({d.dot(axis), d.dot(normal)});
    }

    std::sort(lid.begin(), lid.end(),
        [](const LidPoint& a, const LidPoint& b) { return a.s > b.s; });
    if (lid.front().s - lid.back().s < eye_cfg.vertical_epsilon) {
        return 0.0f;  // lids coincide: fully closed
    }

    // 3. Top pair = two highest, bottom pair = two lowest, each ordered outer -> inner
    LidPoint top[2] = {lid[0], lid[1]};
    LidPoint bottom[2] = {lid[lid.size() - 1], lid[lid.size() - 2]};
    if (top[0].t > top[1].t) std::swap(top[0], top[1]);
    if (bottom[0].t > bottom[1].t) std::swap(bottom[0], bottom[1]);

    // 4. EAR = (|p2-p6| + |p3-p5|) / (2 |p1-p4|), lid gaps measured across the axis
    float v_outer = top[0].s - bottom[0].s;
    float v_inner = top[1].s - bottom[1].s;
    float ear = (v_outer + v_inner) / (2.0f * horizontal);

    spdlog::debug("EAR: points={} v1={:.4f} v2={:.4f} h={:.4f} ear={:.4f}",
                  eye.size(), v_outer, v_inner, horizontal, ear);
    return ear;
}

float GeometricSignals::adaptive_threshold(float left_ear, float right_ear) const {
    float avg = (left_ear + right_ear) / 2.0f;

    if (avg > eye_cfg.wide_band) return eye_cfg.wide_threshold;
    if (avg > eye_cfg.normal_band) return eye_cfg.normal_threshold;
    if (avg > eye_cfg.narrow_band) return eye_cfg.narrow_threshold;
    return eye_cfg.minimum_threshold;
}

EyeState GeometricSignals::eye_state(const std::optional<LandmarkSet>& landmarks) const {
    if (!landmarks) {
        return EyeState(true, true, eye_cfg.no_landmarks_confidence);
    }
    if (!landmarks->left_eye || !landmarks->right_eye) {
        return EyeState(true, true, eye_cfg.missing_region_confidence);
    }

    float left_ear = eye_aspect_ratio(*landmarks->left_eye);
    float right_ear = eye_aspect_ratio(*landmarks->right_eye);
    float threshold = adaptive_threshold(left_ear, right_ear);

    bool left_open = left_ear > threshold;
    bool right_open = right_ear > threshold;
    float avg = (left_ear + right_ear) / 2.0f;
    float confidence = std::min(1.0f, avg / threshold);

    spdlog::debug("Eyes: L={:.3f} R={:.3f} thr={:.2f} -> {}/{} conf={:.2f}",
                  left_ear, right_ear, threshold,
                  left_open ? "OPEN" : "CLOSED", right_open ? "OPEN" : "CLOSED", confidence);

    return EyeState(left_open, right_open, confidence);
}

// ==================== LIPS ====================

float GeometricSignals::lip_curvature(const Points& p) const {
    // [0]/[6] corners, [3] top center, [9] bottom center
    float mouth_center_y = (p[3].y + p[9].y) / 2.0f;
    float corner_y = (p[0].y + p[6].y) / 2.0f;

    std::vector<float> measurements;
    measurements.push_back(std::max(0.0f, (corner_y - mouth_center_y) * LIP_CURVATURE_SCALE));

    if (p.size() >= LIP_DETAILED_POINTS) {
        measurements.push_back(std::max(0.0f, (p[0].y - p[1].y) * LIP_SIDE_CURVATURE_SCALE));
        measurements.push_back(std::max(0.0f, (p[6].y - p[5].y) * LIP_SIDE_CURVATURE_SCALE));
    }

    float avg = std::accumulate(measurements.begin(), measurements.end(), 0.0f) /
                static_cast<float>(measurements.size());
    return std::min(1.0f, avg);
}

float GeometricSignals::lip_symmetry(const Points& p) const {
    std::vector<float> measurements;
    measurements.push_back(balance(std::abs(p[0].x - p[3].x), std::abs(p[6].x - p[3].x)));

    if (p.size() >= LIP_DETAILED_POINTS) {
        float upper_l = std::abs(p[1].x - p[3].x);
        float upper_r = std::abs(p[5].x - p[3].x);
        if (std::max(upper_l, upper_r) > 0.0f) measurements.push_back(balance(upper_l, upper_r));

        float lower_l = std::abs(p[11].x - p[9].x);
        float lower_r = std::abs(p[7].x - p[9].x);
        if (std::max(lower_l, lower_r) > 0.0f) measurements.push_back(balance(lower_l, lower_r));
    }

    float avg = std::accumulate(measurements.begin(), measurements.end(), 0.0f) /
                static_cast<float>(measurements.size());
    return clamp01(avg);
}

float GeometricSignals::lip_width(const Points& p) const {
    return std::min(1.0f, std::abs(p[6].x - p[0].x) * LIP_WIDTH_SCALE);
}

float GeometricSignals::lip_openness(const Points& outer, const std::optional<Points>& inner) const {
    float openness = std::abs(outer[3].y - outer[9].y);

    if (inner && inner->size() >= 6) {
        float inner_open = std::abs((*inner)[1].y - (*inner)[4].y);
        openness = (openness + inner_open) / 2.0f;
    }
    return std::min(1.0f, openness * LIP_OPENNESS_SCALE);
}

float GeometricSignals::lip_quality(const Points& p) const {
    float width = std::abs(p[6].x - p[0].x);
    float height = std::abs(p[3].y - p[9].y);

    float proportion = 0.6f;
    if (width > 0.0f) {
        float aspect = height / width;
        if (aspect > 0.05f && aspect < 0.5f) proportion = 1.0f;
    }
    float spread = std::min(1.0f, landmark_spread(p) * 20.0f);
    float outlier = has_outliers(p) ? 0.8f : 1.0f;

    return proportion * spread * outlier;
}

LipAnalysis GeometricSignals::analyze_lips(const LandmarkSet& landmarks) const {
    LipAnalysis result;
    if (!landmarks.outer_lips) return result;

    const Points& p = *landmarks.outer_lips;
    if (p.size() < LIP_MIN_POINTS) {
        result.quality = 0.3f;
        return result;
    }

    result.curvature = lip_curvature(p);
    result.symmetry = lip_symmetry(p);
    result.width = lip_width(p);
    result.openness = lip_openness(p, landmarks.inner_lips);
    result.quality = lip_quality(p);
    return result;
}

// ==================== CHEEKS ====================

float GeometricSignals::cheek_elevation(const Points& c) const {
    size_t n = c.size();
    size_t left = static_cast<size_t>(n * 0.3);
    size_t right = static_cast<size_t>(n * 0.7);
    size_t jaw = static_cast<size_t>(n * 0.5);

    float cheek_y = (c[left].y + c[right].y) / 2.0f;
    return clamp01((c[jaw].y - cheek_y) * CHEEK_ELEVATION_SCALE);
}

float GeometricSignals::cheek_definition(const Points& c) const {
    if (c.size() < CONTOUR_DEFINITION_POINTS) return 0.5f;

    float total = 0.0f;
    int segments = 0;
    for (size_t i = 0; i + 2 < c.size(); i += 2) {
        total += turning(c[i], c[i + 1], c[i + 2]);
        segments++;
    }
    return std::min(1.0f, (total / segments) * 2.0f);
}

float GeometricSignals::cheek_quality(const Points& c) const {
    auto [min_x, max_x] = std::minmax_element(c.begin(), c.end(),
        [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; });
    auto [min_y, max_y] = std::minmax_element(c.begin(), c.end(),
        [](const cv::Point2f& a, const cv::Point2f& b) { return a.y < b.y; });

    float w = max_x->x - min_x->x;
    float h = max_y->y - min_y->y;

    float proportion = 0.6f;
    if (w > 0.0f) {
        float aspect = h / w;
        if (aspect > 0.8f && aspect < 2.0f) proportion = 1.0f;
    }
    float distribution = std::min(1.0f, landmark_spread(c) * 5.0f);
    return proportion * distribution;
}

CheekAnalysis GeometricSignals::analyze_cheeks(const LandmarkSet& landmarks) const {
    CheekAnalysis result;
    if (!landmarks.face_contour) return result;

    const Points& c = *landmarks.face_contour;
    if (c.size() < CONTOUR_MIN_POINTS) {
        result.quality = 0.3f;
        return result;
    }

    result.elevation = cheek_elevation(c);
    result.definition = cheek_definition(c);
    result.quality = cheek_quality(c);
    return result;
}

// ==================== EYE CREASING ====================

float GeometricSignals::eye_creasing(const Points& eye) const {
    if (eye.size() < EYE_MIN_POINTS) return 0.5f;

    // [2] upper mid, [4] lower mid; less height = more squint
    float height = std::abs(eye[2].y - eye[4].y);
    return clamp01(1.0f - height * EYE_CREASE_SCALE);
}

float GeometricSignals::eye_quality(const Points& eye) const {
    if (eye.size() < EYE_MIN_POINTS) return 0.0f;

    float width = std::abs(eye[3].x - eye[0].x);
    float height = std::abs(eye[1].y - eye[5].y);

    float proportion = 0.6f;
    if (width > 0.0f) {
        float aspect = height / width;
        if (aspect > 0.1f && aspect < 0.8f) proportion = 1.0f;
    }
    float distribution = std::min(1.0f, landmark_spread(eye) * 15.0f);
    return proportion * distribution;
}

EyeCreaseAnalysis GeometricSignals::analyze_eye_creasing(const LandmarkSet& landmarks) const {
    EyeCreaseAnalysis result;
    if (!landmarks.left_eye || !landmarks.right_eye) return result;

    float left = eye_creasing(*landmarks.left_eye);
    float right = eye_creasing(*landmarks.right_eye);

    result.creasing = (left + right) / 2.0f;
    result.symmetry = 1.0f - std::abs(left - right);
    result.quality = std::min(eye_quality(*landmarks.left_eye), eye_quality(*landmarks.right_eye));
    return result;
}

// ==================== COMBINED ====================

ExpressionQuality GeometricSignals::combine(const LipAnalysis& lips,
                                            const CheekAnalysis& cheeks,
                                            const EyeCreaseAnalysis& eyes) const {
    const auto& c = expr_cfg;
    float avg_quality = (lips.quality + cheeks.quality + eyes.quality) / 3.0f;

    // 1. Intensity, scaled by landmark quality
    float weighted = lips.curvature * c.lip_weight +
                     eyes.creasing * c.crease_weight +
                     cheeks.elevation * c.cheek_weight;
    float intensity = clamp01(weighted * (0.5f + 0.5f * avg_quality));

    // 2. Naturalness (Duchenne factor + symmetry + definition)
    float naturalness = eyes.creasing * c.natural_crease_weight +
                        lips.symmetry * c.natural_symmetry_weight +
                        cheeks.definition * c.natural_definition_weight;

    if (lips.curvature > c.posed_lip_intensity && eyes.creasing < c.posed_crease_max) {
        naturalness *= c.posed_penalty;  // mouth-only smile
    } else if (lips.curvature > 0.0f) {
        float ratio = eyes.creasing / lips.curvature;
        if (ratio >= c.coordinated_ratio_min && ratio <= c.coordinated_ratio_max) {
            naturalness *= c.coordinated_bonus;
        }
    }
    naturalness = clamp01(naturalness);

    // 3. Confidence
    float consistency = intensity_consistency(lips.curvature, cheeks.elevation, eyes.creasing);
    float avg_symmetry = (lips.symmetry + eyes.symmetry) / 2.0f;
    float confidence = clamp01(avg_quality * c.confidence_quality_weight +
                               consistency * c.confidence_agreement_weight +
                               avg_symmetry * c.confidence_symmetry_weight);

    spdlog::debug("Expression: lip={:.2f} cheek={:.2f} crease={:.2f} -> I={:.2f} N={:.2f} C={:.2f}",
                  lips.curvature, cheeks.elevation, eyes.creasing,
                  intensity, naturalness, confidence);

    return ExpressionQuality(intensity, naturalness, confidence);
}

ExpressionQuality GeometricSignals::expression_quality(const std::optional<LandmarkSet>& landmarks) const {
    if (!landmarks) {
        return ExpressionQuality(0.5f, 0.5f, 0.0f);
    }
    return combine(analyze_lips(*landmarks),
                   analyze_cheeks(*landmarks),
                   analyze_eye_creasing(*landmarks));
}

// ==================== HELPERS ====================

float GeometricSignals::landmark_spread(const Points& points) {
    if (points.size() < 2) return 0.0f;

    cv::Point2f center(0.0f, 0.0f);
    for (const auto& p : points) center += p;
    center *= 1.0f / static_cast<float>(points.size());

    float total = 0.0f;
    for (const auto& p : points) total += dist(p, center);
    return total / static_cast<float>(points.size());
}

bool GeometricSignals::has_outliers(const Points& points) {
    if (points.size() < 6) return false;

    cv::Point2f center(0.0f, 0.0f);
    for (const auto& p : points) center += p;
    center *= 1.0f / static_cast<float>(points.size());

    float max_allowed = landmark_spread(points) * OUTLIER_SPREAD_FACTOR;
    if (max_allowed <= 0.0f) return false;

    for (const auto& p : points) {
        if (dist(p, center) > max_allowed) return true;
    }
    return false;
}

float GeometricSignals::intensity_consistency(float lip, float cheek, float eye) {
    float avg = (lip + cheek + eye) / 3.0f;
    float deviation = (std::abs(lip - avg) + std::abs(cheek - avg) + std::abs(eye - avg)) / 3.0f;
    return std::max(0.0f, 1.0f - deviation * 2.0f);
}

} // namespace burstface
