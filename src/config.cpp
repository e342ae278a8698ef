// ============= src/config.cpp =============
#include "config.hpp"
#include "core/simple_toml.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace burstface {

namespace {

void require(bool cond, const std::string& msg) {
    if (!cond) throw ConfigError(msg);
}

bool in_unit(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

} // namespace

AnalysisConfig AnalysisConfig::load(const std::string& path) {
    SimpleToml toml;
    if (!toml.load(path)) {
        throw ConfigError("cannot open config file: " + path);
    }
    spdlog::info("Config loaded: {} ({} keys)", path, toml.size());

    AnalysisConfig cfg = from_toml(toml);
    cfg.validate();
    return cfg;
}

AnalysisConfig AnalysisConfig::from_toml(const SimpleToml& t) {
    AnalysisConfig c;

    // [eyes]
    auto& e = c.eyes;
    e.min_points = t.get_int("eyes.min_points", e.min_points);
    e.horizontal_epsilon = t.get_float("eyes.horizontal_epsilon", e.horizontal_epsilon);
    e.vertical_epsilon = t.get_float("eyes.vertical_epsilon", e.vertical_epsilon);
    e.default_ear = t.get_float("eyes.default_ear", e.default_ear);
    e.wide_band = t.get_float("eyes.wide_band", e.wide_band);
    e.wide_threshold = t.get_float("eyes.wide_threshold", e.wide_threshold);
    e.normal_band = t.get_float("eyes.normal_band", e.normal_band);
    e.normal_threshold = t.get_float("eyes.normal_threshold", e.normal_threshold);
    e.narrow_band = t.get_float("eyes.narrow_band", e.narrow_band);
    e.narrow_threshold = t.get_float("eyes.narrow_threshold", e.narrow_threshold);
    e.minimum_threshold = t.get_float("eyes.minimum_threshold", e.minimum_threshold);
    e.no_landmarks_confidence = t.get_float("eyes.no_landmarks_confidence", e.no_landmarks_confidence);
    e.missing_region_confidence = t.get_float("eyes.missing_region_confidence", e.missing_region_confidence);

    // [expression]
    auto& x = c.expression;
    x.lip_weight = t.get_float("expression.lip_weight", x.lip_weight);
    x.crease_weight = t.get_float("expression.crease_weight", x.crease_weight);
    x.cheek_weight = t.get_float("expression.cheek_weight", x.cheek_weight);
    x.natural_crease_weight = t.get_float("expression.natural_crease_weight", x.natural_crease_weight);
    x.natural_symmetry_weight = t.get_float("expression.natural_symmetry_weight", x.natural_symmetry_weight);
    x.natural_definition_weight = t.get_float("expression.natural_definition_weight", x.natural_definition_weight);
    x.posed_lip_intensity = t.get_float("expression.posed_lip_intensity", x.posed_lip_intensity);
    x.posed_crease_max = t.get_float("expression.posed_crease_max", x.posed_crease_max);
    x.posed_penalty = t.get_float("expression.posed_penalty", x.posed_penalty);
    x.coordinated_ratio_min = t.get_float("expression.coordinated_ratio_min", x.coordinated_ratio_min);
    x.coordinated_ratio_max = t.get_float("expression.coordinated_ratio_max", x.coordinated_ratio_max);
    x.coordinated_bonus = t.get_float("expression.coordinated_bonus", x.coordinated_bonus);
    x.confidence_quality_weight = t.get_float("expression.confidence_quality_weight", x.confidence_quality_weight);
    x.confidence_agreement_weight = t.get_float("expression.confidence_agreement_weight", x.confidence_agreement_weight);
    x.confidence_symmetry_weight = t.get_float("expression.confidence_symmetry_weight", x.confidence_symmetry_weight);

    // [score]
    auto& s = c.score;
    s.capture_weight = t.get_float("score.capture_weight", s.capture_weight);
    s.eyes_weight = t.get_float("score.eyes_weight", s.eyes_weight);
    s.expression_weight = t.get_float("score.expression_weight", s.expression_weight);
    s.sharpness_weight = t.get_float("score.sharpness_weight", s.sharpness_weight);
    s.pose_weight = t.get_float("score.pose_weight", s.pose_weight);
    s.non_optimal_pose_score = t.get_float("score.non_optimal_pose_score", s.non_optimal_pose_score);
    s.default_capture_quality = t.get_float("score.default_capture_quality", s.default_capture_quality);
    s.sharpness_base = t.get_float("score.sharpness_base", s.sharpness_base);
    s.large_face_area = t.get_float("score.large_face_area", s.large_face_area);
    s.large_face_bonus = t.get_float("score.large_face_bonus", s.large_face_bonus);
    s.medium_face_area = t.get_float("score.medium_face_area", s.medium_face_area);
    s.medium_face_bonus = t.get_float("score.medium_face_bonus", s.medium_face_bonus);
    s.small_face_area = t.get_float("score.small_face_area", s.small_face_area);
    s.small_face_bonus = t.get_float("score.small_face_bonus", s.small_face_bonus);
    s.filter_bonus = t.get_float("score.filter_bonus", s.filter_bonus);
    s.edge_stddev_scale = t.get_float("score.edge_stddev_scale", s.edge_stddev_scale);

    // [identity]
    auto& i = c.identity;
    i.minimum_similarity = t.get_float("identity.minimum_similarity", i.minimum_similarity);
    i.medium_similarity = t.get_float("identity.medium_similarity", i.medium_similarity);
    i.strong_similarity = t.get_float("identity.strong_similarity", i.strong_similarity);
    i.minimum_confidence = t.get_float("identity.minimum_confidence", i.minimum_confidence);
    i.embedding_weight = t.get_float("identity.embedding_weight", i.embedding_weight);
    i.pose_weight = t.get_float("identity.pose_weight", i.pose_weight);
    i.feature_weight = t.get_float("identity.feature_weight", i.feature_weight);
    i.mean_weight = t.get_float("identity.mean_weight", i.mean_weight);
    i.max_weight = t.get_float("identity.max_weight", i.max_weight);
    i.confidence_embedding_weight = t.get_float("identity.confidence_embedding_weight", i.confidence_embedding_weight);
    i.confidence_quality_weight = t.get_float("identity.confidence_quality_weight", i.confidence_quality_weight);
    i.confidence_descriptor_weight = t.get_float("identity.confidence_descriptor_weight", i.confidence_descriptor_weight);
    i.yaw_weight = t.get_float("identity.yaw_weight", i.yaw_weight);
    i.pitch_weight = t.get_float("identity.pitch_weight", i.pitch_weight);
    i.roll_weight = t.get_float("identity.roll_weight", i.roll_weight);
    i.yaw_normalizer = t.get_float("identity.yaw_normalizer", i.yaw_normalizer);
    i.pitch_normalizer = t.get_float("identity.pitch_normalizer", i.pitch_normalizer);
    i.roll_normalizer = t.get_float("identity.roll_normalizer", i.roll_normalizer);
    i.smile_consistency_delta = t.get_float("identity.smile_consistency_delta", i.smile_consistency_delta);
    i.position_distance = t.get_float("identity.position_distance", i.position_distance);
    i.max_temporal_gap_sec = t.get_float("identity.max_temporal_gap_sec",
                                         static_cast<float>(i.max_temporal_gap_sec));
    i.size_ratio_min = t.get_float("identity.size_ratio_min", i.size_ratio_min);
    i.size_ratio_max = t.get_float("identity.size_ratio_max", i.size_ratio_max);
    i.required_consistency_checks = t.get_int("identity.required_consistency_checks",
                                              i.required_consistency_checks);
    i.fallback_position_distance = t.get_float("identity.fallback_position_distance",
                                               i.fallback_position_distance);
    i.fallback_width_difference = t.get_float("identity.fallback_width_difference",
                                              i.fallback_width_difference);

    // [aggregation]
    c.aggregation.min_faces = t.get_int("aggregation.min_faces", c.aggregation.min_faces);
    c.aggregation.min_improvement = t.get_float("aggregation.min_improvement", c.aggregation.min_improvement);
    c.aggregation.people_with_improvement = t.get_float("aggregation.people_with_improvement",
                                                        c.aggregation.people_with_improvement);

    // [eligibility]
    auto& el = c.eligibility;
    el.min_photos = t.get_int("eligibility.min_photos", el.min_photos);
    el.min_overall_improvement = t.get_float("eligibility.min_overall_improvement", el.min_overall_improvement);
    el.insufficient_photos_confidence = t.get_float("eligibility.insufficient_photos_confidence",
                                                    el.insufficient_photos_confidence);
    el.no_variations_confidence = t.get_float("eligibility.no_variations_confidence", el.no_variations_confidence);
    el.low_improvement_confidence = t.get_float("eligibility.low_improvement_confidence",
                                                el.low_improvement_confidence);

    // [cache] / [pipeline]
    c.cache.ttl_sec = t.get_int("cache.ttl_sec", c.cache.ttl_sec);
    c.pipeline.worker_threads = t.get_int("pipeline.worker_threads", c.pipeline.worker_threads);

    return c;
}

void AnalysisConfig::validate() const {
    require(eyes.min_points >= 6, "eyes.min_points must be >= 6");
    require(eyes.horizontal_epsilon > 0.0f, "eyes.horizontal_epsilon must be > 0");
    require(eyes.wide_band >= eyes.normal_band && eyes.normal_band >= eyes.narrow_band,
            "eyes bands must be descending (wide >= normal >= narrow)");
    require(eyes.minimum_threshold > 0.0f, "eyes.minimum_threshold must be > 0");
    require(in_unit(eyes.no_landmarks_confidence) && in_unit(eyes.missing_region_confidence),
            "eyes fallback confidences must be in [0,1]");

    require(in_unit(expression.lip_weight) && in_unit(expression.crease_weight) &&
            in_unit(expression.cheek_weight), "expression weights must be in [0,1]");
    require(expression.coordinated_ratio_min <= expression.coordinated_ratio_max,
            "expression.coordinated_ratio_min > coordinated_ratio_max");

    float score_sum = score.capture_weight + score.eyes_weight + score.expression_weight +
                      score.sharpness_weight + score.pose_weight;
    require(score_sum > 0.0f, "score weights sum to zero");
    require(in_unit(score.default_capture_quality), "score.default_capture_quality must be in [0,1]");
    require(score.edge_stddev_scale > 0.0f, "score.edge_stddev_scale must be > 0");

    require(identity.minimum_similarity <= identity.medium_similarity &&
            identity.medium_similarity <= identity.strong_similarity,
            "identity tiers must be ascending (minimum <= medium <= strong)");
    require(identity.yaw_normalizer > 0.0f && identity.pitch_normalizer > 0.0f &&
            identity.roll_normalizer > 0.0f, "identity angle normalizers must be > 0");
    require(identity.size_ratio_min <= identity.size_ratio_max,
            "identity.size_ratio_min > size_ratio_max");
    require(identity.required_consistency_checks >= 0 && identity.required_consistency_checks <= 3,
            "identity.required_consistency_checks must be in [0,3]");

    require(aggregation.min_faces >= 2, "aggregation.min_faces must be >= 2");
    require(eligibility.min_photos >= 1, "eligibility.min_photos must be >= 1");
    require(cache.ttl_sec >= 0, "cache.ttl_sec must be >= 0");
    require(pipeline.worker_threads >= 1, "pipeline.worker_threads must be >= 1");
}

void AnalysisConfig::log_summary() const {
    spdlog::info("=== Analysis config ===");
    spdlog::info("  Eyes: bands {:.2f}/{:.2f}/{:.2f} -> {:.2f}/{:.2f}/{:.2f} (min {:.2f})",
                 eyes.wide_band, eyes.normal_band, eyes.narrow_band,
                 eyes.wide_threshold, eyes.normal_threshold, eyes.narrow_threshold,
                 eyes.minimum_threshold);
    spdlog::info("  Score: capture={:.2f} eyes={:.2f} expr={:.2f} sharp={:.2f} pose={:.2f}",
                 score.capture_weight, score.eyes_weight, score.expression_weight,
                 score.sharpness_weight, score.pose_weight);
    spdlog::info("  Identity: min={:.2f} medium={:.2f} strong={:.2f} conf={:.2f}",
                 identity.minimum_similarity, identity.medium_similarity,
                 identity.strong_similarity, identity.minimum_confidence);
    spdlog::info("  Eligibility: photos>={} improvement>{:.2f}",
                 eligibility.min_photos, eligibility.min_overall_improvement);
    spdlog::info("  Cache TTL: {}s | Workers: {}", cache.ttl_sec, pipeline.worker_threads);
}

} // namespace burstface
