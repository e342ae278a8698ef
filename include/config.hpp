// ============= include/config.hpp =============
/*
 * Analysis configuration
 *
 * Every threshold and weight used by the engine lives here, grouped by the
 * stage that consumes it. Defaults reproduce the tuned values; a TOML file
 * (configs/analysis.toml) can override any of them.
 *
 * SECTIONS:
 * - [eyes]          EAR bands and fallback confidences
 * - [expression]    regional weights, posed/coordinated multipliers
 * - [score]         composite weights, sharpness tiers
 * - [identity]      similarity tiers, consistency checks, fallback match
 * - [aggregation]   minimum faces and improvement per person
 * - [eligibility]   photo count and improvement cutoffs
 * - [cache]         TTL
 * - [pipeline]      worker threads
 */

#pragma once
#include <stdexcept>
#include <string>

namespace burstface {

class SimpleToml;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct EyeConfig {
    int min_points = 6;
    float horizontal_epsilon = 0.001f;
    float vertical_epsilon = 1e-6f;
    float default_ear = 0.5f;

    // avg EAR above band -> threshold
    float wide_band = 0.30f;
    float wide_threshold = 0.21f;
    float normal_band = 0.20f;
    float normal_threshold = 0.18f;
    float narrow_band = 0.12f;
    float narrow_threshold = 0.15f;
    float minimum_threshold = 0.12f;

    float no_landmarks_confidence = 0.0f;
    float missing_region_confidence = 0.2f;
};

struct ExpressionConfig {
    float lip_weight = 0.60f;
    float crease_weight = 0.25f;
    float cheek_weight = 0.15f;

    float natural_crease_weight = 0.4f;
    float natural_symmetry_weight = 0.3f;
    float natural_definition_weight = 0.3f;

    float posed_lip_intensity = 0.8f;
    float posed_crease_max = 0.1f;
    float posed_penalty = 0.8f;

    float coordinated_ratio_min = 0.2f;
    float coordinated_ratio_max = 3.0f;
    float coordinated_bonus = 1.1f;

    float confidence_quality_weight = 0.4f;
    float confidence_agreement_weight = 0.3f;
    float confidence_symmetry_weight = 0.3f;
};

struct ScoreConfig {
    float capture_weight = 0.30f;
    float eyes_weight = 0.25f;
    float expression_weight = 0.20f;
    float sharpness_weight = 0.15f;
    float pose_weight = 0.10f;

    float non_optimal_pose_score = 0.5f;
    float default_capture_quality = 0.5f;

    float sharpness_base = 0.3f;
    float large_face_area = 0.10f;
    float large_face_bonus = 0.4f;
    float medium_face_area = 0.05f;
    float medium_face_bonus = 0.2f;
    float small_face_area = 0.02f;
    float small_face_bonus = 0.1f;
    float filter_bonus = 0.2f;
    float edge_stddev_scale = 20.0f;   // Laplacian std dev (8-bit gray) earning the full filter bonus
};

struct IdentityConfig {
    float minimum_similarity = 0.2f;
    float medium_similarity = 0.4f;
    float strong_similarity = 0.6f;
    float minimum_confidence = 0.5f;

    float embedding_weight = 0.7f;
    float pose_weight = 0.2f;
    float feature_weight = 0.1f;

    float mean_weight = 0.7f;
    float max_weight = 0.3f;

    float confidence_embedding_weight = 0.5f;
    float confidence_quality_weight = 0.3f;
    float confidence_descriptor_weight = 0.2f;

    float yaw_weight = 0.5f;
    float pitch_weight = 0.3f;
    float roll_weight = 0.2f;
    float yaw_normalizer = 90.0f;
    float pitch_normalizer = 90.0f;
    float roll_normalizer = 180.0f;

    float smile_consistency_delta = 0.3f;

    // medium-tier secondary checks
    float position_distance = 0.4f;
    double max_temporal_gap_sec = 300.0;
    float size_ratio_min = 0.5f;
    float size_ratio_max = 2.0f;
    int required_consistency_checks = 2;

    // embedding-free fallback
    float fallback_position_distance = 0.3f;
    float fallback_width_difference = 0.5f;
};

struct AggregationConfig {
    int min_faces = 2;
    float min_improvement = 0.2f;
    float people_with_improvement = 0.3f;
};

struct EligibilityConfig {
    int min_photos = 2;
    float min_overall_improvement = 0.3f;
    float insufficient_photos_confidence = 1.0f;
    float no_variations_confidence = 0.9f;
    float low_improvement_confidence = 0.8f;
};

struct CacheConfig {
    int ttl_sec = 0;  // 0 = entries never expire
};

struct PipelineConfig {
    int worker_threads = 4;
};

struct AnalysisConfig {
    EyeConfig eyes;
    ExpressionConfig expression;
    ScoreConfig score;
    IdentityConfig identity;
    AggregationConfig aggregation;
    EligibilityConfig eligibility;
    CacheConfig cache;
    PipelineConfig pipeline;

    // Throws ConfigError when the file cannot be read or a value is out of range.
    static AnalysisConfig load(const std::string& path);
    static AnalysisConfig from_toml(const SimpleToml& toml);

    void validate() const;
    void log_summary() const;
};

} // namespace burstface
