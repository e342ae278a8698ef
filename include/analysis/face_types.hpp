// ============= include/analysis/face_types.hpp =============
/*
 * Face analysis data model
 *
 * Coordinates:
 * - Bounding boxes are normalized [0,1] with a top-left origin.
 * - Landmark points are normalized with y growing upward (detector space).
 *
 * Every record produced by the analysis core is a plain value: copied into
 * caches and results, never mutated after construction.
 */

#pragma once
#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace burstface {

// ==================== INPUT ====================

struct Photo {
    int id = 0;
    std::string asset_id;                 // cache key
    double timestamp = 0.0;               // capture time (seconds)
    std::optional<float> overall_score;   // precomputed photo score [0,1]
};

struct PhotoCluster {
    std::string cluster_id;
    std::vector<Photo> photos;
};

using Points = std::vector<cv::Point2f>;

struct LandmarkSet {
    std::optional<Points> left_eye;
    std::optional<Points> right_eye;
    std::optional<Points> outer_lips;
    std::optional<Points> inner_lips;
    std::optional<Points> face_contour;
};

struct FaceAngle {
    float pitch = 0.0f;   // up/down, degrees
    float yaw = 0.0f;     // left/right
    float roll = 0.0f;    // side tilt

    bool is_optimal() const;
    bool is_compatible_for_alignment(const FaceAngle& other) const;
};

// Detector output, one per face
struct DetectedFace {
    cv::Rect2f box;
    std::optional<LandmarkSet> landmarks;
    std::optional<float> capture_quality;
    FaceAngle pose;
};

// ==================== SIGNALS ====================

struct EyeState {
    bool left_open = true;
    bool right_open = true;
    float confidence = 0.0f;

    EyeState() = default;
    EyeState(bool left, bool right, float conf);

    bool both_open() const { return left_open && right_open; }
    bool either_open() const { return left_open || right_open; }
};

struct ExpressionQuality {
    float intensity = 0.0f;
    float naturalness = 0.5f;
    float confidence = 0.0f;

    ExpressionQuality() = default;
    ExpressionQuality(float intensity, float naturalness, float confidence);

    // naturalness weighs more than intensity
    float overall() const { return intensity * 0.4f + naturalness * 0.6f; }
};

enum class FaceIssue {
    EyesClosed,
    PoorExpression,
    AwkwardPose,
    BlurredFace,
    UnflatteringAngle,
    None
};

float severity(FaceIssue issue);
const char* to_string(FaceIssue issue);

// ==================== SCORED FACES ====================

struct FaceQualityRecord {
    Photo photo;
    int face_index = 0;          // detector output order
    cv::Rect2f box;
    float capture_quality = 0.5f;
    EyeState eyes;
    ExpressionQuality expression;
    FaceAngle pose;
    float sharpness = 0.0f;
    float composite = 0.0f;

    std::vector<FaceIssue> identified_issues() const;
    FaceIssue primary_issue() const;

    cv::Point2f center() const {
        return {box.x + box.width * 0.5f, box.y + box.height * 0.5f};
    }
    float area() const { return box.width * box.height; }
};

struct FaceEmbedding {
    std::vector<float> descriptor;
    float confidence = 1.0f;
};

struct ScoredFace {
    FaceQualityRecord record;
    std::optional<FaceEmbedding> embedding;
};

// ==================== IDENTITIES ====================

using PersonId = std::string;

struct PersonIdentity {
    PersonId id;
    std::vector<ScoredFace> faces;   // append-only
};

struct PersonFaceQualityAnalysis {
    PersonId person_id;
    std::vector<FaceQualityRecord> faces;
    FaceQualityRecord best;
    FaceQualityRecord worst;
    float improvement_potential = 0.0f;

    float quality_gain() const { return best.composite - worst.composite; }
    bool should_replace() const;
    std::vector<FaceIssue> issues_fixed() const;
};

struct PhotoCandidate {
    Photo photo;
    cv::Size image_size;
    float suitability = 0.0f;
    float aesthetic = 0.0f;
    float technical = 0.0f;

    float overall() const { return suitability * 0.4f + aesthetic * 0.3f + technical * 0.3f; }
};

struct ClusterFaceAnalysis {
    std::string cluster_id;
    std::map<PersonId, PersonFaceQualityAnalysis> persons;
    std::optional<PhotoCandidate> base_photo;
    float overall_improvement = 0.0f;
    int processed_photos = 0;
    int identities_resolved = 0;

    size_t person_count() const { return persons.size(); }
    std::vector<PersonId> people_with_improvements(float threshold = 0.3f) const;
    double estimated_processing_seconds() const;
};

// ==================== ELIGIBILITY ====================

enum class EligibilityReason {
    Eligible,
    InsufficientPhotos,
    NoFaceVariations,
    InconsistentPeople,
    LowQualityPhotos,
    ProcessingError
};

const char* to_string(EligibilityReason reason);
const char* user_message(EligibilityReason reason);

enum class ImprovementType {
    EyesClosed,
    PoorExpression,
    AwkwardPose,
    BlurredFace,
    UnflatteringAngle
};

const char* to_string(ImprovementType type);
ImprovementType improvement_for(FaceIssue issue);

struct PersonImprovement {
    PersonId person_id;
    Photo source_photo;
    ImprovementType type = ImprovementType::PoorExpression;
    float confidence = 0.0f;
};

struct EligibilityResult {
    bool is_eligible = false;
    EligibilityReason reason = EligibilityReason::ProcessingError;
    float confidence = 0.0f;
    std::vector<PersonImprovement> improvements;
};

// ==================== PER-PHOTO ====================

// One decoded + analyzed photo (also the per-photo cache entry)
struct ProcessedPhoto {
    Photo photo;
    cv::Size image_size;
    std::vector<ScoredFace> faces;
};

} // namespace burstface
