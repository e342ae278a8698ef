// ============= src/analysis/face_types.cpp =============
#include "analysis/face_types.hpp"
#include <algorithm>
#include <cmath>

namespace burstface {

namespace {
inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }
}

// ==================== FaceAngle ====================

bool FaceAngle::is_optimal() const {
    return std::abs(pitch) < 15.0f && std::abs(yaw) < 20.0f && std::abs(roll) < 10.0f;
}

bool FaceAngle::is_compatible_for_alignment(const FaceAngle& other) const {
    return std::abs(pitch - other.pitch) < 25.0f &&
           std::abs(yaw - other.yaw) < 30.0f &&
           std::abs(roll - other.roll) < 20.0f;
}

// ==================== Signals ====================

EyeState::EyeState(bool left, bool right, float conf)
    : left_open(left), right_open(right), confidence(clamp01(conf)) {}

ExpressionQuality::ExpressionQuality(float i, float n, float c)
    : intensity(clamp01(i)), naturalness(clamp01(n)), confidence(clamp01(c)) {}

float severity(FaceIssue issue) {
    switch (issue) {
        case FaceIssue::EyesClosed:        return 1.0f;
        case FaceIssue::BlurredFace:       return 0.9f;
        case FaceIssue::PoorExpression:    return 0.8f;
        case FaceIssue::AwkwardPose:       return 0.7f;
        case FaceIssue::UnflatteringAngle: return 0.6f;
        case FaceIssue::None:              return 0.0f;
    }
    return 0.0f;
}

const char* to_string(FaceIssue issue) {
    switch (issue) {
        case FaceIssue::EyesClosed:        return "eyes_closed";
        case FaceIssue::PoorExpression:    return "poor_expression";
        case FaceIssue::AwkwardPose:       return "awkward_pose";
        case FaceIssue::BlurredFace:       return "blurred_face";
        case FaceIssue::UnflatteringAngle: return "unflattering_angle";
        case FaceIssue::None:              return "none";
    }
    return "none";
}

// ==================== FaceQualityRecord ====================

std::vector<FaceIssue> FaceQualityRecord::identified_issues() const {
    std::vector<FaceIssue> issues;

    if (!eyes.both_open()) issues.push_back(FaceIssue::EyesClosed);
    if (expression.overall() < 0.5f) issues.push_back(FaceIssue::PoorExpression);
    if (!pose.is_optimal()) issues.push_back(FaceIssue::UnflatteringAngle);
    if (sharpness < 0.6f) issues.push_back(FaceIssue::BlurredFace);
    if (capture_quality < 0.5f) issues.push_back(FaceIssue::AwkwardPose);

    if (issues.empty()) issues.push_back(FaceIssue::None);
    return issues;
}

FaceIssue FaceQualityRecord::primary_issue() const {
    auto issues = identified_issues();
    auto it = std::max_element(issues.begin(), issues.end(),
        [](FaceIssue a, FaceIssue b) { return severity(a) < severity(b); });
    return it != issues.end() ? *it : FaceIssue::None;
}

// ==================== Person / Cluster ====================

bool PersonFaceQualityAnalysis::should_replace() const {
    return improvement_potential > 0.4f && quality_gain() > 0.2f;
}

std::vector<FaceIssue> PersonFaceQualityAnalysis::issues_fixed() const {
    auto worst_issues = worst.identified_issues();
    auto best_issues = best.identified_issues();

    std::vector<FaceIssue> fixed;
    for (FaceIssue issue : worst_issues) {
        if (std::find(best_issues.begin(), best_issues.end(), issue) == best_issues.end()) {
            fixed.push_back(issue);
        }
    }
    return fixed;
}

std::vector<PersonId> ClusterFaceAnalysis::people_with_improvements(float threshold) const {
    std::vector<PersonId> ids;
    for (const auto& [id, analysis] : persons) {
        if (analysis.improvement_potential > threshold) ids.push_back(id);
    }
    return ids;
}

double ClusterFaceAnalysis::estimated_processing_seconds() const {
    return 5.0 + 2.0 * static_cast<double>(persons.size()) +
           3.0 * static_cast<double>(people_with_improvements().size());
}

// ==================== Eligibility ====================

const char* to_string(EligibilityReason reason) {
    switch (reason) {
        case EligibilityReason::Eligible:           return "eligible";
        case EligibilityReason::InsufficientPhotos: return "insufficient_photos";
        case EligibilityReason::NoFaceVariations:   return "no_face_variations";
        case EligibilityReason::InconsistentPeople: return "inconsistent_people";
        case EligibilityReason::LowQualityPhotos:   return "low_quality_photos";
        case EligibilityReason::ProcessingError:    return "processing_error";
    }
    return "processing_error";
}

const char* user_message(EligibilityReason reason) {
    switch (reason) {
        case EligibilityReason::Eligible:
            return "This cluster is eligible for composite generation.";
        case EligibilityReason::InsufficientPhotos:
            return "Need at least 2 similar photos to create a composite.";
        case EligibilityReason::NoFaceVariations:
            return "All photos have similar expressions - no improvements possible.";
        case EligibilityReason::InconsistentPeople:
            return "Photos contain different people - cannot create composite.";
        case EligibilityReason::LowQualityPhotos:
            return "Photo quality is too low for reliable face compositing.";
        case EligibilityReason::ProcessingError:
            return "Unable to analyze photos.";
    }
    return "";
}

const char* to_string(ImprovementType type) {
    switch (type) {
        case ImprovementType::EyesClosed:        return "eyes_closed";
        case ImprovementType::PoorExpression:    return "poor_expression";
        case ImprovementType::AwkwardPose:       return "awkward_pose";
        case ImprovementType::BlurredFace:       return "blurred_face";
        case ImprovementType::UnflatteringAngle: return "unflattering_angle";
    }
    return "poor_expression";
}

ImprovementType improvement_for(FaceIssue issue) {
    switch (issue) {
        case FaceIssue::EyesClosed:        return ImprovementType::EyesClosed;
        case FaceIssue::PoorExpression:    return ImprovementType::PoorExpression;
        case FaceIssue::AwkwardPose:       return ImprovementType::AwkwardPose;
        case FaceIssue::BlurredFace:       return ImprovementType::BlurredFace;
        case FaceIssue::UnflatteringAngle: return ImprovementType::UnflatteringAngle;
        case FaceIssue::None:              return ImprovementType::PoorExpression;
    }
    return ImprovementType::PoorExpression;
}

} // namespace burstface
