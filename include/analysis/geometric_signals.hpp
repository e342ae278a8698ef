// ============= include/analysis/geometric_signals.hpp =============
/*
 * Geometric signals from facial landmarks
 *
 * EYES:
 * - Eye Aspect Ratio (EAR) from >= 6 eye points
 * - Adaptive open/closed threshold chosen from the average EAR of both eyes
 *   (raw EAR varies ~0.1 across individuals from eye shape alone)
 *
 * EXPRESSION:
 * - Lips: corner elevation vs mouth center, symmetry, width, openness
 * - Cheeks: contour elevation and definition
 * - Eye creasing: vertical compression of the eye (Duchenne marker)
 * - Fused into ExpressionQuality {intensity, naturalness, confidence}
 *
 * Missing landmarks never throw: every branch has a neutral default with a
 * low confidence.
 */

#pragma once
#include "analysis/face_types.hpp"
#include "config.hpp"

namespace burstface {

struct LipAnalysis {
    float curvature = 0.5f;
    float symmetry = 0.5f;
    float width = 0.5f;
    float openness = 0.5f;
    float quality = 0.0f;
};

struct CheekAnalysis {
    float elevation = 0.5f;
    float definition = 0.5f;
    float quality = 0.0f;
};

struct EyeCreaseAnalysis {
    float creasing = 0.5f;
    float symmetry = 0.5f;
    float quality = 0.0f;
};

class GeometricSignals {
public:
    explicit GeometricSignals(const EyeConfig& eye_cfg = EyeConfig(),
                              const ExpressionConfig& expr_cfg = ExpressionConfig());

    // ===== EYES =====
    float eye_aspect_ratio(const Points& eye) const;
    float adaptive_threshold(float left_ear, float right_ear) const;
    EyeState eye_state(const std::optional<LandmarkSet>& landmarks) const;

    // ===== EXPRESSION =====
    LipAnalysis analyze_lips(const LandmarkSet& landmarks) const;
    CheekAnalysis analyze_cheeks(const LandmarkSet& landmarks) const;
    EyeCreaseAnalysis analyze_eye_creasing(const LandmarkSet& landmarks) const;

    ExpressionQuality expression_quality(const std::optional<LandmarkSet>& landmarks) const;
    ExpressionQuality combine(const LipAnalysis& lips,
                              const CheekAnalysis& cheeks,
                              const EyeCreaseAnalysis& eyes) const;

    // ===== LANDMARK HELPERS =====
    static float landmark_spread(const Points& points);
    static bool has_outliers(const Points& points);
    static float intensity_consistency(float lip, float cheek, float eye);

private:
    EyeConfig eye_cfg;
    ExpressionConfig expr_cfg;

    float lip_curvature(const Points& p) const;
    float lip_symmetry(const Points& p) const;
    float lip_width(const Points& p) const;
    float lip_openness(const Points& outer, const std::optional<Points>& inner) const;
    float lip_quality(const Points& p) const;

    float cheek_elevation(const Points& contour) const;
    float cheek_definition(const Points& contour) const;
    float cheek_quality(const Points& contour) const;

    float eye_creasing(const Points& eye) const;
    float eye_quality(const Points& eye) const;
};

} // namespace burstface
