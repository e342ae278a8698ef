// ============= test/test_geometric_signals.cpp =============
#include "analysis/geometric_signals.hpp"
#include "test_common.hpp"

using namespace burstface;
using namespace testing_util;

// -----------------------------------------------------
// Eye aspect ratio
// -----------------------------------------------------
void test_eye_aspect_ratio(const GeometricSignals& g)
{
    section("EAR");

    // lids 2 * 0.005 apart on a 0.04 wide eye
    float ear = g.eye_aspect_ratio(synthetic::eye(0.5f, 0.5f, 0.04f, 0.005f));
    check_near(ear, 0.25, 1e-4, "open eye EAR = vertical / horizontal");

    float closed = g.eye_aspect_ratio(synthetic::eye(0.5f, 0.5f, 0.04f, 0.0f));
    check_near(closed, 0.0, 1e-6, "coincident lids give EAR 0");

    Points five = synthetic::eye(0.5f, 0.5f, 0.04f, 0.005f);
    five.pop_back();
    check_near(g.eye_aspect_ratio(five), 0.5, 1e-6, "fewer than 6 points fall back to 0.5");

    Points vertical_line;
    for (int i = 0; i < 6; i++) vertical_line.push_back({0.5f, 0.4f + 0.01f * i});
    check_near(g.eye_aspect_ratio(vertical_line), 0.5, 1e-6, "degenerate width falls back to 0.5");

    // point order must not matter
    Points shuffled = synthetic::eye(0.5f, 0.5f, 0.04f, 0.005f);
    std::swap(shuffled[0], shuffled[4]);
    std::swap(shuffled[1], shuffled[3]);
    check_near(g.eye_aspect_ratio(shuffled), 0.25, 1e-4, "EAR independent of point order");
}

// -----------------------------------------------------
// Head roll
// -----------------------------------------------------
void test_rolled_eyes(const GeometricSignals& g)
{
    section("Head roll");

    for (float deg : {1.0f, 5.0f, 10.0f, -7.0f}) {
        Points shut = synthetic::rolled(synthetic::eye(0.5f, 0.5f, 0.04f, 0.0f), deg);
        Points open = synthetic::rolled(synthetic::eye(0.5f, 0.5f, 0.04f, 0.005f), deg);

        float shut_ear = g.eye_aspect_ratio(shut);
        float open_ear = g.eye_aspect_ratio(open);
        spdlog::info("  roll={:+.0f} closed EAR={:.4f} open EAR={:.4f}", deg, shut_ear, open_ear);

        check(shut_ear < 1e-3f, "tilted closed eye keeps EAR near 0");
        check_near(open_ear, 0.25, 1e-3, "tilted open eye keeps its EAR");

        LandmarkSet lm = synthetic::open_eyes();
        lm.left_eye = synthetic::rolled(*lm.left_eye, deg);
        lm.right_eye = shut;
        EyeState state = g.eye_state(lm);
        check(state.left_open && !state.right_open, "tilted wink: left open, right closed");

        lm.left_eye = synthetic::rolled(synthetic::eye(0.35f, 0.6f, 0.04f, 0.0f), deg);
        check(!g.eye_state(lm).either_open(), "tilted closed eyes both detected closed");
    }
}

// -----------------------------------------------------
// Adaptive threshold bands
// -----------------------------------------------------
void test_threshold_bands(const GeometricSignals& g)
{
    section("Adaptive threshold");

    check_near(g.adaptive_threshold(0.35f, 0.35f), 0.21, 1e-6, "wide eyes -> 0.21");
    check_near(g.adaptive_threshold(0.25f, 0.25f), 0.18, 1e-6, "normal eyes -> 0.18");
    check_near(g.adaptive_threshold(0.15f, 0.15f), 0.15, 1e-6, "narrow eyes -> 0.15");
    check_near(g.adaptive_threshold(0.05f, 0.05f), 0.12, 1e-6, "very narrow eyes -> 0.12");
    check_near(g.adaptive_threshold(0.30f, 0.30f), 0.18, 1e-6, "band edge is exclusive");
}

// -----------------------------------------------------
// Eye state
// -----------------------------------------------------
void test_eye_state(const GeometricSignals& g)
{
    section("Eye state");

    EyeState none = g.eye_state(std::nullopt);
    check(none.both_open(), "no landmarks -> assumed open");
    check_near(none.confidence, 0.0, 1e-6, "no landmarks -> confidence 0");

    LandmarkSet one_eye = synthetic::open_eyes();
    one_eye.right_eye.reset();
    EyeState partial = g.eye_state(one_eye);
    check(partial.both_open(), "missing eye region -> assumed open");
    check_near(partial.confidence, 0.2, 1e-6, "missing eye region -> confidence 0.2");

    EyeState open = g.eye_state(synthetic::open_eyes());
    check(open.both_open(), "open eyes detected");
    check_near(open.confidence, 1.0, 1e-6, "open eyes full confidence");

    EyeState closed = g.eye_state(synthetic::closed_eyes());
    check(!closed.left_open && !closed.right_open, "closed eyes detected");
    check_near(closed.confidence, 0.0, 1e-6, "closed eyes zero confidence");

    LandmarkSet wink = synthetic::open_eyes();
    wink.right_eye = synthetic::eye(0.65f, 0.6f, 0.04f, 0.0f);
    EyeState w = g.eye_state(wink);
    check(w.left_open && !w.right_open, "wink: left open, right closed");
    check(w.either_open() && !w.both_open(), "wink: either but not both");
}

// -----------------------------------------------------
// Expression
// -----------------------------------------------------
void test_expression(const GeometricSignals& g)
{
    section("Expression");

    ExpressionQuality neutral_default = g.expression_quality(std::nullopt);
    check_near(neutral_default.intensity, 0.5, 1e-6, "no landmarks -> intensity 0.5");
    check_near(neutral_default.naturalness, 0.5, 1e-6, "no landmarks -> naturalness 0.5");
    check_near(neutral_default.confidence, 0.0, 1e-6, "no landmarks -> confidence 0");

    LandmarkSet smiling = synthetic::open_eyes();
    smiling.outer_lips = synthetic::lips(0.5f, 0.3f, 0.12f, 0.03f, 0.01f);
    LandmarkSet flat = synthetic::open_eyes();
    flat.outer_lips = synthetic::lips(0.5f, 0.3f, 0.12f, 0.03f, 0.0f);

    LipAnalysis smile_lips = g.analyze_lips(smiling);
    LipAnalysis flat_lips = g.analyze_lips(flat);
    check_near(smile_lips.curvature, 0.4, 1e-3, "raised corners -> curvature 0.4");
    check(flat_lips.curvature < 0.01f, "level corners -> no curvature");
    check(smile_lips.symmetry > 0.95f, "symmetric mouth");

    ExpressionQuality s = g.expression_quality(smiling);
    ExpressionQuality f = g.expression_quality(flat);
    check(s.intensity > f.intensity, "smile is more intense than a flat mouth");
    check(s.intensity >= 0.0f && s.intensity <= 1.0f, "intensity in [0,1]");
    check(s.confidence >= 0.0f && s.confidence <= 1.0f, "confidence in [0,1]");

    LandmarkSet short_lips;
    short_lips.outer_lips = Points(5, cv::Point2f(0.5f, 0.3f));
    check_near(g.analyze_lips(short_lips).quality, 0.3, 1e-6, "too few lip points -> quality 0.3");
}

void test_naturalness_multipliers(const GeometricSignals& g)
{
    section("Naturalness");

    CheekAnalysis cheeks;
    cheeks.definition = 0.5f;

    LipAnalysis posed_lips;
    posed_lips.curvature = 0.9f;
    posed_lips.symmetry = 1.0f;
    EyeCreaseAnalysis flat_eyes;
    flat_eyes.creasing = 0.05f;

    // (0.05*0.4 + 1*0.3 + 0.5*0.3) * 0.8
    ExpressionQuality posed = g.combine(posed_lips, cheeks, flat_eyes);
    check_near(posed.naturalness, 0.376, 1e-4, "mouth-only smile penalized");

    LipAnalysis lips;
    lips.curvature = 0.5f;
    lips.symmetry = 1.0f;
    EyeCreaseAnalysis creased;
    creased.creasing = 0.5f;

    // (0.5*0.4 + 1*0.3 + 0.5*0.3) * 1.1
    ExpressionQuality coordinated = g.combine(lips, cheeks, creased);
    check_near(coordinated.naturalness, 0.715, 1e-4, "coordinated smile rewarded");

    check_near(GeometricSignals::intensity_consistency(0.5f, 0.5f, 0.5f), 1.0, 1e-6,
               "equal regions fully consistent");
}

// -----------------------------------------------------
// Landmark helpers
// -----------------------------------------------------
void test_helpers()
{
    section("Landmark helpers");

    check_near(GeometricSignals::landmark_spread({{0.5f, 0.5f}}), 0.0, 1e-6, "single point has no spread");

    Points ring = synthetic::eye(0.5f, 0.5f, 0.04f, 0.005f);
    check(!GeometricSignals::has_outliers(ring), "compact contour has no outliers");

    Points stray = ring;
    stray.push_back({0.9f, 0.9f});
    check(GeometricSignals::has_outliers(stray), "far-off point flagged as outlier");

    check(!GeometricSignals::has_outliers(synthetic::lips(0.5f, 0.3f, 0.12f, 0.03f, 0.01f)),
          "smiling lip contour has no outliers");
}

// -----------------------------------------------------
// main
// -----------------------------------------------------
int main()
{
    spdlog::set_pattern("[%H:%M:%S] %v");

    GeometricSignals g;
    test_eye_aspect_ratio(g);
    test_rolled_eyes(g);
    test_threshold_bands(g);
    test_eye_state(g);
    test_expression(g);
    test_naturalness_multipliers(g);
    test_helpers();

    return finish("geometric signals");
}
