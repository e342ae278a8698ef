// ============= test/test_common.hpp =============
#pragma once
#include "analysis/face_types.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <string>

// -----------------------------------------------------
// Check helpers
// -----------------------------------------------------
namespace testing_util {

inline int& failures() {
    static int count = 0;
    return count;
}

inline void section(const std::string& text) {
    spdlog::info("[{}]", text);
}

inline void ok(const std::string& t) {
    spdlog::info("  OK {}", t);
}

inline void err(const std::string& t) {
    spdlog::error("  ERROR {}", t);
    failures()++;
}

inline void check(bool cond, const std::string& what) {
    if (cond) ok(what);
    else err(what);
}

inline void check_near(double actual, double expected, double tol, const std::string& what) {
    if (std::abs(actual - expected) <= tol) {
        ok(what);
    } else {
        err(what + " (got " + std::to_string(actual) + ", expected " + std::to_string(expected) + ")");
    }
}

inline int finish(const std::string& suite) {
    if (failures() == 0) {
        spdlog::info("✓ {}: all checks passed", suite);
        return 0;
    }
    spdlog::error("✗ {}: {} checks failed", suite, failures());
    return 1;
}

} // namespace testing_util

// -----------------------------------------------------
// Synthetic faces
// -----------------------------------------------------
namespace synthetic {

using namespace burstface;

// 6-point eye: corners at cx +- w/2, lids at cy +- half_height
inline Points eye(float cx, float cy, float w, float half_height) {
    float l = cx - w / 2.0f;
    float r = cx + w / 2.0f;
    float a = cx - w / 6.0f;
    float b = cx + w / 6.0f;
    return {
        {l, cy},
        {a, cy + half_height},
        {b, cy + half_height},
        {r, cy},
        {b, cy - half_height},
        {a, cy - half_height},
    };
}

// Points rotated by `degrees` about their centroid (head roll)
inline Points rolled(const Points& points, float degrees) {
    cv::Point2f c(0.0f, 0.0f);
    for (const auto& p : points) c += p;
    c *= 1.0f / static_cast<float>(points.size());

    float rad = degrees * static_cast<float>(CV_PI) / 180.0f;
    float cs = std::cos(rad);
    float sn = std::sin(rad);
    Points out;
    out.reserve(points.size());
    for (const auto& p : points) {
        cv::Point2f d = p - c;
        out.push_back({c.x + d.x * cs - d.y * sn, c.y + d.x * sn + d.y * cs});
    }
    return out;
}

// 12-point outer lip contour, corners at [0] and [6], lifted by `smile`
inline Points lips(float cx, float cy, float w, float h, float smile) {
    Points p(12);
    for (int i = 0; i < 12; i++) {
        float t = static_cast<float>(i) / 12.0f * 2.0f * static_cast<float>(CV_PI);
        float x = cx - std::cos(t) * w / 2.0f;
        float y = cy + std::sin(t) * h / 2.0f;
        p[i] = {x, y};
    }
    p[0].y += smile;
    p[6].y += smile;
    return p;
}

inline LandmarkSet open_eyes(float half_height = 0.005f) {
    LandmarkSet lm;
    lm.left_eye = eye(0.35f, 0.6f, 0.04f, half_height);
    lm.right_eye = eye(0.65f, 0.6f, 0.04f, half_height);
    lm.outer_lips = lips(0.5f, 0.3f, 0.12f, 0.03f, 0.01f);
    return lm;
}

inline LandmarkSet closed_eyes() {
    return open_eyes(0.0f);
}

inline Photo photo(const std::string& asset, double timestamp, int id = 0) {
    Photo p;
    p.id = id;
    p.asset_id = asset;
    p.timestamp = timestamp;
    return p;
}

inline FaceQualityRecord record(const std::string& asset, double timestamp, int index,
                                cv::Rect2f box, float composite) {
    FaceQualityRecord r;
    r.photo = photo(asset, timestamp);
    r.face_index = index;
    r.box = box;
    r.composite = composite;
    return r;
}

inline ScoredFace scored(const std::string& asset, double timestamp, int index,
                         cv::Rect2f box, float composite,
                         std::optional<FaceEmbedding> embedding = std::nullopt) {
    ScoredFace f;
    f.record = record(asset, timestamp, index, box, composite);
    f.embedding = std::move(embedding);
    return f;
}

// unit descriptor along axis `k` with a small tilt toward axis k+1
inline FaceEmbedding axis_embedding(int k, float tilt = 0.0f, int dims = 8) {
    FaceEmbedding e;
    e.descriptor.assign(dims, 0.0f);
    e.descriptor[k % dims] = 1.0f;
    e.descriptor[(k + 1) % dims] = tilt;
    return e;
}

} // namespace synthetic
