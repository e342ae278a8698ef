// ============= include/pipeline/collaborators.hpp =============
/*
 * External collaborators consumed by the analysis pipeline
 *
 * - ImageLoader:        decode a photo           (throws ImageLoadError)
 * - FaceDetector:       faces + landmarks        (throws DetectionError)
 * - EmbeddingGenerator: identity descriptors     (nullopt = unavailable)
 *
 * Implementations must be safe to call from several worker threads at once.
 */

#pragma once
#include "analysis/face_types.hpp"
#include "recognition/embedding.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace burstface {

class ImageLoadError : public std::runtime_error {
public:
    enum class Kind { NotFound, IOError };

    ImageLoadError(Kind kind, const std::string& what)
        : std::runtime_error(what), error_kind(kind) {}

    Kind kind() const { return error_kind; }

private:
    Kind error_kind;
};

class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& what) : std::runtime_error(what) {}
};

class ImageLoader {
public:
    virtual ~ImageLoader() = default;
    virtual cv::Mat load(const Photo& photo) = 0;
};

class FaceDetector {
public:
    virtual ~FaceDetector() = default;
    virtual std::vector<DetectedFace> detect(const cv::Mat& image, const Photo& photo) = 0;
};

class EmbeddingGenerator {
public:
    virtual ~EmbeddingGenerator() = default;

    // box is normalized; nullopt when no descriptor can be produced
    virtual std::optional<FaceEmbedding> embed(const cv::Mat& image, const cv::Rect2f& box) = 0;

    virtual float distance(const FaceEmbedding& a, const FaceEmbedding& b) const {
        return embedding::l2_distance(a, b);
    }
};

} // namespace burstface
