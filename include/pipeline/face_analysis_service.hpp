// ============= include/pipeline/face_analysis_service.hpp =============
/*
 * FaceAnalysisService: public entry point of the analysis core
 *
 * PIPELINE (per cluster):
 *   1. Per photo, in parallel on the worker pool:
 *        load -> detect -> score -> embed   (photo cache consulted first)
 *   2. Sequential identity fold in canonical order
 *   3. Per-person aggregation, base photo selection
 *   4. Result stored in the cluster cache
 *
 * FAILURES:
 * - Load / detection errors drop the photo (logged at warn)
 * - Missing landmarks or embeddings fall back to neutral defaults
 * - Ineligible clusters are typed results
 */

#pragma once
#include "analysis/base_photo_selector.hpp"
#include "analysis/eligibility_evaluator.hpp"
#include "analysis/face_scorer.hpp"
#include "analysis/person_aggregator.hpp"
#include "config.hpp"
#include "database/analysis_cache.hpp"
#include "pipeline/collaborators.hpp"
#include "pipeline/thread_pool.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace burstface {

class FaceAnalysisService {
public:
    // embedder may be null: identity resolution then uses the position fallback only
    FaceAnalysisService(std::shared_ptr<ImageLoader> loader,
                        std::shared_ptr<FaceDetector> detector,
                        std::shared_ptr<EmbeddingGenerator> embedder,
                        const AnalysisConfig& config = AnalysisConfig());
    ~FaceAnalysisService();

    ClusterFaceAnalysis analyze_cluster(const PhotoCluster& cluster);

    // asset id -> faces sorted by composite, best first
    std::map<std::string, std::vector<FaceQualityRecord>> rank_faces(const std::vector<Photo>& photos);

    EligibilityResult assess_eligibility(const PhotoCluster& cluster);

    void clear_cache();
    void clear_cache(const std::string& cluster_id);
    AnalysisCache::Stats cache_statistics() const;

    const AnalysisConfig& get_config() const { return config; }

private:
    AnalysisConfig config;

    std::shared_ptr<ImageLoader> loader;
    std::shared_ptr<FaceDetector> detector;
    std::shared_ptr<EmbeddingGenerator> embedder;

    FaceScorer scorer;
    PersonAggregator aggregator;
    BasePhotoSelector base_selector;
    EligibilityEvaluator eligibility;
    AnalysisCache cache;
    std::unique_ptr<ThreadPool> pool;

    std::optional<ProcessedPhoto> process_photo(const Photo& photo);
    std::vector<ProcessedPhoto> process_photos(const std::vector<Photo>& photos);
    ClusterFaceAnalysis perform_analysis(const PhotoCluster& cluster);
};

} // namespace burstface
