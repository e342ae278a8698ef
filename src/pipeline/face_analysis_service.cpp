// ============= src/pipeline/face_analysis_service.cpp =============
#include "pipeline/face_analysis_service.hpp"
#include "recognition/identity_resolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <tuple>

namespace burstface {

FaceAnalysisService::FaceAnalysisService(std::shared_ptr<ImageLoader> loader,
                                         std::shared_ptr<FaceDetector> detector,
                                         std::shared_ptr<EmbeddingGenerator> embedder,
                                         const AnalysisConfig& config)
    : config(config),
      loader(std::move(loader)),
      detector(std::move(detector)),
      embedder(std::move(embedder)),
      scorer(config),
      aggregator(config.aggregation),
      eligibility(config.eligibility),
      cache(config.cache.ttl_sec)
{
    if (!this->loader || !this->detector) {
        throw std::invalid_argument("FaceAnalysisService requires an image loader and a face detector");
    }
    this->config.validate();

    pool = std::make_unique<ThreadPool>(static_cast<size_t>(config.pipeline.worker_threads));

    spdlog::info("🧠 Face analysis service ready");
    spdlog::info("   Workers: {}", config.pipeline.worker_threads);
    spdlog::info("   Embeddings: {}", this->embedder ? "enabled" : "disabled (position fallback)");
    spdlog::info("   Cache TTL: {}", config.cache.ttl_sec > 0
                 ? std::to_string(config.cache.ttl_sec) + "s" : std::string("none"));
}

FaceAnalysisService::~FaceAnalysisService() {
    if (pool) pool->stop();
}

// ==================== PER PHOTO ====================

std::optional<ProcessedPhoto> FaceAnalysisService::process_photo(const Photo& photo) {
    if (auto cached = cache.get_photo(photo.asset_id)) {
        // faces are reused, metadata comes from the caller
        cached->photo = photo;
        for (auto& face : cached->faces) face.record.photo = photo;
        return cached;
    }

    // 1. Load
    cv::Mat image;
    try {
        image = loader->load(photo);
    } catch (const ImageLoadError& e) {
        spdlog::warn("⚠️ Could not load {} ({}): {}", photo.asset_id,
                     e.kind() == ImageLoadError::Kind::NotFound ? "not found" : "io error", e.what());
        return std::nullopt;
    }
    if (image.empty()) {
        spdlog::warn("⚠️ Could not load {}: empty image", photo.asset_id);
        return std::nullopt;
    }

    // 2. Detect
    std::vector<DetectedFace> detected;
    try {
        detected = detector->detect(image, photo);
    } catch (const DetectionError& e) {
        spdlog::warn("⚠️ Detection failed for {}: {}", photo.asset_id, e.what());
        return std::nullopt;
    }

    // 3. Score + embed
    ProcessedPhoto result;
    result.photo = photo;
    result.image_size = image.size();
    result.faces.reserve(detected.size());

    for (size_t i = 0; i < detected.size(); i++) {
        ScoredFace face;
        face.record = scorer.score(detected[i], photo, static_cast<int>(i), image);

        if (embedder) {
            try {
                face.embedding = embedder->embed(image, detected[i].box);
            } catch (const std::exception& e) {
                spdlog::debug("Embedding failed for {}#{}: {}", photo.asset_id, i, e.what());
            }
        }
        result.faces.push_back(std::move(face));
    }

    spdlog::debug("{}: {} faces ({}x{})", photo.asset_id, result.faces.size(),
                  result.image_size.width, result.image_size.height);

    // 4. Cache outside any collaborator call
    cache.set_photo(photo.asset_id, result);
    return result;
}

std::vector<ProcessedPhoto> FaceAnalysisService::process_photos(const std::vector<Photo>& photos) {
    std::vector<std::future<std::optional<ProcessedPhoto>>> futures;
    futures.reserve(photos.size());

    for (const auto& photo : photos) {
        futures.push_back(pool->submit([this, photo]() { return process_photo(photo); }));
    }

    std::vector<ProcessedPhoto> processed;
    processed.reserve(photos.size());

    for (size_t i = 0; i < futures.size(); i++) {
        try {
            if (auto result = futures[i].get()) {
                processed.push_back(std::move(*result));
            }
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Dropping {}: {}", photos[i].asset_id, e.what());
        }
    }

    // canonical order, independent of input order
    std::stable_sort(processed.begin(), processed.end(),
        [](const ProcessedPhoto& a, const ProcessedPhoto& b) {
            return std::tie(a.photo.timestamp, a.photo.asset_id) <
                   std::tie(b.photo.timestamp, b.photo.asset_id);
        });

    return processed;
}

// ==================== CLUSTER ====================

ClusterFaceAnalysis FaceAnalysisService::perform_analysis(const PhotoCluster& cluster) {
    auto t0 = std::chrono::steady_clock::now();
    spdlog::info("Analyzing cluster {} ({} photos)", cluster.cluster_id, cluster.photos.size());

    // 1. Parallel per-photo phase
    std::vector<ProcessedPhoto> processed = process_photos(cluster.photos);

    // 2. Sequential identity fold
    std::vector<ScoredFace> faces;
    for (const auto& p : processed) {
        faces.insert(faces.end(), p.faces.begin(), p.faces.end());
    }

    IdentityResolver::DistanceFn distance;
    if (embedder) {
        EmbeddingGenerator* gen = embedder.get();
        distance = [gen](const FaceEmbedding& a, const FaceEmbedding& b) { return gen->distance(a, b); };
    }
    IdentityResolver resolver(config.identity, distance);
    resolver.resolve_all(std::move(faces));

    // 3. Aggregate
    ClusterFaceAnalysis analysis;
    analysis.cluster_id = cluster.cluster_id;
    analysis.persons = aggregator.aggregate(resolver.get_identities());
    analysis.base_photo = base_selector.select(processed);
    analysis.overall_improvement = PersonAggregator::overall_improvement(analysis.persons);
    analysis.processed_photos = static_cast<int>(processed.size());
    analysis.identities_resolved = static_cast<int>(resolver.get_identity_count());

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    spdlog::info("✓ Cluster {}: {}/{} photos, {} identities, {} with potential, {} to improve, overall={:.3f} ({} ms)",
                 cluster.cluster_id, analysis.processed_photos, cluster.photos.size(),
                 analysis.identities_resolved, analysis.person_count(),
                 analysis.people_with_improvements(config.aggregation.people_with_improvement).size(),
                 analysis.overall_improvement, ms);
    cache.print_stats();

    return analysis;
}

ClusterFaceAnalysis FaceAnalysisService::analyze_cluster(const PhotoCluster& cluster) {
    if (auto cached = cache.get_cluster(cluster.cluster_id, cluster.photos.size())) {
        spdlog::info("Using cached analysis for cluster {}", cluster.cluster_id);
        return *cached;
    }

    ClusterFaceAnalysis analysis = perform_analysis(cluster);
    cache.set_cluster(cluster.cluster_id, cluster.photos.size(), analysis);
    return analysis;
}

std::map<std::string, std::vector<FaceQualityRecord>>
FaceAnalysisService::rank_faces(const std::vector<Photo>& photos) {
    std::map<std::string, std::vector<FaceQualityRecord>> rankings;

    for (const auto& processed : process_photos(photos)) {
        std::vector<FaceQualityRecord> records;
        records.reserve(processed.faces.size());
        for (const auto& f : processed.faces) records.push_back(f.record);

        std::stable_sort(records.begin(), records.end(),
            [](const FaceQualityRecord& a, const FaceQualityRecord& b) {
                return a.composite > b.composite;
            });
        rankings[processed.photo.asset_id] = std::move(records);
    }

    return rankings;
}

EligibilityResult FaceAnalysisService::assess_eligibility(const PhotoCluster& cluster) {
    if (auto early = eligibility.precheck(cluster.photos.size())) {
        spdlog::info("Cluster {} not eligible: {}", cluster.cluster_id, to_string(early->reason));
        return *early;
    }

    ClusterFaceAnalysis analysis = analyze_cluster(cluster);
    EligibilityResult result = eligibility.evaluate(cluster.photos.size(), analysis);

    if (!result.is_eligible) {
        spdlog::info("Cluster {} not eligible: {} (confidence {:.2f})",
                     cluster.cluster_id, to_string(result.reason), result.confidence);
    }
    return result;
}

// ==================== CACHE ====================

void FaceAnalysisService::clear_cache() {
    cache.clear();
}

void FaceAnalysisService::clear_cache(const std::string& cluster_id) {
    cache.clear_cluster(cluster_id);
}

AnalysisCache::Stats FaceAnalysisService::cache_statistics() const {
    return cache.get_stats();
}

} // namespace burstface
