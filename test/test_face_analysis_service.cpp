// ============= test/test_face_analysis_service.cpp =============
#include "pipeline/face_analysis_service.hpp"
#include "test_common.hpp"
#include "test_doubles.hpp"
#include <algorithm>
#include <memory>

using namespace burstface;
using namespace testing_util;

namespace {

const cv::Rect2f LEFT(0.1f, 0.3f, 0.2f, 0.2f);
const cv::Rect2f RIGHT(0.6f, 0.3f, 0.2f, 0.2f);

// Two people in three photos. The left person blinks in the first photo.
struct Fixture {
    std::shared_ptr<doubles::FakeLoader> loader = std::make_shared<doubles::FakeLoader>();
    std::shared_ptr<doubles::FakeDetector> detector = std::make_shared<doubles::FakeDetector>();
    std::shared_ptr<doubles::FakeEmbedder> embedder = std::make_shared<doubles::FakeEmbedder>();
    PhotoCluster cluster;

    Fixture() {
        cluster.cluster_id = "burst_42";
        for (int i = 0; i < 3; i++) {
            std::string asset = "IMG_" + std::to_string(100 + i);
            cluster.photos.push_back(synthetic::photo(asset, 1000.0 + i, i + 1));

            bool blink = i == 0;
            detector->faces[asset] = {
                doubles::face(LEFT, blink ? 0.0f : 1.0f,
                              blink ? std::optional<LandmarkSet>(synthetic::closed_eyes()) : std::nullopt),
                doubles::face(RIGHT, 1.0f),
            };
        }
    }

    std::unique_ptr<FaceAnalysisService> service(bool with_embedder = true) {
        AnalysisConfig cfg;
        cfg.pipeline.worker_threads = 3;
        return std::make_unique<FaceAnalysisService>(loader, detector,
                                                     with_embedder ? embedder : nullptr, cfg);
    }
};

std::vector<std::string> member_assets(const PersonFaceQualityAnalysis& p) {
    std::vector<std::string> assets;
    for (const auto& f : p.faces) assets.push_back(f.photo.asset_id + "#" + std::to_string(f.face_index));
    return assets;
}

}

// -----------------------------------------------------
// analyze_cluster
// -----------------------------------------------------
void test_analyze_cluster()
{
    section("analyze_cluster");
    Fixture fx;
    auto service = fx.service();

    ClusterFaceAnalysis a = service->analyze_cluster(fx.cluster);
    check(a.cluster_id == "burst_42", "cluster id carried");
    check(a.processed_photos == 3, "all photos processed");
    check(a.identities_resolved == 2, "two people resolved");
    check(a.person_count() == 1, "only the blinking person can improve");

    auto it = a.persons.find("person_1");
    check(it != a.persons.end(), "first identity in canonical order is person_1");
    if (it != a.persons.end()) {
        const auto& p = it->second;
        check(p.faces.size() == 3, "person seen in every photo");
        check(p.worst.photo.asset_id == "IMG_100", "worst face is the blink");
        check(p.best.photo.asset_id == "IMG_101", "best face is the first clean one");
        check(p.improvement_potential > 0.3f, "large improvement potential");
    }
    check(a.overall_improvement > 0.3f, "overall improvement above eligibility cutoff");
    check(a.base_photo && a.base_photo->photo.asset_id == "IMG_100", "equal photos: earliest is the base");
}

void test_cache_reuse()
{
    section("Cache reuse");
    Fixture fx;
    auto service = fx.service();

    ClusterFaceAnalysis first = service->analyze_cluster(fx.cluster);
    ClusterFaceAnalysis second = service->analyze_cluster(fx.cluster);

    check(fx.loader->calls == 3, "loader called once per photo");
    check(fx.detector->calls == 3, "detector called once per photo");
    check(fx.embedder->calls == 6, "embedder called once per face");
    check(second.overall_improvement == first.overall_improvement, "cached analysis returned");

    auto stats = service->cache_statistics();
    check(stats.cluster_count == 1, "one cluster cached");
    check(stats.face_count == 3, "three photo entries cached");

    // photo count changed: recompute, but reuse cached photos
    fx.cluster.photos.push_back(synthetic::photo("IMG_103", 1003.0, 4));
    fx.detector->faces["IMG_103"] = {doubles::face(LEFT, 1.0f), doubles::face(RIGHT, 1.0f)};
    ClusterFaceAnalysis grown = service->analyze_cluster(fx.cluster);
    check(grown.processed_photos == 4, "new photo included");
    check(fx.detector->calls == 4, "only the new photo detected");

    service->clear_cache(fx.cluster.cluster_id);
    service->analyze_cluster(fx.cluster);
    check(fx.detector->calls == 4, "cluster recomputed from photo entries");

    service->clear_cache();
    service->analyze_cluster(fx.cluster);
    check(fx.detector->calls == 8, "full clear forces detection again");
}

void test_cached_photo_metadata()
{
    section("Cached photo metadata");
    Fixture fx;
    auto service = fx.service();
    service->analyze_cluster(fx.cluster);

    // same assets, corrected timestamps in reverse order
    PhotoCluster corrected = fx.cluster;
    corrected.cluster_id = "burst_43";
    for (size_t i = 0; i < corrected.photos.size(); i++) {
        corrected.photos[i].timestamp = 2002.0 - static_cast<double>(i);
    }

    ClusterFaceAnalysis a = service->analyze_cluster(corrected);
    check(fx.detector->calls == 3, "cached photo entries reused");

    auto it = a.persons.find("person_1");
    check(it != a.persons.end(), "blinking person still found");
    if (it != a.persons.end()) {
        const auto& worst = it->second.worst;
        check(worst.photo.asset_id == "IMG_100", "worst face is the blink");
        check_near(worst.photo.timestamp, 2002.0, 1e-9, "face record carries the caller's timestamp");
    }
    check(a.base_photo && a.base_photo->photo.asset_id == "IMG_102",
          "canonical order follows the corrected timestamps");
}

void test_input_order()
{
    section("Input order");
    Fixture fx;
    auto service = fx.service();

    ClusterFaceAnalysis forward = service->analyze_cluster(fx.cluster);

    service->clear_cache();
    PhotoCluster reversed = fx.cluster;
    std::reverse(reversed.photos.begin(), reversed.photos.end());
    ClusterFaceAnalysis backward = service->analyze_cluster(reversed);

    check(forward.identities_resolved == backward.identities_resolved, "same identity count");
    check(forward.persons.size() == backward.persons.size(), "same persons");

    bool same = true;
    for (const auto& [id, person] : forward.persons) {
        auto other = backward.persons.find(id);
        if (other == backward.persons.end() || member_assets(person) != member_assets(other->second)) {
            same = false;
        }
    }
    check(same, "identical assignments for reversed input");
}

// -----------------------------------------------------
// Failures and degraded collaborators
// -----------------------------------------------------
void test_failures()
{
    section("Failures");
    Fixture fx;
    fx.cluster.photos.push_back(synthetic::photo("gone", 1003.0));
    fx.cluster.photos.push_back(synthetic::photo("blank", 1004.0));
    fx.cluster.photos.push_back(synthetic::photo("crash", 1005.0));
    fx.loader->missing.insert("gone");
    fx.loader->empty.insert("blank");
    fx.detector->failing.insert("crash");

    auto service = fx.service();
    ClusterFaceAnalysis a = service->analyze_cluster(fx.cluster);

    check(a.processed_photos == 3, "failed photos dropped");
    check(a.identities_resolved == 2, "remaining photos still resolved");
    check(a.person_count() == 1, "analysis continues without the failures");
    check(service->cache_statistics().face_count == 3, "failed photos are not cached");

    Fixture no_emb;
    auto fallback = no_emb.service(false);
    ClusterFaceAnalysis b = fallback->analyze_cluster(no_emb.cluster);
    check(no_emb.embedder->calls == 0, "no embedder -> no embedding calls");
    check(b.identities_resolved == 2, "position fallback separates the two people");

    Fixture refusing;
    refusing.embedder->rule = [](const cv::Rect2f&) { return std::optional<FaceEmbedding>(); };
    ClusterFaceAnalysis c = refusing.service()->analyze_cluster(refusing.cluster);
    check(c.identities_resolved == 2, "unavailable embeddings fall back to position");

    Fixture empty;
    empty.detector->faces.clear();
    ClusterFaceAnalysis d = empty.service()->analyze_cluster(empty.cluster);
    check(d.processed_photos == 3 && d.identities_resolved == 0, "photos without faces are processed");
    check(d.persons.empty() && d.overall_improvement == 0.0f, "no faces -> empty analysis");

    bool threw = false;
    try {
        FaceAnalysisService broken(nullptr, fx.detector, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "missing loader rejected");

    threw = false;
    try {
        AnalysisConfig cfg;
        cfg.pipeline.worker_threads = 0;
        FaceAnalysisService broken(fx.loader, fx.detector, nullptr, cfg);
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw, "invalid config rejected");
}

// -----------------------------------------------------
// rank_faces
// -----------------------------------------------------
void test_rank_faces()
{
    section("rank_faces");
    Fixture fx;
    fx.loader->missing.insert("gone");
    auto service = fx.service();

    auto ranked = service->rank_faces({fx.cluster.photos[0], synthetic::photo("gone", 5.0)});
    check(ranked.size() == 1, "failed photo absent from rankings");

    auto it = ranked.find("IMG_100");
    check(it != ranked.end() && it->second.size() == 2, "both faces ranked");
    if (it != ranked.end() && it->second.size() == 2) {
        check(it->second[0].face_index == 1, "clean face ranked first");
        check(it->second[0].composite >= it->second[1].composite, "descending composite");
    }

    service->rank_faces({fx.cluster.photos[0]});
    check(fx.detector->calls == 1, "rankings reuse the photo cache");
}

// -----------------------------------------------------
// assess_eligibility
// -----------------------------------------------------
void test_eligibility()
{
    section("assess_eligibility");
    Fixture fx;
    auto service = fx.service();

    PhotoCluster single;
    single.cluster_id = "solo";
    single.photos = {fx.cluster.photos[0]};
    EligibilityResult solo = service->assess_eligibility(single);
    check(!solo.is_eligible && solo.reason == EligibilityReason::InsufficientPhotos, "single photo not eligible");
    check(fx.detector->calls == 0, "single photo never reaches the detector");

    EligibilityResult r = service->assess_eligibility(fx.cluster);
    check(r.is_eligible && r.reason == EligibilityReason::Eligible, "blinking burst eligible");
    check(r.improvements.size() == 1, "one improvement");
    if (!r.improvements.empty()) {
        check(r.improvements[0].person_id == "person_1", "improvement for the blinking person");
        check(r.improvements[0].source_photo.asset_id == "IMG_101", "source is the best face's photo");
        check(r.improvements[0].type == ImprovementType::EyesClosed, "fixes closed eyes");
    }

    Fixture steady;
    for (auto& [asset, faces] : steady.detector->faces) {
        faces = {doubles::face(LEFT, 1.0f), doubles::face(RIGHT, 1.0f)};
    }
    EligibilityResult flat = steady.service()->assess_eligibility(steady.cluster);
    check(!flat.is_eligible && flat.reason == EligibilityReason::NoFaceVariations, "steady burst not eligible");
    check_near(flat.confidence, 0.9, 1e-6, "no variations confidence");
}

// -----------------------------------------------------
// main
// -----------------------------------------------------
int main()
{
    spdlog::set_pattern("[%H:%M:%S] %v");

    test_analyze_cluster();
    test_cache_reuse();
    test_cached_photo_metadata();
    test_input_order();
    test_failures();
    test_rank_faces();
    test_eligibility();

    return finish("face analysis service");
}
