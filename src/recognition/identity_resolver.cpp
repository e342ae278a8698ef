// ============= src/recognition/identity_resolver.cpp =============
#include "recognition/identity_resolver.hpp"
#include "recognition/embedding.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <tuple>

namespace burstface {

namespace {
inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }

inline float center_distance(const FaceQualityRecord& a, const FaceQualityRecord& b) {
    return static_cast<float>(cv::norm(a.center() - b.center()));
}
}

IdentityResolver::IdentityResolver(const IdentityConfig& config, DistanceFn distance)
    : cfg(config), distance(std::move(distance)), next_id(1)
{
    if (!this->distance) {
        this->distance = embedding::l2_distance;
    }
    spdlog::debug("Identity resolver: strong={:.2f}/{:.2f} medium={:.2f} min={:.2f}",
                  cfg.strong_similarity, cfg.minimum_confidence,
                  cfg.medium_similarity, cfg.minimum_similarity);
}

void IdentityResolver::canonical_sort(std::vector<ScoredFace>& faces) {
    std::stable_sort(faces.begin(), faces.end(),
        [](const ScoredFace& a, const ScoredFace& b) {
            const auto& ra = a.record;
            const auto& rb = b.record;
            return std::tie(ra.photo.timestamp, ra.photo.asset_id, ra.face_index) <
                   std::tie(rb.photo.timestamp, rb.photo.asset_id, rb.face_index);
        });
}

// ==================== SCORING ====================

float IdentityResolver::embedding_similarity(const FaceEmbedding& a, const FaceEmbedding& b) const {
    return embedding::similarity_from_distance(distance(a, b));
}

float IdentityResolver::pose_similarity(const FaceAngle& a, const FaceAngle& b) const {
    float pitch_sim = std::max(0.0f, 1.0f - std::abs(a.pitch - b.pitch) / cfg.pitch_normalizer);
    float yaw_sim = std::max(0.0f, 1.0f - std::abs(a.yaw - b.yaw) / cfg.yaw_normalizer);
    float roll_sim = std::max(0.0f, 1.0f - std::abs(a.roll - b.roll) / cfg.roll_normalizer);

    return yaw_sim * cfg.yaw_weight + pitch_sim * cfg.pitch_weight + roll_sim * cfg.roll_weight;
}

float IdentityResolver::feature_consistency(const FaceQualityRecord& a,
                                            const FaceQualityRecord& b) const {
    float score = 0.5f;

    if (a.eyes.both_open() == b.eyes.both_open()) score += 0.2f;
    if (std::abs(a.expression.intensity - b.expression.intensity) < cfg.smile_consistency_delta) {
        score += 0.2f;
    }
    if (a.pose.is_compatible_for_alignment(b.pose)) score += 0.1f;

    return std::min(1.0f, score);
}

IdentityMatch IdentityResolver::score_identity(const ScoredFace& face,
                                               const PersonIdentity& identity) const {
    IdentityMatch match;
    if (!face.embedding) return match;

    float sim_sum = 0.0f;
    float conf_sum = 0.0f;

    for (const auto& member : identity.faces) {
        if (!member.embedding) continue;

        float emb_sim = embedding_similarity(*face.embedding, *member.embedding);
        float pose_sim = pose_similarity(face.record.pose, member.record.pose);
        float features = feature_consistency(face.record, member.record);

        float similarity = emb_sim * cfg.embedding_weight +
                           pose_sim * cfg.pose_weight +
                           features * cfg.feature_weight;

        float quality = (face.record.composite + member.record.composite) / 2.0f;
        float emb_conf = std::min(face.embedding->confidence, member.embedding->confidence);
        float confidence = clamp01(emb_sim * cfg.confidence_embedding_weight +
                                   quality * cfg.confidence_quality_weight +
                                   emb_conf * cfg.confidence_descriptor_weight);

        sim_sum += similarity;
        conf_sum += confidence;
        match.max_similarity = std::max(match.max_similarity, similarity);
        match.comparisons++;
    }

    if (match.comparisons == 0) return match;

    match.mean_similarity = sim_sum / match.comparisons;
    match.similarity = match.mean_similarity * cfg.mean_weight + match.max_similarity * cfg.max_weight;
    match.confidence = conf_sum / match.comparisons;
    return match;
}

MatchTier IdentityResolver::classify(float similarity, float confidence) const {
    if (similarity >= cfg.strong_similarity && confidence >= cfg.minimum_confidence) {
        return MatchTier::Strong;
    }
    if (similarity >= cfg.medium_similarity) {
        return MatchTier::Medium;
    }
    return MatchTier::None;
}

// ==================== SECONDARY CHECKS ====================

bool IdentityResolver::position_consistent(const FaceQualityRecord& face,
                                           const PersonIdentity& identity) const {
    return std::any_of(identity.faces.begin(), identity.faces.end(),
        [&](const ScoredFace& m) {
            return center_distance(face, m.record) < cfg.position_distance;
        });
}

bool IdentityResolver::temporal_consistent(const FaceQualityRecord& face,
                                           const PersonIdentity& identity) const {
    return std::any_of(identity.faces.begin(), identity.faces.end(),
        [&](const ScoredFace& m) {
            return std::abs(face.photo.timestamp - m.record.photo.timestamp) < cfg.max_temporal_gap_sec;
        });
}

bool IdentityResolver::size_consistent(const FaceQualityRecord& face,
                                       const PersonIdentity& identity) const {
    float area = face.area();
    return std::any_of(identity.faces.begin(), identity.faces.end(),
        [&](const ScoredFace& m) {
            float existing = m.record.area();
            if (existing <= 0.0f) return false;
            float ratio = area / existing;
            return ratio >= cfg.size_ratio_min && ratio <= cfg.size_ratio_max;
        });
}

bool IdentityResolver::validate_consistency(const FaceQualityRecord& face,
                                            const PersonIdentity& identity) const {
    int passed = (position_consistent(face, identity) ? 1 : 0) +
                 (temporal_consistent(face, identity) ? 1 : 0) +
                 (size_consistent(face, identity) ? 1 : 0);
    return passed >= cfg.required_consistency_checks;
}

bool IdentityResolver::basic_match(const FaceQualityRecord& a, const FaceQualityRecord& b) const {
    return center_distance(a, b) < cfg.fallback_position_distance &&
           std::abs(a.box.width - b.box.width) < cfg.fallback_width_difference;
}

// ==================== FOLD ====================

std::optional<size_t> IdentityResolver::find_best_identity(const ScoredFace& face,
                                                           IdentityMatch& best) const {
    std::optional<size_t> best_idx;

    for (size_t i = 0; i < identities.size(); i++) {
        IdentityMatch m = score_identity(face, identities[i]);
        if (m.similarity <= cfg.minimum_similarity) continue;

        // strictly greater: ties keep the earliest identity
        if (!best_idx || m.similarity > best.similarity) {
            best = m;
            best_idx = i;
        }
    }
    return best_idx;
}

std::optional<size_t> IdentityResolver::fallback_match(const FaceQualityRecord& face) const {
    for (size_t i = 0; i < identities.size(); i++) {
        for (const auto& member : identities[i].faces) {
            if (basic_match(face, member.record)) return i;
        }
    }
    return std::nullopt;
}

PersonId IdentityResolver::create_identity(const ScoredFace& face) {
    PersonIdentity identity;
    identity.id = "person_" + std::to_string(next_id++);
    identity.faces.push_back(face);
    identities.push_back(std::move(identity));
    return identities.back().id;
}

PersonId IdentityResolver::resolve(const ScoredFace& face) {
    const auto& rec = face.record;

    // 1. Embedding-based match
    if (face.embedding) {
        IdentityMatch best;
        auto idx = find_best_identity(face, best);

        if (idx) {
            auto& identity = identities[*idx];
            MatchTier tier = classify(best.similarity, best.confidence);

            spdlog::debug("Match {}#{} -> {}: sim={:.3f} conf={:.3f} ({} comparisons)",
                          rec.photo.asset_id, rec.face_index, identity.id,
                          best.similarity, best.confidence, best.comparisons);

            // 2. Strong tier
            if (tier == MatchTier::Strong) {
                identity.faces.push_back(face);
                return identity.id;
            }

            // 3. Medium tier: needs secondary checks
            if (tier == MatchTier::Medium && validate_consistency(rec, identity)) {
                identity.faces.push_back(face);
                return identity.id;
            }
        }
    } else {
        spdlog::debug("No embedding for {}#{}, using position fallback",
                      rec.photo.asset_id, rec.face_index);
    }

    // 4. Fallback: position + size
    if (auto idx = fallback_match(rec)) {
        identities[*idx].faces.push_back(face);
        return identities[*idx].id;
    }

    // 5. New identity
    PersonId id = create_identity(face);
    spdlog::debug("New identity {} from {}#{}", id, rec.photo.asset_id, rec.face_index);
    return id;
}

void IdentityResolver::resolve_all(std::vector<ScoredFace> faces) {
    canonical_sort(faces);
    for (const auto& face : faces) {
        resolve(face);
    }
    spdlog::info("🎯 Resolved {} faces into {} identities", faces.size(), identities.size());
}

} // namespace burstface
