// ============= include/recognition/identity_resolver.hpp =============
/*
 * Identity resolution within one cluster
 *
 * Folds scored faces, one at a time, into a growing set of identities:
 *   1. Compare the face embedding against every member of every identity
 *      (embedding 0.7 + pose 0.2 + feature consistency 0.1)
 *   2. Aggregate per identity: 0.7 mean + 0.3 max
 *   3. Strong tier:  similarity >= 0.6 and confidence >= 0.5
 *      Medium tier:  similarity >= 0.4 and 2 of 3 checks (position, time, size)
 *   4. Fallback (no embedding / no accepted match): position + width match
 *   5. Otherwise a new identity "person_<n>"
 *
 * The result depends on the order faces arrive; resolve_all() sorts into the
 * canonical order (timestamp, asset id, detector index) first.
 * Identities never merge and are scoped to one resolver instance.
 */

#pragma once
#include "analysis/face_types.hpp"
#include "config.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace burstface {

struct IdentityMatch {
    float similarity = 0.0f;
    float confidence = 0.0f;
    int comparisons = 0;
    float mean_similarity = 0.0f;
    float max_similarity = 0.0f;
};

enum class MatchTier { Strong, Medium, None };

class IdentityResolver {
public:
    using DistanceFn = std::function<float(const FaceEmbedding&, const FaceEmbedding&)>;

    explicit IdentityResolver(const IdentityConfig& config = IdentityConfig(),
                              DistanceFn distance = nullptr);

    // Single fold step; returns the identity the face was assigned to
    PersonId resolve(const ScoredFace& face);

    // Canonical sort + fold over all faces
    void resolve_all(std::vector<ScoredFace> faces);

    static void canonical_sort(std::vector<ScoredFace>& faces);

    const std::vector<PersonIdentity>& get_identities() const { return identities; }
    size_t get_identity_count() const { return identities.size(); }
    int get_total_created() const { return next_id - 1; }

    // ===== SCORING =====
    float embedding_similarity(const FaceEmbedding& a, const FaceEmbedding& b) const;
    float pose_similarity(const FaceAngle& a, const FaceAngle& b) const;
    float feature_consistency(const FaceQualityRecord& a, const FaceQualityRecord& b) const;
    IdentityMatch score_identity(const ScoredFace& face, const PersonIdentity& identity) const;
    MatchTier classify(float similarity, float confidence) const;

    // ===== SECONDARY CHECKS =====
    bool position_consistent(const FaceQualityRecord& face, const PersonIdentity& identity) const;
    bool temporal_consistent(const FaceQualityRecord& face, const PersonIdentity& identity) const;
    bool size_consistent(const FaceQualityRecord& face, const PersonIdentity& identity) const;
    bool validate_consistency(const FaceQualityRecord& face, const PersonIdentity& identity) const;

    bool basic_match(const FaceQualityRecord& a, const FaceQualityRecord& b) const;

private:
    IdentityConfig cfg;
    DistanceFn distance;

    int next_id;
    std::vector<PersonIdentity> identities;

    std::optional<size_t> find_best_identity(const ScoredFace& face, IdentityMatch& best) const;
    std::optional<size_t> fallback_match(const FaceQualityRecord& face) const;
    PersonId create_identity(const ScoredFace& face);
};

} // namespace burstface
