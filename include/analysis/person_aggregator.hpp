// ============= include/analysis/person_aggregator.hpp =============
#pragma once
#include "analysis/face_types.hpp"
#include "config.hpp"
#include <map>
#include <optional>
#include <vector>

namespace burstface {

// Best/worst face and improvement potential per resolved identity.
// Identities with fewer than min_faces faces, or whose spread between best
// and worst composite is not above min_improvement, produce nothing.
class PersonAggregator {
public:
    explicit PersonAggregator(const AggregationConfig& config = AggregationConfig());

    std::optional<PersonFaceQualityAnalysis> analyze(const PersonIdentity& identity) const;
    std::map<PersonId, PersonFaceQualityAnalysis> aggregate(const std::vector<PersonIdentity>& identities) const;

    // max(0, best - worst), clamped to [0,1]; 0 for fewer than 2 faces
    static float improvement_potential(const std::vector<FaceQualityRecord>& faces);

    // Mean potential across persons, clamped to [0,1]; 0 when empty
    static float overall_improvement(const std::map<PersonId, PersonFaceQualityAnalysis>& persons);

private:
    AggregationConfig cfg;
};

} // namespace burstface
