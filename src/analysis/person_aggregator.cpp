// ============= src/analysis/person_aggregator.cpp =============
#include "analysis/person_aggregator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace burstface {

PersonAggregator::PersonAggregator(const AggregationConfig& config) : cfg(config) {}

float PersonAggregator::improvement_potential(const std::vector<FaceQualityRecord>& faces) {
    if (faces.size() < 2) return 0.0f;

    auto [lo, hi] = std::minmax_element(faces.begin(), faces.end(),
        [](const FaceQualityRecord& a, const FaceQualityRecord& b) {
            return a.composite < b.composite;
        });
    return std::max(0.0f, std::min(1.0f, hi->composite - lo->composite));
}

std::optional<PersonFaceQualityAnalysis> PersonAggregator::analyze(const PersonIdentity& identity) const {
    if (static_cast<int>(identity.faces.size()) < cfg.min_faces) {
        return std::nullopt;
    }

    std::vector<FaceQualityRecord> faces;
    faces.reserve(identity.faces.size());
    for (const auto& f : identity.faces) faces.push_back(f.record);

    // ranked copy; `faces` keeps assignment order
    std::vector<FaceQualityRecord> ranked = faces;
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const FaceQualityRecord& a, const FaceQualityRecord& b) {
            return a.composite > b.composite;
        });

    float potential = improvement_potential(faces);
    if (potential <= cfg.min_improvement) {
        spdlog::debug("{}: potential {:.3f} below {:.2f}, skipped",
                      identity.id, potential, cfg.min_improvement);
        return std::nullopt;
    }

    PersonFaceQualityAnalysis analysis;
    analysis.person_id = identity.id;
    analysis.faces = std::move(faces);
    analysis.best = ranked.front();
    analysis.worst = ranked.back();
    analysis.improvement_potential = potential;
    return analysis;
}

std::map<PersonId, PersonFaceQualityAnalysis> PersonAggregator::aggregate(
    const std::vector<PersonIdentity>& identities) const
{
    std::map<PersonId, PersonFaceQualityAnalysis> result;

    for (const auto& identity : identities) {
        if (auto analysis = analyze(identity)) {
            result.emplace(identity.id, std::move(*analysis));
        }
    }

    spdlog::info("📊 {} of {} identities with improvement potential",
                 result.size(), identities.size());
    return result;
}

float PersonAggregator::overall_improvement(const std::map<PersonId, PersonFaceQualityAnalysis>& persons) {
    if (persons.empty()) return 0.0f;

    float total = 0.0f;
    for (const auto& [id, analysis] : persons) {
        total += analysis.improvement_potential;
    }
    return std::max(0.0f, std::min(1.0f, total / static_cast<float>(persons.size())));
}

} // namespace burstface
