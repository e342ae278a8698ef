// ============= src/analysis/eligibility_evaluator.cpp =============
#include "analysis/eligibility_evaluator.hpp"
#include <spdlog/spdlog.h>

namespace burstface {

EligibilityEvaluator::EligibilityEvaluator(const EligibilityConfig& config) : cfg(config) {}

EligibilityResult EligibilityEvaluator::not_eligible(EligibilityReason reason, float confidence) {
    EligibilityResult r;
    r.is_eligible = false;
    r.reason = reason;
    r.confidence = confidence;
    return r;
}

std::optional<EligibilityResult> EligibilityEvaluator::precheck(size_t photo_count) const {
    if (photo_count < static_cast<size_t>(cfg.min_photos)) {
        return not_eligible(EligibilityReason::InsufficientPhotos, cfg.insufficient_photos_confidence);
    }
    return std::nullopt;
}

EligibilityResult EligibilityEvaluator::evaluate(size_t photo_count,
                                                 const ClusterFaceAnalysis& analysis) const {
    if (auto early = precheck(photo_count)) {
        return *early;
    }

    if (analysis.persons.empty()) {
        return not_eligible(EligibilityReason::NoFaceVariations, cfg.no_variations_confidence);
    }

    if (analysis.overall_improvement <= cfg.min_overall_improvement) {
        return not_eligible(EligibilityReason::NoFaceVariations, cfg.low_improvement_confidence);
    }

    EligibilityResult result;
    result.is_eligible = true;
    result.reason = EligibilityReason::Eligible;
    result.confidence = analysis.overall_improvement;

    for (const auto& [id, person] : analysis.persons) {
        PersonImprovement imp;
        imp.person_id = id;
        imp.source_photo = person.best.photo;
        imp.type = improvement_for(person.worst.primary_issue());
        imp.confidence = person.improvement_potential;
        result.improvements.push_back(std::move(imp));
    }

    spdlog::info("✓ Cluster {} eligible: confidence={:.2f}, {} improvements",
                 analysis.cluster_id, result.confidence, result.improvements.size());
    return result;
}

} // namespace burstface
