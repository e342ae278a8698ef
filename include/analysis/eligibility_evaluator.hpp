// ============= include/analysis/eligibility_evaluator.hpp =============
/*
 * Eligibility decision for composite generation
 *
 * Terminal outcomes, checked in order:
 *   photos < 2                 -> InsufficientPhotos  (confidence 1.0)
 *   no person analyses         -> NoFaceVariations    (0.9)
 *   overall improvement <= 0.3 -> NoFaceVariations    (0.8)
 *   otherwise                  -> Eligible (confidence = overall improvement)
 *
 * "Not eligible" is a normal result, never an exception.
 */

#pragma once
#include "analysis/face_types.hpp"
#include "config.hpp"
#include <optional>

namespace burstface {

class EligibilityEvaluator {
public:
    explicit EligibilityEvaluator(const EligibilityConfig& config = EligibilityConfig());

    // Result when the photo count alone decides, nullopt otherwise
    std::optional<EligibilityResult> precheck(size_t photo_count) const;

    EligibilityResult evaluate(size_t photo_count, const ClusterFaceAnalysis& analysis) const;

private:
    EligibilityConfig cfg;

    static EligibilityResult not_eligible(EligibilityReason reason, float confidence);
};

} // namespace burstface
