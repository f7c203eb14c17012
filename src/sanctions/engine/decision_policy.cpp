#include "sanctions/engine/decision_policy.hpp"
#include "sanctions/core/constants.hpp"

#include <algorithm>

namespace sn::engine {

double riskContribution(core::MatchStrategy strategy, double confidence) noexcept {
    if (strategy == core::MatchStrategy::Exact) return 1.0;
    return std::clamp(confidence, 0.0, 1.0);
}

double aggregateRisk(const std::vector<core::MatchFinding>& findings) noexcept {
    double weightedSum = 0.0;
    double totalWeight = 0.0;
    for (const auto& finding : findings) {
        const double weight = finding.riskContribution;
        weightedSum += finding.riskContribution * weight;
        totalWeight += weight;
    }
    if (totalWeight <= 0.0) return 0.0;
    return std::clamp(weightedSum / totalWeight, 0.0, 1.0);
}

Classification classify(double risk, const core::ScreeningThresholds& thresholds, bool hasFindings) noexcept {
    if (!hasFindings) {
        return {core::Decision::Clear, core::NO_FINDINGS_CONFIDENCE};
    }
    if (risk >= thresholds.block) {
        return {core::Decision::Block, thresholds.blockConfidence};
    }
    if (risk >= thresholds.review) {
        return {core::Decision::Review, thresholds.reviewConfidence};
    }
    return {core::Decision::Clear, thresholds.clearConfidence};
}

} // namespace sn::engine
