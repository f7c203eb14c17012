#pragma once

#include "sanctions/core/config.hpp"
#include "sanctions/core/types.hpp"
#include <vector>

namespace sn::engine {

struct Classification {
    core::Decision decision{core::Decision::Clear};
    double confidence{0.0};
};

// Risk a finding contributes for a given raw confidence; clamped to [0, 1],
// 1.0 for exact hits
double riskContribution(core::MatchStrategy strategy, double confidence) noexcept;

// Sum(r * r) / Sum(r) over the findings' risk contributions; 0 when empty
double aggregateRisk(const std::vector<core::MatchFinding>& findings) noexcept;

// risk >= block -> block, risk >= review -> review, else clear.
// Clear with no findings carries full confidence.
Classification classify(double risk, const core::ScreeningThresholds& thresholds, bool hasFindings = true) noexcept;

} // namespace sn::engine
