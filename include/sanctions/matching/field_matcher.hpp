#pragma once

#include "sanctions/core/types.hpp"
#include "sanctions/matching/strategy_outcome.hpp"

namespace sn::matching {

// Secondary attribute comparison. Only fields present on both sides count:
// DOB equality 0.9, document equality 0.95, nationality similarity x 0.7.
// The score is the max of whatever could be computed, 0 when nothing could.
class FieldMatcher final {
public:
    FieldMatcher() = default;

    StrategyOutcome score(const core::Candidate& candidate, const core::WatchlistRecord& record) const;

    // Fields equal on both sides, including the primary name (case-insensitive)
    core::MatchedFields matchedFields(const core::Candidate& candidate, const core::WatchlistRecord& record) const;
};

} // namespace sn::matching
