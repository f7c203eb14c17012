#pragma once

#include "sanctions/core/config.hpp"
#include "sanctions/core/types.hpp"
#include "sanctions/matching/field_matcher.hpp"
#include "sanctions/matching/lexical_matcher.hpp"
#include "sanctions/matching/semantic_matcher.hpp"
#include "sanctions/matching/strategy_outcome.hpp"
#include <memory>
#include <optional>

namespace sn::engine {

// Which step of the evaluation produced (or failed to produce) a finding
struct EvaluationTrace {
    matching::StrategyOutcome fuzzy;
    matching::StrategyOutcome semantic;
    matching::StrategyOutcome field;
    bool exact{false};
    bool malformedRecord{false};
};

/**
 * Evaluates one (candidate, watchlist record) pair.
 *
 * Order is strict and the first success wins:
 *   1. lexical exact              -> exact, 1.0
 *   2. lexical fuzzy >= fuzzy     -> fuzzy, score
 *   3. semantic >= similarity     -> semantic, score
 *   4. field score >= field       -> fuzzy, score (not name based)
 *
 * Strategy failures score 0 and are logged; they never escape.
 */
class EntryEvaluator final {
public:
    explicit EntryEvaluator(std::shared_ptr<matching::SemanticMatcher> semantic);

    std::optional<core::MatchFinding> evaluate(
        const core::Candidate& candidate,
        const core::WatchlistRecord& record,
        const core::ScreeningThresholds& thresholds,
        EvaluationTrace* trace = nullptr
    ) const;

private:
    core::MatchFinding makeFinding(
        const core::Candidate& candidate,
        const core::WatchlistRecord& record,
        core::MatchStrategy strategy,
        double confidence
    ) const;

    matching::LexicalMatcher lexical_;
    matching::FieldMatcher field_;
    std::shared_ptr<matching::SemanticMatcher> semantic_;
};

} // namespace sn::engine
