#include "sanctions/engine/entry_evaluator.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/log.hpp"
#include "sanctions/engine/decision_policy.hpp"

namespace sn::engine {

EntryEvaluator::EntryEvaluator(std::shared_ptr<matching::SemanticMatcher> semantic)
    : semantic_(std::move(semantic)) {
    if (!semantic_) {
        throw core::ConfigError("entry evaluator requires a semantic matcher");
    }
}

core::MatchFinding EntryEvaluator::makeFinding(
    const core::Candidate& candidate,
    const core::WatchlistRecord& record,
    core::MatchStrategy strategy,
    double confidence
) const {
    core::MatchFinding finding;
    finding.record = record;
    finding.matchedFields = field_.matchedFields(candidate, record);
    finding.strategy = strategy;
    finding.confidence = strategy == core::MatchStrategy::Exact ? 1.0 : confidence;
    finding.riskContribution = riskContribution(strategy, finding.confidence);
    return finding;
}

std::optional<core::MatchFinding> EntryEvaluator::evaluate(
    const core::Candidate& candidate,
    const core::WatchlistRecord& record,
    const core::ScreeningThresholds& thresholds,
    EvaluationTrace* trace
) const {
    EvaluationTrace local;
    EvaluationTrace& t = trace ? *trace : local;

    if (matching::LexicalMatcher::normalize(record.name).empty()) {
        t.malformedRecord = true;
        t.fuzzy = matching::StrategyOutcome::failed(matching::StrategyFailure::MalformedRecord, "record has no name");
        SN_WARN("skipping malformed watchlist record id=" << record.id << " list=" << record.listName);
        return std::nullopt;
    }

    if (lexical_.isExactMatch(candidate, record)) {
        t.exact = true;
        SN_LOG("EXACT candidate=" << candidate.name << " record=" << record.id);
        return makeFinding(candidate, record, core::MatchStrategy::Exact, 1.0);
    }

    t.fuzzy = lexical_.fuzzyScore(candidate, record);
    if (t.fuzzy.clears(thresholds.fuzzy)) {
        SN_LOG("FUZZY candidate=" << candidate.name << " record=" << record.id << " score=" << t.fuzzy.score);
        return makeFinding(candidate, record, core::MatchStrategy::Fuzzy, t.fuzzy.score);
    }

    t.semantic = semantic_->score(candidate, record);
    if (!t.semantic.ok()) {
        SN_WARN("semantic strategy failed for record id=" << record.id << " ("
                << matching::toString(t.semantic.failure) << "): " << t.semantic.detail);
    } else if (t.semantic.clears(thresholds.similarity)) {
        return makeFinding(candidate, record, core::MatchStrategy::Semantic, t.semantic.score);
    }

    t.field = field_.score(candidate, record);
    if (t.field.clears(thresholds.field)) {
        SN_LOG("FIELD candidate=" << candidate.name << " record=" << record.id << " score=" << t.field.score);
        return makeFinding(candidate, record, core::MatchStrategy::Fuzzy, t.field.score);
    }

    return std::nullopt;
}

} // namespace sn::engine
