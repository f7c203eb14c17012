#include "sanctions/engine/screening_engine.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/log.hpp"
#include "sanctions/core/validation.hpp"
#include "sanctions/engine/decision_policy.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace sn::engine {

ScreeningEngine::ScreeningEngine(
    std::shared_ptr<watchlist::IWatchlistStore> watchlist,
    std::shared_ptr<matching::ISimilarityProvider> similarity,
    core::ScreeningThresholds thresholds,
    std::shared_ptr<storage::IResultStore> resultStore
) : watchlist_(std::move(watchlist)),
    resultStore_(std::move(resultStore)),
    thresholds_(thresholds),
    evaluator_(std::make_shared<matching::SemanticMatcher>(std::move(similarity))) {
    if (!watchlist_) {
        throw core::ConfigError("screening engine requires a watchlist store");
    }
    core::validate(thresholds_);
}

void ScreeningEngine::sortFindings(std::vector<core::MatchFinding>& findings) {
    // Record id breaks ties so reruns produce the same order
    std::sort(findings.begin(), findings.end(), [](const core::MatchFinding& l, const core::MatchFinding& r) {
        if (l.riskContribution != r.riskContribution) return l.riskContribution > r.riskContribution;
        return l.record.id < r.record.id;
    });
}

core::ScreeningSummary ScreeningEngine::summarize(const std::vector<core::MatchFinding>& findings) {
    core::ScreeningSummary summary;
    summary.totalFindings = findings.size();
    for (const auto& f : findings) {
        summary.strategies.push_back(f.strategy);
        summary.sources.push_back(f.record.source);
    }
    std::sort(summary.strategies.begin(), summary.strategies.end());
    summary.strategies.erase(std::unique(summary.strategies.begin(), summary.strategies.end()), summary.strategies.end());
    std::sort(summary.sources.begin(), summary.sources.end());
    summary.sources.erase(std::unique(summary.sources.begin(), summary.sources.end()), summary.sources.end());
    return summary;
}

void ScreeningEngine::persist(const core::ScreeningResult& result) const {
    if (!resultStore_) return;
    try {
        resultStore_->store(result);
    } catch (const std::exception& e) {
        SN_ERROR("failed to store screening result for '" << result.candidate.name << "': " << e.what());
    }
}

core::ScreeningResult ScreeningEngine::screen(const core::Candidate& candidate, const ScreeningOptions& options) {
    const auto start = std::chrono::steady_clock::now();

    core::validateCandidate(candidate);
    const core::ScreeningThresholds thresholds = options.thresholds.value_or(thresholds_);
    if (options.thresholds) {
        core::validate(thresholds);
    }

    const watchlist::RecordSnapshot snapshot = watchlist_->activeRecords();

    core::ScreeningResult result;
    result.candidate = candidate;

    if (snapshot) {
        for (const auto& record : *snapshot) {
            if (options.cancelled && options.cancelled->load(std::memory_order_acquire)) {
                throw core::ScreeningCancelledError("screening of '" + candidate.name + "' cancelled");
            }
            if (!record.active) continue;
            try {
                if (auto finding = evaluator_.evaluate(candidate, record, thresholds)) {
                    result.findings.push_back(std::move(*finding));
                }
            } catch (const std::exception& e) {
                SN_WARN("record id=" << record.id << " skipped: " << e.what());
            }
        }
    }

    // A run cancelled inside its last record must not produce a result
    if (options.cancelled && options.cancelled->load(std::memory_order_acquire)) {
        throw core::ScreeningCancelledError("screening of '" + candidate.name + "' cancelled");
    }

    sortFindings(result.findings);
    result.riskScore = aggregateRisk(result.findings);
    const Classification c = classify(result.riskScore, thresholds, !result.findings.empty());
    result.decision = c.decision;
    result.confidence = c.confidence;
    result.summary = summarize(result.findings);
    result.latency = std::chrono::duration_cast<core::Latency>(std::chrono::steady_clock::now() - start);

    SN_LOG("SCREENED name=" << candidate.name << " decision=" << core::toString(result.decision)
           << " risk=" << result.riskScore << " findings=" << result.findings.size()
           << " latency_us=" << result.latency.count());

    if (options.persist) persist(result);
    return result;
}

} // namespace sn::engine
