#pragma once

#include "sanctions/engine/entry_evaluator.hpp"
#include "sanctions/engine/i_screening_engine.hpp"
#include "sanctions/matching/i_similarity_provider.hpp"
#include "sanctions/storage/i_result_store.hpp"
#include "sanctions/watchlist/i_watchlist_store.hpp"
#include <memory>
#include <vector>

namespace sn::engine {

// Concrete screening engine: one candidate against every active record
class ScreeningEngine final : public IScreeningEngine {
public:
    ScreeningEngine(
        std::shared_ptr<watchlist::IWatchlistStore> watchlist,
        std::shared_ptr<matching::ISimilarityProvider> similarity,
        core::ScreeningThresholds thresholds = {},
        std::shared_ptr<storage::IResultStore> resultStore = nullptr
    );

    // Throws InvalidCandidateError before matching, ScreeningCancelledError
    // when the cancel flag is raised mid-run
    core::ScreeningResult screen(const core::Candidate& candidate, const ScreeningOptions& options = {}) override;

    const core::ScreeningThresholds& thresholds() const noexcept { return thresholds_; }

private:
    static void sortFindings(std::vector<core::MatchFinding>& findings);
    static core::ScreeningSummary summarize(const std::vector<core::MatchFinding>& findings);
    void persist(const core::ScreeningResult& result) const;

    std::shared_ptr<watchlist::IWatchlistStore> watchlist_;
    std::shared_ptr<storage::IResultStore> resultStore_;
    core::ScreeningThresholds thresholds_;
    EntryEvaluator evaluator_;
};

} // namespace sn::engine
