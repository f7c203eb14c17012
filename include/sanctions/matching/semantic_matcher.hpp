#pragma once

#include "sanctions/core/types.hpp"
#include "sanctions/matching/i_similarity_provider.hpp"
#include "sanctions/matching/strategy_outcome.hpp"
#include <memory>

namespace sn::matching {

// Max provider similarity over {candidate name, aliases} x {record name, aliases}.
// Provider errors come back as a failed outcome, never as an exception.
class SemanticMatcher final {
public:
    explicit SemanticMatcher(std::shared_ptr<ISimilarityProvider> provider);

    StrategyOutcome score(const core::Candidate& candidate, const core::WatchlistRecord& record) const;

    ISimilarityProvider& provider() const noexcept { return *provider_; }

private:
    std::shared_ptr<ISimilarityProvider> provider_;
};

} // namespace sn::matching
