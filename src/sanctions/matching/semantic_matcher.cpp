#include "sanctions/matching/semantic_matcher.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>

namespace sn::matching {

namespace {

bool hasText(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
}

std::vector<std::string> withAliases(const std::string& primary, const std::vector<std::string>& aliases) {
    std::vector<std::string> out;
    out.reserve(aliases.size() + 1);
    if (hasText(primary)) out.push_back(primary);
    for (const auto& alias : aliases) {
        if (hasText(alias)) out.push_back(alias);
    }
    return out;
}

} // namespace

SemanticMatcher::SemanticMatcher(std::shared_ptr<ISimilarityProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw core::ConfigError("semantic matcher requires a similarity provider");
    }
}

StrategyOutcome SemanticMatcher::score(const core::Candidate& candidate, const core::WatchlistRecord& record) const {
    const auto queries = withAliases(candidate.name, candidate.aliases);
    const auto targets = withAliases(record.name, record.aliases);
    if (queries.empty() || targets.empty()) {
        return StrategyOutcome::success(0.0);
    }

    double best = 0.0;
    try {
        for (const auto& query : queries) {
            const auto scores = provider_->batchSimilarity(query, targets);
            if (scores.size() != targets.size()) {
                return StrategyOutcome::failed(StrategyFailure::ProviderError,
                    "batch returned " + std::to_string(scores.size()) + " scores for " +
                    std::to_string(targets.size()) + " candidates");
            }
            for (double s : scores) {
                if (std::isnan(s)) continue;
                best = std::max(best, std::clamp(s, 0.0, 1.0));
            }
        }
    } catch (const std::exception& e) {
        return StrategyOutcome::failed(StrategyFailure::ProviderError, e.what());
    } catch (...) {
        return StrategyOutcome::failed(StrategyFailure::ProviderError, "unknown provider error");
    }

    SN_LOG("SEMANTIC candidate=" << candidate.name << " record=" << record.id << " score=" << best);
    return StrategyOutcome::success(best);
}

} // namespace sn::matching
