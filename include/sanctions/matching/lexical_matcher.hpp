#pragma once

#include "sanctions/core/types.hpp"
#include "sanctions/matching/strategy_outcome.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sn::matching {

// Exact and fuzzy name comparison. Ratios are on a 0..100 scale, the
// normalized similarity on 0..1. Empty input scores 0.
class LexicalMatcher final {
public:
    LexicalMatcher() = default;

    // Lowercase, trim, collapse runs of whitespace
    static std::string normalize(std::string_view text);
    static std::vector<std::string> tokenize(std::string_view text);

    // Indel similarity of the whole strings
    static double ratio(std::string_view a, std::string_view b);
    // Best alignment of the shorter string against windows of the longer one
    static double partialRatio(std::string_view a, std::string_view b);
    // Word order independent
    static double tokenSortRatio(std::string_view a, std::string_view b);
    // Shared tokens plus the remainders
    static double tokenSetRatio(std::string_view a, std::string_view b);
    // 0.30 simple + 0.20 partial + 0.25 token sort + 0.25 token set
    static double weightedRatio(std::string_view a, std::string_view b);
    // weightedRatio / 100
    static double similarity(std::string_view a, std::string_view b);

    // Jaccard overlap of tokens, stop words removed
    static double tokenOverlap(std::string_view a, std::string_view b);

    // Normalized form, first+last, last+first and initial+last
    static std::vector<std::string> nameVariations(std::string_view name);
    // Max similarity over every pair of variations
    static double variationScore(std::string_view a, std::string_view b);

    // Candidates with similarity >= threshold, best first, at most topK
    std::vector<std::pair<std::string, double>> findBestMatches(
        std::string_view query,
        const std::vector<std::string>& candidates,
        double threshold,
        std::size_t topK = 5
    ) const;

    // Case-insensitive equality of primary names or any alias cross pair
    bool isExactMatch(const core::Candidate& candidate, const core::WatchlistRecord& record) const;

    // Max similarity over all (candidate name or alias) x (record name or alias)
    StrategyOutcome fuzzyScore(const core::Candidate& candidate, const core::WatchlistRecord& record) const;
};

} // namespace sn::matching
