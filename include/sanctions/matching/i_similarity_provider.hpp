#pragma once

#include <string>
#include <vector>

namespace sn::matching {

/**
 * Semantic similarity source (embedding model or equivalent).
 *
 * Implementations must be deterministic for fixed model weights and return
 * scores in [0, 1]. batchSimilarity returns one score per candidate, in
 * input order. Implementations may throw; the semantic matcher turns that
 * into a zero-score outcome.
 */
class ISimilarityProvider {
public:
    virtual ~ISimilarityProvider() = default;

    virtual double similarity(const std::string& a, const std::string& b) = 0;
    virtual std::vector<double> batchSimilarity(
        const std::string& query,
        const std::vector<std::string>& candidates
    ) = 0;

    // Checked once when the pipeline starts
    virtual bool isReady() const noexcept { return true; }
};

} // namespace sn::matching
