#pragma once

#include "sanctions/matching/i_similarity_provider.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sn::matching {

// Cosine similarity of character n-gram profiles of preprocessed names.
// Stateless and deterministic; stands in for an embedding model.
class NgramSimilarityProvider final : public ISimilarityProvider {
public:
    explicit NgramSimilarityProvider(std::size_t n = 3);

    double similarity(const std::string& a, const std::string& b) override;
    std::vector<double> batchSimilarity(
        const std::string& query,
        const std::vector<std::string>& candidates
    ) override;

    // Lowercase, collapse whitespace, drop honorifics ("dr.", "sir") and
    // generational suffixes ("jr.", "iii")
    static std::string preprocessName(std::string_view name);

private:
    using Profile = std::map<std::string, double>;

    Profile profile(const std::string& name) const;
    static double cosine(const Profile& a, const Profile& b) noexcept;

    std::size_t n_;
};

} // namespace sn::matching
