#include "sanctions/matching/ngram_similarity_provider.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/matching/lexical_matcher.hpp"

#include <algorithm>
#include <cmath>

namespace sn::matching {

namespace {

const std::vector<std::string_view> kPrefixes{"mr.", "mr", "mrs.", "mrs", "ms.", "ms", "dr.", "dr", "prof.", "prof", "sir", "madam"};
const std::vector<std::string_view> kSuffixes{"jr.", "jr", "sr.", "sr", "ii", "iii", "iv"};

bool contains(const std::vector<std::string_view>& words, std::string_view w) {
    return std::find(words.begin(), words.end(), w) != words.end();
}

} // namespace

NgramSimilarityProvider::NgramSimilarityProvider(std::size_t n) : n_(n) {
    if (n_ == 0) {
        throw core::ConfigError("n-gram size must be positive");
    }
}

std::string NgramSimilarityProvider::preprocessName(std::string_view name) {
    const std::string normalized = LexicalMatcher::normalize(name);

    std::vector<std::string> words;
    std::size_t start = 0;
    while (start < normalized.size()) {
        const std::size_t end = normalized.find(' ', start);
        const std::size_t stop = end == std::string::npos ? normalized.size() : end;
        words.emplace_back(normalized.substr(start, stop - start));
        start = stop + 1;
    }

    // Keep at least one word so a bare "Sir" still has a profile
    while (words.size() > 1 && contains(kPrefixes, words.front())) words.erase(words.begin());
    while (words.size() > 1 && contains(kSuffixes, words.back())) words.pop_back();

    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

NgramSimilarityProvider::Profile NgramSimilarityProvider::profile(const std::string& name) const {
    Profile grams;
    const std::string text = preprocessName(name);
    if (text.empty()) return grams;

    const std::string padded = std::string(n_ - 1, ' ') + text + ' ';
    if (padded.size() < n_) {
        grams[padded] += 1.0;
        return grams;
    }
    for (std::size_t i = 0; i + n_ <= padded.size(); ++i) {
        grams[padded.substr(i, n_)] += 1.0;
    }
    return grams;
}

double NgramSimilarityProvider::cosine(const Profile& a, const Profile& b) noexcept {
    if (a.empty() || b.empty()) return 0.0;
    double dot = 0.0, normA = 0.0, normB = 0.0;
    for (const auto& [gram, weight] : a) {
        normA += weight * weight;
        auto it = b.find(gram);
        if (it != b.end()) dot += weight * it->second;
    }
    for (const auto& [gram, weight] : b) {
        normB += weight * weight;
    }
    if (normA == 0.0 || normB == 0.0) return 0.0;
    return std::clamp(dot / (std::sqrt(normA) * std::sqrt(normB)), 0.0, 1.0);
}

double NgramSimilarityProvider::similarity(const std::string& a, const std::string& b) {
    return cosine(profile(a), profile(b));
}

std::vector<double> NgramSimilarityProvider::batchSimilarity(
    const std::string& query,
    const std::vector<std::string>& candidates
) {
    std::vector<double> scores;
    scores.reserve(candidates.size());
    const Profile q = profile(query);
    for (const auto& candidate : candidates) {
        scores.push_back(cosine(q, profile(candidate)));
    }
    return scores;
}

} // namespace sn::matching
