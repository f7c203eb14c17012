#include "sanctions/matching/lexical_matcher.hpp"
#include "sanctions/core/constants.hpp"

#include <rapidfuzz/fuzz.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <unordered_set>

namespace sn::matching {

namespace {

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words{
        "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for",
        "of", "with", "by", "from", "up", "about", "into", "through", "during",
        "before", "after", "above", "below", "between", "among"
    };
    return words;
}

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Non-ASCII bytes are kept so UTF-8 names survive tokenization
bool isWordByte(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out.push_back(' ');
        out += t;
    }
    return out;
}

std::vector<std::string> namesOf(const std::string& primary, const std::vector<std::string>& aliases) {
    std::vector<std::string> out;
    out.reserve(aliases.size() + 1);
    auto norm = LexicalMatcher::normalize(primary);
    if (!norm.empty()) out.push_back(std::move(norm));
    for (const auto& alias : aliases) {
        auto a = LexicalMatcher::normalize(alias);
        if (!a.empty()) out.push_back(std::move(a));
    }
    return out;
}

} // namespace

std::string LexicalMatcher::normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::vector<std::string> LexicalMatcher::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : normalize(text)) {
        if (isWordByte(c)) {
            current.push_back(c);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

double LexicalMatcher::ratio(std::string_view a, std::string_view b) {
    const std::string na = normalize(a);
    const std::string nb = normalize(b);
    if (na.empty() || nb.empty()) return 0.0;
    return rapidfuzz::fuzz::ratio(na, nb);
}

double LexicalMatcher::partialRatio(std::string_view a, std::string_view b) {
    const std::string na = normalize(a);
    const std::string nb = normalize(b);
    if (na.empty() || nb.empty()) return 0.0;
    return rapidfuzz::fuzz::partial_ratio(na, nb);
}

// Token ratios see punctuation-free words so "Jong-un" and "Jong un" agree
double LexicalMatcher::tokenSortRatio(std::string_view a, std::string_view b) {
    const std::string ta = joinTokens(tokenize(a));
    const std::string tb = joinTokens(tokenize(b));
    if (ta.empty() || tb.empty()) return 0.0;
    return rapidfuzz::fuzz::token_sort_ratio(ta, tb);
}

double LexicalMatcher::tokenSetRatio(std::string_view a, std::string_view b) {
    const std::string ta = joinTokens(tokenize(a));
    const std::string tb = joinTokens(tokenize(b));
    if (ta.empty() || tb.empty()) return 0.0;
    return rapidfuzz::fuzz::token_set_ratio(ta, tb);
}

double LexicalMatcher::weightedRatio(std::string_view a, std::string_view b) {
    if (normalize(a).empty() || normalize(b).empty()) return 0.0;
    return core::WEIGHT_SIMPLE_RATIO * ratio(a, b)
         + core::WEIGHT_PARTIAL_RATIO * partialRatio(a, b)
         + core::WEIGHT_TOKEN_SORT_RATIO * tokenSortRatio(a, b)
         + core::WEIGHT_TOKEN_SET_RATIO * tokenSetRatio(a, b);
}

double LexicalMatcher::similarity(std::string_view a, std::string_view b) {
    return std::clamp(weightedRatio(a, b) / 100.0, 0.0, 1.0);
}

double LexicalMatcher::tokenOverlap(std::string_view a, std::string_view b) {
    auto filtered = [](std::string_view text) {
        std::set<std::string> out;
        for (auto& t : tokenize(text)) {
            if (stopWords().count(t) == 0) out.insert(std::move(t));
        }
        return out;
    };
    const auto sa = filtered(a);
    const auto sb = filtered(b);
    if (sa.empty() || sb.empty()) return 0.0;

    std::vector<std::string> common;
    std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(common));
    const std::size_t unionSize = sa.size() + sb.size() - common.size();
    return static_cast<double>(common.size()) / static_cast<double>(unionSize);
}

std::vector<std::string> LexicalMatcher::nameVariations(std::string_view name) {
    std::vector<std::string> variations{std::string(name)};
    if (normalize(name).empty()) return variations;

    auto addUnique = [&variations](std::string v) {
        if (std::find(variations.begin(), variations.end(), v) == variations.end()) {
            variations.push_back(std::move(v));
        }
    };

    const auto tokens = tokenize(name);
    addUnique(joinTokens(tokens));

    // Components come from the original spelling, split on whitespace
    std::vector<std::string> parts;
    std::string current;
    for (char c : name) {
        if (isSpace(c)) {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));

    if (parts.size() >= 2) {
        const std::string& first = parts.front();
        const std::string& last = parts.back();
        addUnique(first + " " + last);
        addUnique(last + " " + first);
        addUnique(std::string(1, first.front()) + ". " + last);
    }
    return variations;
}

double LexicalMatcher::variationScore(std::string_view a, std::string_view b) {
    double best = 0.0;
    for (const auto& va : nameVariations(a)) {
        for (const auto& vb : nameVariations(b)) {
            best = std::max(best, similarity(va, vb));
        }
    }
    return best;
}

std::vector<std::pair<std::string, double>> LexicalMatcher::findBestMatches(
    std::string_view query,
    const std::vector<std::string>& candidates,
    double threshold,
    std::size_t topK
) const {
    std::vector<std::pair<std::string, double>> matches;
    for (const auto& candidate : candidates) {
        const double score = similarity(query, candidate);
        if (score >= threshold) {
            matches.emplace_back(candidate, score);
        }
    }
    std::stable_sort(matches.begin(), matches.end(),
        [](const auto& l, const auto& r) { return l.second > r.second; });
    if (matches.size() > topK) matches.resize(topK);
    return matches;
}

bool LexicalMatcher::isExactMatch(const core::Candidate& candidate, const core::WatchlistRecord& record) const {
    const std::string candidateName = normalize(candidate.name);
    const std::string recordName = normalize(record.name);
    if (!candidateName.empty() && candidateName == recordName) return true;

    std::vector<std::string> recordAliases;
    recordAliases.reserve(record.aliases.size());
    for (const auto& alias : record.aliases) {
        auto n = normalize(alias);
        if (!n.empty()) recordAliases.push_back(std::move(n));
    }
    auto inRecordAliases = [&recordAliases](const std::string& name) {
        return std::find(recordAliases.begin(), recordAliases.end(), name) != recordAliases.end();
    };

    for (const auto& alias : candidate.aliases) {
        const std::string n = normalize(alias);
        if (n.empty()) continue;
        if (n == recordName || inRecordAliases(n)) return true;
    }
    return !candidateName.empty() && inRecordAliases(candidateName);
}

StrategyOutcome LexicalMatcher::fuzzyScore(const core::Candidate& candidate, const core::WatchlistRecord& record) const {
    const auto left = namesOf(candidate.name, candidate.aliases);
    const auto right = namesOf(record.name, record.aliases);
    double best = 0.0;
    for (const auto& l : left) {
        for (const auto& r : right) {
            best = std::max(best, similarity(l, r));
            if (best >= 1.0) return StrategyOutcome::success(best);
        }
    }
    return StrategyOutcome::success(best);
}

} // namespace sn::matching
