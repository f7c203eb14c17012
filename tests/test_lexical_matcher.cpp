#include "sanctions/matching/lexical_matcher.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using matching::LexicalMatcher;
using Catch::Approx;

TEST_CASE("Normalization and tokenization", "[lexical]") {
    REQUIRE(LexicalMatcher::normalize("  John   SMITH ") == "john smith");
    REQUIRE(LexicalMatcher::normalize("   ").empty());

    const auto tokens = LexicalMatcher::tokenize("Kim Jong-un");
    REQUIRE(tokens == std::vector<std::string>{"kim", "jong", "un"});
}

TEST_CASE("Ratios follow the fuzzy string scale", "[lexical]") {
    SECTION("identical strings ignoring case score 100") {
        REQUIRE(LexicalMatcher::ratio("John Smith", "john smith") == Approx(100.0));
        REQUIRE(LexicalMatcher::similarity("John Smith", "JOHN SMITH") == Approx(1.0));
    }

    SECTION("a contained substring is a perfect partial match") {
        REQUIRE(LexicalMatcher::partialRatio("smith", "John Smith") == Approx(100.0));
    }

    SECTION("word order does not matter for the token ratios") {
        REQUIRE(LexicalMatcher::tokenSortRatio("Smith John", "John Smith") == Approx(100.0));
        REQUIRE(LexicalMatcher::tokenSetRatio("John Smith", "John Smith Jr") == Approx(100.0));
    }

    SECTION("token ratios ignore punctuation between words") {
        REQUIRE(LexicalMatcher::tokenSortRatio("Jong-un, Kim", "Kim Jong Un") == Approx(100.0));
        REQUIRE(LexicalMatcher::tokenSetRatio("--", "Kim") == 0.0);
    }

    SECTION("indel ratio for a single dropped letter") {
        // LCS 9 over 19 characters
        REQUIRE(LexicalMatcher::ratio("Jon Smith", "John Smith") == Approx(200.0 * 9 / 19));
    }

    SECTION("empty input scores zero") {
        REQUIRE(LexicalMatcher::ratio("", "John") == 0.0);
        REQUIRE(LexicalMatcher::weightedRatio("John", "  ") == 0.0);
        REQUIRE(LexicalMatcher::similarity("", "") == 0.0);
    }

    SECTION("similarity stays within [0, 1]") {
        const double s = LexicalMatcher::similarity("Vladimir Putin", "Maria Garcia");
        REQUIRE(s >= 0.0);
        REQUIRE(s < 0.6);
    }
}

TEST_CASE("Near-identical names land in the review band", "[lexical]") {
    const double s = LexicalMatcher::similarity("Johnny Smith", "John Smith");
    REQUIRE(s > 0.85);
    REQUIRE(s < 0.90);
}

TEST_CASE("Token overlap ignores stop words", "[lexical]") {
    REQUIRE(LexicalMatcher::tokenOverlap("The Bank of America", "America Bank") == Approx(1.0));
    REQUIRE(LexicalMatcher::tokenOverlap("John Smith", "John Doe") == Approx(1.0 / 3.0));
    REQUIRE(LexicalMatcher::tokenOverlap("", "John") == 0.0);
    REQUIRE(LexicalMatcher::tokenOverlap("the of", "and") == 0.0);
}

TEST_CASE("Name variations", "[lexical]") {
    SECTION("multi-part names get reordered and abbreviated forms") {
        const auto v = LexicalMatcher::nameVariations("John Smith");
        REQUIRE(v.front() == "John Smith");
        REQUIRE(std::count(v.begin(), v.end(), "john smith") == 1);
        REQUIRE(std::count(v.begin(), v.end(), "Smith John") == 1);
        REQUIRE(std::count(v.begin(), v.end(), "J. Smith") == 1);
        REQUIRE(v.size() == 4);
    }

    SECTION("single names only add the normalized form") {
        const auto v = LexicalMatcher::nameVariations("Madonna");
        REQUIRE(v == std::vector<std::string>{"Madonna", "madonna"});
    }

    SECTION("reversed names score perfectly over variations") {
        REQUIRE(LexicalMatcher::variationScore("Smith John", "John Smith") == Approx(1.0));
    }
}

TEST_CASE("Best match search", "[lexical]") {
    LexicalMatcher matcher;
    const std::vector<std::string> names{"Jon Smith", "Maria Garcia", "John Smith"};

    auto matches = matcher.findBestMatches("John Smith", names, 0.8);
    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].first == "John Smith");
    REQUIRE(matches[0].second == Approx(1.0));
    REQUIRE(matches[1].first == "Jon Smith");

    matches = matcher.findBestMatches("John Smith", names, 0.8, 1);
    REQUIRE(matches.size() == 1);

    REQUIRE(matcher.findBestMatches("Zzyzx", names, 0.8).empty());
}

TEST_CASE("Exact matching across names and aliases", "[lexical][exact]") {
    LexicalMatcher matcher;
    const auto entry = testing::johnSmith();

    REQUIRE(matcher.isExactMatch(testing::candidate("JOHN  SMITH"), entry));
    REQUIRE(matcher.isExactMatch(testing::candidate("Johnny Smith"), entry));
    REQUIRE(matcher.isExactMatch(testing::candidate("Someone Else", {"j. smith"}), entry));
    REQUIRE(matcher.isExactMatch(testing::candidate("Someone Else", {"John Smith"}), entry));
    REQUIRE_FALSE(matcher.isExactMatch(testing::candidate("Jane Doe"), entry));
    REQUIRE_FALSE(matcher.isExactMatch(testing::candidate("Jane Doe", {"   "}), entry));
}

TEST_CASE("Fuzzy score takes the best name pairing", "[lexical][fuzzy]") {
    LexicalMatcher matcher;
    const auto entry = testing::johnSmith();

    const auto close = matcher.fuzzyScore(testing::candidate("Jon Smith"), entry);
    REQUIRE(close.ok());
    REQUIRE(close.score > 0.9);

    const auto viaAlias = matcher.fuzzyScore(testing::candidate("Nobody", {"Johnny Smith"}), entry);
    REQUIRE(viaAlias.score == Approx(1.0));

    const auto far = matcher.fuzzyScore(testing::candidate("Xavier Quill"), entry);
    REQUIRE(far.score < 0.5);
}
