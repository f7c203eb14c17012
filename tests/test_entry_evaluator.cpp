#include "sanctions/engine/entry_evaluator.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using Catch::Approx;

namespace {

engine::EntryEvaluator evaluatorWith(std::shared_ptr<matching::ISimilarityProvider> provider) {
    return engine::EntryEvaluator(std::make_shared<matching::SemanticMatcher>(std::move(provider)));
}

} // namespace

TEST_CASE("Strategies run in order and the first success wins", "[evaluator]") {
    const core::ScreeningThresholds thresholds;
    const auto entry = testing::johnSmith();

    SECTION("exact match short-circuits everything else") {
        auto provider = std::make_shared<testing::FixedSimilarityProvider>(0.99);
        auto evaluator = evaluatorWith(provider);
        engine::EvaluationTrace trace;

        const auto f = evaluator.evaluate(testing::candidate("John Smith"), entry, thresholds, &trace);
        REQUIRE(f);
        REQUIRE(f->strategy == core::MatchStrategy::Exact);
        REQUIRE(f->confidence == 1.0);
        REQUIRE(f->riskContribution == 1.0);
        REQUIRE(f->matchedFields.contains(core::MatchedField::Name));
        REQUIRE(trace.exact);
        REQUIRE(provider->calls() == 0);
    }

    SECTION("fuzzy match above the fuzzy threshold") {
        auto provider = std::make_shared<testing::FixedSimilarityProvider>(0.99);
        auto evaluator = evaluatorWith(provider);

        const auto f = evaluator.evaluate(testing::candidate("Jon Smith"), entry, thresholds);
        REQUIRE(f);
        REQUIRE(f->strategy == core::MatchStrategy::Fuzzy);
        REQUIRE(f->confidence > 0.9);
        REQUIRE(f->riskContribution == Approx(f->confidence));
        REQUIRE(provider->calls() == 0);
    }

    SECTION("semantic match when lexical strategies miss") {
        auto evaluator = evaluatorWith(std::make_shared<testing::FixedSimilarityProvider>(0.9));

        const auto f = evaluator.evaluate(testing::candidate("Xavier Quill"), entry, thresholds);
        REQUIRE(f);
        REQUIRE(f->strategy == core::MatchStrategy::Semantic);
        REQUIRE(f->confidence == Approx(0.9));
    }

    SECTION("field match is reported as fuzzy") {
        auto evaluator = evaluatorWith(std::make_shared<testing::FixedSimilarityProvider>(0.5));
        auto c = testing::candidate("Xavier Quill");
        c.dateOfBirth = "1980-05-15";

        const auto f = evaluator.evaluate(c, entry, thresholds);
        REQUIRE(f);
        REQUIRE(f->strategy == core::MatchStrategy::Fuzzy);
        REQUIRE(f->confidence == Approx(0.90));
        REQUIRE(f->matchedFields.contains(core::MatchedField::DateOfBirth));
        REQUIRE_FALSE(f->matchedFields.contains(core::MatchedField::Name));
    }

    SECTION("nothing clears a threshold") {
        auto evaluator = evaluatorWith(std::make_shared<testing::FixedSimilarityProvider>(0.5));
        engine::EvaluationTrace trace;

        REQUIRE_FALSE(evaluator.evaluate(testing::candidate("Xavier Quill"), entry, thresholds, &trace));
        REQUIRE(trace.semantic.ok());
        REQUIRE(trace.semantic.score == Approx(0.5));
        REQUIRE(trace.field.score == 0.0);
    }
}

TEST_CASE("Thresholds are inclusive", "[evaluator]") {
    core::ScreeningThresholds thresholds;
    thresholds.similarity = 0.9;
    auto evaluator = evaluatorWith(std::make_shared<testing::FixedSimilarityProvider>(0.9));

    const auto f = evaluator.evaluate(testing::candidate("Xavier Quill"), testing::johnSmith(), thresholds);
    REQUIRE(f);
    REQUIRE(f->strategy == core::MatchStrategy::Semantic);
}

TEST_CASE("A failing provider never escapes the evaluator", "[evaluator][errors]") {
    const core::ScreeningThresholds thresholds;
    auto evaluator = evaluatorWith(std::make_shared<testing::ThrowingSimilarityProvider>());
    engine::EvaluationTrace trace;

    SECTION("no other evidence means no finding") {
        REQUIRE_FALSE(evaluator.evaluate(testing::candidate("Xavier Quill"), testing::johnSmith(), thresholds, &trace));
        REQUIRE(trace.semantic.failure == matching::StrategyFailure::ProviderError);
    }

    SECTION("field matching still runs after the semantic failure") {
        auto c = testing::candidate("Xavier Quill");
        c.documentNumber = "A12345678";
        const auto f = evaluator.evaluate(c, testing::johnSmith(), thresholds, &trace);
        REQUIRE(f);
        REQUIRE(f->confidence == Approx(0.95));
        REQUIRE_FALSE(trace.semantic.ok());
    }
}

TEST_CASE("Records without a name are skipped", "[evaluator][errors]") {
    auto evaluator = evaluatorWith(std::make_shared<testing::FixedSimilarityProvider>(1.0));
    engine::EvaluationTrace trace;

    auto broken = testing::record("   ");
    broken.dateOfBirth = "1980-05-15";
    auto c = testing::candidate("Xavier Quill");
    c.dateOfBirth = "1980-05-15";

    REQUIRE_FALSE(evaluator.evaluate(c, broken, core::ScreeningThresholds{}, &trace));
    REQUIRE(trace.malformedRecord);
    REQUIRE(trace.fuzzy.failure == matching::StrategyFailure::MalformedRecord);
}

TEST_CASE("Evaluator requires a semantic matcher", "[evaluator]") {
    REQUIRE_THROWS_AS(engine::EntryEvaluator(nullptr), core::ConfigError);
}
