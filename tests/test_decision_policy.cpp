#include "sanctions/engine/decision_policy.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <initializer_list>

using namespace sn;
using Catch::Approx;

namespace {

core::MatchFinding finding(double risk) {
    core::MatchFinding f;
    f.strategy = core::MatchStrategy::Fuzzy;
    f.confidence = risk;
    f.riskContribution = risk;
    return f;
}

} // namespace

TEST_CASE("Risk contribution", "[decision]") {
    REQUIRE(engine::riskContribution(core::MatchStrategy::Exact, 0.3) == 1.0);
    REQUIRE(engine::riskContribution(core::MatchStrategy::Fuzzy, 0.82) == Approx(0.82));
    REQUIRE(engine::riskContribution(core::MatchStrategy::Semantic, 1.2) == 1.0);
    REQUIRE(engine::riskContribution(core::MatchStrategy::Fuzzy, -0.1) == 0.0);
}

TEST_CASE("Risk contribution is bounded and non-decreasing in confidence", "[decision]") {
    for (const auto strategy : {core::MatchStrategy::Exact, core::MatchStrategy::Fuzzy, core::MatchStrategy::Semantic}) {
        double previous = engine::riskContribution(strategy, -0.5);
        REQUIRE(previous >= 0.0);
        // -0.5 .. 1.5 in steps of 0.01, including values outside [0, 1]
        for (int step = -49; step <= 150; ++step) {
            const double confidence = step / 100.0;
            const double risk = engine::riskContribution(strategy, confidence);
            REQUIRE(risk >= 0.0);
            REQUIRE(risk <= 1.0);
            REQUIRE(risk >= previous);
            previous = risk;
        }
    }
}

TEST_CASE("Aggregate risk weights findings by their own risk", "[decision]") {
    REQUIRE(engine::aggregateRisk({}) == 0.0);
    REQUIRE(engine::aggregateRisk({finding(0.8)}) == Approx(0.8));
    // (1.0 + 0.25) / 1.5
    REQUIRE(engine::aggregateRisk({finding(1.0), finding(0.5)}) == Approx(1.25 / 1.5));
    REQUIRE(engine::aggregateRisk({finding(0.0), finding(0.0)}) == 0.0);
}

TEST_CASE("Classification bands", "[decision]") {
    const core::ScreeningThresholds t;

    auto c = engine::classify(0.95, t);
    REQUIRE(c.decision == core::Decision::Block);
    REQUIRE(c.confidence == Approx(0.95));

    REQUIRE(engine::classify(0.90, t).decision == core::Decision::Block);

    c = engine::classify(0.75, t);
    REQUIRE(c.decision == core::Decision::Review);
    REQUIRE(c.confidence == Approx(0.85));

    REQUIRE(engine::classify(0.70, t).decision == core::Decision::Review);

    c = engine::classify(0.5, t);
    REQUIRE(c.decision == core::Decision::Clear);
    REQUIRE(c.confidence == Approx(0.90));

    c = engine::classify(0.0, t, false);
    REQUIRE(c.decision == core::Decision::Clear);
    REQUIRE(c.confidence == 1.0);
}
