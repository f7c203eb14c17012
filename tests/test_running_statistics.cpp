#include "sanctions/stats/running_statistics.hpp"
#include "sanctions/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>

using namespace sn;
using Catch::Approx;

namespace {

events::PaymentScreeningResult completed(core::Decision decision, events::PaymentStatus status, long latencyUs) {
    events::PaymentScreeningResult r;
    r.decision = decision;
    r.status = status;
    r.processingTime = core::Latency(latencyUs);
    return r;
}

} // namespace

TEST_CASE("Counters split by decision and errors", "[stats]") {
    stats::RunningStatistics statistics(10);
    statistics.record(completed(core::Decision::Clear, events::PaymentStatus::Cleared, 1000));
    statistics.record(completed(core::Decision::Review, events::PaymentStatus::Review, 1000));
    statistics.record(completed(core::Decision::Block, events::PaymentStatus::Blocked, 1000));
    // Fail-closed results carry a block decision but count as errors only
    statistics.record(completed(core::Decision::Block, events::PaymentStatus::Error, 1000));

    const auto s = statistics.snapshot();
    REQUIRE(s.totalProcessed == 4);
    REQUIRE(s.cleared == 1);
    REQUIRE(s.review == 1);
    REQUIRE(s.blocked == 1);
    REQUIRE(s.errors == 1);
    REQUIRE(s.averageLatencyMs == Approx(1.0));
}

TEST_CASE("Latency average covers only the recent window", "[stats]") {
    stats::RunningStatistics statistics(2);
    REQUIRE(statistics.snapshot().latencySamples == 0);
    REQUIRE(statistics.snapshot().averageLatencyMs == 0.0);

    statistics.record(completed(core::Decision::Clear, events::PaymentStatus::Cleared, 1000));
    REQUIRE(statistics.snapshot().averageLatencyMs == Approx(1.0));

    statistics.record(completed(core::Decision::Clear, events::PaymentStatus::Cleared, 2000));
    statistics.record(completed(core::Decision::Clear, events::PaymentStatus::Cleared, 3000));

    const auto s = statistics.snapshot();
    REQUIRE(s.latencySamples == 2);
    REQUIRE(s.averageLatencyMs == Approx(2.5));
    REQUIRE(s.totalProcessed == 3);
}

TEST_CASE("Concurrent updates are not lost", "[stats][concurrency]") {
    stats::RunningStatistics statistics(100);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&statistics, t] {
            const auto decision = static_cast<core::Decision>(t % 3);
            for (int i = 0; i < kPerThread; ++i) {
                statistics.record(completed(decision, events::PaymentStatus::Cleared, 500));
            }
        });
    }
    for (auto& th : threads) th.join();

    const auto s = statistics.snapshot();
    REQUIRE(s.totalProcessed == kThreads * kPerThread);
    REQUIRE(s.cleared + s.review + s.blocked + s.errors == s.totalProcessed);
    REQUIRE(s.latencySamples == 100);
    REQUIRE(s.averageLatencyMs == Approx(0.5));
}

TEST_CASE("Window must hold at least one sample", "[stats][errors]") {
    REQUIRE_THROWS_AS(stats::RunningStatistics(0), core::ConfigError);
}
