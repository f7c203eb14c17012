#include "sanctions/processors/payment_processor.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace sn;
using namespace std::chrono_literals;

namespace {

events::PaymentEvent payment(const std::string& id) {
    events::PaymentEvent e;
    e.paymentId = id;
    e.transactionId = "TXN-" + id;
    e.senderName = "Alice";
    e.recipientName = "Bob";
    return e;
}

} // namespace

TEST_CASE("Stop drains queued payments before the workers exit", "[processor]") {
    auto paymentQueue = std::make_shared<queue::BlockingQueue<events::PaymentEvent>>(8);
    auto publisher = std::make_shared<testing::CapturingPublisher>();
    auto statistics = std::make_shared<stats::RunningStatistics>(8);
    auto orchestrator = std::make_shared<payments::PaymentOrchestrator>(
        std::make_shared<testing::ScriptedEngine>(), publisher, statistics);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(paymentQueue->tryPush(payment("P" + std::to_string(i))));
    }

    processors::PaymentProcessor processor(paymentQueue, orchestrator, 2);
    processor.start();
    processor.stop();

    REQUIRE_FALSE(processor.isRunning());
    REQUIRE(paymentQueue->closed());
    REQUIRE(processor.processed() == 5);
    REQUIRE(publisher->count() == 5);
    REQUIRE_FALSE(paymentQueue->tryPush(payment("late")));
    REQUIRE_THROWS_AS(processor.start(), std::logic_error);
}

TEST_CASE("A worker survives a non-standard exception", "[processor][errors]") {
    auto paymentQueue = std::make_shared<queue::BlockingQueue<events::PaymentEvent>>(8);
    auto publisher = std::make_shared<testing::ForeignThrowingPublisher>();
    auto statistics = std::make_shared<stats::RunningStatistics>(8);
    auto orchestrator = std::make_shared<payments::PaymentOrchestrator>(
        std::make_shared<testing::ScriptedEngine>(), publisher, statistics);

    // One worker, so the second payment only runs if the first did not end it
    processors::PaymentProcessor processor(paymentQueue, orchestrator, 1);
    processor.start();
    REQUIRE(paymentQueue->tryPush(payment("P1")));
    REQUIRE(paymentQueue->tryPush(payment("P2")));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (processor.processed() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    processor.stop();

    REQUIRE(processor.processed() == 2);
    REQUIRE(publisher->attempts.load() == 2);
    REQUIRE(statistics->snapshot().totalProcessed == 2);
}
