#include "sanctions/queue/blocking_queue.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace sn;
using namespace std::chrono_literals;

TEST_CASE("Bounded queue keeps FIFO order and capacity", "[queue]") {
    queue::BlockingQueue<int> q(2);
    REQUIRE(q.capacity() == 2);
    REQUIRE(q.empty());

    REQUIRE(q.tryPush(1));
    REQUIRE(q.tryPush(2));
    REQUIRE(q.full());
    REQUIRE_FALSE(q.tryPush(3));

    int v = 0;
    REQUIRE(q.tryPop(v));
    REQUIRE(v == 1);
    REQUIRE(q.tryPop(v));
    REQUIRE(v == 2);
    REQUIRE_FALSE(q.tryPop(v));
}

TEST_CASE("Close wakes waiters and drains what is left", "[queue]") {
    queue::BlockingQueue<int> q(4);
    REQUIRE(q.tryPush(7));
    q.close();

    REQUIRE(q.closed());
    REQUIRE_FALSE(q.tryPush(8));
    int v = 0;
    REQUIRE(q.pop(v));
    REQUIRE(v == 7);
    REQUIRE_FALSE(q.pop(v));

    queue::BlockingQueue<int> waiting(1);
    std::atomic<bool> popped{true};
    std::thread consumer([&waiting, &popped] {
        int out = 0;
        popped = waiting.pop(out);
    });
    std::this_thread::sleep_for(20ms);
    waiting.close();
    consumer.join();
    REQUIRE_FALSE(popped.load());
}

TEST_CASE("Many producers and consumers exchange every item", "[queue][concurrency]") {
    queue::BlockingQueue<int> q(8);
    constexpr int kProducers = 3;
    constexpr int kItems = 500;
    std::atomic<long> sum{0};
    std::atomic<int> received{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 2; ++c) {
        consumers.emplace_back([&] {
            int v = 0;
            while (q.pop(v)) {
                sum.fetch_add(v);
                received.fetch_add(1);
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&q] {
            for (int i = 1; i <= kItems; ++i) {
                while (!q.tryPush(i)) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& t : producers) t.join();
    q.close();
    for (auto& t : consumers) t.join();

    REQUIRE(received.load() == kProducers * kItems);
    REQUIRE(sum.load() == kProducers * (kItems * (kItems + 1) / 2));
}
