#pragma once

#include "sanctions/events/event_types.hpp"
#include "sanctions/payments/payment_orchestrator.hpp"
#include "sanctions/queue/blocking_queue.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace sn::processors {

// Payment processor that consumes from the payment queue with a fixed pool
// of workers; the pool size bounds the number of payments in flight.
// Single Responsibility: Process payments from queue
class PaymentProcessor {
public:
    PaymentProcessor(
        std::shared_ptr<queue::BlockingQueue<events::PaymentEvent>> paymentQueue,
        std::shared_ptr<payments::PaymentOrchestrator> orchestrator,
        std::size_t workers
    );

    ~PaymentProcessor();

    PaymentProcessor(const PaymentProcessor&) = delete;
    PaymentProcessor& operator=(const PaymentProcessor&) = delete;

    // Start processing payments (runs in worker threads)
    void start();
    // Closes the payment queue and joins the workers once it is drained.
    // The processor cannot be started again afterwards.
    void stop();
    bool isRunning() const noexcept { return running_.load(); }

    std::uint64_t processed() const noexcept { return processed_.load(); }
    std::size_t workerCount() const noexcept { return workerCount_; }

private:
    void processLoop();

    std::shared_ptr<queue::BlockingQueue<events::PaymentEvent>> paymentQueue_;
    std::shared_ptr<payments::PaymentOrchestrator> orchestrator_;
    std::size_t workerCount_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> processed_{0};
};

} // namespace sn::processors
