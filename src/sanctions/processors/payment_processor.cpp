#include "sanctions/processors/payment_processor.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/log.hpp"

#include <exception>
#include <stdexcept>

namespace sn::processors {

PaymentProcessor::PaymentProcessor(
    std::shared_ptr<queue::BlockingQueue<events::PaymentEvent>> paymentQueue,
    std::shared_ptr<payments::PaymentOrchestrator> orchestrator,
    std::size_t workers
) : paymentQueue_(std::move(paymentQueue)),
    orchestrator_(std::move(orchestrator)),
    workerCount_(workers) {
    if (!paymentQueue_ || !orchestrator_) {
        throw core::ConfigError("payment processor requires a queue and an orchestrator");
    }
    if (workerCount_ == 0) {
        throw core::ConfigError("payment processor requires at least one worker");
    }
}

PaymentProcessor::~PaymentProcessor() {
    stop();
}

void PaymentProcessor::start() {
    if (paymentQueue_->closed()) {
        throw std::logic_error("payment processor cannot restart after stop");
    }
    if (running_.exchange(true)) {
        return; // Already running
    }
    workers_.reserve(workerCount_);
    for (std::size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back(&PaymentProcessor::processLoop, this);
    }
}

void PaymentProcessor::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }
    // Workers finish the payments already queued, then see the closed queue
    paymentQueue_->close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void PaymentProcessor::processLoop() {
    events::PaymentEvent event;
    while (paymentQueue_->pop(event)) {
        try {
            orchestrator_->process(event);
        } catch (const std::exception& e) {
            // One bad payment must not take the worker down
            SN_ERROR("payment " << event.paymentId << " aborted: " << e.what());
        } catch (...) {
            SN_ERROR("payment " << event.paymentId << " aborted by a non-standard exception");
        }
        processed_.fetch_add(1);
    }
}

} // namespace sn::processors
