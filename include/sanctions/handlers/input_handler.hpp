#pragma once

#include "sanctions/events/event_types.hpp"
#include "sanctions/queue/blocking_queue.hpp"
#include <memory>

namespace sn::handlers {

// Input handler for submitting payment events to the queue
// Single Responsibility: Handle payment input
class InputHandler {
public:
    explicit InputHandler(std::shared_ptr<queue::BlockingQueue<events::PaymentEvent>> paymentQueue)
        : paymentQueue_(std::move(paymentQueue)) {}

    // Rejects events without a payment id and never blocks on a full queue
    bool submitPayment(const events::PaymentEvent& event) {
        return paymentQueue_ && !event.paymentId.empty() && paymentQueue_->tryPush(event);
    }

    bool submitPayment(events::PaymentEvent&& event) {
        return paymentQueue_ && !event.paymentId.empty() && paymentQueue_->tryPush(std::move(event));
    }

    bool isQueueFull() const {
        return paymentQueue_ && paymentQueue_->full();
    }

private:
    std::shared_ptr<queue::BlockingQueue<events::PaymentEvent>> paymentQueue_;
};

} // namespace sn::handlers
