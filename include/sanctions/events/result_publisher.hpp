#pragma once

#include "sanctions/events/event_types.hpp"
#include "sanctions/queue/blocking_queue.hpp"
#include <memory>
#include <string>

namespace sn::events {

// Interface for result publishing (Dependency Inversion Principle).
// false means the result was not accepted; callers log and move on.
class IResultPublisher {
public:
    virtual ~IResultPublisher() = default;
    virtual bool publish(const PaymentScreeningResult& result, const std::string& routingKey) = 0;
};

// Queue-backed publisher; never blocks a worker, a full queue rejects
class QueueResultPublisher final : public IResultPublisher {
public:
    explicit QueueResultPublisher(std::shared_ptr<queue::BlockingQueue<PublishedResult>> resultQueue)
        : resultQueue_(std::move(resultQueue)) {}

    bool publish(const PaymentScreeningResult& result, const std::string& routingKey) override {
        return resultQueue_ && resultQueue_->tryPush(PublishedResult{routingKey, result.paymentId, result});
    }

private:
    std::shared_ptr<queue::BlockingQueue<PublishedResult>> resultQueue_;
};

} // namespace sn::events
