#pragma once

#include "sanctions/events/event_types.hpp"
#include "sanctions/queue/blocking_queue.hpp"
#include <cstddef>
#include <functional>
#include <memory>

namespace sn::handlers {

// Output handler for consuming published results from the queue
// Single Responsibility: Handle result output
class OutputHandler {
public:
    using ResultCallback = std::function<void(const events::PublishedResult&)>;

    explicit OutputHandler(
        std::shared_ptr<queue::BlockingQueue<events::PublishedResult>> resultQueue,
        ResultCallback callback = nullptr
    ) : resultQueue_(std::move(resultQueue)), callback_(std::move(callback)) {}

    // Drain available results (non-blocking); returns how many were handled
    std::size_t processResults() {
        if (!resultQueue_) return 0;

        std::size_t handled = 0;
        events::PublishedResult published;
        while (resultQueue_->tryPop(published)) {
            if (callback_) {
                callback_(published);
            }
            ++handled;
        }
        return handled;
    }

    void setCallback(ResultCallback callback) {
        callback_ = std::move(callback);
    }

private:
    std::shared_ptr<queue::BlockingQueue<events::PublishedResult>> resultQueue_;
    ResultCallback callback_;
};

} // namespace sn::handlers
