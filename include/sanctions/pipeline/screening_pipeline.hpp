#pragma once

#include "sanctions/core/config.hpp"
#include "sanctions/core/types.hpp"
#include "sanctions/engine/screening_engine.hpp"
#include "sanctions/events/event_types.hpp"
#include "sanctions/events/result_publisher.hpp"
#include "sanctions/handlers/input_handler.hpp"
#include "sanctions/handlers/output_handler.hpp"
#include "sanctions/matching/i_similarity_provider.hpp"
#include "sanctions/payments/payment_orchestrator.hpp"
#include "sanctions/processors/payment_processor.hpp"
#include "sanctions/queue/blocking_queue.hpp"
#include "sanctions/stats/running_statistics.hpp"
#include "sanctions/storage/i_result_store.hpp"
#include "sanctions/watchlist/i_watchlist_store.hpp"
#include <cstdint>
#include <memory>
#include <optional>

namespace sn::pipeline {

// Main pipeline class that wires all components together
// Facade pattern: Provides simple interface to complex subsystem
class ScreeningPipeline {
public:
    ScreeningPipeline(
        std::shared_ptr<watchlist::IWatchlistStore> watchlist,
        std::shared_ptr<matching::ISimilarityProvider> similarity,
        core::ScreeningThresholds thresholds = {},
        core::PipelineConfig config = {},
        std::shared_ptr<storage::IResultStore> resultStore = nullptr
    );

    // Payment operations
    bool submitPayment(const events::PaymentEvent& event);
    bool submitPayment(events::PaymentEvent&& event);
    bool isQueueFull() const;

    // Ad hoc screening of one candidate, on the caller's thread
    core::ScreeningResult screen(
        const core::Candidate& candidate,
        std::optional<core::ScreeningThresholds> thresholds = std::nullopt
    );

    // Result handling
    std::size_t processResults();
    void setResultCallback(handlers::OutputHandler::ResultCallback callback);

    stats::StatisticsSnapshot statistics() const;
    // Payments the workers have taken off the queue and finished
    std::uint64_t processedCount() const noexcept;

    // Lifecycle; start() throws ProviderUnavailableError when the
    // similarity provider is not ready
    void start();
    void stop();
    bool isRunning() const noexcept;

private:
    std::shared_ptr<matching::ISimilarityProvider> similarity_;

    // Queues
    std::shared_ptr<queue::BlockingQueue<events::PaymentEvent>> paymentQueue_;
    std::shared_ptr<queue::BlockingQueue<events::PublishedResult>> resultQueue_;

    // Core components
    std::shared_ptr<engine::ScreeningEngine> engine_;
    std::shared_ptr<events::QueueResultPublisher> publisher_;
    std::shared_ptr<stats::RunningStatistics> statistics_;
    std::shared_ptr<payments::PaymentOrchestrator> orchestrator_;

    // Processors and handlers
    std::unique_ptr<processors::PaymentProcessor> paymentProcessor_;
    std::unique_ptr<handlers::InputHandler> inputHandler_;
    std::unique_ptr<handlers::OutputHandler> outputHandler_;
};

} // namespace sn::pipeline
