#include "sanctions/pipeline/screening_pipeline.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/log.hpp"

namespace sn::pipeline {

ScreeningPipeline::ScreeningPipeline(
    std::shared_ptr<watchlist::IWatchlistStore> watchlist,
    std::shared_ptr<matching::ISimilarityProvider> similarity,
    core::ScreeningThresholds thresholds,
    core::PipelineConfig config,
    std::shared_ptr<storage::IResultStore> resultStore
) : similarity_(similarity) {
    core::validate(thresholds);
    core::validate(config);

    // Create queues
    paymentQueue_ = std::make_shared<queue::BlockingQueue<events::PaymentEvent>>(config.queueSize);
    resultQueue_ = std::make_shared<queue::BlockingQueue<events::PublishedResult>>(config.queueSize);

    // Create core components
    engine_ = std::make_shared<engine::ScreeningEngine>(watchlist, similarity, thresholds, resultStore);
    publisher_ = std::make_shared<events::QueueResultPublisher>(resultQueue_);
    statistics_ = std::make_shared<stats::RunningStatistics>(config.latencyWindow);
    orchestrator_ = std::make_shared<payments::PaymentOrchestrator>(
        engine_, publisher_, statistics_, thresholds, config, resultStore);

    // Create processors and handlers
    paymentProcessor_ = std::make_unique<processors::PaymentProcessor>(paymentQueue_, orchestrator_, config.prefetch);
    inputHandler_ = std::make_unique<handlers::InputHandler>(paymentQueue_);
    outputHandler_ = std::make_unique<handlers::OutputHandler>(resultQueue_);
}

bool ScreeningPipeline::submitPayment(const events::PaymentEvent& event) {
    return inputHandler_->submitPayment(event);
}

bool ScreeningPipeline::submitPayment(events::PaymentEvent&& event) {
    return inputHandler_->submitPayment(std::move(event));
}

bool ScreeningPipeline::isQueueFull() const {
    return inputHandler_->isQueueFull();
}

core::ScreeningResult ScreeningPipeline::screen(
    const core::Candidate& candidate,
    std::optional<core::ScreeningThresholds> thresholds
) {
    engine::ScreeningOptions options;
    options.thresholds = thresholds;
    return engine_->screen(candidate, options);
}

std::size_t ScreeningPipeline::processResults() {
    return outputHandler_->processResults();
}

void ScreeningPipeline::setResultCallback(handlers::OutputHandler::ResultCallback callback) {
    outputHandler_->setCallback(std::move(callback));
}

stats::StatisticsSnapshot ScreeningPipeline::statistics() const {
    return statistics_->snapshot();
}

std::uint64_t ScreeningPipeline::processedCount() const noexcept {
    return paymentProcessor_->processed();
}

void ScreeningPipeline::start() {
    if (!similarity_ || !similarity_->isReady()) {
        throw core::ProviderUnavailableError("similarity provider is not ready");
    }
    paymentProcessor_->start();
    SN_LOG("pipeline started with " << paymentProcessor_->workerCount() << " workers");
}

void ScreeningPipeline::stop() {
    paymentProcessor_->stop();
}

bool ScreeningPipeline::isRunning() const noexcept {
    return paymentProcessor_->isRunning();
}

} // namespace sn::pipeline
