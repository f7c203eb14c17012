#include "sanctions/payments/payment_orchestrator.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/log.hpp"
#include "sanctions/engine/decision_policy.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace sn::payments {

namespace {

std::uint64_t wallClockMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

events::PaymentScreeningResult newResult(const events::PaymentEvent& event, std::uint64_t screeningId) {
    events::PaymentScreeningResult result;
    result.paymentId = event.paymentId;
    result.transactionId = event.transactionId;
    result.screeningId = screeningId;
    result.metadata.paymentType = event.paymentType;
    result.metadata.amount = event.amount;
    result.metadata.currency = event.currency;
    return result;
}

} // namespace

PaymentOrchestrator::PaymentOrchestrator(
    std::shared_ptr<engine::IScreeningEngine> engine,
    std::shared_ptr<events::IResultPublisher> publisher,
    std::shared_ptr<stats::RunningStatistics> statistics,
    core::ScreeningThresholds thresholds,
    core::PipelineConfig config,
    std::shared_ptr<storage::IResultStore> resultStore
) : engine_(std::move(engine)),
    publisher_(std::move(publisher)),
    statistics_(std::move(statistics)),
    resultStore_(std::move(resultStore)),
    thresholds_(thresholds),
    config_(std::move(config)),
    nextScreeningId_(wallClockMs()) {
    if (!engine_) throw core::ConfigError("orchestrator requires a screening engine");
    if (!publisher_) throw core::ConfigError("orchestrator requires a result publisher");
    if (!statistics_) throw core::ConfigError("orchestrator requires running statistics");
    core::validate(thresholds_);
    core::validate(config_);
}

core::Candidate PaymentOrchestrator::partyCandidate(const std::string& name, const std::optional<std::string>& country) {
    core::Candidate candidate;
    candidate.name = name;
    candidate.nationality = country;
    candidate.type = core::EntityType::Individual;
    return candidate;
}

std::string PaymentOrchestrator::routingKey(const events::PaymentScreeningResult& result) const {
    return config_.routingPrefix + "." + core::toString(result.decision);
}

std::future<core::ScreeningResult> PaymentOrchestrator::launch(core::Candidate candidate, const CancelFlag& cancelled) const {
    return std::async(std::launch::async, [engine = engine_, cancelled, candidate = std::move(candidate)]() {
        engine::ScreeningOptions options;
        options.cancelled = cancelled.get();
        options.persist = false;
        return engine->screen(candidate, options);
    });
}

std::optional<core::ScreeningResult> PaymentOrchestrator::collect(
    std::future<core::ScreeningResult>& task,
    const char* side,
    std::vector<std::string>& errors
) {
    try {
        return task.get();
    } catch (const std::exception& e) {
        errors.push_back(std::string(side) + ": " + e.what());
        return std::nullopt;
    } catch (...) {
        errors.push_back(std::string(side) + ": unknown error");
        return std::nullopt;
    }
}

void PaymentOrchestrator::failClosed(
    events::PaymentScreeningResult& result,
    PaymentStateMachine& state,
    const std::string& error
) const {
    result.decision = core::Decision::Block;
    state.advance(events::PaymentStatus::Error);
    result.status = state.state();
    result.metadata.error = error;
    SN_WARN("payment " << result.paymentId << " failed closed: " << error);
}

void PaymentOrchestrator::complete(events::PaymentScreeningResult& result, std::chrono::steady_clock::time_point start) {
    result.processingTime = std::chrono::duration_cast<core::Latency>(std::chrono::steady_clock::now() - start);

    statistics_->record(result);

    const std::string key = routingKey(result);
    try {
        if (!publisher_->publish(result, key)) {
            SN_WARN("result for payment " << result.paymentId << " dropped, publisher rejected key " << key);
        }
    } catch (const std::exception& e) {
        SN_ERROR("publishing result for payment " << result.paymentId << " failed: " << e.what());
    }

    if (resultStore_) {
        try {
            // Only the party screenings this payment was decided on
            if (result.sender) resultStore_->store(*result.sender);
            if (result.recipient) resultStore_->store(*result.recipient);
            resultStore_->store(result);
        } catch (const std::exception& e) {
            SN_ERROR("storing result for payment " << result.paymentId << " failed: " << e.what());
        }
    }

    SN_LOG("PAYMENT id=" << result.paymentId << " status=" << events::toString(result.status)
           << " risk=" << result.riskScore << " latency_us=" << result.processingTime.count());
}

events::PaymentScreeningResult PaymentOrchestrator::process(const events::PaymentEvent& event) {
    const auto start = std::chrono::steady_clock::now();

    // Children are joined when these futures go out of scope, after publishing
    std::future<core::ScreeningResult> senderTask;
    std::future<core::ScreeningResult> recipientTask;

    PaymentStateMachine state;
    events::PaymentScreeningResult result = newResult(event, nextScreeningId_.fetch_add(1));
    state.advance(events::PaymentStatus::Screening);
    result.status = state.state();

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    try {
        senderTask = launch(partyCandidate(event.senderName, event.senderCountry), cancelled);
        recipientTask = launch(partyCandidate(event.recipientName, event.recipientCountry), cancelled);
    } catch (const std::system_error& e) {
        cancelled->store(true, std::memory_order_release);
        result.riskScore = 1.0;
        failClosed(result, state, std::string("could not start screening: ") + e.what());
        complete(result, start);
        return result;
    }

    const auto deadline = start + config_.screeningTimeout;
    const bool senderDone = senderTask.wait_until(deadline) == std::future_status::ready;
    const bool recipientDone = recipientTask.wait_until(deadline) == std::future_status::ready;
    if (!senderDone || !recipientDone) {
        cancelled->store(true, std::memory_order_release);
        result.riskScore = 1.0;
        failClosed(result, state, "screening timed out after " +
                   std::to_string(config_.screeningTimeout.count()) + " ms");
        complete(result, start);
        return result;
    }

    std::vector<std::string> errors;
    result.sender = collect(senderTask, "sender", errors);
    result.recipient = collect(recipientTask, "recipient", errors);

    const double senderRisk = result.sender ? result.sender->riskScore : 0.0;
    const double recipientRisk = result.recipient ? result.recipient->riskScore : 0.0;
    result.riskScore = std::max(senderRisk, recipientRisk);

    if (!errors.empty()) {
        std::string joined;
        for (const auto& e : errors) {
            if (!joined.empty()) joined += "; ";
            joined += e;
        }
        failClosed(result, state, joined);
    } else {
        result.decision = engine::classify(result.riskScore, thresholds_).decision;
        state.advance(PaymentStateMachine::terminalFor(result.decision));
        result.status = state.state();
    }

    complete(result, start);
    return result;
}

} // namespace sn::payments
