#pragma once

#include "sanctions/core/config.hpp"
#include "sanctions/core/types.hpp"
#include "sanctions/engine/i_screening_engine.hpp"
#include "sanctions/events/event_types.hpp"
#include "sanctions/events/result_publisher.hpp"
#include "sanctions/payments/payment_state.hpp"
#include "sanctions/stats/running_statistics.hpp"
#include "sanctions/storage/i_result_store.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sn::payments {

/**
 * Screens one payment: sender and recipient run concurrently, the combined
 * risk is the max of the two, and the payment decision uses the same
 * review/block thresholds as a single screening.
 *
 * Fail-closed: a side that throws contributes no risk but forces the
 * terminal state to error with a block decision. A screening that outlives
 * the configured timeout is cancelled and reported the same way with
 * risk 1.0; its late result is discarded.
 *
 * Every call ends in exactly one publish and one statistics update and
 * does not return before both child screenings have finished. The result
 * store receives the payment result and only the party screenings it was
 * decided on.
 */
class PaymentOrchestrator final {
public:
    PaymentOrchestrator(
        std::shared_ptr<engine::IScreeningEngine> engine,
        std::shared_ptr<events::IResultPublisher> publisher,
        std::shared_ptr<stats::RunningStatistics> statistics,
        core::ScreeningThresholds thresholds = {},
        core::PipelineConfig config = {},
        std::shared_ptr<storage::IResultStore> resultStore = nullptr
    );

    events::PaymentScreeningResult process(const events::PaymentEvent& event);

    // Payment parties are screened as individuals; the country feeds nationality
    static core::Candidate partyCandidate(const std::string& name, const std::optional<std::string>& country);

    std::string routingKey(const events::PaymentScreeningResult& result) const;

private:
    using CancelFlag = std::shared_ptr<std::atomic<bool>>;

    std::future<core::ScreeningResult> launch(core::Candidate candidate, const CancelFlag& cancelled) const;
    static std::optional<core::ScreeningResult> collect(
        std::future<core::ScreeningResult>& task,
        const char* side,
        std::vector<std::string>& errors
    );
    void failClosed(events::PaymentScreeningResult& result, PaymentStateMachine& state, const std::string& error) const;
    void complete(events::PaymentScreeningResult& result, std::chrono::steady_clock::time_point start);

    std::shared_ptr<engine::IScreeningEngine> engine_;
    std::shared_ptr<events::IResultPublisher> publisher_;
    std::shared_ptr<stats::RunningStatistics> statistics_;
    std::shared_ptr<storage::IResultStore> resultStore_;
    core::ScreeningThresholds thresholds_;
    core::PipelineConfig config_;
    std::atomic<std::uint64_t> nextScreeningId_;
};

} // namespace sn::payments
