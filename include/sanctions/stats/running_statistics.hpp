#pragma once

#include "sanctions/core/constants.hpp"
#include "sanctions/events/event_types.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace sn::stats {

struct StatisticsSnapshot {
    std::uint64_t totalProcessed{0};
    std::uint64_t cleared{0};
    std::uint64_t review{0};
    std::uint64_t blocked{0};
    std::uint64_t errors{0};
    double averageLatencyMs{0.0}; // over the recent window
    std::size_t latencySamples{0};
};

/**
 * Counters shared by every in-flight payment.
 *
 * Error results count toward `errors` only, so
 * cleared + review + blocked + errors == totalProcessed.
 * The latency window keeps the most recent `windowCapacity` samples.
 */
class RunningStatistics final {
public:
    explicit RunningStatistics(std::size_t windowCapacity = core::DEFAULT_LATENCY_WINDOW);

    void record(const events::PaymentScreeningResult& result);
    StatisticsSnapshot snapshot() const;

    std::size_t windowCapacity() const noexcept { return window_.size(); }

private:
    mutable std::mutex mutex_;
    StatisticsSnapshot counters_{};
    std::vector<double> window_;   // ring of latency samples in ms
    std::size_t next_{0};
    std::size_t filled_{0};
};

} // namespace sn::stats
