#include "sanctions/stats/running_statistics.hpp"
#include "sanctions/core/errors.hpp"

#include <chrono>
#include <numeric>

namespace sn::stats {

RunningStatistics::RunningStatistics(std::size_t windowCapacity) {
    if (windowCapacity == 0) {
        throw core::ConfigError("latency window must be positive");
    }
    window_.assign(windowCapacity, 0.0);
}

void RunningStatistics::record(const events::PaymentScreeningResult& result) {
    const double latencyMs = std::chrono::duration<double, std::milli>(result.processingTime).count();

    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.totalProcessed;
    if (result.status == events::PaymentStatus::Error) {
        ++counters_.errors;
    } else {
        switch (result.decision) {
            case core::Decision::Clear:  ++counters_.cleared; break;
            case core::Decision::Review: ++counters_.review; break;
            case core::Decision::Block:  ++counters_.blocked; break;
        }
    }

    window_[next_] = latencyMs;
    next_ = (next_ + 1) % window_.size();
    if (filled_ < window_.size()) ++filled_;
}

StatisticsSnapshot RunningStatistics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatisticsSnapshot out = counters_;
    out.latencySamples = filled_;
    if (filled_ > 0) {
        // Unfilled slots are zero, so summing the whole ring is exact
        out.averageLatencyMs = std::accumulate(window_.begin(), window_.end(), 0.0) / static_cast<double>(filled_);
    }
    return out;
}

} // namespace sn::stats
