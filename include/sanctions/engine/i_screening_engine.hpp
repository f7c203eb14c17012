#pragma once

#include "sanctions/core/config.hpp"
#include "sanctions/core/types.hpp"
#include <atomic>
#include <optional>

namespace sn::engine {

struct ScreeningOptions {
    std::optional<core::ScreeningThresholds> thresholds; // per-call override
    const std::atomic<bool>* cancelled{nullptr};          // polled between records
    bool persist{true};                                   // false when the caller stores the result
};

// Interface for screening engine (Dependency Inversion Principle)
class IScreeningEngine {
public:
    virtual ~IScreeningEngine() = default;
    virtual core::ScreeningResult screen(const core::Candidate& candidate, const ScreeningOptions& options = {}) = 0;
};

} // namespace sn::engine
