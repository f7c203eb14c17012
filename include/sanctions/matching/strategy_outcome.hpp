#pragma once

#include <cstdint>
#include <string>

namespace sn::matching {

enum class StrategyFailure : std::uint8_t {
    None,
    ProviderError,    // similarity provider threw or returned a malformed batch
    MalformedRecord   // watchlist record unusable (no name)
};

// Score of one strategy for one (candidate, record) pair, or why there is none.
// A failed outcome always scores 0.
struct StrategyOutcome final {
    double score{0.0};
    StrategyFailure failure{StrategyFailure::None};
    std::string detail;

    static StrategyOutcome success(double score) {
        StrategyOutcome out;
        out.score = score;
        return out;
    }

    static StrategyOutcome failed(StrategyFailure failure, std::string detail) {
        StrategyOutcome out;
        out.failure = failure;
        out.detail = std::move(detail);
        return out;
    }

    [[nodiscard]] bool ok() const noexcept { return failure == StrategyFailure::None; }
    [[nodiscard]] bool clears(double threshold) const noexcept { return ok() && score >= threshold; }
};

constexpr const char* toString(StrategyFailure f) noexcept {
    switch (f) {
        case StrategyFailure::None:            return "none";
        case StrategyFailure::ProviderError:   return "provider_error";
        case StrategyFailure::MalformedRecord: return "malformed_record";
    }
    return "unknown";
}

} // namespace sn::matching
