#pragma once

#include "sanctions/core/constants.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace sn::core {

struct ScreeningThresholds final {
    double fuzzy{DEFAULT_FUZZY_THRESHOLD};
    double similarity{DEFAULT_SIMILARITY_THRESHOLD};
    double field{DEFAULT_FIELD_THRESHOLD};
    double review{DEFAULT_REVIEW_THRESHOLD};
    double block{DEFAULT_BLOCK_THRESHOLD};
    double blockConfidence{BLOCK_CONFIDENCE};
    double reviewConfidence{REVIEW_CONFIDENCE};
    double clearConfidence{CLEAR_CONFIDENCE};
};

struct PipelineConfig final {
    std::size_t prefetch{DEFAULT_PREFETCH};     // worker count == max in-flight payments
    std::size_t queueSize{DEFAULT_QUEUE_SIZE};
    std::chrono::milliseconds screeningTimeout{DEFAULT_SCREENING_TIMEOUT_MS};
    std::size_t latencyWindow{DEFAULT_LATENCY_WINDOW};
    std::string routingPrefix{"screening.result"};
};

// Throw ConfigError when a value is outside its domain
void validate(const ScreeningThresholds& thresholds);
void validate(const PipelineConfig& config);

// Start from `base` and apply FUZZY_THRESHOLD, SIMILARITY_THRESHOLD,
// FIELD_THRESHOLD, MEDIUM_RISK_THRESHOLD and HIGH_RISK_THRESHOLD
ScreeningThresholds loadThresholdsFromEnv(ScreeningThresholds base = {});

// Start from `base` and apply SCREENING_PREFETCH, SCREENING_QUEUE_SIZE,
// SCREENING_TIMEOUT_MS and LATENCY_WINDOW
PipelineConfig loadPipelineConfigFromEnv(PipelineConfig base = {});

} // namespace sn::core
