#pragma once

#include <cstddef>

namespace sn::core {

// Matching thresholds
inline constexpr double DEFAULT_FUZZY_THRESHOLD = 0.80;
inline constexpr double DEFAULT_SIMILARITY_THRESHOLD = 0.85;
inline constexpr double DEFAULT_FIELD_THRESHOLD = 0.85;

// Decision thresholds and the confidence attached to each decision
inline constexpr double DEFAULT_REVIEW_THRESHOLD = 0.70;
inline constexpr double DEFAULT_BLOCK_THRESHOLD = 0.90;
inline constexpr double BLOCK_CONFIDENCE = 0.95;
inline constexpr double REVIEW_CONFIDENCE = 0.85;
inline constexpr double CLEAR_CONFIDENCE = 0.90;
inline constexpr double NO_FINDINGS_CONFIDENCE = 1.0;

// Weighted ratio: simple, partial, token sort, token set
inline constexpr double WEIGHT_SIMPLE_RATIO = 0.30;
inline constexpr double WEIGHT_PARTIAL_RATIO = 0.20;
inline constexpr double WEIGHT_TOKEN_SORT_RATIO = 0.25;
inline constexpr double WEIGHT_TOKEN_SET_RATIO = 0.25;

// Secondary attribute scores
inline constexpr double DOB_MATCH_SCORE = 0.90;
inline constexpr double DOCUMENT_MATCH_SCORE = 0.95;
inline constexpr double NATIONALITY_SCALE = 0.70;

// Pipeline
inline constexpr std::size_t DEFAULT_QUEUE_SIZE = 1024;
inline constexpr std::size_t DEFAULT_PREFETCH = 4;
inline constexpr std::size_t DEFAULT_LATENCY_WINDOW = 1000;
inline constexpr long DEFAULT_SCREENING_TIMEOUT_MS = 5000;

} // namespace sn::core
