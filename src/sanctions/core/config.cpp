#include "sanctions/core/config.hpp"
#include "sanctions/core/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>

namespace sn::core {

namespace {

void requireUnit(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigError(std::string(name) + " must be within [0, 1]");
    }
}

std::optional<double> envDouble(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(raw, &end);
    if (end == raw || *end != '\0' || errno == ERANGE) {
        throw ConfigError(std::string("Invalid value for ") + name + ": " + raw);
    }
    return parsed;
}

std::optional<long long> envPositive(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(raw, &end, 10);
    if (end == raw || *end != '\0' || errno == ERANGE || parsed <= 0) {
        throw ConfigError(std::string("Invalid value for ") + name + ": " + raw);
    }
    return parsed;
}

} // namespace

void validate(const ScreeningThresholds& t) {
    requireUnit(t.fuzzy, "fuzzy threshold");
    requireUnit(t.similarity, "similarity threshold");
    requireUnit(t.field, "field threshold");
    requireUnit(t.review, "review threshold");
    requireUnit(t.block, "block threshold");
    requireUnit(t.blockConfidence, "block confidence");
    requireUnit(t.reviewConfidence, "review confidence");
    requireUnit(t.clearConfidence, "clear confidence");
    if (t.review > t.block) {
        throw ConfigError("review threshold must not exceed block threshold");
    }
}

void validate(const PipelineConfig& c) {
    if (c.prefetch == 0) throw ConfigError("prefetch must be positive");
    if (c.queueSize == 0) throw ConfigError("queue size must be positive");
    if (c.latencyWindow == 0) throw ConfigError("latency window must be positive");
    if (c.screeningTimeout.count() <= 0) throw ConfigError("screening timeout must be positive");
}

ScreeningThresholds loadThresholdsFromEnv(ScreeningThresholds base) {
    if (auto v = envDouble("FUZZY_THRESHOLD")) base.fuzzy = *v;
    if (auto v = envDouble("SIMILARITY_THRESHOLD")) base.similarity = *v;
    if (auto v = envDouble("FIELD_THRESHOLD")) base.field = *v;
    if (auto v = envDouble("MEDIUM_RISK_THRESHOLD")) base.review = *v;
    if (auto v = envDouble("HIGH_RISK_THRESHOLD")) base.block = *v;
    validate(base);
    return base;
}

PipelineConfig loadPipelineConfigFromEnv(PipelineConfig base) {
    if (auto v = envPositive("SCREENING_PREFETCH")) base.prefetch = static_cast<std::size_t>(*v);
    if (auto v = envPositive("SCREENING_QUEUE_SIZE")) base.queueSize = static_cast<std::size_t>(*v);
    if (auto v = envPositive("SCREENING_TIMEOUT_MS")) base.screeningTimeout = std::chrono::milliseconds(*v);
    if (auto v = envPositive("LATENCY_WINDOW")) base.latencyWindow = static_cast<std::size_t>(*v);
    validate(base);
    return base;
}

} // namespace sn::core
