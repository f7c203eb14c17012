#pragma once

#include <stdexcept>
#include <string>

namespace sn::core {

// Candidate rejected before matching (empty name, malformed date)
class InvalidCandidateError : public std::invalid_argument {
public:
    explicit InvalidCandidateError(const std::string& what) : std::invalid_argument(what) {}
};

// Threshold or pipeline setting out of range
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Similarity provider cannot serve requests at startup
class ProviderUnavailableError : public std::runtime_error {
public:
    explicit ProviderUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

// Screening abandoned because its owner gave up waiting
class ScreeningCancelledError : public std::runtime_error {
public:
    explicit ScreeningCancelledError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace sn::core
