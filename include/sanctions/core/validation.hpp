#pragma once

#include "sanctions/core/types.hpp"
#include <string_view>

namespace sn::core {

// True for a real calendar date written as YYYY-MM-DD
bool isIsoDate(std::string_view text) noexcept;

// Throws InvalidCandidateError for an empty name or a malformed date of birth
void validateCandidate(const Candidate& candidate);

} // namespace sn::core
