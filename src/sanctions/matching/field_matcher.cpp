#include "sanctions/matching/field_matcher.hpp"
#include "sanctions/core/constants.hpp"
#include "sanctions/matching/lexical_matcher.hpp"

#include <algorithm>

namespace sn::matching {

namespace {

bool present(const std::optional<std::string>& value) {
    return value.has_value() && !LexicalMatcher::normalize(*value).empty();
}

bool bothPresent(const std::optional<std::string>& a, const std::optional<std::string>& b) {
    return present(a) && present(b);
}

} // namespace

StrategyOutcome FieldMatcher::score(const core::Candidate& candidate, const core::WatchlistRecord& record) const {
    double best = 0.0;

    if (bothPresent(candidate.dateOfBirth, record.dateOfBirth) && *candidate.dateOfBirth == *record.dateOfBirth) {
        best = std::max(best, core::DOB_MATCH_SCORE);
    }

    if (bothPresent(candidate.nationality, record.nationality)) {
        const double nationality = LexicalMatcher::similarity(*candidate.nationality, *record.nationality);
        best = std::max(best, nationality * core::NATIONALITY_SCALE);
    }

    if (bothPresent(candidate.documentNumber, record.documentNumber) &&
        *candidate.documentNumber == *record.documentNumber) {
        best = std::max(best, core::DOCUMENT_MATCH_SCORE);
    }

    return StrategyOutcome::success(best);
}

core::MatchedFields FieldMatcher::matchedFields(const core::Candidate& candidate, const core::WatchlistRecord& record) const {
    core::MatchedFields fields;
    const std::string candidateName = LexicalMatcher::normalize(candidate.name);
    if (!candidateName.empty() && candidateName == LexicalMatcher::normalize(record.name)) {
        fields.set(core::MatchedField::Name);
    }
    if (bothPresent(candidate.dateOfBirth, record.dateOfBirth) && *candidate.dateOfBirth == *record.dateOfBirth) {
        fields.set(core::MatchedField::DateOfBirth);
    }
    if (bothPresent(candidate.nationality, record.nationality) &&
        LexicalMatcher::normalize(*candidate.nationality) == LexicalMatcher::normalize(*record.nationality)) {
        fields.set(core::MatchedField::Nationality);
    }
    if (bothPresent(candidate.documentNumber, record.documentNumber) &&
        *candidate.documentNumber == *record.documentNumber) {
        fields.set(core::MatchedField::PassportNumber);
    }
    return fields;
}

} // namespace sn::matching
