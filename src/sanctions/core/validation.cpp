#include "sanctions/core/validation.hpp"
#include "sanctions/core/errors.hpp"

#include <cctype>

namespace sn::core {

namespace {

bool digitsAt(std::string_view s, std::size_t pos, std::size_t count, int& out) noexcept {
    out = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

bool isLeapYear(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool isBlank(std::string_view s) noexcept {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

bool isIsoDate(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    int year = 0, month = 0, day = 0;
    if (!digitsAt(text, 0, 4, year) || !digitsAt(text, 5, 2, month) || !digitsAt(text, 8, 2, day)) {
        return false;
    }
    if (year == 0 || month < 1 || month > 12 || day < 1) return false;
    static constexpr int kDaysInMonth[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int maxDay = kDaysInMonth[month - 1];
    if (month == 2 && isLeapYear(year)) maxDay = 29;
    return day <= maxDay;
}

void validateCandidate(const Candidate& candidate) {
    if (isBlank(candidate.name)) {
        throw InvalidCandidateError("candidate name must not be empty");
    }
    if (candidate.dateOfBirth && !isIsoDate(*candidate.dateOfBirth)) {
        throw InvalidCandidateError("malformed date of birth '" + *candidate.dateOfBirth + "', expected YYYY-MM-DD");
    }
}

} // namespace sn::core
