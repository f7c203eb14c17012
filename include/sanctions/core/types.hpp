#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sn::core {

enum class EntityType : std::uint8_t { Individual = 0, Organization = 1 };
enum class MatchStrategy : std::uint8_t { Exact = 0, Fuzzy = 1, Semantic = 2 };
enum class Decision : std::uint8_t { Clear = 0, Review = 1, Block = 2 };

enum class MatchedField : std::uint8_t {
    Name           = 1u << 0,
    DateOfBirth    = 1u << 1,
    Nationality    = 1u << 2,
    PassportNumber = 1u << 3
};

using RecordId = std::uint64_t;
using Latency = std::chrono::microseconds;

// Small bit set over MatchedField
class MatchedFields final {
public:
    constexpr MatchedFields() noexcept = default;

    constexpr void set(MatchedField field) noexcept { bits_ |= static_cast<std::uint8_t>(field); }
    [[nodiscard]] constexpr bool contains(MatchedField field) const noexcept {
        return (bits_ & static_cast<std::uint8_t>(field)) != 0;
    }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr std::uint8_t bits() const noexcept { return bits_; }

    // Field names in declaration order, e.g. {"name", "date_of_birth"}
    std::vector<std::string> names() const;

    friend constexpr bool operator==(MatchedFields a, MatchedFields b) noexcept { return a.bits_ == b.bits_; }
    friend constexpr bool operator!=(MatchedFields a, MatchedFields b) noexcept { return a.bits_ != b.bits_; }

private:
    std::uint8_t bits_{0};
};

struct Candidate final {
    std::string name;
    std::vector<std::string> aliases;
    std::optional<std::string> dateOfBirth; // YYYY-MM-DD
    std::optional<std::string> nationality;
    std::optional<std::string> documentNumber;
    EntityType type{EntityType::Individual};
};

struct WatchlistRecord final {
    RecordId id{0};
    std::string listName;
    std::string source;   // issuing authority, e.g. "OFAC"
    std::string country;
    std::string name;
    std::vector<std::string> aliases;
    std::optional<std::string> dateOfBirth;
    std::optional<std::string> nationality;
    std::optional<std::string> documentNumber;
    EntityType type{EntityType::Individual};
    std::string designationDate;
    std::string reason;
    bool active{true};
};

struct MatchFinding final {
    WatchlistRecord record;          // snapshot copy, kept for audit
    MatchedFields matchedFields{};
    MatchStrategy strategy{MatchStrategy::Fuzzy};
    double confidence{0.0};
    double riskContribution{0.0};
};

struct ScreeningSummary final {
    std::size_t totalFindings{0};
    std::vector<MatchStrategy> strategies; // distinct, ascending
    std::vector<std::string> sources;      // distinct, sorted
};

struct ScreeningResult final {
    Candidate candidate;
    std::vector<MatchFinding> findings; // descending by risk contribution
    double riskScore{0.0};
    Decision decision{Decision::Clear};
    double confidence{1.0};
    Latency latency{0};
    ScreeningSummary summary;
};

constexpr const char* toString(Decision d) noexcept {
    switch (d) {
        case Decision::Clear:  return "clear";
        case Decision::Review: return "review";
        case Decision::Block:  return "block";
    }
    return "unknown";
}

constexpr const char* toString(MatchStrategy s) noexcept {
    switch (s) {
        case MatchStrategy::Exact:    return "exact";
        case MatchStrategy::Fuzzy:    return "fuzzy";
        case MatchStrategy::Semantic: return "semantic";
    }
    return "unknown";
}

constexpr const char* toString(EntityType t) noexcept {
    switch (t) {
        case EntityType::Individual:   return "individual";
        case EntityType::Organization: return "organization";
    }
    return "unknown";
}

inline std::vector<std::string> MatchedFields::names() const {
    std::vector<std::string> out;
    if (contains(MatchedField::Name)) out.emplace_back("name");
    if (contains(MatchedField::DateOfBirth)) out.emplace_back("date_of_birth");
    if (contains(MatchedField::Nationality)) out.emplace_back("nationality");
    if (contains(MatchedField::PassportNumber)) out.emplace_back("passport_number");
    return out;
}

} // namespace sn::core
