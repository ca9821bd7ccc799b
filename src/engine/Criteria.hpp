#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sw::engine
{

// Raised for a malformed deletion criteria definition. token() is the
// offending piece of input (empty for a structural problem such as an empty
// rule group).
class InvalidCriteriaError : public std::runtime_error
{
  public:
    InvalidCriteriaError(std::string const &message, std::string token)
        : std::runtime_error(message), token_(std::move(token))
    {
    }

    std::string const &token() const noexcept
    {
        return token_;
    }

  private:
    std::string token_;
};

struct Condition
{
    enum class Kind
    {
        MinSeedingDuration,
        MinRatio,
    };

    Kind kind = Kind::MinRatio;
    std::chrono::seconds duration{0};
    double ratio = 0.0;
    std::string token;

    bool holds(std::chrono::seconds seeding, double current_ratio) const noexcept;
};

struct Rule
{
    std::vector<Condition> conditions;

    // An empty rule never matches.
    bool matches(std::chrono::seconds seeding, double ratio) const noexcept;
    std::string label() const;
};

struct CriteriaExplanation
{
    bool matched = false;
    std::vector<std::string> lines;
};

// OR over rules, AND within a rule.
struct CriteriaSet
{
    std::vector<Rule> rules;

    bool empty() const noexcept
    {
        return rules.empty();
    }
    bool matches(std::chrono::seconds seeding, double ratio) const noexcept;

    // One PASS/FAIL line per rule evaluated, stopping at the first rule that
    // passes.
    CriteriaExplanation explain(std::chrono::seconds seeding,
                                double ratio) const;
};

// Integer followed by d, m or y (any case). Month = 30 days, year = 365
// days. nullopt for anything else, including values that would overflow.
std::optional<std::chrono::seconds> parse_duration(std::string_view token);

// Finite, non-negative decimal consumed in full.
std::optional<double> parse_ratio(std::string_view token);

// "30d 2.0 | 10d 0.5" -> two rules. Blank input yields an empty set.
// Throws InvalidCriteriaError.
CriteriaSet parse_criteria(std::string_view text);

// "[30d AND 2.0] OR [10d AND 0.5]", or "(none)" for an empty set.
std::string describe(CriteriaSet const &criteria);

} // namespace sw::engine
