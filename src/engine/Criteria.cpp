#include "engine/Criteria.hpp"

#include "engine/TorrentUtils.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace sw::engine
{

namespace
{

constexpr long long kSecondsPerDay = 86400;

bool is_space(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

std::string_view trim(std::string_view value) noexcept
{
    while (!value.empty() && is_space(value.front()))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_space(value.back()))
    {
        value.remove_suffix(1);
    }
    return value;
}

std::vector<std::string_view> split_tokens(std::string_view group)
{
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < group.size())
    {
        while (pos < group.size() && is_space(group[pos]))
        {
            ++pos;
        }
        auto start = pos;
        while (pos < group.size() && !is_space(group[pos]))
        {
            ++pos;
        }
        if (pos > start)
        {
            tokens.push_back(group.substr(start, pos - start));
        }
    }
    return tokens;
}

Condition parse_condition(std::string_view token)
{
    Condition condition;
    condition.token = std::string(token);
    if (auto duration = parse_duration(token))
    {
        condition.kind = Condition::Kind::MinSeedingDuration;
        condition.duration = *duration;
        return condition;
    }
    if (auto ratio = parse_ratio(token))
    {
        condition.kind = Condition::Kind::MinRatio;
        condition.ratio = *ratio;
        return condition;
    }
    throw InvalidCriteriaError(
        std::format("invalid deletion criteria token '{}': expected a duration "
                    "like 30d/2m/1y or a ratio like 2.0",
                    token),
        std::string(token));
}

} // namespace

bool Condition::holds(std::chrono::seconds seeding,
                      double current_ratio) const noexcept
{
    switch (kind)
    {
    case Kind::MinSeedingDuration:
        return seeding >= duration;
    case Kind::MinRatio:
    default:
        return current_ratio >= ratio;
    }
}

bool Rule::matches(std::chrono::seconds seeding, double ratio) const noexcept
{
    if (conditions.empty())
    {
        return false;
    }
    for (auto const &condition : conditions)
    {
        if (!condition.holds(seeding, ratio))
        {
            return false;
        }
    }
    return true;
}

std::string Rule::label() const
{
    std::string result;
    for (auto const &condition : conditions)
    {
        if (!result.empty())
        {
            result += " AND ";
        }
        result += condition.token;
    }
    return result;
}

bool CriteriaSet::matches(std::chrono::seconds seeding,
                          double ratio) const noexcept
{
    for (auto const &rule : rules)
    {
        if (rule.matches(seeding, ratio))
        {
            return true;
        }
    }
    return false;
}

CriteriaExplanation CriteriaSet::explain(std::chrono::seconds seeding,
                                         double ratio) const
{
    CriteriaExplanation result;
    auto const age = format_duration(seeding);
    for (auto const &rule : rules)
    {
        std::string details;
        for (auto const &condition : rule.conditions)
        {
            if (!details.empty())
            {
                details += ", ";
            }
            bool const ok = condition.holds(seeding, ratio);
            if (condition.kind == Condition::Kind::MinSeedingDuration)
            {
                details += std::format("age {} {} {}", age, ok ? ">=" : "<",
                                       condition.token);
            }
            else
            {
                details += std::format("ratio {:.2f} {} {}", ratio,
                                       ok ? ">=" : "<", condition.token);
            }
        }
        bool const passed = rule.matches(seeding, ratio);
        result.lines.push_back(std::format("Rule [{}]: {} ({})", rule.label(),
                                           passed ? "PASS" : "FAIL", details));
        if (passed)
        {
            result.matched = true;
            break;
        }
    }
    return result;
}

std::optional<std::chrono::seconds> parse_duration(std::string_view token)
{
    if (token.size() < 2)
    {
        return std::nullopt;
    }
    long long days_per_unit = 0;
    switch (token.back())
    {
    case 'd':
    case 'D':
        days_per_unit = 1;
        break;
    case 'm':
    case 'M':
        days_per_unit = 30;
        break;
    case 'y':
    case 'Y':
        days_per_unit = 365;
        break;
    default:
        return std::nullopt;
    }
    auto digits = token.substr(0, token.size() - 1);
    for (char ch : digits)
    {
        if (ch < '0' || ch > '9')
        {
            return std::nullopt;
        }
    }
    long long amount = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), amount);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    constexpr auto kMax = std::numeric_limits<long long>::max();
    if (amount > kMax / (days_per_unit * kSecondsPerDay))
    {
        return std::nullopt;
    }
    return std::chrono::seconds(amount * days_per_unit * kSecondsPerDay);
}

std::optional<double> parse_ratio(std::string_view token)
{
    if (token.empty())
    {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size())
    {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value < 0.0)
    {
        return std::nullopt;
    }
    return value;
}

CriteriaSet parse_criteria(std::string_view text)
{
    CriteriaSet result;
    if (trim(text).empty())
    {
        return result;
    }
    std::size_t start = 0;
    while (true)
    {
        auto const bar = text.find('|', start);
        auto const group = text.substr(
            start, bar == std::string_view::npos ? std::string_view::npos
                                                 : bar - start);
        auto tokens = split_tokens(group);
        if (tokens.empty())
        {
            throw InvalidCriteriaError(
                std::format("invalid deletion criteria '{}': empty rule group",
                            trim(text)),
                std::string());
        }
        Rule rule;
        rule.conditions.reserve(tokens.size());
        for (auto token : tokens)
        {
            rule.conditions.push_back(parse_condition(token));
        }
        result.rules.push_back(std::move(rule));
        if (bar == std::string_view::npos)
        {
            break;
        }
        start = bar + 1;
    }
    return result;
}

std::string describe(CriteriaSet const &criteria)
{
    if (criteria.empty())
    {
        return "(none)";
    }
    std::string result;
    for (auto const &rule : criteria.rules)
    {
        if (!result.empty())
        {
            result += " OR ";
        }
        result += "[" + rule.label() + "]";
    }
    return result;
}

} // namespace sw::engine
