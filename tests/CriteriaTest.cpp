#include "engine/Criteria.hpp"

#include <chrono>
#include <string>

#include <doctest/doctest.h>

namespace
{

std::chrono::seconds days(long long count)
{
    return std::chrono::seconds(count * 86400);
}

} // namespace

TEST_CASE("parse_duration understands days months and years")
{
    using sw::engine::parse_duration;
    CHECK(parse_duration("30d") == days(30));
    CHECK(parse_duration("30D") == days(30));
    CHECK(parse_duration("2m") == days(60));
    CHECK(parse_duration("1y") == days(365));
    CHECK(parse_duration("0d") == days(0));

    CHECK_FALSE(parse_duration("d"));
    CHECK_FALSE(parse_duration("30"));
    CHECK_FALSE(parse_duration("30h"));
    CHECK_FALSE(parse_duration("-3d"));
    CHECK_FALSE(parse_duration("1.5d"));
    CHECK_FALSE(parse_duration("99999999999999999999d"));
}

TEST_CASE("parse_ratio rejects negative and partial values")
{
    using sw::engine::parse_ratio;
    CHECK(parse_ratio("2.0").value() == doctest::Approx(2.0));
    CHECK(parse_ratio("0").value() == doctest::Approx(0.0));
    CHECK(parse_ratio("0.75").value() == doctest::Approx(0.75));

    CHECK_FALSE(parse_ratio(""));
    CHECK_FALSE(parse_ratio("-1.0"));
    CHECK_FALSE(parse_ratio("2.0x"));
    CHECK_FALSE(parse_ratio("abc"));
    CHECK_FALSE(parse_ratio("inf"));
    CHECK_FALSE(parse_ratio("nan"));
}

TEST_CASE("criteria are OR of rules and AND within a rule")
{
    auto criteria = sw::engine::parse_criteria("30d 2.0 | 10d 0.5");
    REQUIRE(criteria.rules.size() == 2);
    CHECK(criteria.rules[0].conditions.size() == 2);
    CHECK(criteria.rules[1].conditions.size() == 2);

    auto ratio_only = sw::engine::parse_criteria("0.5");
    REQUIRE(ratio_only.rules.size() == 1);
    REQUIRE(ratio_only.rules[0].conditions.size() == 1);
    CHECK(ratio_only.rules[0].conditions[0].kind ==
          sw::engine::Condition::Kind::MinRatio);

    CHECK(criteria.matches(days(40), 2.5));
    CHECK(criteria.matches(days(12), 0.6));
    CHECK_FALSE(criteria.matches(days(40), 0.4));
    CHECK_FALSE(criteria.matches(days(5), 3.0));
    // Thresholds are inclusive.
    CHECK(criteria.matches(days(10), 0.5));
}

TEST_CASE("single condition rules and order independence")
{
    auto age_only = sw::engine::parse_criteria("7d");
    CHECK(age_only.matches(days(7), 0.0));
    CHECK_FALSE(age_only.matches(days(6), 100.0));

    auto swapped = sw::engine::parse_criteria("2.0 30d");
    auto ordered = sw::engine::parse_criteria("30d 2.0");
    for (auto age : {days(10), days(30), days(45)})
    {
        for (double ratio : {0.5, 2.0, 3.0})
        {
            CHECK(swapped.matches(age, ratio) == ordered.matches(age, ratio));
        }
    }
}

TEST_CASE("blank criteria never match")
{
    auto criteria = sw::engine::parse_criteria("   ");
    CHECK(criteria.empty());
    CHECK_FALSE(criteria.matches(days(10000), 1000.0));
    CHECK(sw::engine::describe(criteria) == "(none)");
}

TEST_CASE("malformed criteria raise with the offending token")
{
    using sw::engine::InvalidCriteriaError;
    using sw::engine::parse_criteria;

    try
    {
        parse_criteria("30d 2.0 | 7w");
        FAIL("expected InvalidCriteriaError");
    }
    catch (InvalidCriteriaError const &error)
    {
        CHECK(error.token() == "7w");
        CHECK(std::string(error.what()).find("7w") != std::string::npos);
    }

    CHECK_THROWS_AS(parse_criteria("30d |"), InvalidCriteriaError);
    CHECK_THROWS_AS(parse_criteria("| 2.0"), InvalidCriteriaError);
    CHECK_THROWS_AS(parse_criteria("30d || 2.0"), InvalidCriteriaError);
    CHECK_THROWS_AS(parse_criteria("-1.0"), InvalidCriteriaError);

    try
    {
        parse_criteria("30d || 2.0");
    }
    catch (InvalidCriteriaError const &error)
    {
        CHECK(error.token().empty());
    }
}

TEST_CASE("explain stops at the first passing rule")
{
    auto criteria = sw::engine::parse_criteria("30d 2.0 | 10d 0.5 | 1d");
    auto result = criteria.explain(days(40), 1.0);
    CHECK(result.matched);
    REQUIRE(result.lines.size() == 2);
    CHECK(result.lines[0].rfind("Rule [30d AND 2.0]: FAIL", 0) == 0);
    CHECK(result.lines[0].find("ratio 1.00 < 2.0") != std::string::npos);
    CHECK(result.lines[1].rfind("Rule [10d AND 0.5]: PASS", 0) == 0);

    auto none = criteria.explain(std::chrono::seconds(3600), 0.1);
    CHECK_FALSE(none.matched);
    CHECK(none.lines.size() == 3);

    CHECK(sw::engine::describe(criteria) ==
          "[30d AND 2.0] OR [10d AND 0.5] OR [1d]");
}
