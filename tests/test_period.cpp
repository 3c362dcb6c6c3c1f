#include <catch2/catch_test_macros.hpp>
#include "slipsort/batch/Period.hpp"

using slipsort::Period;

TEST_CASE("Period - Parsing", "[period]")
{
    std::string error;

    SECTION("Month is zero padded")
    {
        auto period = Period::parse("2024", "3", error);
        REQUIRE(period.has_value());
        REQUIRE(period->month == "03");
        REQUIRE(period->year == "2024");
        REQUIRE(period->label() == "03-2024");
    }

    SECTION("Two digit month kept")
    {
        auto period = Period::parse("2023", "12", error);
        REQUIRE(period.has_value());
        REQUIRE(period->label() == "12-2023");
    }

    SECTION("Invalid months rejected")
    {
        REQUIRE_FALSE(Period::parse("2024", "0", error).has_value());
        REQUIRE_FALSE(Period::parse("2024", "13", error).has_value());
        REQUIRE_FALSE(Period::parse("2024", "", error).has_value());
        REQUIRE_FALSE(Period::parse("2024", "ab", error).has_value());
        REQUIRE_FALSE(Period::parse("2024", "003", error).has_value());
        REQUIRE(error.find("Month") != std::string::npos);
    }

    SECTION("Invalid years rejected")
    {
        REQUIRE_FALSE(Period::parse("24", "03", error).has_value());
        REQUIRE_FALSE(Period::parse("20x4", "03", error).has_value());
        REQUIRE(error.find("Year") != std::string::npos);
    }
}

TEST_CASE("Period - Current", "[period]")
{
    Period period = Period::current();
    REQUIRE(period.year.size() == 4);
    REQUIRE(period.month.size() == 2);

    std::string error;
    REQUIRE(Period::parse(period.year, period.month, error).has_value());
}
