#include <catch2/catch.hpp>
#include "engine/cutoff_resolver.hpp"
#include <stdexcept>

using namespace streaks;
using namespace streaks::engine;

TEST_CASE("Base month end from reference date", "[CutoffResolver]") {
    SECTION("Mid-month reference uses the previous month") {
        CutoffResolver r(Date::parse("2024-12-15"));
        REQUIRE(r.base_month_end() == Date(2024, 11, 30));
    }

    SECTION("Month-end reference uses its own month") {
        CutoffResolver r(Date::parse("2024-11-30"));
        REQUIRE(r.base_month_end() == Date(2024, 11, 30));
    }

    SECTION("First day of a month") {
        CutoffResolver r(Date::parse("2024-01-01"));
        REQUIRE(r.base_month_end() == Date(2023, 12, 31));
    }

    SECTION("Leap day is a month end") {
        CutoffResolver r(Date::parse("2024-02-29"));
        REQUIRE(r.base_month_end() == Date(2024, 2, 29));
    }
}

TEST_CASE("Withdrawal bounds the effective end", "[CutoffResolver]") {
    CutoffResolver r(Date::parse("2024-12-15"));

    SECTION("No withdrawal") {
        REQUIRE(r.effective_end(std::nullopt) == Date(2024, 11, 30));
    }

    SECTION("Withdrawal precedes the base month") {
        REQUIRE(CutoffResolver::withdrawal_month_end(Date(2024, 7, 1)) == Date(2024, 6, 30));
        REQUIRE(r.effective_end(Date(2024, 7, 1)) == Date(2024, 6, 30));
        REQUIRE(r.effective_end(Date(2024, 7, 31)) == Date(2024, 6, 30));
    }

    SECTION("Withdrawal after the reference date keeps the base month") {
        REQUIRE(r.effective_end(Date(2025, 3, 10)) == Date(2024, 11, 30));
    }

    SECTION("Withdrawal in the reference month") {
        REQUIRE(r.effective_end(Date(2024, 12, 2)) == Date(2024, 11, 30));
    }
}

TEST_CASE("Client range resolution", "[CutoffResolver]") {
    CutoffResolver r(Date::parse("2024-05-31"));

    SECTION("Normal client") {
        auto range = r.resolve("C1", Date(2024, 1, 31), std::nullopt);
        REQUIRE(range.has_value());
        REQUIRE(range->client_id == "C1");
        REQUIRE(range->first_month == Date(2024, 1, 31));
        REQUIRE(range->effective_end == Date(2024, 5, 31));
    }

    SECTION("Single month window is kept") {
        auto range = r.resolve("C2", Date(2024, 5, 31), std::nullopt);
        REQUIRE(range.has_value());
        REQUIRE(range->first_month == range->effective_end);
    }

    SECTION("Observations after the usable window exclude the client") {
        REQUIRE_FALSE(r.resolve("C3", Date(2024, 6, 30), std::nullopt).has_value());
    }

    SECTION("Withdrawal before the first observation excludes the client") {
        REQUIRE_FALSE(r.resolve("C4", Date(2024, 3, 31), Date(2024, 2, 15)).has_value());
    }

    SECTION("Withdrawal in the first observed month excludes the client") {
        REQUIRE_FALSE(r.resolve("C5", Date(2024, 3, 31), Date(2024, 3, 1)).has_value());
    }
}

TEST_CASE("Calendar boundaries of year 1", "[CutoffResolver]") {
    SECTION("Mid-January reference has no complete month") {
        REQUIRE_THROWS_AS(CutoffResolver(Date(1, 1, 15)), std::invalid_argument);
    }

    SECTION("End of January is its own base month") {
        CutoffResolver r(Date(1, 1, 31));
        REQUIRE(r.base_month_end() == Date(1, 1, 31));
    }

    SECTION("Withdrawal in the first calendar month leaves no active month") {
        CutoffResolver r(Date(1, 3, 31));
        REQUIRE_FALSE(CutoffResolver::withdrawal_month_end(Date(1, 1, 20)).has_value());
        REQUIRE_FALSE(r.effective_end(Date(1, 1, 20)).has_value());
        REQUIRE_FALSE(r.resolve("C1", Date(1, 1, 31), Date(1, 1, 20)).has_value());
    }
}
