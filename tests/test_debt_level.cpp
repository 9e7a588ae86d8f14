#include <catch2/catch.hpp>
#include "engine/debt_level.hpp"
#include <sstream>

using namespace streaks::engine;

TEST_CASE("Balance classification thresholds", "[DebtLevel]") {
    REQUIRE(classify_balance(0) == DebtLevel::N0);
    REQUIRE(classify_balance(299999) == DebtLevel::N0);
    REQUIRE(classify_balance(300000) == DebtLevel::N1);
    REQUIRE(classify_balance(999999) == DebtLevel::N1);
    REQUIRE(classify_balance(1000000) == DebtLevel::N2);
    REQUIRE(classify_balance(2999999) == DebtLevel::N2);
    REQUIRE(classify_balance(3000000) == DebtLevel::N3);
    REQUIRE(classify_balance(4999999) == DebtLevel::N3);
    REQUIRE(classify_balance(5000000) == DebtLevel::N4);
    REQUIRE(classify_balance(250000000) == DebtLevel::N4);
}

TEST_CASE("Default level is N0", "[DebtLevel]") {
    REQUIRE(kDefaultLevel == DebtLevel::N0);
}

TEST_CASE("Debt level text form", "[DebtLevel]") {
    REQUIRE(to_string(DebtLevel::N0) == "N0");
    REQUIRE(to_string(DebtLevel::N2) == "N2");
    REQUIRE(to_string(DebtLevel::N4) == "N4");

    std::ostringstream out;
    out << DebtLevel::N3;
    REQUIRE(out.str() == "N3");
}
