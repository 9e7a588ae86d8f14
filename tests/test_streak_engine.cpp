/**
 * @file test_streak_engine.cpp
 * @brief End-to-end tests of the per-client streak pipeline
 */

#include <catch2/catch.hpp>
#include "engine/streak_engine.hpp"
#include "data/data_loader.hpp"
#include <set>
#include <stdexcept>

using namespace streaks;
using namespace streaks::engine;

TEST_CASE("StreakParameters validation", "[StreakEngine]") {
    SECTION("Valid parameters") {
        auto p = StreakParameters::create("2024-12-15", 3);
        REQUIRE(p.reference_date == Date(2024, 12, 15));
        REQUIRE(p.min_length == 3);
    }

    SECTION("Malformed reference date") {
        REQUIRE_THROWS_AS(StreakParameters::create("15/12/2024", 3), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::create("2024-02-30", 3), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::create("", 3), std::invalid_argument);
    }

    SECTION("Non-positive minimum length") {
        REQUIRE_THROWS_AS(StreakParameters::create("2024-12-15", 0), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::create("2024-12-15", -1), std::invalid_argument);
    }

    SECTION("Reference date without a complete month before it") {
        REQUIRE_THROWS_AS(StreakParameters::create("0001-01-15", 1), std::invalid_argument);
        REQUIRE_NOTHROW(StreakParameters::create("0001-01-31", 1));
    }

    SECTION("Minimum length text is not coerced") {
        REQUIRE(StreakParameters::parse_min_length("3") == 3);
        REQUIRE(StreakParameters::parse_min_length("12") == 12);
        REQUIRE_THROWS_AS(StreakParameters::parse_min_length("3.5"), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::parse_min_length("abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::parse_min_length("0"), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::parse_min_length("-2"), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::parse_min_length(""), std::invalid_argument);
        REQUIRE_THROWS_AS(StreakParameters::parse_min_length("99999999999"), std::invalid_argument);
    }
}

TEST_CASE("Single client end-to-end example", "[StreakEngine]") {
    BalanceHistory history;
    history.add_observation("C1", Date(2024, 1, 31), 250000);
    history.add_observation("C1", Date(2024, 2, 29), 250000);
    history.add_observation("C1", Date(2024, 3, 31), 400000);
    history.add_observation("C1", Date(2024, 4, 30), 400000);
    history.add_observation("C1", Date(2024, 5, 31), 400000);

    StreakEngine engine(StreakParameters::create("2024-05-31", 3));
    auto result = engine.run(history);

    REQUIRE(result.rows.size() == 1);
    const auto& row = result.rows[0];
    REQUIRE(row.client_id == "C1");
    REQUIRE(row.length == 3);
    REQUIRE(row.end_month == Date(2024, 5, 31));
    REQUIRE(row.level == DebtLevel::N1);

    REQUIRE(result.clients_evaluated == 1);
    REQUIRE(result.clients_excluded == 0);
    REQUIRE(result.months_generated == 5);
    REQUIRE(result.streaks_found == 2);
}

TEST_CASE("Gap months are N0 streaks", "[StreakEngine]") {
    BalanceHistory history;
    history.add_observation("C1", Date(2024, 1, 31), 2000000);
    history.add_observation("C1", Date(2024, 4, 30), 2000000);

    StreakEngine engine(StreakParameters::create("2024-04-30", 1));

    auto runs = engine.client_streaks("C1", history);
    REQUIRE(runs.size() == 3);
    REQUIRE(runs[0].level == DebtLevel::N2);
    REQUIRE(runs[0].length == 1);
    REQUIRE(runs[1].level == DebtLevel::N0);
    REQUIRE(runs[1].length == 2);
    REQUIRE(runs[2].level == DebtLevel::N2);
    REQUIRE(runs[2].length == 1);

    auto best = engine.evaluate_client("C1", history);
    REQUIRE(best.has_value());
    REQUIRE(best->level == DebtLevel::N0);
    REQUIRE(best->length == 2);
    REQUIRE(best->end_month == Date(2024, 3, 31));
}

TEST_CASE("Mid-month reference date ignores the current month", "[StreakEngine]") {
    BalanceHistory history;
    history.add_observation("C1", Date(2024, 9, 30), 600000);
    history.add_observation("C1", Date(2024, 10, 31), 600000);
    history.add_observation("C1", Date(2024, 11, 30), 600000);
    history.add_observation("C1", Date(2024, 12, 31), 600000);

    StreakEngine engine(StreakParameters::create("2024-12-15", 2));
    REQUIRE(engine.resolver().base_month_end() == Date(2024, 11, 30));

    auto best = engine.evaluate_client("C1", history);
    REQUIRE(best.has_value());
    REQUIRE(best->length == 3);
    REQUIRE(best->end_month == Date(2024, 11, 30));
}

TEST_CASE("Withdrawal cuts the timeline", "[StreakEngine]") {
    BalanceHistory history;
    Date month(2024, 1, 31);
    for (int i = 0; i < 10; ++i) {
        history.add_observation("C1", month, 3500000);
        month = month.next_month_end();
    }
    history.add_withdrawal("C1", Date(2024, 7, 1));

    StreakEngine engine(StreakParameters::create("2024-12-15", 1));

    auto timeline = engine.client_timeline("C1", history);
    REQUIRE(timeline.back().month_end == Date(2024, 6, 30));

    auto best = engine.evaluate_client("C1", history);
    REQUIRE(best.has_value());
    REQUIRE(best->level == DebtLevel::N3);
    REQUIRE(best->length == 6);
    REQUIRE(best->end_month == Date(2024, 6, 30));
}

TEST_CASE("Excluded and missing clients", "[StreakEngine]") {
    BalanceHistory history;
    // Only observed after the usable window
    history.add_observation("LATE", Date(2025, 1, 31), 100000);
    // Withdrawn before the first observation
    history.add_observation("GONE", Date(2024, 5, 31), 100000);
    history.add_withdrawal("GONE", Date(2024, 3, 10));
    // Known only to the withdrawal table
    history.add_withdrawal("GHOST", Date(2024, 3, 10));
    // Active client with a qualifying streak
    history.add_observation("OK", Date(2024, 9, 30), 100000);
    history.add_observation("OK", Date(2024, 10, 31), 100000);

    StreakEngine engine(StreakParameters::create("2024-12-15", 2));
    auto result = engine.run(history);

    REQUIRE(result.clients_evaluated == 3);
    REQUIRE(result.clients_excluded == 2);
    REQUIRE(result.rows.size() == 1);
    REQUIRE(result.rows[0].client_id == "OK");
    // September and October observed, November filled in with N0
    REQUIRE(result.rows[0].length == 3);
    REQUIRE(result.rows[0].end_month == Date(2024, 11, 30));

    REQUIRE_FALSE(engine.evaluate_client("GHOST", history).has_value());
    REQUIRE(engine.client_timeline("LATE", history).empty());
}

TEST_CASE("Empty inputs give an empty result", "[StreakEngine]") {
    BalanceHistory history;
    StreakEngine engine(StreakParameters::create("2024-12-15", 3));
    auto result = engine.run(history);
    REQUIRE(result.rows.empty());
    REQUIRE(result.clients_evaluated == 0);
}

TEST_CASE("Tie-break across clients and ordering", "[StreakEngine]") {
    BalanceHistory history;
    // B: N4 for Jan-Mar, N1 for Apr-Jun -> equal length, later end wins (N1)
    history.add_observation("B", Date(2024, 1, 31), 9000000);
    history.add_observation("B", Date(2024, 2, 29), 9000000);
    history.add_observation("B", Date(2024, 3, 31), 9000000);
    history.add_observation("B", Date(2024, 4, 30), 500000);
    history.add_observation("B", Date(2024, 5, 31), 500000);
    history.add_observation("B", Date(2024, 6, 30), 500000);
    // A: only short streaks
    history.add_observation("A", Date(2024, 5, 31), 9000000);
    history.add_observation("A", Date(2024, 6, 30), 500000);

    StreakEngine engine(StreakParameters::create("2024-06-30", 3));
    auto result = engine.run(history);

    REQUIRE(result.rows.size() == 1);
    REQUIRE(result.rows[0].client_id == "B");
    REQUIRE(result.rows[0].level == DebtLevel::N1);
    REQUIRE(result.rows[0].end_month == Date(2024, 6, 30));
}

TEST_CASE("Run invariants on synthetic data", "[StreakEngine]") {
    auto history = DataLoader::generate_synthetic_history(150, Date(2022, 1, 31), 36, 0.2, 0.3, 7);
    auto params = StreakParameters::create("2024-08-20", 4);
    StreakEngine engine(params);

    auto first = engine.run(history);
    auto second = engine.run(history);

    SECTION("Deterministic") {
        REQUIRE(first.rows == second.rows);
        REQUIRE(first.months_generated == second.months_generated);
    }

    SECTION("Rows respect the minimum length, one per client, sorted") {
        std::set<std::string> seen;
        for (size_t i = 0; i < first.rows.size(); ++i) {
            const auto& row = first.rows[i];
            REQUIRE(row.length >= params.min_length);
            REQUIRE(seen.insert(row.client_id).second);
            if (i > 0) REQUIRE(first.rows[i - 1].client_id < row.client_id);
            REQUIRE(row.end_month <= engine.resolver().base_month_end());
        }
    }

    SECTION("Timelines are dense and segmentation is consistent") {
        for (const auto& client : history.clients()) {
            auto timeline = engine.client_timeline(client, history);
            for (size_t i = 1; i < timeline.size(); ++i) {
                REQUIRE(timeline[i].month_end == timeline[i - 1].month_end.next_month_end());
            }

            auto ids = StreakSegmenter::assign_streak_ids(timeline);
            for (size_t i = 1; i < ids.size(); ++i) {
                REQUIRE((ids[i] == ids[i - 1]) == (timeline[i].level == timeline[i - 1].level));
                REQUIRE(ids[i] >= ids[i - 1]);
            }
        }
    }

    SECTION("Selected row is the best qualifying streak") {
        for (const auto& row : first.rows) {
            auto runs = engine.client_streaks(row.client_id, history);
            for (const auto& s : runs) {
                if (s.length < params.min_length) continue;
                bool better = s.length > row.length ||
                              (s.length == row.length && s.end_month > row.end_month);
                REQUIRE_FALSE(better);
            }
        }
    }
}

TEST_CASE("Reference date in the last representable month", "[StreakEngine]") {
    BalanceHistory h;
    h.add_observation("C1", Date(9999, 10, 31), 400000);
    h.add_observation("C1", Date(9999, 11, 30), 500000);
    h.add_observation("C1", Date(9999, 12, 31), 600000);

    StreakEngine engine(StreakParameters::create("9999-12-31", 3));
    auto result = engine.run(h);

    REQUIRE(result.rows.size() == 1);
    REQUIRE(result.rows.front() == StreakResult{"C1", 3, Date(9999, 12, 31), DebtLevel::N1});
}

TEST_CASE("Withdrawal in the first calendar month excludes the client", "[StreakEngine]") {
    BalanceHistory h;
    h.add_observation("C1", Date(1, 1, 31), 400000);
    h.add_observation("C1", Date(1, 2, 28), 400000);
    h.add_withdrawal("C1", Date(1, 1, 10));

    StreakEngine engine(StreakParameters::create("0001-03-31", 1));
    auto result = engine.run(h);

    REQUIRE(result.rows.empty());
    REQUIRE(result.clients_excluded == 1);
}
