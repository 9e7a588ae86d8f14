#pragma once

#include <array>
#include <iostream>
#include <string>
#include <vector>
#include "engine/streak_engine.hpp"

namespace streaks {
namespace report {

struct StreakSummary {
    int total_clients = 0;
    std::array<int, 5> clients_per_level{};  // indexed by DebtLevel
    int longest_streak = 0;
    double avg_streak_length = 0.0;
};

// Output table of a run: one row per qualifying client, ordered by id.
class StreakReport {
public:
    StreakReport() = default;
    explicit StreakReport(std::vector<engine::StreakResult> rows);
    ~StreakReport() = default;

    const std::vector<engine::StreakResult>& rows() const { return rows_; }
    StreakSummary get_summary() const;

    void export_to_csv(const std::string& filepath) const;
    void write_csv(std::ostream& out) const;

    void print_top(size_t limit, std::ostream& out = std::cout) const;
    void print_summary(std::ostream& out = std::cout) const;

private:
    std::vector<engine::StreakResult> rows_;
};

} // namespace report
} // namespace streaks
