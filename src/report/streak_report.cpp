/**
 * @file streak_report.cpp
 * @brief Implementation of StreakReport
 */

#include "report/streak_report.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace streaks {
namespace report {

StreakReport::StreakReport(std::vector<engine::StreakResult> rows)
    : rows_(std::move(rows))
{
}

StreakSummary StreakReport::get_summary() const
{
    StreakSummary s;
    s.total_clients = static_cast<int>(rows_.size());

    long long total_length = 0;
    for (const auto &r : rows_)
    {
        s.clients_per_level[static_cast<size_t>(r.level)] += 1;
        s.longest_streak = std::max(s.longest_streak, r.length);
        total_length += r.length;
    }

    if (s.total_clients > 0)
        s.avg_streak_length = static_cast<double>(total_length) / s.total_clients;

    return s;
}

void StreakReport::export_to_csv(const std::string &filepath) const
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    write_csv(file);
}

void StreakReport::write_csv(std::ostream &out) const
{
    out << "identificacion,racha,fecha_fin,nivel\n";
    for (const auto &r : rows_)
    {
        out << r.client_id << ","
            << r.length << ","
            << r.end_month << ","
            << engine::to_string(r.level) << "\n";
    }
}

void StreakReport::print_top(size_t limit, std::ostream &out) const
{
    size_t shown = std::min(limit, rows_.size());

    out << "\n" << std::string(80, '=') << "\n";
    out << "RESULTS: top " << shown << " streaks (of " << rows_.size() << " total)\n";
    out << std::string(80, '=') << "\n";

    for (size_t i = 0; i < shown; ++i)
    {
        const auto &r = rows_[i];
        out << "  " << std::setw(20) << std::left << r.client_id << std::right
            << " | streak: " << std::setw(2) << r.length << " months"
            << " | end: " << r.end_month
            << " | level: " << engine::to_string(r.level) << "\n";
    }

    if (rows_.size() > shown)
    {
        out << "  ... and " << (rows_.size() - shown) << " more clients\n";
    }

    out << std::string(80, '=') << "\n";
}

void StreakReport::print_summary(std::ostream &out) const
{
    auto s = get_summary();
    out << "\n=== Streak Summary ===\n";
    out << "Qualifying clients: " << s.total_clients << "\n";
    for (size_t i = 0; i < s.clients_per_level.size(); ++i)
    {
        out << "  " << engine::to_string(static_cast<engine::DebtLevel>(i)) << ": "
            << s.clients_per_level[i] << "\n";
    }
    out << "Longest streak: " << s.longest_streak << " months\n";
    out << "Average streak: " << std::fixed << std::setprecision(2)
        << s.avg_streak_length << " months\n";
    out << "======================\n";
}

} // namespace report
} // namespace streaks
