#include "engine/streak_selector.hpp"

#include <stdexcept>
#include <string>

namespace streaks {
namespace engine {

StreakSelector::StreakSelector(int min_length) : min_length_(min_length) {
    if (min_length_ < 1)
        throw std::invalid_argument("Minimum streak length must be positive, got " +
                                    std::to_string(min_length_));
}

bool StreakSelector::qualifies(const Streak& streak) const {
    return streak.length >= min_length_;
}

bool StreakSelector::is_preferred(const Streak& candidate, const Streak& incumbent) {
    if (candidate.length != incumbent.length) return candidate.length > incumbent.length;
    return candidate.end_month > incumbent.end_month;
}

std::optional<Streak> StreakSelector::select(const std::vector<Streak>& streaks) const {
    std::optional<Streak> best;
    for (const auto& s : streaks) {
        if (!qualifies(s)) continue;
        if (!best || is_preferred(s, *best)) best = s;
    }
    return best;
}

} // namespace engine
} // namespace streaks
