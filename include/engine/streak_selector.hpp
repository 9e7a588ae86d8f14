#pragma once

#include "engine/streak_segmenter.hpp"

#include <optional>
#include <vector>

namespace streaks {
namespace engine {

class StreakSelector {
public:
    explicit StreakSelector(int min_length);
    ~StreakSelector() = default;

    bool qualifies(const Streak& streak) const;

    // Longest streak wins; on equal length the later end month wins.
    static bool is_preferred(const Streak& candidate, const Streak& incumbent);

    // Best qualifying streak of one client, empty if none reaches min_length.
    std::optional<Streak> select(const std::vector<Streak>& streaks) const;

private:
    int min_length_;
};

} // namespace engine
} // namespace streaks
