#pragma once

#include "engine/debt_level.hpp"
#include "engine/timeline_builder.hpp"

#include <string>
#include <vector>

namespace streaks {
namespace engine {

// Maximal run of consecutive months at one debt level.
struct Streak {
    std::string client_id;
    int streak_id{0};
    DebtLevel level{kDefaultLevel};
    Date start_month;
    Date end_month;
    int length{0};
};

class StreakSegmenter {
public:
    // One id per timeline entry. Ids start at 1 and grow by one at every
    // level change, so equal neighbours share an id.
    static std::vector<int> assign_streak_ids(const std::vector<TimelineEntry>& timeline);

    // Run-length encodes a client's timeline in a single forward pass.
    // The timeline must be strictly ascending by month.
    static std::vector<Streak> segment(const std::string& client_id,
                                       const std::vector<TimelineEntry>& timeline);

private:
    static void validate_order(const std::vector<TimelineEntry>& timeline);
};

} // namespace engine
} // namespace streaks
