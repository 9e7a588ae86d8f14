#include "engine/streak_segmenter.hpp"

#include <stdexcept>

namespace streaks {
namespace engine {

std::vector<int> StreakSegmenter::assign_streak_ids(const std::vector<TimelineEntry>& timeline) {
    validate_order(timeline);

    std::vector<int> ids;
    ids.reserve(timeline.size());

    int current_id = 0;
    for (size_t i = 0; i < timeline.size(); ++i) {
        if (i == 0 || timeline[i].level != timeline[i - 1].level) ++current_id;
        ids.push_back(current_id);
    }
    return ids;
}

std::vector<Streak> StreakSegmenter::segment(const std::string& client_id,
                                             const std::vector<TimelineEntry>& timeline) {
    validate_order(timeline);

    std::vector<Streak> streaks;
    if (timeline.empty()) return streaks;

    Streak current;
    current.client_id = client_id;
    current.streak_id = 1;
    current.level = timeline.front().level;
    current.start_month = timeline.front().month_end;
    current.end_month = timeline.front().month_end;
    current.length = 1;

    for (size_t i = 1; i < timeline.size(); ++i) {
        const auto& entry = timeline[i];
        if (entry.level == current.level) {
            current.end_month = entry.month_end;
            ++current.length;
            continue;
        }

        streaks.push_back(current);

        current.streak_id += 1;
        current.level = entry.level;
        current.start_month = entry.month_end;
        current.end_month = entry.month_end;
        current.length = 1;
    }

    streaks.push_back(current);
    return streaks;
}

void StreakSegmenter::validate_order(const std::vector<TimelineEntry>& timeline) {
    for (size_t i = 1; i < timeline.size(); ++i) {
        if (!(timeline[i - 1].month_end < timeline[i].month_end))
            throw std::invalid_argument("Timeline must be strictly ascending by month: " +
                                        timeline[i - 1].month_end.to_string() + " then " +
                                        timeline[i].month_end.to_string());
    }
}

} // namespace engine
} // namespace streaks
