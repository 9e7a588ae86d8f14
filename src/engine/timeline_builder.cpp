/**
 * @file timeline_builder.cpp
 * @brief Implementation of TimelineBuilder
 */

#include "engine/timeline_builder.hpp"
#include <stdexcept>

namespace streaks
{
    namespace engine
    {

        std::vector<TimelineEntry> TimelineBuilder::build(const ClientRange &range,
                                                          const BalanceHistory::MonthlyBalances &observations)
        {
            if (!range.first_month.is_month_end() || !range.effective_end.is_month_end())
            {
                throw std::invalid_argument("Client range of " + range.client_id +
                                            " must be bounded by month ends");
            }

            std::vector<TimelineEntry> timeline;
            if (range.first_month > range.effective_end)
                return timeline;

            timeline.reserve(count_months(range.first_month, range.effective_end));

            // Each step moves exactly one calendar month. Never step past the
            // inclusive end, which may be the last representable month.
            Date month = range.first_month;
            while (true)
            {
                TimelineEntry entry;
                entry.month_end = month;

                auto it = observations.find(month);
                if (it != observations.end())
                {
                    entry.level = classify_balance(it->second);
                    entry.observed = true;
                }

                timeline.push_back(entry);

                if (month >= range.effective_end)
                    break;
                month = month.next_month_end();
            }

            return timeline;
        }

        size_t TimelineBuilder::count_months(const Date &first, const Date &last)
        {
            if (first > last)
                return 0;

            long span = (static_cast<long>(last.year) - first.year) * 12 + (last.month - first.month);
            return static_cast<size_t>(span + 1);
        }

    } // namespace engine
} // namespace streaks
