/**
 * @file timeline_builder.hpp
 * @brief Dense monthly timeline reconstruction from sparse observations
 */

#pragma once

#include "data/balance_history.hpp"
#include "engine/cutoff_resolver.hpp"
#include "engine/debt_level.hpp"
#include <vector>

namespace streaks
{
    namespace engine
    {

        /**
         * @struct TimelineEntry
         * @brief Debt level of one client in one calendar month
         */
        struct TimelineEntry
        {
            Date month_end;
            DebtLevel level = kDefaultLevel;
            bool observed = false; ///< false when the level is the N0 fill-in
        };

        /**
         * @class TimelineBuilder
         * @brief Expands a client range into one entry per calendar month
         *
         * Months with an observation are classified from the balance; months
         * without one take the default level (N0). The result is strictly
         * ascending with no gaps between first_month and effective_end.
         */
        class TimelineBuilder
        {
        public:
            /**
             * @brief Build the timeline of one client
             * @param range Resolved month window
             * @param observations Observed balances of that client by month end
             * @return Entries for every month of the window, oldest first
             * @throws std::invalid_argument if the range bounds are not month ends
             */
            static std::vector<TimelineEntry> build(const ClientRange &range,
                                                    const BalanceHistory::MonthlyBalances &observations);

            /**
             * @brief Number of calendar months in [first, last], 0 if first > last
             */
            static size_t count_months(const Date &first, const Date &last);
        };

    } // namespace engine
} // namespace streaks
