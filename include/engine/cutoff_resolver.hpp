/**
 * @file cutoff_resolver.hpp
 * @brief Per-client observation window resolution
 *
 * Determines the range of months a client contributes to the streak
 * computation: from the first observed month up to the "effective end",
 * which is bounded by the last complete month before the reference date
 * and, for withdrawn clients, by the month before the withdrawal.
 */

#pragma once

#include "data/calendar.hpp"
#include <optional>
#include <string>

namespace streaks
{
    namespace engine
    {

        /**
         * @struct ClientRange
         * @brief Inclusive month window of one client
         *
         * Invariant: first_month <= effective_end, both month ends.
         */
        struct ClientRange
        {
            std::string client_id;
            Date first_month;
            Date effective_end;
        };

        /**
         * @class CutoffResolver
         * @brief Computes effective end months against a fixed reference date
         *
         * Usage Example:
         * @code
         * CutoffResolver resolver(Date::parse("2024-12-15"));
         * resolver.base_month_end();  // 2024-11-30
         * auto range = resolver.resolve("C1", Date(2024, 1, 31), std::nullopt);
         * @endcode
         */
        class CutoffResolver
        {
        public:
            /**
             * @brief Constructor
             * @param reference_date Reference date of the run (fecha_base)
             * @throws std::invalid_argument if no complete month precedes it
             */
            explicit CutoffResolver(const Date &reference_date);

            /**
             * @brief Last complete month relative to the reference date
             *
             * The reference month itself only counts when the reference date
             * is its last day; otherwise this is the previous month's end.
             */
            const Date &base_month_end() const { return base_month_end_; }

            /**
             * @brief Last active month of a withdrawn client
             * @param withdrawal_date Withdrawal date (fecha_retiro)
             * @return Last day of the month preceding the withdrawal month, or
             *         empty when the withdrawal falls in January of year 1
             */
            static std::optional<Date> withdrawal_month_end(const Date &withdrawal_date);

            /**
             * @brief Last month a client may be considered
             * @param withdrawal_date Optional withdrawal date
             * @return min(base_month_end, withdrawal_month_end); empty when the
             *         client has no active month at all
             */
            std::optional<Date> effective_end(const std::optional<Date> &withdrawal_date) const;

            /**
             * @brief Resolve the month window of one client
             * @param client_id Client identifier
             * @param first_month Earliest observed month end
             * @param withdrawal_date Optional withdrawal date
             * @return The window, or empty when first_month > effective_end
             */
            std::optional<ClientRange> resolve(const std::string &client_id,
                                               const Date &first_month,
                                               const std::optional<Date> &withdrawal_date) const;

        private:
            Date base_month_end_;
        };

    } // namespace engine
} // namespace streaks
