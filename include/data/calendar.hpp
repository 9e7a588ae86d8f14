/**
 * @file calendar.hpp
 * @brief Calendar date value type and month-end arithmetic.
 *
 * Dates are plain (year, month, day) triples with no time zone. All
 * month stepping works on month ends, which is the only granularity the
 * streak engine needs.
 */

#ifndef STREAKS_DATA_CALENDAR_HPP
#define STREAKS_DATA_CALENDAR_HPP

#include <string>
#include <ostream>

namespace streaks
{
    /**
     * @brief True for Gregorian leap years.
     */
    bool is_leap_year(int year);

    /**
     * @brief Number of days in a month (1-12).
     * @throws std::invalid_argument if month is outside 1-12
     */
    int days_in_month(int year, int month);

    /**
     * @struct Date
     * @brief Calendar date with ISO (YYYY-MM-DD) text form.
     */
    struct Date
    {
        int year = 1970;
        int month = 1;
        int day = 1;

        Date() = default;

        /**
         * @brief Construct and validate.
         * @throws std::invalid_argument if the triple is not a real date
         */
        Date(int y, int m, int d);

        /**
         * @brief Parse a strict YYYY-MM-DD string.
         * @throws std::invalid_argument on malformed or impossible dates
         */
        static Date parse(const std::string &iso);

        /**
         * @brief Check a (year, month, day) triple without throwing.
         */
        static bool is_valid(int y, int m, int d);

        std::string to_string() const;

        bool is_month_end() const;

        /** Last day of this date's month. */
        Date month_end() const;

        /** Last day of the month before this date's month. */
        Date previous_month_end() const;

        /** False only in January of year 1, which has no month before it. */
        bool has_previous_month() const;

        /** Last day of the month after this date's month. */
        Date next_month_end() const;

        bool operator==(const Date &other) const;
        bool operator!=(const Date &other) const;
        bool operator<(const Date &other) const;
        bool operator<=(const Date &other) const;
        bool operator>(const Date &other) const;
        bool operator>=(const Date &other) const;
    };

    std::ostream &operator<<(std::ostream &os, const Date &date);

} // namespace streaks

#endif // STREAKS_DATA_CALENDAR_HPP
