/**
 * @file calendar.cpp
 * @brief Implementation of Date and month-end helpers
 */

#include "data/calendar.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <tuple>

namespace streaks
{

    bool is_leap_year(int year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    int days_in_month(int year, int month)
    {
        static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

        if (month < 1 || month > 12)
        {
            throw std::invalid_argument("Invalid month: " + std::to_string(month));
        }

        if (month == 2 && is_leap_year(year))
            return 29;

        return kDays[month - 1];
    }

    Date::Date(int y, int m, int d)
        : year(y), month(m), day(d)
    {
        if (!is_valid(y, m, d))
        {
            throw std::invalid_argument("Invalid date: " + std::to_string(y) + "-" +
                                        std::to_string(m) + "-" + std::to_string(d));
        }
    }

    bool Date::is_valid(int y, int m, int d)
    {
        if (y < 1 || y > 9999)
            return false;
        if (m < 1 || m > 12)
            return false;
        return d >= 1 && d <= days_in_month(y, m);
    }

    Date Date::parse(const std::string &iso)
    {
        // Simple check for YYYY-MM-DD format
        if (iso.length() != 10 || iso[4] != '-' || iso[7] != '-')
        {
            throw std::invalid_argument("Date must be in YYYY-MM-DD format: '" + iso + "'");
        }

        for (size_t i = 0; i < iso.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(iso[i])))
            {
                throw std::invalid_argument("Date must be in YYYY-MM-DD format: '" + iso + "'");
            }
        }

        int y = std::stoi(iso.substr(0, 4));
        int m = std::stoi(iso.substr(5, 2));
        int d = std::stoi(iso.substr(8, 2));

        if (!is_valid(y, m, d))
        {
            throw std::invalid_argument("Not a calendar date: '" + iso + "'");
        }

        return Date(y, m, d);
    }

    std::string Date::to_string() const
    {
        char buffer[11];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
        return std::string(buffer);
    }

    bool Date::is_month_end() const
    {
        return day == days_in_month(year, month);
    }

    Date Date::month_end() const
    {
        return Date(year, month, days_in_month(year, month));
    }

    Date Date::previous_month_end() const
    {
        int y = year;
        int m = month - 1;
        if (m == 0)
        {
            m = 12;
            --y;
        }
        return Date(y, m, days_in_month(y, m));
    }

    bool Date::has_previous_month() const
    {
        return year > 1 || month > 1;
    }

    Date Date::next_month_end() const
    {
        int y = year;
        int m = month + 1;
        if (m == 13)
        {
            m = 1;
            ++y;
        }
        return Date(y, m, days_in_month(y, m));
    }

    bool Date::operator==(const Date &other) const
    {
        return year == other.year && month == other.month && day == other.day;
    }

    bool Date::operator!=(const Date &other) const
    {
        return !(*this == other);
    }

    bool Date::operator<(const Date &other) const
    {
        return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
    }

    bool Date::operator<=(const Date &other) const
    {
        return !(other < *this);
    }

    bool Date::operator>(const Date &other) const
    {
        return other < *this;
    }

    bool Date::operator>=(const Date &other) const
    {
        return !(*this < other);
    }

    std::ostream &operator<<(std::ostream &os, const Date &date)
    {
        return os << date.to_string();
    }

} // namespace streaks
