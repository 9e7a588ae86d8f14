/**
 * @file cutoff_resolver.cpp
 * @brief Implementation of CutoffResolver
 */

#include "engine/cutoff_resolver.hpp"
#include <stdexcept>

namespace streaks
{
    namespace engine
    {

        namespace
        {
            Date base_month_for(const Date &reference_date)
            {
                if (reference_date.is_month_end())
                    return reference_date;

                if (!reference_date.has_previous_month())
                {
                    throw std::invalid_argument("Reference date " + reference_date.to_string() +
                                                " has no complete month before it");
                }

                return reference_date.previous_month_end();
            }
        } // namespace

        CutoffResolver::CutoffResolver(const Date &reference_date)
            : base_month_end_(base_month_for(reference_date))
        {
        }

        std::optional<Date> CutoffResolver::withdrawal_month_end(const Date &withdrawal_date)
        {
            // Inactive from the withdrawal month onward
            if (!withdrawal_date.has_previous_month())
                return std::nullopt;

            return withdrawal_date.previous_month_end();
        }

        std::optional<Date> CutoffResolver::effective_end(const std::optional<Date> &withdrawal_date) const
        {
            if (!withdrawal_date)
                return base_month_end_;

            auto withdrawn = withdrawal_month_end(*withdrawal_date);
            if (!withdrawn)
                return std::nullopt;

            return *withdrawn < base_month_end_ ? *withdrawn : base_month_end_;
        }

        std::optional<ClientRange> CutoffResolver::resolve(const std::string &client_id,
                                                           const Date &first_month,
                                                           const std::optional<Date> &withdrawal_date) const
        {
            auto end = effective_end(withdrawal_date);
            if (!end || first_month > *end)
                return std::nullopt;

            return ClientRange{client_id, first_month, *end};
        }

    } // namespace engine
} // namespace streaks
