/**
 * @file balance_history.cpp
 * @brief Implementation of BalanceHistory
 */

#include "data/balance_history.hpp"
#include <stdexcept>

namespace streaks
{

    void BalanceHistory::add_observation(const BalanceObservation &observation)
    {
        add_observation(observation.client_id, observation.month_end, observation.balance);
    }

    void BalanceHistory::add_observation(const std::string &client_id, const Date &month_end, long long balance)
    {
        if (client_id.empty())
        {
            throw std::invalid_argument("Observation without client id");
        }

        if (!month_end.is_month_end())
        {
            throw std::invalid_argument("Observation for client " + client_id +
                                        " is not dated at a month end: " + month_end.to_string());
        }

        if (balance < 0)
        {
            throw std::invalid_argument("Negative balance for client " + client_id +
                                        " at " + month_end.to_string());
        }

        auto &months = observations_[client_id];
        if (!months.emplace(month_end, balance).second)
        {
            throw std::runtime_error("Duplicate observation for client " + client_id +
                                     " at " + month_end.to_string());
        }

        ++num_observations_;
    }

    void BalanceHistory::add_withdrawal(const WithdrawalRecord &record)
    {
        add_withdrawal(record.client_id, record.withdrawal_date);
    }

    void BalanceHistory::add_withdrawal(const std::string &client_id, const std::optional<Date> &withdrawal_date)
    {
        if (client_id.empty())
        {
            throw std::invalid_argument("Withdrawal record without client id");
        }

        withdrawals_[client_id] = withdrawal_date;
    }

    const BalanceHistory::MonthlyBalances &BalanceHistory::observations(const std::string &client_id) const
    {
        static const MonthlyBalances kEmpty;

        auto it = observations_.find(client_id);
        if (it == observations_.end())
            return kEmpty;

        return it->second;
    }

    std::optional<Date> BalanceHistory::withdrawal_date(const std::string &client_id) const
    {
        auto it = withdrawals_.find(client_id);
        if (it == withdrawals_.end())
            return std::nullopt;

        return it->second;
    }

    bool BalanceHistory::has_withdrawal_record(const std::string &client_id) const
    {
        return withdrawals_.count(client_id) > 0;
    }

    std::optional<Date> BalanceHistory::first_month(const std::string &client_id) const
    {
        const auto &months = observations(client_id);
        if (months.empty())
            return std::nullopt;

        return months.begin()->first;
    }

    std::vector<std::string> BalanceHistory::clients() const
    {
        std::vector<std::string> ids;
        ids.reserve(observations_.size());
        for (const auto &entry : observations_)
        {
            ids.push_back(entry.first);
        }
        return ids;
    }

    void BalanceHistory::print_summary(std::ostream &os) const
    {
        os << "Balance History Summary:\n";
        os << "  Clients with observations: " << num_clients() << "\n";
        os << "  Observations: " << num_observations() << "\n";
        os << "  Withdrawal records: " << num_withdrawals() << "\n";

        if (observations_.empty())
            return;

        Date earliest = observations_.begin()->second.begin()->first;
        Date latest = earliest;
        for (const auto &entry : observations_)
        {
            if (entry.second.begin()->first < earliest)
                earliest = entry.second.begin()->first;
            if (entry.second.rbegin()->first > latest)
                latest = entry.second.rbegin()->first;
        }

        os << "  Months observed: " << earliest << " to " << latest << "\n";
    }

} // namespace streaks
