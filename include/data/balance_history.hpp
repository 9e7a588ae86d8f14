/**
 * @file balance_history.hpp
 * @brief In-memory input tables for the streak engine.
 *
 * Holds the two tables the engine consumes: monthly balance observations
 * (historia_saldos) and withdrawal records (retiros), both keyed by client
 * identifier.
 */

#ifndef STREAKS_DATA_BALANCE_HISTORY_HPP
#define STREAKS_DATA_BALANCE_HISTORY_HPP

#include "data/calendar.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace streaks
{
    /**
     * @struct BalanceObservation
     * @brief One reported month for one client.
     */
    struct BalanceObservation
    {
        std::string client_id; ///< identificacion
        Date month_end;        ///< corte_mes, always the last day of its month
        long long balance = 0; ///< saldo, never negative
    };

    /**
     * @struct WithdrawalRecord
     * @brief Withdrawal status of one client.
     */
    struct WithdrawalRecord
    {
        std::string client_id;                ///< identificacion
        std::optional<Date> withdrawal_date;  ///< fecha_retiro, empty while active
    };

    /**
     * @class BalanceHistory
     * @brief Balance observations and withdrawal records for a run.
     *
     * Observations are stored per client ordered by month. The container
     * rejects rows that would break the table's primary key
     * (client_id, month_end).
     */
    class BalanceHistory
    {
    public:
        /// Ordered month_end -> balance for one client.
        using MonthlyBalances = std::map<Date, long long>;

        BalanceHistory() = default;
        ~BalanceHistory() = default;

        /**
         * @brief Add one balance observation.
         * @throws std::invalid_argument if the client id is empty, the date is
         *         not a month end or the balance is negative
         * @throws std::runtime_error if the (client, month) pair already exists
         */
        void add_observation(const BalanceObservation &observation);

        void add_observation(const std::string &client_id, const Date &month_end, long long balance);

        /**
         * @brief Record a withdrawal; replaces an earlier record for the client.
         * @throws std::invalid_argument if the client id is empty
         */
        void add_withdrawal(const WithdrawalRecord &record);

        void add_withdrawal(const std::string &client_id, const std::optional<Date> &withdrawal_date);

        /**
         * @brief Observations of one client (empty map if unknown).
         */
        const MonthlyBalances &observations(const std::string &client_id) const;

        /**
         * @brief Withdrawal date of one client, empty if active or unknown.
         */
        std::optional<Date> withdrawal_date(const std::string &client_id) const;

        bool has_withdrawal_record(const std::string &client_id) const;

        /**
         * @brief Earliest observed month of one client.
         */
        std::optional<Date> first_month(const std::string &client_id) const;

        /**
         * @brief Clients with at least one observation, sorted by id.
         */
        std::vector<std::string> clients() const;

        size_t num_clients() const { return observations_.size(); }
        size_t num_observations() const { return num_observations_; }
        size_t num_withdrawals() const { return withdrawals_.size(); }
        bool empty() const { return observations_.empty(); }

        void print_summary(std::ostream &os) const;

    private:
        std::map<std::string, MonthlyBalances> observations_;
        std::map<std::string, std::optional<Date>> withdrawals_;
        size_t num_observations_ = 0;
    };

} // namespace streaks

#endif // STREAKS_DATA_BALANCE_HISTORY_HPP
