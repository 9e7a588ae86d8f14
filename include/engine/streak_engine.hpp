// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "data/balance_history.hpp"
#include "data/calendar.hpp"
#include "engine/cutoff_resolver.hpp"
#include "engine/debt_level.hpp"
#include "engine/streak_segmenter.hpp"
#include "engine/streak_selector.hpp"
#include "engine/timeline_builder.hpp"

namespace streaks
{
    namespace engine
    {

        /**
         * @struct StreakParameters
         * @brief Scalar inputs of a streak run.
         */
        struct StreakParameters
        {
            Date reference_date; ///< fecha_base
            int min_length = 1;  ///< n

            /**
             * @brief Validate raw parameter values before any computation.
             * @param reference_date ISO date text (YYYY-MM-DD)
             * @param min_length Minimum streak length, must be >= 1
             * @throws std::invalid_argument on a malformed date or a non-positive length
             */
            static StreakParameters create(const std::string &reference_date, int min_length);

            /**
             * @brief Parse a minimum length given as text.
             *
             * Only a plain positive integer is accepted; "3.5", "abc", "0" and
             * "-2" are rejected rather than coerced.
             *
             * @throws std::invalid_argument if the text is not a positive integer
             */
            static int parse_min_length(const std::string &text);

            void validate() const;
        };

        /**
         * @struct StreakResult
         * @brief Winning streak of one client (one output row).
         */
        struct StreakResult
        {
            std::string client_id; ///< identificacion
            int length = 0;        ///< racha
            Date end_month;        ///< fecha_fin
            DebtLevel level = kDefaultLevel; ///< nivel

            bool operator==(const StreakResult &other) const;
        };

        /**
         * @struct StreakRunResult
         * @brief Output rows of a run plus counters for reporting.
         */
        struct StreakRunResult
        {
            std::vector<StreakResult> rows; ///< sorted by client id

            size_t clients_evaluated = 0;
            size_t clients_excluded = 0;   ///< first month after the effective end
            size_t months_generated = 0;
            size_t streaks_found = 0;

            size_t clients_qualifying() const { return rows.size(); }
        };

        /**
         * @class StreakEngine
         * @brief Longest debt-level streak per client as of a reference date.
         *
         * Each client goes through the same pipeline:
         *  1. CutoffResolver   -> month window (or exclusion)
         *  2. TimelineBuilder  -> dense monthly levels, gaps filled with N0
         *  3. StreakSegmenter  -> maximal same-level runs
         *  4. StreakSelector   -> longest run >= n, later end month on ties
         *
         * Clients are independent; evaluate_client reads only the given
         * client's rows.
         */
        class StreakEngine
        {
        public:
            explicit StreakEngine(const StreakParameters &params);
            ~StreakEngine() = default;

            /**
             * @brief Evaluate every client that has observations.
             * @param history Input tables
             * @return Result rows ordered by client id
             */
            StreakRunResult run(const BalanceHistory &history) const;

            /**
             * @brief Evaluate a single client.
             * @return The winning streak, or empty when the client is excluded
             *         or has no streak of at least min_length months
             */
            std::optional<StreakResult> evaluate_client(const std::string &client_id,
                                                        const BalanceHistory &history) const;

            /**
             * @brief Segmented streaks of one client, before filtering.
             *
             * Empty when the client has no observations or falls outside the
             * usable window.
             */
            std::vector<Streak> client_streaks(const std::string &client_id,
                                               const BalanceHistory &history) const;

            /**
             * @brief Dense timeline of one client (empty if excluded).
             */
            std::vector<TimelineEntry> client_timeline(const std::string &client_id,
                                                       const BalanceHistory &history) const;

            const StreakParameters &params() const { return params_; }
            const CutoffResolver &resolver() const { return resolver_; }

        private:
            StreakParameters params_;
            CutoffResolver resolver_;
            StreakSelector selector_;

            std::optional<ClientRange> resolve_range(const std::string &client_id,
                                                     const BalanceHistory &history) const;

            static StreakResult to_result(const Streak &streak);
        };

    } // namespace engine
} // namespace streaks
