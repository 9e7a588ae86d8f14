// SPDX-License-Identifier: MIT

#include "engine/streak_engine.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace streaks
{
    namespace engine
    {

        // ------------------------- StreakParameters -----------------------------
        StreakParameters StreakParameters::create(const std::string &reference_date, int min_length)
        {
            StreakParameters p;
            p.reference_date = Date::parse(reference_date);
            p.min_length = min_length;
            p.validate();
            return p;
        }

        int StreakParameters::parse_min_length(const std::string &text)
        {
            if (text.empty())
            {
                throw std::invalid_argument("Minimum streak length is empty");
            }

            long long value = 0;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    throw std::invalid_argument("Minimum streak length must be a positive integer: '" + text + "'");
                }

                value = value * 10 + (c - '0');
                if (value > std::numeric_limits<int>::max())
                {
                    throw std::invalid_argument("Minimum streak length is too large: '" + text + "'");
                }
            }

            if (value < 1)
            {
                throw std::invalid_argument("Minimum streak length must be positive: '" + text + "'");
            }

            return static_cast<int>(value);
        }

        void StreakParameters::validate() const
        {
            if (min_length < 1)
            {
                throw std::invalid_argument("Minimum streak length must be positive, got " +
                                            std::to_string(min_length));
            }

            if (!Date::is_valid(reference_date.year, reference_date.month, reference_date.day))
            {
                throw std::invalid_argument("Invalid reference date");
            }

            if (!reference_date.is_month_end() && !reference_date.has_previous_month())
            {
                throw std::invalid_argument("Reference date " + reference_date.to_string() +
                                            " has no complete month before it");
            }
        }

        bool StreakResult::operator==(const StreakResult &other) const
        {
            return client_id == other.client_id && length == other.length &&
                   end_month == other.end_month && level == other.level;
        }

        // ------------------------- StreakEngine ---------------------------------
        StreakEngine::StreakEngine(const StreakParameters &params)
            : params_(params),
              resolver_(params.reference_date),
              selector_(params.min_length)
        {
            params_.validate();
        }

        std::optional<ClientRange> StreakEngine::resolve_range(const std::string &client_id,
                                                               const BalanceHistory &history) const
        {
            auto first = history.first_month(client_id);
            if (!first)
                return std::nullopt;

            return resolver_.resolve(client_id, *first, history.withdrawal_date(client_id));
        }

        std::vector<TimelineEntry> StreakEngine::client_timeline(const std::string &client_id,
                                                                 const BalanceHistory &history) const
        {
            auto range = resolve_range(client_id, history);
            if (!range)
                return {};

            return TimelineBuilder::build(*range, history.observations(client_id));
        }

        std::vector<Streak> StreakEngine::client_streaks(const std::string &client_id,
                                                         const BalanceHistory &history) const
        {
            return StreakSegmenter::segment(client_id, client_timeline(client_id, history));
        }

        std::optional<StreakResult> StreakEngine::evaluate_client(const std::string &client_id,
                                                                  const BalanceHistory &history) const
        {
            auto best = selector_.select(client_streaks(client_id, history));
            if (!best)
                return std::nullopt;

            return to_result(*best);
        }

        StreakRunResult StreakEngine::run(const BalanceHistory &history) const
        {
            StreakRunResult result;

            // clients() is sorted, so rows come out ordered by client id
            for (const auto &client_id : history.clients())
            {
                ++result.clients_evaluated;

                auto range = resolve_range(client_id, history);
                if (!range)
                {
                    ++result.clients_excluded;
                    continue;
                }

                auto timeline = TimelineBuilder::build(*range, history.observations(client_id));
                result.months_generated += timeline.size();

                auto runs = StreakSegmenter::segment(client_id, timeline);
                result.streaks_found += runs.size();

                auto best = selector_.select(runs);
                if (best)
                    result.rows.push_back(to_result(*best));
            }

            return result;
        }

        StreakResult StreakEngine::to_result(const Streak &streak)
        {
            StreakResult r;
            r.client_id = streak.client_id;
            r.length = streak.length;
            r.end_month = streak.end_month;
            r.level = streak.level;
            return r;
        }

    } // namespace engine
} // namespace streaks
