/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads the balance history (historia) and withdrawal (retiros) sheets
 * from CSV files and the run configuration from JSON files.
 */

#ifndef STREAKS_DATA_LOADER_HPP
#define STREAKS_DATA_LOADER_HPP

#include "data/balance_history.hpp"
#include "data/calendar.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace streaks
{

    /**
     * @struct DataConfig
     * @brief Input and output file locations
     */
    struct DataConfig
    {
        std::string historia_file; ///< Balance history CSV
        std::string retiros_file;  ///< Withdrawal records CSV
        std::string output_file;   ///< Result CSV

        /**
         * @brief Load from JSON object
         */
        static DataConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct StreakConfig
     * @brief Run parameters of the streak computation
     *
     * fecha_base and n have no defaults; an empty reference date or an empty
     * minimum length means "not configured" and must be supplied on the
     * command line.
     */
    struct StreakConfig
    {
        std::string reference_date;    ///< fecha_base (YYYY-MM-DD)
        std::optional<int> min_length; ///< n
        size_t top = 20;            ///< Rows shown on the console

        /**
         * @brief Load from JSON object
         * @throws std::invalid_argument if "n" is present but not an integer
         *         that fits in an int
         */
        static StreakConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct AnalyzerConfig
     * @brief Complete analyzer configuration
     */
    struct AnalyzerConfig
    {
        DataConfig data;
        StreakConfig streaks;

        /**
         * @brief Configuration with every default applied
         */
        static AnalyzerConfig defaults();

        /**
         * @brief Load complete configuration from JSON file
         */
        static AnalyzerConfig load_from_file(const std::string &config_path);
    };

    /**
     * @struct LoadStats
     * @brief Row counters of one loaded sheet
     */
    struct LoadStats
    {
        size_t loaded = 0;    ///< Rows stored
        size_t skipped = 0;   ///< Rows dropped with a warning
        size_t negatives = 0; ///< Negative balances clamped to 0
        size_t replaced = 0;  ///< Withdrawal rows overriding an earlier row
    };

    /**
     * @class DataLoader
     * @brief Loads and parses the historia and retiros sheets
     *
     * Expected formats:
     * - historia: identificacion,corte_mes,saldo
     * - retiros:  identificacion,fecha_retiro
     *
     * Header names are matched case-insensitively; extra trailing columns
     * are ignored.
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        // ========================================================================
        // CSV Loading Methods
        // ========================================================================

        /**
         * @brief Load balance observations into a history
         *
         * Rows with an empty id, unparsable date or unparsable balance are
         * skipped with a warning. Negative balances are clamped to 0. Dates
         * are normalized to the last day of their month.
         *
         * @param filepath Path to CSV file
         * @param history Destination tables
         * @return Row counters
         * @throws std::runtime_error if the file cannot be opened, the header
         *         is wrong, or a (client, month) pair repeats
         */
        static LoadStats load_historia_csv(const std::string &filepath, BalanceHistory &history);

        /**
         * @brief Load withdrawal records into a history
         *
         * An empty or unparsable withdrawal date means the client is active.
         * A repeated client replaces the earlier row.
         *
         * @param filepath Path to CSV file
         * @param history Destination tables
         * @return Row counters
         * @throws std::runtime_error if the file cannot be opened or the header is wrong
         */
        static LoadStats load_retiros_csv(const std::string &filepath, BalanceHistory &history);

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load JSON configuration file
         * @param filepath Path to JSON config file
         * @return JSON object
         * @throws std::runtime_error if file cannot be loaded
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load complete analyzer configuration
         * @param config_path Path to config JSON file
         * @return AnalyzerConfig struct
         */
        static AnalyzerConfig load_config(const std::string &config_path);

        // ========================================================================
        // Field Parsing
        // ========================================================================

        /**
         * @brief Parse a date cell
         *
         * Accepted formats, tried in order: YYYY-MM-DD, DD/MM/YYYY,
         * YYYY/MM/DD, MM/DD/YYYY, and ISO date-times (YYYY-MM-DDTHH:MM:SS or
         * with a space separator).
         *
         * @return The date, or empty if the cell is blank or unparsable
         */
        static std::optional<Date> parse_date(const std::string &text);

        /**
         * @brief Parse a balance cell
         *
         * ',' and '.' are treated as digit grouping separators and removed.
         *
         * @return The balance, or empty if the cell is not an integer
         */
        static std::optional<long long> parse_balance(const std::string &text);

        // ========================================================================
        // Data Generation (for testing)
        // ========================================================================

        /**
         * @brief Generate synthetic balance history
         * @param num_clients Number of clients (ids C0001, C0002, ...)
         * @param first_month First month end of the history
         * @param num_months Months per client
         * @param gap_probability Chance that a month is not reported
         * @param withdrawal_probability Chance that a client has withdrawn
         * @param seed Random seed
         * @return History with observations and withdrawal records
         */
        static BalanceHistory generate_synthetic_history(
            size_t num_clients,
            const Date &first_month,
            size_t num_months,
            double gap_probability = 0.1,
            double withdrawal_probability = 0.2,
            std::uint32_t seed = 42);

        // ========================================================================
        // Export Methods
        // ========================================================================

        /**
         * @brief Save observations as a historia CSV
         */
        static void save_historia_csv(const BalanceHistory &history, const std::string &filepath);

        /**
         * @brief Save withdrawal records as a retiros CSV
         *
         * Every client with observations gets a row; active clients have an
         * empty date.
         */
        static void save_retiros_csv(const BalanceHistory &history, const std::string &filepath);

    private:
        // ========================
        // Private Helper Methods
        // ========================

        static std::vector<std::string> parse_csv_line(const std::string &line);

        static void check_header(const std::vector<std::string> &header,
                                 const std::vector<std::string> &expected,
                                 const std::string &sheet);

        static std::string trim(const std::string &str);

        static std::string to_lower(std::string str);

        static void ensure_parent_directory(const std::string &filepath);
    };

} // namespace streaks

#endif // STREAKS_DATA_LOADER_HPP
