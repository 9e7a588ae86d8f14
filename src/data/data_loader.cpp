/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace streaks
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.historia_file = j.value("historia_file", "data/input/historia.csv");
        config.retiros_file = j.value("retiros_file", "data/input/retiros.csv");
        config.output_file = j.value("output_file", "results/resultados_rachas.csv");
        return config;
    }

    StreakConfig StreakConfig::from_json(const nlohmann::json &j)
    {
        StreakConfig config;
        config.reference_date = j.value("fecha_base", "");

        if (j.contains("n"))
        {
            const auto &n = j["n"];
            if (!n.is_number_integer())
            {
                throw std::invalid_argument("Configuration value 'n' must be an integer");
            }

            // Read at full width; get<int>() would wrap values outside int
            bool in_range = n.is_number_unsigned()
                                ? n.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                                : n.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                      n.get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range)
            {
                throw std::invalid_argument("Configuration value 'n' is out of range: " + n.dump());
            }
            config.min_length = static_cast<int>(n.get<std::int64_t>());
        }

        config.top = j.value("top", static_cast<size_t>(20));
        return config;
    }

    AnalyzerConfig AnalyzerConfig::defaults()
    {
        AnalyzerConfig config;
        config.data = DataConfig::from_json(nlohmann::json::object());
        config.streaks = StreakConfig::from_json(nlohmann::json::object());
        return config;
    }

    AnalyzerConfig AnalyzerConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - historia
    // ===========================

    LoadStats DataLoader::load_historia_csv(const std::string &filepath, BalanceHistory &history)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        check_header(parse_csv_line(line), {"identificacion", "corte_mes", "saldo"}, "historia");

        LoadStats stats;
        size_t row = 1;

        while (std::getline(file, line))
        {
            ++row;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            fields.resize(std::max<size_t>(fields.size(), 3));

            std::string id = trim(fields[0]);
            auto corte = parse_date(fields[1]);
            auto saldo = parse_balance(fields[2]);

            if (id.empty() || !corte || !saldo)
            {
                ++stats.skipped;
                std::cerr << "Warning: historia row " << row << ": skipped" << std::endl;
                continue;
            }

            long long balance = *saldo;
            if (balance < 0)
            {
                ++stats.negatives;
                balance = 0;
            }

            try
            {
                history.add_observation(id, corte->month_end(), balance);
            }
            catch (const std::runtime_error &e)
            {
                throw std::runtime_error("historia row " + std::to_string(row) + ": " + e.what());
            }

            ++stats.loaded;
        }

        return stats;
    }

    // ===========================
    // CSV Loading - retiros
    // ===========================

    LoadStats DataLoader::load_retiros_csv(const std::string &filepath, BalanceHistory &history)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        check_header(parse_csv_line(line), {"identificacion", "fecha_retiro"}, "retiros");

        LoadStats stats;
        size_t row = 1;

        while (std::getline(file, line))
        {
            ++row;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            fields.resize(std::max<size_t>(fields.size(), 2));

            std::string id = trim(fields[0]);
            if (id.empty())
            {
                ++stats.skipped;
                std::cerr << "Warning: retiros row " << row << ": empty identificacion" << std::endl;
                continue;
            }

            if (history.has_withdrawal_record(id))
            {
                ++stats.replaced;
            }
            else
            {
                ++stats.loaded;
            }

            history.add_withdrawal(id, parse_date(fields[1]));
        }

        return stats;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    AnalyzerConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        AnalyzerConfig config = AnalyzerConfig::defaults();

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("streaks"))
        {
            config.streaks = StreakConfig::from_json(j["streaks"]);
        }

        return config;
    }

    // ================
    // Field Parsing
    // ================

    std::optional<Date> DataLoader::parse_date(const std::string &text)
    {
        static const char *kFormats[] = {
            "%Y-%m-%d",
            "%d/%m/%Y",
            "%Y/%m/%d",
            "%m/%d/%Y",
            "%Y-%m-%dT%H:%M:%S",
            "%Y-%m-%d %H:%M:%S",
            "%Y-%m-%dT%H:%M",
            "%Y-%m-%d %H:%M",
        };

        std::string s = trim(text);
        if (s.empty())
            return std::nullopt;

        for (const char *format : kFormats)
        {
            std::tm tm = {};
            std::istringstream ss(s);
            ss >> std::get_time(&tm, format);

            // The whole cell must be consumed
            if (ss.fail() || ss.peek() != std::char_traits<char>::eof())
                continue;

            int year = tm.tm_year + 1900;
            int month = tm.tm_mon + 1;
            if (Date::is_valid(year, month, tm.tm_mday))
            {
                return Date(year, month, tm.tm_mday);
            }
        }

        return std::nullopt;
    }

    std::optional<long long> DataLoader::parse_balance(const std::string &text)
    {
        std::string s = trim(text);
        s.erase(std::remove_if(s.begin(), s.end(), [](char c)
                               { return c == ',' || c == '.'; }),
                s.end());

        bool negative = false;
        if (!s.empty() && (s[0] == '-' || s[0] == '+'))
        {
            negative = s[0] == '-';
            s.erase(0, 1);
        }

        if (s.empty() || s.size() > 18)
            return std::nullopt;

        if (!std::all_of(s.begin(), s.end(), [](unsigned char c)
                         { return std::isdigit(c); }))
            return std::nullopt;

        long long value = std::stoll(s);
        return negative ? -value : value;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    BalanceHistory DataLoader::generate_synthetic_history(
        size_t num_clients,
        const Date &first_month,
        size_t num_months,
        double gap_probability,
        double withdrawal_probability,
        std::uint32_t seed)
    {
        // One representative balance per debt level band
        static const long long kBandBalances[] = {150000, 650000, 2000000, 4000000, 7500000};

        std::mt19937 gen(seed);
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        std::uniform_int_distribution<int> band_dist(0, 4);
        std::uniform_int_distribution<long long> jitter(-50000, 50000);

        BalanceHistory history;
        if (num_months == 0)
            return history;

        Date start = first_month.month_end();

        for (size_t c = 0; c < num_clients; ++c)
        {
            std::ostringstream id;
            id << "C" << std::setw(4) << std::setfill('0') << (c + 1);

            // Clients join at different months and drift between bands
            std::uniform_int_distribution<size_t> offset_dist(0, num_months - 1);
            size_t offset = offset_dist(gen);

            Date month = start;
            for (size_t i = 0; i < offset; ++i)
                month = month.next_month_end();

            int band = band_dist(gen);
            bool first = true;

            for (size_t i = offset; i < num_months; ++i, month = month.next_month_end())
            {
                if (unit(gen) < 0.25)
                {
                    band = std::clamp(band + (unit(gen) < 0.5 ? -1 : 1), 0, 4);
                }

                // The first month is always reported so the client has a start
                if (!first && unit(gen) < gap_probability)
                    continue;

                long long balance = std::max(0LL, kBandBalances[band] + jitter(gen));
                history.add_observation(id.str(), month, balance);
                first = false;
            }

            if (unit(gen) < withdrawal_probability)
            {
                std::uniform_int_distribution<size_t> when(offset, num_months - 1);
                Date withdrawal = start;
                for (size_t i = 0, n = when(gen); i < n; ++i)
                    withdrawal = withdrawal.next_month_end();

                std::uniform_int_distribution<int> day(1, withdrawal.day);
                history.add_withdrawal(id.str(), Date(withdrawal.year, withdrawal.month, day(gen)));
            }
            else
            {
                history.add_withdrawal(id.str(), std::nullopt);
            }
        }

        return history;
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_historia_csv(const BalanceHistory &history, const std::string &filepath)
    {
        ensure_parent_directory(filepath);

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "identificacion,corte_mes,saldo\n";

        for (const auto &client : history.clients())
        {
            for (const auto &obs : history.observations(client))
            {
                file << client << "," << obs.first << "," << obs.second << "\n";
            }
        }
    }

    void DataLoader::save_retiros_csv(const BalanceHistory &history, const std::string &filepath)
    {
        ensure_parent_directory(filepath);

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "identificacion,fecha_retiro\n";

        for (const auto &client : history.clients())
        {
            file << client << ",";
            auto withdrawal = history.withdrawal_date(client);
            if (withdrawal)
                file << *withdrawal;
            file << "\n";
        }
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    void DataLoader::check_header(const std::vector<std::string> &header,
                                  const std::vector<std::string> &expected,
                                  const std::string &sheet)
    {
        bool ok = header.size() >= expected.size();
        for (size_t i = 0; ok && i < expected.size(); ++i)
        {
            ok = to_lower(trim(header[i])) == expected[i];
        }

        if (!ok)
        {
            std::string got;
            for (size_t i = 0; i < header.size() && i < expected.size(); ++i)
            {
                got += (i ? "," : "") + trim(header[i]);
            }
            throw std::runtime_error("Sheet " + sheet + ": invalid header: " + got);
        }
    }

    std::string DataLoader::trim(const std::string &str)
    {
        // Also drops a UTF-8 byte order mark left by spreadsheet exports
        std::string s = str;
        if (s.compare(0, 3, "\xEF\xBB\xBF") == 0)
            s.erase(0, 3);

        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        return str;
    }

    void DataLoader::ensure_parent_directory(const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }
    }

} // namespace streaks
