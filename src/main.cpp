/**
 * @file main.cpp
 * @brief Main entry point for the Streak Analyzer
 *
 * Command-line application that loads the balance history and withdrawal
 * sheets, computes the longest debt-level streak per client as of a
 * reference date, and writes the result table.
 */

#include "data/data_loader.hpp"
#include "data/balance_history.hpp"
#include "engine/streak_engine.hpp"
#include "report/streak_report.hpp"
#include <chrono>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>

using namespace streaks;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Streak Analyzer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --fecha-base DATE     Reference date, YYYY-MM-DD (required unless in config)\n"
              << "  --n N                 Minimum streak length in months (required unless in config)\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --historia PATH       Balance history CSV (default: data/input/historia.csv)\n"
              << "  --retiros PATH        Withdrawal records CSV (default: data/input/retiros.csv)\n"
              << "  --out PATH            Result CSV (default: results/resultados_rachas.csv)\n"
              << "  --top K               Rows shown on the console (default: 20)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --fecha-base 2024-12-15 --n 3\n"
              << "  " << program_name << " --config data/config/streak_config.json --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Streak Analyzer v1.0.0                                   \n"
              << "       Longest debt-level streak per client                     \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string historia_path;
    std::string retiros_path;
    std::string output_path;
    std::string reference_date;
    std::string min_length;
    std::string top;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--historia" && i + 1 < argc)
            {
                args.historia_path = argv[++i];
            }
            else if (arg == "--retiros" && i + 1 < argc)
            {
                args.retiros_path = argv[++i];
            }
            else if (arg == "--out" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--fecha-base" && i + 1 < argc)
            {
                args.reference_date = argv[++i];
            }
            else if (arg == "--n" && i + 1 < argc)
            {
                args.min_length = argv[++i];
            }
            else if (arg == "--top" && i + 1 < argc)
            {
                args.top = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }
};

/**
 * @brief Parse the --top value (non-negative integer)
 */
size_t parse_top(const std::string &text)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 9)
    {
        throw std::invalid_argument("--top must be a non-negative integer: '" + text + "'");
    }
    return static_cast<size_t>(std::stoul(text));
}

/**
 * @brief Merge configuration file and command line; CLI values win
 */
AnalyzerConfig resolve_config(const CommandLineArgs &args)
{
    AnalyzerConfig config = args.config_path.empty()
                                ? AnalyzerConfig::defaults()
                                : DataLoader::load_config(args.config_path);

    if (!args.historia_path.empty())
        config.data.historia_file = args.historia_path;
    if (!args.retiros_path.empty())
        config.data.retiros_file = args.retiros_path;
    if (!args.output_path.empty())
        config.data.output_file = args.output_path;
    if (!args.reference_date.empty())
        config.streaks.reference_date = args.reference_date;
    if (!args.min_length.empty())
        config.streaks.min_length = engine::StreakParameters::parse_min_length(args.min_length);
    if (!args.top.empty())
        config.streaks.top = parse_top(args.top);

    if (config.streaks.reference_date.empty())
        throw std::invalid_argument("Missing reference date (--fecha-base)");
    if (!config.streaks.min_length)
        throw std::invalid_argument("Missing minimum streak length (--n)");

    return config;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Validate Parameters
        // ====================================================================
        std::cout << "[1/4] Validating parameters..." << std::endl;

        auto config = resolve_config(args);
        auto params = engine::StreakParameters::create(config.streaks.reference_date,
                                                       *config.streaks.min_length);

        std::cout << "  - fecha_base=" << params.reference_date
                  << ", n=" << params.min_length << std::endl;

        // ====================================================================
        // 2. Load Input Sheets
        // ====================================================================
        std::cout << "[2/4] Loading input sheets..." << std::endl;

        BalanceHistory history;
        auto historia_stats = DataLoader::load_historia_csv(config.data.historia_file, history);
        auto retiros_stats = DataLoader::load_retiros_csv(config.data.retiros_file, history);

        std::cout << "  - historia: " << historia_stats.loaded << " rows loaded (skipped: "
                  << historia_stats.skipped << ", negatives: " << historia_stats.negatives << ")\n";
        std::cout << "  - retiros: " << retiros_stats.loaded << " rows loaded (skipped: "
                  << retiros_stats.skipped << ", replaced: " << retiros_stats.replaced << ")"
                  << std::endl;

        if (args.verbose)
        {
            std::cout << "  - historia file: " << config.data.historia_file << "\n";
            std::cout << "  - retiros file: " << config.data.retiros_file << "\n";
            history.print_summary(std::cout);
        }

        // ====================================================================
        // 3. Compute Streaks
        // ====================================================================
        std::cout << "[3/4] Computing streaks..." << std::endl;

        engine::StreakEngine streak_engine(params);
        auto result = streak_engine.run(history);

        std::cout << "  - " << result.clients_qualifying() << " clients with streaks >= "
                  << params.min_length << " months" << std::endl;

        if (args.verbose)
        {
            std::cout << "  - Base month end: " << streak_engine.resolver().base_month_end() << "\n";
            std::cout << "  - Clients evaluated: " << result.clients_evaluated << "\n";
            std::cout << "  - Clients outside the window: " << result.clients_excluded << "\n";
            std::cout << "  - Months generated: " << result.months_generated << "\n";
            std::cout << "  - Streaks found: " << result.streaks_found << "\n";
        }

        report::StreakReport streak_report(result.rows);
        streak_report.print_top(config.streaks.top);

        if (args.verbose)
        {
            streak_report.print_summary();
        }

        // ====================================================================
        // 4. Write Results
        // ====================================================================
        std::cout << "[4/4] Writing results..." << std::endl;

        streak_report.export_to_csv(config.data.output_file);
        std::cout << "  - Results saved to: " << config.data.output_file << std::endl;

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help)
    {
        print_banner();
        print_usage(argv[0]);
        return 0;
    }

    print_banner();

    return run(args);
}
