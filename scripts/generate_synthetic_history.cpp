/**
 * @file generate_synthetic_history.cpp
 * @brief Generate synthetic historia/retiros sheets for the streak analyzer
 */

#include "data/data_loader.hpp"
#include "data/balance_history.hpp"
#include "engine/debt_level.hpp"
#include <array>
#include <iomanip>
#include <iostream>

using namespace streaks;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic History Generator ===\n" << std::endl;

    std::string historia_file = "data/input/historia.csv";
    std::string retiros_file = "data/input/retiros.csv";
    size_t num_clients = 200;
    size_t num_months = 24;
    std::string first_month = "2023-01-31";
    double gap_probability = 0.1;
    double withdrawal_probability = 0.2;
    unsigned long seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--historia" && i + 1 < argc) {
                historia_file = argv[++i];
            } else if (arg == "--retiros" && i + 1 < argc) {
                retiros_file = argv[++i];
            } else if (arg == "--clients" && i + 1 < argc) {
                num_clients = std::stoul(argv[++i]);
            } else if (arg == "--months" && i + 1 < argc) {
                num_months = std::stoul(argv[++i]);
            } else if (arg == "--start" && i + 1 < argc) {
                first_month = argv[++i];
            } else if (arg == "--gaps" && i + 1 < argc) {
                gap_probability = std::stod(argv[++i]);
            } else if (arg == "--withdrawals" && i + 1 < argc) {
                withdrawal_probability = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoul(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --historia FILE    Balance history CSV (default: data/input/historia.csv)\n"
                          << "  --retiros FILE     Withdrawal CSV (default: data/input/retiros.csv)\n"
                          << "  --clients N        Number of clients (default: 200)\n"
                          << "  --months N         Months of history (default: 24)\n"
                          << "  --start DATE       First month end (default: 2023-01-31)\n"
                          << "  --gaps P           Probability of an unreported month (default: 0.1)\n"
                          << "  --withdrawals P    Probability of a withdrawn client (default: 0.2)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating history for " << num_clients << " clients..." << std::endl;
        std::cout << "Months: " << num_months << " starting " << first_month << std::endl;

        auto history = DataLoader::generate_synthetic_history(
            num_clients,
            Date::parse(first_month),
            num_months,
            gap_probability,
            withdrawal_probability,
            static_cast<std::uint32_t>(seed)
        );

        std::cout << "Saving to " << historia_file << " and " << retiros_file << "..." << std::endl;
        DataLoader::save_historia_csv(history, historia_file);
        DataLoader::save_retiros_csv(history, retiros_file);

        // Level mix of the generated observations
        std::array<size_t, 5> per_level{};
        size_t withdrawn = 0;
        for (const auto& client : history.clients()) {
            for (const auto& obs : history.observations(client)) {
                per_level[static_cast<size_t>(engine::classify_balance(obs.second))] += 1;
            }
            if (history.withdrawal_date(client)) ++withdrawn;
        }

        std::cout << "\n=== Generated Data Summary ===\n";
        history.print_summary(std::cout);
        std::cout << "  Withdrawn clients: " << withdrawn << "\n";
        std::cout << std::string(40, '-') << "\n";
        for (size_t i = 0; i < per_level.size(); ++i) {
            double share = history.num_observations() == 0
                ? 0.0
                : 100.0 * per_level[i] / history.num_observations();
            std::cout << std::setw(6) << engine::to_string(static_cast<engine::DebtLevel>(i))
                      << std::setw(10) << per_level[i]
                      << std::setw(10) << std::fixed << std::setprecision(1) << share << "%\n";
        }
        std::cout << std::string(40, '-') << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nDone.\n" << std::endl;
    return 0;
}
