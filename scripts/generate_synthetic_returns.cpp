/**
 * @file generate_synthetic_returns.cpp
 * @brief Generate synthetic monthly return data for the backtester
 */

#include "portsim/data/data_loader.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>

using namespace portsim;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Return Generator ===\n" << std::endl;

    // The five-fund universe used by the built-in risk levels
    std::vector<std::string> symbols = {
        "VTI",    // US total market
        "VXUS",   // International equity
        "BND",    // US aggregate bond
        "BNDX",   // International bond
        "VNQ"     // Real estate
    };

    std::string output_file = "data/market/monthly_returns.csv";
    std::string start_month = "2015-01";
    size_t num_months = 120;
    double volatility = 0.04;   // 4% monthly volatility
    double drift = 0.006;       // ~7.5% annualized return
    unsigned int seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--start" && i + 1 < argc) {
                start_month = argv[++i];
            } else if (arg == "--months" && i + 1 < argc) {
                num_months = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--volatility" && i + 1 < argc) {
                volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                drift = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/monthly_returns.csv)\n"
                          << "  --start YYYY-MM    First month (default: 2015-01)\n"
                          << "  --months N         Number of months (default: 120)\n"
                          << "  --volatility VAL   Monthly volatility (default: 0.04)\n"
                          << "  --drift VAL        Monthly drift (default: 0.006)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating " << num_months << " months for " << symbols.size()
                  << " assets starting " << start_month << "..." << std::endl;

        auto records = DataLoader::generate_synthetic_returns(
            symbols, num_months, start_month, volatility, drift, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_monthly_returns_csv(records, output_file, symbols);

        std::cout << "\nAsset Statistics (Annualized):\n";
        std::cout << std::string(45, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(18) << "Mean Return"
                  << std::setw(18) << "Volatility" << "\n";
        std::cout << std::string(45, '-') << "\n";

        for (const auto& symbol : symbols) {
            double sum = 0.0, sum_sq = 0.0;
            for (const auto& record : records) {
                double r = record.return_for(symbol);
                sum += r;
                sum_sq += r * r;
            }
            double n = static_cast<double>(records.size());
            double mean = n > 0 ? sum / n : 0.0;
            double var = n > 1 ? (sum_sq - n * mean * mean) / (n - 1) : 0.0;

            std::cout << std::setw(8) << symbol
                      << std::setw(17) << std::fixed << std::setprecision(2)
                      << mean * 12 * 100 << "%"
                      << std::setw(17) << std::sqrt(std::max(var, 0.0) * 12) * 100 << "%\n";
        }
        std::cout << std::string(45, '-') << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nData generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/portsim --returns " << output_file << " --risk-level medium\n";
    std::cout << std::endl;

    return 0;
}
