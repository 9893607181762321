/**
 * @file main.cpp
 * @brief Main entry point for the portsim allocation backtester
 *
 * Command-line application that loads configuration and return data, runs
 * a fixed-allocation backtest and prints or exports the results.
 */

#include "portsim/backtest/backtest_engine.hpp"
#include "portsim/data/data_loader.hpp"
#include "portsim/data/monthly_returns.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace portsim;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "portsim v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --returns PATH        Monthly return CSV (overrides config)\n"
              << "  --prices PATH         Daily price CSV, converted to monthly returns\n"
              << "  --capital X           Initial capital (default: 10000)\n"
              << "  --rebalance N|NAME    Months between rebalances, or hold/monthly/semi_annual/annual\n"
              << "  --risk-level LEVEL    Use the low/medium/high allocation\n"
              << "  --months N            Monthly returns shown in the report (default: 12)\n"
              << "  --output DIR          Write backtest_history.csv and backtest_result.json\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/backtest_config.json\n"
              << "  " << program_name << " --returns data/market/monthly_returns.csv --risk-level high --rebalance annual\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       portsim v1.0.0                                           \n"
              << "       Fixed-Allocation Portfolio Backtester                    \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 *
 * Option values are kept as text; apply_overrides() converts them.
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string returns_path;
    std::string prices_path;
    std::string capital;
    std::string rebalance;
    std::string risk_level;
    std::string months;
    std::string output_dir;
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
            else if (arg == "--returns" && i + 1 < argc)
            {
                args.returns_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--capital" && i + 1 < argc)
            {
                args.capital = argv[++i];
            }
            else if (arg == "--rebalance" && i + 1 < argc)
            {
                args.rebalance = argv[++i];
            }
            else if (arg == "--risk-level" && i + 1 < argc)
            {
                args.risk_level = argv[++i];
            }
            else if (arg == "--months" && i + 1 < argc)
            {
                args.months = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
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

    bool is_valid() const
    {
        return !show_help && (!config_path.empty() || !returns_path.empty() || !prices_path.empty());
    }
};

/**
 * @brief Merge command-line overrides into the loaded configuration
 */
void apply_overrides(const CommandLineArgs &args, AppConfig &config)
{
    if (!args.returns_path.empty())
    {
        config.data.returns_file = args.returns_path;
        config.data.prices_file.clear();
    }
    if (!args.prices_path.empty())
    {
        config.data.prices_file = args.prices_path;
        config.data.returns_file.clear();
    }
    if (!args.capital.empty())
    {
        config.backtest.initial_capital = BacktestConfig::parse_capital(args.capital);
    }
    if (!args.rebalance.empty())
    {
        config.backtest.rebalance = backtest::RebalanceConfig::from_string(args.rebalance);
    }
    if (!args.risk_level.empty())
    {
        config.allocation.weights.clear();
        config.allocation.risk_level = args.risk_level;
    }
    if (!args.months.empty())
    {
        config.backtest.report_months = BacktestConfig::parse_report_months(args.months);
    }
    if (args.verbose)
    {
        config.backtest.verbose = true;
    }
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
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        AppConfig config;
        if (!args.config_path.empty())
        {
            config = DataLoader::load_config(args.config_path);
        }
        apply_overrides(args, config);

        Allocation allocation = config.allocation.resolve();

        if (args.verbose)
        {
            std::cout << "  - Allocation:";
            for (const auto &symbol : allocation.symbols())
            {
                std::cout << " " << symbol << "=" << std::fixed << std::setprecision(2)
                          << allocation.weight(symbol) * 100.0 << "%";
            }
            std::cout << "\n  - Capital: " << config.backtest.initial_capital
                      << "\n  - Rebalance: " << config.backtest.rebalance.label() << "\n";
        }

        // ====================================================================
        // 2. Load Return Data
        // ====================================================================
        std::cout << "[2/4] Loading return data..." << std::endl;

        std::vector<MonthlyReturnRecord> records;
        if (!config.data.returns_file.empty())
        {
            records = DataLoader::load_monthly_returns_csv(config.data.returns_file, allocation.symbols());
        }
        else if (!config.data.prices_file.empty())
        {
            auto prices = DataLoader::load_prices_csv(config.data.prices_file, allocation.symbols());
            if (args.verbose)
            {
                std::cout << "  - Loaded " << prices.num_dates() << " daily prices, "
                          << prices.num_assets() << " assets" << std::endl;
            }
            records = prices.monthly_returns();
        }
        else
        {
            throw std::runtime_error("No data source: set data.returns_file or data.prices_file");
        }

        records = filter_by_month(records, config.data.start_month, config.data.end_month);

        std::cout << "  - " << records.size() << " months";
        if (!records.empty())
        {
            std::cout << " (" << records.front().month << " to " << records.back().month << ")";
        }
        std::cout << std::endl;

        // ====================================================================
        // 3. Run Backtest
        // ====================================================================
        std::cout << "[3/4] Running backtest..." << std::endl;

        backtest::BacktestEngine engine(backtest::BacktestParams::from_config(config.backtest));
        auto result = engine.run(records, allocation);

        // ====================================================================
        // 4. Report
        // ====================================================================
        std::cout << "[4/4] Writing report...\n"
                  << std::endl;

        result.print_summary(std::cout, config.backtest.report_months);

        if (!args.output_dir.empty())
        {
            std::filesystem::create_directories(args.output_dir);

            std::string history_file = args.output_dir + "/backtest_history.csv";
            std::string result_file = args.output_dir + "/backtest_result.json";
            result.export_history_to_csv(history_file);
            result.export_to_json(result_file);

            std::cout << "\n  History exported to: " << history_file << "\n";
            std::cout << "  Result exported to:  " << result_file << "\n";
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Backtest completed successfully in "
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
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
