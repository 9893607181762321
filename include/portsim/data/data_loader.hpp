/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads monthly return records and daily prices from CSV files and the
 * run configuration from JSON files.
 */

#ifndef PORTSIM_DATA_DATA_LOADER_HPP
#define PORTSIM_DATA_DATA_LOADER_HPP

#include "portsim/backtest/rebalance_scheduler.hpp"
#include "portsim/data/allocation.hpp"
#include "portsim/data/monthly_returns.hpp"
#include "portsim/data/price_history.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace portsim {

/**
 * @struct DataConfig
 * @brief Where the return data comes from and which months to keep
 */
struct DataConfig {
    std::string returns_file;                  ///< Monthly return CSV
    std::string prices_file;                   ///< Daily price CSV, used when returns_file is empty
    std::string start_month;                   ///< Inclusive start filter (YYYY-MM)
    std::string end_month;                     ///< Inclusive end filter (YYYY-MM)

    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AllocationConfig
 * @brief Target allocation, either explicit weights or a risk level
 */
struct AllocationConfig {
    std::map<std::string, double> weights;     ///< Explicit symbol -> weight
    std::string risk_level;                    ///< low, medium or high

    /**
     * @brief Build the allocation; explicit weights win over risk_level.
     * @throws InvalidInputError If neither is set or validation fails.
     */
    Allocation resolve() const;

    static AllocationConfig from_json(const nlohmann::json& j);
};

/**
 * @struct BacktestConfig
 * @brief Configuration for backtesting parameters
 */
struct BacktestConfig {
    double initial_capital = 10000.0;          ///< Starting capital
    backtest::RebalanceConfig rebalance;       ///< Rebalancing period
    int report_months = 12;                    ///< Monthly returns shown in the report
    bool verbose = false;                      ///< Engine diagnostics on stderr

    static BacktestConfig from_json(const nlohmann::json& j);

    /**
     * @brief Parse initial capital from text
     * @throws InvalidInputError Unless the whole string is a finite number > 0.
     */
    static double parse_capital(const std::string& text);

    /**
     * @brief Parse the report month count from text
     * @throws InvalidInputError Unless the whole string is an integer >= 0.
     */
    static int parse_report_months(const std::string& text);
};

/**
 * @struct AppConfig
 * @brief Complete run configuration
 */
struct AppConfig {
    DataConfig data;
    AllocationConfig allocation;
    BacktestConfig backtest;

    /**
     * @brief Load complete configuration from JSON file
     */
    static AppConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and saves return and price tables
 *
 * Monthly return CSV (wide format):
 * month,VTI,BND
 * 2020-01,0.013,-0.002
 *
 * Daily price CSV (wide format):
 * date,VTI,BND
 * 2020-01-02,165.1,84.9
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load monthly return records from a wide CSV file
     *
     * @param filepath Path to CSV file
     * @param symbols Columns to keep (all if empty)
     * @return Records in file order
     * @throws std::runtime_error If the file cannot be read or a value is
     *         not a number
     * @throws InvalidInputError If a requested symbol has no column
     */
    static std::vector<MonthlyReturnRecord> load_monthly_returns_csv(
        const std::string& filepath,
        const std::vector<std::string>& symbols = {});

    /**
     * @brief Load daily prices from a wide CSV file
     *
     * Empty or unparseable cells become NaN.
     *
     * @param filepath Path to CSV file
     * @param symbols Columns to keep (all if empty)
     * @throws std::runtime_error If the file cannot be read
     * @throws InvalidInputError If a requested symbol has no column
     */
    static PriceHistory load_prices_csv(const std::string& filepath,
                                        const std::vector<std::string>& symbols = {});

    /**
     * @brief Save monthly return records in the format load_monthly_returns_csv reads
     * @param symbols Column order (taken from the first record if empty)
     */
    static void save_monthly_returns_csv(const std::vector<MonthlyReturnRecord>& records,
                                         const std::string& filepath,
                                         const std::vector<std::string>& symbols = {});

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @throws std::runtime_error If the file cannot be read or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    static AppConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for demos and tests)
    // ========================================================================

    /**
     * @brief Generate normally distributed monthly returns
     * @param symbols Symbols to generate
     * @param num_months Number of records
     * @param start_month First month (YYYY-MM)
     * @param volatility Monthly standard deviation
     * @param drift Monthly mean return
     * @param seed Generator seed; equal seeds give equal records
     */
    static std::vector<MonthlyReturnRecord> generate_synthetic_returns(
        const std::vector<std::string>& symbols,
        size_t num_months,
        const std::string& start_month = "2015-01",
        double volatility = 0.04,
        double drift = 0.006,
        unsigned int seed = 42);

    /**
     * @brief Month identifier offset from a YYYY-MM start
     * @throws InvalidInputError If start_month is not YYYY-MM
     */
    static std::string add_months(const std::string& start_month, int offset);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);

    static std::vector<size_t> select_columns(const std::vector<std::string>& header,
                                              const std::vector<std::string>& symbols,
                                              std::vector<std::string>& selected);
};

} // namespace portsim

#endif // PORTSIM_DATA_DATA_LOADER_HPP
