/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "portsim/data/data_loader.hpp"
#include "portsim/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace portsim
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.returns_file = j.value("returns_file", "");
        config.prices_file = j.value("prices_file", "");
        config.start_month = j.value("start_month", "");
        config.end_month = j.value("end_month", "");
        return config;
    }

    Allocation AllocationConfig::resolve() const
    {
        if (!weights.empty())
        {
            return Allocation(weights);
        }
        if (!risk_level.empty())
        {
            return Allocation::for_risk_level(risk_level);
        }
        throw InvalidInputError("allocation needs either 'weights' or 'risk_level'");
    }

    AllocationConfig AllocationConfig::from_json(const nlohmann::json &j)
    {
        AllocationConfig config;
        config.risk_level = j.value("risk_level", "");

        if (j.contains("weights"))
        {
            const auto &w = j["weights"];
            if (!w.is_object())
            {
                throw InvalidInputError("allocation.weights must be an object of symbol -> weight");
            }
            for (auto it = w.begin(); it != w.end(); ++it)
            {
                if (!it.value().is_number())
                {
                    throw InvalidInputError("weight for '" + it.key() + "' must be a number");
                }
                config.weights[it.key()] = it.value().get<double>();
            }
        }

        return config;
    }

    BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
    {
        BacktestConfig config;
        config.initial_capital = j.value("initial_capital", 10000.0);
        config.rebalance = backtest::RebalanceConfig::from_json(j);
        config.report_months = j.value("report_months", 12);
        config.verbose = j.value("verbose", false);
        if (config.report_months < 0)
        {
            throw InvalidInputError("report_months must be >= 0, got " + std::to_string(config.report_months));
        }
        return config;
    }

    double BacktestConfig::parse_capital(const std::string &text)
    {
        double capital = 0.0;
        size_t consumed = 0;
        try
        {
            capital = std::stod(text, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw InvalidInputError("Invalid initial capital: " + text);
        }
        if (consumed != text.size() || !std::isfinite(capital) || !(capital > 0.0))
        {
            throw InvalidInputError("initial_capital must be a number greater than 0, got " + text);
        }
        return capital;
    }

    int BacktestConfig::parse_report_months(const std::string &text)
    {
        int months = 0;
        size_t consumed = 0;
        try
        {
            months = std::stoi(text, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw InvalidInputError("Invalid month count: " + text);
        }
        if (consumed != text.size() || months < 0)
        {
            throw InvalidInputError("report months must be an integer >= 0, got " + text);
        }
        return months;
    }

    AppConfig AppConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - Monthly Returns
    // ===========================

    std::vector<MonthlyReturnRecord> DataLoader::load_monthly_returns_csv(const std::string &filepath,
                                                                          const std::vector<std::string> &symbols)
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

        auto header = parse_csv_line(line);
        std::string first = header.empty() ? "" : trim(header[0]);
        if (first != "month" && first != "date")
        {
            throw std::runtime_error("CSV must start with 'month' or 'date' column");
        }

        std::vector<std::string> selected;
        std::vector<size_t> columns = select_columns(header, symbols, selected);

        std::vector<MonthlyReturnRecord> records;
        int line_number = 1;
        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            MonthlyReturnRecord record;
            record.month = trim(fields[0]);
            // Daily-style identifiers collapse to their month.
            if (record.month.size() == 10 && record.month[4] == '-' && record.month[7] == '-')
            {
                record.month = record.month.substr(0, 7);
            }

            for (size_t k = 0; k < columns.size(); ++k)
            {
                size_t idx = columns[k];
                double value = idx < fields.size() ? safe_stod(fields[idx])
                                                   : std::numeric_limits<double>::quiet_NaN();
                if (std::isnan(value))
                {
                    std::ostringstream msg;
                    msg << filepath << ":" << line_number << ": invalid return for '"
                        << selected[k] << "'";
                    throw std::runtime_error(msg.str());
                }
                record.returns[selected[k]] = value;
            }
            records.push_back(record);
        }

        return records;
    }

    // ===========================
    // CSV Loading - Daily Prices
    // ===========================

    PriceHistory DataLoader::load_prices_csv(const std::string &filepath,
                                             const std::vector<std::string> &symbols)
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

        auto header = parse_csv_line(line);
        if (header.empty() || trim(header[0]) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        std::vector<std::string> selected;
        std::vector<size_t> columns = select_columns(header, symbols, selected);

        std::vector<std::string> dates;
        std::vector<std::vector<double>> price_data;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            dates.push_back(trim(fields[0]));

            std::vector<double> row_prices;
            row_prices.reserve(columns.size());
            for (size_t idx : columns)
            {
                row_prices.push_back(idx < fields.size() ? safe_stod(fields[idx])
                                                         : std::numeric_limits<double>::quiet_NaN());
            }
            price_data.push_back(row_prices);
        }

        if (dates.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        Eigen::MatrixXd prices(dates.size(), selected.size());
        for (size_t i = 0; i < dates.size(); ++i)
        {
            for (size_t j = 0; j < selected.size(); ++j)
            {
                prices(i, j) = price_data[i][j];
            }
        }

        return PriceHistory(prices, dates, selected);
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

    AppConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        AppConfig config;

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("allocation"))
        {
            config.allocation = AllocationConfig::from_json(j["allocation"]);
        }

        if (j.contains("backtest"))
        {
            config.backtest = BacktestConfig::from_json(j["backtest"]);
        }

        return config;
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    std::vector<MonthlyReturnRecord> DataLoader::generate_synthetic_returns(
        const std::vector<std::string> &symbols,
        size_t num_months,
        const std::string &start_month,
        double volatility,
        double drift,
        unsigned int seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        std::vector<MonthlyReturnRecord> records;
        records.reserve(num_months);

        for (size_t i = 0; i < num_months; ++i)
        {
            MonthlyReturnRecord record;
            record.month = add_months(start_month, static_cast<int>(i));
            for (const auto &symbol : symbols)
            {
                // Floor well above a total loss.
                record.returns[symbol] = std::max(-0.95, dist(gen));
            }
            records.push_back(record);
        }

        return records;
    }

    std::string DataLoader::add_months(const std::string &start_month, int offset)
    {
        bool valid = start_month.size() >= 7 && start_month[4] == '-';
        for (size_t i = 0; valid && i < 7; ++i)
        {
            if (i != 4 && !std::isdigit(static_cast<unsigned char>(start_month[i])))
                valid = false;
        }
        if (!valid)
        {
            throw InvalidInputError("Expected month in YYYY-MM format, got: " + start_month);
        }

        int year = std::stoi(start_month.substr(0, 4));
        int month = std::stoi(start_month.substr(5, 2));
        if (month < 1 || month > 12)
        {
            throw InvalidInputError("Month out of range in: " + start_month);
        }

        int total = year * 12 + (month - 1) + offset;
        std::ostringstream oss;
        oss << std::setw(4) << std::setfill('0') << total / 12 << "-"
            << std::setw(2) << std::setfill('0') << total % 12 + 1;
        return oss.str();
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_monthly_returns_csv(const std::vector<MonthlyReturnRecord> &records,
                                              const std::string &filepath,
                                              const std::vector<std::string> &symbols)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        std::vector<std::string> columns = symbols;
        if (columns.empty() && !records.empty())
        {
            for (const auto &kv : records.front().returns)
            {
                columns.push_back(kv.first);
            }
        }

        file << "month";
        for (const auto &symbol : columns)
        {
            file << "," << symbol;
        }
        file << "\n";

        for (const auto &record : records)
        {
            file << record.month;
            for (const auto &symbol : columns)
            {
                file << "," << std::setprecision(10) << record.return_for(symbol);
            }
            file << "\n";
        }
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<size_t> DataLoader::select_columns(const std::vector<std::string> &header,
                                                   const std::vector<std::string> &symbols,
                                                   std::vector<std::string> &selected)
    {
        std::vector<std::string> all_symbols;
        for (size_t i = 1; i < header.size(); ++i)
        {
            all_symbols.push_back(trim(header[i]));
        }

        std::vector<size_t> columns;
        selected.clear();

        if (symbols.empty())
        {
            for (size_t i = 0; i < all_symbols.size(); ++i)
            {
                columns.push_back(i + 1);
                selected.push_back(all_symbols[i]);
            }
        }
        else
        {
            for (const auto &symbol : symbols)
            {
                auto it = std::find(all_symbols.begin(), all_symbols.end(), symbol);
                if (it == all_symbols.end())
                {
                    throw InvalidInputError("Symbol '" + symbol + "' not found in CSV header");
                }
                columns.push_back(static_cast<size_t>(std::distance(all_symbols.begin(), it)) + 1);
                selected.push_back(symbol);
            }
        }

        if (columns.empty())
        {
            throw std::runtime_error("CSV header has no symbol columns");
        }
        return columns;
    }

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

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::logic_error &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace portsim
