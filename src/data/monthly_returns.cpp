/**
 * @file monthly_returns.cpp
 * @brief Validation and layout helpers for MonthlyReturnRecord sequences
 */

#include "portsim/data/monthly_returns.hpp"
#include "portsim/errors.hpp"

#include <cmath>
#include <sstream>

namespace portsim
{

    bool MonthlyReturnRecord::covers(const std::string &symbol) const
    {
        return returns.find(symbol) != returns.end();
    }

    double MonthlyReturnRecord::return_for(const std::string &symbol) const
    {
        auto it = returns.find(symbol);
        if (it == returns.end())
        {
            throw InvalidInputError("Month " + month + " has no return for symbol '" + symbol + "'");
        }
        return it->second;
    }

    void validate_monthly_returns(const std::vector<MonthlyReturnRecord> &records,
                                  const std::vector<std::string> &symbols)
    {
        if (records.empty())
        {
            throw InvalidInputError("monthly_returns must not be empty");
        }

        for (size_t i = 0; i < records.size(); ++i)
        {
            const auto &record = records[i];

            if (record.month.empty())
            {
                throw InvalidInputError("Record " + std::to_string(i) + " has an empty month identifier");
            }
            if (i > 0 && !(records[i - 1].month < record.month))
            {
                throw InvalidInputError("Months must be strictly increasing: '" + records[i - 1].month +
                                        "' is followed by '" + record.month + "'");
            }

            for (const auto &symbol : symbols)
            {
                double r = record.return_for(symbol);
                if (!std::isfinite(r) || r < -1.0)
                {
                    std::ostringstream msg;
                    msg << "Invalid return " << r << " for '" << symbol << "' in month " << record.month
                        << " (must be finite and >= -1.0)";
                    throw InvalidInputError(msg.str());
                }
            }
        }
    }

    Eigen::MatrixXd to_return_matrix(const std::vector<MonthlyReturnRecord> &records,
                                     const std::vector<std::string> &symbols)
    {
        validate_monthly_returns(records, symbols);

        Eigen::MatrixXd returns(static_cast<int>(records.size()), static_cast<int>(symbols.size()));
        for (size_t i = 0; i < records.size(); ++i)
        {
            for (size_t j = 0; j < symbols.size(); ++j)
            {
                returns(static_cast<int>(i), static_cast<int>(j)) = records[i].return_for(symbols[j]);
            }
        }
        return returns;
    }

    std::vector<MonthlyReturnRecord> filter_by_month(const std::vector<MonthlyReturnRecord> &records,
                                                     const std::string &start_month,
                                                     const std::string &end_month)
    {
        if (!start_month.empty() && !end_month.empty() && end_month < start_month)
        {
            throw InvalidInputError("Start month must not be after end month");
        }

        std::vector<MonthlyReturnRecord> filtered;
        for (const auto &record : records)
        {
            // Compare on the prefix so "2020-01" matches "2020-01-31".
            const std::string &key = record.month;
            if (!start_month.empty() && key.compare(0, start_month.size(), start_month) < 0)
                continue;
            if (!end_month.empty() && key.compare(0, end_month.size(), end_month) > 0)
                continue;
            filtered.push_back(record);
        }
        return filtered;
    }

} // namespace portsim
