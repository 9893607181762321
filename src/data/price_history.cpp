/**
 * @file price_history.cpp
 * @brief Implementation of PriceHistory
 */

#include "portsim/data/price_history.hpp"
#include "portsim/errors.hpp"

#include <cmath>
#include <stdexcept>

namespace portsim
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceHistory::PriceHistory(const Eigen::MatrixXd &prices,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<int>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<int>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }
        for (size_t i = 1; i < dates_.size(); ++i)
        {
            if (!(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument("Dates must be strictly ascending: '" + dates_[i - 1] +
                                            "' followed by '" + dates_[i] + "'");
            }
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            ticker_index_[tickers_[i]] = static_cast<int>(i);
        }
    }

    // ============================================================================
    // Data Access
    // ============================================================================

    Eigen::VectorXd PriceHistory::get_prices(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return prices_.col(idx);
    }

    // ============================================================================
    // Sampling
    // ============================================================================

    PriceHistory PriceHistory::drop_missing() const
    {
        std::vector<int> rows;
        for (int i = 0; i < prices_.rows(); ++i)
        {
            if (!prices_.row(i).hasNaN())
            {
                rows.push_back(i);
            }
        }
        return select_rows(rows);
    }

    PriceHistory PriceHistory::to_month_end() const
    {
        std::vector<std::string> month_dates;
        std::vector<Eigen::VectorXd> month_rows;

        size_t begin = 0;
        while (begin < dates_.size())
        {
            size_t end = begin + 1;
            while (end < dates_.size() && dates_[end].substr(0, 7) == dates_[begin].substr(0, 7))
            {
                ++end;
            }

            // Each column takes its last valid price within the month.
            Eigen::VectorXd row(prices_.cols());
            bool complete = true;
            for (int j = 0; j < prices_.cols() && complete; ++j)
            {
                complete = false;
                for (size_t i = end; i > begin; --i)
                {
                    double p = prices_(static_cast<int>(i - 1), j);
                    if (!std::isnan(p))
                    {
                        row(j) = p;
                        complete = true;
                        break;
                    }
                }
            }

            if (complete)
            {
                month_dates.push_back(dates_[end - 1]);
                month_rows.push_back(row);
            }
            begin = end;
        }

        Eigen::MatrixXd sampled(static_cast<int>(month_rows.size()), prices_.cols());
        for (size_t i = 0; i < month_rows.size(); ++i)
        {
            sampled.row(static_cast<int>(i)) = month_rows[i].transpose();
        }
        return PriceHistory(sampled, month_dates, tickers_);
    }

    std::vector<MonthlyReturnRecord> PriceHistory::monthly_returns() const
    {
        PriceHistory month_end = to_month_end();
        const Eigen::MatrixXd &p = month_end.prices_;

        if (p.rows() < 2)
        {
            throw InvalidInputError("Need at least 2 month-end price observations to calculate monthly returns, got " +
                                    std::to_string(p.rows()));
        }

        std::vector<MonthlyReturnRecord> records;
        records.reserve(static_cast<size_t>(p.rows() - 1));

        for (int i = 1; i < p.rows(); ++i)
        {
            MonthlyReturnRecord record;
            record.month = month_end.dates_[static_cast<size_t>(i)].substr(0, 7);
            for (int j = 0; j < p.cols(); ++j)
            {
                double p_tm1 = p(i - 1, j);
                if (!(p_tm1 > 0.0))
                {
                    throw InvalidInputError("Non-positive price for " + tickers_[static_cast<size_t>(j)] +
                                            " on " + month_end.dates_[static_cast<size_t>(i - 1)]);
                }
                record.returns[tickers_[static_cast<size_t>(j)]] = p(i, j) / p_tm1 - 1.0;
            }
            records.push_back(record);
        }

        return records;
    }

    // ============================================================================
    // Private Helpers
    // ============================================================================

    int PriceHistory::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        return (it != ticker_index_.end()) ? it->second : -1;
    }

    PriceHistory PriceHistory::select_rows(const std::vector<int> &rows) const
    {
        Eigen::MatrixXd selected(static_cast<int>(rows.size()), prices_.cols());
        std::vector<std::string> selected_dates;
        selected_dates.reserve(rows.size());

        for (size_t i = 0; i < rows.size(); ++i)
        {
            selected.row(static_cast<int>(i)) = prices_.row(rows[i]);
            selected_dates.push_back(dates_[static_cast<size_t>(rows[i])]);
        }

        return PriceHistory(selected, selected_dates, tickers_);
    }

} // namespace portsim
