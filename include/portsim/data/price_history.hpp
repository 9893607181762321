/*
 * @file price_history.hpp
 * @brief Daily price table and its conversion into monthly return records.
 *
 * Stores historical prices as an Eigen matrix (dates x assets) with the
 * associated date and ticker indices. Produces month-end samples and the
 * monthly return records the backtest engine consumes.
 */

#ifndef PORTSIM_DATA_PRICE_HISTORY_HPP
#define PORTSIM_DATA_PRICE_HISTORY_HPP

#include "portsim/data/monthly_returns.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace portsim
{

    /**
     * @class PriceHistory
     * @brief Container for multi-asset price series keyed by date.
     *
     * @note Dates are YYYY-MM-DD strings in ascending order.
     * @note Missing prices are represented as NaN values.
     */
    class PriceHistory
    {
    public:
        /**
         * @brief Constructor with data.
         * @param prices Price matrix (dates x assets).
         * @param dates Vector of date strings, ascending.
         * @param tickers Vector of asset ticker symbols.
         * @throws std::invalid_argument On dimension mismatch or unordered dates.
         */
        PriceHistory(const Eigen::MatrixXd &prices,
                     const std::vector<std::string> &dates,
                     const std::vector<std::string> &tickers);

        ~PriceHistory() = default;

        const Eigen::MatrixXd &prices() const
        {
            return prices_;
        }

        const std::vector<std::string> &dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return dates_.size();
        }

        size_t num_assets() const
        {
            return tickers_.size();
        }

        /**
         * @brief Get prices for a specific asset.
         * @throws std::invalid_argument If the ticker is unknown.
         */
        Eigen::VectorXd get_prices(const std::string &ticker) const;

        /**
         * @brief Drop every date row that has a missing price.
         */
        PriceHistory drop_missing() const;

        /**
         * @brief Sample the last available price of each calendar month.
         *
         * Each asset takes its last non-missing price within the month. A
         * month where some asset has no price at all is dropped. Each
         * sampled row carries the last date seen in its month.
         */
        PriceHistory to_month_end() const;

        /**
         * @brief Simple returns between consecutive month-end prices.
         *
         * Each record is labeled with the later month (YYYY-MM).
         *
         * @throws InvalidInputError If fewer than two month-end rows exist.
         */
        std::vector<MonthlyReturnRecord> monthly_returns() const;

    private:
        Eigen::MatrixXd prices_;
        std::vector<std::string> dates_;
        std::vector<std::string> tickers_;
        std::map<std::string, int> ticker_index_;

        int find_ticker_index(const std::string &ticker) const;
        PriceHistory select_rows(const std::vector<int> &rows) const;
    };

} // namespace portsim

#endif // PORTSIM_DATA_PRICE_HISTORY_HPP
