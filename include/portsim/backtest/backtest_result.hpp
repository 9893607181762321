// SPDX-License-Identifier: MIT
#ifndef PORTSIM_BACKTEST_BACKTEST_RESULT_HPP
#define PORTSIM_BACKTEST_BACKTEST_RESULT_HPP

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "portsim/analytics/drawdown_analysis.hpp"
#include "portsim/analytics/performance_metrics.hpp"
#include "portsim/backtest/portfolio.hpp"

namespace portsim
{
    namespace backtest
    {

        /**
         * @struct BacktestResult
         * @brief Value trajectory and derived statistics of one backtest run.
         *
         * portfolio_history holds month 0 (the initial capital) followed by one
         * value per simulated month, so its size is the number of return
         * records plus one. period_labels is aligned with it; the first label
         * is "inception". monthly_returns has one entry per simulated month.
         */
        struct BacktestResult
        {
            std::string strategy;
            std::vector<std::string> symbols;
            double initial_capital = 0.0;

            double final_value = 0.0;
            double total_return = 0.0;
            double cagr = 0.0;
            double max_drawdown = 0.0; ///< Non-positive; -0.2 = 20% below peak

            analytics::YearlyReturn best_year;
            analytics::YearlyReturn worst_year;
            std::vector<analytics::YearlyReturn> yearly_returns;

            std::vector<double> portfolio_history;
            std::vector<std::string> period_labels;
            std::vector<double> monthly_returns;
            std::vector<PortfolioSnapshot> snapshots;
            int rebalance_count = 0;

            int num_months() const { return static_cast<int>(monthly_returns.size()); }

            /**
             * @brief The last n (month, return) pairs, oldest first.
             */
            std::vector<std::pair<std::string, double>> recent_monthly_returns(size_t n) const;

            /**
             * @brief Drawdown events of the value trajectory.
             * @throws InvalidInputError If the result holds no trajectory.
             */
            analytics::DrawdownAnalysis drawdown_analysis() const;

            // -------------------------------------------------------------------
            // Export
            // -------------------------------------------------------------------

            /**
             * @brief Write a readable performance report.
             *
             * Sections: header, performance summary, key insight (best/worst
             * year), the last @p recent_months monthly returns and the deepest
             * drawdowns.
             */
            void print_summary(std::ostream &out, int recent_months = 12) const;

            /**
             * @brief Export the trajectory to CSV.
             *
             * Columns: month, value, monthly_return, cumulative_return, drawdown.
             *
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_history_to_csv(const std::string &filepath) const;

            /** @brief All metrics, yearly buckets and the trajectory as JSON. */
            nlohmann::json to_json() const;

            /**
             * @brief Write to_json() to a file.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_to_json(const std::string &filepath) const;
        };

        /** @brief Signed percentage with two decimals, e.g. "+1.30%". */
        std::string format_percent(double fraction);

    } // namespace backtest
} // namespace portsim

#endif // PORTSIM_BACKTEST_BACKTEST_RESULT_HPP
