// SPDX-License-Identifier: MIT
#pragma once

#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "portsim/data/allocation.hpp"
#include "portsim/data/data_loader.hpp"
#include "portsim/data/monthly_returns.hpp"
#include "portsim/backtest/backtest_result.hpp"
#include "portsim/backtest/portfolio.hpp"
#include "portsim/backtest/rebalance_scheduler.hpp"

namespace portsim
{
    namespace backtest
    {

        struct BacktestParams
        {
            double initial_capital = 10000.0;
            RebalanceConfig rebalance;
            bool verbose = false;

            static BacktestParams from_config(const portsim::BacktestConfig &config);
        };

        /**
         * @class BacktestEngine
         * @brief Replays monthly returns over a fixed target allocation.
         *
         * Month 0 splits the capital by weight. Every following month grows each
         * holding by its return; on months that close a rebalance period the
         * total is redistributed to the target weights. The run is pure: inputs
         * are never modified and equal inputs give bit-identical results.
         */
        class BacktestEngine
        {
        public:
            /**
             * @throws InvalidInputError If capital is not positive or the
             *         rebalance period is negative.
             */
            explicit BacktestEngine(const BacktestParams &params);
            ~BacktestEngine() = default;

            /**
             * @brief Run the backtest.
             * @throws InvalidInputError If records are empty, unordered, miss an
             *         allocation symbol or carry a return below -1.0.
             * @throws ComputationError If a portfolio value stops being finite.
             */
            BacktestResult run(const std::vector<MonthlyReturnRecord> &monthly_returns,
                               const Allocation &allocation) const;

            /**
             * @brief Advance one month: apply returns, then rebalance if month_index
             *        closes a rebalance period.
             */
            PortfolioState step(const PortfolioState &previous,
                                const Eigen::VectorXd &returns,
                                int month_index,
                                const Allocation &allocation) const;

            const BacktestParams &params() const { return params_; }
            const RebalanceScheduler &scheduler() const { return scheduler_; }

        private:
            BacktestParams params_;
            RebalanceScheduler scheduler_;
        };

        /**
         * @brief Functional entry point.
         *
         * @param monthly_returns Chronological monthly return records.
         * @param allocation Symbol -> weight, summing to 1.0.
         * @param initial_capital Positive starting value.
         * @param rebalance_frequency Months between rebalances, 0 = Buy & Hold.
         * @throws InvalidInputError On malformed input.
         */
        BacktestResult run_backtest(const std::vector<MonthlyReturnRecord> &monthly_returns,
                                    const std::map<std::string, double> &allocation,
                                    double initial_capital,
                                    int rebalance_frequency);

    } // namespace backtest
} // namespace portsim
