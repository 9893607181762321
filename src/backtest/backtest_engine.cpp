// SPDX-License-Identifier: MIT

#include "portsim/backtest/backtest_engine.hpp"
#include "portsim/analytics/performance_metrics.hpp"
#include "portsim/errors.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace portsim
{
    namespace backtest
    {

        // ------------------------- BacktestParams -------------------------------
        BacktestParams BacktestParams::from_config(const portsim::BacktestConfig &config)
        {
            BacktestParams p;
            p.initial_capital = config.initial_capital;
            p.rebalance = config.rebalance;
            p.verbose = config.verbose;
            return p;
        }

        // ------------------------- BacktestEngine -------------------------------
        BacktestEngine::BacktestEngine(const BacktestParams &params)
            : params_(params), scheduler_(params.rebalance)
        {
            if (!std::isfinite(params_.initial_capital) || !(params_.initial_capital > 0.0))
            {
                std::ostringstream msg;
                msg << "initial_capital must be greater than 0, got " << params_.initial_capital;
                throw InvalidInputError(msg.str());
            }
        }

        PortfolioState BacktestEngine::step(const PortfolioState &previous,
                                            const Eigen::VectorXd &returns,
                                            int month_index,
                                            const Allocation &allocation) const
        {
            PortfolioState next = apply_returns(previous, returns);
            if (scheduler_.should_rebalance(month_index))
            {
                next = rebalance_to(next, allocation);
            }
            return next;
        }

        // ------------------------- Run method ----------------------------------
        BacktestResult BacktestEngine::run(const std::vector<MonthlyReturnRecord> &monthly_returns,
                                           const Allocation &allocation) const
        {
            const std::vector<std::string> &symbols = allocation.symbols();
            const double capital = params_.initial_capital;

            // Validates ordering, coverage and return bounds before any state exists.
            Eigen::MatrixXd returns = to_return_matrix(monthly_returns, symbols);
            const int num_months = static_cast<int>(returns.rows());

            BacktestResult result;
            result.strategy = params_.rebalance.label();
            result.symbols = symbols;
            result.initial_capital = capital;
            result.portfolio_history.reserve(static_cast<size_t>(num_months) + 1);
            result.period_labels.reserve(static_cast<size_t>(num_months) + 1);
            result.snapshots.reserve(static_cast<size_t>(num_months) + 1);

            PortfolioState state = allocate(capital, allocation);
            result.portfolio_history.push_back(capital);
            result.period_labels.push_back("inception");
            result.snapshots.push_back(make_snapshot(state, "inception", 0, capital, capital, false));

            if (params_.verbose)
            {
                std::cerr << "Backtest: " << num_months << " months, " << symbols.size()
                          << " symbols, strategy '" << result.strategy << "'\n";
            }

            for (int i = 1; i <= num_months; ++i)
            {
                const std::string &month = monthly_returns[static_cast<size_t>(i - 1)].month;
                const bool rebalanced = scheduler_.should_rebalance(i);

                state = step(state, returns.row(i - 1).transpose(), i, allocation);

                double nav = state.nav();
                if (!std::isfinite(nav))
                {
                    throw ComputationError("Portfolio value is not finite in month " + month);
                }

                double previous_nav = result.portfolio_history.back();
                result.portfolio_history.push_back(nav);
                result.period_labels.push_back(month);
                result.snapshots.push_back(make_snapshot(state, month, i, previous_nav, capital, rebalanced));

                if (rebalanced)
                {
                    ++result.rebalance_count;
                    if (params_.verbose)
                    {
                        std::cerr << "Rebalanced on " << month << " (month " << i << "), value " << nav << "\n";
                    }
                }
            }

            analytics::PerformanceMetrics metrics(result.portfolio_history, result.period_labels);
            result.final_value = metrics.final_value();
            result.total_return = result.final_value / capital - 1.0;
            result.cagr = metrics.cagr();
            result.max_drawdown = metrics.max_drawdown();
            result.monthly_returns = metrics.period_returns();
            result.yearly_returns = metrics.yearly_returns();
            result.best_year = metrics.best_year();
            result.worst_year = metrics.worst_year();

            return result;
        }

        BacktestResult run_backtest(const std::vector<MonthlyReturnRecord> &monthly_returns,
                                    const std::map<std::string, double> &allocation,
                                    double initial_capital,
                                    int rebalance_frequency)
        {
            BacktestParams params;
            params.initial_capital = initial_capital;
            params.rebalance = RebalanceConfig::from_months(rebalance_frequency);

            BacktestEngine engine(params);
            return engine.run(monthly_returns, Allocation(allocation));
        }

    } // namespace backtest
} // namespace portsim
