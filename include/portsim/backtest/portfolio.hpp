// SPDX-License-Identifier: MIT
#ifndef PORTSIM_BACKTEST_PORTFOLIO_HPP
#define PORTSIM_BACKTEST_PORTFOLIO_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>

#include "portsim/data/allocation.hpp"

namespace portsim {
namespace backtest {

/**
 * @struct PortfolioState
 * @brief Dollar value held in each symbol plus uninvested cash
 *
 * values is aligned with Allocation::symbols(). No entry is negative.
 */
struct PortfolioState {
    Eigen::VectorXd values;   ///< Dollar value per symbol
    double cash = 0.0;        ///< Uninvested cash (zero once fully invested)

    double nav() const;
    double invested_value() const;
    Eigen::VectorXd weights() const;
};

/**
 * @struct PortfolioSnapshot
 * @brief Point-in-time view of portfolio state at a month boundary
 */
struct PortfolioSnapshot {
    std::string month;                       ///< Month label ("inception" for month 0)
    int month_index = 0;                     ///< 0 = initial allocation
    double nav = 0.0;                        ///< Total portfolio value
    Eigen::VectorXd values;                  ///< Dollar value per symbol (after any rebalance)
    Eigen::VectorXd weights;                 ///< Weights per symbol (after any rebalance)
    double monthly_return = 0.0;             ///< Return since previous snapshot
    double cumulative_return = 0.0;          ///< Return since inception
    bool rebalanced = false;                 ///< Weights were reset to target this month
};

/**
 * @brief Split capital across symbols by target weight.
 * @throws InvalidInputError If capital is not positive and finite.
 */
PortfolioState allocate(double capital, const Allocation& allocation);

/**
 * @brief Grow each holding by its return for the month.
 *
 * Cash is carried over unchanged.
 *
 * @throws InvalidInputError If the return vector does not match the holdings
 *         or a return is below -1.0.
 */
PortfolioState apply_returns(const PortfolioState& state, const Eigen::VectorXd& returns);

/**
 * @brief Redistribute total value (cash included) to the target weights.
 *
 * The total portfolio value is preserved.
 */
PortfolioState rebalance_to(const PortfolioState& state, const Allocation& allocation);

PortfolioSnapshot make_snapshot(const PortfolioState& state,
                                const std::string& month,
                                int month_index,
                                double previous_nav,
                                double initial_capital,
                                bool rebalanced);

} // namespace backtest
} // namespace portsim

#endif // PORTSIM_BACKTEST_PORTFOLIO_HPP
