/**
 * @file monthly_returns.hpp
 * @brief Monthly per-asset return records consumed by the backtest engine.
 */

#ifndef PORTSIM_DATA_MONTHLY_RETURNS_HPP
#define PORTSIM_DATA_MONTHLY_RETURNS_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace portsim
{

    /**
     * @struct MonthlyReturnRecord
     * @brief One calendar month's fractional return for every tracked symbol.
     *
     * The month identifier is a sortable string (YYYY-MM). A return of 0.013
     * means +1.3% over the month.
     */
    struct MonthlyReturnRecord
    {
        std::string month;                     ///< Month identifier (YYYY-MM)
        std::map<std::string, double> returns; ///< Symbol -> fractional return

        bool covers(const std::string &symbol) const;

        /**
         * @brief Return for a symbol in this month.
         * @throws InvalidInputError If the symbol is not present.
         */
        double return_for(const std::string &symbol) const;
    };

    /**
     * @brief Check that records are non-empty, strictly ordered by month and
     *        carry a usable return for every symbol.
     *
     * A usable return is finite and not below -1.0 (a total loss).
     *
     * @throws InvalidInputError On the first violation found.
     */
    void validate_monthly_returns(const std::vector<MonthlyReturnRecord> &records,
                                  const std::vector<std::string> &symbols);

    /**
     * @brief Lay the records out as a (months x symbols) matrix.
     *
     * Column order follows @p symbols. Records are validated first.
     *
     * @throws InvalidInputError If validation fails.
     */
    Eigen::MatrixXd to_return_matrix(const std::vector<MonthlyReturnRecord> &records,
                                     const std::vector<std::string> &symbols);

    /**
     * @brief Keep records whose month lies in [start_month, end_month].
     *
     * An empty bound is open. Bounds compare as strings, so "2020-01" keeps
     * every record of January 2020 regardless of the identifier's day part.
     */
    std::vector<MonthlyReturnRecord> filter_by_month(const std::vector<MonthlyReturnRecord> &records,
                                                     const std::string &start_month,
                                                     const std::string &end_month);

} // namespace portsim

#endif // PORTSIM_DATA_MONTHLY_RETURNS_HPP
