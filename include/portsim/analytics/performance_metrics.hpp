/**
 * @file performance_metrics.hpp
 * @brief Aggregate statistics derived from a monthly portfolio value series.
 *
 * The series starts with the initial capital at month 0 and holds one value
 * per simulated month after that. Annualization assumes 12 periods per year
 * unless configured otherwise.
 */

#ifndef PORTSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
#define PORTSIM_ANALYTICS_PERFORMANCE_METRICS_HPP

#include <string>
#include <vector>

namespace portsim
{
    namespace analytics
    {

        /**
         * @struct YearlyReturn
         * @brief Return over one 12-month bucket anchored to the first month.
         *
         * Bucket k spans values[12k] to values[min(12k + 12, n)], where n is the
         * number of simulated months. The last bucket may be partial.
         */
        struct YearlyReturn
        {
            int year_index = 0;       ///< 0-based bucket index (year 1 = index 0)
            std::string start_month;  ///< Label of the bucket's opening value
            std::string end_month;    ///< Label of the bucket's closing value
            int months = 0;           ///< Months covered (12 unless partial)
            double start_value = 0.0; ///< Portfolio value at bucket start
            double end_value = 0.0;   ///< Portfolio value at bucket end
            double value = 0.0;       ///< end_value / start_value - 1 (0 if start_value is 0)
        };

        /**
         * @class PerformanceMetrics
         * @brief Return and drawdown statistics for a portfolio value series.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(history, labels);
         *   double cagr = metrics.cagr();
         *   double dd = metrics.max_drawdown();   // <= 0
         *   auto best = metrics.best_year();
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class PerformanceMetrics
        {
        public:
            /**
             * @brief Construct from a value series and aligned period labels.
             * @param nav_series Portfolio values, month 0 first (at least 2 elements).
             * @param labels Period labels aligned with nav_series.
             * @param periods_per_year Periods in one year (default 12).
             * @throws InvalidInputError If the series is too short, labels are
             *         misaligned, the first value is not positive, or
             *         periods_per_year < 1.
             */
            PerformanceMetrics(const std::vector<double> &nav_series,
                               const std::vector<std::string> &labels,
                               int periods_per_year = 12);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            /** @brief Number of simulated periods (nav_series.size() - 1). */
            int num_periods() const;

            double final_value() const;

            /**
             * @brief Total cumulative return, final / initial - 1.
             */
            double total_return() const;

            /**
             * @brief Compound annual growth rate.
             *
             * (final / initial)^(periods_per_year / n) - 1, which annualizes
             * partial-year spans as well.
             *
             * A non-positive final/initial ratio is a total loss and yields
             * exactly -1.0 rather than a non-real power.
             *
             * @throws ComputationError If the result is not finite.
             */
            double cagr() const;

            /**
             * @brief Per-period returns, values[i] / values[i-1] - 1.
             * @return Vector of size n. A period starting from 0 has return 0.
             */
            std::vector<double> period_returns() const;

            /**
             * @brief Returns over consecutive 12-period buckets.
             * @return At least one bucket; the last one may be partial.
             */
            std::vector<YearlyReturn> yearly_returns() const;

            /** @brief Bucket with the highest return (earliest on ties). */
            YearlyReturn best_year() const;

            /** @brief Bucket with the lowest return (earliest on ties). */
            YearlyReturn worst_year() const;

            // ---------------------------------------------------------------
            // Risk Metrics
            // ---------------------------------------------------------------

            /**
             * @brief Largest peak-to-trough decline.
             * @return Non-positive fraction; -0.15 means 15% below the running peak.
             *         0.0 for a non-decreasing series.
             */
            double max_drawdown() const;

            /**
             * @brief Drawdown from the running peak at every point.
             * @return Vector aligned with nav_series; values are non-positive.
             */
            std::vector<double> drawdown_series() const;

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            const std::vector<double> &nav_series() const { return nav_series_; }
            const std::vector<std::string> &labels() const { return labels_; }
            int periods_per_year() const { return periods_per_year_; }

        private:
            std::vector<double> nav_series_;
            std::vector<std::string> labels_;
            int periods_per_year_;
        };

    } // namespace analytics
} // namespace portsim

#endif // PORTSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
