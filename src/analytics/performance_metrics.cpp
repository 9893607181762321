/**
 * @file performance_metrics.cpp
 * @brief Implementation of PerformanceMetrics.
 *
 * All statistics are computed on demand from the stored value series.
 */

#include "portsim/analytics/performance_metrics.hpp"
#include "portsim/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace portsim
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const std::vector<double> &nav_series,
                                               const std::vector<std::string> &labels,
                                               int periods_per_year)
            : nav_series_(nav_series), labels_(labels), periods_per_year_(periods_per_year)
        {
            if (nav_series_.size() < 2)
            {
                throw InvalidInputError(
                    "NAV series must have at least 2 elements, got: " + std::to_string(nav_series_.size()));
            }
            if (nav_series_.size() != labels_.size())
            {
                throw InvalidInputError(
                    "NAV series size (" + std::to_string(nav_series_.size()) + ") must match labels size (" + std::to_string(labels_.size()) + ")");
            }
            if (!(nav_series_.front() > 0.0))
            {
                throw InvalidInputError("Initial value must be positive");
            }
            if (periods_per_year_ < 1)
            {
                throw InvalidInputError(
                    "Expected positive value for parameter 'periods_per_year', got: " + std::to_string(periods_per_year_));
            }
        }

        // ===================================================================
        // Return Metrics
        // ===================================================================

        int PerformanceMetrics::num_periods() const
        {
            return static_cast<int>(nav_series_.size()) - 1;
        }

        double PerformanceMetrics::final_value() const
        {
            return nav_series_.back();
        }

        double PerformanceMetrics::total_return() const
        {
            return nav_series_.back() / nav_series_.front() - 1.0;
        }

        double PerformanceMetrics::cagr() const
        {
            double ratio = nav_series_.back() / nav_series_.front();
            if (ratio <= 0.0)
            {
                // Total loss: a fractional power of a non-positive base is not real.
                return -1.0;
            }

            double exponent = static_cast<double>(periods_per_year_) / static_cast<double>(num_periods());
            double result = std::pow(ratio, exponent) - 1.0;
            if (!std::isfinite(result))
            {
                std::ostringstream msg;
                msg << "CAGR is not finite for growth ratio " << ratio << " over " << num_periods() << " periods";
                throw ComputationError(msg.str());
            }
            return result;
        }

        std::vector<double> PerformanceMetrics::period_returns() const
        {
            std::vector<double> returns;
            returns.reserve(nav_series_.size() - 1);
            for (size_t i = 1; i < nav_series_.size(); ++i)
            {
                double prev = nav_series_[i - 1];
                returns.push_back(prev > 0.0 ? nav_series_[i] / prev - 1.0 : 0.0);
            }
            return returns;
        }

        std::vector<YearlyReturn> PerformanceMetrics::yearly_returns() const
        {
            std::vector<YearlyReturn> buckets;
            int n = num_periods();

            for (int start = 0, k = 0; start < n; start += periods_per_year_, ++k)
            {
                int end = std::min(start + periods_per_year_, n);

                YearlyReturn y;
                y.year_index = k;
                y.start_month = labels_[static_cast<size_t>(start)];
                y.end_month = labels_[static_cast<size_t>(end)];
                y.months = end - start;
                y.start_value = nav_series_[static_cast<size_t>(start)];
                y.end_value = nav_series_[static_cast<size_t>(end)];
                y.value = (y.start_value > 0.0) ? (y.end_value / y.start_value - 1.0) : 0.0;
                buckets.push_back(y);
            }

            return buckets;
        }

        YearlyReturn PerformanceMetrics::best_year() const
        {
            auto buckets = yearly_returns();
            auto it = std::max_element(buckets.begin(), buckets.end(),
                                       [](const YearlyReturn &a, const YearlyReturn &b)
                                       {
                                           return a.value < b.value;
                                       });
            return *it;
        }

        YearlyReturn PerformanceMetrics::worst_year() const
        {
            auto buckets = yearly_returns();
            auto it = std::min_element(buckets.begin(), buckets.end(),
                                       [](const YearlyReturn &a, const YearlyReturn &b)
                                       {
                                           return a.value < b.value;
                                       });
            return *it;
        }

        // ===================================================================
        // Risk Metrics
        // ===================================================================

        double PerformanceMetrics::max_drawdown() const
        {
            auto dd = drawdown_series();
            return *std::min_element(dd.begin(), dd.end());
        }

        std::vector<double> PerformanceMetrics::drawdown_series() const
        {
            std::vector<double> dd(nav_series_.size());

            // The running peak starts at the initial value, which is positive.
            double peak = nav_series_.front();
            for (size_t i = 0; i < nav_series_.size(); ++i)
            {
                if (nav_series_[i] > peak)
                {
                    peak = nav_series_[i];
                }
                dd[i] = (nav_series_[i] - peak) / peak;
            }
            return dd;
        }

    } // namespace analytics
} // namespace portsim
