/**
 * @file drawdown_analysis.hpp
 * @brief Drawdown event decomposition for a monthly portfolio value series.
 *
 * A drawdown event is a contiguous run of months where the portfolio value
 * sits below a prior peak. Each event has a peak, a trough, and a recovery
 * month if the value regains the peak before the series ends.
 */

#ifndef PORTSIM_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
#define PORTSIM_ANALYTICS_DRAWDOWN_ANALYSIS_HPP

#include <string>
#include <vector>

namespace portsim
{
    namespace analytics
    {

        /**
         * @struct DrawdownEvent
         * @brief One peak-to-trough-to-recovery cycle.
         *
         * recovery_index is -1 and recovery_month is empty when the value has
         * not recovered by the end of the series.
         */
        struct DrawdownEvent
        {
            int peak_index = 0;
            int trough_index = 0;
            int recovery_index = -1;

            std::string peak_month;
            std::string trough_month;
            std::string recovery_month;

            double peak_value = 0.0;
            double trough_value = 0.0;
            double depth = 0.0; ///< Positive fraction, 0.15 = 15% below peak

            int decline_months = 0;   ///< Months from peak to trough
            int recovery_months = -1; ///< Months from trough to recovery (-1 if unrecovered)

            bool recovered() const { return recovery_index >= 0; }
        };

        /**
         * @class DrawdownAnalysis
         * @brief Identifies every drawdown event in a value series.
         *
         * Usage:
         * @code
         *   DrawdownAnalysis analysis(result.portfolio_history, result.period_labels);
         *   auto top3 = analysis.top_drawdowns(3);
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class DrawdownAnalysis
        {
        public:
            /**
             * @param nav_series Portfolio values (at least 2 elements, first > 0).
             * @param labels Month labels aligned with nav_series.
             * @throws InvalidInputError On short series, misaligned labels or a
             *         non-positive first value.
             */
            DrawdownAnalysis(const std::vector<double> &nav_series,
                             const std::vector<std::string> &labels);

            ~DrawdownAnalysis() = default;

            /** @brief Events in chronological order. */
            const std::vector<DrawdownEvent> &all_events() const;

            /**
             * @brief The n deepest events, deepest first.
             * @throws InvalidInputError If n < 1.
             */
            std::vector<DrawdownEvent> top_drawdowns(int n) const;

            /**
             * @throws std::runtime_error If the series never draws down.
             */
            const DrawdownEvent &worst_drawdown() const;

            int event_count() const;
            int unrecovered_count() const;

            /** @brief Fraction of months spent below a prior peak. */
            double time_in_drawdown() const;

            /** @brief Drawdown at each point; 0.0 at a peak, -0.10 ten percent below. */
            const std::vector<double> &underwater_curve() const;

            /**
             * @brief Formatted table of the deepest events.
             * @param max_events Events to include (-1 for all).
             */
            std::string report(int max_events = -1) const;

        private:
            void compute_underwater_curve();
            void identify_events();
            void close_event(int peak_idx, int trough_idx, int recovery_idx);

            std::vector<double> nav_series_;
            std::vector<std::string> labels_;
            std::vector<DrawdownEvent> events_;
            std::vector<double> underwater_curve_;
            int worst_event_index_;
        };

    } // namespace analytics
} // namespace portsim

#endif // PORTSIM_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
