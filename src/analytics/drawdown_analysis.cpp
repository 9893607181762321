/**
 * @file drawdown_analysis.cpp
 * @brief Implementation of the DrawdownAnalysis class.
 *
 * Events are found in one pass by tracking the running peak and the
 * transitions into and out of drawdown.
 */

#include "portsim/analytics/drawdown_analysis.hpp"
#include "portsim/errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace portsim
{
    namespace analytics
    {

        DrawdownAnalysis::DrawdownAnalysis(const std::vector<double> &nav_series,
                                           const std::vector<std::string> &labels)
            : nav_series_(nav_series), labels_(labels), worst_event_index_(-1)
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

            compute_underwater_curve();
            identify_events();
        }

        // ===================================================================
        // Event Access
        // ===================================================================

        const std::vector<DrawdownEvent> &DrawdownAnalysis::all_events() const
        {
            return events_;
        }

        std::vector<DrawdownEvent> DrawdownAnalysis::top_drawdowns(int n) const
        {
            if (n < 1)
            {
                throw InvalidInputError(
                    "Expected positive value for parameter 'n', got: " + std::to_string(n));
            }

            std::vector<DrawdownEvent> sorted_events(events_);
            std::stable_sort(sorted_events.begin(), sorted_events.end(),
                             [](const DrawdownEvent &a, const DrawdownEvent &b)
                             {
                                 return a.depth > b.depth;
                             });

            sorted_events.resize(std::min(static_cast<size_t>(n), sorted_events.size()));
            return sorted_events;
        }

        const DrawdownEvent &DrawdownAnalysis::worst_drawdown() const
        {
            if (events_.empty())
            {
                throw std::runtime_error("No drawdown events found in the NAV series");
            }
            return events_[static_cast<size_t>(worst_event_index_)];
        }

        int DrawdownAnalysis::event_count() const
        {
            return static_cast<int>(events_.size());
        }

        int DrawdownAnalysis::unrecovered_count() const
        {
            return static_cast<int>(std::count_if(events_.begin(), events_.end(),
                                                  [](const DrawdownEvent &e)
                                                  { return !e.recovered(); }));
        }

        double DrawdownAnalysis::time_in_drawdown() const
        {
            int underwater = static_cast<int>(std::count_if(underwater_curve_.begin(), underwater_curve_.end(),
                                                            [](double d)
                                                            { return d < 0.0; }));
            return static_cast<double>(underwater) / static_cast<double>(nav_series_.size() - 1);
        }

        const std::vector<double> &DrawdownAnalysis::underwater_curve() const
        {
            return underwater_curve_;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string DrawdownAnalysis::report(int max_events) const
        {
            std::ostringstream oss;
            oss << std::fixed;

            int events_to_show = event_count();
            if (max_events >= 0 && max_events < events_to_show)
            {
                events_to_show = max_events;
            }

            oss << "Drawdowns: " << event_count() << " events, "
                << unrecovered_count() << " unrecovered, "
                << std::setprecision(1) << time_in_drawdown() * 100.0 << "% of months underwater\n";

            if (events_to_show == 0)
            {
                return oss.str();
            }

            oss << "  " << std::left
                << std::setw(6) << "Rank"
                << std::setw(10) << "Depth"
                << std::setw(12) << "Peak"
                << std::setw(12) << "Trough"
                << std::setw(13) << "Recovery"
                << std::setw(9) << "Decline"
                << "Recover\n";
            oss << "  " << std::string(70, '-') << "\n";

            auto sorted = top_drawdowns(events_to_show);
            for (size_t i = 0; i < sorted.size(); ++i)
            {
                const auto &e = sorted[i];
                std::ostringstream depth;
                depth << std::fixed << std::setprecision(2) << e.depth * 100.0 << "%";

                oss << "  " << std::left
                    << std::setw(6) << (i + 1)
                    << std::setw(10) << depth.str()
                    << std::setw(12) << e.peak_month
                    << std::setw(12) << e.trough_month
                    << std::setw(13) << (e.recovered() ? e.recovery_month : "Unrecovered")
                    << std::setw(9) << e.decline_months
                    << (e.recovered() ? std::to_string(e.recovery_months) : "N/A") << "\n";
            }

            return oss.str();
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void DrawdownAnalysis::compute_underwater_curve()
        {
            underwater_curve_.resize(nav_series_.size());

            double peak = nav_series_[0];
            for (size_t i = 0; i < nav_series_.size(); ++i)
            {
                if (nav_series_[i] > peak)
                {
                    peak = nav_series_[i];
                }
                underwater_curve_[i] = (nav_series_[i] - peak) / peak;
            }
        }

        void DrawdownAnalysis::identify_events()
        {
            int n = static_cast<int>(nav_series_.size());

            double peak = nav_series_[0];
            int peak_idx = 0;
            int trough_idx = -1; // -1 while at a peak

            for (int i = 1; i < n; ++i)
            {
                double v = nav_series_[static_cast<size_t>(i)];
                if (v >= peak)
                {
                    if (trough_idx >= 0)
                    {
                        close_event(peak_idx, trough_idx, i);
                        trough_idx = -1;
                    }
                    peak = v;
                    peak_idx = i;
                }
                else if (trough_idx < 0 || v < nav_series_[static_cast<size_t>(trough_idx)])
                {
                    trough_idx = i;
                }
            }

            if (trough_idx >= 0)
            {
                close_event(peak_idx, trough_idx, -1);
            }
        }

        void DrawdownAnalysis::close_event(int peak_idx, int trough_idx, int recovery_idx)
        {
            DrawdownEvent event;
            event.peak_index = peak_idx;
            event.trough_index = trough_idx;
            event.recovery_index = recovery_idx;
            event.peak_month = labels_[static_cast<size_t>(peak_idx)];
            event.trough_month = labels_[static_cast<size_t>(trough_idx)];
            event.peak_value = nav_series_[static_cast<size_t>(peak_idx)];
            event.trough_value = nav_series_[static_cast<size_t>(trough_idx)];
            event.depth = (event.peak_value - event.trough_value) / event.peak_value;
            event.decline_months = trough_idx - peak_idx;
            if (recovery_idx >= 0)
            {
                event.recovery_month = labels_[static_cast<size_t>(recovery_idx)];
                event.recovery_months = recovery_idx - trough_idx;
            }

            if (worst_event_index_ < 0 || event.depth > events_[static_cast<size_t>(worst_event_index_)].depth)
            {
                worst_event_index_ = static_cast<int>(events_.size());
            }
            events_.push_back(event);
        }

    } // namespace analytics
} // namespace portsim
