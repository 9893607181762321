// SPDX-License-Identifier: MIT

#include "portsim/backtest/backtest_result.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace portsim
{
    namespace backtest
    {

        std::string format_percent(double fraction)
        {
            double pct = fraction * 100.0;
            std::ostringstream oss;
            oss << (pct >= 0.0 ? "+" : "") << std::fixed << std::setprecision(2) << pct << "%";
            return oss.str();
        }

        static std::string format_money(double value)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2) << value;
            return oss.str();
        }

        static std::string describe_year(const analytics::YearlyReturn &y)
        {
            std::ostringstream oss;
            oss << "Year " << (y.year_index + 1) << " (" << y.start_month << " to " << y.end_month;
            if (y.months < 12)
            {
                oss << ", " << y.months << " months";
            }
            oss << ") " << format_percent(y.value);
            return oss.str();
        }

        std::vector<std::pair<std::string, double>> BacktestResult::recent_monthly_returns(size_t n) const
        {
            std::vector<std::pair<std::string, double>> out;
            size_t count = std::min(n, monthly_returns.size());
            size_t first = monthly_returns.size() - count;
            for (size_t i = first; i < monthly_returns.size(); ++i)
            {
                // period_labels[0] is inception; month i ends at label i + 1.
                out.emplace_back(period_labels[i + 1], monthly_returns[i]);
            }
            return out;
        }

        analytics::DrawdownAnalysis BacktestResult::drawdown_analysis() const
        {
            return analytics::DrawdownAnalysis(portfolio_history, period_labels);
        }

        void BacktestResult::print_summary(std::ostream &out, int recent_months) const
        {
            const std::string rule(50, '=');
            const std::string thin(40, '-');

            out << rule << "\n";
            out << "Strategy: " << strategy << "\n";
            if (period_labels.size() > 1)
            {
                out << "Period: " << period_labels[1] << " - " << period_labels.back()
                    << " (" << num_months() << " months)\n";
            }
            out << "Initial Capital: " << format_money(initial_capital) << "\n";
            out << rule << "\n\n";

            out << "[ Performance Summary ]\n" << thin << "\n";
            out << "Final Value        : " << std::setw(14) << format_money(final_value) << "\n";
            out << "Total Return       : " << format_percent(total_return) << "\n";
            out << "CAGR               : " << format_percent(cagr) << "\n";
            out << "Max Drawdown       : " << format_percent(max_drawdown) << "\n";
            out << "Rebalances         : " << rebalance_count << "\n\n";

            out << "[ Key Insight ]\n" << thin << "\n";
            out << "Best Year          : " << describe_year(best_year) << "\n";
            out << "Worst Year         : " << describe_year(worst_year) << "\n\n";

            if (recent_months > 0)
            {
                auto recent = recent_monthly_returns(static_cast<size_t>(recent_months));
                out << "[ Monthly - Last " << recent.size() << " months ]\n" << thin << "\n";
                for (const auto &entry : recent)
                {
                    out << entry.first << "  " << format_percent(entry.second) << "\n";
                }
                out << "\n";
            }

            if (portfolio_history.size() >= 2)
            {
                out << "[ Drawdowns ]\n" << thin << "\n";
                out << drawdown_analysis().report(3);
            }
            out << rule << "\n";
        }

        void BacktestResult::export_history_to_csv(const std::string &filepath) const
        {
            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);

            std::vector<double> drawdown;
            if (portfolio_history.size() >= 2)
                drawdown = drawdown_analysis().underwater_curve();

            out << "month,value,monthly_return,cumulative_return,drawdown\n";
            out << std::setprecision(10);
            for (size_t i = 0; i < portfolio_history.size() && i < period_labels.size(); ++i)
            {
                double monthly = (i > 0 && i - 1 < monthly_returns.size()) ? monthly_returns[i - 1] : 0.0;
                double cum = initial_capital > 0.0 ? portfolio_history[i] / initial_capital - 1.0 : 0.0;
                double dd = i < drawdown.size() ? drawdown[i] : 0.0;
                out << period_labels[i] << "," << portfolio_history[i] << "," << monthly << ","
                    << cum << "," << dd << "\n";
            }
        }

        static nlohmann::json year_to_json(const analytics::YearlyReturn &y)
        {
            return nlohmann::json{
                {"year_index", y.year_index},
                {"start_month", y.start_month},
                {"end_month", y.end_month},
                {"months", y.months},
                {"start_value", y.start_value},
                {"end_value", y.end_value},
                {"return", y.value}};
        }

        nlohmann::json BacktestResult::to_json() const
        {
            nlohmann::json j;
            j["strategy"] = strategy;
            j["symbols"] = symbols;
            j["initial_capital"] = initial_capital;
            j["final_value"] = final_value;
            j["total_return"] = total_return;
            j["cagr"] = cagr;
            j["max_drawdown"] = max_drawdown;
            j["rebalance_count"] = rebalance_count;
            j["best_year"] = year_to_json(best_year);
            j["worst_year"] = year_to_json(worst_year);

            nlohmann::json years = nlohmann::json::array();
            for (const auto &y : yearly_returns)
                years.push_back(year_to_json(y));
            j["yearly_returns"] = years;

            j["period_labels"] = period_labels;
            j["portfolio_history"] = portfolio_history;
            j["monthly_returns"] = monthly_returns;
            return j;
        }

        void BacktestResult::export_to_json(const std::string &filepath) const
        {
            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);
            out << to_json().dump(2) << "\n";
        }

    } // namespace backtest
} // namespace portsim
