#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <utility>
#include "portsim/backtest/backtest_engine.hpp"
#include "portsim/errors.hpp"

using namespace portsim;
using namespace portsim::backtest;
using Catch::Matchers::WithinAbs;

namespace {

// One record per entry; every record carries the same symbol set.
std::vector<MonthlyReturnRecord> make_records(const std::vector<std::string>& symbols,
                                              const std::vector<std::vector<double>>& rows,
                                              const std::string& start = "2020-01") {
    std::vector<MonthlyReturnRecord> records;
    for (size_t i = 0; i < rows.size(); ++i) {
        MonthlyReturnRecord r;
        r.month = DataLoader::add_months(start, static_cast<int>(i));
        for (size_t j = 0; j < symbols.size(); ++j) {
            r.returns[symbols[j]] = rows[i][j];
        }
        records.push_back(r);
    }
    return records;
}

std::vector<MonthlyReturnRecord> single_asset(const std::vector<double>& returns) {
    std::vector<std::vector<double>> rows;
    for (double r : returns) rows.push_back({r});
    return make_records({"A"}, rows);
}

} // namespace

TEST_CASE("BacktestEngine construction", "[BacktestEngine]") {
    BacktestParams p;
    REQUIRE(p.initial_capital == 10000.0);
    REQUIRE(p.rebalance.period_months == 0);
    REQUIRE_FALSE(p.verbose);

    SECTION("from BacktestConfig") {
        BacktestConfig cfg;
        cfg.initial_capital = 50000.0;
        cfg.rebalance = RebalanceConfig::from_months(6);
        cfg.verbose = true;
        BacktestParams p2 = BacktestParams::from_config(cfg);
        REQUIRE(p2.initial_capital == 50000.0);
        REQUIRE(p2.rebalance.period_months == 6);
        REQUIRE(p2.verbose);
    }

    SECTION("Error: zero capital") {
        p.initial_capital = 0.0;
        REQUIRE_THROWS_AS(BacktestEngine(p), InvalidInputError);
    }

    SECTION("Error: negative capital") {
        p.initial_capital = -100.0;
        REQUIRE_THROWS_AS(BacktestEngine(p), InvalidInputError);
    }

    SECTION("Error: NaN capital") {
        p.initial_capital = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(BacktestEngine(p), InvalidInputError);
    }

    SECTION("Error: negative rebalance period") {
        p.rebalance.period_months = -1;
        REQUIRE_THROWS_AS(BacktestEngine(p), InvalidInputError);
    }
}

TEST_CASE("run_backtest history shape", "[BacktestEngine]") {
    auto records = make_records({"A", "B"}, {{0.01, 0.02}, {-0.03, 0.01}, {0.02, 0.0}, {0.0, -0.01}, {0.05, 0.02}});
    std::map<std::string, double> alloc = {{"A", 0.6}, {"B", 0.4}};

    for (int freq : {0, 1, 2, 6, 12}) {
        auto result = run_backtest(records, alloc, 25000.0, freq);
        REQUIRE(result.portfolio_history.size() == records.size() + 1);
        REQUIRE(result.period_labels.size() == records.size() + 1);
        REQUIRE(result.monthly_returns.size() == records.size());
        REQUIRE(result.snapshots.size() == records.size() + 1);
        REQUIRE(result.portfolio_history.front() == 25000.0);
        REQUIRE(result.period_labels.front() == "inception");
        REQUIRE(result.period_labels.back() == "2020-05");
        REQUIRE(result.final_value == result.portfolio_history.back());
        REQUIRE(result.initial_capital == 25000.0);
    }
}

TEST_CASE("Buy & Hold with zero returns keeps capital", "[BacktestEngine]") {
    std::vector<std::vector<double>> zeros(18, std::vector<double>{0.0, 0.0});
    auto records = make_records({"A", "B"}, zeros);

    auto result = run_backtest(records, {{"A", 0.25}, {"B", 0.75}}, 10000.0, 0);
    REQUIRE(result.final_value == 10000.0);
    REQUIRE(result.total_return == 0.0);
    REQUIRE(result.cagr == 0.0);
    REQUIRE(result.max_drawdown == 0.0);
    REQUIRE(result.rebalance_count == 0);
    REQUIRE(result.strategy == "Buy & Hold");
}

TEST_CASE("Weights inside the tolerance do not leak value", "[BacktestEngine]") {
    std::vector<std::vector<double>> zeros(120, std::vector<double>{0.0, 0.0});
    auto records = make_records({"A", "B"}, zeros);

    for (double a : {0.5000009, 0.4999991}) {
        for (int frequency : {0, 1}) {
            auto result = run_backtest(records, {{"A", a}, {"B", 0.5}}, 10000.0, frequency);
            REQUIRE_THAT(result.portfolio_history[1], WithinAbs(10000.0, 1e-9));
            REQUIRE_THAT(result.final_value, WithinAbs(10000.0, 1e-9));
            REQUIRE_THAT(result.max_drawdown, WithinAbs(0.0, 1e-12));
        }
    }
}

TEST_CASE("Single asset trajectory equals direct compounding", "[BacktestEngine]") {
    std::vector<double> returns = {0.05, -0.02, 0.03, 0.10, -0.04, 0.0, 0.015, -0.07, 0.02, 0.01, 0.03, -0.01, 0.04};
    auto records = single_asset(returns);

    std::vector<double> expected = {1000.0};
    for (double r : returns) expected.push_back(expected.back() * (1.0 + r));

    for (int freq : {0, 1, 3, 6, 12}) {
        auto result = run_backtest(records, {{"A", 1.0}}, 1000.0, freq);
        REQUIRE(result.portfolio_history.size() == expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            REQUIRE_THAT(result.portfolio_history[i], WithinAbs(expected[i], 1e-9));
        }
        for (size_t i = 0; i < returns.size(); ++i) {
            REQUIRE_THAT(result.monthly_returns[i], WithinAbs(returns[i], 1e-12));
        }
    }
}

TEST_CASE("Offsetting returns on a 50/50 allocation", "[BacktestEngine]") {
    std::map<std::string, double> alloc = {{"A", 0.5}, {"B", 0.5}};

    SECTION("One month, Buy & Hold") {
        auto records = make_records({"A", "B"}, {{0.10, -0.10}});
        auto result = run_backtest(records, alloc, 10000.0, 0);
        REQUIRE_THAT(result.final_value, WithinAbs(10000.0, 1e-9));
        REQUIRE_THAT(result.total_return, WithinAbs(0.0, 1e-12));
    }

    SECTION("Two months, monthly rebalance restores the split") {
        auto records = make_records({"A", "B"}, {{0.10, -0.10}, {0.10, -0.10}});
        auto result = run_backtest(records, alloc, 10000.0, 1);
        REQUIRE_THAT(result.portfolio_history[2], WithinAbs(10000.0, 1e-9));
        REQUIRE(result.rebalance_count == 2);
    }

    SECTION("Two months, Buy & Hold lets the winner drift") {
        auto records = make_records({"A", "B"}, {{0.10, -0.10}, {0.10, -0.10}});
        auto result = run_backtest(records, alloc, 10000.0, 0);
        // 5500 * 1.1 + 4500 * 0.9
        REQUIRE_THAT(result.portfolio_history[2], WithinAbs(10100.0, 1e-9));
    }
}

TEST_CASE("Rebalance timing", "[BacktestEngine]") {
    std::vector<std::vector<double>> rows;
    for (int i = 0; i < 24; ++i) rows.push_back({0.02, -0.01});
    auto records = make_records({"A", "B"}, rows);
    std::map<std::string, double> alloc = {{"A", 0.5}, {"B", 0.5}};

    auto result = run_backtest(records, alloc, 10000.0, 6);
    REQUIRE(result.rebalance_count == 4);
    REQUIRE(result.strategy == "Semi-Annual (6 months)");

    for (const auto& s : result.snapshots) {
        bool expected = s.month_index > 0 && s.month_index % 6 == 0;
        REQUIRE(s.rebalanced == expected);
        if (s.rebalanced) {
            REQUIRE_THAT(s.weights(0), WithinAbs(0.5, 1e-12));
            REQUIRE_THAT(s.weights(1), WithinAbs(0.5, 1e-12));
        }
    }

    // Month 5 has drifted toward A, month 6 is back on target.
    REQUIRE(result.snapshots[5].weights(0) > 0.5);
    REQUIRE(result.snapshots[0].month == "inception");

    SECTION("Rebalancing preserves the total") {
        // Holdings after month 6 returns, before the reset, sum to history[6].
        auto hold = run_backtest(records, alloc, 10000.0, 0);
        REQUIRE_THAT(result.portfolio_history[6], WithinAbs(hold.portfolio_history[6], 1e-9));
    }
}

TEST_CASE("CAGR", "[BacktestEngine]") {
    SECTION("Doubling over 12 months gives 100%") {
        std::vector<double> returns(12, 0.0);
        returns[0] = 1.0;
        auto result = run_backtest(single_asset(returns), {{"A", 1.0}}, 10000.0, 0);
        REQUIRE(result.final_value == 20000.0);
        REQUIRE_THAT(result.cagr, WithinAbs(1.0, 1e-12));
    }

    SECTION("Doubling over 24 months annualizes") {
        std::vector<double> returns(24, 0.0);
        returns[3] = 1.0;
        auto result = run_backtest(single_asset(returns), {{"A", 1.0}}, 10000.0, 0);
        REQUIRE_THAT(result.cagr, WithinAbs(std::sqrt(2.0) - 1.0, 1e-12));
    }

    SECTION("Total loss reports -100%") {
        auto result = run_backtest(single_asset({0.05, -1.0, 0.10}), {{"A", 1.0}}, 10000.0, 1);
        REQUIRE(result.final_value == 0.0);
        REQUIRE(result.cagr == -1.0);
        REQUIRE(result.total_return == -1.0);
        REQUIRE(result.max_drawdown == -1.0);
        REQUIRE(result.monthly_returns[2] == 0.0);
    }

    SECTION("Overflow raises ComputationError") {
        BacktestParams params;
        params.initial_capital = 1e300;
        BacktestEngine engine(params);
        auto records = single_asset({1e10});
        REQUIRE_THROWS_AS(engine.run(records, Allocation({{"A", 1.0}})), ComputationError);
    }
}

TEST_CASE("Max drawdown", "[BacktestEngine]") {
    SECTION("Non-decreasing trajectory has none") {
        auto result = run_backtest(single_asset({0.01, 0.0, 0.02, 0.03}), {{"A", 1.0}}, 10000.0, 0);
        REQUIRE(result.max_drawdown == 0.0);
    }

    SECTION("Peak to trough") {
        // 10000 -> 12000 -> 9000 -> 10800
        auto result = run_backtest(single_asset({0.20, -0.25, 0.20}), {{"A", 1.0}}, 10000.0, 0);
        REQUIRE_THAT(result.max_drawdown, WithinAbs(-0.25, 1e-12));
        REQUIRE(result.max_drawdown <= 0.0);
    }
}

TEST_CASE("Yearly buckets", "[BacktestEngine]") {
    SECTION("A 6-month run has one partial year") {
        auto result = run_backtest(single_asset({0.01, 0.02, -0.01, 0.03, 0.0, 0.01}), {{"A", 1.0}}, 10000.0, 0);
        REQUIRE(result.yearly_returns.size() == 1);
        REQUIRE(result.best_year.months == 6);
        REQUIRE(result.worst_year.months == 6);
        REQUIRE(result.best_year.start_month == "inception");
        REQUIRE(result.best_year.end_month == "2020-06");
        REQUIRE(result.best_year.value == result.worst_year.value);
        REQUIRE_THAT(result.best_year.value, WithinAbs(result.total_return, 1e-12));
    }

    SECTION("30 months: two full years and a partial one") {
        std::vector<double> returns(30, 0.0);
        returns[2] = 0.10;   // year 1
        returns[14] = -0.20; // year 2
        returns[26] = 0.05;  // year 3, partial
        auto result = run_backtest(single_asset(returns), {{"A", 1.0}}, 10000.0, 0);

        REQUIRE(result.yearly_returns.size() == 3);
        REQUIRE(result.yearly_returns[2].months == 6);
        REQUIRE(result.best_year.year_index == 0);
        REQUIRE_THAT(result.best_year.value, WithinAbs(0.10, 1e-12));
        REQUIRE(result.worst_year.year_index == 1);
        REQUIRE_THAT(result.worst_year.value, WithinAbs(-0.20, 1e-12));
    }

    SECTION("Ties resolve to the earliest bucket") {
        std::vector<double> returns(24, 0.0);
        auto result = run_backtest(single_asset(returns), {{"A", 1.0}}, 10000.0, 0);
        REQUIRE(result.best_year.year_index == 0);
        REQUIRE(result.worst_year.year_index == 0);
    }
}

TEST_CASE("run_backtest input validation", "[BacktestEngine]") {
    auto records = make_records({"A", "B"}, {{0.01, 0.02}, {0.0, 0.01}});

    SECTION("Weights summing to 0.8") {
        REQUIRE_THROWS_AS(run_backtest(records, {{"A", 0.4}, {"B", 0.4}}, 10000.0, 0), InvalidInputError);
    }

    SECTION("Empty return sequence") {
        REQUIRE_THROWS_AS(run_backtest({}, {{"A", 0.5}, {"B", 0.5}}, 10000.0, 0), InvalidInputError);
    }

    SECTION("Zero capital") {
        REQUIRE_THROWS_AS(run_backtest(records, {{"A", 0.5}, {"B", 0.5}}, 0.0, 0), InvalidInputError);
    }

    SECTION("Negative rebalance frequency") {
        REQUIRE_THROWS_AS(run_backtest(records, {{"A", 0.5}, {"B", 0.5}}, 10000.0, -3), InvalidInputError);
    }

    SECTION("Record missing an allocation symbol") {
        REQUIRE_THROWS_AS(run_backtest(records, {{"A", 0.5}, {"C", 0.5}}, 10000.0, 0), InvalidInputError);
    }

    SECTION("Months out of order") {
        auto swapped = records;
        std::swap(swapped[0], swapped[1]);
        REQUIRE_THROWS_AS(run_backtest(swapped, {{"A", 0.5}, {"B", 0.5}}, 10000.0, 0), InvalidInputError);
    }

    SECTION("Return below -100%") {
        auto bad = records;
        bad[1].returns["A"] = -1.5;
        REQUIRE_THROWS_AS(run_backtest(bad, {{"A", 0.5}, {"B", 0.5}}, 10000.0, 0), InvalidInputError);
    }

    SECTION("Non-finite return") {
        auto bad = records;
        bad[0].returns["B"] = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(run_backtest(bad, {{"A", 0.5}, {"B", 0.5}}, 10000.0, 0), InvalidInputError);
    }

    SECTION("Errors are also std::invalid_argument") {
        REQUIRE_THROWS_AS(run_backtest({}, {{"A", 1.0}}, 10000.0, 0), std::invalid_argument);
    }
}

TEST_CASE("run_backtest is pure", "[BacktestEngine]") {
    auto records = make_records({"A", "B", "X"}, {{0.01, 0.02, 0.5}, {-0.03, 0.01, 0.5}, {0.02, 0.0, 0.5}});
    auto original = records;
    std::map<std::string, double> alloc = {{"A", 0.3}, {"B", 0.7}};

    auto first = run_backtest(records, alloc, 10000.0, 2);
    auto second = run_backtest(records, alloc, 10000.0, 2);

    REQUIRE(first.portfolio_history == second.portfolio_history);
    REQUIRE(first.monthly_returns == second.monthly_returns);
    REQUIRE(first.cagr == second.cagr);

    // Inputs untouched; the extra symbol X is ignored.
    for (size_t i = 0; i < records.size(); ++i) {
        REQUIRE(records[i].month == original[i].month);
        REQUIRE(records[i].returns == original[i].returns);
    }
    std::vector<std::string> expected_symbols = {"A", "B"};
    REQUIRE(first.symbols == expected_symbols);
}

TEST_CASE("BacktestEngine step", "[BacktestEngine]") {
    Allocation alloc({{"A", 0.5}, {"B", 0.5}});
    BacktestParams params;
    params.rebalance = RebalanceConfig::from_months(2);
    BacktestEngine engine(params);

    PortfolioState s0 = allocate(1000.0, alloc);
    Eigen::VectorXd r(2);
    r << 0.2, 0.0;

    PortfolioState s1 = engine.step(s0, r, 1, alloc);
    REQUIRE_THAT(s1.values(0), WithinAbs(600.0, 1e-12));
    REQUIRE_THAT(s1.values(1), WithinAbs(500.0, 1e-12));

    PortfolioState s2 = engine.step(s1, r, 2, alloc);
    // 720 + 500, then reset to 610 / 610
    REQUIRE_THAT(s2.nav(), WithinAbs(1220.0, 1e-9));
    REQUIRE_THAT(s2.values(0), WithinAbs(610.0, 1e-9));
    REQUIRE_THAT(s2.values(1), WithinAbs(610.0, 1e-9));

    // The previous state is left alone.
    REQUIRE_THAT(s1.values(0), WithinAbs(600.0, 1e-12));
}
