#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portsim/backtest/portfolio.hpp"
#include "portsim/errors.hpp"
#include <Eigen/Dense>

using namespace portsim;
using namespace portsim::backtest;

TEST_CASE("Portfolio allocation", "[Portfolio]") {
    Allocation alloc({{"A", 0.6}, {"B", 0.4}});

    SECTION("Happy path: capital split by weight") {
        PortfolioState s = allocate(1000.0, alloc);
        REQUIRE(s.values.size() == 2);
        REQUIRE(s.values(0) == Catch::Approx(600.0));
        REQUIRE(s.values(1) == Catch::Approx(400.0));
        REQUIRE(s.cash == 0.0);
        REQUIRE(s.nav() == Catch::Approx(1000.0));
    }

    SECTION("Edge case: single asset") {
        PortfolioState s = allocate(500.0, Allocation({{"A", 1.0}}));
        REQUIRE(s.values.size() == 1);
        REQUIRE(s.nav() == 500.0);
    }

    SECTION("Edge case: zero-weight symbol holds nothing") {
        PortfolioState s = allocate(1000.0, Allocation({{"A", 1.0}, {"B", 0.0}}));
        REQUIRE(s.values(1) == 0.0);
        REQUIRE(s.weights()(0) == Catch::Approx(1.0));
    }

    SECTION("Error: zero capital") {
        REQUIRE_THROWS_AS(allocate(0.0, alloc), InvalidInputError);
    }

    SECTION("Error: negative capital") {
        REQUIRE_THROWS_AS(allocate(-1.0, alloc), InvalidInputError);
    }
}

TEST_CASE("Portfolio monthly returns", "[Portfolio]") {
    Allocation alloc({{"A", 0.5}, {"B", 0.5}});
    PortfolioState s = allocate(1000.0, alloc);
    Eigen::VectorXd r(2);
    r << 0.10, -0.20;

    SECTION("Happy path: holdings grow by their return") {
        PortfolioState next = apply_returns(s, r);
        REQUIRE(next.values(0) == Catch::Approx(550.0));
        REQUIRE(next.values(1) == Catch::Approx(400.0));
        REQUIRE(next.nav() == Catch::Approx(950.0));
        // Input state unchanged
        REQUIRE(s.nav() == Catch::Approx(1000.0));
    }

    SECTION("Edge case: cash is carried over") {
        s.cash = 100.0;
        PortfolioState next = apply_returns(s, r);
        REQUIRE(next.cash == 100.0);
        REQUIRE(next.nav() == Catch::Approx(1050.0));
    }

    SECTION("Edge case: a -100% month wipes out the holding") {
        Eigen::VectorXd loss(2);
        loss << -1.0, 0.0;
        PortfolioState next = apply_returns(s, loss);
        REQUIRE(next.values(0) == 0.0);
        REQUIRE(next.nav() == Catch::Approx(500.0));
    }

    SECTION("Error: wrong number of returns") {
        Eigen::VectorXd bad(1);
        bad << 0.05;
        REQUIRE_THROWS_AS(apply_returns(s, bad), InvalidInputError);
    }

    SECTION("Error: return below -100%") {
        Eigen::VectorXd bad(2);
        bad << -1.01, 0.0;
        REQUIRE_THROWS_AS(apply_returns(s, bad), InvalidInputError);
    }
}

TEST_CASE("Portfolio rebalancing", "[Portfolio]") {
    Allocation alloc({{"A", 0.6}, {"B", 0.4}});
    PortfolioState s = allocate(1000.0, alloc);
    Eigen::VectorXd r(2);
    r << 0.50, -0.25;
    PortfolioState drifted = apply_returns(s, r);   // 900 / 300

    SECTION("Happy path: back to target, total preserved") {
        REQUIRE(drifted.weights()(0) == Catch::Approx(0.75));

        PortfolioState next = rebalance_to(drifted, alloc);
        REQUIRE(next.nav() == Catch::Approx(1200.0));
        REQUIRE(next.values(0) == Catch::Approx(720.0));
        REQUIRE(next.values(1) == Catch::Approx(480.0));
        REQUIRE(next.weights()(0) == Catch::Approx(0.6));
    }

    SECTION("Edge case: cash is invested") {
        drifted.cash = 300.0;
        PortfolioState next = rebalance_to(drifted, alloc);
        REQUIRE(next.cash == 0.0);
        REQUIRE(next.nav() == Catch::Approx(1500.0));
        REQUIRE(next.values(1) == Catch::Approx(600.0));
    }

    SECTION("Error: allocation size mismatch") {
        Allocation three({{"A", 0.5}, {"B", 0.25}, {"C", 0.25}});
        REQUIRE_THROWS_AS(rebalance_to(drifted, three), InvalidInputError);
    }
}

TEST_CASE("Portfolio weights of an empty portfolio", "[Portfolio]") {
    PortfolioState s;
    s.values = Eigen::VectorXd::Zero(3);
    auto w = s.weights();
    REQUIRE(w.size() == 3);
    REQUIRE((w.array() == 0.0).all());
}

TEST_CASE("Portfolio snapshots", "[Portfolio]") {
    Allocation alloc({{"A", 0.5}, {"B", 0.5}});
    PortfolioState s = allocate(1000.0, alloc);
    Eigen::VectorXd r(2);
    r << 0.10, 0.30;
    PortfolioState next = apply_returns(s, r);

    auto snap = make_snapshot(next, "2020-02", 2, 1100.0, 1000.0, true);
    REQUIRE(snap.month == "2020-02");
    REQUIRE(snap.month_index == 2);
    REQUIRE(snap.nav == Catch::Approx(1200.0));
    REQUIRE(snap.monthly_return == Catch::Approx(1200.0 / 1100.0 - 1.0));
    REQUIRE(snap.cumulative_return == Catch::Approx(0.2));
    REQUIRE(snap.rebalanced);
    REQUIRE(snap.weights.sum() == Catch::Approx(1.0));

    SECTION("Edge case: previous value of zero") {
        auto zero_prev = make_snapshot(next, "2020-02", 2, 0.0, 1000.0, false);
        REQUIRE(zero_prev.monthly_return == 0.0);
    }
}
