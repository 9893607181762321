/**
 * @file test_drawdown_analysis.cpp
 * @brief Unit tests for DrawdownAnalysis
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "portsim/analytics/drawdown_analysis.hpp"
#include "portsim/errors.hpp"

using namespace portsim;
using namespace portsim::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("DrawdownAnalysis events", "[DrawdownAnalysis]") {
    std::vector<double> nav = {100.0, 110.0, 99.0, 104.0, 112.0, 100.0, 95.0, 97.0};
    std::vector<std::string> labels = {"inception", "2020-01", "2020-02", "2020-03",
                                       "2020-04", "2020-05", "2020-06", "2020-07"};
    DrawdownAnalysis analysis(nav, labels);

    REQUIRE(analysis.event_count() == 2);
    REQUIRE(analysis.unrecovered_count() == 1);

    const auto& events = analysis.all_events();

    SECTION("Recovered event") {
        const auto& e = events[0];
        REQUIRE(e.peak_month == "2020-01");
        REQUIRE(e.trough_month == "2020-02");
        REQUIRE(e.recovery_month == "2020-04");
        REQUIRE(e.recovered());
        REQUIRE_THAT(e.depth, WithinAbs(0.1, 1e-12));
        REQUIRE(e.decline_months == 1);
        REQUIRE(e.recovery_months == 2);
    }

    SECTION("Open event at the end of the series") {
        const auto& e = events[1];
        REQUIRE(e.peak_index == 4);
        REQUIRE(e.trough_index == 6);
        REQUIRE_FALSE(e.recovered());
        REQUIRE(e.recovery_month.empty());
        REQUIRE(e.recovery_months == -1);
        REQUIRE_THAT(e.depth, WithinAbs(17.0 / 112.0, 1e-12));
        REQUIRE(e.decline_months == 2);
    }

    SECTION("Ranking") {
        REQUIRE(analysis.worst_drawdown().peak_index == 4);
        auto top = analysis.top_drawdowns(5);
        REQUIRE(top.size() == 2);
        REQUIRE(top[0].peak_index == 4);
        REQUIRE(top[1].peak_index == 1);
        REQUIRE(analysis.top_drawdowns(1).size() == 1);
        REQUIRE_THROWS_AS(analysis.top_drawdowns(0), InvalidInputError);
    }

    SECTION("Underwater curve") {
        const auto& uw = analysis.underwater_curve();
        REQUIRE(uw.size() == nav.size());
        REQUIRE(uw[0] == 0.0);
        REQUIRE(uw[1] == 0.0);
        REQUIRE_THAT(uw[2], WithinAbs(-0.1, 1e-12));
        REQUIRE(uw[4] == 0.0);
        REQUIRE_THAT(analysis.time_in_drawdown(), WithinAbs(5.0 / 7.0, 1e-12));
    }

    SECTION("Report") {
        auto text = analysis.report(1);
        REQUIRE(text.find("2 events") != std::string::npos);
        REQUIRE(text.find("Unrecovered") != std::string::npos);
        REQUIRE(text.find("2020-04") != std::string::npos);
    }
}

TEST_CASE("DrawdownAnalysis without drawdowns", "[DrawdownAnalysis]") {
    DrawdownAnalysis analysis({100.0, 100.0, 101.0}, {"inception", "a", "b"});
    REQUIRE(analysis.event_count() == 0);
    REQUIRE(analysis.time_in_drawdown() == 0.0);
    REQUIRE_THROWS_AS(analysis.worst_drawdown(), std::runtime_error);
    REQUIRE(analysis.report().find("0 events") != std::string::npos);
}

TEST_CASE("DrawdownAnalysis input validation", "[DrawdownAnalysis]") {
    REQUIRE_THROWS_AS(DrawdownAnalysis({100.0}, {"inception"}), InvalidInputError);
    REQUIRE_THROWS_AS(DrawdownAnalysis({100.0, 90.0}, {"inception"}), InvalidInputError);
    REQUIRE_THROWS_AS(DrawdownAnalysis({-1.0, 90.0}, {"inception", "a"}), InvalidInputError);
}
