// ============================================================================
// Implementation of PortfolioState and its transitions
// ============================================================================

#include "portsim/backtest/portfolio.hpp"
#include "portsim/errors.hpp"

#include <cmath>
#include <sstream>

namespace portsim {
namespace backtest {

// ============================================================================
// PortfolioState - queries
// ============================================================================

double PortfolioState::nav() const {
    return cash + invested_value();
}

double PortfolioState::invested_value() const {
    return values.size() > 0 ? values.sum() : 0.0;
}

Eigen::VectorXd PortfolioState::weights() const {
    double n = nav();
    Eigen::VectorXd w(values.size());
    if (!(n > 0.0)) {
        w.setZero();
        return w;
    }
    return values / n;
}

// ============================================================================
// Transitions
// ============================================================================

PortfolioState allocate(double capital, const Allocation& allocation) {
    if (!std::isfinite(capital) || !(capital > 0.0)) {
        std::ostringstream msg;
        msg << "initial_capital must be greater than 0, got " << capital;
        throw InvalidInputError(msg.str());
    }

    PortfolioState s;
    s.values = allocation.weights() * capital;
    s.cash = 0.0;
    return s;
}

PortfolioState apply_returns(const PortfolioState& state, const Eigen::VectorXd& returns) {
    if (returns.size() != state.values.size()) {
        std::ostringstream msg;
        msg << "returns size (" << returns.size() << ") != num holdings (" << state.values.size() << ")";
        throw InvalidInputError(msg.str());
    }
    if (returns.size() > 0 && returns.minCoeff() < -1.0) {
        throw InvalidInputError("a monthly return below -100% would make a holding negative");
    }

    PortfolioState next;
    next.values = state.values.cwiseProduct((returns.array() + 1.0).matrix());
    next.cash = state.cash;
    return next;
}

PortfolioState rebalance_to(const PortfolioState& state, const Allocation& allocation) {
    if (static_cast<size_t>(state.values.size()) != allocation.size()) {
        throw InvalidInputError("allocation size does not match holdings");
    }

    PortfolioState next;
    next.values = allocation.weights() * state.nav();
    next.cash = 0.0;
    return next;
}

// ============================================================================
// Snapshots
// ============================================================================

PortfolioSnapshot make_snapshot(const PortfolioState& state,
                                const std::string& month,
                                int month_index,
                                double previous_nav,
                                double initial_capital,
                                bool rebalanced) {
    PortfolioSnapshot s;
    s.month = month;
    s.month_index = month_index;
    s.nav = state.nav();
    s.values = state.values;
    s.weights = state.weights();
    s.rebalanced = rebalanced;
    if (previous_nav > 0.0) {
        s.monthly_return = (s.nav - previous_nav) / previous_nav;
    } else {
        s.monthly_return = 0.0;
    }
    if (initial_capital > 0.0) {
        s.cumulative_return = (s.nav - initial_capital) / initial_capital;
    } else {
        s.cumulative_return = 0.0;
    }
    return s;
}

} // namespace backtest
} // namespace portsim
