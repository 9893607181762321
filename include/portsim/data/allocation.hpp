// SPDX-License-Identifier: MIT
#ifndef PORTSIM_DATA_ALLOCATION_HPP
#define PORTSIM_DATA_ALLOCATION_HPP

#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace portsim {

/**
 * @class Allocation
 * @brief Fixed target weights per asset symbol.
 *
 * Weights are finite, non-negative and sum to 1.0 within kWeightTolerance;
 * accepted weights are rescaled to sum to 1.0.
 * Symbols are kept in sorted order; weights() is aligned with symbols().
 */
class Allocation {
public:
    static constexpr double kWeightTolerance = 1e-6;

    /**
     * @throws InvalidInputError If empty, a weight is negative or non-finite,
     *         or the weights do not sum to 1.0.
     */
    explicit Allocation(const std::map<std::string, double>& weights);

    /**
     * @brief Built-in allocation for a risk level (low, medium, high).
     * @throws InvalidInputError For an unknown level.
     */
    static Allocation for_risk_level(const std::string& risk_level);

    static std::vector<std::string> risk_levels();

    const std::vector<std::string>& symbols() const { return symbols_; }
    const Eigen::VectorXd& weights() const { return weights_; }
    size_t size() const { return symbols_.size(); }

    bool contains(const std::string& symbol) const;
    double weight(const std::string& symbol) const;
    std::map<std::string, double> as_map() const;

private:
    std::vector<std::string> symbols_;
    Eigen::VectorXd weights_;
};

} // namespace portsim

#endif // PORTSIM_DATA_ALLOCATION_HPP
