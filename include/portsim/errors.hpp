// SPDX-License-Identifier: MIT
#ifndef PORTSIM_ERRORS_HPP
#define PORTSIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace portsim {

/**
 * @class InvalidInputError
 * @brief Malformed or inconsistent arguments passed to a backtest.
 *
 * Raised for empty return sequences, non-normalized allocations,
 * non-positive capital, negative rebalance frequencies and symbol
 * coverage mismatches.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @class ComputationError
 * @brief Numeric breakdown while deriving portfolio values or statistics.
 */
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace portsim

#endif // PORTSIM_ERRORS_HPP
