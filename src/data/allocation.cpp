// SPDX-License-Identifier: MIT

#include "portsim/data/allocation.hpp"
#include "portsim/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace portsim {

namespace {

// Target weights per risk level over the five-fund ETF universe.
const std::map<std::string, std::map<std::string, double>>& risk_table() {
    static const std::map<std::string, std::map<std::string, double>> table = {
        {"low",    {{"VTI", 0.20}, {"VXUS", 0.10}, {"BND", 0.40}, {"BNDX", 0.20}, {"VNQ", 0.10}}},
        {"medium", {{"VTI", 0.35}, {"VXUS", 0.20}, {"BND", 0.25}, {"BNDX", 0.10}, {"VNQ", 0.10}}},
        {"high",   {{"VTI", 0.45}, {"VXUS", 0.30}, {"BND", 0.10}, {"BNDX", 0.05}, {"VNQ", 0.10}}},
    };
    return table;
}

std::string normalize_level(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return std::tolower(c); });
    return out;
}

} // namespace

Allocation::Allocation(const std::map<std::string, double>& weights) {
    if (weights.empty()) {
        throw InvalidInputError("allocation must not be empty");
    }

    symbols_.reserve(weights.size());
    weights_.resize(static_cast<int>(weights.size()));

    double total = 0.0;
    int i = 0;
    for (const auto& kv : weights) {
        if (kv.first.empty()) {
            throw InvalidInputError("allocation contains an empty symbol");
        }
        if (!std::isfinite(kv.second) || kv.second < 0.0) {
            std::ostringstream msg;
            msg << "weight for '" << kv.first << "' must be finite and >= 0, got " << kv.second;
            throw InvalidInputError(msg.str());
        }
        symbols_.push_back(kv.first);
        weights_[i++] = kv.second;
        total += kv.second;
    }

    if (std::abs(total - 1.0) > kWeightTolerance) {
        std::ostringstream msg;
        msg << "Allocation must sum to 1.0, but got " << total;
        throw InvalidInputError(msg.str());
    }

    // Holdings are weight * value, so the stored weights must sum to exactly 1.
    if (total != 1.0) {
        weights_ /= total;
    }
}

Allocation Allocation::for_risk_level(const std::string& risk_level) {
    const auto& table = risk_table();
    auto it = table.find(normalize_level(risk_level));
    if (it == table.end()) {
        std::ostringstream msg;
        msg << "Invalid risk level '" << risk_level << "'. Valid values:";
        for (const auto& level : risk_levels()) msg << " " << level;
        throw InvalidInputError(msg.str());
    }
    return Allocation(it->second);
}

std::vector<std::string> Allocation::risk_levels() {
    std::vector<std::string> levels;
    for (const auto& kv : risk_table()) levels.push_back(kv.first);
    return levels;
}

bool Allocation::contains(const std::string& symbol) const {
    return std::binary_search(symbols_.begin(), symbols_.end(), symbol);
}

double Allocation::weight(const std::string& symbol) const {
    auto it = std::lower_bound(symbols_.begin(), symbols_.end(), symbol);
    if (it == symbols_.end() || *it != symbol) {
        throw InvalidInputError("symbol not in allocation: " + symbol);
    }
    return weights_[static_cast<int>(it - symbols_.begin())];
}

std::map<std::string, double> Allocation::as_map() const {
    std::map<std::string, double> out;
    for (size_t i = 0; i < symbols_.size(); ++i) {
        out[symbols_[i]] = weights_[static_cast<int>(i)];
    }
    return out;
}

} // namespace portsim
