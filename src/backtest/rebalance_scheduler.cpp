// SPDX-License-Identifier: MIT

#include "portsim/backtest/rebalance_scheduler.hpp"
#include "portsim/errors.hpp"

#include <algorithm>
#include <cctype>

namespace portsim {
namespace backtest {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

RebalanceFrequency RebalanceConfig::frequency() const {
    switch (period_months) {
        case 0: return RebalanceFrequency::BUY_AND_HOLD;
        case 1: return RebalanceFrequency::MONTHLY;
        case 6: return RebalanceFrequency::SEMI_ANNUAL;
        case 12: return RebalanceFrequency::ANNUAL;
        default: return RebalanceFrequency::CUSTOM;
    }
}

std::string RebalanceConfig::label() const {
    switch (frequency()) {
        case RebalanceFrequency::BUY_AND_HOLD: return "Buy & Hold";
        case RebalanceFrequency::MONTHLY: return "Monthly (1 month)";
        case RebalanceFrequency::SEMI_ANNUAL: return "Semi-Annual (6 months)";
        case RebalanceFrequency::ANNUAL: return "Annual (12 months)";
        case RebalanceFrequency::CUSTOM: break;
    }
    return "Every " + std::to_string(period_months) + " months";
}

RebalanceConfig RebalanceConfig::from_months(int months) {
    if (months < 0) {
        throw InvalidInputError("rebalance_frequency must be >= 0, got " + std::to_string(months));
    }
    RebalanceConfig cfg;
    cfg.period_months = months;
    return cfg;
}

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (!j.contains("rebalance_frequency")) return cfg;

    const auto& v = j.at("rebalance_frequency");
    if (v.is_number_integer()) {
        return from_months(v.get<int>());
    }
    if (v.is_string()) {
        return from_string(v.get<std::string>());
    }
    if (v.is_null()) {
        return cfg;
    }
    throw InvalidInputError("rebalance_frequency must be an integer or a string, got " + v.dump());
}

RebalanceConfig RebalanceConfig::from_string(const std::string& freq_str) {
    return from_months(parse_frequency(freq_str));
}

int RebalanceConfig::parse_frequency(const std::string& freq_str) {
    auto s = to_lower(trim(freq_str));
    if (s == "buy_and_hold" || s == "buy-and-hold" || s == "hold" || s == "none") return 0;
    if (s == "monthly" || s == "m") return 1;
    if (s == "semi_annual" || s == "semi-annual" || s == "semiannual" || s == "semi") return 6;
    if (s == "annual" || s == "annually" || s == "yearly" || s == "y") return 12;

    int months = 0;
    size_t consumed = 0;
    try {
        months = std::stoi(s, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidInputError("Invalid rebalance frequency: " + freq_str);
    }
    if (consumed != s.size()) {
        throw InvalidInputError("Invalid rebalance frequency: " + freq_str);
    }
    if (months < 0) {
        throw InvalidInputError("rebalance_frequency must be >= 0, got " + freq_str);
    }
    return months;
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config) {
    if (config_.period_months < 0) {
        throw InvalidInputError("rebalance_frequency must be >= 0, got " +
                                std::to_string(config_.period_months));
    }
}

bool RebalanceScheduler::should_rebalance(int month_index) const {
    if (config_.period_months == 0) return false;
    if (month_index <= 0) return false;
    return month_index % config_.period_months == 0;
}

int RebalanceScheduler::next_rebalance(int month_index) const {
    if (config_.period_months == 0) return -1;
    int p = config_.period_months;
    if (month_index < 0) month_index = 0;
    return (month_index / p + 1) * p;
}

int RebalanceScheduler::rebalance_count(int num_months) const {
    if (config_.period_months == 0 || num_months <= 0) return 0;
    return num_months / config_.period_months;
}

} // namespace backtest
} // namespace portsim
