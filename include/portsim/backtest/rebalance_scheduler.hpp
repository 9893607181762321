#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace portsim {
namespace backtest {

enum class RebalanceFrequency {
    BUY_AND_HOLD,
    MONTHLY,
    SEMI_ANNUAL,
    ANNUAL,
    CUSTOM
};

/**
 * Rebalance cadence in months. 0 means Buy & Hold (never rebalance after
 * the initial allocation); any positive N rebalances every N months.
 */
struct RebalanceConfig {
    int period_months = 0;

    RebalanceFrequency frequency() const;
    std::string label() const;

    static RebalanceConfig from_months(int months);
    static RebalanceConfig from_json(const nlohmann::json& j);
    static RebalanceConfig from_string(const std::string& freq_str);
    static int parse_frequency(const std::string& freq_str);
};

class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    /// True when month_index (1-based) closes a rebalance period.
    bool should_rebalance(int month_index) const;

    /// First rebalance month strictly after month_index, or -1 for Buy & Hold.
    int next_rebalance(int month_index) const;

    /// Number of rebalance events in months 1..num_months.
    int rebalance_count(int num_months) const;

    const RebalanceConfig& config() const { return config_; }

private:
    RebalanceConfig config_;
};

} // namespace backtest
} // namespace portsim
