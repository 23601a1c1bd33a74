#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"

namespace intraday {

/**
 * Trading windows of the enabled strategies, keyed by strategy id.
 */
class StrategySchedule {
public:
    StrategySchedule(const std::vector<StrategyConfig>& strategies, const SessionConfig& session);

    const StrategyConfig* find(const std::string& strategy_id) const;
    bool holds_overnight(const std::string& strategy_id) const;

    /**
     * window.end - liquidate_before_end_seconds for intraday strategies,
     * window.end for overnight holders.
     */
    int liquidation_deadline(const std::string& strategy_id) const;

    /**
     * Inside the window and before the liquidation deadline.
     */
    bool accepts_entries(const std::string& strategy_id, int seconds_of_day) const;

    /**
     * Intraday strategy at or past its liquidation deadline.
     */
    bool past_deadline(const std::string& strategy_id, int seconds_of_day) const;

    std::vector<std::string> active_at(int seconds_of_day) const;
    const std::vector<std::string>& ids() const { return order_; }

private:
    std::unordered_map<std::string, StrategyConfig> by_id_;
    std::vector<std::string> order_;   // by window start
};

} // namespace intraday
