#include "strategy_schedule.hpp"

#include <algorithm>

namespace intraday {

StrategySchedule::StrategySchedule(const std::vector<StrategyConfig>& strategies,
                                   const SessionConfig& session) {
    check_strategy_windows(strategies, session);
    for (const auto& s : strategies) {
        if (!s.enabled) continue;
        by_id_[s.id] = s;
        order_.push_back(s.id);
    }
    std::sort(order_.begin(), order_.end(), [this](const std::string& a, const std::string& b) {
        return by_id_.at(a).window_start < by_id_.at(b).window_start;
    });
}

const StrategyConfig* StrategySchedule::find(const std::string& strategy_id) const {
    auto it = by_id_.find(strategy_id);
    return it == by_id_.end() ? nullptr : &it->second;
}

bool StrategySchedule::holds_overnight(const std::string& strategy_id) const {
    const auto* s = find(strategy_id);
    return s != nullptr && s->hold_overnight;
}

int StrategySchedule::liquidation_deadline(const std::string& strategy_id) const {
    const auto* s = find(strategy_id);
    if (s == nullptr) return 0;
    if (s->hold_overnight) return s->window_end;
    return s->window_end - s->liquidate_before_end_seconds;
}

bool StrategySchedule::accepts_entries(const std::string& strategy_id, int sod) const {
    const auto* s = find(strategy_id);
    if (s == nullptr) return false;
    return sod >= s->window_start && sod < s->window_end && sod < liquidation_deadline(strategy_id);
}

bool StrategySchedule::past_deadline(const std::string& strategy_id, int sod) const {
    const auto* s = find(strategy_id);
    if (s == nullptr || s->hold_overnight) return false;
    return sod >= liquidation_deadline(strategy_id);
}

std::vector<std::string> StrategySchedule::active_at(int sod) const {
    std::vector<std::string> out;
    for (const auto& id : order_) {
        if (accepts_entries(id, sod)) {
            out.push_back(id);
        }
    }
    return out;
}

} // namespace intraday
