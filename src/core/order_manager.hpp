#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include "broker_client.hpp"
#include "config.hpp"
#include "market_clock.hpp"
#include "notifier.hpp"
#include "portfolio.hpp"
#include "sizing_policy.hpp"
#include "strategy_schedule.hpp"
#include "trade_journal.hpp"

namespace intraday {

enum class RejectReason {
    NONE,
    INVALID_SIGNAL,
    HALTED,
    OUTSIDE_TRADING_WINDOW,
    NO_POSITION,
    POSITION_LIMIT,
    PRICE_UNAVAILABLE,
    INSUFFICIENT_FUNDS,
    DUPLICATE_ORDER,
    SIZE_ZERO,
    SUBMISSION_FAILED
};

const char* to_string(RejectReason reason);

struct SubmitResult {
    RejectReason reason{RejectReason::NONE};
    std::optional<Order> order;
    std::string detail;

    bool accepted() const { return reason == RejectReason::NONE; }
};

/**
 * The only path from a Signal to a broker Order.
 *
 * Checks run in a fixed order and stop at the first failure: signal
 * sanity, halt and time gate, position/cash/duplicate conflicts, sizing,
 * then submission. Rejections are values, logged, journaled and notified.
 */
class OrderManager {
public:
    OrderManager(const OrderConfig& config,
                 const MarketClock& clock,
                 const StrategySchedule& schedule,
                 Portfolio& portfolio,
                 std::shared_ptr<BrokerClient> broker,
                 std::shared_ptr<Notifier> notifier,
                 std::unique_ptr<SizingPolicy> sizing = nullptr,
                 std::shared_ptr<TradeJournal> journal = nullptr);

    SubmitResult submit(const Signal& signal, Timestamp now);

    void halt() { halted_.store(true); }
    bool halted() const { return halted_.load(); }

    size_t submitted_count() const { return submitted_.load(); }
    size_t rejected_count() const { return rejected_.load(); }

private:
    SubmitResult reject(const Signal& signal, RejectReason reason, const std::string& detail);
    std::optional<std::string> check_time_gate(const Signal& signal, Timestamp now) const;
    bool in_cooldown(const Signal& signal, Timestamp now) const;

    OrderConfig config_;
    const MarketClock& clock_;
    const StrategySchedule& schedule_;
    Portfolio& portfolio_;
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<Notifier> notifier_;
    std::unique_ptr<SizingPolicy> sizing_;
    std::shared_ptr<TradeJournal> journal_;

    std::atomic<bool> halted_{false};
    std::atomic<size_t> submitted_{0};
    std::atomic<size_t> rejected_{0};

    mutable std::mutex cooldown_mutex_;
    std::map<std::tuple<std::string, std::string, OrderSide>, Timestamp> last_submitted_;
};

} // namespace intraday
