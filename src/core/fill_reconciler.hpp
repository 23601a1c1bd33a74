#pragma once

#include <memory>
#include "broker_client.hpp"
#include "config.hpp"
#include "market_clock.hpp"
#include "notifier.hpp"
#include "performance.hpp"
#include "portfolio.hpp"
#include "trade_journal.hpp"

namespace intraday {

struct ReconcileReport {
    bool skipped{false};        // blackout window
    size_t polled{0};
    size_t poll_failures{0};
    size_t fills_applied{0};
    size_t orders_closed{0};
    size_t escalated{0};
};

/**
 * Polls the broker for every open order and folds new executions into the
 * portfolio, in the order the broker reports them.
 *
 * StateCorruptionRisk from the ledger propagates to the caller; transient
 * broker failures only skip the affected order until the next pass.
 */
class FillReconciler {
public:
    FillReconciler(const ReconciliationConfig& config,
                   const MarketClock& clock,
                   Portfolio& portfolio,
                   std::shared_ptr<BrokerClient> broker,
                   std::shared_ptr<Notifier> notifier,
                   std::shared_ptr<TradeJournal> journal = nullptr,
                   PerformanceTracker* performance = nullptr);

    ReconcileReport run_once(Timestamp now);

    bool in_blackout(Timestamp now) const;

private:
    void apply_report(const Order& order, const OrderStatusReport& report, Timestamp now, ReconcileReport& out);
    void escalate_if_stale(const Order& order, Timestamp now, ReconcileReport& out);

    ReconciliationConfig config_;
    const MarketClock& clock_;
    Portfolio& portfolio_;
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<TradeJournal> journal_;
    PerformanceTracker* performance_;
};

} // namespace intraday
