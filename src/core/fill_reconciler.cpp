#include "fill_reconciler.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "errors.hpp"

namespace intraday {

FillReconciler::FillReconciler(const ReconciliationConfig& config,
                               const MarketClock& clock,
                               Portfolio& portfolio,
                               std::shared_ptr<BrokerClient> broker,
                               std::shared_ptr<Notifier> notifier,
                               std::shared_ptr<TradeJournal> journal,
                               PerformanceTracker* performance)
    : config_(config),
      clock_(clock),
      portfolio_(portfolio),
      broker_(std::move(broker)),
      notifier_(std::move(notifier)),
      journal_(std::move(journal)),
      performance_(performance) {}

bool FillReconciler::in_blackout(Timestamp now) const {
    if (config_.blackouts.empty()) return false;
    if (!clock_.is_trading_day(clock_.local_date(now))) return false;
    int sod = clock_.seconds_of_day(now);
    for (const auto& b : config_.blackouts) {
        if (sod >= b.start && sod < b.end) return true;
    }
    return false;
}

ReconcileReport FillReconciler::run_once(Timestamp now) {
    ReconcileReport out;
    if (in_blackout(now)) {
        spdlog::debug("Reconciliation paused for blackout at {}",
                      utils::format_clock_time(clock_.seconds_of_day(now)));
        out.skipped = true;
        return out;
    }

    for (const auto& order : portfolio_.open_orders()) {
        OrderStatusReport report;
        try {
            report = broker_->get_order_status(order.order_id);
        } catch (const TransientApiFailure& e) {
            ++out.poll_failures;
            spdlog::warn("Status poll for order {} failed: {}", order.order_id, e.what());
            continue;
        } catch (const PermanentRejection& e) {
            ++out.poll_failures;
            spdlog::error("Broker no longer knows order {}: {}", order.order_id, e.what());
            if (auto closed = portfolio_.close_order(order.order_id, OrderStatus::CANCELLED)) {
                ++out.orders_closed;
                if (journal_) journal_->record_order_closed(*closed);
                if (notifier_) {
                    notifier_->notify(Severity::ERROR, "Order abandoned",
                                      "order " + order.order_id + " (" + order.signal.symbol +
                                      ") unknown to broker: " + e.what());
                }
            }
            continue;
        }
        ++out.polled;
        apply_report(order, report, now, out);
    }

    if (performance_) {
        performance_->record(now, portfolio_.equity());
    }
    return out;
}

void FillReconciler::apply_report(const Order& order, const OrderStatusReport& report, Timestamp now,
                                  ReconcileReport& out) {
    for (Fill fill : report.fills) {
        if (fill.order_id.empty()) fill.order_id = order.order_id;
        if (fill.symbol.empty()) fill.symbol = order.signal.symbol;
        fill.side = order.signal.side;

        FillResult result = portfolio_.apply_fill(fill);
        if (result.outcome != FillOutcome::APPLIED) continue;

        ++out.fills_applied;
        spdlog::info("Fill {}: {} {} {} @ {:.2f} (order {}, {})", fill.execution_id, to_string(fill.side),
                     fill.quantity, fill.symbol, fill.price, order.order_id, result.strategy_id);
        if (journal_) {
            journal_->record_fill(fill, result.strategy_id, result.realized_pnl, result.realized_return);
        }
        if (performance_ && fill.side == OrderSide::SELL) {
            performance_->record_trade(result.realized_return);
        }
        if (notifier_) {
            std::string body = fmt::format("{} {} {} x{} @ {:.2f}", result.strategy_id, to_string(fill.side),
                                           fill.symbol, fill.quantity, fill.price);
            if (fill.side == OrderSide::SELL) {
                body += fmt::format(" (realized {:+.2f})", result.realized_pnl);
            }
            notifier_->notify(Severity::INFO, "Order filled", body);
        }
    }

    if (is_terminal(report.status)) {
        auto closed = portfolio_.close_order(order.order_id, report.status);
        if (!closed) return;
        ++out.orders_closed;
        if (journal_) journal_->record_order_closed(*closed);
        if (report.status == OrderStatus::FILLED && closed->filled_quantity < closed->signal.quantity) {
            spdlog::warn("Order {} reported FILLED with {}/{} executions seen", order.order_id,
                         closed->filled_quantity, closed->signal.quantity);
        }
        if (report.status != OrderStatus::FILLED && notifier_) {
            notifier_->notify(Severity::WARNING, std::string("Order ") + to_string(report.status),
                              order.signal.strategy_id + " " + to_string(order.signal.side) + " " +
                              order.signal.symbol + " filled " + std::to_string(closed->filled_quantity) +
                              "/" + std::to_string(closed->signal.quantity) +
                              (report.message.empty() ? "" : ": " + report.message));
        }
        return;
    }

    portfolio_.update_order_status(order.order_id, report.status);
    escalate_if_stale(order, now, out);
}

void FillReconciler::escalate_if_stale(const Order& order, Timestamp now, ReconcileReport& out) {
    if (config_.pending_timeout_seconds <= 0) return;
    if (now - order.submitted_at < std::chrono::seconds(config_.pending_timeout_seconds)) return;
    if (!portfolio_.mark_escalated(order.order_id)) return;

    ++out.escalated;
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - order.submitted_at).count();
    spdlog::warn("Order {} ({} {}) still open after {}s", order.order_id, to_string(order.signal.side),
                 order.signal.symbol, age);
    if (notifier_) {
        notifier_->notify(Severity::WARNING, "Order stale",
                          "order " + order.order_id + " " + order.signal.symbol + " open for " +
                          std::to_string(age) + "s" + (config_.cancel_on_timeout ? ", cancelling" : ""));
    }
    if (!config_.cancel_on_timeout) return;
    try {
        broker_->cancel_order(order.order_id);
        spdlog::info("Cancel requested for stale order {}", order.order_id);
    } catch (const TransientApiFailure& e) {
        spdlog::error("Cancel of stale order {} failed: {}", order.order_id, e.what());
    } catch (const PermanentRejection& e) {
        spdlog::warn("Broker refused cancel of order {}: {}", order.order_id, e.what());
    }
}

} // namespace intraday
