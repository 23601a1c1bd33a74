#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "broker_client.hpp"
#include "types.hpp"

namespace intraday {

/**
 * Read-only copy of the ledger handed to strategies and validation.
 */
struct PortfolioView {
    double cash{0.0};
    double committed_cash{0.0};
    std::unordered_map<std::string, Position> positions;
    std::vector<Order> open_orders;

    double available_cash() const { return cash - committed_cash; }
    int64_t held(const std::string& symbol) const;
    int64_t sellable(const std::string& symbol) const;
    std::optional<Position> position(const std::string& symbol) const;
    bool has_open_order(const std::string& strategy_id, const std::string& symbol) const;
};

enum class FillOutcome { APPLIED, DUPLICATE, UNKNOWN_ORDER, INVALID };

struct FillResult {
    FillOutcome outcome{FillOutcome::INVALID};
    std::string strategy_id;
    std::optional<Position> position;   // after the fill, empty once flat
    double realized_pnl{0.0};           // sells only
    double realized_return{0.0};        // sells only, relative to average cost
};

/**
 * Authoritative in-memory ledger of cash, positions and open orders.
 *
 * Cash and positions change only through apply_fill(). Every method takes
 * the single ledger mutex, so the order manager's duplicate check plus
 * registration and the reconciler's removals never interleave.
 */
class Portfolio {
public:
    explicit Portfolio(double initial_cash = 0.0);

    /**
     * Replace the ledger with a broker snapshot. Positions whose owner is
     * not listed in owners belong to kCarryoverOwner.
     */
    void load_snapshot(double cash,
                       const std::vector<BrokerPosition>& positions,
                       const std::unordered_map<std::string, std::string>& owners = {});

    PortfolioView view() const;
    double cash() const;
    std::unordered_map<std::string, Position> positions() const;
    std::optional<Position> position(const std::string& symbol) const;
    std::vector<Order> open_orders() const;
    std::optional<Order> find_order(const std::string& order_id) const;
    size_t open_order_count() const;

    /**
     * Claim the (strategy, symbol) slot ahead of broker submission. Fails if
     * an open order or another reservation already holds it.
     */
    bool reserve(const std::string& strategy_id, const std::string& symbol);
    void release(const std::string& strategy_id, const std::string& symbol);

    /**
     * Record a submitted order and drop its reservation.
     */
    void register_order(const Order& order);

    /**
     * Re-attach an order recovered after restart. The fills listed are
     * already reflected in the broker snapshot and are only marked as seen.
     */
    void adopt_order(Order order, const std::vector<Fill>& existing_fills);

    /**
     * Fold one broker execution into cash and position. Throws
     * StateCorruptionRisk if the fill would overfill its order or drive
     * cash or quantity negative; the ledger is left untouched in that case.
     */
    FillResult apply_fill(const Fill& fill);

    void update_order_status(const std::string& order_id, OrderStatus status);

    /**
     * Remove an order from the open set; returns it with its final status.
     */
    std::optional<Order> close_order(const std::string& order_id, OrderStatus final_status);

    /**
     * Flag an order as escalated; returns false if it already was.
     */
    bool mark_escalated(const std::string& order_id);

    void update_mark(const std::string& symbol, double price);
    double equity() const;
    double realized_pnl() const;
    std::vector<Fill> fills() const;

private:
    double committed_cash_locked() const;
    bool slot_taken_locked(const std::string& strategy_id, const std::string& symbol) const;

    mutable std::mutex mutex_;
    double cash_{0.0};
    double realized_pnl_{0.0};
    std::unordered_map<std::string, Position> positions_;
    std::unordered_map<std::string, Order> open_orders_;
    std::set<std::pair<std::string, std::string>> reservations_;
    std::unordered_set<std::string> applied_executions_;
    std::unordered_map<std::string, double> marks_;
    std::vector<Fill> fill_log_;
};

} // namespace intraday
