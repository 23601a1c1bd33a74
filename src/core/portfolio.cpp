#include "portfolio.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace intraday {

namespace {

constexpr double kCashEpsilon = 1e-6;

} // namespace

int64_t PortfolioView::held(const std::string& symbol) const {
    auto it = positions.find(symbol);
    return it == positions.end() ? 0 : it->second.quantity;
}

int64_t PortfolioView::sellable(const std::string& symbol) const {
    int64_t pending_sells = 0;
    for (const auto& o : open_orders) {
        if (o.signal.symbol == symbol && o.signal.side == OrderSide::SELL) {
            pending_sells += o.remaining();
        }
    }
    return std::max<int64_t>(0, held(symbol) - pending_sells);
}

std::optional<Position> PortfolioView::position(const std::string& symbol) const {
    auto it = positions.find(symbol);
    if (it == positions.end()) return std::nullopt;
    return it->second;
}

bool PortfolioView::has_open_order(const std::string& strategy_id, const std::string& symbol) const {
    return std::any_of(open_orders.begin(), open_orders.end(), [&](const Order& o) {
        return o.signal.strategy_id == strategy_id && o.signal.symbol == symbol;
    });
}

Portfolio::Portfolio(double initial_cash) : cash_(initial_cash) {}

void Portfolio::load_snapshot(double cash,
                              const std::vector<BrokerPosition>& positions,
                              const std::unordered_map<std::string, std::string>& owners) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cash < 0.0) {
        throw StateCorruptionRisk("broker reports negative cash " + std::to_string(cash));
    }
    cash_ = cash;
    positions_.clear();
    for (const auto& bp : positions) {
        if (bp.quantity < 0) {
            throw StateCorruptionRisk("broker reports short position in " + bp.symbol);
        }
        if (bp.quantity == 0) continue;
        Position pos;
        pos.symbol = bp.symbol;
        pos.quantity = bp.quantity;
        pos.average_cost = bp.average_cost;
        auto owner = owners.find(bp.symbol);
        pos.owning_strategy_id = owner != owners.end() ? owner->second : kCarryoverOwner;
        positions_[bp.symbol] = pos;
        marks_[bp.symbol] = bp.average_cost;
    }
    spdlog::info("Portfolio loaded: cash={:.2f} positions={}", cash_, positions_.size());
}

PortfolioView Portfolio::view() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PortfolioView v;
    v.cash = cash_;
    v.committed_cash = committed_cash_locked();
    v.positions = positions_;
    v.open_orders.reserve(open_orders_.size());
    for (const auto& kv : open_orders_) {
        v.open_orders.push_back(kv.second);
    }
    std::sort(v.open_orders.begin(), v.open_orders.end(), [](const Order& a, const Order& b) {
        return a.submitted_at < b.submitted_at;
    });
    return v;
}

double Portfolio::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_;
}

std::unordered_map<std::string, Position> Portfolio::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_;
}

std::optional<Position> Portfolio::position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Order> Portfolio::open_orders() const {
    return view().open_orders;
}

std::optional<Order> Portfolio::find_order(const std::string& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_orders_.find(order_id);
    if (it == open_orders_.end()) return std::nullopt;
    return it->second;
}

size_t Portfolio::open_order_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_orders_.size();
}

bool Portfolio::slot_taken_locked(const std::string& strategy_id, const std::string& symbol) const {
    if (reservations_.count({strategy_id, symbol})) return true;
    for (const auto& kv : open_orders_) {
        if (kv.second.signal.strategy_id == strategy_id && kv.second.signal.symbol == symbol) {
            return true;
        }
    }
    return false;
}

bool Portfolio::reserve(const std::string& strategy_id, const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot_taken_locked(strategy_id, symbol)) {
        return false;
    }
    reservations_.insert({strategy_id, symbol});
    return true;
}

void Portfolio::release(const std::string& strategy_id, const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    reservations_.erase({strategy_id, symbol});
}

void Portfolio::register_order(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    reservations_.erase({order.signal.strategy_id, order.signal.symbol});
    if (open_orders_.count(order.order_id)) {
        throw StateCorruptionRisk("broker returned order id " + order.order_id + " twice");
    }
    open_orders_[order.order_id] = order;
}

void Portfolio::adopt_order(Order order, const std::vector<Fill>& existing_fills) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t filled = 0;
    for (const auto& f : existing_fills) {
        if (applied_executions_.insert(f.execution_id).second) {
            filled += f.quantity;
        }
    }
    order.filled_quantity = std::min(order.signal.quantity, filled);
    if (order.filled_quantity > 0 && order.status == OrderStatus::PENDING) {
        order.status = OrderStatus::PARTIALLY_FILLED;
    }
    open_orders_[order.order_id] = order;
}

FillResult Portfolio::apply_fill(const Fill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    FillResult result;

    if (applied_executions_.count(fill.execution_id)) {
        result.outcome = FillOutcome::DUPLICATE;
        return result;
    }
    auto oit = open_orders_.find(fill.order_id);
    if (oit == open_orders_.end()) {
        spdlog::warn("Fill {} for unknown order {} ignored", fill.execution_id, fill.order_id);
        result.outcome = FillOutcome::UNKNOWN_ORDER;
        return result;
    }
    if (fill.execution_id.empty() || fill.quantity <= 0 || fill.price <= 0.0) {
        spdlog::error("Malformed fill for order {}: exec='{}' qty={} price={}",
                      fill.order_id, fill.execution_id, fill.quantity, fill.price);
        result.outcome = FillOutcome::INVALID;
        return result;
    }

    Order& order = oit->second;
    const std::string& symbol = order.signal.symbol;
    result.strategy_id = order.signal.strategy_id;

    if (order.filled_quantity + fill.quantity > order.signal.quantity) {
        throw StateCorruptionRisk("fill " + fill.execution_id + " overfills order " + order.order_id +
                                  " (" + std::to_string(order.filled_quantity + fill.quantity) +
                                  " > " + std::to_string(order.signal.quantity) + ")");
    }

    double notional = static_cast<double>(fill.quantity) * fill.price;
    auto pit = positions_.find(symbol);

    if (order.signal.side == OrderSide::BUY) {
        if (cash_ - notional < -kCashEpsilon) {
            throw StateCorruptionRisk("fill " + fill.execution_id + " would drive cash negative");
        }
        Position& pos = positions_[symbol];
        if (pit == positions_.end()) {
            pos.symbol = symbol;
            pos.owning_strategy_id = order.signal.strategy_id;
        }
        double total_cost = pos.average_cost * static_cast<double>(pos.quantity) + notional;
        pos.quantity += fill.quantity;
        pos.average_cost = total_cost / static_cast<double>(pos.quantity);
        cash_ -= notional;
        result.position = pos;
    } else {
        int64_t held = pit == positions_.end() ? 0 : pit->second.quantity;
        if (held < fill.quantity) {
            throw StateCorruptionRisk("fill " + fill.execution_id + " sells " +
                                      std::to_string(fill.quantity) + " " + symbol +
                                      " but only " + std::to_string(held) + " held");
        }
        Position& pos = pit->second;
        result.realized_pnl = (fill.price - pos.average_cost) * static_cast<double>(fill.quantity);
        if (pos.average_cost > 0.0) {
            result.realized_return = (fill.price - pos.average_cost) / pos.average_cost;
        }
        realized_pnl_ += result.realized_pnl;
        pos.quantity -= fill.quantity;
        cash_ += notional;
        if (pos.quantity == 0) {
            positions_.erase(pit);
        } else {
            result.position = pos;
        }
    }

    order.filled_quantity += fill.quantity;
    order.status = order.filled_quantity == order.signal.quantity ? OrderStatus::FILLED
                                                                  : OrderStatus::PARTIALLY_FILLED;
    applied_executions_.insert(fill.execution_id);
    marks_[symbol] = fill.price;

    Fill logged = fill;
    logged.symbol = symbol;
    logged.side = order.signal.side;
    fill_log_.push_back(logged);

    result.outcome = FillOutcome::APPLIED;
    return result;
}

void Portfolio::update_order_status(const std::string& order_id, OrderStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_orders_.find(order_id);
    if (it != open_orders_.end()) {
        it->second.status = status;
    }
}

std::optional<Order> Portfolio::close_order(const std::string& order_id, OrderStatus final_status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_orders_.find(order_id);
    if (it == open_orders_.end()) return std::nullopt;
    Order order = it->second;
    order.status = final_status;
    open_orders_.erase(it);
    return order;
}

bool Portfolio::mark_escalated(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_orders_.find(order_id);
    if (it == open_orders_.end() || it->second.timeout_escalated) return false;
    it->second.timeout_escalated = true;
    return true;
}

void Portfolio::update_mark(const std::string& symbol, double price) {
    if (price <= 0.0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    marks_[symbol] = price;
}

double Portfolio::equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double value = cash_;
    for (const auto& kv : positions_) {
        auto mark = marks_.find(kv.first);
        double price = mark != marks_.end() ? mark->second : kv.second.average_cost;
        value += price * static_cast<double>(kv.second.quantity);
    }
    return value;
}

double Portfolio::realized_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_pnl_;
}

std::vector<Fill> Portfolio::fills() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fill_log_;
}

double Portfolio::committed_cash_locked() const {
    double committed = 0.0;
    for (const auto& kv : open_orders_) {
        const Order& o = kv.second;
        if (o.signal.side == OrderSide::BUY) {
            committed += static_cast<double>(o.remaining()) * o.estimated_price;
        }
    }
    return committed;
}

} // namespace intraday
