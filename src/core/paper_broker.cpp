#include "paper_broker.hpp"

#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace intraday {

PaperBroker::PaperBroker(double initial_cash, std::shared_ptr<TimeSource> time_source,
                         int64_t max_fill_per_poll)
    : time_source_(std::move(time_source)),
      max_fill_per_poll_(max_fill_per_poll),
      cash_(initial_cash) {}

void PaperBroker::set_quote(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    quotes_[symbol] = price;
    for (auto& kv : orders_) {
        if (kv.second.request.symbol == symbol && !is_terminal(kv.second.status)) {
            try_fill_locked(kv.second);
        }
    }
}

void PaperBroker::seed_position(const std::string& symbol, int64_t quantity, double average_cost) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[symbol] = BrokerPosition{symbol, quantity, average_cost};
}

Quote PaperBroker::get_quote(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(symbol);
    if (it == quotes_.end()) {
        throw PermanentRejection("no quote for symbol " + symbol);
    }
    return Quote{symbol, it->second, time_source_->now()};
}

std::vector<BrokerPosition> PaperBroker::get_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BrokerPosition> out;
    for (const auto& kv : positions_) {
        if (kv.second.quantity > 0) {
            out.push_back(kv.second);
        }
    }
    return out;
}

double PaperBroker::get_cash_balance() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_;
}

std::string PaperBroker::place_order(const OrderRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (request.quantity <= 0) {
        throw PermanentRejection("quantity must be positive");
    }
    if (!quotes_.count(request.symbol)) {
        throw PermanentRejection("unknown symbol " + request.symbol);
    }
    if (request.type == OrderType::LIMIT && (!request.limit_price || *request.limit_price <= 0.0)) {
        throw PermanentRejection("limit order without limit price");
    }
    if (!request.client_order_id.empty() && client_ids_.count(request.client_order_id)) {
        throw PermanentRejection("duplicate client order id " + request.client_order_id);
    }
    if (request.side == OrderSide::SELL) {
        auto pit = positions_.find(request.symbol);
        int64_t held = pit == positions_.end() ? 0 : pit->second.quantity;
        if (held - pending_sell_quantity_locked(request.symbol) < request.quantity) {
            throw PermanentRejection("insufficient holdings for " + request.symbol);
        }
    }

    PaperOrder order;
    order.id = "P" + std::to_string(next_order_seq_++);
    order.request = request;
    if (!request.client_order_id.empty()) {
        client_ids_[request.client_order_id] = order.id;
    }
    auto& stored = orders_[order.id] = order;
    spdlog::debug("Paper order {} accepted: {} {} {}", stored.id, to_string(request.side),
                  request.quantity, request.symbol);
    try_fill_locked(stored);
    return stored.id;
}

std::optional<std::string> PaperBroker::find_order(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = client_ids_.find(client_order_id);
    if (it == client_ids_.end()) return std::nullopt;
    return it->second;
}

OrderStatusReport PaperBroker::get_order_status(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw PermanentRejection("unknown order " + order_id);
    }
    if (!is_terminal(it->second.status)) {
        try_fill_locked(it->second);
    }
    const PaperOrder& order = it->second;
    return OrderStatusReport{order.id, order.status, order.fills, order.message};
}

void PaperBroker::cancel_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw PermanentRejection("unknown order " + order_id);
    }
    if (is_terminal(it->second.status)) {
        throw PermanentRejection("order " + order_id + " is already " + to_string(it->second.status));
    }
    it->second.status = OrderStatus::CANCELLED;
    it->second.message = "cancelled by client";
}

std::vector<Fill> PaperBroker::get_fills(Timestamp since) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Fill> out;
    std::copy_if(executions_.begin(), executions_.end(), std::back_inserter(out),
                 [since](const Fill& f) { return f.timestamp >= since; });
    return out;
}

bool PaperBroker::is_marketable(const PaperOrder& order, double price) const {
    if (order.request.type == OrderType::MARKET) return true;
    double limit = *order.request.limit_price;
    return order.request.side == OrderSide::BUY ? price <= limit : price >= limit;
}

int64_t PaperBroker::pending_sell_quantity_locked(const std::string& symbol) const {
    int64_t pending = 0;
    for (const auto& kv : orders_) {
        const PaperOrder& o = kv.second;
        if (o.request.symbol == symbol && o.request.side == OrderSide::SELL && !is_terminal(o.status)) {
            pending += o.request.quantity - o.filled;
        }
    }
    return pending;
}

void PaperBroker::try_fill_locked(PaperOrder& order) {
    auto qit = quotes_.find(order.request.symbol);
    if (qit == quotes_.end()) return;
    double price = qit->second;
    if (!is_marketable(order, price)) return;

    int64_t qty = order.request.quantity - order.filled;
    if (max_fill_per_poll_ > 0) {
        qty = std::min(qty, max_fill_per_poll_);
    }
    if (qty <= 0) return;

    double notional = static_cast<double>(qty) * price;
    auto& pos = positions_[order.request.symbol];
    pos.symbol = order.request.symbol;
    if (order.request.side == OrderSide::BUY) {
        if (notional > cash_) {
            order.status = OrderStatus::REJECTED;
            order.message = "insufficient paper cash";
            spdlog::warn("Paper order {} rejected: insufficient cash", order.id);
            return;
        }
        double total_cost = pos.average_cost * static_cast<double>(pos.quantity) + notional;
        pos.quantity += qty;
        pos.average_cost = total_cost / static_cast<double>(pos.quantity);
        cash_ -= notional;
    } else {
        pos.quantity -= qty;
        cash_ += notional;
        if (pos.quantity == 0) {
            pos.average_cost = 0.0;
        }
    }

    Fill fill;
    fill.execution_id = "E" + std::to_string(next_execution_seq_++);
    fill.order_id = order.id;
    fill.symbol = order.request.symbol;
    fill.side = order.request.side;
    fill.quantity = qty;
    fill.price = price;
    fill.timestamp = time_source_->now();
    order.fills.push_back(fill);
    executions_.push_back(fill);

    order.filled += qty;
    order.status = order.filled == order.request.quantity ? OrderStatus::FILLED
                                                          : OrderStatus::PARTIALLY_FILLED;
}

} // namespace intraday
