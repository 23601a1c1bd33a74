#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "types.hpp"
#include "utils.hpp"

namespace intraday {

inline nlohmann::json signal_to_json(const Signal& s) {
    nlohmann::json j = {
        {"strategy_id", s.strategy_id},
        {"symbol", s.symbol},
        {"side", to_string(s.side)},
        {"quantity", s.quantity},
        {"type", to_string(s.type)},
        {"reason", s.reason}
    };
    if (s.limit_price) {
        j["limit_price"] = *s.limit_price;
    }
    return j;
}

inline Signal signal_from_json(const nlohmann::json& j) {
    Signal s;
    s.strategy_id = j.value("strategy_id", "");
    s.symbol = j.value("symbol", "");
    s.side = parse_side(j.value("side", "BUY")).value_or(OrderSide::BUY);
    s.quantity = j.value("quantity", int64_t{0});
    s.type = parse_order_type(j.value("type", "MARKET")).value_or(OrderType::MARKET);
    if (j.contains("limit_price")) {
        s.limit_price = j["limit_price"].get<double>();
    }
    s.reason = j.value("reason", "");
    return s;
}

inline nlohmann::json order_to_json(const Order& o) {
    return {
        {"order_id", o.order_id},
        {"client_order_id", o.client_order_id},
        {"signal", signal_to_json(o.signal)},
        {"submitted_at_ns", utils::ts_to_ns(o.submitted_at)},
        {"status", to_string(o.status)},
        {"filled_quantity", o.filled_quantity},
        {"estimated_price", o.estimated_price},
        {"timeout_escalated", o.timeout_escalated}
    };
}

inline Order order_from_json(const nlohmann::json& j) {
    Order o;
    o.order_id = j.value("order_id", "");
    o.client_order_id = j.value("client_order_id", "");
    if (j.contains("signal")) {
        o.signal = signal_from_json(j["signal"]);
    }
    o.submitted_at = utils::ns_to_ts(j.value("submitted_at_ns", int64_t{0}));
    o.status = parse_order_status(j.value("status", "PENDING")).value_or(OrderStatus::PENDING);
    o.filled_quantity = j.value("filled_quantity", int64_t{0});
    o.estimated_price = j.value("estimated_price", 0.0);
    o.timeout_escalated = j.value("timeout_escalated", false);
    return o;
}

inline nlohmann::json fill_to_json(const Fill& f) {
    return {
        {"execution_id", f.execution_id},
        {"order_id", f.order_id},
        {"symbol", f.symbol},
        {"side", to_string(f.side)},
        {"quantity", f.quantity},
        {"price", f.price},
        {"timestamp", utils::ts_to_iso(f.timestamp)}
    };
}

inline nlohmann::json position_to_json(const Position& p) {
    return {
        {"symbol", p.symbol},
        {"quantity", p.quantity},
        {"average_cost", p.average_cost},
        {"owning_strategy_id", p.owning_strategy_id}
    };
}

} // namespace intraday
