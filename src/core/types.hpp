#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "utils.hpp"

namespace intraday {

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT };
enum class OrderStatus { PENDING, PARTIALLY_FILLED, FILLED, REJECTED, CANCELLED };

// Owner of positions the engine did not open this session.
inline const std::string kCarryoverOwner = "carryover";
// Strategy id carried by engine-initiated sell signals.
inline const std::string kLiquidationStrategyId = "liquidation";

inline const char* to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* to_string(OrderType type) {
    return type == OrderType::MARKET ? "MARKET" : "LIMIT";
}

inline const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

inline std::optional<OrderSide> parse_side(const std::string& s) {
    if (s == "BUY" || s == "buy") return OrderSide::BUY;
    if (s == "SELL" || s == "sell") return OrderSide::SELL;
    return std::nullopt;
}

inline std::optional<OrderType> parse_order_type(const std::string& s) {
    if (s == "MARKET" || s == "market") return OrderType::MARKET;
    if (s == "LIMIT" || s == "limit") return OrderType::LIMIT;
    return std::nullopt;
}

inline std::optional<OrderStatus> parse_order_status(const std::string& s) {
    if (s == "PENDING") return OrderStatus::PENDING;
    if (s == "PARTIALLY_FILLED") return OrderStatus::PARTIALLY_FILLED;
    if (s == "FILLED") return OrderStatus::FILLED;
    if (s == "REJECTED") return OrderStatus::REJECTED;
    if (s == "CANCELLED") return OrderStatus::CANCELLED;
    return std::nullopt;
}

inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::FILLED || status == OrderStatus::REJECTED ||
           status == OrderStatus::CANCELLED;
}

struct Quote {
    std::string symbol;
    double price{0.0};
    Timestamp timestamp{};
};

/**
 * A strategy's proposed trade. Produced and consumed within one tick.
 */
struct Signal {
    std::string strategy_id;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    int64_t quantity{0};
    OrderType type{OrderType::MARKET};
    std::optional<double> limit_price;
    std::string reason;
};

struct Order {
    std::string order_id;          // broker-assigned
    std::string client_order_id;
    Signal signal;
    Timestamp submitted_at{};
    OrderStatus status{OrderStatus::PENDING};
    int64_t filled_quantity{0};
    double estimated_price{0.0};   // per share, slippage buffer included for buys
    bool timeout_escalated{false};

    int64_t remaining() const { return signal.quantity - filled_quantity; }
};

/**
 * Broker-confirmed execution. Immutable once received.
 */
struct Fill {
    std::string execution_id;
    std::string order_id;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    int64_t quantity{0};
    double price{0.0};
    Timestamp timestamp{};
};

struct Position {
    std::string symbol;
    int64_t quantity{0};
    double average_cost{0.0};
    std::string owning_strategy_id;
};

} // namespace intraday
