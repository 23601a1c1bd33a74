#pragma once

#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

namespace intraday {

struct OrderRequest {
    std::string client_order_id;
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    int64_t quantity{0};
    OrderType type{OrderType::MARKET};
    std::optional<double> limit_price;
};

struct BrokerPosition {
    std::string symbol;
    int64_t quantity{0};
    double average_cost{0.0};
};

/**
 * Broker view of one order. fills lists every execution so far, in
 * execution order.
 */
struct OrderStatusReport {
    std::string order_id;
    OrderStatus status{OrderStatus::PENDING};
    std::vector<Fill> fills;
    std::string message;
};

/**
 * Brokerage order API.
 *
 * Every call may throw TransientApiFailure (retryable) or
 * PermanentRejection (not retryable).
 */
class BrokerClient {
public:
    virtual ~BrokerClient() = default;

    virtual Quote get_quote(const std::string& symbol) = 0;
    virtual std::vector<BrokerPosition> get_positions() = 0;
    virtual double get_cash_balance() = 0;

    /**
     * Submit an order; returns the broker-assigned order id.
     */
    virtual std::string place_order(const OrderRequest& request) = 0;

    /**
     * Look up a previously submitted order by client order id.
     */
    virtual std::optional<std::string> find_order(const std::string& client_order_id) = 0;

    virtual OrderStatusReport get_order_status(const std::string& order_id) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;

    /**
     * All executions on the account at or after since.
     */
    virtual std::vector<Fill> get_fills(Timestamp since) = 0;
};

} // namespace intraday
