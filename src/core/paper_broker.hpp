#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "broker_client.hpp"
#include "time_source.hpp"

namespace intraday {

/**
 * In-process broker for paper trading.
 *
 * Orders match against the last quote set for their symbol:
 * - market orders fill at the quote
 * - limit orders fill at the quote once it is at or through the limit
 * - with max_fill_per_poll > 0 an order fills in slices, one per match
 *   attempt (placement, quote update, status poll)
 * - buys are rejected when paper cash cannot cover the fill
 */
class PaperBroker : public BrokerClient {
public:
    PaperBroker(double initial_cash, std::shared_ptr<TimeSource> time_source,
                int64_t max_fill_per_poll = 0);

    /**
     * Update the quote for a symbol and match resting orders against it.
     */
    void set_quote(const std::string& symbol, double price);

    void seed_position(const std::string& symbol, int64_t quantity, double average_cost);

    Quote get_quote(const std::string& symbol) override;
    std::vector<BrokerPosition> get_positions() override;
    double get_cash_balance() override;
    std::string place_order(const OrderRequest& request) override;
    std::optional<std::string> find_order(const std::string& client_order_id) override;
    OrderStatusReport get_order_status(const std::string& order_id) override;
    void cancel_order(const std::string& order_id) override;
    std::vector<Fill> get_fills(Timestamp since) override;

private:
    struct PaperOrder {
        std::string id;
        OrderRequest request;
        OrderStatus status{OrderStatus::PENDING};
        int64_t filled{0};
        std::vector<Fill> fills;
        std::string message;
    };

    void try_fill_locked(PaperOrder& order);
    bool is_marketable(const PaperOrder& order, double price) const;
    int64_t pending_sell_quantity_locked(const std::string& symbol) const;

    std::shared_ptr<TimeSource> time_source_;
    int64_t max_fill_per_poll_;

    mutable std::mutex mutex_;
    double cash_;
    uint64_t next_order_seq_{1};
    uint64_t next_execution_seq_{1};
    std::unordered_map<std::string, double> quotes_;
    std::unordered_map<std::string, BrokerPosition> positions_;
    std::unordered_map<std::string, PaperOrder> orders_;
    std::unordered_map<std::string, std::string> client_ids_;
    std::vector<Fill> executions_;
};

} // namespace intraday
