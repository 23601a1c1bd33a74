#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include "broker_client.hpp"
#include "config.hpp"
#include "notifier.hpp"
#include "rate_limiter.hpp"

namespace intraday {

/**
 * Backoff before retry number retry (1-based): base * multiplier^(retry-1),
 * capped at max_delay_ms, then scaled by (1 + jitter_ratio * jitter) with
 * jitter in [-1, 1].
 */
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int retry, double jitter);

/**
 * Decorator adding bounded retries to every broker call.
 *
 * TransientApiFailure is retried per call-class policy; PermanentRejection
 * passes through untouched. Running out of attempts raises RetryExhausted
 * and fires an alert; escalation_threshold exhaustions in a row fire a
 * critical alert. Order placement checks the broker for the client order
 * id before each retry so a request that reached the broker is never sent
 * twice. With a limiter, every attempt first waits for its call class
 * budget.
 */
class RetryingBroker : public BrokerClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryingBroker(std::shared_ptr<BrokerClient> inner,
                   RetryConfig config,
                   std::shared_ptr<Notifier> notifier,
                   std::chrono::milliseconds quote_ttl = std::chrono::milliseconds(0),
                   Sleeper sleeper = {},
                   std::shared_ptr<RateLimiter> limiter = nullptr);

    Quote get_quote(const std::string& symbol) override;
    std::vector<BrokerPosition> get_positions() override;
    double get_cash_balance() override;
    std::string place_order(const OrderRequest& request) override;
    std::optional<std::string> find_order(const std::string& client_order_id) override;
    OrderStatusReport get_order_status(const std::string& order_id) override;
    void cancel_order(const std::string& order_id) override;
    std::vector<Fill> get_fills(Timestamp since) override;

    int consecutive_exhaustions() const { return consecutive_exhaustions_.load(); }

private:
    template <typename Fn>
    auto with_retry(const char* call_class, const RetryPolicy& policy, const std::string& operation, Fn&& fn)
        -> decltype(fn());

    void throttle(const char* call_class);
    std::chrono::milliseconds next_delay(const RetryPolicy& policy, int retry);
    void record_success();
    void record_exhaustion(const std::string& operation, int attempts, const std::string& error);

    struct CachedQuote {
        Quote quote;
        std::chrono::steady_clock::time_point fetched_at;
    };

    std::shared_ptr<BrokerClient> inner_;
    RetryConfig config_;
    std::shared_ptr<Notifier> notifier_;
    std::chrono::milliseconds quote_ttl_;
    Sleeper sleeper_;
    std::shared_ptr<RateLimiter> limiter_;

    std::mutex cache_mutex_;
    std::unordered_map<std::string, CachedQuote> quote_cache_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    std::atomic<int> consecutive_exhaustions_{0};
};

} // namespace intraday
