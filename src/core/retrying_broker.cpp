#include "retrying_broker.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace intraday {

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int retry, double jitter) {
    double delay = policy.base_delay_ms * std::pow(policy.multiplier, std::max(0, retry - 1));
    delay = std::min(delay, static_cast<double>(policy.max_delay_ms));
    jitter = std::max(-1.0, std::min(1.0, jitter));
    delay *= 1.0 + policy.jitter_ratio * jitter;
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
}

RetryingBroker::RetryingBroker(std::shared_ptr<BrokerClient> inner,
                               RetryConfig config,
                               std::shared_ptr<Notifier> notifier,
                               std::chrono::milliseconds quote_ttl,
                               Sleeper sleeper,
                               std::shared_ptr<RateLimiter> limiter)
    : inner_(std::move(inner)),
      config_(config),
      notifier_(std::move(notifier)),
      quote_ttl_(quote_ttl),
      sleeper_(std::move(sleeper)),
      limiter_(std::move(limiter)),
      rng_(std::random_device{}()) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds RetryingBroker::next_delay(const RetryPolicy& policy, int retry) {
    double jitter = 0.0;
    if (policy.jitter_ratio > 0.0) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        jitter = dist(rng_);
    }
    return backoff_delay(policy, retry, jitter);
}

void RetryingBroker::record_success() {
    consecutive_exhaustions_.store(0);
}

void RetryingBroker::record_exhaustion(const std::string& operation, int attempts, const std::string& error) {
    int streak = ++consecutive_exhaustions_;
    spdlog::error("{} gave up after {} attempts: {}", operation, attempts, error);
    if (notifier_) {
        notifier_->notify(Severity::ERROR, "Broker call failed",
                          operation + " failed after " + std::to_string(attempts) + " attempts: " + error);
        if (streak == config_.escalation_threshold) {
            notifier_->notify(Severity::CRITICAL, "Broker API degraded",
                              std::to_string(streak) + " broker calls in a row exhausted their retries");
        }
    }
}

void RetryingBroker::throttle(const char* call_class) {
    if (!limiter_) return;
    while (!limiter_->allow(call_class)) {
        auto wait = limiter_->retry_after(call_class);
        spdlog::warn("Broker {} call budget spent, waiting {}ms", call_class, wait.count());
        sleeper_(wait);
    }
}

template <typename Fn>
auto RetryingBroker::with_retry(const char* call_class, const RetryPolicy& policy, const std::string& operation,
                                Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        throttle(call_class);
        try {
            auto result = fn();
            record_success();
            return result;
        } catch (const TransientApiFailure& e) {
            if (attempt >= policy.max_attempts) {
                record_exhaustion(operation, attempt, e.what());
                throw RetryExhausted(operation, attempt, e.what());
            }
            auto delay = next_delay(policy, attempt);
            spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {}ms",
                         operation, attempt, policy.max_attempts, e.what(), delay.count());
            sleeper_(delay);
        }
    }
}

Quote RetryingBroker::get_quote(const std::string& symbol) {
    auto now = std::chrono::steady_clock::now();
    if (quote_ttl_.count() > 0) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = quote_cache_.find(symbol);
        if (it != quote_cache_.end() && now - it->second.fetched_at < quote_ttl_) {
            return it->second.quote;
        }
    }
    Quote quote = with_retry("quote", config_.quote, "get_quote " + symbol,
                             [&] { return inner_->get_quote(symbol); });
    if (quote_ttl_.count() > 0) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        quote_cache_[symbol] = CachedQuote{quote, now};
    }
    return quote;
}

std::vector<BrokerPosition> RetryingBroker::get_positions() {
    return with_retry("account", config_.account, "get_positions", [&] { return inner_->get_positions(); });
}

double RetryingBroker::get_cash_balance() {
    return with_retry("account", config_.account, "get_cash_balance", [&] { return inner_->get_cash_balance(); });
}

std::string RetryingBroker::place_order(const OrderRequest& request) {
    const RetryPolicy& policy = config_.submit;
    const std::string operation = "place_order " + request.symbol + " " + request.client_order_id;
    std::string last_error;
    int attempt = 0;

    while (true) {
        ++attempt;
        throttle("submit");
        try {
            auto order_id = inner_->place_order(request);
            record_success();
            return order_id;
        } catch (const TransientApiFailure& e) {
            last_error = e.what();
            spdlog::warn("{} failed (attempt {}/{}): {}", operation, attempt, policy.max_attempts, last_error);
        }

        if (attempt < policy.max_attempts) {
            sleeper_(next_delay(policy, attempt));
        }

        // The failed request may still have reached the broker.
        std::optional<std::string> existing;
        throttle("status");
        try {
            existing = inner_->find_order(request.client_order_id);
        } catch (const std::exception& e) {
            std::string error = last_error + "; order lookup failed: " + e.what();
            record_exhaustion(operation, attempt, error);
            throw RetryExhausted(operation, attempt, error);
        }
        if (existing) {
            spdlog::info("{} found at broker as {} after transient failure", operation, *existing);
            record_success();
            return *existing;
        }
        if (attempt >= policy.max_attempts) {
            record_exhaustion(operation, attempt, last_error);
            throw RetryExhausted(operation, attempt, last_error);
        }
    }
}

std::optional<std::string> RetryingBroker::find_order(const std::string& client_order_id) {
    return with_retry("status", config_.status, "find_order " + client_order_id,
                      [&] { return inner_->find_order(client_order_id); });
}

OrderStatusReport RetryingBroker::get_order_status(const std::string& order_id) {
    return with_retry("status", config_.status, "get_order_status " + order_id,
                      [&] { return inner_->get_order_status(order_id); });
}

void RetryingBroker::cancel_order(const std::string& order_id) {
    with_retry("cancel", config_.cancel, "cancel_order " + order_id, [&] {
        inner_->cancel_order(order_id);
        return true;
    });
}

std::vector<Fill> RetryingBroker::get_fills(Timestamp since) {
    return with_retry("account", config_.account, "get_fills", [&] { return inner_->get_fills(since); });
}

} // namespace intraday
