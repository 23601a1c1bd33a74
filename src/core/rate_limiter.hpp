#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "config.hpp"

namespace intraday {

/**
 * Fixed-window call budget per key. Keys without a limit (or with limit 0)
 * are never throttled.
 */
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit RateLimiter(std::chrono::milliseconds window = std::chrono::seconds(1), Clock clock = {})
        : window_(window), clock_(std::move(clock)) {
        if (!clock_) {
            clock_ = [] { return std::chrono::steady_clock::now(); };
        }
    }

    void set_limit(const std::string& key, size_t max_requests) {
        std::lock_guard<std::mutex> lock(mu_);
        limits_[key] = max_requests;
    }

    bool allow(const std::string& key) {
        auto now = clock_();
        std::lock_guard<std::mutex> lock(mu_);
        auto limit = limits_.find(key);
        if (limit == limits_.end() || limit->second == 0) return true;
        auto& entry = buckets_[key];
        if (!entry.started || now - entry.window_start >= window_) {
            entry.window_start = now;
            entry.count = 0;
            entry.started = true;
        }
        if (entry.count >= limit->second) return false;
        ++entry.count;
        return true;
    }

    // Time left in the key's current window.
    std::chrono::milliseconds retry_after(const std::string& key) {
        auto now = clock_();
        std::lock_guard<std::mutex> lock(mu_);
        auto it = buckets_.find(key);
        if (it == buckets_.end() || !it->second.started) return std::chrono::milliseconds(0);
        auto left = std::chrono::ceil<std::chrono::milliseconds>(it->second.window_start + window_ - now);
        return std::max(std::chrono::milliseconds(0), left);
    }

private:
    struct Bucket {
        std::chrono::steady_clock::time_point window_start{};
        size_t count{0};
        bool started{false};
    };
    std::chrono::milliseconds window_;
    Clock clock_;
    std::unordered_map<std::string, size_t> limits_;
    std::unordered_map<std::string, Bucket> buckets_;
    std::mutex mu_;
};

inline std::shared_ptr<RateLimiter> make_rate_limiter(const RateLimitConfig& cfg, RateLimiter::Clock clock = {}) {
    auto limiter = std::make_shared<RateLimiter>(std::chrono::milliseconds(cfg.window_ms), std::move(clock));
    limiter->set_limit("quote", static_cast<size_t>(cfg.quote));
    limiter->set_limit("account", static_cast<size_t>(cfg.account));
    limiter->set_limit("submit", static_cast<size_t>(cfg.submit));
    limiter->set_limit("status", static_cast<size_t>(cfg.status));
    limiter->set_limit("cancel", static_cast<size_t>(cfg.cancel));
    return limiter;
}

} // namespace intraday
