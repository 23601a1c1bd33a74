#pragma once

#include <chrono>
#include <ctime>
#include <atomic>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../src/core/broker_client.hpp"
#include "../src/core/config.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/notifier.hpp"
#include "../src/core/strategy.hpp"

namespace intraday {
namespace fakes {

using TimePoint = std::chrono::system_clock::time_point;

inline TimePoint make_utc(int year, int month, int day, int hour, int minute, int sec = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = sec;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// Exchange local time for the default calendar (UTC+09:00).
inline TimePoint kst(int year, int month, int day, int hour, int minute, int sec = 0) {
    return make_utc(year, month, day, hour, minute, sec) - std::chrono::hours(9);
}

inline std::string temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("intraday_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    return dir.string();
}

inline Signal make_signal(const std::string& strategy, const std::string& symbol, OrderSide side,
                          int64_t quantity) {
    Signal s;
    s.strategy_id = strategy;
    s.symbol = symbol;
    s.side = side;
    s.quantity = quantity;
    s.type = OrderType::MARKET;
    s.reason = "test";
    return s;
}

inline StrategyConfig window_config(const std::string& id, int start, int end, int lead = 60,
                                    bool hold_overnight = false) {
    StrategyConfig sc;
    sc.id = id;
    sc.type = "scripted";
    sc.window_start = start;
    sc.window_end = end;
    sc.liquidate_before_end_seconds = lead;
    sc.hold_overnight = hold_overnight;
    return sc;
}

constexpr int hms(int h, int m, int s = 0) {
    return h * 3600 + m * 60 + s;
}

struct Notification {
    Severity severity;
    std::string title;
    std::string body;
};

class RecordingNotifier : public Notifier {
public:
    void notify(Severity severity, const std::string& title, const std::string& body) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back({severity, title, body});
    }

    std::vector<Notification> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t count(Severity severity) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& s : sent_) {
            if (s.severity == severity) ++n;
        }
        return n;
    }

    size_t count_title(const std::string& title) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& s : sent_) {
            if (s.title == title) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Notification> sent_;
};

/**
 * Scriptable broker. Failures are queued per call and consumed in order;
 * orders stay PENDING until a test sets their status report.
 */
class FakeBroker : public BrokerClient {
public:
    enum class Failure { TRANSIENT, PERMANENT, TRANSIENT_AFTER_ACCEPT, UNEXPECTED };

    Quote get_quote(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++quote_calls;
        if (pop(quote_failures)) throw TransientApiFailure("quote timeout");
        auto it = quotes.find(symbol);
        if (it == quotes.end()) throw PermanentRejection("no quote for " + symbol);
        return Quote{symbol, it->second, Timestamp{}};
    }

    std::vector<BrokerPosition> get_positions() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return positions;
    }

    double get_cash_balance() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cash;
    }

    std::string place_order(const OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++place_calls;
        if (!place_failures.empty()) {
            Failure f = place_failures.front();
            place_failures.pop_front();
            if (f == Failure::PERMANENT) throw PermanentRejection("order refused");
            if (f == Failure::TRANSIENT) throw TransientApiFailure("submit timeout");
            if (f == Failure::UNEXPECTED) throw std::runtime_error("socket reset");
            accept_locked(request);
            throw TransientApiFailure("response lost");
        }
        return accept_locked(request);
    }

    std::optional<std::string> find_order(const std::string& client_order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++find_calls;
        if (pop(find_failures)) throw TransientApiFailure("lookup timeout");
        auto it = by_client_id.find(client_order_id);
        if (it == by_client_id.end()) return std::nullopt;
        return it->second;
    }

    OrderStatusReport get_order_status(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++status_calls;
        if (pop(status_failures)) throw TransientApiFailure("status timeout");
        auto it = reports.find(order_id);
        if (it == reports.end()) throw PermanentRejection("unknown order " + order_id);
        return it->second;
    }

    void cancel_order(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled.push_back(order_id);
    }

    std::vector<Fill> get_fills(Timestamp since) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Fill> out;
        for (const auto& f : executions) {
            if (f.timestamp >= since) out.push_back(f);
        }
        return out;
    }

    // Append an execution to an order's report and the account history.
    void add_fill(const std::string& order_id, const std::string& exec_id, int64_t qty, double price,
                  OrderStatus status, Timestamp ts = Timestamp{}) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& report = reports[order_id];
        report.order_id = order_id;
        Fill f;
        f.execution_id = exec_id;
        f.order_id = order_id;
        f.quantity = qty;
        f.price = price;
        f.timestamp = ts;
        auto req = requests.find(order_id);
        if (req != requests.end()) {
            f.symbol = req->second.symbol;
            f.side = req->second.side;
        }
        report.fills.push_back(f);
        report.status = status;
        executions.push_back(f);
    }

    void set_status(const std::string& order_id, OrderStatus status, const std::string& message = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& report = reports[order_id];
        report.order_id = order_id;
        report.status = status;
        report.message = message;
    }

    size_t live_orders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests.size();
    }

    std::unordered_map<std::string, double> quotes;
    std::vector<BrokerPosition> positions;
    double cash{0.0};

    std::deque<bool> quote_failures;
    std::deque<Failure> place_failures;
    std::deque<bool> find_failures;
    std::deque<bool> status_failures;

    std::vector<OrderRequest> accepted;    // in acceptance order
    std::unordered_map<std::string, OrderRequest> requests;
    std::unordered_map<std::string, std::string> by_client_id;
    std::unordered_map<std::string, OrderStatusReport> reports;
    std::vector<Fill> executions;
    std::vector<std::string> cancelled;

    int quote_calls{0};
    int place_calls{0};
    int find_calls{0};
    int status_calls{0};

private:
    static bool pop(std::deque<bool>& q) {
        if (q.empty()) return false;
        bool fail = q.front();
        q.pop_front();
        return fail;
    }

    std::string accept_locked(const OrderRequest& request) {
        std::string id = "F" + std::to_string(accepted.size() + 1);
        accepted.push_back(request);
        requests[id] = request;
        by_client_id[request.client_order_id] = id;
        reports[id] = OrderStatusReport{id, OrderStatus::PENDING, {}, ""};
        return id;
    }

    mutable std::mutex mutex_;
};

/**
 * Strategy driven by a callback, counting its invocations.
 */
class ScriptedStrategy : public Strategy {
public:
    using Body = std::function<std::vector<Signal>(const MarketSnapshot&, const PortfolioView&, Timestamp)>;

    ScriptedStrategy(std::string id, std::vector<std::string> universe, Body body)
        : id_(std::move(id)), universe_(std::move(universe)), body_(std::move(body)) {}

    const std::string& id() const override { return id_; }
    std::vector<std::string> universe() const override { return universe_; }
    std::vector<Signal> evaluate(const MarketSnapshot& snapshot, const PortfolioView& view,
                                 Timestamp now) override {
        ++calls_;
        return body_(snapshot, view, now);
    }

    int calls() const { return calls_.load(); }

private:
    std::string id_;
    std::vector<std::string> universe_;
    Body body_;
    std::atomic<int> calls_{0};
};

} // namespace fakes
} // namespace intraday
