#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "broker_client.hpp"
#include "config.hpp"
#include "end_of_day.hpp"
#include "fill_reconciler.hpp"
#include "market_clock.hpp"
#include "notifier.hpp"
#include "order_manager.hpp"
#include "performance.hpp"
#include "portfolio.hpp"
#include "session_checkpoint.hpp"
#include "sizing_policy.hpp"
#include "strategy.hpp"
#include "strategy_schedule.hpp"
#include "time_source.hpp"
#include "trade_journal.hpp"

namespace intraday {

enum class TickStatus {
    WAITING_NON_TRADING_DAY,
    WAITING_BEFORE_SESSION,
    ACTIVE,
    POST_MARKET,
    HALTED
};

const char* to_string(TickStatus status);

struct StrategyOutcome {
    std::string strategy_id;
    size_t signals{0};
    bool failed{false};
    bool timed_out{false};
    std::string error;
};

struct TickReport {
    TickStatus status{TickStatus::WAITING_NON_TRADING_DAY};
    std::optional<Phase> phase;
    std::string trading_date;
    std::vector<Signal> liquidation_signals;
    std::vector<SubmitResult> liquidation_results;
    std::vector<std::string> invoked_strategies;
    std::vector<StrategyOutcome> strategy_outcomes;
    std::vector<SubmitResult> results;      // strategy signals in submission order
    bool ran_end_of_day{false};
    bool shutdown_requested{false};
};

struct EngineReport {
    std::string account_id;
    std::string trading_date;
    std::optional<Phase> phase;
    bool running{false};
    bool halted{false};
    std::string halt_reason;
    double cash{0.0};
    double available_cash{0.0};
    double equity{0.0};
    double realized_pnl{0.0};
    size_t positions{0};
    size_t open_orders{0};
    size_t orders_submitted{0};
    size_t signals_rejected{0};
};

/**
 * Trading-day orchestration: phase tracking, forced liquidation, strategy
 * dispatch and the end-of-day hand-off.
 *
 * tick() and reconcile() can be driven directly (tests) or by start(),
 * which runs them on two worker threads at the configured intervals.
 */
class TradingEngine {
public:
    TradingEngine(const Config& config,
                  std::shared_ptr<TimeSource> time_source,
                  std::shared_ptr<BrokerClient> broker,
                  std::shared_ptr<Notifier> notifier,
                  std::vector<std::unique_ptr<Strategy>> strategies,
                  std::unique_ptr<SizingPolicy> sizing = nullptr,
                  std::shared_ptr<TradeJournal> journal = nullptr);
    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    /**
     * Load cash and positions from the broker, then resume today's session
     * flags and in-flight orders from the checkpoint if one exists.
     */
    void bootstrap();

    /**
     * One pass of the state machine. Idempotent for a given instant.
     */
    TickReport tick(Timestamp now);

    ReconcileReport reconcile(Timestamp now);

    void add_end_of_day_task(std::unique_ptr<EndOfDayTask> task);

    void start();
    void stop();
    void request_stop();
    bool stop_requested() const { return should_stop_.load(); }
    bool running() const { return running_.load(); }

    void halt(const std::string& reason);
    bool halted() const { return halted_.load(); }

    EngineReport report() const;

    Portfolio& portfolio() { return portfolio_; }
    const MarketClock& clock() const { return clock_; }
    PerformanceTracker& performance() { return performance_; }

private:
    void start_session_locked(const ClockReading& reading, Timestamp now);
    Phase track_phase_locked(Phase phase);
    std::vector<Signal> collect_liquidations_locked(const ClockReading& reading, Phase phase);
    MarketSnapshot snapshot_for(const std::vector<std::string>& strategy_ids,
                                const std::string& trading_date, Timestamp now);
    void run_strategy(Strategy& strategy, const MarketSnapshot& snapshot, Timestamp now, TickReport& out);
    void run_post_market_locked(const ClockReading& reading, Timestamp now, TickReport& out);
    SessionSummary build_summary_locked(const ClockReading& reading, Timestamp now) const;
    void save_state_locked() const;
    void save_state() const;

    void run_loop(const char* name, std::chrono::milliseconds period, const std::function<void()>& body);
    void record_loop_error(const std::string& where, const std::string& what);

    Config config_;
    std::shared_ptr<TimeSource> time_;
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<TradeJournal> journal_;

    MarketClock clock_;
    StrategySchedule schedule_;
    Portfolio portfolio_;
    PerformanceTracker performance_;
    std::unique_ptr<OrderManager> order_manager_;
    std::unique_ptr<FillReconciler> reconciler_;
    std::unordered_map<std::string, std::unique_ptr<Strategy>> strategies_;
    std::vector<std::unique_ptr<EndOfDayTask>> eod_tasks_;

    mutable std::mutex state_mutex_;
    SessionState state_;

    std::atomic<bool> halted_{false};
    mutable std::mutex halt_mutex_;
    std::string halt_reason_;

    std::atomic<bool> running_{false};
    std::atomic<bool> should_stop_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::unique_ptr<std::thread> tick_thread_;
    std::unique_ptr<std::thread> reconcile_thread_;

    std::mutex errors_mutex_;
    std::deque<std::chrono::steady_clock::time_point> loop_errors_;
};

} // namespace intraday
