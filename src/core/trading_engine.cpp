#include "trading_engine.hpp"

#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "errors.hpp"

namespace intraday {

namespace {

// Sink failures are logged and never reach the tick or reconcile paths.
std::shared_ptr<Notifier> guarded(std::shared_ptr<Notifier> sink) {
    if (!sink) return nullptr;
    auto fanout = std::make_shared<FanoutNotifier>();
    fanout->add(std::move(sink));
    return fanout;
}

} // namespace

const char* to_string(TickStatus status) {
    switch (status) {
        case TickStatus::WAITING_NON_TRADING_DAY: return "WAITING_NON_TRADING_DAY";
        case TickStatus::WAITING_BEFORE_SESSION: return "WAITING_BEFORE_SESSION";
        case TickStatus::ACTIVE: return "ACTIVE";
        case TickStatus::POST_MARKET: return "POST_MARKET";
        case TickStatus::HALTED: return "HALTED";
    }
    return "UNKNOWN";
}

TradingEngine::TradingEngine(const Config& config,
                             std::shared_ptr<TimeSource> time_source,
                             std::shared_ptr<BrokerClient> broker,
                             std::shared_ptr<Notifier> notifier,
                             std::vector<std::unique_ptr<Strategy>> strategies,
                             std::unique_ptr<SizingPolicy> sizing,
                             std::shared_ptr<TradeJournal> journal)
    : config_(config),
      time_(std::move(time_source)),
      broker_(std::move(broker)),
      notifier_(guarded(std::move(notifier))),
      journal_(std::move(journal)),
      clock_(config_.calendar, config_.session),
      schedule_(config_.strategies, config_.session) {
    order_manager_ = std::make_unique<OrderManager>(config_.orders, clock_, schedule_, portfolio_, broker_,
                                                    notifier_, std::move(sizing), journal_);
    reconciler_ = std::make_unique<FillReconciler>(config_.reconciliation, clock_, portfolio_, broker_,
                                                   notifier_, journal_, &performance_);

    for (auto& strategy : strategies) {
        if (!strategy) continue;
        std::string id = strategy->id();
        if (schedule_.find(id) == nullptr) {
            throw ConfigurationError("strategy '" + id + "' has no enabled trading window");
        }
        if (strategies_.count(id)) {
            throw ConfigurationError("strategy '" + id + "' instantiated twice");
        }
        strategies_[id] = std::move(strategy);
    }
    for (const auto& id : schedule_.ids()) {
        if (!strategies_.count(id)) {
            spdlog::warn("Strategy {} has a window but no instance; it will never be invoked", id);
        }
    }
}

TradingEngine::~TradingEngine() {
    stop();
}

void TradingEngine::add_end_of_day_task(std::unique_ptr<EndOfDayTask> task) {
    if (!task) return;
    std::lock_guard<std::mutex> lock(state_mutex_);
    eod_tasks_.push_back(std::move(task));
}

void TradingEngine::bootstrap() {
    Timestamp now = time_->now();
    std::string today = clock_.local_date(now).to_string();

    double cash = broker_->get_cash_balance();
    auto positions = broker_->get_positions();
    auto ckpt = load_checkpoint(config_.account.id, config_.engine.checkpoint_directory);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!ckpt) {
        portfolio_.load_snapshot(cash, positions);
        spdlog::info("No session checkpoint for {}, starting fresh", config_.account.id);
        return;
    }
    // A position that appeared while offline was opened by the buy order
    // that was in flight for it.
    auto owners = ckpt->position_owners;
    for (const auto& order : ckpt->open_orders) {
        if (order.signal.side == OrderSide::BUY && !owners.count(order.signal.symbol)) {
            owners[order.signal.symbol] = order.signal.strategy_id;
        }
    }
    portfolio_.load_snapshot(cash, positions, owners);

    if (ckpt->state.trading_date == today) {
        state_ = ckpt->state;
        spdlog::info("Resuming session {} (last phase {}, post-market {})", today,
                     state_.last_phase ? to_string(*state_.last_phase) : "none",
                     state_.post_market_ran ? "done" : "pending");
    } else {
        spdlog::info("Checkpoint is from {}, session flags start clean", ckpt->state.trading_date);
    }

    // Fills already reported for a recovered order are part of the broker
    // snapshot loaded above and are only marked as seen.
    size_t adopted = 0;
    for (const auto& order : ckpt->open_orders) {
        OrderStatusReport status;
        try {
            status = broker_->get_order_status(order.order_id);
        } catch (const PermanentRejection& e) {
            spdlog::warn("Checkpointed order {} unknown to broker, dropped: {}", order.order_id, e.what());
            continue;
        }
        if (is_terminal(status.status)) {
            spdlog::info("Checkpointed order {} finished while offline ({})", order.order_id,
                         to_string(status.status));
            continue;
        }
        portfolio_.adopt_order(order, status.fills);
        ++adopted;
    }
    if (adopted > 0) {
        spdlog::info("Recovered {} open orders from checkpoint", adopted);
        if (notifier_) {
            notifier_->notify(Severity::INFO, "Recovered open orders",
                              std::to_string(adopted) + " in-flight orders resumed for " + config_.account.id);
        }
    }
}

TickReport TradingEngine::tick(Timestamp now) {
    TickReport out;
    ClockReading reading = clock_.read(now);
    out.trading_date = reading.date.to_string();

    if (halted_.load()) {
        out.status = TickStatus::HALTED;
        out.phase = Phase::HALTED;
        return out;
    }
    if (reading.status == DayStatus::NON_TRADING_DAY) {
        out.status = TickStatus::WAITING_NON_TRADING_DAY;
        return out;
    }
    if (reading.status == DayStatus::BEFORE_SESSION) {
        out.status = TickStatus::WAITING_BEFORE_SESSION;
        return out;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    try {
        if (state_.trading_date != out.trading_date) {
            start_session_locked(reading, now);
        }
        Phase phase = track_phase_locked(reading.phase);
        out.phase = phase;

        if (phase == Phase::POST_MARKET) {
            out.status = TickStatus::POST_MARKET;
            run_post_market_locked(reading, now, out);
            save_state_locked();
            return out;
        }
        out.status = TickStatus::ACTIVE;

        if (is_market_phase(phase)) {
            std::set<std::string> liquidated_owners;
            for (const auto& signal : collect_liquidations_locked(reading, phase)) {
                liquidated_owners.insert(signal.reason);
                out.liquidation_signals.push_back(signal);
                out.liquidation_results.push_back(order_manager_->submit(signal, now));
            }

            std::vector<std::string> due;
            for (const auto& id : schedule_.active_at(reading.seconds_of_day)) {
                if (liquidated_owners.count(id)) {
                    spdlog::info("Strategy {} skipped this tick, its positions are being liquidated", id);
                    continue;
                }
                if (strategies_.count(id)) due.push_back(id);
            }
            if (!due.empty()) {
                MarketSnapshot snapshot = snapshot_for(due, out.trading_date, now);
                for (const auto& id : due) {
                    run_strategy(*strategies_.at(id), snapshot, now, out);
                }
            }
        }
        save_state_locked();
    } catch (const StateCorruptionRisk& e) {
        halt(e.what());
        out.status = TickStatus::HALTED;
        out.phase = Phase::HALTED;
    }
    return out;
}

void TradingEngine::start_session_locked(const ClockReading& reading, Timestamp now) {
    std::string date = reading.date.to_string();
    if (!state_.trading_date.empty()) {
        spdlog::info("Trading date rolled from {} to {}", state_.trading_date, date);
    }
    state_.reset(date);
    if (journal_) {
        journal_->start_day(date);
    }
    state_.starting_cash = portfolio_.cash();
    for (const auto& kv : portfolio_.positions()) {
        state_.carryover_symbols.insert(kv.first);
    }
    performance_.reset();
    performance_.record(now, portfolio_.equity());
    spdlog::info("Session {} started: cash={:.2f} carryover positions={}", date, state_.starting_cash,
                 state_.carryover_symbols.size());
}

Phase TradingEngine::track_phase_locked(Phase phase) {
    if (state_.last_phase) {
        if (phase < *state_.last_phase) {
            spdlog::warn("Clock reads phase {} after {}, keeping {}", to_string(phase),
                         to_string(*state_.last_phase), to_string(*state_.last_phase));
            return *state_.last_phase;
        }
        if (phase == *state_.last_phase) return phase;
    }
    state_.last_phase = phase;
    state_.phases_entered.push_back(phase);
    spdlog::info("Entering phase {} on {}", to_string(phase), state_.trading_date);
    if (notifier_) {
        notifier_->notify(Severity::INFO, std::string("Phase ") + to_string(phase),
                          config_.account.id + " " + state_.trading_date);
    }
    return phase;
}

std::vector<Signal> TradingEngine::collect_liquidations_locked(const ClockReading& reading, Phase phase) {
    std::vector<Signal> out;
    PortfolioView view = portfolio_.view();

    std::vector<std::string> symbols;
    for (const auto& kv : view.positions) symbols.push_back(kv.first);
    std::sort(symbols.begin(), symbols.end());

    for (const auto& symbol : symbols) {
        const Position& pos = view.positions.at(symbol);
        const std::string& owner = pos.owning_strategy_id;
        const char* cause = nullptr;

        if (schedule_.find(owner) != nullptr && !schedule_.holds_overnight(owner)) {
            if (phase >= Phase::CLOSING_PREP) {
                cause = "closing";
            } else if (schedule_.past_deadline(owner, reading.seconds_of_day)) {
                cause = "window deadline";
            }
        }
        if (cause == nullptr && state_.carryover_symbols.count(symbol) &&
            config_.engine.liquidate_carryover_at_open) {
            cause = "carryover";
        }
        if (cause == nullptr) continue;

        int64_t quantity = view.sellable(symbol);
        if (quantity <= 0) continue;   // exit already working

        Signal signal;
        signal.strategy_id = kLiquidationStrategyId;
        signal.symbol = symbol;
        signal.side = OrderSide::SELL;
        signal.quantity = quantity;
        signal.type = OrderType::MARKET;
        signal.reason = owner;
        out.push_back(signal);

        spdlog::warn("Forced liquidation of {} x{} owned by {} ({})", symbol, quantity, owner, cause);
        if (state_.liquidation_announced.insert(owner).second && notifier_) {
            notifier_->notify(Severity::WARNING, "Forced liquidation",
                              owner + " positions sold at market (" + cause + ")");
        }
    }

    for (auto it = state_.carryover_symbols.begin(); it != state_.carryover_symbols.end();) {
        if (!view.positions.count(*it)) {
            it = state_.carryover_symbols.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

MarketSnapshot TradingEngine::snapshot_for(const std::vector<std::string>& strategy_ids,
                                           const std::string& trading_date, Timestamp now) {
    MarketSnapshot snapshot;
    snapshot.as_of = now;
    snapshot.trading_date = trading_date;

    std::set<std::string> symbols;
    for (const auto& id : strategy_ids) {
        for (const auto& s : strategies_.at(id)->universe()) symbols.insert(s);
    }
    for (const auto& symbol : symbols) {
        try {
            Quote quote = broker_->get_quote(symbol);
            portfolio_.update_mark(symbol, quote.price);
            snapshot.quotes[symbol] = quote;
        } catch (const TransientApiFailure& e) {
            spdlog::warn("No quote for {} this tick: {}", symbol, e.what());
        } catch (const PermanentRejection& e) {
            spdlog::warn("Broker refused quote for {}: {}", symbol, e.what());
        }
    }
    return snapshot;
}

void TradingEngine::run_strategy(Strategy& strategy, const MarketSnapshot& snapshot, Timestamp now,
                                 TickReport& out) {
    StrategyOutcome outcome;
    outcome.strategy_id = strategy.id();
    out.invoked_strategies.push_back(strategy.id());

    std::vector<Signal> signals;
    auto started = std::chrono::steady_clock::now();
    try {
        signals = strategy.evaluate(snapshot, portfolio_.view(), now);
    } catch (const std::exception& e) {
        outcome.failed = true;
        outcome.error = e.what();
        spdlog::error("Strategy {} failed: {}", strategy.id(), e.what());
        if (notifier_) {
            notifier_->notify(Severity::ERROR, "Strategy failed", strategy.id() + ": " + e.what());
        }
        out.strategy_outcomes.push_back(outcome);
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (elapsed.count() > config_.engine.strategy_timeout_ms) {
        outcome.failed = true;
        outcome.timed_out = true;
        outcome.error = fmt::format("evaluation took {}ms, limit {}ms", elapsed.count(),
                                    config_.engine.strategy_timeout_ms);
        spdlog::error("Strategy {} too slow ({}), {} signals discarded", strategy.id(), outcome.error,
                      signals.size());
        if (notifier_) {
            notifier_->notify(Severity::ERROR, "Strategy timed out", strategy.id() + ": " + outcome.error);
        }
        out.strategy_outcomes.push_back(outcome);
        return;
    }

    outcome.signals = signals.size();
    out.strategy_outcomes.push_back(outcome);
    for (const auto& signal : signals) {
        if (signal.strategy_id != strategy.id()) {
            spdlog::warn("Strategy {} emitted a signal tagged '{}' for {}, dropped", strategy.id(),
                         signal.strategy_id, signal.symbol);
            continue;
        }
        out.results.push_back(order_manager_->submit(signal, now));
    }
}

void TradingEngine::run_post_market_locked(const ClockReading& reading, Timestamp now, TickReport& out) {
    if (!state_.post_market_ran) {
        // Persist the flag first so a crash mid-way never reruns the tasks.
        state_.post_market_ran = true;
        save_state_locked();
        out.ran_end_of_day = true;

        SessionSummary summary = build_summary_locked(reading, now);
        spdlog::info("Post-market {}: equity={:.2f} realized={:+.2f} fills={} open orders={}",
                     summary.trading_date, summary.equity, summary.realized_pnl, summary.fills.size(),
                     summary.open_orders);
        for (auto& task : eod_tasks_) {
            try {
                task->run(summary);
                spdlog::info("End-of-day task {} finished", task->name());
            } catch (const std::exception& e) {
                spdlog::error("End-of-day task {} failed: {}", task->name(), e.what());
                if (notifier_) {
                    notifier_->notify(Severity::ERROR, "End-of-day task failed", task->name() + ": " + e.what());
                }
            }
        }
        if (notifier_) {
            notifier_->notify(Severity::INFO, "Session closed",
                              fmt::format("{} {}: equity {:.2f} ({:+.2f}%), {} fills, {} rejected signals",
                                          summary.account_id, summary.trading_date, summary.equity,
                                          summary.performance.total_return * 100.0, summary.fills.size(),
                                          summary.signals_rejected));
        }
    }

    if (config_.session.auto_shutdown && reading.seconds_of_day >= config_.session.shutdown_time) {
        if (!state_.shutdown_requested) {
            state_.shutdown_requested = true;
            spdlog::info("Shutdown time {} reached", utils::format_clock_time(config_.session.shutdown_time));
            if (notifier_) {
                notifier_->notify(Severity::INFO, "Shutting down", config_.account.id + " " + state_.trading_date);
            }
        }
        request_stop();
    }
    out.shutdown_requested = state_.shutdown_requested;
}

SessionSummary TradingEngine::build_summary_locked(const ClockReading& reading, Timestamp now) const {
    SessionSummary s;
    s.account_id = config_.account.id;
    s.trading_date = state_.trading_date;
    s.session_start = clock_.to_instant(reading.date, config_.session.session_start);
    s.generated_at = now;
    s.starting_cash = state_.starting_cash;
    s.cash = portfolio_.cash();
    s.equity = portfolio_.equity();
    s.realized_pnl = portfolio_.realized_pnl();
    s.positions = portfolio_.positions();
    for (const auto& f : portfolio_.fills()) {
        if (f.timestamp >= s.session_start) s.fills.push_back(f);
    }
    s.open_orders = portfolio_.open_order_count();
    s.orders_submitted = order_manager_->submitted_count();
    s.signals_rejected = order_manager_->rejected_count();
    s.performance = performance_.metrics();
    return s;
}

void TradingEngine::save_state_locked() const {
    SessionCheckpoint ckpt;
    ckpt.account_id = config_.account.id;
    ckpt.state = state_;
    ckpt.open_orders = portfolio_.open_orders();
    for (const auto& kv : portfolio_.positions()) {
        ckpt.position_owners[kv.first] = kv.second.owning_strategy_id;
    }
    save_checkpoint(ckpt, config_.engine.checkpoint_directory);
}

void TradingEngine::save_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    save_state_locked();
}

ReconcileReport TradingEngine::reconcile(Timestamp now) {
    if (halted_.load()) return ReconcileReport{};
    ReconcileReport out;
    try {
        out = reconciler_->run_once(now);
    } catch (const StateCorruptionRisk& e) {
        halt(e.what());
        return out;
    }
    if (out.fills_applied > 0 || out.orders_closed > 0) {
        save_state();
    }
    return out;
}

void TradingEngine::halt(const std::string& reason) {
    bool expected = false;
    if (!halted_.compare_exchange_strong(expected, true)) return;
    {
        std::lock_guard<std::mutex> lock(halt_mutex_);
        halt_reason_ = reason;
    }
    order_manager_->halt();
    spdlog::critical("Engine halted for {}: {}", config_.account.id, reason);
    if (notifier_) {
        notifier_->notify(Severity::CRITICAL, "Engine halted", config_.account.id + ": " + reason);
    }
}

void TradingEngine::start() {
    if (running_.exchange(true)) return;
    should_stop_.store(false);

    auto tick_period = std::chrono::milliseconds(config_.engine.tick_interval_seconds * 1000);
    auto reconcile_period = std::chrono::milliseconds(config_.reconciliation.interval_seconds * 1000);

    tick_thread_ = std::make_unique<std::thread>([this, tick_period]() {
        run_loop("tick", tick_period, [this]() { tick(time_->now()); });
    });
    reconcile_thread_ = std::make_unique<std::thread>([this, reconcile_period]() {
        run_loop("reconcile", reconcile_period, [this]() { reconcile(time_->now()); });
    });
    spdlog::info("Engine started for {}: tick every {}s, reconcile every {}s", config_.account.id,
                 config_.engine.tick_interval_seconds, config_.reconciliation.interval_seconds);
}

void TradingEngine::request_stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        should_stop_.store(true);
    }
    wake_cv_.notify_all();
}

void TradingEngine::stop() {
    request_stop();
    if (tick_thread_ && tick_thread_->joinable()) {
        tick_thread_->join();
    }
    tick_thread_.reset();
    if (reconcile_thread_ && reconcile_thread_->joinable()) {
        reconcile_thread_->join();
    }
    reconcile_thread_.reset();
    if (running_.exchange(false)) {
        spdlog::info("Engine stopped for {}", config_.account.id);
    }
}

void TradingEngine::run_loop(const char* name, std::chrono::milliseconds period,
                             const std::function<void()>& body) {
    while (!should_stop_.load()) {
        try {
            body();
        } catch (const StateCorruptionRisk& e) {
            halt(e.what());
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error in {} loop: {}", name, e.what());
            record_loop_error(name, e.what());
        }
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, period, [this]() { return should_stop_.load(); });
    }
    spdlog::info("{} loop exited", name);
}

void TradingEngine::record_loop_error(const std::string& where, const std::string& what) {
    auto now = std::chrono::steady_clock::now();
    size_t recent = 0;
    {
        std::lock_guard<std::mutex> lock(errors_mutex_);
        loop_errors_.push_back(now);
        while (!loop_errors_.empty() && now - loop_errors_.front() > std::chrono::seconds(60)) {
            loop_errors_.pop_front();
        }
        recent = loop_errors_.size();
    }
    if (notifier_) {
        notifier_->notify(Severity::ERROR, "Loop error in " + where, what);
    }
    if (recent > static_cast<size_t>(config_.engine.max_errors_per_minute)) {
        spdlog::critical("{} loop errors within a minute, stopping engine", recent);
        if (notifier_) {
            notifier_->notify(Severity::CRITICAL, "Error budget exhausted",
                              std::to_string(recent) + " loop errors within a minute, last: " + what);
        }
        request_stop();
    }
}

EngineReport TradingEngine::report() const {
    EngineReport r;
    r.account_id = config_.account.id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        r.trading_date = state_.trading_date;
        r.phase = state_.last_phase;
    }
    r.running = running_.load();
    r.halted = halted_.load();
    if (r.halted) {
        r.phase = Phase::HALTED;
        std::lock_guard<std::mutex> lock(halt_mutex_);
        r.halt_reason = halt_reason_;
    }
    PortfolioView view = portfolio_.view();
    r.cash = view.cash;
    r.available_cash = view.available_cash();
    r.positions = view.positions.size();
    r.open_orders = view.open_orders.size();
    r.equity = portfolio_.equity();
    r.realized_pnl = portfolio_.realized_pnl();
    r.orders_submitted = order_manager_->submitted_count();
    r.signals_rejected = order_manager_->rejected_count();
    return r;
}

} // namespace intraday
