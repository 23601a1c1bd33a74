#pragma once

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace intraday {

using json = nlohmann::json;

struct AccountConfig {
    std::string id{"paper-account"};
    std::string lock_file{"run/intraday_trader.lock"};
};

struct CalendarConfig {
    int utc_offset_minutes{540};   // exchange local time, default KST
    // "YYYY-MM-DD" for a single date, "MM-DD" for a yearly holiday
    std::vector<std::string> holidays{
        "01-01",
        "03-01",
        "05-05",
        "06-06",
        "08-15",
        "10-03",
        "10-09",
        "12-25",
        "12-31"
    };
};

/**
 * Session bounds in seconds after local midnight.
 */
struct SessionConfig {
    int session_start{8 * 3600 + 50 * 60};
    int market_open{9 * 3600};
    int opening_end{9 * 3600 + 30 * 60};
    int closing_prep_start{14 * 3600 + 50 * 60};
    int closing_execution_start{15 * 3600 + 20 * 60};
    int market_close{15 * 3600 + 30 * 60};
    int shutdown_time{15 * 3600 + 40 * 60};
    bool auto_shutdown{false};
};

struct EngineConfig {
    int tick_interval_seconds{30};
    int strategy_timeout_ms{5000};
    bool liquidate_carryover_at_open{true};
    int max_errors_per_minute{5};
    std::string checkpoint_directory{"state"};
};

struct SizingConfig {
    std::string policy{"none"};    // "none" or "kelly"
    double win_rate{0.55};
    double avg_win{0.03};
    double avg_loss{0.02};
    double kelly_multiplier{0.5};  // half-Kelly
    int history_lookback_days{90};
    int min_history_trades{5};     // below this the configured win/loss figures are used
};

struct OrderConfig {
    double slippage_buffer{0.05};
    int signal_cooldown_seconds{60};
    int max_open_positions{0};     // 0 = unlimited
    int quote_cache_ttl_ms{2000};
    SizingConfig sizing;
};

struct BlackoutWindow {
    int start{0};
    int end{0};
};

struct ReconciliationConfig {
    int interval_seconds{5};
    int pending_timeout_seconds{300};
    bool cancel_on_timeout{false};
    std::vector<BlackoutWindow> blackouts;
};

struct RetryPolicy {
    int max_attempts{3};
    int base_delay_ms{500};
    double multiplier{2.0};
    int max_delay_ms{5000};
    double jitter_ratio{0.1};
};

struct RetryConfig {
    RetryPolicy quote{5, 200, 2.0, 2000, 0.1};
    RetryPolicy account{3, 1000, 2.0, 8000, 0.1};
    RetryPolicy submit{3, 500, 2.0, 4000, 0.0};
    RetryPolicy status{3, 500, 2.0, 4000, 0.1};
    RetryPolicy cancel{3, 500, 2.0, 4000, 0.1};
    int escalation_threshold{5};
};

// Broker calls allowed per window for each call class, 0 = unlimited.
struct RateLimitConfig {
    int window_ms{1000};
    int quote{0};
    int account{0};
    int submit{0};
    int status{0};
    int cancel{0};
};

struct StrategyConfig {
    std::string id;
    std::string type;
    bool enabled{true};
    int window_start{0};
    int window_end{0};
    int liquidate_before_end_seconds{60};
    bool hold_overnight{false};
    json params = json::object();
};

struct BrokerConfig {
    std::string mode{"paper"};
    double initial_cash{10000000.0};
    int64_t max_fill_per_poll{0};  // paper broker partial fills, 0 = fill whole order
    std::unordered_map<std::string, double> quotes;
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{"logs/intraday_trader.log"};
    std::string journal_directory{"logs"};
};

struct ReportConfig {
    std::string directory{"reports"};
};

struct Config {
    AccountConfig account;
    CalendarConfig calendar;
    SessionConfig session;
    EngineConfig engine;
    OrderConfig orders;
    ReconciliationConfig reconciliation;
    RetryConfig retry;
    RateLimitConfig rate_limit;
    std::vector<StrategyConfig> strategies;
    BrokerConfig broker;
    LoggingConfig logging;
    ReportConfig reports;
};

namespace detail {

inline void read_clock_time(const json& j, const char* key, int& field) {
    if (!j.contains(key)) return;
    auto parsed = utils::parse_clock_time(j.at(key).get<std::string>());
    if (!parsed) {
        throw ConfigurationError(std::string("invalid time for '") + key + "': " +
                                 j.at(key).dump());
    }
    field = *parsed;
}

inline void read_retry_policy(const json& j, const char* key, RetryPolicy& policy) {
    if (!j.contains(key)) return;
    auto& p = j.at(key);
    policy.max_attempts = p.value("max_attempts", policy.max_attempts);
    policy.base_delay_ms = p.value("base_delay_ms", policy.base_delay_ms);
    policy.multiplier = p.value("multiplier", policy.multiplier);
    policy.max_delay_ms = p.value("max_delay_ms", policy.max_delay_ms);
    policy.jitter_ratio = p.value("jitter_ratio", policy.jitter_ratio);
}

inline void validate_retry_policy(const char* name, const RetryPolicy& p) {
    if (p.max_attempts < 1 || p.base_delay_ms < 0 || p.max_delay_ms < 0 ||
        p.multiplier < 1.0 || p.jitter_ratio < 0.0 || p.jitter_ratio > 1.0) {
        throw ConfigurationError(std::string("invalid retry policy '") + name + "'");
    }
}

} // namespace detail

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j;
    try {
        j = json::parse(f, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("cannot parse " + path + ": " + e.what());
    }

    try {
        if (j.contains("account")) {
            auto& a = j["account"];
            cfg.account.id = a.value("id", cfg.account.id);
            cfg.account.lock_file = a.value("lock_file", cfg.account.lock_file);
        }
        if (j.contains("calendar")) {
            auto& c = j["calendar"];
            cfg.calendar.utc_offset_minutes = c.value("utc_offset_minutes", cfg.calendar.utc_offset_minutes);
            if (c.contains("holidays")) {
                cfg.calendar.holidays = c["holidays"].get<std::vector<std::string>>();
            }
        }
        if (j.contains("session")) {
            auto& s = j["session"];
            detail::read_clock_time(s, "session_start", cfg.session.session_start);
            detail::read_clock_time(s, "market_open", cfg.session.market_open);
            detail::read_clock_time(s, "opening_end", cfg.session.opening_end);
            detail::read_clock_time(s, "closing_prep_start", cfg.session.closing_prep_start);
            detail::read_clock_time(s, "closing_execution_start", cfg.session.closing_execution_start);
            detail::read_clock_time(s, "market_close", cfg.session.market_close);
            detail::read_clock_time(s, "shutdown_time", cfg.session.shutdown_time);
            cfg.session.auto_shutdown = s.value("auto_shutdown", cfg.session.auto_shutdown);
        }
        if (j.contains("engine")) {
            auto& e = j["engine"];
            cfg.engine.tick_interval_seconds = e.value("tick_interval_seconds", cfg.engine.tick_interval_seconds);
            cfg.engine.strategy_timeout_ms = e.value("strategy_timeout_ms", cfg.engine.strategy_timeout_ms);
            cfg.engine.liquidate_carryover_at_open = e.value("liquidate_carryover_at_open", cfg.engine.liquidate_carryover_at_open);
            cfg.engine.max_errors_per_minute = e.value("max_errors_per_minute", cfg.engine.max_errors_per_minute);
            cfg.engine.checkpoint_directory = e.value("checkpoint_directory", cfg.engine.checkpoint_directory);
        }
        if (j.contains("orders")) {
            auto& o = j["orders"];
            cfg.orders.slippage_buffer = o.value("slippage_buffer", cfg.orders.slippage_buffer);
            cfg.orders.signal_cooldown_seconds = o.value("signal_cooldown_seconds", cfg.orders.signal_cooldown_seconds);
            cfg.orders.max_open_positions = o.value("max_open_positions", cfg.orders.max_open_positions);
            cfg.orders.quote_cache_ttl_ms = o.value("quote_cache_ttl_ms", cfg.orders.quote_cache_ttl_ms);
            if (o.contains("sizing")) {
                auto& z = o["sizing"];
                cfg.orders.sizing.policy = z.value("policy", cfg.orders.sizing.policy);
                cfg.orders.sizing.win_rate = z.value("win_rate", cfg.orders.sizing.win_rate);
                cfg.orders.sizing.avg_win = z.value("avg_win", cfg.orders.sizing.avg_win);
                cfg.orders.sizing.avg_loss = z.value("avg_loss", cfg.orders.sizing.avg_loss);
                cfg.orders.sizing.kelly_multiplier = z.value("kelly_multiplier", cfg.orders.sizing.kelly_multiplier);
                cfg.orders.sizing.history_lookback_days = z.value("history_lookback_days", cfg.orders.sizing.history_lookback_days);
                cfg.orders.sizing.min_history_trades = z.value("min_history_trades", cfg.orders.sizing.min_history_trades);
            }
        }
        if (j.contains("reconciliation")) {
            auto& r = j["reconciliation"];
            cfg.reconciliation.interval_seconds = r.value("interval_seconds", cfg.reconciliation.interval_seconds);
            cfg.reconciliation.pending_timeout_seconds = r.value("pending_timeout_seconds", cfg.reconciliation.pending_timeout_seconds);
            cfg.reconciliation.cancel_on_timeout = r.value("cancel_on_timeout", cfg.reconciliation.cancel_on_timeout);
            if (r.contains("blackouts")) {
                cfg.reconciliation.blackouts.clear();
                for (auto& b : r["blackouts"]) {
                    BlackoutWindow window;
                    detail::read_clock_time(b, "start", window.start);
                    detail::read_clock_time(b, "end", window.end);
                    cfg.reconciliation.blackouts.push_back(window);
                }
            }
        }
        if (j.contains("retry")) {
            auto& r = j["retry"];
            detail::read_retry_policy(r, "quote", cfg.retry.quote);
            detail::read_retry_policy(r, "account", cfg.retry.account);
            detail::read_retry_policy(r, "submit", cfg.retry.submit);
            detail::read_retry_policy(r, "status", cfg.retry.status);
            detail::read_retry_policy(r, "cancel", cfg.retry.cancel);
            cfg.retry.escalation_threshold = r.value("escalation_threshold", cfg.retry.escalation_threshold);
        }
        if (j.contains("rate_limit")) {
            auto& r = j["rate_limit"];
            cfg.rate_limit.window_ms = r.value("window_ms", cfg.rate_limit.window_ms);
            cfg.rate_limit.quote = r.value("quote", cfg.rate_limit.quote);
            cfg.rate_limit.account = r.value("account", cfg.rate_limit.account);
            cfg.rate_limit.submit = r.value("submit", cfg.rate_limit.submit);
            cfg.rate_limit.status = r.value("status", cfg.rate_limit.status);
            cfg.rate_limit.cancel = r.value("cancel", cfg.rate_limit.cancel);
        }
        if (j.contains("strategies")) {
            cfg.strategies.clear();
            for (auto& s : j["strategies"]) {
                StrategyConfig sc;
                sc.id = s.value("id", sc.id);
                sc.type = s.value("type", sc.type);
                sc.enabled = s.value("enabled", sc.enabled);
                if (s.contains("window")) {
                    detail::read_clock_time(s["window"], "start", sc.window_start);
                    detail::read_clock_time(s["window"], "end", sc.window_end);
                }
                sc.liquidate_before_end_seconds = s.value("liquidate_before_end_seconds", sc.liquidate_before_end_seconds);
                sc.hold_overnight = s.value("hold_overnight", sc.hold_overnight);
                if (s.contains("params")) {
                    sc.params = s["params"];
                }
                cfg.strategies.push_back(std::move(sc));
            }
        }
        if (j.contains("broker")) {
            auto& b = j["broker"];
            cfg.broker.mode = b.value("mode", cfg.broker.mode);
            cfg.broker.initial_cash = b.value("initial_cash", cfg.broker.initial_cash);
            cfg.broker.max_fill_per_poll = b.value("max_fill_per_poll", cfg.broker.max_fill_per_poll);
            if (b.contains("quotes")) {
                cfg.broker.quotes = b["quotes"].get<std::unordered_map<std::string, double>>();
            }
        }
        if (j.contains("logging")) {
            auto& l = j["logging"];
            cfg.logging.level = l.value("level", cfg.logging.level);
            cfg.logging.file = l.value("file", cfg.logging.file);
            cfg.logging.journal_directory = l.value("journal_directory", cfg.logging.journal_directory);
        }
        if (j.contains("reports")) {
            cfg.reports.directory = j["reports"].value("directory", cfg.reports.directory);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("invalid value in " + path + ": " + e.what());
    }
}

/**
 * Enabled strategy windows must be well-formed, lie inside market hours
 * and not overlap one another.
 */
inline void check_strategy_windows(const std::vector<StrategyConfig>& strategies,
                                   const SessionConfig& session) {
    std::vector<const StrategyConfig*> enabled;
    std::unordered_set<std::string> ids;
    for (const auto& s : strategies) {
        if (s.id.empty()) {
            throw ConfigurationError("strategy without id");
        }
        if (!ids.insert(s.id).second) {
            throw ConfigurationError("duplicate strategy id '" + s.id + "'");
        }
        if (s.id == kLiquidationStrategyId || s.id == kCarryoverOwner) {
            throw ConfigurationError("strategy id '" + s.id + "' is reserved");
        }
        if (!s.enabled) continue;
        if (s.window_start >= s.window_end) {
            throw ConfigurationError("strategy '" + s.id + "' window start must precede end");
        }
        if (s.window_start < session.market_open || s.window_end > session.market_close) {
            throw ConfigurationError("strategy '" + s.id + "' window lies outside market hours");
        }
        if (s.liquidate_before_end_seconds < 0 ||
            s.liquidate_before_end_seconds >= s.window_end - s.window_start) {
            throw ConfigurationError("strategy '" + s.id + "' liquidation lead must fit inside its window");
        }
        enabled.push_back(&s);
    }
    std::sort(enabled.begin(), enabled.end(),
              [](const StrategyConfig* a, const StrategyConfig* b) {
                  return a->window_start < b->window_start;
              });
    for (size_t i = 1; i < enabled.size(); ++i) {
        if (enabled[i]->window_start < enabled[i - 1]->window_end) {
            throw ConfigurationError("strategy windows overlap: '" + enabled[i - 1]->id +
                                     "' and '" + enabled[i]->id + "'");
        }
    }
}

/**
 * Startup validation. Throws ConfigurationError on the first problem found.
 */
inline void validate_config(const Config& cfg, const std::vector<std::string>& known_strategy_types) {
    if (cfg.account.id.empty()) {
        throw ConfigurationError("account.id is required");
    }
    const auto& s = cfg.session;
    if (!(s.session_start <= s.market_open && s.market_open < s.opening_end &&
          s.opening_end <= s.closing_prep_start && s.closing_prep_start < s.closing_execution_start &&
          s.closing_execution_start < s.market_close && s.market_close <= s.shutdown_time)) {
        throw ConfigurationError("session boundaries must be in ascending order");
    }
    if (cfg.calendar.utc_offset_minutes < -14 * 60 || cfg.calendar.utc_offset_minutes > 14 * 60) {
        throw ConfigurationError("calendar.utc_offset_minutes out of range");
    }
    if (cfg.engine.tick_interval_seconds <= 0 || cfg.reconciliation.interval_seconds <= 0) {
        throw ConfigurationError("loop intervals must be positive");
    }
    if (cfg.engine.strategy_timeout_ms <= 0) {
        throw ConfigurationError("engine.strategy_timeout_ms must be positive");
    }
    if (cfg.orders.slippage_buffer < 0.0) {
        throw ConfigurationError("orders.slippage_buffer must not be negative");
    }
    if (cfg.orders.max_open_positions < 0 || cfg.orders.signal_cooldown_seconds < 0) {
        throw ConfigurationError("orders limits must not be negative");
    }
    if (cfg.orders.sizing.policy != "none" && cfg.orders.sizing.policy != "kelly") {
        throw ConfigurationError("unknown sizing policy '" + cfg.orders.sizing.policy + "'");
    }
    if (cfg.orders.sizing.history_lookback_days < 0 || cfg.orders.sizing.min_history_trades < 1) {
        throw ConfigurationError("sizing history needs lookback >= 0 days and at least 1 trade");
    }
    for (const auto& b : cfg.reconciliation.blackouts) {
        if (b.start >= b.end) {
            throw ConfigurationError("reconciliation blackout start must precede end");
        }
    }
    detail::validate_retry_policy("quote", cfg.retry.quote);
    detail::validate_retry_policy("account", cfg.retry.account);
    detail::validate_retry_policy("submit", cfg.retry.submit);
    detail::validate_retry_policy("status", cfg.retry.status);
    detail::validate_retry_policy("cancel", cfg.retry.cancel);
    if (cfg.retry.escalation_threshold < 1) {
        throw ConfigurationError("retry.escalation_threshold must be at least 1");
    }
    const auto& rl = cfg.rate_limit;
    if (rl.window_ms <= 0 || rl.quote < 0 || rl.account < 0 || rl.submit < 0 || rl.status < 0 || rl.cancel < 0) {
        throw ConfigurationError("rate_limit needs a positive window_ms and non-negative limits");
    }
    if (cfg.broker.mode != "paper") {
        throw ConfigurationError("unsupported broker mode '" + cfg.broker.mode + "'");
    }
    for (const auto& st : cfg.strategies) {
        if (std::find(known_strategy_types.begin(), known_strategy_types.end(), st.type) ==
            known_strategy_types.end()) {
            throw ConfigurationError("unknown strategy type '" + st.type + "' for '" + st.id + "'");
        }
    }
    check_strategy_windows(cfg.strategies, cfg.session);
}

} // namespace intraday
