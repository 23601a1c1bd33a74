#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "core/config.hpp"
#include "core/end_of_day.hpp"
#include "core/errors.hpp"
#include "core/instance_guard.hpp"
#include "core/notifier.hpp"
#include "core/paper_broker.hpp"
#include "core/retrying_broker.hpp"
#include "core/sizing_policy.hpp"
#include "core/strategy.hpp"
#include "core/time_source.hpp"
#include "core/trade_journal.hpp"
#include "core/trading_engine.hpp"

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void setup_logging(const intraday::LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        auto parent = std::filesystem::path(cfg.file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
    }
    auto logger = std::make_shared<spdlog::logger>("intraday", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(cfg.level));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    try {
        intraday::Config cfg;
        intraday::load_config(cfg, config_path);
        setup_logging(cfg.logging);

        auto registry = intraday::StrategyRegistry::with_builtins();
        intraday::validate_config(cfg, registry.keys());
        spdlog::info("Intraday trader starting. account={} strategies={} mode={}",
                     cfg.account.id, cfg.strategies.size(), cfg.broker.mode);

        intraday::InstanceGuard guard(cfg.account.lock_file);

        auto notifier = std::make_shared<intraday::FanoutNotifier>();
        notifier->add(std::make_shared<intraday::LogNotifier>());

        auto time_source = std::make_shared<intraday::SystemTimeSource>();
        auto paper = std::make_shared<intraday::PaperBroker>(cfg.broker.initial_cash, time_source,
                                                             cfg.broker.max_fill_per_poll);
        for (const auto& kv : cfg.broker.quotes) {
            paper->set_quote(kv.first, kv.second);
        }
        auto broker = std::make_shared<intraday::RetryingBroker>(
            paper, cfg.retry, notifier, std::chrono::milliseconds(cfg.orders.quote_cache_ttl_ms),
            intraday::RetryingBroker::Sleeper{}, intraday::make_rate_limiter(cfg.rate_limit));

        intraday::MarketClock clock(cfg.calendar, cfg.session);
        auto now = time_source->now();
        std::string today = clock.local_date(now).to_string();
        std::string history_since =
            clock.local_date(now - std::chrono::hours(24 * cfg.orders.sizing.history_lookback_days)).to_string();
        auto exit_returns = intraday::TradeJournal::exit_returns(cfg.logging.journal_directory, history_since);
        auto journal = intraday::TradeJournal::daily(cfg.logging.journal_directory, today);

        intraday::TradingEngine engine(cfg, time_source, broker, notifier,
                                       registry.create_enabled(cfg.strategies),
                                       intraday::make_sizing_policy(cfg.orders.sizing, exit_returns), journal);
        engine.add_end_of_day_task(std::make_unique<intraday::SessionReportWriter>(cfg.reports.directory));
        engine.add_end_of_day_task(std::make_unique<intraday::FillAuditTask>(broker, notifier));

        engine.bootstrap();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        engine.start();

        while (g_running && !engine.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        spdlog::info("Shutdown requested, finishing current passes");
        engine.stop();

        auto report = engine.report();
        spdlog::info("Final state: cash={:.2f} equity={:.2f} positions={} open orders={} halted={}",
                     report.cash, report.equity, report.positions, report.open_orders, report.halted);
        spdlog::shutdown();
        return report.halted ? 1 : 0;
    } catch (const intraday::ConfigurationError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 2;
    } catch (const intraday::InstanceConflict& e) {
        spdlog::critical("Startup refused: {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
}
