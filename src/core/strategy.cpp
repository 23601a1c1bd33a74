#include "strategy.hpp"

#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace intraday {

StrategyRegistry StrategyRegistry::with_builtins() {
    StrategyRegistry registry;
    registry.register_factory("price_trigger", [](const StrategyConfig& config) {
        return std::make_unique<PriceTriggerStrategy>(config);
    });
    return registry;
}

void StrategyRegistry::register_factory(const std::string& key, Factory factory) {
    if (!factory) {
        throw ConfigurationError("empty factory for strategy type '" + key + "'");
    }
    if (!factories_.emplace(key, std::move(factory)).second) {
        throw ConfigurationError("strategy type '" + key + "' registered twice");
    }
}

bool StrategyRegistry::contains(const std::string& key) const {
    return factories_.count(key) > 0;
}

std::vector<std::string> StrategyRegistry::keys() const {
    std::vector<std::string> out;
    for (const auto& kv : factories_) {
        out.push_back(kv.first);
    }
    return out;
}

std::unique_ptr<Strategy> StrategyRegistry::create(const StrategyConfig& config) const {
    auto it = factories_.find(config.type);
    if (it == factories_.end()) {
        throw ConfigurationError("unknown strategy type '" + config.type + "' for '" + config.id + "'");
    }
    auto strategy = it->second(config);
    if (!strategy || strategy->id() != config.id) {
        throw ConfigurationError("factory '" + config.type + "' did not build strategy '" + config.id + "'");
    }
    spdlog::info("Strategy '{}' created (type {})", config.id, config.type);
    return strategy;
}

std::vector<std::unique_ptr<Strategy>> StrategyRegistry::create_enabled(
    const std::vector<StrategyConfig>& configs) const {
    std::vector<std::unique_ptr<Strategy>> out;
    for (const auto& config : configs) {
        if (config.enabled) {
            out.push_back(create(config));
        }
    }
    return out;
}

PriceTriggerStrategy::PriceTriggerStrategy(const StrategyConfig& config) : id_(config.id) {
    const auto& p = config.params;
    try {
        take_profit_pct_ = p.value("take_profit_pct", take_profit_pct_);
        stop_loss_pct_ = p.value("stop_loss_pct", stop_loss_pct_);
        max_entries_per_day_ = p.value("max_entries_per_day", max_entries_per_day_);
        if (p.contains("targets")) {
            for (const auto& t : p["targets"]) {
                Target target;
                target.symbol = t.at("symbol").get<std::string>();
                target.trigger_price = t.at("trigger_price").get<double>();
                target.quantity = t.at("quantity").get<int64_t>();
                targets_.push_back(target);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("strategy '" + id_ + "' params: " + e.what());
    }
    if (targets_.empty()) {
        throw ConfigurationError("strategy '" + id_ + "' has no targets");
    }
    for (const auto& t : targets_) {
        if (t.symbol.empty() || t.trigger_price <= 0.0 || t.quantity <= 0) {
            throw ConfigurationError("strategy '" + id_ + "' has an invalid target");
        }
    }
    if (take_profit_pct_ <= 0.0 || stop_loss_pct_ <= 0.0) {
        throw ConfigurationError("strategy '" + id_ + "' exit thresholds must be positive");
    }
}

std::vector<std::string> PriceTriggerStrategy::universe() const {
    std::vector<std::string> out;
    for (const auto& t : targets_) {
        out.push_back(t.symbol);
    }
    return out;
}

std::vector<Signal> PriceTriggerStrategy::evaluate(const MarketSnapshot& snapshot,
                                                   const PortfolioView& portfolio,
                                                   Timestamp) {
    if (snapshot.trading_date != trading_date_) {
        trading_date_ = snapshot.trading_date;
        entries_.clear();
    }

    std::vector<Signal> signals;
    for (const auto& t : targets_) {
        auto price = snapshot.price(t.symbol);
        if (!price) continue;
        if (portfolio.has_open_order(id_, t.symbol)) continue;

        auto pos = portfolio.position(t.symbol);
        if (pos && pos->owning_strategy_id == id_) {
            const char* why = nullptr;
            if (*price >= pos->average_cost * (1.0 + take_profit_pct_)) {
                why = "take profit";
            } else if (*price <= pos->average_cost * (1.0 - stop_loss_pct_)) {
                why = "stop loss";
            }
            if (why) {
                Signal s;
                s.strategy_id = id_;
                s.symbol = t.symbol;
                s.side = OrderSide::SELL;
                s.quantity = pos->quantity;
                s.reason = why;
                signals.push_back(s);
            }
            continue;
        }
        if (pos) continue;

        if (*price >= t.trigger_price && entries_[t.symbol] < max_entries_per_day_) {
            ++entries_[t.symbol];
            Signal s;
            s.strategy_id = id_;
            s.symbol = t.symbol;
            s.side = OrderSide::BUY;
            s.quantity = t.quantity;
            s.reason = "breakout above " + std::to_string(t.trigger_price);
            signals.push_back(s);
        }
    }
    return signals;
}

} // namespace intraday
