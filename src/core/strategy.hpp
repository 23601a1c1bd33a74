#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "portfolio.hpp"

namespace intraday {

/**
 * Quotes gathered for one tick.
 */
struct MarketSnapshot {
    Timestamp as_of{};
    std::string trading_date;
    std::unordered_map<std::string, Quote> quotes;

    std::optional<double> price(const std::string& symbol) const {
        auto it = quotes.find(symbol);
        if (it == quotes.end()) return std::nullopt;
        return it->second.price;
    }
};

/**
 * Signal producer. evaluate() gets a read-only view and must return
 * promptly; signals must carry the strategy's own id.
 */
class Strategy {
public:
    virtual ~Strategy() = default;
    virtual const std::string& id() const = 0;
    virtual std::vector<std::string> universe() const = 0;
    virtual std::vector<Signal> evaluate(const MarketSnapshot& snapshot,
                                         const PortfolioView& portfolio,
                                         Timestamp now) = 0;
};

/**
 * String-keyed strategy factories, resolved once at startup.
 */
class StrategyRegistry {
public:
    using Factory = std::function<std::unique_ptr<Strategy>(const StrategyConfig&)>;

    static StrategyRegistry with_builtins();

    void register_factory(const std::string& key, Factory factory);
    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;

    /**
     * Throws ConfigurationError for an unknown key.
     */
    std::unique_ptr<Strategy> create(const StrategyConfig& config) const;

    std::vector<std::unique_ptr<Strategy>> create_enabled(const std::vector<StrategyConfig>& configs) const;

private:
    std::map<std::string, Factory> factories_;
};

/**
 * Breakout entry with take-profit / stop-loss exits.
 *
 * params:
 *   targets: [{symbol, trigger_price, quantity}]
 *   take_profit_pct, stop_loss_pct: exit thresholds relative to average cost
 *   max_entries_per_day: entries per symbol per trading date (default 1)
 */
class PriceTriggerStrategy : public Strategy {
public:
    explicit PriceTriggerStrategy(const StrategyConfig& config);

    const std::string& id() const override { return id_; }
    std::vector<std::string> universe() const override;
    std::vector<Signal> evaluate(const MarketSnapshot& snapshot,
                                 const PortfolioView& portfolio,
                                 Timestamp now) override;

private:
    struct Target {
        std::string symbol;
        double trigger_price{0.0};
        int64_t quantity{0};
    };

    std::string id_;
    std::vector<Target> targets_;
    double take_profit_pct_{0.02};
    double stop_loss_pct_{0.01};
    int max_entries_per_day_{1};
    std::string trading_date_;
    std::unordered_map<std::string, int> entries_;
};

} // namespace intraday
