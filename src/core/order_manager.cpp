#include "order_manager.hpp"

#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "errors.hpp"

namespace intraday {

const char* to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::INVALID_SIGNAL: return "InvalidSignal";
        case RejectReason::HALTED: return "Halted";
        case RejectReason::OUTSIDE_TRADING_WINDOW: return "OutsideTradingWindow";
        case RejectReason::NO_POSITION: return "NoPosition";
        case RejectReason::POSITION_LIMIT: return "PositionLimit";
        case RejectReason::PRICE_UNAVAILABLE: return "PriceUnavailable";
        case RejectReason::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case RejectReason::DUPLICATE_ORDER: return "DuplicateOrder";
        case RejectReason::SIZE_ZERO: return "SizeZero";
        case RejectReason::SUBMISSION_FAILED: return "SubmissionFailed";
    }
    return "Unknown";
}

OrderManager::OrderManager(const OrderConfig& config,
                           const MarketClock& clock,
                           const StrategySchedule& schedule,
                           Portfolio& portfolio,
                           std::shared_ptr<BrokerClient> broker,
                           std::shared_ptr<Notifier> notifier,
                           std::unique_ptr<SizingPolicy> sizing,
                           std::shared_ptr<TradeJournal> journal)
    : config_(config),
      clock_(clock),
      schedule_(schedule),
      portfolio_(portfolio),
      broker_(std::move(broker)),
      notifier_(std::move(notifier)),
      sizing_(std::move(sizing)),
      journal_(std::move(journal)) {
    if (!sizing_) {
        sizing_ = std::make_unique<PassThroughSizing>();
    }
}

SubmitResult OrderManager::reject(const Signal& signal, RejectReason reason, const std::string& detail) {
    ++rejected_;
    spdlog::warn("Signal rejected [{}] {} {} {} x{}: {}", to_string(reason), signal.strategy_id,
                 to_string(signal.side), signal.symbol, signal.quantity, detail);
    if (journal_) {
        journal_->record_rejection(signal, to_string(reason), detail);
    }
    if (notifier_) {
        Severity severity = reason == RejectReason::SUBMISSION_FAILED ? Severity::ERROR : Severity::WARNING;
        notifier_->notify(severity, std::string("Order rejected: ") + to_string(reason),
                          signal.strategy_id + " " + to_string(signal.side) + " " + signal.symbol +
                          " x" + std::to_string(signal.quantity) + ": " + detail);
    }
    SubmitResult result;
    result.reason = reason;
    result.detail = detail;
    return result;
}

std::optional<std::string> OrderManager::check_time_gate(const Signal& signal, Timestamp now) const {
    auto reading = clock_.read(now);
    if (reading.status != DayStatus::IN_SESSION || !is_market_phase(reading.phase)) {
        return "market is not open at " + utils::format_clock_time(reading.seconds_of_day);
    }
    if (signal.strategy_id == kLiquidationStrategyId) {
        return std::nullopt;
    }
    if (schedule_.find(signal.strategy_id) == nullptr) {
        return "unknown strategy '" + signal.strategy_id + "'";
    }
    if (!schedule_.accepts_entries(signal.strategy_id, reading.seconds_of_day)) {
        return "outside window of '" + signal.strategy_id + "' at " +
               utils::format_clock_time(reading.seconds_of_day);
    }
    return std::nullopt;
}

bool OrderManager::in_cooldown(const Signal& signal, Timestamp now) const {
    std::lock_guard<std::mutex> lock(cooldown_mutex_);
    auto it = last_submitted_.find(std::make_tuple(signal.strategy_id, signal.symbol, signal.side));
    if (it == last_submitted_.end()) return false;
    return now - it->second < std::chrono::seconds(config_.signal_cooldown_seconds);
}

SubmitResult OrderManager::submit(const Signal& signal, Timestamp now) {
    if (signal.strategy_id.empty() || signal.symbol.empty() || signal.quantity <= 0) {
        return reject(signal, RejectReason::INVALID_SIGNAL, "missing strategy, symbol or positive quantity");
    }
    if (signal.type == OrderType::LIMIT && (!signal.limit_price || *signal.limit_price <= 0.0)) {
        return reject(signal, RejectReason::INVALID_SIGNAL, "limit order without positive limit price");
    }
    if (halted_.load()) {
        return reject(signal, RejectReason::HALTED, "engine halted");
    }
    if (auto why = check_time_gate(signal, now)) {
        return reject(signal, RejectReason::OUTSIDE_TRADING_WINDOW, *why);
    }

    PortfolioView view = portfolio_.view();
    int64_t quantity = signal.quantity;
    int64_t sellable = 0;
    double estimated_price = 0.0;

    if (signal.side == OrderSide::SELL) {
        sellable = view.sellable(signal.symbol);
        if (sellable <= 0) {
            return reject(signal, RejectReason::NO_POSITION,
                          "nothing sellable in " + signal.symbol + " (held " +
                          std::to_string(view.held(signal.symbol)) + ")");
        }
        if (signal.type == OrderType::LIMIT) {
            estimated_price = *signal.limit_price;
        }
    } else {
        if (config_.max_open_positions > 0) {
            std::set<std::string> occupied;
            for (const auto& kv : view.positions) occupied.insert(kv.first);
            for (const auto& o : view.open_orders) {
                if (o.signal.side == OrderSide::BUY) occupied.insert(o.signal.symbol);
            }
            if (!occupied.count(signal.symbol) &&
                occupied.size() >= static_cast<size_t>(config_.max_open_positions)) {
                return reject(signal, RejectReason::POSITION_LIMIT,
                              std::to_string(occupied.size()) + " positions held or pending");
            }
        }

        if (signal.type == OrderType::LIMIT) {
            estimated_price = *signal.limit_price;
        } else {
            try {
                estimated_price = broker_->get_quote(signal.symbol).price;
            } catch (const std::exception& e) {
                return reject(signal, RejectReason::PRICE_UNAVAILABLE, e.what());
            }
            if (estimated_price <= 0.0) {
                return reject(signal, RejectReason::PRICE_UNAVAILABLE, "broker quoted a non-positive price");
            }
        }
        estimated_price *= 1.0 + config_.slippage_buffer;

        double required = static_cast<double>(quantity) * estimated_price;
        if (required > view.available_cash()) {
            return reject(signal, RejectReason::INSUFFICIENT_FUNDS,
                          fmt::format("requires {:.2f}, available {:.2f}", required, view.available_cash()));
        }
    }

    if (view.has_open_order(signal.strategy_id, signal.symbol)) {
        return reject(signal, RejectReason::DUPLICATE_ORDER, "open order already exists");
    }
    if (in_cooldown(signal, now)) {
        return reject(signal, RejectReason::DUPLICATE_ORDER,
                      "same signal submitted within " + std::to_string(config_.signal_cooldown_seconds) + "s");
    }

    if (signal.side == OrderSide::SELL) {
        quantity = std::min(quantity, sellable);
    } else {
        quantity = std::min(quantity, sizing_->cap(signal, estimated_price, view));
    }
    if (quantity <= 0) {
        return reject(signal, RejectReason::SIZE_ZERO, "sizing policy '" + sizing_->name() + "' allowed 0");
    }

    if (!portfolio_.reserve(signal.strategy_id, signal.symbol)) {
        return reject(signal, RejectReason::DUPLICATE_ORDER, "order already in flight");
    }

    OrderRequest request;
    request.client_order_id = utils::generate_id();
    request.symbol = signal.symbol;
    request.side = signal.side;
    request.quantity = quantity;
    request.type = signal.type;
    request.limit_price = signal.limit_price;

    std::string order_id;
    try {
        order_id = broker_->place_order(request);
    } catch (const PermanentRejection& e) {
        portfolio_.release(signal.strategy_id, signal.symbol);
        return reject(signal, RejectReason::SUBMISSION_FAILED, std::string("broker rejected: ") + e.what());
    } catch (const TransientApiFailure& e) {
        portfolio_.release(signal.strategy_id, signal.symbol);
        return reject(signal, RejectReason::SUBMISSION_FAILED, e.what());
    } catch (const std::exception& e) {
        portfolio_.release(signal.strategy_id, signal.symbol);
        return reject(signal, RejectReason::SUBMISSION_FAILED, std::string("unexpected broker error: ") + e.what());
    }

    Order order;
    order.order_id = order_id;
    order.client_order_id = request.client_order_id;
    order.signal = signal;
    order.signal.quantity = quantity;
    order.submitted_at = now;
    order.estimated_price = estimated_price;
    portfolio_.register_order(order);

    {
        std::lock_guard<std::mutex> lock(cooldown_mutex_);
        last_submitted_[std::make_tuple(signal.strategy_id, signal.symbol, signal.side)] = now;
    }
    ++submitted_;

    spdlog::info("Order {} submitted: {} {} {} x{} ({})", order_id, signal.strategy_id,
                 to_string(signal.side), signal.symbol, quantity, signal.reason);
    if (journal_) {
        journal_->record_order(order);
    }
    if (notifier_) {
        notifier_->notify(Severity::INFO, "Order submitted",
                          signal.strategy_id + " " + to_string(signal.side) + " " + signal.symbol +
                          " x" + std::to_string(quantity) + " (" + signal.reason + ")");
    }

    SubmitResult result;
    result.order = order;
    return result;
}

} // namespace intraday
