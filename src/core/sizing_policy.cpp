#include "sizing_policy.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace intraday {

KellySizing::KellySizing(double win_rate, double avg_win, double avg_loss, double multiplier)
    : fraction_(kelly_fraction(win_rate, avg_win, avg_loss, multiplier)) {
    spdlog::info("Kelly sizing: win_rate={:.2f} payoff={:.2f} fraction={:.4f}",
                 win_rate, avg_loss != 0.0 ? std::abs(avg_win / avg_loss) : 0.0, fraction_);
}

double KellySizing::kelly_fraction(double win_rate, double avg_win, double avg_loss, double multiplier) {
    avg_loss = std::abs(avg_loss);
    if (avg_loss <= 0.0 || avg_win <= 0.0 || win_rate <= 0.0) {
        return 0.0;
    }
    double b = avg_win / avg_loss;
    double q = 1.0 - win_rate;
    double f = (win_rate * b - q) / b * multiplier;
    return std::max(0.0, std::min(1.0, f));
}

int64_t KellySizing::cap(const Signal& signal, double estimated_price, const PortfolioView& view) const {
    if (signal.side == OrderSide::SELL) {
        return signal.quantity;
    }
    if (estimated_price <= 0.0) {
        return 0;
    }
    double budget = std::max(0.0, view.available_cash()) * fraction_;
    auto affordable = static_cast<int64_t>(std::floor(budget / estimated_price));
    return std::min(signal.quantity, affordable);
}

KellyInputs kelly_inputs(const SizingConfig& config, const std::vector<double>& exit_returns) {
    KellyInputs in;
    in.win_rate = config.win_rate;
    in.avg_win = config.avg_win;
    in.avg_loss = config.avg_loss;
    in.trades = exit_returns.size();

    if (exit_returns.size() < static_cast<size_t>(std::max(1, config.min_history_trades))) {
        return in;
    }
    double win_sum = 0.0, loss_sum = 0.0;
    size_t wins = 0, losses = 0;
    for (double r : exit_returns) {
        if (r > 0.0) {
            win_sum += r;
            ++wins;
        } else if (r < 0.0) {
            loss_sum += r;
            ++losses;
        }
    }
    if (wins == 0 || losses == 0) {
        return in;
    }
    in.win_rate = static_cast<double>(wins) / static_cast<double>(exit_returns.size());
    in.avg_win = win_sum / static_cast<double>(wins);
    in.avg_loss = std::abs(loss_sum / static_cast<double>(losses));
    in.from_history = true;
    return in;
}

std::unique_ptr<SizingPolicy> make_sizing_policy(const SizingConfig& config,
                                                 const std::vector<double>& exit_returns) {
    if (config.policy == "none") {
        return std::make_unique<PassThroughSizing>();
    }
    if (config.policy == "kelly") {
        KellyInputs in = kelly_inputs(config, exit_returns);
        if (in.from_history) {
            spdlog::info("Kelly inputs from {} recorded exits", in.trades);
        } else {
            spdlog::info("Only {} recorded exits usable, Kelly uses configured win/loss figures", in.trades);
        }
        return std::make_unique<KellySizing>(in.win_rate, in.avg_win, in.avg_loss, config.kelly_multiplier);
    }
    throw ConfigurationError("unknown sizing policy '" + config.policy + "'");
}

} // namespace intraday
