#include "performance.hpp"

namespace intraday {

void PerformanceTracker::record(Timestamp ts, double equity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!series_.empty() && series_.back().timestamp >= ts) {
        series_.back().equity = equity;
        return;
    }
    series_.push_back({ts, equity});
}

void PerformanceTracker::record_trade(double realized_return) {
    std::lock_guard<std::mutex> lock(mutex_);
    trade_returns_.push_back(realized_return);
}

void PerformanceTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    series_.clear();
    trade_returns_.clear();
}

std::vector<EquityPoint> PerformanceTracker::points(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (limit == 0 || series_.size() <= limit) return series_;
    return std::vector<EquityPoint>(series_.end() - limit, series_.end());
}

PerformanceMetrics PerformanceTracker::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PerformanceMetrics out;

    if (!series_.empty()) {
        out.start_equity = series_.front().equity;
        out.end_equity = series_.back().equity;
        if (out.start_equity != 0.0) {
            out.total_return = (out.end_equity - out.start_equity) / out.start_equity;
        }
        double peak = series_.front().equity;
        for (const auto& p : series_) {
            if (p.equity > peak) peak = p.equity;
            double dd = peak > 0.0 ? (peak - p.equity) / peak : 0.0;
            if (dd > out.max_drawdown) out.max_drawdown = dd;
        }
    }

    out.closed_trades = trade_returns_.size();
    size_t wins = 0, losses = 0;
    double win_sum = 0.0, loss_sum = 0.0;
    for (double r : trade_returns_) {
        if (r > 0.0) {
            ++wins;
            win_sum += r;
        } else if (r < 0.0) {
            ++losses;
            loss_sum += r;
        }
    }
    if (out.closed_trades > 0) {
        out.win_rate = static_cast<double>(wins) / static_cast<double>(out.closed_trades);
    }
    if (wins > 0) out.avg_win = win_sum / static_cast<double>(wins);
    if (losses > 0) out.avg_loss = loss_sum / static_cast<double>(losses);
    return out;
}

} // namespace intraday
