#pragma once

#include <mutex>
#include <vector>
#include "utils.hpp"

namespace intraday {

struct EquityPoint {
    Timestamp timestamp;
    double equity;
};

struct PerformanceMetrics {
    double start_equity{0.0};
    double end_equity{0.0};
    double total_return{0.0};
    double max_drawdown{0.0};
    size_t closed_trades{0};
    double win_rate{0.0};
    double avg_win{0.0};    // mean return of winning exits
    double avg_loss{0.0};   // mean return of losing exits, negative
};

/**
 * Intraday equity curve plus per-exit returns.
 */
class PerformanceTracker {
public:
    void record(Timestamp ts, double equity);
    void record_trade(double realized_return);
    void reset();
    std::vector<EquityPoint> points(size_t limit = 0) const;
    PerformanceMetrics metrics() const;

private:
    mutable std::mutex mutex_;
    std::vector<EquityPoint> series_;
    std::vector<double> trade_returns_;
};

} // namespace intraday
