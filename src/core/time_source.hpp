#pragma once

#include <atomic>
#include <chrono>
#include "utils.hpp"

namespace intraday {

/**
 * Wall-clock provider for the engine loops.
 */
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual Timestamp now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }
};

/**
 * Manually driven clock. Thread-safe for multi-threaded access.
 */
class ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(Timestamp start = Timestamp{}) : current_time_(start) {}

    ManualTimeSource(const ManualTimeSource&) = delete;
    ManualTimeSource& operator=(const ManualTimeSource&) = delete;

    Timestamp now() const override {
        return current_time_.load(std::memory_order_acquire);
    }

    void set_time(Timestamp ts) {
        current_time_.store(ts, std::memory_order_release);
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        auto step = std::chrono::duration_cast<Timestamp::duration>(delta);
        Timestamp expected = current_time_.load(std::memory_order_acquire);
        while (!current_time_.compare_exchange_weak(expected, expected + step,
                                                    std::memory_order_acq_rel)) {
        }
    }

private:
    std::atomic<Timestamp> current_time_;
};

} // namespace intraday
