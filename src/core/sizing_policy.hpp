#pragma once

#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "portfolio.hpp"

namespace intraday {

/**
 * Caps the quantity of a buy signal. Implementations may only lower the
 * requested quantity.
 */
class SizingPolicy {
public:
    virtual ~SizingPolicy() = default;
    virtual std::string name() const = 0;
    virtual int64_t cap(const Signal& signal, double estimated_price, const PortfolioView& view) const = 0;
};

class PassThroughSizing : public SizingPolicy {
public:
    std::string name() const override { return "none"; }
    int64_t cap(const Signal& signal, double, const PortfolioView&) const override {
        return signal.quantity;
    }
};

/**
 * Fractional Kelly sizing: invest kelly_fraction() of available cash.
 */
class KellySizing : public SizingPolicy {
public:
    KellySizing(double win_rate, double avg_win, double avg_loss, double multiplier = 0.5);

    /**
     * (p*b - q) / b scaled by the multiplier and clamped to [0, 1], with
     * b = avg_win / avg_loss.
     */
    static double kelly_fraction(double win_rate, double avg_win, double avg_loss, double multiplier);

    double fraction() const { return fraction_; }

    std::string name() const override { return "kelly"; }
    int64_t cap(const Signal& signal, double estimated_price, const PortfolioView& view) const override;

private:
    double fraction_;
};

struct KellyInputs {
    double win_rate{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    size_t trades{0};
    bool from_history{false};
};

/**
 * Win rate and average win/loss from realized exit returns. Falls back to
 * the configured figures below min_history_trades exits, or when the
 * history holds only wins or only losses.
 */
KellyInputs kelly_inputs(const SizingConfig& config, const std::vector<double>& exit_returns);

std::unique_ptr<SizingPolicy> make_sizing_policy(const SizingConfig& config,
                                                 const std::vector<double>& exit_returns = {});

} // namespace intraday
