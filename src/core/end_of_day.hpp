#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "broker_client.hpp"
#include "notifier.hpp"
#include "performance.hpp"

namespace intraday {

/**
 * Ledger summary handed to the post-market tasks.
 */
struct SessionSummary {
    std::string account_id;
    std::string trading_date;
    Timestamp session_start{};
    Timestamp generated_at{};
    double starting_cash{0.0};
    double cash{0.0};
    double equity{0.0};
    double realized_pnl{0.0};
    std::unordered_map<std::string, Position> positions;
    std::vector<Fill> fills;
    size_t open_orders{0};
    size_t orders_submitted{0};
    size_t signals_rejected{0};
    PerformanceMetrics performance;
};

class EndOfDayTask {
public:
    virtual ~EndOfDayTask() = default;
    virtual std::string name() const = 0;
    virtual void run(const SessionSummary& summary) = 0;
};

/**
 * Writes <directory>/session_<date>.json.
 */
class SessionReportWriter : public EndOfDayTask {
public:
    explicit SessionReportWriter(std::string directory) : directory_(std::move(directory)) {}

    std::string name() const override { return "session_report"; }
    void run(const SessionSummary& summary) override;

    std::string report_path(const std::string& trading_date) const;

private:
    std::string directory_;
};

/**
 * Compares the executions the broker reports since session start with the
 * fills the ledger applied and alerts on any difference.
 */
class FillAuditTask : public EndOfDayTask {
public:
    FillAuditTask(std::shared_ptr<BrokerClient> broker, std::shared_ptr<Notifier> notifier)
        : broker_(std::move(broker)), notifier_(std::move(notifier)) {}

    std::string name() const override { return "fill_audit"; }
    void run(const SessionSummary& summary) override;

    size_t last_mismatches() const { return last_mismatches_; }

private:
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<Notifier> notifier_;
    size_t last_mismatches_{0};
};

} // namespace intraday
