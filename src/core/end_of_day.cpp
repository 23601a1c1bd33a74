#include "end_of_day.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "serialization.hpp"

namespace intraday {

std::string SessionReportWriter::report_path(const std::string& trading_date) const {
    return directory_ + "/session_" + trading_date + ".json";
}

void SessionReportWriter::run(const SessionSummary& summary) {
    std::filesystem::create_directories(directory_);

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& kv : summary.positions) {
        positions.push_back(position_to_json(kv.second));
    }
    nlohmann::json fills = nlohmann::json::array();
    for (const auto& f : summary.fills) {
        fills.push_back(fill_to_json(f));
    }
    const auto& m = summary.performance;

    nlohmann::json j = {
        {"account_id", summary.account_id},
        {"trading_date", summary.trading_date},
        {"session_start", utils::ts_to_iso(summary.session_start)},
        {"generated_at", utils::ts_to_iso(summary.generated_at)},
        {"starting_cash", summary.starting_cash},
        {"cash", summary.cash},
        {"equity", summary.equity},
        {"realized_pnl", summary.realized_pnl},
        {"open_orders", summary.open_orders},
        {"orders_submitted", summary.orders_submitted},
        {"signals_rejected", summary.signals_rejected},
        {"positions", positions},
        {"fills", fills},
        {"performance", {
            {"start_equity", m.start_equity},
            {"end_equity", m.end_equity},
            {"total_return", m.total_return},
            {"max_drawdown", m.max_drawdown},
            {"closed_trades", m.closed_trades},
            {"win_rate", m.win_rate},
            {"avg_win", m.avg_win},
            {"avg_loss", m.avg_loss}
        }}
    };

    std::string path = report_path(summary.trading_date);
    std::string tmp_path = path + ".tmp";
    std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        throw std::runtime_error("cannot write session report " + tmp_path);
    }
    f << j.dump(2);
    f.close();
    std::filesystem::rename(tmp_path, path);
    spdlog::info("Session report written to {}", path);
}

void FillAuditTask::run(const SessionSummary& summary) {
    auto broker_fills = broker_->get_fills(summary.session_start);

    std::set<std::string> local;
    for (const auto& f : summary.fills) local.insert(f.execution_id);
    std::set<std::string> remote;
    for (const auto& f : broker_fills) remote.insert(f.execution_id);

    std::vector<std::string> missing_locally;
    std::vector<std::string> unknown_to_broker;
    for (const auto& id : remote) {
        if (!local.count(id)) missing_locally.push_back(id);
    }
    for (const auto& id : local) {
        if (!remote.count(id)) unknown_to_broker.push_back(id);
    }
    last_mismatches_ = missing_locally.size() + unknown_to_broker.size();

    if (last_mismatches_ == 0) {
        spdlog::info("Fill audit clean: {} executions match the broker", local.size());
        return;
    }
    std::string body = std::to_string(missing_locally.size()) + " broker executions not in ledger, " +
                       std::to_string(unknown_to_broker.size()) + " ledger fills unknown to broker";
    for (const auto& id : missing_locally) body += "\n  missing: " + id;
    for (const auto& id : unknown_to_broker) body += "\n  unknown: " + id;
    spdlog::warn("Fill audit mismatch: {}", body);
    if (notifier_) {
        notifier_->notify(Severity::WARNING, "Fill audit mismatch", body);
    }
}

} // namespace intraday
