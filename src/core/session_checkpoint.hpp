#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "market_clock.hpp"
#include "serialization.hpp"

namespace intraday {

/**
 * Per-trading-day engine state. Reset whenever the trading date changes.
 */
struct SessionState {
    std::string trading_date;
    std::optional<Phase> last_phase;
    std::vector<Phase> phases_entered;
    std::set<std::string> carryover_symbols;       // held at session start
    std::set<std::string> liquidation_announced;   // owners already announced
    double starting_cash{0.0};
    bool post_market_ran{false};
    bool shutdown_requested{false};

    void reset(const std::string& date) {
        *this = SessionState{};
        trading_date = date;
    }
};

struct SessionCheckpoint {
    std::string account_id;
    SessionState state;
    std::vector<Order> open_orders;
    std::unordered_map<std::string, std::string> position_owners;
    int64_t saved_at_ns{0};
};

inline std::string checkpoint_path(const std::string& dir, const std::string& account_id) {
    return dir + "/session_" + account_id + ".ckpt.json";
}

inline void save_checkpoint(const SessionCheckpoint& ckpt, const std::string& dir) {
    std::filesystem::create_directories(dir);
    nlohmann::json j;
    j["account_id"] = ckpt.account_id;
    j["saved_at_ns"] = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    const auto& s = ckpt.state;
    nlohmann::json phases = nlohmann::json::array();
    for (auto p : s.phases_entered) {
        phases.push_back(to_string(p));
    }
    j["session"] = {
        {"trading_date", s.trading_date},
        {"last_phase", s.last_phase ? to_string(*s.last_phase) : ""},
        {"phases_entered", phases},
        {"carryover_symbols", s.carryover_symbols},
        {"liquidation_announced", s.liquidation_announced},
        {"starting_cash", s.starting_cash},
        {"post_market_ran", s.post_market_ran},
        {"shutdown_requested", s.shutdown_requested}
    };

    nlohmann::json orders = nlohmann::json::array();
    for (const auto& o : ckpt.open_orders) {
        orders.push_back(order_to_json(o));
    }
    j["open_orders"] = orders;
    j["position_owners"] = ckpt.position_owners;

    std::string path = checkpoint_path(dir, ckpt.account_id);
    std::string tmp_path = path + ".tmp";

    std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
    if (f.is_open()) {
        f << j.dump(2);
        f.close();
        try {
            std::filesystem::rename(tmp_path, path);
            spdlog::debug("Saved session checkpoint for {} ({})", ckpt.account_id, s.trading_date);
        } catch (const std::exception& e) {
            spdlog::error("Failed to rename checkpoint for {}: {}", ckpt.account_id, e.what());
        }
    } else {
        spdlog::error("Failed to save checkpoint for {}", ckpt.account_id);
    }
}

inline std::optional<SessionCheckpoint> load_checkpoint(const std::string& account_id, const std::string& dir) {
    std::string path = checkpoint_path(dir, account_id);
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;

    auto j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("Failed to parse checkpoint {}, starting clean", path);
        return std::nullopt;
    }

    SessionCheckpoint ck;
    ck.account_id = j.value("account_id", account_id);
    ck.saved_at_ns = j.value("saved_at_ns", int64_t{0});

    if (j.contains("session")) {
        const auto& s = j["session"];
        ck.state.trading_date = s.value("trading_date", "");
        ck.state.last_phase = parse_phase(s.value("last_phase", ""));
        if (s.contains("phases_entered")) {
            for (const auto& p : s["phases_entered"]) {
                if (auto phase = parse_phase(p.get<std::string>())) {
                    ck.state.phases_entered.push_back(*phase);
                }
            }
        }
        if (s.contains("carryover_symbols")) {
            ck.state.carryover_symbols = s["carryover_symbols"].get<std::set<std::string>>();
        }
        if (s.contains("liquidation_announced")) {
            ck.state.liquidation_announced = s["liquidation_announced"].get<std::set<std::string>>();
        }
        ck.state.starting_cash = s.value("starting_cash", 0.0);
        ck.state.post_market_ran = s.value("post_market_ran", false);
        ck.state.shutdown_requested = s.value("shutdown_requested", false);
    }

    if (j.contains("open_orders")) {
        for (const auto& o : j["open_orders"]) {
            Order order = order_from_json(o);
            if (!order.order_id.empty()) {
                ck.open_orders.push_back(std::move(order));
            }
        }
    }
    if (j.contains("position_owners")) {
        ck.position_owners = j["position_owners"].get<std::unordered_map<std::string, std::string>>();
    }

    spdlog::info("Loaded session checkpoint for {} ({}, {} open orders)",
                 account_id, ck.state.trading_date, ck.open_orders.size());
    return ck;
}

} // namespace intraday
