#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "serialization.hpp"

namespace intraday {

/**
 * Append-only JSON-lines audit log of orders, rejections and fills.
 * Rolls over to path.N once max_bytes is reached. A journal opened with
 * daily() moves to a new file each trading date.
 */
class TradeJournal {
public:
    explicit TradeJournal(const std::string& path, size_t max_bytes = 50 * 1024 * 1024)
        : base_path_(path), max_bytes_(max_bytes) {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        open_stream(base_path_);
    }

    static std::string path_for(const std::string& dir, const std::string& trading_date) {
        return dir + "/trades_" + trading_date + ".jsonl";
    }

    static std::shared_ptr<TradeJournal> daily(const std::string& dir, const std::string& trading_date,
                                               size_t max_bytes = 50 * 1024 * 1024) {
        auto journal = std::make_shared<TradeJournal>(path_for(dir, trading_date), max_bytes);
        journal->directory_ = dir;
        return journal;
    }

    /**
     * Realized returns of every sell recorded in the daily journals under
     * dir dated on or after since_date (YYYY-MM-DD), oldest file first.
     */
    static std::vector<double> exit_returns(const std::string& dir, const std::string& since_date) {
        std::vector<double> out;
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) return out;

        std::vector<std::string> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            auto name = entry.path().filename().string();
            if (name.rfind("trades_", 0) != 0 || name.size() < 17) continue;
            if (name.substr(7, 10) < since_date) continue;
            files.push_back(entry.path().string());
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::ifstream in(file);
            std::string line;
            while (std::getline(in, line)) {
                if (line.empty()) continue;
                auto j = nlohmann::json::parse(line, nullptr, false);
                if (j.is_discarded()) {
                    spdlog::warn("Skipping malformed journal line in {}", file);
                    continue;
                }
                if (j.value("event", "") == "fill" && j.contains("realized_return") &&
                    j["realized_return"].is_number()) {
                    out.push_back(j["realized_return"].get<double>());
                }
            }
        }
        return out;
    }

    std::string path() const {
        std::lock_guard<std::mutex> lock(mu_);
        return base_path_;
    }

    // Switch a daily journal to trading_date's file. No-op for fixed paths.
    void start_day(const std::string& trading_date) {
        if (directory_.empty()) return;
        auto next = path_for(directory_, trading_date);
        std::lock_guard<std::mutex> lock(mu_);
        if (next == base_path_) return;
        stream_.close();
        base_path_ = next;
        roll_idx_ = 0;
        open_stream(base_path_);
        spdlog::info("Trade journal now writing {}", base_path_);
    }

    void append(nlohmann::json j) {
        j["logged_at"] = utils::ts_to_iso(std::chrono::system_clock::now());
        std::string line = j.dump();
        std::lock_guard<std::mutex> lock(mu_);
        if (!stream_.is_open()) return;
        stream_ << line << "\n";
        stream_.flush();
        current_size_ += line.size() + 1;
        if (current_size_ >= max_bytes_) {
            rotate();
        }
    }

    void record_order(const Order& order) {
        auto j = order_to_json(order);
        j["event"] = "order_submitted";
        append(std::move(j));
    }

    void record_rejection(const Signal& signal, const std::string& reason, const std::string& detail) {
        append({
            {"event", "signal_rejected"},
            {"signal", signal_to_json(signal)},
            {"reason", reason},
            {"detail", detail}
        });
    }

    void record_fill(const Fill& fill, const std::string& strategy_id, double realized_pnl,
                     double realized_return = 0.0) {
        auto j = fill_to_json(fill);
        j["event"] = "fill";
        j["strategy_id"] = strategy_id;
        j["realized_pnl"] = realized_pnl;
        if (fill.side == OrderSide::SELL) {
            j["realized_return"] = realized_return;
        }
        append(std::move(j));
    }

    void record_order_closed(const Order& order) {
        auto j = order_to_json(order);
        j["event"] = "order_closed";
        append(std::move(j));
    }

private:
    void open_stream(const std::string& p) {
        stream_.open(p, std::ios::out | std::ios::app);
        if (!stream_.is_open()) {
            spdlog::error("Cannot open trade journal {}", p);
        }
        current_size_ = std::filesystem::exists(p) ? std::filesystem::file_size(p) : 0;
    }

    void rotate() {
        stream_.close();
        ++roll_idx_;
        open_stream(base_path_ + "." + std::to_string(roll_idx_));
    }

    std::string directory_;
    std::string base_path_;
    size_t max_bytes_;
    size_t current_size_{0};
    size_t roll_idx_{0};
    std::ofstream stream_;
    mutable std::mutex mu_;
};

} // namespace intraday
