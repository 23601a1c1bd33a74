#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>

namespace intraday {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared time and id helpers.
 */
namespace utils {

inline int64_t ts_to_ns(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
}

inline Timestamp ns_to_ts(int64_t ns) {
    return Timestamp{} + std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(ns));
}

/**
 * Format timestamp as ISO 8601 string (e.g., "2025-07-01T00:29:55Z").
 */
inline std::string ts_to_iso(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

/**
 * Parse "HH:MM" or "HH:MM:SS" into seconds after local midnight.
 * "24:00" is accepted as end of day.
 */
inline std::optional<int> parse_clock_time(const std::string& s) {
    int hour = 0, minute = 0, second = 0;
    char sep = 0;
    std::istringstream ss(s);
    ss >> hour >> sep >> minute;
    if (ss.fail() || sep != ':') return std::nullopt;
    if (ss.peek() == ':') {
        ss.get();
        ss >> second;
        if (ss.fail()) return std::nullopt;
    }
    if (ss.peek() != std::char_traits<char>::eof()) return std::nullopt;
    if (hour < 0 || minute < 0 || minute > 59 || second < 0 || second > 59) return std::nullopt;
    int total = hour * 3600 + minute * 60 + second;
    if (total > 24 * 3600) return std::nullopt;
    return total;
}

/**
 * Format seconds after midnight as "HH:MM:SS".
 */
inline std::string format_clock_time(int seconds_of_day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                  seconds_of_day / 3600, (seconds_of_day % 3600) / 60, seconds_of_day % 60);
    return std::string(buf);
}

/**
 * Generate a UUID-like ID.
 */
inline std::string generate_id() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (dist(gen) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << (dist(gen) & 0xFFFF) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x0FFF) | 0x4000) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x3FFF) | 0x8000) << "-";
    ss << std::setw(12) << (dist(gen) & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

} // namespace utils
} // namespace intraday
