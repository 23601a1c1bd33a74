#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include "config.hpp"
#include "utils.hpp"

namespace intraday {

/**
 * Trading-day phases in session order. HALTED is entered only by the engine.
 */
enum class Phase {
    PRE_MARKET,
    OPENING,
    MIDDAY,
    CLOSING_PREP,
    CLOSING_EXECUTION,
    POST_MARKET,
    HALTED
};

const char* to_string(Phase phase);
std::optional<Phase> parse_phase(const std::string& s);

// OPENING through CLOSING_EXECUTION.
inline bool is_market_phase(Phase phase) {
    return phase >= Phase::OPENING && phase <= Phase::CLOSING_EXECUTION;
}

struct LocalDate {
    int year{1970};
    int month{1};
    int day{1};

    std::string to_string() const;
    bool operator==(const LocalDate& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const LocalDate& o) const { return !(*this == o); }
};

enum class DayStatus { NON_TRADING_DAY, BEFORE_SESSION, IN_SESSION };

struct ClockReading {
    LocalDate date;
    int seconds_of_day{0};
    DayStatus status{DayStatus::NON_TRADING_DAY};
    Phase phase{Phase::PRE_MARKET};   // meaningful when status == IN_SESSION
};

/**
 * Exchange calendar and session phases. Every answer is a pure function of
 * the timestamp, the UTC offset and the holiday calendar.
 */
class MarketClock {
public:
    MarketClock(const CalendarConfig& calendar, const SessionConfig& session);

    /**
     * Classify an instant: which local date, whether it is a trading day,
     * and the phase when inside the session.
     */
    ClockReading read(Timestamp ts) const;

    LocalDate local_date(Timestamp ts) const;
    int seconds_of_day(Timestamp ts) const;

    bool is_trading_day(const LocalDate& date) const;
    bool is_holiday(const LocalDate& date) const;

    /**
     * True between market open and market close on a trading day.
     */
    bool is_market_open(Timestamp ts) const;

    /**
     * Phase for a local time of day on a trading day at or after session start.
     */
    Phase phase_at(int seconds_of_day) const;

    /**
     * Most recent trading day strictly before the local date of ts.
     */
    LocalDate last_trading_day(Timestamp ts) const;

    /**
     * Next session start at or after ts.
     */
    Timestamp next_session_start(Timestamp ts) const;

    /**
     * Convert local date and time of day to an absolute instant.
     */
    Timestamp to_instant(const LocalDate& date, int seconds_of_day) const;

    const SessionConfig& session() const { return session_; }

private:
    CalendarConfig calendar_;
    SessionConfig session_;
    std::set<std::string> dated_holidays_;      // YYYY-MM-DD
    std::set<std::string> recurring_holidays_;  // MM-DD
};

} // namespace intraday
