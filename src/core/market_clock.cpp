#include "market_clock.hpp"

#include <cstdio>
#include <ctime>

namespace intraday {

namespace {

int day_of_week(int year, int month, int day) {
    static const int table[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    if (month < 3) {
        year -= 1;
    }
    return (year + year / 4 - year / 100 + year / 400 + table[month - 1] + day) % 7;
}

LocalDate add_days(const LocalDate& date, int delta) {
    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = date.month - 1;
    tm.tm_mday = date.day + delta;
    auto tt = timegm(&tm);
    std::tm out{};
    gmtime_r(&tt, &out);
    return LocalDate{out.tm_year + 1900, out.tm_mon + 1, out.tm_mday};
}

Timestamp utc_time_point(int year, int month, int day, int seconds_of_day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    auto tt = timegm(&tm);
    return std::chrono::system_clock::from_time_t(tt) + std::chrono::seconds(seconds_of_day);
}

bool is_recurring_key(const std::string& s) {
    int month = 0, day = 0;
    char tail = 0;
    return s.size() == 5 && std::sscanf(s.c_str(), "%2d-%2d%c", &month, &day, &tail) == 2 &&
           month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

bool is_dated_key(const std::string& s) {
    int year = 0, month = 0, day = 0;
    char tail = 0;
    return s.size() == 10 &&
           std::sscanf(s.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) == 3 &&
           month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

} // namespace

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::PRE_MARKET: return "PRE_MARKET";
        case Phase::OPENING: return "OPENING";
        case Phase::MIDDAY: return "MIDDAY";
        case Phase::CLOSING_PREP: return "CLOSING_PREP";
        case Phase::CLOSING_EXECUTION: return "CLOSING_EXECUTION";
        case Phase::POST_MARKET: return "POST_MARKET";
        case Phase::HALTED: return "HALTED";
    }
    return "UNKNOWN";
}

std::optional<Phase> parse_phase(const std::string& s) {
    for (auto p : {Phase::PRE_MARKET, Phase::OPENING, Phase::MIDDAY, Phase::CLOSING_PREP,
                   Phase::CLOSING_EXECUTION, Phase::POST_MARKET, Phase::HALTED}) {
        if (s == to_string(p)) return p;
    }
    return std::nullopt;
}

std::string LocalDate::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

MarketClock::MarketClock(const CalendarConfig& calendar, const SessionConfig& session)
    : calendar_(calendar), session_(session) {
    for (const auto& h : calendar_.holidays) {
        if (is_dated_key(h)) {
            dated_holidays_.insert(h);
        } else if (is_recurring_key(h)) {
            recurring_holidays_.insert(h);
        } else {
            throw ConfigurationError("invalid holiday '" + h + "', expected YYYY-MM-DD or MM-DD");
        }
    }
}

LocalDate MarketClock::local_date(Timestamp ts) const {
    auto tt = std::chrono::system_clock::to_time_t(ts + std::chrono::minutes(calendar_.utc_offset_minutes));
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return LocalDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int MarketClock::seconds_of_day(Timestamp ts) const {
    auto tt = std::chrono::system_clock::to_time_t(ts + std::chrono::minutes(calendar_.utc_offset_minutes));
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
}

bool MarketClock::is_holiday(const LocalDate& date) const {
    if (dated_holidays_.count(date.to_string())) {
        return true;
    }
    char key[8];
    std::snprintf(key, sizeof(key), "%02d-%02d", date.month, date.day);
    return recurring_holidays_.count(key) > 0;
}

bool MarketClock::is_trading_day(const LocalDate& date) const {
    int wday = day_of_week(date.year, date.month, date.day);
    if (wday == 0 || wday == 6) {
        return false;
    }
    return !is_holiday(date);
}

Phase MarketClock::phase_at(int sod) const {
    if (sod < session_.market_open) return Phase::PRE_MARKET;
    if (sod < session_.opening_end) return Phase::OPENING;
    if (sod < session_.closing_prep_start) return Phase::MIDDAY;
    if (sod < session_.closing_execution_start) return Phase::CLOSING_PREP;
    if (sod < session_.market_close) return Phase::CLOSING_EXECUTION;
    return Phase::POST_MARKET;
}

ClockReading MarketClock::read(Timestamp ts) const {
    ClockReading reading;
    reading.date = local_date(ts);
    reading.seconds_of_day = seconds_of_day(ts);
    if (!is_trading_day(reading.date)) {
        reading.status = DayStatus::NON_TRADING_DAY;
        return reading;
    }
    if (reading.seconds_of_day < session_.session_start) {
        reading.status = DayStatus::BEFORE_SESSION;
        return reading;
    }
    reading.status = DayStatus::IN_SESSION;
    reading.phase = phase_at(reading.seconds_of_day);
    return reading;
}

bool MarketClock::is_market_open(Timestamp ts) const {
    auto reading = read(ts);
    return reading.status == DayStatus::IN_SESSION && is_market_phase(reading.phase);
}

LocalDate MarketClock::last_trading_day(Timestamp ts) const {
    LocalDate date = local_date(ts);
    // Holiday lists never cover more than a few weeks in a row.
    for (int i = 0; i < 366; ++i) {
        date = add_days(date, -1);
        if (is_trading_day(date)) {
            return date;
        }
    }
    throw ConfigurationError("no trading day found in the past year");
}

Timestamp MarketClock::to_instant(const LocalDate& date, int sod) const {
    auto local = utc_time_point(date.year, date.month, date.day, sod);
    return local - std::chrono::minutes(calendar_.utc_offset_minutes);
}

Timestamp MarketClock::next_session_start(Timestamp ts) const {
    LocalDate date = local_date(ts);
    if (is_trading_day(date) && seconds_of_day(ts) < session_.session_start) {
        return to_instant(date, session_.session_start);
    }
    for (int i = 0; i < 366; ++i) {
        date = add_days(date, 1);
        if (is_trading_day(date)) {
            return to_instant(date, session_.session_start);
        }
    }
    throw ConfigurationError("no trading day found in the next year");
}

} // namespace intraday
