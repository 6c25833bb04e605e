#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// A UTC calendar day, stored as days since 1970-01-01.
// Civil conversions follow Howard Hinnant's days_from_civil algorithm.
class CalendarDate {
public:
    CalendarDate() = default;
    explicit CalendarDate(int64_t daysSinceEpoch) : days_(daysSinceEpoch) {}

    static CalendarDate fromYmd(int year, unsigned month, unsigned day);

    // Truncates a unix timestamp (seconds) to its UTC day
    static CalendarDate fromUnixSeconds(int64_t seconds);

    // Accepts "YYYY-MM-DD" optionally followed by a time part
    // ("2025-01-31T00:00:00Z"). Only the date portion is used.
    static std::optional<CalendarDate> parseIso(const std::string& text);

    static CalendarDate today();

    int64_t daysSinceEpoch() const { return days_; }
    int64_t unixSeconds() const { return days_ * 86400; }

    int year() const;
    unsigned month() const;
    unsigned day() const;

    CalendarDate addDays(int64_t n) const { return CalendarDate(days_ + n); }

    std::string isoDate() const;       // 2025-01-31
    std::string isoTimestamp() const;  // 2025-01-31T00:00:00Z
    std::string shortLabel() const;    // 01/31

    bool operator==(const CalendarDate& o) const { return days_ == o.days_; }
    bool operator!=(const CalendarDate& o) const { return days_ != o.days_; }
    bool operator<(const CalendarDate& o)  const { return days_ <  o.days_; }
    bool operator<=(const CalendarDate& o) const { return days_ <= o.days_; }
    bool operator>(const CalendarDate& o)  const { return days_ >  o.days_; }
    bool operator>=(const CalendarDate& o) const { return days_ >= o.days_; }

private:
    struct Civil { int year; unsigned month; unsigned day; };
    Civil civil() const;

    int64_t days_ = 0;
};
