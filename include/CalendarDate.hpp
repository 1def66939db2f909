#ifndef CALENDAR_DATE_HPP
#define CALENDAR_DATE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Civil date at day granularity (proleptic Gregorian calendar).
// Internally stored as days since 1970-01-01. Years are limited to
// 0000-9999; constructing or reaching a day outside that range throws
// std::invalid_argument.
class CalendarDate
{
public:
    CalendarDate() = default;
    CalendarDate(int year, unsigned month, unsigned day);

    static std::optional<CalendarDate> parse(const std::string &text);
    static CalendarDate fromDaysSinceEpoch(int64_t days);
    static CalendarDate fromTimePoint(std::chrono::system_clock::time_point tp,
                                      int utcOffsetMinutes = 0);
    static CalendarDate today(int utcOffsetMinutes = 0);

    int year() const;
    unsigned month() const;
    unsigned day() const;

    int64_t daysSinceEpoch() const { return m_days; }
    CalendarDate addDays(int64_t days) const { return fromDaysSinceEpoch(m_days + days); }
    int64_t daysUntil(const CalendarDate &other) const { return other.m_days - m_days; }

    std::string toString() const;

    bool operator==(const CalendarDate &other) const { return m_days == other.m_days; }
    bool operator!=(const CalendarDate &other) const { return m_days != other.m_days; }
    bool operator<(const CalendarDate &other) const { return m_days < other.m_days; }
    bool operator<=(const CalendarDate &other) const { return m_days <= other.m_days; }
    bool operator>(const CalendarDate &other) const { return m_days > other.m_days; }
    bool operator>=(const CalendarDate &other) const { return m_days >= other.m_days; }

private:
    explicit CalendarDate(int64_t days) : m_days(days) {}

    int64_t m_days = 0;
};

#endif
