#include "CalendarDate.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace
{
    bool isLeapYear(int64_t y)
    {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    unsigned lastDayOfMonth(int64_t y, unsigned m)
    {
        static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return (m == 2 && isLeapYear(y)) ? 29u : days[m - 1];
    }

    // Howard Hinnant's days_from_civil / civil_from_days
    int64_t daysFromCivil(int64_t y, unsigned m, unsigned d)
    {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    void civilFromDays(int64_t z, int64_t &y, unsigned &m, unsigned &d)
    {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
    }

    // Four-digit years keep the YYYY-MM-DD text form ordered like the dates
    const int kMinYear = 0;
    const int kMaxYear = 9999;

    int64_t floorDiv(int64_t a, int64_t b)
    {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0)))
            --q;
        return q;
    }
}

CalendarDate::CalendarDate(int year, unsigned month, unsigned day)
{
    if (year < kMinYear || year > kMaxYear)
    {
        throw std::invalid_argument("CalendarDate: year out of range: " + std::to_string(year));
    }
    if (month < 1 || month > 12)
    {
        throw std::invalid_argument("CalendarDate: month out of range: " + std::to_string(month));
    }
    if (day < 1 || day > lastDayOfMonth(year, month))
    {
        throw std::invalid_argument("CalendarDate: day out of range: " + std::to_string(day));
    }
    m_days = daysFromCivil(year, month, day);
}

std::optional<CalendarDate> CalendarDate::parse(const std::string &text)
{
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return std::nullopt;
    }

    int year = std::stoi(text.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));

    if (month < 1 || month > 12 || day < 1 || day > lastDayOfMonth(year, month))
    {
        return std::nullopt;
    }
    return CalendarDate(year, month, day);
}

CalendarDate CalendarDate::fromDaysSinceEpoch(int64_t days)
{
    static const int64_t minDays = daysFromCivil(kMinYear, 1, 1);
    static const int64_t maxDays = daysFromCivil(kMaxYear, 12, 31);
    if (days < minDays || days > maxDays)
    {
        throw std::invalid_argument("CalendarDate: day " + std::to_string(days) + " outside years 0000-9999");
    }
    return CalendarDate(days);
}

CalendarDate CalendarDate::fromTimePoint(std::chrono::system_clock::time_point tp, int utcOffsetMinutes)
{
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    seconds += static_cast<int64_t>(utcOffsetMinutes) * 60;
    return fromDaysSinceEpoch(floorDiv(seconds, 86400));
}

CalendarDate CalendarDate::today(int utcOffsetMinutes)
{
    return fromTimePoint(std::chrono::system_clock::now(), utcOffsetMinutes);
}

int CalendarDate::year() const
{
    int64_t y;
    unsigned m, d;
    civilFromDays(m_days, y, m, d);
    return static_cast<int>(y);
}

unsigned CalendarDate::month() const
{
    int64_t y;
    unsigned m, d;
    civilFromDays(m_days, y, m, d);
    return m;
}

unsigned CalendarDate::day() const
{
    int64_t y;
    unsigned m, d;
    civilFromDays(m_days, y, m, d);
    return d;
}

std::string CalendarDate::toString() const
{
    int64_t y;
    unsigned m, d;
    civilFromDays(m_days, y, m, d);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
    return buffer;
}
