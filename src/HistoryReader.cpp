#include "HistoryReader.hpp"
#include <stdexcept>

HistoryReader::HistoryReader(std::shared_ptr<ConnectionProvider> provider,
                             const DownloadCountsConfig &config,
                             Clock clock)
    : m_provider(std::move(provider)),
      m_windowDays(config.historyWindowDays),
      m_fillGaps(config.fillGaps),
      m_utcOffsetMinutes(config.utcOffsetMinutes),
      m_clock(std::move(clock))
{
    if (!m_provider)
    {
        throw std::invalid_argument("HistoryReader: null connection provider");
    }
    if (m_windowDays == 0)
    {
        throw std::invalid_argument("HistoryReader: history window must be at least one day");
    }
    if (!m_clock)
    {
        throw std::invalid_argument("HistoryReader: null clock");
    }
}

std::vector<DownloadCount> HistoryReader::fetchHistory(const std::string &key,
                                                       std::optional<CalendarDate> endDate) const
{
    CalendarDate end = endDate.value_or(today());
    CalendarDate start = windowStart(end);

    auto connection = m_provider->acquire();
    std::vector<DownloadCount> rows = VersionDownloads::countsBetween(*connection, key, start, end);

    if (!m_fillGaps)
    {
        return rows;
    }
    return fillHistoryGaps(rows, start, end);
}

std::vector<DownloadCount> HistoryReader::fetchHistoryBefore(const std::string &key,
                                                             const std::optional<std::string> &beforeDate) const
{
    return fetchHistory(key, endDateFor(beforeDate));
}

CalendarDate HistoryReader::endDateFor(const std::optional<std::string> &beforeDate) const
{
    std::optional<CalendarDate> endDate;
    if (beforeDate)
    {
        endDate = CalendarDate::parse(*beforeDate);
    }
    return endDate.value_or(today());
}

std::vector<DownloadCount> HistoryReader::emptyHistory(const CalendarDate &endDate) const
{
    if (!m_fillGaps)
    {
        return {};
    }
    return fillHistoryGaps({}, windowStart(endDate), endDate);
}

CalendarDate HistoryReader::windowStart(const CalendarDate &endDate) const
{
    return endDate.addDays(-static_cast<int64_t>(m_windowDays - 1));
}

CalendarDate HistoryReader::today() const
{
    return CalendarDate::fromTimePoint(m_clock(), m_utcOffsetMinutes);
}

std::vector<DownloadCount> fillHistoryGaps(const std::vector<DownloadCount> &rows,
                                           const CalendarDate &start,
                                           const CalendarDate &end)
{
    std::vector<DownloadCount> series;
    if (end < start)
    {
        return series;
    }
    series.reserve(static_cast<size_t>(start.daysUntil(end) + 1));

    auto row = rows.begin();
    for (CalendarDate day = start; day <= end; day = day.addDays(1))
    {
        while (row != rows.end() && row->date < day)
        {
            ++row;
        }
        if (row != rows.end() && row->date == day)
        {
            series.push_back(*row);
        }
        else
        {
            series.push_back(DownloadCount{day, 0});
        }
    }
    return series;
}
