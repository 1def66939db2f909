#ifndef HISTORY_READER_HPP
#define HISTORY_READER_HPP

#include "CalendarDate.hpp"
#include "Config.hpp"
#include "ConnectionProvider.hpp"
#include "VersionDownloads.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Trailing window of daily download counts for one key. Store errors
// propagate to the caller.
class HistoryReader
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    HistoryReader(std::shared_ptr<ConnectionProvider> provider,
                  const DownloadCountsConfig &config,
                  Clock clock = []()
                  { return std::chrono::system_clock::now(); });

    // Window of historyWindowDays days ending at endDate (default: today in
    // the configured reference calendar), ascending by date.
    std::vector<DownloadCount> fetchHistory(const std::string &key,
                                            std::optional<CalendarDate> endDate = std::nullopt) const;

    // Same, for a raw YYYY-MM-DD end date; absent or unparseable means today
    std::vector<DownloadCount> fetchHistoryBefore(const std::string &key,
                                                  const std::optional<std::string> &beforeDate) const;

    // Absent or unparseable beforeDate means today
    CalendarDate endDateFor(const std::optional<std::string> &beforeDate) const;
    // The result fetchHistory gives for a key with no recorded downloads
    std::vector<DownloadCount> emptyHistory(const CalendarDate &endDate) const;

    CalendarDate today() const;
    unsigned windowDays() const { return m_windowDays; }
    bool fillsGaps() const { return m_fillGaps; }

private:
    CalendarDate windowStart(const CalendarDate &endDate) const;

    std::shared_ptr<ConnectionProvider> m_provider;
    unsigned m_windowDays;
    bool m_fillGaps;
    int m_utcOffsetMinutes;
    Clock m_clock;
};

// One entry per day in [start, end], taking counts from the ascending rows
// and zero elsewhere.
std::vector<DownloadCount> fillHistoryGaps(const std::vector<DownloadCount> &rows,
                                           const CalendarDate &start,
                                           const CalendarDate &end);

#endif
