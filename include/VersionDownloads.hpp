#ifndef VERSION_DOWNLOADS_HPP
#define VERSION_DOWNLOADS_HPP

#include "CalendarDate.hpp"
#include "Database.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One day of a history series
struct DownloadCount
{
    CalendarDate date;
    int64_t count = 0;

    bool operator==(const DownloadCount &other) const
    {
        return date == other.date && count == other.count;
    }
    bool operator!=(const DownloadCount &other) const { return !(*this == other); }
};

// Access to the version_downloads table: one row per (version_key, date).
// None of these functions open a transaction; callers scope them.
class VersionDownloads
{
public:
    static void ensureSchema(Connection &connection);

    // Adds amount to an existing row. Returns false if the row does not exist.
    static bool incrementExisting(Connection &connection, const std::string &key,
                                  const CalendarDate &day, int64_t amount);

    // Throws StoreError(Constraint) if a row for (key, day) already exists.
    static void insertNew(Connection &connection, const std::string &key,
                          const CalendarDate &day, int64_t amount);

    // Increment, else insert; an insert that loses a race to a concurrent
    // writer falls back to increment. Gives up after maxAttempts with the
    // last constraint error.
    static void createOrIncrement(Connection &connection, const std::string &key,
                                  const CalendarDate &day, int64_t amount = 1,
                                  size_t maxAttempts = 3);

    // Rows in [start, end], ascending by date
    static std::vector<DownloadCount> countsBetween(Connection &connection, const std::string &key,
                                                    const CalendarDate &start, const CalendarDate &end);

    static std::optional<int64_t> countFor(Connection &connection, const std::string &key,
                                           const CalendarDate &day);
};

#endif
