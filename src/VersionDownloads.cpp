#include "VersionDownloads.hpp"
#include <stdexcept>

namespace
{
    void requirePositive(int64_t amount)
    {
        if (amount <= 0)
        {
            throw std::invalid_argument("VersionDownloads: increment must be positive, got " + std::to_string(amount));
        }
    }
}

void VersionDownloads::ensureSchema(Connection &connection)
{
    connection.execute(
        "CREATE TABLE IF NOT EXISTS version_downloads ("
        " version_key TEXT NOT NULL,"
        " date TEXT NOT NULL,"
        " downloads INTEGER NOT NULL DEFAULT 1 CHECK (downloads >= 0),"
        " PRIMARY KEY (version_key, date)"
        ") WITHOUT ROWID");
}

bool VersionDownloads::incrementExisting(Connection &connection, const std::string &key,
                                         const CalendarDate &day, int64_t amount)
{
    requirePositive(amount);

    Statement stmt = connection.prepare(
        "UPDATE version_downloads SET downloads = downloads + ?1"
        " WHERE version_key = ?2 AND date = ?3");
    stmt.bind(1, amount).bind(2, key).bind(3, day.toString());
    stmt.step();
    return connection.changes() > 0;
}

void VersionDownloads::insertNew(Connection &connection, const std::string &key,
                                 const CalendarDate &day, int64_t amount)
{
    requirePositive(amount);

    Statement stmt = connection.prepare(
        "INSERT INTO version_downloads (version_key, date, downloads) VALUES (?1, ?2, ?3)");
    stmt.bind(1, key).bind(2, day.toString()).bind(3, amount);
    stmt.step();
}

void VersionDownloads::createOrIncrement(Connection &connection, const std::string &key,
                                         const CalendarDate &day, int64_t amount,
                                         size_t maxAttempts)
{
    requirePositive(amount);
    if (maxAttempts == 0)
    {
        throw std::invalid_argument("VersionDownloads: maxAttempts must be positive");
    }

    for (size_t attempt = 1;; ++attempt)
    {
        if (incrementExisting(connection, key, day, amount))
        {
            return;
        }

        try
        {
            insertNew(connection, key, day, amount);
            return;
        }
        catch (const StoreError &e)
        {
            // another writer created the row first
            if (e.kind() != StoreErrorKind::Constraint || attempt >= maxAttempts)
            {
                throw;
            }
        }
    }
}

std::vector<DownloadCount> VersionDownloads::countsBetween(Connection &connection, const std::string &key,
                                                           const CalendarDate &start, const CalendarDate &end)
{
    Statement stmt = connection.prepare(
        "SELECT date, downloads FROM version_downloads"
        " WHERE version_key = ?1 AND date BETWEEN ?2 AND ?3"
        " ORDER BY date");
    stmt.bind(1, key).bind(2, start.toString()).bind(3, end.toString());

    std::vector<DownloadCount> rows;
    while (stmt.step())
    {
        auto date = CalendarDate::parse(stmt.columnText(0));
        if (!date)
        {
            throw StoreError(StoreErrorKind::Other, 0, "malformed date in version_downloads: " + stmt.columnText(0));
        }
        rows.push_back(DownloadCount{*date, stmt.columnInt64(1)});
    }
    return rows;
}

std::optional<int64_t> VersionDownloads::countFor(Connection &connection, const std::string &key,
                                                  const CalendarDate &day)
{
    Statement stmt = connection.prepare(
        "SELECT downloads FROM version_downloads WHERE version_key = ?1 AND date = ?2");
    stmt.bind(1, key).bind(2, day.toString());
    if (!stmt.step())
    {
        return std::nullopt;
    }
    return stmt.columnInt64(0);
}
