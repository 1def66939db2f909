#include "ConnectionProvider.hpp"
#include "VersionDownloads.hpp"
#include <filesystem>
#include <system_error>

SqliteConnectionProvider::SqliteConnectionProvider(const std::string &databasePath,
                                                   std::chrono::milliseconds busyTimeout,
                                                   bool readOnly)
    : m_databasePath(databasePath),
      m_busyTimeout(busyTimeout),
      m_readOnly(readOnly)
{
}

SqliteConnectionProvider::SqliteConnectionProvider(const DownloadCountsConfig &config)
    : SqliteConnectionProvider(config.databasePath, config.busyTimeout, config.readOnly)
{
}

std::unique_ptr<Connection> SqliteConnectionProvider::acquire()
{
    if (m_readOnly)
    {
        return std::make_unique<Connection>(m_databasePath, Connection::OpenMode::ReadOnly, m_busyTimeout);
    }

    auto connection = std::make_unique<Connection>(m_databasePath, Connection::OpenMode::ReadWriteCreate, m_busyTimeout);

    // Idempotent, so racing first acquirers are harmless. Taking the write
    // lock up front avoids a read-to-write lock upgrade, which SQLite fails
    // immediately instead of waiting on the busy timeout.
    if (!m_schemaReady.load(std::memory_order_acquire))
    {
        TransactionScope transaction(*connection);
        VersionDownloads::ensureSchema(*connection);
        transaction.commit();
        m_schemaReady.store(true, std::memory_order_release);
    }
    return connection;
}

bool SqliteConnectionProvider::storeExists() const
{
    std::error_code ec;
    return std::filesystem::exists(m_databasePath, ec);
}
