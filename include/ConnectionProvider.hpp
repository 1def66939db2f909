#ifndef CONNECTION_PROVIDER_HPP
#define CONNECTION_PROVIDER_HPP

#include "Config.hpp"
#include "Database.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

// Source of store handles. Each unit of work acquires its own connection.
class ConnectionProvider
{
public:
    virtual ~ConnectionProvider() = default;

    // Throws StoreError when no connection can be obtained
    virtual std::unique_ptr<Connection> acquire() = 0;
};

class SqliteConnectionProvider : public ConnectionProvider
{
public:
    SqliteConnectionProvider(const std::string &databasePath,
                             std::chrono::milliseconds busyTimeout,
                             bool readOnly = false);
    explicit SqliteConnectionProvider(const DownloadCountsConfig &config);

    std::unique_ptr<Connection> acquire() override;

    // false until the first writable acquisition creates the database file
    bool storeExists() const;
    const std::string &databasePath() const { return m_databasePath; }
    bool isReadOnly() const { return m_readOnly; }

private:
    std::string m_databasePath;
    std::chrono::milliseconds m_busyTimeout;
    bool m_readOnly;
    std::atomic<bool> m_schemaReady{false};
};

#endif
