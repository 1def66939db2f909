#ifndef DATABASE_HPP
#define DATABASE_HPP

#include "StoreError.hpp"
#include <chrono>
#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

class Connection;

class Statement
{
public:
    Statement(Connection &connection, const std::string &sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept;
    Statement &operator=(Statement &&other) = delete;

    // Parameter indices are 1-based
    Statement &bind(int index, const std::string &value);
    Statement &bind(int index, int64_t value);

    // true when a row is available, false when the statement is done
    bool step();
    void reset();

    int64_t columnInt64(int column) const;
    std::string columnText(int column) const;

private:
    Connection *m_connection;
    sqlite3_stmt *m_stmt;
};

class Connection
{
public:
    enum class OpenMode
    {
        ReadOnly,
        ReadWrite,
        ReadWriteCreate
    };

    Connection(const std::string &path,
               OpenMode mode = OpenMode::ReadWriteCreate,
               std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    void execute(const std::string &sql);
    Statement prepare(const std::string &sql) { return Statement(*this, sql); }

    int changes() const;
    bool inTransaction() const;
    bool isReadOnly() const { return m_mode == OpenMode::ReadOnly; }
    const std::string &path() const { return m_path; }

    // Builds a StoreError from the connection's last error
    StoreError lastError(int resultCode, const std::string &context) const;

    sqlite3 *handle() const { return m_db; }

private:
    friend class TransactionScope;

    std::string m_path;
    OpenMode m_mode;
    sqlite3 *m_db;
    unsigned m_savepointDepth;
};

// Top-level scope runs BEGIN IMMEDIATE ... COMMIT. Inside an open transaction
// the scope is a SAVEPOINT, so rolling it back leaves the enclosing
// transaction intact. Rolls back on destruction unless committed.
class TransactionScope
{
public:
    explicit TransactionScope(Connection &connection);
    ~TransactionScope();

    TransactionScope(const TransactionScope &) = delete;
    TransactionScope &operator=(const TransactionScope &) = delete;

    void commit();
    void rollback();
    bool isNested() const { return m_nested; }

private:
    Connection &m_connection;
    bool m_nested;
    bool m_active;
    std::string m_savepoint;
};

#endif
