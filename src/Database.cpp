#include "Database.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <iostream>
#include <limits>

// Statement

Statement::Statement(Connection &connection, const std::string &sql)
    : m_connection(&connection), m_stmt(nullptr)
{
    int rc = sqlite3_prepare_v2(connection.handle(), sql.c_str(), static_cast<int>(sql.size()), &m_stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw connection.lastError(rc, "prepare failed: " + sql);
    }
}

Statement::~Statement()
{
    if (m_stmt)
    {
        sqlite3_finalize(m_stmt);
    }
}

Statement::Statement(Statement &&other) noexcept
    : m_connection(other.m_connection), m_stmt(other.m_stmt)
{
    other.m_stmt = nullptr;
}

Statement &Statement::bind(int index, const std::string &value)
{
    int rc = sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
    {
        throw m_connection->lastError(rc, "bind failed");
    }
    return *this;
}

Statement &Statement::bind(int index, int64_t value)
{
    int rc = sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK)
    {
        throw m_connection->lastError(rc, "bind failed");
    }
    return *this;
}

bool Statement::step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    if (rc == SQLITE_DONE)
    {
        return false;
    }
    StoreError error = m_connection->lastError(rc, "step failed");
    sqlite3_reset(m_stmt);
    throw error;
}

void Statement::reset()
{
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

int64_t Statement::columnInt64(int column) const
{
    return static_cast<int64_t>(sqlite3_column_int64(m_stmt, column));
}

std::string Statement::columnText(int column) const
{
    const unsigned char *text = sqlite3_column_text(m_stmt, column);
    if (!text)
    {
        return std::string();
    }
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(m_stmt, column)));
}

// Connection

Connection::Connection(const std::string &path, OpenMode mode, std::chrono::milliseconds busyTimeout)
    : m_path(path), m_mode(mode), m_db(nullptr), m_savepointDepth(0)
{
    int flags = 0;
    switch (mode)
    {
    case OpenMode::ReadOnly:
        flags = SQLITE_OPEN_READONLY;
        break;
    case OpenMode::ReadWrite:
        flags = SQLITE_OPEN_READWRITE;
        break;
    case OpenMode::ReadWriteCreate:
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        StoreError error = StoreError::fromResultCode(
            m_db ? sqlite3_extended_errcode(m_db) : rc, "cannot open database " + path);
        sqlite3_close_v2(m_db);
        m_db = nullptr;
        throw error;
    }

    sqlite3_extended_result_codes(m_db, 1);
    const auto timeoutMs = std::min<long long>(std::max<long long>(busyTimeout.count(), 0),
                                               std::numeric_limits<int>::max());
    sqlite3_busy_timeout(m_db, static_cast<int>(timeoutMs));
}

Connection::~Connection()
{
    if (m_db)
    {
        sqlite3_close_v2(m_db);
    }
}

void Connection::execute(const std::string &sql)
{
    char *errmsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StoreError::fromResultCode(sqlite3_extended_errcode(m_db), sql + ": " + message);
    }
}

int Connection::changes() const
{
    return sqlite3_changes(m_db);
}

bool Connection::inTransaction() const
{
    return sqlite3_get_autocommit(m_db) == 0;
}

StoreError Connection::lastError(int resultCode, const std::string &context) const
{
    int code = m_db ? sqlite3_extended_errcode(m_db) : resultCode;
    // the connection may report a stale code when the failure came from the API itself
    if ((code & 0xff) != (resultCode & 0xff))
    {
        code = resultCode;
    }
    std::string message = context;
    if (m_db)
    {
        message += ": ";
        message += sqlite3_errmsg(m_db);
    }
    return StoreError::fromResultCode(code, message);
}

// TransactionScope

TransactionScope::TransactionScope(Connection &connection)
    : m_connection(connection),
      m_nested(connection.inTransaction()),
      m_active(false)
{
    if (m_nested)
    {
        m_savepoint = "counter_sp_" + std::to_string(m_connection.m_savepointDepth + 1);
        m_connection.execute("SAVEPOINT " + m_savepoint);
        ++m_connection.m_savepointDepth;
    }
    else
    {
        m_connection.execute("BEGIN IMMEDIATE");
    }
    m_active = true;
}

TransactionScope::~TransactionScope()
{
    if (!m_active)
    {
        return;
    }
    try
    {
        rollback();
    }
    catch (const StoreError &e)
    {
        std::cerr << "TransactionScope Error: rollback failed: " << e.what() << std::endl;
    }
}

void TransactionScope::commit()
{
    if (!m_active)
    {
        throw std::logic_error("TransactionScope: commit on inactive scope");
    }

    if (m_nested)
    {
        m_connection.execute("RELEASE SAVEPOINT " + m_savepoint);
        --m_connection.m_savepointDepth;
    }
    else
    {
        m_connection.execute("COMMIT");
    }
    m_active = false;
}

void TransactionScope::rollback()
{
    if (!m_active)
    {
        return;
    }
    m_active = false;

    if (m_nested)
    {
        --m_connection.m_savepointDepth;
        m_connection.execute("ROLLBACK TO SAVEPOINT " + m_savepoint);
        m_connection.execute("RELEASE SAVEPOINT " + m_savepoint);
    }
    else if (m_connection.inTransaction())
    {
        m_connection.execute("ROLLBACK");
    }
}
