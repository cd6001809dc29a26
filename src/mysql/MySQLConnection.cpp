/**
 * @file MySQLConnection.cpp
 * @brief Implementation of RAII MySQL connection wrapper.
 */

#include "MySQLConnection.hpp"
#include "MySQLConnectionPool.hpp"
#include "MySQLResultSet.hpp"
#include "ErrorHandler.hpp"

namespace sqlbridge {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection(MySQLConnectionPool* pool, MYSQL* conn,
                                 std::chrono::steady_clock::time_point createdAt)
    : m_pool(pool), m_conn(conn), m_createdAt(createdAt) {
}

MySQLConnection::~MySQLConnection() {
    if (!m_released && m_pool && m_conn) {
        release();
    }
}

// ============================================================================
// Move Operations
// ============================================================================

MySQLConnection::MySQLConnection(MySQLConnection&& other) noexcept
    : m_pool(other.m_pool), m_conn(other.m_conn), m_createdAt(other.m_createdAt),
      m_released(other.m_released), m_broken(other.m_broken) {
    other.m_pool = nullptr;
    other.m_conn = nullptr;
    other.m_released = true;
}

MySQLConnection& MySQLConnection::operator=(MySQLConnection&& other) noexcept {
    if (this != &other) {
        // Release current connection before taking ownership of new one
        if (!m_released && m_pool && m_conn) {
            release();
        }
        m_pool = other.m_pool;
        m_conn = other.m_conn;
        m_createdAt = other.m_createdAt;
        m_released = other.m_released;
        m_broken = other.m_broken;
        other.m_pool = nullptr;
        other.m_conn = nullptr;
        other.m_released = true;
    }
    return *this;
}

// ============================================================================
// Connection State
// ============================================================================

bool MySQLConnection::isValid() const {
    return m_conn != nullptr && !m_released;
}

bool MySQLConnection::ping() {
    if (!isValid()) return false;

    if (mysql_real_query(m_conn, "SELECT 1", 8) != 0) {
        return false;
    }
    MySQLResultSet result(mysql_store_result(m_conn));
    return result && result.fetchRow() != nullptr;
}

// ============================================================================
// Query Execution
// ============================================================================

MySQLStatement MySQLConnection::prepare(const std::string& sql) {
    ensureUsable();

    MYSQL_STMT* stmt = mysql_stmt_init(m_conn);
    if (!stmt) {
        fail("statement init");
    }

    MySQLStatement statement(stmt, secret());
    if (mysql_stmt_prepare(stmt, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        unsigned int code = mysql_stmt_errno(stmt);
        ErrorKind kind = ErrorHandler::classifyMySQL(code);
        if (kind == ErrorKind::ConnectionFailure) m_broken = true;
        throw DatabaseError(kind, ErrorHandler::redact(mysql_stmt_error(stmt), secret()),
                            std::to_string(code), ErrorHandler::isRetryableMySQL(code));
    }

    return statement;
}

StatementResult MySQLConnection::run(const std::string& sql, const std::vector<SqlValue>& params,
                                     size_t fetchSize, size_t maxRows) {
    MySQLStatement statement = prepare(sql);
    try {
        return statement.execute(params, fetchSize, maxRows);
    } catch (const DatabaseError& e) {
        if (e.kind() == ErrorKind::ConnectionFailure) m_broken = true;
        throw;
    }
}

StatementResult MySQLConnection::runText(const std::string& sql) {
    ensureUsable();
    if (mysql_real_query(m_conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        fail("query");
    }

    StatementResult result;
    MySQLResultSet res(mysql_store_result(m_conn));
    if (!res) {
        if (mysql_field_count(m_conn) != 0) {
            fail("store result");
        }
        result.affectedRows = static_cast<int64_t>(mysql_affected_rows(m_conn));
        return result;
    }

    result.hasRows = true;
    result.columns = res.columns();
    unsigned int fields = res.numFields();
    MYSQL_ROW row;
    while ((row = res.fetchRow()) != nullptr) {
        unsigned long* lengths = mysql_fetch_lengths(res.get());
        Row out;
        out.reserve(fields);
        for (unsigned int i = 0; i < fields; ++i) {
            SqlValue cell;
            if (row[i]) {
                cell = std::string(row[i], lengths[i]);
            }
            out.emplace_back(result.columns[i].name, std::move(cell));
        }
        result.rows.push_back(std::move(out));
    }
    return result;
}

BatchResult MySQLConnection::runBatch(const std::string& sql,
                                      const std::vector<std::vector<SqlValue>>& paramSets) {
    BatchResult batch;

    try {
        MySQLStatement statement = prepare(sql);
        for (size_t i = 0; i < paramSets.size(); ++i) {
            batch.failedIndex = i;
            batch.counts.push_back(statement.execute(paramSets[i]).affectedRows);
        }
        batch.failedIndex.reset();
    } catch (const DatabaseError& e) {
        if (!batch.failedIndex) batch.failedIndex = 0;
        batch.error = e.what();
        batch.errorKind = e.kind();
        batch.retryable = e.retryable();
        if (e.kind() == ErrorKind::ConnectionFailure) m_broken = true;
    }

    return batch;
}

// ============================================================================
// Transactions
// ============================================================================

void MySQLConnection::setAutoCommit(bool enabled) {
    ensureUsable();
    if (enabled && mysql_rollback(m_conn) != 0) {
        fail("rollback");
    }
    if (mysql_autocommit(m_conn, enabled) != 0) {
        fail("autocommit");
    }
}

void MySQLConnection::commit() {
    ensureUsable();
    if (mysql_commit(m_conn) != 0) {
        fail("commit");
    }
}

void MySQLConnection::rollback() {
    ensureUsable();
    if (mysql_rollback(m_conn) != 0) {
        fail("rollback");
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* MySQLConnection::error() const {
    if (!m_conn) return "No connection";
    return mysql_error(m_conn);
}

unsigned int MySQLConnection::errorNumber() const {
    if (!m_conn) return 0;
    return mysql_errno(m_conn);
}

void MySQLConnection::ensureUsable() const {
    if (!isValid()) {
        throw DatabaseError(ErrorKind::ConnectionFailure, "MySQL connection already released");
    }
}

void MySQLConnection::fail(const std::string& context) {
    unsigned int code = errorNumber();
    ErrorKind kind = ErrorHandler::classifyMySQL(code);
    if (kind == ErrorKind::ConnectionFailure) {
        m_broken = true;
    }
    throw DatabaseError(kind, ErrorHandler::redact(context + ": " + error(), secret()),
                        std::to_string(code), ErrorHandler::isRetryableMySQL(code));
}

const std::string& MySQLConnection::secret() const {
    static const std::string none;
    return m_pool ? m_pool->info().password : none;
}

// ============================================================================
// Connection Pool Integration
// ============================================================================

void MySQLConnection::release() {
    if (!m_released && m_pool && m_conn) {
        m_pool->releaseConnection(m_conn, m_createdAt, !m_broken);
        m_released = true;
        m_conn = nullptr;
    }
}

}  // namespace sqlbridge
