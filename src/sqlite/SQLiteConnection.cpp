/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the pooled SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "SQLiteConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnectionPool* pool, sqlite3* db,
                                   std::chrono::steady_clock::time_point createdAt)
    : m_pool(pool), m_db(db), m_createdAt(createdAt) {
}

SQLiteConnection::~SQLiteConnection() {
    if (!m_released && m_pool && m_db) {
        release();
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_pool(other.m_pool), m_db(other.m_db), m_createdAt(other.m_createdAt),
      m_released(other.m_released), m_broken(other.m_broken) {
    other.m_pool = nullptr;
    other.m_db = nullptr;
    other.m_released = true;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (!m_released && m_pool && m_db) {
            release();
        }
        m_pool = other.m_pool;
        m_db = other.m_db;
        m_createdAt = other.m_createdAt;
        m_released = other.m_released;
        m_broken = other.m_broken;
        other.m_pool = nullptr;
        other.m_db = nullptr;
        other.m_released = true;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::ping() {
    if (!isValid()) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT 1", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    SQLiteResultSet result(stmt);
    return result.step() == SQLITE_ROW;
}

SQLiteResultSet SQLiteConnection::prepare(const std::string& sql) {
    ensureUsable();

    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, &tail);
    if (rc != SQLITE_OK) {
        fail(rc);
    }

    SQLiteResultSet result(stmt);
    if (!result.isValid()) {
        throw DatabaseError(ErrorKind::QueryExecutionError, "SQL statement is empty");
    }

    // Anything but whitespace and comments after the first statement is a second one
    if (tail && *tail) {
        sqlite3_stmt* next = nullptr;
        int nextRc = sqlite3_prepare_v2(m_db, tail, -1, &next, nullptr);
        SQLiteResultSet extra(next);
        if (nextRc != SQLITE_OK || extra.isValid()) {
            throw DatabaseError(ErrorKind::QueryExecutionError,
                                "Only one SQL statement can be executed per call");
        }
    }

    return result;
}

void SQLiteConnection::bindChecked(SQLiteResultSet& stmt, const std::vector<SqlValue>& params) {
    if (static_cast<int>(params.size()) != stmt.parameterCount()) {
        throw DatabaseError(ErrorKind::QueryExecutionError,
                            "Statement expects " + std::to_string(stmt.parameterCount()) +
                            " parameters, got " + std::to_string(params.size()),
                            std::to_string(SQLITE_RANGE));
    }
    int rc = stmt.bind(params);
    if (rc != SQLITE_OK) {
        fail(rc, "bind");
    }
}

StatementResult SQLiteConnection::run(const std::string& sql, const std::vector<SqlValue>& params,
                                      size_t fetchSize, size_t maxRows) {
    SQLiteResultSet stmt = prepare(sql);
    bindChecked(stmt, params);
    if (fetchSize > 0) {
        spdlog::trace("SQLite steps row by row; fetch size {} ignored", fetchSize);
    }

    StatementResult result;
    bool readOnly = stmt.readOnly();
    if (stmt.columnCount() > 0) {
        result.hasRows = true;
        result.columns = stmt.columns();
    }

    while (true) {
        int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            if (maxRows > 0 && result.rows.size() >= maxRows) {
                result.truncated = true;
                // A writing statement (RETURNING) still has to run to completion
                if (readOnly) break;
                continue;
            }
            result.rows.push_back(stmt.row());
            continue;
        }
        if (rc == SQLITE_DONE) {
            break;
        }
        fail(rc);
    }

    result.affectedRows = readOnly ? 0 : changes();
    return result;
}

BatchResult SQLiteConnection::runBatch(const std::string& sql,
                                       const std::vector<std::vector<SqlValue>>& paramSets) {
    BatchResult batch;

    SQLiteResultSet stmt;
    try {
        stmt = prepare(sql);
    } catch (const DatabaseError& e) {
        batch.failedIndex = 0;
        batch.error = e.what();
        batch.errorKind = e.kind();
        batch.retryable = e.retryable();
        return batch;
    }

    for (size_t i = 0; i < paramSets.size(); ++i) {
        try {
            stmt.reset();
            bindChecked(stmt, paramSets[i]);
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
            }
            if (rc != SQLITE_DONE) {
                fail(rc);
            }
            batch.counts.push_back(changes());
        } catch (const DatabaseError& e) {
            batch.failedIndex = i;
            batch.error = e.what();
            batch.errorKind = e.kind();
            batch.retryable = e.retryable();
            break;
        }
    }

    return batch;
}

// ============================================================================
// Transactions
// ============================================================================

void SQLiteConnection::setAutoCommit(bool enabled) {
    ensureUsable();
    if (!enabled) {
        exec("BEGIN");
    } else if (!sqlite3_get_autocommit(m_db)) {
        exec("ROLLBACK");
    }
}

void SQLiteConnection::commit() {
    ensureUsable();
    exec("COMMIT");
}

void SQLiteConnection::rollback() {
    ensureUsable();
    // Some errors (SQLITE_FULL, SQLITE_IOERR, ...) already rolled the transaction back
    if (sqlite3_get_autocommit(m_db)) {
        return;
    }
    exec("ROLLBACK");
}

void SQLiteConnection::exec(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (errMsg) {
        sqlite3_free(errMsg);
    }
    if (rc != SQLITE_OK) {
        fail(rc, sql);
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

void SQLiteConnection::ensureUsable() const {
    if (!isValid()) {
        throw DatabaseError(ErrorKind::ConnectionFailure, "SQLite connection already released");
    }
}

void SQLiteConnection::fail(int rc, const std::string& context) {
    int code = sqlite3_extended_errcode(m_db);
    if (code == SQLITE_OK) {
        code = rc;
    }

    ErrorKind kind = ErrorHandler::classifySQLite(code);
    if (kind == ErrorKind::ConnectionFailure) {
        m_broken = true;
    }

    std::string message = sqlite3_errmsg(m_db);
    if (!context.empty()) {
        message = context + ": " + message;
    }
    throw DatabaseError(kind, ErrorHandler::redact(message), std::to_string(code),
                        ErrorHandler::isRetryableSQLite(code));
}

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

void SQLiteConnection::release() {
    if (!m_released && m_pool && m_db) {
        m_pool->releaseConnection(m_db, m_createdAt, !m_broken);
        m_released = true;
        m_db = nullptr;
    }
}

}  // namespace sqlbridge
