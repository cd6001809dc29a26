#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for pooled SQLite database handles.
 *
 * A SQLiteConnection borrows an open sqlite3* from SQLiteConnectionPool
 * and returns it when destroyed.
 */

#include "QueryResult.hpp"
#include "SQLiteResultSet.hpp"
#include "Value.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>

namespace sqlbridge {

// Forward declaration
class SQLiteConnectionPool;

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for a SQLite handle from the pool.
 *
 * Statements are compiled with sqlite3_prepare_v2(); a statement text that
 * contains a second statement after the first is rejected instead of
 * silently ignoring the tail. Positional parameters use ? placeholders.
 *
 * Transactions are explicit BEGIN/COMMIT/ROLLBACK. setAutoCommit(true)
 * rolls back a transaction that is still open.
 *
 * Failures are thrown as DatabaseError classified from the extended
 * result code.
 */
class SQLiteConnection {
public:
    SQLiteConnection(SQLiteConnectionPool* pool, sqlite3* db,
                     std::chrono::steady_clock::time_point createdAt);

    /**
     * @brief Destructor - returns the handle to the pool.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    sqlite3* get() const { return m_db; }

    bool isValid() const { return m_db != nullptr && !m_released; }

    /**
     * @brief Execute the validation query ("SELECT 1").
     */
    bool ping();

    /**
     * @brief Compile one statement.
     * @throws DatabaseError QueryExecutionError for syntax errors, empty
     *         input or trailing statements.
     */
    SQLiteResultSet prepare(const std::string& sql);

    /**
     * @brief Execute one statement with positional parameters.
     *
     * SQLite always steps row by row, so fetchSize is accepted for symmetry
     * with the server backends and otherwise ignored.
     */
    StatementResult run(const std::string& sql, const std::vector<SqlValue>& params,
                        size_t fetchSize = 0, size_t maxRows = 0);

    /**
     * @brief Prepare once, execute once per parameter set.
     */
    BatchResult runBatch(const std::string& sql, const std::vector<std::vector<SqlValue>>& paramSets);

    void setAutoCommit(bool enabled);
    void commit();
    void rollback();

    void markBroken() { m_broken = true; }

    const char* error() const;
    int changes() const;

private:
    friend class SQLiteConnectionPool;

    void ensureUsable() const;
    void exec(const char* sql);
    void bindChecked(SQLiteResultSet& stmt, const std::vector<SqlValue>& params);
    [[noreturn]] void fail(int rc, const std::string& context = {});

    void release();

    SQLiteConnectionPool* m_pool;                       ///< Owning connection pool
    sqlite3* m_db;                                      ///< SQLite database handle
    std::chrono::steady_clock::time_point m_createdAt;  ///< When the handle was opened
    bool m_released = false;
    bool m_broken = false;
};

}  // namespace sqlbridge
