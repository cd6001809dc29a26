#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief RAII wrapper for pooled MySQL database connections.
 *
 * When a MySQLConnection goes out of scope, the underlying MYSQL handle
 * is returned to the MySQLConnectionPool it came from.
 */

#include "MySQLStatement.hpp"
#include "QueryResult.hpp"
#include "Value.hpp"
#include <mysql/mysql.h>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>

namespace sqlbridge {

// Forward declaration
class MySQLConnectionPool;

/**
 * @class MySQLConnection
 * @brief RAII wrapper for a MySQL connection from the pool.
 *
 * Statements run as server-side prepared statements (MySQLStatement) so
 * parameters never reach the SQL text. Transactions use the client API:
 * mysql_autocommit(), mysql_commit() and mysql_rollback().
 *
 * setAutoCommit(true) rolls back before switching auto-commit back on, so
 * a connection abandoned mid-transaction never commits partial work.
 *
 * Thread Safety:
 * - Individual connections should not be shared between threads
 */
class MySQLConnection {
public:
    MySQLConnection(MySQLConnectionPool* pool, MYSQL* conn,
                    std::chrono::steady_clock::time_point createdAt);

    /**
     * @brief Destructor - returns connection to pool.
     */
    ~MySQLConnection();

    // Non-copyable
    MySQLConnection(const MySQLConnection&) = delete;
    MySQLConnection& operator=(const MySQLConnection&) = delete;

    // Movable
    MySQLConnection(MySQLConnection&& other) noexcept;
    MySQLConnection& operator=(MySQLConnection&& other) noexcept;

    MYSQL* get() const { return m_conn; }

    bool isValid() const;

    /**
     * @brief Execute the validation query ("SELECT 1").
     */
    bool ping();

    /**
     * @brief Prepare a server-side statement.
     * @throws DatabaseError classified from mysql_stmt_errno().
     */
    MySQLStatement prepare(const std::string& sql);

    /**
     * @brief Execute one statement with positional (?) parameters.
     */
    StatementResult run(const std::string& sql, const std::vector<SqlValue>& params,
                        size_t fetchSize = 0, size_t maxRows = 0);

    /**
     * @brief Run a parameterless statement over the text protocol.
     *
     * For statements the prepared-statement protocol refuses, such as
     * EXPLAIN. Every non-NULL cell comes back as a string.
     */
    StatementResult runText(const std::string& sql);

    /**
     * @brief Prepare once, execute once per parameter set.
     */
    BatchResult runBatch(const std::string& sql, const std::vector<std::vector<SqlValue>>& paramSets);

    void setAutoCommit(bool enabled);
    void commit();
    void rollback();

    void markBroken() { m_broken = true; }

    const char* error() const;
    unsigned int errorNumber() const;

private:
    friend class MySQLConnectionPool;

    void ensureUsable() const;
    [[noreturn]] void fail(const std::string& context);
    const std::string& secret() const;

    /**
     * @brief Return the connection to the pool.
     */
    void release();

    MySQLConnectionPool* m_pool;                        ///< Owning connection pool
    MYSQL* m_conn;                                      ///< MySQL connection handle
    std::chrono::steady_clock::time_point m_createdAt;  ///< Physical connection age
    bool m_released = false;                            ///< Whether connection has been returned
    bool m_broken = false;                              ///< Do not reuse after release
};

}  // namespace sqlbridge
