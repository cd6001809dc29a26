#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII wrapper for pooled PostgreSQL database connections.
 *
 * When a PostgreSQLConnection goes out of scope, the underlying PGconn
 * is returned to the PostgreSQLConnectionPool it came from.
 */

#include "QueryResult.hpp"
#include "Value.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>

namespace sqlbridge {

// Forward declaration
class PostgreSQLConnectionPool;

/**
 * @class PostgreSQLConnection
 * @brief RAII wrapper for a PostgreSQL connection from the pool.
 *
 * libpq API usage:
 * - PQexecParams() with text parameters; Bytes parameters are sent in binary format
 * - PQprepare()/PQexecPrepared() with the unnamed statement for batches
 * - PQsendQueryParams() + PQsetSingleRowMode() when a fetch size is requested
 * - PQresultErrorField(PG_DIAG_SQLSTATE) for error classification
 *
 * Transactions are explicit BEGIN/COMMIT/ROLLBACK. setAutoCommit(true)
 * rolls back anything still open, which is how a pooled connection is
 * returned to a clean state.
 *
 * Every failure is thrown as DatabaseError classified from the SQLSTATE,
 * with the connection password removed from the diagnostic.
 *
 * Thread Safety:
 * - Individual connections should not be shared between threads
 * - The pool handles thread-safe connection distribution
 */
class PostgreSQLConnection {
public:
    /**
     * @brief Construct a connection wrapper.
     * @param pool Pointer to the owning connection pool.
     * @param conn Raw PGconn* handle to wrap.
     * @param createdAt When the physical connection was opened.
     */
    PostgreSQLConnection(PostgreSQLConnectionPool* pool, PGconn* conn,
                         std::chrono::steady_clock::time_point createdAt);

    /**
     * @brief Destructor - returns connection to pool.
     */
    ~PostgreSQLConnection();

    // Non-copyable (connection ownership semantics)
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    // Movable (transfer ownership)
    PostgreSQLConnection(PostgreSQLConnection&& other) noexcept;
    PostgreSQLConnection& operator=(PostgreSQLConnection&& other) noexcept;

    PGconn* get() const { return m_conn; }

    /**
     * @brief Check PQstatus() == CONNECTION_OK.
     */
    bool isValid() const;

    /**
     * @brief Execute the validation query ("SELECT 1").
     * @return true if the server responds successfully.
     */
    bool ping();

    /**
     * @brief Execute one statement with positional ($1, $2, ...) parameters.
     * @param fetchSize When > 0, rows are streamed in single-row mode.
     * @param maxRows When > 0, rows past this limit are discarded and the
     *        result is marked truncated.
     */
    StatementResult run(const std::string& sql, const std::vector<SqlValue>& params,
                        size_t fetchSize = 0, size_t maxRows = 0);

    /**
     * @brief Prepare once, execute once per parameter set.
     *
     * Stops at the first failing set; earlier sets stay applied.
     */
    BatchResult runBatch(const std::string& sql, const std::vector<std::vector<SqlValue>>& paramSets);

    /// false opens a transaction (BEGIN), true rolls back any open one
    void setAutoCommit(bool enabled);
    void commit();
    void rollback();

    /// Close the physical connection on release instead of pooling it
    void markBroken() { m_broken = true; }

    /**
     * @brief Get the last error message.
     */
    const char* error() const;

private:
    friend class PostgreSQLConnectionPool;

    // Text (or binary for Bytes) parameter arrays for PQexecParams/PQexecPrepared
    struct BoundParams {
        std::vector<std::string> storage;
        std::vector<const char*> values;
        std::vector<int> lengths;
        std::vector<int> formats;
    };
    static BoundParams bindParams(const std::vector<SqlValue>& params);

    void ensureUsable() const;
    // Supplied parameters must match the highest $n placeholder
    void checkParameterCount(const std::string& sql, size_t supplied) const;
    void exec(const char* sql);
    StatementResult streamRows(const std::string& sql, const BoundParams& bound, size_t fetchSize,
                               size_t maxRows);
    [[noreturn]] void fail(const std::string& what, const std::string& sqlstate);

    /**
     * @brief Return the connection to the pool.
     */
    void release();

    PostgreSQLConnectionPool* m_pool;                    ///< Owning connection pool
    PGconn* m_conn;                                      ///< PostgreSQL connection handle
    std::chrono::steady_clock::time_point m_createdAt;   ///< Physical connection age
    bool m_released = false;                             ///< Whether connection has been returned
    bool m_broken = false;                               ///< Do not reuse after release
};

}  // namespace sqlbridge
