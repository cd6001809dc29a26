#pragma once

/**
 * @file PostgreSQLConnectionPool.hpp
 * @brief Thread-safe connection pool for PostgreSQL database connections.
 *
 * Manages PGconn* handles for reuse across operations: lazy creation up to
 * the configured size, validation on every borrow, and replacement of
 * connections past their idle or lifetime limit.
 */

#include "ConnectionInfo.hpp"
#include "PostgreSQLConnection.hpp"
#include <libpq-fe.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace sqlbridge {

/**
 * @class PostgreSQLConnectionPool
 * @brief Thread-safe pool of PostgreSQL database connections.
 *
 * Connection Management:
 * - PQconnectdb() with a keyword/value conninfo string built from ConnectionInfo
 * - connect_timeout, statement_timeout and default_transaction_read_only are
 *   passed in the conninfo so they apply to every session
 * - "SELECT 1" validates a connection before it is handed out
 *
 * Pool Behavior:
 * - acquire() blocks until a connection is available or the timeout expires,
 *   then throws DatabaseError(TimeoutError)
 * - Connections idle longer than maxIdle or older than maxLifetime are closed
 *   instead of reused
 * - After drain() every acquire fails and in-use connections are closed as
 *   they come back
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class PostgreSQLConnectionPool {
public:
    /**
     * @brief Create a new PostgreSQL connection pool.
     * @param info Connection parameters; info.poolSize bounds the pool.
     *
     * Pre-creates one connection; a failure there is logged, not thrown,
     * so the caller's health check reports it.
     */
    explicit PostgreSQLConnectionPool(const ConnectionInfo& info);

    /**
     * @brief Destructor - closes all connections.
     */
    ~PostgreSQLConnectionPool();

    PostgreSQLConnectionPool(const PostgreSQLConnectionPool&) = delete;
    PostgreSQLConnectionPool& operator=(const PostgreSQLConnectionPool&) = delete;

    /**
     * @brief Acquire a connection from the pool.
     * @throws DatabaseError TimeoutError when none frees up in time,
     *         ConnectionFailure when a new connection cannot be opened.
     */
    std::unique_ptr<PostgreSQLConnection> acquire(std::chrono::milliseconds timeout);

    size_t availableCount() const;
    size_t totalCount() const;
    size_t waitingCount() const;
    size_t maxSize() const { return m_info.poolSize; }

    /**
     * @brief Close all idle connections and refuse further acquires.
     */
    void drain();

    const ConnectionInfo& info() const { return m_info; }

private:
    friend class PostgreSQLConnection;

    struct IdleConnection {
        PGconn* conn;
        std::chrono::steady_clock::time_point createdAt;
        std::chrono::steady_clock::time_point lastUsed;
    };

    /**
     * @brief Open a new physical connection. Does not touch the counters.
     * @throws DatabaseError ConnectionFailure.
     */
    PGconn* createConnection();

    /**
     * @brief Return a connection to the pool, or close it when not reusable.
     */
    void releaseConnection(PGconn* conn, std::chrono::steady_clock::time_point createdAt, bool reusable);

    /**
     * @brief PQfinish() and decrement the created count. Caller holds m_mutex.
     */
    void destroyConnection(PGconn* conn);

    bool validateConnection(PGconn* conn);
    bool isExpired(const IdleConnection& idle, std::chrono::steady_clock::time_point now) const;

    ConnectionInfo m_info;                 ///< Connection parameters

    std::deque<IdleConnection> m_available; ///< Idle connections ready for use
    std::atomic<size_t> m_createdCount{0};  ///< Open connections (idle + in use)
    std::atomic<size_t> m_waitingCount{0};  ///< Threads waiting for connections

    mutable std::mutex m_mutex;             ///< Protects m_available
    std::condition_variable m_cv;           ///< Signals when connections available
    std::atomic<bool> m_shutdown{false};    ///< Shutdown flag
};

}  // namespace sqlbridge
