#pragma once

/**
 * @file MySQLConnectionPool.hpp
 * @brief Thread-safe connection pool for MySQL database connections.
 */

#include "ConnectionInfo.hpp"
#include "MySQLConnection.hpp"
#include <mysql/mysql.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace sqlbridge {

/**
 * @class MySQLConnectionPool
 * @brief Thread-safe pool of MySQL database connections.
 *
 * Connection Management:
 * - mysql_real_connect() without CLIENT_MULTI_STATEMENTS, utf8mb4 character set
 * - MYSQL_OPT_CONNECT_TIMEOUT from the connect timeout; read/write timeouts
 *   and max_execution_time from the statement timeout
 * - Read-only connections run SET SESSION TRANSACTION READ ONLY
 * - "SELECT 1" validates a connection before it is handed out
 *
 * Pool Behavior:
 * - acquire() blocks until a connection is available or the timeout expires,
 *   then throws DatabaseError(TimeoutError)
 * - Connections idle longer than maxIdle or older than maxLifetime are closed
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - mysql_library_init() runs once per process
 */
class MySQLConnectionPool {
public:
    explicit MySQLConnectionPool(const ConnectionInfo& info);
    ~MySQLConnectionPool();

    MySQLConnectionPool(const MySQLConnectionPool&) = delete;
    MySQLConnectionPool& operator=(const MySQLConnectionPool&) = delete;

    /**
     * @brief Acquire a connection from the pool.
     * @throws DatabaseError TimeoutError or ConnectionFailure.
     */
    std::unique_ptr<MySQLConnection> acquire(std::chrono::milliseconds timeout);

    size_t availableCount() const;
    size_t totalCount() const;
    size_t waitingCount() const;
    size_t maxSize() const { return m_info.poolSize; }

    void drain();

    const ConnectionInfo& info() const { return m_info; }

private:
    friend class MySQLConnection;

    struct IdleConnection {
        MYSQL* conn;
        std::chrono::steady_clock::time_point createdAt;
        std::chrono::steady_clock::time_point lastUsed;
    };

    MYSQL* createConnection();
    void releaseConnection(MYSQL* conn, std::chrono::steady_clock::time_point createdAt, bool reusable);
    void destroyConnection(MYSQL* conn);
    bool validateConnection(MYSQL* conn);
    bool isExpired(const IdleConnection& idle, std::chrono::steady_clock::time_point now) const;

    ConnectionInfo m_info;                  ///< Connection parameters

    std::deque<IdleConnection> m_available;  ///< Idle connections ready for use
    std::atomic<size_t> m_createdCount{0};   ///< Open connections (idle + in use)
    std::atomic<size_t> m_waitingCount{0};   ///< Threads waiting for connections

    mutable std::mutex m_mutex;              ///< Protects m_available
    std::condition_variable m_cv;            ///< Signals when connections available
    std::atomic<bool> m_shutdown{false};     ///< Shutdown flag
};

}  // namespace sqlbridge
