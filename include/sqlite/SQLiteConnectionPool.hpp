#pragma once

/**
 * @file SQLiteConnectionPool.hpp
 * @brief Connection pool for SQLite database handles.
 *
 * SQLite has no server; each "connection" is an open handle on the same
 * database file. Pooling bounds the number of open handles and gives
 * the engine the same acquire/release contract as the server backends.
 */

#include "ConnectionInfo.hpp"
#include "SQLiteConnection.hpp"
#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace sqlbridge {

/**
 * @class SQLiteConnectionPool
 * @brief Bounded pool of SQLite handles on one database file.
 *
 * Handles are opened with sqlite3_open_v2() (read-only when the connection
 * is read-only, URI filenames enabled), a busy timeout equal to the connect
 * timeout, and foreign key enforcement switched on.
 *
 * SQLite Concurrency Notes:
 * - Multiple connections can read simultaneously
 * - Only one connection can write at a time (database-level locking)
 * - A writer blocked past the busy timeout fails with SQLITE_BUSY,
 *   reported as TimeoutError
 */
class SQLiteConnectionPool {
public:
    /**
     * @param info Connection parameters; info.database is the file path.
     */
    explicit SQLiteConnectionPool(const ConnectionInfo& info);
    ~SQLiteConnectionPool();

    SQLiteConnectionPool(const SQLiteConnectionPool&) = delete;
    SQLiteConnectionPool& operator=(const SQLiteConnectionPool&) = delete;

    /**
     * @brief Acquire a handle from the pool.
     * @throws DatabaseError TimeoutError or ConnectionFailure.
     */
    std::unique_ptr<SQLiteConnection> acquire(std::chrono::milliseconds timeout);

    size_t availableCount() const;
    size_t totalCount() const;
    size_t waitingCount() const;
    size_t maxSize() const { return m_info.poolSize; }

    /**
     * @brief Close idle handles and refuse further acquires.
     */
    void drain();

    const ConnectionInfo& info() const { return m_info; }

private:
    friend class SQLiteConnection;

    struct IdleConnection {
        sqlite3* db;
        std::chrono::steady_clock::time_point createdAt;
        std::chrono::steady_clock::time_point lastUsed;
    };

    sqlite3* createConnection();
    void releaseConnection(sqlite3* db, std::chrono::steady_clock::time_point createdAt, bool reusable);
    void destroyConnection(sqlite3* db);
    bool validateConnection(sqlite3* db);
    bool isExpired(const IdleConnection& idle, std::chrono::steady_clock::time_point now) const;

    ConnectionInfo m_info;

    std::deque<IdleConnection> m_available;  ///< Idle handles
    std::atomic<size_t> m_createdCount{0};   ///< Open handles (idle + in use)
    std::atomic<size_t> m_waitingCount{0};

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_shutdown{false};
};

}  // namespace sqlbridge
