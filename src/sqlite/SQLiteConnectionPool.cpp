/**
 * @file SQLiteConnectionPool.cpp
 * @brief Implementation of SQLite connection pool.
 */

#include "SQLiteConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnectionPool::SQLiteConnectionPool(const ConnectionInfo& info)
    : m_info(info) {
    try {
        sqlite3* db = createConnection();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_createdCount++;
        auto now = std::chrono::steady_clock::now();
        m_available.push_back({db, now, now});
    } catch (const DatabaseError& e) {
        spdlog::warn("Failed to pre-create SQLite connection for '{}': {}", m_info.id, e.what());
    }
    spdlog::info("SQLite connection pool '{}' initialized ({}, size {})",
                 m_info.id, m_info.describe(), m_info.poolSize);
}

SQLiteConnectionPool::~SQLiteConnectionPool() {
    drain();
}

// ============================================================================
// Connection Creation and Validation
// ============================================================================

sqlite3* SQLiteConnectionPool::createConnection() {
    int flags = SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX;
    flags |= m_info.readOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(m_info.database.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close(db);
        }
        throw DatabaseError(ErrorKind::ConnectionFailure,
                            "Failed to open SQLite database '" + m_info.database + "': " + message,
                            std::to_string(rc));
    }

    sqlite3_busy_timeout(db, static_cast<int>(m_info.connectTimeout.count() * 1000));

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        spdlog::warn("SQLite '{}': could not enable foreign keys: {}", m_info.id,
                     errMsg ? errMsg : sqlite3_errstr(rc));
    }
    if (errMsg) {
        sqlite3_free(errMsg);
    }

    spdlog::debug("Opened SQLite connection for '{}'", m_info.id);
    return db;
}

bool SQLiteConnectionPool::validateConnection(sqlite3* db) {
    if (!db) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT 1", -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::debug("SQLite connection validation failed: {}", sqlite3_errmsg(db));
        return false;
    }
    SQLiteResultSet result(stmt);
    return result.step() == SQLITE_ROW;
}

bool SQLiteConnectionPool::isExpired(const IdleConnection& idle,
                                     std::chrono::steady_clock::time_point now) const {
    if (m_info.maxIdle.count() > 0 && now - idle.lastUsed > m_info.maxIdle) {
        return true;
    }
    return m_info.maxLifetime.count() > 0 && now - idle.createdAt > m_info.maxLifetime;
}

// ============================================================================
// Connection Acquisition and Release
// ============================================================================

std::unique_ptr<SQLiteConnection> SQLiteConnectionPool::acquire(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (m_shutdown) {
            throw DatabaseError(ErrorKind::ConnectionFailure,
                                "SQLite connection pool '" + m_info.id + "' is shut down");
        }

        auto now = std::chrono::steady_clock::now();
        while (!m_available.empty()) {
            IdleConnection idle = m_available.front();
            m_available.pop_front();
            if (isExpired(idle, now) || !validateConnection(idle.db)) {
                destroyConnection(idle.db);
                continue;
            }
            return std::make_unique<SQLiteConnection>(this, idle.db, idle.createdAt);
        }

        // Open a new handle if under limit
        if (m_createdCount < m_info.poolSize) {
            m_createdCount++;
            lock.unlock();
            try {
                sqlite3* db = createConnection();
                return std::make_unique<SQLiteConnection>(this, db, std::chrono::steady_clock::now());
            } catch (const DatabaseError&) {
                lock.lock();
                m_createdCount--;
                m_cv.notify_one();
                throw;
            }
        }

        m_waitingCount++;
        auto status = m_cv.wait_until(lock, deadline);
        m_waitingCount--;
        if (status == std::cv_status::timeout && m_available.empty() &&
            m_createdCount >= m_info.poolSize) {
            throw DatabaseError(ErrorKind::TimeoutError,
                                "Timeout waiting for SQLite connection '" + m_info.id + "'");
        }
    }
}

void SQLiteConnectionPool::releaseConnection(sqlite3* db,
                                             std::chrono::steady_clock::time_point createdAt,
                                             bool reusable) {
    if (!db) return;

    std::lock_guard<std::mutex> lock(m_mutex);

    // A handle still inside a transaction is never reused
    if (m_shutdown || !reusable || !sqlite3_get_autocommit(db)) {
        destroyConnection(db);
        m_cv.notify_one();
        return;
    }

    m_available.push_back({db, createdAt, std::chrono::steady_clock::now()});
    m_cv.notify_one();
}

void SQLiteConnectionPool::destroyConnection(sqlite3* db) {
    if (db) {
        // Statements are finalized by their owners before release
        sqlite3_close_v2(db);
        m_createdCount--;
        spdlog::debug("Closed SQLite connection for '{}' (remaining: {})", m_info.id, m_createdCount.load());
    }
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

void SQLiteConnectionPool::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown.exchange(true)) {
        return;
    }

    while (!m_available.empty()) {
        destroyConnection(m_available.front().db);
        m_available.pop_front();
    }

    m_cv.notify_all();
    spdlog::info("SQLite connection pool '{}' drained", m_info.id);
}

size_t SQLiteConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t SQLiteConnectionPool::totalCount() const {
    return m_createdCount.load();
}

size_t SQLiteConnectionPool::waitingCount() const {
    return m_waitingCount.load();
}

}  // namespace sqlbridge
