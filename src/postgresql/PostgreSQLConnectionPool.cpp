/**
 * @file PostgreSQLConnectionPool.cpp
 * @brief Implementation of thread-safe PostgreSQL connection pool.
 *
 * Uses libpq keyword/value connection strings for configuration and
 * supports SSL connections.
 */

#include "PostgreSQLConnectionPool.hpp"
#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace sqlbridge {

namespace {

// Conninfo values are single-quoted with \ and ' escaped
std::string quoted(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

PostgreSQLConnectionPool::PostgreSQLConnectionPool(const ConnectionInfo& info)
    : m_info(info) {

    // Pre-create one connection to reduce first-query latency
    try {
        PGconn* conn = createConnection();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_createdCount++;
        auto now = std::chrono::steady_clock::now();
        m_available.push_back({conn, now, now});
    } catch (const DatabaseError& e) {
        spdlog::warn("Failed to pre-create PostgreSQL connection for '{}': {}", m_info.id, e.what());
    }

    spdlog::info("PostgreSQL connection pool '{}' initialized ({}, size {})",
                 m_info.id, m_info.describe(), m_info.poolSize);
}

PostgreSQLConnectionPool::~PostgreSQLConnectionPool() {
    drain();
}

// ============================================================================
// Connection Creation and Validation
// ============================================================================

PGconn* PostgreSQLConnectionPool::createConnection() {
    std::ostringstream connInfo;

    connInfo << "host=" << quoted(m_info.host);
    connInfo << " port=" << m_info.port;

    if (!m_info.user.empty()) {
        connInfo << " user=" << quoted(m_info.user);
    }

    if (!m_info.password.empty()) {
        connInfo << " password=" << quoted(m_info.password);
    }

    if (!m_info.database.empty()) {
        connInfo << " dbname=" << quoted(m_info.database);
    }

    connInfo << " connect_timeout=" << m_info.connectTimeout.count();

    // SSL options
    if (m_info.useSsl) {
        connInfo << " sslmode=require";
        if (!m_info.sslCa.empty()) {
            connInfo << " sslrootcert=" << quoted(m_info.sslCa);
        }
        if (!m_info.sslCert.empty()) {
            connInfo << " sslcert=" << quoted(m_info.sslCert);
        }
        if (!m_info.sslKey.empty()) {
            connInfo << " sslkey=" << quoted(m_info.sslKey);
        }
    } else {
        connInfo << " sslmode=prefer";
    }

    // Session settings
    std::string options;
    if (m_info.statementTimeout.count() > 0) {
        options += "-c statement_timeout=" +
                   std::to_string(m_info.statementTimeout.count() * 1000);
    }
    if (m_info.readOnly) {
        if (!options.empty()) options += ' ';
        options += "-c default_transaction_read_only=on";
    }
    if (!options.empty()) {
        connInfo << " options=" << quoted(options);
    }

    // Application name for identification
    connInfo << " application_name=sql-bridge";

    PGconn* conn = PQconnectdb(connInfo.str().c_str());

    if (!conn) {
        throw DatabaseError(ErrorKind::ConnectionFailure, "Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string errorMsg = PQerrorMessage(conn);
        PQfinish(conn);
        while (!errorMsg.empty() && errorMsg.back() == '\n') errorMsg.pop_back();
        throw DatabaseError(ErrorKind::ConnectionFailure,
                            "Failed to connect to PostgreSQL: " +
                            ErrorHandler::redact(errorMsg, m_info.password));
    }

    // Set client encoding to UTF-8
    PQsetClientEncoding(conn, "UTF8");

    spdlog::debug("Created new PostgreSQL connection for '{}'", m_info.id);

    return conn;
}

bool PostgreSQLConnectionPool::validateConnection(PGconn* conn) {
    if (!conn) return false;

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::debug("PostgreSQL connection validation failed: bad status");
        return false;
    }

    PostgreSQLResultSet res(PQexec(conn, "SELECT 1"));
    bool ok = res.status() == PGRES_TUPLES_OK;

    if (!ok) {
        spdlog::debug("PostgreSQL connection validation failed: ping query failed");
    }

    return ok;
}

bool PostgreSQLConnectionPool::isExpired(const IdleConnection& idle,
                                         std::chrono::steady_clock::time_point now) const {
    if (m_info.maxIdle.count() > 0 && now - idle.lastUsed > m_info.maxIdle) {
        return true;
    }
    return m_info.maxLifetime.count() > 0 && now - idle.createdAt > m_info.maxLifetime;
}

// ============================================================================
// Connection Acquisition
// ============================================================================

std::unique_ptr<PostgreSQLConnection> PostgreSQLConnectionPool::acquire(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (m_shutdown) {
            throw DatabaseError(ErrorKind::ConnectionFailure,
                                "PostgreSQL connection pool '" + m_info.id + "' is shut down");
        }

        // Reuse an idle connection, discarding stale ones
        auto now = std::chrono::steady_clock::now();
        while (!m_available.empty()) {
            IdleConnection idle = m_available.front();
            m_available.pop_front();
            if (isExpired(idle, now) || !validateConnection(idle.conn)) {
                destroyConnection(idle.conn);
                continue;
            }
            return std::make_unique<PostgreSQLConnection>(this, idle.conn, idle.createdAt);
        }

        // Create a new connection if under limit
        if (m_createdCount < m_info.poolSize) {
            m_createdCount++;
            lock.unlock();
            try {
                PGconn* conn = createConnection();
                return std::make_unique<PostgreSQLConnection>(this, conn, std::chrono::steady_clock::now());
            } catch (const DatabaseError&) {
                lock.lock();
                m_createdCount--;
                m_cv.notify_one();
                throw;
            }
        }

        // Wait for a connection to be released
        m_waitingCount++;
        auto status = m_cv.wait_until(lock, deadline);
        m_waitingCount--;
        if (status == std::cv_status::timeout && m_available.empty() &&
            m_createdCount >= m_info.poolSize) {
            throw DatabaseError(ErrorKind::TimeoutError,
                                "Timeout waiting for PostgreSQL connection '" + m_info.id + "'");
        }
    }
}

// ============================================================================
// Connection Release
// ============================================================================

void PostgreSQLConnectionPool::releaseConnection(PGconn* conn,
                                                 std::chrono::steady_clock::time_point createdAt,
                                                 bool reusable) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(m_mutex);

    // A connection left inside a transaction is never reused
    if (m_shutdown || !reusable || PQstatus(conn) != CONNECTION_OK ||
        PQtransactionStatus(conn) != PQTRANS_IDLE) {
        destroyConnection(conn);
        m_cv.notify_one();
        return;
    }

    m_available.push_back({conn, createdAt, std::chrono::steady_clock::now()});
    m_cv.notify_one();
}

void PostgreSQLConnectionPool::destroyConnection(PGconn* conn) {
    if (conn) {
        PQfinish(conn);
        m_createdCount--;
        spdlog::debug("Destroyed PostgreSQL connection for '{}' (remaining: {})",
                      m_info.id, m_createdCount.load());
    }
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

size_t PostgreSQLConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t PostgreSQLConnectionPool::totalCount() const {
    return m_createdCount.load();
}

size_t PostgreSQLConnectionPool::waitingCount() const {
    return m_waitingCount.load();
}

void PostgreSQLConnectionPool::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown.exchange(true)) {
        return;
    }

    while (!m_available.empty()) {
        destroyConnection(m_available.front().conn);
        m_available.pop_front();
    }

    m_cv.notify_all();
    spdlog::info("PostgreSQL connection pool '{}' drained", m_info.id);
}

}  // namespace sqlbridge
