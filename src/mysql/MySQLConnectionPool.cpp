#include "MySQLConnectionPool.hpp"
#include "MySQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

MySQLConnectionPool::MySQLConnectionPool(const ConnectionInfo& info)
    : m_info(info) {

    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        if (mysql_library_init(0, nullptr, nullptr) != 0) {
            spdlog::error("mysql_library_init failed");
        }
    });

    // Pre-create one connection
    try {
        MYSQL* conn = createConnection();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_createdCount++;
        auto now = std::chrono::steady_clock::now();
        m_available.push_back({conn, now, now});
    } catch (const DatabaseError& e) {
        spdlog::warn("Failed to pre-create MySQL connection for '{}': {}", m_info.id, e.what());
    }

    spdlog::info("MySQL connection pool '{}' initialized ({}, size {})",
                 m_info.id, m_info.describe(), m_info.poolSize);
}

MySQLConnectionPool::~MySQLConnectionPool() {
    drain();
}

MYSQL* MySQLConnectionPool::createConnection() {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        throw DatabaseError(ErrorKind::ConnectionFailure, "Failed to initialize MySQL connection");
    }

    // Set options
    unsigned int timeout = static_cast<unsigned int>(m_info.connectTimeout.count());
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    if (m_info.statementTimeout.count() > 0) {
        unsigned int ioTimeout = static_cast<unsigned int>(m_info.statementTimeout.count());
        mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &ioTimeout);
        mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &ioTimeout);
    }

    // SSL options
    if (m_info.useSsl) {
        if (!m_info.sslKey.empty()) mysql_options(conn, MYSQL_OPT_SSL_KEY, m_info.sslKey.c_str());
        if (!m_info.sslCert.empty()) mysql_options(conn, MYSQL_OPT_SSL_CERT, m_info.sslCert.c_str());
        if (!m_info.sslCa.empty()) mysql_options(conn, MYSQL_OPT_SSL_CA, m_info.sslCa.c_str());
    }

    const char* db = m_info.database.empty() ? nullptr : m_info.database.c_str();

    if (!mysql_real_connect(conn,
                            m_info.host.c_str(),
                            m_info.user.c_str(),
                            m_info.password.c_str(),
                            db,
                            m_info.port,
                            nullptr,
                            0)) {
        unsigned int err = mysql_errno(conn);
        std::string msg = mysql_error(conn);
        mysql_close(conn);
        throw DatabaseError(ErrorKind::ConnectionFailure,
                            "Failed to connect to MySQL: " + ErrorHandler::redact(msg, m_info.password),
                            std::to_string(err), ErrorHandler::isRetryableMySQL(err));
    }

    // Set character set to UTF-8
    if (mysql_set_character_set(conn, "utf8mb4") != 0) {
        spdlog::warn("MySQL '{}': could not set utf8mb4: {}", m_info.id, mysql_error(conn));
    }

    // Session settings
    if (m_info.statementTimeout.count() > 0) {
        std::string sql = "SET SESSION max_execution_time = " +
                          std::to_string(m_info.statementTimeout.count() * 1000);
        if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
            spdlog::warn("MySQL '{}': could not set statement timeout: {}", m_info.id, mysql_error(conn));
        }
    }
    if (m_info.readOnly) {
        const std::string sql = "SET SESSION TRANSACTION READ ONLY";
        if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
            unsigned int err = mysql_errno(conn);
            std::string msg = mysql_error(conn);
            mysql_close(conn);
            throw DatabaseError(ErrorKind::ConnectionFailure,
                                "Failed to make MySQL session read-only: " + msg, std::to_string(err));
        }
    }

    spdlog::debug("Created new MySQL connection for '{}'", m_info.id);

    return conn;
}

bool MySQLConnectionPool::validateConnection(MYSQL* conn) {
    if (!conn) return false;

    if (mysql_real_query(conn, "SELECT 1", 8) != 0) {
        spdlog::debug("Connection validation failed: {}", mysql_error(conn));
        return false;
    }
    MySQLResultSet result(mysql_store_result(conn));
    return result && result.fetchRow() != nullptr;
}

bool MySQLConnectionPool::isExpired(const IdleConnection& idle,
                                    std::chrono::steady_clock::time_point now) const {
    if (m_info.maxIdle.count() > 0 && now - idle.lastUsed > m_info.maxIdle) {
        return true;
    }
    return m_info.maxLifetime.count() > 0 && now - idle.createdAt > m_info.maxLifetime;
}

std::unique_ptr<MySQLConnection> MySQLConnectionPool::acquire(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (m_shutdown) {
            throw DatabaseError(ErrorKind::ConnectionFailure,
                                "MySQL connection pool '" + m_info.id + "' is shut down");
        }

        auto now = std::chrono::steady_clock::now();
        while (!m_available.empty()) {
            IdleConnection idle = m_available.front();
            m_available.pop_front();
            if (isExpired(idle, now) || !validateConnection(idle.conn)) {
                destroyConnection(idle.conn);
                continue;
            }
            return std::make_unique<MySQLConnection>(this, idle.conn, idle.createdAt);
        }

        // Try to create a new connection if under limit
        if (m_createdCount < m_info.poolSize) {
            m_createdCount++;
            lock.unlock();
            try {
                MYSQL* conn = createConnection();
                return std::make_unique<MySQLConnection>(this, conn, std::chrono::steady_clock::now());
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
                                "Timeout waiting for MySQL connection '" + m_info.id + "'");
        }
    }
}

void MySQLConnectionPool::releaseConnection(MYSQL* conn,
                                            std::chrono::steady_clock::time_point createdAt,
                                            bool reusable) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown || !reusable) {
        destroyConnection(conn);
        m_cv.notify_one();
        return;
    }

    m_available.push_back({conn, createdAt, std::chrono::steady_clock::now()});
    m_cv.notify_one();
}

void MySQLConnectionPool::destroyConnection(MYSQL* conn) {
    if (conn) {
        mysql_close(conn);
        m_createdCount--;
        spdlog::debug("Destroyed MySQL connection for '{}' (remaining: {})", m_info.id, m_createdCount.load());
    }
}

size_t MySQLConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t MySQLConnectionPool::totalCount() const {
    return m_createdCount.load();
}

size_t MySQLConnectionPool::waitingCount() const {
    return m_waitingCount.load();
}

void MySQLConnectionPool::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown.exchange(true)) {
        return;
    }

    while (!m_available.empty()) {
        destroyConnection(m_available.front().conn);
        m_available.pop_front();
    }

    m_cv.notify_all();
    spdlog::info("MySQL connection pool '{}' drained", m_info.id);
}

}  // namespace sqlbridge
