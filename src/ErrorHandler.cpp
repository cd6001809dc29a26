#include "ErrorHandler.hpp"
#include <regex>

#ifdef WITH_MYSQL
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#endif

#ifdef WITH_SQLITE
#include <sqlite3.h>
#endif

namespace sqlbridge {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionAlreadyExists: return "ConnectionAlreadyExists";
        case ErrorKind::ConnectionNotFound:      return "ConnectionNotFound";
        case ErrorKind::ConnectionFailure:       return "ConnectionFailure";
        case ErrorKind::ValidationError:         return "ValidationError";
        case ErrorKind::QueryExecutionError:     return "QueryExecutionError";
        case ErrorKind::TransactionFailure:      return "TransactionFailure";
        case ErrorKind::TimeoutError:            return "TimeoutError";
    }
    return "Unknown";
}

DatabaseError::DatabaseError(ErrorKind kind, const std::string& message, std::string backendCode,
                             bool retryable)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_backendCode(std::move(backendCode))
    , m_retryable(retryable) {
}

TransactionError::TransactionError(size_t failedIndex, ErrorKind cause, const std::string& message,
                                   std::string backendCode, bool retryable)
    : DatabaseError(ErrorKind::TransactionFailure, message, std::move(backendCode), retryable)
    , m_failedIndex(failedIndex)
    , m_cause(cause) {
}

// ============================================================================
// MySQL
// ============================================================================

#ifdef WITH_MYSQL

ErrorKind ErrorHandler::classifyMySQL(unsigned int mysql_error) {
    switch (mysql_error) {
        // Client-side connection errors
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_UNKNOWN_HOST:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case CR_COMMANDS_OUT_OF_SYNC:
        case CR_SOCKET_CREATE_ERROR:
        case CR_IPSOCK_ERROR:
        case CR_SSL_CONNECTION_ERROR:
            return ErrorKind::ConnectionFailure;

        // Server refused the session
        case ER_ACCESS_DENIED_ERROR:
        case ER_DBACCESS_DENIED_ERROR:
        case ER_BAD_DB_ERROR:
        case ER_CON_COUNT_ERROR:
        case ER_TOO_MANY_USER_CONNECTIONS:
        case ER_HOST_IS_BLOCKED:
        case ER_HOST_NOT_PRIVILEGED:
        case ER_SERVER_SHUTDOWN:
            return ErrorKind::ConnectionFailure;

        // Lock waits and statement time limits
        case ER_LOCK_WAIT_TIMEOUT:
        case 3024:  // ER_QUERY_TIMEOUT (max_execution_time exceeded)
        case 1969:  // MariaDB ER_STATEMENT_TIMEOUT
            return ErrorKind::TimeoutError;

        default:
            return ErrorKind::QueryExecutionError;
    }
}

bool ErrorHandler::isRetryableMySQL(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case ER_LOCK_WAIT_TIMEOUT:
        case ER_LOCK_DEADLOCK:
        case ER_TOO_MANY_CONCURRENT_TRXS:
            return true;
        default:
            return false;
    }
}

#endif  // WITH_MYSQL

// ============================================================================
// PostgreSQL
// ============================================================================

#ifdef WITH_POSTGRESQL

ErrorKind ErrorHandler::classifyPostgreSQL(const std::string& sqlstate) {
    // No SQLSTATE: libpq failed before the server answered
    if (sqlstate.empty()) {
        return ErrorKind::ConnectionFailure;
    }

    // Class 08: connection exception
    if (sqlstate.compare(0, 2, "08") == 0) {
        return ErrorKind::ConnectionFailure;
    }

    if (sqlstate == "57014"      // query_canceled (statement_timeout)
        || sqlstate == "55P03"   // lock_not_available (lock_timeout)
        || sqlstate == "25P03") { // idle_in_transaction_session_timeout
        return ErrorKind::TimeoutError;
    }

    if (sqlstate == "57P01"      // admin_shutdown
        || sqlstate == "57P02"   // crash_shutdown
        || sqlstate == "57P03"   // cannot_connect_now
        || sqlstate == "53300"   // too_many_connections
        || sqlstate == "28000"   // invalid_authorization_specification
        || sqlstate == "28P01"   // invalid_password
        || sqlstate == "3D000") { // invalid_catalog_name
        return ErrorKind::ConnectionFailure;
    }

    return ErrorKind::QueryExecutionError;
}

bool ErrorHandler::isRetryablePostgreSQL(const std::string& sqlstate) {
    return sqlstate == "40001"      // serialization_failure
        || sqlstate == "40P01"      // deadlock_detected
        || sqlstate == "55P03"
        || sqlstate == "57P01"
        || sqlstate.compare(0, 2, "08") == 0;
}

#endif  // WITH_POSTGRESQL

// ============================================================================
// SQLite
// ============================================================================

#ifdef WITH_SQLITE

ErrorKind ErrorHandler::classifySQLite(int result_code) {
    // Extended codes carry the primary code in the low byte
    switch (result_code & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_INTERRUPT:
            return ErrorKind::TimeoutError;

        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
        case SQLITE_AUTH:
            return ErrorKind::ConnectionFailure;

        default:
            return ErrorKind::QueryExecutionError;
    }
}

bool ErrorHandler::isRetryableSQLite(int result_code) {
    int primary = result_code & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

#endif  // WITH_SQLITE

// ============================================================================
// Credential redaction
// ============================================================================

std::string ErrorHandler::redact(const std::string& message, const std::string& secret) {
    static const std::regex keyValue(
        R"((password|passwd|pwd)(\s*[=:]\s*)('[^']*'|"[^"]*"|[^\s;,]+))",
        std::regex::icase);
    static const std::regex uriUserInfo(R"(://([^:/@\s]+):([^@\s]+)@)");

    std::string result = std::regex_replace(message, keyValue, "$1$2****");
    result = std::regex_replace(result, uriUserInfo, "://$1:****@");

    if (!secret.empty()) {
        size_t pos = 0;
        while ((pos = result.find(secret, pos)) != std::string::npos) {
            result.replace(pos, secret.size(), "****");
            pos += 4;
        }
    }

    return result;
}

}  // namespace sqlbridge
