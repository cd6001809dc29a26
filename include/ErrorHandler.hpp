#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sqlbridge {

// Failure categories reported to callers of the core
enum class ErrorKind {
    ConnectionAlreadyExists,
    ConnectionNotFound,
    ConnectionFailure,
    ValidationError,
    QueryExecutionError,
    TransactionFailure,
    TimeoutError
};

const char* errorKindName(ErrorKind kind);

// Base exception for every failure raised by the core.
// backendCode holds the MySQL errno, PostgreSQL SQLSTATE or SQLite result code when known.
// retryable marks transient failures (lost server, deadlock, lock wait, busy database)
// where running the same operation again can succeed.
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(ErrorKind kind, const std::string& message, std::string backendCode = {},
                  bool retryable = false);

    ErrorKind kind() const { return m_kind; }
    const std::string& backendCode() const { return m_backendCode; }
    bool retryable() const { return m_retryable; }

private:
    ErrorKind m_kind;
    std::string m_backendCode;
    bool m_retryable;
};

// Raised after a transaction was rolled back.
// failedIndex is the statement that failed, or the statement count when COMMIT failed.
class TransactionError : public DatabaseError {
public:
    TransactionError(size_t failedIndex, ErrorKind cause, const std::string& message,
                     std::string backendCode = {}, bool retryable = false);

    size_t failedIndex() const { return m_failedIndex; }
    ErrorKind cause() const { return m_cause; }

private:
    size_t m_failedIndex;
    ErrorKind m_cause;
};

// Backend error code -> ErrorKind mapping tables
class ErrorHandler {
public:
#ifdef WITH_MYSQL
    // Classify a MySQL client (CR_*) or server (ER_*) error number
    static ErrorKind classifyMySQL(unsigned int mysqlError);
    static bool isRetryableMySQL(unsigned int mysqlError);
#endif

#ifdef WITH_POSTGRESQL
    // Classify a five-character SQLSTATE; an empty state means the connection itself failed
    static ErrorKind classifyPostgreSQL(const std::string& sqlstate);
    static bool isRetryablePostgreSQL(const std::string& sqlstate);
#endif

#ifdef WITH_SQLITE
    // Classify a primary or extended SQLite result code
    static ErrorKind classifySQLite(int resultCode);
    static bool isRetryableSQLite(int resultCode);
#endif

    // Strip credentials from a diagnostic: password=... fragments, URI user info,
    // and the literal secret when one is given
    static std::string redact(const std::string& message, const std::string& secret = {});
};

}  // namespace sqlbridge
