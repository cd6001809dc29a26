#include "PostgreSQLConnection.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include "SqlSafetyPolicy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace sqlbridge {

namespace {

std::string trimmed(const char* message) {
    std::string text = message ? message : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

// Highest $n placeholder outside literals, comments and dollar-quoted bodies
size_t placeholderCount(const std::string& sql) {
    size_t count = 0;
    for (const auto& token : tokenizeSql(sql, DatabaseType::PostgreSQL).tokens) {
        const std::string& word = token.word;
        if (word.size() < 2 || word[0] != '$' ||
            !std::all_of(word.begin() + 1, word.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            continue;
        }
        // The protocol caps parameters at 65535; longer numbers cannot match anyway
        size_t n = word.size() > 6 ? 1000000 : static_cast<size_t>(std::stoul(word.substr(1)));
        count = std::max(count, n);
    }
    return count;
}

}  // namespace

PostgreSQLConnection::PostgreSQLConnection(PostgreSQLConnectionPool* pool, PGconn* conn,
                                           std::chrono::steady_clock::time_point createdAt)
    : m_pool(pool), m_conn(conn), m_createdAt(createdAt) {
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (!m_released && m_pool && m_conn) {
        release();
    }
}

PostgreSQLConnection::PostgreSQLConnection(PostgreSQLConnection&& other) noexcept
    : m_pool(other.m_pool), m_conn(other.m_conn), m_createdAt(other.m_createdAt),
      m_released(other.m_released), m_broken(other.m_broken) {
    other.m_pool = nullptr;
    other.m_conn = nullptr;
    other.m_released = true;
}

PostgreSQLConnection& PostgreSQLConnection::operator=(PostgreSQLConnection&& other) noexcept {
    if (this != &other) {
        if (!m_released && m_pool && m_conn) {
            release();
        }
        m_pool = other.m_pool;
        m_conn = other.m_conn;
        m_createdAt = other.m_createdAt;
        m_released = other.m_released;
        m_broken = other.m_broken;
        other.m_pool = nullptr;
        other.m_conn = nullptr;
        other.m_released = true;
    }
    return *this;
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && !m_released && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!isValid()) return false;

    PostgreSQLResultSet res(PQexec(m_conn, "SELECT 1"));
    return res.status() == PGRES_TUPLES_OK;
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

// ============================================================================
// Statement Execution
// ============================================================================

PostgreSQLConnection::BoundParams PostgreSQLConnection::bindParams(const std::vector<SqlValue>& params) {
    BoundParams bound;
    bound.storage.reserve(params.size());
    bound.values.reserve(params.size());
    bound.lengths.reserve(params.size());
    bound.formats.reserve(params.size());

    for (const auto& param : params) {
        if (isNull(param)) {
            bound.storage.emplace_back();
            bound.values.push_back(nullptr);
            bound.lengths.push_back(0);
            bound.formats.push_back(0);
        } else if (auto bytes = std::get_if<Bytes>(&param)) {
            bound.storage.emplace_back(bytes->begin(), bytes->end());
            bound.values.push_back(bound.storage.back().data());
            bound.lengths.push_back(static_cast<int>(bytes->size()));
            bound.formats.push_back(1);  // binary
        } else {
            bound.storage.push_back(valueToString(param));
            bound.values.push_back(bound.storage.back().c_str());
            bound.lengths.push_back(0);
            bound.formats.push_back(0);
        }
    }

    return bound;
}

StatementResult PostgreSQLConnection::run(const std::string& sql, const std::vector<SqlValue>& params,
                                          size_t fetchSize, size_t maxRows) {
    ensureUsable();
    checkParameterCount(sql, params.size());
    BoundParams bound = bindParams(params);

    if (fetchSize > 0) {
        return streamRows(sql, bound, fetchSize, maxRows);
    }

    PostgreSQLResultSet res(PQexecParams(m_conn, sql.c_str(), static_cast<int>(params.size()), nullptr,
                                         bound.values.data(), bound.lengths.data(),
                                         bound.formats.data(), 0));
    if (!res.get()) {
        fail(error(), "");
    }
    if (!res.isOk()) {
        fail(res.errorMessage(), res.sqlstate());
    }

    StatementResult result;
    result.affectedRows = res.affectedRows();
    if (res.hasData()) {
        result.hasRows = true;
        result.columns = res.columns();
        int rows = res.numRows();
        for (int i = 0; i < rows; ++i) {
            if (maxRows > 0 && result.rows.size() >= maxRows) {
                result.truncated = true;
                break;
            }
            result.rows.push_back(res.row(i));
        }
    }
    return result;
}

StatementResult PostgreSQLConnection::streamRows(const std::string& sql, const BoundParams& bound,
                                                 size_t fetchSize, size_t maxRows) {
    if (!PQsendQueryParams(m_conn, sql.c_str(), static_cast<int>(bound.values.size()), nullptr,
                           bound.values.data(), bound.lengths.data(), bound.formats.data(), 0)) {
        fail(error(), "");
    }
    if (!PQsetSingleRowMode(m_conn)) {
        spdlog::debug("PostgreSQL single-row mode unavailable, fetching whole result");
    }
    spdlog::trace("Streaming PostgreSQL rows (fetch size {})", fetchSize);

    StatementResult result;
    // Cancelling a write would roll back its implicit transaction
    const bool cancellable = SqlSafetyPolicy::isReadOnlyStatement(sql, DatabaseType::PostgreSQL);
    bool cancelled = false;
    std::string errorText;
    std::string errorState;

    // Drain every result so the connection is usable afterwards
    while (PGresult* raw = PQgetResult(m_conn)) {
        PostgreSQLResultSet res(raw);

        switch (res.status()) {
            case PGRES_SINGLE_TUPLE:
            case PGRES_TUPLES_OK:
                result.hasRows = true;
                if (result.columns.empty()) {
                    result.columns = res.columns();
                }
                // The closing result carries the command tag of a RETURNING write
                if (res.status() == PGRES_TUPLES_OK && res.affectedRows() > 0) {
                    result.affectedRows = res.affectedRows();
                }
                for (int i = 0; i < res.numRows() && !cancelled; ++i) {
                    if (maxRows > 0 && result.rows.size() >= maxRows) {
                        result.truncated = true;
                        if (!cancellable) {
                            // Keep draining; extra rows are dropped
                            break;
                        }
                        PGcancel* cancel = PQgetCancel(m_conn);
                        if (cancel) {
                            std::array<char, 256> buffer{};
                            if (!PQcancel(cancel, buffer.data(), static_cast<int>(buffer.size()))) {
                                spdlog::debug("PostgreSQL cancel request failed: {}", buffer.data());
                            }
                            PQfreeCancel(cancel);
                        }
                        cancelled = true;
                        break;
                    }
                    result.rows.push_back(res.row(i));
                }
                break;
            case PGRES_COMMAND_OK:
                result.affectedRows = res.affectedRows();
                break;
            default:
                // The cancel we sent surfaces as query_canceled
                if (errorText.empty() && !(cancelled && res.sqlstate() == "57014")) {
                    errorText = trimmed(res.errorMessage());
                    errorState = res.sqlstate();
                }
                break;
        }
    }

    if (!errorText.empty()) {
        fail(errorText, errorState);
    }
    if (!result.affectedRows && result.hasRows) {
        result.affectedRows = static_cast<int64_t>(result.rows.size());
    }
    return result;
}

BatchResult PostgreSQLConnection::runBatch(const std::string& sql,
                                           const std::vector<std::vector<SqlValue>>& paramSets) {
    ensureUsable();
    BatchResult batch;
    const std::string secret = m_pool ? m_pool->info().password : std::string{};

    PostgreSQLResultSet prepared(PQprepare(m_conn, "", sql.c_str(), 0, nullptr));
    if (!prepared.isOk()) {
        std::string state = prepared.sqlstate();
        batch.failedIndex = 0;
        batch.error = ErrorHandler::redact(trimmed(prepared.get() ? prepared.errorMessage() : error()), secret);
        batch.errorKind = ErrorHandler::classifyPostgreSQL(state);
        batch.retryable = ErrorHandler::isRetryablePostgreSQL(state);
        if (*batch.errorKind == ErrorKind::ConnectionFailure) m_broken = true;
        return batch;
    }

    const size_t expected = placeholderCount(sql);

    for (size_t i = 0; i < paramSets.size(); ++i) {
        if (paramSets[i].size() != expected) {
            batch.failedIndex = i;
            batch.error = "Statement expects " + std::to_string(expected) + " parameters, got " +
                          std::to_string(paramSets[i].size());
            batch.errorKind = ErrorKind::QueryExecutionError;
            break;
        }
        BoundParams bound = bindParams(paramSets[i]);
        PostgreSQLResultSet res(PQexecPrepared(m_conn, "", static_cast<int>(paramSets[i].size()),
                                               bound.values.data(), bound.lengths.data(),
                                               bound.formats.data(), 0));
        if (!res.isOk()) {
            std::string state = res.sqlstate();
            batch.failedIndex = i;
            batch.error = ErrorHandler::redact(trimmed(res.get() ? res.errorMessage() : error()), secret);
            batch.errorKind = ErrorHandler::classifyPostgreSQL(state);
            batch.retryable = ErrorHandler::isRetryablePostgreSQL(state);
            if (*batch.errorKind == ErrorKind::ConnectionFailure) m_broken = true;
            break;
        }
        batch.counts.push_back(res.affectedRows());
    }

    return batch;
}

// ============================================================================
// Transactions
// ============================================================================

void PostgreSQLConnection::setAutoCommit(bool enabled) {
    ensureUsable();
    if (!enabled) {
        exec("BEGIN");
        return;
    }
    PGTransactionStatusType state = PQtransactionStatus(m_conn);
    if (state == PQTRANS_INTRANS || state == PQTRANS_INERROR) {
        exec("ROLLBACK");
    }
}

void PostgreSQLConnection::commit() {
    ensureUsable();
    // COMMIT of an aborted transaction silently rolls back
    if (PQtransactionStatus(m_conn) == PQTRANS_INERROR) {
        exec("ROLLBACK");
        fail("current transaction is aborted, commit not possible", "25P02");
    }
    exec("COMMIT");
}

void PostgreSQLConnection::rollback() {
    ensureUsable();
    exec("ROLLBACK");
}

void PostgreSQLConnection::exec(const char* sql) {
    PostgreSQLResultSet res(PQexec(m_conn, sql));
    if (!res.get()) {
        fail(error(), "");
    }
    if (!res.isOk()) {
        fail(res.errorMessage(), res.sqlstate());
    }
}

// ============================================================================
// Errors and Release
// ============================================================================

void PostgreSQLConnection::checkParameterCount(const std::string& sql, size_t supplied) const {
    size_t expected = placeholderCount(sql);
    if (expected != supplied) {
        throw DatabaseError(ErrorKind::QueryExecutionError,
                            "Statement expects " + std::to_string(expected) +
                            " parameters, got " + std::to_string(supplied));
    }
}

void PostgreSQLConnection::ensureUsable() const {
    if (!m_conn || m_released) {
        throw DatabaseError(ErrorKind::ConnectionFailure, "PostgreSQL connection already released");
    }
}

void PostgreSQLConnection::fail(const std::string& what, const std::string& sqlstate) {
    ErrorKind kind = ErrorHandler::classifyPostgreSQL(sqlstate);
    if (kind == ErrorKind::ConnectionFailure || PQstatus(m_conn) != CONNECTION_OK) {
        m_broken = true;
        kind = ErrorKind::ConnectionFailure;
    }
    const std::string secret = m_pool ? m_pool->info().password : std::string{};
    throw DatabaseError(kind, ErrorHandler::redact(trimmed(what.c_str()), secret), sqlstate,
                        ErrorHandler::isRetryablePostgreSQL(sqlstate));
}

void PostgreSQLConnection::release() {
    if (!m_released && m_pool && m_conn) {
        m_pool->releaseConnection(m_conn, m_createdAt, !m_broken);
        m_released = true;
        m_conn = nullptr;
    }
}

}  // namespace sqlbridge
