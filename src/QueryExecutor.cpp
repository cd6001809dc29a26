#include "QueryExecutor.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <type_traits>

namespace sqlbridge {

namespace {

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

QueryResult failedResult(std::chrono::steady_clock::time_point start, ErrorKind kind,
                         const std::string& message, bool retryable = false) {
    QueryResult result;
    result.success = false;
    result.error = message;
    result.errorKind = kind;
    result.retryable = retryable;
    result.elapsed = since(start);
    return result;
}

QueryResult toQueryResult(StatementResult&& statement) {
    QueryResult result;
    result.success = true;
    result.columns = std::move(statement.columns);
    result.rows = std::move(statement.rows);
    result.rowCount = result.rows.size();
    result.hasMore = statement.truncated;
    return result;
}

// Turns auto-commit back on when the transaction scope ends. Anything still
// open at that point is rolled back by the connection.
template <typename Connection>
class AutoCommitRestorer {
public:
    explicit AutoCommitRestorer(Connection& conn) : m_conn(conn) {}

    ~AutoCommitRestorer() {
        try {
            m_conn.setAutoCommit(true);
        } catch (const std::exception& e) {
            spdlog::warn("Could not restore auto-commit, discarding connection: {}", e.what());
            m_conn.markBroken();
        }
    }

    AutoCommitRestorer(const AutoCommitRestorer&) = delete;
    AutoCommitRestorer& operator=(const AutoCommitRestorer&) = delete;

private:
    Connection& m_conn;
};

template <typename Connection>
void rollbackQuietly(Connection& conn) {
    try {
        conn.rollback();
    } catch (const std::exception& e) {
        spdlog::error("Rollback failed, discarding connection: {}", e.what());
        conn.markBroken();
    }
}

}  // namespace

QueryExecutor::QueryExecutor(ConnectionRegistry& registry, const SqlSafetyPolicy& policy,
                             QueryConfig config)
    : m_registry(registry), m_policy(policy), m_config(config) {
}

QueryResult QueryExecutor::executeQuery(const std::string& id, const std::string& sql,
                                        const std::vector<SqlValue>& params,
                                        std::optional<size_t> fetchSize) {
    auto start = std::chrono::steady_clock::now();
    auto entry = m_registry.resolve(id);
    const bool readOnly = entry->info().readOnly;

    if (auto failure = m_policy.validate(sql, readOnly, entry->info().type)) {
        spdlog::warn("Query on '{}' rejected by rule {}: {}", id, failure->rule, failure->message);
        return failedResult(start, ErrorKind::ValidationError, failure->message);
    }

    size_t fetch = fetchSize.value_or(m_config.default_fetch_size);
    spdlog::debug("Query on '{}' ({} params, fetch size {})", id, params.size(), fetch);

    try {
        QueryResult result = withConnection<QueryResult>(
            entry->pool(), entry->acquireTimeout(), [&](auto& conn) {
                return toQueryResult(conn.run(sql, params, fetch, m_config.max_rows));
            });
        result.elapsed = since(start);
        entry->touch();

        if (result.hasMore) {
            spdlog::info("Query on '{}' returned the first {} rows only", id, result.rowCount);
        }
        return result;
    } catch (const DatabaseError& e) {
        spdlog::error("Query on '{}' failed: {}", id, e.what());
        return failedResult(start, e.kind(), ErrorHandler::redact(e.what(), entry->info().password),
                            e.retryable());
    } catch (const std::exception& e) {
        spdlog::error("Query on '{}' failed: {}", id, e.what());
        return failedResult(start, ErrorKind::QueryExecutionError,
                            ErrorHandler::redact(e.what(), entry->info().password));
    }
}

int64_t QueryExecutor::executeUpdate(const std::string& id, const std::string& sql,
                                     const std::vector<SqlValue>& params) {
    auto entry = m_registry.resolve(id);
    m_policy.enforce(sql, entry->info().readOnly, entry->info().type);

    int64_t affected = withConnection<int64_t>(
        entry->pool(), entry->acquireTimeout(),
        [&](auto& conn) { return conn.run(sql, params).affectedRows; });

    entry->touch();
    spdlog::debug("Update on '{}' affected {} rows", id, affected);
    return affected;
}

std::vector<TransactionItem> QueryExecutor::executeTransaction(
        const std::string& id, const std::vector<TransactionStatement>& statements) {
    auto entry = m_registry.resolve(id);

    if (statements.empty()) {
        throw DatabaseError(ErrorKind::ValidationError, "Transaction has no statements");
    }
    for (size_t i = 0; i < statements.size(); ++i) {
        if (auto failure = m_policy.validate(statements[i].sql, entry->info().readOnly,
                                             entry->info().type)) {
            throw DatabaseError(ErrorKind::ValidationError,
                                "Statement " + std::to_string(i) + ": " + failure->message,
                                failure->rule);
        }
    }

    const std::string& secret = entry->info().password;

    auto items = withConnection<std::vector<TransactionItem>>(
        entry->pool(), entry->acquireTimeout(), [&](auto& conn) {
            try {
                conn.setAutoCommit(false);
            } catch (const DatabaseError& e) {
                throw TransactionError(0, e.kind(),
                                       "Failed to begin transaction: " + ErrorHandler::redact(e.what(), secret),
                                       e.backendCode(), e.retryable());
            }
            AutoCommitRestorer<std::decay_t<decltype(conn)>> restorer(conn);

            std::vector<TransactionItem> results;
            results.reserve(statements.size());

            for (size_t i = 0; i < statements.size(); ++i) {
                auto start = std::chrono::steady_clock::now();
                try {
                    StatementResult statement = conn.run(statements[i].sql, statements[i].params);
                    if (statement.hasRows) {
                        QueryResult rows = toQueryResult(std::move(statement));
                        rows.elapsed = since(start);
                        results.emplace_back(std::move(rows));
                    } else {
                        results.emplace_back(statement.affectedRows);
                    }
                } catch (const DatabaseError& e) {
                    rollbackQuietly(conn);
                    spdlog::warn("Transaction on '{}' rolled back at statement {}: {}", id, i, e.what());
                    throw TransactionError(i, e.kind(),
                                           "Statement " + std::to_string(i) + " failed: " +
                                               ErrorHandler::redact(e.what(), secret),
                                           e.backendCode(), e.retryable());
                }
            }

            try {
                conn.commit();
            } catch (const DatabaseError& e) {
                rollbackQuietly(conn);
                throw TransactionError(statements.size(), e.kind(),
                                       "Commit failed: " + ErrorHandler::redact(e.what(), secret),
                                       e.backendCode(), e.retryable());
            }
            return results;
        });

    entry->touch();
    spdlog::debug("Transaction on '{}' committed {} statements", id, statements.size());
    return items;
}

BatchResult QueryExecutor::executeBatch(const std::string& id, const std::string& sql,
                                        const std::vector<std::vector<SqlValue>>& paramSets) {
    auto entry = m_registry.resolve(id);
    m_policy.enforce(sql, entry->info().readOnly, entry->info().type);

    if (paramSets.empty()) {
        return BatchResult{};
    }

    BatchResult batch = withConnection<BatchResult>(
        entry->pool(), entry->acquireTimeout(),
        [&](auto& conn) { return conn.runBatch(sql, paramSets); });

    if (batch.error) {
        batch.error = ErrorHandler::redact(*batch.error, entry->info().password);
        spdlog::warn("Batch on '{}' stopped at parameter set {} of {}: {}", id,
                     batch.failedIndex.value_or(0), paramSets.size(), *batch.error);
    } else {
        entry->touch();
        spdlog::debug("Batch on '{}' applied {} parameter sets", id, batch.counts.size());
    }
    return batch;
}

}  // namespace sqlbridge
