#pragma once

#include "Config.hpp"
#include "ConnectionRegistry.hpp"
#include "QueryResult.hpp"
#include "SqlSafetyPolicy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @class QueryExecutor
 * @brief Runs statements against registered connections.
 *
 * Every statement passes the SqlSafetyPolicy before a connection is
 * borrowed. A connection registered read-only is always validated in
 * read-only mode. Parameters are bound positionally by the backend driver.
 */
class QueryExecutor {
public:
    QueryExecutor(ConnectionRegistry& registry, const SqlSafetyPolicy& policy,
                  QueryConfig config = QueryConfig{});

    /**
     * @brief Run a statement and collect its rows.
     *
     * Failures of the statement itself (validation, backend error, acquire
     * timeout) come back as a QueryResult with success == false.
     *
     * @param fetchSize Rows per round trip; nullopt uses query.default_fetch_size
     * @throws DatabaseError ConnectionNotFound for an unknown id
     */
    QueryResult executeQuery(const std::string& id, const std::string& sql,
                             const std::vector<SqlValue>& params = {},
                             std::optional<size_t> fetchSize = std::nullopt);

    /**
     * @brief Run a data-modifying statement.
     * @return Affected row count
     * @throws DatabaseError on any failure
     */
    int64_t executeUpdate(const std::string& id, const std::string& sql,
                          const std::vector<SqlValue>& params = {});

    /**
     * @brief Run all statements on one connection as a single unit.
     *
     * All statements are validated before the pool is touched. On failure the
     * transaction is rolled back and TransactionError is thrown with the index
     * of the failing statement (statements.size() when COMMIT failed).
     */
    std::vector<TransactionItem> executeTransaction(const std::string& id,
                                                    const std::vector<TransactionStatement>& statements);

    /**
     * @brief Execute one statement once per parameter set.
     *
     * Each set runs in auto-commit mode, so sets applied before a failure
     * stay applied; the result reports them with the failing index.
     *
     * @throws DatabaseError for validation, unknown id and acquire failures
     */
    BatchResult executeBatch(const std::string& id, const std::string& sql,
                             const std::vector<std::vector<SqlValue>>& paramSets);

    const QueryConfig& config() const { return m_config; }

private:
    ConnectionRegistry& m_registry;
    const SqlSafetyPolicy& m_policy;
    QueryConfig m_config;
};

}  // namespace sqlbridge
