#pragma once

/**
 * @file PostgreSQLSchemaManager.hpp
 * @brief PostgreSQL catalog queries.
 *
 * Provides the SchemaManager implementation for PostgreSQL, reading
 * information_schema and pg_catalog.
 */

#include "SchemaManager.hpp"
#include "PostgreSQLConnectionPool.hpp"
#include <memory>

namespace sqlbridge {

/**
 * @class PostgreSQLSchemaManager
 * @brief SchemaManager implementation for PostgreSQL databases.
 *
 * PostgreSQL Object Model:
 * - A connection is bound to one database
 * - Each database contains schemas (namespaces); the default is "public"
 *
 * System Catalogs Used:
 * - pg_namespace: Schema list
 * - pg_class: Tables, views, materialized views and their comments
 * - pg_constraint: Foreign keys with their referenced columns
 * - pg_index, pg_am, pg_attribute: Index definitions
 * - information_schema.columns / key_column_usage: Columns and primary keys
 *
 * Every catalog query binds schema and table names as $n parameters.
 */
class PostgreSQLSchemaManager : public SchemaManager {
public:
    PostgreSQLSchemaManager(std::shared_ptr<PostgreSQLConnectionPool> pool,
                            std::chrono::milliseconds acquireTimeout);

    ~PostgreSQLSchemaManager() override = default;

    std::string defaultSchema() const override { return "public"; }

    /**
     * @brief Non-system schemas.
     *
     * Excludes information_schema, pg_catalog, pg_toast and the per-session
     * pg_temp_N / pg_toast_temp_N schemas.
     */
    std::vector<std::string> listSchemas() override;

    std::vector<TableInfo> listTables(const std::string& schema) override;

    std::optional<std::string> getTableType(const std::string& schema,
                                            const std::string& table) override;

    /**
     * @brief Columns from information_schema.columns.
     *
     * USER-DEFINED and ARRAY columns report their udt_name (e.g. "_int4").
     */
    std::vector<ColumnInfo> getColumns(const std::string& schema,
                                       const std::string& table) override;

    std::vector<std::string> getPrimaryKeys(const std::string& schema,
                                            const std::string& table) override;

    std::vector<ForeignKeyInfo> getForeignKeys(const std::string& schema,
                                               const std::string& table) override;

    std::vector<IndexInfo> getIndexes(const std::string& schema,
                                      const std::string& table) override;

    std::optional<std::string> getTableComment(const std::string& schema,
                                               const std::string& table) override;

    /**
     * @brief EXPLAIN (FORMAT JSON), or EXPLAIN (ANALYZE, BUFFERS, FORMAT JSON).
     * @return The JSON plan split into lines.
     */
    std::vector<std::string> explain(const std::string& sql, bool analyze) override;

    bool supportsExplainAnalyze() const override { return true; }

private:
    std::vector<Row> query(const std::string& sql, const std::vector<SqlValue>& params = {});

    std::shared_ptr<PostgreSQLConnectionPool> m_pool;  ///< Connection pool for catalog queries
    std::chrono::milliseconds m_acquireTimeout;
};

}  // namespace sqlbridge
