#pragma once

/**
 * @file MySQLSchemaManager.hpp
 * @brief MySQL catalog queries.
 *
 * Provides the SchemaManager implementation for MySQL and MariaDB,
 * reading INFORMATION_SCHEMA.
 */

#include "SchemaManager.hpp"
#include "MySQLConnectionPool.hpp"
#include <memory>

namespace sqlbridge {

/**
 * @class MySQLSchemaManager
 * @brief SchemaManager implementation for MySQL databases.
 *
 * In MySQL a schema and a database are the same thing; the default schema
 * is the database named in the connection parameters.
 *
 * System Catalog Queries Used:
 * - INFORMATION_SCHEMA.SCHEMATA: Schema list
 * - INFORMATION_SCHEMA.TABLES: Tables, views and comments
 * - INFORMATION_SCHEMA.COLUMNS: Column definitions
 * - INFORMATION_SCHEMA.KEY_COLUMN_USAGE: Primary and foreign keys
 * - INFORMATION_SCHEMA.STATISTICS: Index information
 *
 * Thread Safety:
 * - Each method call uses its own connection from the pool
 */
class MySQLSchemaManager : public SchemaManager {
public:
    MySQLSchemaManager(std::shared_ptr<MySQLConnectionPool> pool,
                       std::chrono::milliseconds acquireTimeout);

    ~MySQLSchemaManager() override = default;

    std::string defaultSchema() const override;

    /**
     * @brief Schemas other than information_schema, mysql, performance_schema and sys.
     */
    std::vector<std::string> listSchemas() override;

    std::vector<TableInfo> listTables(const std::string& schema) override;

    std::optional<std::string> getTableType(const std::string& schema,
                                            const std::string& table) override;

    /**
     * @brief Columns with their full column_type ("int unsigned", "varchar(64)").
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
     * @brief EXPLAIN FORMAT=JSON, or EXPLAIN ANALYZE (tree output, MySQL 8.0.18+).
     */
    std::vector<std::string> explain(const std::string& sql, bool analyze) override;

    bool supportsExplainAnalyze() const override { return true; }

private:
    std::vector<Row> query(const std::string& sql, const std::vector<SqlValue>& params = {});

    std::shared_ptr<MySQLConnectionPool> m_pool;  ///< Connection pool for catalog queries
    std::chrono::milliseconds m_acquireTimeout;
};

}  // namespace sqlbridge
