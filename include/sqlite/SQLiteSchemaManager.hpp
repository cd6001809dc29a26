#pragma once

/**
 * @file SQLiteSchemaManager.hpp
 * @brief SQLite catalog queries.
 *
 * Provides the SchemaManager implementation for SQLite database files,
 * reading sqlite_master and the pragma table-valued functions.
 */

#include "SchemaManager.hpp"
#include "SQLiteConnectionPool.hpp"
#include <memory>

namespace sqlbridge {

/**
 * @class SQLiteSchemaManager
 * @brief SchemaManager implementation for SQLite.
 *
 * SQLite Object Model:
 * - A schema is an attached database: "main" is the opened file
 * - There are no table comments and no named foreign keys
 *
 * Catalog Sources:
 * - pragma_database_list: Attached databases
 * - <schema>.sqlite_master: Tables and views
 * - pragma_table_info: Columns and primary key positions
 * - pragma_foreign_key_list: Foreign keys
 * - pragma_index_list / pragma_index_info: Indexes
 */
class SQLiteSchemaManager : public SchemaManager {
public:
    SQLiteSchemaManager(std::shared_ptr<SQLiteConnectionPool> pool,
                        std::chrono::milliseconds acquireTimeout);

    ~SQLiteSchemaManager() override = default;

    std::string defaultSchema() const override { return "main"; }

    /**
     * @brief Attached database names, "main" first.
     */
    std::vector<std::string> listSchemas() override;

    std::vector<TableInfo> listTables(const std::string& schema) override;

    std::optional<std::string> getTableType(const std::string& schema,
                                            const std::string& table) override;

    std::vector<ColumnInfo> getColumns(const std::string& schema,
                                       const std::string& table) override;

    std::vector<std::string> getPrimaryKeys(const std::string& schema,
                                            const std::string& table) override;

    /**
     * @brief Foreign keys. Constraints are unnamed in SQLite, so each gets
     *        "fk_<table>_<id>".
     */
    std::vector<ForeignKeyInfo> getForeignKeys(const std::string& schema,
                                               const std::string& table) override;

    std::vector<IndexInfo> getIndexes(const std::string& schema,
                                      const std::string& table) override;

    /**
     * @brief Always nullopt: SQLite keeps no table comments.
     */
    std::optional<std::string> getTableComment(const std::string& schema,
                                               const std::string& table) override;

    /**
     * @brief EXPLAIN QUERY PLAN, one line per plan node indented by depth.
     *
     * SQLite has no analyzing explain; analyze is ignored.
     */
    std::vector<std::string> explain(const std::string& sql, bool analyze) override;

    bool supportsExplainAnalyze() const override { return false; }

private:
    std::vector<Row> query(const std::string& sql, const std::vector<SqlValue>& params = {});

    /**
     * @brief Escape an identifier for use in SQL (double quotes).
     */
    static std::string escapeIdentifier(const std::string& id);

    std::shared_ptr<SQLiteConnectionPool> m_pool;  ///< Connection pool for catalog queries
    std::chrono::milliseconds m_acquireTimeout;
};

}  // namespace sqlbridge
