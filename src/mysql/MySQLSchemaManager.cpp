/**
 * @file MySQLSchemaManager.cpp
 * @brief Implementation of the MySQL catalog queries.
 */

#include "MySQLSchemaManager.hpp"
#include "MySQLConnection.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

MySQLSchemaManager::MySQLSchemaManager(std::shared_ptr<MySQLConnectionPool> pool,
                                       std::chrono::milliseconds acquireTimeout)
    : m_pool(std::move(pool)), m_acquireTimeout(acquireTimeout) {
}

std::string MySQLSchemaManager::defaultSchema() const {
    return m_pool->info().database;
}

std::vector<Row> MySQLSchemaManager::query(const std::string& sql,
                                           const std::vector<SqlValue>& params) {
    auto conn = m_pool->acquire(m_acquireTimeout);
    return conn->run(sql, params).rows;
}

// ============================================================================
// Schema and Table Listing
// ============================================================================

std::vector<std::string> MySQLSchemaManager::listSchemas() {
    std::vector<std::string> schemas;

    auto rows = query(
        "SELECT SCHEMA_NAME FROM INFORMATION_SCHEMA.SCHEMATA "
        "WHERE SCHEMA_NAME NOT IN ('information_schema', 'mysql', 'performance_schema', 'sys') "
        "ORDER BY SCHEMA_NAME");

    for (const auto& row : rows) {
        schemas.push_back(stringAt(row, 0));
    }
    return schemas;
}

std::vector<TableInfo> MySQLSchemaManager::listTables(const std::string& schema) {
    std::vector<TableInfo> tables;

    auto rows = query(
        "SELECT TABLE_NAME, "
        "       CASE WHEN TABLE_TYPE IN ('VIEW', 'SYSTEM VIEW') THEN 'VIEW' ELSE 'TABLE' END, "
        "       TABLE_COMMENT "
        "FROM INFORMATION_SCHEMA.TABLES "
        "WHERE TABLE_SCHEMA = ? "
        "ORDER BY TABLE_NAME",
        {schema});

    for (const auto& row : rows) {
        TableInfo info{stringAt(row, 0), stringAt(row, 1), optionalStringAt(row, 2)};
        // Views report the literal comment "VIEW"
        if (info.comment && (info.comment->empty() || (info.kind == "VIEW" && *info.comment == "VIEW"))) {
            info.comment.reset();
        }
        tables.push_back(std::move(info));
    }
    return tables;
}

std::optional<std::string> MySQLSchemaManager::getTableType(const std::string& schema,
                                                            const std::string& table) {
    auto rows = query(
        "SELECT CASE WHEN TABLE_TYPE IN ('VIEW', 'SYSTEM VIEW') THEN 'VIEW' ELSE 'TABLE' END "
        "FROM INFORMATION_SCHEMA.TABLES "
        "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ?",
        {schema, table});

    if (rows.empty()) {
        return std::nullopt;
    }
    return stringAt(rows.front(), 0);
}

// ============================================================================
// Table Structure
// ============================================================================

std::vector<ColumnInfo> MySQLSchemaManager::getColumns(const std::string& schema,
                                                       const std::string& table) {
    std::vector<ColumnInfo> columns;

    auto rows = query(
        "SELECT COLUMN_NAME, COLUMN_TYPE, CHARACTER_MAXIMUM_LENGTH, NUMERIC_PRECISION, "
        "       NUMERIC_SCALE, IS_NULLABLE, COLUMN_DEFAULT, ORDINAL_POSITION "
        "FROM INFORMATION_SCHEMA.COLUMNS "
        "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? "
        "ORDER BY ORDINAL_POSITION",
        {schema, table});

    for (const auto& row : rows) {
        ColumnInfo col;
        col.name = stringAt(row, 0);
        col.type = stringAt(row, 1);
        col.maxLength = intAt(row, 2);
        col.precision = intAt(row, 3);
        col.scale = intAt(row, 4);
        col.nullable = stringAt(row, 5) == "YES";
        col.defaultValue = optionalStringAt(row, 6);
        col.ordinalPosition = static_cast<int>(intAt(row, 7).value_or(0));
        columns.push_back(std::move(col));
    }
    return columns;
}

std::vector<std::string> MySQLSchemaManager::getPrimaryKeys(const std::string& schema,
                                                            const std::string& table) {
    std::vector<std::string> keys;

    auto rows = query(
        "SELECT COLUMN_NAME FROM INFORMATION_SCHEMA.KEY_COLUMN_USAGE "
        "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? AND CONSTRAINT_NAME = 'PRIMARY' "
        "ORDER BY ORDINAL_POSITION",
        {schema, table});

    for (const auto& row : rows) {
        keys.push_back(stringAt(row, 0));
    }
    return keys;
}

std::vector<ForeignKeyInfo> MySQLSchemaManager::getForeignKeys(const std::string& schema,
                                                               const std::string& table) {
    std::vector<ForeignKeyInfo> keys;

    auto rows = query(
        "SELECT COLUMN_NAME, REFERENCED_TABLE_SCHEMA, REFERENCED_TABLE_NAME, "
        "       REFERENCED_COLUMN_NAME, CONSTRAINT_NAME "
        "FROM INFORMATION_SCHEMA.KEY_COLUMN_USAGE "
        "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? AND REFERENCED_TABLE_NAME IS NOT NULL "
        "ORDER BY CONSTRAINT_NAME, ORDINAL_POSITION",
        {schema, table});

    for (const auto& row : rows) {
        ForeignKeyInfo fk;
        fk.column = stringAt(row, 0);
        fk.referencedSchema = stringAt(row, 1);
        fk.referencedTable = stringAt(row, 2);
        fk.referencedColumn = stringAt(row, 3);
        fk.constraintName = stringAt(row, 4);
        keys.push_back(std::move(fk));
    }
    return keys;
}

std::vector<IndexInfo> MySQLSchemaManager::getIndexes(const std::string& schema,
                                                      const std::string& table) {
    std::vector<IndexInfo> indexes;

    // One row per index column, in index order
    auto rows = query(
        "SELECT INDEX_NAME, COLUMN_NAME, NON_UNIQUE, INDEX_TYPE "
        "FROM INFORMATION_SCHEMA.STATISTICS "
        "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? "
        "ORDER BY INDEX_NAME, SEQ_IN_INDEX",
        {schema, table});

    for (const auto& row : rows) {
        std::string name = stringAt(row, 0);
        if (indexes.empty() || indexes.back().name != name) {
            IndexInfo idx;
            idx.name = name;
            idx.unique = intAt(row, 2).value_or(1) == 0;
            idx.kind = stringAt(row, 3);
            indexes.push_back(std::move(idx));
        }
        // Functional key parts have no column name
        if (auto column = optionalStringAt(row, 1)) {
            indexes.back().columns.push_back(*column);
        }
    }
    return indexes;
}

std::optional<std::string> MySQLSchemaManager::getTableComment(const std::string& schema,
                                                               const std::string& table) {
    auto rows = query(
        "SELECT TABLE_COMMENT FROM INFORMATION_SCHEMA.TABLES "
        "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? AND TABLE_TYPE <> 'VIEW'",
        {schema, table});

    if (rows.empty()) {
        return std::nullopt;
    }
    auto comment = optionalStringAt(rows.front(), 0);
    if (comment && comment->empty()) {
        return std::nullopt;
    }
    return comment;
}

// ============================================================================
// Plans
// ============================================================================

std::vector<std::string> MySQLSchemaManager::explain(const std::string& sql, bool analyze) {
    std::string statement = analyze ? "EXPLAIN ANALYZE " : "EXPLAIN FORMAT=JSON ";
    statement += sql;

    spdlog::debug("MySQL explain (analyze={})", analyze);

    // EXPLAIN is not accepted by the prepared statement protocol
    auto conn = m_pool->acquire(m_acquireTimeout);
    return planLines(conn->runText(statement).rows);
}

}  // namespace sqlbridge
