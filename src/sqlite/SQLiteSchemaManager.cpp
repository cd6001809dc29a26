/**
 * @file SQLiteSchemaManager.cpp
 * @brief Implementation of the SQLite catalog queries.
 */

#include "SQLiteSchemaManager.hpp"
#include "SQLiteConnection.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace sqlbridge {

SQLiteSchemaManager::SQLiteSchemaManager(std::shared_ptr<SQLiteConnectionPool> pool,
                                         std::chrono::milliseconds acquireTimeout)
    : m_pool(std::move(pool)), m_acquireTimeout(acquireTimeout) {
}

std::string SQLiteSchemaManager::escapeIdentifier(const std::string& id) {
    std::string result = "\"";
    for (char c : id) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

std::vector<Row> SQLiteSchemaManager::query(const std::string& sql,
                                            const std::vector<SqlValue>& params) {
    auto conn = m_pool->acquire(m_acquireTimeout);
    return conn->run(sql, params).rows;
}

// ============================================================================
// Schema and Table Listing
// ============================================================================

std::vector<std::string> SQLiteSchemaManager::listSchemas() {
    std::vector<std::string> schemas;

    auto rows = query("SELECT name FROM pragma_database_list WHERE name <> 'temp' ORDER BY seq");
    for (const auto& row : rows) {
        schemas.push_back(stringAt(row, 0));
    }
    return schemas;
}

std::vector<TableInfo> SQLiteSchemaManager::listTables(const std::string& schema) {
    std::vector<TableInfo> tables;

    auto rows = query(
        "SELECT name, upper(type) FROM " + escapeIdentifier(schema) + ".sqlite_master "
        "WHERE type IN ('table', 'view') AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
        "ORDER BY name");

    for (const auto& row : rows) {
        tables.push_back({stringAt(row, 0), stringAt(row, 1), std::nullopt});
    }
    return tables;
}

std::optional<std::string> SQLiteSchemaManager::getTableType(const std::string& schema,
                                                             const std::string& table) {
    auto rows = query(
        "SELECT upper(type) FROM " + escapeIdentifier(schema) + ".sqlite_master "
        "WHERE type IN ('table', 'view') AND name = ?",
        {table});

    if (rows.empty()) {
        return std::nullopt;
    }
    return stringAt(rows.front(), 0);
}

// ============================================================================
// Table Structure
// ============================================================================

std::vector<ColumnInfo> SQLiteSchemaManager::getColumns(const std::string& schema,
                                                        const std::string& table) {
    std::vector<ColumnInfo> columns;

    auto rows = query(
        "SELECT cid, name, type, \"notnull\", dflt_value FROM pragma_table_info(?, ?) ORDER BY cid",
        {table, schema});

    for (const auto& row : rows) {
        ColumnInfo col;
        col.ordinalPosition = static_cast<int>(intAt(row, 0).value_or(0)) + 1;  // cid is 0-based
        col.name = stringAt(row, 1);
        col.type = stringAt(row, 2);
        col.nullable = intAt(row, 3).value_or(0) == 0;
        col.defaultValue = optionalStringAt(row, 4);
        columns.push_back(std::move(col));
    }
    return columns;
}

std::vector<std::string> SQLiteSchemaManager::getPrimaryKeys(const std::string& schema,
                                                             const std::string& table) {
    std::vector<std::string> keys;

    // pk is the 1-based position within the primary key, 0 for other columns
    auto rows = query(
        "SELECT name FROM pragma_table_info(?, ?) WHERE pk > 0 ORDER BY pk",
        {table, schema});

    for (const auto& row : rows) {
        keys.push_back(stringAt(row, 0));
    }
    return keys;
}

std::vector<ForeignKeyInfo> SQLiteSchemaManager::getForeignKeys(const std::string& schema,
                                                                const std::string& table) {
    std::vector<ForeignKeyInfo> keys;

    auto rows = query(
        "SELECT id, seq, \"table\", \"from\", \"to\" FROM pragma_foreign_key_list(?, ?) "
        "ORDER BY id, seq",
        {table, schema});

    for (const auto& row : rows) {
        ForeignKeyInfo fk;
        int64_t id = intAt(row, 0).value_or(0);
        size_t seq = static_cast<size_t>(intAt(row, 1).value_or(0));
        fk.referencedSchema = schema;
        fk.referencedTable = stringAt(row, 2);
        fk.column = stringAt(row, 3);
        fk.constraintName = "fk_" + table + "_" + std::to_string(id);

        // A missing "to" column references the parent's primary key
        if (auto to = optionalStringAt(row, 4)) {
            fk.referencedColumn = *to;
        } else {
            auto parentKeys = getPrimaryKeys(schema, fk.referencedTable);
            if (seq < parentKeys.size()) {
                fk.referencedColumn = parentKeys[seq];
            }
        }
        keys.push_back(std::move(fk));
    }
    return keys;
}

std::vector<IndexInfo> SQLiteSchemaManager::getIndexes(const std::string& schema,
                                                       const std::string& table) {
    std::vector<IndexInfo> indexes;

    auto conn = m_pool->acquire(m_acquireTimeout);
    auto list = conn->run(
        "SELECT name, \"unique\", origin FROM pragma_index_list(?, ?) ORDER BY name",
        {table, schema}).rows;

    for (const auto& row : list) {
        IndexInfo idx;
        idx.name = stringAt(row, 0);
        idx.unique = intAt(row, 1).value_or(0) != 0;

        // origin: c = CREATE INDEX, u = UNIQUE constraint, pk = PRIMARY KEY
        std::string origin = stringAt(row, 2);
        if (origin == "pk") idx.kind = "PRIMARY KEY";
        else if (origin == "u") idx.kind = "UNIQUE";
        else idx.kind = "INDEX";

        auto columns = conn->run(
            "SELECT name FROM pragma_index_info(?, ?) ORDER BY seqno",
            {idx.name, schema}).rows;
        for (const auto& column : columns) {
            // Expression index parts have no name
            if (auto name = optionalStringAt(column, 0)) {
                idx.columns.push_back(*name);
            }
        }

        indexes.push_back(std::move(idx));
    }
    return indexes;
}

std::optional<std::string> SQLiteSchemaManager::getTableComment(const std::string& /*schema*/,
                                                                const std::string& /*table*/) {
    return std::nullopt;
}

// ============================================================================
// Plans
// ============================================================================

std::vector<std::string> SQLiteSchemaManager::explain(const std::string& sql, bool analyze) {
    if (analyze) {
        spdlog::debug("SQLite has no EXPLAIN ANALYZE; returning the query plan only");
    }

    auto rows = query("EXPLAIN QUERY PLAN " + sql);

    // Columns: id, parent, notused, detail. Parents precede their children.
    std::unordered_map<int64_t, size_t> depth;
    std::vector<std::string> lines;
    for (const auto& row : rows) {
        int64_t id = intAt(row, 0).value_or(0);
        int64_t parent = intAt(row, 1).value_or(0);

        size_t level = 0;
        auto it = depth.find(parent);
        if (parent != 0 && it != depth.end()) {
            level = it->second + 1;
        }
        depth[id] = level;

        lines.push_back(std::string(level * 2, ' ') + stringAt(row, 3));
    }
    return lines;
}

}  // namespace sqlbridge
