/**
 * @file PostgreSQLSchemaManager.cpp
 * @brief Implementation of the PostgreSQL catalog queries.
 */

#include "PostgreSQLSchemaManager.hpp"
#include "PostgreSQLConnection.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace sqlbridge {

// ============================================================================
// Construction
// ============================================================================

PostgreSQLSchemaManager::PostgreSQLSchemaManager(std::shared_ptr<PostgreSQLConnectionPool> pool,
                                                 std::chrono::milliseconds acquireTimeout)
    : m_pool(std::move(pool)), m_acquireTimeout(acquireTimeout) {
}

std::vector<Row> PostgreSQLSchemaManager::query(const std::string& sql,
                                                const std::vector<SqlValue>& params) {
    auto conn = m_pool->acquire(m_acquireTimeout);
    return conn->run(sql, params).rows;
}

// ============================================================================
// Schema and Table Listing
// ============================================================================

std::vector<std::string> PostgreSQLSchemaManager::listSchemas() {
    std::vector<std::string> schemas;

    auto rows = query(
        "SELECT nspname FROM pg_catalog.pg_namespace "
        "WHERE nspname NOT IN ('information_schema', 'pg_catalog', 'pg_toast') "
        "AND nspname NOT LIKE 'pg\\_temp\\_%' "
        "AND nspname NOT LIKE 'pg\\_toast\\_temp\\_%' "
        "ORDER BY nspname");

    for (const auto& row : rows) {
        schemas.push_back(stringAt(row, 0));
    }
    return schemas;
}

std::vector<TableInfo> PostgreSQLSchemaManager::listTables(const std::string& schema) {
    std::vector<TableInfo> tables;

    auto rows = query(
        "SELECT c.relname, "
        "       CASE WHEN c.relkind IN ('v', 'm') THEN 'VIEW' ELSE 'TABLE' END, "
        "       obj_description(c.oid, 'pg_class') "
        "FROM pg_catalog.pg_class c "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = $1 AND c.relkind IN ('r', 'p', 'v', 'm', 'f') "
        "ORDER BY c.relname",
        {schema});

    for (const auto& row : rows) {
        tables.push_back({stringAt(row, 0), stringAt(row, 1), optionalStringAt(row, 2)});
    }
    return tables;
}

std::optional<std::string> PostgreSQLSchemaManager::getTableType(const std::string& schema,
                                                                 const std::string& table) {
    auto rows = query(
        "SELECT CASE WHEN c.relkind IN ('v', 'm') THEN 'VIEW' ELSE 'TABLE' END "
        "FROM pg_catalog.pg_class c "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = $1 AND c.relname = $2 AND c.relkind IN ('r', 'p', 'v', 'm', 'f')",
        {schema, table});

    if (rows.empty()) {
        return std::nullopt;
    }
    return stringAt(rows.front(), 0);
}

// ============================================================================
// Table Structure
// ============================================================================

std::vector<ColumnInfo> PostgreSQLSchemaManager::getColumns(const std::string& schema,
                                                            const std::string& table) {
    std::vector<ColumnInfo> columns;

    auto rows = query(
        "SELECT column_name, "
        "       CASE WHEN data_type IN ('USER-DEFINED', 'ARRAY') THEN udt_name ELSE data_type END, "
        "       character_maximum_length, numeric_precision, numeric_scale, "
        "       is_nullable, column_default, ordinal_position "
        "FROM information_schema.columns "
        "WHERE table_schema = $1 AND table_name = $2 "
        "ORDER BY ordinal_position",
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

std::vector<std::string> PostgreSQLSchemaManager::getPrimaryKeys(const std::string& schema,
                                                                 const std::string& table) {
    std::vector<std::string> keys;

    auto rows = query(
        "SELECT kcu.column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "  ON tc.constraint_name = kcu.constraint_name "
        " AND tc.table_schema = kcu.table_schema "
        " AND tc.table_name = kcu.table_name "
        "WHERE tc.constraint_type = 'PRIMARY KEY' "
        "AND tc.table_schema = $1 AND tc.table_name = $2 "
        "ORDER BY kcu.ordinal_position",
        {schema, table});

    for (const auto& row : rows) {
        keys.push_back(stringAt(row, 0));
    }
    return keys;
}

std::vector<ForeignKeyInfo> PostgreSQLSchemaManager::getForeignKeys(const std::string& schema,
                                                                    const std::string& table) {
    std::vector<ForeignKeyInfo> keys;

    // conkey and confkey are parallel arrays: unnest them together
    auto rows = query(
        "SELECT a.attname, rn.nspname, rc.relname, ra.attname, con.conname "
        "FROM pg_catalog.pg_constraint con "
        "JOIN pg_catalog.pg_class c ON c.oid = con.conrelid "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "JOIN pg_catalog.pg_class rc ON rc.oid = con.confrelid "
        "JOIN pg_catalog.pg_namespace rn ON rn.oid = rc.relnamespace "
        "JOIN LATERAL unnest(con.conkey, con.confkey) WITH ORDINALITY AS k(attnum, refnum, ord) ON true "
        "JOIN pg_catalog.pg_attribute a ON a.attrelid = con.conrelid AND a.attnum = k.attnum "
        "JOIN pg_catalog.pg_attribute ra ON ra.attrelid = con.confrelid AND ra.attnum = k.refnum "
        "WHERE con.contype = 'f' AND n.nspname = $1 AND c.relname = $2 "
        "ORDER BY con.conname, k.ord",
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

std::vector<IndexInfo> PostgreSQLSchemaManager::getIndexes(const std::string& schema,
                                                           const std::string& table) {
    std::vector<IndexInfo> indexes;

    auto rows = query(
        "SELECT i.relname, ix.indisunique, am.amname, "
        "       array_to_string(array_agg(a.attname ORDER BY k.n), ',') "
        "FROM pg_catalog.pg_index ix "
        "JOIN pg_catalog.pg_class t ON t.oid = ix.indrelid "
        "JOIN pg_catalog.pg_class i ON i.oid = ix.indexrelid "
        "JOIN pg_catalog.pg_am am ON i.relam = am.oid "
        "JOIN pg_catalog.pg_namespace n ON n.oid = t.relnamespace "
        "JOIN generate_subscripts(ix.indkey, 1) k(n) ON true "
        "JOIN pg_catalog.pg_attribute a ON a.attrelid = t.oid AND a.attnum = ix.indkey[k.n] "
        "WHERE n.nspname = $1 AND t.relname = $2 "
        "GROUP BY i.relname, ix.indisunique, am.amname "
        "ORDER BY i.relname",
        {schema, table});

    for (const auto& row : rows) {
        IndexInfo idx;
        idx.name = stringAt(row, 0);
        idx.unique = row.size() > 1 && asBool(row[1].second);
        idx.kind = stringAt(row, 2);

        std::istringstream iss(stringAt(row, 3));
        std::string col;
        while (std::getline(iss, col, ',')) {
            idx.columns.push_back(col);
        }

        indexes.push_back(std::move(idx));
    }
    return indexes;
}

std::optional<std::string> PostgreSQLSchemaManager::getTableComment(const std::string& schema,
                                                                    const std::string& table) {
    auto rows = query(
        "SELECT obj_description(c.oid, 'pg_class') "
        "FROM pg_catalog.pg_class c "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = $1 AND c.relname = $2",
        {schema, table});

    if (rows.empty()) {
        return std::nullopt;
    }
    return optionalStringAt(rows.front(), 0);
}

// ============================================================================
// Plans
// ============================================================================

std::vector<std::string> PostgreSQLSchemaManager::explain(const std::string& sql, bool analyze) {
    std::string statement = analyze ? "EXPLAIN (ANALYZE, BUFFERS, FORMAT JSON) "
                                    : "EXPLAIN (FORMAT JSON) ";
    statement += sql;

    spdlog::debug("PostgreSQL explain (analyze={})", analyze);
    return planLines(query(statement));
}

}  // namespace sqlbridge
