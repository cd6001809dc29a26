#pragma once

#include "PoolFactory.hpp"
#include "Value.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlbridge {

struct ColumnInfo {
    std::string name;
    std::string type;
    std::optional<int64_t> maxLength;  // character types
    std::optional<int64_t> precision;  // numeric types
    std::optional<int64_t> scale;
    bool nullable = true;
    std::optional<std::string> defaultValue;
    int ordinalPosition = 0;
};

struct ForeignKeyInfo {
    std::string column;
    std::string referencedSchema;
    std::string referencedTable;
    std::string referencedColumn;
    std::string constraintName;
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    std::string kind;  // BTREE, HASH, ...
};

struct TableInfo {
    std::string name;
    std::string kind;  // TABLE or VIEW
    std::optional<std::string> comment;
};

struct TableSchema {
    std::string schema;
    std::string table;
    std::optional<std::string> kind;
    std::vector<ColumnInfo> columns;
    std::vector<std::string> primaryKeys;
    std::vector<ForeignKeyInfo> foreignKeys;
    std::vector<IndexInfo> indexes;
    std::optional<std::string> comment;
};

struct PlanResult {
    std::vector<std::string> lines;
    std::string query;
    bool analyze = false;
    std::chrono::system_clock::time_point timestamp;
};

// Abstract base class for per-backend catalog queries. Every method borrows a
// pooled connection for its duration and throws DatabaseError on failure.
class SchemaManager {
public:
    virtual ~SchemaManager() = default;

    // Schema used when the caller passes an empty one
    virtual std::string defaultSchema() const = 0;

    virtual std::vector<std::string> listSchemas() = 0;
    virtual std::vector<TableInfo> listTables(const std::string& schema) = 0;

    // TABLE or VIEW; nullopt when the table does not exist
    virtual std::optional<std::string> getTableType(const std::string& schema,
                                                    const std::string& table) = 0;
    virtual std::vector<ColumnInfo> getColumns(const std::string& schema,
                                               const std::string& table) = 0;
    virtual std::vector<std::string> getPrimaryKeys(const std::string& schema,
                                                    const std::string& table) = 0;
    virtual std::vector<ForeignKeyInfo> getForeignKeys(const std::string& schema,
                                                       const std::string& table) = 0;
    virtual std::vector<IndexInfo> getIndexes(const std::string& schema,
                                              const std::string& table) = 0;
    virtual std::optional<std::string> getTableComment(const std::string& schema,
                                                       const std::string& table) = 0;

    // Raw plan lines for sql. analyze executes the statement.
    virtual std::vector<std::string> explain(const std::string& sql, bool analyze) = 0;
    virtual bool supportsExplainAnalyze() const = 0;

protected:
    SchemaManager() = default;

    // One line per text line of every cell, cells of a row joined by a tab
    static std::vector<std::string> planLines(const std::vector<Row>& rows);

    static std::string stringAt(const Row& row, size_t index);
    static std::optional<std::string> optionalStringAt(const Row& row, size_t index);
    static std::optional<int64_t> intAt(const Row& row, size_t index);
};

// Catalog access for the backend behind pool
std::unique_ptr<SchemaManager> createSchemaManager(const Pool& pool,
                                                   std::chrono::milliseconds acquireTimeout);

}  // namespace sqlbridge
