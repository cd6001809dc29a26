#pragma once

#include "ConnectionRegistry.hpp"
#include "SchemaManager.hpp"
#include "SqlSafetyPolicy.hpp"
#include <string>
#include <vector>

namespace sqlbridge {

// Backend-agnostic schema descriptions for registered connections.
// An empty schema argument means the backend default (public, the
// connection's database, or main).
class SchemaIntrospector {
public:
    SchemaIntrospector(ConnectionRegistry& registry, const SqlSafetyPolicy& policy);

    std::vector<std::string> listSchemas(const std::string& id);

    std::vector<TableInfo> listTables(const std::string& id, const std::string& schema = {});

    // Kind, columns, keys, indexes and comment gathered by independent catalog
    // queries. A failing part is logged and left empty. Throws
    // QueryExecutionError when the table does not exist.
    TableSchema getTableSchema(const std::string& id, const std::string& table,
                               const std::string& schema = {});

    // analyze executes the statement, so it is validated like an execution;
    // otherwise the EXPLAIN text itself is validated. A backend without an
    // analyzing explain returns a plain plan with analyze == false.
    PlanResult explainQuery(const std::string& id, const std::string& sql, bool analyze = false);

private:
    ConnectionRegistry& m_registry;
    const SqlSafetyPolicy& m_policy;
};

}  // namespace sqlbridge
