#include "SchemaIntrospector.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

namespace {

std::unique_ptr<SchemaManager> managerFor(const ConnectionEntry& entry) {
    return createSchemaManager(entry.pool(), entry.acquireTimeout());
}

std::string resolveSchema(const SchemaManager& manager, const std::string& schema) {
    return schema.empty() ? manager.defaultSchema() : schema;
}

// Run one part of a table description; a failure leaves the part at its default
template <typename T, typename Fn>
bool collect(T& target, const char* part, const std::string& table, Fn&& fn) {
    try {
        target = fn();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Could not read {} of '{}': {}", part, table, e.what());
        return false;
    }
}

}  // namespace

SchemaIntrospector::SchemaIntrospector(ConnectionRegistry& registry, const SqlSafetyPolicy& policy)
    : m_registry(registry), m_policy(policy) {
}

std::vector<std::string> SchemaIntrospector::listSchemas(const std::string& id) {
    auto entry = m_registry.resolve(id);
    auto schemas = managerFor(*entry)->listSchemas();
    entry->touch();
    return schemas;
}

std::vector<TableInfo> SchemaIntrospector::listTables(const std::string& id, const std::string& schema) {
    auto entry = m_registry.resolve(id);
    auto manager = managerFor(*entry);
    auto tables = manager->listTables(resolveSchema(*manager, schema));
    entry->touch();
    return tables;
}

TableSchema SchemaIntrospector::getTableSchema(const std::string& id, const std::string& table,
                                               const std::string& schema) {
    auto entry = m_registry.resolve(id);
    auto manager = managerFor(*entry);

    TableSchema result;
    result.schema = resolveSchema(*manager, schema);
    result.table = table;
    const std::string& s = result.schema;

    const std::string qualified = s.empty() ? table : s + "." + table;

    bool kindRead = collect(result.kind, "kind", table, [&] { return manager->getTableType(s, table); });
    bool columnsRead = collect(result.columns, "columns", table, [&] { return manager->getColumns(s, table); });

    if (!kindRead && !columnsRead) {
        throw DatabaseError(ErrorKind::QueryExecutionError, "Could not read the catalog for " + qualified);
    }
    if (result.columns.empty() && !result.kind) {
        throw DatabaseError(ErrorKind::QueryExecutionError, "Table not found: " + qualified);
    }

    collect(result.primaryKeys, "primary keys", table, [&] { return manager->getPrimaryKeys(s, table); });
    collect(result.foreignKeys, "foreign keys", table, [&] { return manager->getForeignKeys(s, table); });
    collect(result.indexes, "indexes", table, [&] { return manager->getIndexes(s, table); });
    collect(result.comment, "comment", table, [&] { return manager->getTableComment(s, table); });

    entry->touch();
    return result;
}

PlanResult SchemaIntrospector::explainQuery(const std::string& id, const std::string& sql, bool analyze) {
    auto entry = m_registry.resolve(id);
    const bool readOnly = entry->info().readOnly;

    if (analyze) {
        m_policy.enforce(sql, readOnly, entry->info().type);
        spdlog::warn("EXPLAIN ANALYZE on '{}' executes the statement", id);
    } else {
        m_policy.enforce("EXPLAIN " + sql, readOnly, entry->info().type);
    }

    auto manager = managerFor(*entry);
    if (analyze && !manager->supportsExplainAnalyze()) {
        spdlog::warn("Connection '{}' cannot analyze plans; returning the plan only", id);
        analyze = false;
    }

    PlanResult plan;
    plan.lines = manager->explain(sql, analyze);
    plan.query = sql;
    plan.analyze = analyze;
    plan.timestamp = std::chrono::system_clock::now();

    entry->touch();
    return plan;
}

}  // namespace sqlbridge
