#include "FormatConverter.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace sqlbridge {

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    if (value) return json(*value);
    return json(nullptr);
}

}  // namespace

// ============================================================================
// Values and Rows
// ============================================================================

json FormatConverter::valueToJson(const SqlValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, DateTime>) {
            return v.text;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return valueToString(SqlValue(v));
        } else {
            return v;
        }
    }, value);
}

json FormatConverter::rowToJson(const Row& row, const JSONOptions& options) {
    json obj = json::object();
    for (const auto& [column, value] : row) {
        if (isNull(value) && !options.includeNull) continue;
        obj[column] = valueToJson(value);
    }
    return obj;
}

// ============================================================================
// Query Results
// ============================================================================

json FormatConverter::toJson(const ColumnDescriptor& column) {
    json obj = json::object();
    obj["name"] = column.name;
    obj["type"] = column.type;
    obj["nullable"] = column.nullable;
    obj["precision"] = column.precision;
    obj["scale"] = column.scale;
    return obj;
}

json FormatConverter::toJson(const QueryResult& result, const JSONOptions& options) {
    json rows = json::array();
    for (const auto& row : result.rows) {
        rows.push_back(rowToJson(row, options));
    }
    if (options.arrayFormat) {
        return rows;
    }

    json obj = json::object();
    obj["success"] = result.success;
    obj["rowCount"] = result.rowCount;
    obj["elapsedMs"] = result.elapsed.count();
    obj["hasMore"] = result.hasMore;

    json columns = json::array();
    for (const auto& column : result.columns) {
        columns.push_back(toJson(column));
    }
    obj["columns"] = std::move(columns);
    obj["rows"] = std::move(rows);

    if (result.error) {
        obj["error"] = *result.error;
    }
    if (result.errorKind) {
        obj["errorKind"] = errorKindName(*result.errorKind);
        obj["retryable"] = result.retryable;
    }
    if (result.executionPlan) {
        obj["executionPlan"] = *result.executionPlan;
    }
    return obj;
}

std::string FormatConverter::toJSON(const QueryResult& result, const JSONOptions& options) {
    return dump(toJson(result, options), options);
}

std::string FormatConverter::toCSV(const QueryResult& result, const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < result.columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(result.columns[i].name, options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (const auto& row : result.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << options.delimiter;

            if (!isNull(row[i].second)) {
                out << escapeCSVField(valueToString(row[i].second), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

json FormatConverter::toJson(const std::vector<TransactionItem>& items) {
    json arr = json::array();
    for (const auto& item : items) {
        if (auto rows = std::get_if<QueryResult>(&item)) {
            arr.push_back(toJson(*rows));
        } else {
            json obj = json::object();
            obj["affectedRows"] = std::get<int64_t>(item);
            arr.push_back(std::move(obj));
        }
    }
    return arr;
}

json FormatConverter::toJson(const BatchResult& batch) {
    json obj = json::object();
    obj["counts"] = batch.counts;
    obj["complete"] = batch.complete();
    if (batch.failedIndex) {
        obj["failedIndex"] = *batch.failedIndex;
    }
    if (batch.error) {
        obj["error"] = *batch.error;
    }
    if (batch.errorKind) {
        obj["errorKind"] = errorKindName(*batch.errorKind);
        obj["retryable"] = batch.retryable;
    }
    return obj;
}

// ============================================================================
// Connections
// ============================================================================

json FormatConverter::toJson(const ConnectionHandle& handle) {
    const ConnectionInfo& info = handle.info;

    json obj = json::object();
    obj["id"] = info.id;
    obj["type"] = databaseTypeToString(info.type);
    obj["url"] = info.describe();
    obj["database"] = info.database;
    obj["readOnly"] = info.readOnly;
    obj["status"] = connectionStatusToString(handle.status);
    obj["createdAt"] = formatTimestamp(info.createdAt);
    obj["lastUsed"] = handle.lastUsed ? json(formatTimestamp(*handle.lastUsed)) : json(nullptr);
    obj["lastError"] = optionalToJson(handle.lastError);

    json pool = json::object();
    pool["total"] = handle.pool.total;
    pool["idle"] = handle.pool.idle;
    pool["waiting"] = handle.pool.waiting;
    pool["maxSize"] = handle.pool.maxSize;
    obj["pool"] = std::move(pool);
    return obj;
}

json FormatConverter::toJson(const std::vector<ConnectionHandle>& handles) {
    json arr = json::array();
    for (const auto& handle : handles) {
        arr.push_back(toJson(handle));
    }
    return arr;
}

json FormatConverter::toJson(const HealthReport& report) {
    json obj = json::object();
    obj["total"] = report.total;
    obj["healthy"] = report.healthy;

    json connections = json::array();
    for (const auto& health : report.connections) {
        json entry = json::object();
        entry["id"] = health.id;
        entry["status"] = connectionStatusToString(health.status);
        entry["error"] = optionalToJson(health.error);
        connections.push_back(std::move(entry));
    }
    obj["connections"] = std::move(connections);
    return obj;
}

// ============================================================================
// Schema
// ============================================================================

json FormatConverter::toJson(const std::vector<TableInfo>& tables) {
    json arr = json::array();
    for (const auto& table : tables) {
        json obj = json::object();
        obj["name"] = table.name;
        obj["kind"] = table.kind;
        obj["comment"] = optionalToJson(table.comment);
        arr.push_back(std::move(obj));
    }
    return arr;
}

json FormatConverter::toJson(const TableSchema& schema) {
    json obj = json::object();
    obj["schema"] = schema.schema;
    obj["table"] = schema.table;
    obj["kind"] = optionalToJson(schema.kind);

    json columns = json::array();
    for (const auto& col : schema.columns) {
        json c = json::object();
        c["name"] = col.name;
        c["type"] = col.type;
        c["maxLength"] = optionalToJson(col.maxLength);
        c["precision"] = optionalToJson(col.precision);
        c["scale"] = optionalToJson(col.scale);
        c["nullable"] = col.nullable;
        c["default"] = optionalToJson(col.defaultValue);
        c["ordinal"] = col.ordinalPosition;
        columns.push_back(std::move(c));
    }
    obj["columns"] = std::move(columns);
    obj["primaryKeys"] = schema.primaryKeys;

    json foreignKeys = json::array();
    for (const auto& fk : schema.foreignKeys) {
        json f = json::object();
        f["column"] = fk.column;
        f["referencedSchema"] = fk.referencedSchema;
        f["referencedTable"] = fk.referencedTable;
        f["referencedColumn"] = fk.referencedColumn;
        f["constraint"] = fk.constraintName;
        foreignKeys.push_back(std::move(f));
    }
    obj["foreignKeys"] = std::move(foreignKeys);

    json indexes = json::array();
    for (const auto& idx : schema.indexes) {
        json i = json::object();
        i["name"] = idx.name;
        i["columns"] = idx.columns;
        i["unique"] = idx.unique;
        i["kind"] = idx.kind;
        indexes.push_back(std::move(i));
    }
    obj["indexes"] = std::move(indexes);
    obj["comment"] = optionalToJson(schema.comment);
    return obj;
}

json FormatConverter::toJson(const PlanResult& plan) {
    json obj = json::object();
    obj["query"] = plan.query;
    obj["analyze"] = plan.analyze;
    obj["timestamp"] = formatTimestamp(plan.timestamp);
    obj["plan"] = plan.lines;
    return obj;
}

// ============================================================================
// Utilities
// ============================================================================

std::string FormatConverter::dump(const json& value, const JSONOptions& options) {
    return options.pretty ? value.dump(options.indent) : value.dump();
}

std::string FormatConverter::formatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

}  // namespace sqlbridge
