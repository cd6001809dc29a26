#pragma once

#include "ConnectionRegistry.hpp"
#include "QueryResult.hpp"
#include "SchemaManager.hpp"
#include "Value.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlbridge {

// Keys keep insertion order so row objects list columns in result order
using json = nlohmann::ordered_json;

struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = false;  // true = bare array of row objects, false = full result object
};

// Renders core results for the command line
class FormatConverter {
public:
    // Query result rows as CSV; NULL is an empty field
    static std::string toCSV(const QueryResult& result, const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const QueryResult& result, const JSONOptions& options = JSONOptions{});

    static json valueToJson(const SqlValue& value);
    static json rowToJson(const Row& row, const JSONOptions& options = JSONOptions{});

    static json toJson(const QueryResult& result, const JSONOptions& options = JSONOptions{});
    static json toJson(const ColumnDescriptor& column);
    static json toJson(const ConnectionHandle& handle);
    static json toJson(const std::vector<ConnectionHandle>& handles);
    static json toJson(const HealthReport& report);
    static json toJson(const std::vector<TableInfo>& tables);
    static json toJson(const TableSchema& schema);
    static json toJson(const PlanResult& plan);
    static json toJson(const BatchResult& batch);
    static json toJson(const std::vector<TransactionItem>& items);

    static std::string dump(const json& value, const JSONOptions& options = JSONOptions{});

    // "2024-03-01T12:30:00.125Z"
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
};

}  // namespace sqlbridge
