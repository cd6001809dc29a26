#pragma once

#include "ErrorHandler.hpp"
#include "Value.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlbridge {

struct ColumnDescriptor {
    std::string name;
    std::string type;       // backend type name
    bool nullable = true;   // true when the backend cannot tell
    int precision = 0;
    int scale = 0;
};

// Outcome of a top-level query. Failures are reported in-band, never thrown.
struct QueryResult {
    bool success = false;
    std::vector<Row> rows;
    std::vector<ColumnDescriptor> columns;
    size_t rowCount = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<std::string> error;
    std::optional<ErrorKind> errorKind;
    bool retryable = false;  // the failure is transient; the same call may succeed
    std::optional<std::vector<std::string>> executionPlan;
    bool hasMore = false;  // rows were cut at the configured row limit
};

// What a backend connection hands back for one executed statement
struct StatementResult {
    bool hasRows = false;   // statement produced a result set
    std::vector<ColumnDescriptor> columns;
    std::vector<Row> rows;
    int64_t affectedRows = 0;
    bool truncated = false;
};

struct TransactionStatement {
    std::string sql;
    std::vector<SqlValue> params;
};

// A transaction step yields rows or an affected-row count
using TransactionItem = std::variant<QueryResult, int64_t>;

// Per-parameter-set affected counts. When the batch stopped early, counts holds
// the sets applied before failedIndex.
struct BatchResult {
    std::vector<int64_t> counts;
    std::optional<size_t> failedIndex;
    std::optional<std::string> error;
    std::optional<ErrorKind> errorKind;
    bool retryable = false;

    bool complete() const { return !failedIndex.has_value(); }
};

}  // namespace sqlbridge
