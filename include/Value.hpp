#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqlbridge {

// Temporal value kept in the backend's textual form, e.g. "2024-03-01 12:30:00"
struct DateTime {
    std::string text;
    std::string type;  // DATE, TIME, TIMESTAMP, ...

    bool operator==(const DateTime& other) const {
        return text == other.text && type == other.type;
    }
};

using Bytes = std::vector<uint8_t>;

// A single bound parameter or result cell.
// Construct integers as int64_t and strings as std::string: a bare
// `const char*` converts to bool before it converts to std::string.
using SqlValue = std::variant<std::monostate, int64_t, double, std::string, bool, DateTime, Bytes>;

// One result row: column name -> value, in result column order
using Row = std::vector<std::pair<std::string, SqlValue>>;

inline bool isNull(const SqlValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

// Textual rendering used for CSV output and plan lines; bytes become hex, null becomes ""
std::string valueToString(const SqlValue& value);

// "null", "integer", "double", "string", "boolean", "datetime" or "bytes"
const char* valueTypeName(const SqlValue& value);

// Lenient accessors used when reading catalog rows
std::optional<std::string> asString(const SqlValue& value);
std::optional<int64_t> asInt(const SqlValue& value);
bool asBool(const SqlValue& value);

// Lookup by column name; nullptr when the row has no such column
const SqlValue* findColumn(const Row& row, const std::string& name);

}  // namespace sqlbridge
