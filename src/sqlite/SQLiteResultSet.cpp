/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of RAII SQLite prepared statement wrapper.
 */

#include "SQLiteResultSet.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace sqlbridge {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool isTemporalType(const std::string& declared) {
    return declared == "DATE" || declared == "TIME" || contains(declared, "DATETIME") ||
           contains(declared, "TIMESTAMP");
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Parameter Binding
// ============================================================================

int SQLiteResultSet::parameterCount() const {
    return m_stmt ? sqlite3_bind_parameter_count(m_stmt) : 0;
}

int SQLiteResultSet::bind(const std::vector<SqlValue>& params) {
    if (!m_stmt) return SQLITE_MISUSE;

    for (size_t i = 0; i < params.size(); ++i) {
        int index = static_cast<int>(i) + 1;
        int rc = std::visit([this, index](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(m_stmt, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(m_stmt, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(m_stmt, index, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(m_stmt, index, v.c_str(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            } else if constexpr (std::is_same_v<T, bool>) {
                return sqlite3_bind_int(m_stmt, index, v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, DateTime>) {
                return sqlite3_bind_text(m_stmt, index, v.text.c_str(), static_cast<int>(v.text.size()),
                                         SQLITE_TRANSIENT);
            } else {
                if (v.empty()) {
                    return sqlite3_bind_zeroblob(m_stmt, index, 0);
                }
                return sqlite3_bind_blob(m_stmt, index, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, params[i]);

        if (rc != SQLITE_OK) {
            return rc;
        }
    }
    return SQLITE_OK;
}

// ============================================================================
// Row Iteration
// ============================================================================

int SQLiteResultSet::step() {
    if (!m_stmt) return SQLITE_MISUSE;
    return sqlite3_step(m_stmt);
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteResultSet::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteResultSet::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

std::string SQLiteResultSet::declaredType(int index) const {
    const char* declared = m_stmt ? sqlite3_column_decltype(m_stmt, index) : nullptr;
    std::string type = declared ? declared : "";
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return type;
}

std::vector<ColumnDescriptor> SQLiteResultSet::columns() const {
    std::vector<ColumnDescriptor> result;
    int count = columnCount();
    result.reserve(count);
    for (int i = 0; i < count; ++i) {
        ColumnDescriptor column;
        column.name = columnName(i);
        // Expression columns have no declared type
        column.type = declaredType(i);
        result.push_back(std::move(column));
    }
    return result;
}

SqlValue SQLiteResultSet::value(int index) const {
    if (!m_stmt) return std::monostate{};

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_NULL:
            return std::monostate{};
        case SQLITE_INTEGER: {
            int64_t number = sqlite3_column_int64(m_stmt, index);
            if (contains(declaredType(index), "BOOL")) {
                return number != 0;
            }
            return number;
        }
        case SQLITE_FLOAT:
            return sqlite3_column_double(m_stmt, index);
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(m_stmt, index));
            int size = sqlite3_column_bytes(m_stmt, index);
            return data ? Bytes(data, data + size) : Bytes{};
        }
        default: {
            const unsigned char* text = sqlite3_column_text(m_stmt, index);
            int size = sqlite3_column_bytes(m_stmt, index);
            std::string str = text ? std::string(reinterpret_cast<const char*>(text), size) : "";
            std::string declared = declaredType(index);
            if (isTemporalType(declared)) {
                return DateTime{std::move(str), declared};
            }
            return str;
        }
    }
}

Row SQLiteResultSet::row() const {
    Row result;
    int count = columnCount();
    result.reserve(count);
    for (int i = 0; i < count; ++i) {
        result.emplace_back(columnName(i), value(i));
    }
    return result;
}

bool SQLiteResultSet::readOnly() const {
    return m_stmt && sqlite3_stmt_readonly(m_stmt) != 0;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::reset() {
    if (m_stmt) {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }
}

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace sqlbridge
