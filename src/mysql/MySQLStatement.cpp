/**
 * @file MySQLStatement.cpp
 * @brief Implementation of the MySQL prepared statement wrapper.
 */

#include "MySQLStatement.hpp"
#include "MySQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <type_traits>

namespace sqlbridge {

namespace {

// bool in MySQL 8, my_bool in older and MariaDB client headers
using NullFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

// Storage that must outlive mysql_stmt_execute()
struct ParamBuffer {
    int64_t integer = 0;
    double real = 0.0;
    std::string text;
    Bytes bytes;
    NullFlag isNull = 0;
};

// std::vector<bool> cannot hand out element pointers
struct NullSlot {
    NullFlag value = 0;
};

std::string formatTime(const MYSQL_TIME& time, enum_field_types type) {
    char buffer[64];
    if (type == MYSQL_TYPE_DATE || type == MYSQL_TYPE_NEWDATE) {
        std::snprintf(buffer, sizeof(buffer), "%04u-%02u-%02u", time.year, time.month, time.day);
    } else if (type == MYSQL_TYPE_TIME) {
        std::snprintf(buffer, sizeof(buffer), "%s%02u:%02u:%02u", time.neg ? "-" : "",
                      time.hour, time.minute, time.second);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%04u-%02u-%02u %02u:%02u:%02u", time.year, time.month,
                      time.day, time.hour, time.minute, time.second);
    }

    std::string text = buffer;
    if (time.second_part > 0) {
        std::snprintf(buffer, sizeof(buffer), ".%06lu", static_cast<unsigned long>(time.second_part));
        text += buffer;
    }
    return text;
}

bool isBinaryString(const MYSQL_FIELD& field) {
    switch (field.type) {
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_STRING:
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            return MySQLResultSet::isBinary(field);
        case MYSQL_TYPE_BIT:
            return true;
        default:
            return false;
    }
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLStatement::MySQLStatement(MYSQL_STMT* stmt, std::string secret)
    : m_stmt(stmt), m_secret(std::move(secret)) {
}

MySQLStatement::~MySQLStatement() {
    if (m_stmt) {
        mysql_stmt_close(m_stmt);
    }
}

MySQLStatement::MySQLStatement(MySQLStatement&& other) noexcept
    : m_stmt(other.m_stmt), m_secret(std::move(other.m_secret)) {
    other.m_stmt = nullptr;
}

MySQLStatement& MySQLStatement::operator=(MySQLStatement&& other) noexcept {
    if (this != &other) {
        if (m_stmt) {
            mysql_stmt_close(m_stmt);
        }
        m_stmt = other.m_stmt;
        m_secret = std::move(other.m_secret);
        other.m_stmt = nullptr;
    }
    return *this;
}

unsigned long MySQLStatement::parameterCount() const {
    return m_stmt ? mysql_stmt_param_count(m_stmt) : 0;
}

// ============================================================================
// Execution
// ============================================================================

StatementResult MySQLStatement::execute(const std::vector<SqlValue>& params, size_t fetchSize,
                                        size_t maxRows) {
    if (parameterCount() != params.size()) {
        throw DatabaseError(ErrorKind::QueryExecutionError,
                            "Statement expects " + std::to_string(parameterCount()) +
                            " parameters, got " + std::to_string(params.size()));
    }

    // Input parameters
    std::vector<MYSQL_BIND> binds(params.size());
    std::vector<ParamBuffer> buffers(params.size());

    for (size_t i = 0; i < params.size(); ++i) {
        MYSQL_BIND& bind = binds[i];
        ParamBuffer& buffer = buffers[i];

        std::visit([&bind, &buffer](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                bind.buffer_type = MYSQL_TYPE_NULL;
                buffer.isNull = 1;
                bind.is_null = &buffer.isNull;
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, bool>) {
                buffer.integer = static_cast<int64_t>(v);
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &buffer.integer;
            } else if constexpr (std::is_same_v<T, double>) {
                buffer.real = v;
                bind.buffer_type = MYSQL_TYPE_DOUBLE;
                bind.buffer = &buffer.real;
            } else if constexpr (std::is_same_v<T, std::string>) {
                buffer.text = v;
                bind.buffer_type = MYSQL_TYPE_STRING;
                bind.buffer = buffer.text.data();
                bind.buffer_length = static_cast<unsigned long>(buffer.text.size());
            } else if constexpr (std::is_same_v<T, DateTime>) {
                buffer.text = v.text;
                bind.buffer_type = MYSQL_TYPE_STRING;
                bind.buffer = buffer.text.data();
                bind.buffer_length = static_cast<unsigned long>(buffer.text.size());
            } else {
                buffer.bytes = v;
                bind.buffer_type = MYSQL_TYPE_BLOB;
                bind.buffer = buffer.bytes.data();
                bind.buffer_length = static_cast<unsigned long>(buffer.bytes.size());
            }
        }, params[i]);
    }

    if (!binds.empty() && mysql_stmt_bind_param(m_stmt, binds.data())) {
        fail("bind");
    }

    MySQLResultSet metadata(mysql_stmt_result_metadata(m_stmt));

    if (metadata && fetchSize > 0) {
        unsigned long cursorType = CURSOR_TYPE_READ_ONLY;
        unsigned long prefetch = static_cast<unsigned long>(fetchSize);
        if (mysql_stmt_attr_set(m_stmt, STMT_ATTR_CURSOR_TYPE, &cursorType) ||
            mysql_stmt_attr_set(m_stmt, STMT_ATTR_PREFETCH_ROWS, &prefetch)) {
            spdlog::debug("MySQL cursor attributes rejected, fetching buffered result");
        }
    }

    if (mysql_stmt_execute(m_stmt)) {
        fail();
    }

    StatementResult result;
    if (!metadata) {
        result.affectedRows = static_cast<int64_t>(mysql_stmt_affected_rows(m_stmt));
        return result;
    }

    result.hasRows = true;
    result.columns = metadata.columns();

    unsigned int count = metadata.numFields();
    MYSQL_FIELD* fields = metadata.fetchFields();

    // Zero-length output buffers report each value's length
    std::vector<MYSQL_BIND> out(count);
    std::vector<unsigned long> lengths(count, 0);
    std::vector<NullSlot> nulls(count);
    for (unsigned int i = 0; i < count; ++i) {
        out[i].buffer_type = MYSQL_TYPE_STRING;
        out[i].buffer = nullptr;
        out[i].buffer_length = 0;
        out[i].length = &lengths[i];
        out[i].is_null = &nulls[i].value;
    }

    if (count > 0 && mysql_stmt_bind_result(m_stmt, out.data())) {
        fail("bind result");
    }

    if (fetchSize == 0 && mysql_stmt_store_result(m_stmt)) {
        fail("store result");
    }

    while (true) {
        int rc = mysql_stmt_fetch(m_stmt);
        if (rc == MYSQL_NO_DATA) {
            break;
        }
        if (rc == 1) {
            fail("fetch");
        }
        // 0 or MYSQL_DATA_TRUNCATED: values are read column by column below
        if (maxRows > 0 && result.rows.size() >= maxRows) {
            result.truncated = true;
            break;
        }

        Row row;
        row.reserve(count);
        for (unsigned int i = 0; i < count; ++i) {
            if (nulls[i].value) {
                row.emplace_back(fields[i].name, std::monostate{});
            } else {
                row.emplace_back(fields[i].name, readColumn(i, fields[i], lengths[i]));
            }
        }
        result.rows.push_back(std::move(row));
    }

    mysql_stmt_free_result(m_stmt);
    result.affectedRows = static_cast<int64_t>(result.rows.size());
    return result;
}

SqlValue MySQLStatement::readColumn(unsigned int index, const MYSQL_FIELD& field, unsigned long length) {
    MYSQL_BIND bind{};
    unsigned long fetched = 0;
    bind.length = &fetched;

    switch (field.type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR: {
            int64_t number = 0;
            bind.buffer_type = MYSQL_TYPE_LONGLONG;
            bind.buffer = &number;
            bind.is_unsigned = (field.flags & UNSIGNED_FLAG) != 0;
            if (mysql_stmt_fetch_column(m_stmt, &bind, index, 0)) fail("fetch column");
            return number;
        }
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE: {
            double real = 0.0;
            bind.buffer_type = MYSQL_TYPE_DOUBLE;
            bind.buffer = &real;
            if (mysql_stmt_fetch_column(m_stmt, &bind, index, 0)) fail("fetch column");
            return real;
        }
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP: {
            MYSQL_TIME time{};
            bind.buffer_type = field.type == MYSQL_TYPE_NEWDATE ? MYSQL_TYPE_DATE : field.type;
            bind.buffer = &time;
            bind.buffer_length = sizeof(time);
            if (mysql_stmt_fetch_column(m_stmt, &bind, index, 0)) fail("fetch column");
            return DateTime{formatTime(time, field.type), MySQLResultSet::typeName(field)};
        }
        default:
            break;
    }

    std::string data(length, '\0');
    if (length > 0) {
        bind.buffer_type = MYSQL_TYPE_STRING;
        bind.buffer = data.data();
        bind.buffer_length = length;
        if (mysql_stmt_fetch_column(m_stmt, &bind, index, 0)) fail("fetch column");
        data.resize(std::min(fetched, length));
    }

    if (isBinaryString(field)) {
        return Bytes(data.begin(), data.end());
    }
    return data;
}

void MySQLStatement::fail(const std::string& context) {
    unsigned int code = mysql_stmt_errno(m_stmt);
    std::string message = mysql_stmt_error(m_stmt);
    if (!context.empty()) {
        message = context + ": " + message;
    }
    throw DatabaseError(ErrorHandler::classifyMySQL(code), ErrorHandler::redact(message, m_secret),
                        std::to_string(code), ErrorHandler::isRetryableMySQL(code));
}

}  // namespace sqlbridge
