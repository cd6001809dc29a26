/**
 * @file MySQLResultSet.cpp
 * @brief Implementation of RAII MySQL result set wrapper.
 */

#include "MySQLResultSet.hpp"

namespace sqlbridge {

namespace {

// Character set number of the binary collation
constexpr unsigned int kBinaryCharset = 63;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLResultSet::MySQLResultSet(MYSQL_RES* res) : m_res(res) {}

MySQLResultSet::~MySQLResultSet() {
    if (m_res) {
        mysql_free_result(m_res);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

MySQLResultSet::MySQLResultSet(MySQLResultSet&& other) noexcept : m_res(other.m_res) {
    other.m_res = nullptr;
}

MySQLResultSet& MySQLResultSet::operator=(MySQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            mysql_free_result(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

// ============================================================================
// Row and Field Access
// ============================================================================

MYSQL_ROW MySQLResultSet::fetchRow() {
    return m_res ? mysql_fetch_row(m_res) : nullptr;
}

unsigned int MySQLResultSet::numFields() const {
    return m_res ? mysql_num_fields(m_res) : 0;
}

MYSQL_FIELD* MySQLResultSet::fetchFields() const {
    return m_res ? mysql_fetch_fields(m_res) : nullptr;
}

std::vector<ColumnDescriptor> MySQLResultSet::columns() const {
    std::vector<ColumnDescriptor> result;
    if (!m_res) return result;

    unsigned int count = mysql_num_fields(m_res);
    MYSQL_FIELD* fields = mysql_fetch_fields(m_res);
    result.reserve(count);

    for (unsigned int i = 0; i < count; ++i) {
        ColumnDescriptor column;
        column.name = fields[i].name;
        column.type = typeName(fields[i]);
        column.nullable = (fields[i].flags & NOT_NULL_FLAG) == 0;
        column.precision = static_cast<int>(fields[i].length);
        column.scale = static_cast<int>(fields[i].decimals);
        result.push_back(std::move(column));
    }

    return result;
}

bool MySQLResultSet::isBinary(const MYSQL_FIELD& field) {
    return field.charsetnr == kBinaryCharset;
}

std::string MySQLResultSet::typeName(const MYSQL_FIELD& field) {
    std::string name;
    switch (field.type) {
        case MYSQL_TYPE_TINY:        name = "TINYINT"; break;
        case MYSQL_TYPE_SHORT:       name = "SMALLINT"; break;
        case MYSQL_TYPE_INT24:       name = "MEDIUMINT"; break;
        case MYSQL_TYPE_LONG:        name = "INT"; break;
        case MYSQL_TYPE_LONGLONG:    name = "BIGINT"; break;
        case MYSQL_TYPE_FLOAT:       name = "FLOAT"; break;
        case MYSQL_TYPE_DOUBLE:      name = "DOUBLE"; break;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:  name = "DECIMAL"; break;
        case MYSQL_TYPE_BIT:         name = "BIT"; break;
        case MYSQL_TYPE_YEAR:        name = "YEAR"; break;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:     name = "DATE"; break;
        case MYSQL_TYPE_TIME:        name = "TIME"; break;
        case MYSQL_TYPE_DATETIME:    name = "DATETIME"; break;
        case MYSQL_TYPE_TIMESTAMP:   name = "TIMESTAMP"; break;
        case MYSQL_TYPE_JSON:        name = "JSON"; break;
        case MYSQL_TYPE_ENUM:        name = "ENUM"; break;
        case MYSQL_TYPE_SET:         name = "SET"; break;
        case MYSQL_TYPE_GEOMETRY:    name = "GEOMETRY"; break;
        case MYSQL_TYPE_NULL:        name = "NULL"; break;
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:        name = isBinary(field) ? "BLOB" : "TEXT"; break;
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_VAR_STRING:  name = isBinary(field) ? "VARBINARY" : "VARCHAR"; break;
        case MYSQL_TYPE_STRING:      name = isBinary(field) ? "BINARY" : "CHAR"; break;
        default:                     name = "UNKNOWN"; break;
    }

    if ((field.flags & UNSIGNED_FLAG) && field.type != MYSQL_TYPE_BIT &&
        field.type != MYSQL_TYPE_YEAR && field.type != MYSQL_TYPE_TIMESTAMP) {
        name += " UNSIGNED";
    }
    return name;
}

}  // namespace sqlbridge
