#pragma once

/**
 * @file MySQLResultSet.hpp
 * @brief RAII wrapper for MySQL result set handles.
 *
 * Owns a MYSQL_RES*, either a stored text-protocol result or the result
 * metadata of a prepared statement, and frees it on destruction.
 */

#include "QueryResult.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @class MySQLResultSet
 * @brief RAII wrapper for MYSQL_RES.
 *
 * Ensures mysql_free_result() is called when the wrapper goes out of scope.
 */
class MySQLResultSet {
public:
    /**
     * @param res MYSQL_RES handle to manage (takes ownership), or nullptr.
     */
    explicit MySQLResultSet(MYSQL_RES* res = nullptr);
    ~MySQLResultSet();

    // Non-copyable
    MySQLResultSet(const MySQLResultSet&) = delete;
    MySQLResultSet& operator=(const MySQLResultSet&) = delete;

    // Movable
    MySQLResultSet(MySQLResultSet&& other) noexcept;
    MySQLResultSet& operator=(MySQLResultSet&& other) noexcept;

    MYSQL_RES* get() const { return m_res; }

    operator bool() const { return m_res != nullptr; }

    /**
     * @brief Next row of a stored text result, nullptr when done.
     */
    MYSQL_ROW fetchRow();

    unsigned int numFields() const;

    MYSQL_FIELD* fetchFields() const;

    /**
     * @brief Column descriptors: SQL type name, NOT NULL flag, length and decimals.
     */
    std::vector<ColumnDescriptor> columns() const;

    /**
     * @brief SQL type name for a field ("VARCHAR", "BIGINT UNSIGNED", ...).
     */
    static std::string typeName(const MYSQL_FIELD& field);

    /**
     * @brief Whether a string/blob field carries the binary character set.
     */
    static bool isBinary(const MYSQL_FIELD& field);

private:
    MYSQL_RES* m_res;  ///< MySQL result set handle (owned)
};

}  // namespace sqlbridge
