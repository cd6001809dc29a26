#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statements and their results.
 *
 * Manages a sqlite3_stmt handle: binding positional parameters, stepping
 * through rows and converting columns to SqlValue. The statement is
 * finalized when the wrapper is destroyed.
 */

#include "QueryResult.hpp"
#include "Value.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @class SQLiteResultSet
 * @brief RAII wrapper for a prepared sqlite3_stmt.
 *
 * SQLite uses step() to both execute and fetch rows. Each call advances
 * to the next row (or completes the statement for DML).
 *
 * Column conversion follows the storage class of each cell, refined by
 * the declared column type:
 * - INTEGER in a BOOL/BOOLEAN column -> bool, otherwise int64
 * - TEXT in a DATE/TIME/DATETIME/TIMESTAMP column -> DateTime
 * - REAL -> double, BLOB -> Bytes, NULL -> null
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class SQLiteResultSet {
public:
    /**
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr);
    ~SQLiteResultSet();

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    sqlite3_stmt* get() const { return m_stmt; }
    bool isValid() const { return m_stmt != nullptr; }

    /**
     * @brief Bind positional parameters (1-based in SQLite, 0-based here).
     * @return SQLITE_OK, or the first failing result code.
     */
    int bind(const std::vector<SqlValue>& params);

    int parameterCount() const;

    /**
     * @brief Advance one row.
     * @return SQLITE_ROW, SQLITE_DONE or an error code.
     */
    int step();

    int columnCount() const;
    std::string columnName(int index) const;

    /// Descriptors from the declared column types
    std::vector<ColumnDescriptor> columns() const;

    /// Value of a column of the current row
    SqlValue value(int index) const;

    /// The current row as name/value pairs
    Row row() const;

    /// sqlite3_stmt_readonly(): the statement does not write the database
    bool readOnly() const;

    void reset();
    void finalize();

private:
    std::string declaredType(int index) const;

    sqlite3_stmt* m_stmt = nullptr;  ///< Prepared statement handle
};

}  // namespace sqlbridge
