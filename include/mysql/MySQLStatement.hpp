#pragma once

/**
 * @file MySQLStatement.hpp
 * @brief RAII wrapper for MySQL server-side prepared statements.
 */

#include "QueryResult.hpp"
#include "Value.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace sqlbridge {

/**
 * @class MySQLStatement
 * @brief Owns a MYSQL_STMT and calls mysql_stmt_close() on destruction.
 *
 * Parameters are bound positionally (? placeholders). Result columns are
 * fetched with zero-length buffers first and then read one by one with
 * mysql_stmt_fetch_column() into a buffer of the reported size:
 * - integer types -> int64, FLOAT/DOUBLE -> double
 * - DECIMAL -> string (exact decimal text)
 * - DATE/TIME/DATETIME/TIMESTAMP -> DateTime
 * - binary-charset strings and blobs, BIT -> Bytes
 *
 * Failures throw DatabaseError classified from mysql_stmt_errno().
 */
class MySQLStatement {
public:
    /**
     * @param stmt Prepared statement handle (takes ownership).
     * @param secret Password removed from diagnostics.
     */
    MySQLStatement(MYSQL_STMT* stmt, std::string secret);
    ~MySQLStatement();

    MySQLStatement(const MySQLStatement&) = delete;
    MySQLStatement& operator=(const MySQLStatement&) = delete;

    MySQLStatement(MySQLStatement&& other) noexcept;
    MySQLStatement& operator=(MySQLStatement&& other) noexcept;

    MYSQL_STMT* get() const { return m_stmt; }

    unsigned long parameterCount() const;

    /**
     * @brief Bind, execute and collect rows or the affected-row count.
     * @param fetchSize When > 0, a read-only cursor prefetching this many rows
     *        is used instead of buffering the whole result.
     * @param maxRows When > 0, rows past this limit are discarded and the
     *        result is marked truncated.
     */
    StatementResult execute(const std::vector<SqlValue>& params, size_t fetchSize = 0,
                            size_t maxRows = 0);

private:
    SqlValue readColumn(unsigned int index, const MYSQL_FIELD& field, unsigned long length);
    [[noreturn]] void fail(const std::string& context = {});

    MYSQL_STMT* m_stmt;
    std::string m_secret;
};

}  // namespace sqlbridge
