#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL PGresult handles.
 *
 * Owns a PGresult* and converts its text-format cells into SqlValue
 * according to the column type OID.
 */

#include "QueryResult.hpp"
#include "Value.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>
#include <cstdint>

namespace sqlbridge {

/**
 * @class PostgreSQLResultSet
 * @brief Owns one PGresult and calls PQclear() on destruction.
 *
 * Cell conversion by type OID:
 * - bool -> bool, int2/int4/int8/oid -> int64, float4/float8 -> double
 * - numeric -> string (exact decimal text)
 * - date/time/timestamp[tz]/timetz -> DateTime
 * - bytea -> Bytes (via PQunescapeBytea)
 * - everything else -> string
 */
class PostgreSQLResultSet {
public:
    explicit PostgreSQLResultSet(PGresult* res = nullptr);
    ~PostgreSQLResultSet();

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    PGresult* get() const { return m_res; }

    /// COMMAND_OK, TUPLES_OK or SINGLE_TUPLE
    bool isOk() const;

    /// Result carries a row description (possibly with zero rows)
    bool hasData() const;

    ExecStatusType status() const;
    const char* errorMessage() const;

    /// Five-character SQLSTATE, empty when the result is missing
    std::string sqlstate() const;

    int numFields() const;
    int numRows() const;

    /// Column descriptors with libpq type names and typmod-derived precision/scale
    std::vector<ColumnDescriptor> columns() const;

    SqlValue value(int row, int col) const;
    Row row(int index) const;

    /// Rows touched by INSERT/UPDATE/DELETE, parsed from PQcmdTuples()
    int64_t affectedRows() const;

    void reset(PGresult* res = nullptr);
    PGresult* release();

    /// Name of a built-in type OID, "oid:<n>" for anything else
    static std::string typeName(Oid oid);

private:
    PGresult* m_res;  ///< PostgreSQL result handle (owned)
};

}  // namespace sqlbridge
