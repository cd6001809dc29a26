#include "PostgreSQLResultSet.hpp"
#include <cstdlib>
#include <unordered_map>

namespace sqlbridge {

namespace {

// Built-in type OIDs from pg_type.dat
constexpr Oid kBoolOid = 16;
constexpr Oid kByteaOid = 17;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kOidOid = 26;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;
constexpr Oid kBpcharOid = 1042;
constexpr Oid kVarcharOid = 1043;
constexpr Oid kDateOid = 1082;
constexpr Oid kTimeOid = 1083;
constexpr Oid kTimestampOid = 1114;
constexpr Oid kTimestamptzOid = 1184;
constexpr Oid kTimetzOid = 1266;
constexpr Oid kNumericOid = 1700;

constexpr int kVarHdrSz = 4;

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(other.m_res) {
    other.m_res = nullptr;
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            PQclear(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

bool PostgreSQLResultSet::isOk() const {
    if (!m_res) return false;
    ExecStatusType s = PQresultStatus(m_res);
    return s == PGRES_COMMAND_OK || s == PGRES_TUPLES_OK || s == PGRES_SINGLE_TUPLE;
}

bool PostgreSQLResultSet::hasData() const {
    if (!m_res) return false;
    ExecStatusType s = PQresultStatus(m_res);
    return s == PGRES_TUPLES_OK || s == PGRES_SINGLE_TUPLE;
}

ExecStatusType PostgreSQLResultSet::status() const {
    return m_res ? PQresultStatus(m_res) : PGRES_FATAL_ERROR;
}

const char* PostgreSQLResultSet::errorMessage() const {
    return m_res ? PQresultErrorMessage(m_res) : "No result";
}

std::string PostgreSQLResultSet::sqlstate() const {
    if (!m_res) return "";
    const char* state = PQresultErrorField(m_res, PG_DIAG_SQLSTATE);
    return state ? state : "";
}

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

std::vector<ColumnDescriptor> PostgreSQLResultSet::columns() const {
    std::vector<ColumnDescriptor> result;
    int nFields = numFields();
    result.reserve(nFields);

    for (int i = 0; i < nFields; ++i) {
        ColumnDescriptor column;
        const char* name = PQfname(m_res, i);
        column.name = name ? name : "";
        Oid oid = PQftype(m_res, i);
        column.type = typeName(oid);

        int mod = PQfmod(m_res, i);
        if (mod >= kVarHdrSz) {
            if (oid == kNumericOid) {
                column.precision = ((mod - kVarHdrSz) >> 16) & 0xffff;
                column.scale = (mod - kVarHdrSz) & 0xffff;
            } else if (oid == kVarcharOid || oid == kBpcharOid) {
                column.precision = mod - kVarHdrSz;
            }
        }
        result.push_back(std::move(column));
    }

    return result;
}

SqlValue PostgreSQLResultSet::value(int row, int col) const {
    if (!m_res || row < 0 || row >= numRows() || col < 0 || col >= numFields()) {
        return std::monostate{};
    }
    if (PQgetisnull(m_res, row, col)) {
        return std::monostate{};
    }

    const char* text = PQgetvalue(m_res, row, col);
    Oid oid = PQftype(m_res, col);

    switch (oid) {
        case kBoolOid:
            return text[0] == 't';
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
        case kOidOid:
            return static_cast<int64_t>(std::strtoll(text, nullptr, 10));
        case kFloat4Oid:
        case kFloat8Oid:
            return std::strtod(text, nullptr);
        case kDateOid:
        case kTimeOid:
        case kTimestampOid:
        case kTimestamptzOid:
        case kTimetzOid:
            return DateTime{text, typeName(oid)};
        case kByteaOid: {
            size_t length = 0;
            unsigned char* raw = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &length);
            if (!raw) {
                return std::string(text);
            }
            Bytes bytes(raw, raw + length);
            PQfreemem(raw);
            return bytes;
        }
        default:
            return std::string(text, static_cast<size_t>(PQgetlength(m_res, row, col)));
    }
}

Row PostgreSQLResultSet::row(int index) const {
    Row result;
    int nFields = numFields();
    result.reserve(nFields);
    for (int col = 0; col < nFields; ++col) {
        const char* name = PQfname(m_res, col);
        result.emplace_back(name ? name : "", value(index, col));
    }
    return result;
}

int64_t PostgreSQLResultSet::affectedRows() const {
    if (!m_res) return 0;
    const char* affected = PQcmdTuples(m_res);
    if (!affected || !*affected) return 0;
    return std::strtoll(affected, nullptr, 10);
}

void PostgreSQLResultSet::reset(PGresult* res) {
    if (m_res) {
        PQclear(m_res);
    }
    m_res = res;
}

PGresult* PostgreSQLResultSet::release() {
    PGresult* res = m_res;
    m_res = nullptr;
    return res;
}

std::string PostgreSQLResultSet::typeName(Oid oid) {
    static const std::unordered_map<Oid, std::string> names = {
        {16, "bool"}, {17, "bytea"}, {18, "char"}, {19, "name"},
        {20, "int8"}, {21, "int2"}, {23, "int4"}, {25, "text"},
        {26, "oid"}, {114, "json"}, {142, "xml"}, {700, "float4"},
        {701, "float8"}, {790, "money"}, {1042, "bpchar"}, {1043, "varchar"},
        {1082, "date"}, {1083, "time"}, {1114, "timestamp"}, {1184, "timestamptz"},
        {1186, "interval"}, {1266, "timetz"}, {1560, "bit"}, {1562, "varbit"},
        {1700, "numeric"}, {2950, "uuid"}, {3802, "jsonb"},
    };

    auto it = names.find(oid);
    if (it != names.end()) {
        return it->second;
    }
    return "oid:" + std::to_string(oid);
}

}  // namespace sqlbridge
