#include "SchemaManager.hpp"
#include "ErrorHandler.hpp"
#include <sstream>

#ifdef WITH_MYSQL
#include "MySQLSchemaManager.hpp"
#endif

#ifdef WITH_POSTGRESQL
#include "PostgreSQLSchemaManager.hpp"
#endif

#ifdef WITH_SQLITE
#include "SQLiteSchemaManager.hpp"
#endif

namespace sqlbridge {

std::vector<std::string> SchemaManager::planLines(const std::vector<Row>& rows) {
    std::vector<std::string> lines;
    for (const auto& row : rows) {
        std::string text;
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) text += '\t';
            text += valueToString(row[i].second);
        }

        std::istringstream iss(text);
        std::string line;
        while (std::getline(iss, line)) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string SchemaManager::stringAt(const Row& row, size_t index) {
    return optionalStringAt(row, index).value_or("");
}

std::optional<std::string> SchemaManager::optionalStringAt(const Row& row, size_t index) {
    if (index >= row.size()) return std::nullopt;
    return asString(row[index].second);
}

std::optional<int64_t> SchemaManager::intAt(const Row& row, size_t index) {
    if (index >= row.size()) return std::nullopt;
    return asInt(row[index].second);
}

std::unique_ptr<SchemaManager> createSchemaManager(const Pool& pool,
                                                   std::chrono::milliseconds acquireTimeout) {
    return std::visit([&](const auto& p) -> std::unique_ptr<SchemaManager> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            throw DatabaseError(ErrorKind::ConnectionFailure, "Connection has no pool");
        }
#ifdef WITH_MYSQL
        else if constexpr (std::is_same_v<T, std::shared_ptr<MySQLConnectionPool>>) {
            return std::make_unique<MySQLSchemaManager>(p, acquireTimeout);
        }
#endif
#ifdef WITH_POSTGRESQL
        else if constexpr (std::is_same_v<T, std::shared_ptr<PostgreSQLConnectionPool>>) {
            return std::make_unique<PostgreSQLSchemaManager>(p, acquireTimeout);
        }
#endif
#ifdef WITH_SQLITE
        else if constexpr (std::is_same_v<T, std::shared_ptr<SQLiteConnectionPool>>) {
            return std::make_unique<SQLiteSchemaManager>(p, acquireTimeout);
        }
#endif
        else {
            throw DatabaseError(ErrorKind::ValidationError, "Unsupported connection pool");
        }
    }, pool);
}

}  // namespace sqlbridge
