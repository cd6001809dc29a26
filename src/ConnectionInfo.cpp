#include "ConnectionInfo.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>

namespace sqlbridge {

DatabaseType parseDatabaseType(const std::string& type) {
    std::string lower = type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "mysql" || lower == "mariadb") {
#ifdef WITH_MYSQL
        return DatabaseType::MySQL;
#else
        throw DatabaseError(ErrorKind::ValidationError,
                            "MySQL support not compiled in. Rebuild with -DWITH_MYSQL=ON");
#endif
    } else if (lower == "postgresql" || lower == "postgres" || lower == "pgsql") {
#ifdef WITH_POSTGRESQL
        return DatabaseType::PostgreSQL;
#else
        throw DatabaseError(ErrorKind::ValidationError,
                            "PostgreSQL support not compiled in. Rebuild with -DWITH_POSTGRESQL=ON");
#endif
    } else if (lower == "sqlite" || lower == "sqlite3") {
#ifdef WITH_SQLITE
        return DatabaseType::SQLite;
#else
        throw DatabaseError(ErrorKind::ValidationError,
                            "SQLite support not compiled in. Rebuild with -DWITH_SQLITE=ON");
#endif
    }

    throw DatabaseError(ErrorKind::ValidationError, "Unknown database type: " + type);
}

std::string databaseTypeToString(DatabaseType type) {
    switch (type) {
        case DatabaseType::MySQL:
            return "mysql";
        case DatabaseType::PostgreSQL:
            return "postgresql";
        case DatabaseType::SQLite:
            return "sqlite";
    }
    return "unknown";
}

uint16_t defaultPort(DatabaseType type) {
    switch (type) {
        case DatabaseType::MySQL:
            return 3306;
        case DatabaseType::PostgreSQL:
            return 5432;
        case DatabaseType::SQLite:
            return 0;
    }
    return 0;
}

std::string connectionStatusToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Created:      return "CREATED";
        case ConnectionStatus::Connecting:   return "CONNECTING";
        case ConnectionStatus::Connected:    return "CONNECTED";
        case ConnectionStatus::Error:        return "ERROR";
        case ConnectionStatus::Disconnected: return "DISCONNECTED";
    }
    return "UNKNOWN";
}

std::optional<std::string> ConnectionInfo::validate() const {
    if (id.empty()) {
        return "connection id is required";
    }
    if (poolSize == 0) {
        return "pool size must be at least 1";
    }
    if (connectTimeout.count() <= 0 || acquireTimeout.count() <= 0) {
        return "connect and acquire timeouts must be positive";
    }

    if (type == DatabaseType::SQLite) {
        if (database.empty()) {
            return "SQLite connection '" + id + "' requires a database file path";
        }
        return std::nullopt;
    }

    if (host.empty()) {
        return "connection '" + id + "' requires a host";
    }
    if (port == 0) {
        return "connection '" + id + "' requires a port";
    }
    if (user.empty()) {
        return "connection '" + id + "' requires a user";
    }
    return std::nullopt;
}

ConnectionInfo ConnectionInfo::redacted() const {
    ConnectionInfo copy = *this;
    if (!copy.password.empty()) {
        copy.password = "********";
    }
    return copy;
}

std::string ConnectionInfo::describe() const {
    if (type == DatabaseType::SQLite) {
        return "sqlite:" + database;
    }
    std::string result = databaseTypeToString(type) + "://";
    if (!user.empty()) {
        result += user + "@";
    }
    result += host + ":" + std::to_string(port);
    if (!database.empty()) {
        result += "/" + database;
    }
    return result;
}

}  // namespace sqlbridge
