#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlbridge {

// Backend type tag
enum class DatabaseType {
    MySQL,
    PostgreSQL,
    SQLite
};

// Convert string to DatabaseType; throws DatabaseError(ValidationError) for unknown
// or not compiled-in backends
DatabaseType parseDatabaseType(const std::string& type);

// Convert DatabaseType to string
std::string databaseTypeToString(DatabaseType type);

// Default server port for a backend, 0 for SQLite
uint16_t defaultPort(DatabaseType type);

enum class ConnectionStatus {
    Created,
    Connecting,
    Connected,
    Error,
    Disconnected
};

std::string connectionStatusToString(ConnectionStatus status);

// Parameters of one named connection. Immutable once the registry accepts it.
struct ConnectionInfo {
    std::string id;
    DatabaseType type = DatabaseType::PostgreSQL;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string database;  // database name, or file path for SQLite
    std::string user;
    std::string password;
    size_t poolSize = 10;
    bool readOnly = false;
    std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now();

    // Timeouts and pool limits
    std::chrono::seconds connectTimeout{30};
    std::chrono::seconds acquireTimeout{30};
    std::chrono::seconds maxIdle{30 * 60};
    std::chrono::seconds maxLifetime{2 * 60 * 60};
    std::chrono::seconds statementTimeout{0};  // 0 = no limit

    // SSL options
    bool useSsl = false;
    std::string sslCa;
    std::string sslCert;
    std::string sslKey;

    // Returns a description of the first problem, or nullopt when usable
    std::optional<std::string> validate() const;

    // Copy safe to hand out or log: password replaced by a mask
    ConnectionInfo redacted() const;

    // "postgresql://user@host:5432/db" or "sqlite:/path/file.db"; never includes the password
    std::string describe() const;
};

}  // namespace sqlbridge
