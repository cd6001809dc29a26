#pragma once

#include "ConnectionInfo.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace sqlbridge {

struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error, critical, off
    std::string file;            // empty = console only
};

struct SecurityConfig {
    bool read_only = false;
    std::vector<std::string> allowed_operations = {
        "SELECT", "INSERT", "UPDATE", "DELETE", "WITH", "EXPLAIN"};
    std::vector<std::string> blocked_keywords = {
        "DROP", "TRUNCATE", "ALTER", "CREATE", "GRANT", "REVOKE"};
    size_t max_query_length = 10000;
    bool reject_multiple_statements = true;
};

struct QueryConfig {
    size_t max_rows = 10000;
    size_t default_fetch_size = 0;  // 0 = driver default
};

// Defaults applied to every [connection.*] section
struct PoolConfig {
    size_t size = 10;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds acquire_timeout{30};
    std::chrono::seconds max_idle{30 * 60};
    std::chrono::seconds max_lifetime{2 * 60 * 60};
    std::chrono::seconds statement_timeout{0};
};

// The one operation the command-line front end runs
struct CommandOptions {
    std::string action;  // health, list, schemas, tables, describe, query, update, explain
    std::vector<std::string> arguments;
    std::vector<std::string> params;
    bool analyze = false;
    std::string format = "json";  // json or csv
    bool pretty = true;
};

struct Config {
    LoggingConfig logging;
    SecurityConfig security;
    QueryConfig query;
    PoolConfig pool;
    std::vector<ConnectionInfo> connections;

    CommandOptions command;

    // Load from file. A connection without a password takes it from the environment
    // variable named by password_env, or SQLBRIDGE_PASSWORD.
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments; -c loads a file first and the command line overrides it
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;
};

}  // namespace sqlbridge
