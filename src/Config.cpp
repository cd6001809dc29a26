#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <map>
#include <set>

namespace sqlbridge {

namespace {

const std::string kConnectionPrefix = "connection.";

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            if (!trim(current).empty()) {
                result.push_back(trim(current));
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trim(current).empty()) {
        result.push_back(trim(current));
    }
    return result;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::chrono::seconds parseSeconds(const std::string& value) {
    return std::chrono::seconds(std::stol(value));
}

using Section = std::map<std::string, std::string>;

ConnectionInfo buildConnection(const std::string& id, const Section& section, const PoolConfig& pool) {
    ConnectionInfo info;
    info.id = id;
    info.poolSize = pool.size;
    info.connectTimeout = pool.connect_timeout;
    info.acquireTimeout = pool.acquire_timeout;
    info.maxIdle = pool.max_idle;
    info.maxLifetime = pool.max_lifetime;
    info.statementTimeout = pool.statement_timeout;

    auto type = section.find("type");
    info.type = parseDatabaseType(type != section.end() ? type->second : "postgresql");
    info.port = defaultPort(info.type);

    std::string passwordEnv = "SQLBRIDGE_PASSWORD";

    for (const auto& [key, value] : section) {
        if (key == "host") info.host = value;
        else if (key == "port") info.port = static_cast<uint16_t>(std::stoi(value));
        else if (key == "database" || key == "path") info.database = value;
        else if (key == "user") info.user = value;
        else if (key == "password") info.password = value;
        else if (key == "password_env") passwordEnv = value;
        else if (key == "pool_size") info.poolSize = static_cast<size_t>(std::stoul(value));
        else if (key == "read_only") info.readOnly = parseBool(value);
        else if (key == "connect_timeout") info.connectTimeout = parseSeconds(value);
        else if (key == "acquire_timeout") info.acquireTimeout = parseSeconds(value);
        else if (key == "max_idle") info.maxIdle = parseSeconds(value);
        else if (key == "max_lifetime") info.maxLifetime = parseSeconds(value);
        else if (key == "statement_timeout") info.statementTimeout = parseSeconds(value);
        else if (key == "ssl") info.useSsl = parseBool(value);
        else if (key == "ssl_ca") info.sslCa = value;
        else if (key == "ssl_cert") info.sslCert = value;
        else if (key == "ssl_key") info.sslKey = value;
        else if (key != "type") spdlog::warn("Unknown key '{}' in [connection.{}]", key, id);
    }

    if (info.password.empty() && info.type != DatabaseType::SQLite) {
        const char* env_pwd = std::getenv(passwordEnv.c_str());
        if (env_pwd) {
            info.password = env_pwd;
        }
    }

    return info;
}

void applyKey(Config& config, const std::string& section, const std::string& key,
              const std::string& value) {
    if (section == "logging") {
        if (key == "level") config.logging.level = value;
        else if (key == "file") config.logging.file = value;
    }
    else if (section == "security") {
        if (key == "read_only")
            config.security.read_only = parseBool(value);
        else if (key == "allowed_operations")
            config.security.allowed_operations = split(value, ',');
        else if (key == "blocked_keywords")
            config.security.blocked_keywords = split(value, ',');
        else if (key == "max_query_length")
            config.security.max_query_length = static_cast<size_t>(std::stoul(value));
        else if (key == "reject_multiple_statements")
            config.security.reject_multiple_statements = parseBool(value);
    }
    else if (section == "query") {
        if (key == "max_rows")
            config.query.max_rows = static_cast<size_t>(std::stoul(value));
        else if (key == "default_fetch_size")
            config.query.default_fetch_size = static_cast<size_t>(std::stoul(value));
    }
    else if (section == "pool") {
        if (key == "size") config.pool.size = static_cast<size_t>(std::stoul(value));
        else if (key == "connect_timeout") config.pool.connect_timeout = parseSeconds(value);
        else if (key == "acquire_timeout") config.pool.acquire_timeout = parseSeconds(value);
        else if (key == "max_idle") config.pool.max_idle = parseSeconds(value);
        else if (key == "max_lifetime") config.pool.max_lifetime = parseSeconds(value);
        else if (key == "statement_timeout") config.pool.statement_timeout = parseSeconds(value);
    }
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    // Connection sections are resolved after the whole file is read so that
    // [pool] defaults apply regardless of section order
    std::vector<std::pair<std::string, Section>> connection_sections;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            if (current_section.rfind(kConnectionPrefix, 0) == 0) {
                connection_sections.emplace_back(current_section.substr(kConnectionPrefix.size()),
                                                 Section{});
            }
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (current_section.rfind(kConnectionPrefix, 0) == 0) {
            connection_sections.back().second[key] = value;
            continue;
        }

        try {
            applyKey(config, current_section, key, value);
        } catch (const std::exception& e) {
            spdlog::warn("{}:{}: ignoring invalid value for '{}': {}",
                         path.string(), line_number, key, e.what());
        }
    }

    for (const auto& [id, section] : connection_sections) {
        try {
            config.connections.push_back(buildConnection(id, section, config.pool));
        } catch (const std::exception& e) {
            spdlog::error("{}: invalid [connection.{}]: {}", path.string(), id, e.what());
            return std::nullopt;
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"sql-bridge - safe uniform access to MySQL, PostgreSQL and SQLite"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file")
        ->check(CLI::ExistingFile);

    std::string log_level;
    std::string log_file;
    bool read_only = false;
    size_t max_rows = 0;
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--log-file", log_file, "Also write logs to this file");
    app.add_flag("--read-only", read_only, "Reject every statement except SELECT/WITH/EXPLAIN");
    app.add_option("--max-rows", max_rows, "Maximum rows returned by a query");

    CommandOptions command;
    app.add_option("--format", command.format, "Output format")
        ->check(CLI::IsMember({"json", "csv"}));
    app.add_flag_callback("--compact", [&command]() { command.pretty = false; },
                 "Print JSON on a single line");
    app.add_option("--param", command.params, "Positional parameter for ? / $n placeholders");
    app.add_flag("--analyze", command.analyze, "Run EXPLAIN with ANALYZE (executes the statement)");

    // Exactly one action
    auto* actions = app.add_option_group("actions", "Operation to run");
    bool health = false;
    bool list = false;
    std::vector<std::string> schemas_args, tables_args, describe_args;
    std::vector<std::string> query_args, update_args, explain_args;
    actions->add_flag("--health", health, "Check every configured connection");
    actions->add_flag("--list", list, "List configured connections");
    actions->add_option("--schemas", schemas_args, "List schemas: ID")->expected(1);
    actions->add_option("--tables", tables_args, "List tables: ID SCHEMA")->expected(2);
    actions->add_option("--describe", describe_args, "Describe a table: ID SCHEMA TABLE")->expected(3);
    actions->add_option("--query", query_args, "Run a query: ID SQL")->expected(2);
    actions->add_option("--update", update_args, "Run an update: ID SQL")->expected(2);
    actions->add_option("--explain", explain_args, "Explain a query: ID SQL")->expected(2);
    actions->require_option(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = std::move(*file_config);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line overrides the file
    if (!log_level.empty()) config.logging.level = log_level;
    if (!log_file.empty()) config.logging.file = log_file;
    if (read_only) config.security.read_only = true;
    if (max_rows > 0) config.query.max_rows = max_rows;

    if (health) {
        command.action = "health";
    } else if (list) {
        command.action = "list";
    } else if (!schemas_args.empty()) {
        command.action = "schemas";
        command.arguments = schemas_args;
    } else if (!tables_args.empty()) {
        command.action = "tables";
        command.arguments = tables_args;
    } else if (!describe_args.empty()) {
        command.action = "describe";
        command.arguments = describe_args;
    } else if (!query_args.empty()) {
        command.action = "query";
        command.arguments = query_args;
    } else if (!update_args.empty()) {
        command.action = "update";
        command.arguments = update_args;
    } else if (!explain_args.empty()) {
        command.action = "explain";
        command.arguments = explain_args;
    }
    config.command = std::move(command);

    return config;
}

bool Config::validate() const {
    std::set<std::string> ids;
    for (const auto& connection : connections) {
        if (auto problem = connection.validate()) {
            spdlog::error("Invalid connection: {}", *problem);
            return false;
        }
        if (!ids.insert(connection.id).second) {
            spdlog::error("Duplicate connection id: {}", connection.id);
            return false;
        }
        if (connection.useSsl) {
            for (const auto& file : {connection.sslCa, connection.sslCert, connection.sslKey}) {
                if (!file.empty() && !std::filesystem::exists(file)) {
                    spdlog::error("SSL file not found for connection '{}': {}", connection.id, file);
                    return false;
                }
            }
        }
    }

    if (security.max_query_length == 0) {
        spdlog::error("max_query_length must be positive");
        return false;
    }

    if (query.max_rows == 0) {
        spdlog::error("max_rows must be positive");
        return false;
    }

    return true;
}

}  // namespace sqlbridge
