#include "Config.hpp"
#include "ConnectionRegistry.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "QueryExecutor.hpp"
#include "SchemaIntrospector.hpp"
#include "SqlSafetyPolicy.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace sqlbridge;

namespace {

void setupLogging(const LoggingConfig& logging) {
    try {
        auto level = spdlog::level::from_str(logging.level);
        std::vector<spdlog::sink_ptr> sinks;

        // Results go to stdout, so diagnostics go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!logging.file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logging.file << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-bridge", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

std::vector<SqlValue> toParams(const std::vector<std::string>& raw) {
    std::vector<SqlValue> params;
    params.reserve(raw.size());
    for (const auto& value : raw) {
        params.emplace_back(value);
    }
    return params;
}

// Registers every configured connection; returns the number that failed
size_t registerConnections(ConnectionRegistry& registry, const Config& config) {
    size_t failed = 0;
    for (const auto& info : config.connections) {
        try {
            registry.addConnection(info);
        } catch (const DatabaseError& e) {
            spdlog::error("Connection '{}' unavailable: {}", info.id, e.what());
            failed++;
        }
    }
    return failed;
}

int runCommand(const Config& config, ConnectionRegistry& registry) {
    const CommandOptions& command = config.command;
    const auto& args = command.arguments;

    JSONOptions jsonOptions;
    jsonOptions.pretty = command.pretty;

    SqlSafetyPolicy policy(config.security);
    QueryExecutor executor(registry, policy, config.query);
    SchemaIntrospector introspector(registry, policy);

    if (command.action == "health") {
        HealthReport report = registry.healthCheck();
        std::cout << FormatConverter::dump(FormatConverter::toJson(report), jsonOptions) << std::endl;
        return report.healthy == config.connections.size() ? 0 : 1;
    }

    if (command.action == "list") {
        std::cout << FormatConverter::dump(FormatConverter::toJson(registry.listConnections()), jsonOptions)
                  << std::endl;
        return 0;
    }

    if (command.action == "schemas") {
        json schemas = introspector.listSchemas(args.at(0));
        std::cout << FormatConverter::dump(schemas, jsonOptions) << std::endl;
        return 0;
    }

    if (command.action == "tables") {
        auto tables = introspector.listTables(args.at(0), args.at(1));
        std::cout << FormatConverter::dump(FormatConverter::toJson(tables), jsonOptions) << std::endl;
        return 0;
    }

    if (command.action == "describe") {
        auto schema = introspector.getTableSchema(args.at(0), args.at(2), args.at(1));
        std::cout << FormatConverter::dump(FormatConverter::toJson(schema), jsonOptions) << std::endl;
        return 0;
    }

    if (command.action == "query") {
        QueryResult result = executor.executeQuery(args.at(0), args.at(1), toParams(command.params));
        if (command.format == "csv" && result.success) {
            std::cout << FormatConverter::toCSV(result);
        } else {
            std::cout << FormatConverter::toJSON(result, jsonOptions) << std::endl;
        }
        return result.success ? 0 : 1;
    }

    if (command.action == "update") {
        int64_t affected = executor.executeUpdate(args.at(0), args.at(1), toParams(command.params));
        json out = json::object();
        out["affectedRows"] = affected;
        std::cout << FormatConverter::dump(out, jsonOptions) << std::endl;
        return 0;
    }

    if (command.action == "explain") {
        PlanResult plan = introspector.explainQuery(args.at(0), args.at(1), command.analyze);
        std::cout << FormatConverter::dump(FormatConverter::toJson(plan), jsonOptions) << std::endl;
        return 0;
    }

    spdlog::error("Unknown action: {}", command.action);
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    spdlog::info("Starting sql-bridge with {} configured connections", config.connections.size());

    ConnectionRegistry registry;
    size_t failed = registerConnections(registry, config);
    if (failed > 0 && config.command.action != "health") {
        spdlog::warn("{} of {} connections could not be registered", failed, config.connections.size());
    }

    int result = 1;
    try {
        result = runCommand(config, registry);
    } catch (const DatabaseError& e) {
        json out = json::object();
        out["error"] = e.what();
        out["errorKind"] = errorKindName(e.kind());
        out["retryable"] = e.retryable();
        if (auto txn = dynamic_cast<const TransactionError*>(&e)) {
            out["failedIndex"] = txn->failedIndex();
        }
        std::cout << out.dump(2) << std::endl;
        spdlog::error("{} failed: {}", config.command.action, e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", config.command.action, e.what());
    }

    registry.shutdown();
    spdlog::info("sql-bridge stopped");

    return result;
}
