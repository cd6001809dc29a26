#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryExecutor.hpp"
#include "ErrorHandler.hpp"
#include <sqlite3.h>
#include <filesystem>

using namespace sqlbridge;
using ::testing::HasSubstr;

class QueryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "sql_bridge_executor_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);

        registry_.addConnection(sqliteInfo("db"));

        // DDL is blocked by the default policy, so set up through the pool
        auto entry = registry_.resolve("db");
        withConnection<bool>(entry->pool(), std::chrono::seconds(1), [](auto& conn) {
            conn.run("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT NOT NULL UNIQUE, score REAL)", {});
            conn.run("INSERT INTO users (id, name, score) VALUES (1, 'alice', 9.5), (2, 'bob', NULL)", {});
            return true;
        });
    }

    void TearDown() override {
        registry_.shutdown();
        std::filesystem::remove_all(tempDir_);
    }

    ConnectionInfo sqliteInfo(const std::string& id) {
        ConnectionInfo info;
        info.id = id;
        info.type = DatabaseType::SQLite;
        info.database = (tempDir_ / "executor.db").string();
        info.poolSize = 2;
        info.connectTimeout = std::chrono::seconds(2);
        info.acquireTimeout = std::chrono::seconds(2);
        return info;
    }

    int64_t countUsers() {
        QueryExecutor executor(registry_, policy_);
        QueryResult result = executor.executeQuery("db", "SELECT COUNT(*) AS n FROM users");
        EXPECT_TRUE(result.success);
        return std::get<int64_t>(result.rows.at(0).at(0).second);
    }

    std::filesystem::path tempDir_;
    ConnectionRegistry registry_;
    SqlSafetyPolicy policy_;
};

// Lifecycle test: register, test, query, remove
TEST_F(QueryExecutorTest, ConnectionLifecycleWithQuery) {
    ConnectionInfo info = sqliteInfo("c1");
    info.database = (tempDir_ / "lifecycle.db").string();
    info.poolSize = 5;

    ConnectionHandle handle = registry_.addConnection(info);
    EXPECT_EQ(handle.status, ConnectionStatus::Connected);
    EXPECT_TRUE(registry_.testConnection("c1"));

    QueryExecutor executor(registry_, policy_);
    QueryResult result = executor.executeQuery("c1", "SELECT 1 AS x");

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.rowCount, 1u);
    ASSERT_EQ(result.rows.size(), 1u);
    ASSERT_EQ(result.rows[0].size(), 1u);
    EXPECT_EQ(result.rows[0][0].first, "x");
    EXPECT_EQ(result.rows[0][0].second, SqlValue(int64_t{1}));

    EXPECT_TRUE(registry_.removeConnection("c1"));

    try {
        registry_.testConnection("c1");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionNotFound);
    }
}

// Query tests
TEST_F(QueryExecutorTest, ExecuteQueryReturnsRows) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT id, name, score FROM users ORDER BY id");

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.rowCount, 2u);
    ASSERT_EQ(result.columns.size(), 3u);
    EXPECT_EQ(result.columns[1].name, "name");
    EXPECT_EQ(result.rows[0][1].second, SqlValue(std::string("alice")));
    EXPECT_EQ(result.rows[0][2].second, SqlValue(9.5));
    EXPECT_TRUE(isNull(result.rows[1][2].second));
    EXPECT_FALSE(result.hasMore);
}

TEST_F(QueryExecutorTest, ExecuteQueryBindsParameters) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT name FROM users WHERE id = ?", {int64_t{2}});

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.rowCount, 1u);
    EXPECT_EQ(result.rows[0][0].second, SqlValue(std::string("bob")));
}

TEST_F(QueryExecutorTest, ParametersAreNeverInterpolated) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT id FROM users WHERE name = ?",
                                               {std::string("alice' OR '1'='1")});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.rowCount, 0u);
}

TEST_F(QueryExecutorTest, ExecuteQueryRejectedByPolicy) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "DROP TABLE users");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ValidationError);
    EXPECT_EQ(countUsers(), 2);
}

TEST_F(QueryExecutorTest, ExecuteQueryStackedStatementsRejected) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT 1; DELETE FROM users");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ValidationError);
    EXPECT_EQ(countUsers(), 2);
}

TEST_F(QueryExecutorTest, ExecuteQueryBackendErrorIsReported) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT * FROM missing_table");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::QueryExecutionError);
    EXPECT_THAT(result.error.value_or(""), HasSubstr("missing_table"));
}

TEST_F(QueryExecutorTest, ExecuteQueryUnknownConnectionThrows) {
    QueryExecutor executor(registry_, policy_);

    try {
        executor.executeQuery("nope", "SELECT 1");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionNotFound);
    }
}

TEST_F(QueryExecutorTest, ExecuteQueryWrongParameterCount) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT name FROM users WHERE id = ?");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::QueryExecutionError);
}

TEST_F(QueryExecutorTest, MaxRowsTruncates) {
    QueryConfig config;
    config.max_rows = 1;
    QueryExecutor executor(registry_, policy_, config);

    QueryResult result = executor.executeQuery("db", "SELECT id FROM users ORDER BY id");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.rowCount, 1u);
    EXPECT_TRUE(result.hasMore);
}

TEST_F(QueryExecutorTest, SuccessfulQueryTouchesConnection) {
    QueryExecutor executor(registry_, policy_);

    executor.executeQuery("db", "SELECT 1");

    auto handle = registry_.resolve("db")->snapshot();
    EXPECT_TRUE(handle.lastUsed.has_value());
}

// Update tests
TEST_F(QueryExecutorTest, ExecuteUpdateReturnsAffectedRows) {
    QueryExecutor executor(registry_, policy_);

    int64_t affected = executor.executeUpdate("db", "UPDATE users SET score = ? WHERE score IS NULL",
                                              {SqlValue(1.0)});

    EXPECT_EQ(affected, 1);
}

TEST_F(QueryExecutorTest, ExecuteUpdateInsert) {
    QueryExecutor executor(registry_, policy_);

    int64_t affected = executor.executeUpdate("db", "INSERT INTO users (name) VALUES (?)",
                                              {std::string("carol")});

    EXPECT_EQ(affected, 1);
    EXPECT_EQ(countUsers(), 3);
}

TEST_F(QueryExecutorTest, ExecuteUpdateConstraintViolationThrows) {
    QueryExecutor executor(registry_, policy_);

    try {
        executor.executeUpdate("db", "INSERT INTO users (name) VALUES (?)", {std::string("alice")});
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::QueryExecutionError);
        EXPECT_FALSE(e.backendCode().empty());
    }
}

TEST_F(QueryExecutorTest, ExecuteUpdateRejectedByPolicy) {
    QueryExecutor executor(registry_, policy_);

    EXPECT_THROW(executor.executeUpdate("db", "TRUNCATE users"), DatabaseError);
}

TEST_F(QueryExecutorTest, ReadOnlyPolicyRejectsUpdate) {
    SecurityConfig security;
    security.read_only = true;
    SqlSafetyPolicy readOnly(security);
    QueryExecutor executor(registry_, readOnly);

    try {
        executor.executeUpdate("db", "DELETE FROM users");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
    EXPECT_EQ(countUsers(), 2);
}

TEST_F(QueryExecutorTest, ReadOnlyConnectionRejectsWrites) {
    ConnectionInfo info = sqliteInfo("ro");
    info.readOnly = true;
    registry_.addConnection(info);
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("ro", "DELETE FROM users RETURNING id");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::ValidationError);
    EXPECT_TRUE(executor.executeQuery("ro", "SELECT * FROM users").success);
}

// Transaction tests
TEST_F(QueryExecutorTest, TransactionCommitsAllStatements) {
    QueryExecutor executor(registry_, policy_);

    auto items = executor.executeTransaction("db", {
        {"INSERT INTO users (name) VALUES (?)", {std::string("carol")}},
        {"UPDATE users SET score = 1 WHERE name = ?", {std::string("carol")}},
        {"SELECT name FROM users WHERE score = 1", {}},
    });

    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(items[0]), 1);
    EXPECT_EQ(std::get<int64_t>(items[1]), 1);
    const auto& rows = std::get<QueryResult>(items[2]);
    ASSERT_EQ(rows.rowCount, 1u);
    EXPECT_EQ(rows.rows[0][0].second, SqlValue(std::string("carol")));
    EXPECT_EQ(countUsers(), 3);
}

TEST_F(QueryExecutorTest, TransactionRollsBackOnFailure) {
    QueryExecutor executor(registry_, policy_);

    try {
        executor.executeTransaction("db", {
            {"INSERT INTO users (name) VALUES (?)", {std::string("carol")}},
            {"INSERT INTO users (name) VALUES (?)", {std::string("alice")}},
        });
        FAIL() << "expected TransactionError";
    } catch (const TransactionError& e) {
        EXPECT_EQ(e.failedIndex(), 1u);
        EXPECT_EQ(e.kind(), ErrorKind::TransactionFailure);
        EXPECT_EQ(e.cause(), ErrorKind::QueryExecutionError);
    }

    EXPECT_EQ(countUsers(), 2);
}

TEST_F(QueryExecutorTest, ConnectionReusableAfterRollback) {
    QueryExecutor executor(registry_, policy_);

    EXPECT_THROW(executor.executeTransaction("db", {{"INSERT INTO missing VALUES (1)", {}}}),
                 TransactionError);

    // The pooled handle is back in auto-commit mode
    EXPECT_EQ(executor.executeUpdate("db", "INSERT INTO users (name) VALUES (?)", {std::string("dave")}), 1);
    EXPECT_EQ(countUsers(), 3);
}

TEST_F(QueryExecutorTest, TransactionValidatesBeforeRunning) {
    QueryExecutor executor(registry_, policy_);

    try {
        executor.executeTransaction("db", {
            {"INSERT INTO users (name) VALUES ('carol')", {}},
            {"DROP TABLE users", {}},
        });
        FAIL() << "expected DatabaseError";
    } catch (const TransactionError&) {
        FAIL() << "nothing should have run";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
        EXPECT_THAT(e.what(), HasSubstr("Statement 1"));
    }

    EXPECT_EQ(countUsers(), 2);
}

TEST_F(QueryExecutorTest, EmptyTransactionRejected) {
    QueryExecutor executor(registry_, policy_);

    try {
        executor.executeTransaction("db", {});
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
}

// Batch tests
TEST_F(QueryExecutorTest, BatchAppliesEverySet) {
    QueryExecutor executor(registry_, policy_);

    BatchResult batch = executor.executeBatch("db", "INSERT INTO users (name, score) VALUES (?, ?)", {
        {std::string("carol"), SqlValue(1.0)},
        {std::string("dave"), SqlValue(std::monostate{})},
    });

    EXPECT_TRUE(batch.complete());
    EXPECT_EQ(batch.counts, (std::vector<int64_t>{1, 1}));
    EXPECT_EQ(countUsers(), 4);
}

TEST_F(QueryExecutorTest, StatementErrorIsNotRetryable) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("db", "SELECT * FROM missing_table");

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.retryable);
}

TEST_F(QueryExecutorTest, LockedDatabaseIsRetryable) {
    ConnectionInfo info = sqliteInfo("locked");
    info.connectTimeout = std::chrono::seconds(1);
    registry_.addConnection(info);

    // A second handle holds the write lock for the whole test
    sqlite3* holder = nullptr;
    ASSERT_EQ(sqlite3_open((tempDir_ / "executor.db").string().c_str(), &holder), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(holder, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), SQLITE_OK);

    QueryExecutor executor(registry_, policy_);
    BatchResult batch = executor.executeBatch("locked", "INSERT INTO users (name) VALUES (?)", {
        {std::string("carol")},
    });

    EXPECT_FALSE(batch.complete());
    EXPECT_EQ(batch.failedIndex, 0u);
    EXPECT_EQ(batch.errorKind, ErrorKind::TimeoutError);
    EXPECT_TRUE(batch.retryable);

    try {
        executor.executeUpdate("locked", "UPDATE users SET score = 1 WHERE id = 1");
        FAIL() << "Expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_TRUE(e.retryable());
    }

    sqlite3_exec(holder, "ROLLBACK", nullptr, nullptr, nullptr);
    sqlite3_close(holder);

    BatchResult retried = executor.executeBatch("locked", "INSERT INTO users (name) VALUES (?)", {
        {std::string("carol")},
    });
    EXPECT_TRUE(retried.complete());
}

TEST_F(QueryExecutorTest, BatchStopsAtFailingSet) {
    QueryExecutor executor(registry_, policy_);

    BatchResult batch = executor.executeBatch("db", "INSERT INTO users (name) VALUES (?)", {
        {std::string("carol")},
        {std::string("alice")},
        {std::string("erin")},
    });

    EXPECT_FALSE(batch.complete());
    EXPECT_EQ(batch.failedIndex, 1u);
    EXPECT_EQ(batch.counts, (std::vector<int64_t>{1}));
    EXPECT_EQ(batch.errorKind, ErrorKind::QueryExecutionError);
    EXPECT_EQ(countUsers(), 3);
}

TEST_F(QueryExecutorTest, EmptyBatchIsComplete) {
    QueryExecutor executor(registry_, policy_);

    BatchResult batch = executor.executeBatch("db", "INSERT INTO users (name) VALUES (?)", {});

    EXPECT_TRUE(batch.complete());
    EXPECT_TRUE(batch.counts.empty());
}

TEST_F(QueryExecutorTest, BatchRejectedByPolicy) {
    QueryExecutor executor(registry_, policy_);

    EXPECT_THROW(executor.executeBatch("db", "DROP TABLE users", {{}}), DatabaseError);
}
