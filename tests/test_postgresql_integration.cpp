#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryExecutor.hpp"
#include "SchemaIntrospector.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>

using namespace sqlbridge;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Runs against a live server named by SQLBRIDGE_TEST_PG_HOST (plus _PORT,
// _DATABASE, _USER and _PASSWORD); skipped otherwise.
class PostgreSQLIntegrationTest : public ::testing::Test {
protected:
    static std::string env(const char* name, const std::string& fallback = {}) {
        const char* value = std::getenv(name);
        return value ? value : fallback;
    }

    void SetUp() override {
        if (env("SQLBRIDGE_TEST_PG_HOST").empty()) {
            GTEST_SKIP() << "SQLBRIDGE_TEST_PG_HOST not set";
        }

        ConnectionInfo info;
        info.id = "pg";
        info.type = DatabaseType::PostgreSQL;
        info.host = env("SQLBRIDGE_TEST_PG_HOST");
        info.port = static_cast<uint16_t>(std::stoi(env("SQLBRIDGE_TEST_PG_PORT", "5432")));
        info.database = env("SQLBRIDGE_TEST_PG_DATABASE", "postgres");
        info.user = env("SQLBRIDGE_TEST_PG_USER", "postgres");
        info.password = env("SQLBRIDGE_TEST_PG_PASSWORD");
        info.poolSize = 2;
        info.connectTimeout = std::chrono::seconds(5);
        registry_.addConnection(info);

        auto entry = registry_.resolve("pg");
        withConnection<bool>(entry->pool(), std::chrono::seconds(5), [](auto& conn) {
            conn.run("DROP TABLE IF EXISTS sqlbridge_orders", {});
            conn.run("DROP TABLE IF EXISTS sqlbridge_users", {});
            conn.run("CREATE TABLE sqlbridge_users ("
                     " id SERIAL PRIMARY KEY,"
                     " email VARCHAR(120) NOT NULL UNIQUE,"
                     " balance NUMERIC(10, 2) DEFAULT 0)", {});
            conn.run("CREATE TABLE sqlbridge_orders ("
                     " id SERIAL PRIMARY KEY,"
                     " user_id INTEGER NOT NULL REFERENCES sqlbridge_users (id))", {});
            conn.run("COMMENT ON TABLE sqlbridge_users IS 'registered users'", {});
            conn.run("INSERT INTO sqlbridge_users (email) VALUES ('a@example.com'), ('b@example.com')", {});
            return true;
        });
    }

    void TearDown() override {
        if (registry_.contains("pg")) {
            auto entry = registry_.resolve("pg");
            withConnection<bool>(entry->pool(), std::chrono::seconds(5), [](auto& conn) {
                conn.run("DROP TABLE IF EXISTS sqlbridge_orders", {});
                conn.run("DROP TABLE IF EXISTS sqlbridge_users", {});
                return true;
            });
        }
        registry_.shutdown();
    }

    ConnectionRegistry registry_;
    SqlSafetyPolicy policy_;
};

TEST_F(PostgreSQLIntegrationTest, QueryWithParameters) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery(
        "pg", "SELECT id, email FROM sqlbridge_users WHERE email = $1", {std::string("b@example.com")});

    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_EQ(result.rowCount, 1u);
    EXPECT_EQ(result.rows[0][1].second, SqlValue(std::string("b@example.com")));
}

TEST_F(PostgreSQLIntegrationTest, FetchSizeReturnsAllRows) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("pg", "SELECT generate_series(1, 25) AS n", {}, 10);

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.rowCount, 25u);
}

TEST_F(PostgreSQLIntegrationTest, TransactionRollback) {
    QueryExecutor executor(registry_, policy_);

    EXPECT_THROW(executor.executeTransaction("pg", {
        {"INSERT INTO sqlbridge_users (email) VALUES ($1)", {std::string("c@example.com")}},
        {"INSERT INTO sqlbridge_users (email) VALUES ($1)", {std::string("a@example.com")}},
    }), TransactionError);

    QueryResult count = executor.executeQuery("pg", "SELECT count(*) FROM sqlbridge_users");
    ASSERT_TRUE(count.success);
    EXPECT_EQ(count.rows[0][0].second, SqlValue(int64_t{2}));
}

TEST_F(PostgreSQLIntegrationTest, BatchInsert) {
    QueryExecutor executor(registry_, policy_);

    BatchResult batch = executor.executeBatch("pg", "INSERT INTO sqlbridge_users (email) VALUES ($1)", {
        {std::string("c@example.com")},
        {std::string("d@example.com")},
    });

    EXPECT_TRUE(batch.complete());
    EXPECT_EQ(batch.counts, (std::vector<int64_t>{1, 1}));
}

TEST_F(PostgreSQLIntegrationTest, UniqueViolationIsQueryError) {
    QueryExecutor executor(registry_, policy_);

    try {
        executor.executeUpdate("pg", "INSERT INTO sqlbridge_users (email) VALUES ($1)",
                               {std::string("a@example.com")});
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::QueryExecutionError);
        EXPECT_EQ(e.backendCode(), "23505");
    }
}

TEST_F(PostgreSQLIntegrationTest, DescribeTable) {
    SchemaIntrospector introspector(registry_, policy_);

    EXPECT_THAT(introspector.listSchemas("pg"), Contains("public"));

    TableSchema users = introspector.getTableSchema("pg", "sqlbridge_users");
    EXPECT_EQ(users.schema, "public");
    EXPECT_EQ(users.kind, "TABLE");
    EXPECT_EQ(users.comment, "registered users");
    EXPECT_THAT(users.primaryKeys, ElementsAre("id"));
    ASSERT_EQ(users.columns.size(), 3u);
    EXPECT_EQ(users.columns[1].maxLength, 120);
    EXPECT_EQ(users.columns[2].precision, 10);
    EXPECT_EQ(users.columns[2].scale, 2);

    TableSchema orders = introspector.getTableSchema("pg", "sqlbridge_orders");
    ASSERT_EQ(orders.foreignKeys.size(), 1u);
    EXPECT_EQ(orders.foreignKeys[0].referencedTable, "sqlbridge_users");
    EXPECT_EQ(orders.foreignKeys[0].referencedColumn, "id");
}

TEST_F(PostgreSQLIntegrationTest, ExplainAnalyze) {
    SchemaIntrospector introspector(registry_, policy_);

    PlanResult plan = introspector.explainQuery("pg", "SELECT * FROM sqlbridge_users", true);

    EXPECT_TRUE(plan.analyze);
    EXPECT_FALSE(plan.lines.empty());
}

TEST_F(PostgreSQLIntegrationTest, WrongParameterCountIsQueryError) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery(
        "pg", "SELECT id FROM sqlbridge_users WHERE email = $1 AND id = $2", {std::string("a@example.com")});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::QueryExecutionError);
    EXPECT_THAT(result.error.value_or(""), HasSubstr("expects 2 parameters, got 1"));

    // The connection stays pooled and usable
    PoolStats stats = PoolFactory::stats(registry_.resolve("pg")->pool());
    EXPECT_GE(stats.idle, 1u);
    EXPECT_TRUE(executor.executeQuery("pg", "SELECT 1").success);
}

TEST_F(PostgreSQLIntegrationTest, BatchWrongParameterCountStopsAtSet) {
    QueryExecutor executor(registry_, policy_);

    BatchResult batch = executor.executeBatch("pg", "INSERT INTO sqlbridge_users (email) VALUES ($1)", {
        {std::string("c@example.com")},
        {std::string("d@example.com"), std::string("extra")},
    });

    EXPECT_EQ(batch.failedIndex, 1u);
    EXPECT_EQ(batch.errorKind, ErrorKind::QueryExecutionError);
    EXPECT_EQ(batch.counts, (std::vector<int64_t>{1}));
}

TEST_F(PostgreSQLIntegrationTest, TruncatedReturningWriteStillCommits) {
    QueryConfig config;
    config.max_rows = 5;
    QueryExecutor executor(registry_, policy_, config);

    QueryResult result = executor.executeQuery(
        "pg",
        "INSERT INTO sqlbridge_users (email) "
        "SELECT 'bulk' || g || '@example.com' FROM generate_series(1, 200) g RETURNING id",
        {}, 10);

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_TRUE(result.hasMore);
    EXPECT_EQ(result.rowCount, 5u);

    QueryResult count = executor.executeQuery("pg", "SELECT count(*) FROM sqlbridge_users");
    ASSERT_TRUE(count.success);
    EXPECT_EQ(count.rows[0][0].second, SqlValue(int64_t{202}));
}

TEST_F(PostgreSQLIntegrationTest, TruncatedSelectLeavesConnectionUsable) {
    QueryConfig config;
    config.max_rows = 5;
    QueryExecutor executor(registry_, policy_, config);

    QueryResult result = executor.executeQuery("pg", "SELECT generate_series(1, 100000) AS n", {}, 10);

    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_TRUE(result.hasMore);
    EXPECT_EQ(result.rowCount, 5u);
    EXPECT_TRUE(executor.executeQuery("pg", "SELECT 1").success);
}
