#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryExecutor.hpp"
#include "SchemaIntrospector.hpp"
#include "ErrorHandler.hpp"
#include <cstdlib>

using namespace sqlbridge;
using ::testing::ElementsAre;

// Runs against a live server named by SQLBRIDGE_TEST_MYSQL_HOST (plus _PORT,
// _DATABASE, _USER and _PASSWORD); skipped otherwise.
class MySQLIntegrationTest : public ::testing::Test {
protected:
    static std::string env(const char* name, const std::string& fallback = {}) {
        const char* value = std::getenv(name);
        return value ? value : fallback;
    }

    void SetUp() override {
        if (env("SQLBRIDGE_TEST_MYSQL_HOST").empty()) {
            GTEST_SKIP() << "SQLBRIDGE_TEST_MYSQL_HOST not set";
        }

        ConnectionInfo info;
        info.id = "my";
        info.type = DatabaseType::MySQL;
        info.host = env("SQLBRIDGE_TEST_MYSQL_HOST");
        info.port = static_cast<uint16_t>(std::stoi(env("SQLBRIDGE_TEST_MYSQL_PORT", "3306")));
        info.database = env("SQLBRIDGE_TEST_MYSQL_DATABASE", "test");
        info.user = env("SQLBRIDGE_TEST_MYSQL_USER", "root");
        info.password = env("SQLBRIDGE_TEST_MYSQL_PASSWORD");
        info.poolSize = 2;
        info.connectTimeout = std::chrono::seconds(5);
        registry_.addConnection(info);

        auto entry = registry_.resolve("my");
        withConnection<bool>(entry->pool(), std::chrono::seconds(5), [](auto& conn) {
            conn.run("DROP TABLE IF EXISTS sqlbridge_items", {});
            conn.run("CREATE TABLE sqlbridge_items ("
                     " id INT AUTO_INCREMENT PRIMARY KEY,"
                     " sku VARCHAR(32) NOT NULL UNIQUE,"
                     " price DECIMAL(8, 2) NULL"
                     ") ENGINE=InnoDB COMMENT='catalog items'", {});
            conn.run("INSERT INTO sqlbridge_items (sku, price) VALUES ('A-1', 1.50), ('B-2', NULL)", {});
            return true;
        });
    }

    void TearDown() override {
        if (registry_.contains("my")) {
            auto entry = registry_.resolve("my");
            withConnection<bool>(entry->pool(), std::chrono::seconds(5), [](auto& conn) {
                conn.run("DROP TABLE IF EXISTS sqlbridge_items", {});
                return true;
            });
        }
        registry_.shutdown();
    }

    ConnectionRegistry registry_;
    SqlSafetyPolicy policy_;
};

TEST_F(MySQLIntegrationTest, QueryWithParameters) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery(
        "my", "SELECT sku, price FROM sqlbridge_items WHERE sku = ?", {std::string("A-1")});

    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_EQ(result.rowCount, 1u);
    // DECIMAL keeps its exact text
    EXPECT_EQ(result.rows[0][1].second, SqlValue(std::string("1.50")));
}

TEST_F(MySQLIntegrationTest, NullValue) {
    QueryExecutor executor(registry_, policy_);

    QueryResult result = executor.executeQuery("my", "SELECT price FROM sqlbridge_items WHERE sku = 'B-2'");

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(isNull(result.rows[0][0].second));
}

TEST_F(MySQLIntegrationTest, TransactionRollback) {
    QueryExecutor executor(registry_, policy_);

    EXPECT_THROW(executor.executeTransaction("my", {
        {"INSERT INTO sqlbridge_items (sku) VALUES (?)", {std::string("C-3")}},
        {"INSERT INTO sqlbridge_items (sku) VALUES (?)", {std::string("A-1")}},
    }), TransactionError);

    QueryResult count = executor.executeQuery("my", "SELECT COUNT(*) FROM sqlbridge_items");
    ASSERT_TRUE(count.success);
    EXPECT_EQ(count.rows[0][0].second, SqlValue(int64_t{2}));
}

TEST_F(MySQLIntegrationTest, BatchStopsAtDuplicate) {
    QueryExecutor executor(registry_, policy_);

    BatchResult batch = executor.executeBatch("my", "INSERT INTO sqlbridge_items (sku) VALUES (?)", {
        {std::string("C-3")},
        {std::string("A-1")},
    });

    EXPECT_FALSE(batch.complete());
    EXPECT_EQ(batch.failedIndex, 1u);
    EXPECT_EQ(batch.counts, (std::vector<int64_t>{1}));
}

TEST_F(MySQLIntegrationTest, DescribeTable) {
    SchemaIntrospector introspector(registry_, policy_);

    TableSchema schema = introspector.getTableSchema("my", "sqlbridge_items");

    EXPECT_EQ(schema.kind, "TABLE");
    EXPECT_EQ(schema.comment, "catalog items");
    EXPECT_THAT(schema.primaryKeys, ElementsAre("id"));
    ASSERT_EQ(schema.columns.size(), 3u);
    EXPECT_EQ(schema.columns[1].maxLength, 32);
    EXPECT_FALSE(schema.columns[1].nullable);
    EXPECT_EQ(schema.columns[2].precision, 8);
    EXPECT_EQ(schema.columns[2].scale, 2);
}

TEST_F(MySQLIntegrationTest, Explain) {
    SchemaIntrospector introspector(registry_, policy_);

    PlanResult plan = introspector.explainQuery("my", "SELECT * FROM sqlbridge_items WHERE sku = 'A-1'");

    EXPECT_FALSE(plan.analyze);
    EXPECT_FALSE(plan.lines.empty());
}
