#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SchemaIntrospector.hpp"
#include "ErrorHandler.hpp"
#include <filesystem>

using namespace sqlbridge;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class SchemaIntrospectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "sql_bridge_schema_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);

        ConnectionInfo info;
        info.id = "db";
        info.type = DatabaseType::SQLite;
        info.database = (tempDir_ / "schema.db").string();
        info.poolSize = 2;
        registry_.addConnection(info);

        auto entry = registry_.resolve("db");
        withConnection<bool>(entry->pool(), std::chrono::seconds(1), [](auto& conn) {
            conn.run("CREATE TABLE users ("
                     " id INTEGER PRIMARY KEY,"
                     " email VARCHAR(255) NOT NULL UNIQUE,"
                     " status TEXT DEFAULT 'active')", {});
            conn.run("CREATE TABLE orders ("
                     " id INTEGER PRIMARY KEY,"
                     " user_id INTEGER NOT NULL REFERENCES users,"
                     " total NUMERIC(10, 2))", {});
            conn.run("CREATE INDEX idx_orders_user ON orders (user_id)", {});
            conn.run("CREATE VIEW active_users AS SELECT id, email FROM users WHERE status = 'active'", {});
            return true;
        });
    }

    void TearDown() override {
        registry_.shutdown();
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
    ConnectionRegistry registry_;
    SqlSafetyPolicy policy_;
};

TEST_F(SchemaIntrospectorTest, ListSchemas) {
    SchemaIntrospector introspector(registry_, policy_);

    EXPECT_THAT(introspector.listSchemas("db"), ElementsAre("main"));
}

TEST_F(SchemaIntrospectorTest, ListTablesIncludesViews) {
    SchemaIntrospector introspector(registry_, policy_);

    auto tables = introspector.listTables("db");

    ASSERT_EQ(tables.size(), 3u);
    EXPECT_EQ(tables[0].name, "active_users");
    EXPECT_EQ(tables[0].kind, "VIEW");
    EXPECT_EQ(tables[1].name, "orders");
    EXPECT_EQ(tables[1].kind, "TABLE");
    EXPECT_EQ(tables[2].name, "users");
    EXPECT_FALSE(tables[2].comment.has_value());
}

TEST_F(SchemaIntrospectorTest, ListTablesExplicitSchema) {
    SchemaIntrospector introspector(registry_, policy_);

    EXPECT_EQ(introspector.listTables("db", "main").size(), 3u);
}

TEST_F(SchemaIntrospectorTest, ListTablesUnknownConnection) {
    SchemaIntrospector introspector(registry_, policy_);

    try {
        introspector.listTables("nope");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionNotFound);
    }
}

TEST_F(SchemaIntrospectorTest, TableSchemaColumns) {
    SchemaIntrospector introspector(registry_, policy_);

    TableSchema schema = introspector.getTableSchema("db", "users");

    EXPECT_EQ(schema.schema, "main");
    EXPECT_EQ(schema.table, "users");
    EXPECT_EQ(schema.kind, "TABLE");
    ASSERT_EQ(schema.columns.size(), 3u);

    EXPECT_EQ(schema.columns[0].name, "id");
    EXPECT_EQ(schema.columns[0].ordinalPosition, 1);

    EXPECT_EQ(schema.columns[1].name, "email");
    EXPECT_EQ(schema.columns[1].type, "VARCHAR(255)");
    EXPECT_FALSE(schema.columns[1].nullable);

    EXPECT_EQ(schema.columns[2].name, "status");
    EXPECT_TRUE(schema.columns[2].nullable);
    EXPECT_EQ(schema.columns[2].defaultValue, "'active'");
}

TEST_F(SchemaIntrospectorTest, TableSchemaKeys) {
    SchemaIntrospector introspector(registry_, policy_);

    TableSchema schema = introspector.getTableSchema("db", "orders");

    EXPECT_THAT(schema.primaryKeys, ElementsAre("id"));
    ASSERT_EQ(schema.foreignKeys.size(), 1u);
    const auto& fk = schema.foreignKeys[0];
    EXPECT_EQ(fk.column, "user_id");
    EXPECT_EQ(fk.referencedTable, "users");
    // No explicit column: resolved from the parent's primary key
    EXPECT_EQ(fk.referencedColumn, "id");
    EXPECT_EQ(fk.referencedSchema, "main");
    EXPECT_FALSE(fk.constraintName.empty());
}

TEST_F(SchemaIntrospectorTest, TableSchemaIndexes) {
    SchemaIntrospector introspector(registry_, policy_);

    TableSchema orders = introspector.getTableSchema("db", "orders");
    ASSERT_EQ(orders.indexes.size(), 1u);
    EXPECT_EQ(orders.indexes[0].name, "idx_orders_user");
    EXPECT_THAT(orders.indexes[0].columns, ElementsAre("user_id"));
    EXPECT_FALSE(orders.indexes[0].unique);
    EXPECT_EQ(orders.indexes[0].kind, "INDEX");

    TableSchema users = introspector.getTableSchema("db", "users");
    ASSERT_EQ(users.indexes.size(), 1u);
    EXPECT_TRUE(users.indexes[0].unique);
    EXPECT_EQ(users.indexes[0].kind, "UNIQUE");
    EXPECT_THAT(users.indexes[0].columns, ElementsAre("email"));
}

TEST_F(SchemaIntrospectorTest, ViewSchema) {
    SchemaIntrospector introspector(registry_, policy_);

    TableSchema schema = introspector.getTableSchema("db", "active_users");

    EXPECT_EQ(schema.kind, "VIEW");
    EXPECT_EQ(schema.columns.size(), 2u);
    EXPECT_TRUE(schema.primaryKeys.empty());
}

TEST_F(SchemaIntrospectorTest, MissingTableThrows) {
    SchemaIntrospector introspector(registry_, policy_);

    try {
        introspector.getTableSchema("db", "missing");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::QueryExecutionError);
        EXPECT_THAT(e.what(), HasSubstr("missing"));
    }
}

TEST_F(SchemaIntrospectorTest, ExplainQuery) {
    SchemaIntrospector introspector(registry_, policy_);

    PlanResult plan = introspector.explainQuery("db", "SELECT * FROM orders WHERE user_id = 1");

    EXPECT_FALSE(plan.lines.empty());
    EXPECT_EQ(plan.query, "SELECT * FROM orders WHERE user_id = 1");
    EXPECT_FALSE(plan.analyze);
    EXPECT_THAT(plan.lines[0], HasSubstr("idx_orders_user"));
}

TEST_F(SchemaIntrospectorTest, ExplainAnalyzeFallsBackToPlan) {
    SchemaIntrospector introspector(registry_, policy_);

    PlanResult plan = introspector.explainQuery("db", "SELECT * FROM users", true);

    EXPECT_FALSE(plan.analyze);
    EXPECT_FALSE(plan.lines.empty());
}

TEST_F(SchemaIntrospectorTest, ExplainRejectedByPolicy) {
    SchemaIntrospector introspector(registry_, policy_);

    EXPECT_THROW(introspector.explainQuery("db", "DROP TABLE users"), DatabaseError);
    EXPECT_THROW(introspector.explainQuery("db", "SELECT 1; DELETE FROM users"), DatabaseError);
}

TEST_F(SchemaIntrospectorTest, ExplainAnalyzeValidatedAsExecution) {
    SecurityConfig security;
    security.read_only = true;
    SqlSafetyPolicy readOnly(security);
    SchemaIntrospector introspector(registry_, readOnly);

    // Plain EXPLAIN only plans the delete
    EXPECT_NO_THROW(introspector.explainQuery("db", "DELETE FROM users"));
    EXPECT_THROW(introspector.explainQuery("db", "DELETE FROM users", true), DatabaseError);
}
