#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SqlSafetyPolicy.hpp"
#include "ErrorHandler.hpp"

using namespace sqlbridge;
using ::testing::HasSubstr;

class SqlSafetyPolicyTest : public ::testing::Test {
protected:
    SecurityConfig config_;

    std::string ruleFor(const std::string& sql, bool forceReadOnly = false) {
        SqlSafetyPolicy policy(config_);
        auto failure = policy.validate(sql, forceReadOnly);
        return failure ? failure->rule : "";
    }
};

// Tokenizer tests
TEST_F(SqlSafetyPolicyTest, TokenizeUpperCasesWords) {
    auto tokenized = tokenizeSql("select id from users");

    ASSERT_EQ(tokenized.tokens.size(), 4u);
    EXPECT_EQ(tokenized.tokens[0].word, "SELECT");
    EXPECT_EQ(tokenized.tokens[3].word, "USERS");
    EXPECT_FALSE(tokenized.multipleStatements);
}

TEST_F(SqlSafetyPolicyTest, TokenizeSkipsLiteralsAndComments) {
    auto tokenized = tokenizeSql("SELECT 'drop table' /* DROP */ -- DROP\n FROM \"Drop\"");

    for (const auto& token : tokenized.tokens) {
        EXPECT_NE(token.word, "DROP");
    }
}

TEST_F(SqlSafetyPolicyTest, TokenizeDollarQuoting) {
    auto tokenized = tokenizeSql("SELECT $body$ DELETE FROM x; $body$, $1");

    ASSERT_EQ(tokenized.tokens.size(), 2u);
    EXPECT_EQ(tokenized.tokens[1].word, "$1");
    EXPECT_FALSE(tokenized.multipleStatements);
}

TEST_F(SqlSafetyPolicyTest, TokenizeTracksDepth) {
    auto tokenized = tokenizeSql("SELECT (SELECT 1)");

    ASSERT_EQ(tokenized.tokens.size(), 3u);
    EXPECT_EQ(tokenized.tokens[0].depth, 0);
    EXPECT_EQ(tokenized.tokens[1].depth, 1);
}

TEST_F(SqlSafetyPolicyTest, TrailingSemicolonIsSingleStatement) {
    EXPECT_FALSE(tokenizeSql("SELECT 1;").multipleStatements);
    EXPECT_FALSE(tokenizeSql("SELECT 1; -- done").multipleStatements);
    EXPECT_TRUE(tokenizeSql("SELECT 1; SELECT 2").multipleStatements);
}

TEST_F(SqlSafetyPolicyTest, MySQLExecutableCommentIsTokenized) {
    auto tokenized = tokenizeSql("SELECT /*!50000 SLEEP(1) */ 1", DatabaseType::MySQL);

    ASSERT_GE(tokenized.tokens.size(), 2u);
    EXPECT_EQ(tokenized.tokens[1].word, "SLEEP");

    // Elsewhere it is an ordinary comment
    EXPECT_EQ(tokenizeSql("SELECT /*!50000 SLEEP(1) */ 1", DatabaseType::PostgreSQL).tokens.size(), 2u);
}

TEST_F(SqlSafetyPolicyTest, MySQLBackslashEscapesInStrings) {
    auto tokenized = tokenizeSql("SELECT 'it\\'s' INTO OUTFILE '/tmp/x' -- '", DatabaseType::MySQL);

    ASSERT_EQ(tokenized.tokens.size(), 3u);
    EXPECT_EQ(tokenized.tokens[1].word, "INTO");
    EXPECT_EQ(tokenized.tokens[2].word, "OUTFILE");

    // Standard strings end at the first quote
    auto standard = tokenizeSql("SELECT 'a\\' AS x", DatabaseType::PostgreSQL);
    ASSERT_EQ(standard.tokens.size(), 3u);
    EXPECT_EQ(standard.tokens[2].word, "X");
}

TEST_F(SqlSafetyPolicyTest, MySQLHashAndDashComments) {
    auto hash = tokenizeSql("SELECT 1 # '\nINTO OUTFILE '/tmp/x'", DatabaseType::MySQL);
    ASSERT_EQ(hash.tokens.size(), 4u);
    EXPECT_EQ(hash.tokens[2].word, "INTO");

    // "--" without a following space is two minus signs
    auto dashes = tokenizeSql("SELECT 1--1 INTO @v", DatabaseType::MySQL);
    ASSERT_EQ(dashes.tokens.size(), 5u);
    EXPECT_EQ(dashes.tokens[3].word, "INTO");
}

TEST_F(SqlSafetyPolicyTest, PostgreSQLBlockCommentsNest) {
    auto tokenized = tokenizeSql("SELECT /* a /* b */ ' */ 1", DatabaseType::PostgreSQL);

    ASSERT_EQ(tokenized.tokens.size(), 2u);
    EXPECT_EQ(tokenized.tokens[1].word, "1");
}

TEST_F(SqlSafetyPolicyTest, SQLiteBracketIdentifiers) {
    auto tokenized = tokenizeSql("SELECT [it's] FROM t; DELETE FROM t", DatabaseType::SQLite);

    EXPECT_TRUE(tokenized.multipleStatements);
    EXPECT_EQ(tokenized.tokens.back().word, "T");
}

TEST_F(SqlSafetyPolicyTest, DollarQuotingIsPostgreSQLOnly) {
    auto tokenized = tokenizeSql("SELECT $x$ INTO OUTFILE '/tmp/x' $x$", DatabaseType::MySQL);

    ASSERT_GE(tokenized.tokens.size(), 3u);
    EXPECT_EQ(tokenized.tokens[2].word, "INTO");
}

// Dialect-aware validation
TEST_F(SqlSafetyPolicyTest, ReadOnlyRejectsMySQLEscapedQuoteTricks) {
    SqlSafetyPolicy policy(config_);

    const char* statements[] = {
        "SELECT '\\'' INTO OUTFILE '/tmp/out' -- '",
        "SELECT 1 # '\nINTO OUTFILE '/tmp/out2' -- '",
        "SELECT '\\''; DELETE FROM t; -- '",
    };
    for (const char* sql : statements) {
        EXPECT_TRUE(policy.validate(sql, true, DatabaseType::MySQL).has_value()) << sql;
        // Without a backend every lexing has to pass
        EXPECT_TRUE(policy.validate(sql, true).has_value()) << sql;
    }
}

TEST_F(SqlSafetyPolicyTest, MySQLStackedStatementAfterEscapedQuote) {
    SqlSafetyPolicy policy(config_);

    auto failure = policy.validate("SELECT '\\''; DELETE FROM t; -- '", false, DatabaseType::MySQL);
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->rule, SqlSafetyPolicy::kRuleMultipleStatements);
}

TEST_F(SqlSafetyPolicyTest, BackslashIsLiteralInPostgreSQLStrings) {
    SqlSafetyPolicy policy(config_);

    EXPECT_FALSE(policy.validate("SELECT 'C:\\temp\\' AS path", true, DatabaseType::PostgreSQL).has_value());
    EXPECT_FALSE(policy.validate("SELECT 'it\\'s' AS x", true, DatabaseType::MySQL).has_value());
}

TEST_F(SqlSafetyPolicyTest, ReadOnlyStatementPerDialect) {
    const std::string sql = "SELECT '\\'' INTO OUTFILE '/tmp/out' -- '";

    EXPECT_TRUE(SqlSafetyPolicy::isReadOnlyStatement(sql, DatabaseType::PostgreSQL));
    EXPECT_FALSE(SqlSafetyPolicy::isReadOnlyStatement(sql, DatabaseType::MySQL));
    EXPECT_FALSE(SqlSafetyPolicy::isReadOnlyStatement(sql));
}

// Default policy tests
TEST_F(SqlSafetyPolicyTest, AcceptsPlainSelect) {
    EXPECT_EQ(ruleFor("SELECT * FROM users WHERE id = ?"), "");
}

TEST_F(SqlSafetyPolicyTest, RejectsEmptyStatement) {
    EXPECT_EQ(ruleFor(""), SqlSafetyPolicy::kRuleEmpty);
    EXPECT_EQ(ruleFor("   -- only a comment"), SqlSafetyPolicy::kRuleEmpty);
}

TEST_F(SqlSafetyPolicyTest, RejectsOperationNotAllowed) {
    EXPECT_EQ(ruleFor("PRAGMA table_info(users)"), SqlSafetyPolicy::kRuleAllowedOperations);
}

TEST_F(SqlSafetyPolicyTest, RejectsBlockedKeyword) {
    EXPECT_EQ(ruleFor("DELETE FROM users WHERE id IN (SELECT 1) OR TRUNCATE"),
              SqlSafetyPolicy::kRuleBlockedKeywords);
}

TEST_F(SqlSafetyPolicyTest, BlockedKeywordMatchesWholeTokens) {
    EXPECT_EQ(ruleFor("SELECT created_at, dropped FROM events"), "");
    EXPECT_EQ(ruleFor("SELECT 'DROP TABLE users' AS text"), "");
}

TEST_F(SqlSafetyPolicyTest, RejectsTooLongStatement) {
    config_.max_query_length = 20;

    EXPECT_EQ(ruleFor("SELECT id, name, email FROM users"), SqlSafetyPolicy::kRuleMaxLength);
}

TEST_F(SqlSafetyPolicyTest, RejectsStackedStatements) {
    EXPECT_EQ(ruleFor("SELECT 1; DELETE FROM users"), SqlSafetyPolicy::kRuleMultipleStatements);
}

TEST_F(SqlSafetyPolicyTest, StackedStatementsAllowedWhenDisabled) {
    config_.reject_multiple_statements = false;

    EXPECT_EQ(ruleFor("SELECT 1; SELECT 2"), "");
}

TEST_F(SqlSafetyPolicyTest, WithClauseChecksInnerVerb) {
    config_.allowed_operations = {"SELECT", "WITH"};

    EXPECT_EQ(ruleFor("WITH t AS (SELECT 1) SELECT * FROM t"), "");
    EXPECT_EQ(ruleFor("WITH t AS (SELECT 1) DELETE FROM users"),
              SqlSafetyPolicy::kRuleAllowedOperations);
}

TEST_F(SqlSafetyPolicyTest, ExplainAnalyzeChecksExplainedVerb) {
    config_.allowed_operations = {"SELECT", "EXPLAIN"};

    EXPECT_EQ(ruleFor("EXPLAIN SELECT * FROM users"), "");
    EXPECT_EQ(ruleFor("EXPLAIN ANALYZE SELECT * FROM users"), "");
    EXPECT_EQ(ruleFor("EXPLAIN ANALYZE DELETE FROM users"),
              SqlSafetyPolicy::kRuleAllowedOperations);
}

TEST_F(SqlSafetyPolicyTest, AllowedOperationsAreCaseInsensitive) {
    config_.allowed_operations = {"select"};

    EXPECT_EQ(ruleFor("SeLeCt 1"), "");
}

// Read-only tests
TEST_F(SqlSafetyPolicyTest, ReadOnlyRejectsWrites) {
    config_.read_only = true;

    EXPECT_EQ(ruleFor("INSERT INTO users VALUES (1)"), SqlSafetyPolicy::kRuleReadOnly);
    EXPECT_EQ(ruleFor("UPDATE users SET name = 'x'"), SqlSafetyPolicy::kRuleReadOnly);
    EXPECT_EQ(ruleFor("SELECT * FROM users"), "");
}

TEST_F(SqlSafetyPolicyTest, ReadOnlyRejectsDataModifyingCte) {
    config_.read_only = true;

    EXPECT_EQ(ruleFor("WITH gone AS (DELETE FROM users RETURNING *) SELECT * FROM gone"),
              SqlSafetyPolicy::kRuleReadOnly);
}

TEST_F(SqlSafetyPolicyTest, ReadOnlyRejectsSelectInto) {
    config_.read_only = true;

    EXPECT_EQ(ruleFor("SELECT * INTO backup FROM users"), SqlSafetyPolicy::kRuleReadOnly);
}

TEST_F(SqlSafetyPolicyTest, ReadOnlyAllowsRowLocks) {
    EXPECT_TRUE(SqlSafetyPolicy::isReadOnlyStatement("SELECT * FROM users FOR UPDATE"));
    EXPECT_TRUE(SqlSafetyPolicy::isReadOnlyStatement("SELECT * FROM users FOR NO KEY UPDATE"));
}

TEST_F(SqlSafetyPolicyTest, PlainExplainIsReadOnly) {
    EXPECT_TRUE(SqlSafetyPolicy::isReadOnlyStatement("EXPLAIN DELETE FROM users"));
    EXPECT_FALSE(SqlSafetyPolicy::isReadOnlyStatement("EXPLAIN ANALYZE DELETE FROM users"));
}

TEST_F(SqlSafetyPolicyTest, ForceReadOnlyPerCall) {
    EXPECT_EQ(ruleFor("DELETE FROM users", false), "");
    EXPECT_EQ(ruleFor("DELETE FROM users", true), SqlSafetyPolicy::kRuleReadOnly);
}

TEST_F(SqlSafetyPolicyTest, ReadOnlyCheckedBeforeAllowedOperations) {
    config_.read_only = true;

    EXPECT_EQ(ruleFor("PRAGMA foreign_keys = ON"), SqlSafetyPolicy::kRuleReadOnly);
}

// Enforce tests
TEST_F(SqlSafetyPolicyTest, EnforceThrowsValidationError) {
    SqlSafetyPolicy policy(config_);

    try {
        policy.enforce("DROP TABLE users");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
        EXPECT_THAT(e.what(), HasSubstr("DROP"));
    }
}

TEST_F(SqlSafetyPolicyTest, EnforceAcceptsValidStatement) {
    SqlSafetyPolicy policy(config_);

    EXPECT_NO_THROW(policy.enforce("SELECT 1"));
}
