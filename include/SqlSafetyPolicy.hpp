#pragma once

#include "Config.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlbridge {

// Word token of a statement with literals, quoted identifiers and comments removed
struct SqlToken {
    std::string word;  // upper-cased
    int depth = 0;     // parenthesis nesting level
};

struct TokenizedSql {
    std::vector<SqlToken> tokens;
    bool multipleStatements = false;  // ';' followed by more SQL outside literals
};

// Split a statement into upper-cased word tokens, lexed the way the dialect's server
// lexes it:
//  PostgreSQL: '...', E'...' (backslash escapes), "..." identifiers, $tag$ quoting,
//              -- and nested /* */ comments
//  MySQL:      '...' and "..." strings with backslash escapes, `...` identifiers,
//              #, "-- " and /* */ comments; /*! ... */ and /*M! ... */ are executed
//              and tokenized as SQL
//  SQLite:     '...', "...", `...` and [...] quoting, -- and /* */ comments
TokenizedSql tokenizeSql(const std::string& sql, DatabaseType dialect = DatabaseType::PostgreSQL);

// Which rule rejected a statement
struct ValidationFailure {
    std::string rule;     // one of the SqlSafetyPolicy::kRule* names
    std::string message;
};

// Gate every statement must pass before it reaches a connection pool
class SqlSafetyPolicy {
public:
    static constexpr const char* kRuleEmpty = "empty";
    static constexpr const char* kRuleReadOnly = "read_only";
    static constexpr const char* kRuleAllowedOperations = "allowed_operations";
    static constexpr const char* kRuleBlockedKeywords = "blocked_keywords";
    static constexpr const char* kRuleMaxLength = "max_length";
    static constexpr const char* kRuleMultipleStatements = "multiple_statements";

    explicit SqlSafetyPolicy(const SecurityConfig& config = SecurityConfig{});

    // Check, in order: empty, read-only mode, allowed leading verb, blocked keywords,
    // length, multiple statements. forceReadOnly applies read-only mode for this call.
    // dialect is the backend that will run the statement; without one the statement
    // must pass under every dialect's lexing.
    std::optional<ValidationFailure> validate(const std::string& sql, bool forceReadOnly = false,
                                              std::optional<DatabaseType> dialect = std::nullopt) const;

    // validate() that throws DatabaseError(ValidationError) on failure
    void enforce(const std::string& sql, bool forceReadOnly = false,
                 std::optional<DatabaseType> dialect = std::nullopt) const;

    // SELECT / WITH / EXPLAIN without data modification
    static bool isReadOnlyStatement(const std::string& sql,
                                    std::optional<DatabaseType> dialect = std::nullopt);

    bool readOnly() const { return m_readOnly; }
    size_t maxQueryLength() const { return m_maxQueryLength; }

private:
    // Verb that actually runs: the DML after a WITH clause list, or the explained
    // statement of EXPLAIN ANALYZE
    static std::string effectiveVerb(const TokenizedSql& tokenized);
    static bool isReadOnly(const TokenizedSql& tokenized);

    std::optional<ValidationFailure> check(const std::string& sql, const TokenizedSql& tokenized,
                                           bool forceReadOnly) const;

    bool m_readOnly;
    std::unordered_set<std::string> m_allowedOperations;
    std::unordered_set<std::string> m_blockedKeywords;
    size_t m_maxQueryLength;
    bool m_rejectMultipleStatements;
};

}  // namespace sqlbridge
