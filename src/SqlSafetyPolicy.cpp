#include "SqlSafetyPolicy.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace sqlbridge {

namespace {

bool isWordChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$';
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

// Returns the index just past the closing quote, or sql.size() when unterminated
size_t skipQuoted(const std::string& sql, size_t pos, char quote, bool backslashEscapes) {
    size_t i = pos + 1;
    while (i < sql.size()) {
        if (backslashEscapes && sql[i] == '\\') {
            i += 2;
            continue;
        }
        if (sql[i] == quote) {
            if (i + 1 < sql.size() && sql[i + 1] == quote) {
                i += 2;  // doubled quote
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return sql.size();
}

bool isDmlVerb(const std::string& word) {
    return word == "SELECT" || word == "INSERT" || word == "UPDATE" || word == "DELETE"
        || word == "MERGE" || word == "REPLACE" || word == "VALUES" || word == "WITH"
        || word == "TABLE";
}

// Tokens that write data even inside an otherwise read-only statement
bool isModifyingToken(const std::vector<SqlToken>& tokens, size_t index) {
    const std::string& word = tokens[index].word;
    if (word == "INSERT" || word == "DELETE" || word == "MERGE" || word == "INTO") {
        return true;
    }
    if (word == "UPDATE") {
        // FOR UPDATE / FOR NO KEY UPDATE are row locks
        return index == 0 || (tokens[index - 1].word != "FOR" && tokens[index - 1].word != "KEY");
    }
    return false;
}

constexpr std::array<DatabaseType, 3> kDialects = {
    DatabaseType::PostgreSQL, DatabaseType::MySQL, DatabaseType::SQLite};

std::string joined(const std::unordered_set<std::string>& words) {
    std::vector<std::string> sorted(words.begin(), words.end());
    std::sort(sorted.begin(), sorted.end());
    std::string result;
    for (const auto& word : sorted) {
        if (!result.empty()) result += ", ";
        result += word;
    }
    return result;
}

}  // namespace

// ============================================================================
// Tokenizer
// ============================================================================

TokenizedSql tokenizeSql(const std::string& sql, DatabaseType dialect) {
    const bool mysql = dialect == DatabaseType::MySQL;
    const bool postgres = dialect == DatabaseType::PostgreSQL;
    const bool sqlite = dialect == DatabaseType::SQLite;

    TokenizedSql result;
    const size_t n = sql.size();
    size_t i = 0;
    int depth = 0;
    bool terminated = false;

    // Anything after a top-level ';' is a second statement
    auto content = [&]() {
        if (terminated) result.multipleStatements = true;
    };

    auto skipLine = [&](size_t from) {
        size_t end = sql.find('\n', from);
        return end == std::string::npos ? n : end;
    };

    while (i < n) {
        char c = sql[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        // -- line comment; MySQL needs whitespace or a control character after the dashes
        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            unsigned char next = i + 2 < n ? static_cast<unsigned char>(sql[i + 2]) : ' ';
            if (!mysql || std::isspace(next) || std::iscntrl(next)) {
                i = skipLine(i);
                continue;
            }
        }

        // # line comment (MySQL)
        if (mysql && c == '#') {
            i = skipLine(i);
            continue;
        }

        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            // MySQL /*! ... */ and MariaDB /*M! ... */ comments are executed
            if (mysql && i + 2 < n && (sql[i + 2] == '!' ||
                                       (sql[i + 2] == 'M' && i + 3 < n && sql[i + 3] == '!'))) {
                i += sql[i + 2] == '!' ? 3 : 4;
                while (i < n && std::isdigit(static_cast<unsigned char>(sql[i]))) ++i;
                continue;
            }
            // PostgreSQL block comments nest
            if (postgres) {
                int level = 1;
                size_t j = i + 2;
                while (j < n && level > 0) {
                    if (sql[j] == '/' && j + 1 < n && sql[j + 1] == '*') {
                        ++level;
                        j += 2;
                    } else if (sql[j] == '*' && j + 1 < n && sql[j + 1] == '/') {
                        --level;
                        j += 2;
                    } else {
                        ++j;
                    }
                }
                i = j;
                continue;
            }
            size_t end = sql.find("*/", i + 2);
            i = (end == std::string::npos) ? n : end + 2;
            continue;
        }

        // Closing marker of an executable comment
        if (mysql && c == '*' && i + 1 < n && sql[i + 1] == '/') {
            i += 2;
            continue;
        }

        // MySQL strings take backslash escapes in both quote styles
        if (c == '\'' || c == '"') {
            content();
            i = skipQuoted(sql, i, c, mysql);
            continue;
        }

        if (c == '`' && !postgres) {
            content();
            i = skipQuoted(sql, i, c, false);
            continue;
        }

        // [identifier] (SQLite)
        if (sqlite && c == '[') {
            content();
            size_t end = sql.find(']', i + 1);
            i = (end == std::string::npos) ? n : end + 1;
            continue;
        }

        // $tag$ ... $tag$ dollar quoting; $1 placeholders fall through to words
        if (postgres && c == '$' && (i == 0 || !isWordChar(sql[i - 1]))) {
            size_t j = i + 1;
            while (j < n && (std::isalpha(static_cast<unsigned char>(sql[j])) || sql[j] == '_' ||
                             (j > i + 1 && std::isdigit(static_cast<unsigned char>(sql[j]))))) {
                ++j;
            }
            if (j < n && sql[j] == '$') {
                std::string tag = sql.substr(i, j - i + 1);
                size_t end = sql.find(tag, j + 1);
                content();
                i = (end == std::string::npos) ? n : end + tag.size();
                continue;
            }
        }

        if (isWordChar(c)) {
            size_t start = i;
            while (i < n && isWordChar(sql[i])) ++i;
            std::string word = toUpper(sql.substr(start, i - start));

            // E'...' escape string: backslash escapes apply
            if (postgres && word == "E" && i < n && sql[i] == '\'') {
                content();
                i = skipQuoted(sql, i, '\'', true);
                continue;
            }

            content();
            result.tokens.push_back({std::move(word), depth});
            continue;
        }

        if (c == ';') {
            terminated = true;
            ++i;
            continue;
        }

        content();
        if (c == '(') {
            ++depth;
        } else if (c == ')' && depth > 0) {
            --depth;
        }
        ++i;
    }

    return result;
}

// ============================================================================
// Policy
// ============================================================================

SqlSafetyPolicy::SqlSafetyPolicy(const SecurityConfig& config)
    : m_readOnly(config.read_only)
    , m_maxQueryLength(config.max_query_length)
    , m_rejectMultipleStatements(config.reject_multiple_statements) {
    for (const auto& op : config.allowed_operations) {
        m_allowedOperations.insert(toUpper(op));
    }
    for (const auto& keyword : config.blocked_keywords) {
        m_blockedKeywords.insert(toUpper(keyword));
    }
    spdlog::debug("SQL safety policy: read_only={}, allowed=[{}], blocked=[{}], max_length={}",
                  m_readOnly, joined(m_allowedOperations), joined(m_blockedKeywords),
                  m_maxQueryLength);
}

std::string SqlSafetyPolicy::effectiveVerb(const TokenizedSql& tokenized) {
    const auto& tokens = tokenized.tokens;
    if (tokens.empty()) return "";

    const std::string& lead = tokens.front().word;

    if (lead == "WITH") {
        int baseDepth = tokens.front().depth;
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (tokens[i].depth == baseDepth && isDmlVerb(tokens[i].word) && tokens[i].word != "WITH") {
                return tokens[i].word;
            }
        }
        return lead;
    }

    if (lead == "EXPLAIN") {
        bool analyze = false;
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (tokens[i].word == "ANALYZE" || tokens[i].word == "ANALYSE") {
                analyze = true;
            } else if (isDmlVerb(tokens[i].word)) {
                if (!analyze) return lead;
                TokenizedSql inner;
                inner.tokens.assign(tokens.begin() + static_cast<std::ptrdiff_t>(i), tokens.end());
                return effectiveVerb(inner);
            }
        }
        return lead;
    }

    return lead;
}

bool SqlSafetyPolicy::isReadOnly(const TokenizedSql& tokenized) {
    const auto& tokens = tokenized.tokens;
    if (tokens.empty()) return false;

    const std::string& lead = tokens.front().word;
    if (lead != "SELECT" && lead != "WITH" && lead != "EXPLAIN") {
        return false;
    }

    std::string verb = effectiveVerb(tokenized);

    // Plain EXPLAIN only plans the statement
    if (lead == "EXPLAIN" && verb == "EXPLAIN") {
        return true;
    }

    if (verb != "SELECT" && verb != "VALUES" && verb != "TABLE") {
        return false;
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (isModifyingToken(tokens, i)) {
            return false;
        }
    }
    return true;
}

bool SqlSafetyPolicy::isReadOnlyStatement(const std::string& sql,
                                          std::optional<DatabaseType> dialect) {
    if (dialect) {
        return isReadOnly(tokenizeSql(sql, *dialect));
    }
    return std::all_of(kDialects.begin(), kDialects.end(), [&sql](DatabaseType d) {
        return isReadOnly(tokenizeSql(sql, d));
    });
}

std::optional<ValidationFailure> SqlSafetyPolicy::validate(const std::string& sql, bool forceReadOnly,
                                                           std::optional<DatabaseType> dialect) const {
    if (dialect) {
        return check(sql, tokenizeSql(sql, *dialect), forceReadOnly);
    }
    // Backend unknown: the statement has to pass however it is lexed
    for (DatabaseType d : kDialects) {
        if (auto failure = check(sql, tokenizeSql(sql, d), forceReadOnly)) {
            return failure;
        }
    }
    return std::nullopt;
}

std::optional<ValidationFailure> SqlSafetyPolicy::check(const std::string& sql,
                                                        const TokenizedSql& tokenized,
                                                        bool forceReadOnly) const {
    if (tokenized.tokens.empty()) {
        return ValidationFailure{kRuleEmpty, "SQL statement is empty"};
    }

    const std::string& lead = tokenized.tokens.front().word;
    std::string verb = effectiveVerb(tokenized);

    // 1. Read-only mode
    if ((m_readOnly || forceReadOnly) && !isReadOnly(tokenized)) {
        return ValidationFailure{kRuleReadOnly,
            "Read-only mode: only SELECT, WITH and EXPLAIN statements are allowed, got " +
            (verb.empty() ? lead : verb)};
    }

    // 2. Allowed operations
    if (m_allowedOperations.find(lead) == m_allowedOperations.end()) {
        return ValidationFailure{kRuleAllowedOperations,
            "Operation not allowed: " + lead + " (allowed: " + joined(m_allowedOperations) + ")"};
    }
    if (verb != lead && lead != "EXPLAIN" &&
        m_allowedOperations.find(verb) == m_allowedOperations.end()) {
        return ValidationFailure{kRuleAllowedOperations,
            "Operation not allowed: " + verb + " inside " + lead};
    }
    if (lead == "EXPLAIN" && verb != lead &&
        m_allowedOperations.find(verb) == m_allowedOperations.end()) {
        return ValidationFailure{kRuleAllowedOperations,
            "Operation not allowed: EXPLAIN ANALYZE executes " + verb};
    }

    // 3. Blocked keywords, matched as whole tokens
    for (const auto& token : tokenized.tokens) {
        if (m_blockedKeywords.count(token.word)) {
            return ValidationFailure{kRuleBlockedKeywords,
                "Blocked keyword in statement: " + token.word};
        }
    }

    // 4. Length
    if (sql.size() > m_maxQueryLength) {
        return ValidationFailure{kRuleMaxLength,
            "Statement length " + std::to_string(sql.size()) +
            " exceeds maximum of " + std::to_string(m_maxQueryLength)};
    }

    // 5. Stacked statements
    if (m_rejectMultipleStatements && tokenized.multipleStatements) {
        return ValidationFailure{kRuleMultipleStatements,
            "Multiple statements are not allowed in a single call"};
    }

    return std::nullopt;
}

void SqlSafetyPolicy::enforce(const std::string& sql, bool forceReadOnly,
                              std::optional<DatabaseType> dialect) const {
    if (auto failure = validate(sql, forceReadOnly, dialect)) {
        spdlog::warn("SQL rejected by rule '{}': {}", failure->rule, failure->message);
        throw DatabaseError(ErrorKind::ValidationError, failure->message, failure->rule);
    }
}

}  // namespace sqlbridge
