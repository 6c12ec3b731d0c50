#pragma once

#include <memory>
#include <string>

#include "query/query_ast.h"

namespace chronodb {
namespace query {

struct ParseError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    std::string context;  // Snippet of the query around the error

    std::string toString() const {
        std::string result = "Parse error at line " + std::to_string(line)
                           + ", column " + std::to_string(column) + ": " + message;
        if (!context.empty()) {
            result += "\n  " + context;
        }
        return result;
    }
};

struct ParseResult {
    bool success = false;
    std::shared_ptr<Statement> statement;
    ParseError error;

    static ParseResult Success(std::shared_ptr<Statement> s) {
        ParseResult result;
        result.success = true;
        result.statement = std::move(s);
        return result;
    }

    static ParseResult Failure(std::string msg, size_t line = 0, size_t col = 0, std::string ctx = "") {
        ParseResult result;
        result.success = false;
        result.error.message = std::move(msg);
        result.error.line = line;
        result.error.column = col;
        result.error.context = std::move(ctx);
        return result;
    }
};

/**
 * Parser for the series query language.
 *
 * Example:
 *   QueryParser parser;
 *   auto r = parser.parse("select count(*) from users.events group_by time(1h) where time>now()-7d");
 *   if (r.success) { ... r.statement ... } else { r.error.toString(); }
 *
 * Clauses after FROM may appear in any order. "from=", "limit=" and
 * "into=" are accepted as well as the space separated forms.
 */
class QueryParser {
public:
    QueryParser() = default;

    ParseResult parse(const std::string& query_string);

    /// True if the source text must be treated as a regular expression
    static bool looksLikeRegex(const std::string& name);
};

}  // namespace query
}  // namespace chronodb
