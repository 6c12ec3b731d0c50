#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace chronodb {
namespace query {

// ============================================================================
// Expressions
// ============================================================================

enum class ExprType {
    Literal,        // 95, 2.5, 'login', true, null
    Column,         // value, email, t1.value
    Star,           // * (only as function argument, e.g. count(*))
    Duration,       // 1h, 15m
    Regex,          // /pattern/ (right-hand side of =~ and !~)
    Forever,        // forever
    FunctionCall,   // count(*), percentile(95, value), now()
    BinaryOp,       // + - * / = != < <= > >= =~ !~ and or
    UnaryOp         // -x, not x
};

using LiteralValue = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string
>;

enum class BinaryOperator {
    Eq, Neq, Lt, Lte, Gt, Gte,
    Match, NotMatch,
    And, Or,
    Add, Sub, Mul, Div
};

enum class UnaryOperator { Minus, Not };

const char* binaryOperatorToString(BinaryOperator op);
bool isComparison(BinaryOperator op);

struct Expression {
    virtual ~Expression() = default;
    virtual ExprType getType() const = 0;
    virtual nlohmann::json toJSON() const = 0;
    /// Canonical source text; used as the result column name of computed fields
    virtual std::string text() const = 0;
};

using ExprPtr = std::shared_ptr<Expression>;

struct LiteralExpr : Expression {
    LiteralValue value;

    explicit LiteralExpr(LiteralValue v) : value(std::move(v)) {}

    ExprType getType() const override { return ExprType::Literal; }
    nlohmann::json toJSON() const override;
    std::string text() const override;
    nlohmann::json toValue() const;
};

struct ColumnExpr : Expression {
    std::string name;

    explicit ColumnExpr(std::string n) : name(std::move(n)) {}

    ExprType getType() const override { return ExprType::Column; }
    nlohmann::json toJSON() const override { return {{"type", "column"}, {"name", name}}; }
    std::string text() const override { return name; }
};

struct StarExpr : Expression {
    ExprType getType() const override { return ExprType::Star; }
    nlohmann::json toJSON() const override { return {{"type", "star"}}; }
    std::string text() const override { return "*"; }
};

struct DurationExpr : Expression {
    int64_t millis = 0;
    std::string literal;

    DurationExpr(int64_t ms, std::string lit) : millis(ms), literal(std::move(lit)) {}

    ExprType getType() const override { return ExprType::Duration; }
    nlohmann::json toJSON() const override { return {{"type", "duration"}, {"ms", millis}, {"literal", literal}}; }
    std::string text() const override { return literal; }
};

struct RegexExpr : Expression {
    std::string pattern;

    explicit RegexExpr(std::string p) : pattern(std::move(p)) {}

    ExprType getType() const override { return ExprType::Regex; }
    nlohmann::json toJSON() const override { return {{"type", "regex"}, {"pattern", pattern}}; }
    std::string text() const override { return "/" + pattern + "/"; }
};

struct ForeverExpr : Expression {
    ExprType getType() const override { return ExprType::Forever; }
    nlohmann::json toJSON() const override { return {{"type", "forever"}}; }
    std::string text() const override { return "forever"; }
};

struct FunctionCallExpr : Expression {
    std::string name;   // lower case
    std::vector<ExprPtr> arguments;

    FunctionCallExpr(std::string n, std::vector<ExprPtr> args)
        : name(std::move(n)), arguments(std::move(args)) {}

    ExprType getType() const override { return ExprType::FunctionCall; }
    nlohmann::json toJSON() const override;
    std::string text() const override;
};

struct BinaryOpExpr : Expression {
    BinaryOperator op;
    ExprPtr left;
    ExprPtr right;

    BinaryOpExpr(BinaryOperator o, ExprPtr l, ExprPtr r)
        : op(o), left(std::move(l)), right(std::move(r)) {}

    ExprType getType() const override { return ExprType::BinaryOp; }
    nlohmann::json toJSON() const override;
    std::string text() const override;
};

struct UnaryOpExpr : Expression {
    UnaryOperator op;
    ExprPtr operand;

    UnaryOpExpr(UnaryOperator o, ExprPtr e) : op(o), operand(std::move(e)) {}

    ExprType getType() const override { return ExprType::UnaryOp; }
    nlohmann::json toJSON() const override;
    std::string text() const override;
};

// ============================================================================
// Statements
// ============================================================================

/// FROM clause
struct SeriesSource {
    enum class Kind {
        Name,       // cpu.idle
        Regex,      // cpu.* or /^cpu\./
        Merge,      // merge(a, b, ...)
        Join        // inner_join(a, t1, b, t2)
    };

    Kind kind = Kind::Name;
    std::string name;                   // Name
    std::string pattern;                // Regex
    std::vector<std::string> names;     // Merge / Join series
    std::vector<std::string> aliases;   // Join aliases, parallel to names

    nlohmann::json toJSON() const;
};

struct GroupBy {
    std::optional<int64_t> bucket_ms;   // time(...) interval
    std::vector<std::string> columns;   // non-time group columns, in query order

    bool empty() const { return !bucket_ms && columns.empty(); }
};

enum class StatementType { Select, Delete, ListSeries };

struct Statement {
    StatementType type = StatementType::Select;
    std::vector<ExprPtr> fields;        // empty with select_all
    bool select_all = false;
    std::optional<SeriesSource> source; // optional for list series
    ExprPtr where;
    GroupBy group_by;
    std::optional<size_t> limit;
    std::optional<bool> ascending;
    std::optional<std::string> into;
    std::string text;                   // original statement text

    nlohmann::json toJSON() const;
};

} // namespace query
} // namespace chronodb
