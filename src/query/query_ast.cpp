#include "query/query_ast.h"

namespace chronodb {
namespace query {

const char* binaryOperatorToString(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Eq: return "=";
        case BinaryOperator::Neq: return "!=";
        case BinaryOperator::Lt: return "<";
        case BinaryOperator::Lte: return "<=";
        case BinaryOperator::Gt: return ">";
        case BinaryOperator::Gte: return ">=";
        case BinaryOperator::Match: return "=~";
        case BinaryOperator::NotMatch: return "!~";
        case BinaryOperator::And: return "and";
        case BinaryOperator::Or: return "or";
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::Div: return "/";
    }
    return "?";
}

bool isComparison(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Eq:
        case BinaryOperator::Neq:
        case BinaryOperator::Lt:
        case BinaryOperator::Lte:
        case BinaryOperator::Gt:
        case BinaryOperator::Gte:
        case BinaryOperator::Match:
        case BinaryOperator::NotMatch:
            return true;
        default:
            return false;
    }
}

nlohmann::json LiteralExpr::toValue() const {
    return std::visit([](const auto& v) -> nlohmann::json { return v; }, value);
}

nlohmann::json LiteralExpr::toJSON() const {
    return {{"type", "literal"}, {"value", toValue()}};
}

std::string LiteralExpr::text() const {
    if (std::holds_alternative<std::string>(value)) {
        return "'" + std::get<std::string>(value) + "'";
    }
    return toValue().dump();
}

nlohmann::json FunctionCallExpr::toJSON() const {
    nlohmann::json args = nlohmann::json::array();
    for (const auto& a : arguments) {
        args.push_back(a->toJSON());
    }
    return {{"type", "function"}, {"name", name}, {"arguments", args}};
}

std::string FunctionCallExpr::text() const {
    std::string out = name + "(";
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) out += ", ";
        out += arguments[i]->text();
    }
    return out + ")";
}

nlohmann::json BinaryOpExpr::toJSON() const {
    return {
        {"type", "binary"},
        {"op", binaryOperatorToString(op)},
        {"left", left->toJSON()},
        {"right", right->toJSON()}
    };
}

std::string BinaryOpExpr::text() const {
    return left->text() + " " + binaryOperatorToString(op) + " " + right->text();
}

nlohmann::json UnaryOpExpr::toJSON() const {
    return {{"type", "unary"}, {"op", op == UnaryOperator::Minus ? "-" : "not"}, {"operand", operand->toJSON()}};
}

std::string UnaryOpExpr::text() const {
    return op == UnaryOperator::Minus ? "-" + operand->text() : "not " + operand->text();
}

nlohmann::json SeriesSource::toJSON() const {
    switch (kind) {
        case Kind::Name: return {{"kind", "name"}, {"name", name}};
        case Kind::Regex: return {{"kind", "regex"}, {"pattern", pattern}};
        case Kind::Merge: return {{"kind", "merge"}, {"series", names}};
        case Kind::Join: return {{"kind", "inner_join"}, {"series", names}, {"aliases", aliases}};
    }
    return nullptr;
}

nlohmann::json Statement::toJSON() const {
    nlohmann::json j;
    switch (type) {
        case StatementType::Select: j["type"] = "select"; break;
        case StatementType::Delete: j["type"] = "delete"; break;
        case StatementType::ListSeries: j["type"] = "list_series"; break;
    }
    nlohmann::json f = nlohmann::json::array();
    for (const auto& e : fields) f.push_back(e->toJSON());
    j["fields"] = f;
    j["select_all"] = select_all;
    if (source) j["source"] = source->toJSON();
    if (where) j["where"] = where->toJSON();
    if (group_by.bucket_ms) j["group_by_time_ms"] = *group_by.bucket_ms;
    if (!group_by.columns.empty()) j["group_by"] = group_by.columns;
    if (limit) j["limit"] = *limit;
    if (ascending) j["order"] = *ascending ? "asc" : "desc";
    if (into) j["into"] = *into;
    return j;
}

} // namespace query
} // namespace chronodb
