#include "query/query_engine.h"
#include "query/aggregator.h"
#include "query/query_parser.h"
#include "timeseries/series_store.h"
#include "utils/logger.h"

#include <algorithm>
#include <limits>
#include <map>
#include <regex>
#include <set>
#include <unordered_map>

namespace chronodb {
namespace query {

namespace {

using json = nlohmann::json;

constexpr int64_t kMaxTime = std::numeric_limits<int64_t>::max();
const char* const kOrigSeriesColumn = "_orig_series";

struct EvalContext {
    utils::TimePrecision precision = utils::TimePrecision::Seconds;
    int64_t now_ms = 0;
    std::unordered_map<std::string, std::regex> regexes;

    const std::regex& regexFor(const std::string& pattern) {
        auto it = regexes.find(pattern);
        if (it == regexes.end()) {
            try {
                it = regexes.emplace(pattern, std::regex(pattern, std::regex::ECMAScript)).first;
            } catch (const std::regex_error& e) {
                throw QueryError("Invalid regular expression '" + pattern + "': " + e.what());
            }
        }
        return it->second;
    }
};

bool isTopOrBottom(const ExprPtr& e) {
    if (!e || e->getType() != ExprType::FunctionCall) return false;
    const auto& name = static_cast<const FunctionCallExpr&>(*e).name;
    return name == "top" || name == "bottom";
}

bool referencesTime(const ExprPtr& e) {
    if (!e) return false;
    switch (e->getType()) {
        case ExprType::Column:
            return static_cast<const ColumnExpr&>(*e).name == "time";
        case ExprType::BinaryOp: {
            const auto& b = static_cast<const BinaryOpExpr&>(*e);
            return referencesTime(b.left) || referencesTime(b.right);
        }
        case ExprType::UnaryOp:
            return referencesTime(static_cast<const UnaryOpExpr&>(*e).operand);
        case ExprType::FunctionCall:
            for (const auto& a : static_cast<const FunctionCallExpr&>(*e).arguments) {
                if (referencesTime(a)) return true;
            }
            return false;
        default:
            return false;
    }
}

void collectColumns(const ExprPtr& e, std::set<std::string>& out) {
    if (!e) return;
    switch (e->getType()) {
        case ExprType::Column: {
            const auto& name = static_cast<const ColumnExpr&>(*e).name;
            if (name != "time") out.insert(name);
            break;
        }
        case ExprType::BinaryOp: {
            const auto& b = static_cast<const BinaryOpExpr&>(*e);
            collectColumns(b.left, out);
            collectColumns(b.right, out);
            break;
        }
        case ExprType::UnaryOp:
            collectColumns(static_cast<const UnaryOpExpr&>(*e).operand, out);
            break;
        case ExprType::FunctionCall:
            for (const auto& a : static_cast<const FunctionCallExpr&>(*e).arguments) {
                collectColumns(a, out);
            }
            break;
        default:
            break;
    }
}

json lookupColumn(const Point& p, const std::string& name, const EvalContext& ctx) {
    if (name == "time") {
        return utils::fromMillis(p.timestamp_ms, ctx.precision);
    }
    auto it = p.values.find(name);
    if (it == p.values.end()) return nullptr;
    return *it;
}

bool fitsInt64(const json& v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return v.is_number_integer();
}

json arithmetic(BinaryOperator op, const json& a, const json& b) {
    if (!a.is_number() || !b.is_number()) return nullptr;
    // Integer results that would overflow int64 are computed as doubles
    const bool ints = fitsInt64(a) && fitsInt64(b);
    std::optional<int64_t> exact;
    switch (op) {
        case BinaryOperator::Add:
            if (ints && (exact = utils::checkedAdd(a.get<int64_t>(), b.get<int64_t>()))) return *exact;
            return a.get<double>() + b.get<double>();
        case BinaryOperator::Sub:
            if (ints && (exact = utils::checkedSub(a.get<int64_t>(), b.get<int64_t>()))) return *exact;
            return a.get<double>() - b.get<double>();
        case BinaryOperator::Mul:
            if (ints && (exact = utils::checkedMul(a.get<int64_t>(), b.get<int64_t>()))) return *exact;
            return a.get<double>() * b.get<double>();
        case BinaryOperator::Div: {
            double d = b.get<double>();
            if (d == 0.0) return nullptr;
            return a.get<double>() / d;
        }
        default:
            return nullptr;
    }
}

json negate(const json& v) {
    if (fitsInt64(v)) {
        if (auto n = utils::checkedSub(0, v.get<int64_t>())) return *n;
        return -v.get<double>();
    }
    if (v.is_number()) return -v.get<double>();
    return nullptr;
}

bool compareValues(BinaryOperator op, const json& a, const json& b) {
    // A missing column never matches
    if (a.is_null() || b.is_null()) return false;

    int cmp = 0;
    if (a.is_number() && b.is_number()) {
        double x = a.get<double>();
        double y = b.get<double>();
        cmp = x < y ? -1 : (x > y ? 1 : 0);
    } else if (a.is_string() && b.is_string()) {
        int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
    } else if (a.is_boolean() && b.is_boolean()) {
        if (op == BinaryOperator::Eq) return a == b;
        if (op == BinaryOperator::Neq) return a != b;
        return false;
    } else {
        return op == BinaryOperator::Neq;
    }

    switch (op) {
        case BinaryOperator::Eq: return cmp == 0;
        case BinaryOperator::Neq: return cmp != 0;
        case BinaryOperator::Lt: return cmp < 0;
        case BinaryOperator::Lte: return cmp <= 0;
        case BinaryOperator::Gt: return cmp > 0;
        case BinaryOperator::Gte: return cmp >= 0;
        default: return false;
    }
}

bool truthy(const json& v) {
    return v.is_boolean() && v.get<bool>();
}

/// Evaluate an expression against a single point
json evalRow(const ExprPtr& e, const Point& p, EvalContext& ctx) {
    switch (e->getType()) {
        case ExprType::Literal:
            return static_cast<const LiteralExpr&>(*e).toValue();
        case ExprType::Column:
            return lookupColumn(p, static_cast<const ColumnExpr&>(*e).name, ctx);
        case ExprType::Duration:
            return static_cast<const DurationExpr&>(*e).millis;
        case ExprType::Forever:
            return nullptr;
        case ExprType::Star:
            throw QueryError("'*' is only valid as the argument of count()");
        case ExprType::Regex:
            throw QueryError("Regular expressions are only valid after =~ or !~");
        case ExprType::UnaryOp: {
            const auto& u = static_cast<const UnaryOpExpr&>(*e);
            json v = evalRow(u.operand, p, ctx);
            if (u.op == UnaryOperator::Not) return !truthy(v);
            return negate(v);
        }
        case ExprType::BinaryOp: {
            const auto& b = static_cast<const BinaryOpExpr&>(*e);
            if (b.op == BinaryOperator::And) {
                return truthy(evalRow(b.left, p, ctx)) && truthy(evalRow(b.right, p, ctx));
            }
            if (b.op == BinaryOperator::Or) {
                return truthy(evalRow(b.left, p, ctx)) || truthy(evalRow(b.right, p, ctx));
            }
            if (b.op == BinaryOperator::Match || b.op == BinaryOperator::NotMatch) {
                json v = evalRow(b.left, p, ctx);
                if (!v.is_string()) return false;
                if (b.right->getType() != ExprType::Regex) {
                    throw QueryError("Right side of =~ must be a regular expression");
                }
                const auto& re = ctx.regexFor(static_cast<const RegexExpr&>(*b.right).pattern);
                bool found = std::regex_search(v.get_ref<const std::string&>(), re);
                return b.op == BinaryOperator::Match ? found : !found;
            }
            json l = evalRow(b.left, p, ctx);
            json r = evalRow(b.right, p, ctx);
            if (isComparison(b.op)) {
                return compareValues(b.op, l, r);
            }
            return arithmetic(b.op, l, r);
        }
        case ExprType::FunctionCall: {
            const auto& f = static_cast<const FunctionCallExpr&>(*e);
            if (f.name == "diff") {
                if (f.arguments.size() != 2) throw QueryError("diff() expects two arguments");
                return arithmetic(BinaryOperator::Sub, evalRow(f.arguments[0], p, ctx), evalRow(f.arguments[1], p, ctx));
            }
            if (f.name == "now") {
                return utils::fromMillis(ctx.now_ms, ctx.precision);
            }
            if (Aggregator::isAggregateName(f.name) || f.name == "top" || f.name == "bottom") {
                throw QueryError("Aggregate function " + f.name + "() cannot be nested here");
            }
            throw QueryError("Unknown function " + f.name + "()");
        }
    }
    return nullptr;
}

/// Evaluate a time bound expression to milliseconds
int64_t evalTime(const ExprPtr& e, const EvalContext& ctx) {
    switch (e->getType()) {
        case ExprType::Literal: {
            json v = static_cast<const LiteralExpr&>(*e).toValue();
            std::optional<int64_t> ms;
            if (v.is_number_integer()) ms = utils::toMillis(v.get<int64_t>(), ctx.precision);
            else if (v.is_number_float()) ms = utils::toMillis(v.get<double>(), ctx.precision);
            else throw QueryError("Time must be compared with a number, now() or forever");
            if (!ms) throw QueryError("Timestamp out of range: " + e->text());
            return *ms;
        }
        case ExprType::Forever:
            return kMaxTime;
        case ExprType::Duration:
            return static_cast<const DurationExpr&>(*e).millis;
        case ExprType::FunctionCall: {
            const auto& f = static_cast<const FunctionCallExpr&>(*e);
            if (f.name == "now" && f.arguments.empty()) return ctx.now_ms;
            throw QueryError("Unsupported function in time condition: " + f.name + "()");
        }
        case ExprType::UnaryOp: {
            const auto& u = static_cast<const UnaryOpExpr&>(*e);
            if (u.op == UnaryOperator::Minus) {
                if (auto n = utils::checkedSub(0, evalTime(u.operand, ctx))) return *n;
                throw QueryError("Timestamp out of range: " + e->text());
            }
            break;
        }
        case ExprType::BinaryOp: {
            const auto& b = static_cast<const BinaryOpExpr&>(*e);
            if (b.op == BinaryOperator::Add || b.op == BinaryOperator::Sub) {
                int64_t l = evalTime(b.left, ctx);
                int64_t r = evalTime(b.right, ctx);
                if (l == kMaxTime || r == kMaxTime) return kMaxTime;
                auto t = b.op == BinaryOperator::Add ? utils::checkedAdd(l, r) : utils::checkedSub(l, r);
                if (!t) throw QueryError("Timestamp out of range: " + e->text());
                return *t;
            }
            break;
        }
        default:
            break;
    }
    throw QueryError("Unsupported time expression: " + e->text());
}

std::vector<ExprPtr> flattenAnd(const ExprPtr& e) {
    std::vector<ExprPtr> out;
    if (!e) return out;
    if (e->getType() == ExprType::BinaryOp) {
        const auto& b = static_cast<const BinaryOpExpr&>(*e);
        if (b.op == BinaryOperator::And) {
            auto l = flattenAnd(b.left);
            auto r = flattenAnd(b.right);
            out.insert(out.end(), l.begin(), l.end());
            out.insert(out.end(), r.begin(), r.end());
            return out;
        }
    }
    out.push_back(e);
    return out;
}

BinaryOperator flip(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Lt: return BinaryOperator::Gt;
        case BinaryOperator::Lte: return BinaryOperator::Gte;
        case BinaryOperator::Gt: return BinaryOperator::Lt;
        case BinaryOperator::Gte: return BinaryOperator::Lte;
        default: return op;
    }
}

/// Aggregate evaluation over one group (points oldest first)
json evalAggregate(const ExprPtr& e, const std::vector<const Point*>& pts, EvalContext& ctx) {
    auto collect = [&](const ExprPtr& arg) {
        std::vector<json> values;
        values.reserve(pts.size());
        for (const Point* p : pts) {
            values.push_back(evalRow(arg, *p, ctx));
        }
        return values;
    };

    switch (e->getType()) {
        case ExprType::Literal:
            return static_cast<const LiteralExpr&>(*e).toValue();
        case ExprType::Column:
            throw QueryError("Column '" + static_cast<const ColumnExpr&>(*e).name +
                             "' must be used inside an aggregate function");
        case ExprType::UnaryOp: {
            const auto& u = static_cast<const UnaryOpExpr&>(*e);
            json v = evalAggregate(u.operand, pts, ctx);
            if (u.op == UnaryOperator::Minus) return negate(v);
            throw QueryError("'not' is not valid in a selected field");
        }
        case ExprType::BinaryOp: {
            const auto& b = static_cast<const BinaryOpExpr&>(*e);
            if (isComparison(b.op) || b.op == BinaryOperator::And || b.op == BinaryOperator::Or) {
                throw QueryError("Comparisons are not valid in aggregate fields");
            }
            return arithmetic(b.op, evalAggregate(b.left, pts, ctx), evalAggregate(b.right, pts, ctx));
        }
        case ExprType::FunctionCall: {
            const auto& f = static_cast<const FunctionCallExpr&>(*e);
            if (f.name == "top" || f.name == "bottom") {
                throw QueryError(f.name + "() must be the only selected field");
            }
            if (f.name == "diff") {
                if (f.arguments.size() != 2) throw QueryError("diff() expects two arguments");
                return arithmetic(BinaryOperator::Sub,
                                  evalAggregate(f.arguments[0], pts, ctx),
                                  evalAggregate(f.arguments[1], pts, ctx));
            }
            auto fn = Aggregator::fromName(f.name);
            if (!fn) {
                throw QueryError("Unknown function " + f.name + "()");
            }

            if (*fn == Aggregator::Function::Percentile) {
                if (f.arguments.size() != 2) throw QueryError("percentile() expects (p, column)");
                // Accept percentile(95, value) and percentile(value, 95)
                size_t p_idx = f.arguments[0]->getType() == ExprType::Literal ? 0 : 1;
                const auto& p_expr = f.arguments[p_idx];
                if (p_expr->getType() != ExprType::Literal) throw QueryError("percentile() needs a numeric percentile");
                json p = static_cast<const LiteralExpr&>(*p_expr).toValue();
                if (!p.is_number() || p.get<double>() < 0.0 || p.get<double>() > 100.0) {
                    throw QueryError("percentile must be between 0 and 100");
                }
                return Aggregator::percentile(Aggregator::numericValues(collect(f.arguments[1 - p_idx])), p.get<double>());
            }

            if (f.arguments.size() != 1) {
                throw QueryError(f.name + "() expects one argument");
            }
            const auto& arg = f.arguments[0];

            if (*fn == Aggregator::Function::Count) {
                if (arg->getType() == ExprType::Star) {
                    return static_cast<int64_t>(pts.size());
                }
                if (arg->getType() == ExprType::FunctionCall &&
                    static_cast<const FunctionCallExpr&>(*arg).name == "distinct") {
                    const auto& d = static_cast<const FunctionCallExpr&>(*arg);
                    if (d.arguments.size() != 1) throw QueryError("distinct() expects one argument");
                    return Aggregator::countDistinct(collect(d.arguments[0]));
                }
                return Aggregator::count(collect(arg));
            }
            if (arg->getType() == ExprType::Star) {
                throw QueryError("'*' is only valid as the argument of count()");
            }

            auto values = collect(arg);
            switch (*fn) {
                case Aggregator::Function::Distinct: return Aggregator::distinct(values);
                case Aggregator::Function::Sum: return Aggregator::sum(values);
                case Aggregator::Function::Mean: return Aggregator::mean(values);
                case Aggregator::Function::Min: return Aggregator::min(values);
                case Aggregator::Function::Max: return Aggregator::max(values);
                case Aggregator::Function::First: return Aggregator::first(values);
                case Aggregator::Function::Last: return Aggregator::last(values);
                case Aggregator::Function::Median: return Aggregator::median(Aggregator::numericValues(values));
                case Aggregator::Function::StdDev: return Aggregator::stddev(Aggregator::numericValues(values));
                default: break;
            }
            return nullptr;
        }
        default:
            throw QueryError("Unsupported expression in aggregate field: " + e->text());
    }
}

std::string fieldName(const ExprPtr& e) {
    switch (e->getType()) {
        case ExprType::Column:
            return static_cast<const ColumnExpr&>(*e).name;
        case ExprType::FunctionCall: {
            const auto& f = static_cast<const FunctionCallExpr&>(*e);
            if ((f.name == "first" || f.name == "last") && f.arguments.size() == 1) {
                return f.arguments[0]->text();
            }
            if ((f.name == "top" || f.name == "bottom") && f.arguments.size() == 2) {
                return fieldName(f.arguments[1]);
            }
            return f.name;
        }
        default:
            return e->text();
    }
}

std::string valueToName(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

bool pointLess(const Point& a, const Point& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
    return a.seq < b.seq;
}

void sortPoints(std::vector<Point>& pts, bool descending) {
    if (descending) {
        std::sort(pts.begin(), pts.end(), [](const Point& a, const Point& b) { return pointLess(b, a); });
    } else {
        std::sort(pts.begin(), pts.end(), pointLess);
    }
}

/// Points feeding one result series
struct InputSet {
    std::string name;
    std::vector<std::string> series;    // underlying series
    std::vector<Point> points;
};

struct RowEntry {
    int64_t time_ms = 0;
    std::string group_key;
    json row;
};

json aggregateRows(const std::vector<Point>& points,
                   const std::vector<ExprPtr>& fields,
                   const GroupBy& group_by,
                   EvalContext& ctx,
                   bool descending,
                   size_t limit) {
    struct Group {
        int64_t bucket = 0;
        int64_t newest_ms = 0;
        json key_values = json::array();
        std::vector<const Point*> points;
    };
    std::map<std::pair<int64_t, std::string>, Group> groups;

    for (const auto& p : points) {
        int64_t bucket = group_by.bucket_ms ? utils::alignToBucket(p.timestamp_ms, *group_by.bucket_ms) : 0;
        json key_values = json::array();
        for (const auto& col : group_by.columns) {
            key_values.push_back(lookupColumn(p, col, ctx));
        }
        auto& g = groups[{bucket, key_values.dump()}];
        if (g.points.empty()) {
            g.bucket = bucket;
            g.key_values = std::move(key_values);
        }
        g.points.push_back(&p);
        g.newest_ms = std::max(g.newest_ms, p.timestamp_ms);
    }

    std::vector<RowEntry> entries;
    entries.reserve(groups.size());
    for (auto& [key, g] : groups) {
        RowEntry entry;
        entry.time_ms = group_by.bucket_ms ? g.bucket : g.newest_ms;
        entry.group_key = key.second;
        entry.row = json::array();
        for (const auto& f : fields) {
            entry.row.push_back(evalAggregate(f, g.points, ctx));
        }
        entry.row.push_back(utils::fromMillis(entry.time_ms, ctx.precision));
        for (const auto& v : g.key_values) {
            entry.row.push_back(v);
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [descending](const RowEntry& a, const RowEntry& b) {
        if (a.time_ms != b.time_ms) return descending ? a.time_ms > b.time_ms : a.time_ms < b.time_ms;
        return a.group_key < b.group_key;
    });

    json rows = json::array();
    for (auto& e : entries) {
        if (limit > 0 && rows.size() >= limit) break;
        rows.push_back(std::move(e.row));
    }
    return rows;
}

} // namespace

// ============================================================================
// QueryEngine
// ============================================================================

QueryEngine::QueryEngine(SeriesStore& store) : QueryEngine(store, Config{}) {}

QueryEngine::QueryEngine(SeriesStore& store, Config config)
    : store_(store), config_(config) {}

bool QueryEngine::containsAggregate(const ExprPtr& e) {
    if (!e) return false;
    switch (e->getType()) {
        case ExprType::FunctionCall: {
            const auto& f = static_cast<const FunctionCallExpr&>(*e);
            if (Aggregator::isAggregateName(f.name) || f.name == "top" || f.name == "bottom") return true;
            for (const auto& a : f.arguments) {
                if (containsAggregate(a)) return true;
            }
            return false;
        }
        case ExprType::BinaryOp: {
            const auto& b = static_cast<const BinaryOpExpr&>(*e);
            return containsAggregate(b.left) || containsAggregate(b.right);
        }
        case ExprType::UnaryOp:
            return containsAggregate(static_cast<const UnaryOpExpr&>(*e).operand);
        default:
            return false;
    }
}

QueryEngine::Status QueryEngine::extractTimeRange(const ExprPtr& where, utils::TimePrecision precision,
                                                  int64_t now_ms, TimeRange& range, ExprPtr& residual) {
    range = TimeRange{};
    range.from_ms = 0;
    range.to_ms = kMaxTime;
    residual.reset();

    EvalContext ctx;
    ctx.precision = precision;
    ctx.now_ms = now_ms;

    try {
        for (const auto& c : flattenAnd(where)) {
            bool is_time_cmp = false;
            if (c->getType() == ExprType::BinaryOp) {
                const auto& b = static_cast<const BinaryOpExpr&>(*c);
                auto isTimeCol = [](const ExprPtr& x) {
                    return x->getType() == ExprType::Column && static_cast<const ColumnExpr&>(*x).name == "time";
                };
                if (isComparison(b.op) && (isTimeCol(b.left) || isTimeCol(b.right))) {
                    is_time_cmp = true;
                    const bool time_left = isTimeCol(b.left);
                    const BinaryOperator op = time_left ? b.op : flip(b.op);
                    const int64_t v = evalTime(time_left ? b.right : b.left, ctx);

                    switch (op) {
                        case BinaryOperator::Gt:
                            if (v == kMaxTime) {
                                range.from_ms = kMaxTime;
                                range.to_ms = 0;
                            } else {
                                range.from_ms = std::max(range.from_ms, v + 1);
                            }
                            range.has_lower = true;
                            break;
                        case BinaryOperator::Gte:
                            range.from_ms = std::max(range.from_ms, v);
                            range.has_lower = true;
                            break;
                        case BinaryOperator::Lt:
                            range.to_ms = std::min(range.to_ms, v == kMaxTime ? kMaxTime : utils::checkedSub(v, 1).value_or(v));
                            range.has_upper = true;
                            break;
                        case BinaryOperator::Lte:
                            range.to_ms = std::min(range.to_ms, v);
                            range.has_upper = true;
                            break;
                        case BinaryOperator::Eq:
                            range.from_ms = std::max(range.from_ms, v);
                            range.to_ms = std::min(range.to_ms, v);
                            range.has_lower = true;
                            range.has_upper = true;
                            break;
                        default:
                            return Status::Error("Unsupported operator on time: " + std::string(binaryOperatorToString(b.op)));
                    }
                }
            }
            if (is_time_cmp) continue;
            if (referencesTime(c)) {
                return Status::Error("Time conditions must be plain comparisons combined with 'and'");
            }
            residual = residual ? std::make_shared<BinaryOpExpr>(BinaryOperator::And, residual, c) : c;
        }
    } catch (const QueryError& e) {
        return Status::Error(e.what());
    }
    return Status::OK();
}

std::vector<std::string> QueryEngine::resolveSeries(const std::string& db, const SeriesSource& source) const {
    switch (source.kind) {
        case SeriesSource::Kind::Name:
            return {source.name};
        case SeriesSource::Kind::Merge:
        case SeriesSource::Kind::Join:
            return source.names;
        case SeriesSource::Kind::Regex: {
            std::regex re;
            try {
                re = std::regex(source.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                throw QueryError("Invalid regular expression '" + source.pattern + "': " + e.what());
            }
            std::vector<std::string> out;
            for (const auto& name : store_.listSeries(db)) {
                if (std::regex_match(name, re)) out.push_back(name);
            }
            return out;
        }
    }
    return {};
}

QueryEngine::Status QueryEngine::requireSeries(const std::string& db, const SeriesSource& source) const {
    if (source.kind == SeriesSource::Kind::Regex) return Status::OK();
    for (const auto& name : resolveSeries(db, source)) {
        if (!store_.seriesExists(db, name)) {
            return Status::Error(Status::Code::NotFound, "Series not found: " + name);
        }
    }
    return Status::OK();
}

QueryEngine::Result QueryEngine::execute(const std::string& db, const std::string& query_text,
                                         const ExecOptions& options) const {
    QueryParser parser;
    auto parsed = parser.parse(query_text);
    if (!parsed.success) {
        return {Status::Error(parsed.error.toString()), {}};
    }
    return execute(db, *parsed.statement, options);
}

QueryEngine::Result QueryEngine::execute(const std::string& db, const Statement& stmt,
                                         const ExecOptions& options) const {
    const int64_t now_ms = options.now_ms > 0 ? options.now_ms : utils::nowMillis();
    try {
        switch (stmt.type) {
            case StatementType::Select: return executeSelect(db, stmt, options, now_ms);
            case StatementType::Delete: return executeDelete(db, stmt, options, now_ms);
            case StatementType::ListSeries: return executeList(db, stmt);
        }
    } catch (const QueryError& e) {
        CHRONODB_DEBUG("Query on {} failed: {}", db, e.what());
        return {Status::Error(e.what()), {}};
    } catch (const std::regex_error& e) {
        return {Status::Error(std::string("Regular expression error: ") + e.what()), {}};
    }
    return {Status::Error("Unsupported statement"), {}};
}

QueryEngine::Result QueryEngine::executeList(const std::string& db, const Statement& stmt) const {
    SeriesResult result;
    result.name = "list_series";
    result.columns = {"name"};

    std::vector<std::string> names;
    if (stmt.source) {
        names = resolveSeries(db, *stmt.source);
        if (stmt.source->kind == SeriesSource::Kind::Name && !store_.seriesExists(db, stmt.source->name)) {
            names.clear();
        }
    } else {
        names = store_.listSeries(db);
    }
    for (const auto& n : names) {
        result.datapoints.push_back(json::array({n}));
    }
    return {Status::OK(), {result}};
}

QueryEngine::Result QueryEngine::executeDelete(const std::string& db, const Statement& stmt,
                                               const ExecOptions& options, int64_t now_ms) const {
    TimeRange range;
    ExprPtr residual;
    auto st = extractTimeRange(stmt.where, options.precision, now_ms, range, residual);
    if (!st.ok) return {st, {}};
    if (residual) {
        return {Status::Error("DELETE only supports conditions on time"), {}};
    }

    st = requireSeries(db, *stmt.source);
    if (!st.ok) return {st, {}};

    std::vector<SeriesResult> results;
    for (const auto& series : resolveSeries(db, *stmt.source)) {
        auto [dst, deleted] = store_.deleteRange(db, series, range.from_ms, range.to_ms);
        if (!dst.ok) {
            return {Status::Error(dst.message), {}};
        }
        SeriesResult r;
        r.name = series;
        r.columns = {"deleted"};
        r.datapoints.push_back(json::array({static_cast<int64_t>(deleted)}));
        results.push_back(std::move(r));
    }
    return {Status::OK(), results};
}

QueryEngine::Result QueryEngine::executeSelect(const std::string& db, const Statement& stmt,
                                               const ExecOptions& options, int64_t now_ms) const {
    if (!stmt.source) {
        return {Status::Error("SELECT requires a FROM clause"), {}};
    }
    const SeriesSource& source = *stmt.source;

    EvalContext ctx;
    ctx.precision = options.precision;
    ctx.now_ms = now_ms;

    TimeRange range;
    ExprPtr residual;
    auto st = extractTimeRange(stmt.where, options.precision, now_ms, range, residual);
    if (!st.ok) return {st, {}};

    if (!range.has_lower) {
        range.from_ms = options.backfill ? 0 : std::max<int64_t>(0, now_ms - config_.default_window_ms);
    }
    if (!range.has_upper) {
        range.to_ms = now_ms;
    }
    if (options.min_from_ms) {
        range.from_ms = std::max(range.from_ms, *options.min_from_ms);
    }
    range.from_ms = std::max<int64_t>(range.from_ms, 0);

    // Classify fields
    bool any_agg = false;
    bool any_raw = false;
    for (const auto& f : stmt.fields) {
        (containsAggregate(f) ? any_agg : any_raw) = true;
    }
    if (any_agg && any_raw) {
        return {Status::Error("Cannot mix aggregate and non-aggregate fields"), {}};
    }
    const bool aggregate = any_agg;
    const bool ranked = stmt.fields.size() == 1 && isTopOrBottom(stmt.fields[0]);
    if (!ranked) {
        for (const auto& f : stmt.fields) {
            if (isTopOrBottom(f)) {
                return {Status::Error("top()/bottom() must be the only selected field"), {}};
            }
        }
    }
    if (!aggregate && !stmt.group_by.empty() && source.kind != SeriesSource::Kind::Join) {
        return {Status::Error("group_by requires an aggregate function"), {}};
    }

    const size_t limit = options.unlimited ? 0 : stmt.limit.value_or(config_.default_limit);
    const bool descending = !stmt.ascending.value_or(false);

    // Raw selects only keep points carrying at least one selected column
    std::set<std::string> referenced;
    if (!stmt.select_all) {
        for (const auto& f : stmt.fields) collectColumns(f, referenced);
    }
    auto hasReferenced = [&](const Point& p) {
        if (aggregate || referenced.empty()) return true;
        for (const auto& c : referenced) {
            auto it = p.values.find(c);
            if (it != p.values.end() && !it->is_null()) return true;
        }
        return false;
    };
    auto wherePredicate = [&](const Point& p) {
        return !residual || truthy(evalRow(residual, p, ctx));
    };

    auto scan = [&](const std::string& series, bool tag_origin, bool scan_desc, size_t scan_limit) {
        SeriesStore::ScanOptions so;
        so.from_ms = range.from_ms;
        so.to_ms = range.to_ms;
        so.descending = scan_desc;
        so.limit = scan_limit;
        so.predicate = [&](const Point& p) {
            if (!tag_origin) return wherePredicate(p) && hasReferenced(p);
            Point tagged = p;
            tagged.values[kOrigSeriesColumn] = series;
            return wherePredicate(tagged) && hasReferenced(tagged);
        };
        auto [sst, pts] = store_.scan(db, series, so);
        if (!sst.ok) throw QueryError(sst.message);
        if (tag_origin) {
            for (auto& p : pts) p.values[kOrigSeriesColumn] = series;
        }
        return pts;
    };

    const bool scan_desc = aggregate ? false : descending;
    const size_t scan_limit = aggregate ? 0 : limit;

    st = requireSeries(db, source);
    if (!st.ok) return {st, {}};

    std::vector<InputSet> inputs;
    auto series_names = resolveSeries(db, source);
    if (options.series_filter) {
        series_names.erase(std::remove_if(series_names.begin(), series_names.end(),
                                          [&](const std::string& s) { return !options.series_filter(s); }),
                           series_names.end());
    }

    switch (source.kind) {
        case SeriesSource::Kind::Name:
        case SeriesSource::Kind::Regex:
            for (const auto& s : series_names) {
                InputSet in;
                in.name = s;
                in.series = {s};
                in.points = scan(s, false, scan_desc, scan_limit);
                if (source.kind == SeriesSource::Kind::Regex && in.points.empty()) continue;
                inputs.push_back(std::move(in));
            }
            break;
        case SeriesSource::Kind::Merge: {
            InputSet in;
            for (size_t i = 0; i < source.names.size(); ++i) {
                if (i > 0) in.name += "_merge_";
                in.name += source.names[i];
            }
            in.series = series_names;
            for (const auto& s : series_names) {
                auto pts = scan(s, true, scan_desc, scan_limit);
                in.points.insert(in.points.end(), std::make_move_iterator(pts.begin()), std::make_move_iterator(pts.end()));
            }
            sortPoints(in.points, scan_desc);
            if (scan_limit > 0 && in.points.size() > scan_limit) in.points.resize(scan_limit);
            inputs.push_back(std::move(in));
            break;
        }
        case SeriesSource::Kind::Join: {
            InputSet in;
            in.name = source.names[0] + "_join_" + source.names[1];
            in.series = source.names;

            // Newest point per join bucket for each side
            std::map<int64_t, Point> sides[2];
            for (size_t i = 0; i < 2; ++i) {
                SeriesStore::ScanOptions so;
                so.from_ms = range.from_ms;
                so.to_ms = range.to_ms;
                so.descending = false;
                auto [sst, pts] = store_.scan(db, source.names[i], so);
                if (!sst.ok) throw QueryError(sst.message);
                for (auto& p : pts) {
                    int64_t bucket = stmt.group_by.bucket_ms
                        ? utils::alignToBucket(p.timestamp_ms, *stmt.group_by.bucket_ms)
                        : p.timestamp_ms;
                    sides[i][bucket] = std::move(p);
                }
            }
            for (const auto& [bucket, left] : sides[0]) {
                auto rit = sides[1].find(bucket);
                if (rit == sides[1].end()) continue;
                Point joined;
                joined.series = in.name;
                joined.timestamp_ms = bucket;
                joined.seq = 0;
                for (auto it = left.values.begin(); it != left.values.end(); ++it) {
                    joined.values[source.aliases[0] + "." + it.key()] = it.value();
                }
                for (auto it = rit->second.values.begin(); it != rit->second.values.end(); ++it) {
                    joined.values[source.aliases[1] + "." + it.key()] = it.value();
                }
                if (!wherePredicate(joined) || !hasReferenced(joined)) continue;
                in.points.push_back(std::move(joined));
            }
            sortPoints(in.points, scan_desc);
            if (scan_limit > 0 && in.points.size() > scan_limit) in.points.resize(scan_limit);
            inputs.push_back(std::move(in));
            break;
        }
    }

    std::vector<SeriesResult> results;

    for (auto& in : inputs) {
        if (ranked) {
            const auto& top = static_cast<const FunctionCallExpr&>(*stmt.fields[0]);
            if (top.arguments.size() != 2 || top.arguments[0]->getType() != ExprType::Literal) {
                return {Status::Error(top.name + "() expects (n, aggregate)"), {}};
            }
            json n = static_cast<const LiteralExpr&>(*top.arguments[0]).toValue();
            if (!n.is_number_integer() || n.get<int64_t>() <= 0) {
                return {Status::Error(top.name + "() needs a positive integer n"), {}};
            }
            const ExprPtr& inner = top.arguments[1];
            if (!containsAggregate(inner)) {
                return {Status::Error(top.name + "() ranks by an aggregate such as count(*)"), {}};
            }

            // Partition by non-time group columns
            struct Ranked {
                std::string key;
                json key_values;
                std::vector<Point> points;
                json score;
            };
            std::map<std::string, Ranked> partitions;
            for (const auto& p : in.points) {
                json kv = json::array();
                for (const auto& col : stmt.group_by.columns) kv.push_back(lookupColumn(p, col, ctx));
                auto& r = partitions[kv.dump()];
                if (r.points.empty()) {
                    r.key = kv.dump();
                    r.key_values = kv;
                }
                r.points.push_back(p);
            }
            std::vector<Ranked*> order;
            for (auto& [k, r] : partitions) {
                std::vector<const Point*> ptrs;
                for (const auto& p : r.points) ptrs.push_back(&p);
                r.score = evalAggregate(inner, ptrs, ctx);
                order.push_back(&r);
            }
            const bool highest = top.name == "top";
            std::sort(order.begin(), order.end(), [highest](const Ranked* a, const Ranked* b) {
                bool an = a->score.is_number(), bn = b->score.is_number();
                if (an != bn) return an;
                if (an && a->score.get<double>() != b->score.get<double>()) {
                    return highest ? a->score.get<double>() > b->score.get<double>()
                                   : a->score.get<double>() < b->score.get<double>();
                }
                return a->key < b->key;
            });

            const size_t take = std::min(order.size(), static_cast<size_t>(n.get<int64_t>()));
            for (size_t i = 0; i < take; ++i) {
                const Ranked& r = *order[i];
                SeriesResult res;
                res.name = in.name;
                for (const auto& v : r.key_values) res.name += "." + valueToName(v);
                res.columns = {fieldName(inner), "time"};
                for (const auto& c : stmt.group_by.columns) res.columns.push_back(c);
                res.datapoints = aggregateRows(r.points, {inner}, stmt.group_by, ctx, descending, limit);
                results.push_back(std::move(res));
            }
            continue;
        }

        SeriesResult res;
        res.name = in.name;

        if (aggregate) {
            for (const auto& f : stmt.fields) res.columns.push_back(fieldName(f));
            res.columns.push_back("time");
            for (const auto& c : stmt.group_by.columns) res.columns.push_back(c);
            res.datapoints = aggregateRows(in.points, stmt.fields, stmt.group_by, ctx, descending, limit);
            if (source.kind == SeriesSource::Kind::Regex && res.datapoints.empty()) continue;
            results.push_back(std::move(res));
            continue;
        }

        // Raw rows
        std::vector<std::string> cols;
        if (stmt.select_all) {
            if (source.kind == SeriesSource::Kind::Join) {
                for (size_t i = 0; i < 2; ++i) {
                    for (const auto& c : store_.columns(db, source.names[i])) {
                        cols.push_back(source.aliases[i] + "." + c);
                    }
                }
            } else {
                for (const auto& s : in.series) {
                    for (const auto& c : store_.columns(db, s)) {
                        if (std::find(cols.begin(), cols.end(), c) == cols.end()) cols.push_back(c);
                    }
                }
                if (source.kind == SeriesSource::Kind::Merge) cols.push_back(kOrigSeriesColumn);
            }
            res.columns = cols;
        } else {
            for (const auto& f : stmt.fields) res.columns.push_back(fieldName(f));
        }
        res.columns.push_back("time");

        for (const auto& p : in.points) {
            json row = json::array();
            if (stmt.select_all) {
                for (const auto& c : cols) row.push_back(lookupColumn(p, c, ctx));
            } else {
                for (const auto& f : stmt.fields) row.push_back(evalRow(f, p, ctx));
            }
            row.push_back(utils::fromMillis(p.timestamp_ms, ctx.precision));
            res.datapoints.push_back(std::move(row));
        }
        results.push_back(std::move(res));
    }

    CHRONODB_DEBUG("Select on {} [{}, {}] produced {} series", db, range.from_ms, range.to_ms, results.size());
    return {Status::OK(), results};
}

} // namespace query
} // namespace chronodb
