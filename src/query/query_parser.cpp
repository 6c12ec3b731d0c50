#include "query/query_parser.h"
#include "storage/key_schema.h"
#include "utils/time_utils.h"

#include <algorithm>
#include <cctype>
#include <deque>
#include <stdexcept>

namespace chronodb {
namespace query {

namespace {

// ============================================================================
// Tokenizer (Lexer)
// ============================================================================

enum class TokenType {
    // Keywords
    SELECT, FROM, WHERE, GROUP_BY, GROUP, BY, LIMIT, ORDER, ASC, DESC, INTO,
    DELETE, LIST, SERIES, AND, OR, NOT, TRUE, FALSE, NULL_LITERAL, FOREVER,

    // Operators
    EQ, NEQ, LT, LTE, GT, GTE, MATCH, NOT_MATCH,
    PLUS, MINUS, STAR, SLASH,
    ASSIGN,  // Single '=' (equality in WHERE, optional after from/limit/into)

    // Literals
    IDENTIFIER, STRING, INTEGER, FLOAT, DURATION,

    // Punctuation
    DOT, COMMA, LPAREN, RPAREN,

    // Special
    END_OF_FILE, INVALID
};

struct Token {
    TokenType type;
    std::string value;
    size_t line;
    size_t column;
    size_t offset;

    Token(TokenType t, std::string v, size_t l, size_t c, size_t o)
        : type(t), value(std::move(v)), line(l), column(c), offset(o) {}
};

struct ParseException : std::runtime_error {
    size_t line;
    size_t column;
    size_t offset;
    ParseException(const std::string& msg, size_t l, size_t c, size_t o)
        : std::runtime_error(msg), line(l), column(c), offset(o) {}
};

bool isDurationUnit(const std::string& u) {
    return u == "u" || u == "us" || u == "ms" || u == "s" || u == "m" ||
           u == "h" || u == "d" || u == "w";
}

/// Lazy lexer; the parser can rewind it to read source names and regexes raw.
class Tokenizer {
public:
    explicit Tokenizer(const std::string& input)
        : input_(input), pos_(0), line_(1), column_(1) {}

    Token next() {
        skipWhitespace();
        size_t start_line = line_;
        size_t start_column = column_;
        size_t start = pos_;
        if (pos_ >= input_.size()) {
            return Token(TokenType::END_OF_FILE, "", start_line, start_column, start);
        }

        char ch = peek();
        if (ch == '"' || ch == '\'') {
            return readString(start_line, start_column, start);
        }
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            return readNumber(start_line, start_column, start);
        }
        if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_') {
            return readIdentifierOrKeyword(start_line, start_column, start);
        }
        return readOperatorOrPunctuation(start_line, start_column, start);
    }

    void rewind(size_t offset, size_t line, size_t column) {
        pos_ = offset;
        line_ = line;
        column_ = column;
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    char peek(size_t offset = 0) const {
        size_t p = pos_ + offset;
        return (p < input_.size()) ? input_[p] : '\0';
    }

    char advance() {
        if (pos_ >= input_.size()) return '\0';
        char ch = input_[pos_++];
        if (ch == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        return ch;
    }

    /// Series name, regex or merge(...)/inner_join(...) up to whitespace or ','
    /// at paren depth 0. A leading '/' reads a /regex/ literal.
    std::string readRawName() {
        skipWhitespace();
        if (peek() == '/') {
            return "/" + readRegexBody() + "/";
        }
        std::string out;
        int depth = 0;
        while (pos_ < input_.size()) {
            char c = peek();
            if (depth == 0 && (std::isspace(static_cast<unsigned char>(c)) || c == ',')) break;
            if (c == '(') {
                depth++;
            } else if (c == ')') {
                if (depth == 0) break;
                depth--;
            }
            out += advance();
        }
        return out;
    }

    /// Reads /pattern/ and returns the pattern; throws if unterminated
    std::string readRegexBody() {
        skipWhitespace();
        size_t l = line_, c = column_, o = pos_;
        if (peek() != '/') {
            throw ParseException("Expected regular expression /.../", l, c, o);
        }
        advance();
        std::string body;
        while (pos_ < input_.size() && peek() != '/') {
            if (peek() == '\\' && peek(1) == '/') {
                advance();
            }
            body += advance();
        }
        if (peek() != '/') {
            throw ParseException("Unterminated regular expression", l, c, o);
        }
        advance();
        return body;
    }

    size_t line() const { return line_; }
    size_t column() const { return column_; }
    size_t offset() const { return pos_; }

private:
    const std::string& input_;
    size_t pos_;
    size_t line_;
    size_t column_;

    Token readString(size_t line, size_t col, size_t off) {
        char quote = advance();
        std::string value;
        while (peek() != quote && peek() != '\0') {
            if (peek() == '\\') {
                advance();
                char next = advance();
                switch (next) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    default: value += next; break;
                }
            } else {
                value += advance();
            }
        }
        if (peek() != quote) {
            return Token(TokenType::INVALID, "unterminated string", line, col, off);
        }
        advance();
        return Token(TokenType::STRING, value, line, col, off);
    }

    Token readNumber(size_t line, size_t col, size_t off) {
        std::string value;
        bool is_float = false;

        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            value += advance();
        }
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
            is_float = true;
            value += advance();
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                value += advance();
            }
        }

        // 15m, 1h, 500ms
        if (!is_float && std::isalpha(static_cast<unsigned char>(peek()))) {
            std::string unit;
            while (std::isalpha(static_cast<unsigned char>(peek()))) {
                unit += advance();
            }
            if (!isDurationUnit(unit)) {
                return Token(TokenType::INVALID, value + unit, line, col, off);
            }
            return Token(TokenType::DURATION, value + unit, line, col, off);
        }

        return Token(is_float ? TokenType::FLOAT : TokenType::INTEGER, value, line, col, off);
    }

    Token readIdentifierOrKeyword(size_t line, size_t col, size_t off) {
        std::string value;
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
            value += advance();
        }

        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "select") return Token(TokenType::SELECT, value, line, col, off);
        if (lower == "from") return Token(TokenType::FROM, value, line, col, off);
        if (lower == "where") return Token(TokenType::WHERE, value, line, col, off);
        if (lower == "group_by") return Token(TokenType::GROUP_BY, value, line, col, off);
        if (lower == "group") return Token(TokenType::GROUP, value, line, col, off);
        if (lower == "by") return Token(TokenType::BY, value, line, col, off);
        if (lower == "limit") return Token(TokenType::LIMIT, value, line, col, off);
        if (lower == "order") return Token(TokenType::ORDER, value, line, col, off);
        if (lower == "asc") return Token(TokenType::ASC, value, line, col, off);
        if (lower == "desc") return Token(TokenType::DESC, value, line, col, off);
        if (lower == "into") return Token(TokenType::INTO, value, line, col, off);
        if (lower == "delete") return Token(TokenType::DELETE, value, line, col, off);
        if (lower == "list") return Token(TokenType::LIST, value, line, col, off);
        if (lower == "series") return Token(TokenType::SERIES, value, line, col, off);
        if (lower == "and") return Token(TokenType::AND, value, line, col, off);
        if (lower == "or") return Token(TokenType::OR, value, line, col, off);
        if (lower == "not") return Token(TokenType::NOT, value, line, col, off);
        if (lower == "true") return Token(TokenType::TRUE, value, line, col, off);
        if (lower == "false") return Token(TokenType::FALSE, value, line, col, off);
        if (lower == "null") return Token(TokenType::NULL_LITERAL, value, line, col, off);
        if (lower == "forever") return Token(TokenType::FOREVER, value, line, col, off);

        return Token(TokenType::IDENTIFIER, value, line, col, off);
    }

    Token readOperatorOrPunctuation(size_t line, size_t col, size_t off) {
        char ch = peek();
        char nx = peek(1);

        if (ch == '=' && nx == '=') { advance(); advance(); return Token(TokenType::EQ, "==", line, col, off); }
        if (ch == '=' && nx == '~') { advance(); advance(); return Token(TokenType::MATCH, "=~", line, col, off); }
        if (ch == '!' && nx == '=') { advance(); advance(); return Token(TokenType::NEQ, "!=", line, col, off); }
        if (ch == '!' && nx == '~') { advance(); advance(); return Token(TokenType::NOT_MATCH, "!~", line, col, off); }
        if (ch == '<' && nx == '>') { advance(); advance(); return Token(TokenType::NEQ, "<>", line, col, off); }
        if (ch == '<' && nx == '=') { advance(); advance(); return Token(TokenType::LTE, "<=", line, col, off); }
        if (ch == '>' && nx == '=') { advance(); advance(); return Token(TokenType::GTE, ">=", line, col, off); }

        advance();
        switch (ch) {
            case '=': return Token(TokenType::ASSIGN, "=", line, col, off);
            case '<': return Token(TokenType::LT, "<", line, col, off);
            case '>': return Token(TokenType::GT, ">", line, col, off);
            case '+': return Token(TokenType::PLUS, "+", line, col, off);
            case '-': return Token(TokenType::MINUS, "-", line, col, off);
            case '*': return Token(TokenType::STAR, "*", line, col, off);
            case '/': return Token(TokenType::SLASH, "/", line, col, off);
            case '.': return Token(TokenType::DOT, ".", line, col, off);
            case ',': return Token(TokenType::COMMA, ",", line, col, off);
            case '(': return Token(TokenType::LPAREN, "(", line, col, off);
            case ')': return Token(TokenType::RPAREN, ")", line, col, off);
            default: return Token(TokenType::INVALID, std::string(1, ch), line, col, off);
        }
    }
};

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(const std::string& input) : input_(input), tok_(input) {}

    ParseResult parse() {
        try {
            auto stmt = parseStatement();
            stmt->text = input_;
            return ParseResult::Success(stmt);
        } catch (const ParseException& e) {
            return ParseResult::Failure(e.what(), e.line, e.column, contextAt(e.offset));
        }
    }

private:
    const std::string& input_;
    Tokenizer tok_;
    std::deque<Token> buf_;

    const Token& current() { return peek(0); }

    const Token& peek(size_t offset) {
        while (buf_.size() <= offset) {
            buf_.push_back(tok_.next());
        }
        return buf_[offset];
    }

    void advance() {
        if (!buf_.empty()) buf_.pop_front();
        else tok_.next();
    }

    bool match(TokenType type) { return current().type == type; }

    void expect(TokenType type, const std::string& msg) {
        if (!match(type)) {
            fail(msg);
        }
        advance();
    }

    [[noreturn]] void fail(const std::string& msg) {
        const Token& t = current();
        std::string full = msg;
        if (t.type == TokenType::END_OF_FILE) {
            full += " (at end of query)";
        } else {
            full += " (got '" + t.value + "')";
        }
        throw ParseException(full, t.line, t.column, t.offset);
    }

    [[noreturn]] void failRaw(const std::string& msg, size_t line, size_t col, size_t off) {
        throw ParseException(msg, line, col, off);
    }

    /// Drop lexed lookahead and position the lexer at its start
    void enterRawMode() {
        if (!buf_.empty()) {
            const Token& t = buf_.front();
            tok_.rewind(t.offset, t.line, t.column);
            buf_.clear();
        }
        tok_.skipWhitespace();
    }

    std::string contextAt(size_t offset) const {
        size_t start = offset > 15 ? offset - 15 : 0;
        return input_.substr(start, 40);
    }

    std::shared_ptr<Statement> parseStatement() {
        auto stmt = std::make_shared<Statement>();
        if (match(TokenType::SELECT)) {
            advance();
            parseSelect(*stmt);
        } else if (match(TokenType::DELETE)) {
            advance();
            parseDelete(*stmt);
        } else if (match(TokenType::LIST)) {
            advance();
            parseList(*stmt);
        } else {
            fail("Expected SELECT, DELETE or LIST");
        }
        if (!match(TokenType::END_OF_FILE)) {
            fail("Unexpected token");
        }
        return stmt;
    }

    void parseSelect(Statement& stmt) {
        stmt.type = StatementType::Select;

        if (match(TokenType::STAR) && peek(1).type == TokenType::FROM) {
            advance();
            stmt.select_all = true;
        } else {
            stmt.fields.push_back(parseExpression());
            while (match(TokenType::COMMA)) {
                advance();
                stmt.fields.push_back(parseExpression());
            }
        }

        expect(TokenType::FROM, "Expected FROM");
        if (match(TokenType::ASSIGN)) advance();
        stmt.source = parseSource();

        while (!match(TokenType::END_OF_FILE)) {
            if (match(TokenType::WHERE)) {
                if (stmt.where) fail("Duplicate WHERE clause");
                advance();
                stmt.where = parseExpression();
            } else if (match(TokenType::GROUP_BY) || match(TokenType::GROUP)) {
                if (!stmt.group_by.empty()) fail("Duplicate GROUP_BY clause");
                if (match(TokenType::GROUP)) {
                    advance();
                    expect(TokenType::BY, "Expected BY after GROUP");
                } else {
                    advance();
                }
                parseGroupBy(stmt.group_by);
            } else if (match(TokenType::LIMIT)) {
                if (stmt.limit) fail("Duplicate LIMIT clause");
                advance();
                if (match(TokenType::ASSIGN)) advance();
                if (!match(TokenType::INTEGER)) fail("Expected integer after LIMIT");
                try {
                    stmt.limit = static_cast<size_t>(std::stoull(current().value));
                } catch (const std::exception&) {
                    fail("LIMIT out of range");
                }
                advance();
            } else if (match(TokenType::ORDER)) {
                if (stmt.ascending) fail("Duplicate ORDER clause");
                advance();
                if (match(TokenType::BY)) {
                    advance();
                    if (match(TokenType::IDENTIFIER) && toLower(current().value) == "time") advance();
                }
                if (match(TokenType::ASC)) stmt.ascending = true;
                else if (match(TokenType::DESC)) stmt.ascending = false;
                else fail("Expected ASC or DESC after ORDER");
                advance();
            } else if (match(TokenType::INTO)) {
                if (stmt.into) fail("Duplicate INTO clause");
                advance();
                if (match(TokenType::ASSIGN)) advance();
                stmt.into = parseIntoTarget();
            } else {
                fail("Unexpected token after FROM clause");
            }
        }
    }

    void parseDelete(Statement& stmt) {
        stmt.type = StatementType::Delete;
        expect(TokenType::FROM, "Expected FROM after DELETE");
        if (match(TokenType::ASSIGN)) advance();
        stmt.source = parseSource();
        if (stmt.source->kind == SeriesSource::Kind::Join) {
            fail("inner_join cannot be used in DELETE");
        }
        if (match(TokenType::WHERE)) {
            advance();
            stmt.where = parseExpression();
        }
    }

    void parseList(Statement& stmt) {
        stmt.type = StatementType::ListSeries;
        expect(TokenType::SERIES, "Expected SERIES after LIST");
        if (!match(TokenType::END_OF_FILE)) {
            stmt.source = parseSource();
            if (stmt.source->kind != SeriesSource::Kind::Name &&
                stmt.source->kind != SeriesSource::Kind::Regex) {
                fail("LIST SERIES accepts a name or regular expression");
            }
        }
    }

    void parseGroupBy(GroupBy& group_by) {
        do {
            if (match(TokenType::COMMA)) advance();
            if (!match(TokenType::IDENTIFIER)) fail("Expected column or time(...) in GROUP_BY");
            if (toLower(current().value) == "time" && peek(1).type == TokenType::LPAREN) {
                if (group_by.bucket_ms) fail("Duplicate time(...) in GROUP_BY");
                advance();
                advance();
                if (!match(TokenType::DURATION)) fail("Expected duration in time(...)");
                auto ms = utils::parseDurationMillis(current().value);
                if (!ms || *ms <= 0) fail("Invalid time bucket");
                group_by.bucket_ms = *ms;
                advance();
                expect(TokenType::RPAREN, "Expected ')' after time bucket");
            } else {
                group_by.columns.push_back(parseDottedName());
            }
        } while (match(TokenType::COMMA));
    }

    std::string parseDottedName() {
        if (!match(TokenType::IDENTIFIER)) fail("Expected column name");
        std::string name = current().value;
        advance();
        while (match(TokenType::DOT) && peek(1).type == TokenType::IDENTIFIER) {
            advance();
            name += "." + current().value;
            advance();
        }
        return name;
    }

    std::vector<std::string> splitArgs(const std::string& inner) {
        std::vector<std::string> out;
        std::string cur;
        for (char c : inner) {
            if (c == ',') {
                out.push_back(trim(cur));
                cur.clear();
            } else {
                cur += c;
            }
        }
        out.push_back(trim(cur));
        return out;
    }

    SeriesSource parseSource() {
        enterRawMode();
        size_t line = tok_.line(), col = tok_.column(), off = tok_.offset();
        std::string raw = tok_.readRawName();
        if (raw.empty()) {
            failRaw("Expected series name, regex, merge(...) or inner_join(...)", line, col, off);
        }

        SeriesSource src;
        const std::string lower = toLower(raw);

        if (raw.size() >= 2 && raw.front() == '/' && raw.back() == '/') {
            src.kind = SeriesSource::Kind::Regex;
            src.pattern = raw.substr(1, raw.size() - 2);
            return src;
        }

        auto parseCall = [&](const std::string& prefix) -> std::vector<std::string> {
            if (raw.back() != ')') {
                failRaw("Expected ')' to close " + prefix, line, col, off);
            }
            return splitArgs(raw.substr(prefix.size() + 1, raw.size() - prefix.size() - 2));
        };

        if (lower.rfind("merge(", 0) == 0) {
            src.kind = SeriesSource::Kind::Merge;
            src.names = parseCall("merge");
            if (src.names.size() < 2) {
                failRaw("merge() needs at least two series", line, col, off);
            }
            for (const auto& n : src.names) {
                if (auto err = KeySchema::validateSeriesName(n)) failRaw(*err, line, col, off);
            }
            return src;
        }

        if (lower.rfind("inner_join(", 0) == 0) {
            src.kind = SeriesSource::Kind::Join;
            auto args = parseCall("inner_join");
            if (args.size() != 4) {
                failRaw("inner_join() expects (series, alias, series, alias)", line, col, off);
            }
            src.names = {args[0], args[2]};
            src.aliases = {args[1], args[3]};
            for (const auto& n : src.names) {
                if (auto err = KeySchema::validateSeriesName(n)) failRaw(*err, line, col, off);
            }
            for (const auto& a : src.aliases) {
                if (a.empty() || a.find('.') != std::string::npos) {
                    failRaw("Invalid join alias '" + a + "'", line, col, off);
                }
            }
            if (src.aliases[0] == src.aliases[1]) {
                failRaw("Join aliases must differ", line, col, off);
            }
            return src;
        }

        if (QueryParser::looksLikeRegex(raw)) {
            src.kind = SeriesSource::Kind::Regex;
            src.pattern = raw;
            return src;
        }

        if (auto err = KeySchema::validateSeriesName(raw)) {
            failRaw(*err, line, col, off);
        }
        src.kind = SeriesSource::Kind::Name;
        src.name = raw;
        return src;
    }

    std::string parseIntoTarget() {
        enterRawMode();
        size_t line = tok_.line(), col = tok_.column(), off = tok_.offset();
        std::string raw = tok_.readRawName();
        if (raw.empty()) {
            failRaw("Expected target series after INTO", line, col, off);
        }
        // Placeholder is substituted per source series at run time
        std::string check = raw;
        const std::string placeholder = ":series_name";
        for (auto p = check.find(placeholder); p != std::string::npos; p = check.find(placeholder)) {
            check.replace(p, placeholder.size(), "x");
        }
        if (auto err = KeySchema::validateSeriesName(check)) {
            failRaw("Invalid INTO target: " + *err, line, col, off);
        }
        return raw;
    }

    // ------------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------------

    ExprPtr parseExpression() { return parseOr(); }

    ExprPtr parseOr() {
        auto left = parseAnd();
        while (match(TokenType::OR)) {
            advance();
            left = std::make_shared<BinaryOpExpr>(BinaryOperator::Or, left, parseAnd());
        }
        return left;
    }

    ExprPtr parseAnd() {
        auto left = parseNot();
        while (match(TokenType::AND)) {
            advance();
            left = std::make_shared<BinaryOpExpr>(BinaryOperator::And, left, parseNot());
        }
        return left;
    }

    ExprPtr parseNot() {
        if (match(TokenType::NOT)) {
            advance();
            return std::make_shared<UnaryOpExpr>(UnaryOperator::Not, parseNot());
        }
        return parseComparison();
    }

    ExprPtr parseComparison() {
        auto left = parseAdditive();

        BinaryOperator op;
        switch (current().type) {
            case TokenType::EQ:
            case TokenType::ASSIGN: op = BinaryOperator::Eq; break;
            case TokenType::NEQ: op = BinaryOperator::Neq; break;
            case TokenType::LT: op = BinaryOperator::Lt; break;
            case TokenType::LTE: op = BinaryOperator::Lte; break;
            case TokenType::GT: op = BinaryOperator::Gt; break;
            case TokenType::GTE: op = BinaryOperator::Gte; break;
            case TokenType::MATCH:
            case TokenType::NOT_MATCH: {
                op = match(TokenType::MATCH) ? BinaryOperator::Match : BinaryOperator::NotMatch;
                advance();
                ExprPtr rhs;
                if (match(TokenType::STRING)) {
                    rhs = std::make_shared<RegexExpr>(current().value);
                    advance();
                } else {
                    enterRawMode();
                    rhs = std::make_shared<RegexExpr>(tok_.readRegexBody());
                }
                return std::make_shared<BinaryOpExpr>(op, left, rhs);
            }
            default:
                return left;
        }
        advance();
        return std::make_shared<BinaryOpExpr>(op, left, parseAdditive());
    }

    ExprPtr parseAdditive() {
        auto left = parseMultiplicative();
        while (match(TokenType::PLUS) || match(TokenType::MINUS)) {
            auto op = match(TokenType::PLUS) ? BinaryOperator::Add : BinaryOperator::Sub;
            advance();
            left = std::make_shared<BinaryOpExpr>(op, left, parseMultiplicative());
        }
        return left;
    }

    ExprPtr parseMultiplicative() {
        auto left = parseUnary();
        while (match(TokenType::STAR) || match(TokenType::SLASH)) {
            auto op = match(TokenType::STAR) ? BinaryOperator::Mul : BinaryOperator::Div;
            advance();
            left = std::make_shared<BinaryOpExpr>(op, left, parseUnary());
        }
        return left;
    }

    ExprPtr parseUnary() {
        if (match(TokenType::MINUS)) {
            advance();
            return std::make_shared<UnaryOpExpr>(UnaryOperator::Minus, parseUnary());
        }
        return parsePrimary();
    }

    ExprPtr parsePrimary() {
        const Token& t = current();
        switch (t.type) {
            case TokenType::INTEGER: {
                int64_t v = 0;
                try {
                    v = std::stoll(t.value);
                } catch (const std::exception&) {
                    fail("Integer out of range");
                }
                advance();
                return std::make_shared<LiteralExpr>(v);
            }
            case TokenType::FLOAT: {
                double v = 0;
                try {
                    v = std::stod(t.value);
                } catch (const std::exception&) {
                    fail("Number out of range");
                }
                advance();
                return std::make_shared<LiteralExpr>(v);
            }
            case TokenType::STRING: {
                std::string v = t.value;
                advance();
                return std::make_shared<LiteralExpr>(std::move(v));
            }
            case TokenType::DURATION: {
                auto ms = utils::parseDurationMillis(t.value);
                if (!ms) fail("Invalid duration");
                std::string lit = t.value;
                advance();
                return std::make_shared<DurationExpr>(*ms, std::move(lit));
            }
            case TokenType::TRUE:
                advance();
                return std::make_shared<LiteralExpr>(true);
            case TokenType::FALSE:
                advance();
                return std::make_shared<LiteralExpr>(false);
            case TokenType::NULL_LITERAL:
                advance();
                return std::make_shared<LiteralExpr>(nullptr);
            case TokenType::FOREVER:
                advance();
                return std::make_shared<ForeverExpr>();
            case TokenType::LPAREN: {
                advance();
                auto e = parseExpression();
                expect(TokenType::RPAREN, "Expected ')'");
                return e;
            }
            case TokenType::IDENTIFIER: {
                if (peek(1).type == TokenType::LPAREN) {
                    return parseFunctionCall();
                }
                return std::make_shared<ColumnExpr>(parseDottedName());
            }
            case TokenType::INVALID:
                fail("Invalid token");
            default:
                fail("Expected expression");
        }
    }

    ExprPtr parseFunctionCall() {
        std::string name = toLower(current().value);
        advance();
        expect(TokenType::LPAREN, "Expected '('");

        std::vector<ExprPtr> args;
        if (!match(TokenType::RPAREN)) {
            do {
                if (match(TokenType::COMMA)) advance();
                if (match(TokenType::STAR) &&
                    (peek(1).type == TokenType::RPAREN || peek(1).type == TokenType::COMMA)) {
                    advance();
                    args.push_back(std::make_shared<StarExpr>());
                } else {
                    args.push_back(parseExpression());
                }
            } while (match(TokenType::COMMA));
        }
        expect(TokenType::RPAREN, "Expected ')' after function arguments");
        return std::make_shared<FunctionCallExpr>(std::move(name), std::move(args));
    }
};

} // namespace

bool QueryParser::looksLikeRegex(const std::string& name) {
    return name.find_first_of("*+?[]()^$|\\{}") != std::string::npos;
}

ParseResult QueryParser::parse(const std::string& query_string) {
    std::string trimmed = trim(query_string);
    if (trimmed.empty()) {
        return ParseResult::Failure("Empty query", 1, 1);
    }
    Parser parser(query_string);
    return parser.parse();
}

}  // namespace query
}  // namespace chronodb
