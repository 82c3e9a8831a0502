#include "MuRuntime.h"

namespace MuRuntime {
namespace Py {

// ====== Lexer ======

namespace {

PyError syntax_error(int line, const std::string& msg = "invalid syntax") {
    PyError e(msg.find("indent") != std::string::npos ? "IndentationError" : "SyntaxError", msg);
    e.frames.push_back({line, ""});
    e.located = true;
    return e;
}

bool is_name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_name_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

const char* const kOperators[] = {
    "**=", "//=", ">>=", "<<=",
    "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "->", "<<", ">>",
    "+", "-", "*", "/", "%", "<", ">", "=", "(", ")", "[", "]", "{", "}", ",", ":", ".", ";",
    "&", "|", "^", "~", "@"
};

// Reads a quoted literal starting at src[i]; leaves i past the closing quote
std::string read_string(const std::string& src, size_t& i, int& line) {
    char q = src[i];
    bool triple = i + 2 < src.size() && src[i + 1] == q && src[i + 2] == q;
    i += triple ? 3 : 1;
    int start_line = line;

    std::string s;
    while (true) {
        if (i >= src.size()) throw syntax_error(start_line, "unterminated string");
        char c = src[i];
        if (triple) {
            if (c == q && i + 2 < src.size() && src[i + 1] == q && src[i + 2] == q) { i += 3; break; }
        } else {
            if (c == q) { i++; break; }
            if (c == '\n') throw syntax_error(start_line, "unterminated string");
        }
        if (c == '\\' && i + 1 < src.size()) {
            char n = src[i + 1];
            i += 2;
            switch (n) {
                case 'n': s += '\n'; break;
                case 't': s += '\t'; break;
                case 'r': s += '\r'; break;
                case '0': s += '\0'; break;
                case '\\': s += '\\'; break;
                case '\'': s += '\''; break;
                case '"': s += '"'; break;
                case '\n': line++; break;
                default: s += '\\'; s += n; break;
            }
            continue;
        }
        if (c == '\n') line++;
        s += c;
        i++;
    }
    return s;
}

} // namespace

std::vector<Token> lex(const std::string& src) {
    std::vector<Token> t;
    std::vector<int> indents{0};
    int depth = 0;
    int line = 1;
    bool line_start = true;
    size_t i = 0;

    auto push = [&](Token::Kind k, std::string s) { t.push_back({k, std::move(s), line}); };

    while (i < src.size()) {
        if (line_start && depth == 0) {
            int col = 0;
            size_t j = i;
            while (j < src.size() && (src[j] == ' ' || src[j] == '\t')) {
                col = src[j] == '\t' ? (col / 8 + 1) * 8 : col + 1;
                j++;
            }
            // blank and comment-only lines carry no indentation
            if (j >= src.size() || src[j] == '\n' || src[j] == '\r' || src[j] == '#') {
                while (j < src.size() && src[j] != '\n') j++;
                if (j < src.size()) { j++; line++; }
                i = j;
                continue;
            }
            if (col > indents.back()) {
                indents.push_back(col);
                push(Token::INDENT, "");
            } else {
                while (col < indents.back()) {
                    indents.pop_back();
                    push(Token::DEDENT, "");
                }
                if (col != indents.back())
                    throw syntax_error(line, "unindent doesn't match any outer indent level");
            }
            i = j;
            line_start = false;
        }

        char c = src[i];
        if (c == '\n') {
            if (depth == 0) {
                push(Token::NEWLINE, "");
                line_start = true;
            }
            line++;
            i++;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r') { i++; continue; }
        if (c == '#') {
            while (i < src.size() && src[i] != '\n') i++;
            continue;
        }
        if (c == '\\' && i + 1 < src.size() && src[i + 1] == '\n') {
            i += 2;
            line++;
            continue;
        }
        if (c == '"' || c == '\'') {
            int at = line;
            std::string s = read_string(src, i, line);
            t.push_back({Token::STRING, std::move(s), at});
            continue;
        }
        if (is_name_start(c)) {
            size_t j = i;
            while (j < src.size() && is_name_char(src[j])) j++;
            // r"..." / b"..." prefixes are accepted and ignored
            if (j - i == 1 && (c == 'r' || c == 'b') && j < src.size() && (src[j] == '"' || src[j] == '\'')) {
                i = j;
                continue;
            }
            push(Token::NAME, src.substr(i, j - i));
            i = j;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            size_t j = i;
            if (c == '0' && j + 1 < src.size() && (src[j + 1] == 'x' || src[j + 1] == 'X')) {
                j += 2;
                while (j < src.size() && std::isxdigit(static_cast<unsigned char>(src[j]))) j++;
            } else {
                while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) j++;
                if (j < src.size() && src[j] == '.') {
                    j++;
                    while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) j++;
                }
                if (j < src.size() && (src[j] == 'e' || src[j] == 'E')) {
                    size_t k = j + 1;
                    if (k < src.size() && (src[k] == '+' || src[k] == '-')) k++;
                    if (k < src.size() && std::isdigit(static_cast<unsigned char>(src[k]))) {
                        j = k;
                        while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) j++;
                    }
                }
            }
            push(Token::NUMBER, src.substr(i, j - i));
            i = j;
            continue;
        }

        bool matched = false;
        for (const char* op : kOperators) {
            size_t n = std::strlen(op);
            if (src.compare(i, n, op) == 0) {
                if (op[0] == '(' || op[0] == '[' || op[0] == '{') depth++;
                if ((op[0] == ')' || op[0] == ']' || op[0] == '}') && depth > 0) depth--;
                push(Token::OP, op);
                i += n;
                matched = true;
                break;
            }
        }
        if (!matched) throw syntax_error(line);
    }

    if (!t.empty() && t.back().kind != Token::NEWLINE && t.back().kind != Token::DEDENT)
        push(Token::NEWLINE, "");
    while (indents.size() > 1) {
        indents.pop_back();
        push(Token::DEDENT, "");
    }
    push(Token::END, "");
    return t;
}

bool needs_more_input(const std::string& src, bool* open_brackets) {
    int depth = 0;
    bool in_triple = false;
    bool compound = false;
    char quote = 0;
    std::string last_line;

    auto end_line = [&] {
        while (!last_line.empty() && std::isspace(static_cast<unsigned char>(last_line.back()))) last_line.pop_back();
        if (depth == 0 && !last_line.empty() && last_line.back() == ':') compound = true;
        last_line.clear();
    };

    for (size_t i = 0; i < src.size(); ++i) {
        char c = src[i];
        if (in_triple) {
            if (c == quote && i + 2 < src.size() && src[i + 1] == quote && src[i + 2] == quote) {
                in_triple = false;
                i += 2;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            if (i + 2 < src.size() && src[i + 1] == c && src[i + 2] == c) {
                in_triple = true;
                quote = c;
                i += 2;
                continue;
            }
            size_t j = i + 1;
            while (j < src.size() && src[j] != c && src[j] != '\n') {
                if (src[j] == '\\') j++;
                j++;
            }
            i = (j < src.size() && src[j] == '\n') ? j - 1 : j;
            last_line += 'x';
            continue;
        }
        if (c == '#') {
            while (i + 1 < src.size() && src[i + 1] != '\n') i++;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') depth++;
        if ((c == ')' || c == ']' || c == '}') && depth > 0) depth--;
        if (c == '\n') {
            end_line();
            continue;
        }
        last_line += c;
    }
    bool continued = !last_line.empty() && last_line.back() == '\\';
    end_line();

    bool open = in_triple || depth > 0 || continued;
    if (open_brackets) *open_brackets = open;
    return open || compound;
}

// ====== Parser ======

namespace {

const std::set<std::string> kKeywords = {
    "if", "elif", "else", "while", "for", "in", "def", "return", "break", "continue",
    "pass", "import", "from", "as", "global", "raise", "try", "except", "finally",
    "and", "or", "not", "is", "True", "False", "None", "lambda", "class", "with", "yield", "del"
};

class Parser {
public:
    Parser(const std::vector<Token>& tokens, bool interactive)
        : t_(tokens), pos_(0), interactive_(interactive), nesting_(0), depth_(0) {}

    Block program() {
        Block out;
        while (!at(Token::END)) {
            if (accept(Token::NEWLINE)) continue;
            statement(out);
        }
        return out;
    }

private:
    const Token& peek(size_t ahead = 0) const {
        size_t i = std::min(pos_ + ahead, t_.size() - 1);
        return t_[i];
    }
    bool at(Token::Kind k) const { return peek().kind == k; }
    bool at_op(const char* op) const { return peek().kind == Token::OP && peek().text == op; }
    bool at_kw(const char* kw) const { return peek().kind == Token::NAME && peek().text == kw; }

    const Token& next() {
        const Token& tok = t_[pos_];
        if (pos_ + 1 < t_.size()) pos_++;
        return tok;
    }
    bool accept(Token::Kind k) {
        if (!at(k)) return false;
        next();
        return true;
    }
    bool accept_op(const char* op) {
        if (!at_op(op)) return false;
        next();
        return true;
    }
    bool accept_kw(const char* kw) {
        if (!at_kw(kw)) return false;
        next();
        return true;
    }
    void expect_op(const char* op) {
        if (!accept_op(op)) throw syntax_error(peek().line);
    }
    void expect_kw(const char* kw) {
        if (!accept_kw(kw)) throw syntax_error(peek().line);
    }
    std::string expect_name() {
        if (!at(Token::NAME) || kKeywords.count(peek().text)) throw syntax_error(peek().line);
        return next().text;
    }

    // Bounds the tree depth so nested input cannot exhaust the C stack
    static constexpr int kMaxDepth = 200;

    void deepen(int line) {
        if (depth_ >= kMaxDepth) throw syntax_error(line, "too many nested levels");
        depth_++;
    }

    // Restores the depth on scope exit; deeper() accounts for
    // left-associative chains built inside one call
    struct DepthGuard {
        DepthGuard(Parser& p, int line) : parser(p), saved(p.depth_) { parser.deepen(line); }
        ~DepthGuard() { parser.depth_ = saved; }
        void deeper(int line) { parser.deepen(line); }

        Parser& parser;
        int saved;
    };

    template <typename T>
    std::shared_ptr<T> stamp(std::shared_ptr<T> node, int line) {
        node->line = line;
        return node;
    }

    // --- statements ---

    void statement(Block& out) {
        const Token& tok = peek();
        if (tok.kind == Token::INDENT) throw syntax_error(tok.line, "unexpected indent");
        if (tok.kind == Token::NAME) {
            if (tok.text == "if") { out.push_back(if_stmt()); return; }
            if (tok.text == "while") { out.push_back(while_stmt()); return; }
            if (tok.text == "for") { out.push_back(for_stmt()); return; }
            if (tok.text == "def") { out.push_back(def_stmt()); return; }
            if (tok.text == "try") { out.push_back(try_stmt()); return; }
        }
        simple_statements(out);
    }

    void simple_statements(Block& out) {
        out.push_back(small_statement());
        while (accept_op(";")) {
            if (at(Token::NEWLINE)) break;
            out.push_back(small_statement());
        }
        if (!accept(Token::NEWLINE) && !at(Token::END)) throw syntax_error(peek().line);
    }

    Block block() {
        DepthGuard guard(*this, peek().line);
        expect_op(":");
        Block body;
        nesting_++;
        if (accept(Token::NEWLINE)) {
            if (!accept(Token::INDENT)) throw syntax_error(peek().line, "expected an indented block");
            while (!accept(Token::DEDENT) && !at(Token::END)) {
                if (accept(Token::NEWLINE)) continue;
                statement(body);
            }
        } else {
            simple_statements(body);
        }
        nesting_--;
        return body;
    }

    StmtPtr small_statement() {
        int line = peek().line;
        if (accept_kw("pass")) return stamp(std::make_shared<StmtPass>(), line);
        if (accept_kw("break")) return stamp(std::make_shared<StmtBreak>(), line);
        if (accept_kw("continue")) return stamp(std::make_shared<StmtContinue>(), line);
        if (accept_kw("return")) {
            auto s = stamp(std::make_shared<StmtReturn>(), line);
            if (!at(Token::NEWLINE) && !at_op(";") && !at(Token::END)) s->value = expression();
            return s;
        }
        if (accept_kw("raise")) {
            auto s = stamp(std::make_shared<StmtRaise>(), line);
            if (!at(Token::NEWLINE) && !at_op(";") && !at(Token::END)) s->exc = expression();
            return s;
        }
        if (accept_kw("global")) {
            auto s = stamp(std::make_shared<StmtGlobal>(), line);
            s->names.push_back(expect_name());
            while (accept_op(",")) s->names.push_back(expect_name());
            return s;
        }
        if (accept_kw("import")) {
            auto s = stamp(std::make_shared<StmtImport>(), line);
            s->module = dotted_name();
            s->alias = accept_kw("as") ? expect_name() : s->module;
            return s;
        }
        if (accept_kw("from")) {
            auto s = stamp(std::make_shared<StmtFromImport>(), line);
            s->module = dotted_name();
            expect_kw("import");
            if (accept_op("*")) {
                s->names.push_back({"*", "*"});
                return s;
            }
            bool paren = accept_op("(");
            do {
                if (paren && at_op(")")) break;
                std::string name = expect_name();
                std::string alias = accept_kw("as") ? expect_name() : name;
                s->names.push_back({name, alias});
            } while (accept_op(","));
            if (paren) expect_op(")");
            return s;
        }
        if (at(Token::NAME) && (peek().text == "class" || peek().text == "with" ||
                                peek().text == "lambda" || peek().text == "yield" || peek().text == "del")) {
            throw syntax_error(line, "unsupported syntax");
        }
        return expression_statement();
    }

    std::string dotted_name() {
        std::string name = expect_name();
        while (accept_op(".")) name += "." + expect_name();
        return name;
    }

    static bool assignable(const ExprPtr& e) {
        return std::dynamic_pointer_cast<AstName>(e) || std::dynamic_pointer_cast<AstAttr>(e) ||
               std::dynamic_pointer_cast<AstSubscript>(e);
    }

    StmtPtr expression_statement() {
        int line = peek().line;
        ExprPtr first = expression();

        static const char* aug_ops[] = {"+=", "-=", "*=", "/=", "//=", "%=", "**="};
        for (const char* op : aug_ops) {
            if (accept_op(op)) {
                if (!assignable(first)) throw syntax_error(line, "illegal expression for augmented assignment");
                auto s = stamp(std::make_shared<StmtAugAssign>(), line);
                s->target = first;
                s->op = std::string(op, std::strlen(op) - 1);
                s->value = expression();
                return s;
            }
        }

        if (at_op("=")) {
            auto s = stamp(std::make_shared<StmtAssign>(), line);
            s->targets.push_back(first);
            while (accept_op("=")) s->targets.push_back(expression());
            s->value = s->targets.back();
            s->targets.pop_back();
            for (const auto& target : s->targets)
                if (!assignable(target)) throw syntax_error(line, "can't assign to expression");
            return s;
        }

        auto s = stamp(std::make_shared<StmtExpr>(), line);
        s->expr = first;
        s->echo = interactive_ && nesting_ == 0;
        return s;
    }

    StmtPtr if_stmt() {
        auto s = stamp(std::make_shared<StmtIf>(), peek().line);
        next();
        ExprPtr cond = expression();
        s->branches.push_back({cond, block()});
        while (true) {
            while (at(Token::NEWLINE)) next();
            if (accept_kw("elif")) {
                ExprPtr c = expression();
                s->branches.push_back({c, block()});
                continue;
            }
            if (accept_kw("else")) s->orelse = block();
            break;
        }
        return s;
    }

    StmtPtr while_stmt() {
        auto s = stamp(std::make_shared<StmtWhile>(), peek().line);
        next();
        s->cond = expression();
        s->body = block();
        return s;
    }

    StmtPtr for_stmt() {
        auto s = stamp(std::make_shared<StmtFor>(), peek().line);
        next();
        s->var = expect_name();
        expect_kw("in");
        s->iter = expression();
        s->body = block();
        return s;
    }

    StmtPtr def_stmt() {
        auto s = stamp(std::make_shared<StmtDef>(), peek().line);
        next();
        s->name = expect_name();
        expect_op("(");
        while (!at_op(")")) {
            s->params.push_back(expect_name());
            if (accept_op("=")) s->defaults.push_back(expression());
            else if (!s->defaults.empty()) throw syntax_error(s->line, "non-default argument follows default argument");
            if (!accept_op(",")) break;
        }
        expect_op(")");
        s->body = block();
        return s;
    }

    StmtPtr try_stmt() {
        auto s = stamp(std::make_shared<StmtTry>(), peek().line);
        next();
        s->body = block();
        while (true) {
            while (at(Token::NEWLINE)) next();
            if (!accept_kw("except")) break;
            StmtTry::Handler h;
            if (!at_op(":")) {
                h.type = expect_name();
                if (accept_kw("as")) h.name = expect_name();
            }
            h.body = block();
            s->handlers.push_back(std::move(h));
        }
        if (accept_kw("finally")) s->finally_body = block();
        if (s->handlers.empty() && s->finally_body.empty()) throw syntax_error(s->line);
        return s;
    }

    // --- expressions ---

    ExprPtr expression() {
        int line = peek().line;
        DepthGuard guard(*this, line);
        ExprPtr e = or_test();
        if (accept_kw("if")) {
            ExprPtr cond = or_test();
            expect_kw("else");
            ExprPtr other = expression();
            return stamp(std::make_shared<AstTernary>(cond, e, other), line);
        }
        return e;
    }

    ExprPtr or_test() {
        DepthGuard guard(*this, peek().line);
        ExprPtr e = and_test();
        while (at_kw("or")) {
            int line = next().line;
            guard.deeper(line);
            e = stamp(std::make_shared<AstBoolOp>(false, e, and_test()), line);
        }
        return e;
    }

    ExprPtr and_test() {
        DepthGuard guard(*this, peek().line);
        ExprPtr e = not_test();
        while (at_kw("and")) {
            int line = next().line;
            guard.deeper(line);
            e = stamp(std::make_shared<AstBoolOp>(true, e, not_test()), line);
        }
        return e;
    }

    ExprPtr not_test() {
        if (at_kw("not")) {
            int line = next().line;
            DepthGuard guard(*this, line);
            return stamp(std::make_shared<AstUnary>("not", not_test()), line);
        }
        return comparison();
    }

    ExprPtr comparison() {
        int line = peek().line;
        ExprPtr first = arith();
        std::shared_ptr<AstCompare> cmp;
        while (true) {
            std::string op;
            if (at(Token::OP) && (peek().text == "<" || peek().text == ">" || peek().text == "==" ||
                                  peek().text == "!=" || peek().text == "<=" || peek().text == ">=")) {
                op = next().text;
            } else if (accept_kw("in")) {
                op = "in";
            } else if (at_kw("not") && peek(1).kind == Token::NAME && peek(1).text == "in") {
                next();
                next();
                op = "not in";
            } else if (accept_kw("is")) {
                op = accept_kw("not") ? "is not" : "is";
            } else {
                break;
            }
            if (!cmp) {
                cmp = stamp(std::make_shared<AstCompare>(), line);
                cmp->first = first;
            }
            cmp->rest.push_back({op, arith()});
        }
        return cmp ? ExprPtr(cmp) : first;
    }

    ExprPtr arith() {
        DepthGuard guard(*this, peek().line);
        ExprPtr e = term();
        while (at_op("+") || at_op("-")) {
            const Token& op = next();
            guard.deeper(op.line);
            e = stamp(std::make_shared<AstBinary>(op.text, e, term()), op.line);
        }
        return e;
    }

    ExprPtr term() {
        DepthGuard guard(*this, peek().line);
        ExprPtr e = factor();
        while (at_op("*") || at_op("/") || at_op("//") || at_op("%")) {
            const Token& op = next();
            guard.deeper(op.line);
            e = stamp(std::make_shared<AstBinary>(op.text, e, factor()), op.line);
        }
        return e;
    }

    ExprPtr factor() {
        if (at_op("-") || at_op("+")) {
            const Token& op = next();
            DepthGuard guard(*this, op.line);
            return stamp(std::make_shared<AstUnary>(op.text, factor()), op.line);
        }
        return power();
    }

    ExprPtr power() {
        ExprPtr base = postfix();
        if (at_op("**")) {
            int line = next().line;
            return stamp(std::make_shared<AstBinary>("**", base, factor()), line);
        }
        return base;
    }

    ExprPtr postfix() {
        DepthGuard guard(*this, peek().line);
        ExprPtr e = atom();
        while (true) {
            int line = peek().line;
            if (at_op("(") || at_op("[") || at_op(".")) guard.deeper(line);
            if (accept_op("(")) {
                auto call = stamp(std::make_shared<AstCall>(), line);
                call->fn = e;
                while (!at_op(")")) {
                    if (at(Token::NAME) && peek(1).kind == Token::OP && peek(1).text == "=") {
                        std::string key = next().text;
                        next();
                        call->kwargs.push_back({key, expression()});
                    } else {
                        if (!call->kwargs.empty()) throw syntax_error(line, "positional argument follows keyword argument");
                        call->args.push_back(expression());
                    }
                    if (!accept_op(",")) break;
                }
                expect_op(")");
                e = call;
            } else if (accept_op("[")) {
                ExprPtr index = expression();
                expect_op("]");
                e = stamp(std::make_shared<AstSubscript>(e, index), line);
            } else if (accept_op(".")) {
                e = stamp(std::make_shared<AstAttr>(e, expect_name()), line);
            } else {
                return e;
            }
        }
    }

    ExprPtr atom() {
        const Token& tok = peek();
        int line = tok.line;

        if (tok.kind == Token::NUMBER) {
            next();
            const std::string& s = tok.text;
            if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
                return stamp(std::make_shared<AstConst>(Value::I(std::stoll(s.substr(2), nullptr, 16))), line);
            if (s.find_first_of(".eE") != std::string::npos)
                return stamp(std::make_shared<AstConst>(Value::F(std::strtod(s.c_str(), nullptr))), line);
            errno = 0;
            long long n = std::strtoll(s.c_str(), nullptr, 10);
            if (errno == ERANGE) throw syntax_error(line, "integer literal too large");
            return stamp(std::make_shared<AstConst>(Value::I(n)), line);
        }
        if (tok.kind == Token::STRING) {
            std::string s;
            while (at(Token::STRING)) s += next().text;
            return stamp(std::make_shared<AstConst>(Value::S(s)), line);
        }
        if (tok.kind == Token::NAME) {
            if (tok.text == "True") { next(); return stamp(std::make_shared<AstConst>(Value::B(true)), line); }
            if (tok.text == "False") { next(); return stamp(std::make_shared<AstConst>(Value::B(false)), line); }
            if (tok.text == "None") { next(); return stamp(std::make_shared<AstConst>(Value::None()), line); }
            return stamp(std::make_shared<AstName>(expect_name()), line);
        }
        if (accept_op("(")) {
            ExprPtr e = expression();
            expect_op(")");
            return e;
        }
        if (accept_op("[")) {
            auto list = stamp(std::make_shared<AstList>(), line);
            while (!at_op("]")) {
                list->items.push_back(expression());
                if (!accept_op(",")) break;
            }
            expect_op("]");
            return list;
        }
        throw syntax_error(line);
    }

    const std::vector<Token>& t_;
    size_t pos_;
    bool interactive_;
    int nesting_;
    int depth_;
};

} // namespace

Block parse_program(const std::string& src, bool interactive) {
    std::vector<Token> tokens = lex(src);
    Parser p(tokens, interactive);
    return p.program();
}

} // namespace Py
} // namespace MuRuntime
