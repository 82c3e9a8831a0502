#ifndef _MuRuntime_py_ast_h_
#define _MuRuntime_py_ast_h_

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "py_value.h"

namespace MuRuntime {
namespace Py {

//
// Interpreter state shared by every node during evaluation
//
struct Runtime {
    std::shared_ptr<Env> builtins;
    std::shared_ptr<Env> globals;
    std::map<std::string, Value> modules;
    std::map<std::string, std::function<Value(Runtime&)>> module_factories;

    std::function<void(const std::string&)> out;
    std::function<void(const std::string&)> err;

    // Allocation budget for the current execution unit
    size_t heap_limit = 0;
    size_t heap_used = 0;

    std::vector<std::string> call_stack;
    static const size_t kMaxDepth = 64;

    void write(const std::string& s) { if (out) out(s); }
    void write_err(const std::string& s) { if (err) err(s); }
    void charge(size_t bytes);

    Value import_module(const std::string& name);
    Value call(const Value& fn, Args& args, Kwargs& kwargs);
    Value get_attr(const Value& target, const std::string& name);
    void set_attr(const Value& target, const std::string& name, const Value& v);
};

// Operators shared by the evaluator and the builtins
Value binary_op(Runtime& rt, const std::string& op, const Value& a, const Value& b);
bool compare_op(const std::string& op, const Value& a, const Value& b);
bool values_equal(const Value& a, const Value& b);
std::vector<Value> iterate(Runtime& rt, const Value& v);
Value subscript_get(const Value& target, const Value& index);
void subscript_set(const Value& target, const Value& index, const Value& v);

// Raised while unwinding loops and functions; not Python exceptions
struct BreakSignal {};
struct ContinueSignal {};
struct ReturnSignal { Value value; };

//
// Expressions
//
struct Expr {
    int line = 0;
    virtual ~Expr() = default;
    virtual Value eval(Runtime& rt, const std::shared_ptr<Env>& env) = 0;
};
using ExprPtr = std::shared_ptr<Expr>;

struct AstConst : Expr {
    Value val;
    explicit AstConst(Value v) : val(std::move(v)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstName : Expr {
    std::string id;
    explicit AstName(std::string s) : id(std::move(s)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstList : Expr {
    std::vector<ExprPtr> items;
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstAttr : Expr {
    ExprPtr target;
    std::string name;
    AstAttr(ExprPtr t, std::string n) : target(std::move(t)), name(std::move(n)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstSubscript : Expr {
    ExprPtr target, index;
    AstSubscript(ExprPtr t, ExprPtr i) : target(std::move(t)), index(std::move(i)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstCall : Expr {
    ExprPtr fn;
    std::vector<ExprPtr> args;
    std::vector<std::pair<std::string, ExprPtr>> kwargs;
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstUnary : Expr {
    std::string op;
    ExprPtr operand;
    AstUnary(std::string o, ExprPtr e) : op(std::move(o)), operand(std::move(e)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstBinary : Expr {
    std::string op;
    ExprPtr lhs, rhs;
    AstBinary(std::string o, ExprPtr l, ExprPtr r) : op(std::move(o)), lhs(std::move(l)), rhs(std::move(r)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
// a < b <= c
struct AstCompare : Expr {
    ExprPtr first;
    std::vector<std::pair<std::string, ExprPtr>> rest;
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstBoolOp : Expr {
    bool is_and;
    ExprPtr lhs, rhs;
    AstBoolOp(bool a, ExprPtr l, ExprPtr r) : is_and(a), lhs(std::move(l)), rhs(std::move(r)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct AstTernary : Expr {
    ExprPtr cond, a, b;
    AstTernary(ExprPtr c, ExprPtr x, ExprPtr y) : cond(std::move(c)), a(std::move(x)), b(std::move(y)) {}
    Value eval(Runtime& rt, const std::shared_ptr<Env>& env) override;
};

//
// Statements
//
struct Stmt {
    int line = 0;
    virtual ~Stmt() = default;
    virtual void exec(Runtime& rt, const std::shared_ptr<Env>& env) = 0;
};
using StmtPtr = std::shared_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

// Runs a block, recording the failing line on the first frame that sees a PyError
void exec_block(Runtime& rt, const Block& block, const std::shared_ptr<Env>& env);

struct StmtExpr : Stmt {
    ExprPtr expr;
    bool echo = false; // interactive: print repr of non-None results
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtAssign : Stmt {
    std::vector<ExprPtr> targets;
    ExprPtr value;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtAugAssign : Stmt {
    ExprPtr target;
    std::string op;
    ExprPtr value;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtIf : Stmt {
    std::vector<std::pair<ExprPtr, Block>> branches;
    Block orelse;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtWhile : Stmt {
    ExprPtr cond;
    Block body;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtFor : Stmt {
    std::string var;
    ExprPtr iter;
    Block body;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtDef : Stmt {
    std::string name;
    std::vector<std::string> params;
    std::vector<ExprPtr> defaults;
    Block body;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtReturn : Stmt {
    ExprPtr value;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtBreak : Stmt { void exec(Runtime&, const std::shared_ptr<Env>&) override { throw BreakSignal{}; } };
struct StmtContinue : Stmt { void exec(Runtime&, const std::shared_ptr<Env>&) override { throw ContinueSignal{}; } };
struct StmtPass : Stmt { void exec(Runtime&, const std::shared_ptr<Env>&) override {} };
struct StmtImport : Stmt {
    std::string module;
    std::string alias;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtFromImport : Stmt {
    std::string module;
    std::vector<std::pair<std::string, std::string>> names; // name, alias; "*" imports all
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtTry : Stmt {
    struct Handler {
        std::string type; // empty catches everything
        std::string name;
        Block body;
    };
    Block body;
    std::vector<Handler> handlers;
    Block finally_body;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtRaise : Stmt {
    ExprPtr exc;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};
struct StmtGlobal : Stmt {
    std::vector<std::string> names;
    void exec(Runtime& rt, const std::shared_ptr<Env>& env) override;
};

//
// Lexer / parser
//
struct Token {
    enum Kind { NAME, NUMBER, STRING, OP, NEWLINE, INDENT, DEDENT, END };
    Kind kind;
    std::string text;
    int line;
};

std::vector<Token> lex(const std::string& src);
// interactive marks top-level expression statements for echo
Block parse_program(const std::string& src, bool interactive);

// True when src is an unfinished interactive unit (open bracket,
// unterminated triple quote, or a compound statement header).
// open_brackets reports the first two conditions alone.
bool needs_more_input(const std::string& src, bool* open_brackets = nullptr);

// Exceptions as values
std::shared_ptr<Object> make_exception(const std::string& type, const std::string& message);
bool exception_matches(const std::string& raised, const std::string& handler);

void install_builtins(Runtime& rt);
void install_modules(Runtime& rt);

} // namespace Py
} // namespace MuRuntime

#endif
