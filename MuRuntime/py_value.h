#ifndef _MuRuntime_py_value_h_
#define _MuRuntime_py_value_h_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace MuRuntime {
namespace Py {

struct Value;
struct Object;
struct BuiltinFn;
struct Function;
struct Runtime;

using Args = std::vector<Value>;
using Kwargs = std::map<std::string, Value>;

//
// Values of the embedded interpreter
//
struct Value {
    using List = std::shared_ptr<std::vector<Value>>;

    std::variant<std::monostate, bool, int64_t, double, std::string, List,
                 std::shared_ptr<Object>, std::shared_ptr<BuiltinFn>,
                 std::shared_ptr<Function>> v;

    Value() : v(std::monostate{}) {}
    static Value None() { return Value(); }
    static Value B(bool b) { Value r; r.v = b; return r; }
    static Value I(int64_t x) { Value r; r.v = x; return r; }
    static Value F(double d) { Value r; r.v = d; return r; }
    static Value S(std::string s) { Value r; r.v = std::move(s); return r; }
    static Value L(std::vector<Value> xs) { Value r; r.v = std::make_shared<std::vector<Value>>(std::move(xs)); return r; }
    static Value O(std::shared_ptr<Object> o) { Value r; r.v = std::move(o); return r; }
    static Value Built(std::shared_ptr<BuiltinFn> f) { Value r; r.v = std::move(f); return r; }
    static Value Fn(std::shared_ptr<Function> f) { Value r; r.v = std::move(f); return r; }

    bool is_none() const { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const { return std::holds_alternative<bool>(v); }
    bool is_int() const { return std::holds_alternative<int64_t>(v); }
    bool is_float() const { return std::holds_alternative<double>(v); }
    bool is_str() const { return std::holds_alternative<std::string>(v); }
    bool is_list() const { return std::holds_alternative<List>(v); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(v); }
    bool is_callable() const {
        return std::holds_alternative<std::shared_ptr<BuiltinFn>>(v) ||
               std::holds_alternative<std::shared_ptr<Function>>(v);
    }
    // bool counts as a number, as in Python
    bool is_number() const { return is_int() || is_float() || is_bool(); }

    const std::string& str() const { return std::get<std::string>(v); }
    const List& list() const { return std::get<List>(v); }
    const std::shared_ptr<Object>& object() const { return std::get<std::shared_ptr<Object>>(v); }

    std::string type_name() const;
    std::string repr() const;
    std::string to_str() const;
    bool truthy() const;
};

//
// Python-level exception
//
struct PyError : std::runtime_error {
    struct Frame {
        int line;
        std::string scope;
    };

    std::string type;
    std::string message;
    std::vector<Frame> frames;
    bool located = false;

    PyError(std::string t, std::string m)
        : std::runtime_error(t + ": " + m), type(std::move(t)), message(std::move(m)) {}
};

// Module objects, class-like namespaces and instances
struct Object {
    std::string type;
    std::string display;
    std::string text; // str() form when it differs from repr
    bool is_exception = false;
    std::map<std::string, Value> attrs;
    // Optional hook run before an attribute is stored; returns the value to store
    std::function<Value(Object&, const std::string&, const Value&)> on_setattr;

    Object(std::string t, std::string d = {}) : type(std::move(t)), display(std::move(d)) {}

    std::optional<Value> get(const std::string& name) const {
        auto it = attrs.find(name);
        if (it == attrs.end()) return std::nullopt;
        return it->second;
    }
};

struct BuiltinFn {
    using Impl = std::function<Value(Runtime&, Args&, Kwargs&)>;
    std::string name;
    Impl fn;

    BuiltinFn(std::string n, Impl f) : name(std::move(n)), fn(std::move(f)) {}
};

struct Env;
struct Stmt;

struct Function {
    std::string name;
    std::vector<std::string> params;
    std::vector<Value> defaults; // aligned to the trailing params
    std::vector<std::shared_ptr<Stmt>> body;
    std::shared_ptr<Env> closure;
};

//
// Scope
//
struct Env {
    std::map<std::string, Value> tbl;
    std::shared_ptr<Env> up;
    std::set<std::string> global_names;
    explicit Env(std::shared_ptr<Env> p = nullptr) : up(std::move(p)) {}
    void set(const std::string& k, const Value& v) { tbl[k] = v; }
    std::optional<Value> get(const std::string& k) const {
        auto it = tbl.find(k);
        if (it != tbl.end()) return it->second;
        if (up) return up->get(k);
        return std::nullopt;
    }
};

inline std::shared_ptr<BuiltinFn> make_builtin(std::string name, BuiltinFn::Impl fn) {
    return std::make_shared<BuiltinFn>(std::move(name), std::move(fn));
}

// Numeric coercion helpers; throw TypeError on non-numbers
int64_t to_int(const Value& v, const char* what);
double to_float(const Value& v, const char* what);
std::string format_float(double d);

} // namespace Py
} // namespace MuRuntime

#endif
